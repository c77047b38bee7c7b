#include <fleet/client/mods.h>

#include <spdlog/spdlog.h>

namespace fleet::client::mods {

Result<Message> messageSizeMod(Message& message, Context& context, const ClientAppCallable& next) {
    spdlog::debug("[messageSizeMod] task {} ({}): {} bytes in {} records",
                  message.metadata().taskId(), message.metadata().taskType(),
                  message.content().byteSize(), message.content().size());
    return next(message, context);
}

Result<Message> parametersSizeMod(Message& message, Context& context,
                                  const ClientAppCallable& next) {
    auto out = next(message, context);
    if (!out)
        return out;

    auto& content = out.value().content();
    int64_t arrays = 0;
    int64_t bytes = 0;
    for (const auto& name : content.parametersKeys()) {
        for (const auto& [key, array] : *content.findParameters(name)) {
            ++arrays;
            bytes += static_cast<int64_t>(array.numBytes());
        }
    }
    content.setMetrics(kParametersSizeRecord, MetricsRecord{{"arrays", arrays}, {"bytes", bytes}});
    spdlog::debug("[parametersSizeMod] task {}: {} arrays, {} bytes", out.value().metadata().taskId(),
                  arrays, bytes);
    return out;
}

} // namespace fleet::client::mods
