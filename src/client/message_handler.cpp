#include <fleet/client/message_handler.h>

#include <fleet/common/recordset_compat.h>
#include <fleet/common/task_type.h>

#include <spdlog/spdlog.h>

namespace fleet::client {

namespace {

template <typename Ins, typename Invoke>
Result<Message> dispatch(const Message& message, Invoke&& invoke) {
    auto ins = compat::fromRecordSet<Ins>(message.content());
    if (!ins)
        return ins.error();
    auto res = invoke(ins.value());
    return Message{message.metadata(), compat::toRecordSet(res)};
}

} // namespace

Result<Message> handleLegacyMessage(Message& message, Context& /*context*/, Client& client) {
    auto type = parseTaskType(message.metadata().taskType());
    if (!type) {
        spdlog::warn("[ClientApp] unsupported call type '{}'", message.metadata().taskType());
        return Error{ErrorCode::NotSupported,
                     "unsupported call type '" + message.metadata().taskType() + "'"};
    }

    switch (*type) {
        case TaskType::GetProperties:
            return dispatch<GetPropertiesIns>(
                message, [&](const GetPropertiesIns& ins) { return client.getProperties(ins); });
        case TaskType::GetParameters:
            return dispatch<GetParametersIns>(
                message, [&](const GetParametersIns& ins) { return client.getParameters(ins); });
        case TaskType::Fit:
            return dispatch<FitIns>(message, [&](const FitIns& ins) { return client.fit(ins); });
        case TaskType::Evaluate:
            return dispatch<EvaluateIns>(
                message, [&](const EvaluateIns& ins) { return client.evaluate(ins); });
    }
    return Error{ErrorCode::InternalError, "unhandled call type"};
}

} // namespace fleet::client
