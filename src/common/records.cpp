#include <fleet/common/record_set.h>
#include <fleet/common/records.h>

#include <type_traits>

namespace fleet {

namespace {

std::size_t valueByteSize(const ConfigsRecordValue& value) {
    return std::visit(
        [](const auto& v) -> std::size_t {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string> || std::is_same_v<T, ByteVector>) {
                return v.size();
            } else if constexpr (std::is_same_v<T, std::vector<bool>>) {
                return v.size();
            } else if constexpr (std::is_same_v<T, std::vector<std::string>> ||
                                 std::is_same_v<T, std::vector<ByteVector>>) {
                std::size_t total = 0;
                for (const auto& item : v)
                    total += item.size();
                return total;
            } else if constexpr (std::is_same_v<T, std::vector<int64_t>> ||
                                 std::is_same_v<T, std::vector<double>>) {
                return v.size() * sizeof(typename T::value_type);
            } else {
                return sizeof(T);
            }
        },
        value);
}

std::size_t valueByteSize(const MetricsRecordValue& value) {
    return std::visit(
        [](const auto& v) -> std::size_t {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::vector<int64_t>> ||
                          std::is_same_v<T, std::vector<double>>) {
                return v.size() * sizeof(typename T::value_type);
            } else {
                return sizeof(T);
            }
        },
        value);
}

} // namespace

std::size_t recordByteSize(const ConfigsRecord& record) {
    std::size_t total = 0;
    for (const auto& [key, value] : record)
        total += key.size() + valueByteSize(value);
    return total;
}

std::size_t recordByteSize(const MetricsRecord& record) {
    std::size_t total = 0;
    for (const auto& [key, value] : record)
        total += key.size() + valueByteSize(value);
    return total;
}

std::size_t recordByteSize(const ParametersRecord& record) {
    std::size_t total = 0;
    for (const auto& [key, array] : record)
        total += key.size() + array.numBytes();
    return total;
}

void RecordSet::store(std::string name, Record record) {
    records_.set(std::move(name), std::move(record));
}

void RecordSet::setParameters(std::string name, ParametersRecord record) {
    store(std::move(name), Record{std::move(record)});
}

void RecordSet::setMetrics(std::string name, MetricsRecord record) {
    store(std::move(name), Record{std::move(record)});
}

void RecordSet::setConfigs(std::string name, ConfigsRecord record) {
    store(std::move(name), Record{std::move(record)});
}

ParametersRecord* RecordSet::findParameters(std::string_view name) {
    return findAs<ParametersRecord>(name);
}

const ParametersRecord* RecordSet::findParameters(std::string_view name) const {
    return findAs<ParametersRecord>(name);
}

MetricsRecord* RecordSet::findMetrics(std::string_view name) {
    return findAs<MetricsRecord>(name);
}

const MetricsRecord* RecordSet::findMetrics(std::string_view name) const {
    return findAs<MetricsRecord>(name);
}

ConfigsRecord* RecordSet::findConfigs(std::string_view name) {
    return findAs<ConfigsRecord>(name);
}

const ConfigsRecord* RecordSet::findConfigs(std::string_view name) const {
    return findAs<ConfigsRecord>(name);
}

std::vector<std::string> RecordSet::parametersKeys() const {
    return keysOf<ParametersRecord>();
}

std::vector<std::string> RecordSet::metricsKeys() const {
    return keysOf<MetricsRecord>();
}

std::vector<std::string> RecordSet::configsKeys() const {
    return keysOf<ConfigsRecord>();
}

std::size_t RecordSet::byteSize() const {
    std::size_t total = 0;
    for (const auto& [name, record] : records_) {
        total += name.size();
        total += std::visit([](const auto& r) { return recordByteSize(r); }, record);
    }
    return total;
}

} // namespace fleet
