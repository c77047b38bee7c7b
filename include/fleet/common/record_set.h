#pragma once

#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <fleet/common/records.h>

namespace fleet {

using Record = std::variant<ParametersRecord, MetricsRecord, ConfigsRecord>;

/**
 * @brief Named bundle of typed records forming a Message payload or a node's state.
 *
 * Record names are unique across all record kinds: storing a record under a name
 * that already holds one (of any kind) replaces it. Name enumeration follows the
 * order in which names were first stored.
 */
class RecordSet {
public:
    RecordSet() = default;

    void setParameters(std::string name, ParametersRecord record);
    void setMetrics(std::string name, MetricsRecord record);
    void setConfigs(std::string name, ConfigsRecord record);

    ParametersRecord* findParameters(std::string_view name);
    const ParametersRecord* findParameters(std::string_view name) const;
    MetricsRecord* findMetrics(std::string_view name);
    const MetricsRecord* findMetrics(std::string_view name) const;
    ConfigsRecord* findConfigs(std::string_view name);
    const ConfigsRecord* findConfigs(std::string_view name) const;

    bool contains(std::string_view name) const { return records_.contains(name); }
    bool erase(std::string_view name) { return records_.erase(name); }

    // All record names, then per-kind views, each in first-insertion order.
    std::vector<std::string> keys() const { return records_.keys(); }
    std::vector<std::string> parametersKeys() const;
    std::vector<std::string> metricsKeys() const;
    std::vector<std::string> configsKeys() const;

    std::size_t size() const noexcept { return records_.size(); }
    bool empty() const noexcept { return records_.empty(); }

    TypedRecord<Record>::const_iterator begin() const { return records_.begin(); }
    TypedRecord<Record>::const_iterator end() const { return records_.end(); }

    // Approximate payload size across all records.
    std::size_t byteSize() const;

    bool operator==(const RecordSet&) const = default;

private:
    void store(std::string name, Record record);

    template <typename R> R* findAs(std::string_view name) {
        auto* rec = records_.find(name);
        return rec ? std::get_if<R>(rec) : nullptr;
    }

    template <typename R> const R* findAs(std::string_view name) const {
        const auto* rec = records_.find(name);
        return rec ? std::get_if<R>(rec) : nullptr;
    }

    template <typename R> std::vector<std::string> keysOf() const {
        std::vector<std::string> out;
        for (const auto& [name, rec] : records_)
            if (std::holds_alternative<R>(rec))
                out.push_back(name);
        return out;
    }

    TypedRecord<Record> records_;
};

} // namespace fleet
