#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include <fleet/common/typed_record.h>
#include <fleet/core/types.h>

namespace fleet {

// N-dimensional array carried opaquely. `data` is never interpreted by the core.
struct Array {
    std::string dtype;
    std::vector<int32_t> shape;
    std::string stype;
    ByteVector data;

    std::size_t numBytes() const noexcept { return data.size(); }

    bool operator==(const Array&) const = default;
};

using ConfigsRecordValue =
    std::variant<int64_t, double, bool, std::string, ByteVector, std::vector<int64_t>,
                 std::vector<double>, std::vector<bool>, std::vector<std::string>,
                 std::vector<ByteVector>>;

using MetricsRecordValue =
    std::variant<int64_t, double, std::vector<int64_t>, std::vector<double>>;

using ConfigsRecord = TypedRecord<ConfigsRecordValue>;
using MetricsRecord = TypedRecord<MetricsRecordValue>;
using ParametersRecord = TypedRecord<Array>;

// Approximate in-memory payload size of a record, used by size-reporting mods.
std::size_t recordByteSize(const ConfigsRecord& record);
std::size_t recordByteSize(const MetricsRecord& record);
std::size_t recordByteSize(const ParametersRecord& record);

} // namespace fleet
