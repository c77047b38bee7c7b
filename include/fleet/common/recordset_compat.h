#pragma once

#include <concepts>

#include <fleet/common/record_set.h>
#include <fleet/common/task_type.h>
#include <fleet/common/typing.h>
#include <fleet/core/types.h>

namespace fleet::compat {

// Per-type RecordSet bindings. Each specialization names the call type it belongs
// to and provides the encode/decode pair. decode() fails with SchemaMismatch when a
// required record is missing or holds a value of the wrong type.
template <typename T> struct CompatBinding; // no default implementation

template <typename T>
concept HasCompatBinding = requires(const T& t, const RecordSet& rs) {
    { CompatBinding<T>::kTaskType } -> std::convertible_to<TaskType>;
    { CompatBinding<T>::encode(t) } -> std::same_as<RecordSet>;
    { CompatBinding<T>::decode(rs) } -> std::same_as<Result<T>>;
};

#define FLEET_DECLARE_COMPAT_BINDING(Type, Tag)                                                   \
    template <> struct CompatBinding<Type> {                                                      \
        static constexpr TaskType kTaskType = Tag;                                                \
        static RecordSet encode(const Type& value);                                               \
        static Result<Type> decode(const RecordSet& recordset);                                   \
    }

FLEET_DECLARE_COMPAT_BINDING(GetPropertiesIns, TaskType::GetProperties);
FLEET_DECLARE_COMPAT_BINDING(GetPropertiesRes, TaskType::GetProperties);
FLEET_DECLARE_COMPAT_BINDING(GetParametersIns, TaskType::GetParameters);
FLEET_DECLARE_COMPAT_BINDING(GetParametersRes, TaskType::GetParameters);
FLEET_DECLARE_COMPAT_BINDING(FitIns, TaskType::Fit);
FLEET_DECLARE_COMPAT_BINDING(FitRes, TaskType::Fit);
FLEET_DECLARE_COMPAT_BINDING(EvaluateIns, TaskType::Evaluate);
FLEET_DECLARE_COMPAT_BINDING(EvaluateRes, TaskType::Evaluate);

#undef FLEET_DECLARE_COMPAT_BINDING

template <HasCompatBinding T> RecordSet toRecordSet(const T& value) {
    return CompatBinding<T>::encode(value);
}

template <HasCompatBinding T> Result<T> fromRecordSet(const RecordSet& recordset) {
    return CompatBinding<T>::decode(recordset);
}

template <HasCompatBinding T> constexpr TaskType taskTypeOf() {
    return CompatBinding<T>::kTaskType;
}

// Building blocks shared by the bindings; exposed for mods that inspect payloads.
ParametersRecord parametersToRecord(const Parameters& parameters);
Parameters recordToParameters(const ParametersRecord& record);
ConfigsRecord scalarsToRecord(const std::map<std::string, Scalar>& values);
Result<std::map<std::string, Scalar>> recordToScalars(const ConfigsRecord& record);

} // namespace fleet::compat
