#pragma once

#include <optional>
#include <string_view>

namespace fleet {

// Closed set of remote calls. Adding a call means adding one tag here and one
// encode/decode pair in recordset_compat.
enum class TaskType { GetProperties, GetParameters, Fit, Evaluate };

inline constexpr std::string_view kTaskTypeGetProperties = "get-properties";
inline constexpr std::string_view kTaskTypeGetParameters = "get-parameters";
inline constexpr std::string_view kTaskTypeFit = "fit";
inline constexpr std::string_view kTaskTypeEvaluate = "evaluate";

inline constexpr std::string_view to_string(TaskType t) {
    switch (t) {
        case TaskType::GetProperties:
            return kTaskTypeGetProperties;
        case TaskType::GetParameters:
            return kTaskTypeGetParameters;
        case TaskType::Fit:
            return kTaskTypeFit;
        case TaskType::Evaluate:
            return kTaskTypeEvaluate;
    }
    return "";
}

inline std::optional<TaskType> parseTaskType(std::string_view tag) {
    if (tag == kTaskTypeGetProperties)
        return TaskType::GetProperties;
    if (tag == kTaskTypeGetParameters)
        return TaskType::GetParameters;
    if (tag == kTaskTypeFit)
        return TaskType::Fit;
    if (tag == kTaskTypeEvaluate)
        return TaskType::Evaluate;
    return std::nullopt;
}

} // namespace fleet
