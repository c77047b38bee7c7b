#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

#include <fleet/core/types.h>

namespace fleet {

using Scalar = std::variant<bool, ByteVector, double, int64_t, std::string>;
using Config = std::map<std::string, Scalar>;
using Properties = std::map<std::string, Scalar>;
using Metrics = std::map<std::string, Scalar>;

// Client-side status codes. Any value other than Ok is reported inside the typed
// response, never as an Error.
enum class Code : int64_t {
    Ok = 0,
    GetPropertiesNotImplemented = 1,
    GetParametersNotImplemented = 2,
    FitNotImplemented = 3,
    EvaluateNotImplemented = 4
};

struct Status {
    Code code{Code::Ok};
    std::string message;

    bool operator==(const Status&) const = default;
};

// Model parameters as serialized tensors.
struct Parameters {
    std::vector<ByteVector> tensors;
    std::string tensorType;

    bool operator==(const Parameters&) const = default;
};

struct GetPropertiesIns {
    Config config;

    bool operator==(const GetPropertiesIns&) const = default;
};

struct GetPropertiesRes {
    Status status;
    Properties properties;

    bool operator==(const GetPropertiesRes&) const = default;
};

struct GetParametersIns {
    Config config;

    bool operator==(const GetParametersIns&) const = default;
};

struct GetParametersRes {
    Status status;
    Parameters parameters;

    bool operator==(const GetParametersRes&) const = default;
};

struct FitIns {
    Parameters parameters;
    Config config;

    bool operator==(const FitIns&) const = default;
};

struct FitRes {
    Status status;
    Parameters parameters;
    int64_t numExamples{0};
    Metrics metrics;

    bool operator==(const FitRes&) const = default;
};

struct EvaluateIns {
    Parameters parameters;
    Config config;

    bool operator==(const EvaluateIns&) const = default;
};

struct EvaluateRes {
    Status status;
    double loss{0.0};
    int64_t numExamples{0};
    Metrics metrics;

    bool operator==(const EvaluateRes&) const = default;
};

} // namespace fleet
