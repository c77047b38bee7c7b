#pragma once

#include <fleet/common/typing.h>

namespace fleet::client {

/**
 * @brief Worker-side implementation of the four remote calls.
 *
 * Every method has a default that reports the matching *NotImplemented status, so
 * a client only overrides the calls it supports.
 */
class Client {
public:
    virtual ~Client() = default;

    virtual GetPropertiesRes getProperties(const GetPropertiesIns& ins);
    virtual GetParametersRes getParameters(const GetParametersIns& ins);
    virtual FitRes fit(const FitIns& ins);
    virtual EvaluateRes evaluate(const EvaluateIns& ins);
};

} // namespace fleet::client
