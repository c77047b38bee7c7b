#include <fleet/client/client.h>

namespace fleet::client {

GetPropertiesRes Client::getProperties(const GetPropertiesIns&) {
    GetPropertiesRes res;
    res.status = Status{Code::GetPropertiesNotImplemented,
                        "Client does not implement `getProperties`"};
    return res;
}

GetParametersRes Client::getParameters(const GetParametersIns&) {
    GetParametersRes res;
    res.status = Status{Code::GetParametersNotImplemented,
                        "Client does not implement `getParameters`"};
    return res;
}

FitRes Client::fit(const FitIns&) {
    FitRes res;
    res.status = Status{Code::FitNotImplemented, "Client does not implement `fit`"};
    return res;
}

EvaluateRes Client::evaluate(const EvaluateIns&) {
    EvaluateRes res;
    res.status = Status{Code::EvaluateNotImplemented, "Client does not implement `evaluate`"};
    return res;
}

} // namespace fleet::client
