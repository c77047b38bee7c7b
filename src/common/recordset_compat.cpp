#include <fleet/common/recordset_compat.h>

#include <string>
#include <string_view>
#include <type_traits>

namespace fleet::compat {

namespace {

Error missingRecord(std::string_view name) {
    return Error{ErrorCode::SchemaMismatch, "missing record '" + std::string(name) + "'"};
}

Error badValue(std::string_view record, std::string_view key) {
    return Error{ErrorCode::SchemaMismatch, "record '" + std::string(record) +
                                                "' has no valid value for '" + std::string(key) +
                                                "'"};
}

Result<const ConfigsRecord*> requireConfigs(const RecordSet& rs, const std::string& name) {
    const auto* rec = rs.findConfigs(name);
    if (!rec)
        return missingRecord(name);
    return rec;
}

Result<const MetricsRecord*> requireMetrics(const RecordSet& rs, const std::string& name) {
    const auto* rec = rs.findMetrics(name);
    if (!rec)
        return missingRecord(name);
    return rec;
}

Result<const ParametersRecord*> requireParameters(const RecordSet& rs, const std::string& name) {
    const auto* rec = rs.findParameters(name);
    if (!rec)
        return missingRecord(name);
    return rec;
}

template <typename V, typename Rec>
Result<V> requireValue(const Rec& record, const std::string& recordName, std::string_view key) {
    const auto* value = record.find(key);
    if (!value)
        return badValue(recordName, key);
    const auto* typed = std::get_if<V>(value);
    if (!typed)
        return badValue(recordName, key);
    return *typed;
}

void setStatus(RecordSet& rs, const std::string& prefix, const Status& status) {
    ConfigsRecord rec;
    rec.set("code", static_cast<int64_t>(status.code));
    rec.set("message", status.message);
    rs.setConfigs(prefix + ".status", std::move(rec));
}

Result<Status> getStatus(const RecordSet& rs, const std::string& prefix) {
    const std::string name = prefix + ".status";
    auto rec = requireConfigs(rs, name);
    if (!rec)
        return rec.error();
    auto code = requireValue<int64_t>(*rec.value(), name, "code");
    if (!code)
        return code.error();
    auto message = requireValue<std::string>(*rec.value(), name, "message");
    if (!message)
        return message.error();
    const int64_t raw = code.value();
    if (raw < static_cast<int64_t>(Code::Ok) ||
        raw > static_cast<int64_t>(Code::EvaluateNotImplemented)) {
        return Error{ErrorCode::SchemaMismatch,
                     "record '" + name + "' carries unknown status code " + std::to_string(raw)};
    }
    return Status{static_cast<Code>(raw), std::move(message).value()};
}

Result<Config> getScalars(const RecordSet& rs, const std::string& name) {
    auto rec = requireConfigs(rs, name);
    if (!rec)
        return rec.error();
    auto values = recordToScalars(*rec.value());
    if (!values)
        return Error{ErrorCode::SchemaMismatch, "record '" + name + "': " + values.error().message};
    return std::move(values).value();
}

// The tensor type travels in its own configs record next to the arrays, so a
// parameter set without tensors keeps it.
std::string tensorTypeRecordName(const std::string& name) {
    return name + ".tensor_type";
}

void setParameters(RecordSet& rs, const std::string& name, const Parameters& parameters) {
    rs.setParameters(name, parametersToRecord(parameters));
    rs.setConfigs(tensorTypeRecordName(name),
                  ConfigsRecord{{"tensor_type", parameters.tensorType}});
}

Result<Parameters> getParameters(const RecordSet& rs, const std::string& name) {
    auto rec = requireParameters(rs, name);
    if (!rec)
        return rec.error();
    Parameters parameters = recordToParameters(*rec.value());

    const std::string typeName = tensorTypeRecordName(name);
    if (const auto* typeRec = rs.findConfigs(typeName)) {
        auto tensorType = requireValue<std::string>(*typeRec, typeName, "tensor_type");
        if (!tensorType)
            return tensorType.error();
        parameters.tensorType = std::move(tensorType).value();
    }
    return parameters;
}

template <typename V>
Result<V> getMetric(const RecordSet& rs, const std::string& name, std::string_view key) {
    auto rec = requireMetrics(rs, name);
    if (!rec)
        return rec.error();
    return requireValue<V>(*rec.value(), name, key);
}

// Shared layout of FitIns and EvaluateIns.
RecordSet encodeParametersAndConfig(const std::string& prefix, const Parameters& parameters,
                                    const Config& config) {
    RecordSet rs;
    setParameters(rs, prefix + ".parameters", parameters);
    rs.setConfigs(prefix + ".config", scalarsToRecord(config));
    return rs;
}

} // namespace

ParametersRecord parametersToRecord(const Parameters& parameters) {
    ParametersRecord record;
    for (std::size_t i = 0; i < parameters.tensors.size(); ++i) {
        Array array;
        array.stype = parameters.tensorType;
        array.data = parameters.tensors[i];
        record.set(std::to_string(i), std::move(array));
    }
    return record;
}

Parameters recordToParameters(const ParametersRecord& record) {
    Parameters parameters;
    parameters.tensors.reserve(record.size());
    for (const auto& [key, array] : record) {
        if (parameters.tensors.empty())
            parameters.tensorType = array.stype;
        parameters.tensors.push_back(array.data);
    }
    return parameters;
}

ConfigsRecord scalarsToRecord(const std::map<std::string, Scalar>& values) {
    ConfigsRecord record;
    for (const auto& [key, scalar] : values) {
        std::visit([&, k = key](const auto& v) { record.set(k, ConfigsRecordValue{v}); }, scalar);
    }
    return record;
}

Result<std::map<std::string, Scalar>> recordToScalars(const ConfigsRecord& record) {
    std::map<std::string, Scalar> out;
    for (const auto& [key, value] : record) {
        bool ok = std::visit(
            [&, k = key](const auto& v) {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, bool> || std::is_same_v<T, ByteVector> ||
                              std::is_same_v<T, double> || std::is_same_v<T, int64_t> ||
                              std::is_same_v<T, std::string>) {
                    out.emplace(k, Scalar{v});
                    return true;
                } else {
                    return false;
                }
            },
            value);
        if (!ok)
            return Error{ErrorCode::SchemaMismatch, "list value under '" + key + "' is not a scalar"};
    }
    return out;
}

// get-properties

RecordSet CompatBinding<GetPropertiesIns>::encode(const GetPropertiesIns& value) {
    RecordSet rs;
    rs.setConfigs("getpropertiesins.config", scalarsToRecord(value.config));
    return rs;
}

Result<GetPropertiesIns> CompatBinding<GetPropertiesIns>::decode(const RecordSet& recordset) {
    auto config = getScalars(recordset, "getpropertiesins.config");
    if (!config)
        return config.error();
    return GetPropertiesIns{std::move(config).value()};
}

RecordSet CompatBinding<GetPropertiesRes>::encode(const GetPropertiesRes& value) {
    RecordSet rs;
    rs.setConfigs("getpropertiesres.properties", scalarsToRecord(value.properties));
    setStatus(rs, "getpropertiesres", value.status);
    return rs;
}

Result<GetPropertiesRes> CompatBinding<GetPropertiesRes>::decode(const RecordSet& recordset) {
    auto properties = getScalars(recordset, "getpropertiesres.properties");
    if (!properties)
        return properties.error();
    auto status = getStatus(recordset, "getpropertiesres");
    if (!status)
        return status.error();
    return GetPropertiesRes{std::move(status).value(), std::move(properties).value()};
}

// get-parameters

RecordSet CompatBinding<GetParametersIns>::encode(const GetParametersIns& value) {
    RecordSet rs;
    rs.setConfigs("getparametersins.config", scalarsToRecord(value.config));
    return rs;
}

Result<GetParametersIns> CompatBinding<GetParametersIns>::decode(const RecordSet& recordset) {
    auto config = getScalars(recordset, "getparametersins.config");
    if (!config)
        return config.error();
    return GetParametersIns{std::move(config).value()};
}

RecordSet CompatBinding<GetParametersRes>::encode(const GetParametersRes& value) {
    RecordSet rs;
    setParameters(rs, "getparametersres.parameters", value.parameters);
    setStatus(rs, "getparametersres", value.status);
    return rs;
}

Result<GetParametersRes> CompatBinding<GetParametersRes>::decode(const RecordSet& recordset) {
    auto parameters = getParameters(recordset, "getparametersres.parameters");
    if (!parameters)
        return parameters.error();
    auto status = getStatus(recordset, "getparametersres");
    if (!status)
        return status.error();
    return GetParametersRes{std::move(status).value(), std::move(parameters).value()};
}

// fit

RecordSet CompatBinding<FitIns>::encode(const FitIns& value) {
    return encodeParametersAndConfig("fitins", value.parameters, value.config);
}

Result<FitIns> CompatBinding<FitIns>::decode(const RecordSet& recordset) {
    auto parameters = getParameters(recordset, "fitins.parameters");
    if (!parameters)
        return parameters.error();
    auto config = getScalars(recordset, "fitins.config");
    if (!config)
        return config.error();
    return FitIns{std::move(parameters).value(), std::move(config).value()};
}

RecordSet CompatBinding<FitRes>::encode(const FitRes& value) {
    RecordSet rs;
    setParameters(rs, "fitres.parameters", value.parameters);
    rs.setMetrics("fitres.num_examples", MetricsRecord{{"num_examples", value.numExamples}});
    rs.setConfigs("fitres.metrics", scalarsToRecord(value.metrics));
    setStatus(rs, "fitres", value.status);
    return rs;
}

Result<FitRes> CompatBinding<FitRes>::decode(const RecordSet& recordset) {
    auto parameters = getParameters(recordset, "fitres.parameters");
    if (!parameters)
        return parameters.error();
    auto numExamples = getMetric<int64_t>(recordset, "fitres.num_examples", "num_examples");
    if (!numExamples)
        return numExamples.error();
    auto metrics = getScalars(recordset, "fitres.metrics");
    if (!metrics)
        return metrics.error();
    auto status = getStatus(recordset, "fitres");
    if (!status)
        return status.error();

    FitRes res;
    res.status = std::move(status).value();
    res.parameters = std::move(parameters).value();
    res.numExamples = numExamples.value();
    res.metrics = std::move(metrics).value();
    return res;
}

// evaluate

RecordSet CompatBinding<EvaluateIns>::encode(const EvaluateIns& value) {
    return encodeParametersAndConfig("evaluateins", value.parameters, value.config);
}

Result<EvaluateIns> CompatBinding<EvaluateIns>::decode(const RecordSet& recordset) {
    auto parameters = getParameters(recordset, "evaluateins.parameters");
    if (!parameters)
        return parameters.error();
    auto config = getScalars(recordset, "evaluateins.config");
    if (!config)
        return config.error();
    return EvaluateIns{std::move(parameters).value(), std::move(config).value()};
}

RecordSet CompatBinding<EvaluateRes>::encode(const EvaluateRes& value) {
    RecordSet rs;
    rs.setMetrics("evaluateres.loss", MetricsRecord{{"loss", value.loss}});
    rs.setMetrics("evaluateres.num_examples",
                  MetricsRecord{{"num_examples", value.numExamples}});
    rs.setConfigs("evaluateres.metrics", scalarsToRecord(value.metrics));
    setStatus(rs, "evaluateres", value.status);
    return rs;
}

Result<EvaluateRes> CompatBinding<EvaluateRes>::decode(const RecordSet& recordset) {
    auto loss = getMetric<double>(recordset, "evaluateres.loss", "loss");
    if (!loss)
        return loss.error();
    auto numExamples = getMetric<int64_t>(recordset, "evaluateres.num_examples", "num_examples");
    if (!numExamples)
        return numExamples.error();
    auto metrics = getScalars(recordset, "evaluateres.metrics");
    if (!metrics)
        return metrics.error();
    auto status = getStatus(recordset, "evaluateres");
    if (!status)
        return status.error();

    EvaluateRes res;
    res.status = std::move(status).value();
    res.loss = loss.value();
    res.numExamples = numExamples.value();
    res.metrics = std::move(metrics).value();
    return res;
}

} // namespace fleet::compat
