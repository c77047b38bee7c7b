#include <fleet/common/serde.h>

#include <fleet/proto/recordset.pb.h>
#include <fleet/proto/task.pb.h>

#include <spdlog/spdlog.h>

#include <string>
#include <type_traits>

namespace fleet::serde {

namespace pb = fleet::proto;

namespace {

std::string bytesToString(const ByteVector& in) {
    return std::string(reinterpret_cast<const char*>(in.data()), in.size());
}

ByteVector stringToBytes(const std::string& in) {
    ByteVector out(in.size());
    for (std::size_t i = 0; i < in.size(); ++i)
        out[i] = static_cast<std::byte>(in[i]);
    return out;
}

template <typename Repeated, typename Vec> void copyList(const Vec& in, Repeated* out) {
    out->Clear();
    out->Reserve(static_cast<int>(in.size()));
    for (const auto& v : in)
        out->Add(v);
}

template <typename T, typename Repeated> std::vector<T> readList(const Repeated& in) {
    return std::vector<T>(in.begin(), in.end());
}

void arrayToProto(const Array& in, pb::Array* out) {
    out->set_dtype(in.dtype);
    for (auto dim : in.shape)
        out->add_shape(dim);
    out->set_stype(in.stype);
    out->set_data(bytesToString(in.data));
}

Array arrayFromProto(const pb::Array& in) {
    Array out;
    out.dtype = in.dtype();
    out.shape.assign(in.shape().begin(), in.shape().end());
    out.stype = in.stype();
    out.data = stringToBytes(in.data());
    return out;
}

void metricsValueToProto(const MetricsRecordValue& in, pb::MetricsRecordValue* out) {
    std::visit(
        [out](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, int64_t>) {
                out->set_sint64_value(v);
            } else if constexpr (std::is_same_v<T, double>) {
                out->set_double_value(v);
            } else if constexpr (std::is_same_v<T, std::vector<int64_t>>) {
                copyList(v, out->mutable_sint64_list()->mutable_vals());
            } else {
                copyList(v, out->mutable_double_list()->mutable_vals());
            }
        },
        in);
}

Result<MetricsRecordValue> metricsValueFromProto(const pb::MetricsRecordValue& in) {
    switch (in.value_case()) {
        case pb::MetricsRecordValue::kDoubleValue:
            return MetricsRecordValue{in.double_value()};
        case pb::MetricsRecordValue::kSint64Value:
            return MetricsRecordValue{static_cast<int64_t>(in.sint64_value())};
        case pb::MetricsRecordValue::kDoubleList:
            return MetricsRecordValue{readList<double>(in.double_list().vals())};
        case pb::MetricsRecordValue::kSint64List:
            return MetricsRecordValue{readList<int64_t>(in.sint64_list().vals())};
        case pb::MetricsRecordValue::VALUE_NOT_SET:
            break;
    }
    return Error{ErrorCode::SerializationError, "metrics value not set"};
}

void configsValueToProto(const ConfigsRecordValue& in, pb::ConfigsRecordValue* out) {
    std::visit(
        [out](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, int64_t>) {
                out->set_sint64_value(v);
            } else if constexpr (std::is_same_v<T, double>) {
                out->set_double_value(v);
            } else if constexpr (std::is_same_v<T, bool>) {
                out->set_bool_value(v);
            } else if constexpr (std::is_same_v<T, std::string>) {
                out->set_string_value(v);
            } else if constexpr (std::is_same_v<T, ByteVector>) {
                out->set_bytes_value(bytesToString(v));
            } else if constexpr (std::is_same_v<T, std::vector<int64_t>>) {
                copyList(v, out->mutable_sint64_list()->mutable_vals());
            } else if constexpr (std::is_same_v<T, std::vector<double>>) {
                copyList(v, out->mutable_double_list()->mutable_vals());
            } else if constexpr (std::is_same_v<T, std::vector<bool>>) {
                auto* vals = out->mutable_bool_list()->mutable_vals();
                for (bool b : v)
                    vals->Add(b);
            } else if constexpr (std::is_same_v<T, std::vector<std::string>>) {
                auto* vals = out->mutable_string_list()->mutable_vals();
                for (const auto& s : v)
                    vals->Add(std::string{s});
            } else {
                auto* vals = out->mutable_bytes_list()->mutable_vals();
                for (const auto& b : v)
                    vals->Add(bytesToString(b));
            }
        },
        in);
}

Result<ConfigsRecordValue> configsValueFromProto(const pb::ConfigsRecordValue& in) {
    switch (in.value_case()) {
        case pb::ConfigsRecordValue::kDoubleValue:
            return ConfigsRecordValue{in.double_value()};
        case pb::ConfigsRecordValue::kSint64Value:
            return ConfigsRecordValue{static_cast<int64_t>(in.sint64_value())};
        case pb::ConfigsRecordValue::kBoolValue:
            return ConfigsRecordValue{in.bool_value()};
        case pb::ConfigsRecordValue::kStringValue:
            return ConfigsRecordValue{in.string_value()};
        case pb::ConfigsRecordValue::kBytesValue:
            return ConfigsRecordValue{stringToBytes(in.bytes_value())};
        case pb::ConfigsRecordValue::kDoubleList:
            return ConfigsRecordValue{readList<double>(in.double_list().vals())};
        case pb::ConfigsRecordValue::kSint64List:
            return ConfigsRecordValue{readList<int64_t>(in.sint64_list().vals())};
        case pb::ConfigsRecordValue::kBoolList:
            return ConfigsRecordValue{readList<bool>(in.bool_list().vals())};
        case pb::ConfigsRecordValue::kStringList:
            return ConfigsRecordValue{readList<std::string>(in.string_list().vals())};
        case pb::ConfigsRecordValue::kBytesList: {
            std::vector<ByteVector> out;
            out.reserve(static_cast<std::size_t>(in.bytes_list().vals_size()));
            for (const auto& b : in.bytes_list().vals())
                out.push_back(stringToBytes(b));
            return ConfigsRecordValue{std::move(out)};
        }
        case pb::ConfigsRecordValue::VALUE_NOT_SET:
            break;
    }
    return Error{ErrorCode::SerializationError, "configs value not set"};
}

void taskToProto(const Task& in, pb::Task* out) {
    out->mutable_producer()->set_node_id(in.producer.nodeId);
    out->mutable_producer()->set_anonymous(in.producer.anonymous);
    out->mutable_consumer()->set_node_id(in.consumer.nodeId);
    out->mutable_consumer()->set_anonymous(in.consumer.anonymous);
    out->set_created_at(in.createdAt);
    out->set_delivered_at(in.deliveredAt);
    out->set_ttl(in.ttl);
    for (const auto& a : in.ancestry)
        out->add_ancestry(a);
    out->set_task_type(in.taskType);
    recordSetToProto(in.recordset, out->mutable_recordset());
}

Result<Task> taskFromProto(const pb::Task& in) {
    Task out;
    out.producer = Node{in.producer().node_id(), in.producer().anonymous()};
    out.consumer = Node{in.consumer().node_id(), in.consumer().anonymous()};
    out.createdAt = in.created_at();
    out.deliveredAt = in.delivered_at();
    out.ttl = in.ttl();
    out.ancestry.assign(in.ancestry().begin(), in.ancestry().end());
    out.taskType = in.task_type();
    auto rs = recordSetFromProto(in.recordset());
    if (!rs)
        return rs.error();
    out.recordset = std::move(rs).value();
    return out;
}

template <typename Msg> Result<std::vector<uint8_t>> serialize(const Msg& msg) {
    std::vector<uint8_t> bytes(msg.ByteSizeLong());
    if (!bytes.empty() && !msg.SerializeToArray(bytes.data(), static_cast<int>(bytes.size()))) {
        return Error{ErrorCode::SerializationError, "failed to serialize " + msg.GetTypeName()};
    }
    return bytes;
}

} // namespace

void recordSetToProto(const RecordSet& in, pb::RecordSet* out) {
    out->Clear();
    for (const auto& [name, record] : in) {
        auto* entry = out->add_records();
        entry->set_name(name);
        if (const auto* params = std::get_if<ParametersRecord>(&record)) {
            auto* rec = entry->mutable_parameters();
            for (const auto& [key, array] : *params) {
                auto* e = rec->add_entries();
                e->set_key(key);
                arrayToProto(array, e->mutable_value());
            }
        } else if (const auto* metrics = std::get_if<MetricsRecord>(&record)) {
            auto* rec = entry->mutable_metrics();
            for (const auto& [key, value] : *metrics) {
                auto* e = rec->add_entries();
                e->set_key(key);
                metricsValueToProto(value, e->mutable_value());
            }
        } else if (const auto* configs = std::get_if<ConfigsRecord>(&record)) {
            auto* rec = entry->mutable_configs();
            for (const auto& [key, value] : *configs) {
                auto* e = rec->add_entries();
                e->set_key(key);
                configsValueToProto(value, e->mutable_value());
            }
        }
    }
}

Result<RecordSet> recordSetFromProto(const pb::RecordSet& in) {
    RecordSet out;
    for (const auto& entry : in.records()) {
        switch (entry.record_case()) {
            case pb::RecordEntry::kParameters: {
                ParametersRecord rec;
                for (const auto& e : entry.parameters().entries())
                    rec.set(e.key(), arrayFromProto(e.value()));
                out.setParameters(entry.name(), std::move(rec));
                break;
            }
            case pb::RecordEntry::kMetrics: {
                MetricsRecord rec;
                for (const auto& e : entry.metrics().entries()) {
                    auto value = metricsValueFromProto(e.value());
                    if (!value)
                        return value.error();
                    rec.set(e.key(), std::move(value).value());
                }
                out.setMetrics(entry.name(), std::move(rec));
                break;
            }
            case pb::RecordEntry::kConfigs: {
                ConfigsRecord rec;
                for (const auto& e : entry.configs().entries()) {
                    auto value = configsValueFromProto(e.value());
                    if (!value)
                        return value.error();
                    rec.set(e.key(), std::move(value).value());
                }
                out.setConfigs(entry.name(), std::move(rec));
                break;
            }
            case pb::RecordEntry::RECORD_NOT_SET:
                return Error{ErrorCode::SerializationError,
                             "record '" + entry.name() + "' has no payload"};
        }
    }
    return out;
}

void taskInsToProto(const TaskIns& in, pb::TaskIns* out) {
    out->set_task_id(in.taskId);
    out->set_group_id(in.groupId);
    out->set_run_id(in.runId);
    taskToProto(in.task, out->mutable_task());
}

Result<TaskIns> taskInsFromProto(const pb::TaskIns& in) {
    auto task = taskFromProto(in.task());
    if (!task)
        return task.error();
    return TaskIns{in.task_id(), in.group_id(), in.run_id(), std::move(task).value()};
}

void taskResToProto(const TaskRes& in, pb::TaskRes* out) {
    out->set_task_id(in.taskId);
    out->set_group_id(in.groupId);
    out->set_run_id(in.runId);
    taskToProto(in.task, out->mutable_task());
}

Result<TaskRes> taskResFromProto(const pb::TaskRes& in) {
    auto task = taskFromProto(in.task());
    if (!task)
        return task.error();
    return TaskRes{in.task_id(), in.group_id(), in.run_id(), std::move(task).value()};
}

Result<std::vector<uint8_t>> encodeTaskIns(const TaskIns& taskIns) {
    pb::TaskIns msg;
    taskInsToProto(taskIns, &msg);
    return serialize(msg);
}

Result<TaskIns> decodeTaskIns(const std::vector<uint8_t>& bytes) {
    pb::TaskIns msg;
    if (!msg.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
        spdlog::debug("[serde] TaskIns parse failed ({} bytes)", bytes.size());
        return Error{ErrorCode::SerializationError, "failed to parse TaskIns"};
    }
    return taskInsFromProto(msg);
}

Result<std::vector<uint8_t>> encodeTaskRes(const TaskRes& taskRes) {
    pb::TaskRes msg;
    taskResToProto(taskRes, &msg);
    return serialize(msg);
}

Result<TaskRes> decodeTaskRes(const std::vector<uint8_t>& bytes) {
    pb::TaskRes msg;
    if (!msg.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
        spdlog::debug("[serde] TaskRes parse failed ({} bytes)", bytes.size());
        return Error{ErrorCode::SerializationError, "failed to parse TaskRes"};
    }
    return taskResFromProto(msg);
}

} // namespace fleet::serde
