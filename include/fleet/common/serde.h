#pragma once

#include <cstdint>
#include <vector>

#include <fleet/common/record_set.h>
#include <fleet/common/task.h>
#include <fleet/core/types.h>

namespace fleet::proto {
class RecordSet;
class TaskIns;
class TaskRes;
} // namespace fleet::proto

namespace fleet::serde {

// Protobuf message conversions.
void recordSetToProto(const RecordSet& in, proto::RecordSet* out);
Result<RecordSet> recordSetFromProto(const proto::RecordSet& in);
void taskInsToProto(const TaskIns& in, proto::TaskIns* out);
Result<TaskIns> taskInsFromProto(const proto::TaskIns& in);
void taskResToProto(const TaskRes& in, proto::TaskRes* out);
Result<TaskRes> taskResFromProto(const proto::TaskRes& in);

// Byte-level encoding used by the in-memory queue state.
Result<std::vector<uint8_t>> encodeTaskIns(const TaskIns& taskIns);
Result<TaskIns> decodeTaskIns(const std::vector<uint8_t>& bytes);
Result<std::vector<uint8_t>> encodeTaskRes(const TaskRes& taskRes);
Result<TaskRes> decodeTaskRes(const std::vector<uint8_t>& bytes);

} // namespace fleet::serde
