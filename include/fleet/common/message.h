#pragma once

#include <string>
#include <utility>

#include <fleet/common/record_set.h>
#include <fleet/core/types.h>

namespace fleet {

// Identifiers attached to one unit of work. Read-only after construction.
class Metadata {
public:
    Metadata(RunId runId, std::string taskId, std::string groupId, std::string ttl,
             std::string taskType)
        : runId_(runId), taskId_(std::move(taskId)), groupId_(std::move(groupId)),
          ttl_(std::move(ttl)), taskType_(std::move(taskType)) {}

    RunId runId() const noexcept { return runId_; }
    const std::string& taskId() const noexcept { return taskId_; }
    const std::string& groupId() const noexcept { return groupId_; }
    const std::string& ttl() const noexcept { return ttl_; }
    const std::string& taskType() const noexcept { return taskType_; }

    bool operator==(const Metadata&) const = default;

private:
    RunId runId_;
    std::string taskId_;
    std::string groupId_;
    std::string ttl_;
    std::string taskType_;
};

// Unit flowing through the mod chain and across the queue boundary.
class Message {
public:
    Message(Metadata metadata, RecordSet content)
        : metadata_(std::move(metadata)), content_(std::move(content)) {}

    const Metadata& metadata() const noexcept { return metadata_; }

    RecordSet& content() noexcept { return content_; }
    const RecordSet& content() const noexcept { return content_; }

private:
    Metadata metadata_;
    RecordSet content_;
};

} // namespace fleet
