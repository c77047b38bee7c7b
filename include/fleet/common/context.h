#pragma once

#include <utility>

#include <fleet/common/record_set.h>

namespace fleet {

// Long-lived per-node state shared by every mod and handler invocation on that node.
// Not synchronized; callers run at most one chain per node at a time.
struct Context {
    Context() = default;
    explicit Context(RecordSet s) : state(std::move(s)) {}

    RecordSet state;
};

} // namespace fleet
