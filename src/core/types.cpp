/**
 * @file types.cpp
 * @brief Implementation of core type helpers
 */

#include "core/types.h"

namespace polyglot {

const char* segment_state_name(SegmentState state) {
    switch (state) {
        case SegmentState::Pending: return "pending";
        case SegmentState::Translating: return "translating";
        case SegmentState::Completed: return "completed";
        case SegmentState::Failed: return "failed";
        default: return "unknown";
    }
}

} // namespace polyglot
