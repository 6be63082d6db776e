#pragma once

/**
 * @file constants.h
 * @brief System-wide constants and tuning parameters
 *
 * All magic numbers should be defined here with clear documentation.
 * Runtime values come from config; these are the defaults.
 */

#include <cstddef>

namespace polyglot {
namespace constants {

// =============================================================================
// Translation Buffer Constants
// =============================================================================

namespace buffer {
    /// Upper bound between first submission of a segment and its dispatch (ms)
    constexpr int MAX_DELAY_MS = 500;

    /// Confidence strictly above this dispatches an interim segment immediately
    constexpr float HIGH_CONFIDENCE_THRESHOLD = 0.8f;

    /// Interval at which the loop sweeps for overdue segments (ms), must be <= MAX_DELAY_MS
    constexpr int POLL_INTERVAL_MS = 100;

    /// Completed/failed segments are kept this long for inspection before removal (ms)
    constexpr int CLEANUP_GRACE_MS = 2000;

    /// Ids of cleaned-up segments remembered so late updates cannot reopen them
    constexpr size_t RETIRED_IDS_KEPT = 4096;

    /// Concurrent dispatches (one dispatch = one fan-out of a segment)
    constexpr size_t DISPATCH_WORKERS = 4;
}

// =============================================================================
// Streaming Transcript Constants
// =============================================================================

namespace transcript {
    /// Silence between recognizer events that closes the current utterance (ms)
    constexpr int UTTERANCE_GAP_MS = 500;

    /// Interim hypotheses below this confidence are not forwarded (0 = forward all)
    constexpr float MIN_INTERIM_CONFIDENCE = 0.0f;
}

// =============================================================================
// Translation Service Constants
// =============================================================================

namespace translation {
    /// Per-request timeout; one slow listener cannot hold up the others past this (ms)
    constexpr int DEFAULT_TIMEOUT_MS = 3000;

    /// Translation requests in flight at once per session; the rest wait their turn
    constexpr size_t REQUEST_WORKERS = 8;

    /// Connection timeout (ms)
    constexpr int CONNECT_TIMEOUT_MS = 1000;

    /// Default sampling temperature for the translation model
    constexpr float DEFAULT_TEMPERATURE = 0.3f;
}

// =============================================================================
// Logging Constants
// =============================================================================

namespace logging {
    /// Characters of segment text included in log lines
    constexpr size_t TEXT_SNIPPET_CHARS = 40;
}

} // namespace constants
} // namespace polyglot
