#pragma once

// ── Watch stream ────────────────────────────────────────────
constexpr int WATCH_OPEN_RETRY_SECS      = 5;     // Backoff after a failed stream open
constexpr int WATCH_RESTART_SECS         = 2;     // Backoff after a server-side stream close
constexpr int WATCH_READ_SLICE_MS        = 100;   // Max block on stream read before re-checking stop
constexpr int EVENT_SETTLE_MS            = 100;   // Pause before handling Added/Modified
constexpr int RECENT_DELETIONS_MAX       = 256;   // UIDs remembered for delete de-duplication

// ── Monitoring ──────────────────────────────────────────────
constexpr int MONITOR_POLL_SECS          = 10;    // Job status poll interval
constexpr int MONITOR_POLL_MAX_SECS      = 86400; // Upper bound; the interval is kept in ms
constexpr int MONITOR_SLEEP_SLICE_MS     = 100;   // Sleep granularity for responsive cancel
constexpr int STATUS_MESSAGE_CAP         = 500;   // Max characters of a failure message
constexpr int STATUS_UPDATE_MAX_ATTEMPTS = 3;     // Read-merge-write retries on conflict

// ── Job defaults ────────────────────────────────────────────
constexpr int DEFAULT_BACKOFF_LIMIT      = 3;
constexpr int DEFAULT_ACTIVE_DEADLINE    = 1800;  // 30 min
constexpr int KUBECTL_TIMEOUT_SECS       = 30;    // Per-call timeout for store/runner commands
constexpr int KUBECTL_TIMEOUT_MAX_SECS   = 3600;
constexpr int CLEANUP_TIMEOUT_SECS       = 120;   // Artifact removal may walk many objects

// ── Build defaults ──────────────────────────────────────────
constexpr const char* DEFAULT_BUILD_COMMAND = "npm run build";
constexpr const char* DEFAULT_OUTPUT_DIR    = "dist";

// ── Phases ──────────────────────────────────────────────────
constexpr const char* PHASE_PENDING  = "Pending";
constexpr const char* PHASE_FAILED   = "Failed";

constexpr const char* FORGEOP_VERSION = "0.4.0";
