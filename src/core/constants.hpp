#pragma once

// ── Network ─────────────────────────────────────────────────
constexpr int SSH_DEFAULT_PORT             = 22;

// ── Timeouts ────────────────────────────────────────────────
constexpr int CONNECT_TIMEOUT_SECS         = 30;    // TCP connect bound when no deadline applies
constexpr int SSH_CMD_TIMEOUT_SECS         = 300;   // Max time for a single remote command
constexpr int SSH_CLOSE_TIMEOUT_SECS       = 5;     // Channel close handshake bound
constexpr int SSH_POLL_INTERVAL_MS         = 10;    // Wait between EAGAIN retries
constexpr int SSH_WAIT_SLICE_MS            = 100;   // Longest single socket poll

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SSH_READ_BUF_SIZE            = 4096;

// ── Paths ───────────────────────────────────────────────────
constexpr const char* SSHPOOL_CONFIG_DIR   = ".sshpool";
constexpr const char* SSHPOOL_CONFIG_FILE  = "config.yaml";
constexpr const char* SSHPOOL_LOG_FILE     = "sshpool_debug.log";
