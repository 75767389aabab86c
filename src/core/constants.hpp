#pragma once

#include <cstdint>

// ── Version ─────────────────────────────────────────────────
constexpr const char* SSHGATE_VERSION = "0.4.0";

// ── SSH client ──────────────────────────────────────────────
constexpr const char* DEFAULT_SSH_BINARY         = "ssh";
constexpr const char* DEFAULT_HOST_KEY_CHECKING  = "accept-new";

// Default identity files, most common algorithms first.
constexpr const char* DEFAULT_KEY_NAMES[] = {"id_rsa", "id_ed25519", "id_ecdsa", "id_dsa"};
constexpr const char* DEFAULT_KEY_PROMPT_PATH = "~/.ssh/id_rsa";
constexpr int KEY_SCAN_MAX_FILES          = 10;    // Fallback scan of ~/.ssh when no default key exists
constexpr int KEY_HEADER_PEEK_BYTES       = 64;

// Set in the environment of a password attempt; sshgate answers as askpass.
constexpr const char* ASKPASS_ENV_FLAG   = "SSHGATE_ASKPASS";
constexpr const char* ASKPASS_ENV_SECRET = "SSHGATE_ASKPASS_SECRET";

// ── Timeouts ────────────────────────────────────────────────
constexpr int DNS_TIMEOUT_MS              = 5000;
constexpr int PORT_TIMEOUT_MS             = 5000;
constexpr int METHOD_PROBE_TIMEOUT_MS     = 10000;
constexpr int AUTH_TIMEOUT_MS             = 15000;
constexpr int PROCESS_KILL_GRACE_MS       = 2000;  // SIGTERM -> SIGKILL

// ── Retry counts ────────────────────────────────────────────
constexpr int DEFAULT_MAX_ATTEMPTS        = 3;     // Outer diagnose passes per target
constexpr int MAX_PASSWORD_ATTEMPTS       = 3;     // Prompts per credential round, independent of the above
constexpr int RETRY_BACKOFF_MS            = 2000;  // Non-interactive pause between passes

// ── Credential cache ────────────────────────────────────────
constexpr int64_t DEFAULT_CACHE_TTL_MS    = 15LL * 60 * 1000;
constexpr const char* DEFAULT_CACHE_TTL   = "15m";

// ── Buffer sizes ────────────────────────────────────────────
constexpr int PROCESS_READ_BUF_SIZE       = 4096;
constexpr int LOG_OUTPUT_TRUNCATE         = 500;
