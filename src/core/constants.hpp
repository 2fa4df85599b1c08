#pragma once

// ── Version ─────────────────────────────────────────────────
constexpr const char* GITBRIDGE_VERSION = "0.4.1";

// ── Remote schemes ──────────────────────────────────────────
// Explicit Git URL schemes; a location starting with "<scheme>://" is never
// SSH shorthand.
constexpr const char* GIT_SCHEMES[] = {"git", "git+ssh", "git+http", "git+https"};

// ── Defaults ────────────────────────────────────────────────
constexpr const char* DEFAULT_SSH_COMMAND      = "ssh";
constexpr const char* DEFAULT_TRANSACTION_NAME = "git_handler";
constexpr const char* DEFAULT_UPLOAD_SERVICE   = "git-upload-pack";

// ── Repository layout ───────────────────────────────────────
constexpr const char* HG_DIR             = ".hg";
constexpr const char* WLOCK_FILE         = "wlock";
constexpr const char* STORE_LOCK_FILE    = "store/lock";
constexpr const char* BOOKMARKS_FILE     = "bookmarks";
constexpr const char* BOOKMARKS_PENDING  = "bookmarks.pending";

// ── Sub-repository files ────────────────────────────────────
constexpr const char* HGSUB_FILE      = ".hgsub";
constexpr const char* HGSUBSTATE_FILE = ".hgsubstate";
