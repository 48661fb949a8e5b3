#pragma once

namespace tally::codes {

// Storage / filesystem
inline constexpr const char* DB = "DB_ERROR";
inline constexpr const char* IO = "IO_ERROR";
inline constexpr const char* ZIP = "ZIP_ERROR";
inline constexpr const char* CONFIG = "CONFIG_ERROR";

// Sync protocol. These strings are part of the wire format.
inline constexpr const char* SYNC_AUTH = "SYNC_AUTH";
inline constexpr const char* SYNC_PAIR = "SYNC_PAIR";
inline constexpr const char* SYNC_PAIR_CODE = "SYNC_PAIR_CODE";
inline constexpr const char* SYNC_CONFLICT = "SYNC_CONFLICT";
inline constexpr const char* SYNC_REMOTE_NEWER = "SYNC_REMOTE_NEWER";
inline constexpr const char* SYNC_LOCAL_NEWER = "SYNC_LOCAL_NEWER";
inline constexpr const char* SYNC_REMOTE_CHANGE = "SYNC_REMOTE_CHANGE";
inline constexpr const char* SYNC_BACKUP = "SYNC_BACKUP";
inline constexpr const char* SYNC_RESTORE = "SYNC_RESTORE";
inline constexpr const char* SYNC_STORE = "SYNC_STORE";
inline constexpr const char* SYNC_NOT_FOUND = "SYNC_NOT_FOUND";
inline constexpr const char* SYNC_TOO_LARGE = "SYNC_TOO_LARGE";
inline constexpr const char* SYNC_TRANSPORT = "SYNC_TRANSPORT";

// HTTP framing
inline constexpr const char* HTTP_BAD_REQUEST = "HTTP_BAD_REQUEST";

} // namespace tally::codes
