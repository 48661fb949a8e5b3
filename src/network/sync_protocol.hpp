#pragma once

#include <cstdint>

namespace tally::network {

inline constexpr uint16_t DEFAULT_SYNC_PORT = 48080;

// Routes
inline constexpr const char* ROUTE_STATUS = "/sync/status";
inline constexpr const char* ROUTE_PAIR = "/sync/pair";
inline constexpr const char* ROUTE_BACKUP = "/sync/backup";
inline constexpr const char* ROUTE_RESTORE = "/sync/restore";

// Request headers on authenticated routes. Matched case-insensitively.
inline constexpr const char* HEADER_DEVICE_ID = "Device-Id";
inline constexpr const char* HEADER_DEVICE_TOKEN = "Device-Token";
inline constexpr const char* HEADER_REMOTE_LAST_CHANGE = "Remote-Last-Change";

} // namespace tally::network
