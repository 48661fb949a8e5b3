#pragma once

#include <QJsonObject>
#include <optional>
#include <string>
#include <vector>
#include <cstdint>

namespace tally::sync {

/**
 * A peer that completed pairing with this device.
 */
struct PairedDevice {
    std::string device_id;
    std::string device_name;
    std::string token;
    std::optional<std::string> last_sync_at;
    std::optional<std::string> last_remote_change;
    std::optional<std::string> last_known_ip;
};

struct ConflictItem {
    std::string date;
    std::string label;
    double amount_chf = 0.0;
    std::string type;
};

/**
 * Lightweight picture of one side of a conflict for the operator.
 */
struct ConflictSummary {
    int64_t tx_count = 0;
    double income_total = 0.0;
    double expense_total = 0.0;
    std::vector<ConflictItem> last_items;
};

/**
 * The single pending conflict, if any.
 * `archive_path` is set only when the peer pushed its archive.
 */
struct PendingConflict {
    std::string device_id;
    std::string device_name;
    std::string local_last_change;
    std::string remote_last_change;
    std::string received_at;
    std::optional<std::string> archive_path;
    std::optional<ConflictSummary> local_summary;
    std::optional<ConflictSummary> remote_summary;
};

struct DeviceIdentity {
    std::string device_id;
    std::string device_name;
};

/**
 * Read-only view of the pairing store for status display.
 */
struct SyncSnapshot {
    DeviceIdentity identity;
    std::string pair_code;
    std::vector<PairedDevice> paired_devices;
    std::optional<PendingConflict> pending_conflict;
};

// JSON (snake_case keys). Parsers return nullopt when a required field is
// missing or has the wrong type.

[[nodiscard]] QJsonObject to_json(const PairedDevice& device, bool include_token);
[[nodiscard]] std::optional<PairedDevice> paired_device_from_json(const QJsonObject& obj);

[[nodiscard]] QJsonObject to_json(const ConflictSummary& summary);
[[nodiscard]] std::optional<ConflictSummary> conflict_summary_from_json(const QJsonObject& obj);

/**
 * With `include_archive` false the local archive path is left out, as in
 * status output.
 */
[[nodiscard]] QJsonObject to_json(const PendingConflict& conflict, bool include_archive);
[[nodiscard]] std::optional<PendingConflict> pending_conflict_from_json(const QJsonObject& obj);

} // namespace tally::sync
