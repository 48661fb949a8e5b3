#include "sync/models.hpp"

#include <QJsonArray>
#include <QJsonValue>

namespace tally::sync {

namespace {

QJsonValue optional_string(const std::optional<std::string>& value) {
    if (!value) return QJsonValue(QJsonValue::Null);
    return QString::fromStdString(*value);
}

std::optional<std::string> read_optional_string(const QJsonObject& obj, const QString& key) {
    const auto value = obj.value(key);
    if (!value.isString()) return std::nullopt;
    return value.toString().toStdString();
}

bool read_string(const QJsonObject& obj, const QString& key, std::string& out) {
    const auto value = obj.value(key);
    if (!value.isString()) return false;
    out = value.toString().toStdString();
    return true;
}

} // namespace

QJsonObject to_json(const PairedDevice& device, bool include_token) {
    QJsonObject obj;
    obj.insert(QStringLiteral("device_id"), QString::fromStdString(device.device_id));
    obj.insert(QStringLiteral("device_name"), QString::fromStdString(device.device_name));
    if (include_token) {
        obj.insert(QStringLiteral("token"), QString::fromStdString(device.token));
    }
    obj.insert(QStringLiteral("last_sync_at"), optional_string(device.last_sync_at));
    obj.insert(QStringLiteral("last_remote_change"), optional_string(device.last_remote_change));
    obj.insert(QStringLiteral("last_known_ip"), optional_string(device.last_known_ip));
    return obj;
}

std::optional<PairedDevice> paired_device_from_json(const QJsonObject& obj) {
    PairedDevice device;
    if (!read_string(obj, QStringLiteral("device_id"), device.device_id) ||
        !read_string(obj, QStringLiteral("token"), device.token)) {
        return std::nullopt;
    }
    if (device.device_id.empty() || device.token.empty()) {
        return std::nullopt;
    }
    device.device_name = read_optional_string(obj, QStringLiteral("device_name")).value_or("");
    device.last_sync_at = read_optional_string(obj, QStringLiteral("last_sync_at"));
    device.last_remote_change = read_optional_string(obj, QStringLiteral("last_remote_change"));
    device.last_known_ip = read_optional_string(obj, QStringLiteral("last_known_ip"));
    return device;
}

QJsonObject to_json(const ConflictSummary& summary) {
    QJsonArray items;
    for (const auto& item : summary.last_items) {
        QJsonObject entry;
        entry.insert(QStringLiteral("date"), QString::fromStdString(item.date));
        entry.insert(QStringLiteral("label"), QString::fromStdString(item.label));
        entry.insert(QStringLiteral("amount_chf"), item.amount_chf);
        entry.insert(QStringLiteral("tx_type"), QString::fromStdString(item.type));
        items.append(entry);
    }

    QJsonObject obj;
    obj.insert(QStringLiteral("tx_count"), static_cast<qint64>(summary.tx_count));
    obj.insert(QStringLiteral("income_total"), summary.income_total);
    obj.insert(QStringLiteral("expense_total"), summary.expense_total);
    obj.insert(QStringLiteral("last_items"), items);
    return obj;
}

std::optional<ConflictSummary> conflict_summary_from_json(const QJsonObject& obj) {
    if (!obj.value(QStringLiteral("tx_count")).isDouble()) {
        return std::nullopt;
    }

    ConflictSummary summary;
    summary.tx_count = obj.value(QStringLiteral("tx_count")).toInteger();
    summary.income_total = obj.value(QStringLiteral("income_total")).toDouble();
    summary.expense_total = obj.value(QStringLiteral("expense_total")).toDouble();
    for (const auto& value : obj.value(QStringLiteral("last_items")).toArray()) {
        const auto entry = value.toObject();
        summary.last_items.push_back(ConflictItem{
            .date = entry.value(QStringLiteral("date")).toString().toStdString(),
            .label = entry.value(QStringLiteral("label")).toString().toStdString(),
            .amount_chf = entry.value(QStringLiteral("amount_chf")).toDouble(),
            .type = entry.value(QStringLiteral("tx_type")).toString().toStdString()
        });
    }
    return summary;
}

QJsonObject to_json(const PendingConflict& conflict, bool include_archive) {
    QJsonObject obj;
    obj.insert(QStringLiteral("device_id"), QString::fromStdString(conflict.device_id));
    obj.insert(QStringLiteral("device_name"), QString::fromStdString(conflict.device_name));
    obj.insert(QStringLiteral("local_last_change"), QString::fromStdString(conflict.local_last_change));
    obj.insert(QStringLiteral("remote_last_change"), QString::fromStdString(conflict.remote_last_change));
    obj.insert(QStringLiteral("received_at"), QString::fromStdString(conflict.received_at));
    if (include_archive) {
        obj.insert(QStringLiteral("archive_path"), optional_string(conflict.archive_path));
    }
    obj.insert(QStringLiteral("local_summary"),
               conflict.local_summary ? QJsonValue(to_json(*conflict.local_summary))
                                      : QJsonValue(QJsonValue::Null));
    obj.insert(QStringLiteral("remote_summary"),
               conflict.remote_summary ? QJsonValue(to_json(*conflict.remote_summary))
                                       : QJsonValue(QJsonValue::Null));
    return obj;
}

std::optional<PendingConflict> pending_conflict_from_json(const QJsonObject& obj) {
    PendingConflict conflict;
    if (!read_string(obj, QStringLiteral("device_id"), conflict.device_id) ||
        !read_string(obj, QStringLiteral("local_last_change"), conflict.local_last_change) ||
        !read_string(obj, QStringLiteral("remote_last_change"), conflict.remote_last_change)) {
        return std::nullopt;
    }
    conflict.device_name = read_optional_string(obj, QStringLiteral("device_name")).value_or("");
    conflict.received_at = read_optional_string(obj, QStringLiteral("received_at")).value_or("");
    conflict.archive_path = read_optional_string(obj, QStringLiteral("archive_path"));

    const auto local = obj.value(QStringLiteral("local_summary"));
    if (local.isObject()) {
        conflict.local_summary = conflict_summary_from_json(local.toObject());
    }
    const auto remote = obj.value(QStringLiteral("remote_summary"));
    if (remote.isObject()) {
        conflict.remote_summary = conflict_summary_from_json(remote.toObject());
    }
    return conflict;
}

} // namespace tally::sync
