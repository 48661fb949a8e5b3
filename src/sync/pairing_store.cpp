#include "sync/pairing_store.hpp"
#include "crypto/random.hpp"
#include "core/log.hpp"
#include "core/types.hpp"
#include "core/error_codes.hpp"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QLockFile>
#include <QSaveFile>

#include <algorithm>

namespace tally::sync {

namespace {

Error store_error(std::string message) {
    return Error{std::move(message), codes::SYNC_STORE};
}

bool write_bytes_atomic(const QString& path, const QByteArray& bytes) {
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        return false;
    }
    if (file.write(bytes) != bytes.size()) {
        file.cancelWriting();
        return false;
    }
    return file.commit();
}

std::string trimmed(std::string_view text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return {};
    const auto last = text.find_last_not_of(" \t\r\n");
    return std::string(text.substr(first, last - first + 1));
}

// Version 0 is the original schema-less layout: the same keys as today
// but without "version", and without any guarantee that peer entries are
// complete.
Result<void, Error> migrate_v0_to_v1(QJsonObject& doc) {
    QJsonArray kept;
    for (const auto& value : doc.value(QStringLiteral("paired_devices")).toArray()) {
        const auto entry = value.toObject();
        if (entry.value(QStringLiteral("device_id")).toString().isEmpty() ||
            entry.value(QStringLiteral("token")).toString().isEmpty()) {
            qCWarning(tallySyncLog) << "dropping incomplete paired device entry during migration";
            continue;
        }
        kept.append(entry);
    }
    doc.insert(QStringLiteral("paired_devices"), kept);
    if (!doc.value(QStringLiteral("pending_conflict")).isObject()) {
        doc.insert(QStringLiteral("pending_conflict"), QJsonValue(QJsonValue::Null));
    }
    doc.insert(QStringLiteral("version"), 1);
    return Result<void, Error>::ok();
}

} // namespace

Result<void, Error> PairingStore::migrate_document(QJsonObject& doc) {
    const auto version_value = doc.value(QStringLiteral("version"));
    if (!version_value.isUndefined() && !version_value.isDouble()) {
        return Result<void, Error>::err(store_error("sync state has a non-numeric version"));
    }

    int version = version_value.toInt(0);
    if (version > CURRENT_VERSION) {
        return Result<void, Error>::err(store_error(
            "sync state version " + std::to_string(version) + " is newer than supported " +
            std::to_string(CURRENT_VERSION)));
    }

    while (version < CURRENT_VERSION) {
        switch (version) {
        case 0:
            TALLY_TRY(Result<void>, migrate_v0_to_v1(doc));
            break;
        default:
            return Result<void, Error>::err(store_error(
                "no migration from sync state version " + std::to_string(version)));
        }
        version = doc.value(QStringLiteral("version")).toInt();
    }
    return Result<void, Error>::ok();
}

QJsonObject PairingStore::encode(const State& state) {
    QJsonArray devices;
    for (const auto& device : state.paired_devices) {
        devices.append(to_json(device, true));
    }

    QJsonObject doc;
    doc.insert(QStringLiteral("version"), CURRENT_VERSION);
    doc.insert(QStringLiteral("device_id"), QString::fromStdString(state.identity.device_id));
    doc.insert(QStringLiteral("device_name"), QString::fromStdString(state.identity.device_name));
    doc.insert(QStringLiteral("pair_code"), QString::fromStdString(state.pair_code));
    doc.insert(QStringLiteral("paired_devices"), devices);
    doc.insert(QStringLiteral("pending_conflict"),
               state.pending_conflict ? QJsonValue(to_json(*state.pending_conflict, true))
                                      : QJsonValue(QJsonValue::Null));
    return doc;
}

Result<PairingStore::State, Error> PairingStore::decode(const QJsonObject& doc) {
    State state;
    state.identity.device_id = doc.value(QStringLiteral("device_id")).toString().toStdString();
    state.identity.device_name = doc.value(QStringLiteral("device_name")).toString().toStdString();
    state.pair_code = doc.value(QStringLiteral("pair_code")).toString().toStdString();

    for (const auto& value : doc.value(QStringLiteral("paired_devices")).toArray()) {
        auto device = paired_device_from_json(value.toObject());
        if (!device) {
            return Result<State, Error>::err(store_error("malformed paired device entry"));
        }
        state.paired_devices.push_back(std::move(*device));
    }

    const auto conflict = doc.value(QStringLiteral("pending_conflict"));
    if (conflict.isObject()) {
        state.pending_conflict = pending_conflict_from_json(conflict.toObject());
        if (!state.pending_conflict) {
            return Result<State, Error>::err(store_error("malformed pending conflict"));
        }
    }
    return Result<State, Error>::ok(std::move(state));
}

Result<PairingStore::State, Error> PairingStore::load(const QString& path) {
    QFile file(path);
    if (!file.exists()) {
        return Result<State, Error>::ok(State{});
    }
    if (!file.open(QIODevice::ReadOnly)) {
        return Result<State, Error>::err(store_error(
            "cannot read " + path.toStdString() + ": " + file.errorString().toStdString()));
    }

    QJsonParseError err{};
    const auto json = QJsonDocument::fromJson(file.readAll(), &err);
    if (err.error != QJsonParseError::NoError || !json.isObject()) {
        return Result<State, Error>::err(store_error(
            "cannot parse " + path.toStdString() + ": " + err.errorString().toStdString()));
    }

    auto doc = json.object();
    TALLY_TRY(Result<State>, migrate_document(doc));
    return decode(doc);
}

Result<std::unique_ptr<PairingStore>, Error> PairingStore::open(const QString& path,
                                                                 const std::string& default_device_name) {
    using R = Result<std::unique_ptr<PairingStore>, Error>;

    if (!QDir().mkpath(QFileInfo(path).absolutePath())) {
        return R::err(store_error("cannot create directory for " + path.toStdString()));
    }

    std::unique_ptr<PairingStore> store(new PairingStore(path, State{}));
    auto opened = store->update([&](State& state) {
        if (state.identity.device_id.empty()) {
            state.identity.device_id = crypto::generate_uuid().to_string();
        }
        if (state.identity.device_name.empty()) {
            state.identity.device_name = default_device_name;
        }
        if (state.pair_code.empty()) {
            state.pair_code = crypto::generate_pairing_code();
        }
        return Result<void, Error>::ok();
    });
    if (opened.is_err()) {
        return R::err(opened.unwrap_err());
    }

    const auto identity = store->identity();
    qCInfo(tallySyncLog) << "sync state loaded from" << path
                         << "device_id=" << QString::fromStdString(identity.device_id);
    return R::ok(std::move(store));
}

QString PairingStore::lock_path() const {
    return path_ + QStringLiteral(".lock");
}

Result<PairingStore::State, Error> PairingStore::lock_and_load_locked(QLockFile& file_lock) {
    if (!file_lock.tryLock(LOCK_TIMEOUT_MS)) {
        return Result<State, Error>::err(store_error(
            "cannot lock " + lock_path().toStdString() + " (error " +
            std::to_string(static_cast<int>(file_lock.error())) + ")"));
    }
    if (!QFile::exists(path_)) {
        return Result<State, Error>::ok(state_);
    }
    return load(path_);
}

PairingStore::State PairingStore::current_locked() const {
    if (!QFile::exists(path_)) {
        return state_;
    }
    auto loaded = load(path_);
    if (loaded.is_err()) {
        qCWarning(tallySyncLog) << "cannot re-read sync state, using last known:"
                                << QString::fromStdString(loaded.unwrap_err().to_string());
        return state_;
    }
    return std::move(loaded).unwrap();
}

Result<void, Error> PairingStore::commit_locked(State next) {
    const QByteArray bytes = QJsonDocument(encode(next)).toJson(QJsonDocument::Indented);
    if (!write_bytes_atomic(path_, bytes)) {
        return Result<void, Error>::err(store_error("cannot write " + path_.toStdString()));
    }
    state_ = std::move(next);
    return Result<void, Error>::ok();
}

SyncSnapshot PairingStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    State state = current_locked();
    return SyncSnapshot{
        .identity = std::move(state.identity),
        .pair_code = std::move(state.pair_code),
        .paired_devices = std::move(state.paired_devices),
        .pending_conflict = std::move(state.pending_conflict)
    };
}

DeviceIdentity PairingStore::identity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_locked().identity;
}

Result<std::string, Error> PairingStore::pair(std::string_view code,
                                              const std::string& device_id,
                                              const std::string& device_name,
                                              const std::optional<std::string>& ip) {
    return update([&](State& next) -> Result<std::string, Error> {
        if (!crypto::constant_time_equals(trimmed(code), next.pair_code)) {
            return Result<std::string, Error>::err(
                Error{"Pairing code does not match", codes::SYNC_PAIR_CODE});
        }
        if (device_id.empty()) {
            return Result<std::string, Error>::err(Error{"Device id is missing", codes::SYNC_PAIR});
        }

        auto it = std::find_if(next.paired_devices.begin(), next.paired_devices.end(),
                               [&](const PairedDevice& d) { return d.device_id == device_id; });
        if (it != next.paired_devices.end()) {
            it->device_name = device_name;
            if (ip) {
                it->last_known_ip = ip;
            }
            return Result<std::string, Error>::ok(it->token);
        }

        std::string token = crypto::generate_token();
        next.paired_devices.push_back(PairedDevice{
            .device_id = device_id,
            .device_name = device_name,
            .token = token,
            .last_sync_at = std::nullopt,
            .last_remote_change = std::nullopt,
            .last_known_ip = ip
        });
        return Result<std::string, Error>::ok(std::move(token));
    });
}

Result<void, Error> PairingStore::remember_peer(const std::string& device_id,
                                                const std::string& device_name,
                                                const std::string& token,
                                                const std::optional<std::string>& ip) {
    if (device_id.empty() || token.empty()) {
        return Result<void, Error>::err(Error{"Peer id and token are required", codes::SYNC_PAIR});
    }
    return update([&](State& next) {
        auto it = std::find_if(next.paired_devices.begin(), next.paired_devices.end(),
                               [&](const PairedDevice& d) { return d.device_id == device_id; });
        if (it != next.paired_devices.end()) {
            it->device_name = device_name;
            it->token = token;
            if (ip) it->last_known_ip = ip;
        } else {
            next.paired_devices.push_back(PairedDevice{
                .device_id = device_id,
                .device_name = device_name,
                .token = token,
                .last_sync_at = std::nullopt,
                .last_remote_change = std::nullopt,
                .last_known_ip = ip
            });
        }
        return Result<void, Error>::ok();
    });
}

std::optional<PairedDevice> PairingStore::find_device(const std::string& device_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const State state = current_locked();
    for (const auto& device : state.paired_devices) {
        if (device.device_id == device_id) {
            return device;
        }
    }
    return std::nullopt;
}

std::optional<PairedDevice> PairingStore::device_for_token(const std::string& device_id,
                                                           std::string_view token) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const State state = current_locked();
    for (const auto& device : state.paired_devices) {
        if (device.device_id == device_id && crypto::constant_time_equals(device.token, token)) {
            return device;
        }
    }
    return std::nullopt;
}

Result<void, Error> PairingStore::update_device_seen(const std::string& device_id,
                                                     const std::optional<std::string>& name,
                                                     const std::optional<std::string>& ip,
                                                     const std::optional<std::string>& remote_change) {
    return update([&](State& next) {
        auto it = std::find_if(next.paired_devices.begin(), next.paired_devices.end(),
                               [&](const PairedDevice& d) { return d.device_id == device_id; });
        if (it != next.paired_devices.end()) {
            if (name) it->device_name = *name;
            if (ip) it->last_known_ip = ip;
            if (remote_change) it->last_remote_change = remote_change;
        }
        return Result<void, Error>::ok();
    });
}

Result<void, Error> PairingStore::update_device_sync(const std::string& device_id,
                                                     const std::optional<std::string>& remote_change) {
    return update([&](State& next) {
        auto it = std::find_if(next.paired_devices.begin(), next.paired_devices.end(),
                               [&](const PairedDevice& d) { return d.device_id == device_id; });
        if (it != next.paired_devices.end()) {
            it->last_sync_at = Timestamp::now().to_iso_string();
            if (remote_change) it->last_remote_change = remote_change;
        }
        return Result<void, Error>::ok();
    });
}

Result<void, Error> PairingStore::set_pending_conflict(const PendingConflict& conflict) {
    return update([&](State& next) {
        next.pending_conflict = conflict;
        return Result<void, Error>::ok();
    });
}

Result<void, Error> PairingStore::clear_pending_conflict() {
    return update([](State& next) {
        next.pending_conflict.reset();
        return Result<void, Error>::ok();
    });
}

std::optional<PendingConflict> PairingStore::pending_conflict() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_locked().pending_conflict;
}

Result<void, Error> PairingStore::set_device_name(const std::string& name) {
    const std::string clean = trimmed(name);
    if (clean.empty()) {
        return Result<void, Error>::err(store_error("device name must not be empty"));
    }
    return update([&](State& next) {
        next.identity.device_name = clean;
        return Result<void, Error>::ok();
    });
}

} // namespace tally::sync
