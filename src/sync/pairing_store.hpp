#pragma once

#include "sync/models.hpp"
#include "core/result.hpp"
#include <QString>
#include <QJsonObject>
#include <QLockFile>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tally::sync {

/**
 * PairingStore - this device's identity, pairing code, paired peers and
 * the pending conflict, persisted as one JSON document.
 *
 * The document is rewritten in full on every mutation through a
 * temporary file that is renamed over the old one. The file is shared
 * with other tallyd processes on the same data directory: every call
 * reads it again, and a mutation holds `<path>.lock` from the read to
 * the write.
 *
 * Thread-safe; every call takes the store mutex.
 */
class PairingStore {
public:
    static constexpr int CURRENT_VERSION = 1;
    static constexpr int LOCK_TIMEOUT_MS = 5000;

    /**
     * Load the store at `path`, creating it when absent. Missing identity
     * fields are generated and the result is written back immediately.
     */
    [[nodiscard]] static Result<std::unique_ptr<PairingStore>, Error> open(
        const QString& path, const std::string& default_device_name);

    PairingStore(const PairingStore&) = delete;
    PairingStore& operator=(const PairingStore&) = delete;

    [[nodiscard]] SyncSnapshot snapshot() const;
    [[nodiscard]] DeviceIdentity identity() const;
    [[nodiscard]] const QString& path() const { return path_; }

    /**
     * Pair a peer. Fails with SYNC_PAIR_CODE when `code` does not match,
     * also for known peers. A known peer gets its existing token back.
     */
    [[nodiscard]] Result<std::string, Error> pair(std::string_view code,
                                                  const std::string& device_id,
                                                  const std::string& device_name,
                                                  const std::optional<std::string>& ip);

    /**
     * Record a token this device received when it paired with a peer.
     * The entry is shared with pair(): one list, one token per peer.
     */
    [[nodiscard]] Result<void, Error> remember_peer(const std::string& device_id,
                                                    const std::string& device_name,
                                                    const std::string& token,
                                                    const std::optional<std::string>& ip);

    [[nodiscard]] std::optional<PairedDevice> find_device(const std::string& device_id) const;

    [[nodiscard]] std::optional<PairedDevice> device_for_token(const std::string& device_id,
                                                               std::string_view token) const;

    /**
     * Record metadata seen on an authenticated request. Unknown peers
     * are ignored.
     */
    [[nodiscard]] Result<void, Error> update_device_seen(const std::string& device_id,
                                                         const std::optional<std::string>& name,
                                                         const std::optional<std::string>& ip,
                                                         const std::optional<std::string>& remote_change);

    /**
     * Mark a completed sync: last_sync_at becomes now.
     */
    [[nodiscard]] Result<void, Error> update_device_sync(const std::string& device_id,
                                                         const std::optional<std::string>& remote_change);

    [[nodiscard]] Result<void, Error> set_pending_conflict(const PendingConflict& conflict);
    [[nodiscard]] Result<void, Error> clear_pending_conflict();
    [[nodiscard]] std::optional<PendingConflict> pending_conflict() const;

    [[nodiscard]] Result<void, Error> set_device_name(const std::string& name);

    /**
     * Bring a parsed document up to CURRENT_VERSION in place.
     * Exposed for tests.
     */
    [[nodiscard]] static Result<void, Error> migrate_document(QJsonObject& doc);

private:
    struct State {
        DeviceIdentity identity;
        std::string pair_code;
        std::vector<PairedDevice> paired_devices;
        std::optional<PendingConflict> pending_conflict;
    };

    PairingStore(QString path, State state) : path_(std::move(path)), state_(std::move(state)) {}

    [[nodiscard]] static Result<State, Error> load(const QString& path);
    [[nodiscard]] static QJsonObject encode(const State& state);
    [[nodiscard]] static Result<State, Error> decode(const QJsonObject& doc);

    [[nodiscard]] QString lock_path() const;

    // Take the file lock and read the latest document. Caller holds mutex_.
    [[nodiscard]] Result<State, Error> lock_and_load_locked(QLockFile& file_lock);

    // Latest document for reads, or the last known state when it cannot
    // be read. Caller holds mutex_.
    [[nodiscard]] State current_locked() const;

    /**
     * Write `next` to disk and adopt it. Caller holds mutex_ and the
     * file lock.
     */
    [[nodiscard]] Result<void, Error> commit_locked(State next);

    /**
     * Read-modify-write under both locks. `change` edits the latest state
     * and returns Result<T, Error>; the state is written only when it
     * succeeds.
     */
    template<typename F>
    auto update(F&& change) -> decltype(change(std::declval<State&>())) {
        using R = decltype(change(std::declval<State&>()));
        std::lock_guard<std::mutex> lock(mutex_);
        QLockFile file_lock(lock_path());
        auto latest = lock_and_load_locked(file_lock);
        if (latest.is_err()) {
            return R::err(latest.unwrap_err());
        }
        State next = std::move(latest).unwrap();
        auto result = change(next);
        if (result.is_err()) {
            return result;
        }
        auto saved = commit_locked(std::move(next));
        if (saved.is_err()) {
            return R::err(saved.unwrap_err());
        }
        return result;
    }

    QString path_;
    mutable std::mutex mutex_;
    State state_;
};

} // namespace tally::sync
