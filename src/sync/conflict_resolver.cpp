#include "sync/conflict_resolver.hpp"
#include "core/error_codes.hpp"
#include "core/log.hpp"

#include <QDebug>
#include <QFile>

#include <algorithm>
#include <cctype>
#include <string>

namespace tally::sync {

namespace {

std::string upper(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

Error no_archive() {
    return Error{"Conflict has no remote data to apply", codes::SYNC_CONFLICT};
}

} // namespace

std::optional<ResolveAction> parse_resolve_action(std::string_view label) {
    const auto key = upper(label);
    if (key == "KEEP_LOCAL") return ResolveAction::KeepLocal;
    if (key == "USE_REMOTE") return ResolveAction::UseRemote;
    if (key == "MERGE") return ResolveAction::Merge;
    return std::nullopt;
}

std::string_view to_string(ResolveAction action) {
    switch (action) {
        case ResolveAction::KeepLocal: return "KEEP_LOCAL";
        case ResolveAction::UseRemote: return "USE_REMOTE";
        case ResolveAction::Merge: return "MERGE";
    }
    return "UNKNOWN";
}

Result<void, Error> ConflictResolver::resolve(std::string_view action_label) {
    auto action = parse_resolve_action(action_label);
    if (!action) {
        return Result<void, Error>::err(
            Error{"Invalid conflict action: " + std::string(action_label), codes::SYNC_CONFLICT});
    }
    return resolve(*action);
}

Result<void, Error> ConflictResolver::resolve(ResolveAction action) {
    auto conflict = ctx_.pairing().pending_conflict();
    if (!conflict) {
        return Result<void, Error>::err(Error{"No pending conflict", codes::SYNC_CONFLICT});
    }

    qCInfo(tallySyncLog) << "resolving conflict with" << QString::fromStdString(conflict->device_name)
                         << "action=" << QString::fromUtf8(to_string(action).data(),
                                                           static_cast<int>(to_string(action).size()));
    switch (action) {
        case ResolveAction::KeepLocal: return keep_local(*conflict);
        case ResolveAction::UseRemote: return use_remote(*conflict);
        case ResolveAction::Merge: return merge(*conflict);
    }
    return Result<void, Error>::err(Error{"Invalid conflict action", codes::SYNC_CONFLICT});
}

Result<void, Error> ConflictResolver::keep_local(const PendingConflict& conflict) {
    discard_archive(conflict);
    return finish(conflict);
}

Result<void, Error> ConflictResolver::use_remote(const PendingConflict& conflict) {
    if (!conflict.archive_path) {
        return Result<void, Error>::err(no_archive());
    }
    TALLY_TRY(Result<void>, ctx_.apply_remote_restore(QString::fromStdString(*conflict.archive_path),
                                                      "SYNC_RESTORE_REMOTE"));
    TALLY_TRY(Result<void>, finish(conflict));
    discard_archive(conflict);
    return Result<void, Error>::ok();
}

Result<void, Error> ConflictResolver::merge(const PendingConflict& conflict) {
    if (!conflict.archive_path) {
        return Result<void, Error>::err(no_archive());
    }
    auto stats = ctx_.merge_archive(QString::fromStdString(*conflict.archive_path));
    if (stats.is_err()) {
        return Result<void, Error>::err(stats.unwrap_err());
    }
    TALLY_TRY(Result<void>, finish(conflict));
    discard_archive(conflict);
    return Result<void, Error>::ok();
}

Result<void, Error> ConflictResolver::finish(const PendingConflict& conflict) {
    TALLY_TRY(Result<void>, ctx_.pairing().update_device_sync(conflict.device_id,
                                                              conflict.remote_last_change));
    return ctx_.pairing().clear_pending_conflict();
}

void ConflictResolver::discard_archive(const PendingConflict& conflict) {
    if (!conflict.archive_path) {
        return;
    }
    const auto path = QString::fromStdString(*conflict.archive_path);
    if (QFile::exists(path) && !QFile::remove(path)) {
        qCWarning(tallySyncLog) << "cannot remove conflict archive" << path;
    }
}

} // namespace tally::sync
