#include "storage/change_log.hpp"
#include "core/types.hpp"

namespace tally::storage {

Result<std::string, Error> ChangeLog::last_change() {
    auto stmt_result = db_.prepare("SELECT MAX(ts) FROM audit_log;");
    if (stmt_result.is_err()) {
        return Result<std::string, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<std::string, Error>::err(step_result.unwrap_err());
    }

    if (!step_result.unwrap() || stmt.column_is_null(0)) {
        return Result<std::string, Error>::ok(std::string(EPOCH_SENTINEL));
    }
    return Result<std::string, Error>::ok(stmt.column_text(0));
}

Result<std::string, Error> ChangeLog::append(const ChangeEntry& entry) {
    auto last_result = last_change();
    if (last_result.is_err()) {
        return last_result;
    }

    Timestamp ts = Timestamp::now();
    if (auto last = Timestamp::from_iso_string(last_result.unwrap()); last && ts <= *last) {
        ts = *last + std::chrono::milliseconds(1);
    }
    const std::string ts_text = ts.to_iso_string();

    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO audit_log (ts, actor, action, entity_type, entity_id, ref_id, payload_json, details)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?);
    )SQL");
    if (stmt_result.is_err()) {
        return Result<std::string, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bind_result = stmt.bind_all(ts_text, entry.actor, entry.action, entry.entity_type,
                                     entry.entity_id, entry.ref_id, entry.payload_json,
                                     entry.details);
    if (bind_result.is_err()) {
        return Result<std::string, Error>::err(bind_result.unwrap_err());
    }

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<std::string, Error>::err(step_result.unwrap_err());
    }

    return Result<std::string, Error>::ok(ts_text);
}

Result<int64_t, Error> ChangeLog::count() {
    auto stmt_result = db_.prepare("SELECT COUNT(*) FROM audit_log;");
    if (stmt_result.is_err()) {
        return Result<int64_t, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<int64_t, Error>::err(step_result.unwrap_err());
    }
    return Result<int64_t, Error>::ok(stmt.column_int64(0));
}

} // namespace tally::storage
