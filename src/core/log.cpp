#include "core/log.hpp"

namespace tally {

Q_LOGGING_CATEGORY(tallySyncLog, "tally.sync", QtInfoMsg)
Q_LOGGING_CATEGORY(tallyStorageLog, "tally.storage", QtInfoMsg)
Q_LOGGING_CATEGORY(tallyHttpLog, "tally.http", QtInfoMsg)

void enable_sync_debug(bool enabled) {
    if (enabled) {
        QLoggingCategory::setFilterRules(QStringLiteral("tally.sync.debug=true\n"
                                                        "tally.http.debug=true"));
    } else {
        QLoggingCategory::setFilterRules(QStringLiteral("tally.sync.debug=false\n"
                                                        "tally.http.debug=false"));
    }
}

} // namespace tally
