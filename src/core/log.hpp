#pragma once

#include <QLoggingCategory>

namespace tally {

Q_DECLARE_LOGGING_CATEGORY(tallySyncLog)
Q_DECLARE_LOGGING_CATEGORY(tallyStorageLog)
Q_DECLARE_LOGGING_CATEGORY(tallyHttpLog)

/**
 * Turn on debug output for the sync and http categories.
 * Set from --debug-sync or TALLY_DEBUG_SYNC.
 */
void enable_sync_debug(bool enabled);

} // namespace tally
