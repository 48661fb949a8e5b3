#pragma once

#include "storage/database.hpp"
#include "core/result.hpp"
#include <QHash>
#include <QString>
#include <optional>
#include <string>
#include <string_view>

namespace tally::sync {

// Directory name of the attachment store inside the data directory. Paths
// recorded on another machine are rebased at this segment.
inline constexpr const char* RECEIPT_ROOT_SEGMENT = "Belege";
inline constexpr const char* RECEIPT_BASE_SETTING = "receipt_base_folder";

/**
 * ReceiptIndex - maps attachment paths recorded on another device onto
 * files under the local attachment root.
 */
class ReceiptIndex {
public:
    explicit ReceiptIndex(const QString& receipt_base);

    /**
     * Rebase the part after the RECEIPT_ROOT_SEGMENT component
     * (case-insensitive) onto the local root if that file exists; else
     * look the file name up anywhere under the root. nullopt when neither
     * finds a file.
     */
    [[nodiscard]] std::optional<std::string> map(std::string_view recorded_path) const;

private:
    QString base_;
    QHash<QString, QString> by_name_;
};

/**
 * Copy attachment files from `from` that do not yet exist under `to`.
 */
[[nodiscard]] Result<int, Error> copy_missing_receipts(const QString& from, const QString& to);

/**
 * Rewrite every booking's receipt_path that does not point at an existing
 * file under `receipt_base` to its local equivalent, where one exists.
 */
[[nodiscard]] Result<int, Error> fix_receipt_paths(storage::Database& db, const QString& receipt_base);

/**
 * Point the receipt_base_folder setting at `receipt_base`.
 */
[[nodiscard]] Result<void, Error> ensure_receipt_setting(storage::Database& db,
                                                         const QString& receipt_base);

} // namespace tally::sync
