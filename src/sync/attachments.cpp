#include "sync/attachments.hpp"
#include "storage/archive.hpp"
#include "storage/ledger_repository.hpp"
#include "core/log.hpp"

#include <QDebug>
#include <QDir>
#include <QDirIterator>
#include <QFileInfo>
#include <QRegularExpression>
#include <QStringList>

#include <algorithm>

namespace tally::sync {

namespace {

QStringList path_components(std::string_view path) {
    static const QRegularExpression separators(QStringLiteral("[/\\\\]"));
    return QString::fromUtf8(path.data(), static_cast<qsizetype>(path.size()))
        .split(separators, Qt::SkipEmptyParts);
}

} // namespace

ReceiptIndex::ReceiptIndex(const QString& receipt_base)
    : base_(QDir(receipt_base).absolutePath()) {
    if (!QDir(base_).exists()) {
        return;
    }

    QStringList files;
    QDirIterator it(base_, QDir::Files | QDir::Hidden, QDirIterator::Subdirectories);
    while (it.hasNext()) {
        files.append(it.next());
    }
    // First match in path order wins when a name occurs more than once.
    std::sort(files.begin(), files.end());
    for (const auto& file : files) {
        const QString name = QFileInfo(file).fileName();
        if (!by_name_.contains(name)) {
            by_name_.insert(name, file);
        }
    }
}

std::optional<std::string> ReceiptIndex::map(std::string_view recorded_path) const {
    const QStringList parts = path_components(recorded_path);
    if (parts.isEmpty()) {
        return std::nullopt;
    }

    const auto root = std::find_if(parts.begin(), parts.end(), [](const QString& part) {
        return part.compare(QLatin1String(RECEIPT_ROOT_SEGMENT), Qt::CaseInsensitive) == 0;
    });
    if (root != parts.end() && std::next(root) != parts.end()) {
        QString candidate = base_;
        for (auto part = std::next(root); part != parts.end(); ++part) {
            candidate += QLatin1Char('/') + *part;
        }
        if (QFileInfo(candidate).isFile()) {
            return QDir::cleanPath(candidate).toStdString();
        }
    }

    const auto found = by_name_.constFind(parts.last());
    if (found != by_name_.constEnd()) {
        return found.value().toStdString();
    }
    return std::nullopt;
}

Result<int, Error> copy_missing_receipts(const QString& from, const QString& to) {
    return storage::copy_tree(from, to, false);
}

Result<int, Error> fix_receipt_paths(storage::Database& db, const QString& receipt_base) {
    storage::LedgerRepository repo(db);
    auto paths_result = repo.get_receipt_paths();
    if (paths_result.is_err()) {
        return Result<int, Error>::err(paths_result.unwrap_err());
    }

    const QString base = QDir(receipt_base).absolutePath();
    const ReceiptIndex index(base);
    int fixed = 0;
    for (const auto& [id, path] : paths_result.unwrap()) {
        const QString current = QString::fromStdString(path);
        if (current.startsWith(base) && QFileInfo(current).isFile()) {
            continue;
        }
        const auto mapped = index.map(path);
        if (!mapped) {
            qCDebug(tallySyncLog) << "no local file for receipt" << current;
            continue;
        }
        TALLY_TRY(Result<int>, repo.set_receipt_path(id, *mapped));
        ++fixed;
    }
    return Result<int, Error>::ok(fixed);
}

Result<void, Error> ensure_receipt_setting(storage::Database& db, const QString& receipt_base) {
    storage::LedgerRepository repo(db);
    return repo.set_setting(RECEIPT_BASE_SETTING, QDir(receipt_base).absolutePath().toStdString());
}

} // namespace tally::sync
