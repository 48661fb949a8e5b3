#include "storage/archive.hpp"
#include "core/log.hpp"

#include <quazip.h>
#include <quazipfile.h>
#include <quazipnewinfo.h>

#include <QDebug>
#include <QDir>
#include <QDirIterator>
#include <QFile>
#include <QFileInfo>

#include <optional>

namespace tally::storage {

namespace {

constexpr qint64 CHUNK_SIZE = 64 * 1024;

Error zip_error(const QString& what, int code) {
    return Error{what.toStdString() + " (zip error " + std::to_string(code) + ")", codes::ZIP};
}

Error io_error(const QString& what) {
    return Error{what.toStdString(), codes::IO};
}

Result<void, Error> pump(QIODevice& in, QIODevice& out) {
    while (!in.atEnd()) {
        const QByteArray chunk = in.read(CHUNK_SIZE);
        if (chunk.isEmpty()) {
            return Result<void, Error>::err(io_error("Read failed: " + in.errorString()));
        }
        if (out.write(chunk) != chunk.size()) {
            return Result<void, Error>::err(io_error("Write failed: " + out.errorString()));
        }
    }
    return Result<void, Error>::ok();
}

Result<void, Error> add_file(QuaZip& zip, const QString& source, const QString& entry_name) {
    QFile in(source);
    if (!in.open(QIODevice::ReadOnly)) {
        return Result<void, Error>::err(io_error("Cannot read " + source + ": " + in.errorString()));
    }

    QuaZipFile out(&zip);
    if (!out.open(QIODevice::WriteOnly, QuaZipNewInfo(entry_name, source))) {
        return Result<void, Error>::err(zip_error("Cannot add " + entry_name, out.getZipError()));
    }

    auto copied = pump(in, out);
    out.close();
    if (copied.is_err()) {
        return copied;
    }
    if (out.getZipError() != UNZ_OK) {
        return Result<void, Error>::err(zip_error("Cannot finish " + entry_name, out.getZipError()));
    }
    return Result<void, Error>::ok();
}

// Joins `name` under `root`, refusing absolute names and ".." escapes.
std::optional<QString> safe_target(const QDir& root, const QString& name) {
    if (name.isEmpty() || QDir::isAbsolutePath(name) || name.contains(QLatin1Char('\\'))) {
        return std::nullopt;
    }
    const QString cleaned = QDir::cleanPath(name);
    if (cleaned == QStringLiteral("..") || cleaned.startsWith(QStringLiteral("../"))) {
        return std::nullopt;
    }
    return root.absoluteFilePath(cleaned);
}

} // namespace

Result<void, Error> create_archive(const QString& db_path,
                                   const QString& receipt_base,
                                   const QString& output_path) {
    if (!QFile::exists(db_path)) {
        return Result<void, Error>::err(io_error("Database file missing: " + db_path));
    }
    if (!QDir().mkpath(QFileInfo(output_path).absolutePath())) {
        return Result<void, Error>::err(io_error("Cannot create directory for " + output_path));
    }

    QuaZip zip(output_path);
    if (!zip.open(QuaZip::mdCreate)) {
        return Result<void, Error>::err(zip_error("Cannot create " + output_path, zip.getZipError()));
    }

    auto db_added = add_file(zip, db_path, QString::fromLatin1(ARCHIVE_DB_ENTRY));
    if (db_added.is_err()) {
        zip.close();
        return db_added;
    }

    int receipt_count = 0;
    const QDir base(receipt_base);
    if (!receipt_base.isEmpty() && base.exists()) {
        QDirIterator it(receipt_base, QDir::Files | QDir::Hidden, QDirIterator::Subdirectories);
        while (it.hasNext()) {
            const QString file = it.next();
            const QString entry = QString::fromLatin1(ARCHIVE_RECEIPTS_DIR) + QLatin1Char('/') +
                                  base.relativeFilePath(file);
            auto added = add_file(zip, file, entry);
            if (added.is_err()) {
                zip.close();
                return added;
            }
            ++receipt_count;
        }
    }

    zip.close();
    if (zip.getZipError() != ZIP_OK) {
        return Result<void, Error>::err(zip_error("Cannot finalize " + output_path, zip.getZipError()));
    }

    qCDebug(tallyStorageLog) << "archive created" << output_path << "receipts=" << receipt_count;
    return Result<void, Error>::ok();
}

Result<ArchiveContents, Error> extract_archive(const QString& archive_path, const QString& dest_dir) {
    using R = Result<ArchiveContents, Error>;

    QDir root(dest_dir);
    if (!root.mkpath(QStringLiteral("."))) {
        return R::err(io_error("Cannot create " + dest_dir));
    }

    QuaZip zip(archive_path);
    if (!zip.open(QuaZip::mdUnzip)) {
        return R::err(zip_error("Cannot open archive " + archive_path, zip.getZipError()));
    }

    for (bool more = zip.goToFirstFile(); more; more = zip.goToNextFile()) {
        const QString name = zip.getCurrentFileName();
        const auto target = safe_target(root, name);
        if (!target) {
            zip.close();
            return R::err(Error{"Archive entry escapes destination: " + name.toStdString(), codes::ZIP});
        }

        if (name.endsWith(QLatin1Char('/'))) {
            if (!QDir().mkpath(*target)) {
                zip.close();
                return R::err(io_error("Cannot create " + *target));
            }
            continue;
        }

        if (!QDir().mkpath(QFileInfo(*target).absolutePath())) {
            zip.close();
            return R::err(io_error("Cannot create directory for " + *target));
        }

        QuaZipFile in(&zip);
        if (!in.open(QIODevice::ReadOnly)) {
            zip.close();
            return R::err(zip_error("Cannot read entry " + name, in.getZipError()));
        }
        QFile out(*target);
        if (!out.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
            in.close();
            zip.close();
            return R::err(io_error("Cannot write " + *target + ": " + out.errorString()));
        }

        auto copied = pump(in, out);
        in.close();
        out.close();
        if (copied.is_err()) {
            zip.close();
            return R::err(copied.unwrap_err());
        }
        if (in.getZipError() != UNZ_OK) {
            zip.close();
            return R::err(zip_error("Corrupt entry " + name, in.getZipError()));
        }
    }

    const int iteration_error = zip.getZipError();
    zip.close();
    if (iteration_error != UNZ_OK) {
        return R::err(zip_error("Cannot read archive " + archive_path, iteration_error));
    }

    ArchiveContents contents;
    contents.root = root.absolutePath();
    if (QFileInfo(root.filePath(QString::fromLatin1(ARCHIVE_DB_ENTRY))).isFile()) {
        contents.db_file = root.absoluteFilePath(QString::fromLatin1(ARCHIVE_DB_ENTRY));
    }
    if (QFileInfo(root.filePath(QString::fromLatin1(ARCHIVE_RECEIPTS_DIR))).isDir()) {
        contents.receipts_dir = root.absoluteFilePath(QString::fromLatin1(ARCHIVE_RECEIPTS_DIR));
    }
    return R::ok(std::move(contents));
}

Result<int, Error> copy_tree(const QString& from, const QString& to, bool overwrite) {
    const QDir source(from);
    if (!source.exists()) {
        return Result<int, Error>::ok(0);
    }
    const QDir target(to);

    int copied = 0;
    QDirIterator it(from, QDir::Files | QDir::Hidden, QDirIterator::Subdirectories);
    while (it.hasNext()) {
        const QString file = it.next();
        const QString dest = target.absoluteFilePath(source.relativeFilePath(file));

        if (QFile::exists(dest)) {
            if (!overwrite) continue;
            if (!QFile::remove(dest)) {
                return Result<int, Error>::err(io_error("Cannot replace " + dest));
            }
        }
        if (!QDir().mkpath(QFileInfo(dest).absolutePath())) {
            return Result<int, Error>::err(io_error("Cannot create directory for " + dest));
        }
        if (!QFile::copy(file, dest)) {
            return Result<int, Error>::err(io_error("Cannot copy " + file + " to " + dest));
        }
        ++copied;
    }
    return Result<int, Error>::ok(copied);
}

} // namespace tally::storage
