#include "file_copier.h"
#include "file_utils.h"
#include "test_hooks.h"

#include <QtConcurrent>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QThreadPool>
#include <QDebug>

#include <atomic>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <vector>

static TransferResult openFailure(const QString& path, bool forWriting)
{
    if (!forWriting && !QFileInfo::exists(path))
        return TransferResult::failure(TransferErrorKind::PathNotFound, QString("Source missing: %1").arg(path));
    if (forWriting) {
        const QFileInfo dir(QFileInfo(path).absolutePath());
        if (dir.exists() && !dir.isWritable())
            return TransferResult::failure(TransferErrorKind::PermissionDenied, QString("Cannot write %1").arg(path));
        return TransferResult::failure(TransferErrorKind::IoError, QString("Failed to write %1").arg(path));
    }
    if (!QFileInfo(path).isReadable())
        return TransferResult::failure(TransferErrorKind::PermissionDenied, QString("Cannot read %1").arg(path));
    return TransferResult::failure(TransferErrorKind::IoError, QString("Failed to open %1").arg(path));
}

FileCopier::FileCopier(const TransferSettings& settings)
    : m_settings(settings)
{
    m_settings.clamp();
}

QString FileCopier::chunkTempPath(const QString& dst, int index)
{
    return QString("%1.chunk%2").arg(dst).arg(index);
}

QString FileCopier::stagingPath(const QString& dst)
{
    return dst + QStringLiteral(".part");
}

static TransferResult sameFileFailure(const QString& path)
{
    return TransferResult::failure(TransferErrorKind::IoError,
                                   QString("Source and destination are the same file: %1").arg(path));
}

// Replaces dst with the finished staging file in one rename
static TransferResult commitStaged(const QString& staging, const QString& dst)
{
    if (std::rename(QFile::encodeName(staging).constData(), QFile::encodeName(dst).constData()) == 0)
        return TransferResult::success();
    const int err = errno;
    FileUtils::removeIfExists(staging);
    return TransferResult::failure(errorKindFromErrno(err),
                                   QString("Cannot replace %1: %2").arg(dst, QString::fromLocal8Bit(std::strerror(err))));
}

qint64 FileCopier::chunkSizeFor(qint64 fileSize) const
{
    const qint64 perWorker = fileSize / qMax(1, m_settings.chunkWorkers);
    return qBound(m_settings.minChunkSize, perWorker, m_settings.maxChunkSize);
}

TransferResult FileCopier::verifySize(const QString& src, const QString& dst)
{
    const qint64 expected = FileUtils::fileSize(src);
    const qint64 actual = FileUtils::fileSize(dst);
    if (actual < 0 || actual != expected) {
        return TransferResult::failure(TransferErrorKind::CopyVerificationFailed,
                                       QString("Size mismatch for %1 (expected %2, got %3)")
                                           .arg(dst).arg(expected).arg(actual));
    }
    return TransferResult::success();
}

void FileCopier::removeChunkTemps(const QString& dst, int chunkCount)
{
    for (int i = 0; i < chunkCount; ++i) {
        const QString temp = chunkTempPath(dst, i);
        if (!FileUtils::removeIfExists(temp))
            qWarning() << "[FileCopier] Could not remove chunk temporary" << temp;
    }
}

TransferResult FileCopier::copyFile(const QString& src, const QString& dst, const CancellationToken& token,
                                    const ByteProgress& onBytes) const
{
    if (token.isCancelled()) return TransferResult::cancelledResult();
    if (!FileUtils::fileExists(src))
        return TransferResult::failure(TransferErrorKind::PathNotFound, QString("Source missing: %1").arg(src));

    QString dirError;
    if (!FileUtils::ensureParentDir(dst, &dirError))
        return TransferResult::failure(TransferErrorKind::PermissionDenied, dirError);

    const qint64 size = QFileInfo(src).size();
    if (FileUtils::isSameFile(src, dst)) {
        qInfo() << "[FileCopier] Source is already at its destination" << src;
        if (onBytes) onBytes(size);
        return TransferResult::success();
    }

    // The existing destination stays in place until the new copy is complete
    const QString staging = stagingPath(dst);
    const TransferResult copied = size < m_settings.smallFileThreshold
                                      ? copySmall(src, staging, token, onBytes)
                                      : copyChunked(src, staging, token, onBytes);
    if (!copied.ok()) {
        FileUtils::removeIfExists(staging);
        return copied;
    }
    if (token.isCancelled()) {
        FileUtils::removeIfExists(staging);
        return TransferResult::cancelledResult();
    }
    return commitStaged(staging, dst);
}

TransferResult FileCopier::copySmall(const QString& src, const QString& dst, const CancellationToken& token,
                                     const ByteProgress& onBytes) const
{
    if (token.isCancelled()) return TransferResult::cancelledResult();
    if (FileUtils::isSameFile(src, dst)) return sameFileFailure(src);

    // QFile::copy refuses to overwrite
    FileUtils::removeIfExists(dst);
    if (QFile::copy(src, dst)) {
        if (token.isCancelled()) {
            FileUtils::removeIfExists(dst);
            return TransferResult::cancelledResult();
        }
        TransferResult verified = verifySize(src, dst);
        if (!verified.ok()) {
            FileUtils::removeIfExists(dst);
            return verified;
        }
        if (onBytes) onBytes(QFileInfo(dst).size());
        return verified;
    }

    qDebug() << "[FileCopier] Direct copy failed for" << src << "- using micro-chunk copy";
    return copyMicroChunked(src, dst, token, onBytes);
}

TransferResult FileCopier::copyMicroChunked(const QString& src, const QString& dst, const CancellationToken& token,
                                            const ByteProgress& onBytes) const
{
    if (FileUtils::isSameFile(src, dst)) return sameFileFailure(src);
    QFile in(src);
    QFile out(dst);
    if (!in.open(QIODevice::ReadOnly)) return openFailure(src, false);
    if (!out.open(QIODevice::WriteOnly | QIODevice::Truncate)) return openFailure(dst, true);

    auto abort = [&out](const TransferResult& r) {
        out.close();
        out.remove();
        return r;
    };

    QByteArray buf;
    buf.resize(static_cast<int>(m_settings.microChunkSize));
    while (!in.atEnd()) {
        if (token.isCancelled()) return abort(TransferResult::cancelledResult());
        const qint64 r = in.read(buf.data(), buf.size());
        if (r < 0) return abort(TransferResult::failure(TransferErrorKind::IoError, QString("Read error %1").arg(src)));
        if (r == 0) break;
        if (token.isCancelled()) return abort(TransferResult::cancelledResult());
        const qint64 w = out.write(buf.constData(), r);
        if (w != r) return abort(TransferResult::failure(TransferErrorKind::IoError, QString("Write error %1").arg(dst)));
        if (onBytes) onBytes(w);
        if (token.isCancelled()) return abort(TransferResult::cancelledResult());
    }
    out.flush();
    out.close();
    in.close();

    TransferResult verified = verifySize(src, dst);
    if (!verified.ok()) FileUtils::removeIfExists(dst);
    return verified;
}

TransferResult FileCopier::copyChunk(const QString& src, const QString& tempPath, const QString& dst, int index,
                                     qint64 offset, qint64 length, const CancellationToken& token,
                                     const std::atomic_bool& siblingFailed, const ByteProgress& onBytes) const
{
    QFile in(src);
    QFile out(tempPath);
    if (!in.open(QIODevice::ReadOnly) || !in.seek(offset)) {
        return TransferResult::failure(TransferErrorKind::ChunkFailure,
                                       QString("Chunk %1: cannot read %2 at %3").arg(index).arg(src).arg(offset));
    }
    if (!out.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return TransferResult::failure(TransferErrorKind::ChunkFailure,
                                       QString("Chunk %1: cannot create %2").arg(index).arg(tempPath));
    }

    auto abort = [&out](const TransferResult& r) {
        out.close();
        out.remove();
        return r;
    };
    auto stopRequested = [&token, &siblingFailed]() {
        return token.isCancelled() || siblingFailed.load();
    };

    QByteArray buf;
    buf.resize(static_cast<int>(qMin(m_settings.subChunkSize, length)));
    qint64 remaining = length;
    while (remaining > 0) {
        if (stopRequested()) return abort(TransferResult::cancelledResult());
        const qint64 want = qMin<qint64>(buf.size(), remaining);
        const qint64 r = in.read(buf.data(), want);
        if (r <= 0) {
            return abort(TransferResult::failure(TransferErrorKind::ChunkFailure,
                                                 QString("Chunk %1: short read from %2").arg(index).arg(src)));
        }
        if (stopRequested()) return abort(TransferResult::cancelledResult());
        if (TestHooks::chunkWriteShouldFail(dst, index)) {
            return abort(TransferResult::failure(TransferErrorKind::ChunkFailure,
                                                 QString("Chunk %1: write failed for %2").arg(index).arg(tempPath)));
        }
        const qint64 w = out.write(buf.constData(), r);
        if (w != r) {
            return abort(TransferResult::failure(TransferErrorKind::ChunkFailure,
                                                 QString("Chunk %1: write failed for %2").arg(index).arg(tempPath)));
        }
        remaining -= w;
        if (onBytes) onBytes(w);
    }
    out.flush();
    out.close();
    return TransferResult::success();
}

TransferResult FileCopier::reassemble(const QString& dst, int chunkCount, const CancellationToken& token) const
{
    QFile out(dst);
    if (!out.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return TransferResult::failure(TransferErrorKind::ReassemblyFailure, QString("Cannot create %1").arg(dst));
    }

    QByteArray buf;
    buf.resize(static_cast<int>(m_settings.subChunkSize));
    for (int i = 0; i < chunkCount; ++i) {
        QFile part(chunkTempPath(dst, i));
        if (!part.open(QIODevice::ReadOnly)) {
            out.close();
            out.remove();
            return TransferResult::failure(TransferErrorKind::ReassemblyFailure,
                                           QString("Missing chunk %1 for %2").arg(i).arg(dst));
        }
        while (!part.atEnd()) {
            if (token.isCancelled()) {
                out.close();
                out.remove();
                return TransferResult::cancelledResult();
            }
            const qint64 r = part.read(buf.data(), buf.size());
            if (r < 0 || (r > 0 && out.write(buf.constData(), r) != r)) {
                out.close();
                out.remove();
                return TransferResult::failure(TransferErrorKind::ReassemblyFailure,
                                               QString("Failed to append chunk %1 to %2").arg(i).arg(dst));
            }
            if (r == 0) break;
        }
    }
    out.flush();
    out.close();
    return TransferResult::success();
}

TransferResult FileCopier::copyChunked(const QString& src, const QString& dst, const CancellationToken& token,
                                       const ByteProgress& onBytes) const
{
    if (FileUtils::isSameFile(src, dst)) return sameFileFailure(src);
    const qint64 size = QFileInfo(src).size();
    const qint64 chunkSize = chunkSizeFor(size);
    const int chunkCount = static_cast<int>((size + chunkSize - 1) / chunkSize);

    qDebug() << "[FileCopier] Chunked copy" << src << "size" << size << "chunks" << chunkCount
             << "chunk size" << chunkSize;

    QThreadPool pool;
    pool.setMaxThreadCount(qMax(1, qMin(m_settings.chunkWorkers, chunkCount)));

    std::atomic_bool siblingFailed{false};
    std::vector<TransferResult> results(static_cast<size_t>(chunkCount));
    QList<QFuture<void>> futures;
    for (int i = 0; i < chunkCount; ++i) {
        const qint64 offset = static_cast<qint64>(i) * chunkSize;
        const qint64 length = qMin(chunkSize, size - offset);
        futures.append(QtConcurrent::run(&pool, [this, &src, &dst, &token, &siblingFailed, &results, &onBytes,
                                                 i, offset, length]() {
            TransferResult r = copyChunk(src, chunkTempPath(dst, i), dst, i, offset, length,
                                         token, siblingFailed, onBytes);
            if (!r.ok() && !r.cancelled()) siblingFailed.store(true);
            results[static_cast<size_t>(i)] = r;
        }));
    }
    for (QFuture<void>& f : futures)
        f.waitForFinished();

    if (token.isCancelled()) {
        removeChunkTemps(dst, chunkCount);
        FileUtils::removeIfExists(dst);
        return TransferResult::cancelledResult();
    }
    for (const TransferResult& r : results) {
        if (!r.ok() && !r.cancelled()) {
            qWarning() << "[FileCopier]" << r.message;
            removeChunkTemps(dst, chunkCount);
            FileUtils::removeIfExists(dst);
            return r;
        }
    }

    TransferResult assembled = reassemble(dst, chunkCount, token);
    removeChunkTemps(dst, chunkCount);
    if (!assembled.ok()) {
        FileUtils::removeIfExists(dst);
        return assembled;
    }

    TransferResult verified = verifySize(src, dst);
    if (!verified.ok()) FileUtils::removeIfExists(dst);
    return verified;
}

TransferResult FileCopier::moveFile(const QString& src, const QString& dst, const CancellationToken& token,
                                    const ByteProgress& onBytes) const
{
    if (token.isCancelled()) return TransferResult::cancelledResult();
    if (!FileUtils::fileExists(src))
        return TransferResult::failure(TransferErrorKind::PathNotFound, QString("Source missing: %1").arg(src));

    QString dirError;
    if (!FileUtils::ensureParentDir(dst, &dirError))
        return TransferResult::failure(TransferErrorKind::PermissionDenied, dirError);

    const qint64 size = QFileInfo(src).size();
    if (FileUtils::isSameFile(src, dst)) {
        qInfo() << "[FileCopier] Source is already at its destination" << src;
        if (onBytes) onBytes(size);
        return TransferResult::success();
    }

    int err = 0;
    if (const auto forced = TestHooks::renameOverride(src, dst)) {
        err = *forced;
    } else if (std::rename(QFile::encodeName(src).constData(), QFile::encodeName(dst).constData()) != 0) {
        err = errno;
    }
    if (err == 0) {
        if (onBytes) onBytes(size);
        return TransferResult::success();
    }
    if (err != EXDEV) {
        return TransferResult::failure(errorKindFromErrno(err),
                                       QString("Rename %1 -> %2 failed: %3").arg(src, dst, QString::fromLocal8Bit(std::strerror(err))));
    }

    qDebug() << "[FileCopier] Cross-volume move, copying" << src;
    if (token.isCancelled()) return TransferResult::cancelledResult();

    TransferResult copied = copyFile(src, dst, token, onBytes);
    if (!copied.ok()) return copied;

    if (token.isCancelled()) {
        FileUtils::removeIfExists(dst);
        return TransferResult::cancelledResult();
    }

    TransferResult verified = verifySize(src, dst);
    if (!verified.ok()) {
        FileUtils::removeIfExists(dst);
        return verified;
    }

    if (!QFile::remove(src)) {
        qWarning() << "[FileCopier] Copied" << src << "but could not remove the source";
        return TransferResult::failure(TransferErrorKind::PermissionDenied,
                                       QString("Copied to %1 but could not remove source %2").arg(dst, src));
    }
    return TransferResult::success(true);
}
