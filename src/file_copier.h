#pragma once
#include <QString>
#include <functional>

#include "cancellation_token.h"
#include "transfer_error.h"
#include "transfer_settings.h"

/**
 * FileCopier performs a single file copy or move.
 *
 * Copy strategy by size:
 * - below smallFileThreshold: one direct copy; if that fails, a micro-chunk
 *   loop that checks for cancellation before every read and around every write
 * - otherwise: the file is split into equal chunks copied in parallel into
 *   "<dst>.chunk<N>" temporaries, then concatenated in index order
 *
 * Move tries an atomic rename first. When source and destination are on
 * different volumes the file is copied, the copy is verified and only then
 * is the source removed.
 *
 * Copies are written to "<dst>.part" and renamed over the destination once
 * complete, so an existing destination is only replaced by a finished copy.
 * A source that already is the destination is left alone and reported as
 * success.
 *
 * Existing destination files are overwritten. On any failure or cancellation
 * no partial destination or chunk temporary is left behind and the source
 * is untouched.
 *
 * The byte callback receives increments and may be called concurrently from
 * chunk workers.
 */
class FileCopier {
public:
    using ByteProgress = std::function<void(qint64 bytesWritten)>;

    explicit FileCopier(const TransferSettings& settings = TransferSettings());

    TransferResult copyFile(const QString& src, const QString& dst, const CancellationToken& token,
                            const ByteProgress& onBytes = {}) const;
    TransferResult moveFile(const QString& src, const QString& dst, const CancellationToken& token,
                            const ByteProgress& onBytes = {}) const;

    TransferResult copySmall(const QString& src, const QString& dst, const CancellationToken& token,
                             const ByteProgress& onBytes) const;
    TransferResult copyMicroChunked(const QString& src, const QString& dst, const CancellationToken& token,
                                    const ByteProgress& onBytes) const;
    TransferResult copyChunked(const QString& src, const QString& dst, const CancellationToken& token,
                               const ByteProgress& onBytes) const;

    // Chunk size for a large file: size / chunkWorkers clamped to [minChunkSize, maxChunkSize]
    qint64 chunkSizeFor(qint64 fileSize) const;

    static QString chunkTempPath(const QString& dst, int index);
    static QString stagingPath(const QString& dst);

    const TransferSettings& settings() const { return m_settings; }

private:
    TransferResult copyChunk(const QString& src, const QString& tempPath, const QString& dst, int index,
                             qint64 offset, qint64 length, const CancellationToken& token,
                             const std::atomic_bool& siblingFailed, const ByteProgress& onBytes) const;
    TransferResult reassemble(const QString& dst, int chunkCount, const CancellationToken& token) const;
    static TransferResult verifySize(const QString& src, const QString& dst);
    static void removeChunkTemps(const QString& dst, int chunkCount);

    TransferSettings m_settings;
};
