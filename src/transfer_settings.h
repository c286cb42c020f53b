#pragma once
#include <QtGlobal>

struct TransferSettings {
    static constexpr qint64 MB = 1024 * 1024;

    int fileWorkers = 4;                   // files in flight per batch
    int chunkWorkers = 8;                  // chunk copies in flight per large file
    int maxThreadBudget = 64;              // cap on fileWorkers * chunkWorkers
    qint64 smallFileThreshold = 10 * MB;   // below this a file is copied in one go
    qint64 microChunkSize = 1024;          // fallback copy granularity for small files
    qint64 subChunkSize = 1 * MB;          // read/write unit inside a chunk
    qint64 minChunkSize = 1 * MB;
    qint64 maxChunkSize = 64 * MB;
    static constexpr qint64 MaxBufferSize = 64 * MB;   // cap for in-memory copy buffers
    int progressIntervalMs = 500;          // persisted/emitted progress coalescing

    // Bring every value into range; the thread budget shrinks chunkWorkers first
    void clamp() {
        fileWorkers = qBound(1, fileWorkers, 64);
        chunkWorkers = qBound(1, chunkWorkers, 64);
        maxThreadBudget = qMax(1, maxThreadBudget);
        if (fileWorkers > maxThreadBudget) fileWorkers = maxThreadBudget;
        while (fileWorkers * chunkWorkers > maxThreadBudget && chunkWorkers > 1)
            --chunkWorkers;
        microChunkSize = qBound<qint64>(1, microChunkSize, MaxBufferSize);
        subChunkSize = qBound<qint64>(1024, subChunkSize, MaxBufferSize);
        minChunkSize = qMax<qint64>(1, minChunkSize);
        maxChunkSize = qMax(minChunkSize, maxChunkSize);
        smallFileThreshold = qMax<qint64>(0, smallFileThreshold);
        progressIntervalMs = qMax(0, progressIntervalMs);
    }
};
