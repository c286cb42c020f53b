#pragma once
#include <QString>
#include <QStringList>
#include <QRegularExpression>
#include <QHash>
#include <QHashFunctions>
#include <QVector>
#include <optional>

#include "file_tree.h"

struct SequenceGroup {
    QString baseName;          // e.g., "SC001_beauty_v001"
    QString suffix;            // e.g., ".exr" or "_denoise.exr"
    QString extension;         // e.g., "exr"
    QString directory;
    QString pattern;           // e.g., "SC001_beauty_v001.####.exr"
    int paddingLength = 0;
    QVector<int> frameNumbers; // ascending
    QVector<FileEntry> files;  // same order as frameNumbers
    qint64 totalBytes = 0;

    // Gap detection
    bool hasGaps = false;
    QVector<int> missingFrames;
    int gapCount = 0;

    int startFrame() const { return frameNumbers.isEmpty() ? 0 : frameNumbers.first(); }
    int endFrame() const { return frameNumbers.isEmpty() ? 0 : frameNumbers.last(); }
    int frameCount() const { return frameNumbers.size(); }
    QString frameRange() const { return QString("%1-%2").arg(startFrame()).arg(endFrame()); }
    QString patternPath() const;
};

struct GroupingResult {
    QVector<SequenceGroup> sequences;
    QVector<FileEntry> singles;
    int candidates = 0;        // inputs with a sequenceable extension
};

class SequenceGrouper {
public:
    struct Decomposition {
        QString baseName;
        int frameNumber = -1;
        int paddingLength = 0;
        QString suffix;        // everything after the frame number
        int patternIndex = -1;
        QString prefix;        // text before the frame separator
        QChar separator;
    };

    static constexpr int MAX_FRAME = 999999;

    // Structural patterns tried in priority order:
    // base.frame.ext, base_frame.ext, base.frame_suffix.ext, base_frame_suffix.ext
    static const QVector<QRegularExpression>& structuralPatterns();

    static const QStringList& sequenceExtensions();
    static bool isSequenceExtension(const QString& extension);

    // Split a filename into (base, frame, suffix); empty when it has no frame number
    static std::optional<Decomposition> decompose(const QString& fileName);

    // Partition files into multi-frame sequences and standalone files
    static GroupingResult group(const QVector<FileEntry>& files);

    // Generate pattern string (e.g., "render.####.exr")
    static QString generatePattern(const QString& prefix, QChar separator, int paddingLength, const QString& suffix);

    // Fill hasGaps/missingFrames/gapCount from the sorted frame list
    static void detectGaps(SequenceGroup& sequence);

    struct SequenceKey {
        QString directory;
        QString baseName;
        QString extension;

        bool operator==(const SequenceKey& other) const {
            return directory == other.directory && baseName == other.baseName && extension == other.extension;
        }
    };
};

inline size_t qHash(const SequenceGrouper::SequenceKey& key, size_t seed = 0) noexcept {
    return qHashMulti(seed, key.directory, key.baseName, key.extension);
}
