#include "sequence_grouper.h"
#include <QDir>
#include <QFileInfo>
#include <QSet>
#include <QDebug>
#include <algorithm>

QString SequenceGroup::patternPath() const
{
    return QDir(directory).filePath(pattern);
}

const QVector<QRegularExpression>& SequenceGrouper::structuralPatterns()
{
    // Captures: (1) base, (2) frame, then either (3) extension or (3) middle + (4) extension
    static const QVector<QRegularExpression> patterns = {
        QRegularExpression(R"(^(.+?)\.(\d{1,10})\.([^.]+)$)"),
        QRegularExpression(R"(^(.+?)_(\d{4,10})\.([^.]+)$)"),
        QRegularExpression(R"(^(.+?)\.(\d{4,10})_(.+?)\.([^.]+)$)"),
        QRegularExpression(R"(^(.+?)_(\d{4,10})_(.+?)\.([^.]+)$)"),
    };
    return patterns;
}

const QStringList& SequenceGrouper::sequenceExtensions()
{
    static const QStringList exts = {
        "exr", "dpx", "tif", "tiff", "jpg", "jpeg", "png", "hdr", "mov", "mp4"
    };
    return exts;
}

bool SequenceGrouper::isSequenceExtension(const QString& extension)
{
    QString ext = extension.toLower();
    if (ext.startsWith('.')) ext.remove(0, 1);
    return sequenceExtensions().contains(ext);
}

std::optional<SequenceGrouper::Decomposition> SequenceGrouper::decompose(const QString& fileName)
{
    const QVector<QRegularExpression>& patterns = structuralPatterns();
    for (int i = 0; i < patterns.size(); ++i) {
        const QRegularExpressionMatch m = patterns.at(i).match(fileName);
        if (!m.hasMatch()) continue;

        const QString prefix = m.captured(1);
        const QString digits = m.captured(2);
        bool ok = false;
        const qlonglong frame = digits.toLongLong(&ok);
        if (!ok || frame < 0 || frame > MAX_FRAME) continue;

        const bool hasMiddle = (i >= 2);
        const QString middle = hasMiddle ? m.captured(3) : QString();
        const QString extension = hasMiddle ? m.captured(4) : m.captured(3);
        const QChar separator = (i == 0 || i == 2) ? QChar('.') : QChar('_');

        Decomposition d;
        d.baseName = hasMiddle ? prefix + '_' + middle : prefix;
        if (d.baseName.isEmpty() || d.baseName == QLatin1String("_")
            || d.baseName.contains(QLatin1String("sequence_"), Qt::CaseInsensitive)) {
            continue;
        }
        d.frameNumber = static_cast<int>(frame);
        d.paddingLength = digits.length();
        d.suffix = hasMiddle ? QString("_%1.%2").arg(middle, extension) : QString(".%1").arg(extension);
        d.patternIndex = i;
        // Prefix and separator are only needed to render the pattern
        d.prefix = prefix;
        d.separator = separator;
        return d;
    }
    return std::nullopt;
}

QString SequenceGrouper::generatePattern(const QString& prefix, QChar separator, int paddingLength, const QString& suffix)
{
    return prefix + separator + QString(qMax(1, paddingLength), QLatin1Char('#')) + suffix;
}

void SequenceGrouper::detectGaps(SequenceGroup& sequence)
{
    sequence.missingFrames.clear();
    sequence.gapCount = 0;
    sequence.hasGaps = false;

    const QVector<int>& frames = sequence.frameNumbers;
    for (int i = 1; i < frames.size(); ++i) {
        const int expected = frames.at(i - 1) + 1;
        if (frames.at(i) > expected) {
            ++sequence.gapCount;
            for (int f = expected; f < frames.at(i); ++f)
                sequence.missingFrames.append(f);
        }
    }
    sequence.hasGaps = sequence.gapCount > 0;
}

GroupingResult SequenceGrouper::group(const QVector<FileEntry>& files)
{
    struct FrameInfo {
        Decomposition parts;
        FileEntry entry;
    };

    GroupingResult result;
    QHash<SequenceKey, QVector<FrameInfo>> buckets;
    QVector<SequenceKey> bucketOrder;

    for (const FileEntry& entry : files) {
        const QString extension = entry.extension.isEmpty()
            ? QFileInfo(entry.name).suffix().toLower() : entry.extension.toLower();
        if (!isSequenceExtension(extension)) {
            result.singles.append(entry);
            continue;
        }
        ++result.candidates;

        const auto parts = decompose(entry.name);
        if (!parts) {
            result.singles.append(entry);
            continue;
        }

        SequenceKey key;
        key.directory = QFileInfo(entry.absolutePath).absolutePath();
        key.baseName = parts->baseName;
        key.extension = extension;
        if (!buckets.contains(key)) bucketOrder.append(key);
        buckets[key].append({*parts, entry});
    }

    for (const SequenceKey& key : bucketOrder) {
        QVector<FrameInfo> frames = buckets.value(key);

        std::stable_sort(frames.begin(), frames.end(), [](const FrameInfo& a, const FrameInfo& b) {
            return a.parts.frameNumber < b.parts.frameNumber;
        });

        // "shot.1.exr" and "shot.001.exr" both claim frame 1; only the first stays in the sequence
        QVector<FrameInfo> unique;
        QSet<int> seen;
        for (const FrameInfo& f : frames) {
            if (seen.contains(f.parts.frameNumber)) {
                qDebug() << "[SequenceGrouper] Duplicate frame" << f.parts.frameNumber << "in" << f.entry.name;
                result.singles.append(f.entry);
                continue;
            }
            seen.insert(f.parts.frameNumber);
            unique.append(f);
        }

        // Only treat as sequence if we have 2+ frames
        if (unique.size() < 2) {
            for (const FrameInfo& f : unique)
                result.singles.append(f.entry);
            continue;
        }

        const Decomposition& first = unique.first().parts;
        SequenceGroup seq;
        seq.baseName = key.baseName;
        seq.extension = key.extension;
        seq.directory = key.directory;
        seq.suffix = first.suffix;
        seq.paddingLength = first.paddingLength;
        seq.pattern = generatePattern(first.prefix, first.separator, first.paddingLength, first.suffix);
        for (const FrameInfo& f : unique) {
            seq.frameNumbers.append(f.parts.frameNumber);
            seq.files.append(f.entry);
            seq.totalBytes += f.entry.sizeBytes;
        }
        detectGaps(seq);

        qDebug() << "[SequenceGrouper] Detected sequence:" << seq.pattern
                 << "frames:" << seq.startFrame() << "-" << seq.endFrame()
                 << "count:" << seq.frameCount();
        result.sequences.append(seq);
    }

    return result;
}
