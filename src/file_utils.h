#pragma once

#include <QString>
#include <QFileInfo>
#include <QFile>
#include <QDir>

/**
 * FileUtils - filesystem helpers shared by the scanner, the copier and the CLI.
 *
 * Every existence check in the project goes through these so symlinks and
 * relative paths are treated the same way everywhere.
 */
namespace FileUtils {

/**
 * Check if a regular file exists at the given path.
 */
inline bool fileExists(const QString& filePath)
{
    QFileInfo fi(filePath);
    return fi.exists() && fi.isFile();
}

inline bool dirExists(const QString& dirPath)
{
    QFileInfo fi(dirPath);
    return fi.exists() && fi.isDir();
}

/**
 * True when both paths name the same existing file, following symlinks.
 */
inline bool isSameFile(const QString& a, const QString& b)
{
    const QString ca = QFileInfo(a).canonicalFilePath();
    if (ca.isEmpty()) return false;
    return ca == QFileInfo(b).canonicalFilePath();
}

/**
 * Create the parent directory of a destination file if missing.
 * Safe to call concurrently for the same directory.
 *
 * @return true if the directory exists afterwards
 */
inline bool ensureParentDir(const QString& filePath, QString* errorOut = nullptr)
{
    const QString parent = QFileInfo(filePath).absolutePath();
    if (dirExists(parent)) return true;
    if (QDir().mkpath(parent) || dirExists(parent)) return true;
    if (errorOut) *errorOut = QString("Cannot create directory %1").arg(parent);
    return false;
}

/**
 * Remove a file if present. Missing files count as removed.
 */
inline bool removeIfExists(const QString& filePath)
{
    if (!QFileInfo::exists(filePath)) return true;
    return QFile::remove(filePath);
}

inline qint64 fileSize(const QString& filePath)
{
    QFileInfo fi(filePath);
    return fi.exists() ? fi.size() : -1;
}

} // namespace FileUtils
