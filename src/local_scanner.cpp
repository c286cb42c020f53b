#include "local_scanner.h"
#include "file_utils.h"

#include <QDir>
#include <QFileInfo>
#include <QDebug>

bool LocalDirectoryScanner::scan(const QString& rootPath, FileTreeNode& out, QString* errorOut)
{
    m_filesScanned = 0;
    if (!FileUtils::dirExists(rootPath)) {
        if (errorOut) *errorOut = QString("Source folder does not exist: %1").arg(rootPath);
        qWarning() << "[Scanner] Missing source folder" << rootPath;
        return false;
    }

    const QFileInfo rootInfo(rootPath);
    out = FileTreeNode();
    out.type = FileTreeNode::Type::Folder;
    out.path = rootInfo.absoluteFilePath();
    out.name = rootInfo.fileName().isEmpty() ? QDir(rootPath).dirName() : rootInfo.fileName();

    scanFolder(out.path, out);
    qInfo() << "[Scanner] Scanned" << m_filesScanned << "files under" << out.path;
    return true;
}

void LocalDirectoryScanner::scanFolder(const QString& dirPath, FileTreeNode& node)
{
    QDir::Filters filters = QDir::Dirs | QDir::Files | QDir::NoDotAndDotDot;
    if (m_includeHidden) filters |= QDir::Hidden;

    const QFileInfoList entries = QDir(dirPath).entryInfoList(filters, QDir::Name | QDir::DirsFirst);
    for (const QFileInfo& fi : entries) {
        FileTreeNode child;
        child.name = fi.fileName();
        child.path = fi.absoluteFilePath();
        if (fi.isDir()) {
            // Symlinked folders could loop back on themselves
            if (fi.isSymLink()) continue;
            child.type = FileTreeNode::Type::Folder;
            scanFolder(child.path, child);
        } else {
            child.type = FileTreeNode::Type::File;
            child.size = fi.size();
            child.extension = fi.suffix().toLower();
            ++m_filesScanned;
        }
        node.children.append(child);
    }
}
