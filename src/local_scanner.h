#pragma once
#include "file_tree.h"

#include <QStringList>

// Walks a local directory and builds a FileTreeNode hierarchy.
class LocalDirectoryScanner : public IScanner {
public:
    bool scan(const QString& rootPath, FileTreeNode& out, QString* errorOut = nullptr) override;

    // Hidden files and folders are skipped unless enabled
    void setIncludeHidden(bool include) { m_includeHidden = include; }

    int filesScanned() const { return m_filesScanned; }

private:
    void scanFolder(const QString& dirPath, FileTreeNode& node);

    bool m_includeHidden = false;
    int m_filesScanned = 0;
};
