#pragma once
#include <QString>
#include <QVector>
#include <QJsonObject>
#include <QJsonArray>

// A single scanned file. Never mutated after the scanner produces it.
struct FileEntry {
    QString name;          // e.g., "SC001_beauty_v001.1001.exr"
    QString absolutePath;
    qint64 sizeBytes = 0;
    QString extension;     // lower case, no dot
};

struct FileTreeNode {
    enum class Type { File, Folder };

    QString name;
    QString path;
    Type type = Type::Folder;
    qint64 size = 0;
    QString extension;
    QVector<FileTreeNode> children;

    bool isFile() const { return type == Type::File; }

    FileEntry toEntry() const {
        FileEntry e;
        e.name = name;
        e.absolutePath = path;
        e.sizeBytes = size;
        e.extension = extension;
        return e;
    }

    // Depth-first collection of every file leaf
    void collectFiles(QVector<FileEntry>& out) const {
        if (isFile()) {
            out.append(toEntry());
            return;
        }
        for (const FileTreeNode& child : children)
            child.collectFiles(out);
    }

    QJsonObject toJson() const {
        QJsonObject o;
        o["name"] = name;
        o["path"] = path;
        o["type"] = isFile() ? QStringLiteral("file") : QStringLiteral("folder");
        if (isFile()) {
            o["size"] = size;
            o["extension"] = extension;
        } else {
            QJsonArray arr;
            for (const FileTreeNode& child : children)
                arr.append(child.toJson());
            o["children"] = arr;
        }
        return o;
    }

    static FileTreeNode fromJson(const QJsonObject& o) {
        FileTreeNode n;
        n.name = o.value("name").toString();
        n.path = o.value("path").toString();
        n.type = o.value("type").toString() == QLatin1String("file") ? Type::File : Type::Folder;
        n.size = static_cast<qint64>(o.value("size").toDouble());
        n.extension = o.value("extension").toString().toLower();
        if (n.extension.startsWith('.'))
            n.extension.remove(0, 1);
        const QJsonArray arr = o.value("children").toArray();
        for (const QJsonValue& v : arr)
            n.children.append(fromJson(v.toObject()));
        return n;
    }
};

// Produces the file tree consumed by the mapping stage. Crawling remote
// storage, timeouts and retries belong to implementations of this interface.
class IScanner {
public:
    virtual ~IScanner() = default;
    virtual bool scan(const QString& rootPath, FileTreeNode& out, QString* errorOut = nullptr) = 0;
};
