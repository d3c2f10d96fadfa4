#include "toollocator.h"
#include <QDir>
#include <QFileInfo>
#include <QStandardPaths>

QString ToolLocator::findTool(const QStringList& names) {
    // 1. PATH
    for (const QString& name : names) {
        QString inPath = QStandardPaths::findExecutable(name);
        if (!inPath.isEmpty()) return inPath;
    }

    // 2. Common install locations, including our own tool directory
    QString home = QDir::homePath();
    const QStringList dirs = {
        home + "/.local/share/questlift/bin",
        home + "/.local/bin",
        "/usr/local/bin",
        "/usr/bin",
        "/opt/homebrew/bin",
    };
    for (const QString& dir : dirs) {
        for (const QString& name : names) {
            QString path = dir + "/" + name;
            if (isExecutable(path)) return path;
        }
    }

    return QString();
}

bool ToolLocator::isExecutable(const QString& path) {
    if (path.isEmpty()) return false;
    QFileInfo info(path);
    return info.isFile() && info.isExecutable();
}

QString ToolLocator::transferBinaryPath() const {
    if (!m_transferBinary.isEmpty()) return m_transferBinary;
    return findTool({"rclone"});
}

QString ToolLocator::archiveBinaryPath() const {
    if (!m_archiveBinary.isEmpty()) return m_archiveBinary;
    return findTool({"7z", "7zz", "7za"});
}

QString ToolLocator::deviceBridgeBinaryPath() const {
    if (!m_deviceBridgeBinary.isEmpty()) return m_deviceBridgeBinary;
    return findTool({"adb"});
}
