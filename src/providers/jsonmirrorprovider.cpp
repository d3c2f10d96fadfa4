#include "jsonmirrorprovider.h"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QDebug>

JsonMirrorProvider::JsonMirrorProvider(const QString& path) : m_path(path) {}

bool JsonMirrorProvider::load() {
    m_mirrors.clear();
    m_activeIndex = -1;

    QFile file(m_path);
    if (!file.exists()) return true;
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "[config] Could not read mirrors:" << m_path << file.errorString();
        return false;
    }

    QJsonDocument doc = QJsonDocument::fromJson(file.readAll());
    if (!doc.isArray()) {
        qWarning() << "[config] Mirrors file is not a JSON array, ignoring:" << m_path;
        return false;
    }

    // Relative rclone config paths are relative to the mirrors file
    QDir baseDir = QFileInfo(m_path).absoluteDir();
    const QJsonArray entries = doc.array();
    for (const QJsonValue& value : entries) {
        QJsonObject obj = value.toObject();
        MirrorProfile mirror;
        mirror.id = obj.value("id").toString();
        mirror.name = obj.value("name").toString(mirror.id);
        mirror.remoteName = obj.value("remoteName").toString();
        QString configFile = obj.value("configFile").toString();
        if (!configFile.isEmpty()) mirror.configFile = baseDir.absoluteFilePath(configFile);

        if (mirror.id.isEmpty()) {
            qWarning() << "[config] Skipping mirror entry without id";
            continue;
        }
        if (m_activeIndex == -1 && obj.value("active").toBool(false)) {
            m_activeIndex = m_mirrors.size();
        }
        m_mirrors.append(mirror);
    }
    return true;
}

std::optional<MirrorProfile> JsonMirrorProvider::activeMirror() const {
    if (m_activeIndex < 0 || m_activeIndex >= m_mirrors.size()) return std::nullopt;
    return m_mirrors.at(m_activeIndex);
}
