#include "jsonsettings.h"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QDebug>

JsonSettings::JsonSettings(const QString& path)
    : m_path(path), m_downloadsDir(dataDir() + "/downloads"),
      m_queueFile(dataDir() + "/download-queue.json") {}

QString JsonSettings::configDir() {
    return QDir::homePath() + "/.config/questlift";
}

QString JsonSettings::dataDir() {
    return QDir::homePath() + "/.local/share/questlift";
}

QString JsonSettings::defaultPath() {
    return configDir() + "/settings.json";
}

namespace {
QString expandHome(const QString& path) {
    if (path.startsWith("~/")) return QDir::homePath() + path.mid(1);
    return path;
}
}

bool JsonSettings::load() {
    QFile file(m_path);
    if (!file.exists()) {
        qInfo() << "[config] No settings file, using defaults:" << m_path;
        return true;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "[config] Could not read settings:" << m_path << file.errorString();
        return false;
    }

    QJsonDocument doc = QJsonDocument::fromJson(file.readAll());
    if (!doc.isObject()) {
        qWarning() << "[config] Settings file is not a JSON object, using defaults:" << m_path;
        return false;
    }

    QJsonObject root = doc.object();
    m_downloadRateLimit = qMax(0, root.value("downloadRateLimit").toInt(0));
    m_uploadRateLimit = qMax(0, root.value("uploadRateLimit").toInt(0));
    m_mirrorFallback = root.value("mirrorFallback").toBool(true);
    m_remoteConfigUrl = root.value("remoteConfigUrl").toString();

    QString downloads = expandHome(root.value("downloadsDir").toString());
    if (!downloads.isEmpty()) m_downloadsDir = downloads;
    QString queueFile = expandHome(root.value("queueFile").toString());
    if (!queueFile.isEmpty()) m_queueFile = queueFile;
    return true;
}

bool JsonSettings::save() const {
    QDir().mkpath(QFileInfo(m_path).absolutePath());

    QJsonObject root;
    root["downloadRateLimit"] = m_downloadRateLimit;
    root["uploadRateLimit"] = m_uploadRateLimit;
    root["mirrorFallback"] = m_mirrorFallback;
    root["downloadsDir"] = m_downloadsDir;
    root["queueFile"] = m_queueFile;
    if (!m_remoteConfigUrl.isEmpty()) root["remoteConfigUrl"] = m_remoteConfigUrl;

    QSaveFile file(m_path);
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "[config] Could not write settings:" << m_path << file.errorString();
        return false;
    }
    file.write(QJsonDocument(root).toJson());
    return file.commit();
}
