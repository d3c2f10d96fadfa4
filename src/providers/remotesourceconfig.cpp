#include "remotesourceconfig.h"
#include "jsonsettings.h"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QDebug>

RemoteSourceConfig::RemoteSourceConfig(const QString& cachePath, QObject *parent)
    : QObject(parent), m_cachePath(cachePath) {}

QString RemoteSourceConfig::defaultPath() {
    return JsonSettings::configDir() + "/remote-source.json";
}

bool RemoteSourceConfig::parse(const QByteArray& data, RemoteSource *source, QString *error) {
    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(data, &parseError);
    if (!doc.isObject()) {
        if (error) *error = "Invalid remote source document: " + parseError.errorString();
        return false;
    }

    QJsonObject root = doc.object();
    RemoteSource parsed;
    parsed.baseAddress = root.value("baseUri").toString().trimmed();
    parsed.password = root.value("password").toString().trimmed();
    if (!parsed.isValid()) {
        if (error) *error = "Remote source document is missing baseUri or password";
        return false;
    }

    *source = parsed;
    return true;
}

bool RemoteSourceConfig::load() {
    QFile file(m_cachePath);
    if (!file.exists()) {
        qInfo() << "[config] No cached remote source config:" << m_cachePath;
        return false;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "[config] Could not read remote source config:" << file.errorString();
        return false;
    }

    QString error;
    if (!parse(file.readAll(), &m_source, &error)) {
        qWarning() << "[config]" << error;
        return false;
    }
    return true;
}

bool RemoteSourceConfig::save() const {
    QDir().mkpath(QFileInfo(m_cachePath).absolutePath());

    QJsonObject root;
    root["baseUri"] = m_source.baseAddress;
    root["password"] = m_source.password;

    QSaveFile file(m_cachePath);
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "[config] Could not write remote source config:" << file.errorString();
        return false;
    }
    file.write(QJsonDocument(root).toJson());
    return file.commit();
}

void RemoteSourceConfig::refresh(const QUrl& url) {
    if (!url.isValid() || url.isEmpty()) {
        emit refreshed(false, "No remote config URL configured");
        return;
    }
    if (!m_nam) m_nam = new QNetworkAccessManager(this);

    qInfo() << "[config] Refreshing remote source config from" << url.toString();
    QNetworkRequest req(url);
    req.setTransferTimeout(15000);
    QNetworkReply *reply = m_nam->get(req);

    connect(reply, &QNetworkReply::finished, this, [this, reply]() {
        reply->deleteLater();

        if (reply->error() != QNetworkReply::NoError) {
            int httpStatus = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
            QString error = QString("Remote config request failed (http %1): %2")
                                .arg(httpStatus).arg(reply->errorString());
            qWarning() << "[config]" << error;
            emit refreshed(false, error);
            return;
        }

        RemoteSource fetched;
        QString error;
        if (!parse(reply->readAll(), &fetched, &error)) {
            qWarning() << "[config]" << error;
            emit refreshed(false, error);
            return;
        }

        m_source = fetched;
        if (!save()) {
            emit refreshed(false, "Could not write " + m_cachePath);
            return;
        }
        qInfo() << "[config] Remote source config updated";
        emit refreshed(true, QString());
    });
}
