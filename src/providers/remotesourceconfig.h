#ifndef REMOTESOURCECONFIG_H
#define REMOTESOURCECONFIG_H

#include <QObject>
#include <QUrl>
#include "../collaborators.h"

class QNetworkAccessManager;

// Public download endpoint and archive password, cached in
// remote-source.json and refreshable from a published config document.
class RemoteSourceConfig : public QObject, public RemoteSourceProvider {
    Q_OBJECT
public:
    explicit RemoteSourceConfig(const QString& cachePath, QObject *parent = nullptr);

    static QString defaultPath();
    // Accepts {"baseUri": ..., "password": ...}
    static bool parse(const QByteArray& data, RemoteSource *source, QString *error = nullptr);

    bool load();
    bool save() const;

    RemoteSource remoteSource() const override { return m_source; }
    void setRemoteSource(const RemoteSource& source) { m_source = source; }

    // Asynchronous; emits refreshed() when done. A failed refresh keeps the cache.
    void refresh(const QUrl& url);

signals:
    void refreshed(bool success, const QString& error);

private:
    QString m_cachePath;
    RemoteSource m_source;
    QNetworkAccessManager *m_nam = nullptr;
};

#endif
