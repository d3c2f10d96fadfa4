#ifndef JSONSETTINGS_H
#define JSONSETTINGS_H

#include <QString>
#include "../collaborators.h"

// User settings from ~/.config/questlift/settings.json. Missing keys keep
// their defaults.
class JsonSettings : public SettingsProvider {
public:
    explicit JsonSettings(const QString& path = defaultPath());

    static QString configDir();
    static QString dataDir();
    static QString defaultPath();

    bool load();
    bool save() const;

    int downloadRateLimit() const override { return m_downloadRateLimit; }
    int uploadRateLimit() const override { return m_uploadRateLimit; }
    bool fallbackToPublicOnMirrorFailure() const override { return m_mirrorFallback; }

    QString downloadsDir() const { return m_downloadsDir; }
    // Persisted download queue; defaults to the per-user data directory
    QString queueFile() const { return m_queueFile; }
    QString remoteConfigUrl() const { return m_remoteConfigUrl; }
    QString path() const { return m_path; }

    void setDownloadRateLimit(int kib) { m_downloadRateLimit = qMax(0, kib); }
    void setUploadRateLimit(int kib) { m_uploadRateLimit = qMax(0, kib); }
    void setMirrorFallback(bool enabled) { m_mirrorFallback = enabled; }
    void setQueueFile(const QString& path) { m_queueFile = path; }

private:
    QString m_path;
    int m_downloadRateLimit = 0;
    int m_uploadRateLimit = 0;
    bool m_mirrorFallback = true;
    QString m_downloadsDir;
    QString m_queueFile;
    QString m_remoteConfigUrl;
};

#endif
