#ifndef COLLABORATORS_H
#define COLLABORATORS_H

#include <QString>
#include <QStringList>
#include <optional>

// Narrow interfaces to everything the pipeline consumes but does not own.
// Concrete implementations live under providers/; tests substitute fakes.

class DependencyResolver {
public:
    virtual ~DependencyResolver() = default;
    virtual QString transferBinaryPath() const = 0;
    virtual QString archiveBinaryPath() const = 0;
    virtual bool isTransferReady() const = 0;
    virtual bool isArchiveReady() const = 0;
};

struct MirrorProfile {
    QString id;
    QString name;
    QString remoteName;     // rclone remote defined in configFile
    QString configFile;     // rclone config holding the remote
};

class MirrorProvider {
public:
    virtual ~MirrorProvider() = default;
    virtual std::optional<MirrorProfile> activeMirror() const = 0;
};

class SettingsProvider {
public:
    virtual ~SettingsProvider() = default;
    // KiB/s, 0 = unlimited
    virtual int downloadRateLimit() const = 0;
    virtual int uploadRateLimit() const = 0;
    // false: a failed mirror transfer becomes the job's terminal error
    virtual bool fallbackToPublicOnMirrorFailure() const = 0;
};

struct RemoteSource {
    QString baseAddress;
    QString password;       // base64 encoded at rest

    bool isValid() const { return !baseAddress.isEmpty() && !password.isEmpty(); }
};

class RemoteSourceProvider {
public:
    virtual ~RemoteSourceProvider() = default;
    virtual RemoteSource remoteSource() const = 0;
};

class DeviceControl {
public:
    virtual ~DeviceControl() = default;
    virtual bool runShellCommand(const QString& deviceId, const QString& command,
                                 QString *output = nullptr) = 0;
    virtual bool pushPath(const QString& deviceId, const QString& localPath,
                          const QString& remotePath) = 0;
    virtual bool pullPath(const QString& deviceId, const QString& remotePath,
                          const QString& localPath) = 0;
    virtual bool installPackage(const QString& deviceId, const QString& packageFile,
                                const QStringList& flags, QString *output = nullptr) = 0;
    virtual bool uninstallPackage(const QString& deviceId, const QString& packageName) = 0;
};

#endif
