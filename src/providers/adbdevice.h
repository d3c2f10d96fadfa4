#ifndef ADBDEVICE_H
#define ADBDEVICE_H

#include <QString>
#include <QStringList>
#include "../collaborators.h"

// DeviceControl over the adb command-line client. Every call blocks until
// adb exits or the timeout expires.
class AdbDevice : public DeviceControl {
public:
    explicit AdbDevice(const QString& adbPath, int timeoutMs = 30 * 60 * 1000);

    bool runShellCommand(const QString& deviceId, const QString& command,
                         QString *output = nullptr) override;
    bool pushPath(const QString& deviceId, const QString& localPath,
                  const QString& remotePath) override;
    bool pullPath(const QString& deviceId, const QString& remotePath,
                  const QString& localPath) override;
    bool installPackage(const QString& deviceId, const QString& packageFile,
                        const QStringList& flags, QString *output = nullptr) override;
    bool uninstallPackage(const QString& deviceId, const QString& packageName) override;

private:
    QString m_adbPath;
    int m_timeoutMs;

    bool run(const QString& deviceId, const QStringList& args, QString *output);
};

#endif
