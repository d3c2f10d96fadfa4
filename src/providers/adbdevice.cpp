#include "adbdevice.h"
#include <QProcess>
#include <QDebug>

AdbDevice::AdbDevice(const QString& adbPath, int timeoutMs)
    : m_adbPath(adbPath), m_timeoutMs(timeoutMs) {}

bool AdbDevice::run(const QString& deviceId, const QStringList& args, QString *output) {
    if (m_adbPath.isEmpty()) {
        qWarning() << "[adb] adb binary not found";
        if (output) *output = "adb binary not found";
        return false;
    }

    QProcess proc;
    proc.setProcessChannelMode(QProcess::MergedChannels);
    proc.start(m_adbPath, QStringList{"-s", deviceId} + args);

    if (!proc.waitForStarted(5000)) {
        qWarning() << "[adb] Failed to start adb:" << proc.errorString();
        if (output) *output = proc.errorString();
        return false;
    }
    if (!proc.waitForFinished(m_timeoutMs)) {
        qWarning() << "[adb] Timed out:" << args.join(' ');
        proc.kill();
        proc.waitForFinished(3000);
        if (output) *output = "adb timed out";
        return false;
    }

    QString text = QString::fromUtf8(proc.readAll());
    if (output) *output = text;

    if (proc.exitStatus() != QProcess::NormalExit || proc.exitCode() != 0) {
        qWarning() << "[adb]" << args.value(0) << "failed with exit code" << proc.exitCode()
                   << ":" << text.trimmed().right(300);
        return false;
    }
    return true;
}

bool AdbDevice::runShellCommand(const QString& deviceId, const QString& command, QString *output) {
    qDebug() << "[adb]" << deviceId << "shell" << command;
    return run(deviceId, {"shell", command}, output);
}

bool AdbDevice::pushPath(const QString& deviceId, const QString& localPath,
                         const QString& remotePath) {
    qDebug() << "[adb]" << deviceId << "push" << localPath << remotePath;
    return run(deviceId, {"push", localPath, remotePath}, nullptr);
}

bool AdbDevice::pullPath(const QString& deviceId, const QString& remotePath,
                         const QString& localPath) {
    qDebug() << "[adb]" << deviceId << "pull" << remotePath << localPath;
    return run(deviceId, {"pull", remotePath, localPath}, nullptr);
}

bool AdbDevice::installPackage(const QString& deviceId, const QString& packageFile,
                               const QStringList& flags, QString *output) {
    qInfo() << "[adb]" << deviceId << "install" << flags.join(' ') << packageFile;
    QString text;
    bool ok = run(deviceId, QStringList{"install"} + flags + QStringList{packageFile}, &text);
    if (output) *output = text;
    // Older adb versions exit 0 even when the package manager refuses
    return ok && !text.contains("Failure");
}

bool AdbDevice::uninstallPackage(const QString& deviceId, const QString& packageName) {
    qInfo() << "[adb]" << deviceId << "uninstall" << packageName;
    QString text;
    bool ok = run(deviceId, {"uninstall", packageName}, &text);
    return ok && !text.contains("Failure");
}
