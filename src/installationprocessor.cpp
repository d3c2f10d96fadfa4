#include "installationprocessor.h"
#include "queuemanager.h"
#include <QDir>
#include <QDirIterator>
#include <QFile>
#include <QFileInfo>
#include <QRegularExpression>
#include <QTextStream>
#include <QVector>
#include <QDebug>
#include <algorithm>

namespace {
const char *ExpansionDataRoot = "/sdcard/Android/obb";

struct PendingFile {
    QString path;
    QString relativePath;
    qint64 size;
};

bool isIncompatibleInstall(const QString& output) {
    return output.contains("INSTALL_FAILED_UPDATE_INCOMPATIBLE")
        || output.contains("INSTALL_FAILED_VERSION_DOWNGRADE");
}
}

InstallationProcessor::InstallationProcessor(QueueManager *queue, DeviceControl *device,
                                             QObject *parent)
    : QObject(parent), m_queue(queue), m_device(device) {}

QString InstallationProcessor::findInstallScript(const QString& contentDir) {
    QDir dir(contentDir);
    for (const QString& name : {QString("install.txt"), QString("Install.txt")}) {
        if (QFileInfo(dir.filePath(name)).isFile()) return dir.filePath(name);
    }
    return QString();
}

QString InstallationProcessor::expansionDataPath(const QString& contentId) {
    return QString::fromLatin1(ExpansionDataRoot) + "/" + contentId;
}

// Whitespace separated tokens; double quotes group, and are dropped
QStringList InstallationProcessor::splitCommandLine(const QString& line) {
    QStringList tokens;
    QString current;
    bool inQuotes = false;
    bool hasToken = false;

    for (const QChar c : line) {
        if (c == '"') {
            inQuotes = !inQuotes;
            hasToken = true;
        } else if (c.isSpace() && !inQuotes) {
            if (hasToken) tokens << current;
            current.clear();
            hasToken = false;
        } else {
            current += c;
            hasToken = true;
        }
    }
    if (hasToken) tokens << current;
    return tokens;
}

bool InstallationProcessor::start(const Job& job, const QString& deviceId) {
    qInfo() << "[install] Starting installation of" << job.id << "on device" << deviceId;

    if (job.status != JobStatus::Completed && job.status != JobStatus::InstallError) {
        qWarning() << "[install] Job" << job.id << "is" << jobStatusName(job.status)
                   << "- only completed content can be installed";
        return false;
    }

    if (!m_device || deviceId.isEmpty()) {
        failInstall(job.id, JobErrorKind::ConfigMissing, "No device selected for installation");
        return false;
    }

    if (job.localPath.isEmpty() || !QFileInfo(job.localPath).isDir()) {
        failInstall(job.id, JobErrorKind::PathError, "Download path missing or invalid");
        return false;
    }

    JobUpdate begin;
    begin.status = JobStatus::Installing;
    begin.progress = 0;
    begin.error = QString();
    begin.errorKind = JobErrorKind::None;
    m_queue->update(job.id, begin);
    emit jobUpdated(job.id);

    QString error;
    bool ok = false;
    QString script = findInstallScript(job.localPath);
    if (!script.isEmpty()) {
        qInfo() << "[install] Found install script" << script;
        ok = runInstallScript(job, deviceId, script, &error);
    } else {
        qInfo() << "[install] No install script for" << job.id << "- running standard install";
        ok = runStandardInstall(job, deviceId, &error);
    }

    if (!ok) {
        failInstall(job.id, JobErrorKind::InstallFailure,
                    error.isEmpty() ? QString("Installation failed (see logs)") : error);
        return false;
    }

    qInfo() << "[install] Installation completed for" << job.id;
    JobUpdate done;
    done.status = JobStatus::Completed;
    done.progress = 100;
    done.extractProgress = 100;
    m_queue->update(job.id, done);
    emit progressChanged(job.id, 100);
    emit jobUpdated(job.id);
    return true;
}

bool InstallationProcessor::runInstallScript(const Job& job, const QString& deviceId,
                                             const QString& scriptPath, QString *error) {
    QFile file(scriptPath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        *error = "Failed to read install script: " + file.errorString();
        return false;
    }

    QStringList commands;
    QTextStream in(&file);
    while (!in.atEnd()) {
        QString line = in.readLine().trimmed();
        if (line.isEmpty() || line.startsWith('#')) continue;
        commands << line;
    }
    qInfo() << "[install] Executing" << commands.size() << "script commands";

    QDir content(job.localPath);
    for (int i = 0; i < commands.size(); ++i) {
        const QString& line = commands.at(i);
        QStringList parts = splitCommandLine(line);
        if (!parts.isEmpty() && parts.first().compare("adb", Qt::CaseInsensitive) == 0)
            parts.removeFirst();
        if (parts.isEmpty()) {
            qWarning() << "[install] Skipping empty command:" << line;
            continue;
        }

        QString command = parts.takeFirst().toLower();
        qInfo() << "[install] Running:" << line;

        bool commandOk = false;
        QString reason;

        if (command == "shell") {
            if (parts.isEmpty()) {
                reason = "Missing shell command argument";
            } else {
                QString output;
                commandOk = m_device->runShellCommand(deviceId, parts.join(' '), &output);
                if (!commandOk) reason = output.trimmed();
            }
        } else if (command == "install") {
            QString package;
            QStringList flags = {"-r", "-g"};
            for (const QString& arg : parts) {
                if (package.isEmpty() && arg.endsWith(".apk", Qt::CaseInsensitive)) {
                    package = arg;
                } else if (!flags.contains(arg)) {
                    flags << arg;
                }
            }

            if (package.isEmpty()) {
                reason = "Missing package file argument for install command";
            } else if (!QFileInfo::exists(content.filePath(package))) {
                reason = "Package file not found: " + content.filePath(package);
            } else {
                commandOk = installPackage(job, deviceId, content.filePath(package), flags, &reason);
            }

            // A failed package install ends the script
            if (!commandOk) {
                *error = truncateError(QString("Script execution failed on command: %1. Reason: %2")
                                       .arg(line, reason));
                return false;
            }
        } else if (command == "push") {
            if (parts.size() != 2) {
                reason = "Invalid arguments for push command (expected 2)";
            } else if (!QFileInfo::exists(content.filePath(parts.at(0)))) {
                reason = "Local file or folder not found for push: " + content.filePath(parts.at(0));
            } else {
                commandOk = m_device->pushPath(deviceId, content.filePath(parts.at(0)), parts.at(1));
            }
        } else if (command == "pull") {
            if (parts.size() != 1) {
                reason = "Invalid arguments for pull command (expected 1)";
            } else {
                QString remote = parts.at(0);
                QString target = content.filePath(remote.section('/', -1));
                commandOk = m_device->pullPath(deviceId, remote, target);
            }
        } else {
            qWarning() << "[install] Skipping unsupported command:" << command;
            commandOk = true;
        }

        if (!commandOk) {
            qWarning() << "[install] Command failed:" << line << "Reason:" << reason;
        }
        setProgress(job.id, (i + 1) * 100 / commands.size());
    }

    return true;
}

bool InstallationProcessor::runStandardInstall(const Job& job, const QString& deviceId,
                                               QString *error) {
    if (job.contentId.isEmpty()) {
        *error = "Missing package identifier for standard install";
        return false;
    }

    QDir content(job.localPath);
    const QStringList packages = content.entryList({"*.apk"}, QDir::Files, QDir::Name);
    if (packages.isEmpty()) {
        *error = "No package files found for standard install";
        return false;
    }

    QString expansionDir;
    QFileInfo candidate(content.filePath(job.contentId));
    if (candidate.isDir()) {
        expansionDir = candidate.absoluteFilePath();
    } else if (candidate.exists()) {
        qWarning() << "[install]" << candidate.filePath() << "matches the package name but is not a directory";
    }

    setProgress(job.id, 0);
    for (const QString& package : packages) {
        qInfo() << "[install] Installing" << package;
        QString reason;
        if (!installPackage(job, deviceId, content.filePath(package), {"-r", "-g"}, &reason)) {
            *error = truncateError(QString("Failed to install %1: %2").arg(package, reason));
            return false;
        }
    }
    setProgress(job.id, expansionDir.isEmpty() ? 100 : 50);
    if (expansionDir.isEmpty()) return true;

    QString remoteBase = expansionDataPath(job.contentId);
    if (!m_device->runShellCommand(deviceId, QString("mkdir -p %1").arg(ExpansionDataRoot))) {
        qWarning() << "[install] Could not ensure" << ExpansionDataRoot << "exists on device";
    }

    QVector<PendingFile> files;
    qint64 totalBytes = 0;
    QDirIterator it(expansionDir, QDir::Files | QDir::Hidden, QDirIterator::Subdirectories);
    while (it.hasNext()) {
        it.next();
        PendingFile file;
        file.path = it.filePath();
        file.relativePath = QDir(expansionDir).relativeFilePath(file.path);
        file.size = it.fileInfo().size();
        totalBytes += file.size;
        files << file;
    }
    std::sort(files.begin(), files.end(), [](const PendingFile& a, const PendingFile& b) {
        return a.relativePath < b.relativePath;
    });

    if (files.isEmpty()) {
        qInfo() << "[install] Expansion data directory" << expansionDir << "is empty";
        setProgress(job.id, 100);
        return true;
    }
    qInfo() << "[install] Pushing" << files.size() << "expansion files," << totalBytes << "bytes";

    QString output;
    if (!m_device->runShellCommand(deviceId, QString("mkdir -p \"%1\"").arg(remoteBase), &output)) {
        *error = truncateError("Failed to create " + remoteBase + ": " + output.trimmed());
        return false;
    }

    qint64 pushedBytes = 0;
    for (int i = 0; i < files.size(); ++i) {
        const PendingFile& file = files.at(i);
        QString remotePath = remoteBase + "/" + file.relativePath;
        QString remoteDir = remotePath.section('/', 0, -2);
        if (remoteDir != remoteBase
                && !m_device->runShellCommand(deviceId, QString("mkdir -p \"%1\"").arg(remoteDir))) {
            qWarning() << "[install] Could not create" << remoteDir << "on device";
        }

        qInfo() << "[install] Pushing file" << i + 1 << "/" << files.size() << ":"
                << file.relativePath << "(" << file.size << "bytes)";
        if (!m_device->pushPath(deviceId, file.path, remotePath)) {
            *error = truncateError("Failed to push expansion file " + file.relativePath);
            return false;
        }

        pushedBytes += file.size;
        int percent = totalBytes > 0
            ? int(qMin<qint64>(100, pushedBytes * 100 / totalBytes))
            : (i + 1) * 100 / files.size();
        setProgress(job.id, 50 + percent / 2);
    }

    return true;
}

bool InstallationProcessor::installPackage(const Job& job, const QString& deviceId,
                                           const QString& packageFile, const QStringList& flags,
                                           QString *error) {
    QString output;
    if (m_device->installPackage(deviceId, packageFile, flags, &output)) return true;

    if (!isIncompatibleInstall(output)) {
        *error = output.trimmed().isEmpty() ? QString("Package install failed") : output.trimmed();
        return false;
    }

    static const QRegularExpression packageRe("Package (\\S+)");
    QRegularExpressionMatch match = packageRe.match(output);
    QString packageName = match.hasMatch() ? match.captured(1) : job.contentId;
    qWarning() << "[install] Incompatible existing install of" << packageName
               << "- uninstalling and retrying";

    if (packageName.isEmpty() || !m_device->uninstallPackage(deviceId, packageName)) {
        *error = "Could not uninstall incompatible package " + packageName;
        return false;
    }

    output.clear();
    if (m_device->installPackage(deviceId, packageFile, flags, &output)) return true;
    *error = output.trimmed().isEmpty() ? QString("Package install failed after uninstall")
                                        : output.trimmed();
    return false;
}

void InstallationProcessor::setProgress(const QString& jobId, int progress) {
    JobUpdate update;
    update.progress = progress;
    m_queue->update(jobId, update);
    emit progressChanged(jobId, qBound(0, progress, 100));
    emit jobUpdated(jobId);
}

void InstallationProcessor::failInstall(const QString& jobId, JobErrorKind kind,
                                        const QString& message) {
    qCritical() << "[install] Installation failed for" << jobId << ":" << message;
    JobUpdate update;
    update.status = JobStatus::InstallError;
    update.error = truncateError(message);
    update.errorKind = kind;
    update.progress = 100;
    if (m_queue->update(jobId, update)) emit jobUpdated(jobId);
}
