#include "downloadprocessor.h"
#include "queuemanager.h"
#include "outputparsers/rcloneoutputparser.h"
#include <QDir>
#include <QFileInfo>
#include <QCryptographicHash>
#include <QDebug>

// rclone copies objects from either the active mirror or the public HTTP
// endpoint into <downloadsDir>/<job id>.
//
// Public endpoint layout:
//   each release is stored under md5("<release name>\n"), fetched through
//   rclone's on-the-fly ":http:" backend with --http-url pointing at the
//   base address. No rclone config is needed, so /dev/null is passed.
// Mirror layout:
//   "<remote>:/Quest Games/<release name>", using the remote defined in the
//   mirror's own rclone config file. Mirror content is stored extracted.

DownloadProcessor::DownloadProcessor(QueueManager *queue, DependencyResolver *dependencies,
                                     RemoteSourceProvider *remoteSource, MirrorProvider *mirrors,
                                     SettingsProvider *settings, const QString& downloadsDir,
                                     QObject *parent)
    : QObject(parent), m_queue(queue), m_dependencies(dependencies),
      m_remoteSource(remoteSource), m_mirrors(mirrors), m_settings(settings),
      m_downloadsDir(downloadsDir), m_parser(std::make_unique<RcloneOutputParser>()) {}

DownloadProcessor::~DownloadProcessor() {
    for (auto it = m_transfers.begin(); it != m_transfers.end(); ++it) {
        QProcess *proc = it.value().process;
        if (!proc) continue;
        proc->disconnect(this);
        if (proc->state() != QProcess::NotRunning) {
            proc->kill();
            proc->waitForFinished(1000);
        }
    }
}

void DownloadProcessor::setOutputParser(std::unique_ptr<ToolOutputParser> parser) {
    if (parser) m_parser = std::move(parser);
}

QString DownloadProcessor::publicObjectName(const QString& jobId) {
    return QString::fromLatin1(
        QCryptographicHash::hash((jobId + "\n").toUtf8(), QCryptographicHash::Md5).toHex());
}

QStringList DownloadProcessor::commonArgs() const {
    QStringList args;
    args << "--no-check-certificate"
         << "--progress"
         << "--stats=1s"
         << "--stats-one-line";

    // rclone takes "UP:DOWN" for separate upload/download limits
    int down = m_settings ? m_settings->downloadRateLimit() : 0;
    int up = m_settings ? m_settings->uploadRateLimit() : 0;
    if (down > 0 || up > 0) {
        QString upLimit = up > 0 ? QString("%1K").arg(up) : QString("off");
        QString downLimit = down > 0 ? QString("%1K").arg(down) : QString("off");
        args << "--bwlimit" << upLimit + ":" + downLimit;
    }
    return args;
}

QStringList DownloadProcessor::mirrorArgs(const Job& job, const MirrorProfile& mirror) const {
    QStringList args;
    args << "copy"
         << mirror.remoteName + ":/Quest Games/" + job.id
         << job.localPath
         << "--config" << mirror.configFile;
    return args + commonArgs();
}

QStringList DownloadProcessor::publicArgs(const Job& job, const RemoteSource& source) const {
    QStringList args;
    args << "copy"
         << ":http:/" + publicObjectName(job.id)
         << job.localPath
         << "--config" << "/dev/null"
         << "--http-url" << source.baseAddress;
    return args + commonArgs();
}

void DownloadProcessor::start(const Job& job) {
    qInfo() << "[download] Starting download for" << job.id;

    if (m_transfers.contains(job.id)) {
        qWarning() << "[download] Transfer already running for" << job.id;
        finish(job.id, false, false);
        return;
    }

    RemoteSource source = m_remoteSource ? m_remoteSource->remoteSource() : RemoteSource();
    if (!source.isValid()) {
        qCritical() << "[download] Missing remote source base address or password";
        fail(job.id, JobErrorKind::ConfigMissing, "Missing remote source configuration");
        finish(job.id, false, false);
        return;
    }

    if (!m_dependencies || !m_dependencies->isTransferReady()
            || m_dependencies->transferBinaryPath().isEmpty()) {
        qCritical() << "[download] rclone binary not available";
        fail(job.id, JobErrorKind::DependencyUnavailable, "rclone dependency not found");
        finish(job.id, false, false);
        return;
    }

    QString localPath = QDir(m_downloadsDir).filePath(job.id);
    JobUpdate pathUpdate;
    pathUpdate.localPath = localPath;
    m_queue->update(job.id, pathUpdate);

    if (!QDir().mkpath(localPath)) {
        qCritical() << "[download] Failed to create download directory" << localPath;
        fail(job.id, JobErrorKind::PathError,
             "Failed to create directory " + localPath);
        finish(job.id, false, false);
        return;
    }

    JobUpdate begin;
    begin.status = JobStatus::Downloading;
    begin.progress = 0;
    begin.speed = QString();
    begin.eta = QString();
    begin.error = QString();
    begin.errorKind = JobErrorKind::None;
    m_queue->update(job.id, begin);
    emit jobUpdated(job.id);

    std::optional<Job> current = m_queue->find(job.id);
    if (!current) {
        finish(job.id, false, false);
        return;
    }

    std::optional<MirrorProfile> mirror = m_mirrors ? m_mirrors->activeMirror() : std::nullopt;
    if (mirror) {
        if (mirror->remoteName.isEmpty() || mirror->configFile.isEmpty()
                || !QFileInfo::exists(mirror->configFile)) {
            qWarning() << "[download] Mirror" << mirror->name
                       << "has no usable config file, falling back to public endpoint";
        } else {
            qInfo() << "[download] Using active mirror:" << mirror->name;
            startTransfer(*current, mirrorArgs(*current, *mirror), true);
            return;
        }
    }

    startPublic(*current);
}

void DownloadProcessor::startPublic(const Job& job) {
    qInfo() << "[download] Using public endpoint for" << job.id;
    RemoteSource source = m_remoteSource->remoteSource();
    startTransfer(job, publicArgs(job, source), false);
}

void DownloadProcessor::startTransfer(const Job& job, const QStringList& args, bool viaMirror) {
    QProcess *proc = new QProcess(this);
    proc->setProcessChannelMode(QProcess::MergedChannels);
    proc->setStandardInputFile(QProcess::nullDevice());

    Transfer transfer;
    transfer.process = proc;
    transfer.viaMirror = viaMirror;
    transfer.outputConnection = connect(proc, &QProcess::readyReadStandardOutput,
                                        this, [this, jobId = job.id]() {
        handleOutput(jobId);
    });
    m_transfers.insert(job.id, transfer);

    connect(proc, &QProcess::started, this, [this, proc, jobId = job.id]() {
        JobUpdate update;
        update.pid = proc->processId();
        m_queue->update(jobId, update);
        qInfo() << "[download] rclone started for" << jobId << "PID:" << proc->processId();
    });

    connect(proc, QOverload<int, QProcess::ExitStatus>::of(&QProcess::finished),
            this, [this, jobId = job.id](int exitCode, QProcess::ExitStatus status) {
        handleFinished(jobId, exitCode, status);
    });

    // FailedToStart never produces finished(), so resolve the attempt here
    connect(proc, &QProcess::errorOccurred, this, [this, proc, jobId = job.id](QProcess::ProcessError error) {
        if (error == QProcess::FailedToStart) {
            handleStartFailure(jobId, proc->errorString());
        }
    });

    proc->start(m_dependencies->transferBinaryPath(), args);
}

void DownloadProcessor::handleOutput(const QString& jobId) {
    auto it = m_transfers.find(jobId);
    if (it == m_transfers.end()) return;
    Transfer& transfer = it.value();

    std::optional<Job> current = m_queue->find(jobId);
    if (!current || current->status != JobStatus::Downloading) {
        // Cancelled or superseded; stale output must not touch the job again
        qWarning() << "[download] Job" << jobId << "is now"
                   << (current ? jobStatusName(current->status) : QString("gone"))
                   << "- stopping transfer output processing";
        detachAndTerminate(transfer);
        return;
    }

    const QStringList lines = transfer.buffer.append(transfer.process->readAllStandardOutput());
    for (const QString& line : lines) {
        qDebug() << "[rclone]" << jobId << ":" << line;

        ParsedLine parsed = m_parser->parseLine(line);

        // >= so the initial 0% is still announced
        if (parsed.hasProgress() && parsed.percent >= current->progress) {
            JobUpdate update;
            update.status = JobStatus::Downloading;
            update.progress = parsed.percent;
            update.speed = parsed.speed.isEmpty() ? current->speed : parsed.speed;
            update.eta = parsed.eta.isEmpty() ? current->eta : parsed.eta;
            m_queue->update(jobId, update);
            current = m_queue->find(jobId);
            emit progressChanged(jobId, current->progress, current->speed, current->eta);
            emit jobUpdated(jobId);
        }

        if (parsed.failure == JobErrorKind::AuthFailure) {
            if (transfer.viaMirror) {
                qWarning() << "[download] Authentication failed with mirror for" << jobId;
                transfer.mirrorFailed = true;
                transfer.mirrorError = "Authentication failed with mirror";
                detachAndTerminate(transfer);
            } else {
                qCritical() << "[download] Authentication failed for" << jobId;
                cancel(jobId, JobStatus::Error,
                       "Authentication failed (check the remote source password)",
                       JobErrorKind::AuthFailure);
            }
            return;
        }
    }
}

void DownloadProcessor::detachAndTerminate(Transfer& transfer) {
    QObject::disconnect(transfer.outputConnection);
    transfer.terminating = true;
    if (transfer.process && transfer.process->state() != QProcess::NotRunning) {
        transfer.process->terminate();
    }
}

void DownloadProcessor::cancel(const QString& jobId, JobStatus finalStatus,
                               const QString& error, JobErrorKind kind) {
    auto it = m_transfers.find(jobId);
    if (it != m_transfers.end()) {
        qInfo() << "[download] Cancelling download for" << jobId
                << "(PID:" << it.value().process->processId() << ")";
        // Listeners go first so a late progress line cannot overwrite the final status
        detachAndTerminate(it.value());
    } else {
        qInfo() << "[download] No active transfer to cancel for" << jobId;
    }

    std::optional<Job> job = m_queue->find(jobId);
    if (!job) {
        qWarning() << "[download] Job" << jobId << "not found during cancellation";
        return;
    }

    JobUpdate update;
    update.pid = 0;
    if (!(job->status == JobStatus::Error && finalStatus == JobStatus::Cancelled)) {
        update.status = finalStatus;
    }
    if (finalStatus == JobStatus::Cancelled) {
        update.progress = 0;
        update.speed = QString();
        update.eta = QString();
    }
    if (finalStatus == JobStatus::Error) {
        update.error = truncateError(error.isEmpty() ? job->error : error);
        update.errorKind = kind == JobErrorKind::None ? JobErrorKind::UnexpectedError : kind;
    } else {
        update.error = QString();
        update.errorKind = JobErrorKind::None;
    }
    m_queue->update(jobId, update);
    emit jobUpdated(jobId);
}

void DownloadProcessor::handleFinished(const QString& jobId, int exitCode,
                                       QProcess::ExitStatus exitStatus) {
    auto it = m_transfers.find(jobId);
    if (it == m_transfers.end()) return;
    Transfer transfer = it.value();
    m_transfers.erase(it);
    transfer.process->deleteLater();
    transfer.buffer.takeRemainder();

    bool terminated = transfer.terminating || exitStatus == QProcess::CrashExit
        || exitCode == 143 || exitCode == 137;
    std::optional<Job> current = m_queue->find(jobId);
    bool stillDownloading = current && current->status == JobStatus::Downloading;

    if (transfer.viaMirror) {
        if (stillDownloading && !transfer.mirrorFailed && !terminated && exitCode == 0) {
            qInfo() << "[download] Mirror transfer finished for" << jobId
                    << "- mirror content is already extracted";
            JobUpdate done;
            done.status = JobStatus::Completed;
            done.progress = 100;
            done.extractProgress = 100;
            done.speed = QString();
            done.eta = QString();
            m_queue->update(jobId, done);
            emit jobUpdated(jobId);
            finish(jobId, true, false);
            return;
        }
        if (stillDownloading) {
            QString reason = transfer.mirrorError.isEmpty()
                ? QString("Mirror transfer failed (exit code %1)").arg(exitCode)
                : transfer.mirrorError;
            QString excerpt = transfer.buffer.tail();
            if (!excerpt.isEmpty()) reason += "\n...\n" + excerpt;
            handleMirrorFailure(jobId, reason);
            return;
        }
    }

    if (!stillDownloading) {
        qInfo() << "[download] Transfer for" << jobId << "finished, but status is"
                << (current ? jobStatusName(current->status) : QString("gone"))
                << "- not proceeding to extraction";
        if (current && current->pid != 0) {
            JobUpdate clearPid;
            clearPid.pid = 0;
            m_queue->update(jobId, clearPid);
        }
        finish(jobId, false, false);
        return;
    }

    if (terminated) {
        // Killed from outside while nobody had set a final status
        qInfo() << "[download] rclone for" << jobId << "was terminated by a signal"
                << "(" << jobErrorKindName(JobErrorKind::ProcessTerminated) << ")";
        JobUpdate update;
        update.status = JobStatus::Cancelled;
        update.progress = 0;
        update.speed = QString();
        update.eta = QString();
        m_queue->update(jobId, update);
        emit jobUpdated(jobId);
        finish(jobId, false, false);
        return;
    }

    if (exitCode != 0) {
        QString message = QString("rclone exited with code %1").arg(exitCode);
        QString excerpt = transfer.buffer.tail();
        if (!excerpt.isEmpty()) message += "\n...\n" + excerpt;
        qCritical() << "[download] Transfer failed for" << jobId << ":" << message;
        fail(jobId, JobErrorKind::UnexpectedError, message);
        finish(jobId, false, false);
        return;
    }

    qInfo() << "[download] rclone finished successfully for" << jobId;
    JobUpdate done;
    done.progress = 100;
    done.pid = 0;
    m_queue->update(jobId, done);
    emit progressChanged(jobId, 100, current->speed, current->eta);
    emit jobUpdated(jobId);
    finish(jobId, true, true);
}

void DownloadProcessor::handleStartFailure(const QString& jobId, const QString& reason) {
    auto it = m_transfers.find(jobId);
    if (it == m_transfers.end()) return;
    Transfer transfer = it.value();
    m_transfers.erase(it);
    transfer.process->deleteLater();

    qCritical() << "[download] Failed to start rclone for" << jobId << ":" << reason;

    std::optional<Job> current = m_queue->find(jobId);
    if (!current || current->status != JobStatus::Downloading) {
        finish(jobId, false, false);
        return;
    }
    if (transfer.viaMirror) {
        handleMirrorFailure(jobId, "Failed to start rclone for mirror: " + reason);
        return;
    }
    fail(jobId, JobErrorKind::DependencyUnavailable, "Failed to start rclone: " + reason);
    finish(jobId, false, false);
}

void DownloadProcessor::handleMirrorFailure(const QString& jobId, const QString& reason) {
    std::optional<Job> current = m_queue->find(jobId);
    if (!current) {
        finish(jobId, false, false);
        return;
    }

    bool fallback = !m_settings || m_settings->fallbackToPublicOnMirrorFailure();
    if (!fallback) {
        qCritical() << "[download] Mirror failed for" << jobId << ":" << reason;
        JobErrorKind kind = reason.startsWith("Authentication")
            ? JobErrorKind::AuthFailure : JobErrorKind::UnexpectedError;
        fail(jobId, kind, reason);
        finish(jobId, false, false);
        return;
    }

    qWarning() << "[download] Mirror failed for" << jobId << "(" << reason
               << ") - falling back to public endpoint";
    JobUpdate clearPid;
    clearPid.pid = 0;
    m_queue->update(jobId, clearPid);
    startPublic(*current);
}

void DownloadProcessor::fail(const QString& jobId, JobErrorKind kind, const QString& message) {
    std::optional<Job> current = m_queue->find(jobId);
    if (current && (current->status == JobStatus::Cancelled || current->status == JobStatus::Error)) {
        qInfo() << "[download] Error for" << jobId << "ignored, status already"
                << jobStatusName(current->status) << ":" << message;
        if (current->status == JobStatus::Error) {
            JobUpdate update;
            update.error = truncateError(message);
            m_queue->update(jobId, update);
            emit jobUpdated(jobId);
        }
        return;
    }

    JobUpdate update;
    update.status = JobStatus::Error;
    update.error = truncateError(message);
    update.errorKind = kind;
    update.speed = QString();
    update.eta = QString();
    update.pid = 0;
    if (m_queue->update(jobId, update)) emit jobUpdated(jobId);
}

void DownloadProcessor::finish(const QString& jobId, bool success, bool shouldExtract) {
    DownloadResult result;
    result.success = success;
    result.shouldExtract = shouldExtract;
    result.finalJob = m_queue->find(jobId);
    emit finished(jobId, result);
}
