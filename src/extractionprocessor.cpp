#include "extractionprocessor.h"
#include "queuemanager.h"
#include "outputparsers/sevenzipoutputparser.h"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTimer>
#include <QDebug>
#include <cstring>

namespace {
const char *FirstPartSuffix = ".7z.001";
constexpr int MaxNestingDepth = 3;
}

ExtractionProcessor::ExtractionProcessor(QueueManager *queue, DependencyResolver *dependencies,
                                         RemoteSourceProvider *remoteSource, QObject *parent)
    : QObject(parent), m_queue(queue), m_dependencies(dependencies),
      m_remoteSource(remoteSource), m_parser(std::make_unique<SevenZipOutputParser>()) {}

ExtractionProcessor::~ExtractionProcessor() {
    for (auto it = m_extractions.begin(); it != m_extractions.end(); ++it) {
        QProcess *proc = it.value().process;
        if (!proc) continue;
        proc->disconnect(this);
        if (proc->state() != QProcess::NotRunning) {
            proc->kill();
            proc->waitForFinished(1000);
        }
    }
}

void ExtractionProcessor::setOutputParser(std::unique_ptr<ToolOutputParser> parser) {
    if (parser) m_parser = std::move(parser);
}

QString ExtractionProcessor::findFirstArchivePart(const QString& dir) {
    QDir d(dir);
    const QStringList candidates = d.entryList({QString("*") + FirstPartSuffix},
                                               QDir::Files, QDir::Name);
    if (candidates.isEmpty()) return QString();
    return d.filePath(candidates.first());
}

QStringList ExtractionProcessor::archiveParts(const QString& dir, const QString& firstPart) {
    QString fileName = QFileInfo(firstPart).fileName();
    QString baseName = fileName.left(fileName.length() - int(std::strlen(FirstPartSuffix)));

    QStringList parts;
    QDir d(dir);
    const QStringList files = d.entryList(QDir::Files, QDir::Name);
    for (const QString& file : files) {
        if (file.startsWith(baseName) && file.contains(".7z.")) {
            parts << d.filePath(file);
        }
    }
    return parts;
}

QByteArray ExtractionProcessor::decodePassword(const QString& encoded) {
    auto result = QByteArray::fromBase64Encoding(encoded.trimmed().toLatin1(),
                                                 QByteArray::AbortOnBase64DecodingErrors);
    if (!result) return QByteArray();
    return result.decoded;
}

void ExtractionProcessor::start(const Job& job) {
    qInfo() << "[extract] Starting extraction for" << job.id;

    if (m_extractions.contains(job.id)) {
        qWarning() << "[extract] Extraction already running for" << job.id;
        emit finished(job.id, false);
        return;
    }

    if (job.localPath.isEmpty() || !QFileInfo(job.localPath).isDir()) {
        fail(job.id, JobErrorKind::PathError,
             "Download directory not found: " + job.localPath);
        emit finished(job.id, false);
        return;
    }

    if (!m_dependencies || !m_dependencies->isArchiveReady()
            || m_dependencies->archiveBinaryPath().isEmpty()) {
        fail(job.id, JobErrorKind::DependencyUnavailable, "7-Zip dependency not found");
        emit finished(job.id, false);
        return;
    }

    RemoteSource source = m_remoteSource ? m_remoteSource->remoteSource() : RemoteSource();
    QByteArray password = decodePassword(source.password);
    if (password.isEmpty()) {
        fail(job.id, JobErrorKind::ConfigMissing,
             "Missing or invalid archive password in remote source configuration");
        emit finished(job.id, false);
        return;
    }

    QString firstPart = findFirstArchivePart(job.localPath);
    if (firstPart.isEmpty()) {
        fail(job.id, JobErrorKind::PathError,
             QString("No %1 archive found in %2").arg(QString::fromLatin1(FirstPartSuffix), job.localPath));
        emit finished(job.id, false);
        return;
    }

    JobUpdate begin;
    begin.status = JobStatus::Extracting;
    begin.extractProgress = 0;
    begin.speed = QString();
    begin.eta = QString();
    m_queue->update(job.id, begin);
    emit jobUpdated(job.id);

    std::optional<Job> current = m_queue->find(job.id);
    if (!current || current->status != JobStatus::Extracting) {
        qWarning() << "[extract] Job" << job.id << "could not enter extraction";
        emit finished(job.id, false);
        return;
    }

    QProcess *proc = new QProcess(this);
    proc->setProcessChannelMode(QProcess::MergedChannels);
    proc->setStandardInputFile(QProcess::nullDevice());
    proc->setWorkingDirectory(job.localPath);

    Extraction extraction;
    extraction.process = proc;
    extraction.firstPart = firstPart;
    extraction.password = password;
    extraction.outputConnection = connect(proc, &QProcess::readyReadStandardOutput,
                                          this, [this, jobId = job.id]() {
        handleOutput(jobId);
    });
    m_extractions.insert(job.id, extraction);

    connect(proc, &QProcess::started, this, [this, proc, jobId = job.id]() {
        JobUpdate update;
        update.pid = proc->processId();
        m_queue->update(jobId, update);
        qInfo() << "[extract] 7z started for" << jobId << "PID:" << proc->processId();
    });
    connect(proc, QOverload<int, QProcess::ExitStatus>::of(&QProcess::finished),
            this, [this, jobId = job.id](int exitCode, QProcess::ExitStatus status) {
        handleFinished(jobId, exitCode, status);
    });
    connect(proc, &QProcess::errorOccurred, this, [this, proc, jobId = job.id](QProcess::ProcessError error) {
        if (error == QProcess::FailedToStart) {
            handleStartFailure(jobId, proc->errorString());
        }
    });

    QStringList args;
    args << "x" << firstPart
         << "-aoa"
         << "-bsp1"
         << "-y"
         << "-o" + job.localPath
         << "-p" + QString::fromUtf8(password);

    qInfo() << "[extract] Extracting" << QFileInfo(firstPart).fileName() << "into" << job.localPath;
    proc->start(m_dependencies->archiveBinaryPath(), args);
}

void ExtractionProcessor::handleOutput(const QString& jobId) {
    auto it = m_extractions.find(jobId);
    if (it == m_extractions.end() || !it.value().process) return;
    Extraction& extraction = it.value();

    std::optional<Job> current = m_queue->find(jobId);
    if (!current || current->status != JobStatus::Extracting) {
        qWarning() << "[extract] Job" << jobId << "is no longer extracting - stopping 7z";
        requestStop(extraction);
        return;
    }

    const QStringList lines = extraction.buffer.append(extraction.process->readAllStandardOutput());
    if (extraction.nested) {
        for (const QString& line : lines) qDebug() << "[7z]" << jobId << "(nested) :" << line;
        return;
    }
    for (const QString& line : lines) {
        qDebug() << "[7z]" << jobId << ":" << line;

        ParsedLine parsed = m_parser->parseLine(line);
        if (parsed.hasProgress() && parsed.percent >= current->extractProgress) {
            JobUpdate update;
            update.extractProgress = parsed.percent;
            m_queue->update(jobId, update);
            current = m_queue->find(jobId);
            emit progressChanged(jobId, current->extractProgress);
            emit jobUpdated(jobId);
        }

        if (parsed.isFailure()) {
            QString message = SevenZipOutputParser::failureMessage(parsed.failure);
            qCritical() << "[extract]" << message << "while extracting" << jobId;
            cancel(jobId, JobStatus::Error, message, parsed.failure);
            return;
        }
    }
}

void ExtractionProcessor::requestStop(Extraction& extraction) {
    QObject::disconnect(extraction.outputConnection);
    if (extraction.terminating) return;
    extraction.terminating = true;

    QProcess *proc = extraction.process;
    if (!proc || proc->state() == QProcess::NotRunning) return;
    proc->terminate();

    // 7z may ignore SIGTERM while it holds output files open
    QTimer::singleShot(m_gracePeriod, proc, [proc]() {
        if (proc->state() != QProcess::NotRunning) {
            qWarning() << "[extract] 7z did not exit after termination request, killing PID"
                       << proc->processId();
            proc->kill();
        }
    });
}

void ExtractionProcessor::cancel(const QString& jobId, JobStatus finalStatus,
                                 const QString& error, JobErrorKind kind) {
    auto it = m_extractions.find(jobId);
    if (it != m_extractions.end()) {
        qInfo() << "[extract] Cancelling extraction for" << jobId;
        requestStop(it.value());
    } else {
        qInfo() << "[extract] No active extraction to cancel for" << jobId;
    }

    std::optional<Job> job = m_queue->find(jobId);
    if (!job) return;

    JobUpdate update;
    update.pid = 0;
    if (!(job->status == JobStatus::Error && finalStatus == JobStatus::Cancelled)) {
        update.status = finalStatus;
    }
    if (finalStatus == JobStatus::Error) {
        update.error = truncateError(error.isEmpty() ? job->error : error);
        update.errorKind = kind == JobErrorKind::None ? JobErrorKind::UnexpectedError : kind;
    } else if (finalStatus == JobStatus::Cancelled) {
        update.progress = 0;
        update.error = QString();
        update.errorKind = JobErrorKind::None;
    }
    m_queue->update(jobId, update);
    emit jobUpdated(jobId);
}

void ExtractionProcessor::handleFinished(const QString& jobId, int exitCode,
                                         QProcess::ExitStatus exitStatus) {
    auto it = m_extractions.find(jobId);
    if (it == m_extractions.end()) return;
    Extraction& extraction = it.value();
    extraction.process->deleteLater();
    extraction.process = nullptr;

    std::optional<Job> current = m_queue->find(jobId);
    if (!current || current->status != JobStatus::Extracting) {
        qInfo() << "[extract] 7z for" << jobId << "exited after status became"
                << (current ? jobStatusName(current->status) : QString("gone"));
        m_extractions.erase(it);
        emit finished(jobId, false);
        return;
    }

    // A failure reported on the last, unterminated line
    QString lastLine = extraction.buffer.takeRemainder();
    if (!lastLine.isEmpty() && !extraction.nested) {
        qDebug() << "[7z]" << jobId << ":" << lastLine;
        ParsedLine parsed = m_parser->parseLine(lastLine);
        if (parsed.isFailure()) {
            m_extractions.erase(it);
            fail(jobId, parsed.failure, SevenZipOutputParser::failureMessage(parsed.failure));
            emit finished(jobId, false);
            return;
        }
    }

    if (extraction.terminating || (exitStatus == QProcess::CrashExit && !extraction.nested)) {
        qInfo() << "[extract] 7z for" << jobId << "was terminated"
                << "(" << jobErrorKindName(JobErrorKind::ProcessTerminated) << ")";
        m_extractions.erase(it);
        JobUpdate update;
        update.status = JobStatus::Cancelled;
        update.progress = 0;
        m_queue->update(jobId, update);
        emit jobUpdated(jobId);
        emit finished(jobId, false);
        return;
    }

    if (extraction.nested) {
        QString name = QFileInfo(extraction.currentArchive).fileName();
        if (exitStatus == QProcess::NormalExit && exitCode == 0) {
            extraction.extractedInPass = true;
            if (!QFile::remove(extraction.currentArchive)) {
                qWarning() << "[extract] Could not remove nested archive" << extraction.currentArchive;
            }
        } else {
            // A broken inner archive is left in place; the job still completes
            qWarning() << "[extract] Nested archive" << name << "failed with exit code"
                       << exitCode << ":" << extraction.buffer.tail(2);
            extraction.failedNested << extraction.currentArchive;
        }
        continueNested(jobId);
        return;
    }

    if (exitCode != 0) {
        QString message = QString("Extraction failed (7z exit code %1)").arg(exitCode);
        QString excerpt = extraction.buffer.tail();
        if (!excerpt.isEmpty()) message += "\n...\n" + excerpt;
        m_extractions.erase(it);
        fail(jobId, JobErrorKind::UnexpectedError, message);
        emit finished(jobId, false);
        return;
    }

    qInfo() << "[extract] 7z finished successfully for" << jobId;

    removeArchiveParts(current->localPath, extraction.firstPart);
    flattenWrapperDirectory(current->localPath, jobId);
    extraction.contentDir = current->localPath;
    continueNested(jobId);
}

void ExtractionProcessor::continueNested(const QString& jobId) {
    auto it = m_extractions.find(jobId);
    if (it == m_extractions.end()) return;
    Extraction& extraction = it.value();

    if (extraction.pendingNested.isEmpty()) {
        bool anotherPass = extraction.nestedPass == 0
            || (extraction.extractedInPass && extraction.nestedPass < MaxNestingDepth);
        if (anotherPass) {
            ++extraction.nestedPass;
            extraction.extractedInPass = false;
            QDir dir(extraction.contentDir);
            const QStringList names = dir.entryList({"*.7z"}, QDir::Files, QDir::Name);
            for (const QString& name : names) {
                QString archive = dir.filePath(name);
                if (!extraction.failedNested.contains(archive)) extraction.pendingNested << archive;
            }
        }
        if (extraction.pendingNested.isEmpty()) {
            m_extractions.erase(it);
            completeExtraction(jobId);
            return;
        }
    }

    startNested(jobId, extraction.pendingNested.takeFirst());
}

void ExtractionProcessor::startNested(const QString& jobId, const QString& archive) {
    Extraction& extraction = m_extractions[jobId];
    QString dir = extraction.contentDir;
    QString password = QString::fromUtf8(extraction.password);

    QProcess *proc = new QProcess(this);
    proc->setProcessChannelMode(QProcess::MergedChannels);
    proc->setStandardInputFile(QProcess::nullDevice());
    proc->setWorkingDirectory(dir);

    extraction.process = proc;
    extraction.nested = true;
    extraction.currentArchive = archive;
    extraction.buffer = LineBuffer();
    extraction.outputConnection = connect(proc, &QProcess::readyReadStandardOutput,
                                          this, [this, jobId]() {
        handleOutput(jobId);
    });

    connect(proc, QOverload<int, QProcess::ExitStatus>::of(&QProcess::finished),
            this, [this, jobId](int exitCode, QProcess::ExitStatus status) {
        handleFinished(jobId, exitCode, status);
    });
    connect(proc, &QProcess::errorOccurred, this, [this, proc, jobId](QProcess::ProcessError error) {
        if (error == QProcess::FailedToStart) {
            handleStartFailure(jobId, proc->errorString());
        }
    });

    qInfo() << "[extract] Extracting nested archive" << QFileInfo(archive).fileName();
    proc->start(m_dependencies->archiveBinaryPath(),
                {"x", archive, "-aoa", "-y", "-o" + dir, "-p" + password});
}

void ExtractionProcessor::completeExtraction(const QString& jobId) {
    JobUpdate done;
    done.status = JobStatus::Completed;
    done.extractProgress = 100;
    done.pid = 0;
    m_queue->update(jobId, done);
    emit progressChanged(jobId, 100);
    emit jobUpdated(jobId);
    emit finished(jobId, true);
}

void ExtractionProcessor::handleStartFailure(const QString& jobId, const QString& reason) {
    auto it = m_extractions.find(jobId);
    if (it == m_extractions.end()) return;
    Extraction& extraction = it.value();
    extraction.process->deleteLater();
    extraction.process = nullptr;

    if (extraction.nested) {
        qWarning() << "[extract] Could not start 7z for nested archive"
                   << QFileInfo(extraction.currentArchive).fileName() << ":" << reason;
        extraction.failedNested << extraction.currentArchive;
        continueNested(jobId);
        return;
    }

    m_extractions.erase(it);
    fail(jobId, JobErrorKind::DependencyUnavailable, "Failed to start 7z: " + reason);
    emit finished(jobId, false);
}

void ExtractionProcessor::removeArchiveParts(const QString& dir, const QString& firstPart) {
    const QStringList parts = archiveParts(dir, firstPart);
    for (const QString& part : parts) {
        if (QFile::remove(part)) {
            qDebug() << "[extract] Removed archive part" << QFileInfo(part).fileName();
        } else {
            qWarning() << "[extract] Could not remove archive part" << part;
        }
    }
}

void ExtractionProcessor::flattenWrapperDirectory(const QString& dir, const QString& jobId) {
    QDir wrapper(QDir(dir).filePath(jobId));
    if (!wrapper.exists()) return;

    qInfo() << "[extract] Flattening wrapper directory" << jobId;
    const QFileInfoList entries = wrapper.entryInfoList(
        QDir::AllEntries | QDir::Hidden | QDir::System | QDir::NoDotAndDotDot);
    for (const QFileInfo& entry : entries) {
        QString target = QDir(dir).filePath(entry.fileName());
        if (QFileInfo::exists(target)) {
            qWarning() << "[extract] Skipping" << entry.fileName() << "- already exists in" << dir;
            continue;
        }
        if (!QDir().rename(entry.absoluteFilePath(), target)) {
            qWarning() << "[extract] Could not move" << entry.absoluteFilePath() << "to" << target;
        }
    }

    if (wrapper.isEmpty()) {
        if (!QDir(dir).rmdir(jobId)) {
            qWarning() << "[extract] Could not remove empty wrapper directory" << wrapper.path();
        }
    } else {
        qWarning() << "[extract] Wrapper directory" << wrapper.path() << "left in place, not empty";
    }
}

void ExtractionProcessor::fail(const QString& jobId, JobErrorKind kind, const QString& message) {
    qCritical() << "[extract] Extraction failed for" << jobId << ":" << message;
    JobUpdate update;
    update.status = JobStatus::Error;
    update.error = truncateError(message);
    update.errorKind = kind;
    update.pid = 0;
    update.extractProgress = 0;
    if (m_queue->update(jobId, update)) emit jobUpdated(jobId);
}
