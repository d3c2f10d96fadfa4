#include "pipelinescheduler.h"
#include "queuemanager.h"
#include "extractionprocessor.h"
#include "installationprocessor.h"
#include <QDateTime>
#include <QDir>
#include <QFileInfo>
#include <QDebug>
#include <algorithm>
#include <exception>

PipelineScheduler::PipelineScheduler(QueueManager *queue, DownloadProcessor *download,
                                     ExtractionProcessor *extraction,
                                     InstallationProcessor *installation,
                                     DependencyResolver *dependencies, QObject *parent)
    : QObject(parent), m_queue(queue), m_download(download), m_extraction(extraction),
      m_installation(installation), m_dependencies(dependencies) {
    m_notifyTimer = new QTimer(this);
    m_notifyTimer->setSingleShot(true);
    m_notifyTimer->setInterval(300);
    connect(m_notifyTimer, &QTimer::timeout, this, [this]() {
        emit queueChanged(m_queue->jobs());
    });

    connect(m_download, &DownloadProcessor::jobUpdated, this, &PipelineScheduler::scheduleNotify);
    connect(m_download, &DownloadProcessor::progressChanged,
            this, &PipelineScheduler::transferProgress);
    connect(m_download, &DownloadProcessor::finished,
            this, &PipelineScheduler::onDownloadFinished);

    connect(m_extraction, &ExtractionProcessor::jobUpdated, this, &PipelineScheduler::scheduleNotify);
    connect(m_extraction, &ExtractionProcessor::progressChanged,
            this, &PipelineScheduler::extractionProgress);
    connect(m_extraction, &ExtractionProcessor::finished,
            this, &PipelineScheduler::onExtractionFinished);

    connect(m_installation, &InstallationProcessor::jobUpdated,
            this, &PipelineScheduler::scheduleNotify);
    connect(m_installation, &InstallationProcessor::progressChanged,
            this, &PipelineScheduler::installProgress);
}

void PipelineScheduler::initialize(bool autoStart) {
    if (m_initialized) return;
    qInfo() << "[scheduler] Initializing download pipeline...";
    m_autoStart = autoStart;

    if (!QDir().mkpath(m_download->downloadsDir())) {
        qWarning() << "[scheduler] Could not create downloads directory" << m_download->downloadsDir();
    }

    m_queue->load();

    // Interrupted transfers and extractions lost their process; start them over
    JobUpdate requeue;
    requeue.status = JobStatus::Queued;
    requeue.progress = 0;
    requeue.extractProgress = -1;
    requeue.pid = 0;
    requeue.speed = QString();
    requeue.eta = QString();
    int requeued = m_queue->updateWhere([](const Job& job) {
        return job.status == JobStatus::Downloading || job.status == JobStatus::Extracting;
    }, requeue);
    if (requeued > 0) {
        qInfo() << "[scheduler] Reset" << requeued << "interrupted job(s) to Queued after restart";
    }

    // The extracted content of an interrupted install is still on disk
    JobUpdate restore;
    restore.status = JobStatus::Completed;
    restore.progress = 100;
    restore.extractProgress = 100;
    restore.pid = 0;
    int restored = m_queue->updateWhere([](const Job& job) {
        return job.status == JobStatus::Installing;
    }, restore);
    if (restored > 0) {
        qInfo() << "[scheduler] Reset" << restored << "interrupted install(s) to Completed";
    }

    m_initialized = true;
    emit queueChanged(m_queue->jobs());
    if (m_autoStart) processQueue();
}

QVector<Job> PipelineScheduler::queue() const {
    return m_queue->jobs();
}

bool PipelineScheduler::add(const AddRequest& request) {
    if (!m_initialized) {
        qCritical() << "[scheduler] Not initialized, cannot add" << request.id;
        return false;
    }
    if (request.id.trimmed().isEmpty()) {
        qCritical() << "[scheduler] Cannot add" << request.displayName << "- missing release name";
        return false;
    }

    std::optional<Job> existing = m_queue->find(request.id);
    if (existing) {
        if (existing->status == JobStatus::Completed) {
            qInfo() << "[scheduler]" << request.id << "already downloaded";
            return false;
        }
        if (existing->status != JobStatus::Error && existing->status != JobStatus::Cancelled) {
            qInfo() << "[scheduler]" << request.id << "is already in the queue with status"
                    << jobStatusName(existing->status);
            return false;
        }
        qInfo() << "[scheduler] Re-adding" << request.id << "after previous"
                << jobStatusName(existing->status);
        m_queue->remove(request.id);
    }

    Job job;
    job.id = request.id;
    job.displayName = request.displayName;
    job.contentId = request.contentId;
    job.status = JobStatus::Queued;
    job.addedAt = QDateTime::currentMSecsSinceEpoch();
    m_queue->add(job);
    qInfo() << "[scheduler] Added" << job.id << "to download queue";

    scheduleNotify();
    if (m_autoStart) kickQueue();
    return true;
}

void PipelineScheduler::processQueue() {
    if (m_processing || m_installing) return;

    if (!m_dependencies || !m_dependencies->isTransferReady()) {
        qWarning() << "[scheduler] rclone not ready, cannot process download queue";
        emit idle();
        return;
    }

    std::optional<Job> next = m_queue->findNextQueued();
    if (!next) {
        emit idle();
        return;
    }

    // A retried job whose previous process has not exited yet
    if (m_download->isActive(next->id) || m_extraction->isActive(next->id)) {
        qInfo() << "[scheduler] Waiting for previous process of" << next->id << "to exit";
        QTimer::singleShot(100, this, &PipelineScheduler::processQueue);
        return;
    }

    m_processing = true;
    m_currentJobId = next->id;
    qInfo() << "[scheduler] Processing next job:" << next->id;

    try {
        m_download->start(*next);
    } catch (const std::exception& e) {
        handleUnexpected(next->id, QString::fromLocal8Bit(e.what()));
    }
}

void PipelineScheduler::onDownloadFinished(const QString& jobId, const DownloadResult& result) {
    if (jobId != m_currentJobId) {
        qDebug() << "[scheduler] Ignoring download result for" << jobId;
        return;
    }

    if (result.success && result.shouldExtract && result.finalJob) {
        qInfo() << "[scheduler] Download finished for" << jobId << "- starting extraction";
        try {
            m_extraction->start(*result.finalJob);
        } catch (const std::exception& e) {
            handleUnexpected(jobId, QString::fromLocal8Bit(e.what()));
        }
        return;
    }

    qInfo() << "[scheduler] Download for" << jobId << "ended with status"
            << (result.finalJob ? jobStatusName(result.finalJob->status) : QString("unknown"));
    finishCurrent();
}

void PipelineScheduler::onExtractionFinished(const QString& jobId, bool success) {
    if (jobId != m_currentJobId) {
        qDebug() << "[scheduler] Ignoring extraction result for" << jobId;
        return;
    }
    qInfo() << "[scheduler] Extraction for" << jobId << (success ? "succeeded" : "did not succeed");
    finishCurrent();
}

void PipelineScheduler::handleUnexpected(const QString& jobId, const QString& what) {
    qCritical() << "[scheduler] Unexpected error processing" << jobId << ":" << what;
    JobUpdate update;
    update.status = JobStatus::Error;
    update.error = truncateError("Unexpected processing error: " + what);
    update.errorKind = JobErrorKind::UnexpectedError;
    update.pid = 0;
    m_queue->update(jobId, update);
    finishCurrent();
}

void PipelineScheduler::finishCurrent() {
    m_processing = false;
    m_currentJobId.clear();
    scheduleNotify();
    // Deferred so a processor's finished() emission unwinds first
    kickQueue();
}

void PipelineScheduler::kickQueue() {
    QTimer::singleShot(0, this, &PipelineScheduler::processQueue);
}

void PipelineScheduler::scheduleNotify() {
    // Start only when idle, so a steady stream of updates cannot postpone it forever
    if (!m_notifyTimer->isActive()) m_notifyTimer->start();
}

bool PipelineScheduler::cancel(const QString& jobId) {
    std::optional<Job> job = m_queue->find(jobId);
    if (!job) {
        qWarning() << "[scheduler] Cannot cancel" << jobId << "- not found";
        return false;
    }

    qInfo() << "[scheduler] Cancel requested for" << jobId << "status:" << jobStatusName(job->status);
    switch (job->status) {
    case JobStatus::Queued:
    case JobStatus::Downloading:
        m_download->cancel(jobId, JobStatus::Cancelled);
        break;
    case JobStatus::Extracting:
        m_extraction->cancel(jobId, JobStatus::Cancelled);
        break;
    default:
        qWarning() << "[scheduler] Cannot cancel" << jobId << "- not in a cancellable state";
        return false;
    }
    scheduleNotify();
    return true;
}

bool PipelineScheduler::retry(const QString& jobId) {
    std::optional<Job> job = m_queue->find(jobId);
    if (!job || (job->status != JobStatus::Cancelled && job->status != JobStatus::Error)) {
        qWarning() << "[scheduler] Cannot retry" << jobId << "- status:"
                   << (job ? jobStatusName(job->status) : QString("not found"));
        return false;
    }

    qInfo() << "[scheduler] Retrying" << jobId;
    if (m_download->isActive(jobId)) {
        qWarning() << "[scheduler] Retrying" << jobId << "with a live transfer - stopping it first";
        m_download->cancel(jobId, JobStatus::Error, "Cancelled before retry");
    }
    if (m_extraction->isActive(jobId)) {
        qWarning() << "[scheduler] Retrying" << jobId << "with a live extraction - stopping it first";
        m_extraction->cancel(jobId, JobStatus::Error, "Cancelled before retry");
    }

    JobUpdate reset;
    reset.status = JobStatus::Queued;
    reset.progress = 0;
    reset.extractProgress = -1;
    reset.error = QString();
    reset.errorKind = JobErrorKind::None;
    reset.pid = 0;
    reset.speed = QString();
    reset.eta = QString();
    if (!m_queue->update(jobId, reset)) return false;

    scheduleNotify();
    if (m_autoStart) kickQueue();
    return true;
}

bool PipelineScheduler::remove(const QString& jobId) {
    std::optional<Job> job = m_queue->find(jobId);
    if (!job) return false;

    switch (job->status) {
    case JobStatus::Downloading:
        m_download->cancel(jobId, JobStatus::Cancelled);
        break;
    case JobStatus::Extracting:
        m_extraction->cancel(jobId, JobStatus::Cancelled);
        break;
    case JobStatus::Installing:
        qWarning() << "[scheduler] Cannot remove" << jobId << "while it is installing";
        return false;
    default:
        if (!m_queue->remove(jobId)) return false;
        qInfo() << "[scheduler] Removed" << jobId << "from queue";
        break;
    }
    scheduleNotify();
    return true;
}

bool PipelineScheduler::deleteFiles(const QString& jobId) {
    std::optional<Job> job = m_queue->find(jobId);
    if (!job) return false;

    if (job->status == JobStatus::Installing) {
        qWarning() << "[scheduler] Cannot delete files of" << jobId << "while it is installing";
        return false;
    }
    if (job->status == JobStatus::Downloading || m_download->isActive(jobId)) {
        m_download->cancel(jobId, JobStatus::Cancelled);
    }
    if (job->status == JobStatus::Extracting || m_extraction->isActive(jobId)) {
        m_extraction->cancel(jobId, JobStatus::Cancelled);
    }

    QString path = job->localPath.isEmpty()
        ? QDir(m_download->downloadsDir()).filePath(jobId) : job->localPath;
    if (QFileInfo::exists(path)) {
        qInfo() << "[scheduler] Deleting files of" << jobId << "at" << path;
        if (!QDir(path).removeRecursively()) {
            qCritical() << "[scheduler] Failed to delete" << path;
            JobUpdate update;
            update.error = truncateError("Failed to delete files at " + path);
            m_queue->update(jobId, update);
            scheduleNotify();
            return false;
        }
    } else {
        qInfo() << "[scheduler] Files of" << jobId << "already gone:" << path;
    }

    m_queue->remove(jobId);
    scheduleNotify();
    return true;
}

bool PipelineScheduler::install(const QString& jobId, const QString& deviceId) {
    std::optional<Job> job = m_queue->find(jobId);
    if (!job) {
        qWarning() << "[scheduler] Cannot install" << jobId << "- not found";
        return false;
    }

    const QVector<Job> jobs = m_queue->jobs();
    bool slotBusy = m_processing || m_installing
        || std::any_of(jobs.cbegin(), jobs.cend(), [](const Job& j) { return j.isActive(); });
    if (slotBusy) {
        qWarning() << "[scheduler] Cannot install" << jobId << "- another job is active";
        return false;
    }

    m_installing = true;
    bool ok = false;
    try {
        ok = m_installation->start(*job, deviceId);
    } catch (const std::exception& e) {
        qCritical() << "[scheduler] Unexpected error installing" << jobId << ":" << e.what();
        JobUpdate update;
        update.status = JobStatus::InstallError;
        update.error = truncateError(QString("Unexpected install error: ") + e.what());
        update.errorKind = JobErrorKind::UnexpectedError;
        m_queue->update(jobId, update);
    }
    m_installing = false;

    scheduleNotify();
    if (m_autoStart) kickQueue();
    return ok;
}
