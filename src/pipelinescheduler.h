#ifndef PIPELINESCHEDULER_H
#define PIPELINESCHEDULER_H

#include <QObject>
#include <QVector>
#include <QTimer>
#include "job.h"
#include "collaborators.h"
#include "downloadprocessor.h"

class QueueManager;
class ExtractionProcessor;
class InstallationProcessor;

// Drains the queue one job at a time: download, then extraction when the
// download asks for it. User actions are routed to the stage owning the job.
class PipelineScheduler : public QObject {
    Q_OBJECT
public:
    struct AddRequest {
        QString id;
        QString displayName;
        QString contentId;
    };

    PipelineScheduler(QueueManager *queue, DownloadProcessor *download,
                      ExtractionProcessor *extraction, InstallationProcessor *installation,
                      DependencyResolver *dependencies, QObject *parent = nullptr);

    // Loads the queue and recovers jobs interrupted by a previous run.
    // With autoStart, adding or retrying a job kicks the queue.
    void initialize(bool autoStart = true);

    bool add(const AddRequest& request);
    bool cancel(const QString& jobId);
    bool retry(const QString& jobId);
    bool remove(const QString& jobId);
    bool deleteFiles(const QString& jobId);
    bool install(const QString& jobId, const QString& deviceId);

    QVector<Job> queue() const;
    bool isProcessing() const { return m_processing; }
    QString currentJobId() const { return m_currentJobId; }

    void setNotifyDelay(int msec) { m_notifyTimer->setInterval(msec); }

public slots:
    void processQueue();

signals:
    void queueChanged(const QVector<Job>& jobs);
    void transferProgress(const QString& jobId, int progress, const QString& speed, const QString& eta);
    void extractionProgress(const QString& jobId, int extractProgress);
    void installProgress(const QString& jobId, int progress);
    // Nothing left to start
    void idle();

private:
    QueueManager *m_queue;
    DownloadProcessor *m_download;
    ExtractionProcessor *m_extraction;
    InstallationProcessor *m_installation;
    DependencyResolver *m_dependencies;

    bool m_initialized = false;
    bool m_autoStart = true;
    bool m_processing = false;
    bool m_installing = false;
    QString m_currentJobId;
    QTimer *m_notifyTimer;

    void onDownloadFinished(const QString& jobId, const DownloadResult& result);
    void onExtractionFinished(const QString& jobId, bool success);
    void handleUnexpected(const QString& jobId, const QString& what);
    void finishCurrent();
    void scheduleNotify();
    void kickQueue();
};

#endif
