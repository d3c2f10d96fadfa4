#ifndef DOWNLOADPROCESSOR_H
#define DOWNLOADPROCESSOR_H

#include <QObject>
#include <QHash>
#include <QProcess>
#include <memory>
#include <optional>
#include "job.h"
#include "collaborators.h"
#include "outputparsers/tooloutputparser.h"

class QueueManager;

struct DownloadResult {
    bool success = false;
    bool shouldExtract = false;
    std::optional<Job> finalJob;
};

// Runs one rclone transfer per job, mirror first when one is active, and
// mirrors the transfer's progress into the queue.
class DownloadProcessor : public QObject {
    Q_OBJECT
public:
    DownloadProcessor(QueueManager *queue, DependencyResolver *dependencies,
                      RemoteSourceProvider *remoteSource, MirrorProvider *mirrors,
                      SettingsProvider *settings, const QString& downloadsDir,
                      QObject *parent = nullptr);
    ~DownloadProcessor() override;

    // Asynchronous; finished() is always emitted exactly once per call.
    void start(const Job& job);
    void cancel(const QString& jobId, JobStatus finalStatus = JobStatus::Cancelled,
                const QString& error = QString(), JobErrorKind kind = JobErrorKind::None);
    bool isActive(const QString& jobId) const { return m_transfers.contains(jobId); }

    void setOutputParser(std::unique_ptr<ToolOutputParser> parser);
    QString downloadsDir() const { return m_downloadsDir; }

    static QString publicObjectName(const QString& jobId);

signals:
    void jobUpdated(const QString& jobId);
    void progressChanged(const QString& jobId, int progress, const QString& speed, const QString& eta);
    void finished(const QString& jobId, const DownloadResult& result);

private:
    struct Transfer {
        QProcess *process = nullptr;
        QMetaObject::Connection outputConnection;
        LineBuffer buffer;
        bool viaMirror = false;
        bool mirrorFailed = false;
        QString mirrorError;
        bool terminating = false;
    };

    QueueManager *m_queue;
    DependencyResolver *m_dependencies;
    RemoteSourceProvider *m_remoteSource;
    MirrorProvider *m_mirrors;
    SettingsProvider *m_settings;
    QString m_downloadsDir;
    std::unique_ptr<ToolOutputParser> m_parser;
    // Per-job ownership table: job id -> running transfer
    QHash<QString, Transfer> m_transfers;

    QStringList commonArgs() const;
    QStringList mirrorArgs(const Job& job, const MirrorProfile& mirror) const;
    QStringList publicArgs(const Job& job, const RemoteSource& source) const;

    void startPublic(const Job& job);
    void startTransfer(const Job& job, const QStringList& args, bool viaMirror);
    void handleOutput(const QString& jobId);
    void handleFinished(const QString& jobId, int exitCode, QProcess::ExitStatus exitStatus);
    void handleStartFailure(const QString& jobId, const QString& reason);
    void handleMirrorFailure(const QString& jobId, const QString& reason);
    void detachAndTerminate(Transfer& transfer);

    void fail(const QString& jobId, JobErrorKind kind, const QString& message);
    void finish(const QString& jobId, bool success, bool shouldExtract);
};

#endif
