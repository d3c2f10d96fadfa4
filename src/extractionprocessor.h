#ifndef EXTRACTIONPROCESSOR_H
#define EXTRACTIONPROCESSOR_H

#include <QObject>
#include <QHash>
#include <QProcess>
#include <memory>
#include "job.h"
#include "collaborators.h"
#include "outputparsers/tooloutputparser.h"

class QueueManager;

// Unpacks a downloaded multi-part 7z archive in place and tidies the result
// (part cleanup, wrapper directory flattening, nested archives).
class ExtractionProcessor : public QObject {
    Q_OBJECT
public:
    ExtractionProcessor(QueueManager *queue, DependencyResolver *dependencies,
                        RemoteSourceProvider *remoteSource, QObject *parent = nullptr);
    ~ExtractionProcessor() override;

    // Asynchronous; finished() is always emitted exactly once per call.
    void start(const Job& job);
    void cancel(const QString& jobId, JobStatus finalStatus = JobStatus::Cancelled,
                const QString& error = QString(), JobErrorKind kind = JobErrorKind::None);
    bool isActive(const QString& jobId) const { return m_extractions.contains(jobId); }

    void setOutputParser(std::unique_ptr<ToolOutputParser> parser);
    // Time between the termination request and the kill on cancel
    void setGracePeriod(int msec) { m_gracePeriod = msec; }
    int gracePeriod() const { return m_gracePeriod; }

    static QString findFirstArchivePart(const QString& dir);
    static QStringList archiveParts(const QString& dir, const QString& firstPart);
    static QByteArray decodePassword(const QString& encoded);

signals:
    void jobUpdated(const QString& jobId);
    void progressChanged(const QString& jobId, int extractProgress);
    void finished(const QString& jobId, bool success);

private:
    struct Extraction {
        QProcess *process = nullptr;
        QMetaObject::Connection outputConnection;
        LineBuffer buffer;
        QString firstPart;
        QByteArray password;
        bool terminating = false;

        // Nested archive passes run after the main archive, one 7z at a time
        bool nested = false;
        QString contentDir;
        QString currentArchive;
        QStringList pendingNested;
        QStringList failedNested;
        int nestedPass = 0;
        bool extractedInPass = false;
    };

    QueueManager *m_queue;
    DependencyResolver *m_dependencies;
    RemoteSourceProvider *m_remoteSource;
    std::unique_ptr<ToolOutputParser> m_parser;
    QHash<QString, Extraction> m_extractions;
    int m_gracePeriod = 5000;

    void handleOutput(const QString& jobId);
    void handleFinished(const QString& jobId, int exitCode, QProcess::ExitStatus exitStatus);
    void handleStartFailure(const QString& jobId, const QString& reason);
    void requestStop(Extraction& extraction);

    void removeArchiveParts(const QString& dir, const QString& firstPart);
    void flattenWrapperDirectory(const QString& dir, const QString& jobId);
    void continueNested(const QString& jobId);
    void startNested(const QString& jobId, const QString& archive);
    void completeExtraction(const QString& jobId);

    void fail(const QString& jobId, JobErrorKind kind, const QString& message);
};

#endif
