#ifndef QUEUECONTROL_H
#define QUEUECONTROL_H

#include <QObject>
#include <QStringList>

class QFileSystemWatcher;
class PipelineScheduler;

// Hands queue actions from other invocations to the process that owns the
// queue. Each request is a small JSON file dropped into a shared directory;
// the owner watches the directory, applies requests in arrival order and
// deletes them.
class QueueControl : public QObject {
    Q_OBJECT
public:
    struct Request {
        QString action;     // cancel | retry | remove | delete-files | add
        QStringList args;   // job id first; add also takes displayName and contentId
    };

    QueueControl(const QString& requestDir, PipelineScheduler *scheduler, QObject *parent = nullptr);

    static bool submit(const QString& requestDir, const Request& request, QString *error = nullptr);
    static bool isKnownAction(const QString& action);

    // Starts watching and applies requests already waiting
    bool listen();
    int processPending();

    QString requestDir() const { return m_requestDir; }

signals:
    void requestHandled(const QString& action, const QString& jobId, bool success);

private:
    QString m_requestDir;
    PipelineScheduler *m_scheduler;
    QFileSystemWatcher *m_watcher = nullptr;

    bool dispatch(const Request& request);
};

#endif
