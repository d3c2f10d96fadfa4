#ifndef INSTALLATIONPROCESSOR_H
#define INSTALLATIONPROCESSOR_H

#include <QObject>
#include <QStringList>
#include "job.h"
#include "collaborators.h"

class QueueManager;

// Installs extracted content on a device, either by running the release's
// install.txt or by the standard package + expansion data layout.
class InstallationProcessor : public QObject {
    Q_OBJECT
public:
    InstallationProcessor(QueueManager *queue, DeviceControl *device, QObject *parent = nullptr);

    // Blocks until the install finishes. The job ends Completed or InstallError.
    bool start(const Job& job, const QString& deviceId);

    static QString findInstallScript(const QString& contentDir);
    static QStringList splitCommandLine(const QString& line);
    static QString expansionDataPath(const QString& contentId);

signals:
    void jobUpdated(const QString& jobId);
    void progressChanged(const QString& jobId, int progress);

private:
    QueueManager *m_queue;
    DeviceControl *m_device;

    bool runInstallScript(const Job& job, const QString& deviceId, const QString& scriptPath,
                          QString *error);
    bool runStandardInstall(const Job& job, const QString& deviceId, QString *error);
    bool installPackage(const Job& job, const QString& deviceId, const QString& packageFile,
                        const QStringList& flags, QString *error);

    void setProgress(const QString& jobId, int progress);
    void failInstall(const QString& jobId, JobErrorKind kind, const QString& message);
};

#endif
