#ifndef TOOLLOCATOR_H
#define TOOLLOCATOR_H

#include <QString>
#include <QStringList>
#include "../collaborators.h"

// Finds the external command-line tools on PATH or in the usual install
// locations. A path pinned with a setter always wins.
class ToolLocator : public DependencyResolver {
public:
    QString transferBinaryPath() const override;
    QString archiveBinaryPath() const override;
    QString deviceBridgeBinaryPath() const;

    bool isTransferReady() const override { return isExecutable(transferBinaryPath()); }
    bool isArchiveReady() const override { return isExecutable(archiveBinaryPath()); }
    bool isDeviceBridgeReady() const { return isExecutable(deviceBridgeBinaryPath()); }

    void setTransferBinary(const QString& path) { m_transferBinary = path; }
    void setArchiveBinary(const QString& path) { m_archiveBinary = path; }
    void setDeviceBridgeBinary(const QString& path) { m_deviceBridgeBinary = path; }

    static QString findTool(const QStringList& names);
    static bool isExecutable(const QString& path);

private:
    QString m_transferBinary;
    QString m_archiveBinary;
    QString m_deviceBridgeBinary;
};

#endif
