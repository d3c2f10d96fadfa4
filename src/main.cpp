#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QLockFile>
#include <QTextStream>
#include <QTimer>
#include <QDebug>
#include <cstdio>
#include "job.h"
#include "queuemanager.h"
#include "downloadprocessor.h"
#include "extractionprocessor.h"
#include "installationprocessor.h"
#include "pipelinescheduler.h"
#include "queuecontrol.h"
#include "providers/toollocator.h"
#include "providers/jsonsettings.h"
#include "providers/jsonmirrorprovider.h"
#include "providers/remotesourceconfig.h"
#include "providers/adbdevice.h"

namespace {
QFile *g_logFile = nullptr;
bool g_verbose = false;

void messageHandler(QtMsgType type, const QMessageLogContext&, const QString& msg) {
    const char *level = "DEBUG";
    switch (type) {
    case QtDebugMsg: level = "DEBUG"; break;
    case QtInfoMsg: level = "INFO"; break;
    case QtWarningMsg: level = "WARN"; break;
    case QtCriticalMsg: level = "ERROR"; break;
    case QtFatalMsg: level = "FATAL"; break;
    }

    if (g_logFile && g_logFile->isOpen()) {
        QString line = QDateTime::currentDateTime().toString("yyyy-MM-dd hh:mm:ss.zzz") +
                       "  " + level + "  " + msg + "\n";
        g_logFile->write(line.toUtf8());
        g_logFile->flush();
    }

    if (type != QtDebugMsg || g_verbose) {
        fprintf(stderr, "%s\n", qPrintable(msg));
    }
}

void printQueue(const QVector<Job>& jobs) {
    QTextStream out(stdout);
    if (jobs.isEmpty()) {
        out << "Queue is empty\n";
        return;
    }
    for (const Job& job : jobs) {
        out << job.id << "  " << jobStatusName(job.status) << "  " << job.progress << "%";
        if (job.hasExtractProgress()) out << "  extract " << job.extractProgress << "%";
        if (!job.error.isEmpty()) out << "  error: " << job.error.section('\n', 0, 0);
        out << "\n";
    }
}
}

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    app.setApplicationName("questlift");
    app.setApplicationVersion("0.1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Download, extract and install content on a headset");
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption verboseOption("verbose", "Print debug output.");
    QCommandLineOption deviceOption("device", "Device serial for install.", "serial");
    QCommandLineOption configDirOption("config-dir", "Configuration directory.", "dir",
                                       JsonSettings::configDir());
    parser.addOption(verboseOption);
    parser.addOption(deviceOption);
    parser.addOption(configDirOption);
    parser.addPositionalArgument("command",
        "list | add <id> <displayName> <contentId> | run | cancel <id> | retry <id> | "
        "remove <id> | delete-files <id> | install <id> | refresh-source");
    parser.process(app);

    g_verbose = parser.isSet(verboseOption);
    QDir().mkpath(JsonSettings::dataDir());
    QFile logFile(JsonSettings::dataDir() + "/questlift.log");
    if (logFile.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        g_logFile = &logFile;
    }
    qInstallMessageHandler(messageHandler);

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        parser.showHelp(1);
    }
    const QString command = args.first();

    QString configDir = parser.value(configDirOption);
    JsonSettings settings(configDir + "/settings.json");
    settings.load();
    JsonMirrorProvider mirrors(configDir + "/mirrors.json");
    mirrors.load();
    RemoteSourceConfig remoteSource(configDir + "/remote-source.json");
    remoteSource.load();
    ToolLocator tools;
    AdbDevice device(tools.deviceBridgeBinaryPath());

    if (command == "refresh-source") {
        int exitCode = 1;
        QObject::connect(&remoteSource, &RemoteSourceConfig::refreshed,
                         [&](bool success, const QString& error) {
            if (!success) qCritical() << "Refresh failed:" << error;
            exitCode = success ? 0 : 1;
            app.quit();
        });
        QUrl url(settings.remoteConfigUrl());
        QTimer::singleShot(0, &remoteSource, [&]() { remoteSource.refresh(url); });
        app.exec();
        return exitCode;
    }

    // One process owns the queue file; others read it or hand it requests
    const QString queueFile = settings.queueFile();
    QDir().mkpath(QFileInfo(queueFile).absolutePath());
    QLockFile queueLock(queueFile + ".lock");
    queueLock.setStaleLockTime(0);
    const bool owner = queueLock.tryLock(0);
    if (!owner && queueLock.error() != QLockFile::LockFailedError) {
        qCritical() << "Could not lock the download queue" << queueFile
                    << "(error" << int(queueLock.error()) << ")";
        return 1;
    }
    qint64 ownerPid = 0;
    if (!owner) {
        QString host, appName;
        queueLock.getLockInfo(&ownerPid, &host, &appName);
    }

    QueueManager queue(queueFile);
    queue.setReadOnly(!owner);
    DownloadProcessor download(&queue, &tools, &remoteSource, &mirrors, &settings,
                               settings.downloadsDir());
    ExtractionProcessor extraction(&queue, &tools, &remoteSource);
    InstallationProcessor installation(&queue, &device);
    PipelineScheduler scheduler(&queue, &download, &extraction, &installation, &tools);
    QueueControl control(queueFile + ".requests", &scheduler);

    auto requireId = [&]() -> QString {
        if (args.size() < 2) {
            qCritical() << "Missing job id for" << command;
            return QString();
        }
        return args.at(1);
    };

    if (!owner) {
        qInfo() << "[main] Queue is in use by PID" << ownerPid;
        bool ok = false;
        if (command == "list") {
            queue.load();
            printQueue(queue.jobs());
            ok = true;
        } else if (QueueControl::isKnownAction(command)) {
            QString error;
            if (args.size() < (command == "add" ? 4 : 2)) {
                qCritical() << "Missing arguments for" << command;
            } else if (!QueueControl::submit(control.requestDir(), {command, args.mid(1)}, &error)) {
                qCritical() << "Could not send" << command << "request:" << error;
            } else {
                QTextStream(stdout) << command << " " << args.at(1)
                                    << " sent to the running queue processor (PID " << ownerPid << ")\n";
                ok = true;
            }
        } else if (command == "run" || command == "install") {
            qCritical() << "Another questlift process (PID" << ownerPid << ") is processing the queue;"
                        << command << "is not possible until it exits";
        } else {
            qCritical() << "Unknown command:" << command;
            parser.showHelp(1);
        }
        qInstallMessageHandler(nullptr);
        g_logFile = nullptr;
        return ok ? 0 : 1;
    }

    bool ok = false;
    if (command != "run") scheduler.initialize(false);

    if (command == "list") {
        printQueue(scheduler.queue());
        ok = true;
    } else if (command == "add") {
        if (args.size() < 4) {
            qCritical() << "Usage: add <id> <displayName> <contentId>";
        } else {
            ok = scheduler.add({args.at(1), args.at(2), args.at(3)});
        }
    } else if (command == "cancel") {
        QString id = requireId();
        ok = !id.isEmpty() && scheduler.cancel(id);
    } else if (command == "retry") {
        QString id = requireId();
        ok = !id.isEmpty() && scheduler.retry(id);
    } else if (command == "remove") {
        QString id = requireId();
        ok = !id.isEmpty() && scheduler.remove(id);
    } else if (command == "delete-files") {
        QString id = requireId();
        ok = !id.isEmpty() && scheduler.deleteFiles(id);
    } else if (command == "run") {
        if (!tools.isTransferReady()) {
            qCritical() << "rclone not found; install it or put it on PATH";
        } else {
            QObject::connect(&scheduler, &PipelineScheduler::transferProgress,
                             [](const QString& id, int progress, const QString& speed, const QString& eta) {
                qInfo().noquote() << QString("%1: %2% %3 ETA %4").arg(id).arg(progress).arg(speed, eta);
            });
            QObject::connect(&scheduler, &PipelineScheduler::extractionProgress,
                             [](const QString& id, int progress) {
                qInfo().noquote() << QString("%1: extracting %2%").arg(id).arg(progress);
            });
            QObject::connect(&scheduler, &PipelineScheduler::idle, &app, &QCoreApplication::quit);
            // Requests waiting from other invocations are applied before the first job starts
            QTimer::singleShot(0, &scheduler, [&]() {
                scheduler.initialize(false);
                control.listen();
                scheduler.processQueue();
            });
            app.exec();
            printQueue(scheduler.queue());
            ok = true;
        }
    } else if (command == "install") {
        QString id = requireId();
        QString serial = parser.value(deviceOption);
        if (serial.isEmpty()) {
            qCritical() << "install needs --device <serial>";
        } else if (!id.isEmpty()) {
            QObject::connect(&scheduler, &PipelineScheduler::installProgress,
                             [](const QString& jobId, int progress) {
                qInfo().noquote() << QString("%1: installing %2%").arg(jobId).arg(progress);
            });
            ok = scheduler.install(id, serial);
        }
    } else {
        qCritical() << "Unknown command:" << command;
        parser.showHelp(1);
    }

    if (!queue.saveNow()) {
        qCritical() << "Failed to save the download queue";
        ok = false;
    }
    qInstallMessageHandler(nullptr);
    g_logFile = nullptr;
    return ok ? 0 : 1;
}
