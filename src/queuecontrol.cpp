#include "queuecontrol.h"
#include "pipelinescheduler.h"
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileSystemWatcher>
#include <QSaveFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QUuid>
#include <QDebug>

QueueControl::QueueControl(const QString& requestDir, PipelineScheduler *scheduler, QObject *parent)
    : QObject(parent), m_requestDir(requestDir), m_scheduler(scheduler) {}

bool QueueControl::isKnownAction(const QString& action) {
    static const QStringList actions = {"cancel", "retry", "remove", "delete-files", "add"};
    return actions.contains(action);
}

bool QueueControl::submit(const QString& requestDir, const Request& request, QString *error) {
    if (!isKnownAction(request.action) || request.args.isEmpty()) {
        if (error) *error = "Unsupported request: " + request.action;
        return false;
    }
    if (!QDir().mkpath(requestDir)) {
        if (error) *error = "Could not create request directory " + requestDir;
        return false;
    }

    QJsonObject root;
    root["action"] = request.action;
    root["args"] = QJsonArray::fromStringList(request.args);
    root["requestedAt"] = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);

    // Names sort in submission order
    static int sequence = 0;
    QString name = QString("%1-%2-%3.json")
        .arg(QDateTime::currentMSecsSinceEpoch(), 13, 10, QChar('0'))
        .arg(sequence++, 6, 10, QChar('0'))
        .arg(QUuid::createUuid().toString(QUuid::WithoutBraces));
    QSaveFile file(QDir(requestDir).filePath(name));
    if (!file.open(QIODevice::WriteOnly)) {
        if (error) *error = file.errorString();
        return false;
    }
    file.write(QJsonDocument(root).toJson(QJsonDocument::Compact));
    if (!file.commit()) {
        if (error) *error = file.errorString();
        return false;
    }
    qInfo() << "[control] Submitted" << request.action << request.args.first();
    return true;
}

bool QueueControl::listen() {
    if (!QDir().mkpath(m_requestDir)) {
        qWarning() << "[control] Could not create request directory" << m_requestDir;
        return false;
    }

    if (!m_watcher) {
        m_watcher = new QFileSystemWatcher(this);
        connect(m_watcher, &QFileSystemWatcher::directoryChanged, this, [this]() {
            processPending();
        });
    }
    if (!m_watcher->directories().contains(m_requestDir) && !m_watcher->addPath(m_requestDir)) {
        qWarning() << "[control] Could not watch" << m_requestDir;
        return false;
    }

    qInfo() << "[control] Listening for queue requests in" << m_requestDir;
    processPending();
    return true;
}

int QueueControl::processPending() {
    QDir dir(m_requestDir);
    const QStringList names = dir.entryList({"*.json"}, QDir::Files, QDir::Name);

    int handled = 0;
    for (const QString& name : names) {
        QFile file(dir.filePath(name));
        if (!file.open(QIODevice::ReadOnly)) {
            qWarning() << "[control] Could not read request" << name << file.errorString();
            continue;
        }
        QByteArray data = file.readAll();
        file.close();
        // Consumed before dispatch so a request is never applied twice
        if (!file.remove()) {
            qWarning() << "[control] Could not remove request" << name << file.errorString();
        }

        QJsonDocument doc = QJsonDocument::fromJson(data);
        if (!doc.isObject()) {
            qWarning() << "[control] Ignoring malformed request" << name;
            continue;
        }

        QJsonObject root = doc.object();
        Request request;
        request.action = root.value("action").toString();
        for (const QJsonValue& value : root.value("args").toArray()) {
            request.args << value.toString();
        }

        if (!isKnownAction(request.action) || request.args.isEmpty()) {
            qWarning() << "[control] Ignoring unsupported request" << request.action;
            continue;
        }

        bool ok = dispatch(request);
        qInfo() << "[control]" << request.action << request.args.first() << (ok ? "applied" : "refused");
        emit requestHandled(request.action, request.args.first(), ok);
        handled++;
    }
    return handled;
}

bool QueueControl::dispatch(const Request& request) {
    const QString& id = request.args.first();
    if (request.action == "cancel") return m_scheduler->cancel(id);
    if (request.action == "retry") return m_scheduler->retry(id);
    if (request.action == "remove") return m_scheduler->remove(id);
    if (request.action == "delete-files") return m_scheduler->deleteFiles(id);
    if (request.action == "add") {
        if (request.args.size() < 3) {
            qWarning() << "[control] add request for" << id << "is missing displayName or contentId";
            return false;
        }
        return m_scheduler->add({id, request.args.at(1), request.args.at(2)});
    }
    return false;
}
