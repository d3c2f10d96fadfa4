#include "queuemanager.h"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QDebug>
#include <algorithm>

QueueManager::QueueManager(const QString& queuePath, QObject *parent)
    : QObject(parent), m_queuePath(queuePath) {
    // Coalesce bursts of progress updates into one write per second
    m_saveTimer = new QTimer(this);
    m_saveTimer->setSingleShot(true);
    m_saveTimer->setInterval(1000);
    connect(m_saveTimer, &QTimer::timeout, this, [this]() {
        saveNow();
    });
}

QueueManager::~QueueManager() {
    if (m_saveTimer->isActive()) {
        m_saveTimer->stop();
        saveNow();
    }
}

void QueueManager::setReadOnly(bool readOnly) {
    m_readOnly = readOnly;
    if (m_readOnly) m_saveTimer->stop();
}

void QueueManager::load() {
    m_jobs.clear();

    QFile file(m_queuePath);
    if (!file.exists()) {
        qInfo() << "[queue] No existing queue file, starting fresh:" << m_queuePath;
        return;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "[queue] Could not read queue file:" << m_queuePath << file.errorString();
        return;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (doc.isNull() || !doc.isArray()) {
        qWarning() << "[queue] Queue file is corrupt, starting with an empty queue:"
                   << parseError.errorString();
        return;
    }

    const QJsonArray entries = doc.array();
    int dropped = 0;
    for (const QJsonValue& value : entries) {
        Job job = Job::fromJson(value.toObject());
        if (job.id.isEmpty()) {
            dropped++;
            continue;
        }
        // The download directory was removed behind our back; nothing to resume
        if (!job.localPath.isEmpty() && !QFileInfo::exists(job.localPath)) {
            qWarning() << "[queue] Directory" << job.localPath << "for" << job.id
                       << "not found. Removing job from queue.";
            dropped++;
            continue;
        }
        if (indexOf(job.id) != -1) {
            qWarning() << "[queue] Duplicate job id in queue file:" << job.id;
            dropped++;
            continue;
        }
        m_jobs.append(job);
    }

    if (dropped > 0 && !m_readOnly) {
        qInfo() << "[queue] Saving cleaned queue after dropping" << dropped << "job(s)";
        saveNow();
    }
    qInfo() << "[queue] Loaded" << m_jobs.size() << "job(s) from" << m_queuePath;
}

bool QueueManager::saveNow() {
    m_saveTimer->stop();
    if (m_readOnly) {
        qWarning() << "[queue] Queue is read-only, not writing" << m_queuePath;
        return false;
    }

    QJsonArray entries;
    for (const Job& job : m_jobs) {
        entries.append(job.toJson());
    }

    QDir().mkpath(QFileInfo(m_queuePath).absolutePath());
    QSaveFile file(m_queuePath);
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "[queue] Failed to open queue file for writing:" << file.errorString();
        return false;
    }
    file.write(QJsonDocument(entries).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        qWarning() << "[queue] Failed to save queue:" << file.errorString();
        return false;
    }
    emit saved();
    return true;
}

int QueueManager::indexOf(const QString& id) const {
    for (int i = 0; i < m_jobs.size(); i++) {
        if (m_jobs[i].id == id) return i;
    }
    return -1;
}

std::optional<Job> QueueManager::find(const QString& id) const {
    int index = indexOf(id);
    if (index == -1) return std::nullopt;
    return m_jobs[index];
}

std::optional<Job> QueueManager::findNextQueued() const {
    for (const Job& job : m_jobs) {
        if (job.status == JobStatus::Queued) return job;
    }
    return std::nullopt;
}

void QueueManager::add(const Job& job) {
    if (indexOf(job.id) != -1) {
        qWarning() << "[queue] Refusing to add duplicate job:" << job.id;
        return;
    }
    Job entry = job;
    entry.progress = qBound(0, entry.progress, 100);
    if (entry.hasExtractProgress())
        entry.extractProgress = qBound(0, entry.extractProgress, 100);
    m_jobs.append(entry);
    scheduleSave();
}

bool QueueManager::remove(const QString& id) {
    int index = indexOf(id);
    if (index == -1) return false;
    m_jobs.removeAt(index);
    scheduleSave();
    return true;
}

bool QueueManager::removeWhere(const std::function<bool(const Job&)>& predicate) {
    int before = m_jobs.size();
    m_jobs.erase(std::remove_if(m_jobs.begin(), m_jobs.end(), predicate), m_jobs.end());
    bool removed = m_jobs.size() < before;
    if (removed) scheduleSave();
    return removed;
}

bool QueueManager::update(const QString& id, const JobUpdate& changes) {
    int index = indexOf(id);
    if (index == -1) return false;
    applyUpdate(m_jobs[index], changes);
    scheduleSave();
    return true;
}

int QueueManager::updateWhere(const std::function<bool(const Job&)>& predicate,
                              const JobUpdate& changes) {
    int changed = 0;
    for (Job& job : m_jobs) {
        if (predicate(job)) {
            applyUpdate(job, changes);
            changed++;
        }
    }
    if (changed > 0) scheduleSave();
    return changed;
}

void QueueManager::applyUpdate(Job& job, const JobUpdate& changes) {
    bool statusChanged = false;
    if (changes.status) {
        if (isTransitionAllowed(job.status, *changes.status)) {
            statusChanged = job.status != *changes.status;
            job.status = *changes.status;
        } else {
            qWarning() << "[queue] Rejected status change for" << job.id << ":"
                       << jobStatusName(job.status) << "->" << jobStatusName(*changes.status);
        }
    }

    if (changes.progress) job.progress = qBound(0, *changes.progress, 100);
    if (changes.speed) job.speed = *changes.speed;
    if (changes.eta) job.eta = *changes.eta;
    if (changes.localPath) job.localPath = *changes.localPath;
    if (changes.pid) job.pid = qMax<qint64>(0, *changes.pid);
    if (changes.error) job.error = *changes.error;
    if (changes.errorKind) job.errorKind = *changes.errorKind;

    if (changes.extractProgress) {
        job.extractProgress = *changes.extractProgress < 0
            ? -1 : qBound(0, *changes.extractProgress, 100);
    }

    // Only Extracting and Completed carry an extraction percentage
    if (job.status != JobStatus::Extracting && job.status != JobStatus::Completed)
        job.extractProgress = -1;

    if (!job.isActive()) job.pid = 0;

    if (statusChanged && job.status == JobStatus::Queued) {
        job.error.clear();
        job.errorKind = JobErrorKind::None;
    }
}

void QueueManager::scheduleSave() {
    if (m_readOnly) return;
    if (!m_saveTimer->isActive()) m_saveTimer->start();
}
