#ifndef QUEUEMANAGER_H
#define QUEUEMANAGER_H

#include <QObject>
#include <QVector>
#include <QTimer>
#include <functional>
#include <optional>
#include "job.h"

// In-memory job queue backed by a JSON file. Every mutation schedules a
// coalesced write-back; reads never touch the disk.
class QueueManager : public QObject {
    Q_OBJECT
public:
    explicit QueueManager(const QString& queuePath, QObject *parent = nullptr);
    ~QueueManager() override;

    void load();
    bool saveNow();

    QVector<Job> jobs() const { return m_jobs; }
    std::optional<Job> find(const QString& id) const;
    std::optional<Job> findNextQueued() const;

    void add(const Job& job);
    bool remove(const QString& id);
    bool removeWhere(const std::function<bool(const Job&)>& predicate);
    bool update(const QString& id, const JobUpdate& changes);
    int updateWhere(const std::function<bool(const Job&)>& predicate, const JobUpdate& changes);

    QString queuePath() const { return m_queuePath; }
    void setSaveDelay(int msec) { m_saveTimer->setInterval(msec); }
    bool hasPendingSave() const { return m_saveTimer->isActive(); }

    // A read-only queue observes a file owned by another process and never writes it
    void setReadOnly(bool readOnly);
    bool isReadOnly() const { return m_readOnly; }

signals:
    void saved();

private:
    QString m_queuePath;
    QVector<Job> m_jobs;
    QTimer *m_saveTimer;
    bool m_readOnly = false;

    int indexOf(const QString& id) const;
    void applyUpdate(Job& job, const JobUpdate& changes);
    void scheduleSave();
};

#endif
