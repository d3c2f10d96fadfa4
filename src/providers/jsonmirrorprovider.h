#ifndef JSONMIRRORPROVIDER_H
#define JSONMIRRORPROVIDER_H

#include <QString>
#include <QVector>
#include "../collaborators.h"

// Mirror profiles from ~/.config/questlift/mirrors.json. The first entry
// flagged active is the active mirror.
class JsonMirrorProvider : public MirrorProvider {
public:
    explicit JsonMirrorProvider(const QString& path);

    bool load();
    std::optional<MirrorProfile> activeMirror() const override;
    QVector<MirrorProfile> mirrors() const { return m_mirrors; }

private:
    QString m_path;
    QVector<MirrorProfile> m_mirrors;
    int m_activeIndex = -1;
};

#endif
