#include "tooloutputparser.h"
#include <QRegularExpression>

namespace {
bool isSeparator(char c) {
    return c == '\r' || c == '\n' || c == '\b';
}
}

QStringList LineBuffer::append(const QByteArray& chunk) {
    m_pending += chunk;

    // Decode only complete lines; a multi-byte character may straddle two reads
    int lastSeparator = -1;
    for (int i = m_pending.size() - 1; i >= 0; --i) {
        if (isSeparator(m_pending.at(i))) {
            lastSeparator = i;
            break;
        }
    }
    if (lastSeparator < 0) return QStringList();

    const QString complete = QString::fromUtf8(m_pending.constData(), lastSeparator);
    m_pending.remove(0, lastSeparator + 1);

    static const QRegularExpression separators("[\\r\\n\\x08]+");
    QStringList lines;
    for (const QString& part : complete.split(separators)) {
        QString trimmed = part.trimmed();
        if (trimmed.isEmpty()) continue;
        lines << trimmed;
        m_recent << trimmed;
    }
    while (m_recent.size() > 20) m_recent.removeFirst();
    return lines;
}

QString LineBuffer::takeRemainder() {
    QString rest = QString::fromUtf8(m_pending).trimmed();
    m_pending.clear();
    if (!rest.isEmpty()) m_recent << rest;
    return rest;
}

QString LineBuffer::tail(int lines) const {
    return m_recent.mid(qMax(0, m_recent.size() - lines)).join('\n');
}
