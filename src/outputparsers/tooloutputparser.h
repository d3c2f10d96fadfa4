#ifndef TOOLOUTPUTPARSER_H
#define TOOLOUTPUTPARSER_H

#include <QByteArray>
#include <QString>
#include <QStringList>
#include "../job.h"

struct ParsedLine {
    int percent = -1;           // -1 when the line carries no percentage
    QString speed;
    QString eta;
    JobErrorKind failure = JobErrorKind::None;

    bool hasProgress() const { return percent >= 0; }
    bool isFailure() const { return failure != JobErrorKind::None; }
};

// Scrapes one line of a tool's human-readable output. Orchestration code only
// sees ParsedLine, so a parser can be swapped per tool version.
class ToolOutputParser {
public:
    virtual ~ToolOutputParser() = default;
    virtual QString toolName() const = 0;
    virtual ParsedLine parseLine(const QString& line) const = 0;
};

// Accumulates raw output chunks and hands back complete lines. Progress bars
// redraw with '\r' or backspaces, so those terminate a line as well.
class LineBuffer {
public:
    QStringList append(const QByteArray& chunk);
    QString takeRemainder();
    // Last few non-empty lines seen, for error excerpts
    QString tail(int lines = 5) const;

private:
    QByteArray m_pending;    // bytes after the last separator
    QStringList m_recent;
};

#endif
