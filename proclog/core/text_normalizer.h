#ifndef PROCLOG_TEXT_NORMALIZER_H
#define PROCLOG_TEXT_NORMALIZER_H

#include <QString>
#include <QStringList>
#include <QByteArray>

namespace ProcLog {

    // Convert \r\n and bare \r to \n
    QString normalizeLineEndings(const QString& text);

    // Remove ANSI escape sequences (CSI, OSC and two-character escapes).
    // Malformed sequences are left in place or dropped, never an error.
    QString stripAnsi(const QString& text);

    bool containsAnsi(const QString& text);

    // Split on \n. A terminating newline does not produce an empty last element.
    QStringList splitLines(const QString& text);

    // Best-effort UTF-8 decode, invalid sequences become U+FFFD
    QString decodeLossy(const QByteArray& bytes);
}

#endif // PROCLOG_TEXT_NORMALIZER_H
