#include "text_normalizer.h"
#include <QRegularExpression>

namespace ProcLog {

namespace {

const QRegularExpression& ansiPattern()
{
    // CSI: ESC [ params intermediates final
    // OSC: ESC ] ... terminated by BEL or ESC backslash
    // nF:  ESC intermediates final, e.g. ESC ( B from tput sgr0
    // Fe:  ESC followed by a single character in @-Z, \, -, _
    static const QRegularExpression re(
        QStringLiteral("\\x1B(?:\\[[0-?]*[ -/]*[@-~]"
                       "|\\][^\\x07\\x1B]*(?:\\x07|\\x1B\\\\)"
                       "|[ -/]+[0-~]"
                       "|[@-Z\\\\-_])"));
    return re;
}

} // namespace

QString normalizeLineEndings(const QString& text)
{
    if (!text.contains(QLatin1Char('\r'))) {
        return text;
    }

    QString result = text;
    result.replace(QLatin1String("\r\n"), QLatin1String("\n"));
    result.replace(QLatin1Char('\r'), QLatin1Char('\n'));
    return result;
}

QString stripAnsi(const QString& text)
{
    if (!text.contains(QChar(0x1B))) {
        return text;
    }

    QString result = text;
    result.remove(ansiPattern());
    return result;
}

bool containsAnsi(const QString& text)
{
    return text.contains(QChar(0x1B)) && ansiPattern().match(text).hasMatch();
}

QStringList splitLines(const QString& text)
{
    if (text.isEmpty()) {
        return QStringList();
    }

    QStringList lines = text.split(QLatin1Char('\n'));
    if (text.endsWith(QLatin1Char('\n'))) {
        lines.removeLast();
    }
    return lines;
}

QString decodeLossy(const QByteArray& bytes)
{
    return QString::fromUtf8(bytes);
}

} // namespace ProcLog
