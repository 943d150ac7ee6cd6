#include "qt_message_handler.h"
#include "proclogger.h"
#include <QString>

namespace ProcLogCommon {

static QtMessageHandler originalMessageHandler = nullptr;
static bool handlerInstalled = false;

static void unifiedMessageHandler(QtMsgType type, const QMessageLogContext &context, const QString &msg)
{
    if (!ProcLogger::isInitialized()) {
        if (originalMessageHandler) {
            originalMessageHandler(type, context, msg);
        }
        return;
    }

    switch (type) {
    case QtDebugMsg:
        ProcLogger::instance().log(LogLevel::Debug, "qt", msg);
        break;
    case QtInfoMsg:
        ProcLogger::instance().log(LogLevel::Info, "qt", msg);
        break;
    case QtWarningMsg:
        ProcLogger::instance().log(LogLevel::Warning, "qt", msg);
        break;
    case QtCriticalMsg:
        ProcLogger::instance().log(LogLevel::Error, "qt", msg);
        break;
    case QtFatalMsg:
        ProcLogger::instance().log(LogLevel::Critical, "qt", msg);
        ProcLogger::instance().flush();
        break;
    }
}

void installQtMessageHandler()
{
    if (handlerInstalled) {
        return;
    }
    originalMessageHandler = qInstallMessageHandler(unifiedMessageHandler);
    handlerInstalled = true;
}

void uninstallQtMessageHandler()
{
    if (!handlerInstalled) {
        return;
    }
    qInstallMessageHandler(originalMessageHandler);
    originalMessageHandler = nullptr;
    handlerInstalled = false;
}

} // namespace ProcLogCommon
