#ifndef QT_MESSAGE_HANDLER_H
#define QT_MESSAGE_HANDLER_H

#include <QtGlobal>

namespace ProcLogCommon {
    /**
     * Route qDebug/qInfo/qWarning/qCritical output into ProcLogger under the
     * "qt" category. ProcLogger must be initialized first.
     */
    void installQtMessageHandler();

    // Restore the handler that was active before installQtMessageHandler()
    void uninstallQtMessageHandler();
}

#endif // QT_MESSAGE_HANDLER_H
