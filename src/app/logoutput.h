#ifndef LOGOUTPUT_H
#define LOGOUTPUT_H

#include <QObject>
#include <QString>

/**
 * @brief Console log sink for the command line front end
 *
 * Writes "[DEBUG]", "[INFO]", "[WARNING]" and "[ERROR]" prefixed lines to
 * stderr. Also installed as the Qt message handler so that qDebug() and
 * friends from the engine end up in the same stream; debug lines are only
 * shown in verbose mode.
 */
class LogOutput : public QObject
{
    Q_OBJECT

public:
    explicit LogOutput(QObject *parent = nullptr);

    /**
     * @brief Route Qt messages through this format
     */
    static void install(bool verbose);

    static bool isVerbose();

    /**
     * @brief Format one line the way it is written to stderr
     */
    static QString formatLine(QtMsgType type, const QString &message);

public slots:
    void logDebug(const QString &message);
    void logInfo(const QString &message);
    void logWarning(const QString &message);
    void logError(const QString &message);
};

#endif // LOGOUTPUT_H
