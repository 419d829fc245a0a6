#include "logoutput.h"

#include <QTextStream>

#include <cstdio>

namespace {

bool s_verbose = false;

void writeLine(QtMsgType type, const QString &message)
{
    if (type == QtDebugMsg && !s_verbose) return;

    QTextStream err(stderr);
    err << LogOutput::formatLine(type, message) << Qt::endl;
}

void messageHandler(QtMsgType type, const QMessageLogContext &, const QString &message)
{
    writeLine(type, message);
}

} // namespace

LogOutput::LogOutput(QObject *parent)
    : QObject(parent)
{
}

void LogOutput::install(bool verbose)
{
    s_verbose = verbose;
    qInstallMessageHandler(messageHandler);
}

bool LogOutput::isVerbose()
{
    return s_verbose;
}

QString LogOutput::formatLine(QtMsgType type, const QString &message)
{
    switch (type) {
    case QtDebugMsg:
        return QString("[DEBUG] %1").arg(message);
    case QtInfoMsg:
        return QString("[INFO] %1").arg(message);
    case QtWarningMsg:
        return QString("[WARNING] %1").arg(message);
    case QtCriticalMsg:
    case QtFatalMsg:
        return QString("[ERROR] %1").arg(message);
    }
    return message;
}

void LogOutput::logDebug(const QString &message)
{
    writeLine(QtDebugMsg, message);
}

void LogOutput::logInfo(const QString &message)
{
    writeLine(QtInfoMsg, message);
}

void LogOutput::logWarning(const QString &message)
{
    writeLine(QtWarningMsg, message);
}

void LogOutput::logError(const QString &message)
{
    writeLine(QtCriticalMsg, message);
}
