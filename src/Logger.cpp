#include "Logger.h"

#include <QDateTime>
#include <QDebug>
#include <utility>

namespace graphscan {

namespace {

QString levelToken(QtMsgType type)
{
    switch (type) {
    case QtDebugMsg:
        return QStringLiteral("DEBUG");
    case QtWarningMsg:
        return QStringLiteral("WARNING");
    case QtCriticalMsg:
    case QtFatalMsg:
        return QStringLiteral("ERROR");
    case QtInfoMsg:
    default:
        return QStringLiteral("INFO");
    }
}

// QtMsgType is not ordered by severity (QtInfoMsg sorts after QtFatalMsg).
int severity(QtMsgType type)
{
    switch (type) {
    case QtDebugMsg:
        return 0;
    case QtInfoMsg:
        return 1;
    case QtWarningMsg:
        return 2;
    case QtCriticalMsg:
        return 3;
    case QtFatalMsg:
    default:
        return 4;
    }
}

QString prefix(QtMsgType type)
{
    return QDateTime::currentDateTime().toString("yyyy-MM-dd hh:mm:ss.zzz") +
           QStringLiteral(" [") + levelToken(type) + QStringLiteral("] ");
}

} // namespace

Logger::Sink Logger::s_sink;
QtMsgType Logger::s_minimumLevel = QtInfoMsg;
std::mutex Logger::s_mutex;

void Logger::debug(const QString &message)
{
    log(QtDebugMsg, message);
}

void Logger::info(const QString &message)
{
    log(QtInfoMsg, message);
}

void Logger::warning(const QString &message)
{
    log(QtWarningMsg, message);
}

void Logger::error(const QString &message)
{
    log(QtCriticalMsg, message);
}

void Logger::log(QtMsgType type, const QString &message)
{
    Sink sink;
    {
        std::lock_guard<std::mutex> lock(s_mutex);
        if (severity(type) < severity(s_minimumLevel)) {
            return;
        }
        sink = s_sink;
    }

    const QString text = prefix(type) + message;
    switch (type) {
    case QtDebugMsg:
        qDebug().noquote() << text;
        break;
    case QtWarningMsg:
        qWarning().noquote() << text;
        break;
    case QtCriticalMsg:
    case QtFatalMsg:
        qCritical().noquote() << text;
        break;
    case QtInfoMsg:
    default:
        qInfo().noquote() << text;
        break;
    }

    if (sink) {
        sink(type, text);
    }
}

void Logger::setSink(Sink sink)
{
    std::lock_guard<std::mutex> lock(s_mutex);
    s_sink = std::move(sink);
}

void Logger::setMinimumLevel(QtMsgType level)
{
    std::lock_guard<std::mutex> lock(s_mutex);
    s_minimumLevel = level;
}

QtMsgType Logger::minimumLevel()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return s_minimumLevel;
}

} // namespace graphscan
