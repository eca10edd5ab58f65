#pragma once

#include <QtGlobal>
#include <QString>
#include <functional>
#include <mutex>

namespace graphscan {

class Logger {
public:
    static void debug(const QString &message);
    static void info(const QString &message);
    static void warning(const QString &message);
    static void error(const QString &message);

    using Sink = std::function<void(QtMsgType, const QString &)>;
    static void setSink(Sink sink);

    // Messages below this level are dropped before formatting.
    static void setMinimumLevel(QtMsgType level);
    static QtMsgType minimumLevel();

private:
    static void log(QtMsgType type, const QString &message);

    static Sink s_sink;
    static QtMsgType s_minimumLevel;
    static std::mutex s_mutex;
};

} // namespace graphscan
