#pragma once

#include <chrono>
#include <iostream>

#include <QString>
#include <QStringList>
#include <QThread>
#include <QtGlobal>

namespace binfiddle::debug {

// BINFIDDLE_TRACE=1 (or any value other than 0/false/off/no) turns tracing on.
inline bool traceEnabled() {
    static const bool enabled = []() {
        if (!qEnvironmentVariableIsSet("BINFIDDLE_TRACE")) {
            return false;
        }
        const QString value = qEnvironmentVariable("BINFIDDLE_TRACE").trimmed().toLower();
        static const QStringList kOffValues = {QStringLiteral("0"), QStringLiteral("false"),
                                               QStringLiteral("off"), QStringLiteral("no")};
        return !kOffValues.contains(value);
    }();
    return enabled;
}

inline quint64 traceElapsedUs() {
    static const auto kStart = std::chrono::steady_clock::now();
    const auto now = std::chrono::steady_clock::now();
    return static_cast<quint64>(
        std::chrono::duration_cast<std::chrono::microseconds>(now - kStart).count());
}

// Trace lines go to stderr so they never mix with command output.
inline void traceLog(const QString& message) {
    if (!traceEnabled()) {
        return;
    }
    const quintptr threadId = reinterpret_cast<quintptr>(QThread::currentThreadId());
    std::cerr << "[trace +" << traceElapsedUs() << "us t=0x" << std::hex << threadId
              << std::dec << "] " << message.toStdString() << std::endl;
}

}  // namespace binfiddle::debug

#define BINFIDDLE_TRACE(MSG) ::binfiddle::debug::traceLog(MSG)
