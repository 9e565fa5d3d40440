#include "logger_sink.hpp"

#include "common/logger.hpp"

#include <QtCore/QString>

namespace han {

using common::Logger;
using common::LogLevel;

void LoggerSink::onDiagnostic(const Diagnostic &diagnostic) {
    const QString reason = QString::fromLatin1(to_string(diagnostic.error));
    switch (diagnostic.event) {
        case DiagnosticEvent::FrameAccepted:
            ++accepted_;
            Logger::instance().log(LogLevel::Debug, QStringLiteral("han.frame"),
                                   QStringLiteral("frame accepted (%1 bytes)").arg(diagnostic.frameSize));
            break;
        case DiagnosticEvent::FrameRejected:
            ++rejected_;
            Logger::instance().log(LogLevel::Warn, QStringLiteral("han.frame"),
                                   QStringLiteral("frame rejected: %1 (%2 bytes)").arg(reason).arg(diagnostic.frameSize));
            break;
        case DiagnosticEvent::Resynchronized:
            Logger::instance().log(LogLevel::Info, QStringLiteral("han.sync"),
                                   QStringLiteral("resynchronized after %1").arg(reason));
            break;
        case DiagnosticEvent::EntryFailed:
            Logger::instance().log(LogLevel::Warn, QStringLiteral("han.apdu"),
                                   QStringLiteral("entry %1 failed: %2").arg(diagnostic.entryIndex).arg(reason));
            break;
        case DiagnosticEvent::TelegramDecodeFailed:
            ++rejected_;
            Logger::instance().log(LogLevel::Error, QStringLiteral("han.apdu"),
                                   QStringLiteral("telegram decode failed: %1").arg(reason));
            break;
    }
}

std::size_t LoggerSink::accepted() const {
    return accepted_;
}

std::size_t LoggerSink::rejected() const {
    return rejected_;
}

}  // namespace han
