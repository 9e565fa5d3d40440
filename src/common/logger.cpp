#include "logger.hpp"

#include <QtCore/QMutexLocker>

namespace han::common {

QString to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:
            return QStringLiteral("DEBUG");
        case LogLevel::Info:
            return QStringLiteral("INFO");
        case LogLevel::Warn:
            return QStringLiteral("WARN");
        case LogLevel::Error:
            return QStringLiteral("ERROR");
    }
    return QStringLiteral("?");
}

Logger::Logger(QObject *parent) : QObject(parent) {}

Logger &Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::log(LogLevel level, const QString &category, const QString &message) {
    const QDateTime timestamp = QDateTime::currentDateTimeUtc();
    QMutexLocker locker(&mutex_);
    if (static_cast<int>(level) < static_cast<int>(minimumLevel_)) {
        return;
    }
    emit messageLogged(level, category, message, timestamp);
}

void Logger::setMinimumLevel(LogLevel level) {
    QMutexLocker locker(&mutex_);
    minimumLevel_ = level;
}

LogLevel Logger::minimumLevel() const {
    QMutexLocker locker(&mutex_);
    return minimumLevel_;
}

}  // namespace han::common
