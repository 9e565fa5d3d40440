#pragma once

#include <QtCore/QDateTime>
#include <QtCore/QMutex>
#include <QtCore/QObject>
#include <QtCore/QString>

namespace han::common {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error,
};

QString to_string(LogLevel level);

class Logger : public QObject {
    Q_OBJECT

public:
    static Logger &instance();

    void log(LogLevel level, const QString &category, const QString &message);

    // Messages below this level are dropped before messageLogged.
    void setMinimumLevel(LogLevel level);
    LogLevel minimumLevel() const;

signals:
    void messageLogged(han::common::LogLevel level, QString category, QString message, QDateTime timestamp);

private:
    explicit Logger(QObject *parent = nullptr);

    mutable QMutex mutex_;
    LogLevel minimumLevel_ = LogLevel::Info;
};

}  // namespace han::common
