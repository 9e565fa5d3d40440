#include <QtCore/QCommandLineParser>
#include <QtCore/QCoreApplication>
#include <QtCore/QFile>
#include <QtCore/QTextStream>

#include "common/logger.hpp"
#include "han/decoder.hpp"
#include "han/logger_sink.hpp"
#include "han/telegram_format.hpp"
#include "protocol/io_device_source.hpp"
#include "reader_controller.hpp"

using han::common::Logger;
using han::common::LogLevel;

namespace {

constexpr int kDefaultTimeoutMs = 30000;
constexpr int kDefaultReconnectMs = 3000;

void print_telegram(const han::Telegram &telegram) {
    QTextStream out(stdout);
    for (const QString &line : han::format_telegram(telegram)) {
        out << line << '\n';
    }
    out.flush();
}

void install_log_printer(bool verbose) {
    Logger::instance().setMinimumLevel(verbose ? LogLevel::Debug : LogLevel::Info);
    QObject::connect(&Logger::instance(), &Logger::messageLogged, &Logger::instance(),
                     [](LogLevel level, const QString &category, const QString &message, const QDateTime &ts) {
                         QTextStream err(stderr);
                         err << ts.toString(Qt::ISODateWithMs) << ' ' << han::common::to_string(level) << ' '
                             << category << ": " << message << '\n';
                     });
}

// Blocking read of a capture file or a TTY opened as a file.
int read_file(const QString &path, int timeoutMs) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Unbuffered)) {
        Logger::instance().log(LogLevel::Error, QStringLiteral("reader"),
                               QStringLiteral("cannot open %1: %2").arg(path, file.errorString()));
        return 1;
    }

    han::LoggerSink sink;
    han::protocol::IoDeviceSource source(&file, timeoutMs);
    han::TelegramReader reader(source, &sink);
    while (true) {
        han::DecodeError error = han::DecodeError::None;
        const auto telegram = han::read_telegram(reader, &error);
        if (telegram) {
            print_telegram(*telegram);
            continue;
        }
        if (error == han::DecodeError::EndOfStream) {
            break;
        }
        if (error == han::DecodeError::IoError) {
            Logger::instance().log(LogLevel::Error, QStringLiteral("reader"),
                                   QStringLiteral("read failed: %1").arg(file.errorString()));
            return 1;
        }
        // Mandatory field broken in an otherwise intact frame; keep reading.
    }
    Logger::instance().log(LogLevel::Info, QStringLiteral("reader"),
                           QStringLiteral("%1 frames accepted, %2 rejected").arg(sink.accepted()).arg(sink.rejected()));
    return 0;
}

}  // namespace

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("han-reader"));
    QCoreApplication::setApplicationVersion(QStringLiteral("0.2.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Decodes HAN P1 telegrams from a meter."));
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption fileOption(QStringList{QStringLiteral("f"), QStringLiteral("file")},
                                        QStringLiteral("Capture file or serial device to read."),
                                        QStringLiteral("path"));
    const QCommandLineOption tcpOption(QStringList{QStringLiteral("t"), QStringLiteral("tcp")},
                                       QStringLiteral("Serial-to-TCP bridge to connect to."),
                                       QStringLiteral("host:port"));
    const QCommandLineOption timeoutOption(QStringLiteral("timeout"),
                                           QStringLiteral("Milliseconds without data before giving up or reconnecting."),
                                           QStringLiteral("ms"), QString::number(kDefaultTimeoutMs));
    const QCommandLineOption reconnectOption(QStringLiteral("reconnect"),
                                             QStringLiteral("Milliseconds between reconnect attempts."),
                                             QStringLiteral("ms"), QString::number(kDefaultReconnectMs));
    const QCommandLineOption verboseOption(QStringList{QStringLiteral("v"), QStringLiteral("verbose")},
                                           QStringLiteral("Log every accepted frame."));
    parser.addOption(fileOption);
    parser.addOption(tcpOption);
    parser.addOption(timeoutOption);
    parser.addOption(reconnectOption);
    parser.addOption(verboseOption);
    parser.process(app);

    install_log_printer(parser.isSet(verboseOption));

    bool ok = false;
    const int timeoutMs = parser.value(timeoutOption).toInt(&ok);
    if (!ok || timeoutMs <= 0) {
        Logger::instance().log(LogLevel::Error, QStringLiteral("reader"), QStringLiteral("invalid --timeout"));
        return 2;
    }
    const int reconnectMs = parser.value(reconnectOption).toInt(&ok);
    if (!ok || reconnectMs <= 0) {
        Logger::instance().log(LogLevel::Error, QStringLiteral("reader"), QStringLiteral("invalid --reconnect"));
        return 2;
    }

    if (parser.isSet(fileOption) == parser.isSet(tcpOption)) {
        Logger::instance().log(LogLevel::Error, QStringLiteral("reader"),
                               QStringLiteral("exactly one of --file or --tcp is required"));
        parser.showHelp(2);
    }

    if (parser.isSet(fileOption)) {
        return read_file(parser.value(fileOption), timeoutMs);
    }

    const QString target = parser.value(tcpOption);
    const int colon = target.lastIndexOf(QLatin1Char(':'));
    const uint port = colon > 0 ? target.mid(colon + 1).toUInt(&ok) : 0;
    if (colon <= 0 || !ok || port == 0 || port > 65535) {
        Logger::instance().log(LogLevel::Error, QStringLiteral("reader"),
                               QStringLiteral("invalid --tcp target %1").arg(target));
        return 2;
    }

    ReaderController controller;
    controller.setReconnectInterval(reconnectMs);
    controller.setIdleTimeout(timeoutMs);
    QObject::connect(&controller, &ReaderController::logMessage, [](const QString &message) {
        Logger::instance().log(LogLevel::Info, QStringLiteral("reader"), message);
    });
    QObject::connect(&controller, &ReaderController::statusChanged, [](const QString &status) {
        Logger::instance().log(LogLevel::Debug, QStringLiteral("reader"), QStringLiteral("link %1").arg(status));
    });
    QObject::connect(&controller, &ReaderController::statisticsUpdated, [](int telegrams, int failures) {
        Logger::instance().log(LogLevel::Debug, QStringLiteral("reader"),
                               QStringLiteral("%1 telegrams, %2 dropped").arg(telegrams).arg(failures));
    });
    QObject::connect(&controller, &ReaderController::telegramReceived, &print_telegram);
    controller.connectToHost(target.left(colon), static_cast<quint16>(port));
    return app.exec();
}
