#pragma once

#include <QtCore/QObject>
#include <QtCore/QString>
#include <QtCore/QTimer>
#include <QtNetwork/QAbstractSocket>
#include <QtNetwork/QTcpSocket>

#include <memory>

#include "han/logger_sink.hpp"
#include "han/telegram.hpp"

class P1Session;

// Reads telegrams from a serial-to-TCP bridge and reconnects when the link
// drops or stays silent for longer than the idle timeout.
class ReaderController : public QObject {
    Q_OBJECT

public:
    explicit ReaderController(QObject *parent = nullptr);
    ~ReaderController() override;

    void connectToHost(const QString &host, quint16 port);
    void disconnectFromHost();
    void setReconnectInterval(int milliseconds);
    void setIdleTimeout(int milliseconds);

signals:
    void statusChanged(QString status);
    void logMessage(QString message);
    void telegramReceived(const han::Telegram &telegram);
    void statisticsUpdated(int telegrams, int failures);

private slots:
    void onConnected();
    void onDisconnected();
    void onErrorOccurred(QAbstractSocket::SocketError error);
    void onTelegram(const han::Telegram &telegram);
    void onDecodeFailed(han::DecodeError error);
    void handleIdleTimeout();
    void attemptReconnect();

private:
    void updateStatistics();

    QTcpSocket socket_;
    QTimer reconnectTimer_;
    QTimer idleTimer_;
    std::unique_ptr<P1Session> session_;
    han::LoggerSink sink_;
    bool shouldReconnect_ = false;
    QString host_;
    quint16 port_ = 0;
    int telegramCount_ = 0;
    int failureCount_ = 0;
};
