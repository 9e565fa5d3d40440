#include "reader_controller.hpp"

#include "session/p1_session.hpp"

ReaderController::ReaderController(QObject *parent) : QObject(parent) {
    connect(&socket_, &QTcpSocket::connected, this, &ReaderController::onConnected);
    connect(&socket_, &QTcpSocket::disconnected, this, &ReaderController::onDisconnected);
    connect(&socket_, &QTcpSocket::errorOccurred, this, &ReaderController::onErrorOccurred);

    reconnectTimer_.setInterval(3000);
    reconnectTimer_.setSingleShot(true);
    connect(&reconnectTimer_, &QTimer::timeout, this, &ReaderController::attemptReconnect);

    // Meters push every 2-10 s; a minute of silence means the bridge is stuck.
    idleTimer_.setInterval(60000);
    idleTimer_.setSingleShot(true);
    connect(&idleTimer_, &QTimer::timeout, this, &ReaderController::handleIdleTimeout);
}

ReaderController::~ReaderController() {
    // The socket outlives the timers and session; keep its teardown signals away from them.
    disconnect(&socket_, nullptr, this, nullptr);
    socket_.abort();
}

void ReaderController::connectToHost(const QString &host, quint16 port) {
    host_ = host;
    port_ = port;
    shouldReconnect_ = true;
    reconnectTimer_.stop();
    emit statusChanged(tr("connecting"));
    socket_.connectToHost(host, port);
    emit logMessage(tr("[connect] connecting to %1:%2").arg(host).arg(port));
}

void ReaderController::disconnectFromHost() {
    shouldReconnect_ = false;
    reconnectTimer_.stop();
    idleTimer_.stop();
    if (session_) {
        session_->stop();
    }
    socket_.disconnectFromHost();
}

void ReaderController::setReconnectInterval(int milliseconds) {
    reconnectTimer_.setInterval(milliseconds);
}

void ReaderController::setIdleTimeout(int milliseconds) {
    idleTimer_.setInterval(milliseconds);
}

void ReaderController::onConnected() {
    emit statusChanged(tr("connected"));
    emit logMessage(tr("[connect] connected to %1:%2").arg(host_).arg(port_));

    // Fresh session per connection: a frame never spans two links.
    session_ = std::make_unique<P1Session>(&socket_, &sink_);
    connect(session_.get(), &P1Session::telegramReceived, this, &ReaderController::onTelegram);
    connect(session_.get(), &P1Session::decodeFailed, this, &ReaderController::onDecodeFailed);
    session_->start();
    idleTimer_.start();
}

void ReaderController::onDisconnected() {
    emit statusChanged(tr("disconnected"));
    emit logMessage(tr("[connect] connection closed"));
    idleTimer_.stop();
    if (session_) {
        session_->stop();
    }
    if (shouldReconnect_) {
        emit logMessage(tr("[reconnect] retrying in %1 s").arg(reconnectTimer_.interval() / 1000));
        reconnectTimer_.start();
    }
}

void ReaderController::onErrorOccurred(QAbstractSocket::SocketError) {
    emit statusChanged(tr("error"));
    emit logMessage(tr("[error] socket error: %1").arg(socket_.errorString()));
    if (shouldReconnect_ && !reconnectTimer_.isActive()) {
        emit logMessage(tr("[reconnect] retrying in %1 s").arg(reconnectTimer_.interval() / 1000));
        reconnectTimer_.start();
    }
}

void ReaderController::onTelegram(const han::Telegram &telegram) {
    ++telegramCount_;
    idleTimer_.start();
    emit telegramReceived(telegram);
    updateStatistics();
}

void ReaderController::onDecodeFailed(han::DecodeError error) {
    ++failureCount_;
    emit logMessage(tr("[decode] telegram dropped: %1").arg(QString::fromLatin1(han::to_string(error))));
    updateStatistics();
}

void ReaderController::handleIdleTimeout() {
    emit logMessage(tr("[timeout] no telegram for %1 s, reconnecting").arg(idleTimer_.interval() / 1000));
    socket_.abort();
    attemptReconnect();
}

void ReaderController::attemptReconnect() {
    if (!shouldReconnect_) {
        return;
    }
    if (host_.isEmpty() || port_ == 0) {
        emit logMessage(tr("[reconnect] no target configured, giving up"));
        return;
    }
    idleTimer_.stop();
    emit logMessage(tr("[reconnect] reconnecting to %1:%2").arg(host_).arg(port_));
    socket_.abort();
    socket_.connectToHost(host_, port_);
    emit statusChanged(tr("connecting"));
}

void ReaderController::updateStatistics() {
    emit statisticsUpdated(telegramCount_, failureCount_);
}
