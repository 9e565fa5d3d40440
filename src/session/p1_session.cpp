#include "p1_session.hpp"

P1Session::P1Session(QIODevice *device, han::DiagnosticSink *sink, QObject *parent)
    : QObject(parent), device_(device), decoder_(sink) {
    qRegisterMetaType<han::DecodeError>();
}

P1Session::~P1Session() = default;

void P1Session::start() {
    if (started_) {
        return;
    }
    if (!device_) {
        closed_ = true;
        emit streamClosed();
        return;
    }
    started_ = true;
    connect(device_.data(), &QIODevice::readyRead, this, &P1Session::onReadyRead);
    connect(device_.data(), &QIODevice::readChannelFinished, this, &P1Session::onReadChannelFinished);
    connect(device_.data(), &QIODevice::aboutToClose, this, &P1Session::onReadChannelFinished);
    if (device_->bytesAvailable() > 0) {
        onReadyRead();
    }
}

void P1Session::stop() {
    if (device_) {
        disconnect(device_.data(), nullptr, this, nullptr);
    }
    started_ = false;
    // A partial frame cannot be finished by a later session.
    decoder_.reset();
}

void P1Session::feed(const QByteArray &bytes) {
    for (const char ch : bytes) {
        han::DecodeError error = han::DecodeError::None;
        const auto telegram = decoder_.push(static_cast<uint8_t>(ch), &error);
        if (telegram) {
            ++telegramCount_;
            emit telegramReceived(*telegram);
        } else if (error != han::DecodeError::None) {
            ++failureCount_;
            emit decodeFailed(error);
        }
    }
}

int P1Session::telegramCount() const {
    return telegramCount_;
}

int P1Session::failureCount() const {
    return failureCount_;
}

void P1Session::onReadyRead() {
    if (!device_) {
        return;
    }
    feed(device_->readAll());
}

void P1Session::onReadChannelFinished() {
    if (closed_) {
        return;
    }
    closed_ = true;
    decoder_.reset();
    emit streamClosed();
}
