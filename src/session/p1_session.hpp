#pragma once

#include "han/decoder.hpp"
#include "han/diagnostics.hpp"
#include "han/telegram.hpp"

#include <QtCore/QIODevice>
#include <QtCore/QMetaType>
#include <QtCore/QObject>
#include <QtCore/QPointer>

// Decodes telegrams from a QIODevice as its bytes arrive on the event loop.
// The device stays owned by the caller.
class P1Session : public QObject {
    Q_OBJECT

public:
    explicit P1Session(QIODevice *device, han::DiagnosticSink *sink = nullptr, QObject *parent = nullptr);
    ~P1Session() override;

    // Runs bytes through the decoder as if the device had delivered them.
    void feed(const QByteArray &bytes);

    int telegramCount() const;
    int failureCount() const;

public slots:
    void start();
    void stop();

signals:
    void telegramReceived(const han::Telegram &telegram);
    void decodeFailed(han::DecodeError error);
    void streamClosed();

private slots:
    void onReadyRead();
    void onReadChannelFinished();

private:
    QPointer<QIODevice> device_;
    han::Decoder decoder_;
    int telegramCount_ = 0;
    int failureCount_ = 0;
    bool started_ = false;
    bool closed_ = false;  // streamClosed is emitted once
};

Q_DECLARE_METATYPE(han::DecodeError)
