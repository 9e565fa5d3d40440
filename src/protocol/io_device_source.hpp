#pragma once

#include "byte_source.hpp"

#include <QtCore/QIODevice>
#include <QtCore/QPointer>

namespace han::protocol {

// Blocking ByteSource over a QIODevice: a TTY or capture opened as QFile, or a
// connected QTcpSocket to a serial bridge. A read that sees no data within
// timeoutMs reports IoError. Does not take ownership.
class IoDeviceSource : public ByteSource {
public:
    explicit IoDeviceSource(QIODevice *device, int timeoutMs = 30000);

    ReadResult read(uint8_t *buffer, std::size_t capacity) override;

    int timeoutMs() const;

private:
    QPointer<QIODevice> device_;
    int timeoutMs_ = 30000;
};

}  // namespace han::protocol
