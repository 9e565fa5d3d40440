#include "io_device_source.hpp"

#include <QtCore/QFileDevice>

#ifdef Q_OS_UNIX
#include <QtCore/QDeadlineTimer>

#include <cerrno>
#include <poll.h>
#include <unistd.h>
#endif

namespace han::protocol {

namespace {

#ifdef Q_OS_UNIX
// A TTY or pipe opened as QFile has no waitForReadyRead, and QFile::read()
// keeps reading until the request is filled. Wait on the descriptor with the
// deadline and take whatever one read() returns.
ReadResult read_descriptor(int fd, uint8_t *buffer, std::size_t capacity, int timeoutMs) {
    ReadResult result;
    const QDeadlineTimer deadline(timeoutMs);
    while (true) {
        pollfd entry{};
        entry.fd = fd;
        entry.events = POLLIN;
        const int ready = ::poll(&entry, 1, static_cast<int>(deadline.remainingTime()));
        if (ready == 0) {
            result.status = ReadStatus::IoError;
            return result;
        }
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            result.status = ReadStatus::IoError;
            return result;
        }
        if (entry.revents & POLLNVAL) {
            result.status = ReadStatus::IoError;
            return result;
        }

        const ssize_t count = ::read(fd, buffer, capacity);
        if (count < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            result.status = ReadStatus::IoError;
            return result;
        }
        if (count == 0) {
            // Writer hung up.
            result.status = ReadStatus::EndOfStream;
            return result;
        }
        result.count = static_cast<std::size_t>(count);
        return result;
    }
}
#endif

}  // namespace

IoDeviceSource::IoDeviceSource(QIODevice *device, int timeoutMs) : device_(device), timeoutMs_(timeoutMs) {}

ReadResult IoDeviceSource::read(uint8_t *buffer, std::size_t capacity) {
    ReadResult result;
    if (!device_) {
        result.status = ReadStatus::IoError;
        return result;
    }
    if (!device_->isOpen()) {
        result.status = ReadStatus::EndOfStream;
        return result;
    }
    if (!device_->isReadable()) {
        result.status = ReadStatus::IoError;
        return result;
    }

    if (!device_->isSequential() && device_->atEnd()) {
        result.status = ReadStatus::EndOfStream;
        return result;
    }

    auto *file = qobject_cast<QFileDevice *>(device_.data());
    const qint64 buffered = device_->bytesAvailable();
#ifdef Q_OS_UNIX
    if (file && device_->isSequential() && buffered <= 0 && file->handle() >= 0) {
        return read_descriptor(file->handle(), buffer, capacity, timeoutMs_);
    }
#endif

    qint64 wanted = static_cast<qint64>(capacity);
    if (buffered > 0) {
        // Serve what the device already holds without asking it for more.
        wanted = qMin(wanted, buffered);
    } else if (!file && !device_->waitForReadyRead(timeoutMs_)) {
        result.status = device_->isOpen() ? ReadStatus::IoError : ReadStatus::EndOfStream;
        return result;
    }

    const qint64 count = device_->read(reinterpret_cast<char *>(buffer), wanted);
    if (count < 0) {
        result.status = ReadStatus::IoError;
        return result;
    }
    if (count == 0) {
        result.status = file ? ReadStatus::EndOfStream : ReadStatus::IoError;
        return result;
    }
    result.count = static_cast<std::size_t>(count);
    return result;
}

int IoDeviceSource::timeoutMs() const {
    return timeoutMs_;
}

}  // namespace han::protocol
