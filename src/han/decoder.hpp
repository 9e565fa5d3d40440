#pragma once

#include "common/decode_error.hpp"
#include "common/limits.hpp"
#include "diagnostics.hpp"
#include "protocol/byte_source.hpp"
#include "protocol/frame_synchronizer.hpp"
#include "telegram.hpp"

#include <QtCore/QByteArray>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace han {

// Validates one de-stuffed frame (no flags) and decodes its notification.
std::optional<Telegram> decode_frame(const uint8_t *data, std::size_t size, DecodeError *error = nullptr,
                                     DiagnosticSink *sink = nullptr);

// Decodes one captured frame. With a leading flag the buffer is taken as it
// came off the line (flags and escapes); otherwise as de-stuffed content.
std::optional<Telegram> decode(const uint8_t *data, std::size_t size, DecodeError *error = nullptr,
                               DiagnosticSink *sink = nullptr);
std::optional<Telegram> decode(const QByteArray &bytes, DecodeError *error = nullptr, DiagnosticSink *sink = nullptr);

// Push-driven pipeline for transports that deliver bytes on their own
// schedule. Corrupt frames are dropped and reported to the sink only.
class Decoder {
public:
    explicit Decoder(DiagnosticSink *sink = nullptr);

    // Returns a telegram when byte completes a frame that decodes. When a
    // checksummed frame fails in a mandatory field, *error says why.
    std::optional<Telegram> push(uint8_t byte, DecodeError *error = nullptr);

    // Discards any partial frame and waits for the next flag.
    void reset();

    void setSink(DiagnosticSink *sink);
    const protocol::FrameSynchronizer &synchronizer() const;

private:
    protocol::FrameSynchronizer sync_;
    DiagnosticSink *sink_ = nullptr;
};

// Pull-driven pipeline over a ByteSource.
class TelegramReader {
public:
    explicit TelegramReader(protocol::ByteSource &source, DiagnosticSink *sink = nullptr);

    // Reads until one telegram is decoded. Fails only on a transport failure
    // (EndOfStream, IoError) or a mandatory-field failure; other corruption
    // is skipped. After a failure the next call starts on a fresh frame.
    std::optional<Telegram> readTelegram(DecodeError *error = nullptr);

    const Decoder &decoder() const;

private:
    protocol::ByteSource &source_;
    Decoder decoder_;
    std::array<uint8_t, kReadChunkBytes> chunk_{};
    std::size_t chunkSize_ = 0;
    std::size_t chunkPos_ = 0;
};

std::optional<Telegram> read_telegram(TelegramReader &reader, DecodeError *error = nullptr);

}  // namespace han
