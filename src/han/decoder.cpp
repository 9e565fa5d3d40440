#include "decoder.hpp"

#include "cosem/apdu_decoder.hpp"
#include "protocol/hdlc_frame.hpp"

namespace han {

namespace {

void set_error(DecodeError code, DecodeError *outCode) {
    if (outCode) {
        *outCode = code;
    }
}

void report(DiagnosticSink *sink, DiagnosticEvent event, DecodeError error, std::size_t frameSize,
            std::size_t entryIndex = 0) {
    if (!sink) {
        return;
    }
    Diagnostic diagnostic;
    diagnostic.event = event;
    diagnostic.error = error;
    diagnostic.frameSize = frameSize;
    diagnostic.entryIndex = entryIndex;
    sink->onDiagnostic(diagnostic);
}

DecodeError sync_error(protocol::FrameSynchronizer::Event event) {
    using Event = protocol::FrameSynchronizer::Event;
    switch (event) {
        case Event::Overflow:
            return DecodeError::FrameOverflow;
        case Event::Aborted:
            return DecodeError::InvalidFormat;
        case Event::Runt:
            return DecodeError::LengthMismatch;
        default:
            return DecodeError::None;
    }
}

}  // namespace

std::optional<Telegram> decode_frame(const uint8_t *data, std::size_t size, DecodeError *error, DiagnosticSink *sink) {
    set_error(DecodeError::None, error);

    DecodeError frameError = DecodeError::None;
    const auto frame = protocol::validate_frame(data, size, &frameError);
    if (!frame) {
        set_error(frameError, error);
        report(sink, DiagnosticEvent::FrameRejected, frameError, size);
        return std::nullopt;
    }

    TelegramBuilder builder;
    builder.setHeader(frame->header);
    cosem::ApduDecoder apdu(frame->payload, frame->payloadSize);
    DecodeError apduError = DecodeError::None;
    if (!apdu.decodeNotification(builder, &apduError)) {
        set_error(apduError, error);
        report(sink, DiagnosticEvent::TelegramDecodeFailed, apduError, size);
        return std::nullopt;
    }

    const Telegram &telegram = builder.peek();
    for (std::size_t i = 0; i < telegram.entryCount(); ++i) {
        const EntrySlot &slot = telegram.entry(i);
        if (!slot.ok()) {
            report(sink, DiagnosticEvent::EntryFailed, slot.error, size, i);
        }
    }
    report(sink, DiagnosticEvent::FrameAccepted, DecodeError::None, size);
    return builder.build();
}

std::optional<Telegram> decode(const uint8_t *data, std::size_t size, DecodeError *error, DiagnosticSink *sink) {
    set_error(DecodeError::None, error);

    if (size == 0 || data[0] != protocol::kFlag) {
        if (size > kMaxFrameBytes) {
            set_error(DecodeError::FrameOverflow, error);
            report(sink, DiagnosticEvent::FrameRejected, DecodeError::FrameOverflow, size);
            return std::nullopt;
        }
        return decode_frame(data, size, error, sink);
    }

    protocol::FrameSynchronizer sync;
    DecodeError lastSyncError = DecodeError::None;
    for (std::size_t i = 0; i < size; ++i) {
        const auto event = sync.push(data[i]);
        if (event == protocol::FrameSynchronizer::Event::FrameReady) {
            return decode_frame(sync.frameData(), sync.frameSize(), error, sink);
        }
        const DecodeError current = sync_error(event);
        if (current != DecodeError::None) {
            lastSyncError = current;
        }
    }

    // No closing flag.
    const DecodeError failure = lastSyncError != DecodeError::None ? lastSyncError : DecodeError::Truncated;
    set_error(failure, error);
    report(sink, DiagnosticEvent::FrameRejected, failure, sync.frameSize());
    return std::nullopt;
}

std::optional<Telegram> decode(const QByteArray &bytes, DecodeError *error, DiagnosticSink *sink) {
    return decode(reinterpret_cast<const uint8_t *>(bytes.constData()), static_cast<std::size_t>(bytes.size()),
                  error, sink);
}

Decoder::Decoder(DiagnosticSink *sink) : sink_(sink) {}

std::optional<Telegram> Decoder::push(uint8_t byte, DecodeError *error) {
    set_error(DecodeError::None, error);

    const auto event = sync_.push(byte);
    if (event != protocol::FrameSynchronizer::Event::FrameReady) {
        const DecodeError syncError = sync_error(event);
        if (syncError != DecodeError::None) {
            report(sink_, DiagnosticEvent::Resynchronized, syncError, 0);
        }
        return std::nullopt;
    }

    DecodeError frameError = DecodeError::None;
    auto telegram = decode_frame(sync_.frameData(), sync_.frameSize(), &frameError, sink_);
    sync_.release();
    if (!telegram) {
        // Framing and checksum failures are line noise; only a frame that
        // passed both checks and still failed is worth surfacing.
        const bool mandatory = frameError != DecodeError::LengthMismatch &&
                               frameError != DecodeError::InvalidFormat &&
                               frameError != DecodeError::Unsupported &&
                               frameError != DecodeError::HeaderChecksum &&
                               frameError != DecodeError::FrameChecksum;
        if (mandatory) {
            set_error(frameError, error);
        }
    }
    return telegram;
}

void Decoder::reset() {
    sync_.reset();
}

void Decoder::setSink(DiagnosticSink *sink) {
    sink_ = sink;
}

const protocol::FrameSynchronizer &Decoder::synchronizer() const {
    return sync_;
}

TelegramReader::TelegramReader(protocol::ByteSource &source, DiagnosticSink *sink)
    : source_(source), decoder_(sink) {}

std::optional<Telegram> TelegramReader::readTelegram(DecodeError *error) {
    set_error(DecodeError::None, error);

    while (true) {
        while (chunkPos_ < chunkSize_) {
            DecodeError frameError = DecodeError::None;
            auto telegram = decoder_.push(chunk_[chunkPos_++], &frameError);
            if (telegram) {
                return telegram;
            }
            if (frameError != DecodeError::None) {
                set_error(frameError, error);
                return std::nullopt;
            }
        }

        const protocol::ReadResult result = source_.read(chunk_.data(), chunk_.size());
        chunkPos_ = 0;
        chunkSize_ = 0;
        if (result.status != protocol::ReadStatus::Ok) {
            decoder_.reset();
            set_error(result.status == protocol::ReadStatus::EndOfStream ? DecodeError::EndOfStream
                                                                         : DecodeError::IoError,
                      error);
            return std::nullopt;
        }
        chunkSize_ = result.count < chunk_.size() ? result.count : chunk_.size();
    }
}

const Decoder &TelegramReader::decoder() const {
    return decoder_;
}

std::optional<Telegram> read_telegram(TelegramReader &reader, DecodeError *error) {
    return reader.readTelegram(error);
}

}  // namespace han
