#pragma once

#include "common/decode_error.hpp"

#include <cstddef>

namespace han {

enum class DiagnosticEvent {
    FrameAccepted,
    FrameRejected,
    Resynchronized,
    EntryFailed,
    TelegramDecodeFailed,
};

const char *to_string(DiagnosticEvent event);

struct Diagnostic {
    DiagnosticEvent event = DiagnosticEvent::FrameAccepted;
    DecodeError error = DecodeError::None;
    std::size_t frameSize = 0;
    std::size_t entryIndex = 0;  // EntryFailed only
};

// Optional observer of the decode pipeline. It only watches: whether one is
// attached never changes what gets decoded.
class DiagnosticSink {
public:
    virtual ~DiagnosticSink() = default;

    virtual void onDiagnostic(const Diagnostic &diagnostic) = 0;
};

}  // namespace han
