#pragma once

namespace han {

enum class DecodeError {
    None = 0,
    // Transport
    EndOfStream,
    IoError,
    // Framing
    FrameOverflow,
    InvalidFormat,
    Unsupported,
    LengthMismatch,
    HeaderChecksum,
    FrameChecksum,
    // Application data
    UnexpectedApdu,
    UnexpectedTag,
    Truncated,
    StructureTooDeep,
    MalformedEntry,
    InvalidDateTime,
    CapacityExceeded,
};

const char *to_string(DecodeError error);

// Transport failures end a streaming read; everything else is about one frame.
bool is_transport_error(DecodeError error);

}  // namespace han
