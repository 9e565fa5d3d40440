#include "decode_error.hpp"

namespace han {

const char *to_string(DecodeError error) {
    switch (error) {
        case DecodeError::None:
            return "none";
        case DecodeError::EndOfStream:
            return "end of stream";
        case DecodeError::IoError:
            return "i/o error";
        case DecodeError::FrameOverflow:
            return "frame overflow";
        case DecodeError::InvalidFormat:
            return "invalid frame format";
        case DecodeError::Unsupported:
            return "unsupported frame";
        case DecodeError::LengthMismatch:
            return "length mismatch";
        case DecodeError::HeaderChecksum:
            return "header checksum";
        case DecodeError::FrameChecksum:
            return "frame checksum";
        case DecodeError::UnexpectedApdu:
            return "unexpected apdu";
        case DecodeError::UnexpectedTag:
            return "unexpected tag";
        case DecodeError::Truncated:
            return "truncated";
        case DecodeError::StructureTooDeep:
            return "structure too deep";
        case DecodeError::MalformedEntry:
            return "malformed entry";
        case DecodeError::InvalidDateTime:
            return "invalid date-time";
        case DecodeError::CapacityExceeded:
            return "capacity exceeded";
    }
    return "unknown";
}

bool is_transport_error(DecodeError error) {
    return error == DecodeError::EndOfStream || error == DecodeError::IoError;
}

}  // namespace han
