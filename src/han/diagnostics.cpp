#include "diagnostics.hpp"

namespace han {

const char *to_string(DiagnosticEvent event) {
    switch (event) {
        case DiagnosticEvent::FrameAccepted:
            return "frame accepted";
        case DiagnosticEvent::FrameRejected:
            return "frame rejected";
        case DiagnosticEvent::Resynchronized:
            return "resynchronized";
        case DiagnosticEvent::EntryFailed:
            return "entry failed";
        case DiagnosticEvent::TelegramDecodeFailed:
            return "telegram decode failed";
    }
    return "unknown";
}

}  // namespace han
