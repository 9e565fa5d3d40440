#pragma once

#include "common/limits.hpp"

#include <array>
#include <cstddef>
#include <cstdint>

namespace han::protocol {

constexpr uint8_t kFlag = 0x7E;
constexpr uint8_t kEscape = 0x7D;
constexpr uint8_t kEscapeXor = 0x20;

// Hunts for flag-delimited frames in a byte stream and collects the
// de-stuffed content of one frame at a time into a fixed buffer.
class FrameSynchronizer {
public:
    enum class State {
        Seeking,
        Accumulating,
        FrameReady,
        Overflow,
    };

    enum class Event {
        None,
        FrameReady,
        Overflow,
        Aborted,
        Runt,
    };

    Event push(uint8_t byte);

    // Consumes bytes until a frame is ready or the input is exhausted.
    // Returns the number of bytes consumed; *event receives the last event
    // that is not None.
    std::size_t feed(const uint8_t *data, std::size_t size, Event *event = nullptr);

    State state() const;
    bool frameReady() const;
    const uint8_t *frameData() const;
    std::size_t frameSize() const;

    // Drops the current frame. The closing flag stays in effect as the
    // opening flag of the next frame.
    void release();
    // Forgets everything and goes back to hunting for a flag.
    void reset();

    std::size_t framesReady() const;
    std::size_t overflows() const;
    std::size_t aborts() const;
    std::size_t runts() const;

private:
    void startFrame();

    std::array<uint8_t, kMaxFrameBytes> buffer_{};
    std::size_t size_ = 0;
    State state_ = State::Seeking;
    bool escaped_ = false;

    std::size_t framesReady_ = 0;
    std::size_t overflows_ = 0;
    std::size_t aborts_ = 0;
    std::size_t runts_ = 0;
};

}  // namespace han::protocol
