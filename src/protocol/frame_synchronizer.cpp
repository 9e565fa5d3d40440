#include "frame_synchronizer.hpp"

namespace han::protocol {

FrameSynchronizer::Event FrameSynchronizer::push(uint8_t byte) {
    if (state_ == State::FrameReady) {
        release();
    }

    if (state_ == State::Seeking || state_ == State::Overflow) {
        if (byte == kFlag) {
            startFrame();
        } else {
            state_ = State::Seeking;
        }
        return Event::None;
    }

    if (byte == kFlag) {
        if (escaped_) {
            ++aborts_;
            startFrame();
            return Event::Aborted;
        }
        if (size_ >= kMinFrameBytes) {
            state_ = State::FrameReady;
            ++framesReady_;
            return Event::FrameReady;
        }
        const bool runt = size_ > 0;
        startFrame();
        if (runt) {
            ++runts_;
            return Event::Runt;
        }
        return Event::None;
    }

    if (byte == kEscape && !escaped_) {
        escaped_ = true;
        return Event::None;
    }

    if (size_ == buffer_.size()) {
        // The byte that overflowed is not a flag, so it cannot open a frame.
        ++overflows_;
        size_ = 0;
        escaped_ = false;
        state_ = State::Overflow;
        return Event::Overflow;
    }

    if (escaped_) {
        byte ^= kEscapeXor;
        escaped_ = false;
    }
    buffer_[size_++] = byte;
    return Event::None;
}

std::size_t FrameSynchronizer::feed(const uint8_t *data, std::size_t size, Event *event) {
    std::size_t consumed = 0;
    while (consumed < size) {
        const Event current = push(data[consumed++]);
        if (current != Event::None && event) {
            *event = current;
        }
        if (current == Event::FrameReady) {
            break;
        }
    }
    return consumed;
}

FrameSynchronizer::State FrameSynchronizer::state() const {
    return state_;
}

bool FrameSynchronizer::frameReady() const {
    return state_ == State::FrameReady;
}

const uint8_t *FrameSynchronizer::frameData() const {
    return buffer_.data();
}

std::size_t FrameSynchronizer::frameSize() const {
    return size_;
}

void FrameSynchronizer::release() {
    if (state_ == State::FrameReady) {
        startFrame();
    }
}

void FrameSynchronizer::reset() {
    size_ = 0;
    escaped_ = false;
    state_ = State::Seeking;
}

std::size_t FrameSynchronizer::framesReady() const {
    return framesReady_;
}

std::size_t FrameSynchronizer::overflows() const {
    return overflows_;
}

std::size_t FrameSynchronizer::aborts() const {
    return aborts_;
}

std::size_t FrameSynchronizer::runts() const {
    return runts_;
}

void FrameSynchronizer::startFrame() {
    size_ = 0;
    escaped_ = false;
    state_ = State::Accumulating;
}

}  // namespace han::protocol
