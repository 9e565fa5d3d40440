#include "value.hpp"

#include <cstring>
#include <type_traits>

namespace han::cosem {

std::optional<double> numeric_value(const Value &value) {
    return std::visit(
        [](const auto &v) -> std::optional<double> {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, bool>) {
                return v ? 1.0 : 0.0;
            } else if constexpr (std::is_same_v<T, UnsignedInt> || std::is_same_v<T, SignedInt> ||
                                 std::is_same_v<T, Enumerated> || std::is_same_v<T, Float>) {
                return static_cast<double>(v.value);
            } else {
                return std::nullopt;
            }
        },
        value);
}

std::optional<int64_t> integer_value(const Value &value) {
    if (const auto *u = std::get_if<UnsignedInt>(&value)) {
        if (u->value > static_cast<uint64_t>(INT64_MAX)) {
            return std::nullopt;
        }
        return static_cast<int64_t>(u->value);
    }
    if (const auto *s = std::get_if<SignedInt>(&value)) {
        return s->value;
    }
    if (const auto *e = std::get_if<Enumerated>(&value)) {
        return e->value;
    }
    return std::nullopt;
}

std::optional<NodeRange> ValueStore::allocateNodes(std::size_t count) {
    if (count > nodes_.size() - nodeCount_) {
        return std::nullopt;
    }
    NodeRange range;
    range.first = static_cast<uint16_t>(nodeCount_);
    range.count = static_cast<uint16_t>(count);
    for (std::size_t i = 0; i < count; ++i) {
        nodes_[nodeCount_ + i] = Null{};
    }
    nodeCount_ += count;
    return range;
}

std::optional<ByteRange> ValueStore::storeBytes(const uint8_t *data, std::size_t size) {
    if (size > bytes_.size() - byteCount_) {
        return std::nullopt;
    }
    ByteRange range;
    range.offset = static_cast<uint16_t>(byteCount_);
    range.size = static_cast<uint16_t>(size);
    if (size > 0) {
        std::memcpy(bytes_.data() + byteCount_, data, size);
    }
    byteCount_ += size;
    return range;
}

Value &ValueStore::node(std::size_t index) {
    return nodes_.at(index);
}

const Value &ValueStore::node(std::size_t index) const {
    return nodes_.at(index);
}

const Value &ValueStore::child(const NodeRange &range, std::size_t index) const {
    static const Value none = Null{};
    const std::size_t position = std::size_t(range.first) + index;
    if (index >= range.count || position >= nodeCount_) {
        return none;
    }
    return nodes_[position];
}

const uint8_t *ValueStore::data(const ByteRange &range) const {
    return bytes_.data() + range.offset;
}

std::string_view ValueStore::text(const ByteRange &range) const {
    return std::string_view(reinterpret_cast<const char *>(bytes_.data() + range.offset), range.size);
}

ValueStore::Mark ValueStore::mark() const {
    Mark m;
    m.nodes = nodeCount_;
    m.bytes = byteCount_;
    return m;
}

void ValueStore::rewind(const Mark &mark) {
    if (mark.nodes <= nodeCount_) {
        nodeCount_ = mark.nodes;
    }
    if (mark.bytes <= byteCount_) {
        byteCount_ = mark.bytes;
    }
}

std::size_t ValueStore::nodeCount() const {
    return nodeCount_;
}

std::size_t ValueStore::byteCount() const {
    return byteCount_;
}

}  // namespace han::cosem
