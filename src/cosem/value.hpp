#pragma once

#include "common/limits.hpp"
#include "date_time.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <variant>

namespace han::cosem {

// Wire tags of the COSEM data types this decoder understands.
enum class DataType : uint8_t {
    Null = 0x00,
    Array = 0x01,
    Structure = 0x02,
    Boolean = 0x03,
    DoubleLong = 0x05,
    DoubleLongUnsigned = 0x06,
    OctetString = 0x09,
    VisibleString = 0x0A,
    Utf8String = 0x0C,
    Integer = 0x0F,
    Long = 0x10,
    Unsigned = 0x11,
    LongUnsigned = 0x12,
    Long64 = 0x14,
    Long64Unsigned = 0x15,
    Enum = 0x16,
    Float32 = 0x17,
    Float64 = 0x18,
    DateTime = 0x19,
};

// Slice of the owning store's byte pool.
struct ByteRange {
    uint16_t offset = 0;
    uint16_t size = 0;
};

// Contiguous children in the owning store's node pool.
struct NodeRange {
    uint16_t first = 0;
    uint16_t count = 0;
};

struct Null {};
struct UnsignedInt {
    uint64_t value = 0;
    uint8_t width = 0;  // bytes on the wire
};
struct SignedInt {
    int64_t value = 0;
    uint8_t width = 0;
};
struct Enumerated {
    uint8_t value = 0;
};
struct Float {
    double value = 0.0;
    uint8_t width = 0;
};
struct OctetString {
    ByteRange bytes;
};
struct VisibleString {
    ByteRange bytes;
};
struct DateTime {
    Timestamp value;
};
struct Array {
    NodeRange children;
};
struct Structure {
    NodeRange children;
};

using Value = std::variant<Null, bool, UnsignedInt, SignedInt, Enumerated, Float, OctetString, VisibleString,
                           DateTime, Array, Structure>;

// Integer, enum, boolean and float values as a number.
std::optional<double> numeric_value(const Value &value);
std::optional<int64_t> integer_value(const Value &value);

// Fixed-capacity arena for composite children and string bytes. Values
// refer into it by index, so copying the store copies the whole tree.
class ValueStore {
public:
    struct Mark {
        std::size_t nodes = 0;
        std::size_t bytes = 0;
    };

    std::optional<NodeRange> allocateNodes(std::size_t count);
    std::optional<ByteRange> storeBytes(const uint8_t *data, std::size_t size);

    Value &node(std::size_t index);
    const Value &node(std::size_t index) const;
    const Value &child(const NodeRange &range, std::size_t index) const;

    const uint8_t *data(const ByteRange &range) const;
    std::string_view text(const ByteRange &range) const;

    Mark mark() const;
    void rewind(const Mark &mark);

    std::size_t nodeCount() const;
    std::size_t byteCount() const;

private:
    std::array<Value, kMaxValueNodes> nodes_{};
    std::size_t nodeCount_ = 0;
    std::array<uint8_t, kMaxValueBytes> bytes_{};
    std::size_t byteCount_ = 0;
};

}  // namespace han::cosem
