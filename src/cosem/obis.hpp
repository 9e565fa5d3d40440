#pragma once

#include <QtCore/QString>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace han::cosem {

constexpr std::size_t kObisCodeBytes = 6;

// Value group layout A-B:C.D.E*F.
struct ObisCode {
    std::array<uint8_t, kObisCodeBytes> bytes{};

    uint8_t a() const { return bytes[0]; }
    uint8_t b() const { return bytes[1]; }
    uint8_t c() const { return bytes[2]; }
    uint8_t d() const { return bytes[3]; }
    uint8_t e() const { return bytes[4]; }
    uint8_t f() const { return bytes[5]; }

    // "1-0:1.7.0", with "*F" appended when F is not 255.
    QString toString() const;

    static ObisCode from(uint8_t a, uint8_t b, uint8_t c, uint8_t d, uint8_t e, uint8_t f = 255);
    static std::optional<ObisCode> parse(const QString &text);
};

bool operator==(const ObisCode &lhs, const ObisCode &rhs);
bool operator!=(const ObisCode &lhs, const ObisCode &rhs);

// Symbol of a DLMS unit enumeration value, or nullptr when unknown.
const char *unit_symbol(uint8_t unit);

}  // namespace han::cosem
