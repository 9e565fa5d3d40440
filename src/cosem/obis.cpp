#include "obis.hpp"

#include <QtCore/QRegularExpression>

namespace han::cosem {

namespace {

// Indexed by DLMS unit code 1..57 (IEC 62056-62).
constexpr const char *kUnitSymbols[] = {
    nullptr, "a",    "mo",    "wk",   "d",      "h",    "min",   "s",      "°",      "°C",     "currency",
    "m",     "m/s",  "m³",    "m³",   "m³/h",   "m³/h", "m³/d",  "m³/d",   "l",      "kg",     "N",
    "Nm",    "Pa",   "bar",   "J",    "J/h",    "W",    "VA",    "var",    "Wh",     "VAh",    "varh",
    "A",     "C",    "V",     "V/m",  "F",      "Ω",    "Ωm²/m", "Wb",     "T",      "A/m",    "H",
    "Hz",    "1/Wh", "1/varh", "1/VAh", "V²h",  "A²h",  "kg/s",  "S",      "K",      "1/V²h",  "1/A²h",
    "1/m³",  "%",    "Ah",
};

constexpr std::size_t kUnitCount = sizeof(kUnitSymbols) / sizeof(kUnitSymbols[0]);

}  // namespace

QString ObisCode::toString() const {
    QString text = QStringLiteral("%1-%2:%3.%4.%5").arg(int(a())).arg(int(b())).arg(int(c())).arg(int(d())).arg(int(e()));
    if (f() != 255) {
        text.append(QStringLiteral("*%1").arg(int(f())));
    }
    return text;
}

ObisCode ObisCode::from(uint8_t a, uint8_t b, uint8_t c, uint8_t d, uint8_t e, uint8_t f) {
    ObisCode code;
    code.bytes = {a, b, c, d, e, f};
    return code;
}

std::optional<ObisCode> ObisCode::parse(const QString &text) {
    static const QRegularExpression pattern(
        QStringLiteral("^(\\d{1,3})-(\\d{1,3}):(\\d{1,3})\\.(\\d{1,3})\\.(\\d{1,3})(?:[*.](\\d{1,3}))?$"));
    const QRegularExpressionMatch match = pattern.match(text.trimmed());
    if (!match.hasMatch()) {
        return std::nullopt;
    }

    ObisCode code;
    for (int group = 1; group <= 6; ++group) {
        const QString part = match.captured(group);
        if (part.isEmpty()) {
            code.bytes[group - 1] = 255;
            continue;
        }
        const uint value = part.toUInt();
        if (value > 255) {
            return std::nullopt;
        }
        code.bytes[group - 1] = static_cast<uint8_t>(value);
    }
    return code;
}

bool operator==(const ObisCode &lhs, const ObisCode &rhs) {
    return lhs.bytes == rhs.bytes;
}

bool operator!=(const ObisCode &lhs, const ObisCode &rhs) {
    return !(lhs == rhs);
}

const char *unit_symbol(uint8_t unit) {
    if (unit < kUnitCount) {
        return kUnitSymbols[unit];
    }
    if (unit == 255) {
        return "count";
    }
    return nullptr;
}

}  // namespace han::cosem
