#include "telegram_format.hpp"

#include <QtCore/QByteArray>

#include <type_traits>

namespace han {

namespace {

QString format_children(const Telegram &telegram, const cosem::NodeRange &children) {
    QStringList parts;
    for (std::size_t i = 0; i < children.count; ++i) {
        parts.append(format_value(telegram, telegram.store().child(children, i)));
    }
    return parts.join(QStringLiteral(", "));
}

bool printable(std::string_view text) {
    for (const char ch : text) {
        if (static_cast<unsigned char>(ch) < 0x20 || static_cast<unsigned char>(ch) > 0x7E) {
            return false;
        }
    }
    return true;
}

QString address_text(const protocol::HdlcAddress &address) {
    return QStringLiteral("0x%1").arg(address.value, 0, 16);
}

}  // namespace

QString format_value(const Telegram &telegram, const cosem::Value &value) {
    return std::visit(
        [&telegram](const auto &v) -> QString {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, cosem::Null>) {
                return QStringLiteral("null");
            } else if constexpr (std::is_same_v<T, bool>) {
                return v ? QStringLiteral("true") : QStringLiteral("false");
            } else if constexpr (std::is_same_v<T, cosem::UnsignedInt>) {
                return QString::number(static_cast<qulonglong>(v.value));
            } else if constexpr (std::is_same_v<T, cosem::SignedInt>) {
                return QString::number(static_cast<qlonglong>(v.value));
            } else if constexpr (std::is_same_v<T, cosem::Enumerated>) {
                return QStringLiteral("enum(%1)").arg(int(v.value));
            } else if constexpr (std::is_same_v<T, cosem::Float>) {
                return QString::number(v.value);
            } else if constexpr (std::is_same_v<T, cosem::OctetString>) {
                const std::string_view bytes = telegram.bytes(v);
                const QByteArray raw(bytes.data(), static_cast<int>(bytes.size()));
                if (!bytes.empty() && printable(bytes)) {
                    return QStringLiteral("\"%1\"").arg(QString::fromLatin1(raw));
                }
                return QString::fromLatin1(raw.toHex(' ').toUpper());
            } else if constexpr (std::is_same_v<T, cosem::VisibleString>) {
                const std::string_view text = telegram.text(v);
                return QStringLiteral("\"%1\"").arg(QString::fromUtf8(text.data(), static_cast<int>(text.size())));
            } else if constexpr (std::is_same_v<T, cosem::DateTime>) {
                return v.value.toString();
            } else if constexpr (std::is_same_v<T, cosem::Array>) {
                return QStringLiteral("[%1]").arg(format_children(telegram, v.children));
            } else {
                return QStringLiteral("{%1}").arg(format_children(telegram, v.children));
            }
        },
        value);
}

QString format_entry(const Telegram &telegram, const EntrySlot &slot) {
    if (!slot.ok()) {
        return QStringLiteral("%1 <%2>").arg(slot.entry.code.toString(), QString::fromLatin1(to_string(slot.error)));
    }

    QString line = QStringLiteral("%1 = %2").arg(slot.entry.code.toString(), format_value(telegram, slot.entry.value));
    if (slot.entry.scalerUnit) {
        const auto scaled = scaled_value(slot.entry);
        const char *unit = cosem::unit_symbol(slot.entry.scalerUnit->unit);
        if (scaled) {
            line.append(QStringLiteral(" -> %1").arg(*scaled));
        }
        if (unit) {
            line.append(QLatin1Char(' '));
            line.append(QString::fromUtf8(unit));
        }
    }
    return line;
}

QStringList format_telegram(const Telegram &telegram) {
    QStringList lines;
    const QString when = telegram.timestamp() ? telegram.timestamp()->toString() : QStringLiteral("no timestamp");
    lines.append(QStringLiteral("telegram %1 invoke=0x%2 dst=%3 src=%4 entries=%5/%6")
                     .arg(when)
                     .arg(telegram.invokeId(), 8, 16, QLatin1Char('0'))
                     .arg(address_text(telegram.header().destination), address_text(telegram.header().source))
                     .arg(telegram.entryCount())
                     .arg(telegram.declaredEntryCount()));
    for (const EntrySlot &slot : telegram) {
        lines.append(QStringLiteral("  ") + format_entry(telegram, slot));
    }
    if (telegram.droppedEntryCount() > 0) {
        lines.append(QStringLiteral("  (%1 entries dropped)").arg(telegram.droppedEntryCount()));
    }
    return lines;
}

}  // namespace han
