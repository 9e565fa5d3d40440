#pragma once

#include "telegram.hpp"

#include <QtCore/QString>
#include <QtCore/QStringList>

namespace han {

QString format_value(const Telegram &telegram, const cosem::Value &value);
QString format_entry(const Telegram &telegram, const EntrySlot &slot);
// Summary line followed by one line per entry slot.
QStringList format_telegram(const Telegram &telegram);

}  // namespace han
