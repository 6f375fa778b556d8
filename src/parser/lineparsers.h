#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The DikuMapper Authors

#include "../global/macros.h"

#include <optional>

#include <QStringList>

class QString;

namespace InventoryParser {
// Finds the last "You are carrying:" header and returns the non-empty lines
// between it and the next prompt; nullopt until that prompt has arrived.
NODISCARD extern std::optional<QStringList> parse(const QStringList &lines);
} // namespace InventoryParser

namespace MoveFailedParser {
NODISCARD extern bool parse(const QString &line);
}

namespace RecallParser {
// Recall teleports the player, so the next room must not be linked as a move.
NODISCARD extern bool parse(const QString &line);
} // namespace RecallParser
