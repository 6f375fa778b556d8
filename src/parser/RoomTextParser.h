#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The DikuMapper Authors

#include "../global/macros.h"

#include <optional>
#include <vector>

#include <QString>
#include <QStringList>

// A room candidate extracted from the game output.
struct NODISCARD RoomInfo final
{
    QString title;
    QString description;
    // full direction names, in the order the game listed them
    std::vector<QString> exits;
    // human-readable trace of the parser's decisions, if requested
    QString debugInfo;

    // Set for the bracketed format, where the room text sits between a "--<"
    // line and a ">--" line. The indices refer to the input lines, so the
    // caller can hide the marker lines from display.
    bool isBracketed = false;
    int bracketStartIdx = -1;
    int bracketEndIdx = -1;
};

struct NODISCARD RoomParserOptions final
{
    // how many lines above the exits line may belong to the room
    int backwardLineBudget = 15;
    bool debugTrace = false;
};

namespace RoomTextParser {

// Recognizes "Exits: a, b", "[ Exits: n s e ]", "Obvious exits: a and b"
// and the compact form inside a prompt ("...Exits:N(S)E>", where a letter in
// parentheses is a closed door). Returns nullopt if the line isn't an exits
// line at all, and an empty list if it is one without any known direction.
NODISCARD extern std::optional<std::vector<QString>> parseExitsLine(const QString &line);

NODISCARD extern bool isStatusOrCombatLine(const QString &line);
NODISCARD extern bool isRoomTitle(const QString &line);

// Looks for the most recent room in the window of recent lines; nullopt means
// there's nothing to merge. If trace is given, it receives the decision trace
// even when no room is found.
NODISCARD extern std::optional<RoomInfo> parseRoomInfo(const QStringList &lines,
                                                       const RoomParserOptions &options = {},
                                                       QString *trace = nullptr);

// Only the bracketed-format detector; display code runs it on every batch
// of output to find the marker lines.
NODISCARD extern std::optional<RoomInfo> parseBarsoomRoomOnly(const QStringList &lines,
                                                              bool debugTrace = false);

} // namespace RoomTextParser
