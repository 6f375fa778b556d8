#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The DikuMapper Authors

#include "../global/macros.h"

#include <array>
#include <cstdint>
#include <vector>

#include <QString>
#include <glm/glm.hpp>

// Canonical movement directions. The order of the enum is the canonical
// iteration order used by every search and layout over a room's exits.
enum class NODISCARD ExitDirEnum : uint8_t {
    NORTH = 0,
    SOUTH,
    EAST,
    WEST,
    UP,
    DOWN,
    NORTHEAST,
    NORTHWEST,
    SOUTHEAST,
    SOUTHWEST,
    UNKNOWN
};

static constexpr const uint32_t NUM_EXITS_NESW = 4u;
static constexpr const uint32_t NUM_EXITS_NESWUD = 6u;
static constexpr const uint32_t NUM_EXITS = 10u;

namespace enums {
NODISCARD const std::array<ExitDirEnum, NUM_EXITS_NESW> &getAllExitsNESW();
NODISCARD const std::array<ExitDirEnum, NUM_EXITS> &getAllExits();

#define ALL_EXITS_NESW enums::getAllExitsNESW()
#define ALL_EXITS enums::getAllExits()
} // namespace enums

NODISCARD extern bool isNESW(ExitDirEnum dir);
NODISCARD extern bool isUpDown(ExitDirEnum dir);
NODISCARD extern bool isDiagonal(ExitDirEnum dir);
NODISCARD extern ExitDirEnum opposite(ExitDirEnum in);
NODISCARD extern const char *lowercaseDirection(ExitDirEnum dir);

// Accepts full names and the short aliases (n, s, e, w, u, d, ne, nw, se, sw),
// case-insensitively. Anything else is UNKNOWN.
NODISCARD extern ExitDirEnum dirForName(const QString &name);

// Only the four cardinal directions move a room on the 2D grid
// (north is y-1, south is y+1); every other direction yields (0,0).
NODISCARD extern glm::ivec2 gridOffset(ExitDirEnum dir);

namespace Directions {

// "n" -> "north", etc. Names that are not single-letter aliases come back lowercased.
NODISCARD extern QString expandAlias(const QString &name);

// True for any canonical direction name or alias.
NODISCARD extern bool isValidDirection(const QString &name);

// The structurally opposite direction, preserving the form of the input
// (ne <-> sw, northeast <-> southwest). Returns an empty string for names
// outside the fixed table, including single-letter aliases.
NODISCARD extern QString reverse(const QString &name);

// Canonical order: north, south, east, west, up, down, then everything else
// alphabetically. Short aliases sort with their full names.
NODISCARD extern bool lessThan(const QString &a, const QString &b);
extern void sortCanonical(std::vector<QString> &dirs);

// Returns the full direction name if the command is a bare direction
// or any of its aliases (including ne, nw, se, sw), otherwise an empty string.
NODISCARD extern QString detectMovement(const QString &command);

} // namespace Directions
