// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The DikuMapper Authors

#include "ExitDirection.h"

#include <algorithm>
#include <utility>

namespace enums {
const std::array<ExitDirEnum, NUM_EXITS_NESW> &getAllExitsNESW()
{
    static const std::array<ExitDirEnum, NUM_EXITS_NESW> g_all_exits{ExitDirEnum::NORTH,
                                                                     ExitDirEnum::SOUTH,
                                                                     ExitDirEnum::EAST,
                                                                     ExitDirEnum::WEST};
    return g_all_exits;
}

const std::array<ExitDirEnum, NUM_EXITS> &getAllExits()
{
    static const std::array<ExitDirEnum, NUM_EXITS> g_all_exits{ExitDirEnum::NORTH,
                                                                ExitDirEnum::SOUTH,
                                                                ExitDirEnum::EAST,
                                                                ExitDirEnum::WEST,
                                                                ExitDirEnum::UP,
                                                                ExitDirEnum::DOWN,
                                                                ExitDirEnum::NORTHEAST,
                                                                ExitDirEnum::NORTHWEST,
                                                                ExitDirEnum::SOUTHEAST,
                                                                ExitDirEnum::SOUTHWEST};
    return g_all_exits;
}
} // namespace enums

bool isNESW(const ExitDirEnum dir)
{
    switch (dir) {
    case ExitDirEnum::NORTH:
    case ExitDirEnum::SOUTH:
    case ExitDirEnum::EAST:
    case ExitDirEnum::WEST:
        return true;
    default:
        return false;
    }
}

bool isUpDown(const ExitDirEnum dir)
{
    return dir == ExitDirEnum::UP || dir == ExitDirEnum::DOWN;
}

bool isDiagonal(const ExitDirEnum dir)
{
    switch (dir) {
    case ExitDirEnum::NORTHEAST:
    case ExitDirEnum::NORTHWEST:
    case ExitDirEnum::SOUTHEAST:
    case ExitDirEnum::SOUTHWEST:
        return true;
    default:
        return false;
    }
}

ExitDirEnum opposite(const ExitDirEnum in)
{
#define PAIR(A, B) \
    case ExitDirEnum::A: \
        return ExitDirEnum::B; \
    case ExitDirEnum::B: \
        return ExitDirEnum::A
    switch (in) {
        PAIR(NORTH, SOUTH);
        PAIR(WEST, EAST);
        PAIR(UP, DOWN);
        PAIR(NORTHEAST, SOUTHWEST);
        PAIR(NORTHWEST, SOUTHEAST);
    case ExitDirEnum::UNKNOWN:
        break;
    }
    return ExitDirEnum::UNKNOWN;
#undef PAIR
}

const char *lowercaseDirection(const ExitDirEnum dir)
{
#define X_CASE(UPPER, lower) \
    case ExitDirEnum::UPPER: \
        return #lower
    switch (dir) {
        X_CASE(NORTH, north);
        X_CASE(SOUTH, south);
        X_CASE(EAST, east);
        X_CASE(WEST, west);
        X_CASE(UP, up);
        X_CASE(DOWN, down);
        X_CASE(NORTHEAST, northeast);
        X_CASE(NORTHWEST, northwest);
        X_CASE(SOUTHEAST, southeast);
        X_CASE(SOUTHWEST, southwest);
    case ExitDirEnum::UNKNOWN:
        break;
    }
    return "unknown";
#undef X_CASE
}

ExitDirEnum dirForName(const QString &name)
{
    static const std::array<std::pair<const char *, ExitDirEnum>, 20> g_names{{
        {"north", ExitDirEnum::NORTH},
        {"n", ExitDirEnum::NORTH},
        {"south", ExitDirEnum::SOUTH},
        {"s", ExitDirEnum::SOUTH},
        {"east", ExitDirEnum::EAST},
        {"e", ExitDirEnum::EAST},
        {"west", ExitDirEnum::WEST},
        {"w", ExitDirEnum::WEST},
        {"up", ExitDirEnum::UP},
        {"u", ExitDirEnum::UP},
        {"down", ExitDirEnum::DOWN},
        {"d", ExitDirEnum::DOWN},
        {"northeast", ExitDirEnum::NORTHEAST},
        {"ne", ExitDirEnum::NORTHEAST},
        {"northwest", ExitDirEnum::NORTHWEST},
        {"nw", ExitDirEnum::NORTHWEST},
        {"southeast", ExitDirEnum::SOUTHEAST},
        {"se", ExitDirEnum::SOUTHEAST},
        {"southwest", ExitDirEnum::SOUTHWEST},
        {"sw", ExitDirEnum::SOUTHWEST},
    }};

    const QString lower = name.trimmed().toLower();
    for (const auto &[str, dir] : g_names) {
        if (lower == QLatin1String(str)) {
            return dir;
        }
    }
    return ExitDirEnum::UNKNOWN;
}

glm::ivec2 gridOffset(const ExitDirEnum dir)
{
    switch (dir) {
    case ExitDirEnum::NORTH:
        return glm::ivec2{0, -1};
    case ExitDirEnum::SOUTH:
        return glm::ivec2{0, 1};
    case ExitDirEnum::EAST:
        return glm::ivec2{1, 0};
    case ExitDirEnum::WEST:
        return glm::ivec2{-1, 0};
    default:
        return glm::ivec2{0, 0};
    }
}

namespace Directions {

QString expandAlias(const QString &name)
{
    const QString lower = name.trimmed().toLower();
    if (lower.length() == 1) {
        const ExitDirEnum dir = dirForName(lower);
        if (dir != ExitDirEnum::UNKNOWN) {
            return QString::fromLatin1(lowercaseDirection(dir));
        }
    }
    return lower;
}

bool isValidDirection(const QString &name)
{
    return dirForName(name) != ExitDirEnum::UNKNOWN;
}

QString reverse(const QString &name)
{
    static const std::array<std::pair<const char *, const char *>, 14> g_reverse{{
        {"north", "south"},
        {"south", "north"},
        {"east", "west"},
        {"west", "east"},
        {"up", "down"},
        {"down", "up"},
        {"ne", "sw"},
        {"nw", "se"},
        {"se", "nw"},
        {"sw", "ne"},
        {"northeast", "southwest"},
        {"northwest", "southeast"},
        {"southeast", "northwest"},
        {"southwest", "northeast"},
    }};

    const QString lower = name.toLower();
    for (const auto &[from, to] : g_reverse) {
        if (lower == QLatin1String(from)) {
            return QString::fromLatin1(to);
        }
    }
    return QString{};
}

namespace { // anonymous
NODISCARD int priority(const QString &dir)
{
    const ExitDirEnum e = dirForName(dir);
    if (e == ExitDirEnum::UNKNOWN || isDiagonal(e)) {
        return static_cast<int>(NUM_EXITS_NESWUD);
    }
    return static_cast<int>(e);
}
} // namespace

bool lessThan(const QString &a, const QString &b)
{
    const int pa = priority(a);
    const int pb = priority(b);
    if (pa != pb) {
        return pa < pb;
    }
    return a < b;
}

void sortCanonical(std::vector<QString> &dirs)
{
    std::sort(dirs.begin(), dirs.end(), &lessThan);
}

QString detectMovement(const QString &command)
{
    const ExitDirEnum dir = dirForName(command.trimmed());
    if (dir == ExitDirEnum::UNKNOWN) {
        return QString{};
    }
    return QString::fromLatin1(lowercaseDirection(dir));
}

} // namespace Directions
