#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The DikuMapper Authors

#include "../global/macros.h"

#include <glm/glm.hpp>

// Grid position of a room in the rendered map: x grows east, y grows south.
struct NODISCARD Coordinate2i final
{
public:
    int x = 0;
    int y = 0;

public:
    Coordinate2i() = default;
    explicit Coordinate2i(const int x_, const int y_)
        : x{x_}
        , y{y_}
    {}
    explicit Coordinate2i(const glm::ivec2 &rhs)
        : x{rhs.x}
        , y{rhs.y}
    {}

    NODISCARD Coordinate2i operator+(const glm::ivec2 &rhs) const
    {
        return Coordinate2i{to_ivec2() + rhs};
    }

    NODISCARD bool operator==(const Coordinate2i &rhs) const { return x == rhs.x && y == rhs.y; }
    NODISCARD bool operator!=(const Coordinate2i &rhs) const { return !(*this == rhs); }
    // row-major, so sorted coordinates read like the rendered text
    NODISCARD bool operator<(const Coordinate2i &rhs) const
    {
        return (y != rhs.y) ? (y < rhs.y) : (x < rhs.x);
    }

    NODISCARD bool isOrigin() const { return x == 0 && y == 0; }
    NODISCARD glm::ivec2 to_ivec2() const { return glm::ivec2{x, y}; }
};

// Inclusive rectangle of grid coordinates.
struct NODISCARD GridBounds final
{
    Coordinate2i min;
    Coordinate2i max;

    NODISCARD bool contains(const Coordinate2i &c) const
    {
        return min.x <= c.x && c.x <= max.x && min.y <= c.y && c.y <= max.y;
    }
};
