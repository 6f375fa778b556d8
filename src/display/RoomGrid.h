#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The DikuMapper Authors

#include "../global/macros.h"
#include "../map/coordinate.h"

#include <map>

class Map;
class Room;

// What occupies one cell of the 2D layout.
struct NODISCARD RoomMarker final
{
    // null for an exit nobody has walked through yet
    const Room *room = nullptr;

    NODISCARD bool isUnexplored() const { return room == nullptr; }
};

using RoomGrid = std::map<Coordinate2i, RoomMarker>;

// Characters per room horizontally (glyph plus a two-column connector) and
// lines per room vertically (room line plus connector line).
static constexpr const int ROOM_COLUMN_PITCH = 3;
static constexpr const int ROOM_ROW_PITCH = 2;

// The cells that fit into width x height characters, centered on (0,0).
NODISCARD extern GridBounds viewportBounds(int width, int height, int columnPitch = ROOM_COLUMN_PITCH);

// Breadth-first layout starting with the origin room at (0,0). Only north,
// south, east and west move the coordinate; up, down and the diagonals are
// drawn on the room itself. A cell keeps whatever claimed it first, so loops
// that don't close on a flat grid can't overwrite each other.
//
// Cells outside the viewport are left out of the result; pass the pitch the
// grid will be printed with.
NODISCARD extern RoomGrid buildRoomGrid(const Map &map,
                                        const Room &origin,
                                        int viewportWidth,
                                        int viewportHeight,
                                        int columnPitch = ROOM_COLUMN_PITCH);
