#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The DikuMapper Authors

#include "../global/macros.h"
#include "GridRenderer.h"

#include <vector>

class Map;
class Room;

struct NODISCARD LegendEntry final
{
    int number = 0;
    const Room *room = nullptr;
    // only set for the nearby legend
    int distance = 0;
};

// Numbers printed on the map in place of room glyphs, plus the same rooms as
// a list for the room panel.
struct NODISCARD MapLegend final
{
    RoomLegend numbers;
    std::vector<LegendEntry> entries;
    // the viewport was clipped at this pitch; render with it too
    int columnPitch = ROOM_COLUMN_PITCH;

    NODISCARD bool empty() const { return entries.empty(); }
    // The room the user means by a number from this legend, or null.
    NODISCARD const Room *findByNumber(int number) const;
};

// Rooms within maxDistance hops that are visible in the viewport, numbered
// 1..n by distance (then title).
NODISCARD extern MapLegend buildNearbyLegend(const Map &map, int maxDistance, int width, int height);

// Rooms visible in the viewport, labelled with their durable room numbers.
NODISCARD extern MapLegend buildDurableLegend(const Map &map, int width, int height);
