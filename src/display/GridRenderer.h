#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The DikuMapper Authors

#include "../global/macros.h"
#include "../map/roomid.h"
#include "RoomGrid.h"

#include <map>
#include <utility>
#include <vector>

#include <QString>

class Map;

// room id -> number shown instead of the room glyph
using RoomLegend = std::map<RoomId, int>;

namespace GridGlyphs {
// UTF-8
static constexpr const char *const CURRENT_ROOM = u8"\u25A3";
static constexpr const char *const VISITED_ROOM = u8"\u25A2";
static constexpr const char *const UNEXPLORED = u8"\u25A6";
static constexpr const char *const UP_AND_DOWN = u8"\u21C5";
static constexpr const char *const UP_ONLY = u8"\u21F1";
static constexpr const char *const DOWN_ONLY = u8"\u21F2";
static constexpr const char *const HORIZONTAL = u8"\u2500\u2500";
static constexpr const char *const VERTICAL = u8"\u2502";
} // namespace GridGlyphs

// Column pitch needed to print numbers up to maxNumber.
NODISCARD extern int columnPitchForNumber(int maxNumber);
// Column pitch needed to print the largest legend number.
NODISCARD extern int columnPitchForLegend(const RoomLegend *legend);

// Text rendering of a layout: a room line and a connector line per grid row,
// centered on (0,0). Connectors are drawn when the exit records of either
// side agree that the two cells are connected.
//
// The column pitch is the larger of minColumnPitch and what the legend needs.
NODISCARD extern QString renderGrid(const RoomGrid &grid,
                                    int width,
                                    int height,
                                    const RoomLegend *legend = nullptr,
                                    int minColumnPitch = ROOM_COLUMN_PITCH);

// Returns the rendered map and the current room's title;
// "(exploring...)" and an empty title when there is no current room yet.
NODISCARD extern std::pair<QString, QString> renderMap(const Map &map,
                                                       int width,
                                                       int height,
                                                       const RoomLegend *legend = nullptr,
                                                       int minColumnPitch = ROOM_COLUMN_PITCH);

// Known rooms that would be drawn in a width x height viewport, in layout order.
NODISCARD extern std::vector<RoomId> visibleRoomIds(const Map &map,
                                                    int width,
                                                    int height,
                                                    int columnPitch = ROOM_COLUMN_PITCH);

// UP_AND_DOWN, UP_ONLY, DOWN_ONLY or an empty string.
NODISCARD extern QString verticalExitsGlyph(bool hasUp, bool hasDown);
