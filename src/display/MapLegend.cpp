// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The DikuMapper Authors

#include "MapLegend.h"

#include "../map/Map.h"
#include "../map/room.h"
#include "../mapdata/shortestpath.h"

#include <unordered_set>

namespace { // anonymous

NODISCARD std::unordered_set<RoomId> visibleSet(const Map &map,
                                               const int width,
                                               const int height,
                                               const int columnPitch)
{
    std::unordered_set<RoomId> result;
    for (const RoomId &id : visibleRoomIds(map, width, height, columnPitch)) {
        result.insert(id);
    }
    return result;
}

} // namespace

const Room *MapLegend::findByNumber(const int number) const
{
    for (const LegendEntry &entry : entries) {
        if (entry.number == number) {
            return entry.room;
        }
    }
    return nullptr;
}

MapLegend buildNearbyLegend(const Map &map, const int maxDistance, const int width, const int height)
{
    MapLegend legend;
    const auto nearby = PathFinder{map}.findNearbyRooms(maxDistance);
    if (!nearby) {
        return legend;
    }

    // numbers never exceed the candidate count, so clip at the pitch that count needs
    legend.columnPitch = columnPitchForNumber(static_cast<int>(nearby->size()));
    const auto visible = visibleSet(map, width, height, legend.columnPitch);
    int number = 0;
    for (const NearbyRoom &nr : *nearby) {
        const RoomId &id = nr.room->getId();
        if (visible.count(id) == 0) {
            continue;
        }
        ++number;
        legend.numbers.emplace(id, number);
        legend.entries.push_back(LegendEntry{number, nr.room, nr.distance});
    }
    return legend;
}

MapLegend buildDurableLegend(const Map &map, const int width, const int height)
{
    MapLegend legend;
    const auto &numbering = map.getRoomNumbering();
    legend.columnPitch = columnPitchForNumber(static_cast<int>(numbering.size()));
    const auto visible = visibleSet(map, width, height, legend.columnPitch);
    if (visible.empty()) {
        return legend;
    }

    for (size_t i = 0; i < numbering.size(); ++i) {
        const RoomId &id = numbering[i];
        const Room *const room = map.findRoom(id);
        if (room == nullptr || visible.count(id) == 0) {
            continue;
        }
        const int number = static_cast<int>(i) + 1;
        legend.numbers.emplace(id, number);
        legend.entries.push_back(LegendEntry{number, room, 0});
    }
    return legend;
}
