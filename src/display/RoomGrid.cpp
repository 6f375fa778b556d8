// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The DikuMapper Authors

#include "RoomGrid.h"

#include "../global/utils.h"
#include "../map/ExitDirection.h"
#include "../map/Map.h"
#include "../map/room.h"

#include <algorithm>
#include <queue>
#include <unordered_set>

GridBounds viewportBounds(const int width, const int height, const int columnPitch)
{
    const int roomsPerLine = std::max(0, width) / std::max(1, columnPitch);
    const int roomsPerColumn = std::max(0, height) / ROOM_ROW_PITCH;
    const int halfWidth = roomsPerLine / 2;
    const int halfHeight = roomsPerColumn / 2;
    return GridBounds{Coordinate2i{-halfWidth, -halfHeight}, Coordinate2i{halfWidth, halfHeight}};
}

RoomGrid buildRoomGrid(const Map &map,
                       const Room &origin,
                       const int viewportWidth,
                       const int viewportHeight,
                       const int columnPitch)
{
    struct NODISCARD QueueItem final
    {
        const Room *room = nullptr;
        Coordinate2i coord;
    };

    RoomGrid layout;
    std::unordered_set<RoomId> visited;
    std::queue<QueueItem> queue;

    layout.emplace(Coordinate2i{}, RoomMarker{&origin});
    visited.insert(origin.getId());
    queue.push(QueueItem{&origin, Coordinate2i{}});

    while (!queue.empty()) {
        const QueueItem item = queue.front();
        queue.pop();

        const Room &room = deref(item.room);
        for (const QString &dir : room.getSortedExitDirections()) {
            const ExitDirEnum e = dirForName(dir);
            if (!isNESW(e)) {
                continue;
            }

            const Coordinate2i next = item.coord + gridOffset(e);
            if (layout.find(next) != layout.end()) {
                continue;
            }

            const std::optional<ExitTarget> exit = room.getExit(dir);
            const Room *const dest = map.findRoom(deref(exit).getRoomIdOrInvalid());
            layout.emplace(next, RoomMarker{dest});
            if (dest != nullptr && visited.insert(dest->getId()).second) {
                queue.push(QueueItem{dest, next});
            }
        }
    }

    const GridBounds bounds = viewportBounds(viewportWidth, viewportHeight, columnPitch);
    RoomGrid result;
    for (const auto &[coord, marker] : layout) {
        if (bounds.contains(coord)) {
            result.emplace(coord, marker);
        }
    }
    return result;
}
