#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The DikuMapper Authors

#include "../global/macros.h"
#include "../map/roomid.h"

#include <optional>
#include <vector>

#include <QString>

class Map;
class Room;

// One node of a breadth-first search tree; parent is an index into the
// same vector (-1 for the origin).
struct NODISCARD SPNode final
{
    RoomId room;
    int parent = -1;
    int dist = 0;
    QString lastdir;
};

// Unweighted breadth-first search from origin over explored exits only,
// visiting exits in canonical direction order, so the first path found to
// any room is the reproducible one.
//
// A negative maxDistance means unbounded. If target is valid, the search
// stops as soon as it has been reached (it is then the last node).
NODISCARD extern std::vector<SPNode> shortestPathSearch(const Map &map,
                                                        const RoomId &origin,
                                                        int maxDistance = -1,
                                                        const RoomId &target = INVALID_ROOMID);

// Hop count from one room to another, or nullopt when unreachable.
NODISCARD extern std::optional<int> bfsDistance(const Map &map, const RoomId &from, const RoomId &to);

struct NODISCARD PathStep final
{
    QString direction;
    QString roomTitle;
};

struct NODISCARD NearbyRoom final
{
    const Room *room = nullptr;
    int distance = 0;
};

// Route queries relative to the map's current room.
class NODISCARD PathFinder final
{
private:
    const Map &m_map;

public:
    explicit PathFinder(const Map &map)
        : m_map{map}
    {}

public:
    // Empty when already at the target; nullopt when there is no current
    // room or the target can't be reached.
    NODISCARD std::optional<std::vector<QString>> findPath(const RoomId &target) const;
    NODISCARD std::optional<std::vector<PathStep>> findPathWithRooms(const RoomId &target) const;

    // Every room within maxDistance hops, excluding the current room, sorted
    // by distance and then by title. nullopt when there is no current room.
    NODISCARD std::optional<std::vector<NearbyRoom>> findNearbyRooms(int maxDistance) const;

private:
    NODISCARD std::optional<std::vector<SPNode>> searchTrail(const RoomId &target) const;
};
