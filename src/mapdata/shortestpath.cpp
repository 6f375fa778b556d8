// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The DikuMapper Authors

#include "shortestpath.h"

#include "../global/logging.h"
#include "../global/utils.h"
#include "../map/Map.h"
#include "../map/room.h"

#include <algorithm>
#include <queue>
#include <unordered_set>

std::vector<SPNode> shortestPathSearch(const Map &map,
                                       const RoomId &origin,
                                       const int maxDistance,
                                       const RoomId &target)
{
    std::vector<SPNode> sp_nodes;
    if (map.findRoom(origin) == nullptr) {
        return sp_nodes;
    }

    std::unordered_set<RoomId> visited;
    std::queue<int> future_paths;
    sp_nodes.push_back(SPNode{origin, -1, 0, QString{}});
    visited.insert(origin);
    future_paths.push(0);

    if (target && origin == target) {
        return sp_nodes;
    }

    while (!future_paths.empty()) {
        const int spindex = future_paths.front();
        future_paths.pop();

        // copies, since sp_nodes may reallocate below
        const RoomId thisId = sp_nodes[static_cast<size_t>(spindex)].room;
        const int thisdist = sp_nodes[static_cast<size_t>(spindex)].dist;
        if (maxDistance >= 0 && thisdist >= maxDistance) {
            continue;
        }

        const Room &thisr = map.getRoom(thisId);
        for (const QString &dir : thisr.getSortedExitDirections()) {
            const std::optional<ExitTarget> exit = thisr.getExit(dir);
            const ExitTarget &e = deref(exit);
            if (e.isUnexplored()) {
                continue;
            }

            const RoomId &nextrId = e.getRoomId();
            if (map.findRoom(nextrId) == nullptr) {
                DMLOG_WARNING() << "Room " << thisId.toQString() << " has a " << dir
                                << " exit to a room that does not exist: " << nextrId.toQString();
                continue;
            }
            if (visited.count(nextrId) != 0) {
                continue;
            }

            visited.insert(nextrId);
            sp_nodes.push_back(SPNode{nextrId, spindex, thisdist + 1, dir});
            if (target && nextrId == target) {
                return sp_nodes;
            }
            future_paths.push(static_cast<int>(sp_nodes.size()) - 1);
        }
    }
    return sp_nodes;
}

std::optional<int> bfsDistance(const Map &map, const RoomId &from, const RoomId &to)
{
    if (!from || !to) {
        return std::nullopt;
    }
    const auto nodes = shortestPathSearch(map, from, -1, to);
    if (nodes.empty() || nodes.back().room != to) {
        return std::nullopt;
    }
    return nodes.back().dist;
}

std::optional<std::vector<SPNode>> PathFinder::searchTrail(const RoomId &target) const
{
    const RoomId &origin = m_map.getCurrentRoomId();
    if (!origin || !target) {
        return std::nullopt;
    }

    const auto nodes = shortestPathSearch(m_map, origin, -1, target);
    if (nodes.empty() || nodes.back().room != target) {
        return std::nullopt;
    }

    // walk back from the target to the origin, then flip
    std::vector<SPNode> trail;
    for (int i = static_cast<int>(nodes.size()) - 1; i > 0;) {
        const SPNode &node = nodes[static_cast<size_t>(i)];
        trail.push_back(node);
        i = node.parent;
    }
    std::reverse(trail.begin(), trail.end());
    return trail;
}

std::optional<std::vector<QString>> PathFinder::findPath(const RoomId &target) const
{
    auto trail = searchTrail(target);
    if (!trail) {
        return std::nullopt;
    }

    std::vector<QString> result;
    result.reserve(trail->size());
    for (const SPNode &node : *trail) {
        result.push_back(node.lastdir);
    }
    return result;
}

std::optional<std::vector<PathStep>> PathFinder::findPathWithRooms(const RoomId &target) const
{
    auto trail = searchTrail(target);
    if (!trail) {
        return std::nullopt;
    }

    std::vector<PathStep> result;
    result.reserve(trail->size());
    for (const SPNode &node : *trail) {
        result.push_back(PathStep{node.lastdir, m_map.getRoom(node.room).getTitle()});
    }
    return result;
}

std::optional<std::vector<NearbyRoom>> PathFinder::findNearbyRooms(const int maxDistance) const
{
    const RoomId &origin = m_map.getCurrentRoomId();
    if (m_map.findRoom(origin) == nullptr) {
        return std::nullopt;
    }

    std::vector<NearbyRoom> result;
    if (maxDistance <= 0) {
        return result;
    }

    for (const SPNode &node : shortestPathSearch(m_map, origin, maxDistance)) {
        if (node.parent < 0) {
            continue;
        }
        result.push_back(NearbyRoom{&m_map.getRoom(node.room), node.dist});
    }

    std::stable_sort(result.begin(), result.end(), [](const NearbyRoom &a, const NearbyRoom &b) {
        if (a.distance != b.distance) {
            return a.distance < b.distance;
        }
        return a.room->getTitle() < b.room->getTitle();
    });
    return result;
}
