// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The DikuMapper Authors

#include "GridRenderer.h"

#include "../map/ExitDirection.h"
#include "../map/Map.h"
#include "../map/room.h"

#include <algorithm>
#include <optional>
#include <unordered_set>

#include <QStringList>

namespace { // anonymous

NODISCARD const RoomMarker *findMarker(const RoomGrid &grid, const Coordinate2i &c)
{
    const auto it = grid.find(c);
    return (it == grid.end()) ? nullptr : &it->second;
}

// Does `from` have an exit in `dir` that leads to whatever is in `to`?
NODISCARD bool exitReaches(const RoomMarker &from, const ExitDirEnum dir, const RoomMarker &to)
{
    if (from.isUnexplored()) {
        return false;
    }
    const Room &room = *from.room;
    for (const auto &[name, target] : room.getExits()) {
        if (dirForName(name) != dir) {
            continue;
        }
        if (to.isUnexplored() || target.leadsTo(to.room->getId())) {
            return true;
        }
    }
    return false;
}

NODISCARD bool isConnected(const RoomMarker *a, const ExitDirEnum dir, const RoomMarker *b)
{
    if (a == nullptr || b == nullptr) {
        return false;
    }
    return exitReaches(*a, dir, *b) || exitReaches(*b, opposite(dir), *a);
}

NODISCARD QString roomGlyph(const RoomMarker &marker, const bool isCurrent, const RoomLegend *legend)
{
    if (marker.isUnexplored()) {
        return QString::fromUtf8(GridGlyphs::UNEXPLORED);
    }

    const Room &room = *marker.room;
    if (legend != nullptr) {
        const auto it = legend->find(room.getId());
        if (it != legend->end()) {
            return QString::number(it->second);
        }
    } else {
        const QString vertical = verticalExitsGlyph(room.hasUpExit(), room.hasDownExit());
        if (!vertical.isEmpty()) {
            return vertical;
        }
    }
    return QString::fromUtf8(isCurrent ? GridGlyphs::CURRENT_ROOM : GridGlyphs::VISITED_ROOM);
}

} // namespace

int columnPitchForNumber(const int maxNumber)
{
    if (maxNumber >= 100) {
        return ROOM_COLUMN_PITCH + 2;
    } else if (maxNumber >= 10) {
        return ROOM_COLUMN_PITCH + 1;
    }
    return ROOM_COLUMN_PITCH;
}

int columnPitchForLegend(const RoomLegend *const legend)
{
    if (legend == nullptr) {
        return ROOM_COLUMN_PITCH;
    }

    int maxNumber = 0;
    for (const auto &kv : *legend) {
        maxNumber = std::max(maxNumber, kv.second);
    }
    return columnPitchForNumber(maxNumber);
}

QString renderGrid(const RoomGrid &grid,
                   const int width,
                   const int height,
                   const RoomLegend *const legend,
                   const int minColumnPitch)
{
    const int pitch = std::max(minColumnPitch, columnPitchForLegend(legend));
    const int cellWidth = pitch - 2;
    const GridBounds bounds = viewportBounds(width, height, pitch);

    const QString horizontal = QString::fromUtf8(GridGlyphs::HORIZONTAL);
    const QString vertical = QString::fromUtf8(GridGlyphs::VERTICAL);
    const QString noHorizontal(2, QChar::Space);

    QStringList lines;
    for (int y = bounds.min.y; y <= bounds.max.y; ++y) {
        QString roomLine;
        QString connLine;
        for (int x = bounds.min.x; x <= bounds.max.x; ++x) {
            const Coordinate2i here{x, y};
            const RoomMarker *const marker = findMarker(grid, here);

            roomLine += (marker == nullptr ? QString{} : roomGlyph(*marker, here.isOrigin(), legend))
                            .leftJustified(cellWidth, QChar::Space);

            if (x < bounds.max.x) {
                const RoomMarker *const east = findMarker(grid, Coordinate2i{x + 1, y});
                roomLine += isConnected(marker, ExitDirEnum::EAST, east) ? horizontal : noHorizontal;
            }

            if (y < bounds.max.y) {
                const RoomMarker *const south = findMarker(grid, Coordinate2i{x, y + 1});
                connLine += (isConnected(marker, ExitDirEnum::SOUTH, south) ? vertical : QString{})
                                .leftJustified(cellWidth, QChar::Space);
                if (x < bounds.max.x) {
                    connLine += noHorizontal;
                }
            }
        }

        lines.append(roomLine);
        if (y < bounds.max.y) {
            lines.append(connLine);
        }
    }
    return lines.join(QChar{u'\n'});
}

std::pair<QString, QString> renderMap(const Map &map,
                                      const int width,
                                      const int height,
                                      const RoomLegend *const legend,
                                      const int minColumnPitch)
{
    const Room *const current = map.getCurrentRoom();
    if (current == nullptr) {
        return {QStringLiteral("(exploring...)"), QString{}};
    }

    const int pitch = std::max(minColumnPitch, columnPitchForLegend(legend));
    const RoomGrid grid = buildRoomGrid(map, *current, width, height, pitch);
    return {renderGrid(grid, width, height, legend, pitch), current->getTitle()};
}

std::vector<RoomId> visibleRoomIds(const Map &map,
                                   const int width,
                                   const int height,
                                   const int columnPitch)
{
    std::vector<RoomId> result;
    const Room *const current = map.getCurrentRoom();
    if (current == nullptr) {
        return result;
    }

    std::unordered_set<RoomId> seen;
    for (const auto &kv : buildRoomGrid(map, *current, width, height, columnPitch)) {
        const RoomMarker &marker = kv.second;
        if (!marker.isUnexplored() && seen.insert(marker.room->getId()).second) {
            result.push_back(marker.room->getId());
        }
    }
    return result;
}

QString verticalExitsGlyph(const bool hasUp, const bool hasDown)
{
    if (hasUp && hasDown) {
        return QString::fromUtf8(GridGlyphs::UP_AND_DOWN);
    } else if (hasUp) {
        return QString::fromUtf8(GridGlyphs::UP_ONLY);
    } else if (hasDown) {
        return QString::fromUtf8(GridGlyphs::DOWN_ONLY);
    }
    return QString{};
}
