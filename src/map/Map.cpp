// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The DikuMapper Authors

#include "Map.h"

#include "../global/logging.h"
#include "../global/utils.h"
#include "../mapdata/shortestpath.h"
#include "ExitDirection.h"
#include "InvalidMapOperation.h"
#include "RoomIdentity.h"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <utility>

#include <QRegularExpression>

namespace { // anonymous

NODISCARD std::vector<QString> getExitNames(const Room &room)
{
    std::vector<QString> names;
    names.reserve(room.getExits().size());
    for (const auto &kv : room.getExits()) {
        names.push_back(kv.first);
    }
    return names;
}

} // namespace

const Room *Map::findRoom(const RoomId &id) const
{
    if (!id) {
        return nullptr;
    }
    const auto it = m_rooms.find(id);
    if (it == m_rooms.end()) {
        return nullptr;
    }
    return &it->second;
}

const Room &Map::getRoom(const RoomId &id) const
{
    if (const Room *const room = findRoom(id)) {
        return *room;
    }
    throw InvalidMapOperation("room does not exist: " + id.toQString());
}

Room *Map::findRoomMutable(const RoomId &id)
{
    return const_cast<Room *>(std::as_const(*this).findRoom(id));
}

void Map::setLastDirection(const QString &direction)
{
    const QString full = Directions::detectMovement(direction);
    m_lastDirection = full.isEmpty() ? direction.trimmed().toLower() : full;
    m_lastDirectionConsumed = m_lastDirection.isEmpty();
}

std::optional<RoomId> Map::findKnownExitRevisit(const Room &candidate) const
{
    if (!hasPendingDirection()) {
        return std::nullopt;
    }
    const Room *const current = getCurrentRoom();
    if (current == nullptr) {
        return std::nullopt;
    }

    const std::optional<ExitTarget> exit = current->getExit(m_lastDirection);
    if (!exit || exit->isUnexplored()) {
        return std::nullopt;
    }

    const RoomId &destId = exit->getRoomId();
    if (findRoom(destId) == nullptr) {
        return std::nullopt;
    }

    // Compare against the content the id was generated from; the stored
    // room's exits may have grown since then.
    const QString signature = RoomIdentity::contentSignature(candidate.getTitle(),
                                                             candidate.getDescription(),
                                                             getExitNames(candidate));
    if (signature != RoomIdentity::stripDistance(destId)) {
        return std::nullopt;
    }
    return destId;
}

int Map::computeCandidateDistance() const
{
    if (!m_currentRoomId) {
        // the very first room of the session is the origin
        return m_roomNumbering.empty() ? 0 : RoomIdentity::NO_DISTANCE;
    }

    const RoomId origin = getOriginRoomId();
    if (const std::optional<int> dist = bfsDistance(*this, m_currentRoomId, origin)) {
        return dist.value() + 1;
    }
    return RoomIdentity::NO_DISTANCE;
}

void Map::linkRooms(const RoomId &from, const RoomId &to, const QString &direction)
{
    Room &fromRoom = deref(findRoomMutable(from));
    Room &toRoom = deref(findRoomMutable(to));

    fromRoom.setExit(direction, ExitTarget{to});

    // Tentative: the world may not be symmetric, so only claim the reverse
    // exit when nothing contradicts it.
    const QString back = Directions::reverse(direction);
    if (back.isEmpty()) {
        return;
    }
    const std::optional<ExitTarget> existing = toRoom.getExit(back);
    if (!existing || existing->isUnexplored() || existing->leadsTo(from)) {
        toRoom.setExit(back, ExitTarget{from});
    }
}

const Room &Map::addOrUpdateRoom(const Room &candidate)
{
    if (candidate.getTitle().trimmed().isEmpty()) {
        throw std::invalid_argument("room candidate has no title");
    }

    std::optional<RoomId> resolved = findKnownExitRevisit(candidate);
    if (!resolved) {
        const int distance = computeCandidateDistance();
        const RoomId id = RoomIdentity::generateRoomId(candidate.getTitle(),
                                                       candidate.getDescription(),
                                                       getExitNames(candidate),
                                                       distance);
        if (findRoom(id) != nullptr) {
            resolved = id;
        } else {
            Room room = candidate;
            room.setId(id);
            room.setFirstSentence(RoomIdentity::extractFirstSentence(candidate.getDescription()));
            room.setVisitCount(1);
            m_rooms.emplace(id, std::move(room));
            m_roomNumbering.push_back(id);
            DMLOG_INFO() << "New room #" << m_roomNumbering.size() << " \""
                         << candidate.getTitle() << "\" (" << id.toQString() << ")";
            return finishMerge(id);
        }
    }

    Room &existing = deref(findRoomMutable(resolved.value()));
    existing.incrementVisitCount();
    existing.mergeExits(candidate.getExits());
    DMLOG_DEBUG() << "Revisited \"" << existing.getTitle() << "\" (visit "
                  << existing.getVisitCount() << ")";
    return finishMerge(resolved.value());
}

const Room &Map::finishMerge(const RoomId &resolved)
{
    const RoomId from = m_currentRoomId;
    if (from && from != resolved && hasPendingDirection() && findRoom(from) != nullptr) {
        linkRooms(from, resolved, m_lastDirection);
    }
    m_lastDirectionConsumed = true;

    if (from != resolved) {
        m_previousRoomId = from;
        m_currentRoomId = resolved;
    }
    return getRoom(resolved);
}

bool Map::removeExit(const QString &direction)
{
    Room *const current = findRoomMutable(m_currentRoomId);
    if (current == nullptr) {
        return false;
    }

    const QString full = Directions::detectMovement(direction);
    const QString expanded = full.isEmpty() ? direction.trimmed().toLower() : full;
    const bool removed = current->removeExit(direction) || current->removeExit(expanded);
    if (removed) {
        DMLOG_INFO() << "Removed exit " << expanded << " from \"" << current->getTitle() << "\"";
    }
    return removed;
}

int Map::getRoomNumber(const RoomId &id) const
{
    const auto it = std::find(m_roomNumbering.begin(), m_roomNumbering.end(), id);
    if (it == m_roomNumbering.end()) {
        return 0;
    }
    return static_cast<int>(it - m_roomNumbering.begin()) + 1;
}

const Room *Map::getRoomByNumber(const int number) const
{
    if (number < 1 || static_cast<size_t>(number) > m_roomNumbering.size()) {
        return nullptr;
    }
    return findRoom(m_roomNumbering[static_cast<size_t>(number - 1)]);
}

RoomId Map::getOriginRoomId() const
{
    if (m_roomNumbering.empty()) {
        return INVALID_ROOMID;
    }
    return m_roomNumbering.front();
}

std::vector<const Room *> Map::findRooms(const QString &query) const
{
    static const QRegularExpression whitespace{R"(\s+)"};
    const QStringList terms = query.split(whitespace, Qt::SkipEmptyParts);

    std::vector<const Room *> result;
    for (const auto &kv : m_rooms) {
        if (kv.second.matchesSearch(terms)) {
            result.push_back(&kv.second);
        }
    }

    const auto rank = [this](const Room *room) {
        const int number = getRoomNumber(room->getId());
        return number == 0 ? std::numeric_limits<int>::max() : number;
    };
    std::stable_sort(result.begin(), result.end(), [&rank](const Room *a, const Room *b) {
        return rank(a) < rank(b);
    });
    return result;
}

void Map::insertRoom(Room room)
{
    const RoomId id = room.getId();
    if (!id) {
        throw std::invalid_argument("cannot insert a room without an id");
    }
    m_rooms.insert_or_assign(id, std::move(room));
}

void Map::setRoomNumbering(std::vector<RoomId> numbering)
{
    m_roomNumbering.clear();
    for (RoomId &id : numbering) {
        // each id at most once, in first-seen order
        if (id && std::find(m_roomNumbering.begin(), m_roomNumbering.end(), id)
                      == m_roomNumbering.end()) {
            m_roomNumbering.push_back(std::move(id));
        }
    }
}

void Map::restorePosition(const RoomId &current, const RoomId &previous, const QString &lastDirection)
{
    m_currentRoomId = current;
    m_previousRoomId = previous;
    m_lastDirection = lastDirection;
    // a saved direction was already used by the merge that followed it
    m_lastDirectionConsumed = true;
}
