// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The DikuMapper Authors

#include "jsonmapstorage.h"

#include "../global/logging.h"
#include "../map/Map.h"
#include "../map/RoomIdentity.h"
#include "../map/room.h"

#include <algorithm>
#include <set>
#include <vector>

#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QRegularExpression>
#include <QSaveFile>

namespace { // anonymous

#define ConstString static constexpr const char *const
ConstString KEY_ROOMS = "rooms";
ConstString KEY_CURRENT_ROOM_ID = "current_room_id";
ConstString KEY_PREVIOUS_ROOM_ID = "previous_room_id";
ConstString KEY_LAST_DIRECTION = "last_direction";
ConstString KEY_ROOM_NUMBERING = "room_numbering";

ConstString KEY_ID = "id";
ConstString KEY_TITLE = "title";
ConstString KEY_DESCRIPTION = "description";
ConstString KEY_FIRST_SENTENCE = "first_sentence";
ConstString KEY_EXITS = "exits";
ConstString KEY_VISIT_COUNT = "visit_count";
#undef ConstString

NODISCARD QJsonObject roomToJson(const Room &room)
{
    QJsonObject jExits;
    for (const auto &[dir, target] : room.getExits()) {
        jExits[dir] = target.getRoomIdOrInvalid().toQString();
    }

    QJsonObject jr;
    jr[KEY_ID] = room.getId().toQString();
    jr[KEY_TITLE] = room.getTitle();
    jr[KEY_DESCRIPTION] = room.getDescription();
    jr[KEY_FIRST_SENTENCE] = room.getFirstSentence();
    jr[KEY_EXITS] = jExits;
    jr[KEY_VISIT_COUNT] = room.getVisitCount();
    return jr;
}

NODISCARD Room roomFromJson(const QString &key, const QJsonObject &jr)
{
    Room room;
    const QString id = jr.value(KEY_ID).toString();
    room.setId(RoomId{id.isEmpty() ? key : id});
    room.setTitle(jr.value(KEY_TITLE).toString());
    room.setDescription(jr.value(KEY_DESCRIPTION).toString());
    if (jr.contains(KEY_FIRST_SENTENCE)) {
        room.setFirstSentence(jr.value(KEY_FIRST_SENTENCE).toString());
    } else {
        room.setFirstSentence(RoomIdentity::extractFirstSentence(room.getDescription()));
    }
    room.setVisitCount(std::max(1, jr.value(KEY_VISIT_COUNT).toInt(1)));

    const QJsonObject jExits = jr.value(KEY_EXITS).toObject();
    for (auto it = jExits.begin(); it != jExits.end(); ++it) {
        room.setExit(it.key(), ExitTarget{RoomId{it.value().toString()}});
    }
    return room;
}

} // namespace

MapStorageError::MapStorageError(const QString &message)
    : std::runtime_error{message.toStdString()}
{}

MapStorageError::~MapStorageError() = default;

JsonMapStorage::JsonMapStorage(QString fileName)
    : m_fileName{std::move(fileName)}
{}

QString JsonMapStorage::fileNameForServer(const QString &host, const uint16_t port)
{
    static const QRegularExpression unsafe{R"([^A-Za-z0-9.\-])"};
    QString safeHost = host;
    safeHost.replace(unsafe, QStringLiteral("_"));
    return QStringLiteral("map_%1_%2.json").arg(safeHost).arg(port);
}

QJsonObject JsonMapStorage::toJson(const Map &map)
{
    QJsonObject jRooms;
    for (const auto &kv : map.getRooms()) {
        jRooms[kv.first.toQString()] = roomToJson(kv.second);
    }

    QJsonArray jNumbering;
    for (const RoomId &id : map.getRoomNumbering()) {
        jNumbering.append(id.toQString());
    }

    QJsonObject json;
    json[KEY_ROOMS] = jRooms;
    json[KEY_CURRENT_ROOM_ID] = map.getCurrentRoomId().toQString();
    json[KEY_PREVIOUS_ROOM_ID] = map.getPreviousRoomId().toQString();
    json[KEY_LAST_DIRECTION] = map.getLastDirection();
    json[KEY_ROOM_NUMBERING] = jNumbering;
    return json;
}

Map JsonMapStorage::fromJson(const QJsonObject &json, bool *const migrated)
{
    if (migrated != nullptr) {
        *migrated = false;
    }

    const QJsonValue jRoomsValue = json.value(KEY_ROOMS);
    if (!jRoomsValue.isUndefined() && !jRoomsValue.isNull() && !jRoomsValue.isObject()) {
        throw MapStorageError(QStringLiteral("\"%1\" is not an object").arg(QString::fromLatin1(KEY_ROOMS)));
    }

    Map map;
    const QJsonObject jRooms = jRoomsValue.toObject();
    for (auto it = jRooms.begin(); it != jRooms.end(); ++it) {
        if (!it.value().isObject()) {
            throw MapStorageError(QStringLiteral("room %1 is not an object").arg(it.key()));
        }
        map.insertRoom(roomFromJson(it.key(), it.value().toObject()));
    }

    std::vector<RoomId> numbering;
    for (const QJsonValue &v : json.value(KEY_ROOM_NUMBERING).toArray()) {
        numbering.emplace_back(v.toString());
    }

    // Every room needs a number; legacy files have none at all, so they get
    // them in id order (std::map iterates sorted).
    std::set<RoomId> numbered(numbering.begin(), numbering.end());
    bool completed = false;
    for (const auto &kv : map.getRooms()) {
        if (numbered.count(kv.first) == 0) {
            numbering.push_back(kv.first);
            completed = true;
        }
    }
    map.setRoomNumbering(std::move(numbering));
    if (completed && migrated != nullptr) {
        *migrated = true;
    }

    map.restorePosition(RoomId{json.value(KEY_CURRENT_ROOM_ID).toString()},
                        RoomId{json.value(KEY_PREVIOUS_ROOM_ID).toString()},
                        json.value(KEY_LAST_DIRECTION).toString());
    return map;
}

Map JsonMapStorage::load() const CAN_THROW
{
    QFile file{m_fileName};
    if (!file.exists()) {
        DMLOG_INFO() << "No map file " << m_fileName << " yet; starting with an empty map";
        return Map{};
    }

    if (!file.open(QIODevice::ReadOnly)) {
        throw MapStorageError(
            QStringLiteral("error opening %1: %2").arg(m_fileName, file.errorString()));
    }

    QJsonParseError parseError{};
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        throw MapStorageError(
            QStringLiteral("error parsing %1: %2").arg(m_fileName, parseError.errorString()));
    }
    if (!doc.isObject()) {
        throw MapStorageError(QStringLiteral("%1 does not contain a JSON object").arg(m_fileName));
    }

    bool migrated = false;
    Map map = fromJson(doc.object(), &migrated);
    DMLOG_INFO() << "Loaded " << map.getRoomsCount() << " rooms from " << m_fileName;

    if (migrated) {
        DMLOG_INFO() << "Numbered the rooms of " << m_fileName << "; saving the upgraded file";
        try {
            save(map);
        } catch (const MapStorageError &ex) {
            DMLOG_WARNING() << "Failed to save the upgraded map: " << ex.what();
        }
    }
    return map;
}

void JsonMapStorage::save(const Map &map) const CAN_THROW
{
    QSaveFile file{m_fileName};
    if (!file.open(QIODevice::WriteOnly)) {
        throw MapStorageError(
            QStringLiteral("error opening %1 for writing: %2").arg(m_fileName, file.errorString()));
    }

    const QByteArray data = QJsonDocument{toJson(map)}.toJson(QJsonDocument::Indented);
    if (file.write(data) != data.size()) {
        const QString error = file.errorString();
        file.cancelWriting();
        throw MapStorageError(QStringLiteral("error writing %1: %2").arg(m_fileName, error));
    }
    if (!file.commit()) {
        throw MapStorageError(
            QStringLiteral("error committing %1: %2").arg(m_fileName, file.errorString()));
    }
    DMLOG_DEBUG() << "Saved " << map.getRoomsCount() << " rooms to " << m_fileName;
}
