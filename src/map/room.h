#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The DikuMapper Authors

#include "../global/RuleOf5.h"
#include "../global/macros.h"
#include "ExitTarget.h"
#include "roomid.h"

#include <map>
#include <optional>
#include <vector>

#include <QString>
#include <QStringList>

using RoomExits = std::map<QString, ExitTarget>;

// A discovered location. Rooms are owned by Map and refer to each other only by id.
class NODISCARD Room final
{
private:
    RoomId m_id;
    QString m_title;
    QString m_description;
    QString m_firstSentence;
    RoomExits m_exits;
    int m_visitCount = 1;

public:
    Room() = default;
    // Every listed exit starts out unexplored; the id is assigned when the
    // room is merged into a Map.
    explicit Room(QString title, QString description, const std::vector<QString> &exits);
    DEFAULT_RULE_OF_5(Room);

public:
    NODISCARD const RoomId &getId() const { return m_id; }
    NODISCARD const QString &getTitle() const { return m_title; }
    NODISCARD const QString &getDescription() const { return m_description; }
    NODISCARD const QString &getFirstSentence() const { return m_firstSentence; }
    NODISCARD const RoomExits &getExits() const { return m_exits; }
    NODISCARD int getVisitCount() const { return m_visitCount; }

    void setId(const RoomId &id) { m_id = id; }
    void setTitle(QString title) { m_title = std::move(title); }
    void setDescription(QString description) { m_description = std::move(description); }
    void setFirstSentence(QString sentence) { m_firstSentence = std::move(sentence); }
    void setVisitCount(const int count) { m_visitCount = count; }
    void incrementVisitCount() { ++m_visitCount; }

public:
    NODISCARD bool hasExit(const QString &direction) const;
    NODISCARD std::optional<ExitTarget> getExit(const QString &direction) const;
    void setExit(const QString &direction, const ExitTarget &target);
    // Returns false if there was no such exit.
    bool removeExit(const QString &direction);
    // Adds exits this room doesn't know about yet; existing entries are never overwritten.
    void mergeExits(const RoomExits &other);

    // Exit names in canonical order (north, south, east, west, up, down, rest alphabetically).
    NODISCARD std::vector<QString> getSortedExitDirections() const;
    NODISCARD bool hasUpExit() const;
    NODISCARD bool hasDownExit() const;

public:
    // lowercase "title firstSentence exits..." used by room search
    NODISCARD QString getSearchText() const;
    NODISCARD bool matchesSearch(const QStringList &queryTerms) const;
};
