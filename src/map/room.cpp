// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The DikuMapper Authors

#include "room.h"

#include "ExitDirection.h"
#include "RoomIdentity.h"

#include <algorithm>

Room::Room(QString title, QString description, const std::vector<QString> &exits)
    : m_title{std::move(title)}
    , m_description{std::move(description)}
{
    m_firstSentence = RoomIdentity::extractFirstSentence(m_description);
    for (const QString &dir : exits) {
        m_exits.emplace(dir, ExitTarget::unexplored());
    }
}

bool Room::hasExit(const QString &direction) const
{
    return m_exits.find(direction) != m_exits.end();
}

std::optional<ExitTarget> Room::getExit(const QString &direction) const
{
    const auto it = m_exits.find(direction);
    if (it == m_exits.end()) {
        return std::nullopt;
    }
    return it->second;
}

void Room::setExit(const QString &direction, const ExitTarget &target)
{
    m_exits[direction] = target;
}

bool Room::removeExit(const QString &direction)
{
    return m_exits.erase(direction) != 0;
}

void Room::mergeExits(const RoomExits &other)
{
    for (const auto &[dir, target] : other) {
        m_exits.emplace(dir, target);
    }
}

std::vector<QString> Room::getSortedExitDirections() const
{
    std::vector<QString> dirs;
    dirs.reserve(m_exits.size());
    for (const auto &kv : m_exits) {
        dirs.push_back(kv.first);
    }
    Directions::sortCanonical(dirs);
    return dirs;
}

bool Room::hasUpExit() const
{
    return std::any_of(m_exits.begin(), m_exits.end(), [](const auto &kv) {
        return dirForName(kv.first) == ExitDirEnum::UP;
    });
}

bool Room::hasDownExit() const
{
    return std::any_of(m_exits.begin(), m_exits.end(), [](const auto &kv) {
        return dirForName(kv.first) == ExitDirEnum::DOWN;
    });
}

QString Room::getSearchText() const
{
    // plain lexical order here, so the text doesn't depend on direction priorities
    QStringList exitNames;
    for (const auto &kv : m_exits) {
        exitNames.append(kv.first);
    }
    return (m_title + QChar::Space + m_firstSentence + QChar::Space + exitNames.join(QChar::Space))
        .toLower();
}

bool Room::matchesSearch(const QStringList &queryTerms) const
{
    const QString text = getSearchText();
    return std::all_of(queryTerms.begin(), queryTerms.end(), [&text](const QString &term) {
        return text.contains(term.toLower());
    });
}
