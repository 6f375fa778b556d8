#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The DikuMapper Authors

#include "../global/macros.h"

#include <cstdint>
#include <stdexcept>
#include <string>

#include <QJsonObject>
#include <QString>

class Map;

struct NODISCARD MapStorageError : public std::runtime_error
{
    explicit MapStorageError(const QString &message);
    ~MapStorageError() override;
};

/*! \brief Whole-file JSON persistence of a Map, one file per game server.
 *
 * The document holds every room (keyed by id, with its title, description,
 * first sentence, exits and visit count), the current and previous room,
 * the last movement direction and the durable room numbering. Unexplored
 * exits are stored as an empty string.
 */
class NODISCARD JsonMapStorage final
{
private:
    QString m_fileName;

public:
    explicit JsonMapStorage(QString fileName);

public:
    NODISCARD const QString &getFileName() const { return m_fileName; }

    /*! \exception MapStorageError if the file exists but can't be read or parsed.
     *
     * A missing file gives an empty map. A file written before rooms were
     * numbered gets a numbering in id order and is written back right away.
     */
    NODISCARD Map load() const CAN_THROW;

    /*! \exception MapStorageError if the file can't be written; the previous
     * file is left untouched in that case.
     */
    void save(const Map &map) const CAN_THROW;

public:
    // "map_<host>_<port>.json" with anything but [A-Za-z0-9.-] replaced by '_'.
    NODISCARD static QString fileNameForServer(const QString &host, uint16_t port);

    NODISCARD static QJsonObject toJson(const Map &map);
    // Sets *migrated when the numbering had to be synthesized or completed.
    NODISCARD static Map fromJson(const QJsonObject &json, bool *migrated = nullptr) CAN_THROW;
};
