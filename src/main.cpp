// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The DikuMapper Authors

#include "./configuration/configuration.h"
#include "./display/GridRenderer.h"
#include "./display/MapLegend.h"
#include "./global/logging.h"
#include "./global/utils.h"
#include "./map/Map.h"
#include "./map/room.h"
#include "./mapdata/shortestpath.h"
#include "./mapstorage/jsonmapstorage.h"
#include "./session/MapperSession.h"

#include <optional>
#include <stdexcept>

#include <QCommandLineParser>
#include <QFile>
#include <QRegularExpression>
#include <QTextStream>
#include <QtCore>

namespace { // anonymous

struct NODISCARD ViewportSize final
{
    int width = 0;
    int height = 0;
};

NODISCARD std::optional<ViewportSize> parseViewportSize(const QString &text)
{
    static const QRegularExpression re{R"(^(\d+)[xX](\d+)$)"};
    const QRegularExpressionMatch m = re.match(text.trimmed());
    if (!m.hasMatch()) {
        return std::nullopt;
    }
    ViewportSize size{m.captured(1).toInt(), m.captured(2).toInt()};
    if (size.width <= 0 || size.height <= 0) {
        return std::nullopt;
    }
    return size;
}

NODISCARD QTextStream &out()
{
    static QTextStream stream{stdout};
    return stream;
}

// A transcript has the commands the user typed prefixed with "> "; every
// other line is game output. Consecutive output lines arrive as one batch.
NODISCARD bool replayTranscript(MapperSession &session, const QString &fileName)
{
    QFile file{fileName};
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        DMLOG_ERROR() << "Cannot open transcript " << fileName << ": " << file.errorString();
        return false;
    }

    static const QLatin1String COMMAND_PREFIX{"> "};
    QString batch;
    const auto flush = [&session, &batch]() {
        if (batch.isEmpty()) {
            return;
        }
        const SessionUpdate update = session.onTextReceived(batch);
        if (!update.debugInfo.isEmpty()) {
            DMLOG_DEBUG() << update.debugInfo;
        }
        batch.clear();
    };

    QTextStream in{&file};
    while (!in.atEnd()) {
        const QString line = in.readLine();
        if (line.startsWith(COMMAND_PREFIX)) {
            flush();
            session.onCommandSent(line.mid(COMMAND_PREFIX.size()));
        } else {
            batch += line + QChar{u'\n'};
        }
    }
    flush();
    return true;
}

void printRender(const Map &map, const ViewportSize &size, const MapLegend *const legend)
{
    const auto [text, title] = renderMap(map,
                                         size.width,
                                         size.height,
                                         legend != nullptr ? &legend->numbers : nullptr,
                                         legend != nullptr ? legend->columnPitch : ROOM_COLUMN_PITCH);
    if (!title.isEmpty()) {
        out() << title << Qt::endl;
    }
    out() << text << Qt::endl;

    if (legend == nullptr) {
        return;
    }
    for (const LegendEntry &entry : legend->entries) {
        const Room &room = deref(entry.room);
        out() << QString("%1: %2").arg(entry.number).arg(room.getTitle());
        if (entry.distance > 0) {
            out() << QString(" (%1)").arg(entry.distance);
        }
        out() << Qt::endl;
    }
}

NODISCARD bool printPath(const Map &map, const int number)
{
    const Room *const target = map.getRoomByNumber(number);
    if (target == nullptr) {
        DMLOG_ERROR() << "There is no room #" << number;
        return false;
    }

    const auto steps = PathFinder{map}.findPathWithRooms(target->getId());
    if (!steps) {
        out() << "No known route to " << target->getTitle() << Qt::endl;
        return false;
    }
    if (steps->empty()) {
        out() << "You are already in " << target->getTitle() << Qt::endl;
        return true;
    }
    for (const PathStep &step : steps.value()) {
        out() << step.direction << " -> " << step.roomTitle << Qt::endl;
    }
    return true;
}

NODISCARD bool printNearby(const Map &map, const int maxDistance)
{
    const auto nearby = PathFinder{map}.findNearbyRooms(maxDistance);
    if (!nearby) {
        out() << "The current room is unknown." << Qt::endl;
        return false;
    }
    for (const NearbyRoom &n : nearby.value()) {
        const Room &room = deref(n.room);
        out() << QString("#%1 %2 (%3 steps)")
                     .arg(map.getRoomNumber(room.getId()))
                     .arg(room.getTitle())
                     .arg(n.distance)
              << Qt::endl;
    }
    return true;
}

void printRooms(const Map &map, const QString &query)
{
    for (const Room *const room : map.findRooms(query)) {
        const int number = map.getRoomNumber(room->getId());
        QStringList exits;
        for (const QString &dir : room->getSortedExitDirections()) {
            exits.append(dir);
        }
        out() << QString("#%1 %2 [%3]")
                     .arg(number == 0 ? QStringLiteral("-") : QString::number(number),
                          room->getTitle(),
                          exits.join(QChar::Space))
              << Qt::endl;
    }
}

} // namespace

int main(int argc, char **argv)
{
    setEnteredMain();

    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("dikumapper");

    QCommandLineParser parser;
    parser.setApplicationDescription("Builds and queries the room map of a DikuMUD session.");
    parser.addHelpOption();

    const QCommandLineOption mapOption{"map", "Map file to load and save.", "file"};
    const QCommandLineOption replayOption{"replay",
                                          "Feed a transcript through the mapper "
                                          "(lines starting with \"> \" are commands).",
                                          "file"};
    const QCommandLineOption renderOption{"render", "Print the map around the current room.", "WxH"};
    const QCommandLineOption pathOption{"path", "Print the route to a room number.", "number"};
    const QCommandLineOption legendOption{"legend",
                                          "Label rooms in --render with numbers: "
                                          "\"nearby\" or \"rooms\".",
                                          "kind"};
    const QCommandLineOption nearbyOption{"nearby", "List rooms within n steps.", "n"};
    const QCommandLineOption roomsOption{"rooms", "List known rooms, filtered by the query terms."};
    parser.addOptions(
        {mapOption, replayOption, renderOption, legendOption, pathOption, nearbyOption, roomsOption});
    parser.addPositionalArgument("query", "Search terms for --rooms.", "[query...]");
    parser.process(app);

    if (!parser.isSet(mapOption)) {
        DMLOG_ERROR() << "--map is required";
        parser.showHelp(1);
    }

    Configuration &config = setConfig();
    const JsonMapStorage storage{parser.value(mapOption)};

    std::optional<MapperSession> session;
    try {
        session.emplace(storage.load(), SessionOptions::fromConfig(config));
    } catch (const MapStorageError &ex) {
        DMLOG_ERROR() << ex.what();
        return 1;
    }
    session->setStorage(storage);

    int ret = 0;
    if (parser.isSet(replayOption)) {
        if (!replayTranscript(session.value(), parser.value(replayOption))) {
            ret = 1;
        }
        if (!session->save()) {
            ret = 1;
        }
    }

    const Map &map = session->getMap();
    if (parser.isSet(renderOption) || parser.isSet(legendOption)) {
        const QString legendKind = parser.value(legendOption);
        // the legend is numbered for exactly the viewport it is drawn in
        const auto size = parser.isSet(renderOption)
                              ? parseViewportSize(parser.value(renderOption))
                              : std::optional<ViewportSize>{
                                  ViewportSize{config.map.legendViewportWidth,
                                               config.map.legendViewportHeight}};
        if (size) {
            std::optional<MapLegend> legend;
            if (legendKind == "nearby") {
                legend = buildNearbyLegend(map,
                                           config.map.nearbyDistance,
                                           size->width,
                                           size->height);
            } else if (legendKind == "rooms") {
                legend = buildDurableLegend(map, size->width, size->height);
            } else if (!legendKind.isEmpty()) {
                DMLOG_WARNING() << "Unknown legend kind: " << legendKind;
            }
            printRender(map, size.value(), legend ? &legend.value() : nullptr);
        } else {
            DMLOG_ERROR() << "Invalid viewport size: " << parser.value(renderOption);
            ret = 1;
        }
    }

    if (parser.isSet(pathOption)) {
        bool ok = false;
        const int number = parser.value(pathOption).toInt(&ok);
        if (!ok || !printPath(map, number)) {
            ret = 1;
        }
    }

    if (parser.isSet(nearbyOption)) {
        bool ok = false;
        const int n = parser.value(nearbyOption).toInt(&ok);
        if (!ok || !printNearby(map, n > 0 ? n : config.map.nearbyDistance)) {
            ret = 1;
        }
    }

    if (parser.isSet(roomsOption)) {
        printRooms(map, parser.positionalArguments().join(QChar::Space));
    }

    config.write();
    return ret;
}
