// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The DikuMapper Authors

#include "RoomTextParser.h"

#include "../global/parserutils.h"
#include "../map/ExitDirection.h"

#include <algorithm>
#include <array>

#include <QRegularExpression>

namespace { // anonymous

const QLatin1String BRACKET_OPEN{"--<"};
const QLatin1String BRACKET_CLOSE{">--"};

class NODISCARD Tracer final
{
private:
    const bool m_enabled;
    QString m_text;

public:
    explicit Tracer(const bool enabled)
        : m_enabled{enabled}
    {}

public:
    explicit operator bool() const { return m_enabled; }
    void add(const QString &msg)
    {
        if (m_enabled) {
            m_text += QStringLiteral("[mapper] ") + msg + QChar{u'\n'};
        }
    }
    NODISCARD const QString &getText() const { return m_text; }
};

NODISCARD QString quoted(const QString &s)
{
    return QChar{u'"'} + s + QChar{u'"'};
}

NODISCARD QString joined(const std::vector<QString> &exits)
{
    QStringList list;
    for (const QString &e : exits) {
        list.append(e);
    }
    return QChar{u'['} + list.join(QStringLiteral(", ")) + QChar{u']'};
}

void addUnique(std::vector<QString> &exits, const QString &dir)
{
    if (std::find(exits.begin(), exits.end(), dir) == exits.end()) {
        exits.push_back(dir);
    }
}

// Each letter is a direction; parentheses mark a closed door, which is
// still an exit.
NODISCARD std::vector<QString> parseCompactExits(const QString &text)
{
    std::vector<QString> exits;
    for (const QChar c : text) {
        if (c == QChar{u'('} || c == QChar{u')'}) {
            continue;
        }
        const QString full = Directions::detectMovement(QString{c});
        if (!full.isEmpty()) {
            addUnique(exits, full);
        }
    }
    return exits;
}

NODISCARD std::vector<QString> parseExitWords(const QString &text)
{
    static const QRegularExpression separators{R"([\s,]+)"};

    std::vector<QString> exits;
    for (const QString &word : text.split(separators, Qt::SkipEmptyParts)) {
        const QString full = Directions::detectMovement(word);
        if (!full.isEmpty()) {
            addUnique(exits, full);
        }
        // anything else ("and", "or", "none", door names) is noise
    }
    return exits;
}

// A single token made only of direction letters is a letter list, so "NE"
// is north and east. Tokens such as "down" or "north" use other letters.
NODISCARD bool looksCompact(const QString &text)
{
    static const QRegularExpression compact{R"(^[neswud()]+$)",
                                            QRegularExpression::CaseInsensitiveOption};
    return compact.match(text).hasMatch();
}

NODISCARD std::vector<QString> parseExitsList(const QString &exitText)
{
    const QString text = exitText.trimmed();
    if (looksCompact(text)) {
        return parseCompactExits(text);
    }
    return parseExitWords(text);
}

NODISCARD bool isBlank(const QString &cleaned)
{
    return cleaned.isEmpty();
}

// Bracketed rooms:
//
//   --<
//   Temple Square
//       You are standing in a large temple square...
//   >-- Exits:NSE
//
// The exits normally share the close marker's line, but may also follow it.
NODISCARD std::optional<RoomInfo> parseBracketed(const QStringList &lines, Tracer &tracer)
{
    const int count = static_cast<int>(lines.size());

    int endIdx = -1;
    for (int i = count - 1; i >= 0; --i) {
        if (ParserUtils::cleanLine(lines.at(i)).startsWith(BRACKET_CLOSE)) {
            endIdx = i;
            break;
        }
    }
    if (endIdx < 0) {
        return std::nullopt;
    }
    tracer.add(QStringLiteral("bracket close marker at line %1").arg(endIdx));

    int startIdx = -1;
    for (int i = endIdx - 1; i >= 0; --i) {
        if (ParserUtils::cleanLine(lines.at(i)) == BRACKET_OPEN) {
            startIdx = i;
            break;
        }
    }
    if (startIdx < 0) {
        tracer.add(QStringLiteral("no bracket open marker before line %1").arg(endIdx));
        return std::nullopt;
    }
    tracer.add(QStringLiteral("bracket open marker at line %1").arg(startIdx));

    std::vector<QString> exits;
    {
        const QString rest = ParserUtils::cleanLine(lines.at(endIdx)).mid(BRACKET_CLOSE.size()).trimmed();
        if (auto parsed = RoomTextParser::parseExitsLine(rest)) {
            exits = std::move(parsed.value());
        }
    }
    for (int i = endIdx + 1; exits.empty() && i < count; ++i) {
        const QString line = ParserUtils::cleanLine(lines.at(i));
        if (auto parsed = RoomTextParser::parseExitsLine(line); parsed && !parsed->empty()) {
            tracer.add(QStringLiteral("exits after the close marker at line %1").arg(i));
            exits = std::move(parsed.value());
            break;
        }
        if (ParserUtils::isPromptLine(line)) {
            break;
        }
    }

    RoomInfo info;
    QStringList descriptionLines;
    for (int i = startIdx + 1; i < endIdx; ++i) {
        const QString line = ParserUtils::cleanLine(lines.at(i));
        if (isBlank(line)) {
            continue;
        }
        if (info.title.isEmpty()) {
            info.title = line;
        } else {
            descriptionLines.append(line);
        }
    }
    if (info.title.isEmpty()) {
        tracer.add(QStringLiteral("bracketed block has no title"));
        return std::nullopt;
    }

    info.description = descriptionLines.join(QChar::Space);
    info.exits = std::move(exits);
    info.isBracketed = true;
    info.bracketStartIdx = startIdx;
    info.bracketEndIdx = endIdx;
    tracer.add(QStringLiteral("bracketed room %1 with exits %2")
                   .arg(quoted(info.title), joined(info.exits)));
    return info;
}

} // namespace

namespace RoomTextParser {

std::optional<std::vector<QString>> parseExitsLine(const QString &line)
{
    static const QRegularExpression::PatternOptions ci = QRegularExpression::CaseInsensitiveOption;
    static const QRegularExpression bracketed{R"(^\[\s*exits?\s*:\s*(.*?)\s*\]$)", ci};
    static const QRegularExpression obvious{R"(^obvious\s+exits?\s*:\s*(.*)$)", ci};
    static const QRegularExpression compact{R"(exits?\s*:\s*([neswud()]+)\s*>)", ci};
    static const QRegularExpression plain{R"(^exits?\s*:\s*(.*)$)", ci};

    const QString text = line.trimmed();
    for (const QRegularExpression *const re : {&bracketed, &obvious}) {
        const QRegularExpressionMatch m = re->match(text);
        if (m.hasMatch()) {
            return parseExitsList(m.captured(1));
        }
    }

    // the compact form sits inside a prompt, so it is never mistaken for a word
    if (const QRegularExpressionMatch m = compact.match(text); m.hasMatch()) {
        return parseCompactExits(m.captured(1));
    }

    if (const QRegularExpressionMatch m = plain.match(text); m.hasMatch()) {
        return parseExitsList(m.captured(1));
    }
    return std::nullopt;
}

bool isStatusOrCombatLine(const QString &line)
{
    static const std::array<const char *, 14> g_patterns{{
        "you feel",
        "you are affected",
        "you nearly",
        "you retch",
        "points a",
        "is lying here",
        "sits here",
        "stands here",
        "plays with",
        "is here",
        "a small",
        "a large",
        "a long",
        "the corpse",
    }};

    const QString lower = line.toLower();
    return std::any_of(g_patterns.begin(), g_patterns.end(), [&lower](const char *const pattern) {
        return lower.contains(QLatin1String(pattern));
    });
}

bool isRoomTitle(const QString &line)
{
    static const std::array<const char *, 5> g_badStarts{{
        "you ",
        "the corpse",
        "a small",
        "a large",
        "a long",
    }};

    const QString text = line.trimmed();
    if (text.isEmpty()) {
        return false;
    }

    const QString lower = text.toLower();
    for (const char *const start : g_badStarts) {
        if (lower.startsWith(QLatin1String(start))) {
            return false;
        }
    }

    const auto words = text.split(QChar::Space, Qt::SkipEmptyParts).size();
    if (words < 2 || words > 8) {
        return false;
    }

    const QChar first = text.front();
    return first >= QChar{u'A'} && first <= QChar{u'Z'};
}

std::optional<RoomInfo> parseBarsoomRoomOnly(const QStringList &lines, const bool debugTrace)
{
    if (lines.isEmpty()) {
        return std::nullopt;
    }
    Tracer tracer{debugTrace};
    auto result = parseBracketed(lines, tracer);
    if (result) {
        result->debugInfo = tracer.getText();
    }
    return result;
}

std::optional<RoomInfo> parseRoomInfo(const QStringList &lines,
                                      const RoomParserOptions &options,
                                      QString *const trace)
{
    Tracer tracer{options.debugTrace || trace != nullptr};
    const auto finish = [&tracer, trace](std::optional<RoomInfo> result) {
        if (trace != nullptr) {
            *trace = tracer.getText();
        }
        if (result) {
            result->debugInfo = tracer.getText();
        }
        return result;
    };

    if (lines.isEmpty()) {
        return finish(std::nullopt);
    }

    const int count = static_cast<int>(lines.size());
    if (tracer) {
        for (int i = std::max(0, count - 10); i < count; ++i) {
            tracer.add(QStringLiteral("line %1: %2").arg(i).arg(quoted(lines.at(i))));
        }
    }

    if (auto bracketed = parseBracketed(lines, tracer)) {
        if (bracketed->exits.empty()) {
            tracer.add(QStringLiteral("bracketed room without exits"));
            return finish(std::nullopt);
        }
        return finish(std::move(bracketed));
    }

    // the most recent exits line wins
    int exitsIdx = -1;
    std::vector<QString> exits;
    for (int i = count - 1; i >= 0; --i) {
        auto parsed = parseExitsLine(ParserUtils::cleanLine(lines.at(i)));
        if (parsed && !parsed->empty()) {
            exitsIdx = i;
            exits = std::move(parsed.value());
            break;
        }
    }
    if (exitsIdx < 0) {
        tracer.add(QStringLiteral("no exits line"));
        return finish(std::nullopt);
    }
    tracer.add(QStringLiteral("exits line %1: %2").arg(exitsIdx).arg(joined(exits)));

    const int budget = std::max(1, options.backwardLineBudget);
    QStringList block;
    int blankRun = 0;
    for (int i = exitsIdx - 1; i >= 0; --i) {
        if (exitsIdx - i > budget) {
            tracer.add(QStringLiteral("line budget exhausted at line %1").arg(i));
            break;
        }

        const QString line = ParserUtils::cleanLine(lines.at(i));
        if (isBlank(line)) {
            if (++blankRun >= 2) {
                tracer.add(QStringLiteral("two blank lines at line %1").arg(i));
                break;
            }
            continue;
        }
        blankRun = 0;

        if (ParserUtils::isPromptLine(line)) {
            tracer.add(QStringLiteral("previous prompt at line %1").arg(i));
            break;
        }
        if (parseExitsLine(line)) {
            // an older room; we must not glue it to this one
            tracer.add(QStringLiteral("previous exits line at line %1").arg(i));
            break;
        }
        if (isStatusOrCombatLine(line)) {
            tracer.add(QStringLiteral("skipping status line %1").arg(i));
            continue;
        }
        block.prepend(line);
    }

    if (block.isEmpty()) {
        tracer.add(QStringLiteral("nothing above the exits line"));
        return finish(std::nullopt);
    }

    qsizetype titleIdx = 0;
    for (qsizetype i = 0; i < block.size(); ++i) {
        if (isRoomTitle(block.at(i))) {
            titleIdx = i;
            break;
        }
    }
    if (!isRoomTitle(block.at(titleIdx))) {
        tracer.add(QStringLiteral("no title-like line; using the first line"));
    }

    RoomInfo info;
    info.title = block.at(titleIdx);
    info.description = block.mid(titleIdx + 1).join(QChar::Space);
    info.exits = std::move(exits);
    tracer.add(QStringLiteral("room %1 with exits %2").arg(quoted(info.title), joined(info.exits)));
    return finish(std::move(info));
}

} // namespace RoomTextParser
