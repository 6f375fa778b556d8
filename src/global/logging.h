#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The DikuMapper Authors

#include "dm_source_location.h"

#include <cassert>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>

#include <QDebug>
#include <QString>

namespace dm {

// Collects a message with ostream syntax and hands it to Qt's message logger
// (one log record per object) when the object is destroyed.
struct NODISCARD AbstractDebugOStream
{
private:
    QDebug m_debug;
    std::ostringstream m_os_utf8;

protected:
    NODISCARD static QMessageLogger getMessageLogger(const source_location loc)
    {
        return QMessageLogger{loc.file_name(), static_cast<int>(loc.line()), loc.function_name()};
    }

public:
    explicit AbstractDebugOStream(QDebug &&os);
    ~AbstractDebugOStream();

public:
    void writeUtf8(std::string_view sv);

public:
    template<typename T>
    AbstractDebugOStream &operator<<(const T &x)
    {
        auto &self = *this;
        self.m_os_utf8 << x;
        return self;
    }

public:
    AbstractDebugOStream &operator<<(const char *const s)
    {
        assert(s != nullptr);
        auto &self = *this;
        if (s != nullptr)
            self.writeUtf8(s);
        return self;
    }

    AbstractDebugOStream &operator<<(const std::string_view s)
    {
        writeUtf8(s);
        return *this;
    }

    AbstractDebugOStream &operator<<(const std::string &s)
    {
        writeUtf8(s);
        return *this;
    }

    AbstractDebugOStream &operator<<(const QString &s)
    {
        const QByteArray utf8 = s.toUtf8();
        writeUtf8(std::string_view{utf8.constData(), static_cast<size_t>(utf8.size())});
        return *this;
    }
};

struct NODISCARD DebugOstream final : public AbstractDebugOStream
{
public:
    explicit DebugOstream(source_location loc)
        : AbstractDebugOStream(getMessageLogger(loc).debug())
    {}
    ~DebugOstream();
};

struct NODISCARD InfoOstream final : public AbstractDebugOStream
{
public:
    explicit InfoOstream(source_location loc)
        : AbstractDebugOStream(getMessageLogger(loc).info())
    {}
    ~InfoOstream();
};

struct NODISCARD WarningOstream final : public AbstractDebugOStream
{
public:
    explicit WarningOstream(source_location loc)
        : AbstractDebugOStream(getMessageLogger(loc).warning())
    {}
    ~WarningOstream();
};

} // namespace dm

#define DMLOG_DEBUG() (dm::DebugOstream{DM_SOURCE_LOCATION()})
#define DMLOG_INFO() (dm::InfoOstream{DM_SOURCE_LOCATION()})
#define DMLOG_WARNING() (dm::WarningOstream{DM_SOURCE_LOCATION()})
#define DMLOG_ERROR() DMLOG_WARNING()
