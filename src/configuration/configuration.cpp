// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The DikuMapper Authors

#include "configuration.h"

#include "../global/logging.h"
#include "../global/utils.h"

#include <atomic>
#include <cassert>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <thread>

#include <QFile>
#include <QFileInfo>

namespace { // anonymous

std::thread::id g_thread{};
std::atomic_bool g_config_enteredMain{false};

} // namespace

Configuration::Configuration()
{
    read(); // read the settings or set them to the default values
}

#define ConstString static constexpr const char *const
ConstString SETTINGS_ORGANIZATION = "DikuMapper";
ConstString SETTINGS_APPLICATION = "DikuMapper";

class NODISCARD Settings final
{
private:
    static constexpr const char *const DIKUMAPPER_PROFILE_PATH = "DIKUMAPPER_PROFILE_PATH";

private:
    std::optional<QSettings> m_settings;

private:
    NODISCARD static bool isValid(const QString &fileName)
    {
        const QFileInfo info{fileName};
        return !info.isDir() && info.exists() && info.isReadable() && info.isWritable();
    }

private:
    void initSettings();

public:
    DELETE_CTORS_AND_ASSIGN_OPS(Settings);
    Settings() { initSettings(); }
    ~Settings() = default;
    explicit operator QSettings &()
    {
        if (!m_settings) {
            throw std::runtime_error("object does not exist");
        }
        return m_settings.value();
    }
};

void Settings::initSettings()
{
    if (m_settings) {
        throw std::runtime_error("object already exists");
    }

    // NOTE: mutex guards read/write access to g_path from multiple threads,
    // since the static variable can be cleared on failure.
    static std::mutex g_mutex;
    std::lock_guard<std::mutex> lock{g_mutex};

    static QString g_path = qEnvironmentVariable(DIKUMAPPER_PROFILE_PATH);

    if (!g_path.isEmpty()) {
        static std::once_flag attempt_flag;
        std::call_once(attempt_flag, [] {
            DMLOG_INFO() << "Attempting to use settings from " << g_path
                         << " (specified by environment variable " << DIKUMAPPER_PROFILE_PATH
                         << ")...";
        });

        if (!isValid(g_path)) {
            DMLOG_WARNING() << "Falling back to default settings path because " << g_path
                            << " is not a writable file.";
            g_path.clear();
        } else {
            m_settings.emplace(g_path, QSettings::IniFormat);
        }
    }

    if (!m_settings) {
        m_settings.emplace(SETTINGS_ORGANIZATION, SETTINGS_APPLICATION);
    }

    static std::once_flag success_flag;
    std::call_once(success_flag, [this] {
        DMLOG_INFO() << "Using settings from " << static_cast<QSettings &>(*this).fileName()
                     << (g_path.isEmpty()
                             ? " (Hint: Environment variable DIKUMAPPER_PROFILE_PATH overrides the default)."
                             : ".");
    });
}

#define SETTINGS(conf) \
    Settings settings; \
    QSettings &conf = static_cast<QSettings &>(settings)

ConstString GRP_PARSER = "Parser";
ConstString GRP_MAP = "Map";
ConstString GRP_AUTO_WALK = "Auto-walk";

ConstString KEY_BACKWARD_LINE_BUDGET = "backward line budget";
ConstString KEY_RECENT_LINES = "recent lines";
ConstString KEY_DEBUG_TRACE = "debug trace";
ConstString KEY_NEARBY_DISTANCE = "nearby distance";
ConstString KEY_LEGEND_VIEWPORT_WIDTH = "legend viewport width";
ConstString KEY_LEGEND_VIEWPORT_HEIGHT = "legend viewport height";
ConstString KEY_SAVE_AFTER_EVERY_ROOM = "save after every room";
ConstString KEY_REPLAN_ON_FAILURE = "replan on failure";

NODISCARD static int sanitizePositive(const char *const key, const int input, const int defaultValue)
{
    const int result = utils::clampPositive(input, defaultValue);
    if (result != input) {
        DMLOG_WARNING() << "invalid value for \"" << key << "\": " << input;
    }
    return result;
}

#define GROUP_CALLBACK(callback, name, ref) \
    do { \
        conf.beginGroup(name); \
        ref.callback(conf); \
        conf.endGroup(); \
    } while (false)

#define FOREACH_CONFIG_GROUP(callback) \
    do { \
        GROUP_CALLBACK(callback, GRP_PARSER, parser); \
        GROUP_CALLBACK(callback, GRP_MAP, map); \
        GROUP_CALLBACK(callback, GRP_AUTO_WALK, autoWalk); \
    } while (false)

void Configuration::read()
{
    SETTINGS(conf);
    FOREACH_CONFIG_GROUP(read);
}

void Configuration::write() const
{
    SETTINGS(conf);
    FOREACH_CONFIG_GROUP(write);
}

void Configuration::reset()
{
    {
        SETTINGS(conf);
        conf.clear();
    }

    // Reload defaults
    read();
}

QString Configuration::getSettingsFileName() const
{
    SETTINGS(conf);
    return conf.fileName();
}

#undef FOREACH_CONFIG_GROUP
#undef GROUP_CALLBACK

void Configuration::ParserSettings::read(const QSettings &conf)
{
    backwardLineBudget = sanitizePositive(KEY_BACKWARD_LINE_BUDGET,
                                          conf.value(KEY_BACKWARD_LINE_BUDGET, 15).toInt(),
                                          15);
    recentLines = sanitizePositive(KEY_RECENT_LINES, conf.value(KEY_RECENT_LINES, 30).toInt(), 30);
    debugTrace = conf.value(KEY_DEBUG_TRACE, false).toBool();
}

void Configuration::MapSettings::read(const QSettings &conf)
{
    nearbyDistance = sanitizePositive(KEY_NEARBY_DISTANCE,
                                      conf.value(KEY_NEARBY_DISTANCE, 5).toInt(),
                                      5);
    legendViewportWidth = sanitizePositive(KEY_LEGEND_VIEWPORT_WIDTH,
                                           conf.value(KEY_LEGEND_VIEWPORT_WIDTH, 30).toInt(),
                                           30);
    legendViewportHeight = sanitizePositive(KEY_LEGEND_VIEWPORT_HEIGHT,
                                            conf.value(KEY_LEGEND_VIEWPORT_HEIGHT, 15).toInt(),
                                            15);
    saveAfterEveryRoom = conf.value(KEY_SAVE_AFTER_EVERY_ROOM, true).toBool();
}

void Configuration::AutoWalkSettings::read(const QSettings &conf)
{
    replanOnFailure = conf.value(KEY_REPLAN_ON_FAILURE, true).toBool();
}

void Configuration::ParserSettings::write(QSettings &conf) const
{
    conf.setValue(KEY_BACKWARD_LINE_BUDGET, backwardLineBudget);
    conf.setValue(KEY_RECENT_LINES, recentLines);
    conf.setValue(KEY_DEBUG_TRACE, debugTrace);
}

void Configuration::MapSettings::write(QSettings &conf) const
{
    conf.setValue(KEY_NEARBY_DISTANCE, nearbyDistance);
    conf.setValue(KEY_LEGEND_VIEWPORT_WIDTH, legendViewportWidth);
    conf.setValue(KEY_LEGEND_VIEWPORT_HEIGHT, legendViewportHeight);
    conf.setValue(KEY_SAVE_AFTER_EVERY_ROOM, saveAfterEveryRoom);
}

void Configuration::AutoWalkSettings::write(QSettings &conf) const
{
    conf.setValue(KEY_REPLAN_ON_FAILURE, replanOnFailure);
}

#undef ConstString

Configuration &setConfig()
{
    assert(g_config_enteredMain);
    assert(g_thread == std::this_thread::get_id());
    static Configuration conf;
    return conf;
}

const Configuration &getConfig()
{
    return setConfig();
}

void setEnteredMain()
{
    g_thread = std::this_thread::get_id();
    g_config_enteredMain = true;
}
