#include "common/config.hpp"

#include <QFile>
#include <QStandardPaths>

#include <unistd.h>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace testline {

namespace {

constexpr int kMinRefreshIntervalSeconds = 1;

void warnInvalidSetting(const QString &key, const QString &value)
{
    TLOG_WARN(QStringLiteral("Config"),
              QStringLiteral("loadEngineConfig"),
              QStringLiteral("config_value_ignored"),
              QStringLiteral("invalid_value"),
              QStringLiteral("keep_default"),
              testline::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"key", key.toStdString()},
                              {"value", value.toStdString()}}));
}

bool validOffset(int minutes)
{
    return minutes >= -kMaxUtcOffsetMinutes && minutes <= kMaxUtcOffsetMinutes;
}

void applyJson(EngineConfig &config, const nlohmann::json &root)
{
    if (root.contains("referenceUtcOffsetMinutes")) {
        const auto &value = root.at("referenceUtcOffsetMinutes");
        if (value.is_number_integer() && validOffset(value.get<int>())) {
            config.referenceUtcOffsetMinutes = value.get<int>();
        } else {
            warnInvalidSetting(QStringLiteral("referenceUtcOffsetMinutes"),
                               QString::fromStdString(value.dump()));
        }
    }

    if (root.contains("sourceTiePolicy")) {
        const auto &value = root.at("sourceTiePolicy");
        const auto policy = value.is_string()
            ? parseSourceTiePolicyString(value.get<std::string>())
            : std::nullopt;
        if (policy.has_value()) {
            config.sourceTiePolicy = *policy;
        } else {
            warnInvalidSetting(QStringLiteral("sourceTiePolicy"),
                               QString::fromStdString(value.dump()));
        }
    }

    if (root.contains("trendCacheEnabled") && root.at("trendCacheEnabled").is_boolean()) {
        config.trendCacheEnabled = root.at("trendCacheEnabled").get<bool>();
    }

    if (root.contains("refreshIntervalSeconds")) {
        const auto &value = root.at("refreshIntervalSeconds");
        if (value.is_number_integer() && value.get<int>() >= kMinRefreshIntervalSeconds) {
            config.refreshIntervalSeconds = value.get<int>();
        } else {
            warnInvalidSetting(QStringLiteral("refreshIntervalSeconds"),
                               QString::fromStdString(value.dump()));
        }
    }

    if (root.contains("bundleDir") && root.at("bundleDir").is_string()) {
        config.bundleDir = QString::fromStdString(root.at("bundleDir").get<std::string>());
    }
    if (root.contains("socketName") && root.at("socketName").is_string()) {
        config.socketName = QString::fromStdString(root.at("socketName").get<std::string>());
    }
}

} // namespace

QString defaultSocketPath()
{
    QString runtimeDir = qEnvironmentVariable("XDG_RUNTIME_DIR");
    if (runtimeDir.isEmpty()) {
        runtimeDir =
            QStandardPaths::writableLocation(QStandardPaths::RuntimeLocation);
    }
    if (runtimeDir.isEmpty()) {
        runtimeDir = QStringLiteral("/run/user/%1").arg(getuid());
    }
    return runtimeDir + QStringLiteral("/testline.sock");
}

void applyEnvironmentOverrides(EngineConfig &config)
{
    if (qEnvironmentVariableIsSet("TESTLINE_UTC_OFFSET_MINUTES")) {
        const QString raw = qEnvironmentVariable("TESTLINE_UTC_OFFSET_MINUTES");
        bool ok = false;
        const int minutes = raw.toInt(&ok);
        if (ok && validOffset(minutes)) {
            config.referenceUtcOffsetMinutes = minutes;
        } else {
            warnInvalidSetting(QStringLiteral("TESTLINE_UTC_OFFSET_MINUTES"), raw);
        }
    }

    if (qEnvironmentVariableIsSet("TESTLINE_SOURCE_TIE_POLICY")) {
        const QString raw = qEnvironmentVariable("TESTLINE_SOURCE_TIE_POLICY");
        if (const auto policy = parseSourceTiePolicyString(raw.toStdString())) {
            config.sourceTiePolicy = *policy;
        } else {
            warnInvalidSetting(QStringLiteral("TESTLINE_SOURCE_TIE_POLICY"), raw);
        }
    }

    if (qEnvironmentVariableIsSet("TESTLINE_TREND_CACHE")) {
        config.trendCacheEnabled = qEnvironmentVariableIntValue("TESTLINE_TREND_CACHE") == 1;
    }

    if (qEnvironmentVariableIsSet("TESTLINE_REFRESH_INTERVAL_SECONDS")) {
        const QString raw = qEnvironmentVariable("TESTLINE_REFRESH_INTERVAL_SECONDS");
        bool ok = false;
        const int seconds = raw.toInt(&ok);
        if (ok && seconds >= kMinRefreshIntervalSeconds) {
            config.refreshIntervalSeconds = seconds;
        } else {
            warnInvalidSetting(QStringLiteral("TESTLINE_REFRESH_INTERVAL_SECONDS"), raw);
        }
    }

    const QString bundleDir = qEnvironmentVariable("TESTLINE_BUNDLE_DIR");
    if (!bundleDir.isEmpty()) {
        config.bundleDir = bundleDir;
    }
    const QString socketName = qEnvironmentVariable("TESTLINE_SOCKET_NAME");
    if (!socketName.isEmpty()) {
        config.socketName = socketName;
    }
}

EngineConfig loadEngineConfig(const QString &path)
{
    EngineConfig config;

    if (!path.isEmpty()) {
        QFile file(path);
        if (!file.open(QIODevice::ReadOnly)) {
            throw EngineError(ErrorKind::InvalidRequest,
                              "Cannot read config file " + path.toStdString());
        }
        const auto root = nlohmann::json::parse(file.readAll().toStdString(), nullptr, false);
        if (root.is_discarded() || !root.is_object()) {
            throw EngineError(ErrorKind::InvalidRequest,
                              "Malformed config file " + path.toStdString());
        }
        applyJson(config, root);
    }

    applyEnvironmentOverrides(config);

    if (config.socketName.isEmpty()) {
        config.socketName = defaultSocketPath();
    }
    return config;
}

} // namespace testline
