#pragma once

#include <QString>

#include "common/enums.hpp"

namespace testline {

constexpr int kMaxUtcOffsetMinutes = 14 * 60;

struct EngineConfig {
    // Fixed offset of the reference zone that defines trend day boundaries.
    int referenceUtcOffsetMinutes = 0;
    SourceTiePolicy sourceTiePolicy = SourceTiePolicy::PreferManual;
    bool trendCacheEnabled = true;
    int refreshIntervalSeconds = 60;
    QString bundleDir;
    QString socketName;
};

// Reads an optional JSON config file (empty path = defaults) and then applies
// TESTLINE_* environment overrides. Throws EngineError(InvalidRequest) when a
// given file cannot be read or parsed.
EngineConfig loadEngineConfig(const QString &path);

// Applies TESTLINE_* environment variables on top of config. Invalid values
// are ignored with a warning.
void applyEnvironmentOverrides(EngineConfig &config);

// Socket path used when the config does not name one.
QString defaultSocketPath();

} // namespace testline
