#pragma once

#include <QString>

namespace sm {

class AppConfig;

/// Reads the JSON config written by the original stream manager
/// (stream_config.json) into an AppConfig.
class LegacyConfigImporter {
public:
    static constexpr const char* LEGACY_FILE_NAME = "stream_config.json";

    /// Returns false (config untouched) when the file is missing or is not
    /// a JSON object.
    static bool import(const QString& jsonPath, AppConfig& config);
};

} // namespace sm
