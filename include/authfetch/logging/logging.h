#pragma once

#include <authfetch/core/types.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <string>
#include <string_view>

namespace authfetch::logging {

struct LoggingConfig {
    std::string appName{"authfetch"};
    // false switches the default logger to one JSON object per line.
    bool textLogger{true};
    std::string level{"info"};
    // Empty logs to stderr; otherwise a rotating file sink is used.
    std::filesystem::path logFile;
    // Explicit destination; takes precedence over logFile.
    spdlog::sink_ptr sink;
};

spdlog::level::level_enum parseLevel(std::string_view level);

// Installs the default logger. Safe to call more than once.
Result<void> configure(const LoggingConfig& config);

bool jsonOutputEnabled() noexcept;

// Structured event: the message plus fields rendered as JSON (merged into the record in
// JSON mode, appended to the line in text mode).
void logEvent(spdlog::level::level_enum level, std::string_view message,
              const nlohmann::json& fields = nlohmann::json::object());

// Removes userinfo passwords and blanks signature/token query values.
std::string redactUrl(std::string_view url);

} // namespace authfetch::logging
