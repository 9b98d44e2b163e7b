#ifndef GENOCOL_LOGGER_H
#define GENOCOL_LOGGER_H

#include <memory>
#include <mutex>
#include <string>

#include <spdlog/spdlog.h>

namespace genocol {

// Process-wide spdlog setup: colored console plus a rotating log file.
class LogManager {
public:
    static LogManager& Instance();

    void Initialize(const std::string& log_file = "genocol.log",
                    spdlog::level::level_enum level = spdlog::level::info);

    std::shared_ptr<spdlog::logger> Logger();
    void SetLevel(spdlog::level::level_enum level);

    // Maps "trace".."off" to a level; returns false for unknown names.
    static bool ParseLevel(const std::string& name, spdlog::level::level_enum& level);

private:
    LogManager() = default;
    void ConfigureLogger(const std::string& log_file, spdlog::level::level_enum level);

    std::shared_ptr<spdlog::logger> logger_;
    std::once_flag init_flag_;
};

}  // namespace genocol

#endif  // GENOCOL_LOGGER_H
