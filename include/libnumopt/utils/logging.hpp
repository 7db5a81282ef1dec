#pragma once

#include <spdlog/spdlog.h>

#include <memory>

namespace numopt::utils {

/**
 * @class Logging
 * @brief Process-wide spdlog logger shared by every solver.
 *
 * Solvers only write to it; the level decides how much of the iteration
 * history reaches stdout.
 */
class Logging {
public:
    /**
     * @brief Returns the shared logger, creating it at the default level on first use.
     */
    static std::shared_ptr<spdlog::logger>& getLogger();

    /**
     * @brief Creates the logger if needed and sets its level and flush level.
     * @param level Minimum level of messages to emit.
     */
    static void init(spdlog::level::level_enum level = spdlog::level::info);

private:
    Logging() = default;

    static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace numopt::utils

#define NUMOPT_TRACE(...)    numopt::utils::Logging::getLogger()->trace(__VA_ARGS__)
#define NUMOPT_DEBUG(...)    numopt::utils::Logging::getLogger()->debug(__VA_ARGS__)
#define NUMOPT_INFO(...)     numopt::utils::Logging::getLogger()->info(__VA_ARGS__)
#define NUMOPT_WARN(...)     numopt::utils::Logging::getLogger()->warn(__VA_ARGS__)
#define NUMOPT_ERROR(...)    numopt::utils::Logging::getLogger()->error(__VA_ARGS__)
#define NUMOPT_CRITICAL(...) numopt::utils::Logging::getLogger()->critical(__VA_ARGS__)
