#pragma once

#include <memory>

#include <spdlog/logger.h>

#include "tally/config.hpp"

namespace Tally {

    /// @ingroup Tally
    /// @brief The library's logger, registered with spdlog as "tally".
    ///
    /// @details
    /// Created on first use with a colored stderr sink at spdlog's global level
    /// unless a logger named "tally" is already registered, in which case
    /// that one is used. Adjust the level with
    /// `Tally::logger()->set_level(...)` or `spdlog::cfg::load_env_levels()`.
    ///
    /// Levels used by the library:
    /// - `warn`:  a grammar was compiled with identical separators
    /// - `debug`: a configuration could not be turned into a grammar
    /// - `trace`: guard rejections and grammar cache misses
    [[nodiscard]] TALLY_API std::shared_ptr<spdlog::logger> logger();

    namespace detail {
        /// Registers @p created with spdlog, or returns the logger already
        /// registered under its name when another thread got there first.
        [[nodiscard]] TALLY_API std::shared_ptr<spdlog::logger> adopt_logger(std::shared_ptr<spdlog::logger> created);
    } // namespace detail

} // namespace Tally
