#include "tally/log.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>


namespace Tally {

    namespace detail {

        std::shared_ptr<spdlog::logger> adopt_logger(std::shared_ptr<spdlog::logger> created) {
            try {
                // Picks up levels from spdlog::cfg and registers the logger.
                spdlog::initialize_logger(created);
                return created;
            } catch (const spdlog::spdlog_ex&) {
                // Someone registered the name first; theirs wins.
                if (auto existing = spdlog::get(created->name())) return existing;
                throw;
            }
        }

    } // namespace detail

    std::shared_ptr<spdlog::logger> logger() {
        static const std::shared_ptr<spdlog::logger> instance = [] {
            if (auto existing = spdlog::get("tally")) return existing;
            return detail::adopt_logger(std::make_shared<spdlog::logger>(
                "tally",
                std::make_shared<spdlog::sinks::stderr_color_sink_mt>()));
        }();
        return instance;
    }

} // namespace Tally
