#ifndef TESSERA_UTILS_SYSTEM_H
#define TESSERA_UTILS_SYSTEM_H

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include "tessera/options.h"
#include "tessera/status.h"

namespace Tessera {

constexpr auto LOG_FILENAME = "tessera.log";

using Log = spdlog::logger;
using LogPtr = std::shared_ptr<spdlog::logger>;
using LogSink = spdlog::sink_ptr;

/*
 * Owns the log sink selected by the options. Components get their own named loggers from create_log(), all
 * of which write to the shared sink.
 */
class System {
public:
    System(const std::string &prefix, const Options &options);
    [[nodiscard]] auto create_log(const std::string &name) const -> LogPtr;

private:
    LogSink m_sink;
    spdlog::level::level_enum m_level {spdlog::level::off};
};

// Check that the sizes in "options" are within their allowed ranges.
[[nodiscard]] auto validate_options(const Options &options) -> Status;

} // namespace Tessera

#endif // TESSERA_UTILS_SYSTEM_H
