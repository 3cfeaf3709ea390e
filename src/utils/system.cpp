#include "system.h"
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>
#include "utils.h"

namespace Tessera {

System::System(const std::string &prefix, const Options &options)
{
    switch (options.log_level) {
        case LogLevel::TRACE:
            m_level = spdlog::level::trace;
            break;
        case LogLevel::INFO:
            m_level = spdlog::level::info;
            break;
        case LogLevel::WARN:
            m_level = spdlog::level::warn;
            break;
        case LogLevel::ERROR:
            m_level = spdlog::level::err;
            break;
        default:
            m_level = spdlog::level::off;
            m_sink = std::make_shared<spdlog::sinks::null_sink_mt>();
    }

    if (m_level != spdlog::level::off) {
        switch (options.log_target) {
            case LogTarget::STDOUT:
                m_sink = std::make_shared<spdlog::sinks::stdout_sink_mt>();
                break;
            case LogTarget::STDERR:
                m_sink = std::make_shared<spdlog::sinks::stderr_sink_mt>();
                break;
            case LogTarget::STDOUT_COLOR:
                m_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
                break;
            case LogTarget::STDERR_COLOR:
                m_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
                break;
            default:
                m_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    prefix + LOG_FILENAME, options.max_log_size, options.max_log_files);
        }
    }
    m_sink->set_level(m_level);
}

auto validate_options(const Options &options) -> Status
{
    if (options.chunk_size < MINIMUM_CHUNK_SIZE || options.chunk_size > MAXIMUM_CHUNK_SIZE) {
        return Status::invalid_argument(fmt::format("chunk size {} is out of range [{}, {}]",
                                                    options.chunk_size, MINIMUM_CHUNK_SIZE, MAXIMUM_CHUNK_SIZE));
    }
    if (options.log_level != LogLevel::OFF && options.log_target == LogTarget::FILE) {
        if (options.max_log_size < MINIMUM_LOG_MAX_SIZE || options.max_log_size > MAXIMUM_LOG_MAX_SIZE) {
            return Status::invalid_argument(fmt::format("maximum log size {} is out of range [{}, {}]",
                                                        options.max_log_size, MINIMUM_LOG_MAX_SIZE, MAXIMUM_LOG_MAX_SIZE));
        }
        if (options.max_log_files < MINIMUM_LOG_MAX_FILES || options.max_log_files > MAXIMUM_LOG_MAX_FILES) {
            return Status::invalid_argument(fmt::format("maximum log file count {} is out of range [{}, {}]",
                                                        options.max_log_files, MINIMUM_LOG_MAX_FILES, MAXIMUM_LOG_MAX_FILES));
        }
    }
    return Status::ok();
}

auto System::create_log(const std::string &name) const -> LogPtr
{
    TESSERA_EXPECT_FALSE(name.empty());
    auto log = std::make_shared<Log>(name, m_sink);
    log->set_level(m_level);
    return log;
}

} // namespace Tessera
