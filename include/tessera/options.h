#ifndef TESSERA_OPTIONS_H
#define TESSERA_OPTIONS_H

#include "slice.h"

namespace Tessera {

static constexpr Size MINIMUM_CHUNK_SIZE {0x1};
static constexpr Size DEFAULT_CHUNK_SIZE {0x10000};
static constexpr Size MAXIMUM_CHUNK_SIZE {0x4000000};
static constexpr Size MINIMUM_LOG_MAX_SIZE {0xA000};
static constexpr Size DEFAULT_MAX_LOG_SIZE {0x100000};
static constexpr Size MAXIMUM_LOG_MAX_SIZE {0xA00000};
static constexpr Size MINIMUM_LOG_MAX_FILES {1};
static constexpr Size DEFAULT_MAX_LOG_FILES {4};
static constexpr Size MAXIMUM_LOG_MAX_FILES {32};

enum class LogLevel {
    TRACE,
    INFO,
    WARN,
    ERROR,
    OFF,
};

enum class LogTarget {
    FILE,
    STDOUT,
    STDERR,
    STDOUT_COLOR,
    STDERR_COLOR,
};

struct Options {
    // Number of bytes requested from the source each time the parser runs out of input.
    Size chunk_size {DEFAULT_CHUNK_SIZE};

    // Convert FLOAT, DOUBLE, DOUBLE PRECISION, and REAL columns to double instead of Decimal.
    bool use_float {};

    LogLevel log_level {LogLevel::OFF};
    LogTarget log_target {};

    // Log file path prefix. Only used with LogTarget::FILE.
    Slice log_prefix;
    Size max_log_size {DEFAULT_MAX_LOG_SIZE};
    Size max_log_files {DEFAULT_MAX_LOG_FILES};
};

} // namespace Tessera

#endif // TESSERA_OPTIONS_H
