#pragma once

#include <skills_mcp/core/result.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace skills_mcp {

enum class MockLevel {
    Info,
    Warn,
    Error,
    Debug,
};

// "INFO", "WARN", "ERROR", "DEBUG".
const char* MockLevelName(MockLevel level);

// Parse a level filter: info/warn/error/debug (any case) select one level,
// "all" selects every level (nullopt). Anything else is an error.
Result<std::optional<MockLevel>, Error> ParseLevelFilter(std::string_view text);

// ---------------------------------------------------------------------------
// LogGenerator — produces realistic-looking service log lines:
//
//   [2026-10-19 14:03:07.412] [WARN ] [auth-service] Retry attempt 2 of 3
//
// Deterministic for a given seed and base time.
// ---------------------------------------------------------------------------
class LogGenerator {
public:
    using Clock = std::chrono::system_clock;

    explicit LogGenerator(uint32_t seed);

    // One entry at `when`. A disengaged level picks one at random.
    std::string Entry(std::optional<MockLevel> level, Clock::time_point when);

    // `count` entries spaced one second apart, the last one close to `now`,
    // each with a random millisecond offset. Negative counts yield nothing.
    std::vector<std::string> Generate(int count, std::optional<MockLevel> level,
                                      Clock::time_point now);

private:
    std::string FillPlaceholders(std::string_view text);

    std::mt19937 rng_;
};

// Local-time "YYYY-MM-DD HH:MM:SS.mmm".
std::string FormatLogTimestamp(LogGenerator::Clock::time_point when);

} // namespace skills_mcp
