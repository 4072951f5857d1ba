#include <skills_mcp/tools/log_generator.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace skills_mcp {

namespace {

constexpr std::array<MockLevel, 4> kLevels = {
    MockLevel::Info, MockLevel::Warn, MockLevel::Error, MockLevel::Debug,
};

const std::vector<std::string_view> kServices = {
    "api-gateway",
    "auth-service",
    "user-service",
    "payment-service",
    "notification-service",
    "cache-manager",
    "db-connector",
    "queue-worker",
};

const std::vector<std::string_view>& Templates(MockLevel level) {
    static const std::vector<std::string_view> info = {
        "Request processed successfully",
        "User session started",
        "Cache hit for key: user_{}",
        "Connection established to database",
        "Health check passed",
        "Configuration reloaded",
        "Scheduled task completed",
        "Message published to queue",
    };
    static const std::vector<std::string_view> warn = {
        "High memory usage detected: {}%",
        "Slow query detected: {}ms",
        "Rate limit approaching for client {}",
        "Retry attempt {} of 3",
        "Connection pool running low",
        "Deprecated API endpoint called",
        "Certificate expires in {} days",
    };
    static const std::vector<std::string_view> error = {
        "Failed to connect to database: timeout",
        "Authentication failed for user {}",
        "Payment processing error: insufficient funds",
        "Service unavailable: upstream timeout",
        "Invalid request payload",
        "Queue message processing failed",
        "Disk space critical: {}% used",
    };
    static const std::vector<std::string_view> debug = {
        "Entering function: process_request",
        "Variable state: count={}",
        "SQL query: SELECT * FROM users WHERE id={}",
        "HTTP response: status={}, body_size={}",
        "Cache miss for key: session_{}",
        "Decoding JWT token",
        "Validating input parameters",
    };
    switch (level) {
        case MockLevel::Info:  return info;
        case MockLevel::Warn:  return warn;
        case MockLevel::Error: return error;
        case MockLevel::Debug: return debug;
    }
    return info;
}

template <typename Container, typename Rng>
const auto& PickOne(const Container& items, Rng& rng) {
    std::uniform_int_distribution<std::size_t> dist(0, items.size() - 1);
    return items[dist(rng)];
}

} // anonymous namespace

const char* MockLevelName(MockLevel level) {
    switch (level) {
        case MockLevel::Info:  return "INFO";
        case MockLevel::Warn:  return "WARN";
        case MockLevel::Error: return "ERROR";
        case MockLevel::Debug: return "DEBUG";
    }
    return "INFO";
}

Result<std::optional<MockLevel>, Error> ParseLevelFilter(std::string_view text) {
    using R = Result<std::optional<MockLevel>, Error>;
    std::string upper(text);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "ALL") {
        return R::Ok(std::nullopt);
    }
    for (auto level : kLevels) {
        if (upper == MockLevelName(level)) {
            return R::Ok(level);
        }
    }
    return R::Err(Error{"GenerateLogs",
                        "Invalid level '" + std::string(text) +
                            "'. Use: info, warn, error, debug, or all",
                        ErrorCategory::InvalidArgument});
}

std::string FormatLogTimestamp(LogGenerator::Clock::time_point when) {
    const auto t = LogGenerator::Clock::to_time_t(when);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        when.time_since_epoch()) % 1000;

    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &t);
#else
    localtime_r(&t, &local);
#endif

    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

LogGenerator::LogGenerator(uint32_t seed) : rng_(seed) {}

std::string LogGenerator::FillPlaceholders(std::string_view text) {
    std::uniform_int_distribution<int> value(1, 9999);
    std::string out;
    out.reserve(text.size() + 8);
    std::size_t pos = 0;
    while (true) {
        auto hole = text.find("{}", pos);
        if (hole == std::string_view::npos) break;
        out.append(text.substr(pos, hole - pos));
        out += std::to_string(value(rng_));
        pos = hole + 2;
    }
    out.append(text.substr(pos));
    return out;
}

std::string LogGenerator::Entry(std::optional<MockLevel> level,
                                Clock::time_point when) {
    const auto chosen = level ? *level : PickOne(kLevels, rng_);
    const auto service = PickOne(kServices, rng_);
    const auto message = FillPlaceholders(PickOne(Templates(chosen), rng_));

    std::ostringstream oss;
    oss << '[' << FormatLogTimestamp(when) << "] "
        << '[' << std::left << std::setw(5) << MockLevelName(chosen) << "] "
        << '[' << service << "] " << message;
    return oss.str();
}

std::vector<std::string> LogGenerator::Generate(int count,
                                                std::optional<MockLevel> level,
                                                Clock::time_point now) {
    std::vector<std::string> lines;
    if (count <= 0) return lines;

    lines.reserve(static_cast<std::size_t>(count));
    std::uniform_int_distribution<int> jitter_ms(0, 999);
    const auto base = now - std::chrono::seconds(count);
    for (int i = 0; i < count; ++i) {
        const auto when = base + std::chrono::seconds(i) +
                          std::chrono::milliseconds(jitter_ms(rng_));
        lines.push_back(Entry(level, when));
    }
    return lines;
}

} // namespace skills_mcp
