#include <catch2/catch_test_macros.hpp>

#include <skills_mcp/core/log.hpp>

#include <nlohmann/json.hpp>

#include <cstdio>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace skills_mcp;

// ===========================================================================
// Helper: a sink that captures messages into a vector.
// ===========================================================================

struct CapturedMessage {
    LogLevel level;
    std::string component;
    std::string message;
};

class CaptureSink : public ILogSink {
public:
    explicit CaptureSink(std::vector<CapturedMessage>& out) : out_(out) {}

    void Write(LogLevel level, std::string_view component,
               std::string_view message) override {
        out_.push_back({level, std::string(component), std::string(message)});
    }

private:
    std::vector<CapturedMessage>& out_;
};

// ===========================================================================
// ParseLogLevel
// ===========================================================================

TEST_CASE("ParseLogLevel: accepted names", "[log]") {
    CHECK(ParseLogLevel("debug").Value() == LogLevel::Debug);
    CHECK(ParseLogLevel("INFO").Value() == LogLevel::Info);
    CHECK(ParseLogLevel("warn").Value() == LogLevel::Warn);
    CHECK(ParseLogLevel("Warning").Value() == LogLevel::Warn);
    CHECK(ParseLogLevel("error").Value() == LogLevel::Error);
}

TEST_CASE("ParseLogLevel: unknown name", "[log]") {
    auto result = ParseLogLevel("trace");
    REQUIRE(result.IsErr());
    CHECK(result.Error().find("'trace'") != std::string::npos);
}

// ===========================================================================
// JsonSink
// ===========================================================================

TEST_CASE("JsonSink: one JSON object per line", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Info, "session", "started");
    sink.Write(LogLevel::Error, "dispatch", "boom \"quoted\"\n");

    std::istringstream lines(oss.str());
    std::string first;
    std::string second;
    REQUIRE(std::getline(lines, first));
    REQUIRE(std::getline(lines, second));

    auto a = nlohmann::json::parse(first);
    CHECK(a["level"] == "INFO");
    CHECK(a["component"] == "session");
    CHECK(a["message"] == "started");
    CHECK(a["ts"].get<std::string>().back() == 'Z');

    auto b = nlohmann::json::parse(second);
    CHECK(b["level"] == "ERROR");
    CHECK(b["message"] == "boom \"quoted\"\n");
}

TEST_CASE("JsonSink: invalid UTF-8 does not throw", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);
    REQUIRE_NOTHROW(sink.Write(LogLevel::Warn, "codec", "bad \xff byte"));
    CHECK_FALSE(oss.str().empty());
}

// ===========================================================================
// ColorConsoleSink
// ===========================================================================

TEST_CASE("ColorConsoleSink: plain mode", "[log]") {
    std::ostringstream oss;
    ColorConsoleSink sink(false, oss);
    sink.Write(LogLevel::Warn, "tools", "careful");

    auto out = oss.str();
    CHECK(out.find("[WARN] [tools] careful\n") != std::string::npos);
    CHECK(out.find("\033[") == std::string::npos);
}

TEST_CASE("ColorConsoleSink: color mode contains ANSI escape codes", "[log]") {
    std::ostringstream oss;
    ColorConsoleSink sink(true, oss);
    sink.Write(LogLevel::Error, "tools", "broken");

    auto out = oss.str();
    CHECK(out.find("\033[1;31m") != std::string::npos);
    CHECK(out.find("broken") != std::string::npos);
    CHECK(out.find("[tools]") != std::string::npos);
}

// ===========================================================================
// FileSink
// ===========================================================================

TEST_CASE("FileSink: appends records", "[log]") {
    const std::string path = "skills_mcp_test_file_sink.log";
    std::remove(path.c_str());

    {
        auto sink = FileSink::Open(path, true);
        REQUIRE(sink.IsOk());
        auto owned = std::move(sink).Value();
        owned->Write(LogLevel::Info, "session", "first");
        owned->Write(LogLevel::Debug, "session", "second");
    }

    std::ifstream in(path);
    std::string line;
    std::vector<std::string> messages;
    while (std::getline(in, line)) {
        messages.push_back(nlohmann::json::parse(line)["message"].get<std::string>());
    }
    in.close();
    std::remove(path.c_str());

    REQUIRE(messages.size() == 2);
    CHECK(messages[0] == "first");
    CHECK(messages[1] == "second");
}

TEST_CASE("FileSink: wraps an opened stream in plain format", "[log]") {
    const std::string path = "skills_mcp_test_plain_sink.log";
    std::remove(path.c_str());

    {
        std::ofstream file(path);
        REQUIRE(file.is_open());
        auto sink = std::make_unique<FileSink>(std::move(file), false);
        sink->Write(LogLevel::Warn, "session", "plain record");
    }

    std::ifstream in(path);
    std::string line;
    REQUIRE(std::getline(in, line));
    in.close();
    std::remove(path.c_str());

    CHECK(line.find("[WARN] [session] plain record") != std::string::npos);
    CHECK(line.find("\033[") == std::string::npos);
}

TEST_CASE("FileSink: unopenable path is a config error", "[log]") {
    auto sink = FileSink::Open("/nonexistent-dir/sub/skills.log", false);
    REQUIRE(sink.IsErr());
    CHECK(sink.Error().category == ErrorCategory::Config);
    CHECK(sink.Error().message.find("/nonexistent-dir/sub/skills.log") != std::string::npos);
}

// ===========================================================================
// Logger
// ===========================================================================

TEST_CASE("Logger: respects min_level", "[log]") {
    std::vector<CapturedMessage> captured;
    Logger logger(std::make_unique<CaptureSink>(captured), LogLevel::Warn);

    logger.Debug("c", "dropped");
    logger.Info("c", "dropped");
    logger.Warn("c", "kept");
    logger.Error("c", "kept too");

    REQUIRE(captured.size() == 2);
    CHECK(captured[0].level == LogLevel::Warn);
    CHECK(captured[0].message == "kept");
    CHECK(captured[1].level == LogLevel::Error);
}

TEST_CASE("Logger: SetLevel and Enabled", "[log]") {
    std::vector<CapturedMessage> captured;
    Logger logger(std::make_unique<CaptureSink>(captured), LogLevel::Error);

    CHECK_FALSE(logger.Enabled(LogLevel::Info));
    logger.SetLevel(LogLevel::Debug);
    CHECK(logger.Enabled(LogLevel::Debug));

    logger.Debug("session", "now visible");
    REQUIRE(captured.size() == 1);
    CHECK(captured[0].component == "session");
}

TEST_CASE("Logger: concurrent logging keeps every record", "[log]") {
    std::vector<CapturedMessage> captured;
    Logger logger(std::make_unique<CaptureSink>(captured), LogLevel::Debug);

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&logger]() {
            for (int i = 0; i < 100; ++i) {
                logger.Info("worker", "tick");
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    CHECK(captured.size() == 400);
}

// ===========================================================================
// Global logger
// ===========================================================================

TEST_CASE("GlobalLogger: free functions reach installed sink", "[log]") {
    std::vector<CapturedMessage> captured;
    InitGlobalLogger(std::make_unique<CaptureSink>(captured), LogLevel::Info);

    LogDebug("g", "hidden");
    LogInfo("g", "info");
    LogWarn("g", "warn");
    LogError("g", "error");

    // Detach before `captured` goes out of scope.
    InitGlobalLogger(std::make_unique<ColorConsoleSink>(false), LogLevel::Error);

    REQUIRE(captured.size() == 3);
    CHECK(captured[0].message == "info");
    CHECK(captured[2].level == LogLevel::Error);
}
