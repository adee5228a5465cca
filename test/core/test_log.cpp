#include <catch2/catch_test_macros.hpp>

#include <bullvision/core/log.hpp>

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace bullvision;

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
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override {
        messages.push_back(
            {level, std::string(component), std::string(message)});
    }

    std::vector<CapturedMessage> messages;
};

// ===========================================================================
// ConsoleSink
// ===========================================================================

TEST_CASE("ConsoleSink: writes without crashing", "[log]") {
    ConsoleSink sink;
    // Just verify it doesn't throw or crash.
    sink.Write(LogLevel::Info, "test", "hello from console sink");
    sink.Write(LogLevel::Error, "test", "error from console sink");
}

// ===========================================================================
// JsonSink
// ===========================================================================

TEST_CASE("JsonSink: writes valid JSON lines", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Info, "manager", "started");

    auto line = oss.str();
    CHECK(line.find("\"level\":\"INFO\"") != std::string::npos);
    CHECK(line.find("\"component\":\"manager\"") != std::string::npos);
    CHECK(line.find("\"message\":\"started\"") != std::string::npos);
    CHECK(line.find("\"ts\":\"") != std::string::npos);
    // Must end with newline
    REQUIRE(!line.empty());
    CHECK(line.back() == '\n');
}

TEST_CASE("JsonSink: each write produces one line", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Debug, "a", "first");
    sink.Write(LogLevel::Warn, "b", "second");

    auto output = oss.str();
    // Count newlines: exactly 2
    auto count = std::count(output.begin(), output.end(), '\n');
    CHECK(count == 2);
}

TEST_CASE("JsonSink: all log levels produce correct names", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Debug, "x", "d");
    sink.Write(LogLevel::Info, "x", "i");
    sink.Write(LogLevel::Warn, "x", "w");
    sink.Write(LogLevel::Error, "x", "e");

    auto output = oss.str();
    CHECK(output.find("\"level\":\"DEBUG\"") != std::string::npos);
    CHECK(output.find("\"level\":\"INFO\"") != std::string::npos);
    CHECK(output.find("\"level\":\"WARN\"") != std::string::npos);
    CHECK(output.find("\"level\":\"ERROR\"") != std::string::npos);
}

TEST_CASE("JsonSink: escapes special characters in message", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Info, "esc", "line1\nline2\ttab \"quoted\" back\\slash");

    auto output = oss.str();
    CHECK(output.find("\\n") != std::string::npos);
    CHECK(output.find("\\t") != std::string::npos);
    CHECK(output.find("\\\"quoted\\\"") != std::string::npos);
    CHECK(output.find("back\\\\slash") != std::string::npos);
}

// ===========================================================================
// Logger: level filtering
// ===========================================================================

TEST_CASE("Logger: respects min_level", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    Logger logger(std::move(sink), LogLevel::Warn);

    logger.Debug("c", "should be filtered");
    logger.Info("c", "should be filtered");
    logger.Warn("c", "should pass");
    logger.Error("c", "should pass");

    REQUIRE(sink_ptr->messages.size() == 2);
    CHECK(sink_ptr->messages[0].level == LogLevel::Warn);
    CHECK(sink_ptr->messages[1].level == LogLevel::Error);
}

TEST_CASE("Logger: Debug level passes all messages", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    Logger logger(std::move(sink), LogLevel::Debug);

    logger.Debug("c", "d");
    logger.Info("c", "i");
    logger.Warn("c", "w");
    logger.Error("c", "e");

    CHECK(sink_ptr->messages.size() == 4);
}

TEST_CASE("Logger: Error level only passes errors", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    Logger logger(std::move(sink), LogLevel::Error);

    logger.Debug("c", "d");
    logger.Info("c", "i");
    logger.Warn("c", "w");
    logger.Error("c", "e");

    REQUIRE(sink_ptr->messages.size() == 1);
    CHECK(sink_ptr->messages[0].level == LogLevel::Error);
}

TEST_CASE("Logger: SetLevel changes filtering dynamically", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    Logger logger(std::move(sink), LogLevel::Error);

    logger.Info("c", "filtered");
    CHECK(sink_ptr->messages.empty());

    logger.SetLevel(LogLevel::Info);
    logger.Info("c", "now passes");
    REQUIRE(sink_ptr->messages.size() == 1);
    CHECK(sink_ptr->messages[0].message == "now passes");
}

// ===========================================================================
// Logger: message content
// ===========================================================================

TEST_CASE("Logger: preserves component and message", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    Logger logger(std::move(sink), LogLevel::Debug);

    logger.Info("connection", "Connected to 'news'");

    REQUIRE(sink_ptr->messages.size() == 1);
    CHECK(sink_ptr->messages[0].component == "connection");
    CHECK(sink_ptr->messages[0].message == "Connected to 'news'");
    CHECK(sink_ptr->messages[0].level == LogLevel::Info);
}

// ===========================================================================
// Logger: thread safety
// ===========================================================================

TEST_CASE("Logger: concurrent logging does not crash", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    Logger logger(std::move(sink), LogLevel::Debug);

    constexpr int kThreads = 8;
    constexpr int kMessagesPerThread = 100;

    std::vector<std::thread> threads;
    threads.reserve(kThreads);
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&logger, t]() {
            for (int i = 0; i < kMessagesPerThread; ++i) {
                logger.Info("thread-" + std::to_string(t),
                            "msg-" + std::to_string(i));
            }
        });
    }

    for (auto& th : threads) {
        th.join();
    }

    CHECK(sink_ptr->messages.size() == kThreads * kMessagesPerThread);
}

// ===========================================================================
// ConsoleSink format
// ===========================================================================

TEST_CASE("ConsoleSink: ISO timestamp, level and component", "[log]") {
    std::ostringstream oss;
    ConsoleSink sink(oss);

    sink.Write(LogLevel::Warn, "transport", "ignored SIGTERM");

    auto output = oss.str();
    CHECK(output.find("[WARN] [transport] ignored SIGTERM") != std::string::npos);
    CHECK(output.find('T') == 10);
    CHECK(output.back() == '\n');
}

// ===========================================================================
// FileSink / TeeSink
// ===========================================================================

TEST_CASE("FileSink: appends lines to the file", "[log]") {
    const std::string path = "bullvision_test_log_file.log";
    std::remove(path.c_str());
    {
        auto sink = FileSink::Open(path);
        REQUIRE(sink.IsOk());
        sink.Value()->Write(LogLevel::Info, "host", "first");
    }
    {
        auto sink = FileSink::Open(path);
        REQUIRE(sink.IsOk());
        sink.Value()->Write(LogLevel::Error, "host", "second");
    }

    std::ifstream in(path);
    std::string line1, line2;
    REQUIRE(std::getline(in, line1));
    REQUIRE(std::getline(in, line2));
    CHECK(line1.find("first") != std::string::npos);
    CHECK(line2.find("[ERROR]") != std::string::npos);
    std::remove(path.c_str());
}

TEST_CASE("FileSink: unwritable path is a config error", "[log]") {
    auto sink = FileSink::Open("/nonexistent-dir/sub/x.log");
    REQUIRE(sink.IsErr());
    CHECK(sink.Error().Is(ErrorCategory::Config));
    CHECK(sink.Error().target == "/nonexistent-dir/sub/x.log");
}

TEST_CASE("TeeSink: forwards to both sinks", "[log]") {
    auto a = std::make_unique<CaptureSink>();
    auto b = std::make_unique<CaptureSink>();
    auto* a_ptr = a.get();
    auto* b_ptr = b.get();
    TeeSink tee(std::move(a), std::move(b));

    tee.Write(LogLevel::Info, "c", "m");

    CHECK(a_ptr->messages.size() == 1);
    CHECK(b_ptr->messages.size() == 1);
}

// ===========================================================================
// ParseLogLevel
// ===========================================================================

TEST_CASE("ParseLogLevel: known names, any case", "[log]") {
    CHECK(ParseLogLevel("debug").Value() == LogLevel::Debug);
    CHECK(ParseLogLevel("INFO").Value() == LogLevel::Info);
    CHECK(ParseLogLevel("Warn").Value() == LogLevel::Warn);
    CHECK(ParseLogLevel("warning").Value() == LogLevel::Warn);
    CHECK(ParseLogLevel("error").Value() == LogLevel::Error);
}

TEST_CASE("ParseLogLevel: unknown name is a config error", "[log]") {
    auto r = ParseLogLevel("verbose");
    REQUIRE(r.IsErr());
    CHECK(r.Error().Is(ErrorCategory::Config));
    CHECK(r.Error().message.find("verbose") != std::string::npos);
}

// ===========================================================================
// Global logger
// ===========================================================================

TEST_CASE("Global logger: free functions reach the installed sink", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    InitGlobalLogger(std::move(sink), LogLevel::Info);

    LogDebug("x", "filtered");
    LogInfo("x", "info");
    LogWarn("x", "warn");
    LogError("x", "error");

    REQUIRE(sink_ptr->messages.size() == 3);
    CHECK(sink_ptr->messages[0].message == "info");
    CHECK(sink_ptr->messages[2].level == LogLevel::Error);

    InitGlobalLogger(std::make_unique<CaptureSink>(), LogLevel::Error);
}
