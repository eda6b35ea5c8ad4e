#include <catch2/catch_test_macros.hpp>
#include "util/Logger.hpp"
#include "errors/Errors.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace agegraph;
using namespace agegraph::util;

namespace {

// Redirects the logger for the duration of a test
class CapturedLog {
public:
    explicit CapturedLog(LogLevel level) : m_previous(Logger::instance().level()) {
        Logger::instance().setOutputStream(&m_out);
        Logger::instance().setLevel(level);
    }
    ~CapturedLog() {
        Logger::instance().setOutputStream(&std::cerr);
        Logger::instance().setLevel(m_previous);
    }
    std::string text() const { return m_out.str(); }

private:
    std::ostringstream m_out;
    LogLevel m_previous;
};

} // namespace

TEST_CASE("Logger singleton", "[Logger]") {
    CHECK(&Logger::instance() == &Logger::instance());
}

TEST_CASE("Logger filters below the configured level", "[Logger]") {
    CapturedLog log(LogLevel::WARN);

    AGEGRAPH_LOG_DEBUG("debug message");
    AGEGRAPH_LOG_INFO("info message");
    AGEGRAPH_LOG_WARN("warn message");
    AGEGRAPH_LOG_ERROR("error message");

    auto text = log.text();
    CHECK(text.find("debug message") == std::string::npos);
    CHECK(text.find("info message") == std::string::npos);
    CHECK(text.find("[WARN ] warn message") != std::string::npos);
    CHECK(text.find("[ERROR] error message") != std::string::npos);
}

TEST_CASE("Logger debug macro skips message construction when disabled", "[Logger]") {
    CapturedLog log(LogLevel::INFO);
    int built = 0;
    auto message = [&built]() { ++built; return std::string("expensive"); };

    AGEGRAPH_LOG_DEBUG(message());
    CHECK(built == 0);

    Logger::instance().setLevel(LogLevel::DEBUG);
    AGEGRAPH_LOG_DEBUG(message());
    CHECK(built == 1);
    CHECK(log.text().find("[DEBUG] expensive") != std::string::npos);
}

TEST_CASE("Logger levelFromString", "[Logger]") {
    CHECK(Logger::levelFromString("debug") == LogLevel::DEBUG);
    CHECK(Logger::levelFromString("INFO") == LogLevel::INFO);
    CHECK(Logger::levelFromString("Warning") == LogLevel::WARN);
    CHECK(Logger::levelFromString("WARN") == LogLevel::WARN);
    CHECK(Logger::levelFromString("CRITICAL") == LogLevel::ERROR);
    CHECK_THROWS_AS(Logger::levelFromString("TRACE"), errors::ValidationError);
}

TEST_CASE("Logger truncate", "[Logger]") {
    CHECK(Logger::truncate("short", 10) == "short");

    std::string longText(20, 'x');
    auto truncated = Logger::truncate(longText, 5);
    CHECK(truncated.rfind("xxxxx...", 0) == 0);
    CHECK(truncated.find("total 20 bytes") != std::string::npos);
}

TEST_CASE("Logger file logging appends", "[Logger]") {
    auto path = std::filesystem::temp_directory_path() / "agegraph-logger-test.log";
    std::filesystem::remove(path);

    Logger::instance().enableFileLogging(path.string());
    AGEGRAPH_LOG_ERROR("written to file");
    Logger::instance().setOutputStream(&std::cerr);

    std::ifstream in(path);
    std::stringstream content;
    content << in.rdbuf();
    CHECK(content.str().find("written to file") != std::string::npos);

    std::filesystem::remove(path);

    CHECK_THROWS_AS(Logger::instance().enableFileLogging("/nonexistent-dir/agegraph.log"),
                    errors::ValidationError);
    Logger::instance().setOutputStream(&std::cerr);
}
