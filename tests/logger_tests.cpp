#include <zlib.h>
#include "test_common.hpp"

using namespace refgate::test_support;

TEST_CASE("Logger writes text lines with fields") {
    TempDir dir("refgate_logger_text");
    fs::path log = dir.path / "refgate.log";
    set_json_logging(false);
    REQUIRE(init_logger(log.string(), LogLevel::INFO));
    LoggerGuard guard;
    REQUIRE(logger_initialized());
    REQUIRE(log_file_path() == log.string());
    log_debug("hidden");
    log_info("Update rejected", {{"ref", "refs/heads/release"}, {"reason", "merge-only"}});
    shutdown_logger();
    std::string content = read_file(log);
    REQUIRE(content.find("hidden") == std::string::npos);
    REQUIRE(content.find("[INFO] Update rejected") != std::string::npos);
    REQUIRE(content.find("ref=refs/heads/release") != std::string::npos);
    REQUIRE(content.find("reason=merge-only") != std::string::npos);
}

TEST_CASE("Logger writes JSON lines") {
    TempDir dir("refgate_logger_json");
    fs::path log = dir.path / "refgate.log";
    set_json_logging(true);
    REQUIRE(init_logger(log.string(), LogLevel::DEBUG));
    LoggerGuard guard;
    log_event(LogLevel::WARNING, "quote \" here", {{"key", "a\\b"}});
    shutdown_logger();
    set_json_logging(false);
    std::string content = read_file(log);
    REQUIRE(content.find("\"level\":\"WARNING\"") != std::string::npos);
    REQUIRE(content.find("\"msg\":\"quote \\\" here\"") != std::string::npos);
    REQUIRE(content.find("\"key\":\"a\\\\b\"") != std::string::npos);
}

TEST_CASE("Logger falls back to a discard sink") {
    fs::path log = fs::temp_directory_path() / "refgate_no_such_dir" / "sub" / "refgate.log";
    REQUIRE_FALSE(init_logger(log.string()));
    LoggerGuard guard;
    REQUIRE_FALSE(logger_initialized());
    REQUIRE(log_file_path().empty());
    log_error("dropped", {{"k", "v"}});
    flush_logger();
    REQUIRE_FALSE(fs::exists(log));
}

TEST_CASE("Logger appends across runs") {
    TempDir dir("refgate_logger_append");
    fs::path log = dir.path / "refgate.log";
    REQUIRE(init_logger(log.string()));
    log_info("first");
    shutdown_logger();
    REQUIRE(init_logger(log.string()));
    log_info("second");
    shutdown_logger();
    std::string content = read_file(log);
    REQUIRE(content.find("first") != std::string::npos);
    REQUIRE(content.find("second") != std::string::npos);
}

TEST_CASE("Logger rotates and limits files") {
    TempDir dir("refgate_logger_rotate");
    fs::path log = dir.path / "refgate.log";
    set_log_compression(false);
    REQUIRE(init_logger(log.string(), LogLevel::INFO, 100, 2));
    LoggerGuard guard;
    for (int i = 0; i < 200; ++i)
        log_info("entry " + std::to_string(i));
    shutdown_logger();
    REQUIRE(fs::exists(log));
    REQUIRE(fs::exists(log.string() + ".1"));
    REQUIRE(fs::exists(log.string() + ".2"));
    REQUIRE_FALSE(fs::exists(log.string() + ".3"));
}

TEST_CASE("Logger compresses rotated files") {
    TempDir dir("refgate_logger_compress");
    fs::path log = dir.path / "refgate.log";
    set_log_compression(true);
    REQUIRE(init_logger(log.string(), LogLevel::INFO, 100, 2));
    LoggerGuard guard;
    for (int i = 0; i < 200; ++i)
        log_info("entry " + std::to_string(i));
    shutdown_logger();
    set_log_compression(false);
    fs::path gz = log.string() + ".1.gz";
    REQUIRE(fs::exists(gz));
    REQUIRE_FALSE(fs::exists(log.string() + ".1"));

    gzFile f = gzopen(gz.string().c_str(), "rb");
    REQUIRE(f != nullptr);
    char buf[256];
    int n = gzread(f, buf, sizeof(buf) - 1);
    gzclose(f);
    REQUIRE(n > 0);
    buf[n] = '\0';
    REQUIRE(std::string(buf).find("entry") != std::string::npos);
}
