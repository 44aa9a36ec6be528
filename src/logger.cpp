#include "logger.hpp"
#include <zlib.h>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <syslog.h>
#include "time_utils.hpp"

namespace fs = std::filesystem;

static std::ofstream g_log_ofs;
static std::string g_log_path; // NOLINT(runtime/string)
static std::mutex g_log_mtx;
static std::atomic<LogLevel> g_min_level{LogLevel::INFO};
static std::atomic<size_t> g_max_size{0};
static std::atomic<size_t> g_max_files{1};
static std::atomic<bool> g_json_log{false};
static std::atomic<bool> g_compress_logs{false};
static std::atomic<bool> g_syslog{false};

bool init_logger(const std::string& path, LogLevel level, size_t max_size, size_t max_files) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    if (g_log_ofs.is_open()) {
        g_log_ofs.flush();
        g_log_ofs.close();
    }
    g_log_ofs.clear();
    g_log_path.clear();
    g_min_level.store(level);
    g_max_size.store(max_size);
    g_max_files.store(max_files);
    if (path.empty())
        return false;
    g_log_ofs.open(path, std::ios::app);
    if (!g_log_ofs.is_open()) {
        // Enforcement goes on without a log file.
        std::cerr << "refgate: cannot open log file " << path << ", logging disabled" << std::endl;
        g_log_ofs.clear();
        return false;
    }
    g_log_path = path;
    return true;
}

void init_syslog(int facility) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    g_syslog.store(true);
    openlog("refgate", LOG_PID | LOG_CONS, facility == 0 ? LOG_USER : facility);
}

void set_json_logging(bool enable) { g_json_log.store(enable); }

void set_log_compression(bool enable) { g_compress_logs.store(enable); }

bool logger_initialized() {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    return g_log_ofs.is_open();
}

std::string log_file_path() {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    return g_log_path;
}

void flush_logger() {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    if (g_log_ofs.is_open())
        g_log_ofs.flush();
}

static bool gzip_file(const std::string& src, const std::string& dst) {
    std::ifstream in(src, std::ios::binary);
    gzFile out = gzopen(dst.c_str(), "wb");
    if (!in.is_open() || out == nullptr) {
        if (out)
            gzclose(out);
        return false;
    }
    char buf[8192];
    while (in) {
        in.read(buf, sizeof(buf));
        std::streamsize n = in.gcount();
        if (n > 0)
            gzwrite(out, buf, static_cast<unsigned int>(n));
    }
    gzclose(out);
    return true;
}

static std::string json_escape(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (char c : in) {
        switch (c) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            out += c;
            break;
        }
    }
    return out;
}

static const char* level_label(LogLevel level) {
    switch (level) {
    case LogLevel::DEBUG:
        return "DEBUG";
    case LogLevel::INFO:
        return "INFO";
    case LogLevel::WARNING:
        return "WARNING";
    case LogLevel::ERR:
        return "ERROR";
    }
    return "INFO";
}

static std::string format_line(LogLevel level, const std::string& msg,
                               const std::map<std::string, std::string>& fields) {
    std::string ts = timestamp();
    std::string line;
    if (g_json_log.load()) {
        line = "{\"timestamp\":\"" + json_escape(ts) + "\",\"level\":\"" + level_label(level) +
               "\",\"msg\":\"" + json_escape(msg) + "\"";
        for (const auto& [k, v] : fields)
            line += ",\"" + json_escape(k) + "\":\"" + json_escape(v) + "\"";
        line += "}";
    } else {
        line = "[" + ts + "] [" + level_label(level) + "] " + msg;
        for (const auto& [k, v] : fields)
            line += " " + k + "=" + v;
    }
    return line;
}

// Caller holds g_log_mtx.
static void rotate_if_needed() {
    if (g_max_size.load() == 0 || g_log_path.empty())
        return;
    g_log_ofs.flush();
    std::error_code ec;
    auto size = fs::file_size(g_log_path, ec);
    if (ec || size <= g_max_size.load())
        return;
    g_log_ofs.close();
    size_t keep = g_max_files.load();
    if (keep > 0) {
        const std::string suffix = g_compress_logs.load() ? ".gz" : "";
        for (size_t i = keep; i > 0; --i) {
            fs::path src = g_log_path + "." + std::to_string(i) + suffix;
            if (i == keep) {
                fs::remove(src, ec);
            } else {
                fs::path dst = g_log_path + "." + std::to_string(i + 1) + suffix;
                fs::rename(src, dst, ec);
            }
        }
        fs::path first = g_log_path + ".1";
        fs::rename(g_log_path, first, ec);
        if (g_compress_logs.load()) {
            fs::path gz = first;
            gz += ".gz";
            if (gzip_file(first.string(), gz.string()))
                fs::remove(first, ec);
        }
    }
    g_log_ofs.open(g_log_path, std::ios::trunc);
}

static int syslog_priority(LogLevel level) {
    switch (level) {
    case LogLevel::DEBUG:
        return LOG_DEBUG;
    case LogLevel::INFO:
        return LOG_INFO;
    case LogLevel::WARNING:
        return LOG_WARNING;
    case LogLevel::ERR:
        return LOG_ERR;
    }
    return LOG_INFO;
}

void log_event(LogLevel level, const std::string& message,
               const std::map<std::string, std::string>& fields) {
    if (level < g_min_level.load())
        return;
    std::lock_guard<std::mutex> lk(g_log_mtx);
    const bool to_file = g_log_ofs.is_open();
    if (!to_file && !g_syslog.load())
        return;
    std::string line = format_line(level, message, fields);
    if (to_file) {
        g_log_ofs << line << std::endl;
        rotate_if_needed();
    }
    if (g_syslog.load())
        syslog(syslog_priority(level), "%s", line.c_str());
}

void log_debug(const std::string& msg) { log_event(LogLevel::DEBUG, msg); }
void log_debug(const std::string& msg, const std::map<std::string, std::string>& fields) {
    log_event(LogLevel::DEBUG, msg, fields);
}
void log_info(const std::string& msg) { log_event(LogLevel::INFO, msg); }
void log_info(const std::string& msg, const std::map<std::string, std::string>& fields) {
    log_event(LogLevel::INFO, msg, fields);
}
void log_warning(const std::string& msg) { log_event(LogLevel::WARNING, msg); }
void log_warning(const std::string& msg, const std::map<std::string, std::string>& fields) {
    log_event(LogLevel::WARNING, msg, fields);
}
void log_error(const std::string& msg) { log_event(LogLevel::ERR, msg); }
void log_error(const std::string& msg, const std::map<std::string, std::string>& fields) {
    log_event(LogLevel::ERR, msg, fields);
}

void shutdown_logger() {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    if (g_log_ofs.is_open()) {
        g_log_ofs.flush();
        g_log_ofs.close();
    }
    g_log_path.clear();
    if (g_syslog.load()) {
        closelog();
        g_syslog.store(false);
    }
}
