#include "logger.hpp"
#include <zlib.h>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>
#include "time_utils.hpp"
#ifdef __linux__
#include <syslog.h>
#endif

namespace fs = std::filesystem;

namespace {

struct LogMessage {
    LogLevel level;
    std::string msg;
    LogFields fields;
};

std::ofstream g_log_ofs;
std::string g_log_path; // NOLINT(runtime/string)
std::mutex g_file_mtx;
std::atomic<LogLevel> g_min_level{LogLevel::INFO};
std::atomic<size_t> g_max_size{0};
std::atomic<size_t> g_max_files{1};
std::atomic<bool> g_json_log{false};
std::atomic<bool> g_compress_logs{false};
std::atomic<bool> g_syslog{false};

std::queue<LogMessage> g_log_queue;
size_t g_in_flight = 0; // guarded by g_queue_mtx
std::mutex g_queue_mtx;
std::condition_variable g_queue_cv;
std::condition_variable g_idle_cv;
bool g_running = false; // guarded by g_queue_mtx
std::thread g_log_thread;
std::mutex g_init_mtx;

const char* level_label(LogLevel level) {
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

std::string json_escape(const std::string& in) {
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

std::string format_line(const LogMessage& m) {
    std::string ts = timestamp();
    std::string line;
    if (g_json_log.load()) {
        line = "{\"timestamp\":\"" + json_escape(ts) + "\",\"level\":\"" + level_label(m.level) +
               "\",\"msg\":\"" + json_escape(m.msg) + "\"";
        for (const auto& [k, v] : m.fields)
            line += ",\"" + json_escape(k) + "\":\"" + json_escape(v) + "\"";
        line += "}";
    } else {
        line = "[" + ts + "] [" + level_label(m.level) + "] " + m.msg;
        for (const auto& [k, v] : m.fields)
            line += " " + k + "=" + v;
    }
    return line;
}

bool gzip_file(const std::string& src, const std::string& dst) {
    std::ifstream in(src, std::ios::binary);
    if (!in.is_open())
        return false;
    gzFile out = gzopen(dst.c_str(), "wb");
    if (out == nullptr)
        return false;
    char buf[8192];
    bool ok = true;
    while (in && ok) {
        in.read(buf, sizeof(buf));
        std::streamsize n = in.gcount();
        if (n > 0 && gzwrite(out, buf, static_cast<unsigned int>(n)) == 0)
            ok = false;
    }
    return gzclose(out) == Z_OK && ok;
}

// Shift path.N -> path.N+1, dropping the oldest, then move the active file
// to path.1 (compressed when enabled). Caller holds g_file_mtx.
void rotate_files() {
    std::error_code ec;
    const size_t keep = g_max_files.load();
    const std::string ext = g_compress_logs.load() ? ".gz" : "";
    g_log_ofs.close();
    if (keep > 0) {
        for (size_t i = keep; i > 0; --i) {
            fs::path src = g_log_path + "." + std::to_string(i) + ext;
            if (i == keep)
                fs::remove(src, ec);
            else
                fs::rename(src, g_log_path + "." + std::to_string(i + 1) + ext, ec);
        }
        fs::path first = g_log_path + ".1";
        fs::rename(g_log_path, first, ec);
        if (!ext.empty() && gzip_file(first.string(), first.string() + ext))
            fs::remove(first, ec);
    }
    g_log_ofs.open(g_log_path, std::ios::trunc);
}

void write_log_entry(const LogMessage& m) {
    std::string line = format_line(m);
    {
        std::lock_guard<std::mutex> lk(g_file_mtx);
        if (g_log_ofs.is_open()) {
            g_log_ofs << line << '\n';
            if (g_max_size.load() > 0) {
                g_log_ofs.flush();
                std::error_code ec;
                auto size = fs::file_size(g_log_path, ec);
                if (!ec && size > g_max_size.load())
                    rotate_files();
            }
        }
    }
#ifdef __linux__
    if (g_syslog.load()) {
        int pri = LOG_INFO;
        switch (m.level) {
        case LogLevel::DEBUG:
            pri = LOG_DEBUG;
            break;
        case LogLevel::INFO:
            pri = LOG_INFO;
            break;
        case LogLevel::WARNING:
            pri = LOG_WARNING;
            break;
        case LogLevel::ERR:
            pri = LOG_ERR;
            break;
        }
        syslog(pri, "%s", line.c_str());
    }
#endif
}

void log_worker() {
    std::vector<LogMessage> batch;
    batch.reserve(16);
    std::unique_lock<std::mutex> lk(g_queue_mtx);
    while (true) {
        g_queue_cv.wait(lk, [] { return !g_log_queue.empty() || !g_running; });
        if (!g_running && g_log_queue.empty())
            break;
        while (!g_log_queue.empty() && batch.size() < 16) {
            batch.push_back(std::move(g_log_queue.front()));
            g_log_queue.pop();
        }
        g_in_flight = batch.size();
        lk.unlock();
        for (const LogMessage& m : batch)
            write_log_entry(m);
        batch.clear();
        {
            std::lock_guard<std::mutex> flk(g_file_mtx);
            g_log_ofs.flush();
        }
        lk.lock();
        g_in_flight = 0;
        if (g_log_queue.empty())
            g_idle_cv.notify_all();
    }
    g_idle_cv.notify_all();
}

// Caller holds g_init_mtx.
void start_log_thread() {
    {
        std::lock_guard<std::mutex> lk(g_queue_mtx);
        if (g_running)
            return;
        g_running = true;
    }
    g_log_thread = std::thread(log_worker);
}

void stop_log_thread() {
    {
        std::lock_guard<std::mutex> lk(g_queue_mtx);
        g_running = false;
    }
    g_queue_cv.notify_all();
    if (g_log_thread.joinable())
        g_log_thread.join();
}

} // namespace

bool init_logger(const std::string& path, LogLevel level, size_t max_size, size_t max_files) {
    std::lock_guard<std::mutex> lk(g_init_mtx);
    stop_log_thread();
    {
        std::lock_guard<std::mutex> flk(g_file_mtx);
        if (g_log_ofs.is_open())
            g_log_ofs.close();
        g_log_ofs.clear();
        g_log_ofs.open(path, std::ios::app);
        if (!g_log_ofs.is_open()) {
            std::cerr << "Failed to open log file: " << path << std::endl;
            return false;
        }
        g_log_path = path;
    }
    g_max_size.store(max_size);
    g_max_files.store(max_files);
    g_min_level.store(level);
    start_log_thread();
    return true;
}

#ifdef __linux__
void init_syslog(int facility) {
    std::lock_guard<std::mutex> lk(g_init_mtx);
    openlog("deployloop", LOG_PID | LOG_CONS, facility);
    g_syslog.store(true);
    start_log_thread();
}
#else
void init_syslog(int) {}
#endif

void set_log_level(LogLevel level) { g_min_level.store(level); }

void set_json_logging(bool enable) { g_json_log.store(enable); }

void set_log_compression(bool enable) { g_compress_logs.store(enable); }

bool parse_log_level(const std::string& name, LogLevel& out) {
    std::string v = name;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (v == "DEBUG")
        out = LogLevel::DEBUG;
    else if (v == "INFO")
        out = LogLevel::INFO;
    else if (v == "WARNING" || v == "WARN")
        out = LogLevel::WARNING;
    else if (v == "ERROR" || v == "ERR")
        out = LogLevel::ERR;
    else
        return false;
    return true;
}

void log_event(LogLevel level, const std::string& message, const LogFields& fields) {
    if (level < g_min_level.load())
        return;
    {
        std::lock_guard<std::mutex> lk(g_queue_mtx);
        if (!g_running)
            return;
        g_log_queue.push(LogMessage{level, message, fields});
    }
    g_queue_cv.notify_one();
}

void log_debug(const std::string& msg, const LogFields& fields) {
    log_event(LogLevel::DEBUG, msg, fields);
}
void log_info(const std::string& msg, const LogFields& fields) {
    log_event(LogLevel::INFO, msg, fields);
}
void log_warning(const std::string& msg, const LogFields& fields) {
    log_event(LogLevel::WARNING, msg, fields);
}
void log_error(const std::string& msg, const LogFields& fields) {
    log_event(LogLevel::ERR, msg, fields);
}

void flush_logger() {
    std::unique_lock<std::mutex> lk(g_queue_mtx);
    g_idle_cv.wait(lk, [] { return !g_running || (g_log_queue.empty() && g_in_flight == 0); });
}

void shutdown_logger() {
    std::lock_guard<std::mutex> lk(g_init_mtx);
    stop_log_thread();
    {
        std::lock_guard<std::mutex> flk(g_file_mtx);
        if (g_log_ofs.is_open()) {
            g_log_ofs.flush();
            g_log_ofs.close();
        }
    }
#ifdef __linux__
    if (g_syslog.load()) {
        closelog();
        g_syslog.store(false);
    }
#endif
    std::lock_guard<std::mutex> qlk(g_queue_mtx);
    std::queue<LogMessage>().swap(g_log_queue);
}
