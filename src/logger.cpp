#include "logger.hpp"
#include <zlib.h>
#include <atomic>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "time_utils.hpp"
#ifdef __linux__
#include <syslog.h>
#endif

namespace fs = std::filesystem;

static std::ofstream g_log_ofs;
static std::string g_log_path; // NOLINT(runtime/string)
static std::atomic<LogLevel> g_min_level{LogLevel::INFO};
static std::atomic<size_t> g_max_size{0};
static std::atomic<size_t> g_max_files{1};
static std::atomic<bool> g_json_log{false};
static std::atomic<bool> g_compress_logs{false};
static std::atomic<bool> g_console{false};
static std::atomic<bool> g_annotations{false};
#ifdef __linux__
static std::atomic<bool> g_syslog{false};
#endif

struct LogMessage {
    LogLevel level;
    std::string ts;
    std::string msg;
    std::map<std::string, std::string> fields;
};

static std::queue<LogMessage> g_log_queue;
static std::mutex g_queue_mtx;
static std::condition_variable g_queue_cv;
static std::condition_variable g_drained_cv;
static bool g_writing = false;
static std::atomic<bool> g_running{false};
static std::thread g_log_thread;
static std::mutex g_init_mtx;
static std::mutex g_console_mtx;

static void log_worker();

static void stop_log_thread() {
    {
        std::lock_guard<std::mutex> qlk(g_queue_mtx);
        g_running.store(false);
    }
    g_queue_cv.notify_all();
    if (g_log_thread.joinable())
        g_log_thread.join();
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

void init_logger(const std::string& path, LogLevel level, size_t max_size, size_t max_files) {
    std::lock_guard<std::mutex> lk(g_init_mtx);
    std::string prev_path = g_log_path;
    stop_log_thread();
    if (g_log_ofs.is_open()) {
        g_log_ofs.flush();
        g_log_ofs.close();
    } else {
        g_log_ofs.clear();
    }
    g_max_size.store(max_size);
    g_max_files.store(max_files);
    std::string target = path;
    g_log_ofs.open(target, std::ios::app);
    if (!g_log_ofs.is_open()) {
        std::cerr << "Failed to open log file: " << path << std::endl;
        target = prev_path;
        if (!target.empty())
            g_log_ofs.open(target, std::ios::app);
    }
    g_log_path = target;
    g_min_level.store(level);
    g_running.store(true);
    g_log_thread = std::thread(log_worker);
}

#ifdef __linux__
void init_syslog(int facility) {
    std::lock_guard<std::mutex> lk(g_init_mtx);
    g_syslog.store(true);
    openlog("autosubsync", LOG_PID | LOG_CONS, facility);
}
#else
void init_syslog(int) {}
#endif

void set_log_level(LogLevel level) { g_min_level.store(level); }

void set_json_logging(bool enable) { g_json_log.store(enable); }

void set_log_compression(bool enable) { g_compress_logs.store(enable); }

void set_console_logging(bool enable) { g_console.store(enable); }

void set_github_annotations(bool enable) { g_annotations.store(enable); }

bool logger_initialized() {
    std::lock_guard<std::mutex> lk(g_init_mtx);
    return g_log_ofs.is_open();
}

void flush_logger() {
    std::unique_lock<std::mutex> lk(g_queue_mtx);
    g_drained_cv.wait_for(lk, std::chrono::seconds(5),
                          [] { return g_log_queue.empty() && !g_writing; });
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

/**
 * @brief Shift `log.N` to `log.N+1`, dropping the oldest, and move the active
 * file to `log.1` (gzipped when compression is enabled).
 */
static void rotate_files() {
    std::error_code ec;
    const size_t keep = g_max_files.load();
    const std::string suffix = g_compress_logs.load() ? ".gz" : "";
    for (size_t i = keep; i > 0; --i) {
        fs::path src = g_log_path + "." + std::to_string(i) + suffix;
        if (i == keep)
            fs::remove(src, ec);
        else
            fs::rename(src, g_log_path + "." + std::to_string(i + 1) + suffix, ec);
    }
    fs::path first = g_log_path + ".1";
    fs::rename(g_log_path, first, ec);
    if (!suffix.empty()) {
        fs::path gz = first;
        gz += suffix;
        if (gzip_file(first.string(), gz.string()))
            fs::remove(first, ec);
    }
}

static std::string format_line(const LogMessage& m) {
    if (g_json_log.load()) {
        nlohmann::json j{{"timestamp", m.ts}, {"level", level_label(m.level)}, {"msg", m.msg}};
        for (const auto& [k, v] : m.fields)
            j[k] = v;
        return j.dump();
    }
    std::string line = "[" + m.ts + "] [" + level_label(m.level) + "] " + m.msg;
    for (const auto& [k, v] : m.fields)
        line += " " + k + "=" + v;
    return line;
}

static void write_log_entry(const LogMessage& m) {
    if (!g_log_ofs.is_open())
        return;
    std::string line = format_line(m);
    g_log_ofs << line << '\n';
    if (g_max_size.load() > 0) {
        g_log_ofs.flush();
        std::error_code ec;
        if (fs::file_size(g_log_path, ec) > g_max_size.load() && !ec) {
            g_log_ofs.close();
            if (g_max_files.load() > 0)
                rotate_files();
            g_log_ofs.open(g_log_path, std::ios::trunc);
        }
    }
}

#ifdef __linux__
static void write_syslog(LogLevel level, const std::string& msg,
                         const std::map<std::string, std::string>& fields) {
    if (!g_syslog.load())
        return;
    int pri = LOG_INFO;
    switch (level) {
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
    std::string line = msg;
    for (const auto& [k, v] : fields)
        line += " " + k + "=" + v;
    syslog(pri, "%s", line.c_str());
}
#endif

static void write_console(LogLevel level, const std::string& msg,
                          const std::map<std::string, std::string>& fields) {
    std::string line = msg;
    for (const auto& [k, v] : fields)
        line += " " + k + "=" + v;
    std::lock_guard<std::mutex> lk(g_console_mtx);
    if (level >= LogLevel::WARNING) {
        if (g_annotations.load())
            std::cerr << (level == LogLevel::ERR ? "::error::" : "::warning::");
        else
            std::cerr << level_label(level) << ": ";
        std::cerr << line << std::endl;
    } else {
        std::cout << line << std::endl;
    }
}

static void enqueue_message(LogLevel level, const std::string& msg,
                            const std::map<std::string, std::string>& fields) {
    if (!g_running.load())
        return;
    {
        std::lock_guard<std::mutex> lk(g_queue_mtx);
        g_log_queue.push(LogMessage{level, timestamp(), msg, fields});
    }
    g_queue_cv.notify_one();
}

static void log(LogLevel level, const std::string& msg,
                const std::map<std::string, std::string>& fields) {
    if (level < g_min_level.load())
        return;
    if (g_console.load())
        write_console(level, msg, fields);
#ifdef __linux__
    write_syslog(level, msg, fields);
#endif
    enqueue_message(level, msg, fields);
}

static std::map<std::string, std::string> data_field(const std::string& data) {
    if (data.empty())
        return {};
    return {{"data", data}};
}

void log_debug(const std::string& msg) { log(LogLevel::DEBUG, msg, {}); }
void log_debug(const std::string& msg, const std::string& data) {
    log(LogLevel::DEBUG, msg, data_field(data));
}
void log_debug(const std::string& msg, const std::map<std::string, std::string>& fields) {
    log(LogLevel::DEBUG, msg, fields);
}

void log_info(const std::string& msg) { log(LogLevel::INFO, msg, {}); }
void log_info(const std::string& msg, const std::string& data) {
    log(LogLevel::INFO, msg, data_field(data));
}
void log_info(const std::string& msg, const std::map<std::string, std::string>& fields) {
    log(LogLevel::INFO, msg, fields);
}

void log_warning(const std::string& msg) { log(LogLevel::WARNING, msg, {}); }
void log_warning(const std::string& msg, const std::string& data) {
    log(LogLevel::WARNING, msg, data_field(data));
}
void log_warning(const std::string& msg, const std::map<std::string, std::string>& fields) {
    log(LogLevel::WARNING, msg, fields);
}

void log_error(const std::string& msg) { log(LogLevel::ERR, msg, {}); }
void log_error(const std::string& msg, const std::string& data) {
    log(LogLevel::ERR, msg, data_field(data));
}
void log_error(const std::string& msg, const std::map<std::string, std::string>& fields) {
    log(LogLevel::ERR, msg, fields);
}

void log_group_begin(const std::string& title) {
    if (g_console.load()) {
        std::lock_guard<std::mutex> lk(g_console_mtx);
        if (g_annotations.load())
            std::cout << "::group::" << title << std::endl;
        else
            std::cout << "== " << title << std::endl;
    }
    if (g_min_level.load() <= LogLevel::INFO)
        enqueue_message(LogLevel::INFO, title, {});
}

void log_group_end() {
    if (g_console.load() && g_annotations.load()) {
        std::lock_guard<std::mutex> lk(g_console_mtx);
        std::cout << "::endgroup::" << std::endl;
    }
}

static void log_worker() {
    std::vector<LogMessage> batch;
    batch.reserve(16);
    while (true) {
        std::unique_lock<std::mutex> lk(g_queue_mtx);
        g_queue_cv.wait(lk, [] { return !g_log_queue.empty() || !g_running.load(); });
        if (!g_running.load() && g_log_queue.empty())
            break;
        while (!g_log_queue.empty() && batch.size() < 16) {
            batch.push_back(std::move(g_log_queue.front()));
            g_log_queue.pop();
        }
        g_writing = true;
        lk.unlock();
        for (const LogMessage& m : batch)
            write_log_entry(m);
        batch.clear();
        g_log_ofs.flush();
        lk.lock();
        g_writing = false;
        if (g_log_queue.empty())
            g_drained_cv.notify_all();
    }
    g_log_ofs.flush();
    std::lock_guard<std::mutex> lk(g_queue_mtx);
    g_drained_cv.notify_all();
}

void shutdown_logger() {
    std::lock_guard<std::mutex> lk(g_init_mtx);
    stop_log_thread();
    if (g_log_ofs.is_open()) {
        g_log_ofs.flush();
        g_log_ofs.close();
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
