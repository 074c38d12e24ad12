#include "sds_log.h"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <mutex>
#include <string>
#include <vector>

namespace sds {

static std::atomic<bool> last_to_stderr{false};

void default_log_callback(ggml_log_level level, const char * text, void * /*user_data*/) {
    bool to_stderr = last_to_stderr.load();
    if (level != GGML_LOG_LEVEL_CONT) {
        to_stderr = level >= GGML_LOG_LEVEL_WARN;
        last_to_stderr.store(to_stderr);
    }
    FILE * out = to_stderr ? stderr : stdout;
    std::fputs(text, out);
    std::fflush(out);
}

namespace {

struct LogSink {
    std::mutex mtx;
    ggml_log_callback cb = default_log_callback;
    void * user_data = nullptr;
    ggml_log_level min_level = GGML_LOG_LEVEL_INFO;
};

LogSink & sink() {
    static LogSink s;
    return s;
}

struct SinkState {
    ggml_log_callback cb;
    void * user_data;
    ggml_log_level min_level;
};

// callbacks are invoked with the lock released
SinkState snapshot() {
    LogSink & s = sink();
    std::lock_guard<std::mutex> lock(s.mtx);
    return SinkState{s.cb, s.user_data, s.min_level};
}

const char * level_tag(ggml_log_level level) {
    switch (level) {
        case GGML_LOG_LEVEL_DEBUG: return "DEBUG";
        case GGML_LOG_LEVEL_INFO:  return "INFO ";
        case GGML_LOG_LEVEL_WARN:  return "WARN ";
        case GGML_LOG_LEVEL_ERROR: return "ERROR";
        default:                   return "     ";
    }
}

const char * basename_of(const char * path) {
    const char * slash = std::strrchr(path, '/');
    return slash ? slash + 1 : path;
}

void ggml_forward_cb(ggml_log_level level, const char * text, void * /*user_data*/) {
    const SinkState s = snapshot();
    if (level != GGML_LOG_LEVEL_CONT && level < s.min_level) return;
    s.cb(level, text, s.user_data);
}

}

void set_log_callback(ggml_log_callback cb, void * user_data) {
    LogSink & s = sink();
    std::lock_guard<std::mutex> lock(s.mtx);
    s.cb = cb ? cb : default_log_callback;
    s.user_data = cb ? user_data : nullptr;
}

void set_log_level(ggml_log_level min_level) {
    LogSink & s = sink();
    std::lock_guard<std::mutex> lock(s.mtx);
    s.min_level = min_level;
}

void route_ggml_logs() {
    ggml_log_set(ggml_forward_cb, nullptr);
}

void log_printf(ggml_log_level level, const char * file, int line, const char * fmt, ...) {
    const SinkState s = snapshot();
    if (level < s.min_level) return;

    va_list args;
    va_start(args, fmt);
    va_list args_copy;
    va_copy(args_copy, args);
    const int n = std::vsnprintf(nullptr, 0, fmt, args);
    va_end(args);

    std::vector<char> msg((size_t)(n > 0 ? n : 0) + 1, '\0');
    std::vsnprintf(msg.data(), msg.size(), fmt, args_copy);
    va_end(args_copy);

    char head[128];
    std::snprintf(head, sizeof(head), "[%s] %s:%-4d - ", level_tag(level), basename_of(file), line);

    std::string text;
    text.reserve(std::strlen(head) + msg.size() + 1);
    text += head;
    text += msg.data();
    text += '\n';

    s.cb(level, text.c_str(), s.user_data);
}

}
