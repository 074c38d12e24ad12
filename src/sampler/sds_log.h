#pragma once

#include "ggml.h"

namespace sds {

// Writes below WARN to stdout and WARN and up to stderr. CONT lines follow the previous line.
void default_log_callback(ggml_log_level level, const char * text, void * user_data);

void set_log_callback(ggml_log_callback cb, void * user_data);
void set_log_level(ggml_log_level min_level);

// Sends ggml's own diagnostics through the same sink.
void route_ggml_logs();

void log_printf(ggml_log_level level, const char * file, int line, const char * fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 4, 5)))
#endif
    ;

}

#define SDS_LOG_DEBUG(...) ::sds::log_printf(GGML_LOG_LEVEL_DEBUG, __FILE__, __LINE__, __VA_ARGS__)
#define SDS_LOG_INFO(...)  ::sds::log_printf(GGML_LOG_LEVEL_INFO,  __FILE__, __LINE__, __VA_ARGS__)
#define SDS_LOG_WARN(...)  ::sds::log_printf(GGML_LOG_LEVEL_WARN,  __FILE__, __LINE__, __VA_ARGS__)
#define SDS_LOG_ERROR(...) ::sds::log_printf(GGML_LOG_LEVEL_ERROR, __FILE__, __LINE__, __VA_ARGS__)
