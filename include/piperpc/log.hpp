#pragma once

#ifdef __GNUC__
#    define PIPERPC_ATTRIBUTE_FORMAT(...) __attribute__((format(printf, __VA_ARGS__)))
#else
#    define PIPERPC_ATTRIBUTE_FORMAT(...)
#endif

enum piperpc_log_level {
    PIPERPC_LOG_LEVEL_NONE  = 0,
    PIPERPC_LOG_LEVEL_DEBUG = 1,
    PIPERPC_LOG_LEVEL_INFO  = 2,
    PIPERPC_LOG_LEVEL_WARN  = 3,
    PIPERPC_LOG_LEVEL_ERROR = 4,
};

// Receives every formatted log line. The text already carries its newline.
typedef void (*piperpc_log_callback)(enum piperpc_log_level level, const char * text, void * user_data);

// Replace the log sink. Passing nullptr restores the default sink (stderr).
// Never log to stdout from the server: stdout is the protocol stream.
void piperpc_log_set(piperpc_log_callback log_callback, void * user_data);

// Messages below this level are dropped before formatting. Default: INFO.
void piperpc_log_set_level(enum piperpc_log_level level);
enum piperpc_log_level piperpc_log_get_level(void);

void piperpc_log_internal(enum piperpc_log_level level, const char * format, ...) PIPERPC_ATTRIBUTE_FORMAT(2, 3);

#define PIPERPC_LOG_ERROR(...) piperpc_log_internal(PIPERPC_LOG_LEVEL_ERROR, __VA_ARGS__)
#define PIPERPC_LOG_WARN(...)  piperpc_log_internal(PIPERPC_LOG_LEVEL_WARN , __VA_ARGS__)
#define PIPERPC_LOG_INFO(...)  piperpc_log_internal(PIPERPC_LOG_LEVEL_INFO , __VA_ARGS__)
#define PIPERPC_LOG_DEBUG(...) piperpc_log_internal(PIPERPC_LOG_LEVEL_DEBUG, __VA_ARGS__)
