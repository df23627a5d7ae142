#include "piperpc/log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <vector>

namespace {

void log_callback_default(enum piperpc_log_level level, const char * text, void * user_data) {
    (void) level;
    (void) user_data;
    fputs(text, stderr);
    fflush(stderr);
}

struct log_state {
    std::mutex           mutex;
    piperpc_log_callback callback  = log_callback_default;
    void               * user_data = nullptr;

    std::atomic<int> min_level{PIPERPC_LOG_LEVEL_INFO};
};

log_state & g_state() {
    static log_state state;
    return state;
}

} // namespace

void piperpc_log_set(piperpc_log_callback log_callback, void * user_data) {
    auto & state = g_state();
    std::lock_guard<std::mutex> lock(state.mutex);
    state.callback  = log_callback ? log_callback : log_callback_default;
    state.user_data = user_data;
}

void piperpc_log_set_level(enum piperpc_log_level level) {
    g_state().min_level.store(level);
}

enum piperpc_log_level piperpc_log_get_level(void) {
    return static_cast<piperpc_log_level>(g_state().min_level.load());
}

void piperpc_log_internal(enum piperpc_log_level level, const char * format, ...) {
    auto & state = g_state();
    const int min_level = state.min_level.load();
    if (min_level == PIPERPC_LOG_LEVEL_NONE || level < min_level) {
        return;
    }

    va_list args;
    va_start(args, format);

    char buffer[1024];
    va_list args_copy;
    va_copy(args_copy, args);
    const int len = vsnprintf(buffer, sizeof(buffer), format, args);

    std::lock_guard<std::mutex> lock(state.mutex);
    if (len < 0) {
        state.callback(level, "piperpc: failed to format log message\n", state.user_data);
    } else if (len < (int) sizeof(buffer)) {
        state.callback(level, buffer, state.user_data);
    } else {
        std::vector<char> large((size_t) len + 1);
        vsnprintf(large.data(), large.size(), format, args_copy);
        state.callback(level, large.data(), state.user_data);
    }

    va_end(args_copy);
    va_end(args);
}
