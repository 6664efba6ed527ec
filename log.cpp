#include "log.hpp"
#include <fstream>

static bool s_debugLogging = false;

void setDebugLogging(bool enabled) {
    s_debugLogging = enabled;
}

bool debugLoggingEnabled() {
    return s_debugLogging;
}

void edgeLog(const std::string& msg) {
    if (!s_debugLogging)
        return;

    std::ofstream log(EDGE_SCROLL_LOG_PATH, std::ios::app);
    if (log.is_open())
        log << "[hypr-edge-scroll] " << msg << "\n";
}
