#pragma once
#include <string>

inline constexpr const char* EDGE_SCROLL_LOG_PATH = "/tmp/hypr-edge-scroll.log";

void setDebugLogging(bool enabled);
bool debugLoggingEnabled();

// Appends a line to EDGE_SCROLL_LOG_PATH. No-op unless debug logging is on.
void edgeLog(const std::string& msg);
