#include "pch.h"

namespace cbp {

namespace log {

namespace {
bool g_debug_mode = false;
}

void set_debug_mode(bool enabled) {
    g_debug_mode = enabled;
}

void debug(const std::string& message) {
    if (g_debug_mode) {
        std::cout << "[DEBUG] " << message << "\n";
    }
}

} // namespace log

void Diagnostics::warn(const std::string& message) {
    // Targets sharing a toolchain report the same problem once
    if (std::find(warnings_.begin(), warnings_.end(), message) != warnings_.end()) return;
    log::debug("warning: " + message);
    warnings_.push_back(message);
}

bool Diagnostics::contains(const std::string& text) const {
    for (const auto& w : warnings_) {
        if (w.find(text) != std::string::npos) return true;
    }
    return false;
}

} // namespace cbp
