#pragma once

#include <string>
#include <vector>

namespace cbp {

namespace log {

// Runtime switch for [DEBUG] trace output (--debug)
void set_debug_mode(bool enabled);

// Print a [DEBUG] line to stdout when debug mode is on
void debug(const std::string& message);

} // namespace log

// Non-fatal problems collected while the pipeline runs.
// The CLI reports them once the run is over.
class Diagnostics {
public:
    void warn(const std::string& message);

    const std::vector<std::string>& warnings() const { return warnings_; }
    bool has_warnings() const { return !warnings_.empty(); }

    // True if any collected warning contains the given text
    bool contains(const std::string& text) const;

private:
    std::vector<std::string> warnings_;
};

} // namespace cbp
