#include "pch.h"
#include "path_utils.hpp"

namespace cbp {

std::string to_unix_path(const std::string& path) {
    std::string result = path;
    std::replace(result.begin(), result.end(), '\\', '/');
    return result;
}

static bool has_drive_letter(const std::string& path) {
    return path.size() >= 2 && std::isalpha(static_cast<unsigned char>(path[0])) && path[1] == ':';
}

bool is_absolute_path(const std::string& path) {
    if (path.empty()) return false;
    if (path[0] == '/' || path[0] == '\\') return true;
    return has_drive_letter(path) && path.size() >= 3 && (path[2] == '/' || path[2] == '\\');
}

std::string normalize_path(const std::string& path) {
    std::string p = to_unix_path(path);

    // Split off the root ("/", "C:/" or "C:")
    std::string root;
    size_t pos = 0;
    if (has_drive_letter(p)) {
        root = p.substr(0, 2);
        pos = 2;
    }
    if (pos < p.size() && p[pos] == '/') {
        root += '/';
        ++pos;
    }

    std::vector<std::string> segments;
    std::stringstream ss(p.substr(pos));
    std::string segment;
    while (std::getline(ss, segment, '/')) {
        if (segment.empty() || segment == ".") continue;
        if (segment == "..") {
            if (!segments.empty() && segments.back() != "..") {
                segments.pop_back();
            } else if (root.empty()) {
                segments.push_back(segment);
            }
            continue;
        }
        segments.push_back(segment);
    }

    std::string result = root;
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) result += '/';
        result += segments[i];
    }
    return result.empty() ? "." : result;
}

std::string join_path(const std::string& lhs, const std::string& rhs) {
    if (lhs.empty() || lhs == "." || is_absolute_path(rhs)) return rhs;
    if (rhs.empty()) return lhs;
    std::string result = to_unix_path(lhs);
    if (result.back() != '/') result += '/';
    return result + to_unix_path(rhs);
}

std::string parent_path(const std::string& path) {
    std::string p = to_unix_path(path);
    size_t slash = p.find_last_of('/');
    if (slash == std::string::npos) return "";
    if (slash == 0) return "/";
    return p.substr(0, slash);
}

std::string file_name(const std::string& path) {
    std::string p = to_unix_path(path);
    size_t slash = p.find_last_of('/');
    return slash == std::string::npos ? p : p.substr(slash + 1);
}

std::string file_extension(const std::string& path) {
    std::string name = file_name(path);
    size_t dot = name.find_last_of('.');
    if (dot == std::string::npos || dot == 0) return "";
    return name.substr(dot);
}

std::string strip_trailing_separators(const std::string& path) {
    std::string result = path;
    while (result.size() > 1 && (result.back() == '/' || result.back() == '\\')) {
        result.pop_back();
    }
    return result;
}

std::vector<std::string> split_command_line(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;
    bool in_quotes = false;
    bool has_token = false;

    for (char c : text) {
        if (c == '"') {
            in_quotes = !in_quotes;
            has_token = true;
        } else if (std::isspace(static_cast<unsigned char>(c)) && !in_quotes) {
            if (has_token) {
                tokens.push_back(current);
                current.clear();
                has_token = false;
            }
        } else {
            current += c;
            has_token = true;
        }
    }
    if (has_token) {
        tokens.push_back(current);
    }
    return tokens;
}

std::string quote_argument(const std::string& arg) {
    if (arg.empty()) return "\"\"";
    bool needs_quotes = std::any_of(arg.begin(), arg.end(),
                                    [](unsigned char c) { return std::isspace(c); });
    if (!needs_quotes || (arg.front() == '"' && arg.back() == '"')) return arg;
    return "\"" + arg + "\"";
}

void MacroTable::set(const std::string& name, const std::string& value) {
    values_[name] = value;
}

std::string MacroTable::expand(const std::string& text) const {
    std::string result;
    result.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        if (text[i] == '$' && i + 1 < text.size() && (text[i + 1] == '(' || text[i + 1] == '{')) {
            char close = text[i + 1] == '(' ? ')' : '}';
            size_t end = text.find(close, i + 2);
            if (end != std::string::npos) {
                std::string name = text.substr(i + 2, end - i - 2);
                auto it = values_.find(name);
                if (it != values_.end()) {
                    result += it->second;
                    i = end + 1;
                    continue;
                }
            }
        }
        result += text[i];
        ++i;
    }
    return result;
}

std::vector<std::string> MacroTable::expand_all(const std::vector<std::string>& values) const {
    std::vector<std::string> result;
    result.reserve(values.size());
    for (const auto& v : values) {
        result.push_back(expand(v));
    }
    return result;
}

} // namespace cbp
