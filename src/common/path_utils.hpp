#pragma once

#include <map>
#include <string>
#include <vector>

namespace cbp {

// Convert Windows path to Unix path (backslash to forward slash)
std::string to_unix_path(const std::string& path);

// True for "/x", "\\x", "C:\\x" and "C:/x" regardless of host platform
bool is_absolute_path(const std::string& path);

// Lexically normalize a path with forward slashes. Leading ".." segments
// of relative paths are kept; "." and empty segments are dropped.
// Returns "." for an empty result.
std::string normalize_path(const std::string& path);

// Join two path fragments with a single '/'. An absolute rhs wins.
std::string join_path(const std::string& lhs, const std::string& rhs);

// Directory part of a path ("" when there is none)
std::string parent_path(const std::string& path);

// Last path component
std::string file_name(const std::string& path);

// Extension including the dot, case preserved ("" when there is none)
std::string file_extension(const std::string& path);

// Remove trailing '/' and '\\' (but keep a lone root)
std::string strip_trailing_separators(const std::string& path);

// Split an option string the way a shell would (whitespace, quotes)
std::vector<std::string> split_command_line(const std::string& text);

// Quote an argument for a command line if it contains whitespace
std::string quote_argument(const std::string& arg);

// Placeholder table for Code::Blocks macros ($(NAME) and ${NAME}).
// Expansion is a single pass: values are never re-expanded, unknown
// placeholders are left as written.
class MacroTable {
public:
    void set(const std::string& name, const std::string& value);

    std::string expand(const std::string& text) const;
    std::vector<std::string> expand_all(const std::vector<std::string>& values) const;

private:
    std::map<std::string, std::string> values_;
};

} // namespace cbp
