#include "pch.h"
#include "compiler_flags.hpp"
#include "common/path_utils.hpp"
#include <cstring>

namespace cbp {

namespace {

// Single-letter standard extensions (base ISA letters included)
constexpr const char* STANDARD_LETTERS = "iemafdgqlcbjtpvhn";

bool is_standard_letter(char c) {
    return c != '\0' && std::strchr(STANDARD_LETTERS, c) != nullptr;
}

bool is_multi_letter_prefix(char c) {
    return c == 'z' || c == 's';
}

char lower(char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

// Skip an extension version such as "2p0"
size_t skip_version(const std::string& v, size_t i) {
    while (i < v.size() && std::isdigit(static_cast<unsigned char>(v[i]))) ++i;
    if (i + 1 < v.size() && lower(v[i]) == 'p' && std::isdigit(static_cast<unsigned char>(v[i + 1]))) {
        ++i;
        while (i < v.size() && std::isdigit(static_cast<unsigned char>(v[i]))) ++i;
    }
    return i;
}

std::string first_token(const std::string& flag) {
    auto tokens = split_command_line(flag);
    return tokens.empty() ? flag : tokens.front();
}

bool starts_with(const std::string& str, const char* prefix) {
    return str.rfind(prefix, 0) == 0;
}

} // namespace

std::pair<std::string, std::string> split_march(const std::string& value) {
    if (value.size() < 3 || lower(value[0]) != 'r' || lower(value[1]) != 'v' ||
        !std::isdigit(static_cast<unsigned char>(value[2]))) {
        return {value, ""};
    }

    size_t i = 2;
    while (i < value.size() && std::isdigit(static_cast<unsigned char>(value[i]))) ++i;

    while (i < value.size()) {
        char c = lower(value[i]);

        if (c == '_') {
            if (i + 1 >= value.size()) break;
            char next = lower(value[i + 1]);
            if (is_multi_letter_prefix(next)) {
                size_t end = value.find('_', i + 1);
                i = end == std::string::npos ? value.size() : end;
                continue;
            }
            if (is_standard_letter(next) && (i + 2 >= value.size() || value[i + 2] == '_' ||
                                             std::isdigit(static_cast<unsigned char>(value[i + 2])))) {
                i = skip_version(value, i + 2);
                continue;
            }
            return {value.substr(0, i), value.substr(i)};
        }

        if (is_multi_letter_prefix(c)) {
            size_t end = value.find('_', i);
            i = end == std::string::npos ? value.size() : end;
            continue;
        }

        if (is_standard_letter(c)) {
            i = skip_version(value, i + 1);
            continue;
        }

        return {value.substr(0, i), value.substr(i)};
    }

    return {value, ""};
}

MarchInfo detect_march(const std::vector<std::string>& flags) {
    MarchInfo info;
    for (const auto& entry : flags) {
        for (const auto& token : split_command_line(entry)) {
            if (!starts_with(token, "-march=")) continue;
            info.full_flag = token;
            auto parts = split_march(token.substr(7));
            info.base = parts.first;
            info.extension = parts.second;
        }
    }
    if (info.present()) {
        log::debug("march " + info.full_flag + ": base '" + info.base + "', extension '" + info.extension + "'");
    }
    return info;
}

std::string flag_key(const std::string& flag) {
    std::string t = first_token(flag);

    if (starts_with(t, "-D") || starts_with(t, "-U")) {
        std::string name = t.substr(2);
        return "macro:" + name.substr(0, name.find('='));
    }
    if (starts_with(t, "-O")) return "-O";
    if (t == "-g" || starts_with(t, "-ggdb") ||
        (t.size() > 2 && starts_with(t, "-g") && std::isdigit(static_cast<unsigned char>(t[2])))) {
        return "-g";
    }
    if (starts_with(t, "-I") || starts_with(t, "-include") || starts_with(t, "-isystem")) {
        return flag;
    }
    if (starts_with(t, "-fno-")) return "-f" + t.substr(5);
    if (starts_with(t, "-Wno-")) return "-W" + t.substr(5);
    if (starts_with(t, "-mno-")) return "-m" + t.substr(5);

    size_t eq = t.find('=');
    if (eq != std::string::npos) return t.substr(0, eq);
    return t;
}

std::vector<std::string> dedupe_preserving_order(const std::vector<std::string>& values) {
    std::vector<std::string> result;
    std::set<std::string> seen;
    for (const auto& v : values) {
        if (seen.insert(v).second) {
            result.push_back(v);
        }
    }
    return result;
}

std::vector<std::string> apply_flag_overrides(const std::vector<std::string>& base,
                                              const std::vector<std::string>& overrides) {
    std::set<std::string> override_keys;
    for (const auto& o : overrides) {
        override_keys.insert(flag_key(o));
    }

    std::vector<std::string> result;
    for (const auto& flag : base) {
        if (override_keys.count(flag_key(flag))) continue;
        result.push_back(flag);
    }
    result.insert(result.end(), overrides.begin(), overrides.end());
    return dedupe_preserving_order(result);
}

std::vector<std::string> ResolvedOptions::include_flags() const {
    std::vector<std::string> flags;
    for (const auto& dir : include_dirs) {
        flags.push_back("-I" + dir);
    }
    return flags;
}

ResolvedOptions CompilerFlagAnalyzer::analyze(const Target& target) {
    ResolvedOptions options;
    options.target_name = target.name;
    options.profile = ToolchainRegistry::instance().resolve(target.compiler_id, diag_);

    options.compiler_flags = dedupe_preserving_order(target.compiler_options);
    if (options.compiler_flags.size() != target.compiler_options.size()) {
        log::debug("target '" + target.name + "': removed " +
                   std::to_string(target.compiler_options.size() - options.compiler_flags.size()) +
                   " duplicate compiler option(s)");
    }
    options.include_dirs = dedupe_preserving_order(target.include_dirs);
    options.march = detect_march(options.compiler_flags);

    return options;
}

std::vector<std::string> CompilerFlagAnalyzer::flags_for(const ResolvedOptions& options,
                                                         const SourceFile& source) const {
    if (source.compiler_options.empty()) return options.compiler_flags;
    return apply_flag_overrides(options.compiler_flags, source.compiler_options);
}

std::vector<std::string> CompilerFlagAnalyzer::include_dirs_for(const ResolvedOptions& options,
                                                                const SourceFile& source) const {
    std::vector<std::string> dirs = source.include_dirs;
    dirs.insert(dirs.end(), options.include_dirs.begin(), options.include_dirs.end());
    return dedupe_preserving_order(dirs);
}

} // namespace cbp
