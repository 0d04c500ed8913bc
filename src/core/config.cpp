#include "core/config.h"
#include "core/logging.h"

#include <cctype>
#include <charconv>
#include <fstream>
#include <sstream>
#include <string>

namespace scale::core {

namespace {

std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front())))
        sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back())))
        sv.remove_suffix(1);
    return sv;
}

std::string_view strip_dashes(std::string_view sv) {
    if (sv.starts_with("--")) return sv.substr(2);
    if (sv.starts_with("-"))  return sv.substr(1);
    return sv;
}

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

std::optional<bool> parse_bool(std::string_view sv) {
    if (iequals(sv, "1") || iequals(sv, "true") ||
        iequals(sv, "yes") || iequals(sv, "on")) {
        return true;
    }
    if (iequals(sv, "0") || iequals(sv, "false") ||
        iequals(sv, "no") || iequals(sv, "off")) {
        return false;
    }
    return std::nullopt;
}

} // anonymous namespace

void Config::insert(ValueMap& target, std::string_view key,
                    std::string value) {
    target[std::string{key}].push_back(std::move(value));
}

const std::vector<std::string>* Config::lookup(std::string_view key) const {
    std::string k{key};
    if (auto it = cli_values_.find(k); it != cli_values_.end()) {
        return &it->second;
    }
    if (auto it = file_values_.find(k); it != file_values_.end()) {
        return &it->second;
    }
    return nullptr;
}

// ---------------------------------------------------------------------------
// Config -- source loading
// ---------------------------------------------------------------------------

void Config::parse_args(int argc, const char* const argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        if (arg.empty()) continue;

        if (!arg.starts_with("-")) {
            LOG_WARN(LogCategory::CONFIG,
                     "Config: ignoring positional argument '" +
                     std::string{arg} + "'");
            continue;
        }

        std::string_view stripped = strip_dashes(arg);
        auto eq_pos = stripped.find('=');
        if (eq_pos != std::string_view::npos) {
            insert(cli_values_, trim(stripped.substr(0, eq_pos)),
                   std::string{trim(stripped.substr(eq_pos + 1))});
        } else {
            insert(cli_values_, trim(stripped), "1");
        }
    }
}

Result<void> Config::parse_text(std::string_view text) {
    int line_num = 0;
    while (!text.empty()) {
        auto nl = text.find('\n');
        std::string_view line = text.substr(0, nl);
        text = nl == std::string_view::npos ? std::string_view{}
                                            : text.substr(nl + 1);
        ++line_num;

        std::string_view sv = trim(line);
        if (sv.empty() || sv.front() == '#') continue;

        auto eq_pos = sv.find('=');
        if (eq_pos == std::string_view::npos) {
            insert(file_values_, sv, "1");
            continue;
        }

        std::string_view key = trim(sv.substr(0, eq_pos));
        if (key.empty()) {
            return make_error(ErrorCode::INVALID_VALUE,
                              "empty key on line " +
                              std::to_string(line_num));
        }
        insert(file_values_, key, std::string{trim(sv.substr(eq_pos + 1))});
    }
    return make_ok();
}

Result<void> Config::parse_file(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        return make_error(ErrorCode::INVALID_VALUE,
                          "unable to open config file '" +
                          path.string() + "'");
    }

    LOG_DEBUG(LogCategory::CONFIG,
              "Config: loading configuration from '" + path.string() + "'");

    std::ostringstream contents;
    contents << ifs.rdbuf();
    return parse_text(contents.str()).map_error([&](Error e) {
        return e.chain("while reading '" + path.string() + "'");
    });
}

// ---------------------------------------------------------------------------
// Config -- setters / getters
// ---------------------------------------------------------------------------

void Config::set(std::string_view key, std::string value) {
    file_values_[std::string{key}] = {std::move(value)};
}

std::optional<std::string> Config::get(std::string_view key) const {
    const auto* vals = lookup(key);
    if (!vals || vals->empty()) return std::nullopt;
    return vals->front();
}

std::string Config::get_or(std::string_view key,
                           std::string_view default_val) const {
    auto val = get(key);
    return val.has_value() ? *val : std::string{default_val};
}

int64_t Config::get_int(std::string_view key, int64_t default_val) const {
    auto val = get(key);
    if (!val.has_value()) return default_val;

    int64_t result = default_val;
    const auto& s = *val;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), result);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        LOG_WARN(LogCategory::CONFIG,
                 "Config: cannot parse '" + s +
                 "' as integer for key '" + std::string{key} + "'");
        return default_val;
    }
    return result;
}

bool Config::get_bool(std::string_view key, bool default_val) const {
    auto val = get(key);
    if (!val.has_value() || val->empty()) return default_val;
    auto parsed = parse_bool(*val);
    if (!parsed) {
        LOG_WARN(LogCategory::CONFIG,
                 "Config: cannot parse '" + *val +
                 "' as boolean for key '" + std::string{key} + "'");
        return default_val;
    }
    return *parsed;
}

std::vector<std::string> Config::get_list(std::string_view key) const {
    std::string k{key};
    std::vector<std::string> result;

    if (auto it = cli_values_.find(k); it != cli_values_.end()) {
        result.insert(result.end(), it->second.begin(), it->second.end());
    }
    if (auto it = file_values_.find(k); it != file_values_.end()) {
        result.insert(result.end(), it->second.begin(), it->second.end());
    }
    return result;
}

bool Config::has(std::string_view key) const {
    return lookup(key) != nullptr;
}

} // namespace scale::core
