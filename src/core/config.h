#pragma once

#include "core/error.h"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace scale::core {

// ---------------------------------------------------------------------------
// Configuration keys understood by the codec and its logging setup
// ---------------------------------------------------------------------------
inline constexpr const char* CONF_LOGLEVEL         = "loglevel";
inline constexpr const char* CONF_LOGCATEGORIES    = "logcategories";
inline constexpr const char* CONF_LOGFILE          = "logfile";
inline constexpr const char* CONF_PRINTTOCONSOLE   = "printtoconsole";
inline constexpr const char* CONF_MAXDEPTH         = "maxdepth";
inline constexpr const char* CONF_REQUIREFULLINPUT = "requirefullinput";

// ---------------------------------------------------------------------------
// Config  --  key/value settings from the command line and INI files
//
// Priority order: command-line args  >  config file / set()
// Repeated keys (-logcategories=a -logcategories=b) accumulate and are
// returned in order by get_list().
// ---------------------------------------------------------------------------
class Config {
public:
    Config() = default;

    /// Parse command-line arguments, skipping argv[0].
    ///   -key=value   --key=value   (key/value pair)
    ///   -key         --key         (boolean flag, value = "1")
    /// Positional arguments are ignored with a warning.
    void parse_args(int argc, const char* const argv[]);

    /// Parse INI-style text:  key=value per line, '#' comments, blank
    /// lines ignored.  A line with an empty key is an error.
    [[nodiscard]] Result<void> parse_text(std::string_view text);

    /// Read @p path and hand its contents to parse_text().
    [[nodiscard]] Result<void> parse_file(const std::filesystem::path& path);

    /// Replace every file-level value of @p key.
    void set(std::string_view key, std::string value);

    [[nodiscard]] std::optional<std::string> get(std::string_view key) const;
    [[nodiscard]] std::string get_or(std::string_view key,
                                     std::string_view default_val) const;

    /// Integer value of @p key, or @p default_val when absent or
    /// unparsable.
    [[nodiscard]] int64_t get_int(std::string_view key,
                                  int64_t default_val = 0) const;

    /// Truthy: "1", "true", "yes", "on"; falsy: "0", "false", "no",
    /// "off" (case-insensitive).  Anything else yields @p default_val.
    [[nodiscard]] bool get_bool(std::string_view key,
                                bool default_val = false) const;

    /// All values of @p key, CLI values first.
    [[nodiscard]] std::vector<std::string> get_list(
        std::string_view key) const;

    [[nodiscard]] bool has(std::string_view key) const;

private:
    using ValueMap =
        std::unordered_map<std::string, std::vector<std::string>>;

    ValueMap cli_values_;
    ValueMap file_values_;

    void insert(ValueMap& target, std::string_view key, std::string value);
    [[nodiscard]] const std::vector<std::string>* lookup(
        std::string_view key) const;
};

} // namespace scale::core
