// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// Unit tests for the core module.

#include "test_framework.h"
#include "test_util.h"

#include "core/config.h"
#include "core/error.h"
#include "core/hex.h"
#include "core/logging.h"
#include "core/logging_init.h"
#include "core/utf8.h"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace scale;

// ============================================================================
// Error
// ============================================================================

TEST_CASE(Error, default_is_ok) {
    core::Error e;
    CHECK(e.is_ok());
    CHECK(!e);
    CHECK_EQ(e.format(), "no error");
}

TEST_CASE(Error, chain_renders_outermost_first) {
    auto root = core::make_error(core::ErrorCode::NOT_ENOUGH_DATA, "root cause");
    auto err = std::move(root).chain("wrap cause").chain("final type");

    CHECK_EQ(err.what(), "final type:\n\twrap cause:\n\t\troot cause\n");
    CHECK(err.code() == core::ErrorCode::NOT_ENOUGH_DATA);

    auto descs = err.descriptions();
    CHECK_EQ(descs.size(), 3u);
    CHECK_EQ(descs[0], "root cause");
    CHECK_EQ(descs[2], "final type");
}

TEST_CASE(Error, chain_keeps_original_when_copied) {
    const auto root = core::make_error(core::ErrorCode::OUT_OF_RANGE, "inner");
    auto outer = root.chain("outer");
    CHECK_EQ(root.what(), "inner\n");
    CHECK(outer.cause() != nullptr);
    CHECK_EQ(outer.cause()->message(), "inner");
}

TEST_CASE(Error, format_includes_code_and_messages) {
    auto err = core::make_error(core::ErrorCode::INVALID_VALUE, "bad byte")
                   .chain("Could not decode `Foo::x`");
    const auto text = err.format();
    CHECK(text.starts_with("INVALID_VALUE(103): Could not decode `Foo::x`: bad byte"));
    CHECK(text.find("test_core.cpp") != std::string::npos);
}

TEST_CASE(Error, equality_compares_codes) {
    auto a = core::make_error(core::ErrorCode::DEPTH_LIMIT, "one");
    auto b = core::make_error(core::ErrorCode::DEPTH_LIMIT, "two");
    auto c = core::make_error(core::ErrorCode::TRAILING_DATA, "one");
    CHECK(a == b);
    CHECK(a != c);
    CHECK_EQ(core::error_code_name(core::ErrorCode::TRAILING_DATA), "TRAILING_DATA");
}

// ============================================================================
// Result
// ============================================================================

namespace {

core::Result<int> parse_digit(char c) {
    if (c < '0' || c > '9') {
        return core::make_error(core::ErrorCode::INVALID_VALUE, "not a digit");
    }
    return c - '0';
}

core::Result<int> sum_digits(const std::string& s) {
    int total = 0;
    for (char c : s) {
        total += SCALE_TRY(parse_digit(c));
    }
    return total;
}

core::Result<int> first_digit_twice(const std::string& s) {
    SCALE_TRY_ASSIGN(d, parse_digit(s.at(0)));
    return d * 2;
}

core::Result<void> all_digits(const std::string& s) {
    for (char c : s) SCALE_TRY_VOID(parse_digit(c));
    return core::make_ok();
}

} // namespace

TEST_CASE(Result, try_propagates_first_error) {
    CHECK_EQ(sum_digits("123").value(), 6);
    auto bad = sum_digits("1x3");
    CHECK_ERR(bad);
    CHECK_EQ(bad.error().message(), "not a digit");
}

TEST_CASE(Result, try_assign_and_void) {
    CHECK_EQ(first_digit_twice("4").value(), 8);
    CHECK_ERR(first_digit_twice("z"));
    CHECK_OK(all_digits("0189"));
    CHECK_ERR(all_digits("01a"));
}

TEST_CASE(Result, combinators) {
    auto r = parse_digit('7');
    CHECK_EQ(r.map([](int v) { return v + 1; }).value(), 8);
    CHECK_EQ(r.and_then([](int v) { return parse_digit(static_cast<char>('0' + v - 1)); }).value(), 6);
    CHECK_EQ(parse_digit('q').value_or(-1), -1);

    auto chained = parse_digit('q').map_error([](core::Error e) {
        return std::move(e).chain("Could not decode `Digit`");
    });
    CHECK_EQ(chained.error().what(), "Could not decode `Digit`:\n\tnot a digit\n");
}

TEST_CASE(Result, value_on_error_throws) {
    auto r = parse_digit('x');
    CHECK_THROWS(r.value(), std::runtime_error);
    auto ok = parse_digit('1');
    CHECK_THROWS(ok.error(), std::runtime_error);
}

// ============================================================================
// Hex
// ============================================================================

TEST_CASE(Hex, encode_variants) {
    std::vector<uint8_t> data = {0x00, 0xab, 0x7f, 0xff};
    CHECK_EQ(core::to_hex(data), "00ab7fff");
    CHECK_EQ(core::to_hex_upper(data), "00AB7FFF");
    CHECK_EQ(core::to_hex_spaced(data), "00 ab 7f ff");
    CHECK_EQ(core::to_hex_spaced({}), "");
}

TEST_CASE(Hex, from_hex) {
    auto v = core::from_hex("deadBEEF");
    CHECK(v.has_value());
    CHECK_EQ(*v, (std::vector<uint8_t>{0xde, 0xad, 0xbe, 0xef}));
    CHECK(!core::from_hex("abc").has_value());
    CHECK(!core::from_hex("zz").has_value());
    CHECK(core::is_hex("0123abcdef"));
    CHECK(!core::is_hex("12 34"));
}

TEST_CASE(Hex, parse_dump) {
    auto v = core::parse_hex_dump("34 48 65\n6c\t6c 6f");
    CHECK_OK(v);
    CHECK_EQ(v.value(), (std::vector<uint8_t>{0x34, 0x48, 0x65, 0x6c, 0x6c, 0x6f}));

    auto prefixed = core::parse_hex_dump("0x0102");
    CHECK_OK(prefixed);
    CHECK_EQ(prefixed.value().size(), 2u);

    CHECK_ERR(core::parse_hex_dump("01 0"));
    CHECK_ERR(core::parse_hex_dump("0g"));
}

// ============================================================================
// UTF-8
// ============================================================================

TEST_CASE(Utf8, accepts_valid_sequences) {
    CHECK(core::is_valid_utf8(std::string_view("Hello, World!")));
    CHECK(core::is_valid_utf8(std::string_view("\xc3\xa9t\xc3\xa9")));           // été
    CHECK(core::is_valid_utf8(std::string_view("\xe2\x82\xac")));                // €
    CHECK(core::is_valid_utf8(std::string_view("\xf0\x9f\x98\x80")));            // U+1F600
    CHECK(core::is_valid_utf8(std::string_view("")));
}

TEST_CASE(Utf8, reports_first_invalid_byte) {
    const std::vector<uint8_t> lone_continuation = {'a', 'b', 0x80, 'c'};
    CHECK_EQ(core::utf8_first_invalid(lone_continuation), std::optional<size_t>(2));

    const std::vector<uint8_t> overlong = {0xc0, 0xaf};
    CHECK_EQ(core::utf8_first_invalid(overlong), std::optional<size_t>(0));

    const std::vector<uint8_t> surrogate = {'x', 0xed, 0xa0, 0x80};
    CHECK_EQ(core::utf8_first_invalid(surrogate), std::optional<size_t>(1));

    const std::vector<uint8_t> too_large = {0xf4, 0x90, 0x80, 0x80};
    CHECK(!core::is_valid_utf8(too_large));

    const std::vector<uint8_t> truncated = {0xe2, 0x82};
    CHECK(!core::is_valid_utf8(truncated));
}

// ============================================================================
// Config
// ============================================================================

TEST_CASE(Config, parse_args) {
    const char* argv[] = {"prog", "-loglevel=debug", "--printtoconsole",
                          "-logcategories=decode", "-logcategories=append",
                          "positional"};
    core::Config conf;
    conf.parse_args(6, argv);

    CHECK_EQ(conf.get_or(core::CONF_LOGLEVEL, "info"), "debug");
    CHECK(conf.get_bool(core::CONF_PRINTTOCONSOLE));
    auto cats = conf.get_list(core::CONF_LOGCATEGORIES);
    CHECK_EQ(cats.size(), 2u);
    CHECK_EQ(cats[0], "decode");
    CHECK(!conf.has("positional"));
}

TEST_CASE(Config, parse_text_and_precedence) {
    core::Config conf;
    CHECK_OK(conf.parse_text("# codec settings\n"
                             "maxdepth = 32\n"
                             "\n"
                             "requirefullinput=yes\n"
                             "loglevel=warn\n"));
    CHECK_EQ(conf.get_int(core::CONF_MAXDEPTH), 32);
    CHECK(conf.get_bool(core::CONF_REQUIREFULLINPUT));

    const char* argv[] = {"prog", "-maxdepth=4"};
    conf.parse_args(2, argv);
    CHECK_EQ(conf.get_int(core::CONF_MAXDEPTH), 4);
    CHECK_EQ(conf.get_or(core::CONF_LOGLEVEL, ""), "warn");
}

TEST_CASE(Config, parse_text_rejects_empty_key) {
    core::Config conf;
    auto r = conf.parse_text("maxdepth=1\n=oops\n");
    CHECK_ERR(r);
    CHECK_EQ(r.error().message(), "empty key on line 2");
}

TEST_CASE(Config, typed_getter_fallbacks) {
    core::Config conf;
    conf.set("maxdepth", "12abc");
    conf.set("requirefullinput", "maybe");
    CHECK_EQ(conf.get_int("maxdepth", 7), 7);
    CHECK_EQ(conf.get_bool("requirefullinput", true), true);
    CHECK_EQ(conf.get_int("absent", 3), 3);
    CHECK(!conf.get("absent").has_value());
}

TEST_CASE(Config, parse_file) {
    const auto path = std::filesystem::temp_directory_path() / "scale_test_config.conf";
    {
        std::ofstream out(path);
        out << "maxdepth=9\nlogcategories=codec,compact\n";
    }
    core::Config conf;
    CHECK_OK(conf.parse_file(path));
    CHECK_EQ(conf.get_int(core::CONF_MAXDEPTH), 9);
    std::filesystem::remove(path);

    auto missing = conf.parse_file(path);
    CHECK_ERR(missing);

    {
        std::ofstream out(path);
        out << "=1\n";
    }
    auto bad = conf.parse_file(path);
    CHECK_ERR(bad);
    CHECK_EQ(bad.error().descriptions().size(), 2u);
    std::filesystem::remove(path);
}

// ============================================================================
// Logging
// ============================================================================

TEST_CASE(Logging, level_and_category_names) {
    CHECK_EQ(core::log_level_string(core::LogLevel::ERR), "ERROR");
    CHECK_EQ(core::parse_log_level("Warning"), std::optional<core::LogLevel>(core::LogLevel::WARN));
    CHECK_EQ(core::parse_log_level("TRACE"), std::optional<core::LogLevel>(core::LogLevel::TRACE));
    CHECK(!core::parse_log_level("loud").has_value());

    CHECK_EQ(core::log_category_string(core::LogCategory::DECODE), "DECODE");
    CHECK_EQ(core::log_category_string(core::LogCategory::ALL), "ALL");
    CHECK(core::parse_log_category("append") == core::LogCategory::APPEND);
    CHECK(!core::parse_log_category("network").has_value());
}

TEST_CASE(Logging, capture_respects_level_and_category) {
    test::LogCapture capture(core::LogLevel::INFO, core::LogCategory::DECODE);
    LOG_DEBUG(core::LogCategory::DECODE, "too detailed");
    LOG_WARN(core::LogCategory::APPEND, "other category");
    LOG_WARN(core::LogCategory::DECODE, "kept");

    auto lines = capture.lines();
    CHECK_EQ(lines.size(), 1u);
    CHECK(lines[0].find("[WARN] [DECODE] kept") != std::string::npos);
}

TEST_CASE(Logging, disabled_message_is_not_formatted) {
    test::LogCapture capture(core::LogLevel::OFF);
    int evaluated = 0;
    auto message = [&] { ++evaluated; return std::string("x"); };
    LOG_ERROR(core::LogCategory::CODEC, message());
    CHECK_EQ(evaluated, 0);
    CHECK(capture.lines().empty());
}

TEST_CASE(Logging, file_sink) {
    const auto path = std::filesystem::temp_directory_path() / "scale_test_log.txt";
    std::filesystem::remove(path);

    auto& log = core::Logger::instance();
    const auto saved = log.level();
    log.set_level(core::LogLevel::INFO);
    CHECK(log.set_log_file(path));
    log.set_print_to_file(true);
    LOG_INFO(core::LogCategory::CONFIG, "written to file");
    log.flush();
    log.set_print_to_file(false);
    CHECK(log.set_log_file(""));
    log.set_level(saved);

    std::ifstream in(path);
    std::string line;
    std::getline(in, line);
    CHECK(line.find("[INFO] [CONFIG] written to file") != std::string::npos);
    in.close();
    std::filesystem::remove(path);
}

// ============================================================================
// Logging initialisation
// ============================================================================

TEST_CASE(LoggingInit, parse_categories) {
    auto cats = core::parse_log_categories("decode, append");
    CHECK_OK(cats);
    CHECK(cats.value() == (core::LogCategory::DECODE | core::LogCategory::APPEND));

    CHECK(core::parse_log_categories(" , ").value() == core::LogCategory::ALL);
    CHECK_ERR(core::parse_log_categories("decode,bogus"));
}

TEST_CASE(LoggingInit, applies_config) {
    auto& log = core::Logger::instance();
    const auto saved_level = log.level();
    const auto saved_cats = log.enabled_categories();

    core::Config conf;
    conf.set(core::CONF_LOGLEVEL, "debug");
    conf.set(core::CONF_LOGCATEGORIES, "compact,config");
    CHECK_OK(core::init_logging(conf));
    CHECK(log.level() == core::LogLevel::DEBUG);
    CHECK(log.enabled_categories() == (core::LogCategory::COMPACT | core::LogCategory::CONFIG));

    log.set_level(saved_level);
    log.set_categories(saved_cats);
}

TEST_CASE(LoggingInit, rejects_unknown_level_without_side_effects) {
    auto& log = core::Logger::instance();
    const auto before = log.level();

    core::Config conf;
    conf.set(core::CONF_LOGLEVEL, "chatty");
    auto r = core::init_logging(conf);
    CHECK_ERR(r);
    CHECK(log.level() == before);
}
