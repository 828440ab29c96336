#include "app/Options.hpp"
#include "config/Configuration.hpp"

#include "TestUtils.hpp"

#include <string>
#include <vector>

#include <doctest/doctest.h>

using ur::app::parse_options;
using ur::config::ConfigurationError;

TEST_CASE("first positional argument is the URI")
{
    auto options = parse_options({ur::tests::kSampleUri, "ida://extra"});
    REQUIRE(options.uri);
    CHECK(*options.uri == ur::tests::kSampleUri);
    CHECK_FALSE(options.config_path);
    CHECK_FALSE(options.idle_timeout);
    CHECK_FALSE(parse_options({}).uri);
}

TEST_CASE("flags accept both value spellings")
{
    auto joined = parse_options({"--config=/etc/u.json", "--idle-timeout-ms=250"});
    REQUIRE(joined.config_path);
    CHECK(*joined.config_path == std::filesystem::path("/etc/u.json"));
    REQUIRE(joined.idle_timeout);
    CHECK(joined.idle_timeout->count() == 250);

    auto split = parse_options(
        {"--config", "/etc/u.json", "--idle-timeout-ms", "250", "ida://x"});
    REQUIRE(split.config_path);
    CHECK(*split.config_path == std::filesystem::path("/etc/u.json"));
    REQUIRE(split.idle_timeout);
    CHECK(split.idle_timeout->count() == 250);
    REQUIRE(split.uri);
    CHECK(*split.uri == "ida://x");
}

TEST_CASE("unknown flags are skipped")
{
    auto options = parse_options({"-psn_0_12345", "--new-window", "ida://x"});
    REQUIRE(options.uri);
    CHECK(*options.uri == "ida://x");
}

TEST_CASE("double dash ends option parsing")
{
    auto options = parse_options({"--", "--looks-like-a-flag"});
    REQUIRE(options.uri);
    CHECK(*options.uri == "--looks-like-a-flag");
}

TEST_CASE("help and version")
{
    CHECK(parse_options({"--help"}).show_help);
    CHECK(parse_options({"-h"}).show_help);
    CHECK(parse_options({"--version"}).show_version);
    CHECK(ur::app::usage_text().find("--idle-timeout-ms") != std::string::npos);
}

TEST_CASE("bad option values are configuration errors")
{
    CHECK_THROWS_AS(parse_options({"--idle-timeout-ms=0"}), ConfigurationError);
    CHECK_THROWS_AS(parse_options({"--idle-timeout-ms=-5"}), ConfigurationError);
    CHECK_THROWS_AS(parse_options({"--idle-timeout-ms=10s"}), ConfigurationError);
    CHECK_THROWS_AS(parse_options({"--idle-timeout-ms"}), ConfigurationError);
    CHECK_THROWS_AS(parse_options({"--config="}), ConfigurationError);
}

TEST_CASE("idle timeout beyond one day is refused")
{
    CHECK_THROWS_AS(parse_options({"--idle-timeout-ms=9223372036854775807"}),
                    ConfigurationError);
    CHECK(parse_options({"--idle-timeout-ms=86400000"}).idle_timeout ==
          ur::config::kMaxIdleTimeout);

    ur::tests::ScopedEnv timeout("URIRELAY_IDLE_TIMEOUT_MS",
                                 std::string("9223372036854775807"));
    auto options = parse_options({});
    CHECK_THROWS_AS(ur::app::apply_environment(options), ConfigurationError);
}

TEST_CASE("environment fills in what the command line left unset")
{
    ur::tests::ScopedEnv config("URIRELAY_CONFIG", std::string("/env/settings.json"));
    ur::tests::ScopedEnv timeout("URIRELAY_IDLE_TIMEOUT_MS", std::string("900"));

    auto from_env = parse_options({});
    ur::app::apply_environment(from_env);
    REQUIRE(from_env.config_path);
    CHECK(*from_env.config_path == std::filesystem::path("/env/settings.json"));
    REQUIRE(from_env.idle_timeout);
    CHECK(from_env.idle_timeout->count() == 900);

    auto from_flags = parse_options({"--config=/cli.json", "--idle-timeout-ms=5"});
    ur::app::apply_environment(from_flags);
    CHECK(*from_flags.config_path == std::filesystem::path("/cli.json"));
    CHECK(from_flags.idle_timeout->count() == 5);
}

TEST_CASE("malformed environment timeout is a configuration error")
{
    ur::tests::ScopedEnv timeout("URIRELAY_IDLE_TIMEOUT_MS", std::string("soon"));
    auto options = parse_options({});
    CHECK_THROWS_AS(ur::app::apply_environment(options), ConfigurationError);
}
