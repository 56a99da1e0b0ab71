#include "test_common.hpp"
#include "arg_parser.hpp"

TEST_CASE("ArgParser basic parsing") {
    const char* argv[] = {"prog", "--foo", "--opt", "42", "pos", "--unknown"};
    ArgParser parser(6, const_cast<char**>(argv), {"--foo", "--bar", "--opt"}, {}, {"--opt"});
    REQUIRE(parser.has_flag("--foo"));
    REQUIRE(parser.get_option("--opt") == "42");
    REQUIRE(parser.positional().size() == 1);
    REQUIRE(parser.positional()[0] == "pos");
    REQUIRE(parser.unknown_flags().size() == 1);
    REQUIRE(parser.unknown_flags()[0] == "--unknown");
}

TEST_CASE("ArgParser option with equals") {
    const char* argv[] = {"prog", "--opt=val"};
    ArgParser parser(2, const_cast<char**>(argv), {"--opt"});
    REQUIRE(parser.has_flag("--opt"));
    REQUIRE(parser.get_option("--opt") == "val");
}

TEST_CASE("ArgParser switches do not consume the next argument") {
    const char* argv[] = {"prog", "--dry-run", "/srv/super"};
    ArgParser parser(3, const_cast<char**>(argv), {"--dry-run", "--root"}, {}, {"--root"});
    REQUIRE(parser.has_flag("--dry-run"));
    REQUIRE(parser.get_option("--dry-run").empty());
    REQUIRE(parser.positional() == std::vector<std::string>{"/srv/super"});
}

TEST_CASE("ArgParser value flags take dash-prefixed values") {
    const char* argv[] = {"prog", "--automation-branch", "-weird"};
    ArgParser parser(3, const_cast<char**>(argv), {"--automation-branch"}, {},
                     {"--automation-branch"});
    REQUIRE(parser.get_option("--automation-branch") == "-weird");
    REQUIRE(parser.unknown_flags().empty());
}

TEST_CASE("ArgParser short options") {
    const char* argv[] = {"prog", "-h", "-y", "cfg.yaml", "-j=cfg.json"};
    ArgParser parser(5, const_cast<char**>(argv), {"--help", "--config-yaml", "--config-json"},
                     {{'h', "--help"}, {'y', "--config-yaml"}, {'j', "--config-json"}},
                     {"--config-yaml", "--config-json"});
    REQUIRE(parser.has_flag("--help"));
    REQUIRE(parser.get_option("--config-yaml") == "cfg.yaml");
    REQUIRE(parser.get_option("--config-json") == "cfg.json");
}

TEST_CASE("ArgParser unknown short flag") {
    const char* argv[] = {"prog", "-x"};
    ArgParser parser(2, const_cast<char**>(argv), {"--help"}, {{'h', "--help"}});
    REQUIRE(parser.unknown_flags() == std::vector<std::string>{"-x"});
    REQUIRE(parser.positional().empty());
}

TEST_CASE("ArgParser reports value flags without a value") {
    const char* argv[] = {"prog", "--root"};
    ArgParser parser(2, const_cast<char**>(argv), {"--root"}, {}, {"--root"});
    REQUIRE(parser.has_flag("--root"));
    REQUIRE(parser.missing_values() == std::vector<std::string>{"--root"});
}

TEST_CASE("ArgParser double dash ends flag parsing") {
    const char* argv[] = {"prog", "--", "--not-a-flag"};
    ArgParser parser(3, const_cast<char**>(argv), {"--help"});
    REQUIRE(parser.unknown_flags().empty());
    REQUIRE(parser.positional() == std::vector<std::string>{"--not-a-flag"});
}
