#include <catch2/catch_test_macros.hpp>

#include <ffmpeg_tools/config/config_loader.hpp>

#include <cstdlib>
#include <string>
#include <vector>

using namespace ffmpeg_tools;

namespace {
void SetEnv(const char* name, const char* value) {
    setenv(name, value, 1);
}

void UnsetEnv(const char* name) {
    unsetenv(name);
}
} // namespace

// ===========================================================================
// Helper: path to test data files
// ===========================================================================

// Tests run from the build directory; derive the testdata path from __FILE__.
namespace {

std::string TestDataPath(const std::string& filename) {
    std::string this_file = __FILE__;
    auto last_slash = this_file.rfind('/');
    auto test_dir = this_file.substr(0, last_slash);   // .../test/config
    auto test_root = test_dir.substr(0, test_dir.rfind('/'));  // .../test
    return test_root + "/testdata/" + filename;
}

} // anonymous namespace

// ===========================================================================
// LoadFromYaml
// ===========================================================================

TEST_CASE("LoadFromYaml: valid full config", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("valid_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.tools.source_root == "/opt/ffmpeg/src");
    CHECK(config.tools.ffmpeg_path == "/usr/local/bin/ffmpeg");
    CHECK(config.tools.timeout_seconds == 120);
    REQUIRE(config.log_file.has_value());
    CHECK(*config.log_file == "/tmp/ffmpeg-tools.log");
    CHECK(config.json_logs);
    CHECK(config.verbosity == 1);
    REQUIRE(config.config_file.has_value());
    CHECK(*config.config_file == TestDataPath("valid_config.yaml"));
}

TEST_CASE("LoadFromYaml: minimal config keeps defaults", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("minimal_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.tools.source_root == "./ffmpeg_src");
    CHECK(config.tools.ffmpeg_path == "ffmpeg");
    CHECK(config.tools.timeout_seconds == 0);
    CHECK_FALSE(config.log_file.has_value());
    CHECK_FALSE(config.json_logs);
}

TEST_CASE("LoadFromYaml: nonexistent file", "[config][yaml]") {
    auto result = LoadFromYaml("/nonexistent/path/config.yaml");
    REQUIRE(result.IsErr());
    CHECK(result.Error().operation == "ConfigLoader");
    CHECK(result.Error().category == ErrorCategory::Config);
}

TEST_CASE("LoadFromYaml: malformed YAML", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("malformed_config.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("Failed to parse YAML") != std::string::npos);
}

TEST_CASE("LoadFromYaml: wrong value type", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("bad_timeout_config.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().target == TestDataPath("bad_timeout_config.yaml"));
}

// ===========================================================================
// LoadFromCli
// ===========================================================================

TEST_CASE("LoadFromCli: no args means serve with defaults", "[config][cli]") {
    const char* argv[] = {"ffmpeg-tools"};
    auto result = LoadFromCli(1, argv);
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.command == Command::Serve);
    CHECK(config.tools.source_root.empty());
    CHECK(config.tools.ffmpeg_path == "ffmpeg");
    CHECK(config.tools.timeout_seconds == 0);
    CHECK(config.verbosity == 0);
    CHECK_FALSE(config.config_file.has_value());
}

TEST_CASE("LoadFromCli: all options", "[config][cli]") {
    const char* argv[] = {
        "ffmpeg-tools", "check",
        "--config", "/etc/ffmpeg-tools.yaml",
        "--source-root", "/src/ffmpeg",
        "--ffmpeg", "/usr/bin/ffmpeg",
        "--timeout", "30",
        "--log-file", "/tmp/log.jsonl",
        "--json-logs",
        "--no-color",
    };
    int argc = sizeof(argv) / sizeof(argv[0]);

    auto result = LoadFromCli(argc, argv);
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.command == Command::Check);
    REQUIRE(config.config_file.has_value());
    CHECK(*config.config_file == "/etc/ffmpeg-tools.yaml");
    CHECK(config.tools.source_root == "/src/ffmpeg");
    CHECK(config.tools.ffmpeg_path == "/usr/bin/ffmpeg");
    CHECK(config.tools.timeout_seconds == 30);
    REQUIRE(config.log_file.has_value());
    CHECK(*config.log_file == "/tmp/log.jsonl");
    CHECK(config.json_logs);
    CHECK(config.no_color);
    CHECK_FALSE(config.force_color);
}

TEST_CASE("LoadFromCli: repeated -v raises verbosity", "[config][cli]") {
    const char* argv[] = {"ffmpeg-tools", "-v", "-v"};
    auto result = LoadFromCli(3, argv);
    REQUIRE(result.IsOk());
    CHECK(result.Value().verbosity == 2);
}

TEST_CASE("LoadFromCli: unknown command is a config error", "[config][cli]") {
    const char* argv[] = {"ffmpeg-tools", "deploy"};
    auto result = LoadFromCli(2, argv);
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
    CHECK(result.Error().ExitCode() == 1);
    CHECK(result.Error().message.find("deploy") != std::string::npos);
}

TEST_CASE("LoadFromCli: non-numeric timeout is rejected", "[config][cli]") {
    const char* argv[] = {"ffmpeg-tools", "--timeout", "soon"};
    auto result = LoadFromCli(3, argv);
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("CLI parse error") != std::string::npos);
}

// ===========================================================================
// MergeConfigs
// ===========================================================================

TEST_CASE("MergeConfigs: CLI overrides YAML where set", "[config][merge]") {
    AppConfig yaml;
    yaml.tools.source_root = "/yaml/src";
    yaml.tools.ffmpeg_path = "/yaml/ffmpeg";
    yaml.tools.timeout_seconds = 60;
    yaml.verbosity = 1;

    AppConfig cli;
    cli.command = Command::Check;
    cli.tools.source_root = "/cli/src";
    cli.verbosity = 2;

    auto merged = MergeConfigs(yaml, cli);
    CHECK(merged.command == Command::Check);
    CHECK(merged.tools.source_root == "/cli/src");
    CHECK(merged.tools.ffmpeg_path == "/yaml/ffmpeg");
    CHECK(merged.tools.timeout_seconds == 60);
    CHECK(merged.verbosity == 2);
}

TEST_CASE("MergeConfigs: YAML values survive default CLI", "[config][merge]") {
    AppConfig yaml;
    yaml.tools.source_root = "/yaml/src";
    yaml.log_file = "/yaml/log";
    yaml.json_logs = true;

    auto merged = MergeConfigs(yaml, AppConfig{});
    CHECK(merged.tools.source_root == "/yaml/src");
    REQUIRE(merged.log_file.has_value());
    CHECK(*merged.log_file == "/yaml/log");
    CHECK(merged.json_logs);
}

// ===========================================================================
// ApplyEnvironment
// ===========================================================================

TEST_CASE("ApplyEnvironment: fills unset values from environment", "[config][env]") {
    SetEnv("FFMPEG_TOOLS_SOURCE_ROOT", "/env/src");
    SetEnv("FFMPEG_TOOLS_FFMPEG", "/env/ffmpeg");

    auto config = ApplyEnvironment(AppConfig{});
    CHECK(config.tools.source_root == "/env/src");
    CHECK(config.tools.ffmpeg_path == "/env/ffmpeg");

    UnsetEnv("FFMPEG_TOOLS_SOURCE_ROOT");
    UnsetEnv("FFMPEG_TOOLS_FFMPEG");
}

TEST_CASE("ApplyEnvironment: explicit values win over environment", "[config][env]") {
    SetEnv("FFMPEG_TOOLS_SOURCE_ROOT", "/env/src");

    AppConfig explicit_config;
    explicit_config.tools.source_root = "/cli/src";
    auto config = ApplyEnvironment(explicit_config);
    CHECK(config.tools.source_root == "/cli/src");

    UnsetEnv("FFMPEG_TOOLS_SOURCE_ROOT");
}

// ===========================================================================
// DefaultSourceRoot / ValidateConfig
// ===========================================================================

TEST_CASE("DefaultSourceRoot: sibling ffmpeg_src of the binary directory", "[config]") {
    auto root = DefaultSourceRoot("/opt/tools/bin/ffmpeg-tools");
    CHECK(root.filename() == "ffmpeg_src");
    CHECK(root.is_absolute());
}

TEST_CASE("ValidateConfig: accepts a complete config", "[config][validate]") {
    AppConfig config;
    config.tools.source_root = "/src/ffmpeg";
    CHECK(ValidateConfig(config).IsOk());
}

TEST_CASE("ValidateConfig: rejects missing source root", "[config][validate]") {
    auto result = ValidateConfig(AppConfig{});
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("source_root") != std::string::npos);
}

TEST_CASE("ValidateConfig: rejects negative timeout and empty ffmpeg", "[config][validate]") {
    AppConfig config;
    config.tools.source_root = "/src/ffmpeg";
    config.tools.timeout_seconds = -5;
    CHECK(ValidateConfig(config).IsErr());

    config.tools.timeout_seconds = 0;
    config.tools.ffmpeg_path.clear();
    CHECK(ValidateConfig(config).IsErr());
}
