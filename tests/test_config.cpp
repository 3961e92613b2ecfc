#include <gtest/gtest.h>
#include <simulation/simulation_config.hpp>
#include <serialization/config_json.hpp>
#include <serialization/snapshot_json.hpp>
#include <cli/cli_common.hpp>
#include <common/logging.hpp>
#include <serialization/json_serialization.hpp>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace clothsim;

TEST(SimulationConfigTest, DefaultsAreValid) {
    SimulationConfig config;
    EXPECT_EQ(config.width, 40u);
    EXPECT_EQ(config.height, 25u);
    EXPECT_FLOAT_EQ(config.spacing, 15.0f);
    EXPECT_EQ(config.origin, Vec2(300.0f, 50.0f));
    EXPECT_EQ(config.gravity, Vec2(0.0f, 980.0f));
    EXPECT_FLOAT_EQ(config.stiffness, 0.9f);
    EXPECT_FLOAT_EQ(config.tear_threshold, 4.5f);
    EXPECT_EQ(config.iterations, 5);
    EXPECT_FLOAT_EQ(config.cut_radius, 10.0f);
    EXPECT_TRUE(validate_config(config).empty());
}

TEST(SimulationConfigTest, ValidateReportsEveryViolation) {
    SimulationConfig config;
    config.width = 1;
    config.stiffness = 1.5f;
    config.tear_threshold = 1.0f;
    config.iterations = 0;

    EXPECT_EQ(validate_config(config).size(), 4u);
}

TEST(SimulationConfigTest, ValidateRejectsOversizedGrid) {
    SimulationConfig config;
    config.width = 2048;
    config.height = 1024;

    std::vector<std::string> errors = validate_config(config);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_NE(errors[0].find("width * height"), std::string::npos);

    config.height = 512;
    EXPECT_TRUE(validate_config(config).empty());
}

TEST(SimulationConfigTest, DerivedParameterSets) {
    SimulationConfig config;
    config.width = 8;
    config.stiffness = 0.5f;

    ClothBuildConfig build = config.build_config();
    EXPECT_EQ(build.width, 8u);
    EXPECT_EQ(build.height, config.height);
    EXPECT_EQ(build.origin, config.origin);

    SolverParams params = config.solver_params();
    EXPECT_FLOAT_EQ(params.stiffness, 0.5f);
    EXPECT_EQ(params.iterations, config.iterations);
    EXPECT_EQ(params.gravity, config.gravity);
}

TEST(ConfigJsonTest, MissingFieldsKeepDefaults) {
    nlohmann::json j = {
        {"width", 12},
        {"gravity", {0.0, 500.0}}
    };

    SimulationConfig config = j.get<SimulationConfig>();

    EXPECT_EQ(config.width, 12u);
    EXPECT_EQ(config.gravity, Vec2(0.0f, 500.0f));
    EXPECT_EQ(config.height, 25u);
    EXPECT_EQ(config.origin, Vec2(300.0f, 50.0f));
    EXPECT_FLOAT_EQ(config.tear_threshold, 4.5f);
}

TEST(ConfigJsonTest, NegativeGridSizeIsRejected) {
    nlohmann::json negative_width = {{"width", -3}};
    EXPECT_THROW(negative_width.get<SimulationConfig>(), std::invalid_argument);

    nlohmann::json tiny_height = {{"height", 1}};
    EXPECT_THROW(tiny_height.get<SimulationConfig>(), std::invalid_argument);

    nlohmann::json huge_width = {{"width", 5000000000LL}};
    EXPECT_THROW(huge_width.get<SimulationConfig>(), std::invalid_argument);
}

TEST(ConfigJsonTest, WrittenConfigReadsBack) {
    SimulationConfig written;
    written.height = 9;
    written.cut_radius = 25.0f;

    nlohmann::json j = written;
    EXPECT_EQ(j["origin"], nlohmann::json::array({300.0f, 50.0f}));

    SimulationConfig parsed = j.get<SimulationConfig>();
    EXPECT_EQ(parsed.height, 9u);
    EXPECT_FLOAT_EQ(parsed.cut_radius, 25.0f);
}

TEST(SnapshotJsonTest, SegmentsCarryTypeNames) {
    RenderSnapshot snapshot;
    snapshot.segments.push_back({Vec2(0.0f, 0.0f), Vec2(1.0f, 0.0f), ConstraintType::Shear});
    snapshot.particles.push_back({Vec2(0.0f, 0.0f), true});

    nlohmann::json j = render_snapshot_to_json(snapshot);

    ASSERT_EQ(j["segments"].size(), 1u);
    EXPECT_EQ(j["segments"][0]["type"], "Shear");
    EXPECT_EQ(j["particles"][0]["pinned"], true);
}

TEST(CliArgsTest, ParsesRunOptions) {
    const char* args[] = {"clothsim", "run", "--frames", "30", "--dt", "0.02",
                          "--cut", "15,10", "-o", "out.json", "-v"};
    char** argv = const_cast<char**>(args);

    auto [ctx, next] = cli::parse_common_args(11, argv, 2);

    EXPECT_EQ(next, 11);
    ASSERT_TRUE(ctx.frames.has_value());
    EXPECT_EQ(*ctx.frames, 30);
    ASSERT_TRUE(ctx.dt.has_value());
    EXPECT_FLOAT_EQ(*ctx.dt, 0.02f);
    ASSERT_TRUE(ctx.cut_point.has_value());
    EXPECT_EQ(*ctx.cut_point, Vec2(15.0f, 10.0f));
    EXPECT_EQ(ctx.output_path, "out.json");
    EXPECT_TRUE(ctx.verbose);
    EXPECT_FALSE(ctx.help);
}

TEST(CliArgsTest, HelpFlagIsReported) {
    const char* args[] = {"clothsim", "run", "-h"};
    auto [ctx, next] = cli::parse_common_args(3, const_cast<char**>(args), 2);

    EXPECT_EQ(next, 3);
    EXPECT_TRUE(ctx.help);

    const char* long_form[] = {"clothsim", "view", "--help", "-v"};
    auto [view_ctx, view_next] = cli::parse_common_args(4, const_cast<char**>(long_form), 2);
    EXPECT_TRUE(view_ctx.help);
    EXPECT_TRUE(view_ctx.verbose);
    EXPECT_EQ(view_next, 4);
}

TEST(CliArgsTest, RejectsBadInput) {
    EXPECT_THROW(cli::parse_point("15"), std::runtime_error);
    EXPECT_THROW(cli::parse_point("a,b"), std::runtime_error);

    const char* args[] = {"clothsim", "run", "--bogus"};
    EXPECT_THROW(cli::parse_common_args(3, const_cast<char**>(args), 2), std::runtime_error);

    const char* missing[] = {"clothsim", "run", "-o"};
    EXPECT_THROW(cli::parse_common_args(3, const_cast<char**>(missing), 2), std::runtime_error);
}

TEST(LoggingTest, ParsesLevelNames) {
    EXPECT_EQ(logging::parse_level("debug"), spdlog::level::debug);
    EXPECT_EQ(logging::parse_level("error"), spdlog::level::err);
    EXPECT_EQ(logging::parse_level("off"), spdlog::level::off);
    EXPECT_FALSE(logging::parse_level("loud").has_value());
}

class ConfigFileTest : public ::testing::Test {
protected:
    std::filesystem::path path;

    void SetUp() override {
        path = std::filesystem::temp_directory_path() /
               ("clothsim_config_test_" +
                std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()) +
                ".json");
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }

    void write(const std::string& text) {
        std::ofstream file(path);
        file << text;
    }
};

TEST_F(ConfigFileTest, ReadsSimulationSection) {
    write(R"({"simulation": {"width": 20, "height": 12, "gravity": [0, 980]}})");

    nlohmann::json section = json::read_config_section(path.string(), "simulation");
    SimulationConfig config = section.get<SimulationConfig>();

    EXPECT_EQ(config.width, 20u);
    EXPECT_EQ(config.height, 12u);
    EXPECT_FLOAT_EQ(config.spacing, 15.0f);
}

TEST_F(ConfigFileTest, MissingSectionIsNull) {
    write(R"({"viewer": {}})");
    EXPECT_TRUE(json::read_config_section(path.string(), "simulation").is_null());
}

TEST_F(ConfigFileTest, MalformedFilesThrow) {
    write(R"({"simulation": )");
    EXPECT_THROW(json::read_json_file(path.string()), std::runtime_error);

    write(R"({"simulation": 3})");
    EXPECT_THROW(json::read_config_section(path.string(), "simulation"), std::runtime_error);

    EXPECT_THROW(json::read_json_file((path.parent_path() / "clothsim_missing.json").string()),
                 std::runtime_error);
}
