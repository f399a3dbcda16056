#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <string>

#include "config.hpp"

namespace {

std::string writeConfigFile(const std::string& name, const std::string& body) {
    std::string path = ::testing::TempDir() + name;
    std::ofstream ofs(path);
    ofs << "%YAML:1.0\n" << body;
    return path;
}

}  // namespace

TEST(ConfigTest, ReadsMittCandidateRules) {
    std::string path = writeConfigFile("pitchspeed_calibration.yaml",
        "calibration:\n"
        "  mitt_min_height: 40.0\n"
        "  mitt_max_frame_fraction: 0.6\n"
        "  mitt_min_aspect: 0.8\n"
        "  mitt_min_ratio: 0.04\n"
        "  mitt_max_ratio: 0.35\n"
        "  portrait_coverage: 0.9\n"
        "verbose: 0\n");

    Config config;
    ASSERT_TRUE(config.loadFromFile(path));
    EXPECT_DOUBLE_EQ(config.mittMinHeight, 40.0);
    EXPECT_DOUBLE_EQ(config.mittMaxFrameFraction, 0.6);
    EXPECT_DOUBLE_EQ(config.mittMinAspect, 0.8);
    EXPECT_DOUBLE_EQ(config.mittMinRatio, 0.04);
    EXPECT_DOUBLE_EQ(config.mittMaxRatio, 0.35);
    EXPECT_DOUBLE_EQ(config.portraitCoverage, 0.9);
    // Untouched keys keep their defaults
    EXPECT_DOUBLE_EQ(config.mittHeightMeters, 0.32);
    EXPECT_EQ(config.mittMinCandidates, 4);
    std::remove(path.c_str());
}

TEST(ConfigTest, QuietConfigPrintsNothingToStdout) {
    std::string path = writeConfigFile("pitchspeed_quiet.yaml",
        "tracker:\n"
        "  association_gate: 120.0\n"
        "verbose: 0\n");

    Config config;
    testing::internal::CaptureStdout();
    bool loaded = config.loadFromFile(path);
    std::string output = testing::internal::GetCapturedStdout();

    EXPECT_TRUE(loaded);
    EXPECT_FALSE(config.verbose);
    EXPECT_FLOAT_EQ(config.associationGate, 120.0f);
    EXPECT_EQ(output, "");
    std::remove(path.c_str());
}

TEST(ConfigTest, MissingFileKeepsDefaults) {
    Config config;
    EXPECT_FALSE(config.loadFromFile(::testing::TempDir() + "no_such_pitchspeed.yaml"));
    EXPECT_TRUE(config.verbose);
    EXPECT_FLOAT_EQ(config.associationGate, 150.0f);
}
