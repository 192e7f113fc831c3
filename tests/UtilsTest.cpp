#include "Math.hpp"
#include "Utils.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <random>
#include <string>

namespace
{
std::string writeTempFile(const std::string& name, const std::string& content)
{
  const auto path = std::filesystem::temp_directory_path() / name;
  std::ofstream file(path);
  file << content;
  return path.string();
}
}

TEST(UtilsTest, LoadJsonFileReadsValidFile)
{
  const auto path = writeTempFile("flock2d_valid.json", R"({ "Flocking Forces": { "Cohesion": [2.0, 0.0, 5.0] } })");

  json js;
  EXPECT_TRUE(Utils::LoadJsonFile(path, js));
  EXPECT_EQ(js["Flocking Forces"]["Cohesion"][0].get<double>(), 2.0);

  std::filesystem::remove(path);
}

TEST(UtilsTest, LoadJsonFileRejectsMalformedFile)
{
  const auto path = writeTempFile("flock2d_malformed.json", R"({ "Flocking Forces": { "Cohesion": [2.0, )");

  json js = { { "untouched", true } };
  EXPECT_FALSE(Utils::LoadJsonFile(path, js));
  EXPECT_TRUE(js["untouched"].get<bool>());

  std::filesystem::remove(path);
}

TEST(UtilsTest, LoadJsonFileRejectsMissingFile)
{
  json js;
  EXPECT_FALSE(Utils::LoadJsonFile("/nonexistent/flock2d/config.json", js));
}

TEST(UtilsTest, RandomValuesStayInRange)
{
  std::mt19937 engine(5);
  for (int i = 0; i < 1000; ++i)
  {
    const double value = Utils::RandomUniform(0.0, 640.0, engine);
    EXPECT_GE(value, 0.0);
    EXPECT_LT(value, 640.0);

    const double angle = Utils::RandomAngle(engine);
    EXPECT_GE(angle, 0.0);
    EXPECT_LT(angle, 2.0 * Math::PI);
  }
}

TEST(UtilsTest, VersionsComeFromBuild)
{
  EXPECT_EQ(Utils::GetVersions(), std::string(VERSION_MAJOR) + "." + std::string(VERSION_MINOR));
}
