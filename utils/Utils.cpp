#include "Utils.hpp"
#include "Logging.hpp"
#include "Math.hpp"

#include <fstream>

const std::string Utils::GetVersions()
{
  return std::string(VERSION_MAJOR) + "." + std::string(VERSION_MINOR);
}

bool Utils::LoadJsonFile(const std::string& filePath, json& js)
{
  std::ifstream file(filePath);
  if (!file.is_open())
  {
    LOG_ERROR("Cannot open file {}", filePath);
    return false;
  }

  try
  {
    js = json::parse(file);
  }
  catch (const json::parse_error& e)
  {
    LOG_ERROR("Cannot parse json file {}: {}", filePath, e.what());
    return false;
  }

  return true;
}

std::mt19937& Utils::RandomEngine()
{
  static thread_local std::mt19937 engine(std::random_device {}());
  return engine;
}

double Utils::RandomUniform(double min, double max, std::mt19937& engine)
{
  std::uniform_real_distribution<double> distrib(min, max);
  return distrib(engine);
}

double Utils::RandomAngle(std::mt19937& engine)
{
  return RandomUniform(0.0, 2.0 * Math::PI, engine);
}
