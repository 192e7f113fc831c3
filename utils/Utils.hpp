#pragma once

#include <nlohmann/json.hpp>

#include <random>
#include <string>

using json = nlohmann::json;

namespace Utils
{
const std::string GetVersions();

// Reads and parses a json file, returns false and logs on any failure
bool LoadJsonFile(const std::string& filePath, json& js);

// Shared engine for callers not providing their own
std::mt19937& RandomEngine();

// Uniform value in [min, max)
double RandomUniform(double min, double max, std::mt19937& engine = RandomEngine());

// Uniform angle in [0, 2*PI)
double RandomAngle(std::mt19937& engine = RandomEngine());
}
