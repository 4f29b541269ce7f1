/* @file ConfigLoader.cpp
 * @brief JSON file reader
 *
 * © 2025 The ivseq Authors — MIT-licensed.
 */

// STL headers
#include <fstream>
#include <stdexcept>

// 3rd-party headers
#include <nlohmann/json.hpp>

// ivseq headers
#include "core/ConfigLoader.hpp"
#include "core/EngineConfig.hpp"

using namespace ivseq::core;

ConfigLoader::ConfigLoader(std::string configPath) : path_(std::move(configPath)) {}

nlohmann::json ConfigLoader::load() const {
  std::ifstream in(path_);
  if (!in)
    throw std::runtime_error("[ConfigLoader] cannot open " + path_);

  try {
    return nlohmann::json::parse(in);
  } catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error("[ConfigLoader] " + path_ + ": " + e.what());
  }
}

EngineConfig ConfigLoader::loadEngineConfig() const {
  const auto j = load();
  EngineConfig cfg;
  try {
    j.get_to(cfg);
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error("[ConfigLoader] " + path_ + ": " + e.what());
  }
  validate(cfg);
  return cfg;
}
