/* @file ConfigLoader.cpp
 * @brief JSON file -> nlohmann::json
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "core/ConfigLoader.hpp"

using namespace benchguard::core;

ConfigLoader::ConfigLoader(std::string configPath) : path_(std::move(configPath)) {}

nlohmann::json ConfigLoader::load() const {
  std::ifstream in(path_);
  if (!in)
    throw std::runtime_error("[ConfigLoader] cannot open " + path_);

  try {
    auto j = nlohmann::json::parse(in, nullptr, true, /*ignore_comments=*/true);
    if (!j.is_object())
      throw std::runtime_error("[ConfigLoader] " + path_ + ": top level must be an object");
    return j;
  } catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error("[ConfigLoader] " + path_ + ": " + e.what());
  }
}
