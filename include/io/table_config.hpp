#ifndef TABLE_CONFIG_HPP
#define TABLE_CONFIG_HPP

#include "game/holdem/game_engine.hpp"
#include "util/result.hpp"

#include <string>

#include <yaml-cpp/yaml.h>

Result<GameEngine::Settings> buildSettingsFromYaml(const YAML::Node& root);
Result<GameEngine::Settings> loadSettingsFromFile(const std::string& filePath);

#endif // TABLE_CONFIG_HPP
