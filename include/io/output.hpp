#ifndef OUTPUT_HPP
#define OUTPUT_HPP

#include "game/holdem/action.hpp"
#include "game/holdem/game_engine.hpp"
#include "game/holdem/pot_manager.hpp"

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

nlohmann::ordered_json buildSnapshotJSON(const GameEngine::TableSnapshot& snapshot);
nlohmann::ordered_json buildLegalActionsJSON(const LegalActions& legalActions);
nlohmann::ordered_json buildHandResultJSON(const HandResult& result, const std::vector<std::string>& playerNames);

#endif // OUTPUT_HPP
