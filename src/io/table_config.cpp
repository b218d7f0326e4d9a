#include "io/table_config.hpp"

#include "game/holdem/config.hpp"
#include "game/holdem/game_engine.hpp"
#include "util/result.hpp"
#include "util/string_utils.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <limits>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace {
template <typename T>
bool loadField(T& field, const YAML::Node& node, const std::vector<std::string>& indices, std::size_t depth) {
    if (!node.IsDefined() || node.IsNull()) {
        return false;
    }

    if (depth == indices.size()) {
        try {
            field = node.as<T>();
            std::cout << "Successfully loaded field " << join(indices, "::") << ".\n";
            return true;
        }
        catch (const YAML::Exception&) {
            return false;
        }
    }

    // Only maps can be indexed further
    if (!node.IsMap()) {
        return false;
    }
    return loadField(field, node[indices[depth]], indices, depth + 1);
}

template <typename T>
bool loadFieldRequired(T& field, const YAML::Node& root, const std::vector<std::string>& indices) {
    if (!loadField(field, root, indices, 0)) {
        std::cerr << "Error: Could not load field " << join(indices, "::") << ".\n";
        return false;
    }
    return true;
}

template <typename T>
void loadFieldOptional(T& field, const YAML::Node& root, const std::vector<std::string>& indices, const T& defaultValue) {
    if (!loadField(field, root, indices, 0)) {
        std::cout << "Could not load field " << join(indices, "::") << ", using default.\n";
        field = defaultValue;
    }
}

std::optional<std::string> validatePlayerNames(const std::vector<std::string>& playerNames) {
    int numPlayers = static_cast<int>(playerNames.size());
    if (numPlayers < holdem::MinSeats || numPlayers > holdem::MaxSeats) {
        return "Error: A table needs between " + std::to_string(holdem::MinSeats) + " and " + std::to_string(holdem::MaxSeats)
            + " players, got " + std::to_string(numPlayers) + ".";
    }

    std::set<std::string> seenNames;
    for (const std::string& name : playerNames) {
        if (trim(name).empty()) {
            return "Error: Player names must not be empty.";
        }
        if (!seenNames.insert(name).second) {
            return "Error: Player name \"" + name + "\" is used more than once.";
        }
    }
    return std::nullopt;
}
} // namespace

Result<GameEngine::Settings> buildSettingsFromYaml(const YAML::Node& root) {
    GameEngine::Settings settings;

    // Load players
    if (!loadFieldRequired(settings.playerNames, root, { "players" })) {
        return "Error: Could not load the list of players.";
    }
    std::optional<std::string> nameError = validatePlayerNames(settings.playerNames);
    if (nameError) {
        return *nameError;
    }

    // Load chips and blinds
    loadFieldOptional(settings.startingChips, root, { "starting-chips" }, holdem::DefaultStartingChips);
    if (settings.startingChips <= 0) {
        return "Error: Starting chips must be positive.";
    }

    loadFieldOptional(settings.startingStacks, root, { "stacks" }, std::vector<int>{});
    if (!settings.startingStacks.empty()) {
        if (settings.startingStacks.size() != settings.playerNames.size()) {
            return "Error: Expected " + std::to_string(settings.playerNames.size()) + " stacks, got " + std::to_string(settings.startingStacks.size()) + ".";
        }
        for (int stack : settings.startingStacks) {
            if (stack < 0) {
                return "Error: Stacks must not be negative.";
            }
        }
    }

    // Every chip at the table must fit in an int
    std::int64_t totalChips = 0;
    if (settings.startingStacks.empty()) {
        totalChips = static_cast<std::int64_t>(settings.startingChips) * static_cast<std::int64_t>(settings.playerNames.size());
    }
    else {
        for (int stack : settings.startingStacks) {
            totalChips += stack;
        }
    }
    if (totalChips > std::numeric_limits<int>::max()) {
        return "Error: The table holds " + std::to_string(totalChips) + " chips, at most " + std::to_string(std::numeric_limits<int>::max()) + " are supported.";
    }

    loadFieldOptional(settings.smallBlind, root, { "blinds", "small" }, holdem::DefaultSmallBlind);
    loadFieldOptional(settings.bigBlind, root, { "blinds", "big" }, holdem::DefaultBigBlind);
    if (settings.smallBlind <= 0) {
        return "Error: Small blind must be positive.";
    }
    if (settings.bigBlind < settings.smallBlind) {
        return "Error: Big blind must be at least the small blind.";
    }

    // Load seed
    std::uint64_t seed;
    if (loadField(seed, root, { "seed" }, 0)) {
        settings.seed = seed;
    }
    else {
        std::cout << "Could not load field seed, using a random seed.\n";
        settings.seed = std::nullopt;
    }

    return settings;
}

Result<GameEngine::Settings> loadSettingsFromFile(const std::string& filePath) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(filePath);
    }
    catch (const YAML::Exception& e) {
        return std::string{ "Error: Could not load settings file. " } + e.what();
    }

    std::cout << "Loading table settings from " << filePath << ":\n";
    return buildSettingsFromYaml(root);
}
