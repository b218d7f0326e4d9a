#ifndef TABLE_COMMANDS_HPP
#define TABLE_COMMANDS_HPP

#include "cli/cli_dispatcher.hpp"
#include "game/holdem/game_engine.hpp"

#include <memory>

struct TableContext {
    std::unique_ptr<GameEngine> engine;
};

bool registerAllCommands(CliDispatcher& dispatcher, TableContext& context);

#endif // TABLE_COMMANDS_HPP
