#include "cli/cli_dispatcher.hpp"
#include "cli/table_commands.hpp"

#include <iostream>

int main() {
    CliDispatcher dispatcher("HoldemEngine", Version{ .major = 1, .minor = 0, .patch = 0 });
    TableContext context;
    registerAllCommands(dispatcher, context);

    dispatcher.run(std::cin);

    return 0;
}
