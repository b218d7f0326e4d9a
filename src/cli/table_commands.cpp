#include "cli/table_commands.hpp"

#include "cli/cli_dispatcher.hpp"
#include "game/game_types.hpp"
#include "game/game_utils.hpp"
#include "game/holdem/action.hpp"
#include "game/holdem/game_engine.hpp"
#include "game/holdem/hand_evaluation.hpp"
#include "game/holdem/pot_manager.hpp"
#include "io/output.hpp"
#include "io/table_config.hpp"
#include "util/result.hpp"
#include "util/string_utils.hpp"

#include <cstddef>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace {
bool isContextValid(const TableContext& context) {
    return context.engine != nullptr;
}

void printInvalidContextError() {
    std::cerr << "Error: No table loaded. Please run \"default\" or \"table <file>\" first.\n";
}

void printEngineError(const EngineError& error) {
    std::cerr << "Error: " << getErrorKindName(error.kind) << ": " << error.message << "\n";
}

std::vector<std::string> getPlayerNames(const GameEngine& engine) {
    std::vector<std::string> names;
    for (SeatID seat = 0; seat < engine.getNumSeats(); ++seat) {
        names.push_back(engine.getPlayer(seat).getName());
    }
    return names;
}

std::string getCardsString(const CardID* cards, std::size_t numCards) {
    std::vector<std::string> names;
    for (std::size_t i = 0; i < numCards; ++i) {
        names.push_back(getDisplayNameFromCardID(cards[i]));
    }
    return join(names, " ");
}

std::string getHandString(const EvaluatedHand& hand) {
    std::string tieBreak;
    for (Value value : hand.tieBreak) {
        tieBreak += getNameFromCardID(getCardID(value, Suit::Clubs)).substr(0, 1);
    }
    return getHandCategoryName(hand.category) + " (" + tieBreak + ")";
}

void printTable(const GameEngine& engine) {
    // Hot-seat play: only the player to act sees their cards
    GameEngine::TableSnapshot snapshot = engine.getSnapshot(engine.getSeatToAct());

    std::cout << "Hand #" << snapshot.handNumber << " - " << getPhaseName(snapshot.phase) << "\n";
    std::cout << "Board: " << (snapshot.communityCards.empty() ? "-" : getCardsString(snapshot.communityCards.data(), snapshot.communityCards.size())) << "\n";

    std::cout << "Pots:";
    if (snapshot.potTotals.empty()) {
        std::cout << " -";
    }
    for (int potTotal : snapshot.potTotals) {
        std::cout << " " << potTotal;
    }
    std::cout << " (total " << snapshot.totalPot << ")\n";

    for (const GameEngine::SeatSnapshot& seat : snapshot.seats) {
        std::cout << (seat.seat == snapshot.seatToAct ? "-> " : "   ");
        std::cout << "[" << seat.seat << "] " << std::left << std::setw(12) << seat.name << std::right;
        std::cout << " chips " << std::setw(7) << seat.chips;
        std::cout << "  bet " << std::setw(6) << seat.streetContribution;
        std::cout << "  " << getSeatStatusName(seat.status);
        if (seat.isDealer) {
            std::cout << " (D)";
        }
        if (seat.holeCards) {
            std::cout << "  " << getCardsString(seat.holeCards->data(), seat.holeCards->size());
        }
        std::cout << "\n";
    }
}

void printLegalActions(const GameEngine& engine, SeatID seat) {
    LegalActions legal = engine.getLegalActions(seat);

    std::cout << engine.getPlayer(seat).getName() << " can:";
    if (legal.canFold) {
        std::cout << " fold";
    }
    if (legal.canCheck) {
        std::cout << " check";
    }
    if (legal.canCall) {
        std::cout << " call (" << legal.callAmount << ", pot odds " << std::fixed << std::setprecision(1) << legal.potOdds * 100.0f << "%)";
    }
    if (legal.canRaise) {
        std::cout << " raise <" << legal.minRaise << "-" << legal.maxRaise << ">";
    }
    if (legal.canAllIn) {
        std::cout << " allin";
    }
    std::cout << "\n";
}

void printHandResult(const GameEngine& engine, const HandResult& result) {
    std::cout << "Hand #" << result.handNumber << " result:\n";
    for (const PotAward& award : result.awards) {
        std::vector<std::string> winnerNames;
        for (SeatID seat : award.winners) {
            winnerNames.push_back(engine.getPlayer(seat).getName());
        }

        std::cout << (award.potIndex == 0 ? "Main pot" : "Side pot " + std::to_string(award.potIndex)) << " (" << award.amount << "): ";
        std::cout << join(winnerNames, ", ");
        if (award.winningHand) {
            std::cout << " with " << getHandString(*award.winningHand);
        }
        else if (result.wentToShowdown) {
            std::cout << " (returned)";
        }
        std::cout << "\n";
    }
}

bool handleSetupTable(TableContext& context, const std::string& argument) {
    Result<GameEngine::Settings> settingsResult = loadSettingsFromFile(argument);
    if (settingsResult.isError()) {
        std::cerr << settingsResult.getError() << "\n";
        return false;
    }

    context.engine = std::make_unique<GameEngine>(settingsResult.getValue());
    std::cout << "Successfully loaded table with " << context.engine->getNumSeats() << " players.\n";
    return true;
}

bool handleSetupDefault(TableContext& context) {
    context.engine = std::make_unique<GameEngine>(getDefaultSettings());
    std::cout << "Successfully loaded default heads-up table.\n";
    return true;
}

bool handleDeal(TableContext& context) {
    if (!isContextValid(context)) {
        printInvalidContextError();
        return false;
    }

    Status startResult = context.engine->startHand();
    if (startResult.isError()) {
        printEngineError(startResult.getError());
        return false;
    }

    printTable(*context.engine);
    if (context.engine->getPhase() == HandPhase::HandComplete) {
        printHandResult(*context.engine, *context.engine->getLastHandResult());
    }
    return true;
}

bool handleAction(TableContext& context, const Action& action) {
    if (!isContextValid(context)) {
        printInvalidContextError();
        return false;
    }

    std::optional<SeatID> seatToAct = context.engine->getSeatToAct();
    if (!seatToAct) {
        std::cerr << "Error: Nobody is to act. Run \"deal\" to start a new hand.\n";
        return false;
    }

    EngineResult<GameEngine::RoundOutcome> outcomeResult = context.engine->applyAction(*seatToAct, action);
    if (outcomeResult.isError()) {
        printEngineError(outcomeResult.getError());
        return false;
    }

    const GameEngine::RoundOutcome& outcome = outcomeResult.getValue();
    std::cout << outcome.description << "\n";
    if (outcome.handComplete) {
        printHandResult(*context.engine, *context.engine->getLastHandResult());
    }
    else if (outcome.roundState == RoundState::Complete) {
        printTable(*context.engine);
    }
    return true;
}

bool handleRaise(TableContext& context, const std::string& argument) {
    std::optional<int> amount = parseInt(argument);
    if (!amount) {
        std::cerr << "Error: Raise amount must be an integer.\n";
        return false;
    }
    return handleAction(context, RaiseAction{ *amount });
}

bool handleState(TableContext& context) {
    if (!isContextValid(context)) {
        printInvalidContextError();
        return false;
    }

    printTable(*context.engine);
    return true;
}

bool handleActions(TableContext& context) {
    if (!isContextValid(context)) {
        printInvalidContextError();
        return false;
    }

    std::optional<SeatID> seatToAct = context.engine->getSeatToAct();
    if (!seatToAct) {
        std::cerr << "Error: Nobody is to act.\n";
        return false;
    }

    printLegalActions(*context.engine, *seatToAct);
    return true;
}

bool handleJSON(TableContext& context) {
    if (!isContextValid(context)) {
        printInvalidContextError();
        return false;
    }

    nlohmann::ordered_json j;
    j["Table"] = buildSnapshotJSON(context.engine->getSnapshot(context.engine->getSeatToAct()));
    j["Legal Actions"] = context.engine->getSeatToAct()
        ? buildLegalActionsJSON(context.engine->getLegalActions(*context.engine->getSeatToAct()))
        : nlohmann::ordered_json(nullptr);

    const std::optional<HandResult>& lastHandResult = context.engine->getLastHandResult();
    j["Last Hand"] = lastHandResult
        ? buildHandResultJSON(*lastHandResult, getPlayerNames(*context.engine))
        : nlohmann::ordered_json(nullptr);

    std::cout << j.dump(4) << "\n";
    return true;
}

bool handleResult(TableContext& context) {
    if (!isContextValid(context)) {
        printInvalidContextError();
        return false;
    }

    const std::optional<HandResult>& lastHandResult = context.engine->getLastHandResult();
    if (!lastHandResult) {
        std::cerr << "Error: No hand has finished yet.\n";
        return false;
    }

    printHandResult(*context.engine, *lastHandResult);
    return true;
}

bool handleSitOut(TableContext& context, const std::string& argument, bool sittingOut) {
    if (!isContextValid(context)) {
        printInvalidContextError();
        return false;
    }

    std::optional<int> seat = parseInt(argument);
    if (!seat) {
        std::cerr << "Error: Seat must be an integer.\n";
        return false;
    }

    Status sitOutResult = context.engine->setSittingOut(*seat, sittingOut);
    if (sitOutResult.isError()) {
        printEngineError(sitOutResult.getError());
        return false;
    }

    std::cout << context.engine->getPlayer(*seat).getName() << (sittingOut ? " will sit out" : " will be dealt in") << " from the next hand.\n";
    return true;
}
} // namespace

bool registerAllCommands(CliDispatcher& dispatcher, TableContext& context) {
    bool allSuccess = true;

    allSuccess &= dispatcher.registerCommand(
        "table",
        "file",
        "Loads table settings (players, starting chips, blinds, seed) from a given .yml configuration file.",
        [&context](const std::string& argument) { return handleSetupTable(context, argument); }
    );

    allSuccess &= dispatcher.registerCommand(
        "default",
        "Loads a heads-up table with two players, 10000 chips each and blinds of 10/20.",
        [&context]() { return handleSetupDefault(context); }
    );

    allSuccess &= dispatcher.registerCommand(
        "deal",
        "Shuffles and deals the next hand.",
        [&context]() { return handleDeal(context); }
    );

    allSuccess &= dispatcher.registerCommand(
        "fold",
        "Folds for the player to act.",
        [&context]() { return handleAction(context, FoldAction{}); }
    );

    allSuccess &= dispatcher.registerCommand(
        "check",
        "Checks for the player to act.",
        [&context]() { return handleAction(context, CheckAction{}); }
    );

    allSuccess &= dispatcher.registerCommand(
        "call",
        "Calls the current bet for the player to act.",
        [&context]() { return handleAction(context, CallAction{}); }
    );

    allSuccess &= dispatcher.registerCommand(
        "raise",
        "amount",
        "Raises by the given amount on top of the call for the player to act.",
        [&context](const std::string& argument) { return handleRaise(context, argument); }
    );

    allSuccess &= dispatcher.registerCommand(
        "allin",
        "Commits all remaining chips for the player to act.",
        [&context]() { return handleAction(context, AllInAction{}); }
    );

    allSuccess &= dispatcher.registerCommand(
        "state",
        "Prints the table as seen by the player to act.",
        [&context]() { return handleState(context); }
    );

    allSuccess &= dispatcher.registerCommand(
        "actions",
        "Lists the legal actions of the player to act.",
        [&context]() { return handleActions(context); }
    );

    allSuccess &= dispatcher.registerCommand(
        "json",
        "Prints the table, legal actions and last hand result as JSON.",
        [&context]() { return handleJSON(context); }
    );

    allSuccess &= dispatcher.registerCommand(
        "result",
        "Prints the result of the last finished hand.",
        [&context]() { return handleResult(context); }
    );

    allSuccess &= dispatcher.registerCommand(
        "sitout",
        "seat",
        "Sits out the player in the given seat from the next hand.",
        [&context](const std::string& argument) { return handleSitOut(context, argument, true); }
    );

    allSuccess &= dispatcher.registerCommand(
        "sitin",
        "seat",
        "Deals the player in the given seat back in from the next hand.",
        [&context](const std::string& argument) { return handleSitOut(context, argument, false); }
    );

    return allSuccess;
}
