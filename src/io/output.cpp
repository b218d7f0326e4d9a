#include "io/output.hpp"

#include "game/game_types.hpp"
#include "game/game_utils.hpp"
#include "game/holdem/action.hpp"
#include "game/holdem/game_engine.hpp"
#include "game/holdem/hand_evaluation.hpp"
#include "game/holdem/pot_manager.hpp"

#include <nlohmann/json.hpp>

#include <cassert>
#include <cstddef>
#include <string>
#include <vector>

using json = nlohmann::ordered_json;

namespace {
json buildCardsJSON(const CardID* cards, std::size_t numCards) {
    json j = json::array();
    for (std::size_t i = 0; i < numCards; ++i) {
        j.push_back(getNameFromCardID(cards[i]));
    }
    return j;
}

json buildHandJSON(const EvaluatedHand& hand) {
    json j;
    j["Category"] = getHandCategoryName(hand.category);

    j["Tie Break"] = json::array();
    for (Value value : hand.tieBreak) {
        j["Tie Break"].push_back(static_cast<int>(value));
    }
    return j;
}

json buildSeatJSON(const GameEngine::SeatSnapshot& seat) {
    json j;
    j["Seat"] = seat.seat;
    j["Name"] = seat.name;
    j["Chips"] = seat.chips;
    j["Street Contribution"] = seat.streetContribution;
    j["Hand Contribution"] = seat.handContribution;
    j["Status"] = getSeatStatusName(seat.status);
    if (seat.holeCards) {
        j["Hole Cards"] = buildCardsJSON(seat.holeCards->data(), seat.holeCards->size());
    }
    else {
        j["Hole Cards"] = nullptr;
    }
    j["Dealer"] = seat.isDealer;
    return j;
}
} // namespace

json buildSnapshotJSON(const GameEngine::TableSnapshot& snapshot) {
    json j;
    j["Hand Number"] = snapshot.handNumber;
    j["Phase"] = getPhaseName(snapshot.phase);
    j["Street"] = snapshot.street ? json(getStreetName(*snapshot.street)) : json(nullptr);
    j["Community Cards"] = buildCardsJSON(snapshot.communityCards.data(), snapshot.communityCards.size());
    j["Pots"] = snapshot.potTotals;
    j["Total Pot"] = snapshot.totalPot;
    j["Seat To Act"] = snapshot.seatToAct ? json(*snapshot.seatToAct) : json(nullptr);
    j["Dealer"] = snapshot.dealer;
    j["Bet To Call"] = snapshot.betToCall;
    j["Min Raise"] = snapshot.minRaise;

    j["Seats"] = json::array();
    for (const GameEngine::SeatSnapshot& seat : snapshot.seats) {
        j["Seats"].push_back(buildSeatJSON(seat));
    }
    return j;
}

json buildLegalActionsJSON(const LegalActions& legalActions) {
    json j;

    j["Actions"] = json::array();
    if (legalActions.canFold) {
        j["Actions"].push_back("Fold");
    }
    if (legalActions.canCheck) {
        j["Actions"].push_back("Check");
    }
    if (legalActions.canCall) {
        j["Actions"].push_back("Call");
    }
    if (legalActions.canRaise) {
        j["Actions"].push_back("Raise");
    }
    if (legalActions.canAllIn) {
        j["Actions"].push_back("All-in");
    }

    j["Call Amount"] = legalActions.callAmount;
    if (legalActions.canRaise) {
        j["Min Raise"] = legalActions.minRaise;
        j["Max Raise"] = legalActions.maxRaise;
    }
    j["Pot Odds"] = legalActions.potOdds;
    return j;
}

json buildHandResultJSON(const HandResult& result, const std::vector<std::string>& playerNames) {
    json j;
    j["Hand Number"] = result.handNumber;
    j["Showdown"] = result.wentToShowdown;

    j["Pots"] = json::array();
    for (const PotAward& award : result.awards) {
        json pot;
        pot["Pot"] = award.potIndex;
        pot["Amount"] = award.amount;

        pot["Winners"] = json::array();
        for (SeatID seat : award.winners) {
            assert(seat < static_cast<int>(playerNames.size()));
            pot["Winners"].push_back(playerNames[seat]);
        }

        pot["Winning Hand"] = award.winningHand ? buildHandJSON(*award.winningHand) : json(nullptr);
        j["Pots"].push_back(pot);
    }

    json& payouts = j["Payouts"];
    payouts = json::object();
    for (SeatID seat = 0; seat < static_cast<int>(playerNames.size()); ++seat) {
        if (result.payouts[seat] > 0) {
            payouts[playerNames[seat]] = result.payouts[seat];
        }
    }

    json& shownHands = j["Shown Hands"];
    shownHands = json::object();
    for (SeatID seat = 0; seat < static_cast<int>(playerNames.size()); ++seat) {
        if (result.shownHands[seat]) {
            shownHands[playerNames[seat]] = buildHandJSON(*result.shownHands[seat]);
        }
    }

    return j;
}
