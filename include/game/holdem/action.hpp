#ifndef ACTION_HPP
#define ACTION_HPP

#include "game/game_types.hpp"

#include <string>
#include <variant>

struct FoldAction {
    bool operator==(const FoldAction&) const = default;
};

struct CheckAction {
    bool operator==(const CheckAction&) const = default;
};

struct CallAction {
    bool operator==(const CallAction&) const = default;
};

// Raise by amount on top of whatever is needed to call
struct RaiseAction {
    int amount;

    bool operator==(const RaiseAction&) const = default;
};

struct AllInAction {
    bool operator==(const AllInAction&) const = default;
};

using Action = std::variant<FoldAction, CheckAction, CallAction, RaiseAction, AllInAction>;

struct LegalActions {
    bool canFold = false;
    bool canCheck = false;
    bool canCall = false;
    bool canRaise = false;
    bool canAllIn = false;

    // Chips a call would commit (capped at the stack)
    int callAmount = 0;

    // Inclusive bounds for RaiseAction::amount
    int minRaise = 0;
    int maxRaise = 0;

    // Call amount divided by the pot after calling
    float potOdds = 0.0f;
};

// An action as it was carried out: a short call becomes an all-in
struct AppliedAction {
    SeatID seat;
    Action action;
    int amountCommitted;
    int streetContribution;
    bool reopenedBetting;
};

std::string getActionName(const Action& action);
std::string describeAppliedAction(const std::string& playerName, const AppliedAction& applied);

#endif // ACTION_HPP
