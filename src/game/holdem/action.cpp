#include "game/holdem/action.hpp"

#include "util/overloaded.hpp"

#include <string>
#include <variant>

std::string getActionName(const Action& action) {
    return std::visit(Overloaded{
        [](const FoldAction&) -> std::string { return "Fold"; },
        [](const CheckAction&) -> std::string { return "Check"; },
        [](const CallAction&) -> std::string { return "Call"; },
        [](const RaiseAction& raise) -> std::string { return "Raise " + std::to_string(raise.amount); },
        [](const AllInAction&) -> std::string { return "All-in"; }
    }, action);
}

std::string describeAppliedAction(const std::string& playerName, const AppliedAction& applied) {
    return std::visit(Overloaded{
        [&](const FoldAction&) -> std::string {
            return playerName + " folded";
        },
        [&](const CheckAction&) -> std::string {
            return playerName + " checked";
        },
        [&](const CallAction&) -> std::string {
            return playerName + " called " + std::to_string(applied.amountCommitted);
        },
        [&](const RaiseAction&) -> std::string {
            return playerName + " raised to " + std::to_string(applied.streetContribution);
        },
        [&](const AllInAction&) -> std::string {
            return playerName + " went all-in with " + std::to_string(applied.amountCommitted);
        }
    }, applied.action);
}
