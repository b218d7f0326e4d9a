#include "game/holdem/betting_round.hpp"

#include "game/game_types.hpp"
#include "game/game_utils.hpp"
#include "game/holdem/action.hpp"
#include "game/holdem/player.hpp"
#include "util/overloaded.hpp"

#include <algorithm>
#include <cassert>
#include <optional>
#include <string>
#include <variant>

int countPlayersWithStatus(const Seats& players, SeatStatus status) {
    return static_cast<int>(std::count_if(players.begin(), players.end(), [status](const Player& player) {
        return player.getStatus() == status;
    }));
}

int countPlayersInHand(const Seats& players) {
    return static_cast<int>(std::count_if(players.begin(), players.end(), [](const Player& player) {
        return player.isInHand();
    }));
}

BettingRound::BettingRound(Street street, const Seats& players, SeatID actionStartsAfter, int betToCall, int minRaise) :
    m_street{ street },
    m_betToCall{ betToCall },
    m_minRaise{ minRaise },
    m_actedSinceFullRaise{},
    m_seatToAct{ std::nullopt } {
    assert(betToCall >= 0);
    assert(minRaise > 0);
    assert(actionStartsAfter >= 0 && actionStartsAfter < static_cast<int>(players.size()));

    m_actedSinceFullRaise.fill(false);
    if (countPlayersInHand(players) > 1) {
        m_seatToAct = findNextSeatToAct(players, actionStartsAfter);
    }
}

EngineResult<AppliedAction> BettingRound::applyAction(Seats& players, SeatID seat, const Action& action) {
    if (!m_seatToAct) {
        return EngineError{ ErrorKind::InvalidAction, "The " + getStreetName(m_street) + " betting round is already complete." };
    }
    if (seat != *m_seatToAct) {
        return EngineError{
            ErrorKind::OutOfTurn,
            "Seat " + std::to_string(seat) + " cannot act, seat " + std::to_string(*m_seatToAct) + " is to act."
        };
    }

    Player& player = players[seat];
    assert(player.getStatus() == SeatStatus::Active);

    const int chips = player.getChips();
    const int callAmount = std::max(0, m_betToCall - player.getStreetContribution());
    assert(chips > 0);

    auto commitChips = [&player](int amount) {
        Status commitResult = player.commit(amount);
        assert(commitResult.isValue());
        static_cast<void>(commitResult);
    };

    EngineResult<AppliedAction> result = std::visit(Overloaded{
        [&](const FoldAction&) -> EngineResult<AppliedAction> {
            player.fold();
            return AppliedAction{ seat, FoldAction{}, 0, player.getStreetContribution(), false };
        },

        [&](const CheckAction&) -> EngineResult<AppliedAction> {
            if (callAmount > 0) {
                return EngineError{ ErrorKind::InvalidAction, "Cannot check when a bet is pending." };
            }
            return AppliedAction{ seat, CheckAction{}, 0, player.getStreetContribution(), false };
        },

        [&](const CallAction&) -> EngineResult<AppliedAction> {
            if (callAmount == 0) {
                return EngineError{ ErrorKind::InvalidAction, "There is no bet to call." };
            }

            // A short stack calls for whatever it has left
            int amount = std::min(callAmount, chips);
            commitChips(amount);
            Action resolved = (player.getChips() == 0) ? Action{ AllInAction{} } : Action{ CallAction{} };
            return AppliedAction{ seat, resolved, amount, player.getStreetContribution(), false };
        },

        [&](const RaiseAction& raise) -> EngineResult<AppliedAction> {
            if (!isRaiseOpen(players, seat)) {
                return EngineError{ ErrorKind::InvalidAction, "Raising is not allowed here, only calling or folding." };
            }
            if (raise.amount <= 0) {
                return EngineError{ ErrorKind::InvalidRaiseAmount, "Raise amount must be positive." };
            }

            if (raise.amount > chips - callAmount) {
                return EngineError{
                    ErrorKind::InsufficientChips,
                    "Raising by " + std::to_string(raise.amount) + " needs more than the " + std::to_string(chips) + " chips that remain."
                };
            }

            int amount = callAmount + raise.amount;

            // Raising less than the minimum is only allowed when it puts the player all-in
            bool isAllIn = (amount == chips);
            if (raise.amount < m_minRaise && !isAllIn) {
                return EngineError{
                    ErrorKind::InvalidRaiseAmount,
                    "Raise of " + std::to_string(raise.amount) + " is below the minimum raise of " + std::to_string(m_minRaise) + "."
                };
            }

            commitChips(amount);
            bool reopened = recordRaise(seat, player.getStreetContribution());
            Action resolved = isAllIn ? Action{ AllInAction{} } : Action{ RaiseAction{ raise.amount } };
            return AppliedAction{ seat, resolved, amount, player.getStreetContribution(), reopened };
        },

        [&](const AllInAction&) -> EngineResult<AppliedAction> {
            if (chips > callAmount && !isRaiseOpen(players, seat)) {
                return EngineError{ ErrorKind::InvalidAction, "Going all-in would be a raise, which is not allowed here." };
            }

            commitChips(chips);
            bool reopened = false;
            if (player.getStreetContribution() > m_betToCall) {
                reopened = recordRaise(seat, player.getStreetContribution());
            }
            return AppliedAction{ seat, AllInAction{}, chips, player.getStreetContribution(), reopened };
        }
    }, action);

    if (result.isError()) {
        return result;
    }

    m_actedSinceFullRaise[seat] = true;
    advance(players, seat);
    return result;
}

LegalActions BettingRound::getLegalActions(const Seats& players, SeatID seat, int potTotal) const {
    LegalActions legal;
    if (!m_seatToAct || seat != *m_seatToAct) {
        return legal;
    }

    const Player& player = players[seat];
    const int chips = player.getChips();
    const int callAmount = std::max(0, m_betToCall - player.getStreetContribution());

    legal.canFold = true;
    legal.canCheck = (callAmount == 0);
    legal.canCall = (callAmount > 0);
    legal.callAmount = std::min(callAmount, chips);

    if (chips > callAmount && isRaiseOpen(players, seat)) {
        legal.canRaise = true;
        legal.maxRaise = chips - callAmount;
        legal.minRaise = std::min(m_minRaise, legal.maxRaise);
    }

    legal.canAllIn = (chips <= callAmount) || legal.canRaise;

    if (legal.callAmount > 0) {
        legal.potOdds = static_cast<float>(legal.callAmount) / static_cast<float>(potTotal + legal.callAmount);
    }

    return legal;
}

Street BettingRound::getStreet() const {
    return m_street;
}

RoundState BettingRound::getState() const {
    return m_seatToAct ? RoundState::AwaitingAction : RoundState::Complete;
}

std::optional<SeatID> BettingRound::getSeatToAct() const {
    return m_seatToAct;
}

int BettingRound::getBetToCall() const {
    return m_betToCall;
}

int BettingRound::getMinRaise() const {
    return m_minRaise;
}

bool BettingRound::needsToAct(const Seats& players, SeatID seat) const {
    const Player& player = players[seat];
    if (player.getStatus() != SeatStatus::Active) {
        return false;
    }

    if (player.getStreetContribution() < m_betToCall) {
        return true;
    }

    if (m_actedSinceFullRaise[seat]) {
        return false;
    }

    // A lone active player facing nothing has nobody left to bet against
    return countPlayersWithStatus(players, SeatStatus::Active) > 1;
}

bool BettingRound::isRaiseOpen(const Seats& players, SeatID seat) const {
    // Only a full raise reopens the betting for players who already acted
    if (m_actedSinceFullRaise[seat]) {
        return false;
    }

    for (int otherSeat = 0; otherSeat < static_cast<int>(players.size()); ++otherSeat) {
        if (otherSeat != seat && players[otherSeat].getStatus() == SeatStatus::Active) {
            return true;
        }
    }
    return false;
}

std::optional<SeatID> BettingRound::findNextSeatToAct(const Seats& players, SeatID afterSeat) const {
    int numSeats = static_cast<int>(players.size());
    for (int offset = 1; offset <= numSeats; ++offset) {
        SeatID seat = (afterSeat + offset) % numSeats;
        if (needsToAct(players, seat)) {
            return seat;
        }
    }
    return std::nullopt;
}

bool BettingRound::recordRaise(SeatID seat, int newStreetContribution) {
    int raiseIncrement = newStreetContribution - m_betToCall;
    assert(raiseIncrement > 0);

    m_betToCall = newStreetContribution;
    if (raiseIncrement < m_minRaise) {
        return false;
    }

    m_minRaise = raiseIncrement;
    m_actedSinceFullRaise.fill(false);
    m_actedSinceFullRaise[seat] = true;
    return true;
}

void BettingRound::advance(const Seats& players, SeatID actingSeat) {
    if (countPlayersInHand(players) <= 1) {
        m_seatToAct = std::nullopt;
        return;
    }
    m_seatToAct = findNextSeatToAct(players, actingSeat);
}
