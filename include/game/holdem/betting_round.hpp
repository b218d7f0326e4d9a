#ifndef BETTING_ROUND_HPP
#define BETTING_ROUND_HPP

#include "game/game_types.hpp"
#include "game/holdem/action.hpp"
#include "game/holdem/player.hpp"

#include <optional>

enum class RoundState : std::uint8_t {
    AwaitingAction,
    Complete
};

// Betting for a single street. The players are owned by the caller and passed
// into every call; the round only keeps the street level betting state.
class BettingRound {
public:
    // Action starts with the first seat after actionStartsAfter that needs to act
    BettingRound(Street street, const Seats& players, SeatID actionStartsAfter, int betToCall, int minRaise);

    EngineResult<AppliedAction> applyAction(Seats& players, SeatID seat, const Action& action);
    LegalActions getLegalActions(const Seats& players, SeatID seat, int potTotal) const;

    Street getStreet() const;
    RoundState getState() const;
    std::optional<SeatID> getSeatToAct() const;
    int getBetToCall() const;
    int getMinRaise() const;

private:
    bool needsToAct(const Seats& players, SeatID seat) const;
    bool isRaiseOpen(const Seats& players, SeatID seat) const;
    std::optional<SeatID> findNextSeatToAct(const Seats& players, SeatID afterSeat) const;
    // Returns true when the raise was a full raise and betting reopened
    bool recordRaise(SeatID seat, int newStreetContribution);
    void advance(const Seats& players, SeatID actingSeat);

    Street m_street;
    int m_betToCall;
    int m_minRaise;
    SeatArray<bool> m_actedSinceFullRaise;
    std::optional<SeatID> m_seatToAct;
};

int countPlayersWithStatus(const Seats& players, SeatStatus status);
int countPlayersInHand(const Seats& players);

#endif // BETTING_ROUND_HPP
