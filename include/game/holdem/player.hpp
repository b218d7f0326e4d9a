#ifndef PLAYER_HPP
#define PLAYER_HPP

#include "game/game_types.hpp"

#include <optional>
#include <string>

class Player {
public:
    Player() = default;
    Player(const std::string& name, int chips);

    // Moves chips from the stack into the pot, going all-in when the stack empties
    Status commit(int amount);
    void fold();
    void collect(int amount);
    void dealHoleCards(const HoleCards& holeCards);

    // Takes effect at the next hand
    void setSittingOut(bool sittingOut);

    void resetForNewHand();
    void resetStreetContribution();

    const std::string& getName() const;
    int getChips() const;
    int getStreetContribution() const;
    int getHandContribution() const;
    SeatStatus getStatus() const;
    const std::optional<HoleCards>& getHoleCards() const;
    bool isInHand() const;
    bool wantsToSitOut() const;

private:
    std::string m_name;
    int m_chips = 0;
    int m_streetContribution = 0;
    int m_handContribution = 0;
    SeatStatus m_status = SeatStatus::SittingOut;
    std::optional<HoleCards> m_holeCards;
    bool m_wantsToSitOut = false;
};

using Seats = FixedVector<Player, holdem::MaxSeats>;

#endif // PLAYER_HPP
