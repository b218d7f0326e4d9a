#ifndef POT_MANAGER_HPP
#define POT_MANAGER_HPP

#include "game/game_types.hpp"
#include "game/holdem/hand_evaluation.hpp"
#include "game/holdem/player.hpp"

#include <optional>
#include <vector>

struct PotLayer {
    // Total chips in the layer, not the amount per player
    int amount;
    SeatList eligibleSeats;
};

struct PotAward {
    int potIndex;
    int amount;

    // In odd chip order, clockwise from the dealer
    SeatList winners;

    // Empty when the pot was not contested
    std::optional<EvaluatedHand> winningHand;
};

struct HandResult {
    int handNumber = 0;
    bool wentToShowdown = false;
    std::vector<PotAward> awards;
    SeatArray<int> payouts{};
    SeatArray<std::optional<EvaluatedHand>> shownHands{};
};

class PotManager {
public:
    PotManager();

    void reset();
    void addContribution(SeatID seat, int amount);
    void markFolded(SeatID seat);

    int getContribution(SeatID seat) const;
    int getTotal() const;

    // Main pot first, then each side pot in order of increasing all-in level
    std::vector<PotLayer> buildLayers() const;

    HandResult awardUncontested(SeatID winner) const;
    HandResult resolveShowdown(const Seats& players, CardSet board, SeatID dealer) const;

private:
    SeatArray<int> m_contributions;
    SeatArray<bool> m_folded;
};

#endif // POT_MANAGER_HPP
