#include "game/holdem/pot_manager.hpp"

#include "game/game_types.hpp"
#include "game/game_utils.hpp"
#include "game/holdem/hand_evaluation.hpp"
#include "game/holdem/player.hpp"

#include <algorithm>
#include <cassert>
#include <numeric>
#include <optional>
#include <vector>

namespace {
// Position of a seat in odd chip order, the seat left of the dealer comes first
int getClockwiseDistance(SeatID dealer, SeatID seat, int numSeats) {
    return (seat - dealer - 1 + numSeats) % numSeats;
}
} // namespace

PotManager::PotManager() {
    reset();
}

void PotManager::reset() {
    m_contributions.fill(0);
    m_folded.fill(false);
}

void PotManager::addContribution(SeatID seat, int amount) {
    assert(seat >= 0 && seat < holdem::MaxSeats);
    assert(amount >= 0);
    m_contributions[seat] += amount;
}

void PotManager::markFolded(SeatID seat) {
    assert(seat >= 0 && seat < holdem::MaxSeats);
    m_folded[seat] = true;
}

int PotManager::getContribution(SeatID seat) const {
    assert(seat >= 0 && seat < holdem::MaxSeats);
    return m_contributions[seat];
}

int PotManager::getTotal() const {
    return std::accumulate(m_contributions.begin(), m_contributions.end(), 0);
}

std::vector<PotLayer> PotManager::buildLayers() const {
    std::vector<int> levels;
    for (int contribution : m_contributions) {
        if (contribution > 0) {
            levels.push_back(contribution);
        }
    }
    std::sort(levels.begin(), levels.end());
    levels.erase(std::unique(levels.begin(), levels.end()), levels.end());

    std::vector<PotLayer> layers;
    int previousLevel = 0;
    for (int level : levels) {
        PotLayer layer{ 0, {} };
        for (SeatID seat = 0; seat < holdem::MaxSeats; ++seat) {
            if (m_contributions[seat] >= level) {
                layer.amount += level - previousLevel;
                if (!m_folded[seat]) {
                    layer.eligibleSeats.pushBack(seat);
                }
            }
        }
        previousLevel = level;

        // A new layer is only needed when a different set of players can win it
        if (!layers.empty()) {
            PotLayer& lower = layers.back();
            if (layer.eligibleSeats.empty() || layer.eligibleSeats == lower.eligibleSeats) {
                lower.amount += layer.amount;
                continue;
            }
            if (lower.eligibleSeats.empty()) {
                lower.amount += layer.amount;
                lower.eligibleSeats = layer.eligibleSeats;
                continue;
            }
        }
        layers.push_back(layer);
    }

    assert(std::accumulate(layers.begin(), layers.end(), 0, [](int sum, const PotLayer& layer) {
        return sum + layer.amount;
    }) == getTotal());
    return layers;
}

HandResult PotManager::awardUncontested(SeatID winner) const {
    assert(!m_folded[winner]);

    HandResult result;
    std::vector<PotLayer> layers = buildLayers();
    for (int i = 0; i < static_cast<int>(layers.size()); ++i) {
        result.awards.push_back({
            .potIndex = i,
            .amount = layers[i].amount,
            .winners = { winner },
            .winningHand = std::nullopt
        });
    }
    result.payouts[winner] = getTotal();
    return result;
}

HandResult PotManager::resolveShowdown(const Seats& players, CardSet board, SeatID dealer) const {
    HandResult result;
    result.wentToShowdown = true;

    int numSeats = static_cast<int>(players.size());
    std::vector<PotLayer> layers = buildLayers();
    for (int i = 0; i < static_cast<int>(layers.size()); ++i) {
        const PotLayer& layer = layers[i];
        assert(!layer.eligibleSeats.empty());

        // Chips only this player put in are returned without a contest
        if (layer.eligibleSeats.size() == 1) {
            SeatID seat = layer.eligibleSeats[0];
            result.awards.push_back({ .potIndex = i, .amount = layer.amount, .winners = { seat }, .winningHand = std::nullopt });
            result.payouts[seat] += layer.amount;
            continue;
        }

        std::optional<EvaluatedHand> bestHand;
        std::vector<SeatID> winners;
        for (SeatID seat : layer.eligibleSeats) {
            if (!result.shownHands[seat]) {
                const std::optional<HoleCards>& holeCards = players[seat].getHoleCards();
                assert(holeCards);

                EngineResult<EvaluatedHand> evaluation = evaluateHand(board | cardIDToSet((*holeCards)[0]) | cardIDToSet((*holeCards)[1]));
                assert(evaluation.isValue());
                result.shownHands[seat] = evaluation.getValue();
            }

            const EvaluatedHand& hand = *result.shownHands[seat];
            if (!bestHand || hand > *bestHand) {
                bestHand = hand;
                winners = { seat };
            }
            else if (hand == *bestHand) {
                winners.push_back(seat);
            }
        }

        std::sort(winners.begin(), winners.end(), [dealer, numSeats](SeatID a, SeatID b) {
            return getClockwiseDistance(dealer, a, numSeats) < getClockwiseDistance(dealer, b, numSeats);
        });

        int numWinners = static_cast<int>(winners.size());
        int share = layer.amount / numWinners;
        int oddChips = layer.amount % numWinners;

        PotAward award{ .potIndex = i, .amount = layer.amount, .winners = {}, .winningHand = bestHand };
        for (int w = 0; w < numWinners; ++w) {
            result.payouts[winners[w]] += share + (w < oddChips ? 1 : 0);
            award.winners.pushBack(winners[w]);
        }
        result.awards.push_back(award);
    }

    assert(std::accumulate(result.payouts.begin(), result.payouts.end(), 0) == getTotal());
    return result;
}
