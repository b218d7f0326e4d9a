#ifndef HAND_EVALUATION_HPP
#define HAND_EVALUATION_HPP

#include "game/game_types.hpp"
#include "util/fixed_vector.hpp"

#include <compare>
#include <span>

struct EvaluatedHand {
    HandCategory category;

    // Ranks that break ties within the category, most significant first
    FixedVector<Value, 5> tieBreak;

    auto operator<=>(const EvaluatedHand&) const = default;
};

EvaluatedHand getFiveCardHandStrength(CardSet hand);

// Best five card hand out of 5 to 7 distinct cards
EngineResult<EvaluatedHand> evaluateHand(CardSet cards);
EngineResult<EvaluatedHand> evaluateHand(std::span<const CardID> cards);

#endif // HAND_EVALUATION_HPP
