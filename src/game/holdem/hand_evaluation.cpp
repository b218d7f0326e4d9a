#include "game/holdem/hand_evaluation.hpp"

#include "game/game_types.hpp"
#include "game/game_utils.hpp"
#include "util/fixed_vector.hpp"

#include <algorithm>
#include <array>
#include <bit>
#include <cassert>
#include <functional>
#include <optional>
#include <span>
#include <utility>

EvaluatedHand getFiveCardHandStrength(CardSet hand) {
    assert(getSetSize(hand) == 5);

    // (count, value) pairs, sorted so the most frequent and then highest values come first
    std::array<std::pair<int, Value>, 13> valueFrequencies;
    for (int i = 0; i < 13; ++i) {
        valueFrequencies[i] = { 0, static_cast<Value>(i + static_cast<int>(Value::Two)) };
    }

    CardSet temp = hand;
    for (int i = 0; i < 5; ++i) {
        int valueIndex = static_cast<int>(getCardValue(popLowestCardFromSet(temp))) - static_cast<int>(Value::Two);
        ++valueFrequencies[valueIndex].first;
    }
    assert(temp == 0);
    std::sort(valueFrequencies.begin(), valueFrequencies.end(), std::greater<std::pair<int, Value>>());

    if (valueFrequencies[0].first == 4) {
        return {
            .category = HandCategory::FourOfAKind,
            .tieBreak = { valueFrequencies[0].second, valueFrequencies[1].second }
        };
    }
    if (valueFrequencies[0].first == 3 && valueFrequencies[1].first == 2) {
        return {
            .category = HandCategory::FullHouse,
            .tieBreak = { valueFrequencies[0].second, valueFrequencies[1].second }
        };
    }
    if (valueFrequencies[0].first == 3) {
        return {
            .category = HandCategory::ThreeOfAKind,
            .tieBreak = { valueFrequencies[0].second, valueFrequencies[1].second, valueFrequencies[2].second }
        };
    }
    if (valueFrequencies[0].first == 2 && valueFrequencies[1].first == 2) {
        return {
            .category = HandCategory::TwoPair,
            .tieBreak = { valueFrequencies[0].second, valueFrequencies[1].second, valueFrequencies[2].second }
        };
    }
    if (valueFrequencies[0].first == 2) {
        return {
            .category = HandCategory::Pair,
            .tieBreak = { valueFrequencies[0].second, valueFrequencies[1].second, valueFrequencies[2].second, valueFrequencies[3].second }
        };
    }

    // Five distinct values, already in descending order
    std::array<Value, 5> sortedCardValues;
    for (int i = 0; i < 5; ++i) {
        sortedCardValues[i] = valueFrequencies[i].second;
    }

    bool isRegularStraight = (static_cast<int>(sortedCardValues[0]) - static_cast<int>(sortedCardValues[4]) == 4);
    bool isWheelStraight = (sortedCardValues[0] == Value::Ace) && (sortedCardValues[1] == Value::Five);

    // Cards of one suit sit four bits apart
    static constexpr CardSet SingleSuitMask = 0x1'1111'1111'1111;
    bool isFlush = false;
    for (int i = 0; i < 4; ++i) {
        isFlush |= (getSetSize(hand & (SingleSuitMask << i)) == 5);
    }

    // The wheel plays as a five-high straight
    Value straightHighCard = isWheelStraight ? Value::Five : sortedCardValues[0];

    if (isRegularStraight && isFlush && sortedCardValues[0] == Value::Ace) {
        return { .category = HandCategory::RoyalFlush, .tieBreak = { Value::Ace } };
    }
    if ((isRegularStraight || isWheelStraight) && isFlush) {
        return { .category = HandCategory::StraightFlush, .tieBreak = { straightHighCard } };
    }

    FixedVector<Value, 5> allValues = { sortedCardValues[0], sortedCardValues[1], sortedCardValues[2], sortedCardValues[3], sortedCardValues[4] };
    if (isFlush) {
        return { .category = HandCategory::Flush, .tieBreak = allValues };
    }
    if (isRegularStraight || isWheelStraight) {
        return { .category = HandCategory::Straight, .tieBreak = { straightHighCard } };
    }
    return { .category = HandCategory::HighCard, .tieBreak = allValues };
}

EngineResult<EvaluatedHand> evaluateHand(CardSet cards) {
    int numCards = getSetSize(cards);
    if (numCards < holdem::MinNumEvaluatedCards) {
        return EngineError{ ErrorKind::InsufficientCards, "At least 5 cards are needed to evaluate a hand." };
    }
    if (numCards > holdem::MaxNumEvaluatedCards) {
        return EngineError{ ErrorKind::InvalidCard, "At most 7 cards can be evaluated as one hand." };
    }

    std::array<CardID, holdem::MaxNumEvaluatedCards> cardArray;
    CardSet temp = cards;
    for (int i = 0; i < numCards; ++i) {
        cardArray[i] = popLowestCardFromSet(temp);
    }
    assert(temp == 0);

    // Try every five card subset, at most (7 choose 5) = 21 of them
    std::optional<EvaluatedHand> bestHand;
    for (unsigned subset = 0; subset < (1u << numCards); ++subset) {
        if (std::popcount(subset) != 5) continue;

        CardSet fiveCardHand = 0;
        for (int i = 0; i < numCards; ++i) {
            if ((subset >> i) & 1) {
                fiveCardHand |= cardIDToSet(cardArray[i]);
            }
        }

        EvaluatedHand hand = getFiveCardHandStrength(fiveCardHand);
        if (!bestHand || hand > *bestHand) {
            bestHand = hand;
        }
    }

    assert(bestHand);
    return *bestHand;
}

EngineResult<EvaluatedHand> evaluateHand(std::span<const CardID> cards) {
    Result<CardSet> cardSetResult = buildCardSet(cards);
    if (cardSetResult.isError()) {
        return EngineError{ ErrorKind::InvalidCard, cardSetResult.getError() };
    }
    return evaluateHand(cardSetResult.getValue());
}
