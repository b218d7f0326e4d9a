#ifndef CONFIG_HPP
#define CONFIG_HPP

namespace holdem {
constexpr int DeckSize = 52;
constexpr int NumHoleCards = 2;
constexpr int MaxNumCommunityCards = 5;
constexpr int MinNumEvaluatedCards = 5;
constexpr int MaxNumEvaluatedCards = NumHoleCards + MaxNumCommunityCards;

constexpr int MinSeats = 2;
constexpr int MaxSeats = 10;

// One burn card before each of the flop, turn and river
constexpr int NumBurnCards = 3;

constexpr int DefaultSmallBlind = 10;
constexpr int DefaultBigBlind = 20;
constexpr int DefaultStartingChips = 10000;
} // namespace holdem

#endif // CONFIG_HPP
