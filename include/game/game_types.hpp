#ifndef GAME_TYPES_HPP
#define GAME_TYPES_HPP

#include "game/holdem/config.hpp"
#include "util/fixed_vector.hpp"
#include "util/result.hpp"

#include <array>
#include <cstdint>
#include <string>

using CardID = std::uint8_t;
using CardSet = std::uint64_t;
using SeatID = int;

template <typename T>
using SeatArray = std::array<T, holdem::MaxSeats>;

using HoleCards = std::array<CardID, holdem::NumHoleCards>;
using CommunityCards = FixedVector<CardID, holdem::MaxNumCommunityCards>;
using SeatList = FixedVector<SeatID, holdem::MaxSeats>;

// Underlying values match the rank numbers (11 = jack, 14 = ace)
enum class Value : std::uint8_t {
    Two = 2,
    Three,
    Four,
    Five,
    Six,
    Seven,
    Eight,
    Nine,
    Ten,
    Jack,
    Queen,
    King,
    Ace
};

enum class Suit : std::uint8_t {
    Clubs,
    Diamonds,
    Hearts,
    Spades
};

enum class Street : std::uint8_t {
    Preflop,
    Flop,
    Turn,
    River
};

enum class HandPhase : std::uint8_t {
    WaitingToStart,
    Preflop,
    Flop,
    Turn,
    River,
    HandComplete
};

enum class SeatStatus : std::uint8_t {
    Active,
    Folded,
    AllIn,
    SittingOut
};

enum class HandCategory : std::uint8_t {
    HighCard,
    Pair,
    TwoPair,
    ThreeOfAKind,
    Straight,
    Flush,
    FullHouse,
    FourOfAKind,
    StraightFlush,
    RoyalFlush
};

enum class ErrorKind : std::uint8_t {
    InsufficientChips,
    InsufficientCards,
    InvalidAction,
    OutOfTurn,
    InvalidRaiseAmount,
    InvalidCard,
    NotEnoughPlayers
};

struct EngineError {
    ErrorKind kind;
    std::string message;
};

template <typename T>
using EngineResult = Result<T, EngineError>;

using Status = EngineResult<Success>;

#endif // GAME_TYPES_HPP
