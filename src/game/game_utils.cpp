#include "game/game_utils.hpp"

#include "game/game_types.hpp"

#include <array>
#include <bit>
#include <cassert>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace {
const std::string CardValueNames = "23456789TJQKA";
const std::string CardSuitNames = "cdhs";
const std::array<std::string, 4> CardSuitSymbols = { "♣", "♦", "♥", "♠" };

bool endsWith(const std::string& input, const std::string& suffix) {
    return input.size() >= suffix.size() && input.compare(input.size() - suffix.size(), suffix.size(), suffix) == 0;
}

int getValueIndex(Value value) {
    return static_cast<int>(value) - static_cast<int>(Value::Two);
}
} // namespace

Value getCardValue(CardID cardID) {
    assert(cardID < holdem::DeckSize);
    return static_cast<Value>(cardID / 4 + static_cast<int>(Value::Two));
}

Suit getCardSuit(CardID cardID) {
    assert(cardID < holdem::DeckSize);
    return static_cast<Suit>(cardID % 4);
}

CardID getCardID(Value value, Suit suit) {
    return static_cast<CardID>(getValueIndex(value) * 4 + static_cast<int>(suit));
}

bool isRedCard(CardID cardID) {
    Suit suit = getCardSuit(cardID);
    return suit == Suit::Hearts || suit == Suit::Diamonds;
}

std::string getNameFromCardID(CardID cardID) {
    Value cardValue = getCardValue(cardID);
    Suit cardSuit = getCardSuit(cardID);
    return { CardValueNames[getValueIndex(cardValue)], CardSuitNames[static_cast<int>(cardSuit)] };
}

std::string getDisplayNameFromCardID(CardID cardID) {
    Value cardValue = getCardValue(cardID);
    std::string valueName = (cardValue == Value::Ten) ? "10" : std::string{ CardValueNames[getValueIndex(cardValue)] };
    return valueName + CardSuitSymbols[static_cast<int>(getCardSuit(cardID))];
}

Result<CardID> getCardIDFromName(const std::string& cardName) {
    std::string errorString = "Error parsing card: \"" + cardName + "\" is not a valid card.";

    // Suit is either a trailing letter or a trailing suit symbol
    std::string valueName;
    int suitID = -1;
    for (int i = 0; i < 4; ++i) {
        if (endsWith(cardName, CardSuitSymbols[i])) {
            suitID = i;
            valueName = cardName.substr(0, cardName.size() - CardSuitSymbols[i].size());
        }
    }
    if (suitID == -1 && !cardName.empty()) {
        std::size_t suit = CardSuitNames.find(cardName.back());
        if (suit != std::string::npos) {
            suitID = static_cast<int>(suit);
            valueName = cardName.substr(0, cardName.size() - 1);
        }
    }
    if (suitID == -1) {
        return errorString;
    }

    int valueID;
    if (valueName == "10") {
        valueID = getValueIndex(Value::Ten);
    }
    else if (valueName.size() == 1 && CardValueNames.find(valueName[0]) != std::string::npos) {
        valueID = static_cast<int>(CardValueNames.find(valueName[0]));
    }
    else {
        return errorString;
    }

    return static_cast<CardID>(valueID * 4 + suitID);
}

Result<std::vector<CardID>> getCardIDsFromNames(const std::vector<std::string>& cardNames) {
    std::vector<CardID> cards;
    cards.reserve(cardNames.size());
    for (const std::string& cardName : cardNames) {
        Result<CardID> cardIDResult = getCardIDFromName(cardName);
        if (cardIDResult.isError()) {
            return cardIDResult.getError();
        }
        cards.push_back(cardIDResult.getValue());
    }
    return cards;
}

CardSet cardIDToSet(CardID cardID) {
    assert(cardID < holdem::DeckSize);
    return (1ULL << cardID);
}

int getSetSize(CardSet cardSet) {
    return std::popcount(cardSet);
}

bool setContainsCard(CardSet cardSet, CardID cardID) {
    assert(cardID < holdem::DeckSize);
    return (cardSet >> cardID) & 1;
}

CardID getLowestCardInSet(CardSet cardSet) {
    assert(getSetSize(cardSet) > 0);

    CardID lowestCard = static_cast<CardID>(std::countr_zero(cardSet));
    assert(lowestCard < holdem::DeckSize);
    return lowestCard;
}

CardID popLowestCardFromSet(CardSet& cardSet) {
    CardID lowestCard = getLowestCardInSet(cardSet);
    cardSet &= ~cardIDToSet(lowestCard);
    return lowestCard;
}

Result<CardSet> buildCardSet(std::span<const CardID> cards) {
    CardSet cardSet = 0;
    for (CardID cardID : cards) {
        if (cardID >= holdem::DeckSize) {
            return "Error building card set: card id " + std::to_string(cardID) + " is out of range.";
        }
        if (setContainsCard(cardSet, cardID)) {
            return "Error building card set: \"" + getNameFromCardID(cardID) + "\" appears more than once.";
        }
        cardSet |= cardIDToSet(cardID);
    }
    return cardSet;
}

Street nextStreet(Street street) {
    switch (street) {
        case Street::Preflop:
            return Street::Flop;
        case Street::Flop:
            return Street::Turn;
        case Street::Turn:
            return Street::River;
        default:
            assert(false);
            return Street::River;
    }
}

HandPhase getPhaseForStreet(Street street) {
    switch (street) {
        case Street::Preflop:
            return HandPhase::Preflop;
        case Street::Flop:
            return HandPhase::Flop;
        case Street::Turn:
            return HandPhase::Turn;
        case Street::River:
            return HandPhase::River;
    }
    assert(false);
    return HandPhase::HandComplete;
}

std::string getStreetName(Street street) {
    switch (street) {
        case Street::Preflop:
            return "Preflop";
        case Street::Flop:
            return "Flop";
        case Street::Turn:
            return "Turn";
        case Street::River:
            return "River";
    }
    assert(false);
    return "???";
}

std::string getPhaseName(HandPhase phase) {
    switch (phase) {
        case HandPhase::WaitingToStart:
            return "Waiting";
        case HandPhase::Preflop:
            return "Preflop";
        case HandPhase::Flop:
            return "Flop";
        case HandPhase::Turn:
            return "Turn";
        case HandPhase::River:
            return "River";
        case HandPhase::HandComplete:
            return "Complete";
    }
    assert(false);
    return "???";
}

std::string getSeatStatusName(SeatStatus status) {
    switch (status) {
        case SeatStatus::Active:
            return "Active";
        case SeatStatus::Folded:
            return "Folded";
        case SeatStatus::AllIn:
            return "All-in";
        case SeatStatus::SittingOut:
            return "Sitting out";
    }
    assert(false);
    return "???";
}

std::string getHandCategoryName(HandCategory category) {
    switch (category) {
        case HandCategory::HighCard:
            return "High Card";
        case HandCategory::Pair:
            return "Pair";
        case HandCategory::TwoPair:
            return "Two Pair";
        case HandCategory::ThreeOfAKind:
            return "Three of a Kind";
        case HandCategory::Straight:
            return "Straight";
        case HandCategory::Flush:
            return "Flush";
        case HandCategory::FullHouse:
            return "Full House";
        case HandCategory::FourOfAKind:
            return "Four of a Kind";
        case HandCategory::StraightFlush:
            return "Straight Flush";
        case HandCategory::RoyalFlush:
            return "Royal Flush";
    }
    assert(false);
    return "???";
}

std::string getErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InsufficientChips:
            return "InsufficientChips";
        case ErrorKind::InsufficientCards:
            return "InsufficientCards";
        case ErrorKind::InvalidAction:
            return "InvalidAction";
        case ErrorKind::OutOfTurn:
            return "OutOfTurn";
        case ErrorKind::InvalidRaiseAmount:
            return "InvalidRaiseAmount";
        case ErrorKind::InvalidCard:
            return "InvalidCard";
        case ErrorKind::NotEnoughPlayers:
            return "NotEnoughPlayers";
    }
    assert(false);
    return "???";
}
