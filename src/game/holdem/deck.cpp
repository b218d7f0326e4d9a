#include "game/holdem/deck.hpp"

#include "game/game_types.hpp"
#include "game/game_utils.hpp"

#include <algorithm>
#include <cassert>
#include <random>
#include <string>
#include <vector>

Deck::Deck() : m_nextCard{ 0 } {
    m_cards.reserve(holdem::DeckSize);
    for (int cardID = 0; cardID < holdem::DeckSize; ++cardID) {
        m_cards.push_back(static_cast<CardID>(cardID));
    }
}

Deck::Deck(const std::vector<CardID>& cards) : m_cards{ cards }, m_nextCard{ 0 } {}

EngineResult<Deck> Deck::buildStacked(const std::vector<CardID>& cards) {
    if (cards.size() > holdem::DeckSize) {
        return EngineError{ ErrorKind::InvalidCard, "Error building deck: a deck holds at most 52 cards." };
    }

    Result<CardSet> cardSetResult = buildCardSet(cards);
    if (cardSetResult.isError()) {
        return EngineError{ ErrorKind::InvalidCard, cardSetResult.getError() };
    }

    return Deck{ cards };
}

void Deck::shuffle(std::mt19937_64& generator) {
    // Only the undealt part of the deck is shuffled
    std::shuffle(m_cards.begin() + m_nextCard, m_cards.end(), generator);
}

EngineResult<std::vector<CardID>> Deck::draw(int count) {
    assert(count >= 0);

    if (count > getRemainingCount()) {
        return EngineError{
            ErrorKind::InsufficientCards,
            "Cannot draw " + std::to_string(count) + " cards, only " + std::to_string(getRemainingCount()) + " remain."
        };
    }

    auto drawBegin = m_cards.begin() + m_nextCard;
    std::vector<CardID> drawnCards(drawBegin, drawBegin + count);
    m_nextCard += count;
    return drawnCards;
}

int Deck::getRemainingCount() const {
    return static_cast<int>(m_cards.size() - m_nextCard);
}
