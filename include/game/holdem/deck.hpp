#ifndef DECK_HPP
#define DECK_HPP

#include "game/game_types.hpp"

#include <cstddef>
#include <random>
#include <vector>

class Deck {
public:
    // All 52 cards in canonical order (2c, 2d, 2h, 2s, 3c, ..., As)
    Deck();

    // Deck that deals the given cards front to back
    static EngineResult<Deck> buildStacked(const std::vector<CardID>& cards);

    void shuffle(std::mt19937_64& generator);
    EngineResult<std::vector<CardID>> draw(int count);
    int getRemainingCount() const;

private:
    explicit Deck(const std::vector<CardID>& cards);

    std::vector<CardID> m_cards;
    std::size_t m_nextCard;
};

#endif // DECK_HPP
