#ifndef GAME_ENGINE_HPP
#define GAME_ENGINE_HPP

#include "game/game_types.hpp"
#include "game/holdem/action.hpp"
#include "game/holdem/betting_round.hpp"
#include "game/holdem/deck.hpp"
#include "game/holdem/player.hpp"
#include "game/holdem/pot_manager.hpp"

#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

class GameEngine {
public:
    struct Settings {
        std::vector<std::string> playerNames;
        int startingChips;

        // Per seat stacks, all seats start with startingChips when empty
        std::vector<int> startingStacks;

        int smallBlind;
        int bigBlind;

        // Seeds the shuffle; a random seed is used when empty
        std::optional<std::uint64_t> seed;

        bool operator==(const Settings&) const = default;
    };

    struct RoundOutcome {
        AppliedAction action;
        std::string description;

        // State of the betting round the action was taken in
        RoundState roundState;

        HandPhase phase;
        std::optional<SeatID> seatToAct;
        bool handComplete;
    };

    struct SeatSnapshot {
        SeatID seat;
        std::string name;
        int chips;
        int streetContribution;
        int handContribution;
        SeatStatus status;
        std::optional<HoleCards> holeCards;
        bool isDealer;
    };

    struct TableSnapshot {
        int handNumber;
        HandPhase phase;
        std::optional<Street> street;
        CommunityCards communityCards;
        std::vector<SeatSnapshot> seats;
        std::vector<int> potTotals;
        int totalPot;
        std::optional<SeatID> seatToAct;
        SeatID dealer;
        int betToCall;
        int minRaise;
    };

    explicit GameEngine(const Settings& settings);

    // Shuffles a fresh deck and deals the next hand
    Status startHand();

    // Deals the next hand from the given deck without shuffling it
    Status startHand(Deck deck);

    EngineResult<RoundOutcome> applyAction(SeatID seat, const Action& action);
    LegalActions getLegalActions(SeatID seat) const;

    // Hole cards are only included for the viewer and for hands shown down
    TableSnapshot getSnapshot(std::optional<SeatID> viewer) const;

    const std::optional<HandResult>& getLastHandResult() const;

    // Takes effect from the next hand
    Status setSittingOut(SeatID seat, bool sittingOut);

    const Settings& getSettings() const;
    int getNumSeats() const;
    const Player& getPlayer(SeatID seat) const;
    HandPhase getPhase() const;
    std::optional<SeatID> getSeatToAct() const;
    SeatID getDealer() const;
    int getHandNumber() const;
    int getTotalChips() const;

private:
    bool isHandInProgress() const;
    SeatID getNextSeatInHand(SeatID seat) const;
    std::vector<CardID> drawCards(int count);
    void postBlind(SeatID seat, int blind);
    void dealHoleCards();
    void startStreet(Street street);
    void advanceHand();
    void finishHand(HandResult result);

    Settings m_settings;
    Seats m_players;
    std::mt19937_64 m_rng;
    Deck m_deck;
    CommunityCards m_communityCards;
    std::optional<BettingRound> m_bettingRound;
    PotManager m_potManager;
    HandPhase m_phase;
    SeatID m_dealer;
    int m_handNumber;
    std::optional<HandResult> m_lastHandResult;
    int m_totalChips;
};

GameEngine::Settings getDefaultSettings();

#endif // GAME_ENGINE_HPP
