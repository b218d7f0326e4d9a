#include "game/holdem/game_engine.hpp"

#include "game/game_types.hpp"
#include "game/game_utils.hpp"
#include "game/holdem/action.hpp"
#include "game/holdem/betting_round.hpp"
#include "game/holdem/deck.hpp"
#include "game/holdem/player.hpp"
#include "game/holdem/pot_manager.hpp"

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <limits>
#include <optional>
#include <random>
#include <span>
#include <string>
#include <utility>
#include <variant>
#include <vector>

GameEngine::Settings getDefaultSettings() {
    return {
        .playerNames = { "Alice", "Bob" },
        .startingChips = holdem::DefaultStartingChips,
        .startingStacks = {},
        .smallBlind = holdem::DefaultSmallBlind,
        .bigBlind = holdem::DefaultBigBlind,
        .seed = std::nullopt
    };
}

GameEngine::GameEngine(const Settings& settings) :
    m_settings{ settings },
    m_players{},
    m_rng{ settings.seed ? *settings.seed : std::random_device{}() },
    m_deck{},
    m_communityCards{},
    m_bettingRound{ std::nullopt },
    m_potManager{},
    m_phase{ HandPhase::WaitingToStart },
    m_dealer{ 0 },
    m_handNumber{ 0 },
    m_lastHandResult{ std::nullopt },
    m_totalChips{ 0 } {
    assert(static_cast<int>(settings.playerNames.size()) >= holdem::MinSeats);
    assert(static_cast<int>(settings.playerNames.size()) <= holdem::MaxSeats);
    assert(settings.startingStacks.empty() || settings.startingStacks.size() == settings.playerNames.size());
    assert(settings.startingChips > 0);
    assert(settings.smallBlind > 0 && settings.smallBlind <= settings.bigBlind);

    for (std::size_t seat = 0; seat < settings.playerNames.size(); ++seat) {
        int chips = settings.startingStacks.empty() ? settings.startingChips : settings.startingStacks[seat];
        assert(chips >= 0);
        m_players.pushBack(Player{ settings.playerNames[seat], chips });
        assert(chips <= std::numeric_limits<int>::max() - m_totalChips);
        m_totalChips += chips;
    }
}

Status GameEngine::startHand() {
    Deck deck;
    deck.shuffle(m_rng);
    return startHand(std::move(deck));
}

Status GameEngine::startHand(Deck deck) {
    if (isHandInProgress()) {
        return EngineError{ ErrorKind::InvalidAction, "A hand is already in progress." };
    }

    int numDealtIn = static_cast<int>(std::count_if(m_players.begin(), m_players.end(), [](const Player& player) {
        return player.getChips() > 0 && !player.wantsToSitOut();
    }));
    if (numDealtIn < holdem::MinSeats) {
        return EngineError{
            ErrorKind::NotEnoughPlayers,
            "At least 2 players with chips are needed to deal a hand, only " + std::to_string(numDealtIn) + " can play."
        };
    }

    int numCardsNeeded = numDealtIn * holdem::NumHoleCards + holdem::NumBurnCards + holdem::MaxNumCommunityCards;
    if (deck.getRemainingCount() < numCardsNeeded) {
        return EngineError{
            ErrorKind::InsufficientCards,
            "Dealing this hand needs " + std::to_string(numCardsNeeded) + " cards, the deck only has " + std::to_string(deck.getRemainingCount()) + "."
        };
    }

    for (Player& player : m_players) {
        player.resetForNewHand();
    }
    m_deck = std::move(deck);
    m_communityCards.clear();
    m_potManager.reset();
    ++m_handNumber;

    // The button moves one seat per hand and skips seats that are not dealt in
    int numSeats = getNumSeats();
    if (m_handNumber > 1) {
        m_dealer = (m_dealer + 1) % numSeats;
    }
    while (!m_players[m_dealer].isInHand()) {
        m_dealer = (m_dealer + 1) % numSeats;
    }

    // Heads-up the dealer posts the small blind
    SeatID smallBlindSeat = (numDealtIn == 2) ? m_dealer : getNextSeatInHand(m_dealer);
    SeatID bigBlindSeat = getNextSeatInHand(smallBlindSeat);
    postBlind(smallBlindSeat, m_settings.smallBlind);
    postBlind(bigBlindSeat, m_settings.bigBlind);

    dealHoleCards();

    m_phase = HandPhase::Preflop;
    m_bettingRound.emplace(Street::Preflop, m_players, bigBlindSeat, m_settings.bigBlind, m_settings.bigBlind);

    // The blinds alone can leave nobody able to bet
    advanceHand();
    assert(getTotalChips() == m_totalChips);
    return Success{};
}

EngineResult<GameEngine::RoundOutcome> GameEngine::applyAction(SeatID seat, const Action& action) {
    if (!isHandInProgress()) {
        return EngineError{ ErrorKind::InvalidAction, "No hand is in progress." };
    }
    if (seat < 0 || seat >= getNumSeats()) {
        return EngineError{ ErrorKind::InvalidAction, "There is no seat " + std::to_string(seat) + " at this table." };
    }

    assert(m_bettingRound);
    EngineResult<AppliedAction> applyResult = m_bettingRound->applyAction(m_players, seat, action);
    if (applyResult.isError()) {
        return applyResult.getError();
    }

    const AppliedAction& applied = applyResult.getValue();
    m_potManager.addContribution(seat, applied.amountCommitted);
    if (std::holds_alternative<FoldAction>(applied.action)) {
        m_potManager.markFolded(seat);
    }

    RoundState roundState = m_bettingRound->getState();
    advanceHand();
    assert(getTotalChips() == m_totalChips);

    return RoundOutcome{
        .action = applied,
        .description = describeAppliedAction(m_players[seat].getName(), applied),
        .roundState = roundState,
        .phase = m_phase,
        .seatToAct = getSeatToAct(),
        .handComplete = (m_phase == HandPhase::HandComplete)
    };
}

LegalActions GameEngine::getLegalActions(SeatID seat) const {
    if (!m_bettingRound || seat < 0 || seat >= getNumSeats()) {
        return LegalActions{};
    }
    return m_bettingRound->getLegalActions(m_players, seat, m_potManager.getTotal());
}

GameEngine::TableSnapshot GameEngine::getSnapshot(std::optional<SeatID> viewer) const {
    bool handInProgress = isHandInProgress();
    bool showdownFinished = (m_phase == HandPhase::HandComplete) && m_lastHandResult && m_lastHandResult->wentToShowdown;

    TableSnapshot snapshot{
        .handNumber = m_handNumber,
        .phase = m_phase,
        .street = m_bettingRound ? std::optional<Street>{ m_bettingRound->getStreet() } : std::nullopt,
        .communityCards = m_communityCards,
        .seats = {},
        .potTotals = {},
        .totalPot = handInProgress ? m_potManager.getTotal() : 0,
        .seatToAct = getSeatToAct(),
        .dealer = m_dealer,
        .betToCall = m_bettingRound ? m_bettingRound->getBetToCall() : 0,
        .minRaise = m_bettingRound ? m_bettingRound->getMinRaise() : 0
    };

    if (handInProgress) {
        for (const PotLayer& layer : m_potManager.buildLayers()) {
            snapshot.potTotals.push_back(layer.amount);
        }
    }

    for (SeatID seat = 0; seat < getNumSeats(); ++seat) {
        const Player& player = m_players[seat];

        bool isVisible = (viewer == seat) || (showdownFinished && player.isInHand());
        snapshot.seats.push_back({
            .seat = seat,
            .name = player.getName(),
            .chips = player.getChips(),
            .streetContribution = player.getStreetContribution(),
            .handContribution = player.getHandContribution(),
            .status = player.getStatus(),
            .holeCards = isVisible ? player.getHoleCards() : std::nullopt,
            .isDealer = (seat == m_dealer) && (m_handNumber > 0)
        });
    }

    return snapshot;
}

const std::optional<HandResult>& GameEngine::getLastHandResult() const {
    return m_lastHandResult;
}

Status GameEngine::setSittingOut(SeatID seat, bool sittingOut) {
    if (seat < 0 || seat >= getNumSeats()) {
        return EngineError{ ErrorKind::InvalidAction, "There is no seat " + std::to_string(seat) + " at this table." };
    }
    m_players[seat].setSittingOut(sittingOut);
    return Success{};
}

const GameEngine::Settings& GameEngine::getSettings() const {
    return m_settings;
}

int GameEngine::getNumSeats() const {
    return static_cast<int>(m_players.size());
}

const Player& GameEngine::getPlayer(SeatID seat) const {
    assert(seat >= 0 && seat < getNumSeats());
    return m_players[seat];
}

HandPhase GameEngine::getPhase() const {
    return m_phase;
}

std::optional<SeatID> GameEngine::getSeatToAct() const {
    return m_bettingRound ? m_bettingRound->getSeatToAct() : std::nullopt;
}

SeatID GameEngine::getDealer() const {
    return m_dealer;
}

int GameEngine::getHandNumber() const {
    return m_handNumber;
}

int GameEngine::getTotalChips() const {
    int total = 0;
    for (const Player& player : m_players) {
        total += player.getChips();
    }
    if (isHandInProgress()) {
        total += m_potManager.getTotal();
    }
    return total;
}

bool GameEngine::isHandInProgress() const {
    return m_phase != HandPhase::WaitingToStart && m_phase != HandPhase::HandComplete;
}

SeatID GameEngine::getNextSeatInHand(SeatID seat) const {
    int numSeats = getNumSeats();
    for (int offset = 1; offset <= numSeats; ++offset) {
        SeatID nextSeat = (seat + offset) % numSeats;
        if (m_players[nextSeat].isInHand()) {
            return nextSeat;
        }
    }
    assert(false);
    return seat;
}

std::vector<CardID> GameEngine::drawCards(int count) {
    // startHand checked that the deck holds enough cards for the whole hand
    EngineResult<std::vector<CardID>> drawResult = m_deck.draw(count);
    assert(drawResult.isValue());
    return drawResult.getValue();
}

void GameEngine::postBlind(SeatID seat, int blind) {
    Player& player = m_players[seat];
    int amount = std::min(blind, player.getChips());

    Status commitResult = player.commit(amount);
    assert(commitResult.isValue());
    static_cast<void>(commitResult);

    m_potManager.addContribution(seat, amount);
}

void GameEngine::dealHoleCards() {
    // One card at a time to each player, starting left of the dealer
    SeatArray<HoleCards> holeCards{};
    for (int cardIndex = 0; cardIndex < holdem::NumHoleCards; ++cardIndex) {
        SeatID seat = m_dealer;
        do {
            seat = getNextSeatInHand(seat);
            holeCards[seat][cardIndex] = drawCards(1)[0];
        } while (seat != m_dealer);
    }

    for (SeatID seat = 0; seat < getNumSeats(); ++seat) {
        if (m_players[seat].isInHand()) {
            m_players[seat].dealHoleCards(holeCards[seat]);
        }
    }
}

void GameEngine::startStreet(Street street) {
    assert(street != Street::Preflop);

    for (Player& player : m_players) {
        player.resetStreetContribution();
    }

    drawCards(1);
    int numCards = (street == Street::Flop) ? 3 : 1;
    for (CardID card : drawCards(numCards)) {
        m_communityCards.pushBack(card);
    }

    m_phase = getPhaseForStreet(street);
    m_bettingRound.emplace(street, m_players, m_dealer, 0, m_settings.bigBlind);
}

void GameEngine::advanceHand() {
    assert(m_bettingRound);

    while (m_bettingRound->getState() == RoundState::Complete) {
        if (countPlayersInHand(m_players) <= 1) {
            auto winner = std::find_if(m_players.begin(), m_players.end(), [](const Player& player) {
                return player.isInHand();
            });
            assert(winner != m_players.end());
            finishHand(m_potManager.awardUncontested(static_cast<SeatID>(winner - m_players.begin())));
            return;
        }

        if (m_bettingRound->getStreet() == Street::River) {
            Result<CardSet> boardResult = buildCardSet(std::span<const CardID>{ m_communityCards.data(), m_communityCards.size() });
            assert(boardResult.isValue());
            finishHand(m_potManager.resolveShowdown(m_players, boardResult.getValue(), m_dealer));
            return;
        }

        // Also runs out the board when fewer than two players can still bet
        startStreet(nextStreet(m_bettingRound->getStreet()));
    }
}

void GameEngine::finishHand(HandResult result) {
    result.handNumber = m_handNumber;
    for (SeatID seat = 0; seat < getNumSeats(); ++seat) {
        m_players[seat].collect(result.payouts[seat]);
    }

    m_bettingRound.reset();
    m_phase = HandPhase::HandComplete;
    m_lastHandResult = std::move(result);
}
