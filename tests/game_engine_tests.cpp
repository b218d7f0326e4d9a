#include <gtest/gtest.h>

#include "game/game_types.hpp"
#include "game/game_utils.hpp"
#include "game/holdem/action.hpp"
#include "game/holdem/deck.hpp"
#include "game/holdem/game_engine.hpp"

#include <cstddef>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace {
using HoleCardNames = std::pair<std::string, std::string>;

GameEngine::Settings makeSettings(const std::vector<std::string>& playerNames, const std::vector<int>& startingStacks = {}) {
    GameEngine::Settings settings = getDefaultSettings();
    settings.playerNames = playerNames;
    settings.startingStacks = startingStacks;
    settings.seed = 7;
    return settings;
}

// Orders the cards the way the engine deals them: hole cards one at a time
// from the seat left of the dealer, then a burn card before each board card group
Deck buildStackedDeck(const std::vector<HoleCardNames>& holeCards, SeatID dealer, const std::vector<std::string>& board) {
    int numSeats = static_cast<int>(holeCards.size());

    std::vector<CardID> cards;
    for (int cardIndex = 0; cardIndex < 2; ++cardIndex) {
        for (int i = 0; i < numSeats; ++i) {
            const HoleCardNames& seatCards = holeCards[(dealer + 1 + i) % numSeats];
            cards.push_back(getCardIDFromName(cardIndex == 0 ? seatCards.first : seatCards.second).getValue());
        }
    }

    std::vector<CardID> boardCards = getCardIDsFromNames(board).getValue();
    CardSet usedCards = buildCardSet(cards).getValue() | buildCardSet(boardCards).getValue();

    std::vector<CardID> burnCards;
    for (CardID card = 0; card < 52 && burnCards.size() < 3; ++card) {
        if (!setContainsCard(usedCards, card)) {
            burnCards.push_back(card);
        }
    }

    cards.push_back(burnCards[0]);
    cards.insert(cards.end(), boardCards.begin(), boardCards.begin() + 3);
    cards.push_back(burnCards[1]);
    cards.push_back(boardCards[3]);
    cards.push_back(burnCards[2]);
    cards.push_back(boardCards[4]);

    return Deck::buildStacked(cards).getValue();
}

GameEngine::RoundOutcome applyOrFail(GameEngine& engine, SeatID seat, const Action& action) {
    EngineResult<GameEngine::RoundOutcome> outcomeResult = engine.applyAction(seat, action);
    EXPECT_TRUE(outcomeResult.isValue()) << (outcomeResult.isError() ? outcomeResult.getError().message : "");
    return outcomeResult.getValue();
}

int getChipsOnTable(const GameEngine& engine) {
    GameEngine::TableSnapshot snapshot = engine.getSnapshot(std::nullopt);
    int total = snapshot.totalPot;
    for (const GameEngine::SeatSnapshot& seat : snapshot.seats) {
        total += seat.chips;
    }
    return total;
}

class HeadsUpShowdownTest : public ::testing::Test {
protected:
    void SetUp() override {
        Deck deck = buildStackedDeck({ { "As", "Ad" }, { "Ks", "Kd" } }, 0, { "2c", "7h", "9d", "Jc", "3s" });
        ASSERT_TRUE(engine.startHand(deck).isValue());
    }

    GameEngine engine{ makeSettings({ "Alice", "Bob" }) };
};
} // namespace

TEST(GameEngineTest, HeadsUpDealerPostsSmallBlindAndActsFirst) {
    GameEngine engine(makeSettings({ "Alice", "Bob" }));
    ASSERT_TRUE(engine.startHand().isValue());

    EXPECT_EQ(engine.getHandNumber(), 1);
    EXPECT_EQ(engine.getPhase(), HandPhase::Preflop);
    EXPECT_EQ(engine.getDealer(), 0);
    EXPECT_EQ(engine.getSeatToAct(), 0);
    EXPECT_EQ(engine.getPlayer(0).getStreetContribution(), 10);
    EXPECT_EQ(engine.getPlayer(1).getStreetContribution(), 20);

    LegalActions legal = engine.getLegalActions(0);
    EXPECT_TRUE(legal.canCall);
    EXPECT_EQ(legal.callAmount, 10);
    EXPECT_EQ(legal.minRaise, 20);
}

TEST(GameEngineTest, ThreeHandedBlindsFollowTheDealer) {
    GameEngine engine(makeSettings({ "Alice", "Bob", "Carol" }));
    ASSERT_TRUE(engine.startHand().isValue());

    EXPECT_EQ(engine.getPlayer(0).getStreetContribution(), 0);
    EXPECT_EQ(engine.getPlayer(1).getStreetContribution(), 10);
    EXPECT_EQ(engine.getPlayer(2).getStreetContribution(), 20);
    EXPECT_EQ(engine.getSeatToAct(), 0);
}

TEST(GameEngineTest, HoleCardsAreOnlyVisibleToTheirOwner) {
    GameEngine engine(makeSettings({ "Alice", "Bob", "Carol" }));
    ASSERT_TRUE(engine.startHand().isValue());

    GameEngine::TableSnapshot snapshot = engine.getSnapshot(1);
    ASSERT_EQ(snapshot.seats.size(), 3u);
    EXPECT_FALSE(snapshot.seats[0].holeCards);
    EXPECT_TRUE(snapshot.seats[1].holeCards);
    EXPECT_FALSE(snapshot.seats[2].holeCards);

    GameEngine::TableSnapshot publicSnapshot = engine.getSnapshot(std::nullopt);
    for (const GameEngine::SeatSnapshot& seat : publicSnapshot.seats) {
        EXPECT_FALSE(seat.holeCards);
    }
    EXPECT_EQ(publicSnapshot.totalPot, 30);
    EXPECT_EQ(publicSnapshot.betToCall, 20);
}

TEST(GameEngineTest, ErrorWhenHandAlreadyRunning) {
    GameEngine engine(makeSettings({ "Alice", "Bob" }));
    ASSERT_TRUE(engine.startHand().isValue());

    Status startResult = engine.startHand();
    ASSERT_TRUE(startResult.isError());
    EXPECT_EQ(startResult.getError().kind, ErrorKind::InvalidAction);
}

TEST(GameEngineTest, ErrorWhenNotEnoughPlayers) {
    GameEngine engine(makeSettings({ "Alice", "Bob" }));
    ASSERT_TRUE(engine.setSittingOut(1, true).isValue());

    Status startResult = engine.startHand();
    ASSERT_TRUE(startResult.isError());
    EXPECT_EQ(startResult.getError().kind, ErrorKind::NotEnoughPlayers);
    EXPECT_EQ(engine.getPhase(), HandPhase::WaitingToStart);
}

TEST(GameEngineTest, ErrorWhenStackedDeckIsTooShort) {
    GameEngine engine(makeSettings({ "Alice", "Bob" }));
    Deck deck = Deck::buildStacked(getCardIDsFromNames({ "As", "Ks", "Qs", "Js", "Ts" }).getValue()).getValue();

    Status startResult = engine.startHand(deck);
    ASSERT_TRUE(startResult.isError());
    EXPECT_EQ(startResult.getError().kind, ErrorKind::InsufficientCards);
    EXPECT_EQ(engine.getHandNumber(), 0);
}

TEST(GameEngineTest, ErrorFromInvalidSeat) {
    GameEngine engine(makeSettings({ "Alice", "Bob" }));
    EXPECT_TRUE(engine.setSittingOut(5, true).isError());

    ASSERT_TRUE(engine.startHand().isValue());
    EngineResult<GameEngine::RoundOutcome> outcomeResult = engine.applyAction(7, FoldAction{});
    ASSERT_TRUE(outcomeResult.isError());
    EXPECT_EQ(outcomeResult.getError().kind, ErrorKind::InvalidAction);
}

TEST(GameEngineTest, OutOfTurnActionIsRejected) {
    GameEngine engine(makeSettings({ "Alice", "Bob" }));
    ASSERT_TRUE(engine.startHand().isValue());

    EngineResult<GameEngine::RoundOutcome> outcomeResult = engine.applyAction(1, CheckAction{});
    ASSERT_TRUE(outcomeResult.isError());
    EXPECT_EQ(outcomeResult.getError().kind, ErrorKind::OutOfTurn);
}

TEST(GameEngineTest, FoldEndsHandImmediately) {
    GameEngine engine(makeSettings({ "Alice", "Bob" }));
    ASSERT_TRUE(engine.startHand().isValue());

    GameEngine::RoundOutcome outcome = applyOrFail(engine, 0, FoldAction{});
    EXPECT_EQ(outcome.description, "Alice folded");
    EXPECT_TRUE(outcome.handComplete);
    EXPECT_EQ(outcome.phase, HandPhase::HandComplete);
    EXPECT_FALSE(outcome.seatToAct);

    EXPECT_EQ(engine.getPlayer(0).getChips(), 9990);
    EXPECT_EQ(engine.getPlayer(1).getChips(), 10010);

    const std::optional<HandResult>& result = engine.getLastHandResult();
    ASSERT_TRUE(result);
    EXPECT_EQ(result->handNumber, 1);
    EXPECT_FALSE(result->wentToShowdown);
    EXPECT_EQ(result->payouts[1], 30);

    // Nothing is revealed when nobody had to show
    for (const GameEngine::SeatSnapshot& seat : engine.getSnapshot(std::nullopt).seats) {
        EXPECT_FALSE(seat.holeCards);
    }
}

TEST(GameEngineTest, ActionAfterHandCompleteFails) {
    GameEngine engine(makeSettings({ "Alice", "Bob" }));
    ASSERT_TRUE(engine.startHand().isValue());
    applyOrFail(engine, 0, FoldAction{});

    EngineResult<GameEngine::RoundOutcome> outcomeResult = engine.applyAction(1, CheckAction{});
    ASSERT_TRUE(outcomeResult.isError());
    EXPECT_EQ(outcomeResult.getError().kind, ErrorKind::InvalidAction);
    EXPECT_FALSE(engine.getLegalActions(1).canFold);
}

TEST(GameEngineTest, DealerMovesEachHand) {
    GameEngine engine(makeSettings({ "Alice", "Bob", "Carol" }));
    for (int hand = 0; hand < 4; ++hand) {
        ASSERT_TRUE(engine.startHand().isValue());
        EXPECT_EQ(engine.getDealer(), hand % 3);

        // Everyone folds to the big blind
        while (engine.getPhase() != HandPhase::HandComplete) {
            applyOrFail(engine, *engine.getSeatToAct(), FoldAction{});
        }
    }
}

TEST(GameEngineTest, RaiseIsDescribedByTotalBet) {
    GameEngine engine(makeSettings({ "Alice", "Bob" }));
    ASSERT_TRUE(engine.startHand().isValue());

    GameEngine::RoundOutcome raiseOutcome = applyOrFail(engine, 0, RaiseAction{ 40 });
    EXPECT_EQ(raiseOutcome.description, "Alice raised to 60");
    EXPECT_EQ(raiseOutcome.seatToAct, 1);

    GameEngine::RoundOutcome callOutcome = applyOrFail(engine, 1, CallAction{});
    EXPECT_EQ(callOutcome.description, "Bob called 40");
    EXPECT_EQ(callOutcome.roundState, RoundState::Complete);
    EXPECT_EQ(callOutcome.phase, HandPhase::Flop);
}

TEST_F(HeadsUpShowdownTest, CheckedDownHandGoesToShowdown) {
    applyOrFail(engine, 0, CallAction{});
    GameEngine::RoundOutcome outcome = applyOrFail(engine, 1, CheckAction{});
    EXPECT_EQ(outcome.phase, HandPhase::Flop);

    // The big blind acts first after the flop
    EXPECT_EQ(outcome.seatToAct, 1);

    GameEngine::TableSnapshot flopSnapshot = engine.getSnapshot(std::nullopt);
    EXPECT_EQ(flopSnapshot.street, Street::Flop);
    EXPECT_EQ(flopSnapshot.communityCards, (CommunityCards{
        getCardIDFromName("2c").getValue(),
        getCardIDFromName("7h").getValue(),
        getCardIDFromName("9d").getValue()
    }));
    EXPECT_EQ(flopSnapshot.betToCall, 0);
    EXPECT_EQ(flopSnapshot.potTotals, (std::vector<int>{ 40 }));

    for (HandPhase phase : { HandPhase::Flop, HandPhase::Turn, HandPhase::River }) {
        EXPECT_EQ(engine.getPhase(), phase);
        applyOrFail(engine, 1, CheckAction{});
        applyOrFail(engine, 0, CheckAction{});
    }

    EXPECT_EQ(engine.getPhase(), HandPhase::HandComplete);
    EXPECT_EQ(engine.getPlayer(0).getChips(), 10020);
    EXPECT_EQ(engine.getPlayer(1).getChips(), 9980);

    const std::optional<HandResult>& result = engine.getLastHandResult();
    ASSERT_TRUE(result);
    EXPECT_TRUE(result->wentToShowdown);
    ASSERT_EQ(result->awards.size(), 1u);
    EXPECT_EQ(result->awards[0].winners, (SeatList{ 0 }));
    ASSERT_TRUE(result->awards[0].winningHand);
    EXPECT_EQ(result->awards[0].winningHand->category, HandCategory::Pair);

    GameEngine::TableSnapshot finalSnapshot = engine.getSnapshot(std::nullopt);
    EXPECT_EQ(finalSnapshot.communityCards.size(), 5u);
    EXPECT_TRUE(finalSnapshot.seats[0].holeCards);
    EXPECT_TRUE(finalSnapshot.seats[1].holeCards);
    EXPECT_EQ(finalSnapshot.totalPot, 0);
}

TEST_F(HeadsUpShowdownTest, AllInIsRunOutAndLoserSitsOut) {
    applyOrFail(engine, 0, AllInAction{});
    GameEngine::RoundOutcome outcome = applyOrFail(engine, 1, CallAction{});

    EXPECT_TRUE(outcome.handComplete);
    EXPECT_EQ(engine.getSnapshot(std::nullopt).communityCards.size(), 5u);
    EXPECT_EQ(engine.getPlayer(0).getChips(), 20000);
    EXPECT_EQ(engine.getPlayer(1).getChips(), 0);

    Status startResult = engine.startHand();
    ASSERT_TRUE(startResult.isError());
    EXPECT_EQ(startResult.getError().kind, ErrorKind::NotEnoughPlayers);
}

TEST(GameEngineTest, SidePotsFromThreeAllIns) {
    // Deep is dealer and first to act, Short posts the small blind and Middle the big blind
    GameEngine engine(makeSettings({ "Deep", "Short", "Middle" }, { 1000, 100, 300 }));
    Deck deck = buildStackedDeck({ { "Qs", "Qd" }, { "As", "Ad" }, { "Ks", "Kd" } }, 0, { "2c", "7h", "9d", "Jc", "3s" });
    ASSERT_TRUE(engine.startHand(deck).isValue());
    ASSERT_EQ(engine.getSeatToAct(), 0);

    applyOrFail(engine, 0, AllInAction{});
    applyOrFail(engine, 1, AllInAction{});
    GameEngine::RoundOutcome outcome = applyOrFail(engine, 2, AllInAction{});
    EXPECT_TRUE(outcome.handComplete);

    const std::optional<HandResult>& result = engine.getLastHandResult();
    ASSERT_TRUE(result);
    ASSERT_EQ(result->awards.size(), 3u);
    EXPECT_EQ(result->awards[0].amount, 300);
    EXPECT_EQ(result->awards[1].amount, 400);
    EXPECT_EQ(result->awards[2].amount, 700);
    EXPECT_EQ(result->awards[0].winners, (SeatList{ 1 }));
    EXPECT_EQ(result->awards[1].winners, (SeatList{ 2 }));
    EXPECT_EQ(result->awards[2].winners, (SeatList{ 0 }));

    EXPECT_EQ(engine.getPlayer(0).getChips(), 700);
    EXPECT_EQ(engine.getPlayer(1).getChips(), 300);
    EXPECT_EQ(engine.getPlayer(2).getChips(), 400);
    EXPECT_EQ(engine.getTotalChips(), 1400);
}

TEST(GameEngineTest, BlindsCanPutEveryoneAllIn) {
    GameEngine engine(makeSettings({ "Alice", "Bob" }, { 10, 20 }));
    ASSERT_TRUE(engine.startHand().isValue());

    EXPECT_EQ(engine.getPhase(), HandPhase::HandComplete);
    EXPECT_FALSE(engine.getSeatToAct());
    EXPECT_EQ(engine.getTotalChips(), 30);
    ASSERT_TRUE(engine.getLastHandResult());
    EXPECT_TRUE(engine.getLastHandResult()->wentToShowdown);
}

TEST(GameEngineTest, SittingOutPlayerIsNotDealtIn) {
    GameEngine engine(makeSettings({ "Alice", "Bob", "Carol" }));
    ASSERT_TRUE(engine.setSittingOut(2, true).isValue());
    ASSERT_TRUE(engine.startHand().isValue());

    EXPECT_EQ(engine.getPlayer(2).getStatus(), SeatStatus::SittingOut);
    EXPECT_FALSE(engine.getPlayer(2).getHoleCards());
    EXPECT_EQ(engine.getPlayer(0).getStreetContribution(), 10);
    EXPECT_EQ(engine.getPlayer(1).getStreetContribution(), 20);
    EXPECT_EQ(engine.getSeatToAct(), 0);
}

TEST(GameEngineTest, ChipsAreConservedOverRandomPlay) {
    static constexpr int NumPlayers = 4;
    static constexpr int StartingChips = 1000;

    GameEngine::Settings settings = makeSettings({ "P0", "P1", "P2", "P3" });
    settings.startingChips = StartingChips;
    GameEngine engine(settings);
    std::mt19937 generator(2024);

    for (int hand = 0; hand < 200; ++hand) {
        Status startResult = engine.startHand();
        if (startResult.isError()) {
            EXPECT_EQ(startResult.getError().kind, ErrorKind::NotEnoughPlayers);
            break;
        }

        while (engine.getSeatToAct()) {
            SeatID seat = *engine.getSeatToAct();
            LegalActions legal = engine.getLegalActions(seat);

            std::vector<Action> choices;
            if (legal.canCheck) choices.push_back(CheckAction{});
            if (legal.canCall) choices.push_back(CallAction{});
            if (legal.canFold) choices.push_back(FoldAction{});
            if (legal.canRaise) {
                choices.push_back(RaiseAction{ legal.minRaise });
                choices.push_back(RaiseAction{ legal.maxRaise });
            }
            if (legal.canAllIn) choices.push_back(AllInAction{});
            ASSERT_FALSE(choices.empty());

            std::uniform_int_distribution<std::size_t> pick(0, choices.size() - 1);
            applyOrFail(engine, seat, choices[pick(generator)]);
            ASSERT_EQ(getChipsOnTable(engine), NumPlayers * StartingChips);
        }

        EXPECT_EQ(engine.getPhase(), HandPhase::HandComplete);
        EXPECT_EQ(getChipsOnTable(engine), NumPlayers * StartingChips);
    }
}
