#include <gtest/gtest.h>

#include "game/game_types.hpp"
#include "game/game_utils.hpp"
#include "game/holdem/action.hpp"
#include "game/holdem/game_engine.hpp"
#include "game/holdem/pot_manager.hpp"
#include "io/output.hpp"

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

using json = nlohmann::ordered_json;

TEST(OutputTest, SnapshotBeforeFirstHand) {
    GameEngine engine(getDefaultSettings());
    json j = buildSnapshotJSON(engine.getSnapshot(std::nullopt));

    EXPECT_EQ(j["Hand Number"], 0);
    EXPECT_EQ(j["Phase"], "Waiting");
    EXPECT_TRUE(j["Street"].is_null());
    EXPECT_TRUE(j["Community Cards"].empty());
    EXPECT_TRUE(j["Seat To Act"].is_null());
    ASSERT_EQ(j["Seats"].size(), 2u);
    EXPECT_EQ(j["Seats"][0]["Name"], "Alice");
    EXPECT_EQ(j["Seats"][1]["Chips"], 10000);
}

TEST(OutputTest, SnapshotKeysKeepInsertionOrder) {
    GameEngine engine(getDefaultSettings());
    json j = buildSnapshotJSON(engine.getSnapshot(std::nullopt));
    EXPECT_EQ(j.begin().key(), "Hand Number");
}

TEST(OutputTest, SnapshotOnlyShowsViewerCards) {
    GameEngine::Settings settings = getDefaultSettings();
    settings.seed = 3;
    GameEngine engine(settings);
    ASSERT_TRUE(engine.startHand().isValue());

    json j = buildSnapshotJSON(engine.getSnapshot(0));
    EXPECT_EQ(j["Phase"], "Preflop");
    EXPECT_EQ(j["Street"], "Preflop");
    EXPECT_EQ(j["Seat To Act"], 0);
    EXPECT_EQ(j["Total Pot"], 30);
    EXPECT_EQ(j["Pots"], json::array({ 20, 10 }));
    EXPECT_EQ(j["Seats"][0]["Hole Cards"].size(), 2u);
    EXPECT_TRUE(j["Seats"][1]["Hole Cards"].is_null());
    EXPECT_EQ(j["Seats"][0]["Dealer"], true);
}

TEST(OutputTest, LegalActionsJSON) {
    LegalActions legal{
        .canFold = true,
        .canCheck = false,
        .canCall = true,
        .canRaise = true,
        .canAllIn = true,
        .callAmount = 50,
        .minRaise = 50,
        .maxRaise = 950,
        .potOdds = 0.25f
    };

    json j = buildLegalActionsJSON(legal);
    EXPECT_EQ(j["Actions"], json::array({ "Fold", "Call", "Raise", "All-in" }));
    EXPECT_EQ(j["Call Amount"], 50);
    EXPECT_EQ(j["Min Raise"], 50);
    EXPECT_EQ(j["Max Raise"], 950);
    EXPECT_FLOAT_EQ(j["Pot Odds"].get<float>(), 0.25f);
}

TEST(OutputTest, HandResultJSON) {
    HandResult result;
    result.handNumber = 4;
    result.wentToShowdown = true;
    result.awards.push_back({
        .potIndex = 0,
        .amount = 300,
        .winners = { 1 },
        .winningHand = EvaluatedHand{ .category = HandCategory::Pair, .tieBreak = { Value::Ace, Value::King, Value::Nine, Value::Seven } }
    });
    result.awards.push_back({ .potIndex = 1, .amount = 100, .winners = { 0 }, .winningHand = std::nullopt });
    result.payouts[0] = 100;
    result.payouts[1] = 300;
    result.shownHands[1] = result.awards[0].winningHand;

    json j = buildHandResultJSON(result, { "Alice", "Bob" });
    EXPECT_EQ(j["Hand Number"], 4);
    EXPECT_EQ(j["Showdown"], true);
    ASSERT_EQ(j["Pots"].size(), 2u);
    EXPECT_EQ(j["Pots"][0]["Winners"], json::array({ "Bob" }));
    EXPECT_EQ(j["Pots"][0]["Winning Hand"]["Category"], "Pair");
    EXPECT_EQ(j["Pots"][0]["Winning Hand"]["Tie Break"], json::array({ 14, 13, 9, 7 }));
    EXPECT_TRUE(j["Pots"][1]["Winning Hand"].is_null());
    EXPECT_EQ(j["Payouts"]["Alice"], 100);
    EXPECT_EQ(j["Payouts"]["Bob"], 300);
    EXPECT_TRUE(j["Shown Hands"].contains("Bob"));
    EXPECT_FALSE(j["Shown Hands"].contains("Alice"));
}
