#include "blackjack/GameSettings.hh"
#include "blackjack/Hand.hh"
#include "blackjack/Player.hh"
#include "blackjack/Shoe.hh"
#include "engine/BlackjackEngine.hh"
#include "FunctionObserver.hh"
#include "MockObserver.hh"
#include "TestUtility.hh"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <array>
#include <chrono>
#include <initializer_list>
#include <memory>
#include <stdexcept>
#include <vector>

using namespace Blackjack;
using Engine::BlackjackEngine;
using Engine::Participant;

using testing::_;
using testing::ElementsAre;
using testing::InSequence;
using testing::NiceMock;
using testing::StrictMock;

using namespace std::chrono_literals;

namespace {

const auto SETTINGS = GameSettings {"Alice", 1, DEFAULT_BANKROLL, 0ms};
constexpr auto BET = Money {500};

// Filler drawn only after the scenario under test is over
constexpr auto FILLER = std::array {
    CardType {Rank::TWO, Suit::CLUBS}, CardType {Rank::TWO, Suit::DIAMONDS},
    CardType {Rank::TWO, Suit::HEARTS}, CardType {Rank::TWO, Suit::SPADES},
};

}

class BlackjackEngineTest : public testing::Test {
protected:

    // The cards are dealt in the given order, followed by the filler cards
    void setCards(const std::initializer_list<CardType> cards)
    {
        auto all_cards = std::vector<CardType>(cards);
        all_cards.insert(all_cards.end(), FILLER.begin(), FILLER.end());
        engine = std::make_unique<BlackjackEngine>(
            SETTINGS, Shoe {1, all_cards.begin(), all_cards.end()});
        engine->subscribeToStateChanged(stateObserver);
    }

    void betAndDeal(const std::initializer_list<CardType> cards)
    {
        setCards(cards);
        ASSERT_TRUE(engine->placeBet(BET));
        ASSERT_TRUE(engine->dealInitialCards());
    }

    const Player& player() const { return engine->getPlayer(); }
    const Hand& playerHand(const std::size_t n) const
    {
        return player().getHand(n);
    }
    const Hand& dealerHand() const { return engine->getDealer().getHand(0); }

    std::shared_ptr<NiceMock<MockObserver<RoundState>>> stateObserver {
        std::make_shared<NiceMock<MockObserver<RoundState>>>()};
    std::unique_ptr<BlackjackEngine> engine;
};

TEST_F(BlackjackEngineTest, testInvalidSettings)
{
    EXPECT_THROW(
        BlackjackEngine(GameSettings("", 6)), std::invalid_argument);
    EXPECT_THROW(
        BlackjackEngine(GameSettings("Alice", 9)), std::invalid_argument);
    EXPECT_THROW(
        BlackjackEngine(GameSettings("Alice", 6, -100)), std::invalid_argument);
}

TEST_F(BlackjackEngineTest, testNewEngine)
{
    const auto new_engine = BlackjackEngine {SETTINGS};
    EXPECT_EQ(RoundState(WaitingForBet {DEFAULT_BANKROLL}), new_engine.getState());
    EXPECT_EQ(SETTINGS, new_engine.getSettings());
    EXPECT_EQ(
        static_cast<std::size_t>(N_CARDS_PER_DECK),
        new_engine.getShoe().getNumberOfAvailableCards());
}

TEST_F(BlackjackEngineTest, testPlaceBet)
{
    setCards({});
    EXPECT_CALL(
        *stateObserver,
        handleNotify(RoundState(WaitingToDeal {BET, DEFAULT_BANKROLL - BET})));
    EXPECT_TRUE(engine->placeBet(BET));
    EXPECT_EQ(
        RoundState(WaitingToDeal {BET, DEFAULT_BANKROLL - BET}),
        engine->getState());
    EXPECT_EQ(BET, playerHand(0).getBet());
}

TEST_F(BlackjackEngineTest, testBetExceedingBankroll)
{
    setCards({});
    EXPECT_CALL(*stateObserver, handleNotify(_)).Times(0);
    EXPECT_FALSE(engine->placeBet(DEFAULT_BANKROLL + 1));
    EXPECT_FALSE(engine->placeBet(-1));
    EXPECT_EQ(RoundState(WaitingForBet {DEFAULT_BANKROLL}), engine->getState());
}

TEST_F(BlackjackEngineTest, testBetWholeBankroll)
{
    setCards({});
    EXPECT_TRUE(engine->placeBet(DEFAULT_BANKROLL));
    EXPECT_EQ(0, player().getBankroll());
}

TEST_F(BlackjackEngineTest, testCommandsInWrongPhase)
{
    setCards({});
    EXPECT_CALL(*stateObserver, handleNotify(_)).Times(0);
    EXPECT_FALSE(engine->dealInitialCards());
    EXPECT_FALSE(engine->submitAction(PlayerAction::HIT, 0));
    EXPECT_FALSE(engine->advanceDealer());
    EXPECT_FALSE(engine->playDealer());
    EXPECT_FALSE(engine->nextRound());
    EXPECT_EQ(RoundPhase::WAITING_FOR_BET, engine->getPhase());
}

TEST_F(BlackjackEngineTest, testDealInitialCards)
{
    setCards({
        card(Rank::TEN), card(Rank::NINE), card(Rank::EIGHT),
        card(Rank::SEVEN)});
    const auto card_observer =
        std::make_shared<StrictMock<MockObserver<BlackjackEngine::CardDealt>>>();
    engine->subscribeToCardDealt(card_observer);
    ASSERT_TRUE(engine->placeBet(BET));
    {
        InSequence sequence;
        EXPECT_CALL(
            *card_observer,
            handleNotify(
                BlackjackEngine::CardDealt {
                    Participant::PLAYER, 0, card(Rank::TEN)}));
        EXPECT_CALL(
            *card_observer,
            handleNotify(
                BlackjackEngine::CardDealt {
                    Participant::DEALER, 0, card(Rank::NINE)}));
        EXPECT_CALL(
            *card_observer,
            handleNotify(
                BlackjackEngine::CardDealt {
                    Participant::PLAYER, 0, card(Rank::EIGHT)}));
        EXPECT_CALL(
            *card_observer,
            handleNotify(
                BlackjackEngine::CardDealt {
                    Participant::DEALER, 0, card(Rank::SEVEN)}));
    }
    EXPECT_TRUE(engine->dealInitialCards());

    const auto state = engine->getState();
    const auto* player_turn = std::get_if<PlayerTurn>(&state);
    ASSERT_NE(nullptr, player_turn);
    EXPECT_EQ(0u, player_turn->activeHandIndex);
    EXPECT_EQ(DEFAULT_BANKROLL - BET, player_turn->bankroll);
    EXPECT_THAT(
        player_turn->dealerHand.getCards(),
        ElementsAre(card(Rank::NINE), card(Rank::SEVEN)));
    ASSERT_EQ(1u, player_turn->playerHands.size());
    EXPECT_THAT(
        player_turn->playerHands.front().getCards(),
        ElementsAre(card(Rank::TEN), card(Rank::EIGHT)));
    EXPECT_EQ(BET, player_turn->playerHands.front().getBet());
}

TEST_F(BlackjackEngineTest, testPlayerNaturalBlackjack)
{
    betAndDeal({
        card(Rank::ACE), card(Rank::NINE), card(Rank::KING),
        card(Rank::SEVEN)});
    EXPECT_EQ(RoundPhase::ROUND_COMPLETE, engine->getPhase());
    EXPECT_EQ(HandOutcome::BLACKJACK, playerHand(0).getOutcome());
    EXPECT_EQ(10750, player().getBankroll());
}

TEST_F(BlackjackEngineTest, testBothNaturalBlackjacks)
{
    betAndDeal({
        card(Rank::ACE), card(Rank::ACE, Suit::HEARTS), card(Rank::KING),
        card(Rank::QUEEN)});
    EXPECT_EQ(RoundPhase::ROUND_COMPLETE, engine->getPhase());
    EXPECT_EQ(HandOutcome::PUSH, playerHand(0).getOutcome());
    EXPECT_EQ(DEFAULT_BANKROLL, player().getBankroll());
}

TEST_F(BlackjackEngineTest, testDealerNaturalBlackjack)
{
    betAndDeal({
        card(Rank::NINE), card(Rank::ACE), card(Rank::EIGHT),
        card(Rank::KING)});
    EXPECT_EQ(RoundPhase::ROUND_COMPLETE, engine->getPhase());
    EXPECT_EQ(HandOutcome::LOSS, playerHand(0).getOutcome());
    EXPECT_EQ(9500, player().getBankroll());
}

TEST_F(BlackjackEngineTest, testStandAndDealerBusts)
{
    betAndDeal({
        card(Rank::TEN), card(Rank::NINE), card(Rank::EIGHT),
        card(Rank::SEVEN), card(Rank::TEN, Suit::HEARTS)});
    EXPECT_TRUE(engine->submitAction(PlayerAction::STAND, 0));
    EXPECT_EQ(RoundPhase::DEALER_TURN, engine->getPhase());
    EXPECT_TRUE(engine->advanceDealer());
    EXPECT_TRUE(dealerHand().isBusted());
    EXPECT_EQ(RoundPhase::ROUND_COMPLETE, engine->getPhase());
    EXPECT_EQ(HandOutcome::WIN, playerHand(0).getOutcome());
    EXPECT_EQ(10500, player().getBankroll());
}

TEST_F(BlackjackEngineTest, testPush)
{
    betAndDeal({
        card(Rank::TEN), card(Rank::KING), card(Rank::EIGHT),
        card(Rank::EIGHT, Suit::HEARTS)});
    EXPECT_TRUE(engine->submitAction(PlayerAction::STAND, 0));
    EXPECT_TRUE(engine->advanceDealer());
    EXPECT_EQ(RoundPhase::ROUND_COMPLETE, engine->getPhase());
    EXPECT_EQ(HandOutcome::PUSH, playerHand(0).getOutcome());
    EXPECT_EQ(DEFAULT_BANKROLL, player().getBankroll());
}

TEST_F(BlackjackEngineTest, testDealerWins)
{
    betAndDeal({
        card(Rank::TEN), card(Rank::KING), card(Rank::SEVEN),
        card(Rank::NINE)});
    EXPECT_TRUE(engine->submitAction(PlayerAction::STAND, 0));
    EXPECT_TRUE(engine->playDealer());
    EXPECT_EQ(RoundPhase::ROUND_COMPLETE, engine->getPhase());
    EXPECT_EQ(HandOutcome::LOSS, playerHand(0).getOutcome());
    EXPECT_EQ(9500, player().getBankroll());
}

TEST_F(BlackjackEngineTest, testDealerStepsAreObservable)
{
    betAndDeal({
        card(Rank::TEN), card(Rank::FIVE), card(Rank::NINE), card(Rank::SIX),
        card(Rank::TWO, Suit::HEARTS), card(Rank::THREE),
        card(Rank::FOUR)});
    EXPECT_TRUE(engine->submitAction(PlayerAction::STAND, 0));
    for (const auto expected_value : {13, 16, 20}) {
        EXPECT_TRUE(engine->advanceDealer());
        EXPECT_EQ(RoundPhase::DEALER_TURN, engine->getPhase());
        EXPECT_EQ(expected_value, dealerHand().getBestValue());
    }
    EXPECT_TRUE(engine->advanceDealer());
    EXPECT_EQ(RoundPhase::ROUND_COMPLETE, engine->getPhase());
    EXPECT_EQ(20, dealerHand().getBestValue());
    EXPECT_EQ(HandOutcome::LOSS, playerHand(0).getOutcome());
    EXPECT_FALSE(engine->advanceDealer());
}

TEST_F(BlackjackEngineTest, testPlayDealerNotifiesEachStep)
{
    betAndDeal({
        card(Rank::TEN), card(Rank::FIVE), card(Rank::NINE), card(Rank::SIX),
        card(Rank::TWO, Suit::HEARTS), card(Rank::THREE),
        card(Rank::FOUR)});
    EXPECT_TRUE(engine->submitAction(PlayerAction::STAND, 0));
    auto phases = std::vector<RoundPhase> {};
    auto observer = makeObserver<RoundState>(
        [&phases](const RoundState& state)
        {
            phases.push_back(getPhase(state));
        });
    engine->subscribeToStateChanged(observer);
    EXPECT_TRUE(engine->playDealer());
    EXPECT_THAT(
        phases,
        ElementsAre(
            RoundPhase::DEALER_TURN, RoundPhase::DEALER_TURN,
            RoundPhase::DEALER_TURN, RoundPhase::ROUND_COMPLETE));
}

TEST_F(BlackjackEngineTest, testHitAndStay)
{
    betAndDeal({
        card(Rank::TWO), card(Rank::NINE), card(Rank::THREE),
        card(Rank::EIGHT), card(Rank::FOUR)});
    EXPECT_TRUE(engine->submitAction(PlayerAction::HIT, 0));
    EXPECT_EQ(RoundPhase::PLAYER_TURN, engine->getPhase());
    EXPECT_EQ(9, playerHand(0).getBestValue());
}

TEST_F(BlackjackEngineTest, testHitAndBust)
{
    betAndDeal({
        card(Rank::TEN), card(Rank::NINE), card(Rank::SIX), card(Rank::EIGHT),
        card(Rank::KING)});
    EXPECT_TRUE(engine->submitAction(PlayerAction::HIT, 0));
    EXPECT_EQ(RoundPhase::ROUND_COMPLETE, engine->getPhase());
    EXPECT_EQ(HandOutcome::LOSS, playerHand(0).getOutcome());
    EXPECT_EQ(2, dealerHand().getNumberOfCards());
    EXPECT_EQ(9500, player().getBankroll());
}

TEST_F(BlackjackEngineTest, testHitToTwentyOne)
{
    betAndDeal({
        card(Rank::TEN), card(Rank::NINE), card(Rank::SIX), card(Rank::EIGHT),
        card(Rank::FIVE)});
    EXPECT_TRUE(engine->submitAction(PlayerAction::HIT, 0));
    EXPECT_EQ(RoundPhase::DEALER_TURN, engine->getPhase());
    EXPECT_TRUE(engine->advanceDealer());
    EXPECT_EQ(HandOutcome::WIN, playerHand(0).getOutcome());
    EXPECT_EQ(10500, player().getBankroll());
}

TEST_F(BlackjackEngineTest, testDouble)
{
    betAndDeal({
        card(Rank::FIVE), card(Rank::NINE), card(Rank::SIX), card(Rank::EIGHT),
        card(Rank::TEN)});
    EXPECT_TRUE(engine->submitAction(PlayerAction::DOUBLE, 0));
    EXPECT_EQ(RoundPhase::DEALER_TURN, engine->getPhase());
    EXPECT_EQ(2 * BET, playerHand(0).getBet());
    EXPECT_EQ(3, playerHand(0).getNumberOfCards());
    EXPECT_EQ(9000, player().getBankroll());
    EXPECT_TRUE(engine->advanceDealer());
    EXPECT_EQ(HandOutcome::WIN, playerHand(0).getOutcome());
    EXPECT_EQ(11000, player().getBankroll());
}

TEST_F(BlackjackEngineTest, testDoubleAndBust)
{
    betAndDeal({
        card(Rank::TEN), card(Rank::NINE), card(Rank::SIX), card(Rank::SIX),
        card(Rank::KING)});
    EXPECT_TRUE(engine->submitAction(PlayerAction::DOUBLE, 0));
    EXPECT_EQ(RoundPhase::DEALER_TURN, engine->getPhase());
    EXPECT_TRUE(playerHand(0).isBusted());
    EXPECT_EQ(HandOutcome::LOSS, playerHand(0).getOutcome());
    EXPECT_EQ(9000, player().getBankroll());

    EXPECT_TRUE(engine->playDealer());
    EXPECT_EQ(RoundPhase::ROUND_COMPLETE, engine->getPhase());
    EXPECT_EQ(3, dealerHand().getNumberOfCards());
    EXPECT_EQ(HandOutcome::LOSS, playerHand(0).getOutcome());
    EXPECT_EQ(9000, player().getBankroll());
}

TEST_F(BlackjackEngineTest, testSplit)
{
    betAndDeal({
        card(Rank::EIGHT), card(Rank::TEN), card(Rank::EIGHT, Suit::HEARTS),
        card(Rank::SEVEN), card(Rank::THREE), card(Rank::TEN, Suit::HEARTS)});
    EXPECT_TRUE(engine->submitAction(PlayerAction::SPLIT, 0));

    const auto state = engine->getState();
    const auto* player_turn = std::get_if<PlayerTurn>(&state);
    ASSERT_NE(nullptr, player_turn);
    EXPECT_EQ(0u, player_turn->activeHandIndex);
    EXPECT_EQ(9000, player_turn->bankroll);
    ASSERT_EQ(2u, player_turn->playerHands.size());
    EXPECT_THAT(
        player_turn->playerHands[0].getCards(),
        ElementsAre(card(Rank::EIGHT), card(Rank::THREE)));
    EXPECT_THAT(
        player_turn->playerHands[1].getCards(),
        ElementsAre(card(Rank::EIGHT, Suit::HEARTS)));
    EXPECT_EQ(BET, player_turn->playerHands[0].getBet());
    EXPECT_EQ(BET, player_turn->playerHands[1].getBet());

    EXPECT_FALSE(engine->submitAction(PlayerAction::STAND, 1));
    EXPECT_TRUE(engine->submitAction(PlayerAction::STAND, 0));
    EXPECT_EQ(1u, getActiveHandIndex(engine->getState()));
    EXPECT_THAT(
        playerHand(1).getCards(),
        ElementsAre(card(Rank::EIGHT, Suit::HEARTS), card(Rank::TEN, Suit::HEARTS)));

    EXPECT_TRUE(engine->submitAction(PlayerAction::STAND, 1));
    EXPECT_EQ(RoundPhase::DEALER_TURN, engine->getPhase());
    EXPECT_TRUE(engine->advanceDealer());
    EXPECT_EQ(RoundPhase::ROUND_COMPLETE, engine->getPhase());
    EXPECT_EQ(HandOutcome::LOSS, playerHand(0).getOutcome());
    EXPECT_EQ(HandOutcome::WIN, playerHand(1).getOutcome());
    EXPECT_EQ(DEFAULT_BANKROLL, player().getBankroll());
}

TEST_F(BlackjackEngineTest, testSplitHandBustsAndNextHandIsPlayed)
{
    betAndDeal({
        card(Rank::EIGHT), card(Rank::TEN), card(Rank::EIGHT, Suit::HEARTS),
        card(Rank::SEVEN), card(Rank::FIVE), card(Rank::KING),
        card(Rank::JACK)});
    EXPECT_TRUE(engine->submitAction(PlayerAction::SPLIT, 0));
    EXPECT_TRUE(engine->submitAction(PlayerAction::HIT, 0));
    EXPECT_EQ(HandOutcome::LOSS, playerHand(0).getOutcome());
    EXPECT_EQ(1u, getActiveHandIndex(engine->getState()));
    EXPECT_EQ(18, playerHand(1).getBestValue());
}

TEST_F(BlackjackEngineTest, testIllegalSplit)
{
    betAndDeal({
        card(Rank::KING), card(Rank::NINE), card(Rank::QUEEN),
        card(Rank::SEVEN)});
    const auto state = engine->getState();
    EXPECT_CALL(*stateObserver, handleNotify(_)).Times(0);
    EXPECT_FALSE(engine->submitAction(PlayerAction::SPLIT, 0));
    EXPECT_EQ(state, engine->getState());
}

TEST_F(BlackjackEngineTest, testActionOnInactiveHand)
{
    betAndDeal({
        card(Rank::TEN), card(Rank::NINE), card(Rank::SEVEN),
        card(Rank::SEVEN)});
    const auto state = engine->getState();
    EXPECT_FALSE(engine->submitAction(PlayerAction::HIT, 1));
    EXPECT_EQ(state, engine->getState());
}

TEST_F(BlackjackEngineTest, testNextRound)
{
    betAndDeal({
        card(Rank::ACE), card(Rank::NINE), card(Rank::KING),
        card(Rank::SEVEN)});
    EXPECT_FALSE(engine->placeBet(BET));
    EXPECT_TRUE(engine->nextRound());
    EXPECT_EQ(RoundState(WaitingForBet {10750}), engine->getState());
    ASSERT_EQ(1u, player().getNumberOfHands());
    EXPECT_EQ(Hand {}, playerHand(0));
    EXPECT_EQ(Hand {}, dealerHand());
    EXPECT_TRUE(engine->placeBet(BET));
}

TEST_F(BlackjackEngineTest, testShoeReplenishedBeforeDeal)
{
    engine = std::make_unique<BlackjackEngine>(
        SETTINGS,
        makeShoe({card(Rank::TEN), card(Rank::NINE), card(Rank::EIGHT)}));
    const auto shoe_observer = std::make_shared<
        StrictMock<MockObserver<BlackjackEngine::ShoeReplenished>>>();
    engine->subscribeToShoeReplenished(shoe_observer);
    EXPECT_CALL(
        *shoe_observer, handleNotify(BlackjackEngine::ShoeReplenished {1}));
    ASSERT_TRUE(engine->placeBet(BET));
    EXPECT_TRUE(engine->dealInitialCards());
    EXPECT_EQ(
        static_cast<std::size_t>(N_CARDS_PER_DECK - 4),
        engine->getShoe().getNumberOfAvailableCards());
    EXPECT_EQ(4u, engine->getShoe().getNumberOfDiscardedCards());
}

TEST_F(BlackjackEngineTest, testShoeReplenishedDuringRound)
{
    engine = std::make_unique<BlackjackEngine>(
        SETTINGS,
        makeShoe({
            card(Rank::TWO), card(Rank::TEN), card(Rank::THREE),
            card(Rank::SEVEN), card(Rank::TWO, Suit::HEARTS),
            card(Rank::TWO, Suit::DIAMONDS), card(Rank::TWO, Suit::CLUBS),
            card(Rank::THREE, Suit::HEARTS)}));
    const auto shoe_observer = std::make_shared<
        StrictMock<MockObserver<BlackjackEngine::ShoeReplenished>>>();
    engine->subscribeToShoeReplenished(shoe_observer);
    ASSERT_TRUE(engine->placeBet(BET));
    ASSERT_TRUE(engine->dealInitialCards());
    for ([[maybe_unused]] const auto n : {1, 2, 3, 4}) {
        ASSERT_TRUE(engine->submitAction(PlayerAction::HIT, 0));
    }
    EXPECT_EQ(0u, engine->getShoe().getNumberOfAvailableCards());
    EXPECT_EQ(14, playerHand(0).getBestValue());

    EXPECT_CALL(
        *shoe_observer, handleNotify(BlackjackEngine::ShoeReplenished {1}));
    EXPECT_TRUE(engine->submitAction(PlayerAction::HIT, 0));
    EXPECT_EQ(7, playerHand(0).getNumberOfCards());
    EXPECT_EQ(
        static_cast<std::size_t>(N_CARDS_PER_DECK - 1),
        engine->getShoe().getNumberOfAvailableCards());
}

TEST_F(BlackjackEngineTest, testShuffleShoe)
{
    setCards({});
    engine->shuffleShoe();
    EXPECT_EQ(
        FILLER.size(), engine->getShoe().getNumberOfAvailableCards());
}

TEST_F(BlackjackEngineTest, testCommandFromObserverIsDeferred)
{
    setCards({
        card(Rank::TEN), card(Rank::NINE), card(Rank::EIGHT),
        card(Rank::SEVEN)});
    auto nested_ret = true;
    auto observer = makeObserver<RoundState>(
        [this, &nested_ret](const RoundState& state)
        {
            if (getPhase(state) == RoundPhase::WAITING_TO_DEAL) {
                nested_ret = engine->dealInitialCards();
            }
        });
    engine->subscribeToStateChanged(observer);
    EXPECT_TRUE(engine->placeBet(BET));
    EXPECT_FALSE(nested_ret);
    EXPECT_EQ(RoundPhase::PLAYER_TURN, engine->getPhase());
}
