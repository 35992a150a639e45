#include "engine/BlackjackEngine.hh"

#include "blackjack/GameSettings.hh"
#include "blackjack/Hand.hh"
#include "blackjack/Player.hh"
#include "blackjack/Shoe.hh"
#include "FunctionQueue.hh"
#include "Logging.hh"
#include "Utility.hh"

#include <boost/statechart/custom_reaction.hpp>
#include <boost/statechart/event.hpp>
#include <boost/statechart/simple_state.hpp>
#include <boost/statechart/state_machine.hpp>
#include <boost/statechart/transition.hpp>

#include <cassert>
#include <ostream>
#include <stdexcept>
#include <thread>

namespace sc = boost::statechart;

namespace Blackjack {
namespace Engine {

namespace {

const GameSettings& validateSettings(const GameSettings& settings)
{
    settings.validate();
    return settings;
}

Shoe makeShuffledShoe(const int deckCount)
{
    auto shoe = Shoe {deckCount};
    shoe.shuffle();
    return shoe;
}

}

////////////////////////////////////////////////////////////////////////////////
// Events
////////////////////////////////////////////////////////////////////////////////

class PlaceBetEvent : public sc::event<PlaceBetEvent> {
public:
    PlaceBetEvent(const Money amount, bool& ret) :
        amount {amount},
        ret {ret}
    {
    }

    Money amount;
    bool& ret;
};
class DealEvent : public sc::event<DealEvent> {
public:
    DealEvent(bool& ret) :
        ret {ret}
    {
    }

    bool& ret;
};
class ActionEvent : public sc::event<ActionEvent> {
public:
    ActionEvent(
        const PlayerAction action, const std::size_t handIndex, bool& ret) :
        action {action},
        handIndex {handIndex},
        ret {ret}
    {
    }

    PlayerAction action;
    std::size_t handIndex;
    bool& ret;
};
class DealerStepEvent : public sc::event<DealerStepEvent> {
public:
    DealerStepEvent(bool& ret) :
        ret {ret}
    {
    }

    bool& ret;
};
class NextRoundEvent : public sc::event<NextRoundEvent> {
public:
    NextRoundEvent(bool& ret) :
        ret {ret}
    {
    }

    bool& ret;
};

////////////////////////////////////////////////////////////////////////////////
// BlackjackEngine::Impl
////////////////////////////////////////////////////////////////////////////////

class AwaitingBet;

class BlackjackEngine::Impl :
    public sc::state_machine<BlackjackEngine::Impl, AwaitingBet> {
public:
    Impl(const GameSettings& settings, Shoe shoe);

    template<typename Event, typename... Args>
    bool processCommand(const Args&... args);
    void unconsumed_event(const sc::event_base&);

    void ensureShoeCapacity();
    void dealCard(Participant participant, std::size_t handIndex);
    void settle();

    RoundState getState() const;
    const GameSettings& getSettings() const { return settings; }
    Player& getPlayer() { return player; }
    const Player& getPlayer() const { return player; }
    Player& getDealer() { return dealer; }
    const Player& getDealer() const { return dealer; }
    Shoe& getShoe() { return shoe; }
    const Shoe& getShoe() const { return shoe; }
    Observable<RoundState>& getStateChangedNotifier()
    {
        return stateChangedNotifier;
    }
    Observable<CardDealt>& getCardDealtNotifier()
    {
        return cardDealtNotifier;
    }
    Observable<ShoeReplenished>& getShoeReplenishedNotifier()
    {
        return shoeReplenishedNotifier;
    }

    FunctionQueue functionQueue;

private:

    void internalHandleShoeReplenished();

    const GameSettings settings;
    Shoe shoe;
    Player player;
    Player dealer;
    Observable<RoundState> stateChangedNotifier;
    Observable<CardDealt> cardDealtNotifier;
    Observable<ShoeReplenished> shoeReplenishedNotifier;
};

BlackjackEngine::Impl::Impl(const GameSettings& settings, Shoe shoe) :
    settings {settings},
    shoe {std::move(shoe)},
    player {settings.initialBankroll},
    dealer {}
{
}

template<typename Event, typename... Args>
bool BlackjackEngine::Impl::processCommand(const Args&... args)
{
    // A command issued while another one is being processed (e.g. from an
    // observer) is deferred, and reported as not accepted to the caller
    auto ret = std::make_shared<bool>(false);
    functionQueue(
        [this, ret, args...]()
        {
            process_event(Event {args..., *ret});
            if (*ret) {
                stateChangedNotifier.notifyAll(getState());
            }
        });
    return *ret;
}

void BlackjackEngine::Impl::unconsumed_event(const sc::event_base&)
{
    log(LogLevel::WARNING, "Command rejected in phase %s",
        Blackjack::getPhase(getState()));
}

void BlackjackEngine::Impl::ensureShoeCapacity()
{
    if (shoe.ensureCardsForPlayers(1)) {
        internalHandleShoeReplenished();
    }
}

void BlackjackEngine::Impl::dealCard(
    const Participant participant, const std::size_t handIndex)
{
    if (shoe.getNumberOfAvailableCards() == 0) {
        log(LogLevel::INFO, "Shoe exhausted during round, replenishing");
        shoe.replenish();
        internalHandleShoeReplenished();
    }
    const auto card = shoe.drawCard();
    auto& receiver = (participant == Participant::PLAYER) ? player : dealer;
    if (!receiver.addCardToHand(dereference(card), handIndex)) {
        throw std::out_of_range {"Dealing card to nonexistent hand"};
    }
    log(LogLevel::DEBUG, "Dealt %s to %s, hand %d", *card, participant,
        handIndex);
    cardDealtNotifier.notifyAll(CardDealt {participant, handIndex, *card});
}

void BlackjackEngine::Impl::settle()
{
    const auto& dealer_hand = dealer.getHand(0);
    const auto dealer_busted = dealer_hand.isBusted();
    const auto dealer_value = dealer_hand.getBestValue();
    for (const auto n : to(player.getNumberOfHands())) {
        auto& hand = player.getHand(n);
        if (hand.getOutcome()) {
            continue;
        }
        const auto value = hand.getBestValue();
        if (hand.isBusted()) {
            hand.setOutcome(HandOutcome::LOSS);
        } else if (dealer_busted || value > dealer_value) {
            hand.setOutcome(HandOutcome::WIN);
            player.credit(hand.getBet() * WIN_PAYOUT);
        } else if (value < dealer_value) {
            hand.setOutcome(HandOutcome::LOSS);
        } else {
            hand.setOutcome(HandOutcome::PUSH);
            player.credit(hand.getBet() * PUSH_PAYOUT);
        }
        log(LogLevel::DEBUG, "Hand %d settled: %s", n, *hand.getOutcome());
    }
}

void BlackjackEngine::Impl::internalHandleShoeReplenished()
{
    shoeReplenishedNotifier.notifyAll(ShoeReplenished {shoe.getDeckCount()});
    if (settings.shoeChangeDelay.count() > 0) {
        std::this_thread::sleep_for(settings.shoeChangeDelay);
    }
}

// Find other method definitions later (they refer to states)

////////////////////////////////////////////////////////////////////////////////
// AwaitingBet
////////////////////////////////////////////////////////////////////////////////

class AwaitingDeal;

class AwaitingBet : public sc::simple_state<AwaitingBet, BlackjackEngine::Impl> {
public:
    using reactions = sc::custom_reaction<PlaceBetEvent>;
    sc::result react(const PlaceBetEvent& event);
};

sc::result AwaitingBet::react(const PlaceBetEvent& event)
{
    auto& player = outermost_context().getPlayer();
    if (!(event.amount >= 0) || event.amount > player.getBankroll()) {
        log(LogLevel::WARNING, "Bet %s rejected, bankroll is %s",
            event.amount, player.getBankroll());
        return discard_event();
    }
    player.debit(event.amount);
    player.getHand(0).setBet(event.amount);
    log(LogLevel::DEBUG, "Bet %s placed", event.amount);
    event.ret = true;
    return transit<AwaitingDeal>();
}

////////////////////////////////////////////////////////////////////////////////
// AwaitingDeal
////////////////////////////////////////////////////////////////////////////////

class PlayerActing;
class Completed;

class AwaitingDeal : public sc::simple_state<AwaitingDeal, BlackjackEngine::Impl> {
public:
    using reactions = sc::custom_reaction<DealEvent>;
    sc::result react(const DealEvent& event);
};

sc::result AwaitingDeal::react(const DealEvent& event)
{
    auto& context = outermost_context();
    context.ensureShoeCapacity();
    for ([[maybe_unused]] const auto n : to(N_INITIAL_CARDS)) {
        context.dealCard(Participant::PLAYER, 0);
        context.dealCard(Participant::DEALER, 0);
    }
    event.ret = true;

    auto& player = context.getPlayer();
    auto& hand = player.getHand(0);
    const auto player_natural = hand.isNaturalBlackjack();
    const auto dealer_natural =
        context.getDealer().getHand(0).isNaturalBlackjack();
    if (player_natural && dealer_natural) {
        hand.setOutcome(HandOutcome::PUSH);
        player.credit(hand.getBet() * PUSH_PAYOUT);
    } else if (player_natural) {
        hand.setOutcome(HandOutcome::BLACKJACK);
        player.credit(hand.getBet() * BLACKJACK_PAYOUT);
    } else if (dealer_natural) {
        hand.setOutcome(HandOutcome::LOSS);
    } else {
        return transit<PlayerActing>();
    }
    log(LogLevel::DEBUG, "Natural blackjack, round settled: %s",
        *hand.getOutcome());
    return transit<Completed>();
}

////////////////////////////////////////////////////////////////////////////////
// PlayerActing
////////////////////////////////////////////////////////////////////////////////

class DealerActing;

class PlayerActing : public sc::simple_state<PlayerActing, BlackjackEngine::Impl> {
public:
    using reactions = sc::custom_reaction<ActionEvent>;
    sc::result react(const ActionEvent& event);

    std::size_t getActiveHandIndex() const { return activeHandIndex; }

private:

    sc::result internalSplit(const ActionEvent& event);
    sc::result internalAdvanceOrFinish();
    sc::result internalAdvanceOrDealerTurn();

    std::size_t activeHandIndex {};
};

sc::result PlayerActing::react(const ActionEvent& event)
{
    if (event.handIndex != activeHandIndex) {
        log(LogLevel::WARNING, "%s rejected, hand %d is not active",
            event.action, event.handIndex);
        return discard_event();
    }
    auto& context = outermost_context();
    auto& player = context.getPlayer();
    auto& hand = player.getHand(activeHandIndex);
    switch (event.action) {
    case PlayerAction::HIT:
        context.dealCard(Participant::PLAYER, activeHandIndex);
        event.ret = true;
        if (hand.isBusted()) {
            hand.setOutcome(HandOutcome::LOSS);
            return internalAdvanceOrFinish();
        } else if (hand.isBlackjack()) {
            return internalAdvanceOrFinish();
        }
        return discard_event();
    case PlayerAction::STAND:
        event.ret = true;
        return internalAdvanceOrFinish();
    case PlayerAction::DOUBLE:
        player.debit(hand.getBet());
        hand.doubleBet();
        context.dealCard(Participant::PLAYER, activeHandIndex);
        if (hand.isBusted()) {
            hand.setOutcome(HandOutcome::LOSS);
        }
        event.ret = true;
        return internalAdvanceOrDealerTurn();
    case PlayerAction::SPLIT:
        return internalSplit(event);
    }
    return discard_event();
}

sc::result PlayerActing::internalSplit(const ActionEvent& event)
{
    auto& context = outermost_context();
    auto& player = context.getPlayer();
    auto& hand = player.getHand(activeHandIndex);
    if (!hand.canSplit()) {
        log(LogLevel::WARNING, "Hand %d cannot be split", activeHandIndex);
        return discard_event();
    }
    const auto card = hand.removeLastCard();
    const auto bet = hand.getBet();
    player.debit(bet);
    // Inserting invalidates the reference to the split hand
    player.insertHand(activeHandIndex + 1, Hand {dereference(card), bet});
    context.dealCard(Participant::PLAYER, activeHandIndex);
    event.ret = true;
    return discard_event();
}

sc::result PlayerActing::internalAdvanceOrFinish()
{
    auto& context = outermost_context();
    const auto& player = context.getPlayer();
    if (activeHandIndex + 1 < player.getNumberOfHands() ||
        player.hasLiveHands()) {
        return internalAdvanceOrDealerTurn();
    }
    context.settle();
    return transit<Completed>();
}

// After a double the dealer plays even if every hand is busted
sc::result PlayerActing::internalAdvanceOrDealerTurn()
{
    auto& context = outermost_context();
    if (activeHandIndex + 1 < context.getPlayer().getNumberOfHands()) {
        ++activeHandIndex;
        context.dealCard(Participant::PLAYER, activeHandIndex);
        return discard_event();
    }
    return transit<DealerActing>();
}

////////////////////////////////////////////////////////////////////////////////
// DealerActing
////////////////////////////////////////////////////////////////////////////////

class DealerActing : public sc::simple_state<DealerActing, BlackjackEngine::Impl> {
public:
    using reactions = sc::custom_reaction<DealerStepEvent>;
    sc::result react(const DealerStepEvent& event);
};

sc::result DealerActing::react(const DealerStepEvent& event)
{
    auto& context = outermost_context();
    const auto& hand = context.getDealer().getHand(0);
    event.ret = true;
    if (hand.getBestValue() <= DEALER_HIT_LIMIT) {
        context.dealCard(Participant::DEALER, 0);
        if (!hand.isBusted()) {
            return discard_event();
        }
    }
    log(LogLevel::DEBUG, "Dealer finished with %d", hand.getBestValue());
    context.settle();
    return transit<Completed>();
}

////////////////////////////////////////////////////////////////////////////////
// Completed
////////////////////////////////////////////////////////////////////////////////

class Completed : public sc::simple_state<Completed, BlackjackEngine::Impl> {
public:
    using reactions = sc::custom_reaction<NextRoundEvent>;
    sc::result react(const NextRoundEvent& event);
};

sc::result Completed::react(const NextRoundEvent& event)
{
    auto& context = outermost_context();
    context.getPlayer().resetHands();
    context.getDealer().resetHands();
    event.ret = true;
    return transit<AwaitingBet>();
}

////////////////////////////////////////////////////////////////////////////////
// BlackjackEngine::Impl (continued)
////////////////////////////////////////////////////////////////////////////////

RoundState BlackjackEngine::Impl::getState() const
{
    const auto bankroll = player.getBankroll();
    if (state_cast<const AwaitingBet*>()) {
        return WaitingForBet {bankroll};
    } else if (state_cast<const AwaitingDeal*>()) {
        return WaitingToDeal {player.getHand(0).getBet(), bankroll};
    }
    const auto& dealer_hand = dealer.getHand(0);
    const auto& player_hands = player.getHands();
    if (const auto* state = state_cast<const PlayerActing*>()) {
        return PlayerTurn {
            dealer_hand, player_hands, bankroll, state->getActiveHandIndex()};
    } else if (state_cast<const DealerActing*>()) {
        return DealerTurn {dealer_hand, player_hands, bankroll};
    }
    return RoundComplete {dealer_hand, player_hands, bankroll};
}

////////////////////////////////////////////////////////////////////////////////
// BlackjackEngine
////////////////////////////////////////////////////////////////////////////////

BlackjackEngine::BlackjackEngine(const GameSettings& settings) :
    BlackjackEngine {
        settings, makeShuffledShoe(validateSettings(settings).deckCount)}
{
}

BlackjackEngine::BlackjackEngine(const GameSettings& settings, Shoe shoe) :
    impl {
        std::make_shared<Impl>(validateSettings(settings), std::move(shoe))}
{
    impl->initiate();
}

BlackjackEngine::~BlackjackEngine() = default;

void BlackjackEngine::subscribeToStateChanged(
    std::weak_ptr<Observer<RoundState>> observer)
{
    assert(impl);
    impl->getStateChangedNotifier().subscribe(std::move(observer));
}

void BlackjackEngine::subscribeToCardDealt(
    std::weak_ptr<Observer<CardDealt>> observer)
{
    assert(impl);
    impl->getCardDealtNotifier().subscribe(std::move(observer));
}

void BlackjackEngine::subscribeToShoeReplenished(
    std::weak_ptr<Observer<ShoeReplenished>> observer)
{
    assert(impl);
    impl->getShoeReplenishedNotifier().subscribe(std::move(observer));
}

bool BlackjackEngine::placeBet(const Money amount)
{
    assert(impl);
    return impl->processCommand<PlaceBetEvent>(amount);
}

bool BlackjackEngine::dealInitialCards()
{
    assert(impl);
    return impl->processCommand<DealEvent>();
}

bool BlackjackEngine::submitAction(
    const PlayerAction action, const std::size_t handIndex)
{
    assert(impl);
    return impl->processCommand<ActionEvent>(action, handIndex);
}

bool BlackjackEngine::advanceDealer()
{
    assert(impl);
    return impl->processCommand<DealerStepEvent>();
}

bool BlackjackEngine::playDealer()
{
    if (!advanceDealer()) {
        return false;
    }
    while (getPhase() == RoundPhase::DEALER_TURN && advanceDealer());
    return true;
}

bool BlackjackEngine::nextRound()
{
    assert(impl);
    return impl->processCommand<NextRoundEvent>();
}

void BlackjackEngine::shuffleShoe()
{
    assert(impl);
    impl->getShoe().shuffle();
}

RoundState BlackjackEngine::getState() const
{
    assert(impl);
    return impl->getState();
}

RoundPhase BlackjackEngine::getPhase() const
{
    return Blackjack::getPhase(getState());
}

const GameSettings& BlackjackEngine::getSettings() const
{
    assert(impl);
    return impl->getSettings();
}

const Player& BlackjackEngine::getPlayer() const
{
    assert(impl);
    return impl->getPlayer();
}

const Player& BlackjackEngine::getDealer() const
{
    assert(impl);
    return impl->getDealer();
}

const Shoe& BlackjackEngine::getShoe() const
{
    assert(impl);
    return impl->getShoe();
}

BlackjackEngine::CardDealt::CardDealt(
    const Participant participant, const std::size_t handIndex,
    const CardType& card) :
    participant {participant},
    handIndex {handIndex},
    card {card}
{
}

BlackjackEngine::ShoeReplenished::ShoeReplenished(const int deckCount) :
    deckCount {deckCount}
{
}

bool operator==(
    const BlackjackEngine::CardDealt& lhs, const BlackjackEngine::CardDealt& rhs)
{
    return lhs.participant == rhs.participant &&
        lhs.handIndex == rhs.handIndex && lhs.card == rhs.card;
}

bool operator==(
    const BlackjackEngine::ShoeReplenished& lhs,
    const BlackjackEngine::ShoeReplenished& rhs)
{
    return lhs.deckCount == rhs.deckCount;
}

std::ostream& operator<<(std::ostream& os, const Participant participant)
{
    return os << (participant == Participant::PLAYER ? "player" : "dealer");
}

}
}
