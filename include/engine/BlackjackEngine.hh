/** \file
 *
 * \brief Definition of Blackjack::Engine::BlackjackEngine class
 */

#ifndef ENGINE_BLACKJACKENGINE_HH_
#define ENGINE_BLACKJACKENGINE_HH_

#include "blackjack/BlackjackConstants.hh"
#include "blackjack/CardType.hh"
#include "blackjack/PlayerAction.hh"
#include "blackjack/RoundState.hh"
#include "Observer.hh"

#include <boost/core/noncopyable.hpp>
#include <boost/operators.hpp>

#include <cstddef>
#include <iosfwd>
#include <memory>

namespace Blackjack {

struct GameSettings;
class Player;
class Shoe;

/** \brief The blackjack engine
 *
 * Namespace Engine contains BlackjackEngine and the notifications it
 * publishes.
 */
namespace Engine {

/** \brief Participant of a round
 */
enum class Participant {
    PLAYER,
    DEALER,
};

/** \brief Output Participant to stream
 */
std::ostream& operator<<(std::ostream& os, Participant participant);

/** \brief The state machine running a single player blackjack game
 *
 * The responsibility of BlackjackEngine is to orchestrate rounds according to
 * the blackjack rules: accepting the bet, dealing, the player and dealer
 * turns and settlement. The engine owns the shoe, the player and the dealer.
 *
 * Every command returns true if it was accepted, and false if it was
 * rejected because it is not allowed in the current phase or its arguments
 * are invalid. A rejected command does not change the state of the engine.
 * After each accepted command the engine notifies the state change
 * observers with the new state.
 */
class BlackjackEngine : private boost::noncopyable {
public:

    /** \brief Event for announcing that a card was dealt
     */
    struct CardDealt : private boost::equality_comparable<CardDealt> {
        /** \brief Create new card dealt event
         *
         * \param participant see \ref participant
         * \param handIndex see \ref handIndex
         * \param card see \ref card
         */
        CardDealt(
            Participant participant, std::size_t handIndex,
            const CardType& card);

        Participant participant;  ///< \brief Who received the card
        std::size_t handIndex;    ///< \brief The hand that received the card
        CardType card;            ///< \brief The card dealt
    };

    /** \brief Event for announcing that the shoe was replenished
     */
    struct ShoeReplenished : private boost::equality_comparable<ShoeReplenished> {
        /** \brief Create new shoe replenished event
         *
         * \param deckCount see \ref deckCount
         */
        explicit ShoeReplenished(int deckCount);

        int deckCount;  ///< \brief The number of decks in the new shoe
    };

    /** \brief Create blackjack engine
     *
     * The engine creates and shuffles a shoe with the number of decks given
     * in the settings.
     *
     * \param settings the game settings
     *
     * \throw std::invalid_argument if the settings are invalid
     */
    explicit BlackjackEngine(const GameSettings& settings);

    /** \brief Create blackjack engine with preloaded shoe
     *
     * The shoe is used as is, without shuffling.
     *
     * \param settings the game settings
     * \param shoe the shoe
     *
     * \throw std::invalid_argument if the settings are invalid
     */
    BlackjackEngine(const GameSettings& settings, Shoe shoe);

    ~BlackjackEngine();

    /** \brief Subscribe to notifications about state changes
     */
    void subscribeToStateChanged(std::weak_ptr<Observer<RoundState>> observer);

    /** \brief Subscribe to notifications about cards dealt
     */
    void subscribeToCardDealt(std::weak_ptr<Observer<CardDealt>> observer);

    /** \brief Subscribe to notifications about shoe replenishment
     */
    void subscribeToShoeReplenished(
        std::weak_ptr<Observer<ShoeReplenished>> observer);

    /** \brief Place a bet
     *
     * The bet is deducted from the bankroll.
     *
     * \param amount the amount to bet
     *
     * \return true if the bet was accepted, false if the engine is not
     * waiting for a bet, or \p amount is negative or exceeds the bankroll
     */
    bool placeBet(Money amount);

    /** \brief Deal the initial cards
     *
     * Two cards are dealt to the player and the dealer alternately, starting
     * from the player. If either has a natural blackjack, the round is
     * settled immediately.
     *
     * \return true if the cards were dealt, false if the engine is not
     * waiting to deal
     */
    bool dealInitialCards();

    /** \brief Act on a player hand
     *
     * \param action the action
     * \param handIndex index of the hand the action is applied to
     *
     * \return true if the action was accepted, false if it is not the turn
     * of the player, \p handIndex is not the active hand, or the action is
     * not allowed for the hand
     */
    bool submitAction(PlayerAction action, std::size_t handIndex);

    /** \brief Perform one step of the dealer turn
     *
     * If the dealer must hit, one card is dealt. If the dealer busts or
     * stands, the round is settled.
     *
     * \return true if the step was taken, false if it is not the turn of the
     * dealer
     */
    bool advanceDealer();

    /** \brief Play the dealer turn to completion
     *
     * \return true if the dealer played, false if it is not the turn of the
     * dealer
     */
    bool playDealer();

    /** \brief Start the next round
     *
     * \return true if a new round was started, false if the round is not
     * complete
     */
    bool nextRound();

    /** \brief Shuffle the cards remaining in the shoe
     */
    void shuffleShoe();

    /** \brief Get a snapshot of the current state
     */
    RoundState getState() const;

    /** \brief Get the phase of the current round
     */
    RoundPhase getPhase() const;

    /** \brief Get the settings the engine was created with
     */
    const GameSettings& getSettings() const;

    /** \brief Get the player
     */
    const Player& getPlayer() const;

    /** \brief Get the dealer
     */
    const Player& getDealer() const;

    /** \brief Get the shoe
     */
    const Shoe& getShoe() const;

    class Impl;

private:

    const std::shared_ptr<Impl> impl;
};

/** \brief Equality operator for card dealt events
 */
bool operator==(
    const BlackjackEngine::CardDealt&, const BlackjackEngine::CardDealt&);

/** \brief Equality operator for shoe replenished events
 */
bool operator==(
    const BlackjackEngine::ShoeReplenished&,
    const BlackjackEngine::ShoeReplenished&);

}
}

#endif // ENGINE_BLACKJACKENGINE_HH_
