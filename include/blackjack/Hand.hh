/** \file
 *
 * \brief Definition of Blackjack::Hand class
 */

#ifndef BLACKJACK_HAND_HH_
#define BLACKJACK_HAND_HH_

#include "blackjack/BlackjackConstants.hh"
#include "blackjack/CardType.hh"

#include <iosfwd>
#include <optional>
#include <string_view>
#include <vector>

namespace Blackjack {

/** \brief Final result of a hand
 */
enum class HandOutcome {
    WIN,        ///< Hand beat the dealer, paid even money
    LOSS,       ///< Hand lost, the bet is forfeited
    PUSH,       ///< Hand tied with the dealer, the bet is returned
    BLACKJACK,  ///< Natural blackjack, paid 3:2
};

/** \brief Return textual representation of a hand outcome
 *
 * \return "win", "loss", "push" or "blackjack"
 */
std::string_view handOutcomeToString(HandOutcome outcome);

/** \brief Parse hand outcome from its textual representation
 *
 * \return The outcome, or none if \p str does not represent any outcome
 */
std::optional<HandOutcome> handOutcomeFromString(std::string_view str);

/** \brief A blackjack hand
 *
 * A hand consists of the cards dealt to it, the bet placed on it and, once
 * the hand is finished, its outcome. Hands are value types: the engine copies
 * them into round state snapshots.
 *
 * The value queries treat each ace independently as one or eleven. The order
 * of the cards only matters for display.
 */
class Hand {
public:

    /** \brief Type of the card container
     */
    using CardVector = std::vector<CardType>;

    /** \brief Create an empty hand without a bet
     */
    Hand();

    /** \brief Create an empty hand with a bet
     *
     * \param bet the bet placed on the hand
     */
    explicit Hand(Money bet);

    /** \brief Create a hand seeded with one card
     *
     * This is used for the hand created when splitting.
     *
     * \param card the seed card
     * \param bet the bet placed on the hand
     */
    Hand(const CardType& card, Money bet);

    /** \brief Append card to the hand
     */
    void addCard(const CardType& card);

    /** \brief Remove the last card from the hand
     *
     * \return The removed card, or none if the hand was empty
     */
    std::optional<CardType> removeLastCard();

    /** \brief Get the cards in the order they were added
     */
    const CardVector& getCards() const;

    /** \brief Get the number of cards in the hand
     */
    int getNumberOfCards() const;

    /** \brief Get the bet placed on the hand
     */
    Money getBet() const;

    /** \brief Set the bet placed on the hand
     */
    void setBet(Money bet);

    /** \brief Double the bet placed on the hand
     */
    void doubleBet();

    /** \brief Get the outcome of the hand
     *
     * \return the outcome, or none if the hand is not finished
     */
    std::optional<HandOutcome> getOutcome() const;

    /** \brief Set the outcome of the hand
     *
     * The engine sets the outcome once per round: when the hand busts, when
     * the initial deal reveals a natural blackjack, or at settlement.
     */
    void setOutcome(HandOutcome outcome);

    /** \brief Determine every total the hand can have
     *
     * Each ace contributes either one or eleven, independently of the other
     * aces. Equal totals are reported once.
     *
     * \return the possible totals in ascending order
     */
    std::vector<int> getPossibleValues() const;

    /** \brief Determine the best total of the hand
     *
     * \return the largest possible total not exceeding 21, or the smallest
     * possible total if the hand is busted
     */
    int getBestValue() const;

    /** \brief Determine if the hand is a natural blackjack
     *
     * \return true if the hand has exactly two cards totaling 21
     */
    bool isNaturalBlackjack() const;

    /** \brief Determine if the hand totals 21
     *
     * Unlike isNaturalBlackjack(), this is true for any number of cards.
     */
    bool isBlackjack() const;

    /** \brief Determine if every possible total of the hand exceeds 21
     */
    bool isBusted() const;

    /** \brief Determine if the hand can be split
     *
     * \return true if the hand has exactly two cards of equal rank
     */
    bool canSplit() const;

    /** \brief Equality operator
     *
     * Hands are equal if their cards, bets and outcomes are equal.
     */
    bool operator==(const Hand&) const = default;

private:

    CardVector cards;
    Money bet;
    std::optional<HandOutcome> outcome;
};

/** \brief Output a HandOutcome to stream
 */
std::ostream& operator<<(std::ostream& os, HandOutcome outcome);

/** \brief Output a Hand to stream
 *
 * The cards are followed by the best value, the bet and the outcome.
 */
std::ostream& operator<<(std::ostream& os, const Hand& hand);

}

#endif // BLACKJACK_HAND_HH_
