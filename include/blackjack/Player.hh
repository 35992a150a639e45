/** \file
 *
 * \brief Definition of Blackjack::Player class
 */

#ifndef BLACKJACK_PLAYER_HH_
#define BLACKJACK_PLAYER_HH_

#include "blackjack/BlackjackConstants.hh"
#include "blackjack/Hand.hh"

#include <cstddef>
#include <vector>

namespace Blackjack {

/** \brief A participant of a blackjack round
 *
 * A player owns one or more hands and a bankroll. The hands are kept in the
 * order they are played: splitting a hand inserts the new hand right after
 * the split one. Between rounds the player holds a single empty hand.
 *
 * The dealer is also represented by a Player. It always has exactly one hand
 * and its bankroll is not used.
 */
class Player {
public:

    /** \brief Type of the hand container
     */
    using HandVector = std::vector<Hand>;

    /** \brief Create a player
     *
     * \param bankroll the initial bankroll
     */
    explicit Player(Money bankroll = Money {});

    /** \brief Get the hands of the player
     */
    const HandVector& getHands() const;

    /** \brief Get the number of hands
     */
    std::size_t getNumberOfHands() const;

    /** \brief Get a hand
     *
     * \param n the index of the hand
     *
     * \throw std::out_of_range if \p n is not a valid index
     */
    const Hand& getHand(std::size_t n) const;

    /// \copydoc getHand(std::size_t) const
    Hand& getHand(std::size_t n);

    /** \brief Add card to a hand
     *
     * \param card the card
     * \param n the index of the hand
     *
     * \return true if the card was added, false if there is no hand with
     * index \p n
     */
    bool addCardToHand(const CardType& card, std::size_t n);

    /** \brief Insert a hand
     *
     * \param n the index of the new hand, at most the current number of hands
     * \param hand the new hand
     *
     * \throw std::out_of_range if \p n is greater than the number of hands
     */
    void insertHand(std::size_t n, Hand hand);

    /** \brief Determine if any hand is not busted
     */
    bool hasLiveHands() const;

    /** \brief Replace the hands with a single empty hand
     */
    void resetHands();

    /** \brief Get the bankroll
     */
    Money getBankroll() const;

    /** \brief Withdraw from the bankroll
     */
    void debit(Money amount);

    /** \brief Deposit to the bankroll
     */
    void credit(Money amount);

private:

    HandVector hands;
    Money bankroll;
};

}

#endif // BLACKJACK_PLAYER_HH_
