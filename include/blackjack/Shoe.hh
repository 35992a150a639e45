/** \file
 *
 * \brief Definition of Blackjack::Shoe class
 */

#ifndef BLACKJACK_SHOE_HH_
#define BLACKJACK_SHOE_HH_

#include "blackjack/CardType.hh"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <vector>

namespace Blackjack {

/** \brief A shoe holding one or more decks of cards
 *
 * The shoe holds the available cards, from which cards are drawn, and the
 * discard pile which receives every drawn card. Together they always make up
 * getDeckCount() full decks, until the shoe is replenished. Replenishing
 * replaces both with a freshly shuffled set of decks, the way a dealer swaps
 * in a new shoe when the old one is running out.
 */
class Shoe {
public:

    /** \brief Type of the card containers
     */
    using CardVector = std::vector<CardType>;

    /** \brief Create a shoe
     *
     * The shoe contains \p deckCount full decks in rank-major, suit-minor
     * order. It is not shuffled.
     *
     * \param deckCount the number of decks
     *
     * \throw std::invalid_argument if \p deckCount is less than one
     */
    explicit Shoe(int deckCount);

    /** \brief Create a shoe with predetermined cards
     *
     * The cards are drawn in the order given by the iterators. The deck count
     * only determines the contents of the shoe after it is replenished.
     *
     * \tparam CardTypeIterator An input iterator that, when dereferenced,
     * returns an object convertible to CardType
     *
     * \param deckCount the number of decks used when replenishing
     * \param first iterator to the first card to be drawn
     * \param last iterator one past the last card to be drawn
     *
     * \throw std::invalid_argument if \p deckCount is less than one
     */
    template<typename CardTypeIterator>
    Shoe(int deckCount, CardTypeIterator first, CardTypeIterator last);

    /** \brief Shuffle the available cards
     *
     * The discard pile is not affected.
     */
    void shuffle();

    /** \brief Draw a card
     *
     * The card is removed from the available cards and added to the discard
     * pile.
     *
     * \return the card drawn, or none if the shoe is empty
     */
    std::optional<CardType> drawCard();

    /** \brief Ensure there are enough cards for a deal
     *
     * If the shoe holds fewer cards than two cards for each player and the
     * dealer, doubled for the draws during the round, the shoe is
     * replenished.
     *
     * \param nPlayers the number of players excluding the dealer
     *
     * \return true if the shoe was replenished, false otherwise
     */
    bool ensureCardsForPlayers(int nPlayers);

    /** \brief Replace the contents with freshly shuffled decks
     *
     * The discard pile is emptied.
     */
    void replenish();

    /** \brief Get the number of decks in the shoe
     */
    int getDeckCount() const;

    /** \brief Get the cards that can be drawn
     *
     * The last card is drawn next.
     */
    const CardVector& getAvailableCards() const;

    /** \brief Get the cards drawn since the shoe was last replenished
     */
    const CardVector& getDiscardedCards() const;

    /** \brief Get the number of cards that can be drawn
     */
    std::size_t getNumberOfAvailableCards() const;

    /** \brief Get the number of cards drawn since last replenished
     */
    std::size_t getNumberOfDiscardedCards() const;

private:

    static int internalCheckDeckCount(int deckCount);

    int deckCount;
    CardVector available;
    CardVector discarded;
};

template<typename CardTypeIterator>
Shoe::Shoe(
    const int deckCount, CardTypeIterator first, CardTypeIterator last) :
    deckCount {internalCheckDeckCount(deckCount)},
    available(first, last)
{
    std::reverse(available.begin(), available.end());
}

}

#endif // BLACKJACK_SHOE_HH_
