/** \file
 *
 * \brief Definition of Blackjack::CardType struct and related concepts
 */

#ifndef BLACKJACK_CARDTYPE_HH_
#define BLACKJACK_CARDTYPE_HH_

#include <boost/bimap/bimap.hpp>
#include <boost/operators.hpp>

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Blackjack {

/** \brief Rank of a playing card
 *
 * The ranks are ordered from two to ace. The numeric value of the
 * enumerators is the index of the rank and not its blackjack value.
 *
 * \sa getValues()
 */
enum class Rank {
    TWO,
    THREE,
    FOUR,
    FIVE,
    SIX,
    SEVEN,
    EIGHT,
    NINE,
    TEN,
    JACK,
    QUEEN,
    KING,
    ACE,
};

/** \brief Suit of a playing card
 */
enum class Suit {
    CLUBS,
    DIAMONDS,
    HEARTS,
    SPADES,
};

/** \brief Type of \ref RANK_TO_STRING_MAP
 */
using RankToStringMap = boost::bimaps::bimap<Rank, std::string>;

/** \brief Two-way map between Rank enumerations and their string
 * representation
 */
extern const RankToStringMap RANK_TO_STRING_MAP;

/** \brief Type of \ref SUIT_TO_STRING_MAP
 */
using SuitToStringMap = boost::bimaps::bimap<Suit, std::string>;

/** \brief Two-way map between Suit enumerations and their string
 * representation
 */
extern const SuitToStringMap SUIT_TO_STRING_MAP;

/** \brief Playing card type
 *
 * CardType objects are equality comparable. They compare equal when both rank
 * and suit are equal.
 *
 * \note Boost operators library is used to ensure that operator!= is
 * generated with usual semantics when operator== is supplied.
 */
struct CardType : private boost::equality_comparable<CardType> {
    Rank rank;  ///< \brief Rank of the card
    Suit suit;  ///< \brief Suit of the card

    CardType() = default;

    /** \brief Create new card type
     *
     * \param rank the rank of the card
     * \param suit the suit of the card
     */
    constexpr CardType(Rank rank, Suit suit) :
        rank {rank},
        suit {suit}
    {
    }
};

/** \brief Equality operator for card types
 *
 * \sa CardType
 */
bool operator==(const CardType&, const CardType&);

/** \brief Determine if the rank is an ace
 */
constexpr bool isAce(Rank rank)
{
    return rank == Rank::ACE;
}

/** \brief Determine the fixed value of a rank
 *
 * \return The value of the rank, counting an ace as one
 */
constexpr int getHardValue(Rank rank)
{
    switch (rank) {
    case Rank::JACK:
    case Rank::QUEEN:
    case Rank::KING:
        return 10;
    case Rank::ACE:
        return 1;
    default:
        return static_cast<int>(rank) + 2;
    }
}

/** \brief Determine the values a rank may contribute to a hand
 *
 * \return A vector containing the single value of the rank, or the values
 * one and eleven (in this order) for an ace
 */
std::vector<int> getValues(Rank rank);

/** \brief Return textual representation of a rank
 *
 * \return "2" to "10", "jack", "queen", "king" or "ace"
 */
std::string_view rankToString(Rank rank);

/** \brief Return textual representation of a suit
 *
 * \return "clubs", "diamonds", "hearts" or "spades"
 */
std::string_view suitToString(Suit suit);

/** \brief Parse rank from its textual representation
 *
 * \return The rank, or none if \p str is not a textual representation of
 * any rank
 *
 * \sa rankToString()
 */
std::optional<Rank> rankFromString(std::string_view str);

/** \brief Parse suit from its textual representation
 *
 * \return The suit, or none if \p str is not a textual representation of
 * any suit
 *
 * \sa suitToString()
 */
std::optional<Suit> suitFromString(std::string_view str);

/** \brief Output a Rank to stream
 *
 * \param os the output stream
 * \param rank the rank to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, Rank rank);

/** \brief Output a Suit to stream
 *
 * \param os the output stream
 * \param suit the suit to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, Suit suit);

/** \brief Output a CardType to stream
 *
 * \param os the output stream
 * \param cardType the card type to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, CardType cardType);

}

#endif // BLACKJACK_CARDTYPE_HH_
