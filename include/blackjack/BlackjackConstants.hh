/** \file
 *
 * \brief Definition of fundamental blackjack constants needed by several
 * classes
 */

#ifndef BLACKJACK_BLACKJACKCONSTANTS_HH_
#define BLACKJACK_BLACKJACKCONSTANTS_HH_

/** \brief Top level namespace of the Blackjack library
 *
 * The Blackjack namespace directly contains the card, hand, shoe and round
 * state types. The state machine driving a round lives in the Engine
 * subnamespace and JSON serialization in the Messaging subnamespace.
 */
namespace Blackjack {

/** \brief Type used for bets and bankrolls
 */
using Money = double;

/** \brief Number of ranks in a deck
 */
constexpr auto N_RANKS = 13;

/** \brief Number of suits in a deck
 */
constexpr auto N_SUITS = 4;

/** \brief Number of cards in a single playing card deck
 */
constexpr auto N_CARDS_PER_DECK = N_RANKS * N_SUITS; // 52

/** \brief Smallest number of decks in a shoe
 */
constexpr auto MIN_DECKS = 1;

/** \brief Largest number of decks in a shoe
 */
constexpr auto MAX_DECKS = 8;

/** \brief The best hand total, exceeding it busts the hand
 */
constexpr auto BLACKJACK_VALUE = 21;

/** \brief The dealer draws while the best value of its hand is at most this
 */
constexpr auto DEALER_HIT_LIMIT = 16;

/** \brief Number of cards dealt to each participant in the initial deal
 */
constexpr auto N_INITIAL_CARDS = 2;

/** \brief Amount credited for a natural blackjack, relative to the bet
 *
 * Stake plus 3:2 profit.
 */
constexpr auto BLACKJACK_PAYOUT = Money {2.5};

/** \brief Amount credited for a won hand, relative to the bet
 */
constexpr auto WIN_PAYOUT = Money {2};

/** \brief Amount credited for a pushed hand, relative to the bet
 */
constexpr auto PUSH_PAYOUT = Money {1};

/** \brief Bankroll of a player unless configured otherwise
 */
constexpr auto DEFAULT_BANKROLL = Money {10000};

}

#endif // BLACKJACK_BLACKJACKCONSTANTS_HH_
