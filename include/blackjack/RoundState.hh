/** \file
 *
 * \brief Definition of Blackjack::RoundState and its alternatives
 *
 * A RoundState is meant to be produced by the engine and consumed by a user
 * interface or a network session to describe the complete state of a round.
 * Each alternative carries exactly the data that is valid in the
 * corresponding phase of the round.
 */

#ifndef BLACKJACK_ROUNDSTATE_HH_
#define BLACKJACK_ROUNDSTATE_HH_

#include "blackjack/BlackjackConstants.hh"
#include "blackjack/Hand.hh"

#include <boost/bimap/bimap.hpp>

#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace Blackjack {

/** \brief Phase of a round
 */
enum class RoundPhase {
    WAITING_FOR_BET,
    WAITING_TO_DEAL,
    PLAYER_TURN,
    DEALER_TURN,
    ROUND_COMPLETE,
};

/** \brief Type of \ref ROUND_PHASE_TO_STRING_MAP
 */
using RoundPhaseToStringMap = boost::bimaps::bimap<RoundPhase, std::string>;

/** \brief Two-way map between RoundPhase enumerations and their string
 * representation
 */
extern const RoundPhaseToStringMap ROUND_PHASE_TO_STRING_MAP;

/** \brief The player is expected to place a bet
 */
struct WaitingForBet {
    Money bankroll;  ///< \brief Bankroll of the player

    /// \brief Equality operator
    bool operator==(const WaitingForBet&) const = default;
};

/** \brief The bet is placed and the initial cards can be dealt
 */
struct WaitingToDeal {
    Money bet;       ///< \brief The bet placed
    Money bankroll;  ///< \brief Bankroll of the player, bet deducted

    /// \brief Equality operator
    bool operator==(const WaitingToDeal&) const = default;
};

/** \brief The player acts on the active hand
 */
struct PlayerTurn {
    Hand dealerHand;               ///< \brief The hand of the dealer
    std::vector<Hand> playerHands; ///< \brief The hands of the player
    Money bankroll;                ///< \brief Bankroll of the player
    std::size_t activeHandIndex;   ///< \brief Index of the hand in turn

    /// \brief Equality operator
    bool operator==(const PlayerTurn&) const = default;
};

/** \brief The dealer plays its hand
 */
struct DealerTurn {
    Hand dealerHand;               ///< \brief The hand of the dealer
    std::vector<Hand> playerHands; ///< \brief The hands of the player
    Money bankroll;                ///< \brief Bankroll of the player

    /// \brief Equality operator
    bool operator==(const DealerTurn&) const = default;
};

/** \brief The round is settled
 *
 * Every player hand carries its outcome and the bankroll includes the
 * payouts.
 */
struct RoundComplete {
    Hand dealerHand;               ///< \brief The hand of the dealer
    std::vector<Hand> playerHands; ///< \brief The hands of the player
    Money bankroll;                ///< \brief Bankroll of the player

    /// \brief Equality operator
    bool operator==(const RoundComplete&) const = default;
};

/** \brief Snapshot of a round
 */
using RoundState = std::variant<
    WaitingForBet, WaitingToDeal, PlayerTurn, DealerTurn, RoundComplete>;

/** \brief Determine the phase of a round state
 */
RoundPhase getPhase(const RoundState& state);

/** \brief Determine the bankroll in a round state
 */
Money getBankroll(const RoundState& state);

/** \brief Determine the bet in a round state
 *
 * \return The bet of the first player hand, or none if no bet is placed
 */
std::optional<Money> getBet(const RoundState& state);

/** \brief Determine the dealer hand in a round state
 *
 * \return pointer to the dealer hand, or nullptr if cards are not dealt
 */
const Hand* getDealerHand(const RoundState& state);

/** \brief Determine the player hands in a round state
 *
 * \return pointer to the player hands, or nullptr if cards are not dealt
 */
const std::vector<Hand>* getPlayerHands(const RoundState& state);

/** \brief Determine the active hand index in a round state
 *
 * \return the active hand index, or none if the player is not in turn
 */
std::optional<std::size_t> getActiveHandIndex(const RoundState& state);

/** \brief Output a RoundPhase to stream
 */
std::ostream& operator<<(std::ostream& os, RoundPhase phase);

/** \brief Output WaitingForBet to stream
 */
std::ostream& operator<<(std::ostream& os, const WaitingForBet& state);

/** \brief Output WaitingToDeal to stream
 */
std::ostream& operator<<(std::ostream& os, const WaitingToDeal& state);

/** \brief Output PlayerTurn to stream
 */
std::ostream& operator<<(std::ostream& os, const PlayerTurn& state);

/** \brief Output DealerTurn to stream
 */
std::ostream& operator<<(std::ostream& os, const DealerTurn& state);

/** \brief Output RoundComplete to stream
 */
std::ostream& operator<<(std::ostream& os, const RoundComplete& state);

}

#endif // BLACKJACK_ROUNDSTATE_HH_
