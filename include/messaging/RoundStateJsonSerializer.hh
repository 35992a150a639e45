/** \file
 *
 * \brief Definition of JSON serializer for Blackjack::RoundState
 *
 * \page jsonroundstate Round state JSON representation
 *
 * A Blackjack::RoundState is represented by a JSON object consisting of the
 * following:
 *
 * \code{.json}
 * {
 *     "phase": <phase>,
 *     "bankroll": <bankroll>,
 *     "bet": <bet>,
 *     "dealerHand": <dealerHand>,
 *     "playerHands": [ <hand>, ... ],
 *     "activeHandIndex": <activeHandIndex>
 * }
 * \endcode
 *
 * - &lt;phase&gt; is a string representing the phase of the round. It must
 *   be one of the following: "waitingForBet", "waitingToDeal", "playerTurn",
 *   "dealerTurn", "roundComplete".
 * - &lt;bankroll&gt; is a number representing the bankroll of the player.
 * - &lt;bet&gt; is the bet placed, or the bet of the first player hand once
 *   the cards are dealt. Null when waiting for bet.
 * - &lt;dealerHand&gt; is the hand of the dealer. See \ref jsonhand. Null
 *   before the cards are dealt.
 * - &lt;hand&gt; is a hand of the player. See \ref jsonhand. The array is
 *   null before the cards are dealt.
 * - &lt;activeHandIndex&gt; is the index of the hand in turn. Null unless
 *   the phase is "playerTurn".
 */

#ifndef MESSAGING_ROUNDSTATEJSONSERIALIZER_HH_
#define MESSAGING_ROUNDSTATEJSONSERIALIZER_HH_

#include "blackjack/RoundState.hh"

#include <nlohmann/json.hpp>

#include <string>

namespace Blackjack {

/** \brief Key for the phase
 *
 * \sa \ref jsonroundstate
 */
extern const std::string ROUND_STATE_PHASE_KEY;

/** \brief Key for the bankroll
 *
 * \sa \ref jsonroundstate
 */
extern const std::string ROUND_STATE_BANKROLL_KEY;

/** \brief Key for the bet
 *
 * \sa \ref jsonroundstate
 */
extern const std::string ROUND_STATE_BET_KEY;

/** \brief Key for the dealer hand
 *
 * \sa \ref jsonroundstate
 */
extern const std::string ROUND_STATE_DEALER_HAND_KEY;

/** \brief Key for the player hands
 *
 * \sa \ref jsonroundstate
 */
extern const std::string ROUND_STATE_PLAYER_HANDS_KEY;

/** \brief Key for the active hand index
 *
 * \sa \ref jsonroundstate
 */
extern const std::string ROUND_STATE_ACTIVE_HAND_INDEX_KEY;

/** \brief Convert RoundPhase to JSON
 */
void to_json(nlohmann::json&, RoundPhase);

/** \brief Convert JSON to RoundPhase
 *
 * \throw Messaging::SerializationFailureException if the JSON does not
 * represent a phase
 */
void from_json(const nlohmann::json&, RoundPhase&);

}

namespace nlohmann {

/** \brief JSON converter for round states
 *
 * RoundState is an alias of a standard variant, so the converter cannot be
 * found by argument dependent lookup.
 */
template<>
struct adl_serializer<Blackjack::RoundState>
{
    /** \brief Convert round state to JSON
     */
    static void to_json(json&, const Blackjack::RoundState&);

    /** \brief Convert JSON to round state
     *
     * \throw Blackjack::Messaging::SerializationFailureException if a field
     * required by the phase is null, or a field is invalid
     */
    static void from_json(const json&, Blackjack::RoundState&);
};

}

#endif // MESSAGING_ROUNDSTATEJSONSERIALIZER_HH_
