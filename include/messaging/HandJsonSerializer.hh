/** \file
 *
 * \brief Definition of JSON serializer for Blackjack::Hand
 *
 * \page jsonhand Hand JSON representation
 *
 * A Blackjack::Hand is represented by a JSON object consisting of the
 * following:
 *
 * \code{.json}
 * {
 *     "cards": [ <card>, ... ],
 *     "bet": <bet>,
 *     "outcome": <outcome>,
 *     "value": <value>
 * }
 * \endcode
 *
 * - &lt;card&gt; is a card in the order they were dealt. See \ref
 *   jsoncardtype.
 * - &lt;bet&gt; is a number representing the bet placed on the hand.
 * - &lt;outcome&gt; is a string representing the outcome of the hand. It
 *   must be one of the following: "win", "loss", "push", "blackjack", or
 *   null if the hand is not settled.
 * - &lt;value&gt; is the best value of the hand. It is informational and is
 *   ignored when deserializing.
 */

#ifndef MESSAGING_HANDJSONSERIALIZER_HH_
#define MESSAGING_HANDJSONSERIALIZER_HH_

#include "blackjack/Hand.hh"

#include <nlohmann/json.hpp>

#include <string>

namespace Blackjack {

/** \brief Key for Hand::getCards()
 *
 * \sa \ref jsonhand
 */
extern const std::string HAND_CARDS_KEY;

/** \brief Key for Hand::getBet()
 *
 * \sa \ref jsonhand
 */
extern const std::string HAND_BET_KEY;

/** \brief Key for Hand::getOutcome()
 *
 * \sa \ref jsonhand
 */
extern const std::string HAND_OUTCOME_KEY;

/** \brief Key for Hand::getBestValue()
 *
 * \sa \ref jsonhand
 */
extern const std::string HAND_VALUE_KEY;

/** \brief Convert HandOutcome to JSON
 */
void to_json(nlohmann::json&, HandOutcome);

/** \brief Convert JSON to HandOutcome
 *
 * \throw Messaging::SerializationFailureException if the JSON does not
 * represent an outcome
 */
void from_json(const nlohmann::json&, HandOutcome&);

/** \brief Convert Hand to JSON
 */
void to_json(nlohmann::json&, const Hand&);

/** \brief Convert JSON to Hand
 *
 * \throw Messaging::SerializationFailureException if the bet is negative
 */
void from_json(const nlohmann::json&, Hand&);

}

#endif // MESSAGING_HANDJSONSERIALIZER_HH_
