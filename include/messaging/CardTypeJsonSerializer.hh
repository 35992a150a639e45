/** \file
 *
 * \brief Definition of JSON serializer for Blackjack::CardType
 *
 * \page jsoncardtype Card type JSON representation
 *
 * A Blackjack::CardType is represented by a JSON object consisting of the
 * following:
 *
 * \code{.json}
 * {
 *     { "rank": <rank> },
 *     { "suit": <suit> }
 * }
 * \endcode
 *
 * - &lt;rank&gt; is a string representing the rank of the card. It must be
 *   one of the following: "2", "3" "4", "5", "6", "7", "8", "9", "10",
 *   "jack", "queen", "king", "ace".
 * - &lt;suit&gt; is a string representing the suit of the card. It must be
 *   one of the following: "clubs", "diamonds", "hearts", "spades".
 */

#ifndef MESSAGING_CARDTYPEJSONSERIALIZER_HH_
#define MESSAGING_CARDTYPEJSONSERIALIZER_HH_

#include "blackjack/CardType.hh"

#include <nlohmann/json.hpp>

#include <string>

namespace Blackjack {

/** \brief Key for CardType::rank
 *
 * \sa \ref jsoncardtype
 */
extern const std::string CARD_TYPE_RANK_KEY;

/** \brief Key for CardType::suit
 *
 * \sa \ref jsoncardtype
 */
extern const std::string CARD_TYPE_SUIT_KEY;

/** \brief Convert Rank to JSON
 */
void to_json(nlohmann::json&, Rank);

/** \brief Convert JSON to Rank
 *
 * \throw Messaging::SerializationFailureException if the JSON does not
 * represent a rank
 */
void from_json(const nlohmann::json&, Rank&);

/** \brief Convert Suit to JSON
 */
void to_json(nlohmann::json&, Suit);

/** \brief Convert JSON to Suit
 *
 * \throw Messaging::SerializationFailureException if the JSON does not
 * represent a suit
 */
void from_json(const nlohmann::json&, Suit&);

/** \brief Convert CardType to JSON
 */
void to_json(nlohmann::json&, const CardType&);

/** \brief Convert JSON to CardType
 */
void from_json(const nlohmann::json& j, CardType&);

}

#endif // MESSAGING_CARDTYPEJSONSERIALIZER_HH_
