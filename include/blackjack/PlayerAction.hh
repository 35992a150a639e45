/** \file
 *
 * \brief Definition of Blackjack::PlayerAction enumeration
 */

#ifndef BLACKJACK_PLAYERACTION_HH_
#define BLACKJACK_PLAYERACTION_HH_

#include <iosfwd>
#include <optional>
#include <string_view>

namespace Blackjack {

/** \brief Action a player takes on the active hand
 */
enum class PlayerAction {
    HIT,     ///< Draw one card
    STAND,   ///< Finish the hand
    DOUBLE,  ///< Double the bet, draw one card and finish the hand
    SPLIT,   ///< Split a pair into two hands
};

/** \brief Parse player action
 *
 * The accepted tokens are “h” or “hit”, “s” or “stand”, “d” or “double”
 * and “p” or “split”. Parsing ignores case and surrounding whitespace.
 *
 * \param str the string to parse
 *
 * \return the action, or none if \p str is not a recognized token
 */
std::optional<PlayerAction> playerActionFromString(std::string_view str);

/** \brief Return the name of a player action
 *
 * \return "HIT", "STAND", "DOUBLE" or "SPLIT"
 */
std::string_view playerActionToString(PlayerAction action);

/** \brief Output a PlayerAction to stream
 */
std::ostream& operator<<(std::ostream& os, PlayerAction action);

}

#endif // BLACKJACK_PLAYERACTION_HH_
