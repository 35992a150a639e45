/** \file
 *
 * \brief The common random number generator
 */

#ifndef BLACKJACK_RANDOM_HH_
#define BLACKJACK_RANDOM_HH_

#include <random>

namespace Blackjack {

/** \brief The preferred random number generator for the Blackjack library
 */
using Rng = std::mt19937;

/** \brief Get reference to the global random number generator
 *
 * \return Reference to the global random number generator
 */
Rng& getRng();

}

#endif // BLACKJACK_RANDOM_HH_
