/** \file
 *
 * \brief Definition of general purpose utilities
 *
 * The utilities do not depend on the blackjack domain but are kept inside the
 * Blackjack namespace to avoid name conflicts.
 */

#ifndef UTILITY_HH_
#define UTILITY_HH_

#include <concepts>
#include <ranges>
#include <stdexcept>
#include <utility>

namespace Blackjack {

/** \brief Check that 0 <= i < n
 *
 * \param i the index to check
 * \param n the upper bound
 *
 * \return i, if 0 <= i < n
 *
 * \throw std::out_of_range, if i < 0 || i >= n
 */
template<typename Integer1, typename Integer2>
constexpr auto checkIndex(Integer1 i, Integer2 n)
{
    if (std::cmp_less(i, 0) || std::cmp_greater_equal(i, n)) {
        throw std::out_of_range("Index out of range");
    }
    return i;
}

/** \brief Check if pointer (or pointer‐like object) is dereferenceable, and
 * dereference it
 *
 * \param p pointer to be dereferenced
 *
 * \return reference to whatever p points to
 *
 * \throw std::invalid_argument, if p is empty
 */
template<typename T>
constexpr decltype(auto) dereference(const T& p)
{
    if (!p) {
        throw std::invalid_argument("Trying to dereference empty value");
    }
    return *p;
}

/** \brief Range over integers
 *
 * Generate an increasing range over integers from 0 to \p n (exclusive).
 *
 * \param n the upper bound of the range
 *
 * \return A range from 0 to \p n (exclusive upper bound)
 *
 * \throw std::invalid_argument if \p n < 0
 */
template<std::integral Integer>
constexpr auto to(Integer n)
{
    if (n < Integer {}) {
        throw std::invalid_argument {"Invalid integer range"};
    }
    return std::ranges::views::iota(Integer {}, n);
}

}

#endif // UTILITY_HH_
