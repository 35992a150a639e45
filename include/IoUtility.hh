/** \file
 *
 * \brief Definition of output stream utilities
 *
 * The utilities are generic but live in the Blackjack namespace so that the
 * logging utility can find them without polluting the global namespace.
 */

#ifndef IOUTILITY_HH_
#define IOUTILITY_HH_

#include <optional>
#include <ostream>
#include <variant>
#include <vector>

namespace Blackjack {

/** \brief Output optional value
 *
 * Outputs the wrapped value if \p t is not empty, and “(none)” otherwise.
 *
 * \param os the output stream
 * \param t the value to be written to \p os
 */
template<typename T>
std::ostream& operator<<(std::ostream& os, const std::optional<T>& t)
{
    if (t) {
        return os << *t;
    }
    return os << "(none)";
}

/** \brief Output variant
 *
 * Writes the active alternative of \p t using its operator<<.
 *
 * \param os the output stream
 * \param t the value to be written to \p os
 */
template<typename T, typename... Ts>
std::ostream& operator<<(std::ostream& os, const std::variant<T, Ts...>& t)
{
    std::visit([&os](const auto& v) { os << v; }, t);
    return os;
}

/** \brief Output vector
 *
 * Writes the elements of \p ts separated by commas and enclosed in brackets.
 *
 * \param os the output stream
 * \param ts the values to be written to \p os
 */
template<typename T>
std::ostream& operator<<(std::ostream& os, const std::vector<T>& ts)
{
    os << "[";
    auto first = true;
    for (const auto& t : ts) {
        if (!first) {
            os << ", ";
        }
        os << t;
        first = false;
    }
    return os << "]";
}

}

#endif // IOUTILITY_HH_
