/** \file
 *
 * \brief Definition of JSON serialization utilities
 */

#ifndef MESSAGING_JSONSERIALIZERUTILITY_HH_
#define MESSAGING_JSONSERIALIZERUTILITY_HH_

#include "messaging/SerializationFailureException.hh"

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace Blackjack {
namespace Messaging {

/** \brief Validate a deserialized value
 *
 * This function is intended to be used for an deserialized object when
 * additional validation is needed.
 *
 * \tparam Preds Predicates that can be invoked with \p t and whose return value
 * is convertible to bool.
 *
 * \param t the object to validate
 * \param preds the predicates used to validate \p t
 *
 * \return the object \p t if all predicates evaluate to true
 *
 * \throw SerializationFailureException if any predicate evaluates to false
 */
template<typename T, typename... Preds>
T validate(T&& t, Preds&&... preds)
{
    if ( ( ... && std::invoke(std::forward<Preds>(preds), t) ) ) {
        return t;
    }
    throw SerializationFailureException {};
}

/** \brief Convert JSON string to enumeration
 *
 * \param j the JSON object to convert
 * \param parse function that parses the enumeration from a string, returning
 * an optional
 *
 * \return the enumeration parsed from \p j
 *
 * \throw SerializationFailureException if \p j is not a string, or \p parse
 * returns none
 */
template<typename Parse>
auto jsonToEnum(const nlohmann::json& j, Parse&& parse)
{
    if (!j.is_string()) {
        throw SerializationFailureException {};
    }
    const auto& str = j.get_ref<const nlohmann::json::string_t&>();
    if (const auto e = std::invoke(std::forward<Parse>(parse), str)) {
        return *e;
    }
    throw SerializationFailureException {};
}

/** \brief Convert optional value to JSON
 *
 * \return \p t converted to JSON, or null if \p t is empty
 */
template<typename T>
nlohmann::json optionalToJson(const std::optional<T>& t)
{
    if (t) {
        return *t;
    }
    return nullptr;
}

/** \brief Convert JSON to optional value
 *
 * \return none if \p j is null, otherwise \p j converted to \c T
 */
template<typename T>
std::optional<T> jsonToOptional(const nlohmann::json& j)
{
    if (j.is_null()) {
        return std::nullopt;
    }
    return j.get<T>();
}

/** \brief Convert JSON object to an object, ignoring errors
 *
 * This function tries to convert JSON object to an object of type \c T, except
 * it catches any exceptions and returns empty value instead on error.
 *
 * \param j the JSON object to covert
 *
 * \return \p j converted to object of type \c T, or none if exception is thrown
 * while converting
 */
template<typename T>
std::optional<T> tryFromJson(const nlohmann::json& j)
{
    try {
        return j.get<T>();
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

}
}

#endif // MESSAGING_JSONSERIALIZERUTILITY_HH_
