/** \file
 *
 * \brief Definition of Blackjack::Messaging::SerializationFailureException class
 */

#ifndef MESSAGING_SERIALIZATIONFAILUREEXCEPTION_HH_
#define MESSAGING_SERIALIZATIONFAILUREEXCEPTION_HH_

#include <exception>

namespace Blackjack {
namespace Messaging {

/** \brief Exception to indicate error in serialization or deserialization
 *
 * This non-fatal exception is used by the serializers to signal that a JSON
 * document could not be converted to the requested type, either because it
 * is malformed or because it does not describe a valid object.
 */
class SerializationFailureException : public std::exception {
public:
    /// \brief Get the explanatory string
    const char* what() const noexcept override
    {
        return "Serialization failure";
    }
};

}
}

#endif // MESSAGING_SERIALIZATIONFAILUREEXCEPTION_HH_
