/** \file
 *
 * \brief Definition of Tarot::Messaging::SerializationFailureException class
 *
 * \page serializationpolicy SerializationPolicy concept
 *
 * FunctionMessageHandler uses serialization policy objects to translate to and
 * from the “wire” presentation of objects. Given object \c serializer and
 * serializable object \c t of type \c T, the following expressions must be
 * valid:
 *
 * Expression                                         | Return value
 * ---------------------------------------------------|--------------
 * serializer.serialize(t)                            | see below
 * serializer.deserialize<T>(serializer.serialize(t)) | equal to \c t
 *
 * The serialized object must be a contiguous sequence of 1‐byte objects.
 *
 * \c deserialize may in addition signal deserialization error by throwing an
 * instance of Tarot::Messaging::SerializationFailureException.
 */

#ifndef MESSAGING_SERIALIZATIONFAILUREEXCEPTION_HH_
#define MESSAGING_SERIALIZATIONFAILUREEXCEPTION_HH_

#include <stdexcept>

namespace Tarot {
namespace Messaging {

/** \brief Exception to indicate error in serialization or deserialization
 *
 * This non-fatal exception is used by serialization policy to signal that the
 * serializer was unable to perform the serialization or deserialization. A
 * message handler receiving it replies with failure.
 *
 * \sa \ref serializationpolicy
 */
class SerializationFailureException : public std::runtime_error {
public:

    /** \brief Create exception with a generic message
     */
    SerializationFailureException();

    /** \brief Create exception
     *
     * \param what the description of the failure
     */
    explicit SerializationFailureException(const std::string& what);
};

}
}

#endif // MESSAGING_SERIALIZATIONFAILUREEXCEPTION_HH_
