#include "messaging/SerializationFailureException.hh"

#include <string>

namespace Tarot {
namespace Messaging {

SerializationFailureException::SerializationFailureException() :
    std::runtime_error {"Serialization failed"}
{
}

SerializationFailureException::SerializationFailureException(
    const std::string& what) :
    std::runtime_error {what}
{
}

}
}
