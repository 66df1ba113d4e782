/** \file
 *
 * \brief JSON serialization policy
 *
 * Every parameter and reply value of the tarot protocol is a JSON document
 * encoded with nlohmann::json.
 *
 * \sa \ref serializationpolicy
 */

#ifndef MESSAGING_JSONSERIALIZER_HH_
#define MESSAGING_JSONSERIALIZER_HH_

#include "messaging/SerializationFailureException.hh"
#include "Blob.hh"

#include <nlohmann/json.hpp>

#include <iterator>
#include <string>
#include <string_view>
#include <utility>

namespace Tarot {
namespace Messaging {

/** \brief Serialization policy dumping values as UTF‐8 JSON
 *
 * Types are converted with the \c to_json and \c from_json overloads found
 * by nlohmann::json.
 *
 * \sa FunctionMessageHandler
 */
struct JsonSerializer {

    /// Convert \p t to JSON and dump it
    template<typename T> static std::string serialize(T&& t)
    {
        return nlohmann::json(std::forward<T>(t)).dump();
    }

    /** \brief Parse \p s as JSON and convert it to \c T
     *
     * \throw SerializationFailureException if \p s is not valid JSON or does
     * not convert to \c T
     */
    template<typename T, typename String>
    static T deserialize(String&& s)
    {
        static_assert(sizeof(*std::data(s)) == 1);
        const auto sv = std::string_view(
            reinterpret_cast<const char*>(std::data(s)), std::size(s));
        try {
            return nlohmann::json::parse(sv).template get<T>();
        } catch (const nlohmann::json::exception& e) {
            throw SerializationFailureException {e.what()};
        }
    }
};

}
}

#endif // MESSAGING_JSONSERIALIZER_HH_
