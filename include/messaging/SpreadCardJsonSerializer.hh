/** \file
 *
 * \brief Definition of JSON serializer for Tarot::Main::SpreadCard
 *
 * \page jsonspreadcard Spread card JSON representation
 *
 * A Tarot::Main::SpreadCard is represented by the JSON object of the drawn
 * card (see \ref jsondrawncard) with one additional member:
 *
 * \code{.json}
 * {
 *     ...,
 *     "role": <role>
 * }
 * \endcode
 *
 * &lt;role&gt; is the position of the card in the spread, one of “past”,
 * “present” or “future”.
 */

#ifndef MESSAGING_SPREADCARDJSONSERIALIZER_HH_
#define MESSAGING_SPREADCARDJSONSERIALIZER_HH_

#include <nlohmann/json.hpp>

#include <string>

namespace Tarot {
namespace Main {

struct SpreadCard;

/** \brief Key for SpreadCard::role
 *
 * \sa \ref jsonspreadcard
 */
extern const std::string SPREAD_CARD_ROLE_KEY;

/** \brief Convert SpreadCard to JSON
 */
void to_json(nlohmann::json&, const SpreadCard&);

/** \brief Convert JSON to SpreadCard
 */
void from_json(const nlohmann::json&, SpreadCard&);

}
}

#endif // MESSAGING_SPREADCARDJSONSERIALIZER_HH_
