/** \file
 *
 * \brief Definition of JSON serializer for Tarot::Engine::DrawnCard
 *
 * \page jsondrawncard Drawn card JSON representation
 *
 * A Tarot::Engine::DrawnCard is represented by a JSON object consisting of the
 * following:
 *
 * \code{.json}
 * {
 *     "index": <index>,
 *     "card": <name>,
 *     "chineseName": <chinese name>,
 *     "japaneseName": <japanese name>,
 *     "orientation": <orientation>,
 *     "meaning": <meaning>
 * }
 * \endcode
 *
 * - &lt;index&gt; is the integer index of the card in the deck
 * - &lt;orientation&gt; is either "upright" or "reversed"
 * - the rest are strings. &lt;meaning&gt; is the meaning of the card in the
 *   drawn orientation.
 */

#ifndef MESSAGING_DRAWNCARDJSONSERIALIZER_HH_
#define MESSAGING_DRAWNCARDJSONSERIALIZER_HH_

#include "tarot/TarotCard.hh"

#include <nlohmann/json.hpp>

#include <string>

namespace Tarot {

namespace Engine {

struct DrawnCard;

/** \brief Key for DrawnCard::index
 *
 * \sa \ref jsondrawncard
 */
extern const std::string DRAWN_CARD_INDEX_KEY;

/** \brief Key for DrawnCard::name
 *
 * \sa \ref jsondrawncard
 */
extern const std::string DRAWN_CARD_NAME_KEY;

/** \brief Key for DrawnCard::chineseName
 *
 * \sa \ref jsondrawncard
 */
extern const std::string DRAWN_CARD_CHINESE_NAME_KEY;

/** \brief Key for DrawnCard::japaneseName
 *
 * \sa \ref jsondrawncard
 */
extern const std::string DRAWN_CARD_JAPANESE_NAME_KEY;

/** \brief Key for DrawnCard::orientation
 *
 * \sa \ref jsondrawncard
 */
extern const std::string DRAWN_CARD_ORIENTATION_KEY;

/** \brief Key for DrawnCard::meaning
 *
 * \sa \ref jsondrawncard
 */
extern const std::string DRAWN_CARD_MEANING_KEY;

/** \brief Convert DrawnCard to JSON
 */
void to_json(nlohmann::json&, const DrawnCard&);

/** \brief Convert JSON to DrawnCard
 */
void from_json(const nlohmann::json&, DrawnCard&);

}

/** \brief Convert Orientation to JSON
 */
void to_json(nlohmann::json&, Orientation);

/** \brief Convert JSON to Orientation
 *
 * \throw Messaging::SerializationFailureException if the JSON is not an
 * orientation name
 */
void from_json(const nlohmann::json&, Orientation&);

}

#endif // MESSAGING_DRAWNCARDJSONSERIALIZER_HH_
