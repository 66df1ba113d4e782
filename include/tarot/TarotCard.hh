/** \file
 *
 * \brief Definition of Tarot::TarotCard and Tarot::Orientation
 */

#ifndef TAROT_TAROTCARD_HH_
#define TAROT_TAROTCARD_HH_

#include <boost/operators.hpp>

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace Tarot {

/** \brief Orientation of a drawn card
 *
 * The orientation is chosen independently for each card whenever it is
 * drawn. It is never recorded.
 */
enum class Orientation {
    UPRIGHT,
    REVERSED,
};

/** \brief Get the name of an orientation
 *
 * \return "upright" or "reversed"
 */
std::string_view orientationName(Orientation orientation);

/** \brief Convert name to orientation
 *
 * \param name the name, as returned by orientationName()
 *
 * \return the orientation, or none if \p name is not an orientation name
 */
std::optional<Orientation> orientationFromName(std::string_view name);

/** \brief A card in the tarot deck
 *
 * A card is created once when the deck is loaded and never modified
 * afterwards.
 *
 * \note Boost operators library is used to ensure that operator!= is
 * generated with usual semantics when operator== is supplied.
 */
struct TarotCard : private boost::equality_comparable<TarotCard> {

    /** \brief Create card with default (empty) values
     */
    TarotCard();

    /** \brief Create card
     *
     * \param index see \ref index
     * \param name see \ref name
     * \param chineseName see \ref chineseName
     * \param japaneseName see \ref japaneseName
     * \param uprightMeaning see \ref uprightMeaning
     * \param reversedMeaning see \ref reversedMeaning
     */
    TarotCard(
        int index, std::string name, std::string chineseName,
        std::string japaneseName, std::string uprightMeaning,
        std::string reversedMeaning);

    int index {};                ///< \brief Index of the card in the deck
    std::string name;            ///< \brief Display name
    std::string chineseName;     ///< \brief Chinese name
    std::string japaneseName;    ///< \brief Japanese name
    std::string uprightMeaning;  ///< \brief Meaning of the upright card
    std::string reversedMeaning; ///< \brief Meaning of the reversed card

    /** \brief Get the meaning matching an orientation
     *
     * \param orientation the orientation
     *
     * \return uprightMeaning or reversedMeaning
     */
    const std::string& getMeaning(Orientation orientation) const;
};

/** \brief Equality operator for tarot cards
 */
bool operator==(const TarotCard&, const TarotCard&);

/** \brief Output an orientation to stream
 */
std::ostream& operator<<(std::ostream& os, Orientation orientation);

/** \brief Output a tarot card to stream
 *
 * Only the index and the display name are written.
 */
std::ostream& operator<<(std::ostream& os, const TarotCard& card);

}

#endif // TAROT_TAROTCARD_HH_
