/** \file
 *
 * \brief Definition of the three card spread
 */

#ifndef MAIN_SPREAD_HH_
#define MAIN_SPREAD_HH_

#include "engine/DrawEngine.hh"

#include <cstddef>
#include <iosfwd>
#include <string>
#include <vector>

namespace Tarot {
namespace Main {

/** \brief Number of cards in the spread
 */
constexpr auto N_SPREAD_CARDS = 3;

/** \brief A drawn card tagged with its position in a spread
 */
struct SpreadCard {
    Engine::DrawnCard card; ///< \brief The drawn card
    std::string role;       ///< \brief The position of the card in the spread
};

/** \brief Equality operator for spread cards
 */
bool operator==(const SpreadCard&, const SpreadCard&);

/** \brief Output spread card to stream
 */
std::ostream& operator<<(std::ostream& os, const SpreadCard& card);

/** \brief Get the role of a position in the spread
 *
 * \param n the position of the card
 *
 * \return “past”, “present” or “future” for the three first positions, and
 * “pos<n>” for the rest
 */
std::string getSpreadRole(std::size_t n);

/** \brief Tag drawn cards with their roles in the spread
 *
 * \param cards the cards in pick order
 *
 * \return the cards tagged with getSpreadRole() of their position
 */
std::vector<SpreadCard> tagSpread(Engine::DrawResult cards);

}
}

#endif // MAIN_SPREAD_HH_
