/** \file
 *
 * \brief Definition of Tarot::Engine::DrawEngine class
 */

#ifndef ENGINE_DRAWENGINE_HH_
#define ENGINE_DRAWENGINE_HH_

#include "tarot/TarotCard.hh"

#include <boost/noncopyable.hpp>

#include <iosfwd>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace Tarot {

class Deck;

namespace Engine {

class UsedSetBackend;

/** \brief A card returned by a draw
 *
 * The meaning is the one matching the orientation drawn for the card.
 */
struct DrawnCard {
    int index {};             ///< \brief Index of the card in the deck
    std::string name;         ///< \brief Display name
    std::string chineseName;  ///< \brief Chinese name
    std::string japaneseName; ///< \brief Japanese name
    Orientation orientation {Orientation::UPRIGHT}; ///< \brief Orientation
    std::string meaning;      ///< \brief Meaning in the drawn orientation
};

/** \brief Equality operator for drawn cards
 */
bool operator==(const DrawnCard&, const DrawnCard&);

/** \brief Output a drawn card to stream
 */
std::ostream& operator<<(std::ostream& os, const DrawnCard& card);

/** \brief Successful result of a draw: the cards in pick order
 */
using DrawResult = std::vector<DrawnCard>;

/** \brief Reasons for a draw to fail
 */
enum class DrawError {
    NO_DECK_LOADED,              ///< The deck contains no cards
    INSUFFICIENT_DISTINCT_CARDS, ///< Too few unused cards and no reset wanted
    BACKEND_UNAVAILABLE,         ///< The used set storage failed
};

/** \brief Output a draw error to stream
 */
std::ostream& operator<<(std::ostream& os, DrawError error);

/** \brief Outcome of a draw
 */
using DrawOutcome = std::variant<DrawResult, DrawError>;

/** \brief Session scoped non‐repeating card draws
 *
 * DrawEngine draws cards from a shared deck so that the same session never
 * receives a card twice until its used set is cleared. The used sets are
 * kept in a UsedSetBackend the engine does not own exclusively.
 *
 * Draws and resets for the same session through one engine are serialized,
 * so an engine may be shared between threads.
 */
class DrawEngine : private boost::noncopyable {
public:

    /** \brief Create draw engine
     *
     * \param deck the deck the cards are drawn from
     * \param backend the storage for the used sets
     */
    DrawEngine(
        std::shared_ptr<const Deck> deck,
        std::shared_ptr<UsedSetBackend> backend);

    ~DrawEngine();

    /** \brief Draw cards for a session
     *
     * Draws \p count distinct cards uniformly at random among the cards not
     * yet used by \p session, records them as used and draws an orientation
     * for each of them.
     *
     * If fewer than \p count unused cards remain and \p resetIfExhausted is
     * true, the used set is cleared and the cards are drawn from the full
     * deck. If \p resetIfExhausted is false, nothing is recorded and the draw
     * fails. A draw of more cards than the deck holds fails even after the
     * reset.
     *
     * \param session the session
     * \param count the number of cards. If not positive, the result is empty.
     * \param resetIfExhausted whether to start over when too few cards remain
     *
     * \return the drawn cards in pick order, or the reason for failure
     */
    DrawOutcome draw(
        std::string_view session, int count, bool resetIfExhausted);

    /** \brief Clear the used set of a session
     *
     * \param session the session
     *
     * \return true if the used set was cleared, false if the backend failed
     */
    bool reset(std::string_view session);

    /** \brief Retrieve the deck
     */
    const Deck& getDeck() const;

private:

    class Impl;
    const std::unique_ptr<Impl> impl;
};

}
}

#endif // ENGINE_DRAWENGINE_HH_
