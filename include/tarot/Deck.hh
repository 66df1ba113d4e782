/** \file
 *
 * \brief Definition of Tarot::Deck
 */

#ifndef TAROT_DECK_HH_
#define TAROT_DECK_HH_

#include "tarot/TarotCard.hh"

#include <cstddef>
#include <map>
#include <vector>

namespace Tarot {

/** \brief The full set of tarot cards, keyed by index
 *
 * A deck is immutable after construction and can be shared between threads
 * without synchronization.
 */
class Deck {
public:

    /** \brief Create an empty deck
     */
    Deck();

    /** \brief Create deck
     *
     * \param cards mapping from index to card. The index stored in each card
     * is overwritten by its key.
     */
    explicit Deck(std::map<int, TarotCard> cards);

    /** \brief Retrieve a card
     *
     * \param index the index of the card
     *
     * \return pointer to the card, or nullptr if the deck has no card with
     * the index
     */
    const TarotCard* getCard(int index) const;

    /** \brief Retrieve all indices
     *
     * \return the indices of the cards in the deck in ascending order
     */
    std::vector<int> getIndices() const;

    /** \brief Determine the number of cards in the deck
     */
    std::size_t size() const;

    /** \brief Determine if the deck contains no cards
     */
    bool empty() const;

private:
    std::map<int, TarotCard> cards;
};

}

#endif // TAROT_DECK_HH_
