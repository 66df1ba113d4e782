/** \file
 *
 * \brief Loading tarot decks from CSV data
 *
 * The data is a comma separated table with a header row. The following
 * columns are recognized (other columns are ignored):
 *
 * - \c Index: integer index of the card (required, rows without a valid
 *   index are skipped)
 * - \c Card: display name
 * - <tt>Chinese Name</tt> (or \c ChineseName): Chinese name
 * - <tt>Japanese Name</tt> (or \c JapaneseName): Japanese name
 * - <tt>Upright Meaning</tt>: meaning of the upright card
 * - <tt>Reversed Meaning</tt>: meaning of the reversed card
 *
 * Header names and values are trimmed of surrounding whitespace. Fields may
 * be quoted with double quotes.
 */

#ifndef TAROT_DECKLOADER_HH_
#define TAROT_DECKLOADER_HH_

#include "tarot/Deck.hh"

#include <iosfwd>
#include <stdexcept>
#include <string>
#include <vector>

namespace Tarot {

/** \brief Exception indicating that deck data could not be read
 */
class DeckLoadFailure : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/** \brief Load deck from a stream
 *
 * Rows are applied in order. If several rows have the same index, the last
 * one wins.
 *
 * \param in the input stream containing CSV data
 *
 * \return the deck
 *
 * \throw DeckLoadFailure if reading the stream fails
 */
Deck loadDeck(std::istream& in);

/** \brief Load deck from the first usable file
 *
 * Each path is tried in order. The first file that exists and can be read is
 * used. If no file can be used, a warning is logged and an empty deck is
 * returned.
 *
 * \param paths the candidate paths
 *
 * \return the deck
 */
Deck loadDeckFromPaths(const std::vector<std::string>& paths);

}

#endif // TAROT_DECKLOADER_HH_
