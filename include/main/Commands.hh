/** \file
 *
 * \brief Definition of \ref tarotprotocol commands
 *
 * \page tarotprotocol Tarot protocol
 *
 * This document describes the tarot protocol version 0.1.
 *
 * The key words “MUST”, “MUST NOT”, “REQUIRED”, “SHALL”, “SHALL NOT”, “SHOULD”,
 * “SHOULD NOT”, “RECOMMENDED”, “MAY”, and “OPTIONAL” in this document are to be
 * interpreted as described in RFC 2119 (http://tools.ietf.org/html/rfc2119).
 *
 * \section tarotprotocolintro Introduction
 *
 * This document describes a protocol for drawing tarot cards from a server. A
 * client names a session, and the server guarantees that the cards drawn for
 * the session do not repeat until the deck is exhausted or the session is
 * reset.
 *
 * \section tarotprotocoltransport Transport
 *
 * The protocol uses ZMTP 3.0 over TCP
 * (https://rfc.zeromq.org/spec:23/ZMTP). The server MUST open a ROUTER socket
 * clients connect to. Clients SHOULD use REQ or DEALER sockets.
 *
 * \section tarotprotocolcontrolmessage Commands
 *
 * A command message consists of the following frames:
 *
 * | Frame | Content                          |
 * |-------|----------------------------------|
 * | 1     | Empty                            |
 * | 2     | Tag                              |
 * | 3     | Command                          |
 * | 4     | Argument key                     |
 * | 5     | Argument value                   |
 * | ...   | More argument key–value pairs    |
 *
 * The empty frame is added by REQ sockets automatically. Clients using DEALER
 * sockets MUST send it explicitly. The tag frame MAY contain arbitrary bytes
 * and is echoed back in the reply. It allows the client to match replies to
 * commands. The command frame MUST be one of the commands described in this
 * section. The arguments are key–value pairs where the key is the name of the
 * argument and the value is a JSON document. Arguments MAY appear in any
 * order. Unknown arguments are ignored. Optional arguments MAY be omitted.
 *
 * A reply message consists of the following frames:
 *
 * | Frame | Content                          |
 * |-------|----------------------------------|
 * | 1     | Empty                            |
 * | 2     | Tag                              |
 * | 3     | Status                           |
 * | 4     | Reply key                        |
 * | 5     | Reply value                      |
 * | ...   | More reply key–value pairs       |
 *
 * The status is “OK” if the command was successful. Otherwise it starts with
 * “ERR”. A failed reply MAY have a suffix separated by colon naming the reason
 * of the failure. The following suffixes are used:
 *
 * - <b>ERR:NODECK</b>: the server has no cards loaded
 * - <b>ERR:EXHAUSTED</b>: the session does not have enough distinct cards
 *   left, and reset was not allowed or would not help
 * - <b>ERR:BACKEND</b>: the storage of the used cards failed
 *
 * Malformed arguments, an empty session and an unknown command are answered
 * with plain “ERR”. A failed reply has no reply arguments.
 *
 * \subsection tarotprotocoldraw draw
 *
 * - <b>Command:</b> draw
 * - <b>Parameters:</b>
 *   - <b>session:</b> the session name, a non-empty string
 *   - <b>count:</b> number of cards to draw (optional, default 1)
 *   - <b>resetIfExhausted:</b> whether the session is reset if it does not
 *     have enough cards left (optional, default true)
 * - <b>Reply:</b>
 *   - <b>session:</b> the session name
 *   - <b>cards:</b> array of drawn cards, see \ref jsondrawncard
 *
 * The cards drawn are distinct, and distinct from the cards drawn earlier for
 * the same session. Each card is upright or reversed with equal probability. A
 * count of zero draws nothing and succeeds. A negative count is rejected.
 *
 * \subsection tarotprotocolspread spread
 *
 * - <b>Command:</b> spread
 * - <b>Parameters:</b>
 *   - <b>session:</b> the session name, a non-empty string
 *   - <b>resetIfExhausted:</b> (optional, default true)
 * - <b>Reply:</b>
 *   - <b>session:</b> the session name
 *   - <b>cards:</b> array of three drawn cards, each with the additional
 *     member “role” whose value is “past”, “present” or “future”
 *
 * Equivalent to \ref tarotprotocoldraw with count three, except that the cards
 * are tagged with their positions in the spread.
 *
 * \subsection tarotprotocolreset reset
 *
 * - <b>Command:</b> reset
 * - <b>Parameters:</b>
 *   - <b>session:</b> the session name, a non-empty string
 * - <b>Reply:</b>
 *   - <b>session:</b> the session name
 *
 * Forget the cards drawn for the session. Resetting a session with no draws
 * succeeds.
 *
 * \subsection tarotprotocolhealth health
 *
 * - <b>Command:</b> health
 * - <b>Parameters:</b> none
 * - <b>Reply:</b>
 *   - <b>status:</b> the string “ok”
 *   - <b>time:</b> the server time in seconds since the Unix epoch
 *   - <b>deckSize:</b> the number of cards loaded
 *
 * The server answers health even when no deck is loaded.
 */

#ifndef MAIN_COMMANDS_HH_
#define MAIN_COMMANDS_HH_

#include <string>

namespace Tarot {
namespace Main {

/** \brief See \ref tarotprotocoldraw
 */
extern const std::string DRAW_COMMAND;

/** \brief See \ref tarotprotocolspread
 */
extern const std::string SPREAD_COMMAND;

/** \brief See \ref tarotprotocolreset
 */
extern const std::string RESET_COMMAND;

/** \brief See \ref tarotprotocolhealth
 */
extern const std::string HEALTH_COMMAND;

/** \brief Argument for the session name
 */
extern const std::string SESSION_COMMAND;

/** \brief Argument for the number of cards
 */
extern const std::string COUNT_COMMAND;

/** \brief Argument for resetting an exhausted session
 */
extern const std::string RESET_IF_EXHAUSTED_COMMAND;

/** \brief Reply argument for the drawn cards
 */
extern const std::string CARDS_COMMAND;

/** \brief Reply argument for the health status
 */
extern const std::string STATUS_COMMAND;

/** \brief Reply argument for the server time
 */
extern const std::string TIME_COMMAND;

/** \brief Reply argument for the deck size
 */
extern const std::string DECK_SIZE_COMMAND;

/** \brief Failure reason when no deck is loaded
 */
extern const std::string NO_DECK_FAILURE;

/** \brief Failure reason when the session is exhausted
 */
extern const std::string EXHAUSTED_FAILURE;

/** \brief Failure reason when the used set backend fails
 */
extern const std::string BACKEND_FAILURE;

}
}

#endif // MAIN_COMMANDS_HH_
