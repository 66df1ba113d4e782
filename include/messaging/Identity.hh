/** \file
 *
 * \brief Definition of Tarot::Messaging::Identity
 */

#ifndef MESSAGING_IDENTITY_HH_
#define MESSAGING_IDENTITY_HH_

#include "messaging/Sockets.hh"
#include "Blob.hh"

#include <boost/operators.hpp>

#include <iosfwd>

namespace Tarot {
namespace Messaging {

/** \brief Routing ID type
 *
 * \sa Identity
 */
using RoutingId = Blob;

/** \brief Identity of a client
 *
 * The identity of a client is the routing ID the ZeroMQ framework attaches to
 * the connection. It should be considered an ephemeral opaque blob that is
 * only useful for diagnostics. It is not a session: the sessions of the draw
 * engine are chosen by the clients explicitly.
 */
struct Identity : private boost::totally_ordered<Identity> {

    Identity() = default;

    /** \brief Create new identity object
     *
     * \param routingId see \ref routingId
     */
    explicit Identity(RoutingId routingId);

    RoutingId routingId;  ///< Routing ID
};

/** \brief Retrieve identity from ZeroMQ message
 *
 * \param routerIdentityFrame Optional identity frame from ROUTER socket. If
 * nullptr, the identity has an empty routing ID.
 *
 * \return Identity of the connection related to the message
 */
Identity identityFromMessage(const Message* routerIdentityFrame);

/** \brief Equality operator for identities
 */
bool operator==(const Identity&, const Identity&);

/** \brief Less than operator for identities
 */
bool operator<(const Identity&, const Identity&);

/** \brief Output an identity to stream
 *
 * The routing ID is written in hexadecimal.
 *
 * \param os the output stream
 * \param identity the identity
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, const Identity& identity);

}
}

#endif // MESSAGING_IDENTITY_HH_
