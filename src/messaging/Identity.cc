#include "messaging/Identity.hh"

#include "messaging/MessageUtility.hh"

#include <boost/algorithm/hex.hpp>

#include <iterator>
#include <ostream>
#include <utility>

namespace Tarot {
namespace Messaging {

Identity::Identity(RoutingId routingId) :
    routingId {std::move(routingId)}
{
}

Identity identityFromMessage(const Message* routerIdentityFrame)
{
    if (!routerIdentityFrame) {
        return {};
    }
    const auto routing_id_view = messageView(*routerIdentityFrame);
    return Identity {
        RoutingId(routing_id_view.begin(), routing_id_view.end())};
}

bool operator==(const Identity& lhs, const Identity& rhs)
{
    return asBytes(lhs.routingId) == asBytes(rhs.routingId);
}

bool operator<(const Identity& lhs, const Identity& rhs)
{
    return asBytes(lhs.routingId) < asBytes(rhs.routingId);
}

std::ostream& operator<<(std::ostream& os, const Identity& identity)
{
    const auto bytes = blobToString(identity.routingId);
    boost::algorithm::hex_lower(
        bytes.begin(), bytes.end(), std::ostreambuf_iterator<char> {os});
    return os;
}

}
}
