/** \file
 *
 * \brief Definition of Tarot::Messaging::MessageQueue class
 */

#ifndef MESSAGING_MESSAGEQUEUE_HH_
#define MESSAGING_MESSAGEQUEUE_HH_

#include <initializer_list>
#include <memory>
#include <utility>

#include <boost/noncopyable.hpp>

#include "messaging/MessageHandler.hh"
#include "messaging/Sockets.hh"
#include "Blob.hh"
#include "BlobMap.hh"

namespace Tarot {

/** \brief Request–reply messaging over ZeroMQ
 */
namespace Messaging {

/** \brief Dispatcher from command frames to message handlers
 *
 * A request consists of a tag frame, a command frame and any number of
 * parameter frames. On a ROUTER socket the request is preceded by the routing
 * ID of the client and an empty delimiter frame. The command is matched
 * byte by byte against the registered commands.
 *
 * MessageQueue does not own or poll sockets. It is registered with a
 * MessageLoop and invoked each time the socket is readable.
 */
class MessageQueue : private boost::noncopyable {
public:

    /// Create queue without handlers
    MessageQueue();

    /// Create queue with the given command–handler pairs
    MessageQueue(
        std::initializer_list<
            std::pair<ByteSpan, std::shared_ptr<MessageHandler>>> handlers);

    ~MessageQueue();

    /** \brief Register handler for a command
     *
     * \return true if \p handler was registered, false if \p command already
     * had a handler, in which case the old handler is kept
     */
    bool trySetHandler(
        ByteSpan command, std::shared_ptr<MessageHandler> handler);

    /** \brief Receive one request from \p socket and send the reply
     *
     * The reply echoes the routing frames and the tag, followed by the status
     * and the frames added by the handler. An unknown command, or a handler
     * throwing an exception, is replied with REPLY_FAILURE. Requests too short
     * to contain a tag and a command are dropped without reply.
     *
     * The Identity passed to the handler is empty unless \p socket is a
     * ROUTER socket.
     */
    void operator()(Socket& socket);

private:

    BlobMap<std::shared_ptr<MessageHandler>> handlers;
    std::shared_ptr<MessageHandler> defaultHandler;
};

}
}

#endif // MESSAGING_MESSAGEQUEUE_HH_
