/** \file
 *
 * \brief Definition of Tarot::Messaging::MessageLoop class
 */

#ifndef MESSAGING_MESSAGELOOP_HH_
#define MESSAGING_MESSAGELOOP_HH_

#include "messaging/Sockets.hh"

#include <boost/noncopyable.hpp>

#include <functional>
#include <memory>

namespace Tarot {
namespace Messaging {

/** \brief Event loop polling ZeroMQ sockets
 *
 * Sockets are registered together with a callback. When a registered socket
 * becomes readable, its callback is invoked with the socket. The loop runs
 * until the thread receives SIGINT or SIGTERM.
 *
 * MessageLoop blocks the termination signals in the thread that constructs it
 * and restores the previous mask when destructed. It must be run in the same
 * thread.
 */
class MessageLoop : private boost::noncopyable {
public:

    /// Socket registered with the loop
    using PollableSocket = SharedSocket;

    /// Callback invoked with a readable socket
    using SocketCallback = std::function<void(Socket&)>;

    /** \brief Create an empty message loop
     *
     * \throw std::system_error if the signal mask cannot be changed
     */
    MessageLoop();

    ~MessageLoop();

    /** \brief Register a socket and its callback
     *
     * The loop keeps \p socket alive until it is destructed. References
     * captured by \p callback must stay valid for the same time.
     *
     * \throw std::invalid_argument if \p socket or \p callback is empty
     * \throw std::runtime_error if \p socket is already registered
     */
    void addPollable(PollableSocket socket, SocketCallback callback);

    /** \brief Run the loop until a termination signal is received
     *
     * Exceptions thrown by the callbacks are logged and the loop continues.
     *
     * \throw std::system_error if the signal descriptor cannot be used
     */
    void run();

private:

    class Impl;
    const std::unique_ptr<Impl> impl;
};

}
}

#endif // MESSAGING_MESSAGELOOP_HH_
