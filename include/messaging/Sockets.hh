/** \file
 *
 * \brief Socket types used by the tarot server
 *
 * The server talks to its clients with ZeroMQ through the cppzmq bindings.
 * The aliases and helpers here keep the rest of the code independent of the
 * exact cppzmq spelling.
 */

#ifndef MESSAGING_SOCKETS_HH_
#define MESSAGING_SOCKETS_HH_

#include <chrono>
#include <memory>
#include <ranges>
#include <stdexcept>
#include <string>
#include <string_view>

#include <zmq.hpp>

#include "Blob.hh"

namespace Tarot {
namespace Messaging {

/// ZeroMQ context
using MessageContext = zmq::context_t;

/// ZeroMQ socket
using Socket = zmq::socket_t;

/// Socket type enumeration (ROUTER, REQ etc.)
using SocketType = zmq::socket_type;

/// Socket shared between the owner and the message loop
using SharedSocket = std::shared_ptr<Socket>;

/// Single message frame
using Message = zmq::message_t;

/// Exception thrown by the ZeroMQ bindings
using SocketError = zmq::error_t;

/// Item polled by the message loop
using Pollitem = zmq::pollitem_t;

/** \brief Wrap data into a buffer that can be sent
 *
 * Forwards to \c zmq::buffer, which accepts strings, string views and
 * contiguous containers.
 */
template<typename... Args>
constexpr auto messageBuffer(Args&&... args)
{
    return zmq::buffer(std::forward<Args>(args)...);
}

/** \brief Wrap bytes into a buffer that can be sent
 */
constexpr auto messageBuffer(const ByteSpan bytes)
{
    return zmq::const_buffer(bytes.data(), bytes.size());
}

/** \brief Create a socket with shared ownership
 *
 * \param context the ZeroMQ context
 * \param type the socket type
 */
inline SharedSocket makeSharedSocket(
    MessageContext& context, const SocketType type)
{
    return std::make_shared<Socket>(context, type);
}

/// Bind \p socket to \p endpoint
inline void bindSocket(Socket& socket, const std::string_view endpoint)
{
    socket.bind(std::string {endpoint});
}

/// Connect \p socket to \p endpoint
inline void connectSocket(Socket& socket, const std::string_view endpoint)
{
    socket.connect(std::string {endpoint});
}

/// Get the type of \p socket
inline SocketType getSocketType(const Socket& socket)
{
    return static_cast<SocketType>(socket.get(zmq::sockopt::type));
}

/** \brief Poll a contiguous range of pollitems
 *
 * \return the number of items with events
 */
template<std::ranges::contiguous_range Pollitems>
auto pollSockets(
    Pollitems& pollitems,
    const std::chrono::milliseconds timeout = std::chrono::milliseconds {-1})
{
    return zmq::poll(
        std::ranges::data(pollitems), std::ranges::size(pollitems), timeout);
}

/** \brief Send a frame with blocking I/O
 *
 * \param socket the socket
 * \param message a Message or a buffer
 * \param more whether more frames of the same message follow
 *
 * \throw std::runtime_error if the send would have blocked
 */
template<typename MessageLike>
void sendMessage(Socket& socket, MessageLike&& message, const bool more = false)
{
    const auto flags = more ? zmq::send_flags::sndmore : zmq::send_flags::none;
    if (!socket.send(std::forward<MessageLike>(message), flags)) {
        throw std::runtime_error {"Blocking send failed with EAGAIN"};
    }
}

/** \brief Receive a frame with blocking I/O
 *
 * \param socket the socket
 * \param message a Message or a mutable buffer
 *
 * \return the received size as reported by cppzmq
 *
 * \throw std::runtime_error if the receive would have blocked
 */
template<typename MessageLike>
auto recvMessage(Socket& socket, MessageLike&& message)
{
    const auto result = socket.recv(
        std::forward<MessageLike>(message), zmq::recv_flags::none);
    if (!result) {
        throw std::runtime_error {"Blocking recv failed with EAGAIN"};
    }
    return *result;
}

}
}

#endif // MESSAGING_SOCKETS_HH_
