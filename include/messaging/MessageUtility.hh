/** \file
 *
 * \brief Multipart message helpers
 */

#ifndef MESSAGING_MESSAGEUTILITY_HH_
#define MESSAGING_MESSAGEUTILITY_HH_

#include "messaging/Sockets.hh"
#include "Blob.hh"

#include <iterator>
#include <utility>
#include <vector>

namespace Tarot {
namespace Messaging {

/// Frames of a multipart message
using MessageVector = std::vector<Message>;

/** \brief Send frames as one multipart message
 *
 * The frames in the range are moved from.
 *
 * \param socket the socket
 * \param first iterator to the first frame
 * \param last iterator one past the last frame
 * \param more if true, the message is continued by a later send
 */
template<typename MessageIterator>
void sendMultipart(
    Socket& socket, MessageIterator first, const MessageIterator last,
    const bool more = false)
{
    for (; first != last; ++first) {
        sendMessage(socket, std::move(*first), more || std::next(first) != last);
    }
}

/** \brief Receive all frames of the next message
 *
 * \param socket the socket
 *
 * \return the frames in the order they were received
 */
inline MessageVector recvMultipart(Socket& socket)
{
    auto frames = MessageVector {};
    do {
        recvMessage(socket, frames.emplace_back());
    } while (frames.back().more());
    return frames;
}

/// View \p message as bytes
inline ByteSpan messageView(const Message& message)
{
    return {message.data<ByteSpan::value_type>(), message.size()};
}

}
}

#endif // MESSAGING_MESSAGEUTILITY_HH_
