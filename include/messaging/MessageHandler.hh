/** \file
 *
 * \brief Command handler interface
 */

#ifndef MESSAGING_MESSAGEHANDLER_HH_
#define MESSAGING_MESSAGEHANDLER_HH_

#include "messaging/Identity.hh"
#include "Blob.hh"

#include <boost/iterator/transform_iterator.hpp>

#include <vector>

namespace Tarot {
namespace Messaging {

/** \brief Sink for the reply of a MessageHandler
 *
 * A reply consists of a status frame followed by zero or more frames.
 */
class Response {
public:

    virtual ~Response();

    /// Set the status frame
    void setStatus(ByteSpan status);

    /// Append a frame after the status
    void addFrame(ByteSpan frame);

private:

    virtual void handleSetStatus(ByteSpan status) = 0;

    virtual void handleAddFrame(ByteSpan frame) = 0;
};

/** \brief Handler of one command
 *
 * MessageQueue calls the handler registered for the command of a request with
 * the identity of the client and the parameter frames. The handler writes
 * its reply to the Response before returning.
 */
class MessageHandler {
public:

    virtual ~MessageHandler();

    /** \brief Handle a request
     *
     * \param identity the identity of the client
     * \param first iterator to the first parameter. Each parameter is a
     * contiguous sequence of bytes.
     * \param last iterator one past the last parameter
     * \param response the sink for the reply
     */
    template<typename ParameterIterator>
    void handle(
        const Identity& identity, ParameterIterator first,
        ParameterIterator last, Response& response);

protected:

    /// Parameters as passed to doHandle()
    using ParameterVector = std::vector<ByteSpan>;

private:

    virtual void doHandle(
        const Identity& identity, const ParameterVector& params,
        Response& response) = 0;
};

template<typename ParameterIterator>
void MessageHandler::handle(
    const Identity& identity, ParameterIterator first, ParameterIterator last,
    Response& response)
{
    const auto as_bytes = [](const auto& param) { return asBytes(param); };
    doHandle(
        identity,
        ParameterVector(
            boost::make_transform_iterator(first, as_bytes),
            boost::make_transform_iterator(last, as_bytes)),
        response);
}

}
}

#endif // MESSAGING_MESSAGEHANDLER_HH_
