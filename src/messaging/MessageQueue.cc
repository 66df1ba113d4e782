#include "messaging/MessageQueue.hh"

#include "messaging/Identity.hh"
#include "messaging/MessageUtility.hh"
#include "messaging/Replies.hh"
#include "Logging.hh"
#include "Utility.hh"

#include <algorithm>
#include <cassert>
#include <exception>
#include <iterator>
#include <optional>
#include <vector>

namespace Tarot {
namespace Messaging {

namespace {

// Request split into its parts. The envelope is the routing ID and the
// delimiter of a ROUTER socket, followed by the tag.
struct Request {
    MessageVector frames;
    std::ptrdiff_t envelopeSize;
    const Message* routingId;
};

std::optional<Request> parseRequest(Socket& socket)
{
    auto frames = recvMultipart(socket);
    auto first = frames.begin();
    const Message* routing_id = nullptr;
    if (getSocketType(socket) == SocketType::router) {
        const auto delimiter = std::find_if(
            frames.begin(), frames.end(),
            [](const auto& frame) { return frame.size() == 0u; });
        if (delimiter == frames.begin() || delimiter == frames.end()) {
            log(LogLevel::DEBUG, "Dropping request without routing envelope");
            return std::nullopt;
        }
        routing_id = &*std::prev(delimiter);
        first = std::next(delimiter);
    }
    // Tag and command
    if (std::distance(first, frames.end()) < 2) {
        log(LogLevel::DEBUG, "Dropping request without tag or command");
        return std::nullopt;
    }
    const auto envelope_size = std::distance(frames.begin(), first) + 1;
    return Request {std::move(frames), envelope_size, routing_id};
}

class QueueResponse : public Response {
public:
    explicit QueueResponse(Request& request);
    void send(Socket& socket);
    void sendFailure(Socket& socket);

private:
    void handleSetStatus(ByteSpan status) override;
    void handleAddFrame(ByteSpan frame) override;

    MessageVector envelope;
    Message status;
    MessageVector frames;
};

QueueResponse::QueueResponse(Request& request) :
    envelope(request.envelopeSize)
{
    assert(request.envelopeSize <= std::ssize(request.frames));
    for (const auto n : to(request.envelopeSize)) {
        envelope[n].move(request.frames[n]);
    }
}

void QueueResponse::send(Socket& socket)
{
    sendMultipart(socket, envelope.begin(), envelope.end(), true);
    sendMessage(socket, std::move(status), !frames.empty());
    sendMultipart(socket, frames.begin(), frames.end());
}

void QueueResponse::sendFailure(Socket& socket)
{
    sendMultipart(socket, envelope.begin(), envelope.end(), true);
    sendMessage(socket, messageBuffer(REPLY_FAILURE));
}

void QueueResponse::handleSetStatus(const ByteSpan status)
{
    this->status.rebuild(status.data(), status.size());
}

void QueueResponse::handleAddFrame(const ByteSpan frame)
{
    frames.emplace_back(frame.data(), frame.size());
}

class UnknownCommandHandler : public MessageHandler {
private:
    void doHandle(
        const Identity& identity, const ParameterVector&,
        Response& response) override
    {
        log(LogLevel::DEBUG, "Unknown command from %s", identity);
        response.setStatus(REPLY_FAILURE);
    }
};

}

MessageQueue::MessageQueue() :
    defaultHandler {std::make_shared<UnknownCommandHandler>()}
{
}

MessageQueue::MessageQueue(
    std::initializer_list<
        std::pair<ByteSpan, std::shared_ptr<MessageHandler>>> handlers) :
    MessageQueue {}
{
    for (const auto& [command, handler] : handlers) {
        trySetHandler(command, handler);
    }
}

MessageQueue::~MessageQueue() = default;

bool MessageQueue::trySetHandler(
    const ByteSpan command, std::shared_ptr<MessageHandler> handler)
{
    return handlers.try_emplace(
        Blob(command.begin(), command.end()), std::move(handler)).second;
}

void MessageQueue::operator()(Socket& socket)
{
    auto request = parseRequest(socket);
    if (!request) {
        return;
    }

    const auto command_frame = std::next(
        request->frames.begin(), request->envelopeSize);
    const auto command = messageView(*command_frame);
    const auto identity = identityFromMessage(request->routingId);
    auto params = std::vector<ByteSpan> {};
    std::transform(
        std::next(command_frame), request->frames.end(),
        std::back_inserter(params),
        [](const auto& frame) { return messageView(frame); });

    const auto iter = handlers.find(command);
    auto& handler = dereference(
        iter != handlers.end() ? iter->second : defaultHandler);

    auto response = QueueResponse {*request};
    try {
        handler.handle(identity, params.begin(), params.end(), response);
    } catch (const std::exception& e) {
        log(LogLevel::ERROR, "Error while handling request from %s: %s",
            identity, e.what());
        response.sendFailure(socket);
        return;
    }
    response.send(socket);
}

}
}
