#include "messaging/MessageLoop.hh"
#include "messaging/MessageUtility.hh"
#include "messaging/Sockets.hh"
#include "Blob.hh"
#include "MockMessageLoopCallback.hh"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <csignal>
#include <stdexcept>
#include <string>

using Tarot::ByteSpan;
using namespace Tarot::BlobLiterals;
using namespace Tarot::Messaging;

using testing::_;
using testing::Invoke;
using testing::Ref;

namespace {

const auto STOP_MSG = "stop"_BS;
const auto FORWARD_MSG = "forward"_BS;

ByteSpan receiveSingle(Socket& socket, Message& msg)
{
    recvMessage(socket, msg);
    EXPECT_FALSE(msg.more());
    return messageView(msg);
}

}

class MessageLoopTest : public testing::Test {
protected:
    struct Channel {
        Channel(MessageContext& context, const std::string& endpoint) :
            client {context, SocketType::dealer},
            server {makeSharedSocket(context, SocketType::dealer)}
        {
            bindSocket(*server, endpoint);
            connectSocket(client, endpoint);
        }

        Socket client;
        SharedSocket server;
        testing::StrictMock<MockMessageLoopCallback> callback;
    };

    void SetUp() override
    {
        for (auto* channel : {&first, &second}) {
            ON_CALL(channel->callback, call(_)).WillByDefault(
                Invoke(
                    [](auto& socket)
                    {
                        auto msg = Message {};
                        EXPECT_EQ(STOP_MSG, receiveSingle(socket, msg));
                        std::raise(SIGTERM);
                    }));
            loop.addPollable(
                channel->server,
                [&callback = channel->callback](auto& socket)
                {
                    callback.call(socket);
                });
        }
    }

    MessageContext context;
    Channel first {context, "inproc://loop-first"};
    Channel second {context, "inproc://loop-second"};
    MessageLoop loop;
};

TEST_F(MessageLoopTest, testCallbackInvokedForReadableSocket)
{
    EXPECT_CALL(first.callback, call(Ref(*first.server)));
    sendMessage(first.client, messageBuffer(STOP_MSG));
    loop.run();
}

TEST_F(MessageLoopTest, testLoopContinuesUntilSignal)
{
    EXPECT_CALL(first.callback, call(Ref(*first.server)))
        .WillOnce(
            Invoke(
                [this](auto& socket)
                {
                    auto msg = Message {};
                    EXPECT_EQ(FORWARD_MSG, receiveSingle(socket, msg));
                    sendMessage(second.client, messageBuffer(STOP_MSG));
                }));
    EXPECT_CALL(second.callback, call(Ref(*second.server)));
    sendMessage(first.client, messageBuffer(FORWARD_MSG));
    loop.run();
}

TEST_F(MessageLoopTest, testExceptionInCallbackDoesNotStopLoop)
{
    EXPECT_CALL(first.callback, call(Ref(*first.server)))
        .WillOnce(
            Invoke(
                [this](auto& socket)
                {
                    auto msg = Message {};
                    recvMessage(socket, msg);
                    sendMessage(second.client, messageBuffer(STOP_MSG));
                    throw std::runtime_error {"callback failed"};
                }));
    EXPECT_CALL(second.callback, call(Ref(*second.server)));
    sendMessage(first.client, messageBuffer(FORWARD_MSG));
    loop.run();
}

TEST_F(MessageLoopTest, testAddPollableTwice)
{
    EXPECT_THROW(
        loop.addPollable(first.server, [](auto&) {}), std::runtime_error);
}

TEST_F(MessageLoopTest, testAddEmptySocket)
{
    EXPECT_THROW(
        loop.addPollable(SharedSocket {}, [](auto&) {}),
        std::invalid_argument);
}

TEST_F(MessageLoopTest, testAddEmptyCallback)
{
    EXPECT_THROW(
        loop.addPollable(
            makeSharedSocket(context, SocketType::dealer),
            MessageLoop::SocketCallback {}),
        std::invalid_argument);
}
