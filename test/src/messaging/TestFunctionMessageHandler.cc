#include "messaging/FunctionMessageHandler.hh"
#include "messaging/Replies.hh"
#include "messaging/SerializationFailureException.hh"
#include "MockMessageHandler.hh"
#include "MockSerializationPolicy.hh"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <tuple>
#include <vector>

using namespace Tarot::Messaging;

using testing::Bool;
using testing::Return;

namespace Tarot {
namespace Messaging {

std::ostream& operator<<(std::ostream& os, const ReplyFailure&)
{
    return os << "reply failure";
}

template<typename... Ts>
std::ostream& operator<<(std::ostream& os, const ReplySuccess<Ts...>&)
{
    return os << "reply success";
}

}
}

namespace {

using namespace std::string_literals;
using namespace Tarot::BlobLiterals;

const auto CLIENT = Identity {"client"_B};
const auto SESSION_KEY = "session"s;
const auto COUNT_KEY = "count"s;
const auto NAME_KEY = "name"s;
const auto TOTAL_KEY = "total"s;
const auto SESSION = "s1"s;
const auto CARD_NAME = "The Fool"s;
const auto TOTAL = 3;

Reply<> replyWith(const bool successful)
{
    if (successful) {
        return success();
    }
    return failure();
}

Reply<std::string> cardName(const Identity&)
{
    return success(CARD_NAME);
}

Reply<std::string, int> cardNameAndTotal(const Identity&)
{
    return success(CARD_NAME, TOTAL);
}

Reply<std::optional<std::string>> someCardName(const Identity&)
{
    return success(CARD_NAME);
}

Reply<std::optional<std::string>> noCardName(const Identity&)
{
    return success(std::nullopt);
}

Reply<std::string> noDeck(const Identity&)
{
    return failure("NODECK");
}

class MockCommands {
public:
    MOCK_METHOD1(health, Reply<>(Identity));
    MOCK_METHOD2(reset, Reply<>(Identity, std::string));
    MOCK_METHOD3(draw, Reply<>(Identity, int, std::string));
    MOCK_METHOD2(drawOptional, Reply<>(Identity, std::optional<int>));
};

class UsedCounter {
public:
    Reply<int> markUsed(const Identity&, int count)
    {
        used += count;
        return success(used);
    }

    int used {};
};

class RejectingPolicy {
public:
    template<typename T> T deserialize(Tarot::ByteSpan)
    {
        throw SerializationFailureException {"rejected"};
    }
};

}

class FunctionMessageHandlerTest : public testing::TestWithParam<bool> {
protected:
    auto makeResetHandler()
    {
        return makeMessageHandler<std::string>(
            [this](const auto& identity, std::string session)
            {
                return commands.reset(identity, session);
            }, MockSerializationPolicy {}, std::make_tuple(SESSION_KEY));
    }

    auto makeDrawHandler()
    {
        return makeMessageHandler<int, std::string>(
            [this](const auto& identity, int count, std::string session)
            {
                return commands.draw(identity, count, session);
            }, MockSerializationPolicy {},
            std::make_tuple(COUNT_KEY, SESSION_KEY));
    }

    void handle(
        MessageHandler& handler,
        const std::vector<std::string>& params,
        const Tarot::ByteSpan status,
        const std::vector<std::string>& expectedFrames = {})
    {
        EXPECT_CALL(response, handleSetStatus(status));
        {
            testing::InSequence sequence;
            for (const auto& frame : expectedFrames) {
                EXPECT_CALL(response, handleAddFrame(Tarot::asBytes(frame)));
            }
        }
        handler.handle(CLIENT, params.begin(), params.end(), response);
    }

    Tarot::ByteSpan expectedStatus(const bool successful)
    {
        return successful ? REPLY_SUCCESS : REPLY_FAILURE;
    }

    testing::StrictMock<MockResponse> response;
    testing::StrictMock<MockCommands> commands;
};

TEST_P(FunctionMessageHandlerTest, testWithoutParameters)
{
    const auto successful = GetParam();
    auto handler = makeMessageHandler(
        [this](const auto& identity)
        {
            return commands.health(identity);
        }, MockSerializationPolicy {});
    EXPECT_CALL(commands, health(CLIENT))
        .WillOnce(Return(replyWith(successful)));
    handle(*handler, {}, expectedStatus(successful));
}

TEST_P(FunctionMessageHandlerTest, testSingleParameter)
{
    const auto successful = GetParam();
    auto handler = makeResetHandler();
    EXPECT_CALL(commands, reset(CLIENT, SESSION))
        .WillOnce(Return(replyWith(successful)));
    handle(*handler, {SESSION_KEY, SESSION}, expectedStatus(successful));
}

TEST_P(FunctionMessageHandlerTest, testParametersInAnyOrder)
{
    const auto successful = GetParam();
    auto handler = makeDrawHandler();
    EXPECT_CALL(commands, draw(CLIENT, 2, SESSION))
        .WillOnce(Return(replyWith(successful)));
    handle(
        *handler, {SESSION_KEY, SESSION, COUNT_KEY, "2"},
        expectedStatus(successful));
}

TEST_F(FunctionMessageHandlerTest, testDeserializationFailure)
{
    auto handler = makeMessageHandler<std::string>(
        [this](const auto& identity, std::string session)
        {
            return commands.reset(identity, session);
        }, RejectingPolicy {}, std::make_tuple(SESSION_KEY));
    handle(*handler, {SESSION_KEY, SESSION}, REPLY_FAILURE);
}

TEST_F(FunctionMessageHandlerTest, testValueOfWrongType)
{
    auto handler = makeDrawHandler();
    handle(*handler, {COUNT_KEY, "two", SESSION_KEY, SESSION}, REPLY_FAILURE);
}

TEST_F(FunctionMessageHandlerTest, testRequiredParameterMissing)
{
    auto handler = makeResetHandler();
    handle(*handler, {}, REPLY_FAILURE);
}

TEST_F(FunctionMessageHandlerTest, testUnknownParameterIgnored)
{
    auto handler = makeResetHandler();
    EXPECT_CALL(commands, reset(CLIENT, SESSION))
        .WillOnce(Return(replyWith(true)));
    handle(*handler, {SESSION_KEY, SESSION, COUNT_KEY, "1"}, REPLY_SUCCESS);
}

TEST_F(FunctionMessageHandlerTest, testKeyWithoutValue)
{
    auto handler = makeResetHandler();
    handle(*handler, {SESSION_KEY}, REPLY_FAILURE);
}

TEST_F(FunctionMessageHandlerTest, testTrailingKeyWithoutValue)
{
    auto handler = makeResetHandler();
    handle(*handler, {SESSION_KEY, SESSION, COUNT_KEY}, REPLY_FAILURE);
}

TEST_F(FunctionMessageHandlerTest, testOnlyUnknownKey)
{
    auto handler = makeResetHandler();
    handle(*handler, {COUNT_KEY, "1"}, REPLY_FAILURE);
}

TEST_F(FunctionMessageHandlerTest, testOptionalParameterPresent)
{
    auto handler = makeMessageHandler<std::optional<int>>(
        [this](const auto& identity, std::optional<int> count)
        {
            return commands.drawOptional(identity, count);
        }, MockSerializationPolicy {}, std::make_tuple(COUNT_KEY));
    EXPECT_CALL(commands, drawOptional(CLIENT, std::make_optional(5)))
        .WillOnce(Return(replyWith(true)));
    handle(*handler, {COUNT_KEY, "5"}, REPLY_SUCCESS);
}

TEST_F(FunctionMessageHandlerTest, testOptionalParameterAbsent)
{
    auto handler = makeMessageHandler<std::optional<int>>(
        [this](const auto& identity, std::optional<int> count)
        {
            return commands.drawOptional(identity, count);
        }, MockSerializationPolicy {}, std::make_tuple(COUNT_KEY));
    EXPECT_CALL(commands, drawOptional(CLIENT, std::optional<int> {}))
        .WillOnce(Return(replyWith(true)));
    handle(*handler, {}, REPLY_SUCCESS);
}

TEST_F(FunctionMessageHandlerTest, testReplyWithOneValue)
{
    auto handler = makeMessageHandler(
        &cardName, MockSerializationPolicy {},
        std::make_tuple(), std::make_tuple(NAME_KEY));
    handle(*handler, {}, REPLY_SUCCESS, {NAME_KEY, CARD_NAME});
}

TEST_F(FunctionMessageHandlerTest, testReplyWithTwoValues)
{
    auto handler = makeMessageHandler(
        &cardNameAndTotal, MockSerializationPolicy {},
        std::make_tuple(), std::make_tuple(NAME_KEY, TOTAL_KEY));
    handle(
        *handler, {}, REPLY_SUCCESS,
        {NAME_KEY, CARD_NAME, TOTAL_KEY, std::to_string(TOTAL)});
}

TEST_F(FunctionMessageHandlerTest, testReplyWithOptionalValue)
{
    auto handler = makeMessageHandler(
        &someCardName, MockSerializationPolicy {},
        std::make_tuple(), std::make_tuple(NAME_KEY));
    handle(*handler, {}, REPLY_SUCCESS, {NAME_KEY, CARD_NAME});
}

TEST_F(FunctionMessageHandlerTest, testEmptyOptionalLeftOutOfReply)
{
    auto handler = makeMessageHandler(
        &noCardName, MockSerializationPolicy {},
        std::make_tuple(), std::make_tuple(NAME_KEY));
    handle(*handler, {}, REPLY_SUCCESS);
}

TEST_F(FunctionMessageHandlerTest, testFailureReasonInStatus)
{
    auto handler = makeMessageHandler(
        &noDeck, MockSerializationPolicy {},
        std::make_tuple(), std::make_tuple(NAME_KEY));
    const auto status = makeFailureStatus("NODECK"_BS);
    EXPECT_EQ("ERR:NODECK"s, Tarot::blobToString(status));
    handle(*handler, {}, Tarot::asBytes(status));
}

TEST_F(FunctionMessageHandlerTest, testMemberFunction)
{
    auto counter = UsedCounter {};
    counter.used = 5;
    auto handler = makeMessageHandler(
        counter, &UsedCounter::markUsed, MockSerializationPolicy {},
        std::make_tuple(COUNT_KEY), std::make_tuple(TOTAL_KEY));
    handle(*handler, {COUNT_KEY, "2"}, REPLY_SUCCESS, {TOTAL_KEY, "7"});
    EXPECT_EQ(7, counter.used);
}

INSTANTIATE_TEST_SUITE_P(
    SuccessFailure, FunctionMessageHandlerTest, Bool());
