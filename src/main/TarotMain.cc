#include "main/TarotMain.hh"

#include "engine/DrawEngine.hh"
#include "engine/MemoryUsedSetBackend.hh"
#include "main/Commands.hh"
#include "main/Config.hh"
#include "main/DatabaseUsedSetBackend.hh"
#include "main/Spread.hh"
#include "messaging/DrawnCardJsonSerializer.hh"
#include "messaging/FunctionMessageHandler.hh"
#include "messaging/Identity.hh"
#include "messaging/JsonSerializer.hh"
#include "messaging/MessageLoop.hh"
#include "messaging/MessageQueue.hh"
#include "messaging/SpreadCardJsonSerializer.hh"
#include "tarot/Deck.hh"
#include "tarot/DeckLoader.hh"
#include "Logging.hh"

#include <cassert>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <variant>
#include <vector>

namespace Tarot {
namespace Main {

using Messaging::failure;
using Messaging::Identity;
using Messaging::JsonSerializer;
using Messaging::makeMessageHandler;
using Messaging::MessageQueue;
using Messaging::Reply;
using Messaging::success;

namespace {

using namespace std::string_view_literals;
const auto HEALTH_OK = "ok"sv;

constexpr auto DEFAULT_COUNT = 1;
constexpr auto DEFAULT_RESET_IF_EXHAUSTED = true;

std::shared_ptr<Engine::UsedSetBackend> initializeBackend(
    std::optional<std::string_view> path)
{
    if (path) {
        log(LogLevel::INFO, "Storing used cards in %s", *path);
        return std::make_shared<DatabaseUsedSetBackend>(std::string {*path});
    }
    log(LogLevel::INFO, "Storing used cards in memory");
    return std::make_shared<Engine::MemoryUsedSetBackend>();
}

const std::string& getFailureReason(const Engine::DrawError error)
{
    switch (error) {
    case Engine::DrawError::NO_DECK_LOADED:
        return NO_DECK_FAILURE;
    case Engine::DrawError::INSUFFICIENT_DISTINCT_CARDS:
        return EXHAUSTED_FAILURE;
    case Engine::DrawError::BACKEND_UNAVAILABLE:
        break;
    }
    return BACKEND_FAILURE;
}

std::int64_t getUnixTime()
{
    const auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::seconds>(
        now.time_since_epoch()).count();
}

}

class TarotMain::Impl {
public:

    Impl(Messaging::MessageContext& context, Config config);

    void run();

private:

    Reply<std::string, Engine::DrawResult> draw(
        const Identity& identity, const std::string& session,
        std::optional<int> count, std::optional<bool> resetIfExhausted);
    Reply<std::string, std::vector<SpreadCard>> spread(
        const Identity& identity, const std::string& session,
        std::optional<bool> resetIfExhausted);
    Reply<std::string> reset(
        const Identity& identity, const std::string& session);
    Reply<std::string_view, std::int64_t, std::size_t> health(
        const Identity& identity);

    const Config config;
    Engine::DrawEngine engine;
    MessageQueue messageQueue;
    Messaging::MessageLoop messageLoop;
};

TarotMain::Impl::Impl(Messaging::MessageContext& context, Config config) :
    config {std::move(config)},
    engine {
        std::make_shared<Deck>(loadDeckFromPaths(this->config.getDeckPaths())),
        initializeBackend(this->config.getDataDir())},
    messageQueue {
        {
            {
                asBytes(DRAW_COMMAND),
                makeMessageHandler(
                    *this, &Impl::draw, JsonSerializer {},
                    std::tuple {
                        SESSION_COMMAND, COUNT_COMMAND,
                        RESET_IF_EXHAUSTED_COMMAND},
                    std::tuple {SESSION_COMMAND, CARDS_COMMAND})
            },
            {
                asBytes(SPREAD_COMMAND),
                makeMessageHandler(
                    *this, &Impl::spread, JsonSerializer {},
                    std::tuple {SESSION_COMMAND, RESET_IF_EXHAUSTED_COMMAND},
                    std::tuple {SESSION_COMMAND, CARDS_COMMAND})
            },
            {
                asBytes(RESET_COMMAND),
                makeMessageHandler(
                    *this, &Impl::reset, JsonSerializer {},
                    std::tuple {SESSION_COMMAND},
                    std::tuple {SESSION_COMMAND})
            },
            {
                asBytes(HEALTH_COMMAND),
                makeMessageHandler(
                    *this, &Impl::health, JsonSerializer {},
                    std::tuple {},
                    std::tuple {
                        STATUS_COMMAND, TIME_COMMAND, DECK_SIZE_COMMAND})
            },
        }}
{
    auto controlSocket = Messaging::makeSharedSocket(
        context, Messaging::SocketType::router);
    const auto endpoint = this->config.getEndpoint();
    Messaging::bindSocket(*controlSocket, endpoint);
    log(LogLevel::INFO, "Listening on %s", endpoint);
    messageLoop.addPollable(
        std::move(controlSocket),
        [&queue = messageQueue](auto& socket) { queue(socket); });
}

void TarotMain::Impl::run()
{
    messageLoop.run();
}

Reply<std::string, Engine::DrawResult> TarotMain::Impl::draw(
    const Identity& identity, const std::string& session,
    std::optional<int> count, std::optional<bool> resetIfExhausted)
{
    log(LogLevel::DEBUG, "Draw command from %s. Session: %s, count: %s",
        identity, session, count);
    const auto n_cards = count.value_or(DEFAULT_COUNT);
    if (session.empty() || n_cards < 0) {
        return failure();
    }
    auto outcome = engine.draw(
        session, n_cards,
        resetIfExhausted.value_or(DEFAULT_RESET_IF_EXHAUSTED));
    if (const auto* error = std::get_if<Engine::DrawError>(&outcome)) {
        log(LogLevel::DEBUG, "Draw failed for session %s: %s",
            session, *error);
        return failure(getFailureReason(*error));
    }
    return success(
        session, std::move(std::get<Engine::DrawResult>(outcome)));
}

Reply<std::string, std::vector<SpreadCard>> TarotMain::Impl::spread(
    const Identity& identity, const std::string& session,
    std::optional<bool> resetIfExhausted)
{
    log(LogLevel::DEBUG, "Spread command from %s. Session: %s",
        identity, session);
    if (session.empty()) {
        return failure();
    }
    auto outcome = engine.draw(
        session, N_SPREAD_CARDS,
        resetIfExhausted.value_or(DEFAULT_RESET_IF_EXHAUSTED));
    if (const auto* error = std::get_if<Engine::DrawError>(&outcome)) {
        log(LogLevel::DEBUG, "Spread failed for session %s: %s",
            session, *error);
        return failure(getFailureReason(*error));
    }
    return success(
        session, tagSpread(std::move(std::get<Engine::DrawResult>(outcome))));
}

Reply<std::string> TarotMain::Impl::reset(
    const Identity& identity, const std::string& session)
{
    log(LogLevel::DEBUG, "Reset command from %s. Session: %s",
        identity, session);
    if (session.empty()) {
        return failure();
    }
    if (!engine.reset(session)) {
        return failure(BACKEND_FAILURE);
    }
    return success(session);
}

Reply<std::string_view, std::int64_t, std::size_t> TarotMain::Impl::health(
    const Identity&)
{
    return success(HEALTH_OK, getUnixTime(), engine.getDeck().size());
}

TarotMain::TarotMain(zmq::context_t& context, Config config) :
    impl {std::make_unique<Impl>(context, std::move(config))}
{
}

TarotMain::~TarotMain() = default;

void TarotMain::run()
{
    assert(impl);
    impl->run();
}

}
}
