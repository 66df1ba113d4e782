#include "engine/DrawEngine.hh"

#include "engine/UsedSetBackend.hh"
#include "tarot/Deck.hh"
#include "tarot/Random.hh"
#include "Logging.hh"

#include <algorithm>
#include <array>
#include <cassert>
#include <functional>
#include <iterator>
#include <mutex>
#include <ostream>
#include <random>
#include <tuple>
#include <utility>

namespace Tarot {
namespace Engine {

namespace {

// Number of mutexes the sessions are distributed over
constexpr auto N_SESSION_LOCKS = 32u;

std::vector<int> getRemaining(
    const std::vector<int>& indices, const UsedSetBackend::IndexSet& used)
{
    auto ret = std::vector<int> {};
    std::set_difference(
        indices.begin(), indices.end(), used.begin(), used.end(),
        std::back_inserter(ret));
    return ret;
}

std::vector<int> pickIndices(std::vector<int> pool, const int count)
{
    auto& rng = getRng();
    auto ret = std::vector<int> {};
    ret.reserve(count);
    for (auto n = 0; n < count; ++n) {
        auto dist = std::uniform_int_distribution<std::size_t> {
            0, pool.size() - 1};
        const auto iter = std::next(pool.begin(), dist(rng));
        ret.push_back(*iter);
        pool.erase(iter);
    }
    return ret;
}

DrawnCard makeDrawnCard(const TarotCard& card)
{
    auto dist = std::bernoulli_distribution {0.5};
    const auto orientation =
        dist(getRng()) ? Orientation::UPRIGHT : Orientation::REVERSED;
    return DrawnCard {
        card.index, card.name, card.chineseName, card.japaneseName,
        orientation, card.getMeaning(orientation)};
}

}

bool operator==(const DrawnCard& lhs, const DrawnCard& rhs)
{
    return std::tie(
        lhs.index, lhs.name, lhs.chineseName, lhs.japaneseName,
        lhs.orientation, lhs.meaning) ==
        std::tie(
            rhs.index, rhs.name, rhs.chineseName, rhs.japaneseName,
            rhs.orientation, rhs.meaning);
}

std::ostream& operator<<(std::ostream& os, const DrawnCard& card)
{
    return os << card.index << " " << card.name << " (" << card.orientation
              << ")";
}

std::ostream& operator<<(std::ostream& os, const DrawError error)
{
    switch (error) {
    case DrawError::NO_DECK_LOADED:
        return os << "no deck loaded";
    case DrawError::INSUFFICIENT_DISTINCT_CARDS:
        return os << "insufficient distinct cards";
    case DrawError::BACKEND_UNAVAILABLE:
        return os << "backend unavailable";
    }
    return os << "unknown draw error";
}

class DrawEngine::Impl {
public:

    Impl(
        std::shared_ptr<const Deck> deck,
        std::shared_ptr<UsedSetBackend> backend);

    DrawOutcome draw(
        std::string_view session, int count, bool resetIfExhausted);

    bool reset(std::string_view session);

    const Deck& getDeck() const;

private:

    std::mutex& getSessionLock(std::string_view session);

    const std::shared_ptr<const Deck> deck;
    const std::shared_ptr<UsedSetBackend> backend;
    std::array<std::mutex, N_SESSION_LOCKS> sessionLocks;
};

DrawEngine::Impl::Impl(
    std::shared_ptr<const Deck> deck,
    std::shared_ptr<UsedSetBackend> backend) :
    deck {std::move(deck)},
    backend {std::move(backend)}
{
    assert(this->deck);
    assert(this->backend);
}

std::mutex& DrawEngine::Impl::getSessionLock(const std::string_view session)
{
    const auto n = std::hash<std::string_view> {}(session) % sessionLocks.size();
    return sessionLocks[n];
}

DrawOutcome DrawEngine::Impl::draw(
    const std::string_view session, const int count,
    const bool resetIfExhausted)
{
    if (deck->empty()) {
        return DrawError::NO_DECK_LOADED;
    }
    if (count <= 0) {
        return DrawResult {};
    }

    const auto lock = std::lock_guard {getSessionLock(session)};
    try {
        const auto indices = deck->getIndices();
        auto remaining = getRemaining(indices, backend->getUsed(session));
        if (remaining.size() < static_cast<std::size_t>(count)) {
            if (!resetIfExhausted) {
                log(LogLevel::DEBUG,
                    "Session %s has %d cards left, %d requested",
                    session, remaining.size(), count);
                return DrawError::INSUFFICIENT_DISTINCT_CARDS;
            }
            log(LogLevel::DEBUG, "Resetting exhausted session %s", session);
            backend->clearUsed(session);
            remaining = indices;
            if (remaining.size() < static_cast<std::size_t>(count)) {
                return DrawError::INSUFFICIENT_DISTINCT_CARDS;
            }
        }

        const auto picks = pickIndices(std::move(remaining), count);
        for (const auto index : picks) {
            backend->addUsed(session, index);
        }

        auto result = DrawResult {};
        result.reserve(picks.size());
        for (const auto index : picks) {
            const auto* card = deck->getCard(index);
            assert(card);
            result.push_back(makeDrawnCard(*card));
        }
        log(LogLevel::DEBUG, "Drew %d cards for session %s",
            result.size(), session);
        return result;
    } catch (const BackendFailure& e) {
        log(LogLevel::ERROR, "Used set backend failed during draw: %s",
            e.what());
    }
    return DrawError::BACKEND_UNAVAILABLE;
}

bool DrawEngine::Impl::reset(const std::string_view session)
{
    const auto lock = std::lock_guard {getSessionLock(session)};
    try {
        backend->clearUsed(session);
        log(LogLevel::DEBUG, "Reset session %s", session);
        return true;
    } catch (const BackendFailure& e) {
        log(LogLevel::ERROR, "Used set backend failed during reset: %s",
            e.what());
    }
    return false;
}

const Deck& DrawEngine::Impl::getDeck() const
{
    return *deck;
}

DrawEngine::DrawEngine(
    std::shared_ptr<const Deck> deck,
    std::shared_ptr<UsedSetBackend> backend) :
    impl {std::make_unique<Impl>(std::move(deck), std::move(backend))}
{
}

DrawEngine::~DrawEngine() = default;

DrawOutcome DrawEngine::draw(
    const std::string_view session, const int count,
    const bool resetIfExhausted)
{
    assert(impl);
    return impl->draw(session, count, resetIfExhausted);
}

bool DrawEngine::reset(const std::string_view session)
{
    assert(impl);
    return impl->reset(session);
}

const Deck& DrawEngine::getDeck() const
{
    assert(impl);
    return impl->getDeck();
}

}
}
