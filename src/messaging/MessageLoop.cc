#include "messaging/MessageLoop.hh"

#include "Logging.hh"

#include <algorithm>
#include <cassert>
#include <cerrno>
#include <cstring>
#include <exception>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <vector>

#include <signal.h>
#include <sys/signalfd.h>
#include <unistd.h>

namespace Tarot {
namespace Messaging {

namespace {

sigset_t getTerminationSignals()
{
    auto mask = sigset_t {};
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    return mask;
}

[[noreturn]] void throwErrno(const char* what)
{
    throw std::system_error {errno, std::generic_category(), what};
}

// Owns the signalfd that reports termination signals while the loop runs
class SignalDescriptor {
public:
    SignalDescriptor();
    ~SignalDescriptor();
    SignalDescriptor(const SignalDescriptor&) = delete;
    SignalDescriptor& operator=(const SignalDescriptor&) = delete;

    int get() const { return fd; }
    bool readTermination();

private:
    int fd;
};

SignalDescriptor::SignalDescriptor()
{
    const auto mask = getTerminationSignals();
    fd = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (fd == -1) {
        throwErrno("signalfd");
    }
}

SignalDescriptor::~SignalDescriptor()
{
    if (close(fd) != 0) {
        log(LogLevel::ERROR, "Failed to close signalfd: %s", strerror(errno));
    }
}

bool SignalDescriptor::readTermination()
{
    auto info = signalfd_siginfo {};
    const auto n = read(fd, &info, sizeof(info));
    if (n == -1 && errno == EAGAIN) {
        return false;
    }
    if (n != sizeof(info)) {
        throwErrno("read from signalfd");
    }
    log(LogLevel::DEBUG, "Received signal: %s", strsignal(info.ssi_signo));
    return info.ssi_signo == SIGINT || info.ssi_signo == SIGTERM;
}

}

class MessageLoop::Impl {
public:
    Impl();
    ~Impl();

    void addPollable(PollableSocket socket, SocketCallback callback);
    void run();

private:

    struct Entry {
        PollableSocket socket;
        SocketCallback callback;
    };

    void dispatch(Entry& entry);

    std::vector<Entry> entries;
    sigset_t oldMask;
};

MessageLoop::Impl::Impl()
{
    const auto mask = getTerminationSignals();
    if (const auto err = pthread_sigmask(SIG_BLOCK, &mask, &oldMask)) {
        throw std::system_error {err, std::generic_category(), "pthread_sigmask"};
    }
}

MessageLoop::Impl::~Impl()
{
    if (const auto err = pthread_sigmask(SIG_SETMASK, &oldMask, nullptr)) {
        log(LogLevel::ERROR, "Failed to restore signal mask: %s",
            strerror(err));
    }
}

void MessageLoop::Impl::addPollable(
    PollableSocket socket, SocketCallback callback)
{
    assert(socket);
    const auto duplicate = std::any_of(
        entries.begin(), entries.end(),
        [&socket](const auto& entry) {
            return entry.socket->handle() == socket->handle();
        });
    if (duplicate) {
        throw std::runtime_error {"Socket already registered to the loop"};
    }
    entries.push_back({std::move(socket), std::move(callback)});
}

void MessageLoop::Impl::dispatch(Entry& entry)
{
    try {
        entry.callback(*entry.socket);
    } catch (const SocketError& e) {
        if (e.num() == EINTR) {
            return;
        }
        log(LogLevel::ERROR, "Socket error in message loop: %s", e.what());
    } catch (const std::exception& e) {
        log(LogLevel::ERROR, "Exception caught in message loop: %s",
            e.what());
    }
}

void MessageLoop::Impl::run()
{
    auto signals = SignalDescriptor {};
    // The signalfd is polled as the first item
    auto pollitems = std::vector<Pollitem> {
        { nullptr, signals.get(), ZMQ_POLLIN, 0 }
    };
    for (const auto& entry : entries) {
        pollitems.push_back({ entry.socket->handle(), 0, ZMQ_POLLIN, 0 });
    }

    log(LogLevel::DEBUG, "Message loop polling %d sockets", entries.size());
    while (true) {
        try {
            pollSockets(pollitems);
        } catch (const SocketError& e) {
            if (e.num() != EINTR) {
                throw;
            }
            continue;
        }
        if ((pollitems[0].revents & ZMQ_POLLIN) && signals.readTermination()) {
            log(LogLevel::DEBUG, "Message loop terminating");
            return;
        }
        for (auto n = 1u; n < pollitems.size(); ++n) {
            if (pollitems[n].revents & ZMQ_POLLIN) {
                dispatch(entries[n - 1]);
            }
        }
    }
}

MessageLoop::MessageLoop() :
    impl {std::make_unique<Impl>()}
{
}

MessageLoop::~MessageLoop() = default;

void MessageLoop::addPollable(PollableSocket socket, SocketCallback callback)
{
    if (!socket || !callback) {
        throw std::invalid_argument {"Invalid socket or callback"};
    }
    assert(impl);
    impl->addPollable(std::move(socket), std::move(callback));
}

void MessageLoop::run()
{
    assert(impl);
    impl->run();
}

}
}
