/** \file
 *
 * \brief Definition of Tarot::Messaging::FunctionMessageHandler class
 */

#ifndef MESSAGING_FUNCTIONMESSAGEHANDLER_HH_
#define MESSAGING_FUNCTIONMESSAGEHANDLER_HH_

#include "messaging/Identity.hh"
#include "messaging/MessageHandler.hh"
#include "messaging/Replies.hh"
#include "messaging/SerializationFailureException.hh"
#include "Blob.hh"

#include <algorithm>
#include <array>
#include <cassert>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>

namespace Tarot {
namespace Messaging {

/** \brief Failed reply
 *
 * \sa Reply, makeFailureStatus()
 */
struct ReplyFailure {

    /// Reason appended to the status, or empty
    Blob reason;
};

/** \brief Successful reply carrying \p Args
 *
 * \sa Reply
 */
template<typename... Args>
struct ReplySuccess {

    /** \brief Convert from a reply with compatible argument types
     */
    template<typename... Args2>
    ReplySuccess(ReplySuccess<Args2...> other) :
        arguments(std::move(other.arguments))
    {
    }

    /** \brief Create reply from a tuple of arguments
     */
    template<typename... Args2>
    explicit ReplySuccess(std::tuple<Args2...> args) :
        arguments(std::move(args))
    {
    }

    /// The arguments sent back to the client
    std::tuple<Args...> arguments;
};

/** \brief Return type of the functions wrapped by FunctionMessageHandler
 *
 * \tparam Args the types of the arguments of a successful reply
 */
template<typename... Args>
struct Reply {

    /// The argument types of a successful reply
    using Types = std::tuple<Args...>;

    template<typename... Args2>
    Reply(ReplySuccess<Args2...> reply) : reply {std::move(reply)}
    {
    }

    Reply(ReplyFailure reply) : reply {std::move(reply)}
    {
    }

    /// Either the failure or the successful reply
    std::variant<ReplyFailure, ReplySuccess<Args...>> reply;
};

/// Create successful reply with \p args
template<typename... Args>
auto success(Args&&... args)
{
    return ReplySuccess<Args...> {
        std::forward_as_tuple<Args...>(std::forward<Args>(args)...)};
}

/// Create failed reply
inline auto failure()
{
    return ReplyFailure {};
}

/** \brief Create failed reply with a reason
 *
 * The reason is reported to the client as part of the status, see
 * makeFailureStatus().
 */
inline auto failure(const std::string_view reason)
{
    return ReplyFailure {stringToBlob(reason)};
}

/// \cond DOXYGEN_IGNORE

namespace FunctionMessageHandlerImpl {

template<typename T>
struct ArgTraits {
    using ValueType = T;
    static constexpr bool REQUIRED = true;
};

template<typename T>
struct ArgTraits<std::optional<T>> {
    using ValueType = T;
    static constexpr bool REQUIRED = false;
};

template<typename T>
using Traits = ArgTraits<std::decay_t<T>>;

template<typename Arg, typename T>
decltype(auto) unwrapArg(std::optional<T>& value)
{
    if constexpr (Traits<Arg>::REQUIRED) {
        assert(value);
        return std::move(*value);
    } else {
        return std::move(value);
    }
}

template<typename Keys>
auto makeKeys(const Keys& keys)
{
    return std::apply(
        [](const auto&... key)
        {
            return std::array<Blob, sizeof...(key)> { stringToBlob(key)... };
        },
        keys);
}

template<typename SerializationPolicy, typename T>
void addReplyArg(
    SerializationPolicy& serializer, Response& response, const ByteSpan key,
    const T& value)
{
    response.addFrame(key);
    response.addFrame(asBytes(serializer.serialize(value)));
}

template<typename SerializationPolicy, typename T>
void addReplyArg(
    SerializationPolicy& serializer, Response& response, const ByteSpan key,
    const std::optional<T>& value)
{
    if (value) {
        addReplyArg(serializer, response, key, *value);
    }
}

}

/// \endcond

/** \brief Adapt a function into the MessageHandler interface
 *
 * The message parameters are key–value pairs. FunctionMessageHandler finds
 * the value for each key it knows, deserializes it with \p
 * SerializationPolicy, and calls the function with the Identity of the sender
 * followed by the values in the order of \p Args. Unknown keys are ignored.
 *
 * The function returns a Reply. A ReplyFailure sets a failed status,
 * including the reason if one was given. A ReplySuccess sets the successful
 * status and each of its arguments is serialized and added as a key–value
 * pair, using the reply keys given to the constructor.
 *
 * An argument of type \c std::optional<T> may be missing from the message. If
 * present, its value is deserialized as \c T. Every other argument is
 * required, and the handler replies with failure without calling the function
 * if one is missing or cannot be deserialized. Empty optional values in a
 * successful reply are left out of the response.
 *
 * \code{.cc}
 * Reply<int> count(const Identity& identity, const std::string& session)
 * {
 *     if (const auto* used = findSession(session)) {
 *         return success(used->size());
 *     }
 *     return failure("NOSESSION");
 * }
 * \endcode
 *
 * \tparam Function the wrapped function
 * \tparam SerializationPolicy see \ref serializationpolicy
 * \tparam Args the argument types of \p Function after the identity
 *
 * \sa makeMessageHandler()
 */
template<typename Function, typename SerializationPolicy, typename... Args>
class FunctionMessageHandler : public MessageHandler {
public:

    /** \brief Create function message handler
     *
     * \param function the wrapped function
     * \param serializer the serialization policy
     * \param keys tuple of parameter keys, in the order of \p Args
     * \param replyKeys tuple of reply keys, in the order of the arguments of
     * the successful reply
     */
    template<typename Keys, typename ReplyKeys>
    FunctionMessageHandler(
        Function function, SerializationPolicy serializer,
        Keys&& keys, ReplyKeys&& replyKeys);

private:

    using ResultType = std::invoke_result_t<
        Function, const Identity&, std::decay_t<Args>...>;

    static constexpr auto N_ARGS = sizeof...(Args);
    static constexpr auto N_REPLY_ARGS =
        std::tuple_size_v<typename ResultType::Types>;

    using ArgValues = std::tuple<
        std::optional<
            typename FunctionMessageHandlerImpl::Traits<Args>::ValueType>...>;
    using ParamValues = std::array<std::optional<ByteSpan>, N_ARGS>;

    void doHandle(
        const Identity& identity, const ParameterVector& params,
        Response& response) override;

    bool collectParams(const ParameterVector& params, ParamValues& values) const;

    template<std::size_t N>
    bool deserializeArg(const ParamValues& values, ArgValues& args);

    template<std::size_t... Ns>
    bool deserializeArgs(
        const ParamValues& values, ArgValues& args, std::index_sequence<Ns...>);

    template<std::size_t... Ns>
    ResultType invokeFunction(
        const Identity& identity, ArgValues& args, std::index_sequence<Ns...>);

    template<typename Arguments, std::size_t... Ns>
    void addReplyArgs(
        const Arguments& arguments, Response& response,
        std::index_sequence<Ns...>);

    Function function;
    SerializationPolicy serializer;
    std::array<Blob, N_ARGS> argKeys;
    std::array<Blob, N_REPLY_ARGS> replyKeys;
};

template<typename Function, typename SerializationPolicy, typename... Args>
template<typename Keys, typename ReplyKeys>
FunctionMessageHandler<Function, SerializationPolicy, Args...>::
FunctionMessageHandler(
    Function function, SerializationPolicy serializer, Keys&& keys,
    ReplyKeys&& replyKeys) :
    function(std::move(function)),
    serializer(std::move(serializer)),
    argKeys {FunctionMessageHandlerImpl::makeKeys(keys)},
    replyKeys {FunctionMessageHandlerImpl::makeKeys(replyKeys)}
{
    static_assert(
        N_ARGS == std::tuple_size_v<std::decay_t<Keys>>,
        "Number of keys must match the number of arguments");
    static_assert(
        N_REPLY_ARGS == std::tuple_size_v<std::decay_t<ReplyKeys>>,
        "Number of reply keys must match the number of reply arguments");
}

template<typename Function, typename SerializationPolicy, typename... Args>
bool FunctionMessageHandler<Function, SerializationPolicy, Args...>::
collectParams(const ParameterVector& params, ParamValues& values) const
{
    for (auto iter = params.begin(); iter != params.end(); iter += 2) {
        // Key without value
        if (std::next(iter) == params.end()) {
            return false;
        }
        const auto key_iter = std::find_if(
            argKeys.begin(), argKeys.end(),
            [key = *iter](const auto& arg_key)
            {
                return asBytes(arg_key) == key;
            });
        if (key_iter != argKeys.end()) {
            values[key_iter - argKeys.begin()] = *std::next(iter);
        }
    }
    return true;
}

template<typename Function, typename SerializationPolicy, typename... Args>
template<std::size_t N>
bool FunctionMessageHandler<Function, SerializationPolicy, Args...>::
deserializeArg(const ParamValues& values, ArgValues& args)
{
    using Traits = FunctionMessageHandlerImpl::Traits<
        std::tuple_element_t<N, std::tuple<Args...>>>;
    const auto& value = std::get<N>(values);
    if (!value) {
        return !Traits::REQUIRED;
    }
    std::get<N>(args).emplace(
        serializer.template deserialize<typename Traits::ValueType>(*value));
    return true;
}

template<typename Function, typename SerializationPolicy, typename... Args>
template<std::size_t... Ns>
bool FunctionMessageHandler<Function, SerializationPolicy, Args...>::
deserializeArgs(
    [[maybe_unused]] const ParamValues& values,
    [[maybe_unused]] ArgValues& args, std::index_sequence<Ns...>)
{
    return ( true && ... && deserializeArg<Ns>(values, args) );
}

template<typename Function, typename SerializationPolicy, typename... Args>
template<std::size_t... Ns>
auto FunctionMessageHandler<Function, SerializationPolicy, Args...>::
invokeFunction(
    const Identity& identity, [[maybe_unused]] ArgValues& args,
    std::index_sequence<Ns...>) -> ResultType
{
    return std::invoke(
        function, identity,
        FunctionMessageHandlerImpl::unwrapArg<Args>(std::get<Ns>(args))...);
}

template<typename Function, typename SerializationPolicy, typename... Args>
template<typename Arguments, std::size_t... Ns>
void FunctionMessageHandler<Function, SerializationPolicy, Args...>::
addReplyArgs(
    [[maybe_unused]] const Arguments& arguments,
    [[maybe_unused]] Response& response, std::index_sequence<Ns...>)
{
    ( ..., FunctionMessageHandlerImpl::addReplyArg(
        serializer, response, std::get<Ns>(replyKeys),
        std::get<Ns>(arguments)) );
}

template<typename Function, typename SerializationPolicy, typename... Args>
void FunctionMessageHandler<Function, SerializationPolicy, Args...>::doHandle(
    const Identity& identity, const ParameterVector& params,
    Response& response)
{
    auto values = ParamValues {};
    if (!collectParams(params, values)) {
        response.setStatus(REPLY_FAILURE);
        return;
    }

    auto args = ArgValues {};
    auto valid = false;
    try {
        valid = deserializeArgs(
            values, args, std::index_sequence_for<Args...> {});
    } catch (const SerializationFailureException&) {
        valid = false;
    }
    if (!valid) {
        response.setStatus(REPLY_FAILURE);
        return;
    }

    const auto result = invokeFunction(
        identity, args, std::index_sequence_for<Args...> {});
    if (const auto* failed = std::get_if<ReplyFailure>(&result.reply)) {
        response.setStatus(makeFailureStatus(failed->reason));
        return;
    }
    response.setStatus(REPLY_SUCCESS);
    addReplyArgs(
        std::get<1>(result.reply).arguments, response,
        std::make_index_sequence<N_REPLY_ARGS> {});
}

/** \brief Wrap a function object into a message handler
 *
 * \p Args cannot be deduced from a general function object and must be given
 * explicitly.
 *
 * \tparam Args the argument types of \p function after the identity
 *
 * \param function the function to wrap
 * \param serializer the serialization policy
 * \param keys tuple of parameter keys
 * \param replyKeys tuple of reply keys
 *
 * \return the message handler
 */
template<
    typename... Args, typename Function, typename SerializationPolicy,
    typename Keys = std::tuple<>, typename ReplyKeys = std::tuple<>>
requires std::is_invocable_v<
    std::decay_t<Function>&, const Identity&, std::decay_t<Args>...>
auto makeMessageHandler(
    Function&& function, SerializationPolicy&& serializer, Keys&& keys = {},
    ReplyKeys&& replyKeys = {})
{
    return std::make_unique<
        FunctionMessageHandler<
            std::decay_t<Function>, std::decay_t<SerializationPolicy>,
            Args...>>(
            std::forward<Function>(function),
            std::forward<SerializationPolicy>(serializer),
            std::forward<Keys>(keys),
            std::forward<ReplyKeys>(replyKeys));
}

/** \brief Wrap a member function into a message handler
 *
 * The returned handler refers to \p handler, which must outlive it.
 *
 * \param handler the object the member function is called on
 * \param memfn the member function
 * \param serializer the serialization policy
 * \param keys tuple of parameter keys
 * \param replyKeys tuple of reply keys
 *
 * \return the message handler
 */
template<
    typename Handler, typename Reply, typename... Args,
    typename SerializationPolicy, typename Keys = std::tuple<>,
    typename ReplyKeys = std::tuple<>>
auto makeMessageHandler(
    Handler& handler, Reply (Handler::*memfn)(const Identity&, Args...),
    SerializationPolicy&& serializer, Keys&& keys = {},
    ReplyKeys&& replyKeys = {})
{
    return makeMessageHandler<Args...>(
        [&handler, memfn](
            const Identity& identity, std::decay_t<Args>&&... args)
        {
            return (handler.*memfn)(identity, std::move(args)...);
        },
        std::forward<SerializationPolicy>(serializer),
        std::forward<Keys>(keys),
        std::forward<ReplyKeys>(replyKeys));
}

}
}

#endif // MESSAGING_FUNCTIONMESSAGEHANDLER_HH_
