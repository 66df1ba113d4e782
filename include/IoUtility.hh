/** \file
 *
 * \brief Stream utilities
 */

#ifndef IOUTILITY_HH_
#define IOUTILITY_HH_

#include <fstream>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

namespace Tarot {

/** \brief Write optional value, or “(none)” if empty
 */
template<typename T>
std::ostream& operator<<(std::ostream& os, const std::optional<T>& t)
{
    if (!t) {
        return os << "(none)";
    }
    return os << *t;
}

/** \brief Invoke \p callback with an input stream opened from \p path
 *
 * The path “-” means standard input. Any other path is opened as a file,
 * which stays open until \p callback returns. \p callback checks the state of
 * the stream itself.
 *
 * \return the result of \p callback
 */
template<typename Callable>
decltype(auto) processStreamFromPath(
    const std::string_view path, Callable&& callback)
{
    if (path == "-") {
        return std::invoke(std::forward<Callable>(callback), std::cin);
    }
    auto file = std::ifstream {std::string {path}};
    return std::invoke(
        std::forward<Callable>(callback), static_cast<std::istream&>(file));
}

}

#endif // IOUTILITY_HH_
