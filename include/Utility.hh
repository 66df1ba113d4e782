/** \file
 *
 * \brief General purpose utilities
 */

#ifndef UTILITY_HH_
#define UTILITY_HH_

#include <concepts>
#include <ranges>
#include <stdexcept>

namespace Tarot {

/** \brief Dereference a pointer or pointer‐like object
 *
 * \throw std::invalid_argument if \p p is null
 */
template<typename T>
constexpr decltype(auto) dereference(const T& p)
{
    if (!p) {
        throw std::invalid_argument {"Dereferencing null pointer"};
    }
    return *p;
}

/** \brief Range of integers from zero to \p n, exclusive
 *
 * \throw std::invalid_argument if \p n is negative
 */
template<std::integral Integer>
constexpr auto to(const Integer n)
{
    if (n < Integer {}) {
        throw std::invalid_argument {"Negative range size"};
    }
    return std::views::iota(Integer {}, n);
}

}

#endif // UTILITY_HH_
