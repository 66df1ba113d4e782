/** \file
 *
 * \brief Byte buffers used for message frames
 */

#ifndef BLOB_HH_
#define BLOB_HH_

#include <algorithm>
#include <compare>
#include <cstddef>
#include <iterator>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace Tarot {

/** \brief Owned binary data
 *
 * Used for routing IDs, command names and other frames that outlive the
 * message they were received in.
 */
class Blob : public std::vector<std::byte> {
public:
    using std::vector<std::byte>::vector;
};

/** \brief View to a sequence of bytes
 *
 * Unlike plain \c std::span, byte spans compare by contents.
 */
class ByteSpan : public std::span<const std::byte>
{
public:
    using std::span<const std::byte>::span;
};

/// Compare byte spans lexicographically
constexpr auto operator<=>(const ByteSpan& lhs, const ByteSpan& rhs)
{
    return std::lexicographical_compare_three_way(
        lhs.begin(), lhs.end(), rhs.begin(), rhs.end());
}

/// Compare byte spans by contents
constexpr bool operator==(const ByteSpan& lhs, const ByteSpan& rhs)
{
    return std::equal(lhs.begin(), lhs.end(), rhs.begin(), rhs.end());
}

/** \brief View the object representation of a contiguous container
 *
 * \param container a contiguous container, such as a string or a Blob
 *
 * \return ByteSpan over the bytes of the elements in \p container
 */
template<typename Container>
ByteSpan asBytes(const Container& container)
{
    const auto size = std::size(container) * sizeof(*std::data(container));
    return {
        reinterpret_cast<const std::byte*>(std::data(container)),
        static_cast<ByteSpan::size_type>(size)};
}

/// Copy the bytes of a string or other container of chars into a Blob
template<typename String>
Blob stringToBlob(const String& string)
{
    static_assert(sizeof(*std::data(string)) == 1);
    const auto bytes = asBytes(string);
    return Blob(bytes.begin(), bytes.end());
}

/// Copy bytes into a string
template<typename ByteRange>
std::string blobToString(const ByteRange& bytes)
{
    static_assert(sizeof(*std::data(bytes)) == 1);
    return std::string(
        reinterpret_cast<const char*>(std::data(bytes)), std::size(bytes));
}

inline namespace BlobLiterals {

/// Blob from a string literal
inline Blob operator"" _B(const char* str, std::size_t len)
{
    return stringToBlob(std::string_view {str, len});
}

/// Byte span over a string literal
inline ByteSpan operator"" _BS(const char* str, std::size_t len)
{
    return ByteSpan(reinterpret_cast<const std::byte*>(str), len);
}

}

}

#endif // BLOB_HH_
