/** \file
 *
 * \brief Map keyed by byte buffers
 */

#ifndef BLOBMAP_HH_
#define BLOBMAP_HH_

#include <map>

#include "Blob.hh"

namespace Tarot {

/** \brief Transparent comparator for byte containers
 *
 * Allows looking up a Blob keyed map with a ByteSpan, a string or any other
 * contiguous container without copying the key.
 */
struct BytewiseCompare {
    using is_transparent = void;

    template<typename Lhs, typename Rhs>
    bool operator()(const Lhs& lhs, const Rhs& rhs) const
    {
        return asBytes(lhs) < asBytes(rhs);
    }
};

/// Map from Blob to \p T with heterogeneous lookup
template<typename T>
using BlobMap = std::map<Blob, T, BytewiseCompare>;

}

#endif // BLOBMAP_HH_
