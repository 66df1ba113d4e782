#include "messaging/Replies.hh"

#include <algorithm>
#include <iterator>

namespace Tarot {
namespace Messaging {

using namespace BlobLiterals;

const ByteSpan REPLY_SUCCESS = "OK"_BS;
const ByteSpan REPLY_FAILURE = "ERR"_BS;
const ByteSpan REPLY_SEPARATOR = ":"_BS;

Blob makeFailureStatus(const ByteSpan reason)
{
    auto ret = Blob(REPLY_FAILURE.begin(), REPLY_FAILURE.end());
    if (!reason.empty()) {
        ret.insert(ret.end(), REPLY_SEPARATOR.begin(), REPLY_SEPARATOR.end());
        ret.insert(ret.end(), reason.begin(), reason.end());
    }
    return ret;
}

bool isSuccessful(const ByteSpan code)
{
    const auto first_to_differ = std::mismatch(
        code.begin(), code.end(),
        REPLY_SUCCESS.begin(), REPLY_SUCCESS.end()).second;
    return first_to_differ == REPLY_SUCCESS.end();
}

}
}
