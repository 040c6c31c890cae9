//===----------------------------------------------------------------------===//
//
// Part of the FunTab project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the variable-width integer helpers used when synthesizing and
// decoding modules.  The encoder only covers values below 2^14 (at most two
// bytes); parameter counts and one-entry type section sizes stay below that.
//
//===----------------------------------------------------------------------===//

#include "wasm/Leb128.hpp"

#include <cassert>
#include <string>

namespace funtab::wasm
{

void uleb128Encode(uint32_t n, std::vector<uint8_t> &out)
{
    assert(n < kMaxShortUleb && "uleb128Encode only handles values below 2^14");
    if (n < 128)
    {
        out.push_back(static_cast<uint8_t>(n));
        return;
    }
    out.push_back(static_cast<uint8_t>((n % 128) | 0x80));
    out.push_back(static_cast<uint8_t>(n >> 7));
}

/// @brief Decode a ULEB128 value of at most 32 bits.
///
/// @details Reads up to five bytes.  The fifth byte may only contribute the
///          four remaining high bits and must not carry a continuation flag;
///          anything else is reported as an over-long encoding.  The offset is
///          left untouched when decoding fails.
support::Expected<uint32_t> uleb128Decode(std::span<const uint8_t> bytes, size_t &offset)
{
    uint32_t result = 0;
    size_t pos = offset;
    for (unsigned shift = 0; shift < 35; shift += 7)
    {
        if (pos >= bytes.size())
        {
            return support::makeError(support::ErrorKind::HostFailure,
                                      "truncated LEB128 at offset " + std::to_string(offset));
        }
        const uint8_t byte = bytes[pos++];
        if (shift == 28 && (byte & 0xF0) != 0)
        {
            return support::makeError(support::ErrorKind::HostFailure,
                                      "LEB128 at offset " + std::to_string(offset) +
                                          " does not fit in 32 bits");
        }
        result |= static_cast<uint32_t>(byte & 0x7F) << shift;
        if ((byte & 0x80) == 0)
        {
            offset = pos;
            return result;
        }
    }
    return support::makeError(support::ErrorKind::HostFailure,
                              "LEB128 at offset " + std::to_string(offset) + " does not fit in 32 bits");
}

} // namespace funtab::wasm
