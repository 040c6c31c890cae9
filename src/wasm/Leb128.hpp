// File: src/wasm/Leb128.hpp
// Purpose: Unsigned LEB128 encoding and decoding for module bytes.
// Key invariants: uleb128Encode only accepts values below 2^14.
// Ownership/Lifetime: Stateless free functions operating on caller buffers.
// Links: docs/table-manager.md
#pragma once

#include "support/diag_expected.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace funtab::wasm
{

/// @brief Exclusive upper bound accepted by uleb128Encode.
inline constexpr uint32_t kMaxShortUleb = 1u << 14;

/// @brief Append the ULEB128 encoding of @p n to @p out.
/// @details Emits one byte for values below 128 and two bytes otherwise,
///          least-significant 7-bit group first with the continuation bit set
///          on the leading byte.
/// @pre n < kMaxShortUleb (asserted in debug builds).
void uleb128Encode(uint32_t n, std::vector<uint8_t> &out);

/// @brief Decode a ULEB128 value of at most 32 bits from @p bytes at @p offset.
/// @param bytes Input buffer.
/// @param[in,out] offset Read position; advanced past the encoding on success.
/// @return Decoded value, or a HostFailure diagnostic for truncated or
///         over-long encodings.
support::Expected<uint32_t> uleb128Decode(std::span<const uint8_t> bytes, size_t &offset);

} // namespace funtab::wasm
