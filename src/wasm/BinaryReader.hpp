// File: src/wasm/BinaryReader.hpp
// Purpose: Bounds-checked cursor over module bytes.
// Key invariants: A failed read leaves the cursor where it was.
// Ownership/Lifetime: Borrows the byte span; the caller keeps it alive.
// Links: docs/table-manager.md
#pragma once

#include "support/diag_expected.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace funtab::wasm
{

class BinaryReader
{
  public:
    explicit BinaryReader(std::span<const uint8_t> bytes) : bytes_(bytes) {}

    size_t offset() const noexcept
    {
        return pos_;
    }

    size_t remaining() const noexcept
    {
        return bytes_.size() - pos_;
    }

    bool atEnd() const noexcept
    {
        return pos_ >= bytes_.size();
    }

    support::Expected<uint8_t> readByte();

    /// @brief Read a ULEB128-encoded unsigned 32-bit value.
    support::Expected<uint32_t> readVarU32();

    /// @brief Read a length-prefixed UTF-8 name.
    support::Expected<std::string> readName();

    /// @brief Borrow the next @p count bytes and advance past them.
    support::Expected<std::span<const uint8_t>> readBytes(size_t count);

  private:
    std::span<const uint8_t> bytes_;
    size_t pos_ = 0;
};

} // namespace funtab::wasm
