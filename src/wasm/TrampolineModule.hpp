// File: src/wasm/TrampolineModule.hpp
// Purpose: Emits the minimal module that imports one function and re-exports it.
// Key invariants: Only the type section body depends on the function type;
//                 every other byte is identical across syntheses.
// Ownership/Lifetime: Returns owned byte vectors.
// Links: docs/table-manager.md
#pragma once

#include "wasm/Leb128.hpp"
#include "wasm/ValType.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace funtab::wasm
{

/// @brief Namespace of the single import.
inline constexpr const char *kTrampolineImportModule = "e";

/// @brief Field name of the single import.
inline constexpr const char *kTrampolineImportField = "f";

/// @brief Name the imported function is re-exported under.
inline constexpr const char *kTrampolineExportName = "f";

/// @brief Largest parameter count whose type section size still fits the
///        two-byte length prefix.
inline constexpr size_t kMaxTrampolineParams = kMaxShortUleb - 7;

/// @brief Body of the type section for a single function type:
///        count 1, form 0x60, parameter vector, result vector.
std::vector<uint8_t> encodeTypeSectionBody(const FuncType &type);

/// @brief Complete module bytes declaring @p type, importing "e"."f" of that
///        type and exporting it as "f".
/// @pre type.params.size() <= kMaxTrampolineParams and type.results.size() <= 1.
std::vector<uint8_t> buildTrampolineModule(const FuncType &type);

} // namespace funtab::wasm
