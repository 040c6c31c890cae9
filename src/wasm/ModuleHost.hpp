//===----------------------------------------------------------------------===//
//
// Part of the FunTab project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/wasm/ModuleHost.hpp
// Purpose: Compile and instantiate binary modules whose functions are all
//          imported, then hand out their exports.
// Key invariants: Function index space of a module consists of its imports.
//                 Compilation and instantiation are synchronous.
// Ownership/Lifetime: CompiledModule and Instance are values; an Instance
//                     shares ownership of the functions it exports.
// Links: docs/table-manager.md
//
//===----------------------------------------------------------------------===//
//
// The host understands the module subset needed to adapt foreign callables:
// type, import and export sections (custom sections are skipped).  Modules
// with code, memories, tables or globals are rejected as unsupported.

#pragma once

#include "support/diag_expected.hpp"
#include "wasm/Function.hpp"
#include "wasm/ValType.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace funtab::wasm
{

/// @brief Module magic "\0asm".
inline constexpr uint8_t kModuleMagic[4] = {0x00, 0x61, 0x73, 0x6D};

/// @brief Supported binary format version.
inline constexpr uint32_t kModuleVersion = 1;

/// @brief Section identifiers understood by BinaryModuleHost.
enum class SectionId : uint8_t
{
    Custom = 0,
    Type = 1,
    Import = 2,
    Export = 7,
};

/// @brief Byte introducing a function type in the type section.
inline constexpr uint8_t kFuncTypeForm = 0x60;

/// @brief External kind byte for functions in import/export entries.
inline constexpr uint8_t kExternalFunction = 0x00;

/// @brief Imported function declaration.
struct FuncImport
{
    std::string module;     ///< Import namespace (e.g. "e").
    std::string field;      ///< Name within the namespace (e.g. "f").
    uint32_t typeIndex = 0; ///< Index into CompiledModule::types.
};

/// @brief Exported function declaration.
struct FuncExport
{
    std::string name;       ///< Export name.
    uint32_t funcIndex = 0; ///< Index into the function index space.
};

/// @brief Decoded, validated module ready for instantiation.
struct CompiledModule
{
    std::vector<FuncType> types;
    std::vector<FuncImport> imports;
    std::vector<FuncExport> exports;
};

/// @brief Import bindings keyed by namespace then field name.
using ImportObject = std::map<std::string, std::map<std::string, FunctionPtr>>;

/// @brief Result of instantiating a module.
struct Instance
{
    std::vector<FunctionPtr> functions;                      ///< Function index space.
    std::map<std::string, FunctionPtr, std::less<>> exports; ///< Exports by name.

    /// @brief Exported function @p name, or nullptr when absent.
    FunctionPtr exportedFunction(std::string_view name) const;
};

/// @brief Interface of the binary module host collaborator.
class ModuleHost
{
  public:
    virtual ~ModuleHost() = default;

    /// @brief Decode and validate @p bytes.
    virtual support::Expected<CompiledModule> compile(std::span<const uint8_t> bytes) const = 0;

    /// @brief Bind @p imports to @p module and resolve its exports.
    virtual support::Expected<Instance> instantiate(const CompiledModule &module,
                                                    const ImportObject &imports) const = 0;
};

/// @brief In-process module host for import/export-only modules.
class BinaryModuleHost final : public ModuleHost
{
  public:
    support::Expected<CompiledModule> compile(std::span<const uint8_t> bytes) const override;

    /// @details A typed import must match its declared type exactly and is
    ///          used as-is; an untyped host import is wrapped in a
    ///          TypedFunction of the declared type.
    support::Expected<Instance> instantiate(const CompiledModule &module,
                                            const ImportObject &imports) const override;
};

} // namespace funtab::wasm
