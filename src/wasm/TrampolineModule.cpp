//===----------------------------------------------------------------------===//
//
// Part of the FunTab project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Emits the adapter module used to turn an untyped host callable into a typed
// table entry.  In text form the module is
//
//   (module
//     (type (func (param ...) (result ...)))
//     (import "e" "f" (func (type 0)))
//     (export "f" (func 0)))
//
// The import and export sections never change, so they are stored as constant
// byte strings; only the type section is encoded per call.
//
//===----------------------------------------------------------------------===//

#include "wasm/TrampolineModule.hpp"

#include "wasm/Leb128.hpp"
#include "wasm/ModuleHost.hpp"

#include <array>
#include <cassert>

namespace funtab::wasm
{
namespace
{

constexpr std::array<uint8_t, 8> kHeader = {
    0x00, 0x61, 0x73, 0x6D, // magic ("\0asm")
    0x01, 0x00, 0x00, 0x00, // version 1
};

// (import "e" "f" (func 0 (type 0)))
constexpr std::array<uint8_t, 9> kImportSection = {
    static_cast<uint8_t>(SectionId::Import),
    0x07, // section size
    0x01, // one import
    0x01, 0x65, // "e"
    0x01, 0x66, // "f"
    kExternalFunction,
    0x00, // type index 0
};

// (export "f" (func 0))
constexpr std::array<uint8_t, 7> kExportSection = {
    static_cast<uint8_t>(SectionId::Export),
    0x05, // section size
    0x01, // one export
    0x01, 0x66, // "f"
    kExternalFunction,
    0x00, // function index 0
};

} // namespace

std::vector<uint8_t> encodeTypeSectionBody(const FuncType &type)
{
    assert(type.results.size() <= 1 && "multi-value results are not supported");

    std::vector<uint8_t> body = {
        0x01, // count: 1
        kFuncTypeForm,
    };
    uleb128Encode(static_cast<uint32_t>(type.params.size()), body);
    for (ValType param : type.params)
        body.push_back(typeCode(param));

    if (type.results.empty())
    {
        body.push_back(0x00);
    }
    else
    {
        body.push_back(0x01);
        body.push_back(typeCode(type.results.front()));
    }
    return body;
}

std::vector<uint8_t> buildTrampolineModule(const FuncType &type)
{
    const std::vector<uint8_t> typeBody = encodeTypeSectionBody(type);

    std::vector<uint8_t> bytes(kHeader.begin(), kHeader.end());
    bytes.reserve(kHeader.size() + 3 + typeBody.size() + kImportSection.size() +
                  kExportSection.size());
    bytes.push_back(static_cast<uint8_t>(SectionId::Type));
    uleb128Encode(static_cast<uint32_t>(typeBody.size()), bytes);
    bytes.insert(bytes.end(), typeBody.begin(), typeBody.end());
    bytes.insert(bytes.end(), kImportSection.begin(), kImportSection.end());
    bytes.insert(bytes.end(), kExportSection.begin(), kExportSection.end());
    return bytes;
}

} // namespace funtab::wasm
