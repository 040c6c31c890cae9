//===----------------------------------------------------------------------===//
//
// Part of the FunTab project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the in-process module host.  compile() walks the section list in
// order, decoding each known section from a reader bounded to that section so a
// malformed body can never consume bytes of the next one.  instantiate() binds
// imports by namespace and field name and builds the export map from the
// resulting function index space.
//
// Every failure is a HostFailure diagnostic; callers propagate the message
// verbatim.
//
//===----------------------------------------------------------------------===//

#include "wasm/ModuleHost.hpp"

#include "wasm/BinaryReader.hpp"

#include <memory>
#include <string>
#include <utility>

namespace funtab::wasm
{
namespace
{

support::Diag hostError(std::string msg)
{
    return support::makeError(support::ErrorKind::HostFailure, std::move(msg));
}

std::string hexByte(uint8_t byte)
{
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out = "0x";
    out += kDigits[byte >> 4];
    out += kDigits[byte & 0x0F];
    return out;
}

/// @brief Decode one value type byte.
support::Expected<ValType> readValType(BinaryReader &reader)
{
    const size_t at = reader.offset();
    auto code = reader.readByte();
    if (!code)
        return code.error();
    ValType type{};
    if (!valTypeFromCode(code.value(), type))
    {
        return hostError("invalid value type " + hexByte(code.value()) + " at offset " +
                         std::to_string(at));
    }
    return type;
}

support::Expected<void> decodeTypeSection(BinaryReader &reader, CompiledModule &out)
{
    auto count = reader.readVarU32();
    if (!count)
        return count.error();
    for (uint32_t i = 0; i < count.value(); ++i)
    {
        auto form = reader.readByte();
        if (!form)
            return form.error();
        if (form.value() != kFuncTypeForm)
            return hostError("type " + std::to_string(i) + ": expected function form 0x60");

        FuncType type;
        auto paramCount = reader.readVarU32();
        if (!paramCount)
            return paramCount.error();
        if (paramCount.value() > reader.remaining())
            return hostError("type " + std::to_string(i) + ": parameter count exceeds section");
        type.params.reserve(paramCount.value());
        for (uint32_t p = 0; p < paramCount.value(); ++p)
        {
            auto param = readValType(reader);
            if (!param)
                return param.error();
            type.params.push_back(param.value());
        }

        auto resultCount = reader.readVarU32();
        if (!resultCount)
            return resultCount.error();
        if (resultCount.value() > 1)
            return hostError("type " + std::to_string(i) + ": multi-value results are not supported");
        if (resultCount.value() == 1)
        {
            auto result = readValType(reader);
            if (!result)
                return result.error();
            type.results.push_back(result.value());
        }
        out.types.push_back(std::move(type));
    }
    return {};
}

support::Expected<void> decodeImportSection(BinaryReader &reader, CompiledModule &out)
{
    auto count = reader.readVarU32();
    if (!count)
        return count.error();
    for (uint32_t i = 0; i < count.value(); ++i)
    {
        FuncImport import;
        auto module = reader.readName();
        if (!module)
            return module.error();
        auto field = reader.readName();
        if (!field)
            return field.error();
        import.module = std::move(module.value());
        import.field = std::move(field.value());

        auto kind = reader.readByte();
        if (!kind)
            return kind.error();
        if (kind.value() != kExternalFunction)
        {
            return hostError("import " + import.module + "." + import.field +
                             ": only function imports are supported");
        }

        auto typeIndex = reader.readVarU32();
        if (!typeIndex)
            return typeIndex.error();
        if (typeIndex.value() >= out.types.size())
        {
            return hostError("import " + import.module + "." + import.field + ": type index " +
                             std::to_string(typeIndex.value()) + " out of range");
        }
        import.typeIndex = typeIndex.value();
        out.imports.push_back(std::move(import));
    }
    return {};
}

support::Expected<void> decodeExportSection(BinaryReader &reader, CompiledModule &out)
{
    auto count = reader.readVarU32();
    if (!count)
        return count.error();
    for (uint32_t i = 0; i < count.value(); ++i)
    {
        FuncExport exp;
        auto name = reader.readName();
        if (!name)
            return name.error();
        exp.name = std::move(name.value());

        for (const auto &existing : out.exports)
        {
            if (existing.name == exp.name)
                return hostError("duplicate export '" + exp.name + "'");
        }

        auto kind = reader.readByte();
        if (!kind)
            return kind.error();
        if (kind.value() != kExternalFunction)
            return hostError("export '" + exp.name + "': only function exports are supported");

        auto funcIndex = reader.readVarU32();
        if (!funcIndex)
            return funcIndex.error();
        if (funcIndex.value() >= out.imports.size())
        {
            return hostError("export '" + exp.name + "': function index " +
                             std::to_string(funcIndex.value()) + " out of range");
        }
        exp.funcIndex = funcIndex.value();
        out.exports.push_back(std::move(exp));
    }
    return {};
}

} // namespace

FunctionPtr Instance::exportedFunction(std::string_view name) const
{
    auto it = exports.find(name);
    if (it == exports.end())
        return nullptr;
    return it->second;
}

/// @brief Decode and validate a module.
///
/// @details Checks the magic number and version, then processes sections in
///          order.  Custom sections are skipped, known sections must appear at
///          most once and in ascending id order, and each section body must be
///          consumed exactly.
support::Expected<CompiledModule> BinaryModuleHost::compile(std::span<const uint8_t> bytes) const
{
    BinaryReader reader(bytes);

    auto magic = reader.readBytes(sizeof(kModuleMagic));
    if (!magic)
        return hostError("module too short for magic number");
    for (size_t i = 0; i < sizeof(kModuleMagic); ++i)
    {
        if (magic.value()[i] != kModuleMagic[i])
            return hostError("bad module magic number");
    }

    auto version = reader.readBytes(4);
    if (!version)
        return hostError("module too short for version");
    const auto &v = version.value();
    const uint32_t versionValue = static_cast<uint32_t>(v[0]) | (static_cast<uint32_t>(v[1]) << 8) |
                                  (static_cast<uint32_t>(v[2]) << 16) |
                                  (static_cast<uint32_t>(v[3]) << 24);
    if (versionValue != kModuleVersion)
        return hostError("unsupported module version " + std::to_string(versionValue));

    CompiledModule module;
    uint8_t lastId = 0;
    while (!reader.atEnd())
    {
        auto id = reader.readByte();
        if (!id)
            return id.error();
        auto size = reader.readVarU32();
        if (!size)
            return size.error();
        auto body = reader.readBytes(size.value());
        if (!body)
            return hostError("section " + std::to_string(id.value()) + " extends past end of module");

        if (id.value() == static_cast<uint8_t>(SectionId::Custom))
            continue;
        if (id.value() <= lastId)
            return hostError("section " + std::to_string(id.value()) + " out of order");
        lastId = id.value();

        BinaryReader section(body.value());
        support::Expected<void> decoded;
        switch (static_cast<SectionId>(id.value()))
        {
            case SectionId::Type:
                decoded = decodeTypeSection(section, module);
                break;
            case SectionId::Import:
                decoded = decodeImportSection(section, module);
                break;
            case SectionId::Export:
                decoded = decodeExportSection(section, module);
                break;
            default:
                return hostError("unsupported section id " + std::to_string(id.value()));
        }
        if (!decoded)
            return decoded.error();
        if (!section.atEnd())
            return hostError("section " + std::to_string(id.value()) + " size mismatch");
    }
    return module;
}

support::Expected<Instance> BinaryModuleHost::instantiate(const CompiledModule &module,
                                                          const ImportObject &imports) const
{
    Instance instance;
    instance.functions.reserve(module.imports.size());

    for (const auto &import : module.imports)
    {
        const std::string qualified = import.module + "." + import.field;
        FunctionPtr provided;
        if (auto ns = imports.find(import.module); ns != imports.end())
        {
            if (auto fn = ns->second.find(import.field); fn != ns->second.end())
                provided = fn->second;
        }
        if (!provided)
            return hostError("missing import " + qualified);

        const FuncType &declared = module.types[import.typeIndex];
        if (const FuncType *actual = provided->type())
        {
            if (*actual != declared)
            {
                return hostError("import " + qualified + ": signature mismatch, expected " +
                                 declared.toString() + ", got " + actual->toString());
            }
            instance.functions.push_back(provided);
        }
        else
        {
            instance.functions.push_back(
                std::make_shared<TypedFunction>(provided->name(), declared, provided));
        }
    }

    for (const auto &exp : module.exports)
        instance.exports.emplace(exp.name, instance.functions[exp.funcIndex]);

    return instance;
}

} // namespace funtab::wasm
