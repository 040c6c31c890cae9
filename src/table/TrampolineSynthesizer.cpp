//===----------------------------------------------------------------------===//
//
// Part of the FunTab project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Converts untyped host callables into typed table entries.  When the host
// offers a reflection constructor the entry is built directly from the
// translated type.  Otherwise a one-function adapter module is synthesized,
// compiled and instantiated synchronously with the callable bound to the
// "e"."f" import, and the "f" export is returned.
//
//===----------------------------------------------------------------------===//

#include "table/TrampolineSynthesizer.hpp"

#include "support/debug_log.hpp"
#include "wasm/SignatureTranslator.hpp"
#include "wasm/TrampolineModule.hpp"

#include <string>

namespace funtab::table
{

support::Expected<wasm::FunctionPtr> TrampolineSynthesizer::convert(
    const wasm::FunctionPtr &callable, std::string_view sig) const
{
    if (!callable)
    {
        return support::makeError(support::ErrorKind::ContractViolation,
                                  "cannot convert a null function");
    }

    auto type = wasm::sigToWasmTypes(sig);
    if (!type)
        return type.error();

    if (reflection_)
    {
        support::tableDebugLog("convert '%s' via reflection as %s",
                               callable->name().c_str(),
                               type.value().toString().c_str());
        wasm::FunctionPtr built = reflection_->buildFunction(type.value(), callable);
        if (!built)
        {
            return support::makeError(support::ErrorKind::HostFailure,
                                      "reflection produced no function for '" + callable->name() +
                                          "'");
        }
        return built;
    }

    if (type.value().params.size() > wasm::kMaxTrampolineParams)
    {
        return support::makeError(support::ErrorKind::ContractViolation,
                                  "signature for '" + callable->name() + "' has " +
                                      std::to_string(type.value().params.size()) +
                                      " parameters; at most " +
                                      std::to_string(wasm::kMaxTrampolineParams) +
                                      " are supported");
    }
    return synthesizeModule(callable, type.value());
}

/// @brief Build, compile and instantiate the adapter module for @p type.
///
/// @details The module is tiny, so compilation happens inline on the calling
///          path.  Failures from the host are returned as-is; a module that
///          instantiates but lacks the "f" export is reported as a host
///          failure as well.
support::Expected<wasm::FunctionPtr> TrampolineSynthesizer::synthesizeModule(
    const wasm::FunctionPtr &callable, const wasm::FuncType &type) const
{
    const std::vector<uint8_t> bytes = wasm::buildTrampolineModule(type);
    support::tableDebugLog("convert '%s' via %zu-byte adapter module as %s",
                           callable->name().c_str(),
                           bytes.size(),
                           type.toString().c_str());

    auto module = host_.compile(bytes);
    if (!module)
        return module.error();

    wasm::ImportObject imports;
    imports[wasm::kTrampolineImportModule][wasm::kTrampolineImportField] = callable;

    auto instance = host_.instantiate(module.value(), imports);
    if (!instance)
        return instance.error();

    wasm::FunctionPtr exported = instance.value().exportedFunction(wasm::kTrampolineExportName);
    if (!exported)
    {
        return support::makeError(support::ErrorKind::HostFailure,
                                  std::string("adapter instance has no export '") +
                                      wasm::kTrampolineExportName + "'");
    }
    return exported;
}

} // namespace funtab::table
