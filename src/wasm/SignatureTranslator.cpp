//===----------------------------------------------------------------------===//
//
// Part of the FunTab project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the translator that turns compact signature strings (for example
// "vii" or "ifd") into structured FuncType objects.  One character encodes one
// value: the first character is the result, the remainder are parameters in
// call order.  Unknown characters are rejected, never coerced.
//
//===----------------------------------------------------------------------===//

#include "wasm/SignatureTranslator.hpp"

#include "support/feature_flags.hpp"

#include <string>

namespace funtab::wasm
{
namespace
{

/// @brief Build the diagnostic reported for an invalid tag character.
support::Diag invalidTag(std::string_view sig, size_t pos)
{
    std::string msg = "invalid signature char '";
    msg += sig[pos];
    msg += "' at position " + std::to_string(pos) + " in signature '";
    msg.append(sig.data(), sig.size());
    msg += "'";
    return support::makeError(support::ErrorKind::ContractViolation, std::move(msg));
}

} // namespace

ValType addressValType() noexcept
{
#if FUNTAB_MEMORY64
    return ValType::I64;
#else
    return ValType::I32;
#endif
}

std::optional<ValType> valTypeForTag(char tag) noexcept
{
    switch (tag)
    {
        case 'i':
            return ValType::I32;
        case 'j':
            return ValType::I64;
        case 'f':
            return ValType::F32;
        case 'd':
            return ValType::F64;
        case 'p':
            return addressValType();
        default:
            return std::nullopt;
    }
}

/// @brief Translate a signature string into a FuncType.
///
/// @details The result tag is examined first: the void sentinel yields an empty
///          result list, any value tag yields exactly one result.  Each
///          following character must be a value tag; the void sentinel is not
///          accepted in parameter position.
///
/// @param sig Signature string such as "vii".
/// @return Translated type or a ContractViolation diagnostic.
support::Expected<FuncType> sigToWasmTypes(std::string_view sig)
{
    if (sig.empty())
        return support::makeError(support::ErrorKind::ContractViolation, "empty signature");

    FuncType type;
    if (sig.front() != kVoidTag)
    {
        const auto result = valTypeForTag(sig.front());
        if (!result)
            return invalidTag(sig, 0);
        type.results.push_back(*result);
    }

    type.params.reserve(sig.size() - 1);
    for (size_t i = 1; i < sig.size(); ++i)
    {
        const auto param = valTypeForTag(sig[i]);
        if (!param)
            return invalidTag(sig, i);
        type.params.push_back(*param);
    }
    return type;
}

} // namespace funtab::wasm
