//===----------------------------------------------------------------------===//
//
// Part of the FunTab project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Textual rendering of function types for diagnostics and debug logging.
//
//===----------------------------------------------------------------------===//

#include "wasm/ValType.hpp"

namespace funtab::wasm
{

std::string FuncType::toString() const
{
    std::string out = "(";
    for (size_t i = 0; i < params.size(); ++i)
    {
        if (i != 0)
            out += ", ";
        out += wasm::toString(params[i]);
    }
    out += ") -> ";
    if (results.empty())
        out += "void";
    else
        out += wasm::toString(results.front());
    return out;
}

} // namespace funtab::wasm
