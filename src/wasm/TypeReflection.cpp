//===----------------------------------------------------------------------===//
//
// Part of the FunTab project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "wasm/TypeReflection.hpp"

#include <memory>

namespace funtab::wasm
{

FunctionPtr DirectTypeReflection::buildFunction(const FuncType &type,
                                                const FunctionPtr &callable) const
{
    const std::string name = callable ? callable->name() : std::string("<null>");
    return std::make_shared<TypedFunction>(name, type, callable);
}

} // namespace funtab::wasm
