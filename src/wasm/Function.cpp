//===----------------------------------------------------------------------===//
//
// Part of the FunTab project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements host and typed callables.  Typed functions enforce their declared
// type on every call in both directions: the arguments handed in by the caller
// and the values produced by the target.  Mismatches are reported as contract
// violations carrying the function name.
//
//===----------------------------------------------------------------------===//

#include "wasm/Function.hpp"

#include <string>
#include <utility>

namespace funtab::wasm
{
namespace
{

support::Diag callMismatch(const std::string &name, std::string detail)
{
    return support::makeError(support::ErrorKind::ContractViolation,
                              "call to '" + name + "': " + std::move(detail));
}

} // namespace

HostFunction::HostFunction(std::string name, HostCallback callback)
    : Function(Kind::Host, std::move(name)), callback_(std::move(callback))
{
}

support::Expected<std::vector<Value>> HostFunction::call(std::span<const Value> args) const
{
    if (!callback_)
    {
        return support::makeError(support::ErrorKind::ContractViolation,
                                  "call to '" + name() + "': no callback bound");
    }
    return callback_(args);
}

TypedFunction::TypedFunction(std::string name, FuncType type, FunctionPtr target)
    : Function(Kind::Typed, std::move(name)), type_(std::move(type)), target_(std::move(target))
{
}

/// @brief Check @p args against the declared type and forward to the target.
///
/// @details Argument count and every argument type must match exactly.  The
///          target's results are discarded for void types; otherwise exactly
///          one result of the declared type is required and returned.
support::Expected<std::vector<Value>> TypedFunction::call(std::span<const Value> args) const
{
    if (args.size() != type_.params.size())
    {
        return callMismatch(name(),
                            "expected " + std::to_string(type_.params.size()) +
                                " argument(s), got " + std::to_string(args.size()));
    }
    for (size_t i = 0; i < args.size(); ++i)
    {
        if (args[i].type != type_.params[i])
        {
            return callMismatch(name(),
                                "argument " + std::to_string(i) + " is " +
                                    std::string(toString(args[i].type)) + ", expected " +
                                    std::string(toString(type_.params[i])));
        }
    }

    if (!target_)
        return callMismatch(name(), "no target bound");

    auto produced = target_->call(args);
    if (!produced)
        return produced.error();

    std::vector<Value> &values = produced.value();
    if (type_.results.empty())
        return std::vector<Value>{};

    if (values.size() != 1)
    {
        return callMismatch(name(),
                            "expected 1 result, got " + std::to_string(values.size()));
    }
    if (values.front().type != type_.results.front())
    {
        return callMismatch(name(),
                            "result is " + std::string(toString(values.front().type)) +
                                ", expected " + std::string(toString(type_.results.front())));
    }
    return std::move(values);
}

FunctionPtr makeHostFunction(std::string name, HostCallback callback)
{
    return std::make_shared<HostFunction>(std::move(name), std::move(callback));
}

FunctionPtr makeNativeFunction(std::string name, FuncType type, HostCallback callback)
{
    auto body = std::make_shared<HostFunction>(name + ".body", std::move(callback));
    return std::make_shared<TypedFunction>(std::move(name), std::move(type), std::move(body));
}

} // namespace funtab::wasm
