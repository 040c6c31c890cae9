//===----------------------------------------------------------------------===//
//
// Part of the FunTab project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/wasm/ValType.hpp
// Purpose: Primitive value types, function types and tagged values shared by
//          the table, the module host and the signature translator.
// Key invariants: ValType enumerators carry their binary type codes.
//                 A FuncType has at most one result.
// Ownership/Lifetime: Plain value types.
// Links: docs/table-manager.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace funtab::wasm
{

/// @brief The four primitive wire types, valued by their binary type code.
enum class ValType : uint8_t
{
    I32 = 0x7F,
    I64 = 0x7E,
    F32 = 0x7D,
    F64 = 0x7C,
};

/// @brief Binary type code of @p type.
constexpr uint8_t typeCode(ValType type) noexcept
{
    return static_cast<uint8_t>(type);
}

/// @brief Lowercase mnemonic of @p type ("i32", "i64", "f32", "f64").
constexpr std::string_view toString(ValType type) noexcept
{
    switch (type)
    {
        case ValType::I32:
            return "i32";
        case ValType::I64:
            return "i64";
        case ValType::F32:
            return "f32";
        case ValType::F64:
            return "f64";
    }
    return "i32";
}

/// @brief Decode a binary type code.
/// @param code Byte read from a module.
/// @param[out] out Receives the decoded type on success.
/// @return False when @p code is not one of the four value type codes.
constexpr bool valTypeFromCode(uint8_t code, ValType &out) noexcept
{
    switch (code)
    {
        case 0x7F:
        case 0x7E:
        case 0x7D:
        case 0x7C:
            out = static_cast<ValType>(code);
            return true;
        default:
            return false;
    }
}

/// @brief Parameter and result types of a function.
struct FuncType
{
    std::vector<ValType> params;  ///< Parameter types in call order.
    std::vector<ValType> results; ///< Empty for void, otherwise one element.

    bool operator==(const FuncType &other) const = default;

    /// @brief Render as "(i32, f64) -> i32" or "() -> void".
    std::string toString() const;
};

/// @brief Tagged scalar passed to and returned from table entries.
struct Value
{
    ValType type = ValType::I32;

    union
    {
        int32_t i32;
        int64_t i64 = 0;
        float f32;
        double f64;
    };

    static Value fromI32(int32_t v)
    {
        Value out;
        out.type = ValType::I32;
        out.i32 = v;
        return out;
    }

    static Value fromI64(int64_t v)
    {
        Value out;
        out.type = ValType::I64;
        out.i64 = v;
        return out;
    }

    static Value fromF32(float v)
    {
        Value out;
        out.type = ValType::F32;
        out.f32 = v;
        return out;
    }

    static Value fromF64(double v)
    {
        Value out;
        out.type = ValType::F64;
        out.f64 = v;
        return out;
    }
};

} // namespace funtab::wasm
