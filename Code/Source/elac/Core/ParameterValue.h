/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 *
 * Permission is hereby granted, free of charge, to any person obtaining
 * a copy of this software and associated documentation files (the
 * "Software"), to deal in the Software without restriction, including
 * without limitation the rights to use, copy, modify, merge, publish,
 * distribute, sublicense, and/or sell copies of the Software, and to
 * permit persons to whom the Software is furnished to do so, subject
 * to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included
 * in all copies or substantial portions of the Software.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS
 * IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED
 * TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A
 * PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT OWNER
 * OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL,
 * EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO,
 * PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR
 * PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF
 * LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING
 * NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
 * SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */

#ifndef ELAC_CORE_PARAMETER_VALUE_H
#define ELAC_CORE_PARAMETER_VALUE_H

/**
 * @file ParameterValue.h
 * @brief Typed values for compiler parameters
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace elac {
namespace params {

using Real = double;

using Value = std::variant<Real, int, bool, std::string, std::vector<Real>>;

enum class ValueType : std::uint8_t {
    Any,
    Real,
    Int,
    Bool,
    String,
    RealVector,
};

[[nodiscard]] inline ValueType typeOf(const Value& v) noexcept
{
    if (std::holds_alternative<Real>(v)) return ValueType::Real;
    if (std::holds_alternative<int>(v)) return ValueType::Int;
    if (std::holds_alternative<bool>(v)) return ValueType::Bool;
    if (std::holds_alternative<std::string>(v)) return ValueType::String;
    if (std::holds_alternative<std::vector<Real>>(v)) return ValueType::RealVector;
    return ValueType::Any;
}

[[nodiscard]] inline std::string_view typeName(ValueType t) noexcept
{
    switch (t) {
        case ValueType::Any:
            return "Any";
        case ValueType::Real:
            return "Real";
        case ValueType::Int:
            return "Int";
        case ValueType::Bool:
            return "Bool";
        case ValueType::String:
            return "String";
        case ValueType::RealVector:
            return "RealVector";
        default:
            return "Unknown";
    }
}

template <class T>
[[nodiscard]] inline std::optional<T> get(const Value& v)
{
    if (const auto* p = std::get_if<T>(&v)) return *p;
    return std::nullopt;
}

} // namespace params

/**
 * @brief Opaque, insertion-ordered parameter set forwarded to terminal-form compilers
 *
 * Setting an existing key replaces its value in place.
 */
class CompilerParameters {
public:
    using Entry = std::pair<std::string, params::Value>;

    CompilerParameters() = default;

    CompilerParameters& set(std::string key, params::Value value)
    {
        for (auto& e : entries_) {
            if (e.first == key) {
                e.second = std::move(value);
                return *this;
            }
        }
        entries_.emplace_back(std::move(key), std::move(value));
        return *this;
    }

    [[nodiscard]] bool contains(std::string_view key) const noexcept
    {
        return find(key) != nullptr;
    }

    [[nodiscard]] const params::Value* find(std::string_view key) const noexcept
    {
        for (const auto& e : entries_) {
            if (e.first == key) return &e.second;
        }
        return nullptr;
    }

    /**
     * @brief Typed lookup; empty if the key is absent or holds another type
     */
    template <class T>
    [[nodiscard]] std::optional<T> get(std::string_view key) const
    {
        const auto* v = find(key);
        if (v == nullptr) return std::nullopt;
        return params::get<T>(*v);
    }

    [[nodiscard]] const std::vector<Entry>& entries() const noexcept { return entries_; }
    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    friend bool operator==(const CompilerParameters& a, const CompilerParameters& b)
    {
        return a.entries_ == b.entries_;
    }

private:
    std::vector<Entry> entries_{};
};

} // namespace elac

#endif // ELAC_CORE_PARAMETER_VALUE_H
