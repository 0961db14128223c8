// ecgroup: Generic finite fields and elliptic curve groups
// Copyright 2026 The ecgroup Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "errors.hpp"
#include <intx/intx.hpp>
#include <concepts>
#include <limits>
#include <ostream>
#include <string>

namespace ecgroup
{
/// Unsigned integer types accepted as exponents and scalars:
/// builtin unsigned integers and intx::uint<N>.
template <typename T>
concept UnsignedInteger = std::numeric_limits<T>::is_integer &&
                          !std::numeric_limits<T>::is_signed && !std::same_as<T, bool>;

/// The modular arithmetic operations on residues of a given modulus.
///
/// The UintT is intx::uint<N>. All the arguments must be already reduced, i.e. less than mod.
template <typename UintT>
class ModArith
{
    const UintT mod_;  ///< The modulus.

public:
    constexpr explicit ModArith(const UintT& mod) noexcept : mod_{mod} {}

    /// Returns the modulus.
    constexpr const UintT& mod() const noexcept { return mod_; }

    /// Returns the multiplicative identity. For the modulus of 1 this is 0, the only residue.
    constexpr UintT one() const noexcept { return mod_ == 1 ? UintT{0} : UintT{1}; }

    /// Performs a modular addition.
    constexpr UintT add(const UintT& x, const UintT& y) const noexcept
    {
        const auto s = addc(x, y);
        const auto d = subc(s.value, mod_);
        return (!s.carry && d.carry) ? s.value : d.value;
    }

    /// Performs a modular subtraction.
    constexpr UintT sub(const UintT& x, const UintT& y) const noexcept
    {
        const auto d = subc(x, y);
        const auto s = d.value + mod_;
        return (d.carry) ? s : d.value;
    }

    /// Computes the additive inverse.
    constexpr UintT neg(const UintT& x) const noexcept { return sub(0, x); }

    /// Performs a modular multiplication.
    ///
    /// The full product is computed in the double-width type so it never overflows.
    constexpr UintT mul(const UintT& x, const UintT& y) const noexcept
    {
        return intx::udivrem(intx::umul(x, y), mod_).rem;
    }

    /// Computes the modular exponentiation x^e by the square-and-multiply method.
    ///
    /// The exponent bits are scanned from the least significant one. The cost is
    /// O(log e) modular multiplications. By convention 0^0 = 1.
    template <UnsignedInteger E>
    constexpr UintT pow(const UintT& x, E e) const noexcept
    {
        if (e == 0)
            return one();
        if (x == 0)
            return 0;

        auto ret = one();
        auto base = x;
        while (e != 0)
        {
            if ((e & 1) != 0)
                ret = mul(ret, base);
            e >>= 1;
            if (e != 0)
                base = mul(base, base);
        }
        return ret;
    }

    /// Computes the modular inversion using the Fermat's little theorem: x⁻¹ = x^(mod-2).
    ///
    /// Requires the modulus to be prime (not checked) and x != 0.
    constexpr UintT inv(const UintT& x) const noexcept { return pow(x, mod_ - 2); }
};

/// An element of the field of integers modulo a runtime modulus.
///
/// Every element carries its modulus. Elements of different fields are never equal,
/// and combining them arithmetically is a contract violation reported with ModulusMismatch.
/// The division is only meaningful for prime moduli.
template <typename UintT>
class FieldElement
{
    UintT value_;
    UintT mod_;

    FieldElement() = default;

    /// Wraps a value already reduced by the modulus.
    static constexpr FieldElement wrap(const UintT& v, const UintT& mod) noexcept
    {
        FieldElement element;
        element.value_ = v;
        element.mod_ = mod;
        return element;
    }

    constexpr ModArith<UintT> arith() const noexcept { return ModArith{mod_}; }

    /// Returns the arithmetic of the field shared by both operands.
    static ModArith<UintT> common_arith(const FieldElement& a, const FieldElement& b)
    {
        if (a.mod_ != b.mod_)
        {
            throw ModulusMismatch{"cannot combine elements modulo " + intx::to_string(a.mod_) +
                                  " and " + intx::to_string(b.mod_)};
        }
        return ModArith{a.mod_};
    }

public:
    using uint_type = UintT;

    /// Creates the element of the field modulo mod.
    ///
    /// @throws InvalidResidue if value is not in the range [0, mod).
    FieldElement(const UintT& value, const UintT& mod) : value_{value}, mod_{mod}
    {
        if (value >= mod)
        {
            throw InvalidResidue{"value " + intx::to_string(value) +
                                 " is not a residue modulo " + intx::to_string(mod)};
        }
    }

    constexpr const UintT& value() const noexcept { return value_; }

    constexpr const UintT& mod() const noexcept { return mod_; }

    /// Raises the element to the power of a non-negative exponent.
    template <UnsignedInteger E>
    FieldElement pow(const E& exponent) const noexcept
    {
        return wrap(arith().pow(value_, exponent), mod_);
    }

    /// Computes the multiplicative inverse (Fermat inverse).
    ///
    /// @throws DivisionByZero for the zero element.
    FieldElement inv() const
    {
        if (value_ == 0)
        {
            throw DivisionByZero{
                "zero has no inverse modulo " + intx::to_string(mod_)};
        }
        return wrap(arith().inv(value_), mod_);
    }

    friend constexpr bool operator==(const FieldElement&, const FieldElement&) = default;

    friend constexpr bool is_zero(const FieldElement& a) noexcept { return a.value_ == 0; }

    friend FieldElement operator+(const FieldElement& a, const FieldElement& b)
    {
        const auto arith = common_arith(a, b);
        return wrap(arith.add(a.value_, b.value_), arith.mod());
    }

    friend FieldElement operator-(const FieldElement& a, const FieldElement& b)
    {
        const auto arith = common_arith(a, b);
        return wrap(arith.sub(a.value_, b.value_), arith.mod());
    }

    friend FieldElement operator-(const FieldElement& a) noexcept
    {
        return wrap(a.arith().neg(a.value_), a.mod_);
    }

    friend FieldElement operator*(const FieldElement& a, const FieldElement& b)
    {
        const auto arith = common_arith(a, b);
        return wrap(arith.mul(a.value_, b.value_), arith.mod());
    }

    /// @throws DivisionByZero if b is zero.
    friend FieldElement operator/(const FieldElement& a, const FieldElement& b)
    {
        const auto arith = common_arith(a, b);
        return wrap(arith.mul(a.value_, b.inv().value_), arith.mod());
    }
};

/// Formats the element as "FieldElement<mod>(value)" in decimal.
template <typename UintT>
std::string to_string(const FieldElement<UintT>& a)
{
    return "FieldElement<" + intx::to_string(a.mod()) + ">(" + intx::to_string(a.value()) + ")";
}

template <typename UintT>
std::ostream& operator<<(std::ostream& os, const FieldElement<UintT>& a)
{
    return os << to_string(a);
}
}  // namespace ecgroup
