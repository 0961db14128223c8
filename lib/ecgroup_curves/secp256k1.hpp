// ecgroup: Generic finite fields and elliptic curve groups
// Copyright 2026 The ecgroup Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "ecc.hpp"

namespace ecgroup::secp256k1
{
using namespace intx;

/// The field prime number (P).
inline constexpr auto FIELD_PRIME =
    0xfffffffffffffffffffffffffffffffffffffffffffffffffffffffefffffc2f_u256;

/// The secp256k1 curve group order (N).
inline constexpr auto ORDER =
    0xfffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364141_u256;

/// The curve coefficients: y² = x³ + 7.
/// @{
inline constexpr auto A = 0_u256;
inline constexpr auto B = 7_u256;
/// @}

/// The generator point coordinates.
/// @{
inline constexpr auto GX = 0x79be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798_u256;
inline constexpr auto GY = 0x483ada7726a3c4655da4fbfc0e1108a8fd17b448a68554199c47d08ffb10d4b8_u256;
/// @}

/// The element of the secp256k1 base field.
using Fp = FieldElement<uint256>;

using Curve = ecc::Curve<Fp>;

using CurvePoint = ecc::CurvePoint<Fp>;

/// Creates the base field element of the value v.
///
/// @throws InvalidResidue if v >= P.
Fp fp(const uint256& v);

/// Returns the secp256k1 curve.
///
/// The parameters are built and checked once, on the first call from any thread:
/// G must be on the curve and [N]G must be the point at infinity (ecc::check_generator()).
/// @throws InvalidCurveParameters if the check fails.
const Curve& curve();

/// Returns the generator point G. See curve().
const CurvePoint& generator();
}  // namespace ecgroup::secp256k1
