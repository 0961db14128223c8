// ecgroup: Generic finite fields and elliptic curve groups
// Copyright 2026 The ecgroup Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <stdexcept>

namespace ecgroup
{
/// A field element value is not a residue of its modulus, i.e. value >= mod.
struct InvalidResidue : std::out_of_range
{
    using std::out_of_range::out_of_range;
};

/// Two field elements of different fields have been combined.
struct ModulusMismatch : std::logic_error
{
    using std::logic_error::logic_error;
};

/// The divisor is the zero element of the field.
struct DivisionByZero : std::domain_error
{
    using std::domain_error::domain_error;
};

/// Two points of curves having different parameters have been combined.
struct CurveMismatch : std::logic_error
{
    using std::logic_error::logic_error;
};

/// Built-in curve parameters failed the consistency check.
struct InvalidCurveParameters : std::logic_error
{
    using std::logic_error::logic_error;
};
}  // namespace ecgroup
