// ecgroup: Generic finite fields and elliptic curve groups
// Copyright 2026 The ecgroup Authors.
// SPDX-License-Identifier: Apache-2.0
#include "secp256k1.hpp"

namespace ecgroup::secp256k1
{
namespace
{
/// The checked secp256k1 parameter set.
struct Params
{
    Curve curve{fp(A), fp(B)};
    CurvePoint g = curve.point_at(fp(GX), fp(GY));

    Params() { ecc::check_generator(g, ORDER); }
};

const Params& params()
{
    static const Params instance;
    return instance;
}
}  // namespace

Fp fp(const uint256& v)
{
    return Fp{v, FIELD_PRIME};
}

const Curve& curve()
{
    return params().curve;
}

const CurvePoint& generator()
{
    return params().g;
}
}  // namespace ecgroup::secp256k1
