// ecgroup: Generic finite fields and elliptic curve groups
// Copyright 2026 The ecgroup Authors.
// SPDX-License-Identifier: Apache-2.0

#include <ecgroup_curves/secp256k1.hpp>
#include <exception>
#include <iostream>

int main()
{
    using namespace ecgroup::secp256k1;

    try
    {
        const auto g = curve().point_at(fp(GX), fp(GY));
        std::cout << g << '\n';
        return 0;
    }
    catch (const std::exception& ex)
    {
        std::cerr << "error: " << ex.what() << '\n';
        return 1;
    }
}
