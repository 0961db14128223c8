// ecgroup: Generic finite fields and elliptic curve groups
// Copyright 2026 The ecgroup Authors.
// SPDX-License-Identifier: Apache-2.0

#include <ecgroup_curves/secp256k1.hpp>
#include <gtest/gtest.h>
#include <future>
#include <vector>

using namespace ecgroup;
using namespace ecgroup::secp256k1;

namespace
{
CurvePoint point(const uint256& x, const uint256& y)
{
    return curve().point_at(fp(x), fp(y));
}
}  // namespace

TEST(secp256k1, constants)
{
    EXPECT_EQ(curve().a(), fp(0));
    EXPECT_EQ(curve().b(), fp(7));

    const auto* g = generator().affine();
    ASSERT_NE(g, nullptr);
    EXPECT_EQ(g->x.value(), GX);
    EXPECT_EQ(g->y.value(), GY);
    EXPECT_EQ(g->x.mod(), FIELD_PRIME);
}

TEST(secp256k1, fp_invalid_residue)
{
    EXPECT_THROW(fp(FIELD_PRIME), InvalidResidue);
    EXPECT_THROW(fp(~uint256{}), InvalidResidue);
    EXPECT_EQ(fp(FIELD_PRIME - 1) + fp(1), fp(0));
}

TEST(secp256k1, generator_on_curve)
{
    EXPECT_TRUE(curve().contains(fp(GX), fp(GY)));
    EXPECT_FALSE(curve().contains(fp(GX), fp(GY + 1)));
    EXPECT_EQ(point(GX, GY), generator());
    EXPECT_FALSE(point(GX, GY + 1).is_valid());
}

TEST(secp256k1, generator_order)
{
    const auto& g = generator();
    EXPECT_TRUE(ecc::mul(g, ORDER).is_infinity());
    EXPECT_EQ(ecc::mul(g, ORDER - 1), -g);
    EXPECT_EQ(ecc::mul(g, ORDER + 1), g);
}

TEST(secp256k1, check_generator)
{
    EXPECT_NO_THROW(ecc::check_generator(generator(), ORDER));
    EXPECT_THROW(ecc::check_generator(generator(), ORDER - 1), InvalidCurveParameters);
    EXPECT_THROW(ecc::check_generator(generator(), FIELD_PRIME), InvalidCurveParameters);
    EXPECT_THROW(ecc::check_generator(point(GX, GY + 1), ORDER), InvalidCurveParameters);
    EXPECT_THROW(ecc::check_generator(curve().infinity(), ORDER), InvalidCurveParameters);
}

TEST(secp256k1, small_multiples)
{
    const auto& g = generator();
    const auto g2 = point(0xc6047f9441ed7d6d3045406e95c07cd85c778e4b8cef3ca7abac09b95c709ee5_u256,
        0x1ae168fea63dc339a3c58419466ceaeef7f632653266d0e1236431a950cfe52a_u256);
    const auto g3 = point(0xf9308a019258c31049344f85f89d5229b531c845836f99b08601f113bce036f9_u256,
        0x388f7b0f632de8140fe337e62a37f3566500a99934c2231b6cb9fd7584b8e672_u256);
    const auto g4 = point(0xe493dbf1c10d80f3581e4904930b1404cc6c13900ee0758474fa94abe8c4cd13_u256,
        0x51ed993ea0d455b75642e2098ea51448d967ae33bfbdfe40cfe97bdc47739922_u256);
    ASSERT_TRUE(g2.is_valid());
    ASSERT_TRUE(g3.is_valid());
    ASSERT_TRUE(g4.is_valid());

    EXPECT_EQ(g + g, g2);
    EXPECT_EQ(g2 + g, g3);
    EXPECT_EQ(g + g2, g3);
    EXPECT_EQ(g2 + g2, g4);
    EXPECT_EQ(g3 + g, g4);
    EXPECT_EQ(ecc::mul(g, 2u), g2);
    EXPECT_EQ(ecc::mul(g, 3u), g3);
    EXPECT_EQ(ecc::mul(g, 4_u256), g4);
}

TEST(secp256k1, pt_add_inf)
{
    const auto p1 = point(0x18f4057699e2d9679421de8f4e11d7df9fa4b9e7cb841ea48aed75f1567b9731_u256,
        0x6db5b7ecd8e226c06f538d15173267bf1e78acc02bb856e83b3d6daec6a68144_u256);
    ASSERT_TRUE(p1.is_valid());
    const auto inf = curve().infinity();

    EXPECT_EQ(p1 + inf, p1);
    EXPECT_EQ(inf + p1, p1);
    EXPECT_EQ(inf + inf, inf);
}

TEST(secp256k1, pt_add)
{
    const auto p1 = point(0x18f4057699e2d9679421de8f4e11d7df9fa4b9e7cb841ea48aed75f1567b9731_u256,
        0x6db5b7ecd8e226c06f538d15173267bf1e78acc02bb856e83b3d6daec6a68144_u256);
    const auto p2 = point(0xf929e07c83d65da3569113ae03998d13359ba982216285a686f4d66e721a0beb_u256,
        0xb6d73966107b10526e2e140c17f343ee0a373351f2b1408923151b027f55b82_u256);
    const auto p3 = point(0xf929e07c83d65da3569113ae03998d13359ba982216285a686f4d66e721a0beb_u256,
        0xf4928c699ef84efad91d1ebf3e80cbc11f5c8ccae0d4ebf76dceae4ed80aa0ad_u256);
    const auto p4 = point(
        0x1_u256, 0xbde70df51939b94c9c24979fa7dd04ebd9b3572da7802290438af2a681895441_u256);
    ASSERT_TRUE(p1.is_valid());
    ASSERT_TRUE(p2.is_valid());
    ASSERT_TRUE(p3.is_valid());
    ASSERT_TRUE(p4.is_valid());

    {
        const auto e = point(0x40468d7704db3d11961ab9c222e35919d7e5d1baef59e0f46255d66bec3bd1d3_u256,
            0x6fff88d9f575236b6cc5c74e7d074832a460c2792fba888aea7b9986429dd7f7_u256);
        EXPECT_EQ(p1 + p2, e);
        EXPECT_EQ(p2 + p1, e);
    }
    {
        const auto e = point(0xd8e7b42b8c82e185bf0669ce0754697a6eb46c156497d5d1971bd6a23f38ed9e_u256,
            0x628c3107fc73c92e7b8c534e239257fb2de95bd6b965dc1021f636da086a7e99_u256);
        EXPECT_EQ(p1 + p1, e);
    }
    {
        const auto e = point(0xdf592d726f42759020da10d3106db3880e514c783d6970d2a9085fb16879b37f_u256,
            0x10aa0ef9fe224e3797792b4b286b9f63542d4c11fe26d449a845b9db0f5993f9_u256);
        EXPECT_EQ(p1 + p3, e);
    }
    {
        const auto e = point(0x12a5fd099bcd30e7290e58d63f8d5008287239500e6d0108020040497c5cb9c9_u256,
            0x7f6bd83b5ac46e3b59e24af3bc9bfbb213ed13e21d754e4950ae635961742574_u256);
        EXPECT_EQ(p1 + p4, e);
    }

    // p2 and p3 are opposite points.
    EXPECT_EQ(p2 + p3, curve().infinity());
}

TEST(secp256k1, pt_mul)
{
    const auto p1 = point(0x18f4057699e2d9679421de8f4e11d7df9fa4b9e7cb841ea48aed75f1567b9731_u256,
        0x6db5b7ecd8e226c06f538d15173267bf1e78acc02bb856e83b3d6daec6a68144_u256);

    {
        const auto d{100000000000000000000_u256};
        const auto e = point(0x4c34e6dc48badd579d1ce4702fd490fb98fa0e666417bfc2d4ff8e957d99c565_u256,
            0xb53da5be179d80c7f07226ba79b6bce643d89496b37d6bc2d111b009e37cc28b_u256);
        EXPECT_EQ(ecc::mul(p1, d), e);
    }

    {
        const auto u1 = 0xd17a4c1f283fa5d67656ea81367b520eaa689207e5665620d4f51c7cf85fa220_u256;
        const auto e = point(0x39cb41b2567f68137aae52e99dbe91cd38d9faa3ba6be536a04355b63a7964fe_u256,
            0xf31e6abd08cbd8e4896c9e0304b25000edcd52a9f6d2bac7cfbdad2c835c9a35_u256);
        EXPECT_EQ(ecc::mul(generator(), u1), e);
    }
}

TEST(secp256k1, pt_mul_inf)
{
    const auto p1 = point(0x18f4057699e2d9679421de8f4e11d7df9fa4b9e7cb841ea48aed75f1567b9731_u256,
        0x6db5b7ecd8e226c06f538d15173267bf1e78acc02bb856e83b3d6daec6a68144_u256);
    const auto inf = curve().infinity();

    EXPECT_EQ(ecc::mul(p1, 0u), inf);
    EXPECT_EQ(ecc::mul(p1, ORDER), inf);
    EXPECT_EQ(ecc::mul(inf, 0u), inf);
    EXPECT_EQ(ecc::mul(inf, 1u), inf);
    EXPECT_EQ(ecc::mul(inf, ORDER - 1), inf);
}

TEST(secp256k1, concurrent_first_access)
{
    std::vector<std::future<const Curve*>> results;
    for (int i = 0; i < 8; ++i)
        results.push_back(std::async(std::launch::async, [] { return &curve(); }));

    const auto* expected = &curve();
    for (auto& r : results)
        EXPECT_EQ(r.get(), expected);
    EXPECT_TRUE(generator().curve() == *expected);
}
