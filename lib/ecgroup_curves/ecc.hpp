// ecgroup: Generic finite fields and elliptic curve groups
// Copyright 2026 The ecgroup Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <ecgroup/errors.hpp>
#include <ecgroup/field.hpp>
#include <concepts>
#include <memory>
#include <ostream>
#include <utility>
#include <variant>

namespace ecgroup
{
/// Zero test for curves over builtin integers.
template <std::integral T>
constexpr bool is_zero(T v) noexcept
{
    return v == 0;
}

namespace ecc
{
/// The arithmetic capability required from curve coordinates.
///
/// Implemented by builtin integers (curves over the integers, handy in tests)
/// and by FieldElement (curves over prime fields).
/// With builtin integers the coordinates must be small enough for x³ not to overflow.
template <typename T>
concept Number = std::copyable<T> && std::equality_comparable<T> &&
                 requires(const T& a, const T& b) {
                     { a + b } -> std::convertible_to<T>;
                     { a - b } -> std::convertible_to<T>;
                     { a * b } -> std::convertible_to<T>;
                     { a / b } -> std::convertible_to<T>;
                     { -a } -> std::convertible_to<T>;
                     { is_zero(a) } -> std::same_as<bool>;
                 };

/// The affine (two coordinates) point on an Elliptic Curve.
template <typename ValueT>
struct Point
{
    ValueT x;
    ValueT y;

    friend constexpr bool operator==(const Point&, const Point&) = default;
};

/// The point at infinity: the identity element of the curve group.
struct Infinity
{
    friend constexpr bool operator==(const Infinity&, const Infinity&) noexcept = default;
};

/// The result of building a point from coordinates not satisfying the curve equation.
/// It propagates through the point arithmetic.
struct Invalid
{
    friend constexpr bool operator==(const Invalid&, const Invalid&) noexcept = default;
};

template <Number T>
class CurvePoint;

/// An elliptic curve y² = x³ + ax + b.
///
/// The parameters are immutable and shared by the curve copies and by all points
/// created by the curve, so the points stay valid after the curve object is gone
/// or reassigned.
template <Number T>
class Curve
{
    struct Params
    {
        T a;
        T b;
    };

    std::shared_ptr<const Params> params_;

public:
    /// @throws ModulusMismatch if the field coefficients are of different fields.
    Curve(T a, T b)
    {
        if constexpr (requires { a.mod(); })
        {
            if (a.mod() != b.mod())
                throw ModulusMismatch{"curve coefficients are of different fields"};
        }
        params_ = std::make_shared<const Params>(Params{std::move(a), std::move(b)});
    }

    const T& a() const noexcept { return params_->a; }

    const T& b() const noexcept { return params_->b; }

    /// Checks if (x, y) satisfies the curve equation.
    bool contains(const T& x, const T& y) const { return y * y == x * x * x + a() * x + b(); }

    /// Creates the point at (x, y). Returns the Invalid point if (x, y) is not on the curve.
    CurvePoint<T> point_at(T x, T y) const
    {
        if (!contains(x, y))
            return {*this, Invalid{}};
        return {*this, Point<T>{std::move(x), std::move(y)}};
    }

    /// Returns the point at infinity.
    CurvePoint<T> infinity() const noexcept { return {*this, Infinity{}}; }

    /// Curves are equal if their parameters are equal.
    friend bool operator==(const Curve& c1, const Curve& c2)
    {
        return c1.params_ == c2.params_ || (c1.a() == c2.a() && c1.b() == c2.b());
    }
};

/// A point of the curve group: the point at infinity, an affine point on the curve,
/// or the Invalid point.
template <Number T>
class CurvePoint
{
    using State = std::variant<Infinity, Point<T>, Invalid>;

    Curve<T> curve_;
    State state_;

    CurvePoint(const Curve<T>& curve, State state) noexcept
      : curve_{curve}, state_{std::move(state)}
    {}

    friend class Curve<T>;

public:
    const Curve<T>& curve() const noexcept { return curve_; }

    bool is_infinity() const noexcept { return std::holds_alternative<Infinity>(state_); }

    bool is_valid() const noexcept { return !std::holds_alternative<Invalid>(state_); }

    /// Returns the affine coordinates or null for the point at infinity and the Invalid point.
    const Point<T>* affine() const noexcept { return std::get_if<Point<T>>(&state_); }

    /// Points are equal if they are in the same state on curves with equal parameters.
    friend bool operator==(const CurvePoint& p, const CurvePoint& q)
    {
        return p.curve_ == q.curve_ && p.state_ == q.state_;
    }

    /// Computes the inverse -P = (x, -y).
    CurvePoint operator-() const
    {
        if (const auto* p = affine())
            return {curve_, Point<T>{p->x, -p->y}};
        return *this;
    }

    /// Elliptic curve point addition in affine coordinates.
    ///
    /// Computes P ⊕ Q for two points of the same curve.
    /// This procedure handles all inputs (e.g. doubling or points at infinity).
    /// For a Number with inexact division (builtin integers) a slope that is not a whole
    /// number gives the Invalid point.
    /// @throws CurveMismatch if the points are on curves with different parameters.
    friend CurvePoint operator+(const CurvePoint& p, const CurvePoint& q)
    {
        if (p.curve_ != q.curve_)
            throw CurveMismatch{"cannot add points of different curves"};

        const auto& curve = p.curve_;
        if (!p.is_valid() || !q.is_valid())
            return {curve, Invalid{}};
        if (p.is_infinity())
            return q;
        if (q.is_infinity())
            return p;

        const auto& [x1, y1] = *p.affine();
        const auto& [x2, y2] = *q.affine();

        // Use classic formula for point addition.
        // https://en.wikipedia.org/wiki/Elliptic_curve_point_multiplication#Point_operations

        T dx = x2 - x1;
        T dy = y2 - y1;
        if (x1 == x2)
        {
            if (y1 != y2)                 // For opposite points
                return curve.infinity();  // return the point at infinity.

            // The tangent line at y = 0 is vertical.
            if (is_zero(y1))
                return curve.infinity();

            // For coincident points find the slope of the tangent line.
            const T xx = x1 * x1;
            dy = xx + xx + xx + curve.a();
            dx = y1 + y1;
        }
        const T slope = dy / dx;
        if (slope * dx != dy)
            return {curve, Invalid{}};

        T xr = slope * slope - x1 - x2;
        T yr = slope * (x1 - xr) - y1;
        return {curve, Point<T>{std::move(xr), std::move(yr)}};
    }
};

/// Scalar multiplication.
///
/// Computes [k]P with the double-and-add method, scanning the scalar bits from the least
/// significant one. The Invalid point stays Invalid.
template <Number T, UnsignedInteger K>
CurvePoint<T> mul(const CurvePoint<T>& p, K k)
{
    if (!p.is_valid())
        return p;

    auto r = p.curve().infinity();
    auto addend = p;
    while (k != 0)
    {
        if ((k & 1) != 0)
            r = r + addend;
        k >>= 1;
        if (k != 0)
            addend = addend + addend;
    }
    return r;
}

/// Checks that g generates a subgroup of the given order: g is a finite point on the curve,
/// the order is not 0 and [order]g is the point at infinity.
///
/// @throws InvalidCurveParameters if the check fails.
template <Number T, UnsignedInteger K>
void check_generator(const CurvePoint<T>& g, const K& order)
{
    if (!g.is_valid())
        throw InvalidCurveParameters{"generator is not on the curve"};
    if (g.is_infinity())
        throw InvalidCurveParameters{"generator is the point at infinity"};
    if (order == 0)
        throw InvalidCurveParameters{"group order is 0"};
    if (!mul(g, order).is_infinity())
        throw InvalidCurveParameters{"[N]G is not the point at infinity"};
}

template <Number T>
std::ostream& operator<<(std::ostream& os, const CurvePoint<T>& p)
{
    if (const auto* c = p.affine())
        return os << "CurvePoint(" << c->x << ", " << c->y << ")";
    return os << (p.is_infinity() ? "CurvePoint(infinity)" : "CurvePoint(invalid)");
}
}  // namespace ecc
}  // namespace ecgroup
