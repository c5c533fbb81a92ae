// SPDX-License-Identifier: MIT
/**
 * @file bspline_basis.hpp
 * @brief B-spline basis function evaluation of arbitrary degree
 *
 * Provides the B-spline primitives the monotone basis is built from:
 * - Clamped knot vector with evenly spaced interior knots
 * - Knot span finding (binary search, clamped to the outermost spans)
 * - Cox-de Boor evaluation of the degree+1 nonzero basis functions
 *
 * Points outside [t[p], t[n]] are evaluated on the first or last span,
 * which continues that span's polynomial piece (extrapolation).
 *
 * References:
 * - de Boor, "A Practical Guide to Splines" (2001)
 * - Piegl & Tiller, "The NURBS Book" (1997), algorithms A2.1 and A2.2
 */

#pragma once

#include <algorithm>
#include <cmath>
#include <concepts>
#include <cstddef>
#include <span>
#include <vector>

namespace monocurve {

/// Number of interior knots for a clamped basis of n_bspline functions
///
/// n_bspline - degree - 1, clamped to zero.
[[nodiscard]] constexpr size_t interior_knot_count(size_t n_bspline, size_t degree) noexcept {
    return (n_bspline > degree + 1) ? n_bspline - degree - 1 : 0;
}

/// Create clamped knot vector with evenly spaced interior knots
///
/// Layout for degree p and m interior knots:
///   [x_min × (p+1), x_min + h, ..., x_min + m·h, x_max × (p+1)],  h = (x_max - x_min)/(m+1)
///
/// The sequence depends only on its arguments, so repeated calls with the
/// same configuration yield bit-identical knots.
///
/// @tparam T Floating point type
/// @param n_bspline Number of B-spline functions the knots must support
/// @param degree Polynomial degree p
/// @param x_min Left boundary
/// @param x_max Right boundary
/// @return Knot vector (size = 2(p+1) + m)
template<std::floating_point T>
[[nodiscard]] std::vector<T> clamped_uniform_knots(size_t n_bspline, size_t degree,
                                                   T x_min, T x_max) {
    const size_t n_interior = interior_knot_count(n_bspline, degree);
    std::vector<T> t;
    t.reserve(2 * (degree + 1) + n_interior);

    t.insert(t.end(), degree + 1, x_min);

    const T step = (x_max - x_min) / static_cast<T>(n_interior + 1);
    for (size_t i = 1; i <= n_interior; ++i) {
        t.push_back(x_min + static_cast<T>(i) * step);
    }

    t.insert(t.end(), degree + 1, x_max);
    return t;
}

/// Number of B-spline functions supported by a knot vector
template<std::floating_point T>
[[nodiscard]] size_t bspline_count(const std::vector<T>& t, size_t degree) noexcept {
    return (t.size() > degree + 1) ? t.size() - degree - 1 : 0;
}

/// Find knot span containing x using binary search
///
/// Returns index i with t[i] ≤ x < t[i+1], restricted to [p, n-1] where n is
/// the number of basis functions. Points left of t[p] map to span p; points
/// at or right of t[n] map to span n-1, so x = x_max evaluates the last piece.
///
/// Time: O(log n)
///
/// @tparam T Floating point type
/// @param t Knot vector (clamped)
/// @param degree Polynomial degree p
/// @param x Query point
/// @return Knot span index
template<std::floating_point T>
[[nodiscard]] size_t find_span(const std::vector<T>& t, size_t degree, T x) noexcept {
    const size_t n = bspline_count(t, degree);
    const size_t min_span = degree;
    const size_t max_span = std::max(min_span, n - 1);

    if (x < t[min_span]) {
        return min_span;
    }
    if (x >= t[n]) {
        return max_span;
    }

    auto it = std::upper_bound(t.begin() + static_cast<std::ptrdiff_t>(min_span),
                               t.begin() + static_cast<std::ptrdiff_t>(n) + 1, x);
    const size_t i = static_cast<size_t>(std::distance(t.begin(), it)) - 1;
    return std::clamp(i, min_span, max_span);
}

/// Evaluate the degree+1 nonzero B-spline basis functions on a span
///
/// Cox-de Boor triangular scheme (Piegl & Tiller A2.2). On exit
/// N[r] = B_{span-p+r}(x) for r = 0..p.
///
/// Zero-width knot intervals contribute a zero term instead of a division
/// by zero.
///
/// @tparam T Floating point type
/// @param t Knot vector
/// @param span Knot span from find_span()
/// @param degree Polynomial degree p
/// @param x Evaluation point (may lie outside the span)
/// @param N Output, size ≥ p+1
/// @param left Scratch, size ≥ p+1
/// @param right Scratch, size ≥ p+1
template<std::floating_point T>
void basis_functions(const std::vector<T>& t,
                     size_t span,
                     size_t degree,
                     T x,
                     std::span<T> N,
                     std::span<T> left,
                     std::span<T> right) noexcept
{
    N[0] = T{1};
    for (size_t j = 1; j <= degree; ++j) {
        left[j] = x - t[span + 1 - j];
        right[j] = t[span + j] - x;

        T saved = T{0};
        for (size_t r = 0; r < j; ++r) {
            const T den = right[r + 1] + left[j - r];
            const T temp = (den != T{0}) ? N[r] / den : T{0};
            N[r] = saved + right[r + 1] * temp;
            saved = left[j - r] * temp;
        }
        N[j] = saved;
    }
}

/// Evaluate all n B-spline functions at x into a dense row
///
/// @param t Knot vector
/// @param degree Polynomial degree p
/// @param x Evaluation point
/// @param row Output, size = bspline_count(t, degree); overwritten
template<std::floating_point T>
void bspline_row(const std::vector<T>& t, size_t degree, T x, std::span<T> row) {
    std::fill(row.begin(), row.end(), T{0});

    std::vector<T> N(degree + 1), left(degree + 1), right(degree + 1);
    const size_t span = find_span(t, degree, x);
    basis_functions<T>(t, span, degree, x, N, left, right);

    const size_t first = span - degree;
    for (size_t r = 0; r <= degree; ++r) {
        row[first + r] = N[r];
    }
}

}  // namespace monocurve
