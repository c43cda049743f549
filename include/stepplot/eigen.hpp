#pragma once

// ─── stepplot ↔ Eigen Integration ───────────────────────────────────────────
//
// Include this header to build point sequences and step series straight from
// Eigen vectors of float or double.
//
// Requirements:
//   - Eigen 3.x  (header-only)
//   - Build with -DSTEPPLOT_USE_EIGEN=ON
//
// Usage:
//
//   #include <stepplot/eigen.hpp>
//
//   Eigen::VectorXd x = Eigen::VectorXd::LinSpaced(20, 0.0, 10.0);
//   Eigen::VectorXd y = x.array().sin();
//
//   auto series = stepplot::make_step_series(x, y);
//   series.step_kind(stepplot::StepKind::Mid).fill_color(stepplot::colors::light_gray);
//
// ─────────────────────────────────────────────────────────────────────────────

#include <eigen3/Eigen/Core>
#include <stepplot/data.hpp>
#include <stepplot/error.hpp>
#include <stepplot/step.hpp>
#include <string>
#include <type_traits>
#include <vector>

namespace stepplot
{

namespace eigen_detail
{

// Any Eigen dense expression with float or double scalars and a single
// column (or dynamic column count).
template <typename T, typename = void>
struct is_eigen_real_vector : std::false_type
{
};

template <typename T>
struct is_eigen_real_vector<
    T,
    std::enable_if_t<std::is_base_of_v<Eigen::DenseBase<std::decay_t<T>>, std::decay_t<T>>
                     && (std::is_same_v<typename std::decay_t<T>::Scalar, float>
                         || std::is_same_v<typename std::decay_t<T>::Scalar, double>)
                     && (std::decay_t<T>::ColsAtCompileTime == 1
                         || std::decay_t<T>::ColsAtCompileTime == Eigen::Dynamic)>>
    : std::true_type
{
};

template <typename T>
inline constexpr bool is_eigen_real_vector_v = is_eigen_real_vector<T>::value;

// Evaluates the expression and widens it to double.
template <typename Derived>
std::vector<double> to_vector(const Eigen::DenseBase<Derived>& v)
{
    const auto          evaluated = v.derived().eval();
    std::vector<double> out;
    out.reserve(static_cast<size_t>(evaluated.size()));
    for (Eigen::Index i = 0; i < evaluated.size(); ++i)
        out.push_back(static_cast<double>(evaluated(i)));
    return out;
}

}   // namespace eigen_detail

template <typename XDerived, typename YDerived>
auto copy_points(const Eigen::DenseBase<XDerived>& x, const Eigen::DenseBase<YDerived>& y)
    -> std::enable_if_t<eigen_detail::is_eigen_real_vector_v<XDerived>
                            && eigen_detail::is_eigen_real_vector_v<YDerived>,
                        PointSequence>
{
    if (x.cols() > 1 || y.cols() > 1)
        throw InvalidInput("copy_points: expected column vectors, got " + std::to_string(x.cols())
                           + " and " + std::to_string(y.cols()) + " columns");
    const auto xs = eigen_detail::to_vector(x);
    const auto ys = eigen_detail::to_vector(y);
    return copy_points(std::span<const double>(xs), std::span<const double>(ys));
}

template <typename XDerived, typename YDerived>
auto make_step_series(const Eigen::DenseBase<XDerived>& x, const Eigen::DenseBase<YDerived>& y)
    -> std::enable_if_t<eigen_detail::is_eigen_real_vector_v<XDerived>
                            && eigen_detail::is_eigen_real_vector_v<YDerived>,
                        StepSeries>
{
    const auto points = copy_points(x, y);
    return StepSeries(std::span<const Point>(points));
}

}   // namespace stepplot
