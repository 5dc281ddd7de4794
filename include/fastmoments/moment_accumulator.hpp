#pragma once

#include <cstddef>
#include <limits>
#include <cmath>
#include <initializer_list>
#include <iterator>
#include <ostream>
#include <type_traits>
#include <utility>

namespace fastmoments {

namespace detail {

// Exposes data()/size() and its elements can be read through a `const T*`.
template <class C, class T, class = void>
struct is_contiguous_of : std::false_type {};

template <class C, class T>
struct is_contiguous_of<C, T, std::void_t<decltype(std::declval<const C&>().data()),
                                          decltype(std::declval<const C&>().size())>>
    : std::is_convertible<decltype(std::declval<const C&>().data()), const T*> {};

template <class C, class = void>
struct is_range : std::false_type {};

template <class C>
struct is_range<C, std::void_t<decltype(std::begin(std::declval<const C&>())),
                               decltype(std::end(std::declval<const C&>()))>>
    : std::true_type {};

} // namespace detail

/**
 * @brief Snapshot of the sufficient statistics held by a MomentAccumulator.
 *
 * `m2`, `m3`, `m4` are sums of centered powers (not divided by the count).
 */
template <typename T = double>
struct MomentState {
    std::size_t count{0};
    T m1{0};
    T m2{0};
    T m3{0};
    T m4{0};

    [[nodiscard]] constexpr bool operator==(const MomentState& o) const noexcept {
        return count == o.count && m1 == o.m1 && m2 == o.m2 && m3 == o.m3 && m4 == o.m4;
    }

    [[nodiscard]] constexpr bool operator!=(const MomentState& o) const noexcept {
        return !(*this == o);
    }
};

template <typename T>
std::ostream& operator<<(std::ostream& os, const MomentState<T>& s) {
    return os << '(' << s.count << ", " << s.m1 << ", " << s.m2 << ", "
              << s.m3 << ", " << s.m4 << ')';
}

/**
 * @brief Single-pass mean, variance, skewness and kurtosis of a stream.
 *
 * Tracks the count, the running mean and the second to fourth centered
 * moment sums. `push` is Welford's update extended to the higher moments
 * (Terriberry); `merge` combines two accumulators as if every observation of
 * both had been pushed into one (Chan et al. / Pebay).
 *
 * ## Undefined statistics
 * Every derived statistic returns `NaN` when it is undefined:
 * - `mean()`, `variance_population()`: `count() == 0`
 * - `variance_sample()`: `count() < 2`
 * - `skewness()`, `kurtosis()`: `count() < 2` or zero variance
 *
 * Non-finite inputs are not rejected; they propagate through the arithmetic.
 *
 * Not thread-safe. Use one accumulator per producer and merge them.
 *
 * @tparam T Floating-point type for accumulation and output.
 */
template <typename T = double>
class MomentAccumulator {
    static_assert(std::is_floating_point_v<T>,
                  "MomentAccumulator requires floating point T");

public:
    MomentAccumulator() = default;

    MomentAccumulator(std::initializer_list<T> xs) noexcept {
        push(xs.begin(), xs.end());
    }

    template <class Container,
              std::enable_if_t<detail::is_contiguous_of<Container, T>::value ||
                               detail::is_range<Container>::value, int> = 0>
    explicit MomentAccumulator(const Container& c) noexcept {
        push(c);
    }

    // --- Observe -------------------------------------------------------------

    constexpr void push(T x) noexcept {
        const T n1 = static_cast<T>(n_);
        ++n_;
        const T n = static_cast<T>(n_);

        const T delta = x - m1_;
        const T delta_n = delta / n;
        const T delta_n2 = delta_n * delta_n;
        const T term1 = delta * delta_n * n1;

        m1_ += delta_n;
        m4_ += term1 * delta_n2 * (n * n - T{3} * n + T{3})
             + T{6} * delta_n2 * m2_
             - T{4} * delta_n * m3_;
        m3_ += term1 * delta_n * (n - T{2}) - T{3} * delta_n * m2_;
        m2_ += term1;
    }

    /**
     * @brief Push a batch given by pointer + length.
     *
     * Safe no-op if `xs == nullptr` or `n == 0`.
     */
    constexpr void push(const T* xs, std::size_t n) noexcept {
        if (!xs || n == 0) return;
        for (std::size_t i = 0; i < n; ++i) push(xs[i]);
    }

    template <class Container,
              std::enable_if_t<detail::is_contiguous_of<Container, T>::value, int> = 0>
    constexpr void push(const Container& c) noexcept {
        push(c.data(), static_cast<std::size_t>(c.size()));
    }

    // Any other iterable, e.g. std::list<T> or std::vector<float> into a double accumulator.
    template <class Range,
              std::enable_if_t<!detail::is_contiguous_of<Range, T>::value &&
                               detail::is_range<Range>::value, int> = 0>
    constexpr void push(const Range& r) noexcept {
        push(std::begin(r), std::end(r));
    }

    template <class InputIt,
              class = typename std::iterator_traits<InputIt>::iterator_category>
    constexpr void push(InputIt first, InputIt last) noexcept {
        for (; first != last; ++first) push(static_cast<T>(*first));
    }

    // --- Merge ---------------------------------------------------------------

    /**
     * @brief Fold the observations summarized by `other` into this one.
     *
     * `other` may be `*this`; it is fully read before anything is written.
     */
    constexpr void merge(const MomentAccumulator& other) noexcept {
        if (other.n_ == 0) return;
        if (n_ == 0) {
            *this = other;
            return;
        }

        const T n_a = static_cast<T>(n_);
        const T n_b = static_cast<T>(other.n_);
        const T n = n_a + n_b;

        const T a_m1 = m1_, a_m2 = m2_, a_m3 = m3_, a_m4 = m4_;
        const T b_m1 = other.m1_, b_m2 = other.m2_, b_m3 = other.m3_, b_m4 = other.m4_;

        const T delta = b_m1 - a_m1;
        const T delta2 = delta * delta;
        const T delta3 = delta2 * delta;
        const T delta4 = delta3 * delta;

        m1_ = a_m1 + delta * n_b / n;
        m2_ = a_m2 + b_m2
            + delta2 * n_a * n_b / n;
        m3_ = a_m3 + b_m3
            + delta3 * n_a * n_b * (n_a - n_b) / (n * n)
            + T{3} * delta * (n_a * b_m2 - n_b * a_m2) / n;
        m4_ = a_m4 + b_m4
            + delta4 * n_a * n_b * (n_a * n_a - n_a * n_b + n_b * n_b) / (n * n * n)
            + T{6} * delta2 * (n_a * n_a * b_m2 + n_b * n_b * a_m2) / (n * n)
            + T{4} * delta * (n_a * b_m3 - n_b * a_m3) / n;

        n_ += other.n_;
    }

    constexpr MomentAccumulator& operator+=(const MomentAccumulator& other) noexcept {
        merge(other);
        return *this;
    }

    friend constexpr MomentAccumulator operator+(MomentAccumulator a,
                                                 const MomentAccumulator& b) noexcept {
        a.merge(b);
        return a;
    }

    // --- Accessors -----------------------------------------------------------

    [[nodiscard]] constexpr std::size_t count() const noexcept { return n_; }
    [[nodiscard]] constexpr bool empty() const noexcept { return n_ == 0; }

    [[nodiscard]] constexpr MomentState<T> state() const noexcept {
        return MomentState<T>{n_, m1_, m2_, m3_, m4_};
    }

    [[nodiscard]] constexpr T mean() const noexcept {
        if (n_ < 1) return std::numeric_limits<T>::quiet_NaN();
        return m1_;
    }

    [[nodiscard]] constexpr T variance_population() const noexcept {
        if (n_ < 1) return std::numeric_limits<T>::quiet_NaN();
        return m2_ / static_cast<T>(n_);
    }

    [[nodiscard]] constexpr T variance_sample() const noexcept {
        if (n_ < 2) return std::numeric_limits<T>::quiet_NaN();
        return m2_ / static_cast<T>(n_ - 1);
    }

    [[nodiscard]] T stddev_population() const noexcept {
        const T v = variance_population();
        return std::sqrt(v);
    }

    [[nodiscard]] T stddev_sample() const noexcept {
        const T v = variance_sample();
        return std::sqrt(v);
    }

    // Zero variance leaves the shape undefined rather than infinite.
    [[nodiscard]] T skewness() const noexcept {
        if (n_ < 2 || m2_ == T{0}) return std::numeric_limits<T>::quiet_NaN();
        return std::sqrt(static_cast<T>(n_)) * m3_ / std::pow(m2_, T{1.5});
    }

    // Excess kurtosis: 0 for a normal distribution.
    [[nodiscard]] T kurtosis() const noexcept {
        if (n_ < 2 || m2_ == T{0}) return std::numeric_limits<T>::quiet_NaN();
        return static_cast<T>(n_) * m4_ / (m2_ * m2_) - T{3};
    }

    // --- Reset ---------------------------------------------------------------

    constexpr void reset() noexcept {
        n_ = 0;
        m1_ = T{0};
        m2_ = T{0};
        m3_ = T{0};
        m4_ = T{0};
    }

private:
    std::size_t n_{0};
    T m1_{0};
    T m2_{0};
    T m3_{0};
    T m4_{0};
};

template <typename T>
std::ostream& operator<<(std::ostream& os, const MomentAccumulator<T>& acc) {
    return os << acc.state();
}

} // namespace fastmoments
