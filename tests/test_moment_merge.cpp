#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <fastmoments/moment_accumulator.hpp>

#include <algorithm>
#include <cmath>
#include <random>
#include <vector>

using Acc = fastmoments::MomentAccumulator<double>;

// Same statistics up to rounding. Shape statistics of near-symmetric data sit
// close to zero, hence the absolute margins.
static void require_equivalent(const Acc& got, const Acc& want) {
    REQUIRE(got.count() == want.count());
    REQUIRE(got.mean() == Catch::Approx(want.mean()).epsilon(1e-12).margin(1e-12));
    REQUIRE(got.variance_population() ==
            Catch::Approx(want.variance_population()).epsilon(1e-10));
    REQUIRE(got.variance_sample() == Catch::Approx(want.variance_sample()).epsilon(1e-10));
    REQUIRE(got.skewness() == Catch::Approx(want.skewness()).epsilon(1e-9).margin(1e-9));
    REQUIRE(got.kurtosis() == Catch::Approx(want.kurtosis()).epsilon(1e-9).margin(1e-9));
}

static Acc accumulate(const std::vector<double>& xs, std::size_t first, std::size_t last) {
    Acc acc;
    acc.push(xs.data() + first, last - first);
    return acc;
}

TEST_CASE("MomentAccumulator merge equals push-all-at-once", "[merge]") {
    std::mt19937 rng(6789);
    std::uniform_real_distribution<double> dist(-10.0, 10.0);

    for (int trial = 0; trial < 200; ++trial) {
        const std::size_t n = 2 + (trial % 300);

        std::vector<double> xs(n);
        for (double& x : xs) x = dist(rng);

        const Acc all = accumulate(xs, 0, n);

        // split at every kind of point, including an empty side
        std::uniform_int_distribution<std::size_t> pick(0, n);
        const std::size_t split = trial < 2 ? (trial == 0 ? 0 : n) : pick(rng);

        Acc a = accumulate(xs, 0, split);
        const Acc b = accumulate(xs, split, n);
        a.merge(b);

        require_equivalent(a, all);
    }
}

TEST_CASE("MomentAccumulator merge of skewed shards", "[merge]") {
    std::mt19937 rng(4242);
    std::exponential_distribution<double> dist(0.25);

    std::vector<double> xs(5000);
    for (double& x : xs) x = dist(rng);

    const Acc all = accumulate(xs, 0, xs.size());

    // 16 uneven shards folded one after another
    Acc folded;
    std::size_t first = 0;
    for (std::size_t k = 1; first < xs.size(); ++k) {
        const std::size_t last = std::min(xs.size(), first + 37 * k);
        folded += accumulate(xs, first, last);
        first = last;
    }

    require_equivalent(folded, all);
    REQUIRE(folded.skewness() > 1.0);   // exponential data is right-skewed
}

TEST_CASE("MomentAccumulator merge is commutative", "[merge]") {
    std::mt19937 rng(99);
    std::normal_distribution<double> small(1.0, 0.5);
    std::normal_distribution<double> large(40.0, 7.0);

    Acc a, b;
    for (int i = 0; i < 120; ++i) a.push(small(rng));
    for (int i = 0; i < 35; ++i) b.push(large(rng));

    const Acc ab = a + b;
    const Acc ba = b + a;

    require_equivalent(ab, ba);
}

TEST_CASE("MomentAccumulator merge is associative", "[merge]") {
    std::mt19937 rng(31337);
    std::uniform_real_distribution<double> dist(-3.0, 12.0);

    std::vector<double> xs(900);
    for (double& x : xs) x = dist(rng);

    const Acc a = accumulate(xs, 0, 100);
    const Acc b = accumulate(xs, 100, 550);
    const Acc c = accumulate(xs, 550, 900);

    require_equivalent((a + b) + c, a + (b + c));
    require_equivalent((a + b) + c, accumulate(xs, 0, 900));
}

TEST_CASE("MomentAccumulator empty accumulator is the merge identity", "[merge]") {
    const Acc data{1.5, -2.0, 8.25, 3.0};
    const Acc empty;

    Acc left = data;
    left.merge(empty);
    REQUIRE(left.state() == data.state());

    Acc right = empty;
    right.merge(data);
    REQUIRE(right.state() == data.state());

    Acc both;
    both.merge(empty);
    REQUIRE(both.empty());
    REQUIRE(both.state() == empty.state());
}

TEST_CASE("MomentAccumulator merge of two constant shards", "[merge]") {
    const Acc threes{3.0, 3.0, 3.0};
    const Acc fives{5.0, 5.0};

    const Acc all = threes + fives;

    REQUIRE(all.count() == 5);
    REQUIRE(all.mean() == Catch::Approx(3.8));
    REQUIRE(all.variance_population() == Catch::Approx(0.96));
    REQUIRE(all.variance_sample() == Catch::Approx(1.2));

    const Acc direct{3.0, 3.0, 3.0, 5.0, 5.0};
    require_equivalent(all, direct);

    // identical constants keep zero variance through a merge
    const Acc same = threes + threes;
    REQUIRE(same.variance_population() == 0.0);
    REQUIRE(std::isnan(same.skewness()));
    REQUIRE(std::isnan(same.kurtosis()));
}

TEST_CASE("MomentAccumulator operator+ leaves its operands unchanged", "[merge]") {
    const Acc a{1.0, 2.0, 3.0};
    const Acc b{10.0, 20.0};
    const auto a_before = a.state();
    const auto b_before = b.state();

    const Acc sum = a + b;

    REQUIRE(sum.count() == 5);
    REQUIRE(a.state() == a_before);
    REQUIRE(b.state() == b_before);
}

TEST_CASE("MomentAccumulator merge with itself", "[merge]") {
    Acc acc{2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0};
    const Acc before = acc;

    acc.merge(acc);

    REQUIRE(acc.count() == 16);
    REQUIRE(acc.mean() == Catch::Approx(before.mean()));
    REQUIRE(acc.variance_population() == Catch::Approx(before.variance_population()));
    REQUIRE(acc.skewness() == Catch::Approx(before.skewness()));
    REQUIRE(acc.kurtosis() == Catch::Approx(before.kurtosis()));
}
