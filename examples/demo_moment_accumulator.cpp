#include <fastmoments/moment_accumulator.hpp>
#include <iostream>

int main() {
  fastmoments::MomentAccumulator<double> odd, even;
  for (int i = 1; i <= 10; ++i) (i % 2 ? odd : even).push(i);

  const auto all = odd + even;

  std::cout << "n=" << all.count()
            << " mean=" << all.mean()
            << " var(sample)=" << all.variance_sample()
            << " skew=" << all.skewness()
            << " kurt=" << all.kurtosis()
            << "\n";
}
