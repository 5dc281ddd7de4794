#include <fastmoments/moment_accumulator.hpp>
#include <fastmoments/text_reader.hpp>

#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

// Reads whitespace-separated numbers from each FILE (stdin when none is
// given, or for "-"), accumulates one shard per input and merges them.

namespace {

using Accumulator = fastmoments::MomentAccumulator<double>;

void usage(const char* prog) {
    std::cerr << "usage: " << prog << " [-v|--verbose] [-q|--quiet] [FILE...]\n"
              << "  FILE  input of whitespace-separated numbers, '-' for stdin\n"
              << "  log level can also be set with SPDLOG_LEVEL\n";
}

// Returns false when the stream went bad before EOF.
bool read_shard(std::istream& in, const std::string& name, Accumulator& acc,
                std::size_t& skipped) {
    const auto summary = fastmoments::read_numbers(in, acc, [&name](const std::string& tok) {
        spdlog::warn("{}: skipping non-numeric token '{}'", name, tok);
    });
    skipped += summary.skipped;
    if (summary.io_error) {
        spdlog::error("{}: read error after {} value(s)", name, summary.values);
        return false;
    }
    return true;
}

void print_summary(const Accumulator& acc) {
    std::cout << std::setprecision(12)
              << "count               " << acc.count() << "\n"
              << "mean                " << acc.mean() << "\n"
              << "variance_population " << acc.variance_population() << "\n"
              << "variance_sample     " << acc.variance_sample() << "\n"
              << "stddev_population   " << acc.stddev_population() << "\n"
              << "stddev_sample       " << acc.stddev_sample() << "\n"
              << "skewness            " << acc.skewness() << "\n"
              << "kurtosis            " << acc.kurtosis() << "\n";
}

} // namespace

int main(int argc, char** argv) {
    auto logger = spdlog::stderr_color_mt("moments_stream");
    spdlog::set_default_logger(logger);
    spdlog::cfg::load_env_levels();

    std::vector<std::string> inputs;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (!std::strcmp(arg, "-v") || !std::strcmp(arg, "--verbose")) {
            spdlog::set_level(spdlog::level::debug);
        } else if (!std::strcmp(arg, "-q") || !std::strcmp(arg, "--quiet")) {
            spdlog::set_level(spdlog::level::warn);
        } else if (!std::strcmp(arg, "-h") || !std::strcmp(arg, "--help")) {
            usage(argv[0]);
            return 0;
        } else if (arg[0] == '-' && arg[1] != '\0') {
            spdlog::error("unknown option '{}'", arg);
            usage(argv[0]);
            return 2;
        } else {
            inputs.emplace_back(arg);
        }
    }
    if (inputs.empty()) inputs.emplace_back("-");

    std::vector<Accumulator> shards(inputs.size());
    std::size_t skipped = 0;
    for (std::size_t i = 0; i < inputs.size(); ++i) {
        const std::string& name = inputs[i];
        if (name == "-") {
            if (!read_shard(std::cin, "<stdin>", shards[i], skipped)) return 1;
        } else {
            errno = 0;
            std::ifstream in(name);
            if (!in) {
                if (errno != 0) {
                    spdlog::error("cannot open '{}': {}", name, std::strerror(errno));
                } else {
                    spdlog::error("cannot open '{}'", name);
                }
                return 1;
            }
            if (!read_shard(in, name, shards[i], skipped)) return 1;
        }
        spdlog::debug("shard {} ({}): n={} mean={} var={}", i, name, shards[i].count(),
                      shards[i].mean(), shards[i].variance_population());
    }

    Accumulator total;
    for (const auto& shard : shards) {
        total.merge(shard);
        spdlog::debug("merged shard: n={}", total.count());
    }

    spdlog::info("{} values from {} input(s), {} token(s) skipped",
                 total.count(), inputs.size(), skipped);
    print_summary(total);
    return 0;
}
