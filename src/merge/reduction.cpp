#include <csvutil/core/number.hpp>
#include <csvutil/merge/reduction.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>
#include <vector>

namespace csvutil::merge {

namespace {

auto parse_all(Reduction reduction, std::span<const std::string> values)
    -> Result<std::vector<double>> {
    std::vector<double> numbers;
    numbers.reserve(values.size());
    for (const auto& value : values) {
        auto number = parse_number(value);
        if (!number) {
            return fail(ErrorKind::NonNumericValue,
                        fmt::format("{}: cannot interpret '{}' as a number",
                                    reduction_name(reduction), value));
        }
        numbers.push_back(*number);
    }
    return numbers;
}

auto sum_of(const std::vector<double>& numbers) -> double {
    double total = 0.0;
    for (double v : numbers) {
        total += v;
    }
    return total;
}

// Exact running sum held as non-overlapping partials (Shewchuk), rounded
// once in total().
class PartialSum {
   public:
    void add(double x) {
        std::size_t kept = 0;
        for (double y : partials_) {
            if (std::fabs(x) < std::fabs(y)) {
                std::swap(x, y);
            }
            const double hi = x + y;
            const double lo = y - (hi - x);
            if (lo != 0.0) {
                partials_[kept++] = lo;
            }
            x = hi;
        }
        partials_.resize(kept);
        partials_.push_back(x);
    }

    [[nodiscard]] auto total() const -> double {
        if (partials_.empty()) {
            return 0.0;
        }
        std::size_t i = partials_.size() - 1;
        double hi = partials_[i];
        double lo = 0.0;
        while (i > 0) {
            const double x = hi;
            const double y = partials_[--i];
            hi = x + y;
            lo = y - (hi - x);
            if (lo != 0.0) {
                break;
            }
        }
        // Round half-way cases the same way an infinitely precise sum would.
        if (i > 0 && ((lo < 0.0 && partials_[i - 1] < 0.0) ||
                      (lo > 0.0 && partials_[i - 1] > 0.0))) {
            const double y = lo * 2.0;
            const double x = hi + y;
            if (x - hi == y) {
                hi = x;
            }
        }
        return hi;
    }

   private:
    std::vector<double> partials_;
};

auto all_finite(const std::vector<double>& numbers) -> bool {
    return std::all_of(numbers.begin(), numbers.end(),
                       [](double v) { return std::isfinite(v); });
}

// Power of two to divide by before summing. Large values are brought down
// so a group's squared deviations cannot overflow; tiny values are brought
// up so they cannot underflow. Everything else is left as is.
auto scale_exponent(const std::vector<double>& numbers) -> int {
    double largest = 0.0;
    for (double v : numbers) {
        largest = std::max(largest, std::fabs(v));
    }
    if (largest == 0.0) {
        return 0;
    }
    int exponent = 0;
    std::frexp(largest, &exponent);
    if (exponent > 480) {
        return exponent - 480;
    }
    if (exponent < -256) {
        return exponent;
    }
    return 0;
}

auto scaled(const std::vector<double>& numbers, int exponent) -> std::vector<double> {
    std::vector<double> out;
    out.reserve(numbers.size());
    for (double v : numbers) {
        out.push_back(std::ldexp(v, -exponent));
    }
    return out;
}

// Correctly rounded mean of values that cannot overflow when summed.
auto exact_mean(const std::vector<double>& numbers) -> double {
    PartialSum acc;
    for (double v : numbers) {
        acc.add(v);
    }
    const auto n = static_cast<double>(numbers.size());
    const double q = acc.total() / n;
    const double hi = q * n;
    acc.add(-hi);
    acc.add(-std::fma(q, n, -hi));
    return q + acc.total() / n;
}

auto mean_of(const std::vector<double>& numbers) -> double {
    if (!all_finite(numbers)) {
        return sum_of(numbers) / static_cast<double>(numbers.size());
    }
    const int exponent = scale_exponent(numbers);
    return std::ldexp(exact_mean(scaled(numbers, exponent)), exponent);
}

// First-seen value wins on ties.
template <typename Better>
auto extremum_of(const std::vector<double>& numbers, Better better) -> double {
    double best = numbers.front();
    for (std::size_t i = 1; i < numbers.size(); ++i) {
        if (better(numbers[i], best)) {
            best = numbers[i];
        }
    }
    return best;
}

auto median_of(std::vector<double> numbers) -> double {
    std::sort(numbers.begin(), numbers.end());
    const std::size_t n = numbers.size();
    if (n % 2 == 1) {
        return numbers[n / 2];
    }
    return (numbers[n / 2 - 1] + numbers[n / 2]) / 2.0;
}

// Sample standard deviation. A single value is counted twice so the result
// is 0 instead of undefined.
auto stdev_of(std::vector<double> numbers) -> double {
    if (numbers.size() == 1) {
        numbers.push_back(numbers.front());
    }
    const auto d = static_cast<double>(numbers.size() - 1);
    if (!all_finite(numbers)) {
        const double mean = sum_of(numbers) / static_cast<double>(numbers.size());
        double squares = 0.0;
        for (double v : numbers) {
            squares += (v - mean) * (v - mean);
        }
        return std::sqrt(squares / d);
    }

    const int exponent = scale_exponent(numbers);
    const auto values = scaled(numbers, exponent);
    const double mean = exact_mean(values);

    // Each deviation is split into dev + err exactly, and its square is
    // accumulated from the exact products.
    PartialSum acc;
    for (double v : values) {
        const double dev = v - mean;
        const double bb = dev - v;
        const double err = (v - (dev - bb)) + (-mean - bb);
        const double sq = dev * dev;
        acc.add(sq);
        acc.add(std::fma(dev, dev, -sq));
        acc.add(2.0 * dev * err);
        acc.add(err * err);
    }

    const double var = acc.total() / d;
    const double hi = var * d;
    acc.add(-hi);
    acc.add(-std::fma(var, d, -hi));
    const double var_lo = acc.total() / d;

    double root = std::sqrt(var);
    if (root > 0.0) {
        root += (std::fma(-root, root, var) + var_lo) / (2.0 * root);
    }
    return std::ldexp(root, exponent);
}

auto reduce_text(Reduction reduction, std::span<const std::string> values)
    -> std::optional<std::string> {
    switch (reduction) {
        case Reduction::First:
            return values.front();
        case Reduction::Last:
            return values.back();
        case Reduction::Ignore:
        case Reduction::Sum:
        case Reduction::Min:
        case Reduction::Max:
        case Reduction::Mean:
        case Reduction::Median:
        case Reduction::Stdev:
            break;
    }
    return std::nullopt;
}

}  // namespace

auto resolve_reduction(std::string_view name) -> Result<Reduction> {
    for (auto reduction : kAllReductions) {
        if (reduction_name(reduction) == name) {
            return reduction;
        }
    }
    return fail(ErrorKind::UnknownFunction,
                fmt::format("no such field:function operation: {}", name));
}

auto reduction_name(Reduction reduction) noexcept -> std::string_view {
    switch (reduction) {
        case Reduction::Sum:
            return "sum";
        case Reduction::Min:
            return "min";
        case Reduction::Max:
            return "max";
        case Reduction::Mean:
            return "mean";
        case Reduction::Median:
            return "median";
        case Reduction::Stdev:
            return "stdev";
        case Reduction::First:
            return "first";
        case Reduction::Last:
            return "last";
        case Reduction::Ignore:
            return "ignore";
    }
    return "?";
}

auto is_numeric(Reduction reduction) noexcept -> bool {
    switch (reduction) {
        case Reduction::Sum:
        case Reduction::Min:
        case Reduction::Max:
        case Reduction::Mean:
        case Reduction::Median:
        case Reduction::Stdev:
            return true;
        case Reduction::First:
        case Reduction::Last:
        case Reduction::Ignore:
            return false;
    }
    return false;
}

auto apply_reduction(Reduction reduction, std::span<const std::string> values)
    -> Result<std::optional<std::string>> {
    if (values.empty()) {
        throw std::invalid_argument("reduction over an empty group");
    }
    if (!is_numeric(reduction)) {
        return reduce_text(reduction, values);
    }

    auto numbers = parse_all(reduction, values);
    if (!numbers) {
        return std::unexpected(std::move(numbers.error()));
    }

    double result = 0.0;
    switch (reduction) {
        case Reduction::Sum:
            result = sum_of(*numbers);
            break;
        case Reduction::Min:
            result = extremum_of(*numbers, [](double a, double b) { return a < b; });
            break;
        case Reduction::Max:
            result = extremum_of(*numbers, [](double a, double b) { return a > b; });
            break;
        case Reduction::Mean:
            result = mean_of(*numbers);
            break;
        case Reduction::Median:
            result = median_of(std::move(*numbers));
            break;
        case Reduction::Stdev:
            result = stdev_of(std::move(*numbers));
            break;
        case Reduction::First:
        case Reduction::Last:
        case Reduction::Ignore:
            break;
    }
    return std::optional<std::string>{format_number(result)};
}

}  // namespace csvutil::merge
