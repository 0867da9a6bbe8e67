// src/statistics/significance_tester.cpp

#include "alloc_ngin/statistics/significance_tester.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <random>
#include <sstream>
#include "alloc_ngin/core/logger.hpp"
#include "alloc_ngin/statistics/distributions.hpp"

namespace alloc_ngin {
namespace statistics {

namespace {

constexpr size_t MIN_OBSERVATIONS = 3;

struct Moments {
    double mean{0.0};
    double std_dev{0.0};
};

Moments sample_moments(const std::vector<double>& values) {
    Moments m;
    const double n = static_cast<double>(values.size());
    m.mean = std::accumulate(values.begin(), values.end(), 0.0) / n;
    double sq_sum = 0.0;
    for (double v : values) {
        sq_sum += (v - m.mean) * (v - m.mean);
    }
    m.std_dev = std::sqrt(sq_sum / (n - 1.0));
    return m;
}

double sample_covariance(const std::vector<double>& a, double mean_a,
                         const std::vector<double>& b, double mean_b) {
    double sum = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        sum += (a[i] - mean_a) * (b[i] - mean_b);
    }
    return sum / static_cast<double>(a.size() - 1);
}

std::vector<double> excess_returns(const std::vector<double>& returns,
                                   const std::vector<double>& risk_free) {
    std::vector<double> excess(returns.size());
    for (size_t i = 0; i < returns.size(); ++i) {
        excess[i] = returns[i] - risk_free[i];
    }
    return excess;
}

}  // namespace

nlohmann::json SignificanceResult::to_json() const {
    nlohmann::json j;
    j["strategy_a"] = strategy_a;
    j["strategy_b"] = strategy_b;
    j["num_observations"] = num_observations;
    j["sharpe_a"] = sharpe_a;
    j["sharpe_b"] = sharpe_b;
    j["difference"] = difference;
    j["correlation"] = correlation;
    j["statistic"] = statistic;
    j["p_value"] = p_value;
    j["significance_level"] = significance_level;
    j["significant"] = significant;
    j["interpretation"] = interpretation;
    return j;
}

SignificanceResult SignificanceResult::from_json(const nlohmann::json& j) {
    SignificanceResult r;
    r.strategy_a = j.at("strategy_a").get<std::string>();
    r.strategy_b = j.at("strategy_b").get<std::string>();
    r.num_observations = j.at("num_observations").get<size_t>();
    r.sharpe_a = j.at("sharpe_a").get<double>();
    r.sharpe_b = j.at("sharpe_b").get<double>();
    r.difference = j.at("difference").get<double>();
    r.correlation = j.at("correlation").get<double>();
    r.statistic = j.at("statistic").get<double>();
    r.p_value = j.at("p_value").get<double>();
    r.significance_level = j.at("significance_level").get<double>();
    r.significant = j.at("significant").get<bool>();
    if (j.contains("interpretation"))
        r.interpretation = j.at("interpretation").get<std::string>();
    return r;
}

nlohmann::json BootstrapResult::to_json() const {
    nlohmann::json j;
    j["strategy_a"] = strategy_a;
    j["strategy_b"] = strategy_b;
    j["observed_difference"] = observed_difference;
    j["bootstrap_std"] = bootstrap_std;
    j["ci_lower"] = ci_lower;
    j["ci_upper"] = ci_upper;
    j["p_value"] = p_value;
    j["significant"] = significant;
    j["samples"] = samples;
    return j;
}

SignificanceTester::SignificanceTester(SignificanceConfig config) : config_(config) {
    Logger::register_component("SignificanceTester");
}

Result<void> SignificanceTester::validate_inputs(const std::vector<double>& returns_a,
                                                 const std::vector<double>& returns_b,
                                                 const std::vector<double>& risk_free) const {
    if (returns_a.size() != returns_b.size() || returns_a.size() != risk_free.size()) {
        return make_error<void>(ErrorCode::INSUFFICIENT_DATA,
                                "Return series are not aligned: " +
                                    std::to_string(returns_a.size()) + ", " +
                                    std::to_string(returns_b.size()) + " and " +
                                    std::to_string(risk_free.size()) + " observations",
                                "SignificanceTester");
    }
    if (returns_a.size() < MIN_OBSERVATIONS) {
        return make_error<void>(ErrorCode::INSUFFICIENT_DATA,
                                "Need at least " + std::to_string(MIN_OBSERVATIONS) +
                                    " observations, got " + std::to_string(returns_a.size()),
                                "SignificanceTester");
    }
    if (config_.periods_per_year <= 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "periods_per_year must be positive",
                                "SignificanceTester");
    }
    return Result<void>();
}

Result<SignificanceResult> SignificanceTester::jobson_korkie(
    const std::string& name_a, const std::vector<double>& returns_a, const std::string& name_b,
    const std::vector<double>& returns_b, const std::vector<double>& risk_free) const {
    auto valid = validate_inputs(returns_a, returns_b, risk_free);
    if (valid.is_error()) {
        return forward_error<SignificanceResult>(valid);
    }

    const std::vector<double> excess_a = excess_returns(returns_a, risk_free);
    const std::vector<double> excess_b = excess_returns(returns_b, risk_free);
    const Moments ma = sample_moments(excess_a);
    const Moments mb = sample_moments(excess_b);

    if (ma.std_dev <= 0.0 || mb.std_dev <= 0.0) {
        return make_error<SignificanceResult>(
            ErrorCode::INDETERMINATE_SIGNIFICANCE,
            "Sharpe ratio undefined for a zero-volatility series (" + name_a + " vs " + name_b + ")",
            "SignificanceTester");
    }

    const double T = static_cast<double>(returns_a.size());
    const double sr_a = ma.mean / ma.std_dev;
    const double sr_b = mb.mean / mb.std_dev;
    double rho = sample_covariance(excess_a, ma.mean, excess_b, mb.mean) / (ma.std_dev * mb.std_dev);
    rho = std::max(-1.0, std::min(1.0, rho));

    const double diff = sr_a - sr_b;
    const double variance =
        (2.0 * (1.0 - rho) + 0.5 * (sr_a * sr_a + sr_b * sr_b - 2.0 * sr_a * sr_b * rho * rho)) /
        T;

    SignificanceResult result;
    result.strategy_a = name_a;
    result.strategy_b = name_b;
    result.num_observations = returns_a.size();
    const double annualizer = std::sqrt(static_cast<double>(config_.periods_per_year));
    result.sharpe_a = sr_a * annualizer;
    result.sharpe_b = sr_b * annualizer;
    result.difference = diff * annualizer;
    result.correlation = rho;
    result.significance_level = config_.significance_level;

    const bool no_difference = std::abs(diff) <= 1e-12 * std::max(1.0, std::abs(sr_a) + std::abs(sr_b));
    if (no_difference) {
        // Identical series: nothing to reject regardless of V
        result.statistic = 0.0;
        result.p_value = 1.0;
    } else if (!(variance > 0.0)) {
        std::ostringstream oss;
        oss << "Jobson-Korkie variance " << variance << " is not positive for " << name_a
            << " vs " << name_b;
        WARN(oss.str());
        return make_error<SignificanceResult>(ErrorCode::INDETERMINATE_SIGNIFICANCE, oss.str(),
                                              "SignificanceTester");
    } else {
        result.statistic = diff / std::sqrt(variance);
        // Student-t tail with T - 1 degrees of freedom
        result.p_value = two_sided_t_p_value(result.statistic, T - 1.0);
    }

    result.significant = result.p_value < config_.significance_level;
    result.interpretation = result.significant
                                ? "Sharpe ratios differ at the " +
                                      std::to_string(config_.significance_level) + " level"
                                : "No significant Sharpe ratio difference";
    return result;
}

Result<BootstrapResult> SignificanceTester::bootstrap(const std::string& name_a,
                                                      const std::vector<double>& returns_a,
                                                      const std::string& name_b,
                                                      const std::vector<double>& returns_b,
                                                      const std::vector<double>& risk_free) const {
    auto valid = validate_inputs(returns_a, returns_b, risk_free);
    if (valid.is_error()) {
        return forward_error<BootstrapResult>(valid);
    }
    if (config_.bootstrap_samples == 0) {
        return make_error<BootstrapResult>(ErrorCode::INVALID_ARGUMENT,
                                           "bootstrap_samples must be positive",
                                           "SignificanceTester");
    }

    const std::vector<double> excess_a = excess_returns(returns_a, risk_free);
    const std::vector<double> excess_b = excess_returns(returns_b, risk_free);
    const double annualizer = std::sqrt(static_cast<double>(config_.periods_per_year));

    auto sharpe_difference = [&](const std::vector<double>& a, const std::vector<double>& b,
                                 double& out) {
        const Moments ma = sample_moments(a);
        const Moments mb = sample_moments(b);
        if (ma.std_dev <= 0.0 || mb.std_dev <= 0.0)
            return false;
        out = (ma.mean / ma.std_dev - mb.mean / mb.std_dev) * annualizer;
        return true;
    };

    BootstrapResult result;
    result.strategy_a = name_a;
    result.strategy_b = name_b;
    if (!sharpe_difference(excess_a, excess_b, result.observed_difference)) {
        return make_error<BootstrapResult>(
            ErrorCode::INDETERMINATE_SIGNIFICANCE,
            "Sharpe ratio undefined for a zero-volatility series (" + name_a + " vs " + name_b + ")",
            "SignificanceTester");
    }

    std::mt19937_64 rng(config_.bootstrap_seed);
    std::uniform_int_distribution<size_t> pick(0, excess_a.size() - 1);
    std::vector<double> sample_a(excess_a.size());
    std::vector<double> sample_b(excess_b.size());
    std::vector<double> differences;
    differences.reserve(config_.bootstrap_samples);

    for (size_t s = 0; s < config_.bootstrap_samples; ++s) {
        for (size_t i = 0; i < excess_a.size(); ++i) {
            const size_t k = pick(rng);
            sample_a[i] = excess_a[k];
            sample_b[i] = excess_b[k];
        }
        double diff = 0.0;
        if (sharpe_difference(sample_a, sample_b, diff)) {
            differences.push_back(diff);
        }
    }

    if (differences.size() < 2) {
        return make_error<BootstrapResult>(ErrorCode::INDETERMINATE_SIGNIFICANCE,
                                           "Too few bootstrap samples with defined Sharpe ratios",
                                           "SignificanceTester");
    }

    result.samples = differences.size();
    const Moments md = sample_moments(differences);
    result.bootstrap_std = md.std_dev;

    std::sort(differences.begin(), differences.end());
    result.ci_lower = percentile(differences, 0.025);
    result.ci_upper = percentile(differences, 0.975);

    const double count = static_cast<double>(differences.size());
    double tail = 0.0;
    if (result.observed_difference >= 0.0) {
        tail = static_cast<double>(std::count_if(differences.begin(), differences.end(),
                                                 [](double d) { return d <= 0.0; }));
    } else {
        tail = static_cast<double>(std::count_if(differences.begin(), differences.end(),
                                                 [](double d) { return d >= 0.0; }));
    }
    result.p_value = std::min(1.0, 2.0 * tail / count);
    result.significant = result.p_value < config_.significance_level;

    return result;
}

}  // namespace statistics
}  // namespace alloc_ngin
