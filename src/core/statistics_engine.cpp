/**
 * @file statistics_engine.cpp
 * @brief Summary statistics and cross-formula matrices.
 */

#include "statistics_engine.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>

#include "runtime_log.hpp"

namespace petc
{
namespace
{

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

/**
 * @brief Linear-interpolated quantile of sorted values.
 */
double quantile_sorted(const std::vector<double>& sorted, double q)
{
    if (sorted.empty())
    {
        return kNaN;
    }
    const double position = q * static_cast<double>(sorted.size() - 1);
    const std::size_t lower = static_cast<std::size_t>(std::floor(position));
    const std::size_t upper = std::min(lower + 1, sorted.size() - 1);
    const double weight = position - static_cast<double>(lower);
    return sorted[lower] + (sorted[upper] - sorted[lower]) * weight;
}

} // namespace

FormulaMatrix::FormulaMatrix(std::vector<std::string> labels, double fill)
    : labels_(std::move(labels)), values_(labels_.size() * labels_.size(), fill)
{
}

std::size_t FormulaMatrix::index_of(const std::string& label) const
{
    for (std::size_t i = 0; i < labels_.size(); ++i)
    {
        if (labels_[i] == label)
        {
            return i;
        }
    }
    throw std::out_of_range("Formula not in matrix: " + label);
}

double FormulaMatrix::at(const std::string& row, const std::string& col) const
{
    return at(index_of(row), index_of(col));
}

bool FormulaMatrix::is_symmetric() const
{
    for (std::size_t i = 0; i < labels_.size(); ++i)
    {
        for (std::size_t j = i + 1; j < labels_.size(); ++j)
        {
            const double a = at(i, j);
            const double b = at(j, i);
            if (std::isnan(a) != std::isnan(b) || (!std::isnan(a) && a != b))
            {
                return false;
            }
        }
    }
    return true;
}

const FormulaSummary* StatisticsArtifacts::find_summary(const std::string& formula) const
{
    for (const auto& entry : summary)
    {
        if (entry.formula == formula)
        {
            return &entry;
        }
    }
    return nullptr;
}

FormulaSummary summarize_series(const std::string& name, const std::vector<double>& values)
{
    FormulaSummary out;
    out.formula = name;

    std::vector<double> finite;
    finite.reserve(values.size());
    for (const double value : values)
    {
        if (std::isfinite(value))
        {
            finite.push_back(value);
        }
    }

    out.count = finite.size();
    if (finite.empty())
    {
        out.mean = out.std_dev = out.cv = kNaN;
        out.min_value = out.p25 = out.median = out.p75 = out.max_value = kNaN;
        return out;
    }

    double sum = 0.0;
    for (const double value : finite)
    {
        sum += value;
    }
    out.mean = sum / static_cast<double>(finite.size());

    if (finite.size() > 1)
    {
        double squares = 0.0;
        for (const double value : finite)
        {
            squares += (value - out.mean) * (value - out.mean);
        }
        out.std_dev = std::sqrt(squares / static_cast<double>(finite.size() - 1));
    }
    else
    {
        out.std_dev = kNaN;
    }

    out.cv = (out.mean == 0.0 || std::isnan(out.std_dev)) ? kNaN : out.std_dev / out.mean;

    std::sort(finite.begin(), finite.end());
    out.min_value = finite.front();
    out.max_value = finite.back();
    out.p25 = quantile_sorted(finite, 0.25);
    out.median = quantile_sorted(finite, 0.50);
    out.p75 = quantile_sorted(finite, 0.75);
    return out;
}

double pearson_pairwise(const std::vector<double>& a, const std::vector<double>& b)
{
    const std::size_t n = std::min(a.size(), b.size());
    std::size_t count = 0;
    double sum_a = 0.0;
    double sum_b = 0.0;
    for (std::size_t i = 0; i < n; ++i)
    {
        if (std::isfinite(a[i]) && std::isfinite(b[i]))
        {
            sum_a += a[i];
            sum_b += b[i];
            ++count;
        }
    }
    if (count < 2)
    {
        return kNaN;
    }

    const double mean_a = sum_a / static_cast<double>(count);
    const double mean_b = sum_b / static_cast<double>(count);
    double cov = 0.0;
    double var_a = 0.0;
    double var_b = 0.0;
    for (std::size_t i = 0; i < n; ++i)
    {
        if (std::isfinite(a[i]) && std::isfinite(b[i]))
        {
            const double da = a[i] - mean_a;
            const double db = b[i] - mean_b;
            cov += da * db;
            var_a += da * da;
            var_b += db * db;
        }
    }
    if (var_a <= 0.0 || var_b <= 0.0)
    {
        return kNaN;
    }

    const double r = cov / std::sqrt(var_a * var_b);
    return std::max(-1.0, std::min(1.0, r));
}

double mean_abs_difference_pairwise(const std::vector<double>& a, const std::vector<double>& b)
{
    const std::size_t n = std::min(a.size(), b.size());
    std::size_t count = 0;
    double sum = 0.0;
    for (std::size_t i = 0; i < n; ++i)
    {
        if (std::isfinite(a[i]) && std::isfinite(b[i]))
        {
            sum += std::abs(a[i] - b[i]);
            ++count;
        }
    }
    if (count == 0)
    {
        return kNaN;
    }
    return sum / static_cast<double>(count);
}

std::vector<FormulaSummary> StatisticsEngine::summary(const ResultsTable& table) const
{
    std::vector<FormulaSummary> out;
    out.reserve(table.size());
    for (const auto& entry : table.entries())
    {
        out.push_back(summarize_series(entry.formula, entry.total));
    }
    return out;
}

FormulaMatrix StatisticsEngine::correlation_matrix(const ResultsTable& table) const
{
    FormulaMatrix matrix(table.formula_names(), kNaN);
    const auto& entries = table.entries();
    for (std::size_t i = 0; i < entries.size(); ++i)
    {
        // Self-correlation is 1 unless the series has no variance.
        const double self = pearson_pairwise(entries[i].total, entries[i].total);
        matrix.set(i, i, std::isnan(self) ? kNaN : 1.0);
        for (std::size_t j = i + 1; j < entries.size(); ++j)
        {
            const double r = pearson_pairwise(entries[i].total, entries[j].total);
            matrix.set(i, j, r);
            matrix.set(j, i, r);
        }
    }
    return matrix;
}

FormulaMatrix StatisticsEngine::pairwise_difference_matrix(const ResultsTable& table) const
{
    FormulaMatrix matrix(table.formula_names(), 0.0);
    const auto& entries = table.entries();
    for (std::size_t i = 0; i < entries.size(); ++i)
    {
        for (std::size_t j = i + 1; j < entries.size(); ++j)
        {
            const double d = mean_abs_difference_pairwise(entries[i].total, entries[j].total);
            matrix.set(i, j, d);
            matrix.set(j, i, d);
        }
    }
    return matrix;
}

StatisticsArtifacts StatisticsEngine::compute(const ResultsTable& table) const
{
    StatisticsArtifacts artifacts;
    artifacts.summary = summary(table);
    artifacts.correlation = correlation_matrix(table);
    artifacts.mean_abs_difference = pairwise_difference_matrix(table);

    if (log_normal_enabled())
    {
        std::cout << "[STATS] statistics computed for " << table.size() << " formula(s) over "
                  << table.num_timesteps() << " timestep(s)" << std::endl;
    }
    return artifacts;
}

} // namespace petc
