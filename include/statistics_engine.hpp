#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "results_table.hpp"

/**
 * @file statistics_engine.hpp
 * @brief Cross-formula statistics over the `total` series of a run.
 *
 * Missing values (NaN or Inf) are handled pairwise-complete: each pair of
 * formulas is compared on the timesteps where both are finite. Matrices
 * are computed once per unordered pair and mirrored, so they are exactly
 * symmetric.
 */

namespace petc
{

struct FormulaSummary
{
    std::string formula;
    std::size_t count = 0;
    double mean = 0.0;
    double std_dev = 0.0;
    double cv = 0.0;
    double min_value = 0.0;
    double p25 = 0.0;
    double median = 0.0;
    double p75 = 0.0;
    double max_value = 0.0;
};

/**
 * @brief Square formula-by-formula matrix stored row-major.
 */
class FormulaMatrix
{
public:
    FormulaMatrix() = default;
    FormulaMatrix(std::vector<std::string> labels, double fill);

    std::size_t size() const { return labels_.size(); }
    const std::vector<std::string>& labels() const { return labels_; }

    double at(std::size_t row, std::size_t col) const { return values_[row * labels_.size() + col]; }
    void set(std::size_t row, std::size_t col, double value) { values_[row * labels_.size() + col] = value; }

    /**
     * @brief Looks up a cell by formula names.
     * @throws std::out_of_range for unknown labels.
     */
    double at(const std::string& row, const std::string& col) const;

    bool is_symmetric() const;

private:
    std::size_t index_of(const std::string& label) const;

    std::vector<std::string> labels_;
    std::vector<double> values_;
};

struct StatisticsArtifacts
{
    std::vector<FormulaSummary> summary;
    FormulaMatrix correlation;
    FormulaMatrix mean_abs_difference;

    const FormulaSummary* find_summary(const std::string& formula) const;
};

class StatisticsEngine
{
public:
    std::vector<FormulaSummary> summary(const ResultsTable& table) const;
    FormulaMatrix correlation_matrix(const ResultsTable& table) const;
    FormulaMatrix pairwise_difference_matrix(const ResultsTable& table) const;

    /**
     * @brief Computes all three artifacts.
     */
    StatisticsArtifacts compute(const ResultsTable& table) const;
};

/**
 * @brief Summarizes one series over its finite values.
 */
FormulaSummary summarize_series(const std::string& name, const std::vector<double>& values);

/**
 * @brief Pearson correlation over pairwise-complete samples.
 * @return NaN with fewer than two common samples or a zero-variance side.
 */
double pearson_pairwise(const std::vector<double>& a, const std::vector<double>& b);

/**
 * @brief Mean absolute difference over pairwise-complete samples.
 * @return NaN when no sample is finite on both sides.
 */
double mean_abs_difference_pairwise(const std::vector<double>& a, const std::vector<double>& b);

} // namespace petc
