/**
 * @file forcing_io.cpp
 * @brief CSV forcing loader and comparison output writers.
 */

#include "forcing_io.hpp"

#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "forcing_contract.hpp"
#include "runtime_log.hpp"
#include "string_utils.hpp"

namespace petc
{
namespace
{

bool is_timestamp_column(const std::string& name)
{
    const std::string normalized = strutil::lower_copy(name);
    return normalized == "timestamp" || normalized == "date" || normalized == "time";
}

bool is_missing_token(const std::string& token)
{
    const std::string normalized = strutil::lower_copy(token);
    return normalized.empty() || normalized == "nan" || normalized == "na" || normalized == "n/a" ||
           normalized == "null";
}

std::string location(const std::string& source, std::size_t line_number)
{
    return source + ":" + std::to_string(line_number);
}

/**
 * @brief Formats a value for CSV; non-finite values become empty cells.
 */
void write_csv_value(std::ostream& out, double value)
{
    if (std::isfinite(value))
    {
        out << value;
    }
}

/**
 * @brief Formats a value for JSON; non-finite values become null.
 */
void write_json_number(std::ostream& out, double value)
{
    if (std::isfinite(value))
    {
        out << value;
    }
    else
    {
        out << "null";
    }
}

void write_json_matrix(std::ostream& out, const FormulaMatrix& matrix, const char* indent)
{
    out << "{\n" << indent << "  \"labels\": [";
    for (std::size_t i = 0; i < matrix.size(); ++i)
    {
        if (i > 0) out << ", ";
        out << "\"" << strutil::json_escape(matrix.labels()[i]) << "\"";
    }
    out << "],\n" << indent << "  \"values\": [";
    for (std::size_t i = 0; i < matrix.size(); ++i)
    {
        out << (i > 0 ? ",\n" : "\n") << indent << "    [";
        for (std::size_t j = 0; j < matrix.size(); ++j)
        {
            if (j > 0) out << ", ";
            write_json_number(out, matrix.at(i, j));
        }
        out << "]";
    }
    out << "\n" << indent << "  ]\n" << indent << "}";
}

std::ofstream open_output(const std::string& path)
{
    std::ofstream out(path);
    if (!out)
    {
        throw std::runtime_error("failed to open output file for writing: " + path);
    }
    out << std::setprecision(10);
    return out;
}

void finish_output(std::ofstream& out, const std::string& path)
{
    out.flush();
    if (!out.good())
    {
        throw std::runtime_error("failed to write output file: " + path);
    }
}

} // namespace

ForcingDataset parse_forcing_csv(const std::string& text, const std::string& source)
{
    std::istringstream in(text);
    std::string line;
    std::size_t line_number = 0;

    std::vector<std::string> header;
    while (std::getline(in, line))
    {
        ++line_number;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!strutil::trim_copy(line).empty())
        {
            header = strutil::split_trimmed(line, ',');
            break;
        }
    }
    if (header.empty())
    {
        throw std::runtime_error(source + ": missing CSV header");
    }
    if (!is_timestamp_column(header.front()))
    {
        throw std::runtime_error(location(source, line_number) + ": first column must be timestamp, date or time, got '" +
                                 header.front() + "'");
    }

    std::vector<ForcingVariable> variables;
    for (std::size_t c = 1; c < header.size(); ++c)
    {
        const std::string canonical = canonical_forcing_name(header[c]);
        if (log_debug_enabled() && canonical != header[c])
        {
            std::cout << "[FORCING] column '" << header[c] << "' mapped to " << canonical << std::endl;
        }
        variables.push_back({canonical, {}});
    }

    std::vector<std::string> timestamps;
    while (std::getline(in, line))
    {
        ++line_number;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (strutil::trim_copy(line).empty())
        {
            continue;
        }

        const std::vector<std::string> cells = strutil::split_trimmed(line, ',');
        if (cells.size() != header.size())
        {
            throw std::runtime_error(location(source, line_number) + ": expected " + std::to_string(header.size()) +
                                     " columns, found " + std::to_string(cells.size()));
        }

        timestamps.push_back(cells.front());
        for (std::size_t c = 1; c < cells.size(); ++c)
        {
            double value = std::numeric_limits<double>::quiet_NaN();
            if (!is_missing_token(cells[c]))
            {
                try
                {
                    std::size_t consumed = 0;
                    value = std::stod(cells[c], &consumed);
                    if (consumed != cells[c].size())
                    {
                        throw std::invalid_argument(cells[c]);
                    }
                }
                catch (const std::exception&)
                {
                    throw std::runtime_error(location(source, line_number) + ": malformed number '" + cells[c] +
                                             "' in column '" + header[c] + "'");
                }
            }
            variables[c - 1].values.push_back(value);
        }
    }

    try
    {
        ForcingDataset dataset(std::move(timestamps), std::move(variables));
        if (log_normal_enabled())
        {
            std::cout << "[FORCING] loaded " << dataset.num_variables() << " variable(s) x "
                      << dataset.num_timesteps() << " timestep(s) from " << source << std::endl;
        }
        return dataset;
    }
    catch (const std::invalid_argument& e)
    {
        throw std::runtime_error(source + ": " + e.what());
    }
}

ForcingDataset load_forcing_csv(const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        throw std::runtime_error("Could not open forcing file: " + path);
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return parse_forcing_csv(buffer.str(), path);
}

void write_results_csv(const ResultsTable& table, const std::string& path)
{
    std::ofstream out = open_output(path);
    out << "timestamp";
    for (const auto& entry : table.entries())
    {
        out << "," << entry.formula;
    }
    out << "\n";

    for (std::size_t t = 0; t < table.num_timesteps(); ++t)
    {
        out << table.timestamps()[t];
        for (const auto& entry : table.entries())
        {
            out << ",";
            write_csv_value(out, entry.total[t]);
        }
        out << "\n";
    }
    finish_output(out, path);
}

void write_components_csv(const ResultsTable& table,
                          const std::vector<FormulaComponents>& components,
                          const std::string& path)
{
    std::ofstream out = open_output(path);
    out << "timestamp";
    for (const auto& breakdown : components)
    {
        for (const auto& component : breakdown.components)
        {
            out << "," << breakdown.formula << "." << component.name;
        }
    }
    out << "\n";

    for (std::size_t t = 0; t < table.num_timesteps(); ++t)
    {
        out << table.timestamps()[t];
        for (const auto& breakdown : components)
        {
            for (const auto& component : breakdown.components)
            {
                out << ",";
                write_csv_value(out, component.values[t]);
            }
        }
        out << "\n";
    }
    finish_output(out, path);
}

std::string statistics_to_json(const StatisticsArtifacts& statistics, const RunOutcome& outcome)
{
    std::ostringstream oss;
    oss << std::setprecision(10);
    oss << "{\n";

    oss << "  \"summary\": [";
    for (std::size_t i = 0; i < statistics.summary.size(); ++i)
    {
        const auto& s = statistics.summary[i];
        oss << (i > 0 ? ",\n" : "\n");
        oss << "    {\"formula\": \"" << strutil::json_escape(s.formula) << "\", \"count\": " << s.count;
        const std::pair<const char*, double> fields[] = {
            {"mean", s.mean}, {"std", s.std_dev}, {"cv", s.cv}, {"min", s.min_value}, {"p25", s.p25},
            {"median", s.median}, {"p75", s.p75}, {"max", s.max_value},
        };
        for (const auto& [key, value] : fields)
        {
            oss << ", \"" << key << "\": ";
            write_json_number(oss, value);
        }
        oss << "}";
    }
    oss << "\n  ],\n";

    oss << "  \"correlation\": ";
    write_json_matrix(oss, statistics.correlation, "  ");
    oss << ",\n";

    oss << "  \"mean_abs_difference\": ";
    write_json_matrix(oss, statistics.mean_abs_difference, "  ");
    oss << ",\n";

    oss << "  \"statuses\": [";
    const std::vector<FormulaStatus> statuses = outcome.statuses();
    for (std::size_t i = 0; i < statuses.size(); ++i)
    {
        oss << (i > 0 ? ",\n" : "\n");
        oss << "    {\"formula\": \"" << strutil::json_escape(statuses[i].formula) << "\", \"status\": \""
            << to_string(statuses[i].kind) << "\", \"reason\": \"" << strutil::json_escape(statuses[i].reason)
            << "\"}";
    }
    oss << "\n  ],\n";

    oss << "  \"warnings\": [";
    bool first = true;
    for (const auto& entry : outcome.results.entries())
    {
        for (const auto& warning : entry.warnings)
        {
            oss << (first ? "\n" : ",\n");
            first = false;
            oss << "    {\"formula\": \"" << strutil::json_escape(entry.formula) << "\", \"message\": \""
                << strutil::json_escape(warning) << "\"}";
        }
    }
    oss << "\n  ]\n";
    oss << "}\n";
    return oss.str();
}

void write_statistics_json(const StatisticsArtifacts& statistics,
                           const RunOutcome& outcome,
                           const std::string& path)
{
    std::ofstream out = open_output(path);
    out << statistics_to_json(statistics, outcome);
    finish_output(out, path);
}

} // namespace petc
