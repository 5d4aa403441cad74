#include "comparison.hpp"
#include "forcing_io.hpp"
#include "formulas/factory.hpp"
#include "runtime_config.hpp"
#include "runtime_log.hpp"
#include "test_fixtures.hpp"

#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace
{

int expect_true(bool cond, const std::string& message)
{
    if (!cond)
    {
        std::cerr << "[config-io] FAIL: " << message << std::endl;
        return 1;
    }
    return 0;
}

std::filesystem::path scratch_directory()
{
    const std::filesystem::path dir = std::filesystem::temp_directory_path() / "petc_config_io_test";
    std::filesystem::create_directories(dir);
    return dir;
}

std::string read_file(const std::filesystem::path& path)
{
    std::ifstream in(path);
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

template <typename Fn>
std::string runtime_error_message(Fn&& fn)
{
    try
    {
        fn();
    }
    catch (const std::runtime_error& e)
    {
        return e.what();
    }
    return "";
}

int test_config_values()
{
    int failures = 0;
    using namespace petc;

    ComparisonConfig config;
    apply_config_values({{"logging.profile", "debug"},
                         {"engine.parallel", "yes"},
                         {"engine.threads", "3"},
                         {"partition.tolerance", "0.05"},
                         {"validation.mode", "strict"},
                         {"output.directory", "out/run1"},
                         {"validation.bounds.T_mean.max", "45"},
                         {"formula.priestley_taylor.alpha", "1.3"}},
                        config);
    failures += expect_true(config.log_profile == LogProfile::debug, "logging.profile applied");
    failures += expect_true(config.execution.parallel && config.execution.num_threads == 3, "engine keys applied");
    failures += expect_true(config.partition_tolerance == 0.05, "partition.tolerance applied");
    failures += expect_true(config.validation.mode == GuardMode::Strict, "validation.mode applied");
    failures += expect_true(config.output_directory == "out/run1", "output.directory applied");
    const auto bounds = config.validation.bounds_overrides.find("temperature");
    failures += expect_true(bounds != config.validation.bounds_overrides.end() && bounds->second.has_max &&
                                bounds->second.max_value == 45.0 && bounds->second.has_min &&
                                bounds->second.min_value == -60.0,
                            "bounds override resolves aliases and keeps the contract minimum");
    failures += expect_true(config.formula_options["priestley_taylor"]["alpha"] == 1.3, "formula option collected");

    ComparisonConfig defaults;
    apply_config_values({{"engine.threads", "-2"},
                         {"partition.tolerance", "abc"},
                         {"validation.mode", "loud"},
                         {"output.directory", ""},
                         {"formula.pml.vpd_scale", "wide"}},
                        defaults);
    failures += expect_true(defaults.execution.num_threads == 0, "invalid thread count keeps default");
    failures += expect_true(defaults.partition_tolerance == 0.01, "invalid tolerance keeps default");
    failures += expect_true(defaults.validation.mode == GuardMode::Report, "invalid guard mode keeps default");
    failures += expect_true(defaults.output_directory == "comparison_output", "empty directory keeps default");
    failures += expect_true(defaults.formula_options.empty(), "non-numeric formula options are dropped");

    int parsed = 0;
    failures += expect_true(!try_parse_int_value("12x", parsed), "trailing characters reject integers");
    double value = 0.0;
    failures += expect_true(!try_parse_double_value("inf", value), "non-finite doubles are rejected");
    return failures;
}

int test_config_file()
{
    int failures = 0;
    const std::filesystem::path path = scratch_directory() / "comparison.yaml";
    {
        std::ofstream out(path);
        out << "# comparison settings\n"
            << "logging:\n"
            << "  profile: quiet\n"
            << "engine:\n"
            << "  parallel: true   # use OpenMP\n"
            << "output:\n"
            << "  directory: \"results dir\"\n"
            << "formula:\n"
            << "  hamon:\n"
            << "    coefficient: 1.1\n";
    }

    const auto values = petc::parse_yaml_simple(path.string());
    failures += expect_true(values.count("logging.profile") == 1 && values.at("logging.profile") == "quiet",
                            "nested sections flatten to dotted keys");
    failures += expect_true(values.at("engine.parallel") == "true", "inline comments are stripped");
    failures += expect_true(values.at("formula.hamon.coefficient") == "1.1", "three-level keys flatten");

    const petc::ComparisonConfig config = petc::load_comparison_config(path.string());
    failures += expect_true(config.output_directory == "results dir", "quoted values are unwrapped");
    failures += expect_true(config.execution.parallel, "parallel flag loaded");
    failures += expect_true(petc::global_log_profile == petc::LogProfile::quiet,
                            "loading a config sets the process log profile");

    const petc::FormulaRegistry registry = petc::build_formula_registry(config.formula_options);
    failures += expect_true(registry.find("hamon")->resolved_parameters().get("coefficient") == 1.1,
                            "file options reach the registry");

    failures += expect_true(!runtime_error_message([] { (void)petc::parse_yaml_simple("/nonexistent/petc.yaml"); })
                                 .empty(),
                            "missing config files raise");
    return failures;
}

int test_log_profile_sources()
{
    int failures = 0;
    petc::set_log_profile(petc::LogProfile::quiet);

    ::unsetenv("PETC_LOG_PROFILE");
    failures += expect_true(!petc::apply_log_profile_from_environment(), "unset environment changes nothing");
    failures += expect_true(petc::global_log_profile == petc::LogProfile::quiet, "profile kept without override");

    ::setenv("PETC_LOG_PROFILE", "loud", 1);
    failures += expect_true(!petc::apply_log_profile_from_environment(), "invalid environment value is rejected");
    failures += expect_true(petc::global_log_profile == petc::LogProfile::quiet, "invalid value keeps profile");

    ::setenv("PETC_LOG_PROFILE", "debug", 1);
    failures += expect_true(petc::apply_log_profile_from_environment(), "valid environment value is applied");
    failures += expect_true(petc::log_debug_enabled(), "environment enables debug logging");

    const std::filesystem::path path = scratch_directory() / "no_profile.yaml";
    {
        std::ofstream out(path);
        out << "partition:\n"
            << "  tolerance: 0.02\n";
    }

    std::ostringstream captured;
    std::streambuf* previous = std::cout.rdbuf(captured.rdbuf());
    const petc::ComparisonConfig config = petc::load_comparison_config(path.string());
    std::cout.rdbuf(previous);

    failures += expect_true(config.log_profile == petc::LogProfile::debug,
                            "environment profile holds when the file names none");
    failures += expect_true(captured.str().find("Partition tolerance: 0.02") != std::string::npos,
                            "loaded configuration is printed");

    ::setenv("PETC_LOG_PROFILE", "normal", 1);
    const petc::ComparisonConfig defaults = petc::load_comparison_config("");
    failures += expect_true(defaults.log_profile == petc::LogProfile::normal,
                            "empty path still picks up the environment profile");

    petc::set_log_profile(petc::LogProfile::quiet);
    captured.str("");
    previous = std::cout.rdbuf(captured.rdbuf());
    petc::print_comparison_config(config);
    std::cout.rdbuf(previous);
    failures += expect_true(captured.str().empty(), "quiet profile suppresses the configuration dump");

    ::unsetenv("PETC_LOG_PROFILE");
    return failures;
}

int test_csv_loading()
{
    int failures = 0;
    const std::string csv =
        "date,T_mean,RH,u2,Rn,LAI,station_flag\r\n"
        "2020-07-01,20.0,60,2.5,15,3.0,1\r\n"
        "2020-07-02,22.0,NA,3.0,18,,1\r\n"
        "\n"
        "2020-07-03,25.0,70,2.0,nan,3.2,1\r\n";
    const petc::ForcingDataset data = petc::parse_forcing_csv(csv, "inline.csv");

    failures += expect_true(data.num_timesteps() == 3, "three rows loaded; blank lines skipped");
    const std::vector<std::string> expected = {"temperature", "relative_humidity", "wind_speed", "net_radiation",
                                               "lai", "station_flag"};
    failures += expect_true(data.variable_names() == expected, "aliases canonicalize; unknown names pass through");
    failures += expect_true(data.timestamps()[2] == "2020-07-03", "timestamps are kept verbatim");
    failures += expect_true(std::isnan(data.series("relative_humidity")[1]), "NA loads as NaN");
    failures += expect_true(std::isnan(data.series("lai")[1]), "empty cells load as NaN");
    failures += expect_true(std::isnan(data.series("net_radiation")[2]), "nan loads as NaN");
    failures += expect_true(data.series("wind_speed")[1] == 3.0, "numbers parse");

    const std::string bad_number = runtime_error_message([] {
        (void)petc::parse_forcing_csv("timestamp,T_mean\nd1,20\nd2,2O.5\n", "bad.csv");
    });
    failures += expect_true(bad_number.find("bad.csv:3") != std::string::npos &&
                                bad_number.find("T_mean") != std::string::npos,
                            "malformed numbers report file, line and column");

    const std::string short_row = runtime_error_message([] {
        (void)petc::parse_forcing_csv("timestamp,T_mean,RH\nd1,20\n", "short.csv");
    });
    failures += expect_true(short_row.find("short.csv:2") != std::string::npos, "column count mismatch reported");

    const std::string no_time = runtime_error_message([] {
        (void)petc::parse_forcing_csv("T_mean,RH\n20,60\n", "notime.csv");
    });
    failures += expect_true(!no_time.empty(), "the first column must be the timestamp");

    const std::string duplicate = runtime_error_message([] {
        (void)petc::parse_forcing_csv("timestamp,T_mean,tair\nd1,20,21\n", "dup.csv");
    });
    failures += expect_true(duplicate.find("Duplicate") != std::string::npos,
                            "two aliases of one variable collide");

    failures += expect_true(!runtime_error_message([] { (void)petc::load_forcing_csv("/nonexistent/forcing.csv"); })
                                 .empty(),
                            "missing forcing files raise");
    return failures;
}

int test_pipeline_and_outputs()
{
    int failures = 0;
    const petc::FormulaRegistry& registry = petc::default_formula_registry();
    petc::ComparisonConfig config;

    const petc::ComparisonReport report = petc::run_comparison(petc_test::full_dataset(40), registry, config);
    failures += expect_true(report.validation.missing_core.empty(), "full dataset has every core variable");
    failures += expect_true(report.outcome.results.size() == registry.size(), "the whole catalog ran");
    failures += expect_true(report.components.size() == 4, "four partitioned formulas");
    failures += expect_true(report.statistics.summary.size() == registry.size(), "one summary per formula");

    const std::filesystem::path out_dir = scratch_directory() / "outputs";
    std::filesystem::remove_all(out_dir);
    petc::write_comparison_outputs(report, out_dir.string());

    const std::string results = read_file(out_dir / "results.csv");
    failures += expect_true(results.rfind("timestamp,penman_monteith,penman_monteith_general", 0) == 0,
                            "results.csv header follows registration order");
    const std::string components = read_file(out_dir / "components.csv");
    failures += expect_true(components.find("pt_jpl_partition.canopy_evaporation") != std::string::npos,
                            "components.csv names formula.component columns");
    const std::string json = read_file(out_dir / "statistics.json");
    failures += expect_true(json.find("\"mean_abs_difference\"") != std::string::npos, "statistics.json matrices");
    failures += expect_true(json.find("\"statuses\"") != std::string::npos, "statistics.json statuses");

    // Skipped formulas and undefined correlations are serialized, not dropped.
    const petc::ComparisonReport core = petc::run_comparison(petc_test::core_dataset(), registry, config);
    const std::string core_json = petc::statistics_to_json(core.statistics, core.outcome);
    failures += expect_true(core_json.find("\"missing: lai\"") != std::string::npos, "skip reasons in JSON");

    petc::ComparisonConfig strict;
    strict.validation.mode = petc::GuardMode::Strict;
    const petc::ForcingDataset hot =
        petc_test::core_dataset().with_variable("temperature", {20.0, 75.0, 25.0});
    const std::string refused = runtime_error_message([&] { (void)petc::run_comparison(hot, registry, strict); });
    failures += expect_true(refused.find("Strict forcing validation failed") == 0,
                            "strict validation refuses to run");
    const petc::ComparisonReport reported = petc::run_comparison(hot, registry, config);
    failures += expect_true(!reported.validation.failed && !reported.outcome.results.empty(),
                            "report mode runs despite violations");
    return failures;
}

int test_co2_sensitivity()
{
    int failures = 0;
    const petc::FormulaRegistry& registry = petc::default_formula_registry();
    const petc::ComparisonConfig config;
    const petc::ForcingDataset data = petc_test::full_dataset(30).without_variable("co2");

    const std::vector<petc::ScenarioResult> scenarios =
        petc::run_co2_sensitivity(data, registry, {380.0, 550.0, 700.0}, config);
    failures += expect_true(scenarios.size() == 3 && scenarios[1].co2_ppm == 550.0, "scenario order preserved");
    failures += expect_true(!data.has_variable("co2"), "scenarios never modify the source dataset");

    const auto find_mean = [](const petc::ScenarioResult& scenario, const std::string& name)
    {
        for (const auto& mean : scenario.means)
        {
            if (mean.formula == name)
            {
                return mean.mean_total;
            }
        }
        return std::nan("");
    };
    failures += expect_true(find_mean(scenarios[2], "pm_co2") < find_mean(scenarios[0], "pm_co2"),
                            "pm_co2 mean falls as CO2 rises");
    failures += expect_true(find_mean(scenarios[2], "priestley_taylor") == find_mean(scenarios[0], "priestley_taylor"),
                            "CO2-insensitive formulas are unchanged");

    const std::vector<petc::FormulaMean> per_100 = petc::co2_sensitivity_per_100ppm(scenarios);
    failures += expect_true(per_100.size() == scenarios[0].means.size(), "one sensitivity per formula");
    for (const auto& entry : per_100)
    {
        if (entry.formula == "pm_co2")
        {
            failures += expect_true(entry.mean_total < 0.0, "pm_co2 sensitivity is negative");
        }
        if (entry.formula == "hamon")
        {
            failures += expect_true(entry.mean_total == 0.0, "hamon does not respond to CO2");
        }
    }
    failures += expect_true(petc::co2_sensitivity_per_100ppm({scenarios[0]}).empty(),
                            "a single scenario has no sensitivity");
    return failures;
}

} // namespace

int main()
{
    petc::set_log_profile(petc::LogProfile::quiet);

    int failures = 0;
    failures += test_config_values();
    failures += test_config_file();
    failures += test_log_profile_sources();
    petc::set_log_profile(petc::LogProfile::quiet);
    failures += test_csv_loading();
    failures += test_pipeline_and_outputs();
    failures += test_co2_sensitivity();
    petc::reset_log_profile();

    if (failures > 0)
    {
        std::cerr << "[config-io] FAILED with " << failures << " check(s)." << std::endl;
        return 1;
    }

    std::cout << "[config-io] all checks passed" << std::endl;
    return 0;
}
