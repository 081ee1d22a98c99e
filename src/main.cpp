/**
 * @file main.cpp
 * @brief risk_engine_cli: factor risk report for a configured portfolio
 *
 * Loads a configuration file and its price history, prints the variance
 * breakdown, limit verdicts and score, and optionally runs the optimizer.
 *
 * Exit codes: 0 success, 1 usage or unexpected error, 2 configuration
 * error, 3 insufficient market data, 4 optimizer result not usable
 * (only with --require-feasible).
 */

#include "core/errors.hpp"
#include "data/data_loader.hpp"
#include "data/market_data_provider.hpp"
#include "engine/risk_engine.hpp"
#include "optimizer/optimizer_interface.hpp"
#include "risk/risk_scorer.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <exception>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

using namespace riskengine;

namespace
{
    enum ExitCode
    {
        kOk = 0,
        kUsage = 1,
        kBadConfig = 2,
        kBadData = 3,
        kNotFeasible = 4
    };

    struct Options
    {
        std::string config_path;
        std::string output_path;
        std::string objective;
        bool require_feasible = false;
        bool verbose = false;
        bool help = false;
    };

    void usage(const char *program)
    {
        std::cout << "Usage: " << program << " --config PATH [OPTIONS]\n\n"
                  << "  --config PATH          Configuration JSON (required)\n"
                  << "  --optimize OBJECTIVE   min_variance or max_return; overrides the file\n"
                  << "  --require-feasible     Exit with 4 unless the optimizer result is authoritative\n"
                  << "  --output PATH          Write analysis, score and optimization as JSON\n"
                  << "  --verbose              Debug logging\n"
                  << "  --help, -h             This text\n";
    }

    bool parse_options(int argc, char *argv[], Options &opts)
    {
        for (int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i];
            const bool has_value = i + 1 < argc;

            if (arg == "--help" || arg == "-h")
                opts.help = true;
            else if (arg == "--config" && has_value)
                opts.config_path = argv[++i];
            else if (arg == "--output" && has_value)
                opts.output_path = argv[++i];
            else if (arg == "--optimize" && has_value)
                opts.objective = argv[++i];
            else if (arg == "--require-feasible")
                opts.require_feasible = true;
            else if (arg == "--verbose")
                opts.verbose = true;
            else
            {
                std::cerr << "Unrecognized argument: " << arg << "\n";
                return false;
            }
        }
        return opts.help || !opts.config_path.empty();
    }

    void rule(const std::string &title)
    {
        std::cout << "\n"
                  << title << "\n"
                  << std::string(64, '=') << "\n";
    }

    std::string pct(double fraction)
    {
        std::ostringstream s;
        s << std::fixed << std::setprecision(2) << fraction * 100.0 << "%";
        return s.str();
    }

    void report_analysis(const risk::RiskAnalysisResult &a)
    {
        rule("Risk analysis " + a.window.start_date + " .. " + a.window.end_date +
             " (valued " + a.valuation_date + ")");

        std::cout << std::fixed << std::setprecision(2)
                  << "value " << a.total_value
                  << "   volatility " << pct(a.decomposition.volatility)
                  << "   systematic " << pct(a.decomposition.factor_share)
                  << "   idiosyncratic " << pct(a.decomposition.idiosyncratic_share) << "\n"
                  << std::setprecision(3)
                  << "leverage " << a.leverage << "   herfindahl " << a.herfindahl << "\n\n";

        std::cout << std::left << std::setw(10) << "holding" << std::right
                  << std::setw(12) << "weight" << std::setw(12) << "risk" << "\n";
        for (size_t i = 0; i < a.tickers.size(); ++i)
        {
            std::cout << std::left << std::setw(10) << a.tickers[i] << std::right
                      << std::setw(12) << pct(a.weights(static_cast<Eigen::Index>(i)))
                      << std::setw(12) << pct(a.holding_contributions[i].percent) << "\n";
        }

        std::cout << "\n"
                  << std::left << std::setw(10) << "factor" << std::right
                  << std::setw(12) << "beta" << std::setw(12) << "risk" << "\n";
        for (size_t f = 0; f < a.factor_names.size(); ++f)
        {
            std::cout << std::left << std::setw(10) << a.factor_names[f] << std::right
                      << std::setw(12) << std::setprecision(3)
                      << a.decomposition.portfolio_betas(static_cast<Eigen::Index>(f))
                      << std::setw(12) << pct(a.factor_contributions[f].percent) << "\n";
        }

        std::cout << "\n";
        for (const auto &v : a.verdicts)
        {
            std::cout << std::left << std::setw(6) << risk::to_string(v.status) << std::right
                      << v.rule_name << " [" << v.subject << "] " << std::setprecision(4)
                      << v.current_value << " / " << v.limit_value << "\n";
        }
        if (a.verdicts.empty())
        {
            std::cout << "no limits configured\n";
        }
    }

    void report_score(const risk::RiskScoreResult &score)
    {
        rule("Risk score");
        std::cout << std::fixed << std::setprecision(1) << score.score << " / 100, "
                  << risk::to_string(score.category) << ": " << score.interpretation << "\n";
        for (const auto &sub : score.sub_scores)
        {
            std::cout << "  " << std::left << std::setw(24) << sub.first << std::right << sub.second << "\n";
        }
        for (const auto &advice : score.recommendations)
        {
            std::cout << "  * " << advice << "\n";
        }
    }

    int run(const Options &opts)
    {
        const auto started = std::chrono::steady_clock::now();

        auto config = data::DataLoader::load_config(opts.config_path);
        if (!opts.objective.empty())
        {
            config.objective = optimizer::objective_from_string(opts.objective);
        }

        auto prices = data::DataLoader::load_csv(config.data.data_file);
        spdlog::info("Loaded {} dates x {} tickers from {}", prices.num_dates(), prices.num_assets(),
                     config.data.data_file);

        engine::RiskEngine engine(std::make_shared<data::HistoricalMarketDataProvider>(std::move(prices)),
                                  config.engine);

        const auto analysis = engine.analyze_portfolio(config.portfolio, config.proxies, config.limits);
        report_analysis(*analysis);

        const auto score = engine.score_portfolio(*analysis);
        report_score(score);

        nlohmann::json out = {{"analysis", analysis->to_json()}, {"score", score.to_json()}};

        int code = kOk;
        if (config.objective)
        {
            rule("Optimization: " + optimizer::to_string(*config.objective));
            const auto result = engine.optimize_portfolio(config.portfolio, *config.objective,
                                                          config.limits, config.optimization);
            result.print_summary();
            out["optimization"] = result.to_json();

            if (opts.require_feasible)
            {
                try
                {
                    result.require_feasible();
                }
                catch (const std::runtime_error &e)
                {
                    std::cerr << "Optimizer result rejected: " << e.what() << "\n";
                    code = kNotFeasible;
                }
            }
        }

        if (!opts.output_path.empty())
        {
            std::ofstream file(opts.output_path);
            if (!file)
            {
                throw ConfigurationError("Cannot write report to " + opts.output_path);
            }
            file << out.dump(2) << "\n";
        }

        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        std::cout << "\n"
                  << analysis->failed_verdicts() << " limit breach(es), " << elapsed.count() << " ms\n";
        return code;
    }
} // namespace

int main(int argc, char *argv[])
{
    Options opts;
    if (!parse_options(argc, argv, opts))
    {
        usage(argv[0]);
        return kUsage;
    }
    if (opts.help)
    {
        usage(argv[0]);
        return kOk;
    }

    spdlog::set_level(opts.verbose ? spdlog::level::debug : spdlog::level::warn);

    try
    {
        return run(opts);
    }
    catch (const ConfigurationError &e)
    {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return kBadConfig;
    }
    catch (const DataInsufficientError &e)
    {
        std::cerr << "Insufficient data: " << e.what() << "\n";
        return kBadData;
    }
    catch (const DataUnavailable &e)
    {
        std::cerr << "Market data unavailable: " << e.what() << "\n";
        return kBadData;
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return kUsage;
    }
}
