/**
 * @file data_loader.cpp
 * @brief Implementation of DataLoader class and configuration structures
 */

#include "data/data_loader.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <limits>
#include <map>
#include <set>

namespace riskengine
{
    namespace data
    {

        // =============================================
        // Configuration Structures - from_json Methods
        // =============================================

        DataConfig DataConfig::from_json(const nlohmann::json &j)
        {
            DataConfig config;
            config.data_file = j.value("data_file", "");
            config.start_date = j.value("start_date", "");
            config.end_date = j.value("end_date", "");
            config.valuation_date = j.value("valuation_date", "");
            if (config.data_file.empty())
            {
                throw ConfigurationError("data.data_file is required");
            }
            return config;
        }

        ApplicationConfig ApplicationConfig::from_json(const nlohmann::json &j, const std::string &base_dir)
        {
            if (!j.is_object())
            {
                throw ConfigurationError("Configuration must be a JSON object");
            }

            ApplicationConfig config;
            try
            {
                config.data = DataConfig::from_json(j.value("data", nlohmann::json::object()));

                std::filesystem::path data_path(config.data.data_file);
                if (data_path.is_relative() && !base_dir.empty() && !std::filesystem::exists(data_path))
                {
                    config.data.data_file = (std::filesystem::path(base_dir) / data_path).string();
                }

                // The portfolio window defaults to the data section
                nlohmann::json portfolio_json = j.value("portfolio", nlohmann::json::object());
                if (!portfolio_json.contains("start_date"))
                    portfolio_json["start_date"] = config.data.start_date;
                if (!portfolio_json.contains("end_date"))
                    portfolio_json["end_date"] = config.data.end_date;
                if (!portfolio_json.contains("valuation_date"))
                    portfolio_json["valuation_date"] = config.data.valuation_date;
                config.portfolio = portfolio::Portfolio::from_json(portfolio_json);
                config.portfolio.validate();

                if (!j.contains("factor_proxies"))
                {
                    throw ConfigurationError("Configuration has no factor_proxies section");
                }
                config.proxies = portfolio::FactorProxySet::from_json(j.at("factor_proxies"));
                config.proxies.validate();

                config.limits = risk::RiskLimitSet::from_json(j.value("risk_limits", nlohmann::json::object()));
                config.engine = engine::RiskEngineConfig::from_json(j.value("engine", nlohmann::json::object()));

                const nlohmann::json opt = j.value("optimization", nlohmann::json::object());
                if (opt.contains("objective") && !opt["objective"].is_null())
                {
                    config.objective = optimizer::objective_from_string(opt["objective"].get<std::string>());
                }
                config.optimization = engine::OptimizationSettings::from_json(opt);
                config.optimization.proxies = config.proxies;
            }
            catch (const nlohmann::json::exception &e)
            {
                throw ConfigurationError(std::string("Invalid configuration: ") + e.what());
            }
            return config;
        }

        namespace
        {
            std::string trim(const std::string &s)
            {
                const auto first = s.find_first_not_of(" \t\r\n");
                if (first == std::string::npos)
                {
                    return "";
                }
                return s.substr(first, s.find_last_not_of(" \t\r\n") - first + 1);
            }

            // Quoted fields may contain commas; quotes are dropped
            std::vector<std::string> split_fields(const std::string &line)
            {
                std::vector<std::string> fields(1);
                bool quoted = false;
                for (char c : line)
                {
                    if (c == '"')
                        quoted = !quoted;
                    else if (c == ',' && !quoted)
                        fields.emplace_back();
                    else
                        fields.back() += c;
                }
                for (auto &f : fields)
                {
                    f = trim(f);
                }
                return fields;
            }

            bool is_iso_date(const std::string &s)
            {
                if (s.size() != 10 || s[4] != '-' || s[7] != '-')
                {
                    return false;
                }
                for (size_t i = 0; i < s.size(); ++i)
                {
                    if (i != 4 && i != 7 && !std::isdigit(static_cast<unsigned char>(s[i])))
                    {
                        return false;
                    }
                }
                return true;
            }

            double parse_price(const std::string &cell)
            {
                const double missing = std::numeric_limits<double>::quiet_NaN();
                if (cell.empty())
                {
                    return missing;
                }
                char *end = nullptr;
                const double value = std::strtod(cell.c_str(), &end);
                return (end == cell.c_str() + cell.size()) ? value : missing;
            }

            struct CsvTable
            {
                std::vector<std::string> header;
                std::vector<std::vector<std::string>> rows; ///< Rows with a valid date in column 0
            };

            CsvTable read_table(const std::string &filepath, size_t min_fields)
            {
                std::ifstream in(filepath);
                if (!in)
                {
                    throw DataUnavailable("Cannot open price file " + filepath);
                }

                CsvTable table;
                std::string line;
                if (!std::getline(in, line))
                {
                    throw DataUnavailable("Price file " + filepath + " is empty");
                }
                table.header = split_fields(line);
                if (table.header.front() != "date")
                {
                    throw DataUnavailable("First column of " + filepath + " must be 'date'");
                }

                size_t skipped = 0;
                while (std::getline(in, line))
                {
                    if (trim(line).empty())
                    {
                        continue;
                    }
                    auto fields = split_fields(line);
                    if (fields.size() < min_fields || !is_iso_date(fields.front()))
                    {
                        ++skipped;
                        continue;
                    }
                    table.rows.push_back(std::move(fields));
                }

                if (skipped > 0)
                {
                    spdlog::warn("Skipped {} malformed rows in {}", skipped, filepath);
                }
                if (table.rows.empty())
                {
                    throw DataUnavailable("No dated rows in " + filepath);
                }
                return table;
            }

            bool wanted(const std::vector<std::string> &tickers, const std::string &ticker)
            {
                return tickers.empty() || std::find(tickers.begin(), tickers.end(), ticker) != tickers.end();
            }
        } // namespace

        MarketData DataLoader::load_csv_wide(const std::string &filepath,
                                             const std::vector<std::string> &tickers)
        {
            const CsvTable table = read_table(filepath, 2);

            // Header position of every kept column, in file order
            std::vector<size_t> fields;
            std::vector<std::string> kept;
            for (size_t f = 1; f < table.header.size(); ++f)
            {
                if (wanted(tickers, table.header[f]))
                {
                    fields.push_back(f);
                    kept.push_back(table.header[f]);
                }
            }
            if (kept.empty())
            {
                throw DataUnavailable("None of the requested tickers are columns of " + filepath);
            }

            Eigen::MatrixXd prices(static_cast<Eigen::Index>(table.rows.size()), static_cast<Eigen::Index>(kept.size()));
            std::vector<std::string> dates;
            dates.reserve(table.rows.size());
            for (size_t r = 0; r < table.rows.size(); ++r)
            {
                const auto &row = table.rows[r];
                dates.push_back(row.front());
                for (size_t c = 0; c < fields.size(); ++c)
                {
                    prices(static_cast<Eigen::Index>(r), static_cast<Eigen::Index>(c)) =
                        fields[c] < row.size() ? parse_price(row[fields[c]]) : std::numeric_limits<double>::quiet_NaN();
                }
            }

            return MarketData(std::move(prices), std::move(dates), std::move(kept));
        }

        MarketData DataLoader::load_csv_long(const std::string &filepath,
                                             const std::vector<std::string> &tickers)
        {
            const CsvTable table = read_table(filepath, 3);

            std::map<std::string, std::map<std::string, double>> by_date;
            std::set<std::string> seen;
            for (const auto &row : table.rows)
            {
                if (wanted(tickers, row[1]))
                {
                    by_date[row[0]][row[1]] = parse_price(row[2]);
                    seen.insert(row[1]);
                }
            }
            if (seen.empty())
            {
                throw DataUnavailable("None of the requested tickers appear in " + filepath);
            }

            std::vector<std::string> dates;
            std::vector<std::string> columns(seen.begin(), seen.end());
            Eigen::MatrixXd prices = Eigen::MatrixXd::Constant(static_cast<Eigen::Index>(by_date.size()),
                                                               static_cast<Eigen::Index>(columns.size()),
                                                               std::numeric_limits<double>::quiet_NaN());
            for (const auto &day : by_date)
            {
                const auto r = static_cast<Eigen::Index>(dates.size());
                dates.push_back(day.first);
                for (const auto &quote : day.second)
                {
                    const auto c = std::lower_bound(columns.begin(), columns.end(), quote.first) - columns.begin();
                    prices(r, c) = quote.second;
                }
            }

            return MarketData(std::move(prices), std::move(dates), std::move(columns));
        }

        MarketData DataLoader::load_csv(const std::string &filepath,
                                        const std::vector<std::string> &tickers)
        {
            std::ifstream in(filepath);
            std::string line;
            if (!in || !std::getline(in, line))
            {
                throw DataUnavailable("Cannot read header of " + filepath);
            }

            const auto header = split_fields(line);
            const bool long_layout = header.size() == 3 && (header[1] == "ticker" || header[1] == "symbol");
            return long_layout ? load_csv_long(filepath, tickers) : load_csv_wide(filepath, tickers);
        }

        void DataLoader::save_csv_wide(const MarketData &data, const std::string &filepath)
        {
            std::ofstream out(filepath);
            if (!out)
            {
                throw DataUnavailable("Cannot write price file " + filepath);
            }

            out << "date";
            for (const auto &ticker : data.get_tickers())
            {
                out << ',' << ticker;
            }
            out << '\n' << std::setprecision(10);

            const Eigen::MatrixXd &prices = data.get_prices();
            for (Eigen::Index r = 0; r < prices.rows(); ++r)
            {
                out << data.get_dates()[static_cast<size_t>(r)];
                for (Eigen::Index c = 0; c < prices.cols(); ++c)
                {
                    out << ',';
                    if (!std::isnan(prices(r, c)))
                    {
                        out << prices(r, c);
                    }
                }
                out << '\n';
            }
        }

        // ================
        // JSON Loading
        // ================

        nlohmann::json DataLoader::load_json(const std::string &filepath)
        {
            std::ifstream file(filepath);
            if (!file.is_open())
            {
                throw ConfigurationError("Could not open JSON file: " + filepath);
            }

            nlohmann::json j;
            try
            {
                file >> j;
            }
            catch (const nlohmann::json::exception &e)
            {
                throw ConfigurationError("JSON parsing error in " + filepath + ": " + e.what());
            }
            return j;
        }

        ApplicationConfig DataLoader::load_config(const std::string &config_path)
        {
            const nlohmann::json j = load_json(config_path);
            const std::string base_dir = std::filesystem::path(config_path).parent_path().string();
            return ApplicationConfig::from_json(j, base_dir);
        }

    } // namespace data
} // namespace riskengine
