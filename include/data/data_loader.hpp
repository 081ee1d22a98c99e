/**
 * @file data_loader.hpp
 * @brief Price history and application configuration loading
 *
 * Provides functionality to load market data from CSV files and the
 * engine configuration from JSON files.
 */

#ifndef RISKENGINE_DATA_DATA_LOADER_HPP
#define RISKENGINE_DATA_DATA_LOADER_HPP

#include "data/market_data.hpp"
#include "engine/risk_engine.hpp"
#include "engine/risk_engine_config.hpp"
#include "optimizer/optimizer_interface.hpp"
#include "portfolio/factor_proxy_set.hpp"
#include "portfolio/holding.hpp"
#include "risk/risk_limits.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace riskengine
{
    namespace data
    {

        /**
         * @struct DataConfig
         * @brief Where prices come from and which window to analyse
         */
        struct DataConfig
        {
            std::string data_file;      ///< Wide or long price CSV
            std::string start_date;     ///< Analysis window start (YYYY-MM-DD)
            std::string end_date;       ///< Analysis window end (YYYY-MM-DD)
            std::string valuation_date; ///< Empty means end_date

            static DataConfig from_json(const nlohmann::json &j);
        };

        /**
         * @struct ApplicationConfig
         * @brief Complete configuration file
         */
        struct ApplicationConfig
        {
            DataConfig data;
            portfolio::Portfolio portfolio;
            portfolio::FactorProxySet proxies;
            risk::RiskLimitSet limits;
            engine::RiskEngineConfig engine;
            std::optional<optimizer::ObjectiveType> objective; ///< Set when the file asks for optimization
            engine::OptimizationSettings optimization;

            /**
             * @brief Parse a configuration document
             * @param j Parsed JSON
             * @param base_dir Directory relative data_file paths are resolved against
             * @throws ConfigurationError on missing sections, wrong types or invalid values
             */
            static ApplicationConfig from_json(const nlohmann::json &j, const std::string &base_dir = "");
        };

        /**
         * @class DataLoader
         * @brief Reads price histories and configuration files
         *
         * Two CSV layouts are understood:
         * - wide: @c date,SPY,AAPL,... with one row per date
         * - long: @c date,ticker,price with one row per observation
         *
         * Blank or non-numeric price cells load as NaN. Rows whose date is
         * not YYYY-MM-DD are skipped with a warning.
         */
        class DataLoader
        {
        public:
            /**
             * @param tickers Columns to keep, all when empty
             * @throws DataUnavailable if the file cannot be read, has no date
             *         column, holds no valid rows or none of the requested tickers
             */
            static MarketData load_csv_wide(const std::string &filepath,
                                            const std::vector<std::string> &tickers = {});

            static MarketData load_csv_long(const std::string &filepath,
                                            const std::vector<std::string> &tickers = {});

            /// Picks the layout from the header row
            static MarketData load_csv(const std::string &filepath,
                                       const std::vector<std::string> &tickers = {});

            /// Missing prices are written as empty cells
            static void save_csv_wide(const MarketData &data, const std::string &filepath);

            /// @throws ConfigurationError if the file cannot be read or parsed
            static nlohmann::json load_json(const std::string &filepath);

            /**
             * @brief Parse a configuration file; relative data paths resolve against its directory
             * @throws ConfigurationError on any malformed section
             */
            static ApplicationConfig load_config(const std::string &config_path);
        };

    } // namespace data
} // namespace riskengine

#endif // RISKENGINE_DATA_DATA_LOADER_HPP
