#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include "stock_advisor/core/logger.hpp"
#include "stock_advisor/data/snapshot_provider.hpp"
#include "stock_advisor/portfolio/portfolio_advisor.hpp"

using namespace stock_advisor;

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program
              << " --snapshot <snapshot.json> [--history <closes.csv>] [--config <advisor.json>]"
              << " (--request <request.json> | --amount <usd> --strategy <name>"
              << " [--strategy <name>])" << std::endl;
}

int fail(const AdvisorError& error) {
    std::cout << error_to_json(error).dump(2) << std::endl;
    return 1;
}

}  // namespace

int main(int argc, char* argv[]) {
    std::optional<std::string> config_path;
    std::optional<std::string> snapshot_path;
    std::optional<std::string> history_path;
    std::optional<std::string> request_path;
    std::optional<double> amount;
    std::vector<std::string> strategies;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        }
        if (i + 1 >= argc) {
            print_usage(argv[0]);
            return 2;
        }

        std::string value = argv[++i];
        if (arg == "--config") {
            config_path = value;
        } else if (arg == "--snapshot") {
            snapshot_path = value;
        } else if (arg == "--history") {
            history_path = value;
        } else if (arg == "--request") {
            request_path = value;
        } else if (arg == "--amount") {
            auto parsed = PortfolioRequest::parse_amount(value);
            if (parsed.is_error()) {
                std::cerr << parsed.error()->what() << std::endl;
                return 2;
            }
            amount = parsed.value();
        } else if (arg == "--strategy") {
            strategies.push_back(value);
        } else {
            print_usage(argv[0]);
            return 2;
        }
    }

    if (!snapshot_path || (!request_path && !amount)) {
        print_usage(argv[0]);
        return 2;
    }

    AdvisorConfig config;
    if (config_path) {
        auto loaded = config.load_from_file(*config_path);
        if (loaded.is_error()) {
            return fail(*loaded.error());
        }
    }

    try {
        Logger::instance().initialize(config.logger);
    } catch (const std::exception& e) {
        std::cerr << "ERROR: Logger initialization failed: " << e.what() << std::endl;
        return 1;
    }
    Logger::register_component("suggest_portfolio");

    PortfolioRequest request;
    if (request_path) {
        std::ifstream file(*request_path);
        if (!file.is_open()) {
            return fail(AdvisorError(ErrorCode::FILE_NOT_FOUND,
                                     "Failed to open request: " + *request_path, "main"));
        }

        nlohmann::json j;
        try {
            file >> j;
        } catch (const nlohmann::json::parse_error& e) {
            return fail(AdvisorError(ErrorCode::JSON_PARSE_ERROR,
                                     std::string("Malformed request: ") + e.what(), "main"));
        }

        auto parsed = PortfolioRequest::parse(j);
        if (parsed.is_error()) {
            return fail(*parsed.error());
        }
        request = parsed.value();
    } else {
        request.investment_amount = *amount;
        request.strategies = strategies;
    }

    auto provider = SnapshotMarketDataProvider::load(*snapshot_path, history_path);
    if (provider.is_error()) {
        ERROR("Failed to load market snapshot: " << provider.error()->what());
        return fail(*provider.error());
    }

    PortfolioAdvisor advisor(config, provider.value());
    auto suggestion = advisor.suggest(request);
    if (suggestion.is_error()) {
        ERROR(suggestion.error()->to_string());
        return fail(*suggestion.error());
    }

    std::cout << suggestion.value().to_json().dump(2) << std::endl;
    return 0;
}
