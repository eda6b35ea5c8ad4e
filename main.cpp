#include "config/Settings.hpp"
#include "agtype/AgtypeDecoder.hpp"
#include "errors/Errors.hpp"
#include "graph/GraphRecord.hpp"
#include "postgres/EngineRegistry.hpp"
#include "util/Logger.hpp"
#include <boost/asio/io_context.hpp>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace agegraph;

namespace {

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options] <command> [args]\n"
              << "Commands:\n"
              << "  settings             Print the loaded settings as JSON (password masked)\n"
              << "  query SQL            Run SQL in a transaction and print the decoded rows\n"
              << "Options:\n"
              << "  --env-file PATH      Dotenv file (default: .env)\n"
              << "  --env NAME           Environment: development, testing (default: $AGEGRAPH_ENV or development)\n"
              << "  -l, --log-level LVL  Log level: debug, info, warning, error (overrides APP__LOG_LEVEL)\n"
              << "  -r, --records        query: print vertices and edges instead of raw rows\n"
              << "  -h, --help           Show this help\n";
}

int runQuery(const config::Settings& settings, const std::string& sql, bool asRecords) {
    postgres::EngineRegistry registry(settings.primaryDatabase());
    boost::asio::io_context ioc;
    postgres::ExecutionContext ctx(ioc);

    nlohmann::json output = nlohmann::json::array();
    if (asRecords) {
        auto records = registry.scopedTransaction(ctx, [&sql](postgres::Session& session) {
            return session.fetchRecords(sql);
        });
        for (const auto& record : records) {
            output.push_back(record.toMap());
        }
    } else {
        auto rows = registry.scopedTransaction(ctx, [&sql](postgres::Session& session) {
            return session.execute(sql);
        });
        for (const auto& row : rows) {
            output.push_back(agtype::decodeRow(row).toJson());
        }
    }

    registry.dispose(ctx);
    std::cout << output.dump(2) << std::endl;
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        std::string envFile = config::Settings::DEFAULT_DOTENV;
        std::optional<config::Environment> environment;
        std::optional<util::LogLevel> logLevel;
        bool asRecords = false;
        std::vector<std::string> positional;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--env-file" && i + 1 < argc) {
                envFile = argv[++i];
            } else if (arg == "--env" && i + 1 < argc) {
                environment = config::environmentFromString(argv[++i]);
            } else if ((arg == "-l" || arg == "--log-level") && i + 1 < argc) {
                logLevel = util::Logger::levelFromString(argv[++i]);
            } else if (arg == "-r" || arg == "--records") {
                asRecords = true;
            } else if (arg == "-h" || arg == "--help") {
                printUsage(argv[0]);
                return 0;
            } else if (!arg.empty() && arg[0] == '-') {
                std::cerr << "Error: Unknown option: " << arg << std::endl;
                printUsage(argv[0]);
                return 2;
            } else {
                positional.push_back(arg);
            }
        }

        if (positional.empty()) {
            printUsage(argv[0]);
            return 2;
        }

        auto settings = config::Settings::load(environment, envFile);
        util::Logger::instance().setLevel(logLevel ? *logLevel : settings.app().logLevel);

        const std::string& command = positional[0];
        if (command == "settings") {
            std::cout << settings.toJson().dump(2) << std::endl;
            return 0;
        }
        if (command == "query") {
            if (positional.size() != 2) {
                std::cerr << "Error: query expects exactly one SQL argument" << std::endl;
                return 2;
            }
            return runQuery(settings, positional[1], asRecords);
        }

        std::cerr << "Error: Unknown command: " << command << std::endl;
        printUsage(argv[0]);
        return 2;

    } catch (const errors::ValidationError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
