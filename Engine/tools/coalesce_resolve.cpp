/**
 * @file coalesce_resolve.cpp
 * @brief CLI tool to run a full resolution pass against PostgreSQL
 *
 * Usage: coalesce_resolve <collection> [--config overrides.json]... [--conninfo "..."]
 *                         [--schema name] [--run-id id] [--print-config] [--quiet]
 *
 * Connection settings come from PGHOST/PGPORT/PGDATABASE/PGUSER/PGPASSWORD
 * unless --conninfo is given. Override files are applied in order.
 */

#include <config/resolution_config.hpp>
#include <database/postgres_connection.hpp>
#include <hashing/blake3_pipeline.hpp>
#include <pipeline/resolution_pipeline.hpp>
#include <storage/postgres_store.hpp>
#include <utils/errors.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>

using namespace Coalesce;

namespace {

void usage(const char* prog) {
    std::cerr << "Usage: " << prog << " <collection> [--config overrides.json]... [--conninfo \"...\"]\n"
              << "       [--schema name] [--run-id id] [--print-config] [--quiet]\n";
}

nlohmann::json read_layer(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw ConfigurationError("cannot open override file '" + path + "'");
    try {
        return nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigurationError("'" + path + "': " + e.what());
    }
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2 || std::string(argv[1]).rfind("--", 0) == 0) {
        usage(argv[0]);
        return 1;
    }

    const std::string collection = argv[1];
    std::vector<std::string> config_files;
    std::optional<std::string> conninfo;
    std::string schema = "coalesce";
    std::string run_id;
    bool print_config = false;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) {
                usage(argv[0]);
                std::exit(1);
            }
            return argv[++i];
        };

        if (arg == "--config") config_files.push_back(value());
        else if (arg == "--conninfo") conninfo = value();
        else if (arg == "--schema") schema = value();
        else if (arg == "--run-id") run_id = value();
        else if (arg == "--print-config") print_config = true;
        else if (arg == "--quiet") Logger::set_level(Logger::Level::Warning);
        else {
            std::cerr << "Error: unknown argument '" << arg << "'\n";
            usage(argv[0]);
            return 1;
        }
    }

    try {
        std::vector<nlohmann::json> layers;
        for (const auto& path : config_files) layers.push_back(read_layer(path));
        ResolutionConfig config = layered_config(collection, layers);

        if (print_config) {
            std::cout << to_json(config).dump(2) << "\n";
            return 0;
        }

        if (run_id.empty()) {
            const std::string started = utc_timestamp();
            run_id = "run_" + BLAKE3Pipeline::hash_hex(collection + "@" + started).substr(0, 12);
        }

        PostgresConnection db = conninfo ? PostgresConnection(*conninfo) : PostgresConnection();
        PostgresStore store(db, schema);

        Logger::info("Vector engine: " + [&] {
            auto engine = store.vector_engine();
            return engine.version.empty() ? std::string("none") : engine.name + " " + engine.version;
        }());

        ResolutionPipeline pipeline(store, config);
        PipelineReport report = pipeline.run(run_id);

        std::cout << report.to_json().dump(2) << "\n";
        return 0;
    } catch (const Error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 3;
    }
}
