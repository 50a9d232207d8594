/**
 * rest_server.cpp - oinosql command line tool
 *
 * Exposes SQLite tables as REST resources, either for one request
 * given on the command line or over HTTP.
 *
 * Usage:
 *   ./oinosql -s shop.db -t orders -r "GET /orders?oinosqllimit=5"
 *   ./oinosql -s shop.db -t orders -r "POST /orders" -d '{"total":10}'
 *   ./oinosql -s shop.db -t orders,customers --serve --port 8080
 */

#include <oino/oino.hpp>
#include <oino/cli.hpp>
#include <oino/server.hpp>
#include <cstdio>
#include <map>
#include <memory>

using EngineMap = std::map<std::string, std::shared_ptr<const oino::QueryEngine>>;

static EngineMap open_resources(const oino::cli::cli_args& args) {
    auto dialect = oino::DialectRegistry::with_builtins().create({"sqlite", args.database, args.database});

    EngineMap engines;
    for (const auto& table : args.tables) {
        oino::ApiParams params;
        params.api_name = table;
        params.table_name = table;
        params.hashid_key = args.hashid_key;
        params.hashid_length = args.hashid_length;
        params.hashid_static_ids = args.static_ids;
        engines[table] = std::make_shared<const oino::QueryEngine>(oino::QueryEngine::create(dialect, params));
    }
    return engines;
}

static int run_direct(const oino::cli::cli_args& args, const EngineMap& engines) {
    auto request_line = args.split_request();

    oino::Request request;
    request.method = request_line.first;
    request.body = args.get_body();
    if (!request.body.empty()) {
        request.headers["Content-Type"] = args.content_type;
    }
    if (!args.accept.empty()) {
        request.headers["Accept"] = args.accept;
    }
    std::string name = oino::parse_target(request_line.second, request);

    auto it = engines.find(name);
    if (it == engines.end()) {
        fprintf(stderr, "Unknown resource '%s'\n", name.c_str());
        return 1;
    }

    oino::ApiResult result = it->second->handle(request);
    for (const auto& m : result.messages) {
        fprintf(stderr, "%s\n", m.c_str());
    }
    if (!result.success) {
        return 1;
    }
    if (!result.body.empty()) {
        printf("%s\n", result.body.c_str());
    } else {
        printf("%lld row(s) affected\n", static_cast<long long>(result.affected_rows));
    }
    return 0;
}

static int run_server(const oino::cli::cli_args& args, const EngineMap& engines) {
    oino::http::server_config config;
    config.port = args.port;
    config.bind_address = args.bind_address;
    config.auth_token = args.auth_token;
    config.header_infos = args.verbose;
    config.header_debug = args.verbose;

    oino::http::server server(config);
    for (const auto& kv : engines) {
        server.add_resource(kv.first, kv.second);
    }
    printf("Press Ctrl+C to stop\n");
    server.run();
    return 0;
}

int main(int argc, char** argv) {
    auto args = oino::cli::parse_args(argc, argv, "oinosql", "oinosql - REST resources over SQLite tables");
    if (!args) {
        return 1;
    }
    if (args->verbose) {
        oino::set_log_level(oino::log_level::debug);
    }

    try {
        EngineMap engines = open_resources(*args);
        if (args->mode == oino::cli::cli_mode::serve) {
            return run_server(*args, engines);
        }
        return run_direct(*args, engines);
    } catch (const std::exception& e) {
        fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    }
}
