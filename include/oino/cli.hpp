#pragma once

/**
 * @file cli.hpp
 * @brief Command line parsing for the oinosql tool
 *
 * Two modes share one set of options:
 *
 *   oinosql -s shop.db -t orders -r "GET /orders?oinosqllimit=5"
 *   oinosql -s shop.db -t orders,customers --serve --port 8080
 */

#include "str.hpp"
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace oino::cli {

// ============================================================================
// CLI Modes
// ============================================================================

enum class cli_mode {
    direct,     // -s db -t table -r "METHOD /path" (open, one request, close)
    serve       // -s db -t table --serve --port N (open, listen)
};

// ============================================================================
// CLI Arguments
// ============================================================================

struct cli_args {
    cli_mode mode = cli_mode::direct;

    // Data source
    std::string database;               // -s path
    std::vector<std::string> tables;    // -t a,b

    // Direct request
    std::string request;                // -r "GET /orders/1"
    std::string body;                   // -d '{"a":1}'
    std::string body_file;              // -f body.json
    std::string content_type = "application/json";
    std::string accept;

    // Server options
    int port = 8080;
    std::string bind_address = "127.0.0.1";
    std::string auth_token;
    bool serve = false;

    // Id obfuscation
    std::string hashid_key;
    int hashid_length = 12;
    bool static_ids = false;

    // Misc
    bool verbose = false;
    bool help = false;
    bool version = false;

    // Request body from -d or -f
    std::string get_body() const {
        if (!body.empty()) {
            return body;
        }
        if (!body_file.empty()) {
            return read_file(body_file);
        }
        return {};
    }

    // "GET /orders/1?x=y" -> method and target
    std::pair<std::string, std::string> split_request() const {
        std::string r = trim(request);
        size_t space = r.find(' ');
        if (space == std::string::npos) {
            return {"GET", r};
        }
        return {to_upper(r.substr(0, space)), trim(r.substr(space + 1))};
    }

private:
    static std::string read_file(const std::string& path) {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            throw std::runtime_error("Cannot open file: " + path);
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }
};

// ============================================================================
// Argument Parser
// ============================================================================

class arg_parser {
public:
    arg_parser(const std::string& program_name, const std::string& description)
        : program_name_(program_name), description_(description) {}

    std::optional<cli_args> parse(int argc, char** argv) {
        cli_args args;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            auto value = [&](std::string& out) {
                if (++i >= argc) {
                    error("Missing argument for " + arg);
                    return false;
                }
                out = argv[i];
                return true;
            };
            auto number = [&](int& out) {
                std::string text;
                if (!value(text)) return false;
                int64_t n = 0;
                if (!parse_int64(text, n)) {
                    error("Invalid number for " + arg + ": " + text);
                    return false;
                }
                out = static_cast<int>(n);
                return true;
            };

            bool ok = true;
            if (arg == "-h" || arg == "--help") {
                args.help = true;
            }
            else if (arg == "--version") {
                args.version = true;
            }
            else if (arg == "-s" || arg == "--source") {
                ok = value(args.database);
            }
            else if (arg == "-t" || arg == "--tables") {
                std::string list;
                ok = value(list);
                for (const auto& t : split(list, ',')) {
                    if (!trim(t).empty()) args.tables.push_back(trim(t));
                }
            }
            else if (arg == "-r" || arg == "--request") {
                ok = value(args.request);
            }
            else if (arg == "-d" || arg == "--data") {
                ok = value(args.body);
            }
            else if (arg == "-f" || arg == "--file") {
                ok = value(args.body_file);
            }
            else if (arg == "--content-type") {
                ok = value(args.content_type);
            }
            else if (arg == "--accept") {
                ok = value(args.accept);
            }
            else if (arg == "--serve") {
                args.serve = true;
            }
            else if (arg == "--port") {
                ok = number(args.port);
            }
            else if (arg == "--bind") {
                ok = value(args.bind_address);
            }
            else if (arg == "--token") {
                ok = value(args.auth_token);
            }
            else if (arg == "--hashid-key") {
                ok = value(args.hashid_key);
            }
            else if (arg == "--hashid-length") {
                ok = number(args.hashid_length);
            }
            else if (arg == "--static-ids") {
                args.static_ids = true;
            }
            else if (arg == "-v" || arg == "--verbose") {
                args.verbose = true;
            }
            else if (arg[0] == '-') {
                error("Unknown option: " + arg);
                return std::nullopt;
            }
            else if (args.database.empty()) {
                // Positional argument - treat as database if not set
                args.database = arg;
            }
            else {
                error("Unexpected argument: " + arg);
                return std::nullopt;
            }
            if (!ok) return std::nullopt;
        }

        if (args.help) {
            print_help();
            return std::nullopt;
        }

        if (args.version) {
            std::cout << program_name_ << " version 1.0.0\n";
            return std::nullopt;
        }

        args.mode = args.serve ? cli_mode::serve : cli_mode::direct;

        if (!validate(args)) {
            return std::nullopt;
        }

        return args;
    }

private:
    std::string program_name_;
    std::string description_;

    bool validate(const cli_args& args) {
        if (args.database.empty()) {
            error("No database specified. Use -s <database>");
            print_usage();
            return false;
        }
        if (args.tables.empty()) {
            error("No tables specified. Use -t <table>[,<table>...]");
            print_usage();
            return false;
        }
        if (args.mode == cli_mode::direct && args.request.empty()) {
            error("No request specified. Use -r \"<METHOD> /<table>[/<id>][?query]\" or --serve");
            print_usage();
            return false;
        }
        return true;
    }

    void error(const std::string& msg) {
        std::cerr << program_name_ << ": error: " << msg << "\n";
    }

    void print_usage() {
        std::cerr << "Usage: " << program_name_ << " [options]\n";
        std::cerr << "Try '" << program_name_ << " --help' for more information.\n";
    }

    void print_help() {
        std::cout << description_ << "\n\n";
        std::cout << "Usage:\n";
        std::cout << "  " << program_name_ << " -s <db> -t <tables> -r \"<METHOD> <path>\"   Direct mode: one request\n";
        std::cout << "  " << program_name_ << " -s <db> -t <tables> --serve               Server mode: REST over HTTP\n";
        std::cout << "\n";
        std::cout << "Options:\n";
        std::cout << "  -s, --source <path>       SQLite database file\n";
        std::cout << "  -t, --tables <list>       Comma separated tables to expose\n";
        std::cout << "  -r, --request <request>   e.g. \"GET /orders?oinosqlfilter=(total)-gt(10)\"\n";
        std::cout << "  -d, --data <body>         Request body\n";
        std::cout << "  -f, --file <path>         Request body from file\n";
        std::cout << "  --content-type <type>     Body content type (default: application/json)\n";
        std::cout << "  --accept <type>           Response content type\n";
        std::cout << "\n";
        std::cout << "Server options:\n";
        std::cout << "  --serve                   Start HTTP server mode\n";
        std::cout << "  --port <N>                Port number (default: 8080)\n";
        std::cout << "  --bind <addr>             Bind address (default: 127.0.0.1)\n";
        std::cout << "  --token <token>           Require this bearer token\n";
        std::cout << "\n";
        std::cout << "Id options:\n";
        std::cout << "  --hashid-key <hex>        32 hex character key for numeric primary keys\n";
        std::cout << "  --hashid-length <N>       Minimum id token length, 12-42 (default: 12)\n";
        std::cout << "  --static-ids              Same key always gives the same token\n";
        std::cout << "\n";
        std::cout << "Other:\n";
        std::cout << "  -v, --verbose             Debug logging\n";
        std::cout << "  -h, --help                Show this help\n";
        std::cout << "  --version                 Show version\n";
        std::cout << "\n";
        std::cout << "Examples:\n";
        std::cout << "  " << program_name_ << " -s shop.db -t orders -r \"GET /orders?oinosqlorder=total DESC\"\n";
        std::cout << "  " << program_name_ << " -s shop.db -t orders -r \"POST /orders\" -d '{\"total\":12.5}'\n";
        std::cout << "  " << program_name_ << " -s shop.db -t orders --serve --port 8080\n";
        std::cout << "  curl localhost:8080/orders/1\n";
    }
};

// ============================================================================
// Convenience function
// ============================================================================

/**
 * Parse command line arguments.
 *
 * @return Parsed arguments, or nullopt if --help or error
 */
inline std::optional<cli_args> parse_args(
    int argc, char** argv,
    const std::string& program_name,
    const std::string& description)
{
    arg_parser parser(program_name, description);
    return parser.parse(argc, argv);
}

}  // namespace oino::cli
