/**
 * oino/config.hpp - Immutable settings shared by parsers, codecs and the engine
 *
 * Part of oinosql - REST resources over SQL tables.
 *
 * A Config is built once and passed by value or const reference into
 * every component that needs it. Nothing reads settings from globals.
 *
 *   oino::Config config;
 *   config.id_separator = '-';
 *   auto engine = oino::QueryEngine::create(dialect, params, config);
 */

#pragma once

#include "str.hpp"
#include <string>
#include <vector>

namespace oino {

struct Config {
    /// Name of the synthetic composite primary key field in every row
    std::string id_field = "_OINOID_";

    /// Joins primary key values of a composite id
    char id_separator = '_';

    // Request parameter names
    std::string filter_param = "oinosqlfilter";
    std::string order_param = "oinosqlorder";
    std::string limit_param = "oinosqllimit";
    std::string select_param = "oinosqlselect";
    std::string aggregate_param = "oinosqlaggregate";
    std::string response_type_param = "oinoresponsetype";

    /// Boundary used when producing multipart/form-data output
    std::string multipart_boundary = "---------OINOMultipartBoundary35424568";

    /// Fail filters that name unknown fields instead of rendering them raw
    bool strict_filter_fields = false;

    std::string print_id(const std::vector<std::string>& pk_values) const {
        return print_composite_id(pk_values, id_separator);
    }

    std::vector<std::string> parse_id(const std::string& id) const {
        return parse_composite_id(id, id_separator);
    }
};

} // namespace oino
