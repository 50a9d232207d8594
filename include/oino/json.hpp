#pragma once
/// @file json.hpp
/// @brief JSON library alias for oinosql
///
/// Request bodies are parsed and JSON strings are escaped through this
/// alias. Currently wraps nlohmann/json.

#include <nlohmann/json.hpp>

namespace oino {

/// JSON type alias
using json = nlohmann::json;

/// Ordered JSON (preserves insertion order)
using ordered_json = nlohmann::ordered_json;

} // namespace oino
