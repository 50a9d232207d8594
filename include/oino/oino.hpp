/**
 * oino/oino.hpp - Master include for oinosql
 *
 * oinosql - REST resources over SQL tables
 *
 * Include this single header to get:
 *   - SchemaIntrospector, DataModel - Table schema from CREATE TABLE DDL
 *   - FilterExpr, OrderSpec, LimitSpec - URL query parameters as SQL
 *   - RowCodec - Rows as JSON, CSV, multipart/form-data or urlencoded
 *   - IdCodec - Encrypted hash ids for numeric primary keys
 *   - QueryEngine - GET/POST/PUT/DELETE against one table
 *
 * Example:
 *
 *   #include <oino/oino.hpp>
 *
 *   auto db = std::make_shared<oino::Database>();
 *   db->open("shop.db");
 *   auto engine = oino::QueryEngine::create(oino::make_sqlite_dialect(db), params);
 *
 *   oino::Request req;
 *   req.method = "GET";
 *   req.id = "42";
 *   std::cout << engine.handle(req).body;
 *
 * The HTTP front end lives in server.hpp and is not included here.
 */

#pragma once

#include "log.hpp"
#include "errors.hpp"
#include "types.hpp"
#include "str.hpp"
#include "encoding.hpp"
#include "datetime.hpp"
#include "json.hpp"
#include "database.hpp"
#include "config.hpp"
#include "dialect.hpp"
#include "sqlite_dialect.hpp"
#include "data_model.hpp"
#include "schema.hpp"
#include "field_codec.hpp"
#include "filter.hpp"
#include "row_set.hpp"
#include "id_codec.hpp"
#include "row_codec.hpp"
#include "query_engine.hpp"
