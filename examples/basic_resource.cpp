/**
 * basic_resource.cpp - One table served as a REST resource
 *
 * Demonstrates oino::QueryEngine against an in-memory SQLite table.
 */

#include <oino/oino.hpp>
#include <cstdio>
#include <memory>

static void print_result(const char* title, const oino::ApiResult& result) {
    printf("%s -> %d\n", title, result.status_code);
    for (const auto& m : result.messages) {
        printf("  %s\n", m.c_str());
    }
    if (!result.body.empty()) {
        printf("%s\n", result.body.c_str());
    }
    printf("\n");
}

int main() {
    auto db = std::make_shared<oino::Database>();
    if (!db->open(":memory:")) {
        fprintf(stderr, "Failed to open database: %s\n", db->last_error().c_str());
        return 1;
    }

    if (db->exec("CREATE TABLE products ("
                 "  id INTEGER PRIMARY KEY,"
                 "  name VARCHAR(32) NOT NULL,"
                 "  price REAL,"
                 "  in_stock BOOLEAN"
                 ")") != SQLITE_OK ||
        db->exec("INSERT INTO products (name, price, in_stock) VALUES"
                 " ('Apple', 1.50, 1), ('Banana', 0.75, 1), ('Cherry', 3.00, 0)") != SQLITE_OK) {
        fprintf(stderr, "Setup failed: %s\n", db->last_error().c_str());
        return 1;
    }

    oino::ApiParams params;
    params.table_name = "products";
    auto engine = oino::QueryEngine::create(oino::make_sqlite_dialect(db, "shop"), params);

    printf("Model: %s\n\n", engine.model().print_debug(", ").c_str());

    // Query: All products
    oino::Request get;
    print_result("GET /products", engine.handle(get));

    // Insert as JSON
    oino::Request post;
    post.method = "POST";
    post.headers["Content-Type"] = "application/json";
    post.body = R"([{"name":"Date","price":2.25,"in_stock":true}])";
    print_result("POST /products", engine.handle(post));

    // Query: Filtered and ordered, as CSV
    oino::Request filtered;
    filtered.params["oinosqlfilter"] = "(price)-gt(2)";
    filtered.params["oinosqlorder"] = "price DESC";
    filtered.headers["Accept"] = "text/csv";
    print_result("GET /products?oinosqlfilter=(price)-gt(2)", engine.handle(filtered));

    // Update and delete by id
    oino::Request put;
    put.method = "PUT";
    put.id = "2";
    put.body = R"({"price":0.5})";
    print_result("PUT /products/2", engine.handle(put));

    oino::Request del;
    del.method = "DELETE";
    del.id = "3";
    print_result("DELETE /products/3", engine.handle(del));

    print_result("GET /products", engine.handle(get));
    return 0;
}
