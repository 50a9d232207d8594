/**
 * test_query_engine.cpp - End to end requests against an in-memory SQLite table
 */

#include <gtest/gtest.h>
#include <oino/oino.hpp>
#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

class QueryEngineTest : public ::testing::Test {
protected:
    std::shared_ptr<oino::Database> db_ = std::make_shared<oino::Database>();
    std::shared_ptr<const oino::SqlDialect> dialect_;

    void SetUp() override {
        ASSERT_TRUE(db_->open(":memory:")) << db_->last_error();
        ASSERT_EQ(db_->exec(
            "CREATE TABLE orders ("
            "  id INTEGER PRIMARY KEY,"
            "  customer VARCHAR(16) NOT NULL,"
            "  total REAL,"
            "  paid BOOLEAN,"
            "  created DATETIME,"
            "  note TEXT"
            ")"), SQLITE_OK) << db_->last_error();
        ASSERT_EQ(db_->exec(
            "INSERT INTO orders (customer, total, paid, created) VALUES"
            " ('alice', 10.5, 1, '2024-01-01T10:00:00.000Z'),"
            " ('bob', 20, 0, '2024-02-01T10:00:00.000Z'),"
            " ('carol', 30.25, 1, '2024-03-01T10:00:00.000Z')"), SQLITE_OK) << db_->last_error();
        dialect_ = oino::make_sqlite_dialect(db_, "shop");
    }

    oino::QueryEngine engine(oino::ApiParams params = {}, oino::Config config = {}) {
        if (params.table_name.empty()) params.table_name = "orders";
        return oino::QueryEngine::create(dialect_, params, config);
    }

    static oino::Request get(const std::string& id = "") {
        oino::Request r;
        r.method = "GET";
        r.id = id;
        return r;
    }

    static oino::Request with_body(const std::string& method, const std::string& id,
                                   const std::string& body,
                                   const std::string& content_type = "application/json") {
        oino::Request r;
        r.method = method;
        r.id = id;
        r.body = body;
        r.headers["Content-Type"] = content_type;
        return r;
    }

    std::string scalar(const std::string& sql) {
        return db_->scalar(sql);
    }

    static bool has_message(const oino::ApiResult& result, const std::string& text) {
        for (const auto& m : result.messages) {
            if (m.find(text) != std::string::npos) return true;
        }
        return false;
    }
};

// ============================================================================
// GET
// ============================================================================

TEST_F(QueryEngineTest, GetById) {
    auto e = engine();
    auto result = e.handle(get("1"));
    ASSERT_TRUE(result.ok()) << result.status_message;
    EXPECT_EQ(result.status_code, 200);
    EXPECT_EQ(result.content_type, "application/json");
    EXPECT_EQ(result.affected_rows, 1);
    EXPECT_EQ(result.body,
              "[\r\n{\"_OINOID_\":\"1\",\"id\":1,\"customer\":\"alice\",\"total\":10.5,\"paid\":true,"
              "\"created\":\"2024-01-01T10:00:00.000Z\",\"note\":null}\r\n]");
}

TEST_F(QueryEngineTest, GetFilteredOrderedProjected) {
    auto e = engine();
    auto request = get();
    request.params["oinosqlfilter"] = "(total)-gt(15)";
    request.params["oinosqlorder"] = "total DESC";
    request.params["oinosqlselect"] = "customer,total";

    auto result = e.handle(request);
    ASSERT_TRUE(result.ok()) << result.status_message;
    EXPECT_EQ(result.affected_rows, 2);
    EXPECT_EQ(result.body,
              "[\r\n{\"_OINOID_\":\"3\",\"id\":3,\"customer\":\"carol\",\"total\":30.25},\r\n"
              "{\"_OINOID_\":\"2\",\"id\":2,\"customer\":\"bob\",\"total\":20}\r\n]");
}

TEST_F(QueryEngineTest, GetWithLimit) {
    auto e = engine();
    auto request = get();
    request.params["oinosqlorder"] = "id";
    request.params["oinosqllimit"] = "2";
    auto result = e.handle(request);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.affected_rows, 2);
}

TEST_F(QueryEngineTest, GetNoMatchesIsEmptyList) {
    auto e = engine();
    auto result = e.handle(get("99"));
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.body, "[\r\n\r\n]");
    EXPECT_EQ(result.affected_rows, 0);
}

TEST_F(QueryEngineTest, PrintSelect) {
    auto e = engine();
    oino::Request request;
    request.params["oinosqlfilter"] = "-not((paid)-eq(true))";
    request.params["oinosqlorder"] = "customer";
    request.params["oinosqllimit"] = "5";
    auto rp = e.parse_params(request);
    EXPECT_EQ(e.print_select(rp),
              "SELECT \"id\",\"customer\",\"total\",\"paid\",\"created\",\"note\" FROM [orders] "
              "WHERE NOT ((\"paid\" = 1)) ORDER BY \"customer\" ASC LIMIT 5;");
    EXPECT_EQ(e.print_select(oino::RequestParams{}, "2"),
              "SELECT \"id\",\"customer\",\"total\",\"paid\",\"created\",\"note\" FROM [orders] "
              "WHERE (\"id\"=2);");
}

// ============================================================================
// Content Negotiation
// ============================================================================

TEST_F(QueryEngineTest, AcceptCsv) {
    auto e = engine();
    auto request = get("2");
    request.headers["Accept"] = "text/html, text/csv;q=0.9";
    auto result = e.handle(request);
    ASSERT_TRUE(result.ok()) << result.status_message;
    EXPECT_EQ(result.content_type, "text/csv");
    EXPECT_EQ(result.body,
              "\"_OINOID_\",\"id\",\"customer\",\"total\",\"paid\",\"created\",\"note\"\r\n"
              "\"2\",\"2\",\"bob\",\"20\",\"false\",\"2024-02-01T10:00:00.000Z\",null");
}

TEST_F(QueryEngineTest, ResponseTypeOverride) {
    auto e = engine();
    auto request = get("1");
    request.headers["Accept"] = "text/csv";
    request.params["oinoresponsetype"] = "urlencode";
    auto result = e.handle(request);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.content_type, "application/x-www-form-urlencoded");
    EXPECT_EQ(result.body.substr(0, 14), "_OINOID_=1&id=");
}

TEST_F(QueryEngineTest, FormDataResponseCarriesBoundary) {
    auto e = engine();
    auto request = get("1");
    request.params["oinoresponsetype"] = "formdata";
    auto result = e.handle(request);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.content_type, "multipart/form-data; boundary=" + e.config().multipart_boundary);
}

TEST_F(QueryEngineTest, WildcardAcceptIsJson) {
    auto e = engine();
    auto request = get("1");
    request.headers["Accept"] = "*/*";
    EXPECT_EQ(e.handle(request).content_type, "application/json");
}

TEST_F(QueryEngineTest, UnacceptableResponseType) {
    auto e = engine();
    auto request = get();
    request.headers["Accept"] = "application/xml";
    auto result = e.handle(request);
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.status_code, 406);

    request.headers.clear();
    request.params["oinoresponsetype"] = "xml";
    EXPECT_EQ(e.handle(request).status_code, 406);
}

TEST_F(QueryEngineTest, UnsupportedRequestType) {
    auto e = engine();
    auto result = e.handle(with_body("POST", "", "<order/>", "application/xml"));
    EXPECT_EQ(result.status_code, 415);
    EXPECT_EQ(scalar("SELECT COUNT(*) FROM orders"), "3");
}

// ============================================================================
// Request Errors
// ============================================================================

TEST_F(QueryEngineTest, BadFilterIsClientError) {
    auto e = engine();
    auto request = get();
    request.params["oinosqlfilter"] = "(total)-between(1)";
    auto result = e.handle(request);
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.status_code, 400);
    EXPECT_EQ(result.status_message.rfind("OINO ERROR (Validate): Invalid filter", 0), 0u)
        << result.status_message;
}

TEST_F(QueryEngineTest, InvalidOrderIsIgnored) {
    auto e = engine();
    auto request = get();
    request.params["oinosqlorder"] = "1=1;";
    auto result = e.handle(request);
    ASSERT_TRUE(result.ok()) << result.status_message;
    EXPECT_EQ(result.affected_rows, 3);
}

TEST_F(QueryEngineTest, OrderWithSignSuffix) {
    auto e = engine();
    auto request = get();
    request.params["oinosqlorder"] = "total-";
    request.params["oinosqlselect"] = "total";
    auto result = e.handle(request);
    ASSERT_TRUE(result.ok()) << result.status_message;
    auto rows = oino::json::parse(result.body);
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_FALSE(rows[0].contains("customer"));
    EXPECT_EQ(rows[0]["id"], 3);
    EXPECT_EQ(rows[2]["id"], 1);
}

TEST_F(QueryEngineTest, LimitPages) {
    auto e = engine();
    auto request = get();
    request.params["oinosqlorder"] = "id";
    request.params["oinosqllimit"] = "2 page 2";
    auto result = e.handle(request);
    ASSERT_TRUE(result.ok()) << result.status_message;
    auto rows = oino::json::parse(result.body);
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0]["customer"], "carol");

    request.params["oinosqllimit"] = "2.1";
    rows = oino::json::parse(e.handle(request).body);
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0]["customer"], "alice");
    EXPECT_EQ(rows[1]["customer"], "bob");

    oino::RequestParams rp;
    rp.limit = oino::LimitSpec::parse("10.3");
    EXPECT_EQ(e.print_select(rp),
              "SELECT \"id\",\"customer\",\"total\",\"paid\",\"created\",\"note\" FROM [orders] "
              "LIMIT 10 OFFSET 20;");
}

TEST_F(QueryEngineTest, AggregateGroupsBySelectedFields) {
    auto e = engine();
    auto request = get();
    request.params["oinosqlaggregate"] = "count(id),sum(total)";
    request.params["oinosqlselect"] = "paid,total";
    request.params["oinosqlorder"] = "paid";

    auto rp = e.parse_params(request);
    EXPECT_EQ(e.print_select(rp),
              "SELECT count(\"id\") AS \"id\",sum(\"total\") AS \"total\",\"paid\" FROM [orders] "
              "GROUP BY \"paid\" ORDER BY \"paid\" ASC;");

    auto result = e.handle(request);
    ASSERT_TRUE(result.ok()) << result.status_message;
    EXPECT_EQ(result.body,
              "[\r\n{\"_OINOID_\":\"1\",\"id\":1,\"total\":20,\"paid\":false},\r\n"
              "{\"_OINOID_\":\"2\",\"id\":2,\"total\":40.75,\"paid\":true}\r\n]");
}

TEST_F(QueryEngineTest, AggregateOnUnknownField) {
    auto e = engine();
    auto request = get();
    request.params["oinosqlaggregate"] = "sum(shoe)";
    auto result = e.handle(request);
    EXPECT_EQ(result.status_code, 400);
    EXPECT_TRUE(has_message(result, "Unknown field: shoe"));
}

TEST_F(QueryEngineTest, UnknownSelectField) {
    auto e = engine();
    auto request = get();
    request.params["oinosqlselect"] = "customer,shoe";
    auto result = e.handle(request);
    EXPECT_EQ(result.status_code, 400);
    EXPECT_TRUE(has_message(result, "Unknown field: shoe"));
}

TEST_F(QueryEngineTest, UnknownFilterFieldIsPassedThrough) {
    auto e = engine();
    auto request = get();
    request.params["oinosqlfilter"] = "(shoe)-eq(two words)";
    auto result = e.handle(request);
    // The raw literal reaches the database, which rejects it
    EXPECT_EQ(result.status_code, 500);
    EXPECT_TRUE(has_message(result, "OINO WARNING (Validate): Unknown field 'shoe' in filter"));
    EXPECT_TRUE(has_message(result, "OINO DEBUG (Execute): OINO SQL ["));
}

TEST_F(QueryEngineTest, UnknownFilterFieldStrict) {
    oino::Config config;
    config.strict_filter_fields = true;
    auto e = engine({}, config);
    auto request = get();
    request.params["oinosqlfilter"] = "(shoe)-eq(1)";
    EXPECT_EQ(e.handle(request).status_code, 400);
}

TEST_F(QueryEngineTest, UnsupportedMethod) {
    auto e = engine();
    oino::Request request;
    request.method = "PATCH";
    auto result = e.handle(request);
    EXPECT_EQ(result.status_code, 405);
    EXPECT_EQ(result.status_message, "OINO ERROR (DoRequest): Unsupported HTTP method 'PATCH'");
}

TEST_F(QueryEngineTest, LowercaseMethod) {
    auto e = engine();
    auto request = get("1");
    request.method = "get";
    EXPECT_TRUE(e.handle(request).ok());
}

// ============================================================================
// POST
// ============================================================================

TEST_F(QueryEngineTest, PostJson) {
    auto e = engine();
    auto result = e.handle(with_body("POST", "",
        R"({"customer":"dave","total":5,"paid":false,"created":"2024-04-01T08:30:00Z"})"));
    ASSERT_TRUE(result.ok()) << result.status_message;
    EXPECT_EQ(result.affected_rows, 1);
    EXPECT_EQ(scalar("SELECT created FROM orders WHERE customer = 'dave'"), "2024-04-01T08:30:00.000Z");
    EXPECT_EQ(scalar("SELECT paid FROM orders WHERE customer = 'dave'"), "0");
}

TEST_F(QueryEngineTest, PostManyRows) {
    auto e = engine();
    auto result = e.handle(with_body("POST", "",
        R"([{"customer":"dave"},{"customer":"erin","note":"it's"}])"));
    ASSERT_TRUE(result.ok()) << result.status_message;
    EXPECT_EQ(result.affected_rows, 2);
    EXPECT_EQ(scalar("SELECT note FROM orders WHERE customer = 'erin'"), "it's");
}

TEST_F(QueryEngineTest, PostCsv) {
    auto e = engine();
    auto result = e.handle(with_body("POST", "", "customer,total\r\nfrank,1.5\r\ngina,2\r\n", "text/csv"));
    ASSERT_TRUE(result.ok()) << result.status_message;
    EXPECT_EQ(result.affected_rows, 2);
    EXPECT_EQ(scalar("SELECT total FROM orders WHERE customer = 'frank'"), "1.5");
}

TEST_F(QueryEngineTest, PostFormData) {
    auto e = engine();
    const std::string body =
        "--b\r\nContent-Disposition: form-data; name=\"customer\"\r\n\r\nhank\r\n"
        "--b\r\nContent-Disposition: form-data; name=\"total\"\r\n\r\n7\r\n"
        "--b--\r\n";
    auto result = e.handle(with_body("POST", "", body, "multipart/form-data; boundary=b"));
    ASSERT_TRUE(result.ok()) << result.status_message;
    EXPECT_EQ(scalar("SELECT total FROM orders WHERE customer = 'hank'"), "7.0");
}

TEST_F(QueryEngineTest, PostUrlEncoded) {
    auto e = engine();
    auto result = e.handle(with_body("POST", "", "customer=ivy+lee&total=3", "application/x-www-form-urlencoded"));
    ASSERT_TRUE(result.ok()) << result.status_message;
    EXPECT_EQ(scalar("SELECT COUNT(*) FROM orders WHERE customer = 'ivy lee'"), "1");
}

TEST_F(QueryEngineTest, PostWithIdIsRejected) {
    auto e = engine();
    auto result = e.handle(with_body("POST", "1", R"({"customer":"dave"})"));
    EXPECT_EQ(result.status_code, 400);
    EXPECT_EQ(scalar("SELECT COUNT(*) FROM orders"), "3");
}

TEST_F(QueryEngineTest, PostWithoutRows) {
    auto e = engine();
    EXPECT_EQ(e.handle(with_body("POST", "", "[]")).status_code, 400);
}

TEST_F(QueryEngineTest, PostMalformedBody) {
    auto e = engine();
    auto result = e.handle(with_body("POST", "", R"([{"customer":"dave"},)"));
    EXPECT_EQ(result.status_code, 400);
    EXPECT_EQ(scalar("SELECT COUNT(*) FROM orders"), "3");
}

TEST_F(QueryEngineTest, PostSkipsInvalidRows) {
    auto e = engine();
    auto result = e.handle(with_body("POST", "", R"([{"customer":"dave"},{"customer":null}])"));
    ASSERT_TRUE(result.ok()) << result.status_message;
    EXPECT_EQ(result.affected_rows, 1);
    EXPECT_TRUE(has_message(result, "Row 2 skipped: Field 'customer' is not allowed to be NULL!"));
}

TEST_F(QueryEngineTest, PostFailsOnAnyInvalidRow) {
    oino::ApiParams params;
    params.fail_on_any_invalid_rows = true;
    auto e = engine(params);
    auto result = e.handle(with_body("POST", "", R"([{"customer":"dave"},{"customer":null}])"));
    EXPECT_EQ(result.status_code, 405);
    EXPECT_EQ(scalar("SELECT COUNT(*) FROM orders"), "3");
}

TEST_F(QueryEngineTest, PostOversizedValue) {
    const std::string body = R"({"customer":"a name longer than sixteen"})";

    auto lenient = engine();
    auto result = lenient.handle(with_body("POST", "", body));
    ASSERT_TRUE(result.ok()) << result.status_message;
    EXPECT_TRUE(has_message(result, "OINO WARNING (ValidateRowValues): Field 'customer' length (26) exceeds maximum (16)"));

    oino::ApiParams params;
    params.fail_on_oversized_values = true;
    auto strict = engine(params);
    EXPECT_EQ(strict.handle(with_body("POST", "", body)).status_code, 405);
}

TEST_F(QueryEngineTest, PostAutoincValue) {
    oino::ApiParams params;
    params.fail_on_update_on_autoinc = true;
    auto e = engine(params);
    auto result = e.handle(with_body("POST", "", R"({"id":10,"customer":"dave"})"));
    EXPECT_EQ(result.status_code, 405);
    EXPECT_TRUE(has_message(result, "Autoinc field 'id' can't be updated!"));
}

// ============================================================================
// PUT / DELETE
// ============================================================================

TEST_F(QueryEngineTest, PutUpdatesRow) {
    auto e = engine();
    auto result = e.handle(with_body("PUT", "1", R"({"total":11,"note":"rush"})"));
    ASSERT_TRUE(result.ok()) << result.status_message;
    EXPECT_EQ(result.affected_rows, 1);
    EXPECT_EQ(scalar("SELECT note FROM orders WHERE id = 1"), "rush");
    EXPECT_EQ(scalar("SELECT customer FROM orders WHERE id = 1"), "alice");
}

TEST_F(QueryEngineTest, PutSetsNull) {
    auto e = engine();
    auto result = e.handle(with_body("PUT", "1", R"({"total":null})"));
    ASSERT_TRUE(result.ok()) << result.status_message;
    EXPECT_EQ(scalar("SELECT total IS NULL FROM orders WHERE id = 1"), "1");
}

TEST_F(QueryEngineTest, PutErrors) {
    auto e = engine();
    EXPECT_EQ(e.handle(with_body("PUT", "", R"({"total":1})")).status_code, 400);
    EXPECT_EQ(e.handle(with_body("PUT", "1", R"([{"total":1},{"total":2}])")).status_code, 400);
    EXPECT_EQ(e.handle(with_body("PUT", "1", R"({"customer":null})")).status_code, 405);
    EXPECT_EQ(e.handle(with_body("PUT", "1", R"({"id":7})")).status_code, 400);
    EXPECT_EQ(e.handle(with_body("PUT", "abc", R"({"total":1})")).status_code, 400);
}

TEST_F(QueryEngineTest, PutMissingRowWarns) {
    auto e = engine();
    auto result = e.handle(with_body("PUT", "99", R"({"total":1})"));
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.affected_rows, 0);
    EXPECT_TRUE(has_message(result, "No row matched id '99'"));
}

TEST_F(QueryEngineTest, DeleteRow) {
    auto e = engine();
    oino::Request request;
    request.method = "DELETE";
    request.id = "3";
    auto result = e.handle(request);
    ASSERT_TRUE(result.ok()) << result.status_message;
    EXPECT_EQ(result.affected_rows, 1);
    EXPECT_EQ(scalar("SELECT COUNT(*) FROM orders"), "2");

    request.id.clear();
    EXPECT_EQ(e.handle(request).status_code, 400);
}

TEST_F(QueryEngineTest, ConcurrentWritesReportTheirOwnChanges) {
    const auto e = engine();
    std::atomic<int> wrong_counts{0};
    std::atomic<int> spurious_warnings{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < 50; ++i) {
                if (t % 2 == 0) {
                    const std::string id = std::to_string(1 + (i + t) % 3);
                    auto result = e.handle(with_body("PUT", id, R"({"note":"busy"})"));
                    if (result.affected_rows != 1) ++wrong_counts;
                    if (has_message(result, "No row matched")) ++spurious_warnings;
                } else {
                    oino::Request request;
                    request.method = "DELETE";
                    request.id = "99";
                    auto result = e.handle(request);
                    if (result.affected_rows != 0) ++wrong_counts;
                }
            }
        });
    }
    for (auto& thread : threads) thread.join();

    EXPECT_EQ(wrong_counts.load(), 0);
    EXPECT_EQ(spurious_warnings.load(), 0);
    EXPECT_EQ(scalar("SELECT COUNT(*) FROM orders WHERE note = 'busy'"), "3");
}

// ============================================================================
// Ids
// ============================================================================

TEST_F(QueryEngineTest, HashedIds) {
    oino::ApiParams params;
    params.hashid_key = "000102030405060708090a0b0c0d0e0f";
    params.hashid_static_ids = true;
    auto e = engine(params);

    auto all = e.handle(get());
    ASSERT_TRUE(all.ok()) << all.status_message;
    auto rows = oino::json::parse(all.body);
    ASSERT_EQ(rows.size(), 3u);
    const std::string token = rows[1]["_OINOID_"].get<std::string>();
    EXPECT_EQ(rows[1]["id"].get<std::string>(), token);
    EXPECT_NE(token, "2");

    auto one = e.handle(get(token));
    ASSERT_TRUE(one.ok()) << one.status_message;
    auto row = oino::json::parse(one.body);
    ASSERT_EQ(row.size(), 1u);
    EXPECT_EQ(row[0]["customer"], "bob");

    auto plain = e.handle(get("2"));
    EXPECT_EQ(plain.status_code, 400);
}

TEST_F(QueryEngineTest, CompositeKey) {
    ASSERT_EQ(db_->exec("CREATE TABLE lines (order_id TEXT, line INTEGER, qty INTEGER, "
                        "PRIMARY KEY (order_id, line))"), SQLITE_OK);
    ASSERT_EQ(db_->exec("INSERT INTO lines VALUES ('A_1', 1, 5), ('A_1', 2, 7)"), SQLITE_OK);

    oino::ApiParams params;
    params.table_name = "lines";
    auto e = engine(params);

    auto result = e.handle(get("A%5F1_2"));
    ASSERT_TRUE(result.ok()) << result.status_message;
    EXPECT_EQ(result.body, "[\r\n{\"_OINOID_\":\"A%5F1_2\",\"order_id\":\"A_1\",\"line\":2,\"qty\":7}\r\n]");

    EXPECT_EQ(e.handle(get("A%5F1")).status_code, 400);
}

// ============================================================================
// Construction and Helpers
// ============================================================================

TEST_F(QueryEngineTest, CreateErrors) {
    oino::ApiParams params;
    params.table_name = "missing";
    EXPECT_THROW(oino::QueryEngine::create(dialect_, params), oino::SchemaParseError);

    params.table_name.clear();
    EXPECT_THROW(oino::QueryEngine::create(dialect_, params), oino::SchemaParseError);

    params.table_name = "orders";
    params.hashid_key = "short";
    EXPECT_THROW(oino::QueryEngine::create(dialect_, params), oino::CryptoConfigError);
}

TEST_F(QueryEngineTest, ExcludedFields) {
    oino::ApiParams params;
    params.exclude_fields = {"note", "created"};
    auto e = engine(params);
    EXPECT_EQ(e.model().size(), 4u);
    auto result = e.handle(get("1"));
    EXPECT_EQ(result.body.find("note"), std::string::npos);
}

TEST_F(QueryEngineTest, ParseTarget) {
    oino::Request request;
    EXPECT_EQ(oino::parse_target("/orders/A%5F1_2?oinosqlfilter=(total)-gt(1)&oinosqlorder=total+DESC&x",
                                 request),
              "orders");
    EXPECT_EQ(request.id, "A%5F1_2");
    EXPECT_EQ(request.param("oinosqlfilter"), "(total)-gt(1)");
    EXPECT_EQ(request.param("oinosqlorder"), "total DESC");
    EXPECT_EQ(request.param("x"), "");
    EXPECT_EQ(request.params.count("x"), 1u);

    oino::Request plain;
    EXPECT_EQ(oino::parse_target("/orders", plain), "orders");
    EXPECT_TRUE(plain.id.empty());
}

TEST_F(QueryEngineTest, MessageHeadersAndJson) {
    oino::ApiResult result;
    result.add_warning("careful", "Op");
    result.add_info("fyi", "Op");
    result.set_error(400, "broken\nline", "Op");

    auto headers = result.message_headers(true, true);
    ASSERT_EQ(headers.size(), 2u);
    EXPECT_EQ(headers[0].first, "X-OINO-MESSAGE-1");
    EXPECT_EQ(headers[0].second, "OINO WARNING (Op): careful");
    EXPECT_EQ(headers[1].second, "OINO ERROR (Op): broken line");

    auto doc = oino::json::parse(result.to_json());
    EXPECT_EQ(doc["success"], false);
    EXPECT_EQ(doc["statusCode"], 400);
    EXPECT_EQ(doc["messages"].size(), 3u);
}
