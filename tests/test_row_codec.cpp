/**
 * test_row_codec.cpp - Tests for JSON, CSV, form-data and url-encoded rows
 */

#include <gtest/gtest.h>
#include <oino/row_codec.hpp>
#include <oino/schema.hpp>
#include <oino/sqlite_dialect.hpp>
#include <memory>
#include <string>
#include <vector>

using oino::Cell;
using oino::ContentType;
using oino::Row;

class RowCodecTest : public ::testing::Test {
protected:
    std::shared_ptr<oino::Database> db_ = std::make_shared<oino::Database>();
    std::shared_ptr<const oino::DataModel> model_;
    oino::Timestamp created_ = oino::make_timestamp(2024, 1, 2, 3, 4, 5, 6);

    void SetUp() override {
        ASSERT_TRUE(db_->open(":memory:")) << db_->last_error();
        model_ = std::make_shared<const oino::DataModel>(oino::SchemaIntrospector::build(
            "items",
            "CREATE TABLE items (id INTEGER PRIMARY KEY, name TEXT, price REAL, "
            "active BOOLEAN, created DATETIME, photo BLOB)",
            oino::make_sqlite_dialect(db_, "test")));
    }

    Row full_row() const {
        return Row{Cell(int64_t{1}), Cell(std::string("O'Brien, \"Bob\"")), Cell(2.5), Cell(true),
                   Cell(created_), Cell(oino::Bytes{1, 2, 3})};
    }

    Row sparse_row() const {
        return Row{Cell(int64_t{2}), Cell(oino::Null{}), Cell(int64_t{0}), Cell(false),
                   Cell(oino::Null{}), Cell(oino::Bytes{})};
    }

    std::vector<Row> rows() const { return {full_row(), sparse_row()}; }
};

// ============================================================================
// Content Types
// ============================================================================

TEST(ContentTypeTest, ParseAndParameters) {
    EXPECT_EQ(oino::parse_content_type("application/json; charset=utf-8"), ContentType::Json);
    EXPECT_EQ(oino::parse_content_type("TEXT/CSV"), ContentType::Csv);
    EXPECT_EQ(oino::parse_content_type("multipart/form-data; boundary=x"), ContentType::FormData);
    EXPECT_EQ(oino::parse_content_type("application/x-www-form-urlencoded"), ContentType::UrlEncode);
    EXPECT_FALSE(oino::parse_content_type("application/xml"));

    EXPECT_EQ(oino::header_parameter("multipart/form-data; boundary=\"abc\"", "boundary"), "abc");
    EXPECT_EQ(oino::header_parameter("multipart/form-data; Boundary=abc", "boundary"), "abc");
    EXPECT_EQ(oino::header_parameter("text/csv", "boundary"), "");
}

// ============================================================================
// JSON
// ============================================================================

TEST_F(RowCodecTest, JsonEncode) {
    oino::RowCodec codec(model_);
    EXPECT_EQ(codec.encode(std::vector<Row>{full_row()}, ContentType::Json),
              "[\r\n{\"_OINOID_\":\"1\",\"id\":1,\"name\":\"O'Brien, \\\"Bob\\\"\",\"price\":2.5,"
              "\"active\":true,\"created\":\"2024-01-02T03:04:05.006Z\",\"photo\":\"AQID\"}\r\n]");
}

TEST_F(RowCodecTest, JsonEncodeEmpty) {
    oino::RowCodec codec(model_);
    EXPECT_EQ(codec.encode(std::vector<Row>{}, ContentType::Json), "[\r\n\r\n]");
}

TEST_F(RowCodecTest, JsonSkipsUnsetFields) {
    oino::RowCodec codec(model_);
    Row row(model_->size(), Cell(oino::Unset{}));
    row[0] = int64_t{5};
    row[1] = std::string("x");
    EXPECT_EQ(codec.encode(std::vector<Row>{row}, ContentType::Json),
              "[\r\n{\"_OINOID_\":\"5\",\"id\":5,\"name\":\"x\"}\r\n]");
}

TEST_F(RowCodecTest, JsonRoundTrip) {
    oino::RowCodec codec(model_);
    auto decoded = codec.decode(codec.encode(rows(), ContentType::Json), ContentType::Json);
    EXPECT_EQ(decoded, rows());
}

TEST_F(RowCodecTest, JsonNullBlobIsEmpty) {
    oino::RowCodec codec(model_);
    auto decoded = codec.decode(R"({"id":3,"photo":null})", ContentType::Json);
    ASSERT_EQ(decoded.size(), 1u);
    EXPECT_EQ(std::get<oino::Bytes>(decoded[0][5]), oino::Bytes{});
    EXPECT_TRUE(oino::is_unset(decoded[0][1]));
}

TEST_F(RowCodecTest, JsonDecodeObjectAndUnknownFields) {
    oino::RowCodec codec(model_);
    auto decoded = codec.decode(R"({"_OINOID_":"9","name":"a","colour":"red","price":"1.5"})",
                                ContentType::Json);
    ASSERT_EQ(decoded.size(), 1u);
    EXPECT_TRUE(oino::is_unset(decoded[0][0]));
    EXPECT_EQ(std::get<std::string>(decoded[0][1]), "a");
    EXPECT_DOUBLE_EQ(std::get<double>(decoded[0][2]), 1.5);
}

TEST_F(RowCodecTest, JsonDecodeErrors) {
    oino::RowCodec codec(model_);
    EXPECT_THROW(codec.decode("{\"name\":", ContentType::Json), oino::SerializationError);
    EXPECT_THROW(codec.decode("[1,2]", ContentType::Json), oino::SerializationError);
    EXPECT_THROW(codec.decode("\"text\"", ContentType::Json), oino::SerializationError);
    EXPECT_THROW(codec.decode(R"({"price":"cheap"})", ContentType::Json), oino::SerializationError);
}

// ============================================================================
// CSV
// ============================================================================

TEST_F(RowCodecTest, CsvEncode) {
    oino::RowCodec codec(model_);
    EXPECT_EQ(codec.encode(rows(), ContentType::Csv),
              "\"_OINOID_\",\"id\",\"name\",\"price\",\"active\",\"created\",\"photo\"\r\n"
              "\"1\",\"1\",\"O'Brien, \"\"Bob\"\"\",\"2.5\",\"true\",\"2024-01-02T03:04:05.006Z\",\"AQID\"\r\n"
              "\"2\",\"2\",null,\"0\",\"false\",null,\"\"");
}

TEST_F(RowCodecTest, CsvRoundTrip) {
    oino::RowCodec codec(model_);
    auto decoded = codec.decode(codec.encode(rows(), ContentType::Csv), ContentType::Csv);
    EXPECT_EQ(decoded, rows());
}

TEST_F(RowCodecTest, CsvQuotedLineBreaks) {
    oino::RowCodec codec(model_);
    auto decoded = codec.decode("name,price\n\"two\nlines\",3\n\n\"a,b\",\n", ContentType::Csv);
    ASSERT_EQ(decoded.size(), 2u);
    EXPECT_EQ(std::get<std::string>(decoded[0][1]), "two\nlines");
    EXPECT_EQ(std::get<int64_t>(decoded[0][2]), 3);
    EXPECT_EQ(std::get<std::string>(decoded[1][1]), "a,b");
    EXPECT_TRUE(oino::is_unset(decoded[1][2]));
}

TEST_F(RowCodecTest, CsvErrors) {
    oino::RowCodec codec(model_);
    EXPECT_THROW(codec.decode("colour,size\nred,1", ContentType::Csv), oino::SerializationError);
    EXPECT_THROW(codec.decode("name,price\nx", ContentType::Csv), oino::SerializationError);
    EXPECT_THROW(codec.decode("name\n\"open", ContentType::Csv), oino::SerializationError);
    EXPECT_THROW(codec.decode("name\n\"a\"b", ContentType::Csv), oino::SerializationError);
}

// ============================================================================
// multipart/form-data
// ============================================================================

TEST_F(RowCodecTest, FormDataEncode) {
    oino::RowCodec codec(model_);
    Row row(model_->size(), Cell(oino::Unset{}));
    row[0] = int64_t{7};
    row[1] = oino::Null{};
    row[5] = oino::Bytes{1, 2, 3};

    const std::string b = "--" + codec.config().multipart_boundary;
    EXPECT_EQ(codec.encode(std::vector<Row>{row}, ContentType::FormData),
              b + "\r\nContent-Disposition: form-data; name=\"_OINOID_\"\r\n\r\n7\r\n" +
              b + "\r\nContent-Disposition: form-data; name=\"id\"\r\n\r\n7\r\n" +
              b + "\r\nContent-Disposition: form-data; name=\"name\"\r\n\r\n\r\n" +
              b + "\r\nContent-Disposition: form-data; name=\"photo\"; filename=\"photo\"\r\n"
                  "Content-Type: application/octet-stream\r\n"
                  "Content-Transfer-Encoding: BASE64\r\n\r\nAQID\r\n" +
              b + "--\r\n");
}

TEST_F(RowCodecTest, FormDataRoundTrip) {
    oino::RowCodec codec(model_);
    auto body = codec.encode(rows(), ContentType::FormData);
    auto decoded = codec.decode(body, ContentType::FormData, codec.config().multipart_boundary);
    EXPECT_EQ(decoded, rows());
}

TEST_F(RowCodecTest, FormDataRawFile) {
    oino::RowCodec codec(model_);
    const std::string body =
        "--xyz\r\n"
        "Content-Disposition: form-data; name=\"name\"\r\n\r\n"
        "pic\r\n"
        "--xyz\r\n"
        "Content-Disposition: form-data; name=\"photo\"; filename=\"a.bin\"\r\n"
        "Content-Type: application/octet-stream\r\n\r\n"
        "RAW\r\n"
        "--xyz--\r\n";
    auto decoded = codec.decode(body, ContentType::FormData, "xyz");
    ASSERT_EQ(decoded.size(), 1u);
    EXPECT_EQ(std::get<std::string>(decoded[0][1]), "pic");
    EXPECT_EQ(std::get<oino::Bytes>(decoded[0][5]), (oino::Bytes{'R', 'A', 'W'}));
}

TEST_F(RowCodecTest, FormDataErrors) {
    oino::RowCodec codec(model_);
    EXPECT_THROW(codec.decode("--x\r\n", ContentType::FormData, ""), oino::SerializationError);
    EXPECT_THROW(codec.decode("no boundary here", ContentType::FormData, "x"), oino::SerializationError);
    EXPECT_THROW(codec.decode("--x\r\nContent-Type: multipart/mixed; boundary=y\r\n\r\nv\r\n--x--\r\n",
                              ContentType::FormData, "x"),
                 oino::SerializationError);
    EXPECT_THROW(codec.decode("--x\r\nX-Other: 1\r\n\r\nv\r\n--x--\r\n", ContentType::FormData, "x"),
                 oino::SerializationError);
}

// ============================================================================
// application/x-www-form-urlencoded
// ============================================================================

TEST_F(RowCodecTest, UrlEncode) {
    oino::RowCodec codec(model_);
    EXPECT_EQ(codec.encode(std::vector<Row>{full_row()}, ContentType::UrlEncode),
              "_OINOID_=1&id=1&name=O'Brien%2C%20%22Bob%22&price=2.5&active=true"
              "&created=2024-01-02T03%3A04%3A05.006Z&photo=AQID");
}

TEST_F(RowCodecTest, UrlEncodeRoundTrip) {
    oino::RowCodec codec(model_);
    auto decoded = codec.decode(codec.encode(rows(), ContentType::UrlEncode), ContentType::UrlEncode);
    EXPECT_EQ(decoded, rows());
}

TEST_F(RowCodecTest, UrlDecodePlusAsSpace) {
    oino::RowCodec codec(model_);
    auto decoded = codec.decode("name=a+b&price=1", ContentType::UrlEncode);
    ASSERT_EQ(decoded.size(), 1u);
    EXPECT_EQ(std::get<std::string>(decoded[0][1]), "a b");
    EXPECT_THROW(codec.decode("name=%G1", ContentType::UrlEncode), oino::SerializationError);
}

// ============================================================================
// Ids
// ============================================================================

TEST_F(RowCodecTest, HashedPrimaryKey) {
    auto ids = std::make_shared<const oino::IdCodec>("000102030405060708090a0b0c0d0e0f", "test", 12, true);
    oino::RowCodec codec(model_, oino::Config{}, ids);

    Row row(model_->size(), Cell(oino::Unset{}));
    row[0] = int64_t{42};
    row[1] = std::string("x");

    const std::string token = codec.row_id(row);
    EXPECT_NE(token, "42");
    EXPECT_EQ(ids->decode(token), "42");

    const std::string body = codec.encode(std::vector<Row>{row}, ContentType::Json);
    EXPECT_EQ(body, "[\r\n{\"_OINOID_\":\"" + token + "\",\"id\":\"" + token + "\",\"name\":\"x\"}\r\n]");

    auto decoded = codec.decode(body, ContentType::Json);
    ASSERT_EQ(decoded.size(), 1u);
    EXPECT_EQ(std::get<int64_t>(decoded[0][0]), 42);
}

TEST_F(RowCodecTest, CompositeRowId) {
    auto model = std::make_shared<const oino::DataModel>(oino::SchemaIntrospector::build(
        "lines", "CREATE TABLE lines (order_id TEXT, line INTEGER, qty INTEGER, PRIMARY KEY (order_id, line))",
        oino::make_sqlite_dialect(db_, "test")));
    oino::RowCodec codec(model);
    Row row{Cell(std::string("A_1")), Cell(int64_t{3}), Cell(int64_t{10})};
    EXPECT_EQ(codec.row_id(row), "A%5F1_3");
}
