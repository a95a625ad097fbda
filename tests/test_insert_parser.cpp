#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "InsertParser.hpp"

using namespace ghostdb;
using ::testing::ElementsAre;

class InsertParserTest : public ::testing::Test {
};

// Statement matching
TEST_F(InsertParserTest, MatchesSimpleInsert) {
    auto stmt = InsertParser::match("INSERT INTO users (id, email) VALUES (1, 'a@b.com');");

    ASSERT_TRUE(stmt.has_value());
    EXPECT_EQ(stmt->table, "users");
    EXPECT_EQ(stmt->columns, "id, email");
    EXPECT_EQ(stmt->values, "1, 'a@b.com'");
}

TEST_F(InsertParserTest, KeywordsAreCaseInsensitive) {
    auto stmt = InsertParser::match("insert into Users (id) values (7);");

    ASSERT_TRUE(stmt.has_value());
    EXPECT_EQ(stmt->table, "Users");
    EXPECT_EQ(stmt->values, "7");
}

TEST_F(InsertParserTest, KeepsSchemaQualifiedTableName) {
    auto stmt = InsertParser::match("INSERT INTO public.users (\"id\") VALUES (1);");

    ASSERT_TRUE(stmt.has_value());
    EXPECT_EQ(stmt->table, "public.users");
    EXPECT_EQ(stmt->columns, "\"id\"");
}

TEST_F(InsertParserTest, AllowsTrailingWhitespaceAfterTerminator) {
    auto stmt = InsertParser::match("INSERT INTO t (a) VALUES ('x');  \r");

    ASSERT_TRUE(stmt.has_value());
    EXPECT_EQ(stmt->values, "'x'");
    EXPECT_EQ(stmt->trailing, "  \r");
}

TEST_F(InsertParserTest, TableMayTouchColumnList) {
    auto stmt = InsertParser::match("INSERT INTO t(a, b) VALUES (1, 2);");

    ASSERT_TRUE(stmt.has_value());
    EXPECT_EQ(stmt->table, "t");
    EXPECT_EQ(stmt->columns, "a, b");
}

TEST_F(InsertParserTest, ColumnListEndsAtFirstParenBeforeValues) {
    auto stmt = InsertParser::match("INSERT INTO t (a) x) values(1);");

    ASSERT_TRUE(stmt.has_value());
    EXPECT_EQ(stmt->columns, "a) x");
    EXPECT_EQ(stmt->values, "1");
}

// Long lines must be scanned, never recursed over
TEST_F(InsertParserTest, LongInsertSelectIsNotAStatement) {
    std::string line = "INSERT INTO t (a, " + std::string(200000, 'b') + ") SELECT 1;";

    EXPECT_FALSE(InsertParser::match(line).has_value());
    EXPECT_FALSE(InsertParser::matchHeader(line).has_value());
}

TEST_F(InsertParserTest, VeryWideInsertMatches) {
    std::string columns;
    std::string values;
    for (int i = 0; i < 5000; ++i) {
        if (i > 0) {
            columns += ", ";
            values += ", ";
        }
        columns += "column_" + std::to_string(i);
        values += std::to_string(i);
    }
    std::string line = "INSERT INTO wide (" + columns + ") VALUES (" + values + ");";

    auto stmt = InsertParser::match(line);
    ASSERT_TRUE(stmt.has_value());
    EXPECT_EQ(stmt->table, "wide");
    EXPECT_EQ(InsertParser::splitColumns(stmt->columns).size(), 5000u);
    EXPECT_EQ(InsertParser::splitValues(stmt->values).size(), 5000u);

    auto header = InsertParser::matchHeader(line);
    ASSERT_TRUE(header.has_value());
    EXPECT_EQ(header->columns, columns);
}

TEST_F(InsertParserTest, ValuesMayContainParentheses) {
    auto stmt = InsertParser::match("INSERT INTO t (a, b) VALUES ('f(x)', 2);");

    ASSERT_TRUE(stmt.has_value());
    EXPECT_EQ(stmt->values, "'f(x)', 2");
}

TEST_F(InsertParserTest, RejectsNonInsertLines) {
    EXPECT_FALSE(InsertParser::match("-- a comment").has_value());
    EXPECT_FALSE(InsertParser::match("").has_value());
    EXPECT_FALSE(InsertParser::match("CREATE TABLE users (id int);").has_value());
    EXPECT_FALSE(InsertParser::match("  INSERT INTO t (a) VALUES (1);").has_value());
}

TEST_F(InsertParserTest, RejectsMultiRowAndUnterminatedStatements) {
    EXPECT_FALSE(InsertParser::match("INSERT INTO t (a) VALUES (1)").has_value());
    EXPECT_FALSE(InsertParser::match("INSERT INTO t (a) VALUES (1),").has_value());
    EXPECT_FALSE(InsertParser::match("INSERT INTO t VALUES (1);").has_value());
}

TEST_F(InsertParserTest, HeaderMatchDoesNotNeedTerminator) {
    auto header = InsertParser::matchHeader("INSERT INTO orders (id, amount) VALUES");

    ASSERT_TRUE(header.has_value());
    EXPECT_EQ(header->table, "orders");
    EXPECT_EQ(header->columns, "id, amount");
}

// Value splitting
TEST_F(InsertParserTest, SplitsOnCommasOutsideQuotes) {
    auto values = InsertParser::splitValues("1, 'Smith, John', NULL");

    EXPECT_THAT(values, ElementsAre("1", "'Smith, John'", "NULL"));
}

TEST_F(InsertParserTest, BackslashEscapesQuote) {
    auto values = InsertParser::splitValues(R"('O\'Brien, Pat', 2)");

    EXPECT_THAT(values, ElementsAre(R"('O\'Brien, Pat')", "2"));
}

TEST_F(InsertParserTest, KeepsInteriorEmptyTokens) {
    auto values = InsertParser::splitValues("1,,3");

    EXPECT_THAT(values, ElementsAre("1", "", "3"));
}

TEST_F(InsertParserTest, DropsEmptyTrailingToken) {
    EXPECT_THAT(InsertParser::splitValues("1, 2, "), ElementsAre("1", "2"));
    EXPECT_TRUE(InsertParser::splitValues("").empty());
    EXPECT_TRUE(InsertParser::splitValues("   ").empty());
}

TEST_F(InsertParserTest, ToleratesUnbalancedQuote) {
    auto values = InsertParser::splitValues("'open, 2");

    EXPECT_THAT(values, ElementsAre("'open, 2"));
}

// Column splitting
TEST_F(InsertParserTest, SplitsColumnsAndStripsDoubleQuotes) {
    auto columns = InsertParser::splitColumns(" \"id\" , email,\"first_name\"");

    EXPECT_THAT(columns, ElementsAre("id", "email", "first_name"));
}

TEST_F(InsertParserTest, EmptyColumnListYieldsOneEmptyName) {
    EXPECT_THAT(InsertParser::splitColumns(""), ElementsAre(""));
}

// Quoting helpers
TEST_F(InsertParserTest, QuotedTokens) {
    EXPECT_TRUE(InsertParser::isQuoted("'x'"));
    EXPECT_TRUE(InsertParser::isQuoted("''"));
    EXPECT_FALSE(InsertParser::isQuoted("'"));
    EXPECT_FALSE(InsertParser::isQuoted("42"));
    EXPECT_FALSE(InsertParser::isQuoted("NULL"));

    EXPECT_EQ(InsertParser::unquote("'abc'"), "abc");
    EXPECT_EQ(InsertParser::unquote("abc"), "abc");
}

TEST_F(InsertParserTest, RebuildUsesCanonicalLayout) {
    InsertStatement stmt{"public.users", "\"id\", \"email\"", "1,'a'"};

    auto line = InsertParser::rebuild(stmt, {"1", "'b'"});

    EXPECT_EQ(line, "INSERT INTO public.users (\"id\", \"email\") VALUES (1, 'b');");
}

TEST_F(InsertParserTest, RebuildKeepsTrailingCarriageReturn) {
    auto stmt = InsertParser::match("INSERT INTO t (a) VALUES (1);\r");
    ASSERT_TRUE(stmt.has_value());

    EXPECT_EQ(InsertParser::rebuild(*stmt, {"2"}), "INSERT INTO t (a) VALUES (2);\r");
}
