/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 *
 * This file is part of the CSVIO library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

/**
 * @file dialect_test.cpp
 * @brief Tests for csvio::Dialect and csvio::Terminator
 */

#include <gtest/gtest.h>
#include <csvio/csvio.h>

// Defaults are evaluated at compile time
static_assert(csvio::Dialect{}.delimiter == ',');
static_assert(csvio::Dialect{}.writeQuote() == '"');
static_assert(csvio::Dialect{}.terminator.isCrlf());
static_assert(!csvio::Dialect{}.hasCollisions());

TEST(DialectTest, Defaults) {
    const csvio::Dialect d;
    EXPECT_EQ(d.delimiter, ',');
    ASSERT_TRUE(d.quote.has_value());
    EXPECT_EQ(*d.quote, '"');
    EXPECT_EQ(d.terminator, csvio::Terminator::crlf());
    EXPECT_FALSE(d.bom.has_value());
    EXPECT_TRUE(d.skipsBom());
    EXPECT_FALSE(d.emitsBom());
}

TEST(DialectTest, BomPolicy) {
    EXPECT_TRUE((csvio::Dialect{.bom = true}.skipsBom()));
    EXPECT_TRUE((csvio::Dialect{.bom = true}.emitsBom()));
    EXPECT_FALSE((csvio::Dialect{.bom = false}.skipsBom()));
    EXPECT_FALSE((csvio::Dialect{.bom = false}.emitsBom()));
}

TEST(DialectTest, WriteQuoteFallback) {
    EXPECT_EQ((csvio::Dialect{.quote = std::nullopt}.writeQuote()), '"');
    EXPECT_EQ((csvio::Dialect{.quote = '\''}.writeQuote()), '\'');
}

TEST(DialectTest, TerminatorMatching) {
    const auto crlf = csvio::Terminator::crlf();
    EXPECT_TRUE(crlf.matches('\r'));
    EXPECT_TRUE(crlf.matches('\n'));
    EXPECT_FALSE(crlf.matches('#'));

    const auto hash = csvio::Terminator::octet('#');
    EXPECT_EQ(hash.kind(), csvio::Terminator::Kind::OCTET);
    EXPECT_EQ(hash.value(), '#');
    EXPECT_TRUE(hash.matches('#'));
    EXPECT_FALSE(hash.matches('\n'));

    EXPECT_EQ(csvio::Terminator{}, crlf);
    EXPECT_NE(hash, crlf);
    EXPECT_NE(hash, csvio::Terminator::octet('\n'));
}

TEST(DialectTest, Collisions) {
    EXPECT_TRUE((csvio::Dialect{.delimiter = '"'}.hasCollisions()));
    EXPECT_TRUE((csvio::Dialect{.delimiter = '\n'}.hasCollisions()));
    EXPECT_TRUE((csvio::Dialect{.quote = '\r'}.hasCollisions()));
    EXPECT_TRUE((csvio::Dialect{.delimiter = ';', .terminator = csvio::Terminator::octet(';')}.hasCollisions()));
    EXPECT_FALSE((csvio::Dialect{.delimiter = '\n', .terminator = csvio::Terminator::octet(';')}.hasCollisions()));
    EXPECT_TRUE((csvio::Dialect{.delimiter = '"', .quote = std::nullopt}.hasCollisions()));
}

// Colliding octets are accepted; the outcome is implementation-defined but must not fail
TEST(DialectTest, CollidingDialectStillUsable) {
    const csvio::Dialect dialect{.delimiter = '"'};
    csvio::Reader reader{csvio::MemorySource{"a\"b\r\n"}, dialect};
    csvio::Record record;
    EXPECT_TRUE(reader.readNext(record));
    EXPECT_FALSE(reader.readNext(record));

    std::string out;
    csvio::Writer writer{csvio::StringSink{out}, dialect};
    EXPECT_NO_THROW(writer.writeRecord({"x", "y"}));
}

TEST(DialectTest, Version) {
    EXPECT_EQ(csvio::getVersion(), "1.0.0");
}
