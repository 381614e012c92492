#include <gtest/gtest.h>
#include <adiabat/parser/FormulaParser.hpp>
#include <adiabat/util/ErrorCodes.hpp>
#include <adiabat/util/Elements.hpp>

using namespace Adiabat;

TEST(FormulaParserTest, SimpleFormula) {
    ElementCounts counts;
    ASSERT_EQ(FormulaParser::parse("H2O", counts), ErrorCode::kSuccess);

    ASSERT_EQ(counts.size(), 2u);
    EXPECT_EQ(counts[0].first, "H");
    EXPECT_EQ(counts[0].second, 2);
    EXPECT_EQ(counts[1].first, "O");
    EXPECT_EQ(counts[1].second, 1);
}

TEST(FormulaParserTest, MultiLetterSymbols) {
    ElementCounts counts;
    ASSERT_EQ(FormulaParser::parse("Al2O3", counts), ErrorCode::kSuccess);

    EXPECT_EQ(FormulaParser::countOf(counts, "Al"), 2);
    EXPECT_EQ(FormulaParser::countOf(counts, "O"), 3);
    EXPECT_EQ(FormulaParser::countOf(counts, "A"), 0);
    EXPECT_EQ(FormulaParser::totalAtoms(counts), 5);
}

TEST(FormulaParserTest, ImplicitCountsAndRepeatedSymbols) {
    ElementCounts counts;
    ASSERT_EQ(FormulaParser::parse("CH3OH", counts), ErrorCode::kSuccess);

    // Order of first appearance, repeated H merged
    ASSERT_EQ(counts.size(), 3u);
    EXPECT_EQ(counts[0].first, "C");
    EXPECT_EQ(counts[1].first, "H");
    EXPECT_EQ(counts[2].first, "O");
    EXPECT_EQ(FormulaParser::countOf(counts, "C"), 1);
    EXPECT_EQ(FormulaParser::countOf(counts, "H"), 4);
    EXPECT_EQ(FormulaParser::countOf(counts, "O"), 1);
}

TEST(FormulaParserTest, MultiDigitCounts) {
    ElementCounts counts;
    ASSERT_EQ(FormulaParser::parse("C12H22O11", counts), ErrorCode::kSuccess);

    EXPECT_EQ(FormulaParser::countOf(counts, "C"), 12);
    EXPECT_EQ(FormulaParser::countOf(counts, "H"), 22);
    EXPECT_EQ(FormulaParser::countOf(counts, "O"), 11);
}

TEST(FormulaParserTest, MalformedInput) {
    ElementCounts counts;

    EXPECT_EQ(FormulaParser::parse("", counts), ErrorCode::kInvalidFormula);
    EXPECT_EQ(FormulaParser::parse("h2o", counts), ErrorCode::kInvalidFormula);
    EXPECT_EQ(FormulaParser::parse("2H", counts), ErrorCode::kInvalidFormula);
    EXPECT_EQ(FormulaParser::parse("H2O(g)", counts), ErrorCode::kInvalidFormula);
    EXPECT_EQ(FormulaParser::parse("H 2", counts), ErrorCode::kInvalidFormula);
    EXPECT_EQ(FormulaParser::parse("H0", counts), ErrorCode::kInvalidFormula);
    EXPECT_EQ(FormulaParser::parse("H99999999999", counts), ErrorCode::kInvalidFormula);

    // Failed parses leave no partial result
    EXPECT_TRUE(counts.empty());
}

TEST(FormulaParserTest, MolarMass) {
    ElementCounts counts;
    ASSERT_EQ(FormulaParser::parse("H2O", counts), ErrorCode::kSuccess);

    double dMolarMass = 0.0;
    ASSERT_EQ(FormulaParser::molarMass(counts, dMolarMass), ErrorCode::kSuccess);
    EXPECT_NEAR(dMolarMass, 2.0 * 1.008e-3 + 15.999e-3, 1e-12);
}

TEST(FormulaParserTest, UnknownElementMolarMass) {
    ElementCounts counts;
    // Syntactically valid, but not a tabulated element
    ASSERT_EQ(FormulaParser::parse("Xx2", counts), ErrorCode::kSuccess);

    double dMolarMass = 1.0;
    EXPECT_EQ(FormulaParser::molarMass(counts, dMolarMass), ErrorCode::kUnknownElement);
    EXPECT_DOUBLE_EQ(dMolarMass, 0.0);
}

TEST(ElementsTest, Lookup) {
    EXPECT_EQ(Elements::atomicNumber("H"), 1);
    EXPECT_EQ(Elements::atomicNumber("O"), 8);
    EXPECT_EQ(Elements::atomicNumber("Al"), 13);
    EXPECT_EQ(Elements::atomicNumber("Pu"), 94);
    EXPECT_EQ(Elements::atomicNumber("al"), 0);
    EXPECT_FALSE(Elements::isKnown("Xx"));
    EXPECT_STREQ(Elements::symbol(6), "C");
    EXPECT_NEAR(Elements::molarMass("C"), 12.011e-3, 1e-12);
    EXPECT_DOUBLE_EQ(Elements::molarMass("Xx"), 0.0);
}
