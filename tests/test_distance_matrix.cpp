/*
===============================================================================
TEST DISTANCE MATRIX - Tests for distance_matrix.hpp
===============================================================================

OVERVIEW
--------
Validates the dense distance matrix, its caller-side validation, and the
PHYLIP reader for square and lower-triangular layouts. The example files are
read relative to the repository root.

TEST ORGANIZATION
-----------------
• Section A: DistanceMatrix storage and validation
• Section B: PHYLIP layouts
• Section C: Reader errors
• Section D: Example files through the additivity test

DEPENDENCIES
------------
• Catch2 - Test framework
• distance_matrix.hpp - System under test
• additivity.hpp - Additivity of the parsed examples

===============================================================================
*/

#include <catch2/catch.hpp>
#include "distance_matrix.hpp"
#include "additivity.hpp"

using distance_matrix::DistanceMatrix;
using distance_matrix::DistanceMatrixParser;
using std::string;
using std::vector;

namespace {

DistanceMatrix parseText(string const& text, DistanceMatrixParser::Layout* layout = nullptr) {
	std::istringstream in(text);
	DistanceMatrixParser parser;
	DistanceMatrix res = parser.parse(in);
	if (layout) *layout = parser.getLayout();
	return res;
}

void requireSameEntries(DistanceMatrix const& a, DistanceMatrix const& b) {
	REQUIRE(a.size() == b.size());
	for (size_t i = 0; i < a.size(); i++) {
		REQUIRE(a.name(i) == b.name(i));
		for (size_t j = 0; j < a.size(); j++) REQUIRE(a[i][j] == Approx(b[i][j]));
	}
}

string const SQUARE =
	"4\n"
	"A 0 3 8 6\n"
	"B 3 0 9 7\n"
	"C 8 9 0 6\n"
	"D 6 7 6 0\n";

string const LOWER =
	"  4\n"
	"A\n"
	"B 3\n"
	"C 8 9\n"
	"D 6 7 6\n";

string const LOWER_WITH_DIAGONAL =
	"4\n"
	"\n"
	"A 0\n"
	"B 3 0\n"
	"C 8 9 0\n"
	"D 6.0 7e0 6 0\n";

}

// ============================================================================
// SECTION A: DISTANCEMATRIX STORAGE AND VALIDATION
// ============================================================================

TEST_CASE("A1: DistanceMatrix::Construction", "[DistanceMatrix]") {
	SECTION("Sized matrix is zero with index names") {
		DistanceMatrix m(3);
		REQUIRE(m.size() == 3);
		REQUIRE(m[2][1] == 0);
		REQUIRE(m.name(2) == "2");
	}

	SECTION("From rows") {
		vector<vector<double> > rows = { { 0, 1 }, { 1, 0 } };
		DistanceMatrix m(rows);
		REQUIRE(m.at(0, 1) == 1);
		REQUIRE(m.isSymmetric());
	}

	SECTION("Non-square rows are rejected") {
		vector<vector<double> > rows = { { 0, 1 }, { 1 } };
		REQUIRE_THROWS_AS(DistanceMatrix(rows), std::invalid_argument);
	}

	SECTION("Item count whose matrix cannot be stored") {
		REQUIRE_THROWS_AS(DistanceMatrix(std::numeric_limits<size_t>::max() / 2), std::invalid_argument);
		REQUIRE_THROWS_AS(DistanceMatrix((size_t) 1 << 32), std::invalid_argument);
	}

	SECTION("Set writes both triangles") {
		DistanceMatrix m(3);
		m.set(0, 2, 4.5);
		REQUIRE(m[0][2] == 4.5);
		REQUIRE(m[2][0] == 4.5);
		REQUIRE_THROWS_AS(m.set(0, 3, 1.0), std::out_of_range);
		REQUIRE_THROWS_AS(m.at(3, 0), std::out_of_range);
	}
}

TEST_CASE("A2: DistanceMatrix::Validation", "[DistanceMatrix][validate]") {
	DistanceMatrix m = parseText(SQUARE);
	REQUIRE_NOTHROW(m.validate());

	SECTION("Asymmetric entry") {
		m[1][2] = 9.5;
		REQUIRE_FALSE(m.isSymmetric());
		REQUIRE(m.isSymmetric(0.5));
		REQUIRE_THROWS_AS(m.validate(), std::invalid_argument);
		REQUIRE_NOTHROW(m.validate(0.5));
	}

	SECTION("Negative entry") {
		m.set(0, 3, -1);
		REQUIRE_FALSE(m.isNonNegative());
		REQUIRE_THROWS_AS(m.validate(), std::invalid_argument);
	}

	SECTION("Not a number") {
		m.set(0, 3, std::nan(""));
		REQUIRE_THROWS_AS(m.validate(), std::invalid_argument);
	}

	SECTION("Non-zero diagonal") {
		m[2][2] = 1;
		REQUIRE_FALSE(m.hasZeroDiagonal());
		REQUIRE_THROWS_AS(m.validate(), std::invalid_argument);
	}
}

// ============================================================================
// SECTION B: PHYLIP LAYOUTS
// ============================================================================

TEST_CASE("B1: Phylip::LayoutsGiveTheSameMatrix", "[DistanceMatrixParser]") {
	DistanceMatrixParser::Layout layout;
	DistanceMatrix square = parseText(SQUARE, &layout);
	REQUIRE(layout == DistanceMatrixParser::Layout::SQUARE);

	DistanceMatrix lower = parseText(LOWER, &layout);
	REQUIRE(layout == DistanceMatrixParser::Layout::LOWER);

	DistanceMatrix lowerDiagonal = parseText(LOWER_WITH_DIAGONAL, &layout);
	REQUIRE(layout == DistanceMatrixParser::Layout::LOWER_WITH_DIAGONAL);

	REQUIRE(square.name(0) == "A");
	REQUIRE(square.name(3) == "D");
	REQUIRE(square[1][2] == 9);
	requireSameEntries(square, lower);
	requireSameEntries(square, lowerDiagonal);
}

TEST_CASE("B2: Phylip::CarriageReturnsAndTabs", "[DistanceMatrixParser]") {
	DistanceMatrix m = parseText("3\r\nx\t0\t1\t2\r\ny 1 0 3\r\nz 2 3 0\r\n");
	REQUIRE(m.size() == 3);
	REQUIRE(m.name(0) == "x");
	REQUIRE(m.name(2) == "z");
	REQUIRE(m[0][2] == 2);
	REQUIRE(m[2][1] == 3);
}

TEST_CASE("B3: Phylip::SmallMatrices", "[DistanceMatrixParser][edge]") {
	REQUIRE(parseText("0\n").size() == 0);
	DistanceMatrix single = parseText("1\nonly 0\n");
	REQUIRE(single.size() == 1);
	REQUIRE(single.name(0) == "only");
}

// ============================================================================
// SECTION C: READER ERRORS
// ============================================================================

TEST_CASE("C1: Phylip::Errors", "[DistanceMatrixParser][error]") {
	SECTION("Empty input") {
		REQUIRE_THROWS_AS(parseText(""), std::invalid_argument);
		REQUIRE_THROWS_AS(parseText("\n  \n"), std::invalid_argument);
	}

	SECTION("Header is not a count") {
		REQUIRE_THROWS_AS(parseText("four\nA 0\n"), std::invalid_argument);
		REQUIRE_THROWS_AS(parseText("4 10\nA 0 1 2 3\n"), std::invalid_argument);
	}

	SECTION("Huge count with too few rows") {
		REQUIRE_THROWS_AS(parseText("4000000000\nA 0\n"), std::invalid_argument);
		REQUIRE_THROWS_AS(parseText("4294967296\nA\n"), std::invalid_argument);
		REQUIRE_THROWS_AS(parseText("99999999999999999999999\nA\n"), std::invalid_argument);
	}

	SECTION("Invalid number") {
		REQUIRE_THROWS_AS(parseText("2\nA 0 1\nB 1x 0\n"), std::invalid_argument);
		REQUIRE_THROWS_AS(parseText("2\nA 0 one\nB 1 0\n"), std::invalid_argument);
	}

	SECTION("Unknown layout") {
		REQUIRE_THROWS_AS(parseText("4\nA 0 3\nB 3 0\nC 1 1\nD 1 1\n"), std::invalid_argument);
	}

	SECTION("Inconsistent rows") {
		REQUIRE_THROWS_AS(parseText("3\nA 0 1 2\nB 1 0\nC 2 3 0\n"), std::invalid_argument);
		REQUIRE_THROWS_AS(parseText("3\nA\nB 1\nC 2 3 0\n"), std::invalid_argument);
	}

	SECTION("Missing rows") {
		REQUIRE_THROWS_AS(parseText("3\nA 0 1 2\nB 1 0 3\n"), std::invalid_argument);
	}

	SECTION("Missing file") {
		DistanceMatrixParser parser;
		REQUIRE_THROWS_AS(parser.parse(string("example/does_not_exist.phy")), std::invalid_argument);
	}
}

// ============================================================================
// SECTION D: EXAMPLE FILES THROUGH THE ADDITIVITY TEST
// ============================================================================

TEST_CASE("D1: Examples::TreeAndPerturbed", "[DistanceMatrixParser][isAdditive]") {
	DistanceMatrixParser parser;

	DistanceMatrix tree = parser.parse(string("example/tree5.phy"));
	REQUIRE(tree.size() == 5);
	REQUIRE_NOTHROW(tree.validate());
	REQUIRE(additivity::isAdditive(tree));
	REQUIRE(additivity::isAdditive(tree, 0.0));

	DistanceMatrix perturbed = parser.parse(string("example/perturbed5.phy"));
	REQUIRE(parser.getLayout() == DistanceMatrixParser::Layout::LOWER);
	REQUIRE_NOTHROW(perturbed.validate());
	REQUIRE_FALSE(additivity::isAdditive(perturbed));

	additivity::AdditivityTester<additivity::AdditivityDefaultAttributes, DistanceMatrix> tester(perturbed);
	std::optional<quartet::Quartet> q = tester.firstViolation();
	REQUIRE(q.has_value());
	REQUIRE(*q == quartet::Quartet{ 0, 1, 2, 3 });
}
