#ifndef DOCUMENTATION_HPP
#define DOCUMENTATION_HPP

#include "common.hpp"

namespace documentation{

using std::string;

class DocumentationBase {
protected:
	virtual string introduction() const noexcept = 0;

	virtual string installation() const noexcept {
		return R"FPCDOC(# INSTALLATION
```
cmake -S . -B build
cmake --build build
```
The executables are `build/fpc` and `build/fpc-doc`. Run `ctest --test-dir build` for the unit tests.
)FPCDOC";
	}

	virtual string input() const noexcept = 0;

	virtual string output() const noexcept = 0;

	virtual string programName() const noexcept = 0;

	virtual string exampleInput() const noexcept = 0;

	virtual string execution() const noexcept {
		string const program = "bin/" + programName();
		return "# EXECUTION\n"
			"To list the available options, run\n"
			"```\n" + program + "\n```\n\n"
			"To test whether the distance matrix in `INPUT_FILE` is additive, use:\n"
			"```\n" + program + " -i INPUT_FILE\n```\n\n"
			"For example\n"
			"```\n" + program + " -i example/" + exampleInput() + "\n```\n\n"
			"The result is written to the standard output. To save it in a file use the `-o OUTPUT_FILE` option:\n"
			"```\n" + program + " -i INPUT_FILE -o OUTPUT_FILE\n```\n\n"
			"Sums are compared on their squared difference. To require `(a-b)^2 < 0.0001`, add `-e 0.0001`:\n"
			"```\n" + program + " -e 0.0001 -i INPUT_FILE\n```\n\n"
			"Quartets can be checked by several threads. To use 4 threads, add `-t 4`:\n"
			"```\n" + program + " -t 4 -i INPUT_FILE\n```\n";
	}

	virtual string changes() const noexcept {
		std::ostringstream out;
		out << "# CHANGE LOG\n";
		ChangeLog::displayAll<true>(out, ChangeLog::shared.all);
		return out.str();
	}

public:
	virtual ~DocumentationBase() = default;

	virtual string operator()() const noexcept {
		return introduction() + "\n" + installation() + "\n" + input() + "\n" + output() + "\n" + execution() + "\n" + changes();
	}
};

class Documentation : public DocumentationBase {
protected:
	string introduction() const noexcept override {
		return R"FPCDOC(# FPC: Four-Point Condition additivity test
A distance matrix is additive when some edge-weighted tree realizes every entry as the length of the path between two leaves.
For any four items a, b, c and d, such a tree makes the two largest of the three sums
D(a,b)+D(c,d), D(a,c)+D(b,d) and D(a,d)+D(b,c) equal (the four-point condition).
FPC checks this condition on every quartet of the input matrix. It does not build the tree.
)FPCDOC";
	}

	string input() const noexcept override {
		return R"FPCDOC(# INPUT
The input is a distance matrix in PHYLIP format: the number of items on the first line,
then one row per item with its name followed by its distances. Square matrices and lower-triangular
matrices (with or without the diagonal) are accepted, for example
```
4
A 0 3 7 8
B 3 0 6 7
C 7 6 0 5
D 8 7 5 0
```
or
```
4
A
B 3
C 7 6
D 8 7 5
```
Unless `--no-validate` is given, the matrix must have a zero diagonal, non-negative entries and be symmetric
(up to `--symmetry-tolerance`).
)FPCDOC";
	}

	string output() const noexcept override {
		return R"FPCDOC(# OUTPUT
The first line is `additive` or `not additive`. It is followed by the number of items and quartets and, for
non-additive matrices, the number of violating quartets and up to `--violations` of them with their three pairing sums.
Matrices with fewer than 4 items have no quartet and are reported as additive.
)FPCDOC";
	}

	string programName() const noexcept override { return "fpc"; }

	string exampleInput() const noexcept override { return "tree5.phy"; }
};

};
#endif
