#include "report.hpp"

using std::cerr;
using std::endl;
using namespace std::string_literals;

ChangeLog logmain("main",
	"2026-10-04", "fpc authors", "Command line tool", "minor",
	"2026-10-09", "fpc authors", "Report violating quartets", "patch",
	"2026-10-11", "fpc authors", "Add --thread", "patch");

using Tester = additivity::AdditivityTester<additivity::AdditivityDefaultAttributes, distance_matrix::DistanceMatrix>;

int main(int argc, char* argv[]) {
	using std::string;
	using std::size_t;

	ARG.set("SHORT_NAME", "fpc"s);
	ARG.set("FULL_NAME", "FPC: Four-Point Condition additivity test"s);

	ARG.addArgument('h', "help", "flag", "Display help message", 6, true);
	ARG.addArgument('i', "input", "string", "Input distance matrix file path (PHYLIP format)", 5);
	ARG.addArgument('o', "output", "string", "Output file path, print to stdout if not provided", 5, true);
	ARG.addArgument('t', "thread", "integer", "Number of threads", 4, true, true, "1");
	ARG.addArgument('e', "tolerance", "numeric", "Two pairing sums a and b are equal if (a-b)^2 < tolerance", 3, true, true, "0.01");
	ARG.addArgument('\0', "violations", "integer", "Maximum number of violating quartets listed in the output", 2, true, true, "10");
	ARG.addArgument('\0', "no-validate", "flag", "Don't check the matrix for symmetry, non-negative entries and zero diagonal", 1, true);
	ARG.addArgument('\0', "symmetry-tolerance", "numeric", "Largest |D(i,j)-D(j,i)| accepted by validation", 1, true, true, "1e-9");
	ARG.addArgument('\0', "verbose", "integer", "Verbose level", 0, true, true, "4");
	ARG.addArgument('\0', "no-log", "flag", "Don't generate log file", 1, true);
	ARG.addArgument('\0', "log", "string", "Log file path", 0, true, true, "log.txt");
	ARG.addArgument('\0', "log-verbose", "integer", "Verbose level in log file", 0, true, true, "5");

	try {
		ARG.parse(argc, argv);
	}
	catch (std::invalid_argument const&) {
		return 1;
	}
	common::LogInfo::setVerbose(ARG.has("no-log") ? nullptr : new std::ofstream(ARG.get<string>("log")), ARG.get<size_t>("log-verbose"), ARG.get<size_t>("verbose"));
	ARG.print();

	size_t nThreads = ARG.get<size_t>("thread");
	if (nThreads > 1) common::LogInfo::setShowThread();

	try {
		ARG.log() << "Parsing input file..." << endl;
		distance_matrix::DistanceMatrixParser parser(1);
		distance_matrix::DistanceMatrix matrix = parser.parse(ARG.get<string>("input"));

		if (!ARG.has("no-validate")) {
			ARG.log() << "Validating distance matrix..." << endl;
			matrix.validate(ARG.get<double>("symmetry-tolerance"));
		}

		ARG.log() << "#Items: " << matrix.size() << endl;
		ARG.log() << "#Threads: " << nThreads << endl;
		ARG.log() << "Tolerance: " << ARG.get<double>("tolerance") << endl;

		Tester tester(matrix, ARG.get<double>("tolerance"), nThreads, 1);
		report::Summary summary = report::summarize(tester, ARG.get<size_t>("violations"));
		ARG.log() << "Result: " << (summary.additive ? "additive" : "not additive") << endl;

		if (ARG.has("output")) {
			std::ofstream fout(ARG.get<string>("output"));
			if (!fout) throw std::invalid_argument("Cannot open output file " + ARG.get<string>("output"));
			report::write(fout, matrix, tester, summary);
		}
		else report::write(std::cout, matrix, tester, summary);
	}
	catch (std::exception const& e) {
		cerr << "Error: " << e.what() << endl;
		return 1;
	}
	return 0;
}
