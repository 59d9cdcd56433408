#ifndef REPORT_HPP
#define REPORT_HPP

#include "distance_matrix.hpp"
#include "additivity.hpp"

namespace report{

using std::size_t;
using std::vector;
using std::endl;
using quartet::Quartet;

ChangeLog logReport("Report",
	"2026-10-16", "fpc authors", "Summary and text report of the additivity test", "minor",
	"2026-10-16", "fpc authors", "Evaluate each quartet once per run", "patch");

struct Summary{
	bool additive = true;
	size_t nItems = 0, nQuartets = 0, nViolations = 0;
	vector<Quartet> violations;
};

/*
 * With several threads every quartet is evaluated anyway, so the violation count decides additivity.
 * With one thread the additivity test stops at the first violation and the count is only taken when one exists.
 */
template<class Tester> Summary summarize(Tester const& tester, size_t nListed){
	Summary res;
	res.nItems = tester.nItems();
	res.nQuartets = tester.nQuartets();
	if (tester.nThreads() > 1){
		res.nViolations = tester.countViolations();
		res.additive = (res.nViolations == 0);
	}
	else{
		res.additive = tester.isAdditive();
		if (!res.additive) res.nViolations = tester.countViolations();
	}
	if (!res.additive) res.violations = tester.violations(nListed);
	return res;
}

// One line per violating quartet: its names, then each pairing with its sum.
template<class Tester> void write(std::ostream& out, distance_matrix::DistanceMatrix const& matrix, Tester const& tester, Summary const& summary){
	out << (summary.additive ? "additive" : "not additive") << endl;
	out << "#Items: " << summary.nItems << endl;
	out << "#Quartets: " << summary.nQuartets << endl;
	if (summary.additive) return;
	out << "#Violations: " << summary.nViolations << endl;
	for (Quartet const& q : summary.violations){
		out << matrix.name(q[0]) << " " << matrix.name(q[1]) << " " << matrix.name(q[2]) << " " << matrix.name(q[3]);
		for (auto const& s : tester.pairingSums(q)){
			out << "\t" << matrix.name(s.pairing.pairs[0].first) << "," << matrix.name(s.pairing.pairs[0].second)
				<< "|" << matrix.name(s.pairing.pairs[1].first) << "," << matrix.name(s.pairing.pairs[1].second) << "=" << s.sum;
		}
		out << endl;
	}
}

};
#endif
