#ifndef QUARTET_HPP
#define QUARTET_HPP

#include "common.hpp"

namespace quartet{

using std::size_t;
using std::array;
using std::pair;
using std::string;
using std::views::iota;

template<typename M> concept DISTANCE_MATRIX = requires(M const& m, size_t i){
	{ m.size() } -> std::convertible_to<size_t>;
	{ m[i][i] } -> std::convertible_to<double>;
};

// Entries of integer and float matrices are summed and compared as double.
template<DISTANCE_MATRIX M> using score_of = std::common_type_t<std::remove_cvref_t<decltype(std::declval<M const&>()[0][0])>, double>;

using Quartet = array<size_t, 4>;

ChangeLog logPairing("Pairing",
	"2026-10-02", "fpc authors", "Initial code", "minor");

// Split of a quartet into two pairs, e.g. (ab|cd).
// Stored normalized so that (ba|dc), (cd|ab) and (ab|cd) compare and hash equal.
struct Pairing{
	array<pair<size_t, size_t>, 2> pairs;

	Pairing(size_t a, size_t b, size_t c, size_t d) noexcept: pairs{ std::minmax(a, b), std::minmax(c, d) }{
		if (pairs[1] < pairs[0]) std::swap(pairs[0], pairs[1]);
	}

	bool operator==(Pairing const& other) const noexcept = default;
	auto operator<=>(Pairing const& other) const noexcept = default;

	struct Hash{
		size_t operator()(Pairing const& pairing) const noexcept{
			size_t res = 0;
			for (pair<size_t, size_t> const& p : pairing.pairs){
				res = res * 1000003 ^ std::hash<size_t>()(p.first);
				res = res * 1000003 ^ std::hash<size_t>()(p.second);
			}
			return res;
		}
	};

	friend std::ostream& operator<<(std::ostream& out, Pairing const& pairing){
		return out << "(" << pairing.pairs[0].first << "," << pairing.pairs[0].second << "|" << pairing.pairs[1].first << "," << pairing.pairs[1].second << ")";
	}
};

template<typename score_t> struct PairingSum{
	Pairing pairing;
	score_t sum;
};

template<typename score_t> using PairingSums = array<PairingSum<score_t>, 3>;

// Positions inside the quartet: (01|23), (02|13), (03|12).
inline array<array<size_t, 4>, 3> constexpr PAIRING_PATTERNS = {{ {0, 1, 2, 3}, {0, 2, 1, 3}, {0, 3, 1, 2} }};

template<DISTANCE_MATRIX M> void validateQuartet(M const& distances, Quartet const& q){
	size_t n = distances.size();
	for (size_t i : iota((size_t) 0, (size_t) 4)){
		if (q[i] >= n){
			common::LogInfo err(-100);
			err << "Error: Quartet index " << q[i] << " is out of range for a matrix of " << n << " items!" << std::endl;
			throw std::out_of_range("Quartet index out of range");
		}
		for (size_t j : iota((size_t) 0, i)){
			if (q[i] == q[j]){
				common::LogInfo err(-100);
				err << "Error: Quartet (" << q[0] << "," << q[1] << "," << q[2] << "," << q[3] << ") contains index " << q[i] << " twice!" << std::endl;
				throw std::invalid_argument("Duplicate index in quartet");
			}
		}
	}
}

template<std::ranges::range R> requires std::convertible_to<std::ranges::range_value_t<R>, size_t> Quartet toQuartet(R const& indices){
	Quartet q{};
	size_t cnt = 0;
	for (auto const& index : indices){
		if (cnt < 4) q[cnt] = index;
		cnt++;
	}
	if (cnt != 4){
		common::LogInfo err(-100);
		err << "Error: A quartet needs exactly 4 indices but " << cnt << " were given!" << std::endl;
		throw std::invalid_argument("Quartet size is not 4");
	}
	return q;
}

// No bounds or distinctness check; callers enumerating valid quartets use this directly.
// Lookup errors of the matrix type propagate to the caller.
template<DISTANCE_MATRIX M> PairingSums<score_of<M> > pairingSumsUnchecked(M const& distances, Quartet const& q){
	using score_t = score_of<M>;
	PairingSums<score_of<M> > res{{
		{ Pairing(0, 1, 2, 3), 0 }, { Pairing(0, 2, 1, 3), 0 }, { Pairing(0, 3, 1, 2), 0 }
	}};
	for (size_t iPairing : iota((size_t) 0, (size_t) 3)){
		array<size_t, 4> const& p = PAIRING_PATTERNS[iPairing];
		size_t a = q[p[0]], b = q[p[1]], c = q[p[2]], d = q[p[3]];
		res[iPairing].pairing = Pairing(a, b, c, d);
		res[iPairing].sum = static_cast<score_t>(distances[a][b]) + static_cast<score_t>(distances[c][d]);
	}
	return res;
}

template<DISTANCE_MATRIX M> PairingSums<score_of<M> > computePairingSums(M const& distances, Quartet const& q){
	validateQuartet(distances, q);
	return pairingSumsUnchecked(distances, q);
}

template<DISTANCE_MATRIX M, std::ranges::range R> requires (!std::same_as<std::remove_cvref_t<R>, Quartet>) PairingSums<score_of<M> > computePairingSums(M const& distances, R const& indices){
	return computePairingSums(distances, toQuartet(indices));
}

template<typename score_t> score_t sumOf(PairingSums<score_t> const& sums, Pairing const& pairing){
	for (PairingSum<score_t> const& s : sums){
		if (s.pairing == pairing) return s.sum;
	}
	common::LogInfo err(-100);
	err << "Error: Pairing " << pairing << " does not belong to this quartet!" << std::endl;
	throw std::out_of_range("Pairing not in quartet");
}

};
#endif
