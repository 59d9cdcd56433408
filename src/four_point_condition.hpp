#ifndef FOUR_POINT_CONDITION_HPP
#define FOUR_POINT_CONDITION_HPP

#include "quartet.hpp"

namespace four_point{

using std::size_t;
using quartet::DISTANCE_MATRIX;
using quartet::Quartet;
using quartet::PairingSum;
using quartet::PairingSums;

inline double constexpr DEFAULT_TOLERANCE = 1e-2;

ChangeLog logFourPointCondition("FourPointCondition",
	"2026-10-02", "fpc authors", "Initial code", "minor",
	"2026-10-06", "fpc authors", "Sums equal to the maximum always count, so tolerance 0 means exact equality", "patch",
	"2026-10-06", "fpc authors", "Reject negative tolerance", "patch");

template<typename score_t> void validateTolerance(score_t tolerance){
	if (!(tolerance >= 0)){
		common::LogInfo err(-100);
		err << "Error: Tolerance must be non-negative but " << tolerance << " was given!" << std::endl;
		throw std::invalid_argument("Negative tolerance");
	}
}

/*
 * Number of pairing sums s with (sMax - s)^2 < tolerance.
 * The tolerance bounds the squared difference, not the difference itself.
 */
template<typename score_t> size_t countNearMaximum(PairingSums<score_t> const& sums, score_t tolerance) noexcept{
	score_t sMax = std::max({ sums[0].sum, sums[1].sum, sums[2].sum });
	size_t cnt = 0;
	for (PairingSum<score_t> const& s : sums){
		score_t diff = sMax - s.sum;
		if (diff == 0 || diff * diff < tolerance) cnt++;
	}
	return cnt;
}

// The two largest pairing sums agree within tolerance.
template<typename score_t> bool holds(PairingSums<score_t> const& sums, score_t tolerance) noexcept{
	return countNearMaximum(sums, tolerance) >= 2;
}

template<DISTANCE_MATRIX M> bool satisfiesFourPointCondition(M const& distances, Quartet const& q, double tolerance = DEFAULT_TOLERANCE){
	validateTolerance(tolerance);
	return holds<quartet::score_of<M> >(quartet::computePairingSums(distances, q), tolerance);
}

template<DISTANCE_MATRIX M, std::ranges::range R> requires (!std::same_as<std::remove_cvref_t<R>, Quartet>) bool satisfiesFourPointCondition(M const& distances, R const& indices, double tolerance = DEFAULT_TOLERANCE){
	return satisfiesFourPointCondition(distances, quartet::toQuartet(indices), tolerance);
}

};
#endif
