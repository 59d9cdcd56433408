#ifndef ADDITIVITY_HPP
#define ADDITIVITY_HPP

#include "four_point_condition.hpp"
#include "threadpool.hpp"

namespace additivity{

using std::size_t;
using std::vector;
using std::optional;
using std::views::iota;
using quartet::DISTANCE_MATRIX;
using quartet::Quartet;

template<class Attributes> concept ADDITIVITY_ATTRIBUTES = requires{
	requires std::floating_point<typename Attributes::score_t>;
	{ Attributes::DEFAULT_TOLERANCE } -> std::convertible_to<typename Attributes::score_t>;
	requires thread_pool::SCHEDULER<Attributes::template Scheduler, size_t>;
};

struct AdditivityDefaultAttributes{
	using score_t = double;
	static inline score_t constexpr DEFAULT_TOLERANCE = four_point::DEFAULT_TOLERANCE;
	template<typename T> using Scheduler = thread_pool::InterleavedScheduler<T>;
};

ChangeLog logAdditivityTester("AdditivityTester",
	"2026-10-02", "fpc authors", "Initial code", "minor",
	"2026-10-06", "fpc authors", "Matrices with fewer than 4 items are additive", "patch",
	"2026-10-09", "fpc authors", "Count and list violating quartets", "minor",
	"2026-10-11", "fpc authors", "Multi-threaded quartet checks", "patch",
	"2026-10-16", "fpc authors", "Lookup errors of the matrix propagate instead of terminating", "patch");

template<ADDITIVITY_ATTRIBUTES Attributes, DISTANCE_MATRIX M> class AdditivityTester : public common::LogInfo{
public:
	using score_t = Attributes::score_t;
	using ThreadPool = thread_pool::ThreadPool<size_t, Attributes::template Scheduler>;
	static inline score_t constexpr DEFAULT_TOLERANCE = Attributes::DEFAULT_TOLERANCE;

private:
	M const& distances;
	score_t tolerance;
	size_t n, threads;

	bool quartetHolds(Quartet const& q) const{
		return four_point::holds<quartet::score_of<M> >(quartet::pairingSumsUnchecked(distances, q), tolerance);
	}

	// Visits the quartets (i, j, k, l), i < j < k < l, in lexicographic order until visit returns false.
	template<typename F> bool forEachQuartetFrom(size_t i, F&& visit) const{
		for (size_t j = i + 1; j < n; j++){
			for (size_t k = j + 1; k < n; k++){
				for (size_t l = k + 1; l < n; l++){
					if (!visit(Quartet{ i, j, k, l })) return false;
				}
			}
		}
		return true;
	}

	template<typename F> bool forEachQuartet(F&& visit) const{
		for (size_t i = 0; i < n; i++){
			if (!forEachQuartetFrom(i, visit)) return false;
		}
		return true;
	}

	size_t countViolationsFrom(size_t i) const{
		size_t cnt = 0;
		forEachQuartetFrom(i, [this, &cnt](Quartet const& q){
			if (!quartetHolds(q)) cnt++;
			return true;
		});
		return cnt;
	}

	void checkSquare() const{
		if constexpr (requires(M const& m, size_t i){ { m[i].size() } -> std::convertible_to<size_t>; }){
			for (size_t i : iota((size_t) 0, n)){
				if (distances[i].size() != n){
					common::LogInfo err(-100);
					err << "Error: Row " << i << " of the distance matrix has " << distances[i].size() << " entries but the matrix has " << n << " rows!" << std::endl;
					throw std::invalid_argument("Distance matrix is not square");
				}
			}
		}
	}

public:
	AdditivityTester(M const& distances, score_t tolerance = DEFAULT_TOLERANCE, size_t nThreads = 1, int verbose = DEFAULT_VERBOSE):
			LogInfo(verbose), distances(distances), tolerance(tolerance), n(distances.size()), threads(std::max(nThreads, (size_t) 1)){
		four_point::validateTolerance(tolerance);
		checkSquare();
	}

	size_t nItems() const noexcept{ return n; }

	size_t nThreads() const noexcept{ return threads; }

	size_t nQuartets() const noexcept{
		if (n < 4) return 0;
		return n * (n - 1) / 2 * (n - 2) / 3 * (n - 3) / 4;
	}

	bool isAdditive() const{
		if (n < 4){
			log() << "Fewer than 4 items: no quartet to check, the matrix is additive." << std::endl;
			return true;
		}
		log() << "Checking " << nQuartets() << " quartets of " << n << " items (tolerance " << tolerance << ", " << threads << " thread(s))..." << std::endl;
		if (threads > 1) return countViolations() == 0;
		return forEachQuartet([this](Quartet const& q){ return quartetHolds(q); });
	}

	size_t countViolations() const{
		if (n < 4) return 0;
		if (threads == 1){
			size_t cnt = 0;
			for (size_t i : iota((size_t) 0, n)) cnt += countViolationsFrom(i);
			return cnt;
		}
		// Element i of the pool is the group of quartets whose smallest index is i.
		// The first lookup error raised on a worker is rethrown here.
		std::exception_ptr error;
		std::mutex errorMtx;
		thread_pool::Instruction<size_t> instr;
		instr.mapFuncs.emplace_back([this, &error, &errorMtx](size_t i) noexcept -> size_t {
			try{
				return countViolationsFrom(i);
			}
			catch (...){
				std::lock_guard<std::mutex> lock(errorMtx);
				if (!error) error = std::current_exception();
				return 0;
			}
		});
		instr.reduceFuncs.emplace_back([](size_t a, size_t b) noexcept -> size_t { return a + b; });
		instr.zeros.push_back(0);
		size_t cnt;
		{
			ThreadPool threadPool(threads, 0, n);
			cnt = threadPool(instr)[0];
		}
		if (error) std::rethrow_exception(error);
		return cnt;
	}

	optional<Quartet> firstViolation() const{
		optional<Quartet> res;
		forEachQuartet([this, &res](Quartet const& q){
			if (quartetHolds(q)) return true;
			res = q;
			return false;
		});
		return res;
	}

	vector<Quartet> violations(size_t limit) const{
		vector<Quartet> res;
		if (limit == 0) return res;
		forEachQuartet([this, &res, limit](Quartet const& q){
			if (!quartetHolds(q)) res.push_back(q);
			return res.size() < limit;
		});
		return res;
	}

	quartet::PairingSums<quartet::score_of<M> > pairingSums(Quartet const& q) const{
		return quartet::computePairingSums(distances, q);
	}
};

template<DISTANCE_MATRIX M> bool isAdditive(M const& distances, double tolerance = four_point::DEFAULT_TOLERANCE){
	return AdditivityTester<AdditivityDefaultAttributes, M>(distances, tolerance).isAdditive();
}

};
#endif
