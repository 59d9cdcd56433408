#ifndef THREAD_POOL_HPP
#define THREAD_POOL_HPP

#include "common.hpp"

namespace thread_pool{

using std::size_t;
using std::views::iota;
using std::vector;

template<typename T> concept NonVoid = !std::same_as<T, void>;

ChangeLog logThreadPool("ThreadPool",
	"2026-10-09", "fpc authors", "Map-reduce over quartet groups", "minor",
	"2026-10-11", "fpc authors", "Add interleaved scheduler", "patch");

// Each map function is evaluated on every element and folded with the reduce function of the same index.
template<NonVoid score_t> struct Instruction{
	vector<std::function<score_t(size_t)> > mapFuncs;
	vector<std::function<score_t(score_t, score_t)> > reduceFuncs;
	vector<score_t> zeros;
};

template<NonVoid score_t, std::ranges::range Range> struct Task{
	Instruction<score_t> const *instr;
	Range elementRange;

	Task(Instruction<score_t> const *instr, Range elementRange) noexcept:
		instr(instr), elementRange(elementRange){}

	vector<score_t> operator()() const noexcept{
		vector<score_t> res;
		for (size_t iFunc : iota((size_t) 0, instr->mapFuncs.size())){
			auto const& map = instr->mapFuncs[iFunc];
			auto const& reduce = instr->reduceFuncs[iFunc];
			score_t temp = instr->zeros[iFunc];
			for (size_t iElement : elementRange){
				temp = reduce(temp, map(iElement));
			}
			res.push_back(temp);
		}
		return res;
	}
};

template<template<typename> class Scheduler, typename score_t> concept SCHEDULER = requires(Scheduler<score_t> scheduler, Instruction<score_t> const *const instr, size_t index){
	{Scheduler<score_t>{instr, index, index, index}} noexcept;
	{scheduler(index)} noexcept;
	{scheduler.getResults()} noexcept -> std::same_as<vector<vector<score_t> > >;
	requires NonVoid<score_t>;
};

// Thread i gets the i-th contiguous block of elements.
template<typename score_t> class SimpleScheduler{
	vector<Task<score_t, std::ranges::iota_view<size_t, size_t> > > tasks;
	vector<vector<score_t> > results;

public:
	SimpleScheduler(Instruction<score_t> const *const instr, size_t nThreads, size_t iElementBegin, size_t iElementEnd) noexcept: results(nThreads){
		for (size_t iThread : iota((size_t) 0, nThreads)){
			tasks.emplace_back(instr, iota(iElementBegin + iThread * (iElementEnd - iElementBegin) / nThreads, iElementBegin + (iThread + 1) * (iElementEnd - iElementBegin) / nThreads));
		}
	}

	void operator()(size_t iThread) noexcept{
		results[iThread] = tasks[iThread]();
	}

	vector<vector<score_t> > getResults() noexcept{
		return std::move(results);
	}
};

// Thread i gets elements i, i + nThreads, i + 2 * nThreads, ...
// Balances work that shrinks steadily with the element index.
template<typename score_t> class InterleavedScheduler{
	vector<Task<score_t, vector<size_t> > > tasks;
	vector<vector<score_t> > results;

public:
	InterleavedScheduler(Instruction<score_t> const *const instr, size_t nThreads, size_t iElementBegin, size_t iElementEnd) noexcept: results(nThreads){
		for (size_t iThread : iota((size_t) 0, nThreads)){
			vector<size_t> elements;
			for (size_t iElement = iElementBegin + iThread; iElement < iElementEnd; iElement += nThreads) elements.push_back(iElement);
			tasks.emplace_back(instr, std::move(elements));
		}
	}

	void operator()(size_t iThread) noexcept{
		results[iThread] = tasks[iThread]();
	}

	vector<vector<score_t> > getResults() noexcept{
		return std::move(results);
	}
};

template<typename T, template<typename> class Scheduler> requires SCHEDULER<Scheduler, T> class ThreadPool{
public:
	using score_t = T;

private:
	struct Block{
		std::unique_ptr<Scheduler<score_t> > scheduler;
		std::atomic<size_t> readyCnt = 0;
		std::atomic<bool> dataReady = false;
		std::shared_ptr<Block> next;
	};

	static void work(std::shared_ptr<Block> block, size_t iThread) noexcept{
		while (block.get() != nullptr){
			while (!block->dataReady) std::this_thread::yield();
			if (block->scheduler.get() != nullptr) (*block->scheduler)(iThread);
			block->readyCnt++;
			block = block->next;
		}
	}

	size_t nThreads, iElementBegin, iElementEnd;
	std::shared_ptr<Block> block;
	vector<std::thread> threads;

public:
	ThreadPool(size_t nThreads, size_t iElementBegin, size_t iElementEnd) noexcept: nThreads(std::max(nThreads, (size_t) 1)), iElementBegin(iElementBegin), iElementEnd(iElementEnd), block(new Block){
		for (size_t iThread : iota((size_t) 1, this->nThreads)){
			threads.emplace_back(&ThreadPool<score_t, Scheduler>::work, block, iThread);
		}
	}

	ThreadPool(ThreadPool const&) = delete;
	ThreadPool& operator=(ThreadPool const&) = delete;

	~ThreadPool() noexcept{
		block->dataReady = true;
		for (std::thread &thread : threads){
			thread.join();
		}
	}

	size_t size() const noexcept{ return nThreads; }

	vector<score_t> operator()(Instruction<score_t> const &instr) noexcept{
		if (nThreads == 1) return Task<score_t, std::ranges::iota_view<size_t, size_t> >(&instr, iota(iElementBegin, iElementEnd))();
		block->scheduler.reset(new Scheduler<score_t>(&instr, nThreads, iElementBegin, iElementEnd));
		block->next.reset(new Block);
		block->dataReady = true;
		(*block->scheduler)(0);
		while (block->readyCnt < nThreads - 1) std::this_thread::yield();
		vector<vector<score_t> > results = block->scheduler->getResults();
		vector<score_t> res;
		for (size_t iReduce : iota((size_t) 0, instr.reduceFuncs.size())){
			auto const& reduce = instr.reduceFuncs[iReduce];
			score_t temp = instr.zeros[iReduce];
			for (size_t iThread : iota((size_t) 0, nThreads)){
				temp = reduce(temp, results[iThread][iReduce]);
			}
			res.push_back(temp);
		}
		block = block->next;
		return res;
	}
};

};
#endif
