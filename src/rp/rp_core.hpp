// rp_core.hpp — Replica kernel: ids, slot storage, queues, tick scheduler
//
// THE RULE OF 3 VERBS:
// 1. Ids: IdAllocator::allocate(), IdAllocator::release(id)
// 2. Data: SlotMap<T>::add/get/remove, keyed by generation-checked Id
// 3. Scheduling: kernel.task_add(name, priority, fn)
//
// THREADING:
// The Kernel tick is single-threaded. Everything that mutates replicated
// state runs inside a task. Other threads (network readers/writers, the
// outbound dispatcher) talk to the tick only through BlockingQueue<T>.
//
// NETWORKING:
// rp_core knows nothing about sockets or CBOR.
// See rp_ws.hpp for the transport and rp_server.hpp for the pipeline.

#pragma once

#include <vector>
#include <string>
#include <deque>
#include <unordered_map>
#include <algorithm>
#include <iterator>
#include <functional>
#include <chrono>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <cstdint>
#include <cstddef>
#include <stdexcept>
#include <memory>
#include <exception>

namespace rp
{

struct TaskFault : std::exception
{
	std::string msg;
	explicit TaskFault(std::string m) : msg(std::move(m)) {}
	const char *what() const noexcept override { return msg.c_str(); }
};

// =============================================================================
// Ids — (slot, generation) pairs
//
// A slot is reused after release; the generation tells successive occupants
// apart. UINT32_MAX in either field is reserved for "no object".
// =============================================================================
constexpr uint32_t NULL_INDEX = 0xFFFFFFFF;

struct Id
{
	uint32_t slot = NULL_INDEX;
	uint32_t gen = NULL_INDEX;

	static constexpr Id make(uint32_t slot, uint32_t gen) { return Id{slot, gen}; }

	bool is_null() const { return slot == NULL_INDEX || gen == NULL_INDEX; }

	bool operator==(const Id &o) const { return slot == o.slot && gen == o.gen; }
	bool operator!=(const Id &o) const { return !(*this == o); }
};

constexpr Id NULL_ID = Id{NULL_INDEX, NULL_INDEX};

struct IdHash
{
	size_t operator()(const Id &id) const
	{
		return std::hash<uint64_t>{}((static_cast<uint64_t>(id.slot) << 32) | id.gen);
	}
};

// =============================================================================
// IdAllocator — high-water slots + LIFO free list
//
// Not thread-safe: each ComponentList owns one and only the tick touches it.
// =============================================================================
class IdAllocator
{
	uint32_t highwater = 0;
	std::vector<Id> free_ids;

	Id fresh()
	{
		return Id::make(highwater++, 0);
	}

public:
	Id allocate()
	{
		if (free_ids.empty())
			return fresh();

		Id last = free_ids.back();
		free_ids.pop_back();

		// Slot would wrap into the sentinel generation: retire it for good.
		if (last.gen >= NULL_INDEX - 1)
			return fresh();

		last.gen += 1;
		return last;
	}

	// Caller contract: each allocated id is released at most once.
	void release(Id id) { free_ids.push_back(id); }

	uint32_t high_water() const { return highwater; }
	size_t free_count() const { return free_ids.size(); }
};

// =============================================================================
// SlotMap<T> — contiguous sparse set keyed by Id
//
// Dense items for iteration, sparse slot → dense index for lookup.
// get() rejects ids whose generation no longer matches the occupant.
// Iteration order is insertion order, perturbed by swap-remove.
// =============================================================================
template <typename T>
class SlotMap
{
public:
	std::vector<T> items;
	std::vector<Id> dense_ids;
	std::vector<uint32_t> sparse_indices;

	T *add(Id id, T val)
	{
		uint32_t idx = id.slot;
		if (idx >= sparse_indices.size())
			sparse_indices.resize(static_cast<size_t>(idx) + 1, NULL_INDEX);

		if (sparse_indices[idx] != NULL_INDEX)
		{
			uint32_t dense_idx = sparse_indices[idx];
			dense_ids[dense_idx] = id;
			items[dense_idx] = std::move(val);
			return &items[dense_idx];
		}

		uint32_t dense_idx = static_cast<uint32_t>(items.size());
		sparse_indices[idx] = dense_idx;
		dense_ids.push_back(id);
		items.push_back(std::move(val));
		return &items.back();
	}

	bool remove(Id id)
	{
		uint32_t idx = id.slot;
		if (idx >= sparse_indices.size() || sparse_indices[idx] == NULL_INDEX)
			return false;

		uint32_t dense_idx = sparse_indices[idx];
		if (dense_ids[dense_idx] != id)
			return false;

		uint32_t last_dense_idx = static_cast<uint32_t>(items.size() - 1);
		if (dense_idx != last_dense_idx)
		{
			items[dense_idx] = std::move(items[last_dense_idx]);
			dense_ids[dense_idx] = dense_ids[last_dense_idx];
			sparse_indices[dense_ids[dense_idx].slot] = dense_idx;
		}

		sparse_indices[idx] = NULL_INDEX;
		items.pop_back();
		dense_ids.pop_back();
		return true;
	}

	T *get(Id id)
	{
		uint32_t idx = id.slot;
		if (idx >= sparse_indices.size() || sparse_indices[idx] == NULL_INDEX)
			return nullptr;
		uint32_t dense_idx = sparse_indices[idx];
		if (dense_ids[dense_idx] != id)
			return nullptr;
		return &items[dense_idx];
	}
	const T *get(Id id) const { return const_cast<SlotMap *>(this)->get(id); }

	bool has(Id id) const { return get(id) != nullptr; }
	size_t size() const { return items.size(); }
	Id id_at(size_t dense_idx) const { return dense_ids[dense_idx]; }

	// fn: void(Id, const T&)
	template <typename F>
	void each(F &&fn) const
	{
		for (size_t i = 0; i < items.size(); i++)
			fn(dense_ids[i], items[i]);
	}

	void clear()
	{
		items.clear();
		dense_ids.clear();
		sparse_indices.clear();
	}
};

// =============================================================================
// BlockingQueue<T> — multi-producer queue with close-as-cancellation
//
// pop() suspends the caller until an item arrives or close() is called.
// After close(), pop() returns false immediately; pending items are dropped
// and later pushes are ignored.
// =============================================================================
template <typename T>
class BlockingQueue
{
	std::deque<T> q;
	mutable std::mutex mtx;
	std::condition_variable cv;
	bool closed = false;

public:
	bool push(T item)
	{
		{
			std::lock_guard<std::mutex> lk(mtx);
			if (closed) return false;
			q.push_back(std::move(item));
		}
		cv.notify_one();
		return true;
	}

	bool pop(T &out)
	{
		std::unique_lock<std::mutex> lk(mtx);
		cv.wait(lk, [&] { return closed || !q.empty(); });
		if (closed) return false;
		out = std::move(q.front());
		q.pop_front();
		return true;
	}

	bool try_pop(T &out)
	{
		std::lock_guard<std::mutex> lk(mtx);
		if (closed || q.empty()) return false;
		out = std::move(q.front());
		q.pop_front();
		return true;
	}

	void close()
	{
		{
			std::lock_guard<std::mutex> lk(mtx);
			closed = true;
			q.clear();
		}
		cv.notify_all();
	}

	bool is_closed() const
	{
		std::lock_guard<std::mutex> lk(mtx);
		return closed;
	}

	size_t size() const
	{
		std::lock_guard<std::mutex> lk(mtx);
		return q.size();
	}
};

// =============================================================================
// ThreadGroup — owned worker threads with cooperative reaping
//
// spawn() starts fn on a new thread. reap() joins those that have returned.
// join_all() waits for everything; callers must first make every worker's
// blocking call return (close its queue, shut down its socket).
// =============================================================================
class ThreadGroup
{
	struct Worker
	{
		std::thread thread;
		std::shared_ptr<std::atomic<bool>> done;
	};
	std::vector<Worker> workers;
	std::mutex mtx;

public:
	ThreadGroup() = default;
	ThreadGroup(const ThreadGroup &) = delete;
	ThreadGroup &operator=(const ThreadGroup &) = delete;

	~ThreadGroup() { join_all(); }

	template <typename F>
	void spawn(F &&fn)
	{
		auto done = std::make_shared<std::atomic<bool>>(false);
		std::thread t([f = std::forward<F>(fn), done]() mutable {
			f();
			done->store(true, std::memory_order_release);
		});
		std::lock_guard<std::mutex> lk(mtx);
		workers.push_back({std::move(t), std::move(done)});
	}

	size_t reap()
	{
		std::vector<Worker> finished;
		{
			std::lock_guard<std::mutex> lk(mtx);
			auto it = std::partition(workers.begin(), workers.end(),
				[](const Worker &w) { return !w.done->load(std::memory_order_acquire); });
			std::move(it, workers.end(), std::back_inserter(finished));
			workers.erase(it, workers.end());
		}
		for (auto &w : finished)
			if (w.thread.joinable()) w.thread.join();
		return finished.size();
	}

	// Workers may spawn more workers; loop until none are left.
	void join_all()
	{
		for (;;)
		{
			std::vector<Worker> all;
			{
				std::lock_guard<std::mutex> lk(mtx);
				all.swap(workers);
			}
			if (all.empty())
				return;
			for (auto &w : all)
				if (w.thread.joinable()) w.thread.join();
		}
	}

	size_t size()
	{
		std::lock_guard<std::mutex> lk(mtx);
		return workers.size();
	}
};

// =============================================================================
// Task
// =============================================================================
class Kernel;

struct Task
{
	std::string name;
	float priority = 0;
	bool active = true;

	std::function<void(Kernel &)> fn;

	uint64_t runs = 0, last_us = 0, max_us = 0;

	void record(uint64_t us)
	{
		last_us = us;
		if (us > max_us)
			max_us = us;
		runs++;
	}
};

// =============================================================================
// Kernel — the single-threaded tick
// =============================================================================
class Kernel
{
	std::vector<Task> task_list;
	std::vector<uint16_t> task_order_indices;
	bool tasks_dirty = false;

	float loop_rate = 0.f, raw_dt = 0.f;
	uint64_t tick = 0;
	std::atomic<bool> running{true};
	std::chrono::steady_clock::time_point last_time = std::chrono::steady_clock::now();
	std::vector<std::string> fault_list;

public:
	Kernel() = default;
	Kernel(const Kernel &) = delete;
	Kernel &operator=(const Kernel &) = delete;

	// ====== TIMELINE ======
	void loop_set_rate(float hz) { loop_rate = hz; }
	float loop_dt() const { return raw_dt; }
	uint64_t loop_tick() const { return tick; }

	// Safe from any thread (signal flag pollers, server shutdown).
	void quit() { running.store(false); }
	bool is_running() const { return running.load(); }

	const std::vector<std::string> &faults() const { return fault_list; }

	void loop_run()
	{
		while (is_running())
			loop_once();
	}

	// Execute one tick: sleep to rate, run active tasks in priority order.
	void loop_once()
	{
		auto now = std::chrono::steady_clock::now();

		if (loop_rate > 0.f)
		{
			float target_us = 1e6f / loop_rate;
			float elapsed_us = std::chrono::duration<float, std::micro>(now - last_time).count();
			if (elapsed_us < target_us)
			{
				auto sleep_us = static_cast<int>(target_us - elapsed_us);
				if (sleep_us > 0)
					std::this_thread::sleep_for(std::chrono::microseconds(sleep_us));
			}
			now = std::chrono::steady_clock::now();
		}

		raw_dt = std::min(std::chrono::duration<float>(now - last_time).count(), 0.1f);
		last_time = now;
		tick++;

		if (tasks_dirty)
		{
			task_order_indices.clear();
			for (uint16_t i = 0; i < static_cast<uint16_t>(task_list.size()); i++)
				if (task_list[i].active)
					task_order_indices.push_back(i);
			std::stable_sort(task_order_indices.begin(), task_order_indices.end(),
				[this](uint16_t a, uint16_t b) { return task_list[a].priority < task_list[b].priority; });
			tasks_dirty = false;
		}

		for (size_t oi = 0; oi < task_order_indices.size(); ++oi)
		{
			uint16_t ti = task_order_indices[oi];
			// Index, never a reference: a task may task_add() and reallocate.
			if (!task_list[ti].active || !task_list[ti].fn)
				continue;

			auto t0 = std::chrono::steady_clock::now();
			try
			{
				task_list[ti].fn(*this);
			}
			catch (const TaskFault &e)
			{
				task_list[ti].active = false;
				fault_list.push_back(task_list[ti].name + ": " + e.what());
				tasks_dirty = true;
			}
			task_list[ti].record(static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(
				std::chrono::steady_clock::now() - t0).count()));
		}
	}

	// ====== SCHEDULING ======
	template <typename F>
	void task_add(const std::string &name, float priority, F &&fn)
	{
		Task t;
		t.name = name;
		t.priority = priority;
		t.fn = std::forward<F>(fn);
		task_list.push_back(std::move(t));
		tasks_dirty = true;
	}

	Task *task_get(const std::string &name)
	{
		for (auto &t : task_list)
			if (t.name == name)
				return &t;
		return nullptr;
	}

	void task_stop(const std::string &name)
	{
		for (auto &t : task_list)
			if (t.name == name)
			{
				t.active = false;
				tasks_dirty = true;
			}
	}

	const std::vector<Task> &tasks() const { return task_list; }
};

} // namespace rp
