#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

#include "TaskRunner.hpp"

// Bounded job queue drained by a fixed set of background workers.
class TaskQueue final : public TaskRunner
{
public:
	using Job = std::function<void()>;

public:
	TaskQueue(const TaskQueue&) = delete;
	TaskQueue& operator=(const TaskQueue&) = delete;

public:
	TaskQueue(size_t workers, size_t capacity);
	~TaskQueue();

public:
	// Blocks while the queue is full. Returns false once Stop() was called.
	bool Submit(Job job);

	// Returns when every submitted job has finished.
	void Wait();

	// Finishes queued jobs, then joins the workers.
	void Stop();

	bool Run(Task task) override;

	size_t GetWorkerCount() const noexcept;

private:
	void WorkerThread();

private:
	const size_t capacity_;

	std::mutex mutex_;
	std::condition_variable not_empty_;
	std::condition_variable not_full_;
	std::condition_variable idle_;
	std::queue<Job> jobs_;
	size_t active_ = 0;
	bool stop_ = false;
	std::vector<std::thread> threads_;
};
