#include "TaskQueue.hpp"

#include <future>
#include <memory>
#include <utility>

TaskQueue::TaskQueue(size_t workers, size_t capacity)
	: capacity_(capacity == 0 ? 1 : capacity)
{
	if (workers == 0)
		workers = 1;

	threads_.reserve(workers);
	for (size_t i = 0; i < workers; ++i)
		threads_.emplace_back(&TaskQueue::WorkerThread, this);
}

TaskQueue::~TaskQueue()
{
	Stop();
}

bool TaskQueue::Submit(Job job)
{
	if (!job)
		return false;

	{
		std::unique_lock<std::mutex> lock(mutex_);
		not_full_.wait(lock, [&] { return stop_ || jobs_.size() < capacity_; });
		if (stop_)
			return false;

		jobs_.push(std::move(job));
	}
	not_empty_.notify_one();

	return true;
}

void TaskQueue::Wait()
{
	std::unique_lock<std::mutex> lock(mutex_);
	idle_.wait(lock, [&] { return jobs_.empty() && active_ == 0; });
}

void TaskQueue::Stop()
{
	{
		std::lock_guard<std::mutex> lock(mutex_);
		stop_ = true;
	}
	not_empty_.notify_all();
	not_full_.notify_all();

	for (auto &thread : threads_) {
		if (thread.joinable())
			thread.join();
	}
	threads_.clear();
}

bool TaskQueue::Run(Task task)
{
	if (!task)
		return false;

	auto done = std::make_shared<std::promise<bool>>();
	std::future<bool> result = done->get_future();

	const bool queued = Submit([task = std::move(task), done] {
		try {
			done->set_value(task());
		} catch (...) {
			done->set_exception(std::current_exception());
		}
	});
	if (!queued)
		return false;

	return result.get();
}

size_t TaskQueue::GetWorkerCount() const noexcept
{
	return threads_.size();
}

void TaskQueue::WorkerThread()
{
	while (true) {
		Job job;
		{
			std::unique_lock<std::mutex> lock(mutex_);
			not_empty_.wait(lock, [&] { return stop_ || !jobs_.empty(); });
			if (stop_ && jobs_.empty())
				break;

			job = std::move(jobs_.front());
			jobs_.pop();
			++active_;
		}
		not_full_.notify_one();

		job();

		{
			std::lock_guard<std::mutex> lock(mutex_);
			--active_;
		}
		idle_.notify_all();
	}
}
