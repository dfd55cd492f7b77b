#pragma once

#include <functional>

// Executes one unit of work and hands back its result. The uploader only
// ever has one task outstanding, so implementations may block.
class TaskRunner
{
public:
	using Task = std::function<bool()>;

public:
	virtual ~TaskRunner() = default;

public:
	virtual bool Run(Task task) = 0;
};

class InlineTaskRunner final : public TaskRunner
{
public:
	bool Run(Task task) override
	{
		return task ? task() : false;
	}
};
