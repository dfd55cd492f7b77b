// Worker queue: job completion, bounded capacity, Run() results and
// shutdown behaviour.

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

#include "TaskQueue.hpp"
#include "TaskRunner.hpp"
#include "TestSupport.hpp"

static void test_submit() {
    std::cout << "\n=== TaskQueue::Submit ===" << std::endl;

    {
        TEST(all_jobs_run_before_wait_returns);
        TaskQueue queue(4, 8);
        ASSERT_EQ(queue.GetWorkerCount(), 4u, "workers");

        std::atomic<int> count{0};
        for (int i = 0; i < 100; ++i)
            ASSERT_TRUE(queue.Submit([&count] { ++count; }), "submit " << i);

        queue.Wait();
        ASSERT_EQ(count.load(), 100, "jobs run");
        PASS();
    }

    {
        TEST(zero_workers_still_gets_one);
        TaskQueue queue(0, 0);
        ASSERT_EQ(queue.GetWorkerCount(), 1u, "workers");
        std::atomic<bool> ran{false};
        ASSERT_TRUE(queue.Submit([&ran] { ran = true; }), "submit");
        queue.Wait();
        ASSERT_TRUE(ran.load(), "job ran");
        PASS();
    }

    {
        TEST(submit_after_stop_fails);
        TaskQueue queue(2, 2);
        queue.Stop();
        ASSERT_TRUE(!queue.Submit([] {}), "submit refused");
        ASSERT_EQ(queue.GetWorkerCount(), 0u, "workers joined");
        ASSERT_TRUE(!queue.Run([] { return true; }), "run refused");
        PASS();
    }

    {
        TEST(stop_drains_queued_jobs);
        std::atomic<int> count{0};
        {
            TaskQueue queue(1, 16);
            for (int i = 0; i < 10; ++i)
                queue.Submit([&count] {
                    std::this_thread::sleep_for(std::chrono::milliseconds(1));
                    ++count;
                });
        }
        ASSERT_EQ(count.load(), 10, "drained on destruction");
        PASS();
    }
}

static void test_run() {
    std::cout << "\n=== TaskRunner::Run ===" << std::endl;

    {
        TEST(run_returns_task_result);
        TaskQueue queue(2, 2);
        ASSERT_TRUE(queue.Run([] { return true; }), "true");
        ASSERT_TRUE(!queue.Run([] { return false; }), "false");
        ASSERT_TRUE(!queue.Run(TaskRunner::Task()), "empty task");
        PASS();
    }

    {
        TEST(run_executes_on_worker_thread);
        TaskQueue queue(1, 1);
        const auto caller = std::this_thread::get_id();
        std::thread::id worker;
        ASSERT_TRUE(queue.Run([&] { worker = std::this_thread::get_id(); return true; }), "run");
        ASSERT_TRUE(worker != caller, "different thread");
        PASS();
    }

    {
        TEST(run_forwards_exceptions);
        TaskQueue queue(1, 1);
        bool caught = false;
        try {
            queue.Run([]() -> bool { throw std::runtime_error("boom"); });
        } catch (const std::runtime_error& e) {
            caught = std::string(e.what()) == "boom";
        }
        ASSERT_TRUE(caught, "exception rethrown");
        ASSERT_TRUE(queue.Run([] { return true; }), "queue still usable");
        PASS();
    }

    {
        TEST(inline_runner);
        InlineTaskRunner runner;
        const auto caller = std::this_thread::get_id();
        std::thread::id seen;
        ASSERT_TRUE(runner.Run([&] { seen = std::this_thread::get_id(); return true; }), "run");
        ASSERT_TRUE(seen == caller, "same thread");
        ASSERT_TRUE(!runner.Run(TaskRunner::Task()), "empty task");
        PASS();
    }
}

int main() {
    std::cout << "task queue test suite" << std::endl;

    test_submit();
    test_run();

    TEST_SUMMARY("task queue");

    return tests_failed > 0 ? 1 : 0;
}
