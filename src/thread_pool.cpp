// src/thread_pool.cpp
#include "thread_pool.hpp"
#include <iostream> // For logging

namespace MailIngest
{
    namespace Concurrency
    {

        ThreadPool::ThreadPool(size_t num_threads) : stop_all(false)
        {
            if (num_threads == 0)
            {
                throw std::runtime_error("ThreadPool cannot be initialized with 0 threads.");
            }
            workers.reserve(num_threads);
            for (size_t i = 0; i < num_threads; ++i)
            {
                workers.emplace_back(&ThreadPool::workerLoop, this);
            }
            std::cout << "[ThreadPool] Started " << num_threads << " workers" << std::endl;
        }

        ThreadPool::~ThreadPool()
        {
            {
                std::unique_lock<std::mutex> lock(queue_mutex);
                stop_all = true;
            }
            condition.notify_all();
            for (std::thread &worker : workers)
            {
                if (worker.joinable())
                {
                    worker.join();
                }
            }
        }

        void ThreadPool::workerLoop()
        {
            for (;;)
            {
                std::function<void()> task;
                {
                    std::unique_lock<std::mutex> lock(queue_mutex);
                    condition.wait(lock, [this]
                                   { return stop_all || !tasks.empty(); });

                    // Drain the queue before exiting
                    if (stop_all && tasks.empty())
                        return;

                    task = std::move(tasks.front());
                    tasks.pop();
                }
                task();
            }
        }

    } // namespace Concurrency
} // namespace MailIngest
