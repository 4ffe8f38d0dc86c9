#pragma once

#include <functional>
#include <future>
#include <iostream>
#include <memory>
#include <vector>
#include <boost/thread.hpp>
#include "Queue/BoundedChannel.hpp"

namespace PaperPerp::Utils::Threading
{
    /**
     * Fixed number of boost::threads draining a bounded job channel.
     * submit() blocks while the channel is full, which bounds the amount of
     * outstanding I/O the pool can have queued.
     */
    class WorkerPool {
    public:
        explicit WorkerPool(std::size_t workers, std::size_t queue_capacity = 64)
            : jobs_(queue_capacity)
        {
            if (workers == 0) workers = 1;
            for (std::size_t i = 0; i < workers; ++i) {
                threads_.create_thread([this] { worker_loop(); });
            }
        }

        WorkerPool(const WorkerPool&) = delete;
        WorkerPool& operator=(const WorkerPool&) = delete;

        ~WorkerPool() {
            shutdown();
        }

        template <typename Fn>
        auto submit(Fn fn) -> std::future<decltype(fn())> {
            using Result = decltype(fn());
            auto task = std::make_shared<std::packaged_task<Result()>>(std::move(fn));
            std::future<Result> result = task->get_future();
            if (!jobs_.Send([task] { (*task)(); })) {
                throw std::runtime_error("WorkerPool is shut down");
            }
            return result;
        }

        std::size_t size() const { return threads_.size(); }

        void shutdown() {
            jobs_.Close();
            threads_.join_all();
        }

    private:
        Queue::BoundedChannel<std::function<void()>> jobs_;
        boost::thread_group threads_;

        void worker_loop() {
            while (auto job = jobs_.Receive()) {
                (*job)();
            }
        }
    };
}
