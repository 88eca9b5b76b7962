#pragma once
#ifndef AEGIS_MAINTENANCE_SCHEDULER_H
#define AEGIS_MAINTENANCE_SCHEDULER_H

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <boost/asio.hpp>

namespace aegis {

// Named periodic tasks on a private io_context driven by one worker thread.
// Every task is cancellable; stop() cancels all of them and joins the worker.
class MaintenanceScheduler {
public:
    MaintenanceScheduler();
    ~MaintenanceScheduler();

    MaintenanceScheduler(const MaintenanceScheduler&) = delete;
    MaintenanceScheduler& operator=(const MaintenanceScheduler&) = delete;

    // Registers a task, replacing any task with the same name. The first run
    // happens one interval after start() (or after scheduling, if running).
    void schedule(const std::string& name, std::chrono::milliseconds interval, std::function<void()> task);
    bool cancel(const std::string& name);

    void start();
    void stop();
    bool is_running() const { return running_.load(); }

    size_t task_count() const;
    uint64_t run_count(const std::string& name) const;

private:
    struct Task {
        Task(boost::asio::io_context& io, std::string task_name, std::chrono::milliseconds every,
             std::function<void()> body)
            : name(std::move(task_name)), interval(every), fn(std::move(body)), timer(io) {}

        std::string name;
        std::chrono::milliseconds interval;
        std::function<void()> fn;
        boost::asio::steady_timer timer;
        std::atomic<bool> cancelled{false};
        std::atomic<uint64_t> runs{0};
    };

    void arm(const std::shared_ptr<Task>& task);
    void run_task(const std::shared_ptr<Task>& task);
    void retire(const std::shared_ptr<Task>& task);

    boost::asio::io_context io_context_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_guard_;
    std::thread worker_;
    std::atomic<bool> running_{false};

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Task>> tasks_;
};

}  // namespace aegis

#endif  // AEGIS_MAINTENANCE_SCHEDULER_H
