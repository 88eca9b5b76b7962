#include "scheduler/maintenance_scheduler.h"
#include <spdlog/spdlog.h>

namespace aegis {

MaintenanceScheduler::MaintenanceScheduler() = default;

MaintenanceScheduler::~MaintenanceScheduler() {
    stop();
    std::lock_guard lock(mutex_);
    tasks_.clear();
}

void MaintenanceScheduler::schedule(const std::string& name, std::chrono::milliseconds interval,
                                    std::function<void()> fn) {
    if (interval.count() <= 0) {
        interval = std::chrono::milliseconds(1);
    }
    auto task = std::make_shared<Task>(io_context_, name, interval, std::move(fn));
    std::shared_ptr<Task> replaced;
    {
        std::lock_guard lock(mutex_);
        auto& slot = tasks_[name];
        replaced = slot;
        slot = task;
    }
    if (replaced) retire(replaced);
    boost::asio::post(io_context_, [this, task]() { arm(task); });
    spdlog::debug("Scheduled maintenance task {} every {}ms", name, interval.count());
}

bool MaintenanceScheduler::cancel(const std::string& name) {
    std::shared_ptr<Task> task;
    {
        std::lock_guard lock(mutex_);
        auto it = tasks_.find(name);
        if (it == tasks_.end()) return false;
        task = it->second;
        tasks_.erase(it);
    }
    retire(task);
    spdlog::debug("Cancelled maintenance task {}", name);
    return true;
}

void MaintenanceScheduler::retire(const std::shared_ptr<Task>& task) {
    task->cancelled.store(true);
    // Timers are only touched from the io thread.
    boost::asio::post(io_context_, [task]() { task->timer.cancel(); });
}

void MaintenanceScheduler::start() {
    if (running_.exchange(true)) return;
    if (io_context_.stopped()) {
        io_context_.restart();
    }
    work_guard_.emplace(boost::asio::make_work_guard(io_context_));
    worker_ = std::thread([this]() {
        io_context_.run();
    });
    spdlog::info("Maintenance scheduler started with {} tasks", task_count());
}

void MaintenanceScheduler::stop() {
    std::map<std::string, std::shared_ptr<Task>> tasks;
    {
        std::lock_guard lock(mutex_);
        tasks.swap(tasks_);
    }
    for (auto& [_, task] : tasks) {
        task->cancelled.store(true);
    }

    if (running_.exchange(false)) {
        work_guard_.reset();
        io_context_.stop();
        if (worker_.joinable()) {
            worker_.join();
        }
        spdlog::info("Maintenance scheduler stopped");
    }

    // No worker is left, so timers can be cancelled from here. Draining the
    // aborted waits releases the tasks they hold.
    for (auto& [_, task] : tasks) {
        task->timer.cancel();
    }
    io_context_.restart();
    io_context_.poll();
}

size_t MaintenanceScheduler::task_count() const {
    std::lock_guard lock(mutex_);
    return tasks_.size();
}

uint64_t MaintenanceScheduler::run_count(const std::string& name) const {
    std::lock_guard lock(mutex_);
    auto it = tasks_.find(name);
    return it != tasks_.end() ? it->second->runs.load() : 0;
}

void MaintenanceScheduler::arm(const std::shared_ptr<Task>& task) {
    if (task->cancelled.load()) return;
    task->timer.expires_after(task->interval);
    task->timer.async_wait([this, task](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted || task->cancelled.load()) return;
        run_task(task);
        arm(task);
    });
}

void MaintenanceScheduler::run_task(const std::shared_ptr<Task>& task) {
    try {
        task->fn();
    } catch (const std::exception& e) {
        spdlog::error("Maintenance task {} failed: {}", task->name, e.what());
    } catch (...) {
        spdlog::error("Maintenance task {} failed: non-standard exception", task->name);
    }
    task->runs.fetch_add(1);
}

}  // namespace aegis
