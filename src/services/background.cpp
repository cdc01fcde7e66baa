#include "background.hpp"
#include "../logging.hpp"

#include <algorithm>
#include <chrono>
#include <exception>

namespace callproc {
namespace services {

BackgroundTasks::~BackgroundTasks() {
    wait_all();
}

void BackgroundTasks::spawn(const std::string& name, std::function<void()> fn) {
    auto task = std::async(std::launch::async, [this, name, fn = std::move(fn)]() {
        try {
            fn();
        } catch (const std::exception& e) {
            logging::get_logger("services.background")->error("Background task '{}' failed: {}", name, e.what());
            std::lock_guard<std::mutex> lock(mu_);
            ++failures_;
        }
    });

    std::lock_guard<std::mutex> lock(mu_);
    tasks_.erase(std::remove_if(tasks_.begin(), tasks_.end(),
                                [](const std::future<void>& t) {
                                    return t.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
                                }),
                 tasks_.end());
    tasks_.push_back(std::move(task));
}

void BackgroundTasks::wait_all() {
    for (;;) {
        std::vector<std::future<void>> pending;
        {
            std::lock_guard<std::mutex> lock(mu_);
            pending.swap(tasks_);
        }
        if (pending.empty()) return;
        for (auto& task : pending) task.wait();
    }
}

std::size_t BackgroundTasks::retained() const {
    std::lock_guard<std::mutex> lock(mu_);
    return tasks_.size();
}

std::size_t BackgroundTasks::failures() const {
    std::lock_guard<std::mutex> lock(mu_);
    return failures_;
}

} // namespace services
} // namespace callproc
