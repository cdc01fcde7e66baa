#ifndef CALLPROC_SERVICES_BACKGROUND_HPP
#define CALLPROC_SERVICES_BACKGROUND_HPP

#include <cstddef>
#include <functional>
#include <future>
#include <mutex>
#include <string>
#include <vector>

namespace callproc {
namespace services {

// -----------------------------------------------------------------------------
// BackgroundTasks - supervising group for best-effort notifications
// -----------------------------------------------------------------------------
// No backpressure and no result delivery. A task's exception is logged with
// the task name and never rethrown.
class BackgroundTasks {
public:
    BackgroundTasks() = default;
    ~BackgroundTasks();

    BackgroundTasks(const BackgroundTasks&) = delete;
    BackgroundTasks& operator=(const BackgroundTasks&) = delete;

    void spawn(const std::string& name, std::function<void()> fn);

    // Join every task spawned so far
    void wait_all();

    // Tasks still tracked; finished ones are released on the next spawn
    std::size_t retained() const;

    std::size_t failures() const;

private:
    std::vector<std::future<void>> tasks_;
    std::size_t failures_ = 0;
    mutable std::mutex mu_;
};

} // namespace services
} // namespace callproc

#endif // CALLPROC_SERVICES_BACKGROUND_HPP
