#pragma once

#include <thread>
#include <utility>
#include <vector>

namespace listing_ranker {
namespace ranking {

// Owns a set of worker threads and joins every one of them when it goes out
// of scope, including when spawning fails part way through.
class WorkerGroup {
public:
    WorkerGroup() = default;
    ~WorkerGroup() { joinAll(); }

    WorkerGroup(const WorkerGroup&) = delete;
    WorkerGroup& operator=(const WorkerGroup&) = delete;

    void reserve(size_t count) { threads_.reserve(count); }

    template <typename Function, typename... Args>
    void spawn(Function&& function, Args&&... args) {
        threads_.emplace_back(std::forward<Function>(function), std::forward<Args>(args)...);
    }

    void joinAll() {
        for (auto& thread : threads_) {
            if (thread.joinable()) {
                thread.join();
            }
        }
        threads_.clear();
    }

    size_t size() const { return threads_.size(); }

private:
    std::vector<std::thread> threads_;
};

} // namespace ranking
} // namespace listing_ranker
