#pragma once

#include "display.hpp"
#include "progress_handle.hpp"
#include "../common/logger.hpp"
#include <future>
#include <memory>
#include <mutex>
#include <type_traits>
#include <vector>

namespace multibar {
namespace core {

namespace detail {

// One bar shared by every watched future. The last completion closes it.
class AsyncProgress {
public:
    AsyncProgress(ProgressHandle handle, size_t count)
        : handle_(std::move(handle)), remaining_(count) {}

    void complete() noexcept {
        try {
            std::lock_guard<std::mutex> lock(mutex_);
            handle_.advance(1);
            if (remaining_ > 0 && --remaining_ == 0) {
                handle_.close();
            }
        } catch (const std::exception& e) {
            common::Logger::instance().error("[Async] Progress update failed | error={}", e.what());
        }
    }

private:
    std::mutex mutex_;
    ProgressHandle handle_;
    size_t remaining_;
};

class CompletionGuard {
public:
    explicit CompletionGuard(std::shared_ptr<AsyncProgress> progress) : progress_(std::move(progress)) {}
    ~CompletionGuard() { progress_->complete(); }

    CompletionGuard(const CompletionGuard&) = delete;
    CompletionGuard& operator=(const CompletionGuard&) = delete;

private:
    std::shared_ptr<AsyncProgress> progress_;
};

}

// Watches each future on its own thread and advances one shared bar as soon
// as that unit of work finishes, successfully or not. Results and exceptions
// pass through unchanged in the returned futures, in the original order.
template<typename T>
std::vector<std::future<T>> trackAsync(std::vector<std::future<T>> futures,
                                       const std::shared_ptr<Display>& display) {
    auto progress = std::make_shared<detail::AsyncProgress>(
        display->create(static_cast<uint64_t>(futures.size())), futures.size());

    std::vector<std::future<T>> tracked;
    tracked.reserve(futures.size());

    if (futures.empty()) {
        progress.reset();
        return tracked;
    }

    for (auto& future : futures) {
        tracked.push_back(std::async(std::launch::async,
            [progress, source = std::move(future)]() mutable -> T {
                detail::CompletionGuard guard(progress);
                if constexpr (std::is_void_v<T>) {
                    source.get();
                } else {
                    return source.get();
                }
            }));
    }
    return tracked;
}

}}
