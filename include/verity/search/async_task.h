#pragma once

#include <verity/core/types.h>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <optional>
#include <string_view>
#include <type_traits>

namespace verity::search {

/**
 * @brief Run fn on executor and return a future for its Result. Without an executor fn runs
 * inline. Exceptions escaping fn become InternalError.
 *
 * fn must own (or share) everything it touches: a caller that gives up waiting returns while the
 * task may still be running.
 */
template <typename Fn>
auto postTask(const std::optional<boost::asio::any_io_executor>& executor, Fn fn)
    -> std::future<std::invoke_result_t<Fn&>> {
    using R = std::invoke_result_t<Fn&>;
    auto promise = std::make_shared<std::promise<R>>();
    auto future = promise->get_future();

    auto run = [promise, fn = std::move(fn)]() mutable {
        try {
            promise->set_value(fn());
        } catch (const std::exception& e) {
            spdlog::error("Background task failed: {}", e.what());
            promise->set_value(R(Error{ErrorCode::InternalError, e.what()}));
        }
    };

    if (executor) {
        boost::asio::post(*executor, std::move(run));
    } else {
        run();
    }
    return future;
}

/**
 * @brief Wait for a posted task until deadline. Expiry yields ErrorCode::Timeout naming the task;
 * a missing deadline waits indefinitely.
 */
template <typename T>
Result<T> awaitTask(std::future<Result<T>>& future,
                    std::optional<std::chrono::steady_clock::time_point> deadline,
                    std::string_view what) {
    if (deadline && future.wait_until(*deadline) != std::future_status::ready) {
        spdlog::warn("{} timed out", what);
        return Error{ErrorCode::Timeout, fmt::format("{} timed out", what)};
    }
    return future.get();
}

// Deadline for a timeout measured from now; zero disables
inline std::optional<std::chrono::steady_clock::time_point>
deadlineAfter(std::chrono::milliseconds timeout) {
    if (timeout.count() <= 0) {
        return std::nullopt;
    }
    return std::chrono::steady_clock::now() + timeout;
}

} // namespace verity::search
