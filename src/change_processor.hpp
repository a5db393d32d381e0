#pragma once

// Internal header — not installed.
// Single std::jthread consumer draining an unbounded FIFO of submitted
// changes. One processor per Engine; it serializes all conflict and
// version decisions across every session.

#include <bimcollab/change.hpp>

#include <plog/Log.h>

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

namespace bimcollab::detail {

// The queue payload.
struct QueuedChange {
    std::string session_id;
    Change change;
};

class ChangeProcessor {
public:
    using Handler = std::function<void(const QueuedChange&)>;

    explicit ChangeProcessor(Handler handler)
        : handler_{std::move(handler)},
          worker_{[this](std::stop_token st) { worker_loop(st); }} {}

    ~ChangeProcessor() { stop(); }

    ChangeProcessor(const ChangeProcessor&) = delete;
    auto operator=(const ChangeProcessor&) -> ChangeProcessor& = delete;
    ChangeProcessor(ChangeProcessor&&) = delete;
    auto operator=(ChangeProcessor&&) -> ChangeProcessor& = delete;

    // Returns false once stop() has been called; the item is dropped.
    auto enqueue(QueuedChange item) -> bool {
        {
            auto lock = std::scoped_lock{mutex_};
            if (stop_) return false;
            queue_.push_back(std::move(item));
            ++outstanding_;
        }
        cv_.notify_one();
        return true;
    }

    // Blocks until the queue is empty and nothing is in flight.
    void wait_idle() {
        auto lock = std::unique_lock{mutex_};
        idle_cv_.wait(lock, [&] { return outstanding_ == 0; });
    }

    // Drains what is already queued, then joins the worker. Idempotent.
    void stop() {
        {
            auto lock = std::scoped_lock{mutex_};
            stop_ = true;
        }
        cv_.notify_all();
        if (worker_.joinable()) worker_.join();
    }

    auto stopped() const -> bool {
        auto lock = std::scoped_lock{mutex_};
        return stop_;
    }

    // Items queued or being processed.
    auto outstanding() const -> std::size_t {
        auto lock = std::scoped_lock{mutex_};
        return outstanding_;
    }

private:
    void worker_loop(std::stop_token st) {
        while (true) {
            auto item = QueuedChange{};
            {
                auto lock = std::unique_lock{mutex_};
                cv_.wait(lock, [&] {
                    return !queue_.empty() || stop_ || st.stop_requested();
                });
                if (queue_.empty()) {
                    return;
                }
                item = std::move(queue_.front());
                queue_.pop_front();
            }

            // A failing item is dropped so the rest of the queue keeps moving.
            try {
                handler_(item);
            } catch (const std::exception& e) {
                PLOGE << "Error processing change " << item.change.change_id
                      << " for session " << item.session_id << ": " << e.what();
            } catch (...) {
                PLOGE << "Unknown error processing change " << item.change.change_id
                      << " for session " << item.session_id;
            }

            {
                auto lock = std::scoped_lock{mutex_};
                --outstanding_;
            }
            idle_cv_.notify_all();
        }
    }

    Handler handler_;
    std::deque<QueuedChange> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::size_t outstanding_ = 0;
    bool stop_ = false;
    std::jthread worker_;  // last: starts after the members above exist
};

}  // namespace bimcollab::detail
