#pragma once

/*
FATP_META:
  meta_version: 1
  component: SerialExecutor
  file_role: public_header
  path: include/wifimode/SerialExecutor.h
  namespace: wifimode
  layer: Infrastructure
  summary: Single-consumer task queue with delayed tasks and a bounded blocking bridge for other threads.
  api_stability: in_work
  related:
    tests:
      - components/SerialExecutor/tests/test_SerialExecutor.cpp
  hygiene:
    pragma_once: true
    include_guard: false
    defines_total: 0
    defines_unprefixed: 0
    undefs_total: 0
    includes_windows_h: false
*/

/**
 * @file SerialExecutor.h
 * @brief The single logical thread that owns all controller state.
 *
 * @details
 * Tasks run one at a time in due-time order; tasks with equal due time run in
 * posting order. postAtFront() jumps the queue (used to replay deferred
 * controller messages ahead of newer ones).
 *
 * Two ways to drive it:
 * - start() spawns a worker thread that runs tasks as they become due.
 * - dispatchReady() runs every task that is due now on the calling thread.
 *   Combined with a ManualClock this makes delayed work deterministic.
 *
 * Blocking bridge:
 * @code
 * auto primary = executor.call([&] { return controller.primaryOrNull(); },
 *                              ClientModeManagerPtr{}, "getPrimary");
 * @endcode
 * A caller already running on the executor (worker thread, or inside a task
 * being dispatched manually) executes inline. Other callers block for at most
 * the timeout; on timeout they receive the fallback value and the task stays
 * queued, so it may still run later. A supplier that throws abandons the call:
 * the caller receives the fallback value at once and the failure is logged
 * apart from timeouts.
 *
 * A task that throws is logged at critical and dispatch continues, whatever
 * the thrown type.
 */

#include "Expected.h"
#include "Logging.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <utility>

namespace wifimode
{

// ============================================================================
// ManualClock
// ============================================================================

/**
 * @brief Steady-clock stand-in that only moves when told to.
 */
class ManualClock
{
public:
    using TimePoint = std::chrono::steady_clock::time_point;

    [[nodiscard]] TimePoint now() const noexcept
    {
        return TimePoint(std::chrono::nanoseconds(mNanos.load()));
    }

    void advance(std::chrono::milliseconds delta) noexcept
    {
        mNanos.fetch_add(std::chrono::duration_cast<std::chrono::nanoseconds>(delta).count());
    }

private:
    std::atomic<std::int64_t> mNanos{1'000'000'000};
};

// ============================================================================
// SerialExecutor
// ============================================================================

class SerialExecutor
{
public:
    using Clock      = std::chrono::steady_clock;
    using TimePoint  = Clock::time_point;
    using Task       = std::function<void()>;
    using TimeSource = std::function<TimePoint()>;

    static constexpr std::chrono::milliseconds kDefaultTimeout{4000};

    explicit SerialExecutor(std::string name = "wifimode", TimeSource timeSource = {})
        : mName(std::move(name))
        , mNow(timeSource ? std::move(timeSource) : TimeSource(&Clock::now))
    {
    }

    ~SerialExecutor() { stop(); }

    SerialExecutor(const SerialExecutor&) = delete;
    SerialExecutor& operator=(const SerialExecutor&) = delete;

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    /// Spawns the worker thread. No-op if already running.
    void start()
    {
        std::lock_guard<std::mutex> lock(mMutex);
        if (mWorker.joinable())
        {
            return;
        }
        mStopping = false;
        mWorker = std::thread([this] { workerLoop(); });
        mWorkerId.store(mWorker.get_id());
    }

    /// Joins the worker. Tasks still queued are kept and never run by the worker.
    void stop()
    {
        {
            std::lock_guard<std::mutex> lock(mMutex);
            if (!mWorker.joinable())
            {
                return;
            }
            mStopping = true;
        }
        mCv.notify_all();
        if (std::this_thread::get_id() == mWorkerId.load())
        {
            logger().critical("{}: stop() called from its own worker thread", mName);
            mWorker.detach();
        }
        else
        {
            mWorker.join();
        }
        mWorkerId.store(std::thread::id());
    }

    [[nodiscard]] bool isRunning() const
    {
        std::lock_guard<std::mutex> lock(mMutex);
        return mWorker.joinable() && !mStopping;
    }

    [[nodiscard]] const std::string& name() const noexcept { return mName; }

    // -------------------------------------------------------------------------
    // Posting
    // -------------------------------------------------------------------------

    void post(Task task, std::string taskName = {})
    {
        enqueue(Entry{mNow(), std::move(task), std::move(taskName)}, false);
    }

    void postDelayed(Task task, std::chrono::milliseconds delay, std::string taskName = {})
    {
        enqueue(Entry{mNow() + delay, std::move(task), std::move(taskName)}, false);
    }

    /// Runs before every task already queued.
    void postAtFront(Task task, std::string taskName = {})
    {
        enqueue(Entry{TimePoint::min(), std::move(task), std::move(taskName)}, true);
    }

    [[nodiscard]] std::size_t pendingCount() const
    {
        std::lock_guard<std::mutex> lock(mMutex);
        return mQueue.size();
    }

    /// Time until the earliest queued task is due; empty when the queue is empty.
    [[nodiscard]] std::optional<std::chrono::milliseconds> nextDueIn() const
    {
        std::lock_guard<std::mutex> lock(mMutex);
        if (mQueue.empty())
        {
            return std::nullopt;
        }
        const auto now = mNow();
        const auto due = mQueue.front().due;
        if (due <= now)
        {
            return std::chrono::milliseconds(0);
        }
        return std::chrono::ceil<std::chrono::milliseconds>(due - now);
    }

    /**
     * @brief Runs every task due now on the calling thread, including tasks
     *        those tasks post, until none is due.
     *
     * @return Number of tasks run. Zero while the worker thread is running.
     */
    std::size_t dispatchReady()
    {
        if (isRunning())
        {
            logger().warn("{}: dispatchReady() ignored while the worker thread runs", mName);
            return 0;
        }
        std::size_t count = 0;
        while (auto entry = popReady())
        {
            execute(*entry);
            ++count;
        }
        return count;
    }

    /// True on the worker thread or inside a task being dispatched on this thread.
    [[nodiscard]] bool isCurrentThread() const noexcept
    {
        return tDispatching == this || std::this_thread::get_id() == mWorkerId.load();
    }

    // -------------------------------------------------------------------------
    // Blocking bridge
    // -------------------------------------------------------------------------

    void setTimeoutsAreErrors(bool enabled) noexcept { mTimeoutsAreErrors.store(enabled); }
    void setDefaultTimeout(std::chrono::milliseconds timeout) noexcept { mDefaultTimeout = timeout; }

    /**
     * @brief Runs supplier on the executor and waits for its result.
     *
     * @return The supplier's value, or valueOnTimeout when the bound expires
     *         or the supplier throws.
     * @throws std::runtime_error on timeout when timeouts are errors.
     */
    template <typename Supplier>
    [[nodiscard]] std::invoke_result_t<Supplier&> call(Supplier supplier,
                                                       std::invoke_result_t<Supplier&> valueOnTimeout,
                                                       std::string_view taskName,
                                                       std::optional<std::chrono::milliseconds> timeout = std::nullopt)
    {
        using T = std::invoke_result_t<Supplier&>;
        if (isCurrentThread())
        {
            return supplier();
        }

        auto state = std::make_shared<BlockingState<T>>();
        post([state, supplier = std::move(supplier)]() mutable
             {
                 try
                 {
                     state->complete(supplier());
                 }
                 catch (...)
                 {
                     state->abandon();
                     throw;
                 }
             },
             std::string(taskName));

        std::optional<T> value;
        switch (state->waitFor(timeout.value_or(mDefaultTimeout), value))
        {
            case WaitOutcome::Completed:
                return std::move(*value);
            case WaitOutcome::Abandoned:
                logger().error("{}: '{}' failed before producing a result", mName, taskName);
                return valueOnTimeout;
            case WaitOutcome::TimedOut:
                break;
        }
        reportTimeout(taskName, timeout.value_or(mDefaultTimeout));
        return valueOnTimeout;
    }

    /**
     * @brief Runs task on the executor and waits for it to finish.
     *
     * @return Empty on completion, or an error on timeout or task failure.
     */
    [[nodiscard]] fat_p::Expected<void, std::string> run(Task task,
                                                         std::string_view taskName,
                                                         std::optional<std::chrono::milliseconds> timeout = std::nullopt)
    {
        auto completed = call([task = std::move(task)]() mutable
                              {
                                  task();
                                  return true;
                              },
                              false, taskName, timeout);
        if (!completed)
        {
            return fat_p::unexpected(std::string("task '") + std::string(taskName) + "' did not complete");
        }
        return {};
    }

private:
    struct Entry
    {
        TimePoint due;
        Task task;
        std::string name;
    };

    enum class WaitOutcome
    {
        Completed,
        Abandoned,
        TimedOut
    };

    template <typename T>
    class BlockingState
    {
    public:
        void complete(T value)
        {
            {
                std::lock_guard<std::mutex> lock(mMutex);
                mValue.emplace(std::move(value));
                mDone = true;
            }
            mCv.notify_all();
        }

        void abandon()
        {
            {
                std::lock_guard<std::mutex> lock(mMutex);
                mDone = true;
            }
            mCv.notify_all();
        }

        /// Moves the result into out when the supplier completed.
        WaitOutcome waitFor(std::chrono::milliseconds timeout, std::optional<T>& out)
        {
            std::unique_lock<std::mutex> lock(mMutex);
            if (!mCv.wait_for(lock, timeout, [this] { return mDone; }))
            {
                return WaitOutcome::TimedOut;
            }
            if (!mValue)
            {
                return WaitOutcome::Abandoned;
            }
            out = std::move(mValue);
            return WaitOutcome::Completed;
        }

    private:
        std::mutex mMutex;
        std::condition_variable mCv;
        std::optional<T> mValue;
        bool mDone = false;
    };

    /// Marks the calling thread as dispatching for this executor.
    class DispatchScope
    {
    public:
        explicit DispatchScope(const SerialExecutor* executor) noexcept
            : mPrevious(tDispatching)
        {
            tDispatching = executor;
        }
        ~DispatchScope() { tDispatching = mPrevious; }

        DispatchScope(const DispatchScope&) = delete;
        DispatchScope& operator=(const DispatchScope&) = delete;

    private:
        const SerialExecutor* mPrevious;
    };

    inline static thread_local const SerialExecutor* tDispatching = nullptr;

    std::string                mName;
    TimeSource                 mNow;
    mutable std::mutex         mMutex;
    std::condition_variable    mCv;
    std::deque<Entry>          mQueue;
    std::thread                mWorker;
    std::atomic<std::thread::id> mWorkerId{};
    bool                       mStopping = false;
    std::atomic<bool>          mTimeoutsAreErrors{false};
    std::chrono::milliseconds  mDefaultTimeout{kDefaultTimeout};

    void enqueue(Entry entry, bool atFront)
    {
        {
            std::lock_guard<std::mutex> lock(mMutex);
            if (atFront)
            {
                mQueue.push_front(std::move(entry));
            }
            else
            {
                auto it = std::upper_bound(mQueue.begin(), mQueue.end(), entry.due,
                                           [](TimePoint due, const Entry& e) { return due < e.due; });
                mQueue.insert(it, std::move(entry));
            }
        }
        mCv.notify_all();
    }

    std::optional<Entry> popReady()
    {
        std::lock_guard<std::mutex> lock(mMutex);
        if (mQueue.empty() || mQueue.front().due > mNow())
        {
            return std::nullopt;
        }
        Entry entry = std::move(mQueue.front());
        mQueue.pop_front();
        return entry;
    }

    void execute(Entry& entry)
    {
        DispatchScope scope(this);
        try
        {
            entry.task();
        }
        catch (const std::exception& ex)
        {
            logger().critical("{}: task '{}' threw: {}", mName, entry.name, ex.what());
        }
        catch (...)
        {
            logger().critical("{}: task '{}' threw a non-standard exception", mName, entry.name);
        }
    }

    void workerLoop()
    {
        std::unique_lock<std::mutex> lock(mMutex);
        while (!mStopping)
        {
            if (mQueue.empty())
            {
                mCv.wait(lock);
                continue;
            }
            const auto now = mNow();
            if (mQueue.front().due > now)
            {
                mCv.wait_for(lock, mQueue.front().due - now);
                continue;
            }
            Entry entry = std::move(mQueue.front());
            mQueue.pop_front();
            lock.unlock();
            execute(entry);
            lock.lock();
        }
    }

    void reportTimeout(std::string_view taskName, std::chrono::milliseconds timeout)
    {
        logger().error("{}: timed out after {} ms waiting for '{}'", mName, timeout.count(), taskName);
        if (mTimeoutsAreErrors.load())
        {
            throw std::runtime_error(mName + ": timed out waiting for '" + std::string(taskName) + "'");
        }
    }
};

} // namespace wifimode
