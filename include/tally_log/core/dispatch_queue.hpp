#ifndef TALLY_LOG_DISPATCH_QUEUE_HPP
#define TALLY_LOG_DISPATCH_QUEUE_HPP

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace tally {
namespace detail {

    /// Single worker thread running submitted tasks in FIFO order.
    ///
    /// submit() returns a future that becomes ready once the task has run;
    /// an exception thrown by the task is stored in the future and rethrown
    /// by get().  Tasks are never dropped: stop() refuses new work, runs
    /// everything already queued and joins the worker.
    ///
    /// A task that submits to its own queue runs inline, so waiting on the
    /// returned future from inside a task does not deadlock the worker.
    ///
    /// If the queue is destroyed by one of its own tasks, the worker is
    /// detached and exits once that task returns.  Tasks still queued at that
    /// point are discarded; their futures report std::future_errc::broken_promise.
    class DispatchQueue {
    public:
        DispatchQueue() : m_state(std::make_shared<State>()) {
            m_thread = std::thread(&DispatchQueue::workerLoop, m_state);
            m_workerId = m_thread.get_id();
        }

        ~DispatchQueue() {
            stop();
            if (m_thread.joinable()) {
                // Only reachable from the worker thread itself.
                {
                    std::lock_guard<std::mutex> lock(m_state->mutex);
                    m_state->abandoned = true;
                }
                m_thread.detach();
            }
        }

        DispatchQueue(const DispatchQueue &) = delete;

        DispatchQueue &operator=(const DispatchQueue &) = delete;

        /// @throws std::logic_error if the queue has been stopped.
        std::future<void> submit(std::function<void()> fn) {
            std::packaged_task<void()> task(std::move(fn));
            std::future<void> result = task.get_future();
            if (isWorkerThread()) {
                task();
                return result;
            }
            {
                std::lock_guard<std::mutex> lock(m_state->mutex);
                if (m_state->stopped) {
                    throw std::logic_error("dispatch queue is stopped");
                }
                m_state->tasks.push_back(std::move(task));
            }
            m_state->notEmpty.notify_one();
            return result;
        }

        void stop() {
            {
                std::lock_guard<std::mutex> lock(m_state->mutex);
                m_state->stopped = true;
            }
            m_state->notEmpty.notify_all();
            if (m_thread.joinable() && !isWorkerThread()) {
                m_thread.join();
                // The id may be handed to a new thread once joined.
                m_workerId = std::thread::id();
            }
        }

        size_t pending() const {
            std::lock_guard<std::mutex> lock(m_state->mutex);
            return m_state->tasks.size();
        }

        bool isWorkerThread() const {
            return std::this_thread::get_id() == m_workerId;
        }

    private:
        struct State {
            State() : stopped(false), abandoned(false) {}

            std::mutex mutex;
            std::condition_variable notEmpty;
            std::deque<std::packaged_task<void()> > tasks;
            bool stopped;
            bool abandoned;
        };

        // Owns a reference to the state so a detached worker never touches
        // freed memory.
        static void workerLoop(std::shared_ptr<State> state) {
            std::unique_lock<std::mutex> lock(state->mutex);
            for (;;) {
                state->notEmpty.wait(lock, [&state] { return !state->tasks.empty() || state->stopped; });
                if (state->tasks.empty() || state->abandoned) {
                    return;
                }
                std::packaged_task<void()> task = std::move(state->tasks.front());
                state->tasks.pop_front();
                lock.unlock();

                task();

                lock.lock();
                if (state->abandoned) {
                    return;
                }
            }
        }

        std::shared_ptr<State> m_state;
        std::thread m_thread;
        std::thread::id m_workerId;
    };

} // namespace detail
} // namespace tally

#endif // TALLY_LOG_DISPATCH_QUEUE_HPP
