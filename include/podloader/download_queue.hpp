#ifndef PODLOADER_DOWNLOAD_QUEUE_HPP
#define PODLOADER_DOWNLOAD_QUEUE_HPP

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include <tl/expected.hpp>

#include <podloader/export.hpp>
#include <podloader/episode.hpp>
#include <podloader/errors.hpp>

namespace podloader
{
    namespace fs = std::filesystem;

    using DownloadResult = tl::expected<fs::path, DownloadError>;

    // Fixed pool of workers admitting episodes in FIFO order. At most
    // `max_parallel` jobs run at the same time.
    class PODLOADER_API DownloadQueue
    {
    public:
        using job_t = std::function<DownloadResult(const Episode&)>;
        using future_t = std::shared_future<DownloadResult>;

        DownloadQueue(std::size_t max_parallel, job_t job);
        ~DownloadQueue();

        DownloadQueue(const DownloadQueue&) = delete;
        DownloadQueue& operator=(const DownloadQueue&) = delete;

        // Returns the pending result of the episode, or a kCANCELLED error
        // when the queue is stopped. An episode already queued is not added
        // twice, its pending result is returned instead.
        tl::expected<future_t, DownloadError> try_submit(const Episode& episode);
        // Same as `try_submit` with the refusal folded into the result.
        future_t submit(const Episode& episode);
        // Queues ahead of everything already waiting.
        future_t submit_front(const Episode& episode);

        // Drops a queued episode, its result becomes a kCANCELLED error.
        bool remove(std::int64_t episode_id);

        // Workers finish their current job and take no new one until `resume`.
        // Both return false when the state did not change.
        bool pause();
        bool resume();
        bool paused() const;

        bool is_queued(std::int64_t episode_id) const;
        std::size_t queued() const;
        std::size_t running() const;
        std::size_t peak_running() const;
        // A paused queue with waiting entries is not idle.
        bool idle() const;

        void wait_idle();
        bool wait_idle_for(std::chrono::milliseconds timeout);
        // Waits until no job runs, queued entries are not considered.
        bool wait_running_for(std::chrono::milliseconds timeout);

        bool is_worker_thread() const;

        // Drops queued episodes and joins the workers once the running jobs return.
        void stop();

    private:
        struct Entry
        {
            Episode episode;
            std::promise<DownloadResult> promise;
            future_t future;
        };

        tl::expected<future_t, DownloadError> enqueue(const Episode& episode, bool front);
        void worker_loop();
        static DownloadError cancelled_error(std::int64_t episode_id);
        static future_t refused(DownloadError error);

        job_t m_job;

        mutable std::mutex m_mutex;
        std::condition_variable m_work;
        std::condition_variable m_idle;
        std::deque<std::shared_ptr<Entry>> m_queue;
        std::vector<std::shared_ptr<Entry>> m_running;
        std::size_t m_peak_running = 0;
        bool m_paused = false;
        bool m_stopped = false;

        std::vector<std::thread> m_workers;
    };
}

#endif
