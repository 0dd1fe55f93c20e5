#ifndef PODLOADER_PIPELINE_HPP
#define PODLOADER_PIPELINE_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include <tl/expected.hpp>

#include <podloader/export.hpp>
#include <podloader/context.hpp>
#include <podloader/download_queue.hpp>
#include <podloader/enums.hpp>
#include <podloader/episode.hpp>
#include <podloader/errors.hpp>
#include <podloader/locks.hpp>
#include <podloader/retry.hpp>
#include <podloader/stager.hpp>
#include <podloader/storage.hpp>
#include <podloader/transfer_engine.hpp>

namespace podloader
{
    class EpisodeStore;

    struct PODLOADER_API QueueEvent
    {
        QueueEventType type = QueueEventType::kSTARTED;
        Episode episode;
        // set for kCOMPLETED
        std::optional<fs::path> path;
        // set for kFAILED
        std::optional<DownloadError> error;
    };

    using queue_callback_t = std::function<void(const QueueEvent&)>;

    struct PODLOADER_API QueueStats
    {
        std::size_t total_episodes = 0;
        std::size_t queued = 0;
        std::size_t downloading = 0;
        std::size_t completed = 0;
        std::size_t failed = 0;
        // entries held back by a pause
        std::size_t paused = 0;
    };

    // Entry point wiring the queue, the transfer engine and the retry
    // scheduler around one episode store.
    class PODLOADER_API Pipeline
    {
    public:
        Pipeline(const Context& ctx,
                 EpisodeStore& store,
                 std::shared_ptr<StorageMonitor> storage = std::make_shared<StorageMonitor>());
        ~Pipeline();

        Pipeline(const Pipeline&) = delete;
        Pipeline& operator=(const Pipeline&) = delete;

        // Queues the episode and waits for the result of its first attempt.
        DownloadResult download(const Episode& episode);
        std::shared_future<DownloadResult> enqueue(const Episode& episode);
        // Queues every pending episode without a retry timer, returns how many.
        std::size_t enqueue_pending();

        // Removes a queued entry, disarms a retry timer or cancels an active transfer.
        bool cancel(std::int64_t episode_id);
        void cancel_all();

        // Refused with kRETRIES_EXHAUSTED once all attempts are used, see `reset`.
        DownloadResult retry_now(const Episode& episode);
        std::optional<Episode> reset(const Episode& episode);

        ReconcileReport reconcile();
        // Episodes left in `downloading` by a crash go back to pending.
        std::size_t recover_interrupted();

        tl::expected<Episode, DownloadError> mark_transcribed(std::int64_t episode_id);
        tl::expected<Episode, DownloadError> restore_from_done(std::int64_t episode_id);

        StorageReport validate_storage() const;

        std::size_t subscribe(progress_callback_t observer);
        void unsubscribe(std::size_t token);

        // Listeners are called on the worker threads, pause events on the
        // caller's thread. They must not call `pause` themselves.
        std::size_t add_listener(queue_callback_t listener);
        void remove_listener(std::size_t token);

        // Holds the queue and cancels the active transfers. The cancelled
        // episodes go back to pending and are queued first by `resume`.
        std::size_t pause();
        std::size_t resume();
        bool paused() const;

        QueueStats stats() const;

        // Blocks until nothing is queued, running or waiting for a retry.
        void wait_idle();
        bool idle() const;

        void stop();

        TransferEngine& engine() noexcept
        {
            return m_engine;
        }

        RetryScheduler& scheduler() noexcept
        {
            return m_scheduler;
        }

        DownloadQueue& queue() noexcept
        {
            return m_queue;
        }

    private:
        DownloadResult run_attempt(const Episode& episode);
        tl::expected<void, DownloadError> resubmit(const Episode& episode);
        std::optional<Episode> find(const Episode& episode) const;
        void emit(const QueueEvent& event);

        const Context& m_ctx;
        EpisodeStore& m_store;
        std::shared_ptr<StorageMonitor> m_storage;
        EpisodeLocks m_locks;
        FileStager m_stager;
        TransferEngine m_engine;
        RetryScheduler m_scheduler;

        std::mutex m_listeners_mutex;
        std::map<std::size_t, queue_callback_t> m_listeners;
        std::size_t m_next_token = 1;

        mutable std::mutex m_paused_mutex;
        // cancelled by `pause`, queued again by `resume`
        std::vector<std::int64_t> m_paused_ids;

        // last, its workers use everything above
        DownloadQueue m_queue;
    };
}

#endif
