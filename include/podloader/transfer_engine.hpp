#ifndef PODLOADER_TRANSFER_ENGINE_HPP
#define PODLOADER_TRANSFER_ENGINE_HPP

#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <set>

#include <tl/expected.hpp>

#include <podloader/export.hpp>
#include <podloader/context.hpp>
#include <podloader/episode.hpp>
#include <podloader/errors.hpp>
#include <podloader/stager.hpp>
#include <podloader/transfer.hpp>

namespace podloader
{
    namespace fs = std::filesystem;

    class EpisodeStore;
    class EpisodeLocks;
    class StorageMonitor;

    // Runs transfers and keeps the registry of the active ones. Failures are
    // returned to the caller, retry decisions are taken elsewhere.
    class PODLOADER_API TransferEngine
    {
    public:
        TransferEngine(const Context& ctx,
                       EpisodeStore& store,
                       const StorageMonitor& storage,
                       EpisodeLocks& locks);
        ~TransferEngine();

        TransferEngine(const TransferEngine&) = delete;
        TransferEngine& operator=(const TransferEngine&) = delete;

        // Downloads the episode on the calling thread and returns its final path.
        tl::expected<fs::path, DownloadError> download(const Episode& episode);

        // Cancels the active transfer of an episode and waits for its teardown.
        // Returns false if no transfer is registered for `episode_id`.
        bool cancel(std::int64_t episode_id);
        std::size_t cancel_all();

        bool is_active(std::int64_t episode_id) const;
        std::set<std::int64_t> active_ids() const;

        // Observers are called on the transfer threads.
        std::size_t subscribe(progress_callback_t observer);
        void unsubscribe(std::size_t token);

    private:
        bool register_transfer(const std::shared_ptr<Transfer>& transfer);
        void deregister_transfer(const std::shared_ptr<Transfer>& transfer);

        void on_progress(const Episode& episode, const ProgressEvent& event);
        void notify(const ProgressEvent& event);

        DownloadError reclassify_write_error(DownloadError error) const;
        tl::expected<fs::path, DownloadError> fail(const std::shared_ptr<Transfer>& transfer,
                                                   DownloadError error);

        const Context& m_ctx;
        EpisodeStore& m_store;
        const StorageMonitor& m_storage;
        EpisodeLocks& m_locks;
        FileStager m_stager;

        mutable std::mutex m_mutex;
        std::condition_variable m_teardown;
        std::map<std::int64_t, std::shared_ptr<Transfer>> m_active;

        std::mutex m_observers_mutex;
        std::map<std::size_t, progress_callback_t> m_observers;
        std::size_t m_next_token = 1;
    };
}

#endif
