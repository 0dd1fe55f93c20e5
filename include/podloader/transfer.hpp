#ifndef PODLOADER_TRANSFER_HPP
#define PODLOADER_TRANSFER_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include <tl/expected.hpp>

#include <podloader/export.hpp>
#include <podloader/context.hpp>
#include <podloader/curl.hpp>
#include <podloader/enums.hpp>
#include <podloader/episode.hpp>
#include <podloader/errors.hpp>
#include <podloader/fileio.hpp>

namespace podloader
{
    namespace fs = std::filesystem;

    class CURLHandle;

    struct PODLOADER_API ProgressEvent
    {
        std::int64_t episode_id = 0;
        std::uintmax_t loaded = 0;
        // Unset when the server did not announce a length.
        std::optional<std::uintmax_t> total;
        int percentage = 0;
        // bytes per second since the transfer started
        double speed = 0.0;
        // seconds, unset when it cannot be estimated
        std::optional<double> eta;
    };

    using progress_callback_t = std::function<void(const ProgressEvent&)>;

    // One blocking HTTP transfer of an episode into its temporary file.
    class PODLOADER_API Transfer
    {
    public:
        static std::size_t header_callback(char* buffer,
                                           std::size_t size,
                                           std::size_t nitems,
                                           Transfer* self);
        static std::size_t write_callback(char* buffer,
                                          std::size_t size,
                                          std::size_t nitems,
                                          Transfer* self);
        static int progress_callback(Transfer* self,
                                     curl_off_t total_to_download,
                                     curl_off_t now_downloaded,
                                     curl_off_t total_to_upload,
                                     curl_off_t now_uploaded);

        // `on_chunk` is called on the transfer thread after every chunk written.
        Transfer(const Context& ctx,
                 const Episode& episode,
                 fs::path temp_file,
                 progress_callback_t on_chunk = {});
        ~Transfer();

        Transfer(const Transfer&) = delete;
        Transfer& operator=(const Transfer&) = delete;

        // Opens the temporary file and prepares the curl handle.
        tl::expected<void, DownloadError> prepare();

        // Runs the transfer to completion on the calling thread.
        tl::expected<void, DownloadError> run();

        // Observed by the next callback invocation of the running transfer.
        void cancel() noexcept;
        bool cancelled() const noexcept;

        bool runs_on_this_thread() const noexcept;

        std::int64_t episode_id() const noexcept
        {
            return m_episode_id;
        }

        const fs::path& temp_file() const noexcept
        {
            return m_temp_file;
        }

        std::uintmax_t loaded() const noexcept
        {
            return m_loaded;
        }

        HeaderCbState headercb_state() const noexcept
        {
            return m_headercb_state;
        }

        const Response& response() const noexcept
        {
            return m_response;
        }

    private:
        tl::expected<void, DownloadError> check_finished_transfer_status(CURLcode result);
        ProgressEvent make_progress_event();

        const Context& m_ctx;
        std::int64_t m_episode_id;
        std::string m_url;
        fs::path m_temp_file;
        progress_callback_t m_on_chunk;

        std::unique_ptr<CURLHandle> m_curl_handle;
        std::unique_ptr<FileIO> m_outfile;
        Response m_response;

        HeaderCbState m_headercb_state = HeaderCbState::kDEFAULT;
        std::atomic<bool> m_cancelled{ false };
        std::atomic<std::thread::id> m_thread_id{};

        std::uintmax_t m_loaded = 0;
        int m_percentage = 0;
        int m_write_errno = 0;
        std::string m_callback_error;
        std::chrono::steady_clock::time_point m_start;
    };
}

#endif
