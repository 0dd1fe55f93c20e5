#include <algorithm>
#include <cmath>
#include <cstring>

#include <spdlog/spdlog.h>

#include <podloader/transfer.hpp>
#include <podloader/utils.hpp>

#include "curl_internal.hpp"

namespace podloader
{
    Transfer::Transfer(const Context& ctx,
                       const Episode& episode,
                       fs::path temp_file,
                       progress_callback_t on_chunk)
        : m_ctx(ctx)
        , m_episode_id(episode.episode_id)
        , m_url(episode.audio_url)
        , m_temp_file(std::move(temp_file))
        , m_on_chunk(std::move(on_chunk))
    {
    }

    Transfer::~Transfer()
    {
        if (m_outfile)
        {
            std::error_code ec;
            m_outfile->close(ec);
            if (ec)
            {
                spdlog::error("Could not close file: {}", m_temp_file.string());
            }
        }
    }

    std::size_t Transfer::header_callback(char* buffer,
                                          std::size_t size,
                                          std::size_t nitems,
                                          Transfer* self)
    {
        const std::size_t ret = size * nitems;
        std::string_view header(buffer, ret);

        if (starts_with(header, "HTTP/"))
        {
            // a new status line starts a new response (redirects, 100-continue)
            self->m_response.headers.clear();
            const auto parts = split(strip(header), " ", 2);
            std::optional<std::int64_t> code;
            if (parts.size() > 1)
                code = parse_decimal(parts[1]);
            if (code && *code / 100 == 2)
            {
                self->m_headercb_state = HeaderCbState::kHTTP_STATE_OK;
            }
            else
            {
                spdlog::debug("Header state not OK! {}", strip(header));
                self->m_headercb_state = HeaderCbState::kHTTP_STATE_NOT_OK;
            }
            return ret;
        }

        auto kv = parse_header(header);
        if (!kv.first.empty())
        {
            self->m_response.headers[kv.first] = kv.second;
        }
        return ret;
    }

    std::size_t Transfer::write_callback(char* buffer,
                                         std::size_t size,
                                         std::size_t nitems,
                                         Transfer* self)
    {
        const std::size_t all = size * nitems;

        if (self->cancelled())
        {
            // aborts with CURLE_WRITE_ERROR
            return 0;
        }

        // bodies of error responses never reach the temporary file
        if (self->m_headercb_state == HeaderCbState::kHTTP_STATE_NOT_OK)
        {
            return all;
        }

        const std::size_t written = self->m_outfile->write(buffer, 1, all);
        if (written != all)
        {
            self->m_write_errno = errno;
            spdlog::error("Writing file {}: {}", self->m_temp_file.string(), strerror(errno));
            return 0;
        }
        self->m_loaded += all;

        if (self->m_on_chunk)
        {
            try
            {
                self->m_on_chunk(self->make_progress_event());
            }
            catch (const std::exception& e)
            {
                // never let an exception unwind through libcurl
                self->m_callback_error = e.what();
                return 0;
            }
        }
        return written;
    }

    int Transfer::progress_callback(Transfer* self,
                                    curl_off_t /*total_to_download*/,
                                    curl_off_t /*now_downloaded*/,
                                    curl_off_t /*total_to_upload*/,
                                    curl_off_t /*now_uploaded*/)
    {
        // a non zero value aborts the transfer with CURLE_ABORTED_BY_CALLBACK
        return self->cancelled() ? 1 : 0;
    }

    ProgressEvent Transfer::make_progress_event()
    {
        ProgressEvent event;
        event.episode_id = m_episode_id;
        event.loaded = m_loaded;

        auto length = m_curl_handle->getinfo<curl_off_t>(CURLINFO_CONTENT_LENGTH_DOWNLOAD_T);
        if (length && length.value() > 0)
        {
            event.total = static_cast<std::uintmax_t>(length.value());
            const double ratio
                = static_cast<double>(m_loaded) / static_cast<double>(*event.total);
            m_percentage = std::min(100, static_cast<int>(std::lround(ratio * 100.0)));
        }
        // without a known length the last percentage is kept
        event.percentage = m_percentage;

        const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - m_start;
        if (elapsed.count() > 0.0)
            event.speed = static_cast<double>(m_loaded) / elapsed.count();

        if (event.speed > 0.0 && event.total && *event.total >= m_loaded)
            event.eta = static_cast<double>(*event.total - m_loaded) / event.speed;
        return event;
    }

    tl::expected<void, DownloadError> Transfer::prepare()
    {
        spdlog::info("Opening file {}", m_temp_file.string());

        std::error_code ec;
        m_outfile = std::make_unique<FileIO>(m_temp_file, FileIO::write_binary, ec);
        if (ec)
        {
            m_write_errno = ec.value();
            return tl::unexpected(DownloadError{
                ErrorCode::kWRITE,
                ErrorLevel::SERIOUS,
                fmt::format("Could not open {}: {}", m_temp_file.string(), ec.message()) });
        }

        try
        {
            m_curl_handle = std::make_unique<CURLHandle>(m_ctx, m_url);
            CURLHandle& h = *m_curl_handle;

            h.setopt(CURLOPT_XFERINFOFUNCTION, &Transfer::progress_callback);
            h.setopt(CURLOPT_NOPROGRESS, 0L);
            h.setopt(CURLOPT_XFERINFODATA, this);

            h.setopt(CURLOPT_HEADERFUNCTION, &Transfer::header_callback);
            h.setopt(CURLOPT_HEADERDATA, this);

            h.setopt(CURLOPT_WRITEFUNCTION, &Transfer::write_callback);
            h.setopt(CURLOPT_WRITEDATA, this);
        }
        catch (const std::exception& e)
        {
            return tl::unexpected(
                DownloadError{ ErrorCode::kNETWORK, ErrorLevel::FATAL, e.what() });
        }

        m_headercb_state = HeaderCbState::kDEFAULT;
        return {};
    }

    tl::expected<void, DownloadError> Transfer::run()
    {
        m_thread_id = std::this_thread::get_id();
        m_start = std::chrono::steady_clock::now();

        const CURLcode result = m_curl_handle->perform();

        m_response.fill_values(*m_curl_handle);
        m_thread_id = std::thread::id();

        auto status = check_finished_transfer_status(result);

        // the data has to reach the disk before the rename into the final name
        std::error_code ec;
        const char* step = "sync";
        if (status)
            m_outfile->sync(ec);
        std::error_code close_ec;
        m_outfile->close(close_ec);
        if (!ec && close_ec)
        {
            ec = close_ec;
            step = "close";
        }
        if (ec && m_write_errno == 0)
            m_write_errno = ec.value();

        if (status && ec)
        {
            return tl::unexpected(DownloadError{
                ErrorCode::kWRITE,
                ErrorLevel::SERIOUS,
                fmt::format("Could not {} {}: {}", step, m_temp_file.string(), ec.message()) });
        }
        return status;
    }

    tl::expected<void, DownloadError> Transfer::check_finished_transfer_status(CURLcode result)
    {
        if (cancelled())
        {
            return tl::unexpected(DownloadError{
                ErrorCode::kCANCELLED,
                ErrorLevel::INFO,
                fmt::format("Download of episode {} was cancelled", m_episode_id) });
        }

        if (result != CURLE_OK)
        {
            if (!m_callback_error.empty())
            {
                return tl::unexpected(DownloadError{
                    ErrorCode::kIO,
                    ErrorLevel::SERIOUS,
                    fmt::format("Progress handling failed: {}", m_callback_error) });
            }

            std::string error = fmt::format("CURL error ({}): {} for {} [{}]",
                                            static_cast<int>(result),
                                            curl_easy_strerror(result),
                                            m_url,
                                            m_curl_handle->error_message());
            spdlog::error(error);
            switch (result)
            {
                case CURLE_WRITE_ERROR:
                    return tl::unexpected(
                        DownloadError{ ErrorCode::kWRITE,
                                       ErrorLevel::SERIOUS,
                                       fmt::format("Could not write {}: {}",
                                                   m_temp_file.string(),
                                                   strerror(m_write_errno)) });
                case CURLE_URL_MALFORMAT:
                case CURLE_UNSUPPORTED_PROTOCOL:
                    return tl::unexpected(
                        DownloadError{ ErrorCode::kBAD_URL, ErrorLevel::FATAL, error });
                case CURLE_OPERATION_TIMEDOUT:
                    return tl::unexpected(
                        DownloadError{ ErrorCode::kNETWORK, ErrorLevel::SERIOUS, error });
                default:
                    return tl::unexpected(
                        DownloadError{ ErrorCode::kNETWORK, ErrorLevel::INFO, error });
            }
        }

        // curl return code is CURLE_OK but we need to check status code
        const long code = m_response.http_status;
        if (code && code / 100 != 2)
        {
            DownloadError err{ ErrorCode::kHTTP_STATUS,
                               ErrorLevel::INFO,
                               fmt::format("Status code: {} for {}", code, m_url) };
            err.http_status = code;
            return tl::unexpected(err);
        }

        if (m_loaded == 0)
        {
            return tl::unexpected(DownloadError{ ErrorCode::kNETWORK,
                                                 ErrorLevel::INFO,
                                                 fmt::format("Empty response body for {}", m_url) });
        }
        return {};
    }

    void Transfer::cancel() noexcept
    {
        m_cancelled = true;
    }

    bool Transfer::cancelled() const noexcept
    {
        return m_cancelled;
    }

    bool Transfer::runs_on_this_thread() const noexcept
    {
        return m_thread_id.load() == std::this_thread::get_id();
    }
}
