#include <atomic>
#include <csignal>
#include <fstream>
#include <iostream>
#include <map>
#include <mutex>
#include <set>
#include <thread>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <yaml-cpp/yaml.h>

#include <podloader/podloader.hpp>
#include <podloader/url.hpp>
#include <podloader/utils.hpp>

using namespace podloader;

struct
{
    std::mutex mutex;
    std::map<std::int64_t, ProgressEvent> events;
    bool drawn = false;
} global_progress;

static bool show_progress_bars = true;
static std::atomic<bool> interrupted{ false };

extern "C" void
on_sigint(int)
{
    interrupted = true;
}

void
progress_callback(const ProgressEvent& event)
{
    if (!show_progress_bars)
        return;

    std::lock_guard<std::mutex> lock(global_progress.mutex);
    global_progress.events[event.episode_id] = event;

    std::uintmax_t loaded = 0, total = 0;
    double speed = 0.0;
    for (auto& [id, e] : global_progress.events)
    {
        if (!e.total)
            continue;
        loaded += e.loaded;
        total += *e.total;
        if (e.percentage < 100)
            speed += e.speed;
    }
    if (total == 0)
        return;

    if (global_progress.drawn)
        std::cout << "\x1b[1A\r";
    global_progress.drawn = true;

    const double ratio = static_cast<double>(loaded) / static_cast<double>(total);
    std::size_t bar_width = 50;
    std::size_t pos = static_cast<std::size_t>(bar_width * ratio);
    std::cout << "[";
    for (std::size_t i = 0; i < bar_width; ++i)
    {
        if (i < pos)
            std::cout << "=";
        else if (i == pos)
            std::cout << ">";
        else
            std::cout << " ";
    }
    std::cout << "] " << static_cast<int>(ratio * 100) << " % "
              << format_bytes(static_cast<std::uintmax_t>(speed)) << "/s\n";
    std::cout.flush();
}

void
load_config(Context& ctx, const std::string& file)
{
    spdlog::info("Loading config {}", file);
    YAML::Node config = YAML::LoadFile(file);

    if (config["download_directory"])
        ctx.download_dir = config["download_directory"].as<std::string>();
    if (config["max_concurrent_downloads"])
        ctx.max_parallel_downloads = config["max_concurrent_downloads"].as<long>();
    if (config["retry_attempts"])
        ctx.retry.max_attempts = config["retry_attempts"].as<int>();
    if (config["retry_delay_seconds"])
        ctx.retry.base_delay = std::chrono::milliseconds(
            static_cast<long long>(config["retry_delay_seconds"].as<double>() * 1000));
    if (config["max_retry_delay_seconds"])
        ctx.retry.max_delay = std::chrono::milliseconds(
            static_cast<long long>(config["max_retry_delay_seconds"].as<double>() * 1000));
    if (config["retry_client_errors"])
        ctx.retry.retry_client_errors = config["retry_client_errors"].as<bool>();
    if (config["connect_timeout"])
        ctx.connect_timeout = config["connect_timeout"].as<long>();
    if (config["low_speed_time"])
        ctx.low_speed_time = config["low_speed_time"].as<long>();
    if (config["max_redirects"])
        ctx.max_redirects = config["max_redirects"].as<long>();
    if (config["check_timeout"])
        ctx.check_timeout = config["check_timeout"].as<long>();
    if (config["required_space_mb"])
        ctx.required_space = config["required_space_mb"].as<std::uintmax_t>() * 1024 * 1024;
    if (config["user_agent"])
        ctx.user_agent = config["user_agent"].as<std::string>();
    if (config["disable_ssl"])
        ctx.disable_ssl = config["disable_ssl"].as<bool>();
    if (config["ssl_ca_info"])
        ctx.ssl_ca_info = config["ssl_ca_info"].as<std::string>();
    if (config["proxies"])
        ctx.proxy_map = config["proxies"].as<std::map<std::string, std::string>>();
}

std::optional<Episode>
lookup(const EpisodeStore& store, std::int64_t episode_id)
{
    auto episode = store.get_by_episode_id(episode_id);
    if (!episode)
        std::cerr << "No episode with id " << episode_id << std::endl;
    return episode;
}

// Waits for queued work and retry timers, SIGINT cancels everything.
void
wait_for_pipeline(Pipeline& pipeline)
{
    while (!pipeline.idle())
    {
        if (interrupted)
        {
            std::cout << "\nCancelling downloads..." << std::endl;
            pipeline.cancel_all();
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
}

int
handle_import(const Context& ctx, EpisodeStore& store, const std::string& file)
{
    std::ifstream in(file);
    if (!in)
    {
        spdlog::error("Could not open {}", file);
        return 1;
    }

    nlohmann::json items;
    try
    {
        in >> items;
    }
    catch (const nlohmann::json::parse_error& e)
    {
        spdlog::error("Could not parse {}: {}", file, e.what());
        return 1;
    }
    if (!items.is_array())
    {
        spdlog::error("{} must contain a JSON array of episodes", file);
        return 1;
    }

    std::size_t imported = 0, skipped = 0;
    for (const auto& item : items)
    {
        Episode episode;
        try
        {
            episode = item.get<Episode>();
        }
        catch (const std::exception& e)
        {
            std::cerr << "Skipping invalid entry: " << e.what() << std::endl;
            ++skipped;
            continue;
        }

        // imports always start a fresh lifecycle
        episode.id = 0;
        episode.status = EpisodeStatus::kPENDING;
        episode.progress = 0;
        episode.local_path.clear();
        episode.retry_count = 0;
        episode.last_error.clear();

        if (auto valid = validate_url(ctx, episode.audio_url); !valid)
        {
            std::cerr << "Skipping episode " << episode.episode_id << ": "
                      << valid.error().reason << std::endl;
            ++skipped;
            continue;
        }
        if (!store.insert(episode))
        {
            std::cerr << "Skipping duplicate episode " << episode.episode_id << std::endl;
            ++skipped;
            continue;
        }
        ++imported;
    }

    std::cout << "Imported " << imported << " episodes, skipped " << skipped << std::endl;
    return 0;
}

int
handle_download(Pipeline& pipeline, EpisodeStore& store, const std::vector<std::int64_t>& ids)
{
    const auto recovered = pipeline.recover_interrupted();
    if (recovered)
        std::cout << "Recovered " << recovered << " interrupted downloads" << std::endl;

    std::set<std::int64_t> selected;
    if (ids.empty())
    {
        for (const auto& episode : store.get_by_status(EpisodeStatus::kPENDING))
            selected.insert(episode.episode_id);
        pipeline.enqueue_pending();
    }
    else
    {
        for (auto id : ids)
        {
            auto episode = lookup(store, id);
            if (!episode)
                return 1;
            selected.insert(id);
            pipeline.enqueue(*episode);
        }
    }

    if (selected.empty())
    {
        std::cout << "Nothing to download" << std::endl;
        return 0;
    }

    pipeline.subscribe(progress_callback);
    pipeline.add_listener(
        [](const QueueEvent& event)
        {
            if (event.type == QueueEventType::kFAILED && event.error)
            {
                spdlog::warn("Attempt for episode {} failed: {}",
                             event.episode.episode_id,
                             event.error->reason);
            }
        });
    wait_for_pipeline(pipeline);

    std::size_t downloaded = 0, failed = 0;
    for (auto id : selected)
    {
        auto episode = store.get_by_episode_id(id);
        if (!episode)
            continue;
        if (episode->status == EpisodeStatus::kDOWNLOADED)
            ++downloaded;
        else if (episode->status == EpisodeStatus::kFAILED)
        {
            ++failed;
            std::cerr << "Episode " << id << " failed: " << episode->last_error << std::endl;
        }
    }
    std::cout << downloaded << " downloaded, " << failed << " failed" << std::endl;
    return failed == 0 && !interrupted ? 0 : 1;
}

int
handle_retry(Pipeline& pipeline, EpisodeStore& store, std::int64_t id)
{
    auto episode = lookup(store, id);
    if (!episode)
        return 1;

    pipeline.subscribe(progress_callback);
    auto result = pipeline.retry_now(*episode);
    if (!result)
    {
        if (result.error().code == ErrorCode::kRETRIES_EXHAUSTED)
        {
            std::cerr << result.error().reason << std::endl;
            return 1;
        }
        // further attempts may be scheduled
        wait_for_pipeline(pipeline);
    }

    auto latest = store.get_by_episode_id(id);
    if (latest && latest->status == EpisodeStatus::kDOWNLOADED)
    {
        std::cout << "Downloaded " << latest->local_path << std::endl;
        return 0;
    }
    std::cerr << "Episode " << id << " is " << (latest ? to_string(latest->status) : "gone")
              << (latest ? ": " + latest->last_error : std::string()) << std::endl;
    return 1;
}

int
handle_reset(Pipeline& pipeline, EpisodeStore& store, std::int64_t id)
{
    auto episode = lookup(store, id);
    if (!episode)
        return 1;
    pipeline.reset(*episode);
    std::cout << "Reset retry state of episode " << id << std::endl;
    return 0;
}

int
handle_status(Pipeline& pipeline, const EpisodeStore& store)
{
    std::map<EpisodeStatus, std::size_t> counts;
    fmt::print("{:>12} {:>12} {:<13} {:>4} {:>5}  {}\n",
               "podcast",
               "episode",
               "status",
               "%",
               "tries",
               "title");
    for (const auto& episode : store.get_all())
    {
        ++counts[episode.status];
        fmt::print("{:>12} {:>12} {:<13} {:>4} {:>5}  {}\n",
                   episode.podcast_id,
                   episode.episode_id,
                   to_string(episode.status),
                   episode.progress,
                   episode.retry_count,
                   episode.episode_title);
        if (!episode.last_error.empty())
            fmt::print("{:>28} {}\n", "", episode.last_error);
    }

    std::cout << "\n";
    for (const auto& [status, count] : counts)
        std::cout << to_string(status) << ": " << count << "\n";

    auto stats = pipeline.scheduler().stats();
    std::cout << "pending retries: " << pipeline.scheduler().pending_retries().size()
              << ", average retry count: " << stats.average_retry_count
              << ", max attempts: " << stats.max_attempts << std::endl;

    auto queue = pipeline.stats();
    std::cout << "episodes: " << queue.total_episodes << ", completed: " << queue.completed
              << ", failed: " << queue.failed << std::endl;
    return 0;
}

int
handle_check(const Context& ctx, EpisodeStore& store, std::int64_t id)
{
    auto episode = lookup(store, id);
    if (!episode)
        return 1;

    auto remote = check_url(ctx, episode->audio_url);
    if (!remote)
    {
        std::cerr << "Episode " << id << " is not reachable: " << remote.error().reason
                  << std::endl;
        return 1;
    }
    std::cout << episode->audio_url << "\n  status: " << remote->http_status
              << "\n  size: "
              << (remote->content_length ? format_bytes(*remote->content_length) : "unknown")
              << "\n  type: " << remote->content_type << std::endl;
    if (remote->effective_url != episode->audio_url)
        std::cout << "  redirected to: " << remote->effective_url << std::endl;
    return 0;
}

int
handle_reconcile(Pipeline& pipeline)
{
    auto report = pipeline.reconcile();
    std::cout << "Checked " << report.checked << " episodes, demoted " << report.demoted
              << std::endl;
    for (const auto& issue : report.issues)
        std::cout << "  " << issue << "\n";
    return report.demoted == 0 ? 0 : 1;
}

int
handle_validate(const Pipeline& pipeline, const Context& ctx)
{
    auto report = pipeline.validate_storage();
    if (report.ok)
    {
        std::cout << ctx.download_dir.string() << " is ready" << std::endl;
        return 0;
    }
    for (const auto& issue : report.issues)
        std::cerr << issue << "\n";
    return 1;
}

int
handle_done(Pipeline& pipeline, std::int64_t id)
{
    auto result = pipeline.mark_transcribed(id);
    if (!result)
    {
        std::cerr << result.error().reason << std::endl;
        return 1;
    }
    std::cout << "Moved to " << result->local_path << std::endl;
    return 0;
}

int
handle_restore(Pipeline& pipeline, std::int64_t id)
{
    auto result = pipeline.restore_from_done(id);
    if (!result)
    {
        std::cerr << result.error().reason << std::endl;
        return 1;
    }
    std::cout << "Restored to " << result->local_path << std::endl;
    return 0;
}

int
main(int argc, char** argv)
{
    CLI::App app{ "Podcast episode downloader" };
    app.require_subcommand(1);

    std::string config_file;
    std::string store_file = "episodes.json";
    int verbose = 0;
    bool quiet = false;

    app.add_option("-c,--config", config_file, "YAML configuration file");
    app.add_option("-s,--store", store_file, "Episode store (JSON)");
    app.add_flag("-v,--verbose", verbose, "Verbose output, repeat for more");
    app.add_flag("-q,--quiet", quiet, "Only log errors");

    std::string import_file;
    std::vector<std::int64_t> download_ids;
    std::int64_t episode_id = 0;

    CLI::App* s_import = app.add_subcommand("import", "Import episodes from a JSON file");
    s_import->add_option("file", import_file, "JSON array of episodes")->required();

    CLI::App* s_dl = app.add_subcommand("download", "Download episodes");
    s_dl->add_option("ids", download_ids, "Episode ids, all pending episodes when omitted");

    CLI::App* s_retry = app.add_subcommand("retry", "Retry an episode now");
    s_retry->add_option("id", episode_id, "Episode id")->required();

    CLI::App* s_reset = app.add_subcommand("reset", "Reset the retry state of an episode");
    s_reset->add_option("id", episode_id, "Episode id")->required();

    CLI::App* s_done = app.add_subcommand("done", "Move a downloaded episode to the done folder");
    s_done->add_option("id", episode_id, "Episode id")->required();

    CLI::App* s_restore
        = app.add_subcommand("restore", "Move a transcribed episode back from the done folder");
    s_restore->add_option("id", episode_id, "Episode id")->required();

    CLI::App* s_check = app.add_subcommand("check", "Check that the audio url of an episode answers");
    s_check->add_option("id", episode_id, "Episode id")->required();

    app.add_subcommand("status", "Show all episodes");
    app.add_subcommand("reconcile", "Check downloaded files against the store");
    app.add_subcommand("validate", "Check the download directory");

    CLI11_PARSE(app, argc, argv);

    try
    {
        podloader::Context ctx;
        ctx.set_verbosity(verbose);
        if (quiet)
            ctx.set_log_level(spdlog::level::err);
        show_progress_bars = verbose == 0;

        if (!config_file.empty())
            load_config(ctx, config_file);
        ctx.download_dir = get_env("PODLOADER_DOWNLOAD_DIRECTORY", ctx.download_dir.string());

        JsonEpisodeStore store(store_file);

        if (app.got_subcommand("import"))
            return handle_import(ctx, store, import_file);
        if (app.got_subcommand("check"))
            return handle_check(ctx, store, episode_id);

        Pipeline pipeline(ctx, store);
        std::signal(SIGINT, on_sigint);

        if (app.got_subcommand("download"))
            return handle_download(pipeline, store, download_ids);
        if (app.got_subcommand("retry"))
            return handle_retry(pipeline, store, episode_id);
        if (app.got_subcommand("reset"))
            return handle_reset(pipeline, store, episode_id);
        if (app.got_subcommand("status"))
            return handle_status(pipeline, store);
        if (app.got_subcommand("reconcile"))
            return handle_reconcile(pipeline);
        if (app.got_subcommand("validate"))
            return handle_validate(pipeline, ctx);
        if (app.got_subcommand("done"))
            return handle_done(pipeline, episode_id);
        if (app.got_subcommand("restore"))
            return handle_restore(pipeline, episode_id);
    }
    catch (const YAML::Exception& e)
    {
        spdlog::critical("Invalid configuration: {}", e.what());
        return 1;
    }
    catch (const std::exception& e)
    {
        spdlog::critical(e.what());
        return 1;
    }

    return 0;
}
