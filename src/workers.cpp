#include "justdl/workers.hpp"

#include "justdl/errors.hpp"
#include "justdl/ffmpeg_muxer.hpp"
#include "justdl/file_utils.hpp"
#include "justdl/http_fetcher.hpp"
#include "justdl/url_utils.hpp"
#include "justdl/ytdlp_resolver.hpp"

#include <filesystem>
#include <utility>

#include <spdlog/spdlog.h>

namespace justdl {

namespace fs = std::filesystem;

namespace {

WorkerOutput finalize(const fs::path& file, const fs::path& destination, const std::string& name,
                      std::uint64_t bytes, WorkerContext& context) {
    context.throwIfCancelled();
    context.setStage("finalizing");
    const auto reserved = reserveUniquePath(destination, name);
    commitFile(file, reserved);
    return WorkerOutput{reserved, bytes};
}

std::string withExtension(const std::string& base, const std::string& ext) {
    return ext.empty() ? base : base + "." + ext;
}

} // namespace

DirectFileWorker::DirectFileWorker(std::shared_ptr<Fetcher> fetcher) : fetcher_(std::move(fetcher)) {}

WorkerOutput DirectFileWorker::run(const TaskDescriptor& task, WorkerContext& context) {
    context.setStage("resolving");
    const RemoteInfo remote = fetcher_->probe(task.url, {});
    context.throwIfCancelled();

    std::string name;
    if (!task.filename.empty()) {
        name = sanitizeFilename(task.filename);
    } else if (!remote.filename.empty()) {
        name = sanitizeFilename(remote.filename);
    } else {
        name = filenameFromUrl(task.url);
    }
    context.setFilename(name);
    spdlog::info("task {}: {} -> {} ({})", task.id, task.url, name,
                 remote.content_length ? formatSize(*remote.content_length) : "size unknown");

    Workspace workspace{task.destination, task.id};
    const auto part = workspace.file("download.part");

    context.setStage("downloading");
    FetchRequest request{task.url, {}, part, remote};
    const auto bytes = fetcher_->fetch(
        request, [&context](std::uint64_t done, std::optional<std::uint64_t> total) { context.reportProgress(done, total); },
        context.cancelCheck());

    return finalize(part, task.destination, name, bytes, context);
}

MediaWorker::MediaWorker(std::shared_ptr<MediaResolver> resolver, std::shared_ptr<Fetcher> fetcher,
                         std::shared_ptr<Muxer> muxer, std::string audio_quality)
    : resolver_(std::move(resolver)),
      fetcher_(std::move(fetcher)),
      muxer_(std::move(muxer)),
      audio_quality_(std::move(audio_quality)) {}

WorkerOutput MediaWorker::run(const TaskDescriptor& task, WorkerContext& context) {
    context.setStage("resolving");
    const MediaInfo info = resolver_->resolve(task.url, context.cancelCheck());
    context.throwIfCancelled();

    const bool audio_only = task.kind == TaskKind::MediaAudioOnly;
    const auto selection = selectStreams(info, task.kind, audio_only ? std::string{} : task.quality,
                                         audio_only ? task.quality : audio_quality_);
    if (selection.video) {
        spdlog::info("task {}: video {} ({}, {})", task.id, selection.video->quality_label,
                     selection.video->container, selection.video->format_id);
    }
    if (selection.audio) {
        spdlog::info("task {}: audio {} ({}, {})", task.id, selection.audio->quality_label,
                     selection.audio->container, selection.audio->format_id);
    }

    const std::string base =
        sanitizeFilename(task.filename.empty() ? (info.title.empty() ? "media" : info.title) : task.filename);
    Workspace workspace{task.destination, task.id};

    // one combined progress figure across the two fetches
    std::optional<std::uint64_t> combined_total;
    if (selection.video && selection.video->size && (!selection.audio || selection.audio->size)) {
        combined_total = *selection.video->size + (selection.audio ? *selection.audio->size : 0);
    } else if (!selection.video && selection.audio->size) {
        combined_total = selection.audio->size;
    }
    std::uint64_t fetched_before = 0;
    const auto fetchStream = [&](const StreamDescriptor& stream, const fs::path& target, const char* stage) {
        context.setStage(stage);
        FetchRequest request{stream.url, stream.headers, target, std::nullopt};
        const auto bytes = fetcher_->fetch(
            request,
            [&](std::uint64_t done, std::optional<std::uint64_t> total) {
                std::optional<std::uint64_t> overall = combined_total;
                if (!overall && total) {
                    overall = fetched_before + *total;
                }
                context.reportProgress(fetched_before + done, overall);
            },
            context.cancelCheck());
        fetched_before += bytes;
        return bytes;
    };

    if (!selection.video) {
        const auto& audio = *selection.audio;
        const auto name = withExtension(base, audio.container);
        context.setFilename(name);
        const auto file = workspace.file(withExtension("audio", audio.container));
        const auto bytes = fetchStream(audio, file, "downloading audio");
        return finalize(file, task.destination, name, bytes, context);
    }

    const auto& video = *selection.video;
    if (!selection.needsMux()) {
        const auto name = withExtension(base, video.container);
        context.setFilename(name);
        const auto file = workspace.file(withExtension("video", video.container));
        const auto bytes = fetchStream(video, file, "downloading video");
        return finalize(file, task.destination, name, bytes, context);
    }

    const auto& audio = *selection.audio;
    const std::string container = (video.container == "mp4" && audio.container == "m4a") ? "mp4" : "mkv";
    const auto name = withExtension(base, container);
    context.setFilename(name);

    const auto video_file = workspace.file(withExtension("video", video.container));
    const auto audio_file = workspace.file(withExtension("audio", audio.container));
    fetchStream(video, video_file, "downloading video");
    context.throwIfCancelled();
    fetchStream(audio, audio_file, "downloading audio");
    context.throwIfCancelled();

    context.setStage("muxing");
    const auto muxed = workspace.file(withExtension("muxed", container));
    muxer_->mux(video_file, audio_file, muxed, context.cancelCheck());

    std::error_code ec;
    const auto size = fs::file_size(muxed, ec);
    if (ec) {
        throw MediaProcessingError("muxer produced no output: " + ec.message());
    }
    return finalize(muxed, task.destination, name, static_cast<std::uint64_t>(size), context);
}

WorkerPtr makeWorker(const TaskDescriptor& task, const WorkerServices& services) {
    switch (task.kind) {
        case TaskKind::DirectFile:
            return std::make_unique<DirectFileWorker>(services.fetcher);
        case TaskKind::MediaVideo:
        case TaskKind::MediaAudioOnly:
            return std::make_unique<MediaWorker>(services.resolver, services.fetcher, services.muxer,
                                                 services.audio_quality);
    }
    return nullptr;
}

WorkerFactory makeWorkerFactory(const Config& config) {
    return [config](const TaskDescriptor& task) {
        HttpFetcher::Options options;
        options.segments = task.kind == TaskKind::DirectFile ? config.segments : 1;
        options.max_attempts =
            task.kind == TaskKind::DirectFile ? config.retry_budget.direct_file : config.retry_budget.media;
        options.retry_delay = config.retry_delay;
        options.user_agent = config.user_agent;

        WorkerServices services;
        services.fetcher = std::make_shared<HttpFetcher>(options);
        services.resolver = std::make_shared<YtDlpResolver>(config.ytdlp_path, config.subprocess_timeout);
        services.muxer = std::make_shared<FfmpegMuxer>(config.ffmpeg_path, config.subprocess_timeout);
        services.audio_quality = config.audio_quality;
        return makeWorker(task, services);
    };
}

} // namespace justdl
