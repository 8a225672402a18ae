#pragma once

#include "config.hpp"
#include "fetcher.hpp"
#include "media.hpp"
#include "worker.hpp"

#include <memory>
#include <string>

namespace justdl {

// Plain HTTP(S) file: probe, fetch into the workspace, move into place.
class DirectFileWorker final : public Worker {
public:
    explicit DirectFileWorker(std::shared_ptr<Fetcher> fetcher);

    WorkerOutput run(const TaskDescriptor& task, WorkerContext& context) override;

private:
    std::shared_ptr<Fetcher> fetcher_;
};

// Resolve streams, fetch video and/or audio, mux when they are separate.
class MediaWorker final : public Worker {
public:
    MediaWorker(std::shared_ptr<MediaResolver> resolver, std::shared_ptr<Fetcher> fetcher,
                std::shared_ptr<Muxer> muxer, std::string audio_quality);

    WorkerOutput run(const TaskDescriptor& task, WorkerContext& context) override;

private:
    std::shared_ptr<MediaResolver> resolver_;
    std::shared_ptr<Fetcher> fetcher_;
    std::shared_ptr<Muxer> muxer_;
    std::string audio_quality_;
};

struct WorkerServices {
    std::shared_ptr<Fetcher> fetcher;
    std::shared_ptr<MediaResolver> resolver;
    std::shared_ptr<Muxer> muxer;
    std::string audio_quality{"High (m4a)"};
};

// One strategy per TaskKind.
[[nodiscard]] WorkerPtr makeWorker(const TaskDescriptor& task, const WorkerServices& services);

// Production factory: libcurl fetcher with the per-kind retry budget, yt-dlp
// resolver and ffmpeg muxer. Collaborators are created inside the worker
// process, after the fork.
[[nodiscard]] WorkerFactory makeWorkerFactory(const Config& config);

} // namespace justdl
