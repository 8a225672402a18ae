#include "justdl/http_fetcher.hpp"

#include "justdl/detail/curl_utils.hpp"
#include "justdl/errors.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <curl/curl.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <unistd.h>

namespace justdl {

namespace {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

bool startsWithNoCase(const std::string& text, const std::string& prefix) {
    if (text.size() < prefix.size()) {
        return false;
    }
    return std::equal(prefix.begin(), prefix.end(), text.begin(), [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
    });
}

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

std::string headerValue(const std::vector<std::string>& lines, const std::string& name) {
    const std::string prefix = name + ":";
    for (const auto& line : lines) {
        if (startsWithNoCase(line, prefix)) {
            return trim(line.substr(prefix.size()));
        }
    }
    return {};
}

// filename*=UTF-8''name wins over filename="name"
std::string dispositionFilename(const std::string& disposition) {
    const auto extended = disposition.find("filename*=");
    if (extended != std::string::npos) {
        auto value = disposition.substr(extended + 10);
        value = value.substr(0, value.find(';'));
        const auto quote = value.find("''");
        if (quote != std::string::npos) {
            value = value.substr(quote + 2);
        }
        return trim(value);
    }
    const auto plain = disposition.find("filename=");
    if (plain == std::string::npos) {
        return {};
    }
    auto value = trim(disposition.substr(plain + 9));
    if (!value.empty() && value.front() == '"') {
        const auto end = value.find('"', 1);
        return value.substr(1, end == std::string::npos ? std::string::npos : end - 1);
    }
    return trim(value.substr(0, value.find(';')));
}

} // namespace

class HttpFetcher::Impl {
public:
    explicit Impl(Options options) : options_(std::move(options)) {
        options_.segments = std::max(1, options_.segments);
        options_.max_attempts = std::max(1, options_.max_attempts);
        detail::ensureCurlInitialized();
    }

    [[nodiscard]] RemoteInfo probe(const std::string& url, const HttpHeaders& headers) const {
        for (int attempt = 1;; ++attempt) {
            RemoteInfo info;
            const auto failure = fetchMetadata(url, headers, info);
            if (!failure) {
                return info;
            }
            if (!failure->retryable || attempt >= options_.max_attempts) {
                throwError(failure->kind, fmt::format("{}: {}", url, failure->message));
            }
            spdlog::warn("probe {} failed: {} (attempt {}/{})", url, failure->message, attempt,
                         options_.max_attempts);
            std::this_thread::sleep_for(options_.retry_delay);
        }
    }

    std::uint64_t fetch(const FetchRequest& request, const ProgressFn& on_progress, const CancelFn& should_cancel) {
        Transfer transfer{request, on_progress, should_cancel};

        transfer.file.reset(std::fopen(request.destination.c_str(), "wb+"));
        if (!transfer.file) {
            throw FilesystemError("Cannot create destination file " + request.destination.string());
        }

        const RemoteInfo metadata = request.remote ? *request.remote : probe(request.url, request.headers);
        transfer.total = metadata.content_length;

        const bool segmented = metadata.supports_range && metadata.content_length &&
                               *metadata.content_length > 0 && options_.segments > 1;
        if (!segmented) {
            RangeContext ctx{&transfer, 0, 0, 0};
            runWithRetry(transfer, ctx, metadata.supports_range);
        } else {
            const auto total = static_cast<curl_off_t>(*metadata.content_length);
            if (ftruncate(fileno(transfer.file.get()), total) == -1) {
                throw FilesystemError("Cannot resize destination file");
            }

            const curl_off_t part_size =
                std::max<curl_off_t>(1, (total + options_.segments - 1) / options_.segments);
            std::vector<RangeContext> ranges;
            for (int i = 0; i < options_.segments; ++i) {
                const curl_off_t start = static_cast<curl_off_t>(i) * part_size;
                if (start >= total) {
                    break;
                }
                ranges.push_back(RangeContext{&transfer, start, std::min(start + part_size, total), 0});
            }

            std::vector<std::thread> workers;
            workers.reserve(ranges.size());
            for (auto& range : ranges) {
                workers.emplace_back([this, &transfer, &range]() { runWithRetry(transfer, range, true); });
            }
            for (auto& worker : workers) {
                if (worker.joinable()) {
                    worker.join();
                }
            }
        }

        if (std::fflush(transfer.file.get()) != 0) {
            throw FilesystemError("Failed to flush " + request.destination.string());
        }
        transfer.file.reset();

        if (transfer.failure) {
            throwError(transfer.failure->kind, transfer.failure->message);
        }
        if (should_cancel && should_cancel()) {
            throw CancelledError();
        }

        const std::uint64_t downloaded = transfer.downloaded.load();
        if (transfer.total && downloaded != *transfer.total) {
            throw NetworkError(fmt::format("{}: received {} of {} bytes", request.url, downloaded, *transfer.total));
        }
        if (on_progress) {
            on_progress(downloaded, transfer.total.value_or(downloaded));
        }
        return downloaded;
    }

private:
    struct FileDeleter {
        void operator()(FILE* fp) const noexcept {
            if (fp) {
                std::fclose(fp);
            }
        }
    };

    struct Transfer {
        Transfer(const FetchRequest& req, const ProgressFn& progress, const CancelFn& cancel)
            : request(req), on_progress(progress), should_cancel(cancel) {}

        void fail(detail::TransferFailure f) {
            std::lock_guard<std::mutex> lock(state_mutex);
            if (!failure) {
                failure = std::move(f);
            }
            abort = true;
        }

        const FetchRequest& request;
        const ProgressFn& on_progress;
        const CancelFn& should_cancel;

        std::unique_ptr<FILE, FileDeleter> file{};
        std::mutex file_mutex;
        std::mutex state_mutex;
        std::atomic<std::uint64_t> downloaded{0};
        std::optional<std::uint64_t> total;
        std::atomic<bool> abort{false};
        std::optional<detail::TransferFailure> failure;
    };

    // end == 0 means "until the server stops sending".
    struct RangeContext {
        Transfer* owner{nullptr};
        curl_off_t start{0};
        curl_off_t end{0};
        curl_off_t hasWritten{0};
        bool write_failed{false};
        bool overrun{false};
    };

    void applyCommonOptions(CURL* curl, const std::string& url, curl_slist* headers) const {
        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_USERAGENT, options_.user_agent.c_str());
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, options_.connect_timeout_s);
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, options_.low_speed_time_s);
        if (headers) {
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
        }
    }

    static HeaderList buildHeaders(const HttpHeaders& headers) {
        curl_slist* list = nullptr;
        for (const auto& [name, value] : headers) {
            const std::string line = name + ": " + value;
            list = curl_slist_append(list, line.c_str());
        }
        return HeaderList{list, &curl_slist_free_all};
    }

    [[nodiscard]] std::optional<detail::TransferFailure> fetchMetadata(const std::string& url,
                                                                       const HttpHeaders& extra,
                                                                       RemoteInfo& meta) const {
        CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
        if (!curl) {
            return detail::TransferFailure{ErrorKind::WorkerCrash, false, "Failed to allocate curl handle"};
        }

        auto header_list = buildHeaders(extra);
        applyCommonOptions(curl.get(), url, header_list.get());
        curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);

        std::vector<std::string> headers;
        curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION,
            +[](char* ptr, size_t size, size_t nmemb, void* userdata) -> size_t {
                auto* out = static_cast<std::vector<std::string>*>(userdata);
                std::string line(ptr, size * nmemb);
                // a new status line starts the headers of the next redirect hop
                if (line.rfind("HTTP/", 0) == 0) {
                    out->clear();
                }
                out->push_back(std::move(line));
                return size * nmemb;
            });
        curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &headers);

        const CURLcode res = curl_easy_perform(curl.get());
        long code = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &code);
        if (res == CURLE_OK && (code == 405 || code == 501)) {
            // HEAD not allowed: reachable, but nothing known up front
            return std::nullopt;
        }
        if (res != CURLE_OK || code >= 400) {
            return detail::classifyTransfer(res, code);
        }

        meta.supports_range = startsWithNoCase(headerValue(headers, "Accept-Ranges"), "bytes");
        curl_off_t length = -1;
        curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);
        if (length > 0) {
            meta.content_length = static_cast<std::uint64_t>(length);
        }
        meta.filename = dispositionFilename(headerValue(headers, "Content-Disposition"));
        meta.content_type = headerValue(headers, "Content-Type");
        return std::nullopt;
    }

    [[nodiscard]] std::optional<detail::TransferFailure> transferOnce(Transfer& transfer, RangeContext& ctx) {
        CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
        if (!curl) {
            return detail::TransferFailure{ErrorKind::WorkerCrash, false, "Failed to allocate curl handle"};
        }

        auto header_list = buildHeaders(transfer.request.headers);
        applyCommonOptions(curl.get(), transfer.request.url, header_list.get());

        std::string range;
        if (ctx.end > 0) {
            range = std::to_string(ctx.start + ctx.hasWritten) + "-" + std::to_string(ctx.end - 1);
            curl_easy_setopt(curl.get(), CURLOPT_RANGE, range.c_str());
        } else if (ctx.hasWritten > 0) {
            curl_easy_setopt(curl.get(), CURLOPT_RESUME_FROM_LARGE, ctx.hasWritten);
        }
        curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &Impl::writeCallback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, &Impl::xferCallback);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &transfer);

        ctx.write_failed = false;
        ctx.overrun = false;
        const CURLcode res = curl_easy_perform(curl.get());
        long code = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &code);

        if (ctx.overrun) {
            return detail::TransferFailure{ErrorKind::Network, false, "server ignored the byte range request"};
        }
        if (ctx.write_failed) {
            return detail::TransferFailure{ErrorKind::Filesystem, false,
                                           "Failed to write " + transfer.request.destination.string()};
        }
        if (res != CURLE_OK) {
            return detail::classifyTransfer(res, code);
        }
        if (ctx.end > 0 && ctx.hasWritten != ctx.end - ctx.start) {
            return detail::TransferFailure{ErrorKind::Network, true, "Range download incomplete"};
        }
        return std::nullopt;
    }

    void runWithRetry(Transfer& transfer, RangeContext& ctx, bool can_resume) {
        for (int attempt = 1;; ++attempt) {
            auto failure = transferOnce(transfer, ctx);
            if (!failure) {
                return;
            }
            if (transfer.abort || (transfer.should_cancel && transfer.should_cancel())) {
                transfer.fail(detail::TransferFailure{ErrorKind::Cancelled, false, "cancelled"});
                return;
            }
            if (!failure->retryable || attempt >= options_.max_attempts) {
                if (failure->retryable) {
                    failure->message = fmt::format("{} after {} attempts", failure->message, attempt);
                }
                failure->message = fmt::format("{}: {}", transfer.request.url, failure->message);
                transfer.fail(std::move(*failure));
                return;
            }

            spdlog::warn("{}: {} (attempt {}/{}), retrying", transfer.request.url, failure->message, attempt,
                         options_.max_attempts);
            if (!can_resume && ctx.hasWritten > 0) {
                restartFromZero(transfer, ctx);
            }
            if (!sleepUnlessCancelled(transfer)) {
                transfer.fail(detail::TransferFailure{ErrorKind::Cancelled, false, "cancelled"});
                return;
            }
        }
    }

    // Start over from zero for sources that cannot resume.
    static void restartFromZero(Transfer& transfer, RangeContext& ctx) {
        std::lock_guard<std::mutex> lock(transfer.file_mutex);
        transfer.downloaded -= static_cast<std::uint64_t>(ctx.hasWritten);
        ctx.hasWritten = 0;
        if (ftruncate(fileno(transfer.file.get()), 0) == -1) {
            spdlog::warn("cannot truncate {}", transfer.request.destination.string());
        }
    }

    bool sleepUnlessCancelled(const Transfer& transfer) const {
        constexpr std::chrono::milliseconds step{50};
        auto remaining = options_.retry_delay;
        while (remaining.count() > 0) {
            if (transfer.abort || (transfer.should_cancel && transfer.should_cancel())) {
                return false;
            }
            const auto chunk = std::min(step, remaining);
            std::this_thread::sleep_for(chunk);
            remaining -= chunk;
        }
        return !(transfer.should_cancel && transfer.should_cancel());
    }

    static int xferCallback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
        const auto* transfer = static_cast<Transfer*>(userdata);
        if (transfer->abort || (transfer->should_cancel && transfer->should_cancel())) {
            return 1;
        }
        return 0;
    }

    static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* ctx = static_cast<RangeContext*>(userdata);
        if (!ctx || !ctx->owner) {
            return 0;
        }

        Transfer& self = *ctx->owner;
        const size_t total = size * nmemb;
        if (total == 0) {
            return 0;
        }
        if (ctx->end > 0 && ctx->start + ctx->hasWritten + static_cast<curl_off_t>(total) > ctx->end) {
            ctx->overrun = true;
            return 0;
        }

        {
            std::lock_guard<std::mutex> file_lock(self.file_mutex);
            FILE* file = self.file.get();
            if (!file) {
                ctx->write_failed = true;
                return 0;
            }

            if (fseeko(file, ctx->start + ctx->hasWritten, SEEK_SET) != 0) {
                ctx->write_failed = true;
                return 0;
            }

            const size_t written = std::fwrite(ptr, 1, total, file);
            if (written != total) {
                ctx->write_failed = true;
                return written;
            }
            ctx->hasWritten += static_cast<curl_off_t>(written);
        }

        const std::uint64_t done = self.downloaded += total;
        if (self.on_progress) {
            // nothing may unwind through libcurl's frames
            try {
                self.on_progress(done, self.total);
            } catch (const std::exception& ex) {
                self.fail(detail::TransferFailure{ErrorKind::WorkerCrash, false,
                                                  fmt::format("progress report failed: {}", ex.what())});
                return 0;
            }
        }
        return total;
    }

    Options options_;
};

HttpFetcher::HttpFetcher(Options options) : impl_(std::make_unique<Impl>(std::move(options))) {}

HttpFetcher::~HttpFetcher() = default;

RemoteInfo HttpFetcher::probe(const std::string& url, const HttpHeaders& headers) {
    return impl_->probe(url, headers);
}

std::uint64_t HttpFetcher::fetch(const FetchRequest& request, const ProgressFn& on_progress,
                                 const CancelFn& should_cancel) {
    return impl_->fetch(request, on_progress, should_cancel);
}

} // namespace justdl
