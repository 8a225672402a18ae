#pragma once

#include "fetcher.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace justdl {

    // libcurl-backed Fetcher. Sources that advertise a length and byte-range
    // support are split into `segments` ranges fetched on parallel threads;
    // everything else streams on one connection.
    class HttpFetcher final : public Fetcher {
    public:
        struct Options {
            int segments{4};
            int max_attempts{3};
            std::chrono::milliseconds retry_delay{1000};
            std::string user_agent{"justdl/1.0"};
            long connect_timeout_s{30};
            long low_speed_time_s{60};
        };

        explicit HttpFetcher(Options options);
        ~HttpFetcher() override;

        [[nodiscard]] RemoteInfo probe(const std::string& url, const HttpHeaders& headers) override;
        std::uint64_t fetch(const FetchRequest& request, const ProgressFn& on_progress,
                            const CancelFn& should_cancel) override;

    private:
        class Impl;
        std::unique_ptr<Impl> impl_;
    };

} // namespace justdl
