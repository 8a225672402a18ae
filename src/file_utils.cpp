#include "justdl/file_utils.hpp"

#include "justdl/errors.hpp"

#include <cerrno>
#include <cstring>
#include <string_view>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace justdl {

namespace fs = std::filesystem;

namespace {
constexpr std::size_t kMaxFilenameLength = 200;
constexpr std::string_view kUnsafeChars = "<>:\"/\\|?*";
constexpr int kMaxCollisionSuffix = 10000;
} // namespace

std::string utf8Prefix(const std::string& text, std::size_t max_bytes) {
    if (text.size() <= max_bytes) {
        return text;
    }
    std::size_t cut = max_bytes;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return text.substr(0, cut);
}

std::string sanitizeFilename(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (const char ch : name) {
        const auto uc = static_cast<unsigned char>(ch);
        if (uc < 0x20 || uc == 0x7f || kUnsafeChars.find(ch) != std::string_view::npos) {
            out.push_back('_');
        } else {
            out.push_back(ch);
        }
    }

    const auto first = out.find_first_not_of(". ");
    if (first == std::string::npos) {
        return "download";
    }
    const auto last = out.find_last_not_of(". ");
    out = out.substr(first, last - first + 1);

    if (out.size() > kMaxFilenameLength) {
        // keep the extension when truncating
        const auto dot = out.rfind('.');
        const std::size_t ext_len = (dot != std::string::npos && out.size() - dot <= 10) ? out.size() - dot : 0;
        out = utf8Prefix(out, kMaxFilenameLength - ext_len) + out.substr(out.size() - ext_len);
    }
    return out;
}

fs::path reserveUniquePath(const fs::path& dir, const std::string& name) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw FilesystemError(fmt::format("cannot create directory {}: {}", dir.string(), ec.message()));
    }

    const fs::path base{name};
    const std::string stem = base.stem().string();
    const std::string ext = base.extension().string();

    for (int n = 0; n < kMaxCollisionSuffix; ++n) {
        const fs::path candidate = n == 0 ? dir / name : dir / fmt::format("{} ({}){}", stem, n, ext);
        const int fd = ::open(candidate.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
        if (fd >= 0) {
            ::close(fd);
            if (n > 0) {
                spdlog::debug("{} exists, using {}", name, candidate.filename().string());
            }
            return candidate;
        }
        if (errno != EEXIST) {
            throw FilesystemError(fmt::format("cannot create {}: {}", candidate.string(), std::strerror(errno)));
        }
    }
    throw FilesystemError(fmt::format("no free file name for {} in {}", name, dir.string()));
}

void commitFile(const fs::path& source, const fs::path& reserved) {
    std::error_code ec;
    fs::rename(source, reserved, ec);
    if (ec) {
        fs::remove(reserved, ec);
        throw FilesystemError(fmt::format("cannot move {} to {}: {}", source.string(), reserved.string(),
                                          ec.message()));
    }
}

Workspace::Workspace(const fs::path& parent, std::uint64_t task_id)
    : path_(parent / fmt::format(".justdl-{}-{}", task_id, ::getpid())) {
    std::error_code ec;
    fs::create_directories(path_, ec);
    if (ec) {
        throw FilesystemError(fmt::format("cannot create workspace {}: {}", path_.string(), ec.message()));
    }
}

Workspace::~Workspace() {
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        spdlog::warn("cannot remove workspace {}: {}", path_.string(), ec.message());
    }
}

std::string formatSize(std::uint64_t bytes) {
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;

    const double value = static_cast<double>(bytes);
    if (bytes >= static_cast<std::uint64_t>(GB)) {
        return fmt::format("{:.1f} GB", value / GB);
    } else if (bytes >= static_cast<std::uint64_t>(MB)) {
        return fmt::format("{:.1f} MB", value / MB);
    } else if (bytes >= static_cast<std::uint64_t>(KB)) {
        return fmt::format("{:.1f} KB", value / KB);
    } else {
        return fmt::format("{} B", bytes);
    }
}

std::string formatSpeed(double bytes_per_second) {
    if (bytes_per_second <= 0.0) {
        return "--";
    }
    return formatSize(static_cast<std::uint64_t>(bytes_per_second)) + "/s";
}

} // namespace justdl
