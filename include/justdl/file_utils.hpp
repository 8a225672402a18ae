#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace justdl {

// Replaces characters unsafe on common filesystems (<>:"/\|?* and control
// characters) with '_', trims leading/trailing dots and spaces and caps the
// length. Never returns an empty name.
[[nodiscard]] std::string sanitizeFilename(const std::string& name);

// Longest prefix of `text` within `max_bytes` that does not split a UTF-8
// sequence.
[[nodiscard]] std::string utf8Prefix(const std::string& text, std::size_t max_bytes);

// Atomically claims `dir/name`, or `dir/stem (n)ext` for the first free n, by
// creating an empty placeholder with O_EXCL. Safe across processes. Throws
// FilesystemError.
[[nodiscard]] std::filesystem::path reserveUniquePath(const std::filesystem::path& dir,
                                                      const std::string& name);

// Moves `source` over an existing reservation. Throws FilesystemError.
void commitFile(const std::filesystem::path& source, const std::filesystem::path& reserved);

// Private scratch directory of one worker, removed on destruction.
class Workspace {
public:
    Workspace(const std::filesystem::path& parent, std::uint64_t task_id);
    ~Workspace();

    Workspace(const Workspace&) = delete;
    Workspace& operator=(const Workspace&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] std::filesystem::path file(const std::string& name) const { return path_ / name; }

private:
    std::filesystem::path path_;
};

[[nodiscard]] std::string formatSize(std::uint64_t bytes);
[[nodiscard]] std::string formatSpeed(double bytes_per_second);

} // namespace justdl
