#pragma once
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace modgraph::fs {

// A location inside a named file system. The path is relative to the file
// system root, '/'-separated, without leading or trailing slashes and with
// "." / ".." segments already resolved. The root itself has an empty path.
class FileSystemPath {
public:
    explicit FileSystemPath(std::string file_system, std::string_view path = {});

    static FileSystemPath root(std::string file_system);

    const std::string& file_system() const { return file_system_; }
    const std::string& path() const { return path_; }
    bool is_root() const { return path_.empty(); }

    // Appends a relative path; ".." never climbs above the file system root.
    FileSystemPath join(std::string_view relative) const;
    FileSystemPath parent() const;
    std::string_view file_name() const;

    // "<file_system>/<path>", the root renders as "<file_system>/"
    std::string to_string() const;

    friend bool operator==(const FileSystemPath& a, const FileSystemPath& b) {
        return a.file_system_ == b.file_system_ && a.path_ == b.path_;
    }
    friend bool operator!=(const FileSystemPath& a, const FileSystemPath& b) {
        return !(a == b);
    }
    friend bool operator<(const FileSystemPath& a, const FileSystemPath& b) {
        if (a.file_system_ != b.file_system_) return a.file_system_ < b.file_system_;
        return a.path_ < b.path_;
    }

private:
    std::string file_system_;
    std::string path_;
};

std::ostream& operator<<(std::ostream& os, const FileSystemPath& path);

// Resolves "." and ".." segments and drops empty segments.
std::string normalize_path(std::string_view path);

} // namespace modgraph::fs

template <>
struct std::hash<modgraph::fs::FileSystemPath> {
    std::size_t operator()(const modgraph::fs::FileSystemPath& p) const noexcept {
        std::size_t h = std::hash<std::string>{}(p.file_system());
        return h ^ (std::hash<std::string>{}(p.path()) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
    }
};
