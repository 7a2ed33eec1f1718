#include <modgraph/fs/file_system_path.h>
#include <stdexcept>
#include <vector>

namespace modgraph::fs {

std::string normalize_path(std::string_view path) {
    std::vector<std::string_view> segments;
    size_t pos = 0;

    while (pos <= path.size()) {
        size_t next = path.find('/', pos);
        if (next == std::string_view::npos) next = path.size();

        std::string_view segment = path.substr(pos, next - pos);

        if (segment.empty() || segment == ".") {
            // skip
        } else if (segment == "..") {
            if (!segments.empty()) {
                segments.pop_back();
            }
        } else {
            segments.push_back(segment);
        }

        if (next >= path.size()) break;
        pos = next + 1;
    }

    std::string result;
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) result += '/';
        result += segments[i];
    }
    return result;
}

FileSystemPath::FileSystemPath(std::string file_system, std::string_view path)
    : file_system_(std::move(file_system)), path_(normalize_path(path)) {
    if (file_system_.empty()) {
        throw std::invalid_argument("FileSystemPath requires a file system name");
    }
}

FileSystemPath FileSystemPath::root(std::string file_system) {
    return FileSystemPath(std::move(file_system));
}

FileSystemPath FileSystemPath::join(std::string_view relative) const {
    if (path_.empty()) {
        return FileSystemPath(file_system_, relative);
    }
    std::string combined = path_;
    combined += '/';
    combined += relative;
    return FileSystemPath(file_system_, combined);
}

FileSystemPath FileSystemPath::parent() const {
    auto slash = path_.rfind('/');
    if (slash == std::string::npos) {
        return root(file_system_);
    }
    return FileSystemPath(file_system_, std::string_view(path_).substr(0, slash));
}

std::string_view FileSystemPath::file_name() const {
    auto slash = path_.rfind('/');
    if (slash == std::string::npos) return path_;
    return std::string_view(path_).substr(slash + 1);
}

std::string FileSystemPath::to_string() const {
    return file_system_ + "/" + path_;
}

std::ostream& operator<<(std::ostream& os, const FileSystemPath& path) {
    return os << path.to_string();
}

} // namespace modgraph::fs
