#include "fs_utils.hpp"

#include <algorithm>
#include <string>

namespace fs = std::filesystem;

namespace FsUtils {

    bool Exists(const fs::path& path) {
        std::error_code ec;
        auto status = fs::symlink_status(path, ec);
        return status.type() != fs::file_type::not_found && status.type() != fs::file_type::none;
    }

    std::error_code CopyEntry(const fs::path& from, const fs::path& to) {
        std::error_code ec;
        auto status = fs::symlink_status(from, ec);
        if (ec) return ec;

        if (to.has_parent_path()) {
            fs::create_directories(to.parent_path(), ec);
            if (ec) return ec;
        }

        switch (status.type()) {
        case fs::file_type::directory:
            fs::create_directories(to, ec);
            if (ec) return ec;
            fs::copy(from, to, fs::copy_options::recursive | fs::copy_options::overwrite_existing | fs::copy_options::copy_symlinks, ec);
            return ec;
        case fs::file_type::symlink:
            if (Exists(to)) {
                fs::remove(to, ec);
                if (ec) return ec;
            }
            fs::copy_symlink(from, to, ec);
            return ec;
        case fs::file_type::regular:
            fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
            return ec;
        default:
            return std::make_error_code(std::errc::not_supported);
        }
    }

    std::vector<fs::path> ListFilesRecursive(const fs::path& root, std::error_code& ec) {
        std::vector<fs::path> files;
        ec.clear();

        auto status = fs::symlink_status(root, ec);
        if (ec) return files;
        if (status.type() == fs::file_type::regular) {
            files.emplace_back(".");
            return files;
        }
        if (status.type() != fs::file_type::directory) return files;

        auto it = fs::recursive_directory_iterator(root, ec);
        for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (it->is_regular_file(ec) && !it->is_symlink(ec)) {
                files.emplace_back(it->path().lexically_relative(root));
            }
        }

        std::sort(files.begin(), files.end());
        return files;
    }

    std::error_code RemoveEntry(const fs::path& path, std::size_t& removed) {
        std::error_code ec;
        auto count = fs::remove_all(path, ec);
        if (ec) return ec;
        removed += static_cast<std::size_t>(count);
        return {};
    }

    fs::path SanitizeForBackup(const fs::path& path) {
        // Drop ':' from drive letters and the root separator
        std::string s = path.generic_string();
        std::erase(s, ':');
        while (!s.empty() && s.front() == '/') {
            s.erase(0, 1);
        }
        return fs::path(s).lexically_normal();
    }

}
