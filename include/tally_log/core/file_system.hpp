#ifndef TALLY_LOG_FILE_SYSTEM_HPP
#define TALLY_LOG_FILE_SYSTEM_HPP

#include <string>
#include <cerrno>

#include <sys/stat.h>
#ifdef _MSC_VER
#include <direct.h>
#else
#include <unistd.h>
#endif

namespace tally {
namespace detail {

    inline bool pathExists(const std::string &path) {
        struct stat st;
        return stat(path.c_str(), &st) == 0;
    }

    inline bool isDirectory(const std::string &path) {
        struct stat st;
        if (stat(path.c_str(), &st) != 0) return false;
        return (st.st_mode & S_IFMT) == S_IFDIR;
    }

    /// Create @p path and any missing parents.  Returns false with errno set
    /// when a component cannot be created or exists as a non-directory.
    inline bool mkdirRecursive(const std::string &path) {
        if (path.empty()) return true;
        if (isDirectory(path)) return true;
        if (pathExists(path)) {
            errno = ENOTDIR;
            return false;
        }

        size_t slashPos = path.find_last_of("/\\");
        if (slashPos != std::string::npos && slashPos > 0) {
            if (!mkdirRecursive(path.substr(0, slashPos))) return false;
        }
#ifdef _MSC_VER
        if (_mkdir(path.c_str()) == 0) return true;
#else
        if (mkdir(path.c_str(), 0755) == 0) return true;
#endif
        // Another writer may have created it between the check and mkdir.
        return errno == EEXIST && isDirectory(path);
    }

    inline std::string joinPath(const std::string &base, const std::string &name) {
        if (base.empty()) return name;
        char last = base[base.size() - 1];
        if (last == '/' || last == '\\') return base + name;
        return base + "/" + name;
    }

} // namespace detail
} // namespace tally

#endif // TALLY_LOG_FILE_SYSTEM_HPP
