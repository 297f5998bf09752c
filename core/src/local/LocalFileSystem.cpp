// Local backend: plain POSIX calls on file descriptors and paths.
// Error strings are strerror() texts; the engine adds the path itself.
#include "fileops/LocalFileSystem.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <string>
#include <vector>

// POSIX
#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>

namespace fileops {

static std::string errnoText(int e) {
    return std::strerror(e);
}

static EntryKind kindFromMode(mode_t m) {
    if (S_ISREG(m)) return EntryKind::File;
    if (S_ISDIR(m)) return EntryKind::Directory;
    if (S_ISLNK(m)) return EntryKind::Symlink;
    if (S_ISCHR(m)) return EntryKind::CharDevice;
    if (S_ISBLK(m)) return EntryKind::BlockDevice;
    if (S_ISFIFO(m)) return EntryKind::Fifo;
    if (S_ISSOCK(m)) return EntryKind::Socket;
    return EntryKind::Unknown;
}

namespace {

class LocalReader : public FileReader {
public:
    explicit LocalReader(int fd) : fd_(fd) {}
    ~LocalReader() override {
        if (fd_ >= 0)
            ::close(fd_);
    }

    bool read(std::string& out, std::size_t max, std::string& err) override {
        out.resize(max);
        ssize_t n;
        do {
            n = ::read(fd_, &out[0], max);
        } while (n < 0 && errno == EINTR);
        if (n < 0) {
            err = errnoText(errno);
            out.clear();
            return false;
        }
        out.resize(static_cast<std::size_t>(n));
        return true;
    }

    bool seek(std::uint64_t offset, std::string& err) override {
        if (::lseek(fd_, static_cast<off_t>(offset), SEEK_SET) == (off_t)-1) {
            err = errnoText(errno);
            return false;
        }
        return true;
    }

private:
    int fd_ = -1;
};

class LocalWriter : public FileWriter {
public:
    explicit LocalWriter(int fd) : fd_(fd) {}
    ~LocalWriter() override {
        if (fd_ >= 0)
            ::close(fd_);
    }

    bool write(const std::string& data, std::string& err) override {
        std::size_t off = 0;
        while (off < data.size()) {
            const ssize_t n = ::write(fd_, data.data() + off, data.size() - off);
            if (n < 0) {
                if (errno == EINTR)
                    continue;
                err = errnoText(errno);
                return false;
            }
            off += static_cast<std::size_t>(n);
        }
        return true;
    }

    bool close(std::string& err) override {
        const int fd = fd_;
        fd_ = -1;
        if (::close(fd) != 0) {
            err = errnoText(errno);
            return false;
        }
        return true;
    }

private:
    int fd_ = -1;
};

} // namespace

bool LocalFileSystem::stat(const std::string& path, bool followLinks,
                           FileStat& out, std::string& err) {
    struct stat st;
    const int rc = followLinks ? ::stat(path.c_str(), &st)
                               : ::lstat(path.c_str(), &st);
    if (rc != 0) {
        // "Does not exist" is not an error for callers probing targets.
        if (errno == ENOENT || errno == ENOTDIR)
            err.clear();
        else
            err = errnoText(errno);
        return false;
    }
    out.kind = kindFromMode(st.st_mode);
    out.size = static_cast<std::uint64_t>(st.st_size);
    out.mtime = static_cast<std::int64_t>(st.st_mtime);
    out.atime = static_cast<std::int64_t>(st.st_atime);
    out.mode = static_cast<std::uint32_t>(st.st_mode & 07777);
    out.uid = static_cast<std::uint32_t>(st.st_uid);
    out.gid = static_cast<std::uint32_t>(st.st_gid);
    out.device = static_cast<std::uint64_t>(st.st_dev);
    out.inode = static_cast<std::uint64_t>(st.st_ino);
    return true;
}

bool LocalFileSystem::list(const std::string& dir,
                           std::vector<std::string>& names,
                           std::string& err) {
    DIR* d = ::opendir(dir.c_str());
    if (!d) {
        err = errnoText(errno);
        return false;
    }
    names.clear();
    errno = 0;
    while (struct dirent* de = ::readdir(d)) {
        const char* n = de->d_name;
        if (std::strcmp(n, ".") == 0 || std::strcmp(n, "..") == 0)
            continue;
        names.emplace_back(n);
    }
    const int readErr = errno;
    ::closedir(d);
    if (readErr != 0) {
        err = errnoText(readErr);
        return false;
    }
    std::sort(names.begin(), names.end());
    return true;
}

std::unique_ptr<FileReader> LocalFileSystem::openRead(const std::string& path,
                                                      std::string& err) {
    const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        err = errnoText(errno);
        return nullptr;
    }
    return std::make_unique<LocalReader>(fd);
}

std::unique_ptr<FileWriter> LocalFileSystem::openWrite(const std::string& path,
                                                       bool append,
                                                       std::string& err) {
    const int flags = append ? (O_WRONLY | O_APPEND | O_CLOEXEC)
                             : (O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC);
    const int fd = ::open(path.c_str(), flags, 0666);
    if (fd < 0) {
        err = errnoText(errno);
        return nullptr;
    }
    return std::make_unique<LocalWriter>(fd);
}

bool LocalFileSystem::mkdir(const std::string& dir, std::string& err,
                            unsigned int mode) {
    if (::mkdir(dir.c_str(), static_cast<mode_t>(mode)) != 0) {
        err = errnoText(errno);
        return false;
    }
    return true;
}

bool LocalFileSystem::removeFile(const std::string& path, std::string& err) {
    if (::unlink(path.c_str()) != 0) {
        err = errnoText(errno);
        return false;
    }
    return true;
}

bool LocalFileSystem::removeDir(const std::string& dir, std::string& err) {
    if (::rmdir(dir.c_str()) != 0) {
        err = errnoText(errno);
        return false;
    }
    return true;
}

bool LocalFileSystem::rename(const std::string& from, const std::string& to,
                             std::string& err, int& errnum) {
    if (::rename(from.c_str(), to.c_str()) != 0) {
        errnum = errno;
        err = errnoText(errnum);
        return false;
    }
    errnum = 0;
    return true;
}

bool LocalFileSystem::readLink(const std::string& path, std::string& target,
                               std::string& err) {
    std::vector<char> buf(256);
    for (;;) {
        const ssize_t n = ::readlink(path.c_str(), buf.data(), buf.size());
        if (n < 0) {
            err = errnoText(errno);
            return false;
        }
        if (static_cast<std::size_t>(n) < buf.size()) {
            target.assign(buf.data(), static_cast<std::size_t>(n));
            return true;
        }
        buf.resize(buf.size() * 2);
    }
}

bool LocalFileSystem::symlink(const std::string& target,
                              const std::string& path, std::string& err) {
    if (::symlink(target.c_str(), path.c_str()) != 0) {
        err = errnoText(errno);
        return false;
    }
    return true;
}

void LocalFileSystem::copyAttributes(const std::string& path,
                                     const FileStat& from) {
    // Best effort: each call may fail on its own (chown as non-root, no
    // modes on FAT) without affecting the others.
    struct timeval tv[2];
    tv[0].tv_sec = static_cast<time_t>(from.atime);
    tv[0].tv_usec = 0;
    tv[1].tv_sec = static_cast<time_t>(from.mtime);
    tv[1].tv_usec = 0;
    (void)::chmod(path.c_str(), static_cast<mode_t>(from.mode));
    (void)::utimes(path.c_str(), tv);
    (void)::lchown(path.c_str(), static_cast<uid_t>(from.uid),
                   static_cast<gid_t>(from.gid));
}

} // namespace fileops
