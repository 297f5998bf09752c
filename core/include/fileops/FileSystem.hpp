// Abstract filesystem used by the operation engine. Concrete backends (local
// POSIX, in-memory mock) must honor this API so the engine stays decoupled
// from where the bytes live.
#pragma once
#include "FileOpsTypes.hpp"
#include <memory>
#include <string>
#include <vector>

namespace fileops {

// Sequential reader over an open source file.
class FileReader {
public:
    virtual ~FileReader() = default;

    // Reads up to "max" bytes into "out". An empty "out" with true means EOF.
    virtual bool read(std::string& out, std::size_t max, std::string& err) = 0;

    // Positions the reader at "offset" bytes from the start.
    virtual bool seek(std::uint64_t offset, std::string& err) = 0;
};

// Sequential writer over an open target file.
class FileWriter {
public:
    virtual ~FileWriter() = default;

    virtual bool write(const std::string& data, std::string& err) = 0;
    virtual bool close(std::string& err) = 0;
};

class FileSystem {
public:
    virtual ~FileSystem() = default;

    // Metadata. Returns false with an empty "err" when the path does not
    // exist. followLinks selects stat() over lstat().
    virtual bool stat(const std::string& path,
                      bool followLinks,
                      FileStat& out,
                      std::string& err) = 0;

    // Directory listing (names only, without "." and "..").
    virtual bool list(const std::string& dir,
                      std::vector<std::string>& names,
                      std::string& err) = 0;

    virtual std::unique_ptr<FileReader> openRead(const std::string& path,
                                                 std::string& err) = 0;

    // Creates or truncates "path"; with append=true keeps existing bytes and
    // writes at the end.
    virtual std::unique_ptr<FileWriter> openWrite(const std::string& path,
                                                  bool append,
                                                  std::string& err) = 0;

    virtual bool mkdir(const std::string& dir,
                       std::string& err,
                       unsigned int mode = 0755) = 0;

    virtual bool removeFile(const std::string& path, std::string& err) = 0;

    virtual bool removeDir(const std::string& dir, std::string& err) = 0;

    // rename(2) semantics. On failure "errnum" carries the errno value so the
    // engine can tell EXDEV/EINVAL apart.
    virtual bool rename(const std::string& from,
                        const std::string& to,
                        std::string& err,
                        int& errnum) = 0;

    virtual bool readLink(const std::string& path,
                          std::string& target,
                          std::string& err) = 0;

    virtual bool symlink(const std::string& target,
                         const std::string& path,
                         std::string& err) = 0;

    // Copies mode, times and ownership from "from" onto "path". Best effort:
    // many filesystems support only part of it, so there is no error result.
    virtual void copyAttributes(const std::string& path, const FileStat& from) = 0;
};

std::string joinPath(const std::string& dir, const std::string& name);
std::string baseName(const std::string& path);

} // namespace fileops
