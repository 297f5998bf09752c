#pragma once
#include "FileSystem.hpp"
#include <string>
#include <vector>

namespace fileops {

// POSIX backend over the local disk.
class LocalFileSystem : public FileSystem {
public:
  bool stat(const std::string& path, bool followLinks, FileStat& out,
            std::string& err) override;
  bool list(const std::string& dir, std::vector<std::string>& names,
            std::string& err) override;

  std::unique_ptr<FileReader> openRead(const std::string& path,
                                       std::string& err) override;
  std::unique_ptr<FileWriter> openWrite(const std::string& path, bool append,
                                        std::string& err) override;

  bool mkdir(const std::string& dir, std::string& err,
             unsigned int mode = 0755) override;
  bool removeFile(const std::string& path, std::string& err) override;
  bool removeDir(const std::string& dir, std::string& err) override;
  bool rename(const std::string& from, const std::string& to,
              std::string& err, int& errnum) override;
  bool readLink(const std::string& path, std::string& target,
                std::string& err) override;
  bool symlink(const std::string& target, const std::string& path,
               std::string& err) override;
  void copyAttributes(const std::string& path, const FileStat& from) override;
};

} // namespace fileops
