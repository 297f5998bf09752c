#pragma once
#include "FileSystem.hpp"
#include <map>
#include <string>
#include <vector>

namespace fileops {

// In-memory filesystem for tests. Paths are absolute ("/a/b"); the root
// directory always exists. Faults can be injected per operation and path.
class MockFileSystem : public FileSystem {
public:
  enum class Op {
    Stat, List, OpenRead, OpenWrite, Read, Write, Close,
    Mkdir, RemoveFile, RemoveDir, Rename, ReadLink, Symlink
  };

  MockFileSystem();

  // Tree setup. Missing parent directories are created.
  void addDir(const std::string& path, std::int64_t mtime = 0);
  void addFile(const std::string& path, const std::string& content,
               std::int64_t mtime = 0);
  void addSymlink(const std::string& path, const std::string& target);
  void addSpecial(const std::string& path, EntryKind kind);
  // Paths under "prefix" report a distinct device id; rename across
  // devices fails with EXDEV.
  void addMount(const std::string& prefix);

  // Make "op" on "path" fail with "errnum" after "skip" successful calls.
  void injectFault(Op op, const std::string& path, int errnum, int skip = 0);
  void clearFaults() { faults_.clear(); }

  bool exists(const std::string& path) const;
  std::string content(const std::string& path) const;
  const FileStat* statOf(const std::string& path) const;
  int attributeCopies() const { return attributeCopies_; }

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

private:
  friend class MockReader;
  friend class MockWriter;

  struct Node {
    FileStat    st;
    std::string data;   // file contents
    std::string target; // symlink target
  };

  struct Fault {
    Op op;
    std::string path;
    int errnum;
    int skip;
  };

  // Returns the errno of a matching fault, or 0.
  int faultFor(Op op, const std::string& path);
  bool parentIsDir(const std::string& path) const;
  std::vector<std::string> childrenOf(const std::string& dir) const;
  std::uint64_t deviceOf(const std::string& path) const;
  Node& makeNode(const std::string& path, EntryKind kind);
  void ensureParents(const std::string& path);

  std::map<std::string, Node> nodes_;
  std::vector<Fault> faults_;
  std::vector<std::string> mounts_;
  std::uint64_t nextInode_ = 1;
  int attributeCopies_ = 0;
};

} // namespace fileops
