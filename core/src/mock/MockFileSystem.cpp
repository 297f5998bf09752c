#include "fileops/MockFileSystem.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>

namespace fileops {

static std::string parentOf(const std::string& path) {
  const std::size_t slash = path.find_last_of('/');
  if (slash == std::string::npos || slash == 0) return "/";
  return path.substr(0, slash);
}

static std::string errText(int e) { return std::strerror(e); }

class MockReader : public FileReader {
public:
  MockReader(MockFileSystem* fs, std::string path)
    : fs_(fs), path_(std::move(path)) {}

  bool read(std::string& out, std::size_t max, std::string& err) override {
    out.clear();
    if (int e = fs_->faultFor(MockFileSystem::Op::Read, path_)) {
      err = errText(e);
      return false;
    }
    auto it = fs_->nodes_.find(path_);
    if (it == fs_->nodes_.end()) {
      err = errText(ENOENT);
      return false;
    }
    const std::string& data = it->second.data;
    if (offset_ >= data.size()) return true; // EOF
    out = data.substr(offset_, max);
    offset_ += out.size();
    return true;
  }

  bool seek(std::uint64_t offset, std::string& err) override {
    auto it = fs_->nodes_.find(path_);
    if (it == fs_->nodes_.end()) {
      err = errText(ENOENT);
      return false;
    }
    offset_ = static_cast<std::size_t>(offset);
    return true;
  }

private:
  MockFileSystem* fs_;
  std::string path_;
  std::size_t offset_ = 0;
};

class MockWriter : public FileWriter {
public:
  MockWriter(MockFileSystem* fs, std::string path)
    : fs_(fs), path_(std::move(path)) {}

  bool write(const std::string& data, std::string& err) override {
    if (int e = fs_->faultFor(MockFileSystem::Op::Write, path_)) {
      err = errText(e);
      return false;
    }
    auto it = fs_->nodes_.find(path_);
    if (it == fs_->nodes_.end()) {
      err = errText(ENOENT);
      return false;
    }
    it->second.data += data;
    it->second.st.size = it->second.data.size();
    return true;
  }

  bool close(std::string& err) override {
    if (int e = fs_->faultFor(MockFileSystem::Op::Close, path_)) {
      err = errText(e);
      return false;
    }
    return true;
  }

private:
  MockFileSystem* fs_;
  std::string path_;
};

MockFileSystem::MockFileSystem() {
  makeNode("/", EntryKind::Directory);
}

MockFileSystem::Node& MockFileSystem::makeNode(const std::string& path,
                                               EntryKind kind) {
  Node& n = nodes_[path];
  n.st = FileStat{};
  n.st.kind = kind;
  n.st.mode = kind == EntryKind::Directory ? 0755 : 0644;
  n.st.device = deviceOf(path);
  n.st.inode = nextInode_++;
  n.data.clear();
  n.target.clear();
  return n;
}

void MockFileSystem::ensureParents(const std::string& path) {
  const std::string parent = parentOf(path);
  if (parent == path || nodes_.count(parent)) return;
  ensureParents(parent);
  makeNode(parent, EntryKind::Directory);
}

void MockFileSystem::addDir(const std::string& path, std::int64_t mtime) {
  ensureParents(path);
  makeNode(path, EntryKind::Directory).st.mtime = mtime;
}

void MockFileSystem::addFile(const std::string& path,
                             const std::string& content, std::int64_t mtime) {
  ensureParents(path);
  Node& n = makeNode(path, EntryKind::File);
  n.data = content;
  n.st.size = content.size();
  n.st.mtime = mtime;
}

void MockFileSystem::addSymlink(const std::string& path,
                                const std::string& target) {
  ensureParents(path);
  Node& n = makeNode(path, EntryKind::Symlink);
  n.target = target;
  n.st.size = target.size();
}

void MockFileSystem::addSpecial(const std::string& path, EntryKind kind) {
  ensureParents(path);
  makeNode(path, kind);
}

void MockFileSystem::addMount(const std::string& prefix) {
  mounts_.push_back(prefix);
  for (auto& kv : nodes_) kv.second.st.device = deviceOf(kv.first);
}

void MockFileSystem::injectFault(Op op, const std::string& path, int errnum,
                                 int skip) {
  faults_.push_back({op, path, errnum, skip});
}

int MockFileSystem::faultFor(Op op, const std::string& path) {
  for (auto& f : faults_) {
    if (f.op != op || f.path != path) continue;
    if (f.skip > 0) {
      --f.skip;
      return 0;
    }
    return f.errnum;
  }
  return 0;
}

std::uint64_t MockFileSystem::deviceOf(const std::string& path) const {
  std::uint64_t dev = 1;
  std::size_t best = 0;
  for (std::size_t i = 0; i < mounts_.size(); ++i) {
    const std::string& m = mounts_[i];
    const bool under = path == m ||
        (path.size() > m.size() && path.compare(0, m.size(), m) == 0 &&
         path[m.size()] == '/');
    if (under && m.size() > best) {
      best = m.size();
      dev = i + 2;
    }
  }
  return dev;
}

bool MockFileSystem::parentIsDir(const std::string& path) const {
  auto it = nodes_.find(parentOf(path));
  return it != nodes_.end() && it->second.st.kind == EntryKind::Directory;
}

std::vector<std::string> MockFileSystem::childrenOf(const std::string& dir) const {
  std::vector<std::string> out;
  const std::string prefix = dir == "/" ? "/" : dir + "/";
  for (auto it = nodes_.lower_bound(prefix); it != nodes_.end(); ++it) {
    const std::string& p = it->first;
    if (p.compare(0, prefix.size(), prefix) != 0) break;
    if (p.size() == prefix.size()) continue;
    if (p.find('/', prefix.size()) != std::string::npos) continue;
    out.push_back(p.substr(prefix.size()));
  }
  return out;
}

bool MockFileSystem::exists(const std::string& path) const {
  return nodes_.count(path) != 0;
}

std::string MockFileSystem::content(const std::string& path) const {
  auto it = nodes_.find(path);
  return it == nodes_.end() ? std::string() : it->second.data;
}

const FileStat* MockFileSystem::statOf(const std::string& path) const {
  auto it = nodes_.find(path);
  return it == nodes_.end() ? nullptr : &it->second.st;
}

bool MockFileSystem::stat(const std::string& path, bool followLinks,
                          FileStat& out, std::string& err) {
  if (int e = faultFor(Op::Stat, path)) {
    err = errText(e);
    return false;
  }
  std::string p = path;
  for (int depth = 0; depth < 8; ++depth) {
    auto it = nodes_.find(p);
    if (it == nodes_.end()) {
      err.clear(); // missing
      return false;
    }
    if (!followLinks || it->second.st.kind != EntryKind::Symlink) {
      out = it->second.st;
      return true;
    }
    const std::string& t = it->second.target;
    p = (!t.empty() && t[0] == '/') ? t : joinPath(parentOf(p), t);
  }
  err = errText(ELOOP);
  return false;
}

bool MockFileSystem::list(const std::string& dir,
                          std::vector<std::string>& names, std::string& err) {
  if (int e = faultFor(Op::List, dir)) {
    err = errText(e);
    return false;
  }
  auto it = nodes_.find(dir);
  if (it == nodes_.end()) {
    err = errText(ENOENT);
    return false;
  }
  if (it->second.st.kind != EntryKind::Directory) {
    err = errText(ENOTDIR);
    return false;
  }
  names = childrenOf(dir);
  return true;
}

std::unique_ptr<FileReader> MockFileSystem::openRead(const std::string& path,
                                                     std::string& err) {
  if (int e = faultFor(Op::OpenRead, path)) {
    err = errText(e);
    return nullptr;
  }
  auto it = nodes_.find(path);
  if (it == nodes_.end()) {
    err = errText(ENOENT);
    return nullptr;
  }
  if (it->second.st.kind == EntryKind::Directory) {
    err = errText(EISDIR);
    return nullptr;
  }
  return std::make_unique<MockReader>(this, path);
}

std::unique_ptr<FileWriter> MockFileSystem::openWrite(const std::string& path,
                                                      bool append,
                                                      std::string& err) {
  if (int e = faultFor(Op::OpenWrite, path)) {
    err = errText(e);
    return nullptr;
  }
  auto it = nodes_.find(path);
  if (it != nodes_.end() && it->second.st.kind == EntryKind::Directory) {
    err = errText(EISDIR);
    return nullptr;
  }
  if (it == nodes_.end()) {
    if (append) {
      err = errText(ENOENT);
      return nullptr;
    }
    if (!parentIsDir(path)) {
      err = errText(ENOENT);
      return nullptr;
    }
    makeNode(path, EntryKind::File);
  } else if (!append) {
    it->second.data.clear();
    it->second.st.size = 0;
  }
  return std::make_unique<MockWriter>(this, path);
}

bool MockFileSystem::mkdir(const std::string& dir, std::string& err,
                           unsigned int mode) {
  if (int e = faultFor(Op::Mkdir, dir)) {
    err = errText(e);
    return false;
  }
  if (nodes_.count(dir)) {
    err = errText(EEXIST);
    return false;
  }
  if (!parentIsDir(dir)) {
    err = errText(ENOENT);
    return false;
  }
  makeNode(dir, EntryKind::Directory).st.mode = mode;
  return true;
}

bool MockFileSystem::removeFile(const std::string& path, std::string& err) {
  if (int e = faultFor(Op::RemoveFile, path)) {
    err = errText(e);
    return false;
  }
  auto it = nodes_.find(path);
  if (it == nodes_.end()) {
    err = errText(ENOENT);
    return false;
  }
  if (it->second.st.kind == EntryKind::Directory) {
    err = errText(EISDIR);
    return false;
  }
  nodes_.erase(it);
  return true;
}

bool MockFileSystem::removeDir(const std::string& dir, std::string& err) {
  if (int e = faultFor(Op::RemoveDir, dir)) {
    err = errText(e);
    return false;
  }
  auto it = nodes_.find(dir);
  if (it == nodes_.end()) {
    err = errText(ENOENT);
    return false;
  }
  if (it->second.st.kind != EntryKind::Directory) {
    err = errText(ENOTDIR);
    return false;
  }
  if (!childrenOf(dir).empty()) {
    err = errText(ENOTEMPTY);
    return false;
  }
  nodes_.erase(it);
  return true;
}

bool MockFileSystem::rename(const std::string& from, const std::string& to,
                            std::string& err, int& errnum) {
  errnum = faultFor(Op::Rename, from);
  if (!errnum) {
    auto src = nodes_.find(from);
    auto dst = nodes_.find(to);
    if (src == nodes_.end()) {
      errnum = ENOENT;
    } else if (to.size() > from.size() && to.compare(0, from.size(), from) == 0 &&
               to[from.size()] == '/') {
      errnum = EINVAL;
    } else if (deviceOf(from) != deviceOf(to)) {
      errnum = EXDEV;
    } else if (!parentIsDir(to)) {
      errnum = ENOENT;
    } else if (dst != nodes_.end()) {
      const bool srcDir = src->second.st.kind == EntryKind::Directory;
      const bool dstDir = dst->second.st.kind == EntryKind::Directory;
      if (dstDir && !srcDir) errnum = EISDIR;
      else if (!dstDir && srcDir) errnum = ENOTDIR;
      else if (dstDir && !childrenOf(to).empty()) errnum = ENOTEMPTY;
    }
  }
  if (errnum) {
    err = errText(errnum);
    return false;
  }
  if (from == to) return true;

  // Move the node and everything below it.
  std::vector<std::pair<std::string, Node>> moved;
  const std::string prefix = from + "/";
  for (auto it = nodes_.begin(); it != nodes_.end();) {
    if (it->first == from || it->first.compare(0, prefix.size(), prefix) == 0) {
      moved.emplace_back(to + it->first.substr(from.size()), it->second);
      it = nodes_.erase(it);
    } else {
      ++it;
    }
  }
  nodes_.erase(to);
  for (auto& m : moved) nodes_[m.first] = m.second;
  return true;
}

bool MockFileSystem::readLink(const std::string& path, std::string& target,
                              std::string& err) {
  if (int e = faultFor(Op::ReadLink, path)) {
    err = errText(e);
    return false;
  }
  auto it = nodes_.find(path);
  if (it == nodes_.end() || it->second.st.kind != EntryKind::Symlink) {
    err = errText(it == nodes_.end() ? ENOENT : EINVAL);
    return false;
  }
  target = it->second.target;
  return true;
}

bool MockFileSystem::symlink(const std::string& target, const std::string& path,
                             std::string& err) {
  if (int e = faultFor(Op::Symlink, path)) {
    err = errText(e);
    return false;
  }
  if (nodes_.count(path)) {
    err = errText(EEXIST);
    return false;
  }
  if (!parentIsDir(path)) {
    err = errText(ENOENT);
    return false;
  }
  Node& n = makeNode(path, EntryKind::Symlink);
  n.target = target;
  n.st.size = target.size();
  return true;
}

void MockFileSystem::copyAttributes(const std::string& path,
                                    const FileStat& from) {
  auto it = nodes_.find(path);
  if (it == nodes_.end()) return;
  it->second.st.mode = from.mode;
  it->second.st.mtime = from.mtime;
  it->second.st.atime = from.atime;
  it->second.st.uid = from.uid;
  it->second.st.gid = from.gid;
  ++attributeCopies_;
}

} // namespace fileops
