/**
 * @file file_store.cpp
 * @brief File-per-record store with atomic replace and flock leases.
 */
#include "vpcctl/topology/file_store.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

#include "vpcctl/obs/observability.hpp"
#include "vpcctl/topology/codec.hpp"

namespace vpcctl::topology {

namespace fs = std::filesystem;

namespace {

constexpr const char* kRecordExt = ".json";
constexpr const char* kTempExt   = ".tmp";

/// flock(2) lease; the descriptor is closed (and the lock dropped) on destruction.
class FlockLease final : public KeyLock::Lease {
public:
  explicit FlockLease(int fd) noexcept : fd_(fd) {}
  ~FlockLease() override {
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
  }
  FlockLease(const FlockLease&)            = delete;
  FlockLease& operator=(const FlockLease&) = delete;
private:
  int fd_;
};

Result<std::string> read_text(const fs::path& p) {
  std::ifstream in(p);
  if (!in) {
    return fail(ErrorCode::PersistenceFailure, "cannot read " + p.string());
  }
  std::ostringstream buf;
  buf << in.rdbuf();
  return buf.str();
}

/// Write @p text to a temporary sibling, then rename it over @p p.
Result<void> replace_text(const fs::path& p, const std::string& text) {
  fs::path tmp = p;
  tmp += std::string(kTempExt) + "." + std::to_string(::getpid());
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) {
      return fail(ErrorCode::PersistenceFailure, "cannot write " + tmp.string());
    }
    out << text;
    out.flush();
    if (!out) {
      return fail(ErrorCode::PersistenceFailure, "short write to " + tmp.string());
    }
  }
  std::error_code ec;
  fs::rename(tmp, p, ec);
  if (ec) {
    fs::remove(tmp, ec);
    return fail(ErrorCode::PersistenceFailure, "cannot replace " + p.string() + ": " + ec.message());
  }
  return {};
}

bool exists(const fs::path& p) {
  std::error_code ec;
  return fs::exists(p, ec);
}

/// Record documents in @p dir, skipping temporaries and foreign files.
Result<std::vector<fs::path>> record_files(const fs::path& dir) {
  std::vector<fs::path> out;
  std::error_code ec;
  if (!fs::exists(dir, ec)) return out;
  for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    if (!it->is_regular_file(ec)) continue;
    if (it->path().extension() != kRecordExt) continue;
    out.push_back(it->path());
  }
  if (ec) {
    return fail(ErrorCode::PersistenceFailure, "cannot list " + dir.string() + ": " + ec.message());
  }
  return out;
}

template <class Rec, class Decode>
Result<Rec> load(const fs::path& p, Decode decode) {
  auto text = read_text(p);
  if (!text) return fail(text.error());
  auto rec = decode(*text);
  if (!rec) {
    return fail(ErrorCode::PersistenceFailure, p.string() + ": " + rec.error().message);
  }
  return rec;
}

template <class Rec, class Decode>
Result<std::vector<Rec>> load_all(const fs::path& dir, Decode decode) {
  auto files = record_files(dir);
  if (!files) return fail(files.error());
  std::vector<Rec> out;
  out.reserve(files->size());
  for (const auto& p : *files) {
    auto rec = load<Rec>(p, decode);
    if (!rec) return fail(rec.error());
    out.push_back(std::move(*rec));
  }
  return out;
}

/// Compare-and-swap save shared by both record kinds.
template <class Rec, class Decode>
Result<void> cas_write(const fs::path& p, Rec& rec, Decode decode, const char* what) {
  std::uint64_t stored = 0;
  if (topology::exists(p)) {
    auto cur = load<Rec>(p, decode);
    if (!cur) return fail(cur.error());
    stored = cur->revision;
  }
  if (stored != rec.revision) {
    return fail(ErrorCode::Conflict,
                std::string(what) + " record " + p.filename().string() +
                " changed concurrently (stored revision " + std::to_string(stored) +
                ", expected " + std::to_string(rec.revision) + ")");
  }
  Rec next = rec;
  next.revision = rec.revision + 1;
  if (auto w = replace_text(p, encode(next)); !w) return w;
  rec.revision = next.revision;
  return {};
}

Result<void> remove_file(const fs::path& p, std::string_view what, std::string_view key) {
  std::error_code ec;
  if (!fs::remove(p, ec)) {
    if (ec) {
      return fail(ErrorCode::PersistenceFailure, "cannot remove " + p.string() + ": " + ec.message());
    }
    return fail(ErrorCode::NotFound, std::string(what) + " '" + std::string(key) + "' does not exist");
  }
  return {};
}

} // namespace

Result<void> FileTopologyStore::prepare() const {
  for (const auto* dir : {&paths_.state_dir, &paths_.peering_dir, &paths_.lock_dir}) {
    std::error_code ec;
    fs::create_directories(*dir, ec);
    if (ec) {
      return fail(ErrorCode::PersistenceFailure, "cannot create " + dir->string() + ": " + ec.message());
    }
  }
  return {};
}

Result<fs::path> FileTopologyStore::record_path(const fs::path& dir, std::string_view key) const {
  if (key.empty() || key.find('/') != std::string_view::npos || key == "." || key == "..") {
    return fail(ErrorCode::ValidationFailure, "invalid record key '" + std::string(key) + "'");
  }
  return dir / (std::string(key) + kRecordExt);
}

//------------------------------- VPC records ----------------------------------

Result<Vpc> FileTopologyStore::get_vpc(std::string_view name) const {
  auto p = record_path(paths_.state_dir, name);
  if (!p) return fail(p.error());
  if (!topology::exists(*p)) {
    return fail(ErrorCode::NotFound, "VPC '" + std::string(name) + "' does not exist");
  }
  return load<Vpc>(*p, decode_vpc);
}

Result<void> FileTopologyStore::save_vpc(Vpc& vpc) {
  auto p = record_path(paths_.state_dir, vpc.name);
  if (!p) return fail(p.error());
  std::lock_guard<std::mutex> lk(write_mu_);
  return cas_write(*p, vpc, decode_vpc, "VPC");
}

Result<void> FileTopologyStore::remove_vpc(std::string_view name) {
  auto p = record_path(paths_.state_dir, name);
  if (!p) return fail(p.error());
  std::lock_guard<std::mutex> lk(write_mu_);
  return remove_file(*p, "VPC", name);
}

Result<std::vector<Vpc>> FileTopologyStore::list_vpcs() const {
  return load_all<Vpc>(paths_.state_dir, decode_vpc);
}

//------------------------------- Peering records ------------------------------

Result<Peering> FileTopologyStore::get_peering(std::string_view key) const {
  auto p = record_path(paths_.peering_dir, key);
  if (!p) return fail(p.error());
  if (!topology::exists(*p)) {
    return fail(ErrorCode::NotFound, "peering '" + std::string(key) + "' does not exist");
  }
  return load<Peering>(*p, decode_peering);
}

Result<void> FileTopologyStore::save_peering(Peering& peering) {
  auto p = record_path(paths_.peering_dir, peering.key());
  if (!p) return fail(p.error());
  std::lock_guard<std::mutex> lk(write_mu_);
  return cas_write(*p, peering, decode_peering, "peering");
}

Result<void> FileTopologyStore::remove_peering(std::string_view key) {
  auto p = record_path(paths_.peering_dir, key);
  if (!p) return fail(p.error());
  std::lock_guard<std::mutex> lk(write_mu_);
  return remove_file(*p, "peering", key);
}

Result<std::vector<Peering>> FileTopologyStore::list_peerings() const {
  return load_all<Peering>(paths_.peering_dir, decode_peering);
}

//------------------------------- Locks ----------------------------------------

Result<KeyLock> FileTopologyStore::lock(std::string_view key) {
  if (key.empty() || key.find('/') != std::string_view::npos) {
    return fail(ErrorCode::ValidationFailure, "invalid lock key '" + std::string(key) + "'");
  }
  std::error_code ec;
  fs::create_directories(paths_.lock_dir, ec);
  const fs::path p = paths_.lock_dir / (std::string(key) + ".lock");

  const int fd = ::open(p.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd < 0) {
    return fail(ErrorCode::PersistenceFailure, "cannot open " + p.string() + ": " + std::strerror(errno));
  }
  while (::flock(fd, LOCK_EX) != 0) {
    if (errno == EINTR) continue;
    const int err = errno;
    ::close(fd);
    return fail(ErrorCode::PersistenceFailure, "flock " + p.string() + ": " + std::strerror(err));
  }
  obs::logger()->debug("lock acquired: {}", key);
  return KeyLock(std::make_unique<FlockLease>(fd));
}

} // namespace vpcctl::topology
