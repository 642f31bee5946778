#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>

#include "internal/storage/release_backend.hpp"

namespace releasectl::source {

// Parses one release document. Throws std::runtime_error on malformed input.
v1::Release ParseReleaseManifest(const std::string& text);

/*
  ManifestSource mirrors a directory of release YAML files into the backend.

  Each poll diffs the directory against the previous snapshot (by mtime and
  size). Added or modified files are created or updated in the backend; a
  removed file deletes the release it produced. A file that fails to parse
  is logged and skipped until it changes again.
*/
class ManifestSource {
 public:
  ManifestSource(std::filesystem::path dir, std::shared_ptr<storage::ReleaseBackend> backend,
                 std::chrono::milliseconds poll_interval = std::chrono::seconds(1));
  ~ManifestSource();

  ManifestSource(const ManifestSource&)            = delete;
  ManifestSource& operator=(const ManifestSource&) = delete;

  // Runs one poll synchronously, then keeps polling on a background thread.
  void Start();
  void Stop();

  // One diff pass. Returns the number of backend writes.
  std::size_t Poll();

 private:
  struct FileState {
    std::int64_t mtime = 0;
    std::uintmax_t size  = 0;
    // Release last applied from this file, if it parsed.
    std::optional<std::pair<std::string, std::string>> release;
  };

  std::size_t Apply(const std::filesystem::path& path, FileState* state);
  std::size_t Remove(const std::string& path, const FileState& state);

  void PollLoop();

  std::filesystem::path                     dir_;
  std::shared_ptr<storage::ReleaseBackend> backend_;
  std::chrono::milliseconds                 poll_interval_;

  std::mutex                       poll_mutex_;
  std::map<std::string, FileState> files_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    stopping_ = false;
  std::thread             thread_;
};

} // namespace releasectl::source
