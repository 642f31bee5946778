#pragma once

#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "releasectl/v1/release.pb.h"

namespace releasectl::cache {

/*
  Thread-safe key -> Release map backing an informer.
*/
class ReleaseStore {
 public:
  // Returns the previous object, if any.
  std::optional<v1::Release> Upsert(const std::string& key, const v1::Release& release);

  // Returns the removed object, if any.
  std::optional<v1::Release> Remove(const std::string& key);

  std::optional<v1::Release> Get(const std::string& key) const;

  std::vector<v1::Release> List() const;
  std::vector<std::string> ListKeys() const;

  std::size_t Size() const;

 private:
  mutable std::shared_mutex                    mutex_;
  std::unordered_map<std::string, v1::Release> items_;
};

} // namespace releasectl::cache
