#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "releasectl/v1/release.pb.h"

namespace releasectl::cache {

/*
  Reconcile keys.

  A key is "<namespace>/<name>", or "<name>" when the namespace is empty.
  Both segments are lowercase DNS-1123 subdomain names, so a key decodes
  back into exactly the pair it was built from.
*/

// The last known state of an object whose deletion was not observed
// directly (the watch was down when it went away).
struct DeletedFinalStateUnknown {
  std::string key;
  v1::Release obj;
};

using DeletedObject = std::variant<v1::Release, DeletedFinalStateUnknown>;

bool IsValidName(std::string_view name);

// Throws util::KeyDecodeError when either segment is invalid.
std::string MetaNamespaceKey(const std::string& release_namespace, const std::string& name);
std::string MetaNamespaceKeyFunc(const v1::Release& release);

// Tombstones carry their key verbatim.
std::string DeletionHandlingMetaNamespaceKeyFunc(const DeletedObject& obj);

// {namespace, name}. Throws util::KeyDecodeError on malformed keys.
std::pair<std::string, std::string> SplitMetaNamespaceKey(const std::string& key);

} // namespace releasectl::cache
