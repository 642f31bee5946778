#include "key.hpp"

#include "internal/util/errors.hpp"

namespace releasectl::cache {

namespace {

constexpr std::size_t kMaxNameLength = 253;

bool IsAlnum(char c) {
  return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
}

} // namespace

bool IsValidName(std::string_view name) {
  if (name.empty() || name.size() > kMaxNameLength) return false;
  if (!IsAlnum(name.front()) || !IsAlnum(name.back())) return false;

  for (char c : name) {
    if (!IsAlnum(c) && c != '-' && c != '.') return false;
  }
  return true;
}

std::string MetaNamespaceKey(const std::string& release_namespace, const std::string& name) {
  if (!IsValidName(name)) {
    throw util::KeyDecodeError("invalid object name: '" + name + "'");
  }
  if (release_namespace.empty()) return name;

  if (!IsValidName(release_namespace)) {
    throw util::KeyDecodeError("invalid object namespace: '" + release_namespace + "'");
  }
  return release_namespace + "/" + name;
}

std::string MetaNamespaceKeyFunc(const v1::Release& release) {
  return MetaNamespaceKey(release.namespace_(), release.name());
}

std::string DeletionHandlingMetaNamespaceKeyFunc(const DeletedObject& obj) {
  if (const auto* tombstone = std::get_if<DeletedFinalStateUnknown>(&obj)) {
    return tombstone->key;
  }
  return MetaNamespaceKeyFunc(std::get<v1::Release>(obj));
}

std::pair<std::string, std::string> SplitMetaNamespaceKey(const std::string& key) {
  const auto slash = key.find('/');

  if (slash == std::string::npos) {
    if (!IsValidName(key)) throw util::KeyDecodeError("unexpected key format: '" + key + "'");
    return {"", key};
  }

  if (key.find('/', slash + 1) != std::string::npos) {
    throw util::KeyDecodeError("unexpected key format: '" + key + "'");
  }

  std::string release_namespace = key.substr(0, slash);
  std::string name              = key.substr(slash + 1);
  if (!IsValidName(release_namespace) || !IsValidName(name)) {
    throw util::KeyDecodeError("unexpected key format: '" + key + "'");
  }
  return {std::move(release_namespace), std::move(name)};
}

} // namespace releasectl::cache
