#include "backend_informer.hpp"

#include <unordered_set>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace releasectl::cache {

using observability::StringField;

BackendInformer::BackendInformer(std::shared_ptr<storage::ReleaseBackend> backend) : backend_(std::move(backend)) {
}

BackendInformer::~BackendInformer() {
  Stop();
}

void BackendInformer::Start() {
  std::lock_guard lock(watch_mutex_);
  if (watching_) return;

  {
    std::lock_guard events_lock(events_mutex_);
    live_ = false;
    pending_.clear();
  }

  auto result = backend_->ListAndWatch([this](const storage::WatchEvent& event) { HandleEvent(event); });
  watch_id_   = result.watch_id;
  watching_   = true;

  {
    std::lock_guard events_lock(events_mutex_);
    Replace(result.items);
    for (const auto& event : pending_) ApplyEvent(event);
    pending_.clear();
    live_ = true;
  }

  synced_ = true;
  RELEASECTL_LOG_INFO("Release informer synced", {observability::IntField("releases", static_cast<std::int64_t>(store_.Size()))});
}

void BackendInformer::Stop() {
  std::lock_guard lock(watch_mutex_);
  if (!watching_) return;

  backend_->StopWatch(watch_id_);
  watching_ = false;
}

void BackendInformer::AddEventHandler(ResourceEventHandlerFuncs handler) {
  std::lock_guard lock(handlers_mutex_);
  handlers_.push_back(std::move(handler));
}

bool BackendInformer::HasSynced() const {
  return synced_;
}

std::optional<v1::Release> BackendInformer::Get(const std::string& release_namespace, const std::string& name) const {
  std::string key;
  try {
    key = MetaNamespaceKey(release_namespace, name);
  } catch (const util::KeyDecodeError& e) {
    throw util::LookupError(e.what());
  }
  return store_.Get(key);
}

std::vector<v1::Release> BackendInformer::List() const {
  return store_.List();
}

void BackendInformer::Replace(const std::vector<v1::Release>& items) {
  std::unordered_set<std::string> listed;

  for (const auto& item : items) {
    std::string key;
    try {
      key = MetaNamespaceKeyFunc(item);
    } catch (const util::KeyDecodeError& e) {
      RELEASECTL_LOG_ERROR("Skipping release with invalid key", {StringField("error", e.what())});
      continue;
    }
    listed.insert(key);

    auto previous = store_.Upsert(key, item);
    if (!previous) {
      DispatchAdd(item);
    } else if (previous->resource_version() != item.resource_version()) {
      DispatchUpdate(*previous, item);
    }
  }

  for (const auto& key : store_.ListKeys()) {
    if (listed.contains(key)) continue;
    if (auto removed = store_.Remove(key)) {
      DispatchDelete(DeletedFinalStateUnknown{key, *removed});
    }
  }
}

void BackendInformer::HandleEvent(const storage::WatchEvent& event) {
  std::lock_guard lock(events_mutex_);
  if (!live_) {
    pending_.push_back(event);
    return;
  }
  ApplyEvent(event);
}

void BackendInformer::ApplyEvent(const storage::WatchEvent& event) {
  std::string key;
  try {
    key = MetaNamespaceKeyFunc(event.object);
  } catch (const util::KeyDecodeError& e) {
    RELEASECTL_LOG_ERROR("Dropping watch event with invalid key", {StringField("error", e.what())});
    return;
  }

  switch (event.type) {
    case storage::EventType::kAdded:
    case storage::EventType::kModified: {
      auto previous = store_.Upsert(key, event.object);
      if (previous) {
        DispatchUpdate(*previous, event.object);
      } else {
        DispatchAdd(event.object);
      }
      break;
    }
    case storage::EventType::kDeleted: {
      store_.Remove(key);
      DispatchDelete(event.object);
      break;
    }
  }
}

void BackendInformer::DispatchAdd(const v1::Release& obj) {
  std::lock_guard lock(handlers_mutex_);
  for (const auto& handler : handlers_) {
    if (handler.on_add) handler.on_add(obj);
  }
}

void BackendInformer::DispatchUpdate(const v1::Release& old_obj, const v1::Release& new_obj) {
  std::lock_guard lock(handlers_mutex_);
  for (const auto& handler : handlers_) {
    if (handler.on_update) handler.on_update(old_obj, new_obj);
  }
}

void BackendInformer::DispatchDelete(const DeletedObject& obj) {
  std::lock_guard lock(handlers_mutex_);
  for (const auto& handler : handlers_) {
    if (handler.on_delete) handler.on_delete(obj);
  }
}

} // namespace releasectl::cache
