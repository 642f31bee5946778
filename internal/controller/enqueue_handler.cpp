#include "enqueue_handler.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace releasectl::controller {

using observability::StringField;

EnqueueHandler::EnqueueHandler(std::shared_ptr<queue::RateLimitingQueue> queue) : queue_(std::move(queue)) {
}

void EnqueueHandler::OnAdd(const v1::Release& obj) {
  Enqueue(obj);
}

void EnqueueHandler::OnUpdate(const v1::Release&, const v1::Release& new_obj) {
  Enqueue(new_obj);
}

void EnqueueHandler::OnDelete(const cache::DeletedObject& obj) {
  Enqueue(obj);
}

void EnqueueHandler::Stop() {
  stopped_ = true;
}

std::uint64_t EnqueueHandler::Dropped() const {
  return dropped_;
}

cache::ResourceEventHandlerFuncs EnqueueHandler::Funcs() {
  auto self = shared_from_this();

  cache::ResourceEventHandlerFuncs funcs;
  funcs.on_add    = [self](const v1::Release& obj) { self->OnAdd(obj); };
  funcs.on_update = [self](const v1::Release& old_obj, const v1::Release& new_obj) { self->OnUpdate(old_obj, new_obj); };
  funcs.on_delete = [self](const cache::DeletedObject& obj) { self->OnDelete(obj); };
  return funcs;
}

void EnqueueHandler::Enqueue(const cache::DeletedObject& obj) {
  if (stopped_) return;

  std::string key;
  try {
    key = cache::DeletionHandlingMetaNamespaceKeyFunc(obj);
  } catch (const util::KeyDecodeError& e) {
    ++dropped_;
    RELEASECTL_LOG_ERROR("Can't get obj key", {StringField("error", e.what())});
    return;
  }

  RELEASECTL_LOG_DEBUG("Enqueue", {StringField("key", key)});
  queue_->Add(key);
}

} // namespace releasectl::controller
