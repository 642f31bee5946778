#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

#include "internal/cache/informer.hpp"
#include "internal/cache/release_store.hpp"
#include "internal/storage/release_backend.hpp"

namespace releasectl::cache {

/*
  Informer fed by ReleaseBackend::ListAndWatch.

  Start() lists the backend into the store, marks the informer synced and
  then applies watch events as they arrive. Objects the store holds but a
  fresh list no longer contains were deleted while the watch was down;
  they are reported as DeletedFinalStateUnknown tombstones.
*/
class BackendInformer final : public ReleaseInformer {
 public:
  explicit BackendInformer(std::shared_ptr<storage::ReleaseBackend> backend);
  ~BackendInformer() override;

  void Start();
  void Stop();

  void AddEventHandler(ResourceEventHandlerFuncs handler) override;
  bool HasSynced() const override;

  std::optional<v1::Release> Get(const std::string& release_namespace, const std::string& name) const override;
  std::vector<v1::Release>   List() const override;

 private:
  void Replace(const std::vector<v1::Release>& items);
  void HandleEvent(const storage::WatchEvent& event);
  void ApplyEvent(const storage::WatchEvent& event);

  void DispatchAdd(const v1::Release& obj);
  void DispatchUpdate(const v1::Release& old_obj, const v1::Release& new_obj);
  void DispatchDelete(const DeletedObject& obj);

  std::shared_ptr<storage::ReleaseBackend> backend_;
  ReleaseStore                             store_;

  std::mutex                             handlers_mutex_;
  std::vector<ResourceEventHandlerFuncs> handlers_;

  std::mutex    watch_mutex_;
  std::uint64_t watch_id_ = 0;
  bool          watching_ = false;

  // Events that arrive between ListAndWatch and Replace are held back so
  // the listed snapshot never overwrites newer state.
  std::mutex                       events_mutex_;
  std::vector<storage::WatchEvent> pending_;
  bool                             live_ = false;

  std::atomic<bool> synced_{false};
};

} // namespace releasectl::cache
