#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/release/release_manager.hpp"
#include "internal/render/renderer.hpp"
#include "internal/resources/resource_client.hpp"
#include "internal/storage/condition.hpp"
#include "internal/storage/release_backend.hpp"

namespace releasectl::release {

class Manager final : public ReleaseManager {
 public:
  Manager(std::shared_ptr<storage::ReleaseBackend> backend, std::shared_ptr<render::Renderer> renderer,
          std::shared_ptr<resources::ResourceClient> client);

  void Trigger(const v1::Release& release) override;
  void Delete(const std::string& release_namespace, const std::string& name) override;
  void Run() override;

 private:
  struct Plan {
    storage::Reason reason = storage::Reason::kCreating;
    v1::ReleaseSpec spec;
    int32_t         version     = 0;
    bool            new_history = true;
    int32_t         rollback_to = 0;
    // The rollback is already applied; only the stored spec is rewritten.
    bool            spec_only = false;
  };

  // std::nullopt when the release is already converged.
  static std::optional<Plan> Decide(const v1::Release& release, const std::vector<v1::ReleaseHistory>& histories);

  void Execute(const v1::Release& release, const Plan& plan);
  void ApplyResources(const std::string& owner, const std::vector<resources::Resource>& rendered);
  void RecordFailure(const v1::Release& release, const std::string& message);

  std::shared_ptr<storage::ReleaseBackend>   backend_;
  std::shared_ptr<render::Renderer>          renderer_;
  std::shared_ptr<resources::ResourceClient> client_;
};

} // namespace releasectl::release
