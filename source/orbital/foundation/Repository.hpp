#pragma once

#include <algorithm>
#include <unordered_map>
#include <vector>

#include "Camera/OrbitCameraData.hpp"
#include "Components/Entity.hpp"
#include "Components/OrthographicProjectionComponent.hpp"
#include "Components/TransformComponent.hpp"

namespace orbital::foundation {

  template <typename ComponentType> class ComponentStorage {
  public:
    [[nodiscard]] const ComponentType* find(Entity ent) const {
      auto it = components_.find(ent);
      return (it != components_.end()) ? &it->second : nullptr;
    }

    [[nodiscard]] ComponentType* find_mutable(Entity ent) {
      auto it = components_.find(ent);
      return (it != components_.end()) ? &it->second : nullptr;
    }

    void upsert(Entity ent, const ComponentType& component) {
      components_.insert_or_assign(ent, component);
    }

    // ascending ids, so systems visit entities in creation order
    [[nodiscard]] std::vector<Entity> entities() const {
      std::vector<Entity> result;
      result.reserve(components_.size());
      for (const auto& entry : components_) {
        result.push_back(entry.first);
      }
      std::sort(result.begin(), result.end());
      return result;
    }

    [[nodiscard]] size_t size() const { return components_.size(); }

  private:
    std::unordered_map<Entity, ComponentType> components_;
  };

  class Repository final {
  public:
    Repository() = default;
    ~Repository() = default;

    Repository(const Repository&) = delete;
    Repository& operator=(const Repository&) = delete;

    Repository(Repository&&) = delete;
    Repository& operator=(Repository&&) = delete;

    [[nodiscard]] Entity create_entity() { return next_entity_++; }

    ComponentStorage<OrbitCameraData> orbit_camera_components;
    ComponentStorage<TransformComponent> transform_components;
    ComponentStorage<OrthographicProjectionComponent> orthographic_projection_components;

  private:
    Entity next_entity_ = root_entity + 1;
  };

}  // namespace orbital::foundation
