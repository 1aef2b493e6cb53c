#pragma once

/// @file entity_manager.hpp
/// @brief Entity lifecycle and parent/child ownership.
///
/// EntityManager owns entity slots, generation-based recycling and the
/// ownership graph between a spawned unit and its animation children.
/// Ownership is an explicit edge: the parent handle is stored on the child
/// slot, the parent slot keeps its child list, and destroying a parent
/// walks that list so no child outlives its owner.

#include "dad/ecs/component_storage.hpp"
#include "dad/ecs/entity.hpp"

#include <cstdint>
#include <deque>
#include <vector>

namespace dad::ecs {

class EntityManager {
public:
    EntityManager() = default;

    EntityManager(const EntityManager&) = delete;
    EntityManager& operator=(const EntityManager&) = delete;
    EntityManager(EntityManager&&) noexcept = default;
    EntityManager& operator=(EntityManager&&) noexcept = default;

    // ── Lifecycle ────────────────────────────────────────────────────

    /// Create a root entity, recycling the oldest free slot if any.
    [[nodiscard]] Entity Create();

    /// Create an entity owned by @p parent.
    ///
    /// @return The child handle, or Entity::invalid() when @p parent is
    ///         not alive (nothing is created in that case).
    [[nodiscard]] Entity CreateChild(Entity parent);

    /// Destroy @p entity, all of its descendants and their components.
    ///
    /// Children are destroyed before their parent.  The entity is unlinked
    /// from its own parent.  Destroying a dead handle is a no-op.
    void Destroy(Entity entity);

    /// Queue @p entity for destruction at the next FlushDeferred().
    void DestroyDeferred(Entity entity);

    /// Destroy everything queued by DestroyDeferred().  Handles that died
    /// in the meantime (for example as a child of another queued entity)
    /// are skipped.
    void FlushDeferred();

    // ── Queries ──────────────────────────────────────────────────────

    [[nodiscard]] bool IsAlive(Entity entity) const noexcept;

    /// Number of alive entities, children included.
    [[nodiscard]] std::size_t Count() const noexcept;

    /// Number of slots ever allocated.
    [[nodiscard]] std::size_t Capacity() const noexcept;

    /// Live handle occupying slot @p id, or Entity::invalid() if the slot
    /// is free or was never allocated.
    [[nodiscard]] Entity HandleAt(uint32_t id) const noexcept;

    /// Owner of @p entity, or Entity::invalid() for roots and dead handles.
    [[nodiscard]] Entity ParentOf(Entity entity) const noexcept;

    /// Direct children of @p entity in creation order (empty if dead).
    [[nodiscard]] const std::vector<Entity>& ChildrenOf(Entity entity) const noexcept;

    // ── Component storages ───────────────────────────────────────────

    /// Register a storage so destruction removes the entity's component.
    /// The manager does not own @p storage.
    void RegisterStorage(IComponentStorage* storage);

private:
    [[nodiscard]] Entity allocate();
    void destroyRecursive(Entity entity);
    void detachFromParent(Entity entity);

    std::vector<uint8_t> versions_;
    std::vector<bool> alive_;
    std::vector<Entity> parents_;
    std::vector<std::vector<Entity>> children_;
    std::deque<uint32_t> freeList_;
    std::vector<Entity> pendingDestroy_;
    std::vector<IComponentStorage*> storages_;
    std::size_t count_ = 0;
};

} // namespace dad::ecs
