/// @file entity_manager.cpp
/// @brief Entity lifecycle and ownership graph.

#include "dad/ecs/entity_manager.hpp"

#include <algorithm>
#include <cassert>

namespace dad::ecs {

namespace {

const std::vector<Entity> kNoChildren;

} // namespace

// ── Lifecycle ────────────────────────────────────────────────────────

Entity EntityManager::Create() {
    return allocate();
}

Entity EntityManager::CreateChild(Entity parent) {
    if (!IsAlive(parent)) {
        return Entity::invalid();
    }
    auto child = allocate();
    parents_[child.id()] = parent;
    children_[parent.id()].push_back(child);
    return child;
}

void EntityManager::Destroy(Entity entity) {
    if (!IsAlive(entity)) {
        return;
    }
    detachFromParent(entity);
    destroyRecursive(entity);
}

void EntityManager::DestroyDeferred(Entity entity) {
    if (!IsAlive(entity)) {
        return;
    }
    pendingDestroy_.push_back(entity);
}

void EntityManager::FlushDeferred() {
    auto pending = std::move(pendingDestroy_);
    pendingDestroy_.clear();

    for (const auto& entity : pending) {
        Destroy(entity);
    }
}

// ── Queries ──────────────────────────────────────────────────────────

bool EntityManager::IsAlive(Entity entity) const noexcept {
    if (!entity.isValid()) {
        return false;
    }
    const auto idx = entity.id();
    return idx < versions_.size() && alive_[idx] && versions_[idx] == entity.version();
}

std::size_t EntityManager::Count() const noexcept {
    return count_;
}

std::size_t EntityManager::Capacity() const noexcept {
    return versions_.size();
}

Entity EntityManager::HandleAt(uint32_t id) const noexcept {
    if (id >= versions_.size() || !alive_[id]) {
        return Entity::invalid();
    }
    return Entity(id, versions_[id]);
}

Entity EntityManager::ParentOf(Entity entity) const noexcept {
    if (!IsAlive(entity)) {
        return Entity::invalid();
    }
    return parents_[entity.id()];
}

const std::vector<Entity>& EntityManager::ChildrenOf(Entity entity) const noexcept {
    if (!IsAlive(entity)) {
        return kNoChildren;
    }
    return children_[entity.id()];
}

void EntityManager::RegisterStorage(IComponentStorage* storage) {
    assert(storage != nullptr && "Cannot register null storage");
    storages_.push_back(storage);
}

// ── Private ──────────────────────────────────────────────────────────

Entity EntityManager::allocate() {
    uint32_t index = 0;

    if (!freeList_.empty()) {
        index = freeList_.front();
        freeList_.pop_front();
        alive_[index] = true;
    } else {
        index = static_cast<uint32_t>(versions_.size());
        assert(index <= Entity::kMaxId && "Entity index space exhausted");
        versions_.push_back(0);
        alive_.push_back(true);
        parents_.emplace_back();
        children_.emplace_back();
    }

    ++count_;
    return Entity(index, versions_[index]);
}

void EntityManager::destroyRecursive(Entity entity) {
    const auto idx = entity.id();

    // Children first; the list is moved out so recursion cannot touch it.
    auto children = std::move(children_[idx]);
    children_[idx].clear();
    for (const auto& child : children) {
        if (IsAlive(child)) {
            destroyRecursive(child);
        }
    }

    for (auto* storage : storages_) {
        storage->Remove(entity);
    }

    alive_[idx] = false;
    parents_[idx] = Entity::invalid();
    versions_[idx] = static_cast<uint8_t>(versions_[idx] + 1);
    freeList_.push_back(idx);
    --count_;
}

void EntityManager::detachFromParent(Entity entity) {
    auto parent = parents_[entity.id()];
    if (!IsAlive(parent)) {
        return;
    }
    auto& siblings = children_[parent.id()];
    siblings.erase(std::remove(siblings.begin(), siblings.end(), entity), siblings.end());
}

} // namespace dad::ecs
