#pragma once

/// @file component_storage.hpp
/// @brief Sparse-set pool holding one component type for all units.

#include "dad/ecs/entity.hpp"

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <limits>
#include <type_traits>
#include <utility>
#include <vector>

namespace dad::ecs {

/// Untyped face of a ComponentStorage.
///
/// EntityManager keeps a list of these so that destroying a unit strips
/// every component it owns; Query uses them for exclude filters.
class IComponentStorage {
public:
    virtual ~IComponentStorage() = default;

    virtual void Remove(Entity entity) = 0;
    [[nodiscard]] virtual bool Has(Entity entity) const = 0;
    virtual void Clear() = 0;
    [[nodiscard]] virtual std::size_t Size() const = 0;

    /// Slot index of the owner of packed element @p position.
    [[nodiscard]] virtual uint32_t EntityAt(std::size_t position) const = 0;

    /// Bumped by every add, replace, remove and clear.
    [[nodiscard]] virtual uint32_t Version() const noexcept = 0;
};

/// Components of type T packed contiguously, addressed by entity slot.
///
/// @code
///   lookup_[slot]     -> position in packed_, or kNoPosition
///   packed_[position] -> component
///   owners_[position] -> slot owning packed_[position]
/// @endcode
///
/// Lookups ignore the handle generation; EntityManager strips components
/// when a slot dies, so a recycled slot never inherits old data.  Tag
/// types (Cleanup, behavior markers) use the same layout.
template <typename T>
class ComponentStorage final : public IComponentStorage {
public:
    static_assert(std::is_move_constructible_v<T>, "Component type must be move-constructible");

    using value_type = T;
    using iterator = typename std::vector<T>::iterator;
    using const_iterator = typename std::vector<T>::const_iterator;

    [[nodiscard]] std::size_t Size() const override { return packed_.size(); }
    [[nodiscard]] bool Empty() const noexcept { return packed_.empty(); }

    /// Store a component for @p entity.  With no @p args the component is
    /// value-initialised, otherwise brace-initialised from them.
    /// @pre `!Has(entity)`.
    template <typename... Args>
    T& Add(Entity entity, Args&&... args) {
        assert(entity.isValid() && "Cannot add component to invalid entity");
        assert(!Has(entity) && "Entity already has this component");

        if (entity.id() >= lookup_.size()) {
            lookup_.resize(static_cast<std::size_t>(entity.id()) + 1, kNoPosition);
        }
        lookup_[entity.id()] = static_cast<uint32_t>(packed_.size());
        owners_.push_back(entity.id());

        if constexpr (sizeof...(Args) == 0) {
            packed_.emplace_back();
        } else {
            packed_.push_back(T{std::forward<Args>(args)...});
        }
        ++version_;
        return packed_.back();
    }

    /// @pre `Has(entity)`.
    [[nodiscard]] T& Get(Entity entity) {
        assert(Has(entity) && "Entity does not have this component");
        return packed_[lookup_[entity.id()]];
    }

    /// @pre `Has(entity)`.
    [[nodiscard]] const T& Get(Entity entity) const {
        assert(Has(entity) && "Entity does not have this component");
        return packed_[lookup_[entity.id()]];
    }

    [[nodiscard]] T* TryGet(Entity entity) {
        return Has(entity) ? &packed_[lookup_[entity.id()]] : nullptr;
    }

    [[nodiscard]] const T* TryGet(Entity entity) const {
        return Has(entity) ? &packed_[lookup_[entity.id()]] : nullptr;
    }

    /// @pre `Has(entity)`.
    void Replace(Entity entity, T component) {
        Get(entity) = std::move(component);
        ++version_;
    }

    [[nodiscard]] bool Has(Entity entity) const override {
        return entity.isValid() && entity.id() < lookup_.size() &&
               lookup_[entity.id()] != kNoPosition;
    }

    /// Move the last element into the hole.  No-op without a component.
    void Remove(Entity entity) override {
        if (!Has(entity)) {
            return;
        }

        const uint32_t hole = lookup_[entity.id()];
        const uint32_t tail = static_cast<uint32_t>(packed_.size() - 1);
        if (hole != tail) {
            packed_[hole] = std::move(packed_[tail]);
            owners_[hole] = owners_[tail];
            lookup_[owners_[hole]] = hole;
        }
        packed_.pop_back();
        owners_.pop_back();
        lookup_[entity.id()] = kNoPosition;
        ++version_;
    }

    void Clear() override {
        packed_.clear();
        owners_.clear();
        std::fill(lookup_.begin(), lookup_.end(), kNoPosition);
        ++version_;
    }

    iterator begin() noexcept { return packed_.begin(); }
    iterator end() noexcept { return packed_.end(); }
    [[nodiscard]] const_iterator begin() const noexcept { return packed_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return packed_.end(); }

    [[nodiscard]] uint32_t EntityAt(std::size_t position) const override {
        assert(position < owners_.size());
        return owners_[position];
    }

    [[nodiscard]] uint32_t Version() const noexcept override { return version_; }

private:
    static constexpr uint32_t kNoPosition = std::numeric_limits<uint32_t>::max();

    std::vector<T> packed_;
    std::vector<uint32_t> owners_;
    std::vector<uint32_t> lookup_;
    uint32_t version_ = 0;
};

} // namespace dad::ecs
