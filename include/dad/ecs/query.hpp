#pragma once

/// @file query.hpp
/// @brief Multi-component query with exclude filters and cached matches.

#include <cstdint>
#include <limits>
#include <tuple>
#include <vector>

#include "dad/ecs/component_storage.hpp"
#include "dad/ecs/entity.hpp"

namespace dad::ecs {

/// Iterates every entity owning all of Includes..., skipping entities that
/// own a component in any excluded storage.
///
/// The match list is cached and rebuilt when the summed version of the
/// participating storages changes.
///
/// @note Yielded handles carry generation 0; only the slot index is
///       meaningful.  Use EntityManager::IsAlive() with a stored handle
///       when the generation matters.
///
/// @code
///   Query<Transform, Movement> movers(transforms, movements);
///   movers.Exclude(deadMarkers).ForEach([](Entity e, Transform& t, Movement& m) {
///       ...
///   });
/// @endcode
template <typename... Includes>
class Query {
    static_assert(sizeof...(Includes) > 0, "Query must have at least one component type");

public:
    using const_iterator = typename std::vector<Entity>::const_iterator;

    explicit Query(ComponentStorage<Includes>&... storages)
        : storages_{&storages...} {}

    Query(const Query&) = delete;
    Query& operator=(const Query&) = delete;
    Query(Query&&) noexcept = default;
    Query& operator=(Query&&) noexcept = default;

    Query& Exclude(const IComponentStorage& storage) {
        excludes_.push_back(&storage);
        cacheValid_ = false;
        return *this;
    }

    template <typename Func>
    void ForEach(Func&& func) {
        refreshCache();
        for (Entity e : cachedEntities_) {
            func(e, std::get<ComponentStorage<Includes>*>(storages_)->Get(e)...);
        }
    }

    [[nodiscard]] std::size_t Count() const {
        refreshCache();
        return cachedEntities_.size();
    }

    /// Snapshot of the matching entities.  Safe to use while mutating
    /// the storages afterwards (e.g. to destroy every match).
    [[nodiscard]] std::vector<Entity> Collect() const {
        refreshCache();
        return cachedEntities_;
    }

    [[nodiscard]] const_iterator begin() const {
        refreshCache();
        return cachedEntities_.cbegin();
    }
    [[nodiscard]] const_iterator end() const { return cachedEntities_.cend(); }

private:
    [[nodiscard]] uint64_t fingerprint() const noexcept {
        uint64_t fp = 0;
        std::apply([&](auto*... ptrs) { ((fp += ptrs->Version()), ...); }, storages_);
        for (const auto* ex : excludes_) {
            fp += ex->Version();
        }
        return fp;
    }

    void refreshCache() const {
        const uint64_t fp = fingerprint();
        if (cacheValid_ && cacheVersion_ == fp) {
            return;
        }

        cachedEntities_.clear();

        // Drive iteration from the smallest include storage.
        const IComponentStorage* smallest = nullptr;
        std::size_t smallestSize = std::numeric_limits<std::size_t>::max();
        std::apply(
            [&](auto*... ptrs) {
                auto pick = [&](const IComponentStorage* p) {
                    if (p->Size() < smallestSize) {
                        smallest = p;
                        smallestSize = p->Size();
                    }
                };
                (pick(ptrs), ...);
            },
            storages_);

        for (std::size_t i = 0; smallest != nullptr && i < smallestSize; ++i) {
            const Entity entity(smallest->EntityAt(i), 0);

            bool matches = true;
            std::apply(
                [&](auto*... ptrs) { ((matches = matches && ptrs->Has(entity)), ...); },
                storages_);
            for (const auto* ex : excludes_) {
                if (!matches) {
                    break;
                }
                matches = !ex->Has(entity);
            }

            if (matches) {
                cachedEntities_.push_back(entity);
            }
        }

        cacheVersion_ = fp;
        cacheValid_ = true;
    }

    std::tuple<ComponentStorage<Includes>*...> storages_;
    std::vector<const IComponentStorage*> excludes_;
    mutable std::vector<Entity> cachedEntities_;
    mutable uint64_t cacheVersion_ = 0;
    mutable bool cacheValid_ = false;
};

} // namespace dad::ecs
