#pragma once
// include/reactions/exec/BusyRegistry.hpp
//
// At most one reaction runs per target at a time. A reaction holds a Lease for
// its whole lifetime; the target becomes free again when the lease is
// destroyed, whichever way the reaction ends.

#include "reactions/rules/Facts.hpp"

#include <cstddef>
#include <mutex>
#include <optional>
#include <unordered_set>
#include <utility>

namespace reactions {

class BusyRegistry {
public:
    class Lease {
    public:
        Lease() = default;
        ~Lease() { Release(); }

        Lease(const Lease&)            = delete;
        Lease& operator=(const Lease&) = delete;

        Lease(Lease&& o) noexcept
            : m_owner(std::exchange(o.m_owner, nullptr)), m_target(std::move(o.m_target)) {}

        Lease& operator=(Lease&& o) noexcept
        {
            if (this != &o)
            {
                Release();
                m_owner  = std::exchange(o.m_owner, nullptr);
                m_target = std::move(o.m_target);
            }
            return *this;
        }

        [[nodiscard]] bool valid() const noexcept { return m_owner != nullptr; }
        [[nodiscard]] const ActorId& target() const noexcept { return m_target; }

        void Release() noexcept
        {
            if (m_owner)
            {
                m_owner->Free(m_target);
                m_owner = nullptr;
            }
        }

    private:
        friend class BusyRegistry;
        Lease(BusyRegistry* owner, ActorId target) : m_owner(owner), m_target(std::move(target)) {}

        BusyRegistry* m_owner = nullptr;
        ActorId       m_target;
    };

    BusyRegistry() = default;
    BusyRegistry(const BusyRegistry&)            = delete;
    BusyRegistry& operator=(const BusyRegistry&) = delete;

    // nullopt when `target` is already reacting.
    [[nodiscard]] std::optional<Lease> TryAcquire(const ActorId& target)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_busy.insert(target).second)
            return std::nullopt;
        return Lease(this, target);
    }

    [[nodiscard]] bool IsBusy(const ActorId& target) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_busy.count(target) != 0;
    }

    [[nodiscard]] std::size_t BusyCount() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_busy.size();
    }

private:
    void Free(const ActorId& target) noexcept
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_busy.erase(target);
    }

    mutable std::mutex          m_mutex;
    std::unordered_set<ActorId> m_busy;
};

} // namespace reactions
