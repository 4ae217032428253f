#pragma once

#include <mutex>
#include <shared_mutex>

#include "di/sync/synchronized.h"
#include "di/types/prelude.h"

namespace termgrid {
/// @brief A value guarded by a reader/writer lock
///
/// This mirrors the with_lock() interface of di::Synchronized, and adds with_read_lock(),
/// which only takes a shared hold so that any number of readers can proceed together.
template<typename T>
class SharedSynchronized {
public:
    template<typename... Args>
    explicit SharedSynchronized(di::InPlace, Args&&... args) : m_value(di::forward<Args>(args)...) {}

    SharedSynchronized(SharedSynchronized const&) = delete;
    auto operator=(SharedSynchronized const&) -> SharedSynchronized& = delete;

    /// @brief Run f with exclusive access to the value
    template<typename F>
    auto with_lock(F&& f) -> decltype(auto) {
        auto lock = std::unique_lock(m_mutex);
        return di::invoke(di::forward<F>(f), m_value);
    }

    /// @brief Run f with shared, read-only access to the value
    template<typename F>
    auto with_read_lock(F&& f) const -> decltype(auto) {
        auto lock = std::shared_lock(m_mutex);
        return di::invoke(di::forward<F>(f), m_value);
    }

private:
    T m_value;
    mutable std::shared_mutex m_mutex;
};
}
