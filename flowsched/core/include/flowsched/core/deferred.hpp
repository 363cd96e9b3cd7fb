#pragma once

#include <cstddef>

namespace flowsched::core {

class Engine;

/// @brief Handle returned by Engine::register_deferred().
///
/// A default-constructed handle refers to nothing; requesting it is a no-op.
///
/// @ingroup core_events
class DeferredId {
    friend class Engine;

public:
    DeferredId() = default;

    explicit operator bool() const noexcept { return valid_; }

private:
    explicit DeferredId(std::size_t index) : index_(index), valid_(true) {}

    std::size_t index_{0};
    bool valid_{false};
};

} // namespace flowsched::core
