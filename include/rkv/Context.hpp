#pragma once

#include "rkv/BucketRegistry.hpp"
#include "rkv/PubSub.hpp"

namespace rkv {

/// The process-wide services a manager or facade works against. Both are
/// owned elsewhere and must outlive every user of the context.
class Context {
public:
  Context(BucketRegistry& registry, PubSub& bus)
    : _registry(&registry), _bus(&bus) {}

  BucketRegistry& registry() const noexcept { return *_registry; }
  PubSub& bus() const noexcept { return *_bus; }

private:
  BucketRegistry* _registry;
  PubSub*         _bus;
};

} // namespace rkv
