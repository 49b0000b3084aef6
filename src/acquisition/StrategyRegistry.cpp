#include "acquisition/StrategyRegistry.hpp"

#include "acquisition/SnapshotMountStrategy.hpp"

namespace acquisition {

auto StrategyRegistry::with_builtin_strategies() -> StrategyRegistry {
    StrategyRegistry registry;
    registry.register_type<SnapshotMountStrategy>(SnapshotMountStrategy::IDENTIFIER);
    return registry;
}

}  // namespace acquisition
