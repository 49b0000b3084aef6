/**
 * @file StrategyRegistry.hpp
 * @brief Lookup of acquisition strategies by identifier
 */

#pragma once

#include "acquisition/AcquisitionStrategy.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace acquisition {

/**
 * @class StrategyRegistry
 * @brief Maps method identifiers (e.g. "snapshot") to strategy factories
 *
 * @example
 * ```cpp
 * auto registry = StrategyRegistry::with_builtin_strategies();
 * auto strategy = registry.create("snapshot", services);
 * ```
 */
class StrategyRegistry {
public:
    using FactoryFunc =
        std::function<std::unique_ptr<AcquisitionStrategy>(AcquisitionServices&)>;

    /**
     * @brief Registry holding every strategy shipped with the engine
     */
    [[nodiscard]] static auto with_builtin_strategies() -> StrategyRegistry;

    void register_strategy(const std::string& identifier, FactoryFunc factory) {
        factories_[identifier] = std::move(factory);
    }

    template<typename T>
    void register_type(const std::string& identifier) {
        register_strategy(identifier, [](AcquisitionServices& services)
                                          -> std::unique_ptr<AcquisitionStrategy> {
            return std::make_unique<T>(services);
        });
    }

    /**
     * @brief Create a strategy
     * @return The strategy, or nullptr if the identifier is unknown
     */
    [[nodiscard]] auto create(const std::string& identifier, AcquisitionServices& services) const
        -> std::unique_ptr<AcquisitionStrategy> {
        auto it = factories_.find(identifier);
        if (it == factories_.end()) {
            return nullptr;
        }
        return it->second(services);
    }

    [[nodiscard]] auto identifiers() const -> std::vector<std::string> {
        std::vector<std::string> result;
        result.reserve(factories_.size());
        for (const auto& [identifier, _] : factories_) {
            result.push_back(identifier);
        }
        return result;
    }

    [[nodiscard]] auto is_registered(const std::string& identifier) const -> bool {
        return factories_.contains(identifier);
    }

private:
    std::map<std::string, FactoryFunc> factories_;
};

}  // namespace acquisition
