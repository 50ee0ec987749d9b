#pragma once
// Provider Registry: name -> factory, with cached instances
//
// Providers are registered as factories so construction (API keys, network
// clients) happens on first use. get() hands out one cached instance per
// name; force_new rebuilds it and replaces the cached one. A factory that
// throws yields nullptr.

#include "provider.hpp"
#include "../errors.hpp"
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>

namespace hive {

class ProviderRegistry {
public:
    using Factory = std::function<std::shared_ptr<SearchProvider>()>;

    ProviderRegistry() = default;

    ProviderRegistry(const ProviderRegistry&) = delete;
    ProviderRegistry& operator=(const ProviderRegistry&) = delete;

    // Register or replace a factory. Replacing drops the cached instance.
    void register_provider(const std::string& name, Factory factory) {
        std::lock_guard<std::mutex> lock(mutex_);
        factories_[name] = std::move(factory);
        instances_.erase(name);
    }

    bool unregister(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        instances_.erase(name);
        return factories_.erase(name) > 0;
    }

    bool contains(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return factories_.count(name) > 0;
    }

    // Cached instance for name; nullptr when unknown or the factory throws
    std::shared_ptr<SearchProvider> get(const std::string& name, bool force_new = false) {
        Factory factory;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto f = factories_.find(name);
            if (f == factories_.end()) return nullptr;
            if (!force_new) {
                auto it = instances_.find(name);
                if (it != instances_.end()) return it->second;
            }
            factory = f->second;
        }

        // Build outside the lock; factories may be slow or consult the registry
        std::shared_ptr<SearchProvider> instance;
        try {
            instance = factory();
        } catch (...) {
            std::cerr << "[ProviderRegistry] Failed to create provider " << name
                      << ": " << describe(std::current_exception()) << "\n";
            return nullptr;
        }
        if (!instance) return nullptr;

        std::lock_guard<std::mutex> lock(mutex_);
        if (factories_.find(name) == factories_.end()) return instance;   // Unregistered meanwhile
        if (!force_new) {
            auto it = instances_.find(name);
            if (it != instances_.end()) return it->second;              // Lost the race
        }
        instances_[name] = instance;
        return instance;
    }

    // Registered names, sorted
    std::vector<std::string> list() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> names;
        names.reserve(factories_.size());
        for (const auto& [name, _] : factories_) names.push_back(name);
        return names;
    }

    // Health of every registered provider; false when it cannot be built
    std::map<std::string, bool> list_with_health() {
        std::map<std::string, bool> result;
        for (const auto& name : list()) {
            auto provider = get(name);
            if (!provider) {
                result[name] = false;
                continue;
            }
            try {
                result[name] = provider->health_check();
            } catch (...) {
                std::cerr << "[ProviderRegistry] Health check failed for " << name
                          << ": " << describe(std::current_exception()) << "\n";
                result[name] = false;
            }
        }
        return result;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return factories_.size();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        factories_.clear();
        instances_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, Factory> factories_;
    std::map<std::string, std::shared_ptr<SearchProvider>> instances_;
};

} // namespace hive
