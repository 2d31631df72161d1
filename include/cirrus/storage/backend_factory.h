#pragma once

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include "cirrus/storage/object_store.h"

namespace cirrus::storage {

struct Config {
    std::string type;       // local/memory
    std::string data_dir;   // local
};

using StoreCreator = std::function<std::unique_ptr<ObjectStore>(const Config&)>;

// 对象存储工厂 (单例)
class StoreFactory {
public:
    static StoreFactory& Instance() {
        static StoreFactory instance;
        return instance;
    }

    void Register(const std::string& name, StoreCreator creator) {
        creators_[name] = std::move(creator);
    }

    // 未注册的类型返回 nullptr
    std::unique_ptr<ObjectStore> Create(const Config& config) {
        auto it = creators_.find(config.type);
        if (it == creators_.end()) {
            return nullptr;
        }
        return it->second(config);
    }

    std::vector<std::string> Drivers() const {
        std::vector<std::string> names;
        names.reserve(creators_.size());
        for (const auto& [name, _] : creators_) {
            names.push_back(name);
        }
        return names;
    }

private:
    StoreFactory() = default;
    std::unordered_map<std::string, StoreCreator> creators_;
};

inline void RegisterBuiltinStores() {
    StoreFactory::Instance().Register("local", [](const Config& cfg) {
        return std::make_unique<LocalObjectStore>(LocalObjectStore::Config{cfg.data_dir});
    });

    StoreFactory::Instance().Register("memory", [](const Config&) {
        return std::make_unique<MemoryObjectStore>();
    });
}

} // namespace cirrus::storage
