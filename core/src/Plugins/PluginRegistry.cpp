#include "cosmicconnect/Plugin.h"
#include "cosmicconnect/Plugins/PingPlugin.h"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace CosmicConnect {

// ═══════════════════════════════════════════════════════════
// FunctionPluginFactory
// ═══════════════════════════════════════════════════════════

FunctionPluginFactory::FunctionPluginFactory(std::string name, PluginCapabilities capabilities, Creator creator)
    : m_name(std::move(name))
    , m_capabilities(std::move(capabilities))
    , m_creator(std::move(creator)) {}

std::unique_ptr<Plugin> FunctionPluginFactory::create() const {
    return m_creator ? m_creator() : nullptr;
}

// ═══════════════════════════════════════════════════════════
// PluginSet
// ═══════════════════════════════════════════════════════════

PluginSet::PluginSet(std::vector<std::unique_ptr<Plugin>> plugins)
    : m_plugins(std::move(plugins)) {}

PluginSet::~PluginSet() {
    shutdownAll();
}

size_t PluginSet::dispatch(const Packet& packet, Device& device) {
    size_t delivered = 0;
    for (auto& plugin : m_plugins) {
        const auto caps = plugin->capabilities();
        bool interested = std::any_of(caps.incoming.begin(), caps.incoming.end(),
                                      [&](const std::string& type) { return packet.isType(type); });
        if (!interested) continue;

        ++delivered;
        try {
            plugin->handlePacket(packet, device);
        } catch (const std::exception& e) {
            // Ошибка плагина не закрывает сессию
            spdlog::warn("Plugin '{}' failed on {} from {}: {}",
                         plugin->name(), packet.type, device.id(), e.what());
        }
    }
    if (delivered == 0) {
        spdlog::debug("PluginSet: No plugin for {} from {}", packet.type, device.id());
    }
    return delivered;
}

void PluginSet::shutdownAll() {
    if (m_shutdown) return;
    m_shutdown = true;
    for (auto& plugin : m_plugins) {
        try {
            plugin->shutdown();
        } catch (const std::exception& e) {
            spdlog::warn("Plugin '{}' shutdown failed: {}", plugin->name(), e.what());
        }
    }
}

std::vector<std::string> PluginSet::names() const {
    std::vector<std::string> result;
    result.reserve(m_plugins.size());
    for (const auto& plugin : m_plugins) {
        result.push_back(plugin->name());
    }
    return result;
}

Plugin* PluginSet::find(const std::string& name) const {
    for (const auto& plugin : m_plugins) {
        if (plugin->name() == name) return plugin.get();
    }
    return nullptr;
}

// ═══════════════════════════════════════════════════════════
// PluginRegistry
// ═══════════════════════════════════════════════════════════

PluginRegistry::PluginRegistry() = default;
PluginRegistry::~PluginRegistry() = default;

bool PluginRegistry::registerFactory(std::shared_ptr<PluginFactory> factory) {
    if (!factory) {
        spdlog::warn("PluginRegistry: Attempted to register null factory");
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);

    const std::string name = factory->name();
    if (name.empty() || m_factories.count(name) > 0) {
        spdlog::warn("PluginRegistry: Plugin '{}' already registered", name);
        return false;
    }

    for (const auto& type : factory->capabilities().incoming) {
        m_packetIndex[type].insert(name);
    }
    m_factories[name] = std::move(factory);
    spdlog::debug("PluginRegistry: Registered plugin '{}'", name);
    return true;
}

bool PluginRegistry::unregisterFactory(const std::string& name) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_factories.find(name);
    if (it == m_factories.end()) return false;

    for (auto idx = m_packetIndex.begin(); idx != m_packetIndex.end(); ) {
        idx->second.erase(name);
        if (idx->second.empty()) {
            idx = m_packetIndex.erase(idx);
        } else {
            ++idx;
        }
    }
    m_factories.erase(it);
    return true;
}

bool PluginRegistry::hasPlugin(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_factories.count(name) > 0;
}

std::vector<std::string> PluginRegistry::pluginNames() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> names;
    names.reserve(m_factories.size());
    for (const auto& [name, factory] : m_factories) {
        names.push_back(name);
    }
    return names;
}

std::vector<std::string> PluginRegistry::pluginsForPacketType(const std::string& packetType) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::set<std::string> result;
    for (const auto& [type, names] : m_packetIndex) {
        if (packetTypesMatch(type, packetType)) {
            result.insert(names.begin(), names.end());
        }
    }
    return {result.begin(), result.end()};
}

std::set<std::string> PluginRegistry::incomingCapabilities() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::set<std::string> result;
    for (const auto& [name, factory] : m_factories) {
        auto caps = factory->capabilities();
        result.insert(caps.incoming.begin(), caps.incoming.end());
    }
    return result;
}

std::set<std::string> PluginRegistry::outgoingCapabilities() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::set<std::string> result;
    for (const auto& [name, factory] : m_factories) {
        auto caps = factory->capabilities();
        result.insert(caps.outgoing.begin(), caps.outgoing.end());
    }
    return result;
}

bool PluginRegistry::isInterested(const PluginCapabilities& caps, const DeviceInfo& info) const {
    if (info.incomingCapabilities.empty() && info.outgoingCapabilities.empty()) {
        return true;
    }
    for (const auto& type : caps.incoming) {
        if (info.hasOutgoingCapability(type)) return true;
    }
    for (const auto& type : caps.outgoing) {
        if (info.hasIncomingCapability(type)) return true;
    }
    return false;
}

PluginSet PluginRegistry::instantiate(const Device& device, const PacketSender& sender) const {
    std::vector<std::shared_ptr<PluginFactory>> factories;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& [name, factory] : m_factories) {
            if (isInterested(factory->capabilities(), device.info)) {
                factories.push_back(factory);
            }
        }
    }

    std::vector<std::unique_ptr<Plugin>> plugins;
    for (const auto& factory : factories) {
        try {
            auto plugin = factory->create();
            if (!plugin) continue;
            plugin->init(device, sender);
            plugins.push_back(std::move(plugin));
        } catch (const std::exception& e) {
            spdlog::warn("PluginRegistry: Failed to init '{}' for {}: {}",
                         factory->name(), device.id(), e.what());
        }
    }

    spdlog::debug("PluginRegistry: {} plugins for {}", plugins.size(), device.id());
    return PluginSet(std::move(plugins));
}

std::shared_ptr<PluginRegistry> PluginRegistry::createDefault() {
    auto registry = std::make_shared<PluginRegistry>();
    registry->registerFactory(PingPlugin::factory());
    return registry;
}

} // namespace CosmicConnect
