// Plugin.h — Интерфейс плагинов и реестр фабрик
// Плагин получает пакеты своих типов и отправляет пакеты через переданный sender

#pragma once

#include "export.h"
#include "Models.h"
#include "Network/Packet.h"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace CosmicConnect {

struct PluginCapabilities {
    std::set<std::string> incoming;     // Типы пакетов, которые плагин принимает
    std::set<std::string> outgoing;     // Типы пакетов, которые плагин отправляет
};

/// Отправка пакета в сессию устройства
/// @throws ProtocolError(Backpressure, TransportUnavailable, PacketSizeExceeded)
using PacketSender = std::function<void(const Packet&)>;

// ═══════════════════════════════════════════════════════════
// Plugin — экземпляр на одну сессию
// ═══════════════════════════════════════════════════════════

class CC_API Plugin {
public:
    virtual ~Plugin() = default;

    /// Уникальное имя ("ping", "share")
    virtual std::string name() const = 0;

    virtual PluginCapabilities capabilities() const = 0;

    /// Вызывается один раз при старте сессии
    virtual void init(const Device& device, PacketSender sender) = 0;

    /// Обработать входящий пакет.
    /// Исключения логируются и не закрывают сессию.
    virtual void handlePacket(const Packet& packet, Device& device) = 0;

    /// Вызывается при завершении сессии
    virtual void shutdown() = 0;
};

// ═══════════════════════════════════════════════════════════
// PluginFactory
// ═══════════════════════════════════════════════════════════

class CC_API PluginFactory {
public:
    virtual ~PluginFactory() = default;

    virtual std::string name() const = 0;

    virtual PluginCapabilities capabilities() const = 0;

    virtual std::unique_ptr<Plugin> create() const = 0;
};

/// Фабрика из лямбды (для плагинов без собственного класса фабрики)
class CC_API FunctionPluginFactory : public PluginFactory {
public:
    using Creator = std::function<std::unique_ptr<Plugin>()>;

    FunctionPluginFactory(std::string name, PluginCapabilities capabilities, Creator creator);

    std::string name() const override { return m_name; }
    PluginCapabilities capabilities() const override { return m_capabilities; }
    std::unique_ptr<Plugin> create() const override;

private:
    std::string m_name;
    PluginCapabilities m_capabilities;
    Creator m_creator;
};

// ═══════════════════════════════════════════════════════════
// PluginSet — экземпляры плагинов одной сессии
// ═══════════════════════════════════════════════════════════

class CC_API PluginSet {
public:
    PluginSet() = default;
    explicit PluginSet(std::vector<std::unique_ptr<Plugin>> plugins);
    ~PluginSet();

    PluginSet(PluginSet&&) noexcept = default;
    PluginSet& operator=(PluginSet&&) noexcept = default;

    // Запрет копирования
    PluginSet(const PluginSet&) = delete;
    PluginSet& operator=(const PluginSet&) = delete;

    /// Разослать пакет всем плагинам, чей incoming содержит его тип
    /// @return количество плагинов, получивших пакет
    size_t dispatch(const Packet& packet, Device& device);

    /// shutdown() всем плагинам (идемпотентно)
    void shutdownAll();

    std::vector<std::string> names() const;

    /// Найти экземпляр по имени
    Plugin* find(const std::string& name) const;

    size_t size() const { return m_plugins.size(); }
    bool empty() const { return m_plugins.empty(); }

private:
    std::vector<std::unique_ptr<Plugin>> m_plugins;
    bool m_shutdown = false;
};

// ═══════════════════════════════════════════════════════════
// PluginRegistry
// ═══════════════════════════════════════════════════════════

class CC_API PluginRegistry {
public:
    PluginRegistry();
    ~PluginRegistry();

    // Запрет копирования
    PluginRegistry(const PluginRegistry&) = delete;
    PluginRegistry& operator=(const PluginRegistry&) = delete;

    /// Зарегистрировать фабрику
    /// @return false если имя уже занято или фабрика пустая
    bool registerFactory(std::shared_ptr<PluginFactory> factory);

    bool unregisterFactory(const std::string& name);

    bool hasPlugin(const std::string& name) const;

    std::vector<std::string> pluginNames() const;

    /// Плагины, принимающие данный тип пакета (с учётом алиасов)
    std::vector<std::string> pluginsForPacketType(const std::string& packetType) const;

    /// Объединение incoming / outgoing всех плагинов (для identity)
    std::set<std::string> incomingCapabilities() const;
    std::set<std::string> outgoingCapabilities() const;

    /// Создать и инициализировать плагины для сессии.
    /// Плагин создаётся, если его incoming пересекается с outgoing устройства
    /// или его outgoing пересекается с incoming устройства. Устройство без
    /// объявленных capabilities получает все плагины.
    PluginSet instantiate(const Device& device, const PacketSender& sender) const;

    /// Реестр со встроенными плагинами (ping)
    static std::shared_ptr<PluginRegistry> createDefault();

private:
    bool isInterested(const PluginCapabilities& caps, const DeviceInfo& info) const;

    std::map<std::string, std::shared_ptr<PluginFactory>> m_factories;
    std::map<std::string, std::set<std::string>> m_packetIndex;    // тип -> имена плагинов
    mutable std::mutex m_mutex;
};

} // namespace CosmicConnect
