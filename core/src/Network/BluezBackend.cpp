// BluezBackend.cpp — org.bluez over the system bus (sd-bus)
//
//   start()         ProfileManager1.RegisterProfile(<root>/profile, service UUID)
//   NewConnection   BlueZ hands us a connected RFCOMM fd -> BluetoothTransport
//   connect()       Device1.ConnectProfile(service UUID), wait for NewConnection
//   startScan()     Adapter1.SetDiscoveryFilter + StartDiscovery, Device1 properties
//                   from GetManagedObjects / InterfacesAdded / PropertiesChanged
//   advertise       LEAdvertisingManager1.RegisterAdvertisement(<root>/advertisement)
//
// All bus calls run under m_busMutex. Bus callbacks only record work; advertisement
// callbacks fire from the bus thread after the lock is released.

#include "cosmicconnect/Network/BluezBackend.h"
#include "cosmicconnect/Error.h"
#include <spdlog/spdlog.h>
#include <systemd/sd-bus.h>
#include <fcntl.h>
#include <unistd.h>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <deque>
#include <map>
#include <mutex>
#include <thread>

namespace CosmicConnect {

namespace {

constexpr const char* BLUEZ_SERVICE = "org.bluez";
constexpr const char* PROFILE_INTERFACE = "org.bluez.Profile1";
constexpr const char* ADVERTISEMENT_INTERFACE = "org.bluez.LEAdvertisement1";
constexpr const char* DEVICE_INTERFACE = "org.bluez.Device1";
constexpr uint64_t BUS_WAIT_USEC = 100000;

std::string busError(int r, const sd_bus_error& error) {
    if (error.message) return error.message;
    return std::strerror(-r);
}

/// /org/bluez/hci0/dev_AA_BB_CC_DD_EE_FF -> AA:BB:CC:DD:EE:FF
std::string addressFromPath(const std::string& path) {
    auto pos = path.rfind("/dev_");
    if (pos == std::string::npos) return {};
    std::string address = path.substr(pos + 5);
    auto slash = address.find('/');
    if (slash != std::string::npos) address.resize(slash);
    std::replace(address.begin(), address.end(), '_', ':');
    return address;
}

std::string lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

/// Читает ay из текущей позиции variant
int readBytes(sd_bus_message* m, std::vector<uint8_t>& out) {
    const void* data = nullptr;
    size_t size = 0;
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "ay");
    if (r < 0) return r;
    r = sd_bus_message_read_array(m, 'y', &data, &size);
    if (r < 0) return r;
    const auto* bytes = static_cast<const uint8_t*>(data);
    out.assign(bytes, bytes + size);
    return sd_bus_message_exit_container(m);
}

/// Разбор a{sv} свойств org.bluez.Device1
int parseDeviceProperties(sd_bus_message* m, BleAdvertisement& adv, bool& relevant) {
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sv}");
    if (r < 0) return r;

    while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sv")) > 0) {
        const char* key = nullptr;
        if ((r = sd_bus_message_read(m, "s", &key)) < 0) return r;
        std::string name = key ? key : "";

        if (name == "Name" || name == "Alias") {
            const char* value = nullptr;
            if ((r = sd_bus_message_read(m, "v", "s", &value)) < 0) return r;
            if (value && (adv.name.empty() || name == "Name")) adv.name = value;
        } else if (name == "Address") {
            const char* value = nullptr;
            if ((r = sd_bus_message_read(m, "v", "s", &value)) < 0) return r;
            if (value) adv.address = value;
        } else if (name == "RSSI") {
            int16_t rssi = 0;
            if ((r = sd_bus_message_read(m, "v", "n", &rssi)) < 0) return r;
            adv.rssi = rssi;
            relevant = true;
        } else if (name == "UUIDs") {
            if ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "as")) < 0) return r;
            if ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "s")) < 0) return r;
            const char* uuid = nullptr;
            while ((r = sd_bus_message_read(m, "s", &uuid)) > 0) {
                adv.serviceUuids.push_back(lower(uuid));
            }
            if (r < 0) return r;
            if ((r = sd_bus_message_exit_container(m)) < 0) return r;
            if ((r = sd_bus_message_exit_container(m)) < 0) return r;
            relevant = true;
        } else if (name == "ServiceData") {
            if ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "a{sv}")) < 0) return r;
            if ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sv}")) < 0) return r;
            while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sv")) > 0) {
                const char* uuid = nullptr;
                if ((r = sd_bus_message_read(m, "s", &uuid)) < 0) return r;
                std::vector<uint8_t> data;
                if ((r = readBytes(m, data)) < 0) return r;
                adv.serviceData[lower(uuid)] = std::move(data);
                if ((r = sd_bus_message_exit_container(m)) < 0) return r;
            }
            if (r < 0) return r;
            if ((r = sd_bus_message_exit_container(m)) < 0) return r;
            if ((r = sd_bus_message_exit_container(m)) < 0) return r;
            relevant = true;
        } else if (name == "ManufacturerData") {
            if ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "a{qv}")) < 0) return r;
            if ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{qv}")) < 0) return r;
            while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "qv")) > 0) {
                uint16_t company = 0;
                if ((r = sd_bus_message_read(m, "q", &company)) < 0) return r;
                std::vector<uint8_t> data;
                if ((r = readBytes(m, data)) < 0) return r;
                adv.manufacturerData[company] = std::move(data);
                if ((r = sd_bus_message_exit_container(m)) < 0) return r;
            }
            if (r < 0) return r;
            if ((r = sd_bus_message_exit_container(m)) < 0) return r;
            if ((r = sd_bus_message_exit_container(m)) < 0) return r;
            relevant = true;
        } else {
            if ((r = sd_bus_message_skip(m, "v")) < 0) return r;
        }

        if ((r = sd_bus_message_exit_container(m)) < 0) return r;
    }
    if (r < 0) return r;
    return sd_bus_message_exit_container(m);
}

} // anonymous namespace

// ═══════════════════════════════════════════════════════════
// BluezBackend::Impl
// ═══════════════════════════════════════════════════════════

class BluezBackend::Impl {
public:
    explicit Impl(BluezConfig config)
        : m_config(std::move(config))
        , m_adapterPath("/org/bluez/" + m_config.adapter)
        , m_profilePath(m_config.objectRoot + "/profile")
        , m_advertisementPath(m_config.objectRoot + "/advertisement") {}

    ~Impl() {
        stopAdvertising();
        stopScan();
        stop();
        closeBus();
    }

    // ═══════════════════════════════════════════════════════════
    // RFCOMM profile
    // ═══════════════════════════════════════════════════════════

    bool start() {
        if (m_profileRegistered) return true;
        if (!openBus()) return false;

        std::lock_guard<std::mutex> lock(m_busMutex);
        int r = sd_bus_add_object_vtable(m_bus, &m_profileSlot, m_profilePath.c_str(),
                                         PROFILE_INTERFACE, PROFILE_VTABLE, this);
        if (r < 0) {
            setError("cannot export Profile1: " + std::string(std::strerror(-r)));
            return false;
        }

        sd_bus_error error = SD_BUS_ERROR_NULL;
        sd_bus_message* reply = nullptr;
        r = sd_bus_call_method(m_bus, BLUEZ_SERVICE, "/org/bluez", "org.bluez.ProfileManager1",
                               "RegisterProfile", &error, &reply, "osa{sv}",
                               m_profilePath.c_str(), BLUETOOTH_SERVICE_UUID, 3,
                               "Name", "s", "CosmicConnect",
                               "Role", "s", "server",
                               "RequireAuthentication", "b", 0);
        if (reply) sd_bus_message_unref(reply);
        if (r < 0) {
            setError("RegisterProfile failed: " + busError(r, error));
            sd_bus_error_free(&error);
            m_profileSlot = sd_bus_slot_unref(m_profileSlot);
            return false;
        }
        sd_bus_error_free(&error);

        m_profileRegistered = true;
        spdlog::info("BlueZ: RFCOMM profile registered at {}", m_profilePath);
        return true;
    }

    void stop() {
        if (!m_profileRegistered.exchange(false)) return;
        {
            std::lock_guard<std::mutex> lock(m_busMutex);
            if (m_bus) {
                sd_bus_error error = SD_BUS_ERROR_NULL;
                sd_bus_message* reply = nullptr;
                int r = sd_bus_call_method(m_bus, BLUEZ_SERVICE, "/org/bluez", "org.bluez.ProfileManager1",
                                           "UnregisterProfile", &error, &reply, "o", m_profilePath.c_str());
                if (reply) sd_bus_message_unref(reply);
                if (r < 0) {
                    spdlog::warn("BlueZ: UnregisterProfile failed: {}", busError(r, error));
                }
                sd_bus_error_free(&error);
            }
            m_profileSlot = sd_bus_slot_unref(m_profileSlot);
        }
        {
            std::lock_guard<std::mutex> lock(m_connMutex);
            m_incoming.clear();
        }
        m_connCv.notify_all();
        spdlog::info("BlueZ: RFCOMM profile unregistered");
    }

    bool isRunning() const { return m_profileRegistered; }

    std::unique_ptr<Transport> connect(const std::string& address, std::chrono::milliseconds timeout) {
        if (!m_profileRegistered) {
            throw ProtocolError(ErrorKind::TransportUnavailable, "Bluetooth profile is not registered");
        }

        auto pending = std::make_shared<OutgoingConnect>();
        pending->impl = this;
        pending->address = address;
        {
            std::lock_guard<std::mutex> lock(m_connMutex);
            m_outgoing[address] = pending;
        }

        std::string devicePath = m_adapterPath + "/dev_" + address;
        std::replace(devicePath.begin() + static_cast<std::ptrdiff_t>(m_adapterPath.size()),
                     devicePath.end(), ':', '_');
        {
            std::lock_guard<std::mutex> lock(m_busMutex);
            int r = sd_bus_call_method_async(m_bus, &pending->slot, BLUEZ_SERVICE, devicePath.c_str(),
                                             DEVICE_INTERFACE, "ConnectProfile", onConnectReply,
                                             pending.get(), "s", BLUETOOTH_SERVICE_UUID);
            if (r < 0) {
                forgetOutgoing(address);
                throw ProtocolError(ErrorKind::TransportUnavailable,
                                    "ConnectProfile to " + address + " failed: " + std::strerror(-r));
            }
        }

        std::unique_ptr<Transport> transport;
        std::string error;
        {
            std::unique_lock<std::mutex> lock(m_connMutex);
            m_connCv.wait_for(lock, timeout, [&]() {
                return pending->transport || !pending->error.empty() || !m_profileRegistered;
            });
            transport = std::move(pending->transport);
            error = pending->error;
        }
        forgetOutgoing(address);
        {
            std::lock_guard<std::mutex> lock(m_busMutex);
            pending->slot = sd_bus_slot_unref(pending->slot);
        }

        if (!transport) {
            if (error.empty()) error = "timed out";
            throw ProtocolError(ErrorKind::TransportUnavailable,
                                "Bluetooth connect to " + address + ": " + error);
        }
        spdlog::info("BlueZ: Connected to {}", address);
        return transport;
    }

    std::unique_ptr<Transport> accept(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(m_connMutex);
        m_connCv.wait_for(lock, timeout, [this]() {
            return !m_incoming.empty() || !m_profileRegistered;
        });
        if (m_incoming.empty()) return nullptr;
        auto transport = std::move(m_incoming.front());
        m_incoming.pop_front();
        return transport;
    }

    // ═══════════════════════════════════════════════════════════
    // BLE scan
    // ═══════════════════════════════════════════════════════════

    bool startScan(const std::string& serviceUuid, AdvertisementCallback callback) {
        if (!openBus()) return false;
        {
            std::lock_guard<std::mutex> lock(m_advertMutex);
            m_onAdvertisement = std::move(callback);
        }

        std::lock_guard<std::mutex> lock(m_busMutex);
        int r = sd_bus_match_signal(m_bus, &m_addedSlot, BLUEZ_SERVICE, "/",
                                    "org.freedesktop.DBus.ObjectManager", "InterfacesAdded",
                                    onInterfacesAdded, this);
        if (r >= 0) {
            r = sd_bus_match_signal(m_bus, &m_propsSlot, BLUEZ_SERVICE, nullptr,
                                    "org.freedesktop.DBus.Properties", "PropertiesChanged",
                                    onPropertiesChanged, this);
        }
        if (r < 0) {
            setError("signal subscription failed: " + std::string(std::strerror(-r)));
            m_addedSlot = sd_bus_slot_unref(m_addedSlot);
            m_propsSlot = sd_bus_slot_unref(m_propsSlot);
            return false;
        }

        sd_bus_error error = SD_BUS_ERROR_NULL;
        sd_bus_message* reply = nullptr;
        r = sd_bus_call_method(m_bus, BLUEZ_SERVICE, m_adapterPath.c_str(), "org.bluez.Adapter1",
                               "SetDiscoveryFilter", &error, &reply, "a{sv}", 2,
                               "UUIDs", "as", 1, serviceUuid.c_str(),
                               "Transport", "s", "le");
        if (reply) reply = sd_bus_message_unref(reply);
        if (r < 0) {
            spdlog::warn("BlueZ: SetDiscoveryFilter failed: {}", busError(r, error));
        }
        sd_bus_error_free(&error);

        error = SD_BUS_ERROR_NULL;
        r = sd_bus_call_method(m_bus, BLUEZ_SERVICE, m_adapterPath.c_str(), "org.bluez.Adapter1",
                               "StartDiscovery", &error, &reply, "");
        if (reply) reply = sd_bus_message_unref(reply);
        if (r < 0 && !(error.name && std::string(error.name) == "org.bluez.Error.InProgress")) {
            setError("StartDiscovery failed: " + busError(r, error));
            sd_bus_error_free(&error);
            m_addedSlot = sd_bus_slot_unref(m_addedSlot);
            m_propsSlot = sd_bus_slot_unref(m_propsSlot);
            return false;
        }
        sd_bus_error_free(&error);

        m_scanning = true;
        scanCachedDevices();
        spdlog::info("BlueZ: LE discovery started on {}", m_adapterPath);
        return true;
    }

    void stopScan() {
        if (!m_scanning.exchange(false)) return;
        std::lock_guard<std::mutex> lock(m_busMutex);
        if (m_bus) {
            sd_bus_error error = SD_BUS_ERROR_NULL;
            sd_bus_message* reply = nullptr;
            int r = sd_bus_call_method(m_bus, BLUEZ_SERVICE, m_adapterPath.c_str(), "org.bluez.Adapter1",
                                       "StopDiscovery", &error, &reply, "");
            if (reply) sd_bus_message_unref(reply);
            if (r < 0) {
                spdlog::debug("BlueZ: StopDiscovery: {}", busError(r, error));
            }
            sd_bus_error_free(&error);
        }
        m_addedSlot = sd_bus_slot_unref(m_addedSlot);
        m_propsSlot = sd_bus_slot_unref(m_propsSlot);
        spdlog::info("BlueZ: LE discovery stopped");
    }

    // ═══════════════════════════════════════════════════════════
    // BLE advertising
    // ═══════════════════════════════════════════════════════════

    bool startAdvertising(const BleAdvertisement& advertisement) {
        if (m_advertising) return true;
        if (!openBus()) return false;

        m_advert = advertisement;

        std::lock_guard<std::mutex> lock(m_busMutex);
        int r = sd_bus_add_object_vtable(m_bus, &m_advertSlot, m_advertisementPath.c_str(),
                                         ADVERTISEMENT_INTERFACE, ADVERTISEMENT_VTABLE, this);
        if (r < 0) {
            setError("cannot export LEAdvertisement1: " + std::string(std::strerror(-r)));
            return false;
        }

        // BlueZ читает свойства объявления до ответа, поэтому вызов асинхронный
        r = sd_bus_call_method_async(m_bus, &m_registerAdvertSlot, BLUEZ_SERVICE, m_adapterPath.c_str(),
                                     "org.bluez.LEAdvertisingManager1", "RegisterAdvertisement",
                                     onRegisterAdvertisementReply, this, "oa{sv}",
                                     m_advertisementPath.c_str(), 0);
        if (r < 0) {
            setError("RegisterAdvertisement failed: " + std::string(std::strerror(-r)));
            m_advertSlot = sd_bus_slot_unref(m_advertSlot);
            return false;
        }
        m_advertising = true;
        return true;
    }

    void stopAdvertising() {
        if (!m_advertising.exchange(false)) return;
        std::lock_guard<std::mutex> lock(m_busMutex);
        if (m_bus) {
            sd_bus_error error = SD_BUS_ERROR_NULL;
            sd_bus_message* reply = nullptr;
            int r = sd_bus_call_method(m_bus, BLUEZ_SERVICE, m_adapterPath.c_str(),
                                       "org.bluez.LEAdvertisingManager1", "UnregisterAdvertisement",
                                       &error, &reply, "o", m_advertisementPath.c_str());
            if (reply) sd_bus_message_unref(reply);
            if (r < 0) {
                spdlog::debug("BlueZ: UnregisterAdvertisement: {}", busError(r, error));
            }
            sd_bus_error_free(&error);
        }
        m_registerAdvertSlot = sd_bus_slot_unref(m_registerAdvertSlot);
        m_advertSlot = sd_bus_slot_unref(m_advertSlot);
        spdlog::info("BlueZ: LE advertising stopped");
    }

    std::string getLastError() const {
        std::lock_guard<std::mutex> lock(m_errorMutex);
        return m_lastError;
    }

private:
    struct OutgoingConnect {
        Impl* impl = nullptr;
        std::string address;
        sd_bus_slot* slot = nullptr;
        std::unique_ptr<Transport> transport;
        std::string error;
    };

    static const sd_bus_vtable PROFILE_VTABLE[];
    static const sd_bus_vtable ADVERTISEMENT_VTABLE[];

    BluezConfig m_config;
    std::string m_adapterPath;
    std::string m_profilePath;
    std::string m_advertisementPath;

    std::mutex m_busMutex;
    sd_bus* m_bus = nullptr;
    sd_bus_slot* m_profileSlot = nullptr;
    sd_bus_slot* m_addedSlot = nullptr;
    sd_bus_slot* m_propsSlot = nullptr;
    sd_bus_slot* m_advertSlot = nullptr;
    sd_bus_slot* m_registerAdvertSlot = nullptr;
    std::thread m_busThread;
    std::atomic<bool> m_busRunning{false};

    std::atomic<bool> m_profileRegistered{false};
    std::atomic<bool> m_scanning{false};
    std::atomic<bool> m_advertising{false};

    std::mutex m_connMutex;
    std::condition_variable m_connCv;
    std::deque<std::unique_ptr<Transport>> m_incoming;
    std::map<std::string, std::shared_ptr<OutgoingConnect>> m_outgoing;

    std::mutex m_advertMutex;
    AdvertisementCallback m_onAdvertisement;
    std::vector<BleAdvertisement> m_pendingAdverts;     // под m_busMutex

    BleAdvertisement m_advert;                          // свойства LEAdvertisement1

    mutable std::mutex m_errorMutex;
    std::string m_lastError;

    void setError(const std::string& error) {
        spdlog::warn("BlueZ: {}", error);
        std::lock_guard<std::mutex> lock(m_errorMutex);
        m_lastError = error;
    }

    bool openBus() {
        std::lock_guard<std::mutex> lock(m_busMutex);
        if (m_bus) return true;

        int r = sd_bus_open_system(&m_bus);
        if (r < 0 || !m_bus) {
            m_bus = nullptr;
            std::lock_guard<std::mutex> errorLock(m_errorMutex);
            m_lastError = "cannot connect to system bus: " + std::string(std::strerror(-r));
            spdlog::error("BlueZ: {}", m_lastError);
            return false;
        }

        m_busRunning = true;
        m_busThread = std::thread([this]() { busLoop(); });
        return true;
    }

    void closeBus() {
        m_busRunning = false;
        if (m_busThread.joinable()) m_busThread.join();
        std::lock_guard<std::mutex> lock(m_busMutex);
        if (m_bus) {
            m_bus = sd_bus_flush_close_unref(m_bus);
        }
    }

    void busLoop() {
        spdlog::debug("BlueZ: Bus thread started");
        while (m_busRunning) {
            std::vector<BleAdvertisement> adverts;
            {
                std::lock_guard<std::mutex> lock(m_busMutex);
                while (true) {
                    int r = sd_bus_process(m_bus, nullptr);
                    if (r < 0) {
                        spdlog::error("BlueZ: sd_bus_process failed: {}", std::strerror(-r));
                        break;
                    }
                    if (r == 0) break;
                }
                adverts.swap(m_pendingAdverts);
            }

            deliverAdvertisements(adverts);

            // Без лока: иначе вызовы из других потоков ждут таймаут
            sd_bus_wait(m_bus, BUS_WAIT_USEC);
        }
        spdlog::debug("BlueZ: Bus thread stopped");
    }

    void deliverAdvertisements(const std::vector<BleAdvertisement>& adverts) {
        if (adverts.empty()) return;
        AdvertisementCallback callback;
        {
            std::lock_guard<std::mutex> lock(m_advertMutex);
            callback = m_onAdvertisement;
        }
        if (!callback) return;
        for (const auto& advert : adverts) {
            try {
                callback(advert);
            } catch (const std::exception& e) {
                spdlog::warn("BlueZ: Advertisement handler failed: {}", e.what());
            }
        }
    }

    void forgetOutgoing(const std::string& address) {
        std::lock_guard<std::mutex> lock(m_connMutex);
        m_outgoing.erase(address);
    }

    /// Под m_busMutex
    void scanCachedDevices() {
        sd_bus_error error = SD_BUS_ERROR_NULL;
        sd_bus_message* reply = nullptr;
        int r = sd_bus_call_method(m_bus, BLUEZ_SERVICE, "/", "org.freedesktop.DBus.ObjectManager",
                                   "GetManagedObjects", &error, &reply, "");
        if (r < 0) {
            spdlog::debug("BlueZ: GetManagedObjects failed: {}", busError(r, error));
            sd_bus_error_free(&error);
            return;
        }
        sd_bus_error_free(&error);

        r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_ARRAY, "{oa{sa{sv}}}");
        while (r >= 0 && (r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_DICT_ENTRY, "oa{sa{sv}}")) > 0) {
            const char* path = nullptr;
            if ((r = sd_bus_message_read(reply, "o", &path)) < 0) break;
            if ((r = parseInterfaces(reply, path ? path : "")) < 0) break;
            r = sd_bus_message_exit_container(reply);
        }
        if (r < 0) {
            spdlog::debug("BlueZ: Cannot parse managed objects: {}", std::strerror(-r));
        }
        sd_bus_message_unref(reply);
    }

    /// a{sa{sv}}: интерфейсы одного объекта
    int parseInterfaces(sd_bus_message* m, const std::string& path) {
        int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sa{sv}}");
        if (r < 0) return r;
        while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sa{sv}")) > 0) {
            const char* iface = nullptr;
            if ((r = sd_bus_message_read(m, "s", &iface)) < 0) return r;
            if (iface && std::strcmp(iface, DEVICE_INTERFACE) == 0) {
                if ((r = collectDevice(m, path)) < 0) return r;
            } else {
                if ((r = sd_bus_message_skip(m, "a{sv}")) < 0) return r;
            }
            if ((r = sd_bus_message_exit_container(m)) < 0) return r;
        }
        if (r < 0) return r;
        return sd_bus_message_exit_container(m);
    }

    int collectDevice(sd_bus_message* m, const std::string& path) {
        BleAdvertisement adv;
        bool relevant = false;
        int r = parseDeviceProperties(m, adv, relevant);
        if (r < 0) return r;
        if (adv.address.empty()) adv.address = addressFromPath(path);
        if (relevant && !adv.address.empty()) {
            m_pendingAdverts.push_back(std::move(adv));
        }
        return 0;
    }

    // ═══════════════════════════════════════════════════════════
    // Bus callbacks (bus thread, m_busMutex held)
    // ═══════════════════════════════════════════════════════════

    static int onInterfacesAdded(sd_bus_message* m, void* userdata, sd_bus_error* /*error*/) {
        auto* self = static_cast<Impl*>(userdata);
        const char* path = nullptr;
        int r = sd_bus_message_read(m, "o", &path);
        if (r < 0) return 0;
        r = self->parseInterfaces(m, path ? path : "");
        if (r < 0) {
            spdlog::debug("BlueZ: Cannot parse InterfacesAdded: {}", std::strerror(-r));
        }
        return 0;
    }

    static int onPropertiesChanged(sd_bus_message* m, void* userdata, sd_bus_error* /*error*/) {
        auto* self = static_cast<Impl*>(userdata);
        const char* iface = nullptr;
        if (sd_bus_message_read(m, "s", &iface) < 0 || !iface) return 0;
        if (std::strcmp(iface, DEVICE_INTERFACE) != 0) return 0;

        const char* path = sd_bus_message_get_path(m);
        int r = self->collectDevice(m, path ? path : "");
        if (r < 0) {
            spdlog::debug("BlueZ: Cannot parse PropertiesChanged: {}", std::strerror(-r));
        }
        return 0;
    }

    static int onConnectReply(sd_bus_message* m, void* userdata, sd_bus_error* /*error*/) {
        auto* pending = static_cast<OutgoingConnect*>(userdata);
        const sd_bus_error* error = sd_bus_message_get_error(m);
        if (!error) return 0;

        Impl* self = pending->impl;
        {
            std::lock_guard<std::mutex> lock(self->m_connMutex);
            if (!pending->transport) {
                pending->error = error->message ? error->message : (error->name ? error->name : "failed");
            }
        }
        self->m_connCv.notify_all();
        return 0;
    }

    static int onRegisterAdvertisementReply(sd_bus_message* m, void* userdata, sd_bus_error* /*error*/) {
        auto* self = static_cast<Impl*>(userdata);
        const sd_bus_error* error = sd_bus_message_get_error(m);
        if (error) {
            self->setError(std::string("RegisterAdvertisement: ") +
                           (error->message ? error->message : "failed"));
            self->m_advertising = false;
        } else {
            spdlog::info("BlueZ: LE advertising started");
        }
        return 0;
    }

    static int onProfileRelease(sd_bus_message* m, void* userdata, sd_bus_error* /*error*/) {
        auto* self = static_cast<Impl*>(userdata);
        spdlog::warn("BlueZ: Profile released by bluetoothd");
        self->m_profileRegistered = false;
        self->m_connCv.notify_all();
        return sd_bus_reply_method_return(m, "");
    }

    static int onNewConnection(sd_bus_message* m, void* userdata, sd_bus_error* error) {
        auto* self = static_cast<Impl*>(userdata);
        const char* devicePath = nullptr;
        int fd = -1;
        int r = sd_bus_message_read(m, "oh", &devicePath, &fd);
        if (r < 0) {
            return sd_bus_error_set_const(error, "org.bluez.Error.Rejected", "malformed NewConnection");
        }

        // Дескриптор принадлежит сообщению
        int socket = fcntl(fd, F_DUPFD_CLOEXEC, 3);
        if (socket < 0) {
            spdlog::error("BlueZ: Cannot duplicate RFCOMM fd: {}", std::strerror(errno));
            return sd_bus_error_set_const(error, "org.bluez.Error.Rejected", "cannot take fd");
        }

        std::string address = addressFromPath(devicePath ? devicePath : "");
        auto transport = std::make_unique<BluetoothTransport>(socket, address);
        spdlog::info("BlueZ: RFCOMM connection from {}", address);

        {
            std::lock_guard<std::mutex> lock(self->m_connMutex);
            auto it = self->m_outgoing.find(address);
            if (it != self->m_outgoing.end() && !it->second->transport) {
                it->second->transport = std::move(transport);
            } else {
                self->m_incoming.push_back(std::move(transport));
            }
        }
        self->m_connCv.notify_all();
        return sd_bus_reply_method_return(m, "");
    }

    static int onRequestDisconnection(sd_bus_message* m, void* /*userdata*/, sd_bus_error* /*error*/) {
        const char* devicePath = nullptr;
        if (sd_bus_message_read(m, "o", &devicePath) >= 0 && devicePath) {
            spdlog::info("BlueZ: Disconnection requested for {}", addressFromPath(devicePath));
        }
        return sd_bus_reply_method_return(m, "");
    }

    static int onAdvertisementRelease(sd_bus_message* m, void* userdata, sd_bus_error* /*error*/) {
        auto* self = static_cast<Impl*>(userdata);
        self->m_advertising = false;
        spdlog::info("BlueZ: Advertisement released");
        return sd_bus_reply_method_return(m, "");
    }

    static int getAdvertType(sd_bus* /*bus*/, const char* /*path*/, const char* /*interface*/,
                             const char* /*property*/, sd_bus_message* reply,
                             void* /*userdata*/, sd_bus_error* /*error*/) {
        return sd_bus_message_append(reply, "s", "peripheral");
    }

    static int getAdvertUuids(sd_bus* /*bus*/, const char* /*path*/, const char* /*interface*/,
                              const char* /*property*/, sd_bus_message* reply,
                              void* userdata, sd_bus_error* /*error*/) {
        auto* self = static_cast<Impl*>(userdata);
        int r = sd_bus_message_open_container(reply, SD_BUS_TYPE_ARRAY, "s");
        if (r < 0) return r;
        for (const auto& uuid : self->m_advert.serviceUuids) {
            if ((r = sd_bus_message_append(reply, "s", uuid.c_str())) < 0) return r;
        }
        return sd_bus_message_close_container(reply);
    }

    static int getAdvertServiceData(sd_bus* /*bus*/, const char* /*path*/, const char* /*interface*/,
                                    const char* /*property*/, sd_bus_message* reply,
                                    void* userdata, sd_bus_error* /*error*/) {
        auto* self = static_cast<Impl*>(userdata);
        int r = sd_bus_message_open_container(reply, SD_BUS_TYPE_ARRAY, "{sv}");
        if (r < 0) return r;
        for (const auto& [uuid, data] : self->m_advert.serviceData) {
            if ((r = sd_bus_message_open_container(reply, SD_BUS_TYPE_DICT_ENTRY, "sv")) < 0) return r;
            if ((r = sd_bus_message_append(reply, "s", uuid.c_str())) < 0) return r;
            if ((r = appendByteVariant(reply, data)) < 0) return r;
            if ((r = sd_bus_message_close_container(reply)) < 0) return r;
        }
        return sd_bus_message_close_container(reply);
    }

    static int getAdvertManufacturerData(sd_bus* /*bus*/, const char* /*path*/, const char* /*interface*/,
                                         const char* /*property*/, sd_bus_message* reply,
                                         void* userdata, sd_bus_error* /*error*/) {
        auto* self = static_cast<Impl*>(userdata);
        int r = sd_bus_message_open_container(reply, SD_BUS_TYPE_ARRAY, "{qv}");
        if (r < 0) return r;
        for (const auto& [company, data] : self->m_advert.manufacturerData) {
            if ((r = sd_bus_message_open_container(reply, SD_BUS_TYPE_DICT_ENTRY, "qv")) < 0) return r;
            if ((r = sd_bus_message_append(reply, "q", company)) < 0) return r;
            if ((r = appendByteVariant(reply, data)) < 0) return r;
            if ((r = sd_bus_message_close_container(reply)) < 0) return r;
        }
        return sd_bus_message_close_container(reply);
    }

    static int appendByteVariant(sd_bus_message* reply, const std::vector<uint8_t>& data) {
        int r = sd_bus_message_open_container(reply, SD_BUS_TYPE_VARIANT, "ay");
        if (r < 0) return r;
        if ((r = sd_bus_message_append_array(reply, 'y', data.data(), data.size())) < 0) return r;
        return sd_bus_message_close_container(reply);
    }
};

const sd_bus_vtable BluezBackend::Impl::PROFILE_VTABLE[] = {
    SD_BUS_VTABLE_START(0),
    SD_BUS_METHOD("Release", "", "", BluezBackend::Impl::onProfileRelease, SD_BUS_VTABLE_UNPRIVILEGED),
    SD_BUS_METHOD("NewConnection", "oha{sv}", "", BluezBackend::Impl::onNewConnection, SD_BUS_VTABLE_UNPRIVILEGED),
    SD_BUS_METHOD("RequestDisconnection", "o", "", BluezBackend::Impl::onRequestDisconnection,
                  SD_BUS_VTABLE_UNPRIVILEGED),
    SD_BUS_VTABLE_END
};

const sd_bus_vtable BluezBackend::Impl::ADVERTISEMENT_VTABLE[] = {
    SD_BUS_VTABLE_START(0),
    SD_BUS_METHOD("Release", "", "", BluezBackend::Impl::onAdvertisementRelease, SD_BUS_VTABLE_UNPRIVILEGED),
    SD_BUS_PROPERTY("Type", "s", BluezBackend::Impl::getAdvertType, 0, SD_BUS_VTABLE_PROPERTY_CONST),
    SD_BUS_PROPERTY("ServiceUUIDs", "as", BluezBackend::Impl::getAdvertUuids, 0, SD_BUS_VTABLE_PROPERTY_CONST),
    SD_BUS_PROPERTY("ServiceData", "a{sv}", BluezBackend::Impl::getAdvertServiceData, 0,
                    SD_BUS_VTABLE_PROPERTY_CONST),
    SD_BUS_PROPERTY("ManufacturerData", "a{qv}", BluezBackend::Impl::getAdvertManufacturerData, 0,
                    SD_BUS_VTABLE_PROPERTY_CONST),
    SD_BUS_VTABLE_END
};

// ═══════════════════════════════════════════════════════════
// Public Interface
// ═══════════════════════════════════════════════════════════

BluezBackend::BluezBackend(BluezConfig config)
    : m_impl(std::make_unique<Impl>(std::move(config))) {}

BluezBackend::~BluezBackend() = default;

bool BluezBackend::start() {
    return m_impl->start();
}

void BluezBackend::stop() {
    m_impl->stop();
}

bool BluezBackend::isRunning() const {
    return m_impl->isRunning();
}

std::unique_ptr<Transport> BluezBackend::connect(const std::string& address, std::chrono::milliseconds timeout) {
    return m_impl->connect(address, timeout);
}

std::unique_ptr<Transport> BluezBackend::accept(std::chrono::milliseconds timeout) {
    return m_impl->accept(timeout);
}

bool BluezBackend::startScan(const std::string& serviceUuid, AdvertisementCallback callback) {
    return m_impl->startScan(serviceUuid, std::move(callback));
}

void BluezBackend::stopScan() {
    m_impl->stopScan();
}

bool BluezBackend::startAdvertising(const BleAdvertisement& advertisement) {
    return m_impl->startAdvertising(advertisement);
}

void BluezBackend::stopAdvertising() {
    m_impl->stopAdvertising();
}

std::string BluezBackend::getLastError() const {
    return m_impl->getLastError();
}

} // namespace CosmicConnect
