// BluezBackend.h — BlueZ через sd-bus: RFCOMM профиль (Profile1) и BLE сканер/анонс
// Собирается только при найденном libsystemd (COSMICCONNECT_HAVE_BLUEZ)

#pragma once

#include "BluetoothTransport.h"
#include "BleDiscovery.h"
#include <memory>
#include <string>

namespace CosmicConnect {

struct BluezConfig {
    std::string adapter = "hci0";
    std::string objectRoot = "/org/cosmicconnect";
};

class CC_API BluezBackend : public BluetoothBackend, public BleScanner {
public:
    explicit BluezBackend(BluezConfig config = {});
    ~BluezBackend() override;

    // Запрет копирования
    BluezBackend(const BluezBackend&) = delete;
    BluezBackend& operator=(const BluezBackend&) = delete;

    // BluetoothBackend
    bool start() override;
    void stop() override;
    bool isRunning() const override;
    std::unique_ptr<Transport> connect(const std::string& address,
                                       std::chrono::milliseconds timeout) override;
    std::unique_ptr<Transport> accept(std::chrono::milliseconds timeout) override;

    // BleScanner
    bool startScan(const std::string& serviceUuid, AdvertisementCallback callback) override;
    void stopScan() override;
    bool startAdvertising(const BleAdvertisement& advertisement) override;
    void stopAdvertising() override;

    std::string getLastError() const override;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace CosmicConnect
