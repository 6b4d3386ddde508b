/**
 * @file device_registry.hpp
 * @brief Thread-safe table of discovered devices keyed by IP.
 *
 * Written by the discovery engine and the endpoint negotiator, read by the
 * health checks and the snapshot writer. All access is guarded by a
 * read-write lock.
 *
 * @copyright Copyright (c) 2024 camfleet Contributors
 * @license MIT License
 */

#pragma once

#include "camfleet/core/device.hpp"
#include "camfleet/core/export.hpp"

#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace camfleet {
namespace core {

/**
 * @class DeviceRegistry
 * @brief Device table with idempotent upsert.
 *
 * Usage:
 * @code
 * auto registry = std::make_shared<DeviceRegistry>();
 * registry->upsert(device);
 * registry->setWebsocketUrl("192.168.1.50", "wss://192.168.1.50/ws");
 * for (const auto& d : registry->all()) { ... }
 * @endcode
 */
class CAMFLEET_CORE_API DeviceRegistry {
public:
    DeviceRegistry() = default;
    ~DeviceRegistry() = default;

    DeviceRegistry(const DeviceRegistry&) = delete;
    DeviceRegistry& operator=(const DeviceRegistry&) = delete;

    /**
     * @brief Insert or replace the record for device.ip.
     *
     * Optional URLs absent from @p device keep their previously stored value,
     * so a re-probe does not erase a negotiated endpoint.
     *
     * @return True if the device is new or any field changed.
     */
    bool upsert(const Device& device);

    std::optional<Device> get(const std::string& ip) const;

    /**
     * @brief All devices ordered by numeric IPv4 value.
     */
    std::vector<Device> all() const;

    bool setWebsocketUrl(const std::string& ip, const std::optional<std::string>& url);

    bool remove(const std::string& ip);

    size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Device> devices_;
};

/// Order two dotted-quad strings numerically, falling back to text order.
CAMFLEET_CORE_API bool ipLess(const std::string& a, const std::string& b);

}  // namespace core
}  // namespace camfleet
