/**
 * @file device_registry.cpp
 * @brief DeviceRegistry implementation.
 *
 * @copyright Copyright (c) 2024 camfleet Contributors
 * @license MIT License
 */

#include "camfleet/core/device_registry.hpp"
#include "camfleet/net/ipv4_network.hpp"
#include "camfleet/utils/logger.hpp"

#include <algorithm>
#include <mutex>

namespace camfleet {
namespace core {

bool ipLess(const std::string& a, const std::string& b) {
    auto na = net::ipv4FromString(a);
    auto nb = net::ipv4FromString(b);
    if (na && nb) {
        return *na < *nb;
    }
    return a < b;
}

bool DeviceRegistry::upsert(const Device& device) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = devices_.find(device.ip);
    if (it == devices_.end()) {
        devices_.emplace(device.ip, device);
        LOG_INFO("DeviceRegistry", "New device: {} ({} at {})",
                 device.name, device.model, device.ip);
        return true;
    }

    Device merged = device;
    if (!merged.rtsp_url) {
        merged.rtsp_url = it->second.rtsp_url;
    }
    if (!merged.websocket_url) {
        merged.websocket_url = it->second.websocket_url;
    }

    if (merged == it->second) {
        return false;
    }

    LOG_DEBUG("DeviceRegistry", "Updated device {}", device.ip);
    it->second = std::move(merged);
    return true;
}

std::optional<Device> DeviceRegistry::get(const std::string& ip) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = devices_.find(ip);
    if (it == devices_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Device> DeviceRegistry::all() const {
    std::vector<Device> result;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        result.reserve(devices_.size());
        for (const auto& [ip, device] : devices_) {
            result.push_back(device);
        }
    }
    std::sort(result.begin(), result.end(),
              [](const Device& a, const Device& b) { return ipLess(a.ip, b.ip); });
    return result;
}

bool DeviceRegistry::setWebsocketUrl(const std::string& ip, const std::optional<std::string>& url) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = devices_.find(ip);
    if (it == devices_.end()) {
        return false;
    }
    it->second.websocket_url = url;
    return true;
}

bool DeviceRegistry::remove(const std::string& ip) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return devices_.erase(ip) > 0;
}

size_t DeviceRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return devices_.size();
}

}  // namespace core
}  // namespace camfleet
