/**
 * @file device.hpp
 * @brief Discovered camera record and login credentials.
 *
 * @copyright Copyright (c) 2024 camfleet Contributors
 * @license MIT License
 */

#pragma once

#include "camfleet/core/export.hpp"

#include <optional>
#include <string>

namespace camfleet {
namespace core {

/**
 * @struct Capabilities
 * @brief Feature endpoints a device answered (200 or 401).
 */
struct CAMFLEET_CORE_API Capabilities {
    bool rtsp = false;
    bool onvif = false;
    bool motion_detection = false;
    bool audio = false;
    bool ptz = false;
    bool analytics = false;

    bool operator==(const Capabilities& o) const {
        return rtsp == o.rtsp && onvif == o.onvif && motion_detection == o.motion_detection &&
               audio == o.audio && ptz == o.ptz && analytics == o.analytics;
    }
};

/**
 * @struct Device
 * @brief One camera, keyed by IPv4 address.
 */
struct CAMFLEET_CORE_API Device {
    std::string ip;
    std::string mac;
    std::string model;
    std::string serial;
    std::string firmware;
    std::string name;
    Capabilities capabilities;
    std::optional<std::string> rtsp_url;
    std::optional<std::string> websocket_url;

    Device() = default;

    /// Record with every identity field defaulted to "unknown".
    explicit Device(const std::string& ip_)
        : ip(ip_)
        , mac("unknown")
        , model("unknown")
        , serial("unknown")
        , firmware("unknown")
        , name("axis-" + ip_)
    {}

    bool operator==(const Device& o) const {
        return ip == o.ip && mac == o.mac && model == o.model && serial == o.serial &&
               firmware == o.firmware && name == o.name && capabilities == o.capabilities &&
               rtsp_url == o.rtsp_url && websocket_url == o.websocket_url;
    }
    bool operator!=(const Device& o) const { return !(*this == o); }
};

struct CAMFLEET_CORE_API Credentials {
    std::string username = "root";
    std::string password = "admin";
};

}  // namespace core
}  // namespace camfleet
