#pragma once

/**
 * @file connectivity.hpp
 * @brief Network reachability as the upload gates see it
 *
 * WHY THIS FILE EXISTS:
 * Uploads of large media must not start on a metered link unless the user
 * allows it, and must not start at all while offline. The processor only
 * needs a snapshot: is there a link, what kind, is it metered.
 */

#include <filesystem>
#include <string>
#include <vector>

namespace outbox::net {

enum class TransportType {
    None,
    Wifi,
    Ethernet,
    Cellular,
    Other
};

struct ConnectivityStatus {
    bool connected = false;
    TransportType transport = TransportType::None;
    bool metered = false;
    std::string interface_name;

    bool operator==(const ConnectivityStatus& other) const {
        return connected == other.connected && transport == other.transport
            && metered == other.metered && interface_name == other.interface_name;
    }
    bool operator!=(const ConnectivityStatus& other) const { return !(*this == other); }
};

const char* to_string(TransportType transport) noexcept;

class ConnectivityOracle {
public:
    virtual ~ConnectivityOracle() = default;
    virtual ConnectivityStatus current() = 0;
};

enum class TransportPolicy {
    Any,
    UnmeteredOnly   ///< Wi-Fi or wired only
};

/// Whether `status` satisfies `policy`; always false when disconnected.
bool transport_allowed(const ConnectivityStatus& status, TransportPolicy policy) noexcept;

/**
 * @brief Linux oracle reading /sys/class/net
 *
 * An interface counts when operstate is "up" (or "unknown" with carrier 1,
 * as reported by some tun and ppp drivers). Loopback is ignored. Interfaces
 * whose name starts with one of `metered_prefixes` are cellular and
 * metered; a `wireless` or `phy80211` entry means Wi-Fi; a backing
 * `device` means Ethernet. Unmetered links win over metered ones.
 */
class SysfsConnectivityOracle : public ConnectivityOracle {
public:
    explicit SysfsConnectivityOracle(std::filesystem::path sys_root = "/sys/class/net",
                                     std::vector<std::string> metered_prefixes = {"wwan", "ppp", "usb", "rmnet"});

    ConnectivityStatus current() override;

private:
    bool is_up(const std::filesystem::path& iface) const;
    bool is_metered_name(const std::string& name) const;

    std::filesystem::path sys_root_;
    std::vector<std::string> metered_prefixes_;
};

} // namespace outbox::net
