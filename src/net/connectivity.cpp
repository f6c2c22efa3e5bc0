#include "outbox/net/connectivity.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <system_error>

namespace outbox::net {

namespace fs = std::filesystem;

namespace {

std::string read_first_line(const fs::path& path) {
    std::ifstream input(path);
    std::string line;
    if (input) {
        std::getline(input, line);
    }
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r' || line.back() == ' ')) {
        line.pop_back();
    }
    return line;
}

bool exists_quietly(const fs::path& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

// Lower is better: wired, then Wi-Fi, then metered.
int preference(const ConnectivityStatus& status) {
    if (status.metered) {
        return 2;
    }
    return status.transport == TransportType::Ethernet ? 0 : 1;
}

} // namespace

const char* to_string(TransportType transport) noexcept {
    switch (transport) {
        case TransportType::None: return "none";
        case TransportType::Wifi: return "wifi";
        case TransportType::Ethernet: return "ethernet";
        case TransportType::Cellular: return "cellular";
        case TransportType::Other: return "other";
    }
    return "none";
}

bool transport_allowed(const ConnectivityStatus& status, TransportPolicy policy) noexcept {
    if (!status.connected) {
        return false;
    }
    if (policy == TransportPolicy::Any) {
        return true;
    }
    return !status.metered
        && (status.transport == TransportType::Wifi || status.transport == TransportType::Ethernet);
}

SysfsConnectivityOracle::SysfsConnectivityOracle(fs::path sys_root, std::vector<std::string> metered_prefixes)
    : sys_root_(std::move(sys_root))
    , metered_prefixes_(std::move(metered_prefixes)) {}

ConnectivityStatus SysfsConnectivityOracle::current() {
    std::error_code ec;
    fs::directory_iterator it(sys_root_, ec);
    if (ec) {
        spdlog::warn("Cannot list {}: {}", sys_root_.string(), ec.message());
        return {};
    }

    std::vector<ConnectivityStatus> candidates;
    for (const auto& entry : it) {
        const auto name = entry.path().filename().string();
        if (name == "lo" || !is_up(entry.path())) {
            continue;
        }

        ConnectivityStatus status;
        status.connected = true;
        status.interface_name = name;
        if (is_metered_name(name)) {
            status.transport = TransportType::Cellular;
            status.metered = true;
        } else if (exists_quietly(entry.path() / "wireless") || exists_quietly(entry.path() / "phy80211")) {
            status.transport = TransportType::Wifi;
        } else if (exists_quietly(entry.path() / "device")) {
            status.transport = TransportType::Ethernet;
        } else {
            // Virtual links (bridges, docker, veth) without a physical device.
            continue;
        }
        candidates.push_back(std::move(status));
    }

    if (candidates.empty()) {
        return {};
    }

    std::sort(candidates.begin(), candidates.end(), [](const auto& a, const auto& b) {
        const int pa = preference(a);
        const int pb = preference(b);
        return pa != pb ? pa < pb : a.interface_name < b.interface_name;
    });
    return candidates.front();
}

bool SysfsConnectivityOracle::is_up(const fs::path& iface) const {
    const auto operstate = read_first_line(iface / "operstate");
    if (operstate == "up") {
        return true;
    }
    return operstate == "unknown" && read_first_line(iface / "carrier") == "1";
}

bool SysfsConnectivityOracle::is_metered_name(const std::string& name) const {
    return std::any_of(metered_prefixes_.begin(), metered_prefixes_.end(), [&](const std::string& prefix) {
        return !prefix.empty() && name.rfind(prefix, 0) == 0;
    });
}

} // namespace outbox::net
