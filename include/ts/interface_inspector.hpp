/**
 * @file interface_inspector.hpp
 * @brief Read-only view of the host's network interfaces and the helpers
 *        that pick the tethering interface and its /24 subnet.
 *
 * Every call inspects the OS afresh; nothing is cached. Enumeration
 * failures are logged and produce an empty list rather than an error.
 */

#ifndef TS_INTERFACE_INSPECTOR_HPP_
#define TS_INTERFACE_INSPECTOR_HPP_

#include "ts/log.hpp"
#include "ts/platform.hpp"
#include "ts/vocabulary.hpp"

#if TS_HAS_NETWORK

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

namespace ts {

// ============================================================================
// InterfaceInfo
// ============================================================================

/// @brief Snapshot of one network interface. Immutable value.
struct InterfaceInfo {
  std::string name;
  std::string display_name;
  optional<std::string> ipv4;  ///< First non-loopback IPv4, if any.
  bool is_up = false;
  bool is_loopback = false;
  bool supports_multicast = false;

  bool operator==(const InterfaceInfo& o) const {
    return name == o.name && display_name == o.display_name &&
           ipv4 == o.ipv4 && is_up == o.is_up &&
           is_loopback == o.is_loopback &&
           supports_multicast == o.supports_multicast;
  }
  bool operator!=(const InterfaceInfo& o) const { return !(*this == o); }
};

// ============================================================================
// Naming Helpers
// ============================================================================

/// @brief Case-insensitive prefix test.
inline bool HasPrefixNoCase(const char* name, const char* prefix) noexcept {
  if (name == nullptr || prefix == nullptr) return false;
  while (*prefix != '\0') {
    if (*name == '\0' ||
        std::tolower(static_cast<unsigned char>(*name)) !=
            std::tolower(static_cast<unsigned char>(*prefix))) {
      return false;
    }
    ++name;
    ++prefix;
  }
  return true;
}

/// @brief Case-insensitive substring test.
inline bool ContainsNoCase(const char* haystack, const char* needle) noexcept {
  if (haystack == nullptr || needle == nullptr) return false;
  for (const char* h = haystack; *h != '\0'; ++h) {
    if (HasPrefixNoCase(h, needle)) return true;
  }
  return *needle == '\0';
}

/**
 * @brief Ethernet naming convention: "eth" prefix, any case.
 *
 * A prefix match keeps virtual pairs ("veth1a2b") and bridges out.
 */
inline bool IsEthernetName(const char* name) noexcept {
  return HasPrefixNoCase(name, "eth");
}

/// @brief Ethernet-named, up, and not loopback.
inline bool IsTetheringCandidate(const InterfaceInfo& info) {
  return IsEthernetName(info.name.c_str()) && info.is_up && !info.is_loopback;
}

// ============================================================================
// Subnet Helpers
// ============================================================================

namespace detail {

/// @brief Parse "a.b.c.d" strictly: four decimal octets, each 0..255.
inline bool ParseIpv4Octets(const char* text, uint32_t out[4]) noexcept {
  const char* p = text;
  for (int i = 0; i < 4; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(*p))) return false;
    uint32_t v = 0;
    int digits = 0;
    while (std::isdigit(static_cast<unsigned char>(*p))) {
      v = v * 10U + static_cast<uint32_t>(*p - '0');
      ++p;
      if (++digits > 3) return false;
    }
    if (v > 255U) return false;
    out[i] = v;
    if (i < 3) {
      if (*p != '.') return false;
      ++p;
    }
  }
  return *p == '\0';
}

}  // namespace detail

/**
 * @brief /24 prefix ("a.b.c") of a dotted-quad address.
 * @return empty when @p address is not a valid IPv4 literal.
 */
inline optional<std::string> SubnetOfAddress(const std::string& address) {
  uint32_t o[4];
  if (!detail::ParseIpv4Octets(address.c_str(), o)) {
    return {};
  }
  char buf[16];
  (void)std::snprintf(buf, sizeof(buf), "%u.%u.%u", o[0], o[1], o[2]);
  return optional<std::string>(std::string(buf));
}

/**
 * @brief /24 subnet of an interface.
 * @return empty when no IPv4 address is assigned yet (DHCP pending).
 */
inline optional<std::string> SubnetOf(const InterfaceInfo& info) {
  if (!info.ipv4.has_value()) {
    return {};
  }
  return SubnetOfAddress(info.ipv4.value());
}

/// @brief True when @p subnet is three valid octets ("a.b.c").
inline bool IsValidSubnet(const std::string& subnet) {
  uint32_t o[4];
  const std::string probe = subnet + ".0";
  return detail::ParseIpv4Octets(probe.c_str(), o);
}

/// @brief "subnet.host", e.g. ("10.0.0", 1) -> "10.0.0.1".
inline std::string HostAddress(const std::string& subnet, uint32_t host_id) {
  char buf[24];
  (void)std::snprintf(buf, sizeof(buf), ".%u", host_id);
  return subnet + buf;
}

// ============================================================================
// Enumeration
// ============================================================================

namespace detail {

/// @brief Kernel interface alias (/sys/class/net/<if>/ifalias), or "".
inline std::string ReadInterfaceAlias(const char* name) {
  char path[128];
  (void)std::snprintf(path, sizeof(path), "/sys/class/net/%s/ifalias", name);
  FILE* f = std::fopen(path, "r");
  if (f == nullptr) return {};
  char buf[128];
  std::string alias;
  if (std::fgets(buf, sizeof(buf), f) != nullptr) {
    alias = buf;
    while (!alias.empty() &&
           (alias.back() == '\n' || alias.back() == ' ')) {
      alias.pop_back();
    }
  }
  (void)std::fclose(f);
  return alias;
}

inline InterfaceInfo* FindByName(std::vector<InterfaceInfo>& list,
                                 const char* name) {
  for (auto& info : list) {
    if (info.name == name) return &info;
  }
  return nullptr;
}

}  // namespace detail

/**
 * @brief Enumerate all interfaces, one entry per name, in OS order.
 *
 * Never fails: on getifaddrs(3) failure an error is logged and the
 * result is empty.
 */
inline std::vector<InterfaceInfo> ListInterfaces() {
  std::vector<InterfaceInfo> result;
  struct ifaddrs* ifaddr = nullptr;
  if (::getifaddrs(&ifaddr) != 0 || ifaddr == nullptr) {
    TS_LOG_ERROR("Interfaces", "getifaddrs failed: %s", std::strerror(errno));
    return result;
  }

  for (struct ifaddrs* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
    if (ifa->ifa_name == nullptr) continue;

    InterfaceInfo* info = detail::FindByName(result, ifa->ifa_name);
    if (info == nullptr) {
      InterfaceInfo fresh;
      fresh.name = ifa->ifa_name;
      std::string alias = detail::ReadInterfaceAlias(ifa->ifa_name);
      fresh.display_name = alias.empty() ? fresh.name : alias;
      fresh.is_up = (ifa->ifa_flags & IFF_UP) != 0;
      fresh.is_loopback = (ifa->ifa_flags & IFF_LOOPBACK) != 0;
      fresh.supports_multicast = (ifa->ifa_flags & IFF_MULTICAST) != 0;
      result.push_back(fresh);
      info = &result.back();
    }

    if (info->ipv4.has_value() || ifa->ifa_addr == nullptr ||
        ifa->ifa_addr->sa_family != AF_INET) {
      continue;
    }
    const auto* sin = reinterpret_cast<const sockaddr_in*>(ifa->ifa_addr);
    if ((ntohl(sin->sin_addr.s_addr) >> 24) == 127U) {
      continue;
    }
    char buf[INET_ADDRSTRLEN] = {0};
    if (::inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf)) != nullptr) {
      info->ipv4 = std::string(buf);
    }
  }

  ::freeifaddrs(ifaddr);
  TS_LOG_DEBUG("Interfaces", "enumerated %zu interfaces", result.size());
  return result;
}

// ============================================================================
// Selection
// ============================================================================

/**
 * @brief First Ethernet tethering candidate in @p list.
 *
 * USB (rndis/usb), Bluetooth and Wi-Fi interfaces never qualify.
 */
inline optional<InterfaceInfo> PrimaryTetheringInterface(
    const std::vector<InterfaceInfo>& list) {
  for (const auto& info : list) {
    if (IsTetheringCandidate(info)) {
      return optional<InterfaceInfo>(info);
    }
  }
  return {};
}

inline optional<InterfaceInfo> PrimaryTetheringInterface() {
  return PrimaryTetheringInterface(ListInterfaces());
}

/**
 * @brief Address to embed in the published stream URL.
 *
 * A Tailscale address (100.x.x.x, or any address on an interface whose
 * name contains "tailscale") is preferred so remote viewers on the
 * tailnet can reach the stream; otherwise the first address on an up,
 * non-loopback interface.
 */
inline optional<std::string> SelectAdvertisedAddress(
    const std::vector<InterfaceInfo>& list) {
  optional<std::string> tailscale;
  optional<std::string> fallback;
  for (const auto& info : list) {
    if (info.is_loopback || !info.is_up || !info.ipv4.has_value()) continue;
    const std::string& ip = info.ipv4.value();
    if (ip.compare(0, 4, "100.") == 0 ||
        ContainsNoCase(info.name.c_str(), "tailscale")) {
      tailscale = ip;
    } else if (!fallback.has_value()) {
      fallback = ip;
    }
  }
  return tailscale.has_value() ? tailscale : fallback;
}

}  // namespace ts

#endif  // TS_HAS_NETWORK

#endif  // TS_INTERFACE_INSPECTOR_HPP_
