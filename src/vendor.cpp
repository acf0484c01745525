// ============================================================================
// vendor.cpp — implementation for vendor.hpp
// ============================================================================

#include "netroster/vendor.hpp"

#include <cctype>
#include <cstddef>

#include "etl/flat_map.h"

namespace netroster {

static constexpr std::size_t VENDOR_CAPACITY = 96;   // headroom over the current table

using VendorTable = etl::flat_map<OuiKey, const char*, VENDOR_CAPACITY>;

struct VendorEntry {
    const char* prefix;
    const char* vendor;
};

// Prefixes are stored already normalized (upper-case, colon separated).
static const VendorEntry VENDOR_ENTRIES[] = {
    {"00:50:56", "VMware"},
    {"00:0C:29", "VMware"},
    {"08:00:27", "VirtualBox"},
    {"52:54:00", "QEMU/KVM"},
    {"B8:27:EB", "Raspberry Pi"},
    {"DC:A6:32", "Raspberry Pi"},
    {"E4:5F:01", "Raspberry Pi"},
    {"28:CD:C1", "Raspberry Pi"},
    {"D8:3A:DD", "Raspberry Pi"},
    {"00:E0:4C", "Realtek"},
    {"00:15:5D", "Microsoft Hyper-V"},
    {"00:23:AE", "Dell"},
    {"00:14:22", "Dell"},
    {"18:A9:9B", "Dell"},
    {"3C:D9:2B", "HP"},
    {"00:1E:0B", "HP"},
    {"00:21:5A", "HP"},
    {"00:1F:C6", "ASUSTek"},
    {"00:1A:92", "ASUSTek"},
    {"14:DA:E9", "ASUSTek"},
    {"00:1C:C0", "Intel"},
    {"00:1F:3B", "Intel"},
    {"3C:A9:F4", "Intel"},
    {"5C:B9:01", "Ubiquiti"},
    {"00:27:22", "Ubiquiti"},
    {"04:18:D6", "Ubiquiti"},
    {"74:83:C2", "Ubiquiti"},
    {"FC:EC:DA", "Ubiquiti"},
    {"00:18:0A", "Cisco"},
    {"00:1B:2A", "Cisco"},
    {"64:F6:9D", "Cisco"},
    {"00:14:BF", "Linksys"},
    {"00:1A:70", "Linksys"},
    {"C0:C1:C0", "Linksys"},
    {"00:1F:33", "Netgear"},
    {"00:22:3F", "Netgear"},
    {"A0:63:91", "Netgear"},
    {"08:86:3B", "Belkin"},
    {"94:10:3E", "Belkin"},
    {"00:26:5A", "D-Link"},
    {"00:1E:58", "D-Link"},
    {"1C:7E:E5", "D-Link"},
    {"00:1D:0F", "TP-Link"},
    {"14:CC:20", "TP-Link"},
    {"50:C7:BF", "TP-Link"},
    {"00:25:00", "Apple"},
    {"00:26:08", "Apple"},
    {"28:CF:DA", "Apple"},
    {"3C:15:C2", "Apple"},
    {"5C:F9:38", "Apple"},
    {"78:31:C1", "Apple"},
    {"18:65:90", "Samsung"},
    {"50:01:BB", "Samsung"},
    {"94:35:0A", "Samsung"},
    {"2C:54:91", "Microsoft"},
    {"7C:1E:52", "Microsoft"},
};

static const VendorTable& table() {
    static const VendorTable t = [] {
        VendorTable m;
        for (const auto& e : VENDOR_ENTRIES) m[OuiKey(e.prefix)] = e.vendor;
        return m;
    }();
    return t;
}

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::optional<OuiKey> normalize_oui(const std::string& mac) {
    static const char HEX[] = "0123456789ABCDEF";
    OuiKey key;
    size_t pos = 0;

    for (int octet = 0; octet < 3; ++octet) {
        if (octet > 0) {
            if (pos >= mac.size() || (mac[pos] != ':' && mac[pos] != '-')) return std::nullopt;
            ++pos;
            key.push_back(':');
        }
        // one or two hex digits per octet
        int value = 0, digits = 0;
        while (pos < mac.size() && digits < 2) {
            const int h = hex_value(mac[pos]);
            if (h < 0) break;
            value = value * 16 + h;
            ++digits; ++pos;
        }
        if (digits == 0) return std::nullopt;
        // a third hex digit means this is not an octet boundary
        if (pos < mac.size() && hex_value(mac[pos]) >= 0) return std::nullopt;
        key.push_back(HEX[(value >> 4) & 0xF]);
        key.push_back(HEX[value & 0xF]);
    }
    return key;
}

std::string lookup_vendor(const std::string& mac) {
    auto key = normalize_oui(mac);
    if (!key) return UNKNOWN_VENDOR;
    auto it = table().find(*key);
    if (it == table().end()) return UNKNOWN_VENDOR;
    return it->second;
}

} // namespace netroster
