// ============================================================================
// probe/enrich.cpp — implementation for probe/enrich.hpp
// ============================================================================

#include "netroster/probe/enrich.hpp"
#include "netroster/vendor.hpp"

#include <condition_variable>
#include <memory>
#include <mutex>
#include <system_error>
#include <thread>

#include <arpa/inet.h>     // inet_pton
#include <netdb.h>         // getnameinfo, NI_NAMEREQD
#include <netinet/in.h>    // sockaddr_in
#include <sys/socket.h>

namespace netroster::probe {

// Lookup state shared with the worker; outlives the caller if the worker overruns.
struct PendingLookup {
    std::mutex mu;
    std::condition_variable cv;
    bool done{false};
    std::string name;
};

static std::string lookup_blocking(const std::string& ip) {
    sockaddr_in sa{};
    sa.sin_family = AF_INET;
    if (::inet_pton(AF_INET, ip.c_str(), &sa.sin_addr) != 1) return {};

    char host[NI_MAXHOST] = {0};
    int rc = ::getnameinfo(reinterpret_cast<const sockaddr*>(&sa), sizeof(sa),
                           host, sizeof(host), nullptr, 0, NI_NAMEREQD);
    if (rc != 0) return {};

    std::string name = host;
    while (!name.empty() && name.back() == '.') name.pop_back();
    return name;
}

std::string reverse_dns(const std::string& ip, std::chrono::milliseconds timeout) {
    auto pending = std::make_shared<PendingLookup>();

    try {
        std::thread([pending, ip] {
            std::string name = lookup_blocking(ip);
            std::lock_guard<std::mutex> lock(pending->mu);
            pending->name = std::move(name);
            pending->done = true;
            pending->cv.notify_one();
        }).detach();
    } catch (const std::system_error&) {
        return {};                                   // no thread available: treat as unresolved
    }

    std::unique_lock<std::mutex> lock(pending->mu);
    if (!pending->cv.wait_for(lock, timeout, [&] { return pending->done; })) return {};
    return pending->name;
}

ReverseResolver system_resolver(std::chrono::milliseconds timeout) {
    return [timeout](const std::string& ip) { return reverse_dns(ip, timeout); };
}

void enrich_devices(std::vector<Device>& devices, const ReverseResolver& resolve, const ScanContext& ctx) {
    for (auto& d : devices) {
        if (d.vendor.empty()) d.vendor = lookup_vendor(d.mac);
    }

    if (!resolve) return;
    for (auto& d : devices) {
        if (!d.hostname.empty()) continue;
        if (ctx.expired()) break;
        d.hostname = resolve(d.ip);
    }
}

} // namespace netroster::probe
