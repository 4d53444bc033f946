#include "castbridge/services/discovery/mdns_discovery.hpp"
#include "castbridge/utils/logger.hpp"

#include <avahi-client/client.h>
#include <avahi-client/lookup.h>
#include <avahi-common/error.h>
#include <avahi-common/malloc.h>
#include <avahi-common/simple-watch.h>

#include <memory>

namespace castbridge {
namespace services {

namespace {

struct BrowseContext {
    std::map<core::DeviceId, core::Device> found;
    bool failed = false;
};

std::map<std::string, std::string> read_txt(AvahiStringList* txt) {
    std::map<std::string, std::string> records;
    for (AvahiStringList* item = txt; item; item = avahi_string_list_get_next(item)) {
        char* key = nullptr;
        char* value = nullptr;
        if (avahi_string_list_get_pair(item, &key, &value, nullptr) < 0) {
            continue;
        }
        std::unique_ptr<char, decltype(&avahi_free)> key_guard(key, avahi_free);
        std::unique_ptr<char, decltype(&avahi_free)> value_guard(value, avahi_free);
        if (key) {
            records[key] = value ? value : "";
        }
    }
    return records;
}

void resolve_callback(AvahiServiceResolver* resolver,
                      AvahiIfIndex, AvahiProtocol,
                      AvahiResolverEvent event, const char* name,
                      const char*, const char*, const char*,
                      const AvahiAddress* address, uint16_t port,
                      AvahiStringList* txt, AvahiLookupResultFlags, void* userdata) {
    auto* context = static_cast<BrowseContext*>(userdata);

    if (event == AVAHI_RESOLVER_FOUND && address) {
        char host[AVAHI_ADDRESS_STR_MAX];
        avahi_address_snprint(host, sizeof(host), address);

        auto device = make_cast_device(host, port, name ? name : "", read_txt(txt));
        CASTBRIDGE_LOG_DEBUG("MdnsDiscovery", "Resolved " + device.name + " at " + device.address());
        context->found.insert_or_assign(device.id, std::move(device));
    } else if (event == AVAHI_RESOLVER_FAILURE) {
        CASTBRIDGE_LOG_DEBUG("MdnsDiscovery", std::string("Failed to resolve ") + (name ? name : "?") + ": " +
                             avahi_strerror(avahi_client_errno(avahi_service_resolver_get_client(resolver))));
    }

    avahi_service_resolver_free(resolver);
}

void browse_callback(AvahiServiceBrowser* browser,
                     AvahiIfIndex interface, AvahiProtocol protocol,
                     AvahiBrowserEvent event,
                     const char* name, const char* type, const char* domain,
                     AvahiLookupResultFlags, void* userdata) {
    auto* context = static_cast<BrowseContext*>(userdata);

    switch (event) {
        case AVAHI_BROWSER_NEW:
            if (!avahi_service_resolver_new(avahi_service_browser_get_client(browser),
                                            interface, protocol, name, type, domain,
                                            AVAHI_PROTO_INET, static_cast<AvahiLookupFlags>(0),
                                            resolve_callback, context)) {
                CASTBRIDGE_LOG_DEBUG("MdnsDiscovery", std::string("Could not start resolver for ") + name);
            }
            break;
        case AVAHI_BROWSER_FAILURE:
            CASTBRIDGE_LOG_WARNING("MdnsDiscovery", std::string("Browser failure: ") +
                                   avahi_strerror(avahi_client_errno(avahi_service_browser_get_client(browser))));
            context->failed = true;
            break;
        default:
            break;
    }
}

} // namespace

core::Device make_cast_device(const std::string& host, std::uint16_t port,
                              const std::string& service_name,
                              const std::map<std::string, std::string>& txt) {
    core::Device device;
    device.kind = core::DeviceKind::CastReceiver;
    device.host = host;
    device.port = port != 0 ? port : MdnsDiscovery::kDefaultCastPort;

    auto fn = txt.find("fn");
    device.name = fn != txt.end() && !fn->second.empty() ? fn->second : service_name;
    if (device.name.empty()) {
        device.name = "Chromecast (" + host + ")";
    }

    auto md = txt.find("md");
    device.model = md != txt.end() ? md->second : "Chromecast";

    device.capabilities = {true, true, true};
    device.last_seen = std::chrono::system_clock::now();
    device.id = core::Device::make_id(device.kind, device.host, device.port, device.name);
    return device;
}

std::expected<std::vector<core::Device>, DiscoveryError>
MdnsDiscovery::discover(std::chrono::milliseconds window, std::stop_token stop) {
    std::unique_ptr<AvahiSimplePoll, decltype(&avahi_simple_poll_free)> poll(
        avahi_simple_poll_new(), avahi_simple_poll_free);
    if (!poll) {
        CASTBRIDGE_LOG_ERROR("MdnsDiscovery", "Failed to create Avahi poll object");
        return std::unexpected(DiscoveryError::Unavailable);
    }

    int error = 0;
    std::unique_ptr<AvahiClient, decltype(&avahi_client_free)> client(
        avahi_client_new(avahi_simple_poll_get(poll.get()), static_cast<AvahiClientFlags>(0),
                         nullptr, nullptr, &error),
        avahi_client_free);
    if (!client) {
        CASTBRIDGE_LOG_WARNING("MdnsDiscovery", std::string("Avahi client error: ") + avahi_strerror(error));
        return std::unexpected(DiscoveryError::Unavailable);
    }

    BrowseContext context;
    std::unique_ptr<AvahiServiceBrowser, decltype(&avahi_service_browser_free)> browser(
        avahi_service_browser_new(client.get(), AVAHI_IF_UNSPEC, AVAHI_PROTO_INET,
                                  kServiceType, nullptr, static_cast<AvahiLookupFlags>(0),
                                  browse_callback, &context),
        avahi_service_browser_free);
    if (!browser) {
        CASTBRIDGE_LOG_WARNING("MdnsDiscovery", std::string("Failed to browse: ") +
                               avahi_strerror(avahi_client_errno(client.get())));
        return std::unexpected(DiscoveryError::Unavailable);
    }

    const auto deadline = std::chrono::steady_clock::now() + window;
    while (std::chrono::steady_clock::now() < deadline && !context.failed) {
        if (stop.stop_requested()) {
            return std::unexpected(DiscoveryError::Cancelled);
        }
        if (avahi_simple_poll_iterate(poll.get(), 100) != 0) {
            break;
        }
    }

    if (context.failed && context.found.empty()) {
        return std::unexpected(DiscoveryError::NetworkError);
    }

    std::vector<core::Device> devices;
    devices.reserve(context.found.size());
    for (auto& [id, device] : context.found) {
        devices.push_back(std::move(device));
    }
    return devices;
}

} // namespace services
} // namespace castbridge
