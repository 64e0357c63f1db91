#include "network/discovery.hpp"

#include <avahi-client/client.h>
#include <avahi-client/publish.h>
#include <avahi-client/lookup.h>
#include <avahi-common/alternative.h>
#include <avahi-common/error.h>
#include <avahi-common/malloc.h>
#include <avahi-common/thread-watch.h>

#include <QMetaObject>
#include <QObject>
#include <map>
#include <string>

namespace manuscripts::network {
namespace {

constexpr int kMaxRenames = 16;

// Holds the threaded poll lock while the Qt thread touches Avahi objects.
class PollLock {
public:
    explicit PollLock(AvahiThreadedPoll* poll) : poll_(poll) {
        if (poll_) avahi_threaded_poll_lock(poll_);
    }
    ~PollLock() {
        if (poll_) avahi_threaded_poll_unlock(poll_);
    }
    PollLock(const PollLock&) = delete;
    PollLock& operator=(const PollLock&) = delete;

private:
    AvahiThreadedPoll* poll_;
};

std::string txt_value(AvahiStringList* txt, const char* key) {
    AvahiStringList* item = avahi_string_list_find(txt, key);
    if (!item) return {};

    char* k = nullptr;
    char* v = nullptr;
    std::string out;
    if (avahi_string_list_get_pair(item, &k, &v, nullptr) == 0) {
        if (v) out = v;
        avahi_free(k);
        avahi_free(v);
    }
    return out;
}

} // namespace

/**
 * Avahi-based mDNS discovery backend for Linux.
 *
 * Avahi invokes its callbacks on the threaded poll's thread with the poll
 * lock held; results are posted to the owning Qt thread before they reach
 * the DiscoveryBackend callbacks.
 */
class AvahiDiscoveryBackend final : public QObject, public DiscoveryBackend {
public:
    AvahiDiscoveryBackend() = default;

    ~AvahiDiscoveryBackend() override {
        if (threaded_poll_) {
            avahi_threaded_poll_stop(threaded_poll_);
        }
        if (browser_) avahi_service_browser_free(browser_);
        if (group_) avahi_entry_group_free(group_);
        if (client_) avahi_client_free(client_);
        if (threaded_poll_) avahi_threaded_poll_free(threaded_poll_);
    }

    Result<void, Error> start_advertising(const ServiceRecord& record) override {
        auto client = ensure_client();
        if (client.is_err()) return client;

        PollLock lock(threaded_poll_);
        advertised_ = record;
        service_name_ = record.display_name.toUtf8().toStdString();
        advertising_ = true;

        if (avahi_client_get_state(client_) != AVAHI_CLIENT_S_RUNNING) {
            // Registered from client_callback once the daemon is ready.
            return Result<void, Error>::ok();
        }
        return create_services();
    }

    void stop_advertising() override {
        PollLock lock(threaded_poll_);
        advertising_ = false;
        if (group_) {
            avahi_entry_group_reset(group_);
            avahi_entry_group_free(group_);
            group_ = nullptr;
        }
    }

    Result<void, Error> start_browsing() override {
        auto client = ensure_client();
        if (client.is_err()) return client;

        PollLock lock(threaded_poll_);
        if (browser_) return Result<void, Error>::ok();

        browser_ = avahi_service_browser_new(
            client_,
            AVAHI_IF_UNSPEC,
            AVAHI_PROTO_UNSPEC,
            SERVICE_TYPE,
            nullptr,  // domain
            static_cast<AvahiLookupFlags>(0),
            browse_callback,
            this
        );

        if (!browser_) {
            return Result<void, Error>::fail(ErrorCode::DiscoveryUnavailable,
                "Failed to create service browser: " +
                std::string(avahi_strerror(avahi_client_errno(client_))));
        }
        return Result<void, Error>::ok();
    }

    void stop_browsing() override {
        PollLock lock(threaded_poll_);
        if (browser_) {
            avahi_service_browser_free(browser_);
            browser_ = nullptr;
        }
        resolved_.clear();
    }

private:
    AvahiThreadedPoll* threaded_poll_ = nullptr;
    AvahiClient* client_ = nullptr;
    AvahiEntryGroup* group_ = nullptr;
    AvahiServiceBrowser* browser_ = nullptr;

    ServiceRecord advertised_;
    std::string service_name_;
    bool advertising_ = false;

    // "<interface>/<protocol>/<name>" -> instance id, for REMOVE events
    std::map<std::string, Uuid> resolved_;

    Result<void, Error> ensure_client() {
        if (client_) return Result<void, Error>::ok();

        threaded_poll_ = avahi_threaded_poll_new();
        if (!threaded_poll_) {
            return Result<void, Error>::fail(ErrorCode::DiscoveryUnavailable,
                                             "Failed to create Avahi poll");
        }

        int error = 0;
        client_ = avahi_client_new(
            avahi_threaded_poll_get(threaded_poll_),
            static_cast<AvahiClientFlags>(0),
            client_callback,
            this,
            &error
        );

        if (!client_) {
            avahi_threaded_poll_free(threaded_poll_);
            threaded_poll_ = nullptr;
            return Result<void, Error>::fail(ErrorCode::DiscoveryUnavailable,
                "Failed to create Avahi client: " + std::string(avahi_strerror(error)));
        }

        if (avahi_threaded_poll_start(threaded_poll_) < 0) {
            avahi_client_free(client_);
            client_ = nullptr;
            avahi_threaded_poll_free(threaded_poll_);
            threaded_poll_ = nullptr;
            return Result<void, Error>::fail(ErrorCode::DiscoveryUnavailable,
                                             "Failed to start Avahi poll thread");
        }
        return Result<void, Error>::ok();
    }

    static std::string resolved_key(AvahiIfIndex interface, AvahiProtocol protocol,
                                     const char* name) {
        return std::to_string(interface) + "/" + std::to_string(protocol) + "/" + name;
    }

    // Called with the poll lock held.
    Result<void, Error> create_services() {
        if (!group_) {
            group_ = avahi_entry_group_new(client_, entry_group_callback, this);
            if (!group_) {
                return Result<void, Error>::fail(ErrorCode::DiscoveryUnavailable,
                    "Failed to create entry group: " +
                    std::string(avahi_strerror(avahi_client_errno(client_))));
            }
        }

        AvahiStringList* txt = nullptr;
        txt = avahi_string_list_add_printf(txt, "v=%d", advertised_.protocol_version);
        txt = avahi_string_list_add_printf(txt, "auth=%d", advertised_.requires_passphrase ? 1 : 0);
        txt = avahi_string_list_add_printf(txt, "id=%s",
            advertised_.instance_id.to_string().c_str());
        txt = avahi_string_list_add_printf(txt, "teacher=%s",
            advertised_.display_name.toUtf8().constData());
        txt = avahi_string_list_add_printf(txt, "mode=%s", service_mode_name(advertised_.mode));

        int ret = AVAHI_ERR_COLLISION;
        for (int attempt = 0; attempt < kMaxRenames && ret == AVAHI_ERR_COLLISION; ++attempt) {
            avahi_entry_group_reset(group_);
            ret = avahi_entry_group_add_service_strlst(
                group_,
                AVAHI_IF_UNSPEC,
                AVAHI_PROTO_UNSPEC,
                static_cast<AvahiPublishFlags>(0),
                service_name_.c_str(),
                SERVICE_TYPE,
                nullptr,  // domain
                nullptr,  // host
                advertised_.port,
                txt
            );
            if (ret == AVAHI_ERR_COLLISION) {
                rename_service();
            }
        }

        avahi_string_list_free(txt);

        if (ret < 0) {
            return Result<void, Error>::fail(ErrorCode::DiscoveryUnavailable,
                "Failed to add service: " + std::string(avahi_strerror(ret)));
        }

        ret = avahi_entry_group_commit(group_);
        if (ret < 0) {
            return Result<void, Error>::fail(ErrorCode::DiscoveryUnavailable,
                "Failed to commit service: " + std::string(avahi_strerror(ret)));
        }
        return Result<void, Error>::ok();
    }

    void rename_service() {
        char* alt = avahi_alternative_service_name(service_name_.c_str());
        qCInfo(discoveryLog) << "Service name collision, renaming to" << alt;
        service_name_ = alt;
        avahi_free(alt);
    }

    // Avahi thread -> owning thread.
    void post_error(Error err) {
        QMetaObject::invokeMethod(this, [this, err = std::move(err)]() {
            if (on_error) on_error(err);
        }, Qt::QueuedConnection);
    }

    void post_seen(ServiceRecord record) {
        QMetaObject::invokeMethod(this, [this, record = std::move(record)]() {
            if (on_record_seen) on_record_seen(record);
        }, Qt::QueuedConnection);
    }

    void post_lost(Uuid id) {
        QMetaObject::invokeMethod(this, [this, id]() {
            if (on_record_lost) on_record_lost(id);
        }, Qt::QueuedConnection);
    }

    static void client_callback(AvahiClient* client, AvahiClientState state, void* userdata) {
        auto* self = static_cast<AvahiDiscoveryBackend*>(userdata);
        // May run inside avahi_client_new(), before client_ is assigned.
        self->client_ = client;

        switch (state) {
            case AVAHI_CLIENT_S_RUNNING:
                if (self->advertising_) {
                    auto created = self->create_services();
                    if (created.is_err()) self->post_error(created.unwrap_err());
                }
                break;
            case AVAHI_CLIENT_S_COLLISION:
            case AVAHI_CLIENT_S_REGISTERING:
                // Host name changed; services are re-added once running again.
                if (self->group_) avahi_entry_group_reset(self->group_);
                break;
            case AVAHI_CLIENT_FAILURE:
                self->post_error(Error{ErrorCode::DiscoveryUnavailable,
                    "Avahi client failure: " +
                    std::string(avahi_strerror(avahi_client_errno(client)))});
                break;
            case AVAHI_CLIENT_CONNECTING:
                break;
        }
    }

    static void entry_group_callback(AvahiEntryGroup* group,
                                     AvahiEntryGroupState state,
                                     void* userdata) {
        auto* self = static_cast<AvahiDiscoveryBackend*>(userdata);

        switch (state) {
            case AVAHI_ENTRY_GROUP_ESTABLISHED:
                qCInfo(discoveryLog) << "Service established as" << self->service_name_.c_str();
                break;
            case AVAHI_ENTRY_GROUP_COLLISION: {
                self->group_ = group;
                self->rename_service();
                auto created = self->create_services();
                if (created.is_err()) self->post_error(created.unwrap_err());
                break;
            }
            case AVAHI_ENTRY_GROUP_FAILURE:
                self->post_error(Error{ErrorCode::DiscoveryUnavailable,
                    "Service registration failed: " + std::string(avahi_strerror(
                        avahi_client_errno(avahi_entry_group_get_client(group))))});
                break;
            case AVAHI_ENTRY_GROUP_UNCOMMITED:
            case AVAHI_ENTRY_GROUP_REGISTERING:
                break;
        }
    }

    static void browse_callback(AvahiServiceBrowser* browser,
                                AvahiIfIndex interface,
                                AvahiProtocol protocol,
                                AvahiBrowserEvent event,
                                const char* name,
                                const char* type,
                                const char* domain,
                                AvahiLookupResultFlags flags,
                                void* userdata) {
        Q_UNUSED(flags)
        auto* self = static_cast<AvahiDiscoveryBackend*>(userdata);

        switch (event) {
            case AVAHI_BROWSER_NEW:
                if (!avahi_service_resolver_new(
                        self->client_,
                        interface,
                        protocol,
                        name,
                        type,
                        domain,
                        AVAHI_PROTO_UNSPEC,
                        static_cast<AvahiLookupFlags>(0),
                        resolve_callback,
                        userdata)) {
                    qCDebug(discoveryLog) << "Failed to resolve" << name;
                }
                break;

            case AVAHI_BROWSER_REMOVE: {
                auto it = self->resolved_.find(resolved_key(interface, protocol, name));
                if (it == self->resolved_.end()) break;

                const Uuid id = it->second;
                self->resolved_.erase(it);
                // Same instance may still be visible on another interface.
                for (const auto& [key, other] : self->resolved_) {
                    if (other == id) return;
                }
                self->post_lost(id);
                break;
            }

            case AVAHI_BROWSER_FAILURE:
                self->post_error(Error{ErrorCode::DiscoveryUnavailable,
                    "Service browser failed: " + std::string(avahi_strerror(
                        avahi_client_errno(avahi_service_browser_get_client(browser))))});
                break;

            case AVAHI_BROWSER_ALL_FOR_NOW:
            case AVAHI_BROWSER_CACHE_EXHAUSTED:
                break;
        }
    }

    static void resolve_callback(AvahiServiceResolver* resolver,
                                 AvahiIfIndex interface,
                                 AvahiProtocol protocol,
                                 AvahiResolverEvent event,
                                 const char* name,
                                 const char* type,
                                 const char* domain,
                                 const char* host_name,
                                 const AvahiAddress* address,
                                 uint16_t port,
                                 AvahiStringList* txt,
                                 AvahiLookupResultFlags flags,
                                 void* userdata) {
        Q_UNUSED(type)
        Q_UNUSED(domain)
        Q_UNUSED(host_name)
        Q_UNUSED(flags)
        auto* self = static_cast<AvahiDiscoveryBackend*>(userdata);

        if (event == AVAHI_RESOLVER_FOUND) {
            ServiceRecord record;
            record.port = port;

            char addr_str[AVAHI_ADDRESS_STR_MAX];
            avahi_address_snprint(addr_str, sizeof(addr_str), address);
            record.host = QHostAddress(QString::fromUtf8(addr_str));

            const auto teacher = txt_value(txt, "teacher");
            record.display_name = QString::fromUtf8(teacher.empty() ? name : teacher.c_str());
            record.protocol_version = QString::fromStdString(txt_value(txt, "v")).toInt();
            record.requires_passphrase = txt_value(txt, "auth") == "1";
            record.mode = parse_service_mode(QString::fromStdString(txt_value(txt, "mode")))
                              .value_or(ServiceMode::Receiver);

            auto id = Uuid::parse(txt_value(txt, "id"));
            if (id && !id->is_nil()) {
                record.instance_id = *id;
                self->resolved_[resolved_key(interface, protocol, name)] = *id;
                self->post_seen(std::move(record));
            } else {
                qCDebug(discoveryLog) << "Ignoring" << name << "without instance id";
            }
        }

        avahi_service_resolver_free(resolver);
    }
};

std::unique_ptr<DiscoveryBackend> createAvahiBackend() {
    return std::make_unique<AvahiDiscoveryBackend>();
}

} // namespace manuscripts::network
