#include "devmux/core/device_aggregate.h"
#include "devmux/core/device_store.h"
#include "devmux/utils/clock.hpp"
#include "devmux/utils/logging.hpp"
#include <algorithm>

namespace devmux {
namespace core {

std::shared_ptr<DeviceAggregate> DeviceAggregate::create(
    const std::string& id, std::shared_ptr<CallbackDispatcher> dispatcher) {
    return std::shared_ptr<DeviceAggregate>(new DeviceAggregate(id, std::move(dispatcher)));
}

DeviceAggregate::DeviceAggregate(const std::string& id, std::shared_ptr<CallbackDispatcher> dispatcher)
    : id_(id)
    , dispatcher_(dispatcher ? std::move(dispatcher) : immediateDispatcher()) {}

void DeviceAggregate::setObserver(std::weak_ptr<DeviceObserver> observer) {
    std::lock_guard<std::mutex> lock(mutex_);
    observer_ = std::move(observer);
}

void DeviceAggregate::setStore(std::weak_ptr<DeviceStore> store) {
    std::lock_guard<std::mutex> lock(mutex_);
    store_ = std::move(store);
}

template <typename F>
void DeviceAggregate::post(F&& callback) {
    std::weak_ptr<DeviceObserver> observer;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        observer = observer_;
    }
    auto self = shared_from_this();
    dispatcher_->post([self, observer, callback = std::forward<F>(callback)]() {
        if (auto target = observer.lock()) {
            callback(*target, *self);
        }
    });
}

// =============================================================================
// Metadata
// =============================================================================

std::string DeviceAggregate::metadataLocked(std::string ChannelDescription::*field,
                                            const std::string& fallback) const {
    for (const auto& channel : channels_) {
        auto description = channel->description();
        const std::string& value = (*description).*field;
        if (!value.empty()) {
            return value;
        }
    }
    return fallback;
}

std::string DeviceAggregate::friendlyName() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return metadataLocked(&ChannelDescription::friendlyName, friendlyName_);
}

std::string DeviceAggregate::modelName() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return metadataLocked(&ChannelDescription::modelName, modelName_);
}

std::string DeviceAggregate::modelNumber() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return metadataLocked(&ChannelDescription::modelNumber, modelNumber_);
}

std::string DeviceAggregate::address() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return metadataLocked(&ChannelDescription::address, lastKnownIPAddress_);
}

void DeviceAggregate::setFriendlyName(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    friendlyName_ = name;
}

void DeviceAggregate::setModelName(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    modelName_ = name;
}

void DeviceAggregate::setModelNumber(const std::string& number) {
    std::lock_guard<std::mutex> lock(mutex_);
    modelNumber_ = number;
}

std::string DeviceAggregate::lastKnownIPAddress() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastKnownIPAddress_;
}

std::string DeviceAggregate::lastSeenOnWifi() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastSeenOnWifi_;
}

double DeviceAggregate::lastConnected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastConnected_;
}

double DeviceAggregate::lastDetection() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastDetection_;
}

void DeviceAggregate::setLastKnownIPAddress(const std::string& address) {
    std::lock_guard<std::mutex> lock(mutex_);
    lastKnownIPAddress_ = address;
}

void DeviceAggregate::setLastSeenOnWifi(const std::string& ssid) {
    std::lock_guard<std::mutex> lock(mutex_);
    lastSeenOnWifi_ = ssid;
}

void DeviceAggregate::setLastConnected(double timestamp) {
    std::lock_guard<std::mutex> lock(mutex_);
    lastConnected_ = timestamp;
}

void DeviceAggregate::setLastDetection(double timestamp) {
    std::lock_guard<std::mutex> lock(mutex_);
    lastDetection_ = timestamp;
}

// =============================================================================
// Channel management
// =============================================================================

std::shared_ptr<DeviceChannel> DeviceAggregate::findChannelLocked(const std::string& channelType) const {
    auto it = std::find_if(channels_.begin(), channels_.end(),
        [&channelType](const std::shared_ptr<DeviceChannel>& channel) {
            return channel->channelType() == channelType;
        });
    return it != channels_.end() ? *it : nullptr;
}

bool DeviceAggregate::ownsLocked(const DeviceChannel& channel) const {
    return std::any_of(channels_.begin(), channels_.end(),
        [&channel](const std::shared_ptr<DeviceChannel>& owned) {
            return owned.get() == &channel;
        });
}

bool DeviceAggregate::anyChannelHasLocked(const CapabilityTag& tag, const DeviceChannel* except) const {
    for (const auto& channel : channels_) {
        if (channel.get() == except) {
            continue;
        }
        if (channel->capabilities().all().count(tag) > 0) {
            return true;
        }
    }
    return false;
}

bool DeviceAggregate::addChannel(std::shared_ptr<DeviceChannel> channel) {
    if (!channel) {
        return false;
    }

    const std::string type = channel->channelType();
    CapabilityList added;
    bool connectionRequired = false;
    bool joinsConnect = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (findChannelLocked(type)) {
            DEVMUX_LOG_DEBUG("Device {} already has a {} channel, ignoring", id_, type);
            return false;
        }

        for (const auto& tag : channel->capabilities().all()) {
            if (!anyChannelHasLocked(tag, nullptr)) {
                added.push_back(tag);
            }
        }

        channels_.push_back(channel);
        channel->setObserver(std::weak_ptr<ChannelObserver>(shared_from_this()));
        resolveLocked();

        connectionRequired = channel->isConnectable() && !channel->isConnected() &&
                             (connecting_ || connectCompleted_);
        if (connectionRequired) {
            connectCompleted_ = false;
            // Readiness now waits for this channel as well
            if (connecting_) {
                pendingConnect_.insert(type);
                joinsConnect = true;
            }
        }
    }

    DEVMUX_LOG_DEBUG("Device {} added channel {}", id_, type);

    if (!added.empty()) {
        post([added](DeviceObserver& o, DeviceAggregate& d) {
            o.onCapabilitiesChanged(d, added, CapabilityList{});
        });
    }
    if (connectionRequired) {
        post([channel](DeviceObserver& o, DeviceAggregate& d) {
            o.onChannelConnectionRequired(d, *channel);
        });
    }
    if (joinsConnect) {
        channel->connect();
    }
    return true;
}

void DeviceAggregate::removeChannel(const std::string& channelType) {
    std::shared_ptr<DeviceChannel> removedChannel;
    CapabilityList removed;
    bool connectSettled = false;
    bool disconnectSettled = false;
    std::optional<Error> failure;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find_if(channels_.begin(), channels_.end(),
            [&channelType](const std::shared_ptr<DeviceChannel>& channel) {
                return channel->channelType() == channelType;
            });
        if (it == channels_.end()) {
            return;
        }

        removedChannel = *it;
        channels_.erase(it);

        for (const auto& tag : removedChannel->capabilities().all()) {
            if (!anyChannelHasLocked(tag, nullptr)) {
                removed.push_back(tag);
            }
        }
        resolveLocked();

        if (connecting_ && pendingConnect_.erase(channelType) > 0 && pendingConnect_.empty()) {
            connecting_ = false;
            connectSettled = true;
            failure = firstFailure_;
        }
        if (disconnecting_ && pendingDisconnect_.erase(channelType) > 0 && pendingDisconnect_.empty()) {
            disconnecting_ = false;
            disconnectSettled = true;
        }
    }

    removedChannel->setObserver(std::weak_ptr<ChannelObserver>());
    DEVMUX_LOG_DEBUG("Device {} removed channel {}", id_, channelType);

    if (!removed.empty()) {
        post([removed](DeviceObserver& o, DeviceAggregate& d) {
            o.onCapabilitiesChanged(d, CapabilityList{}, removed);
        });
    }
    if (connectSettled) {
        finishConnect(failure);
    }
    if (disconnectSettled) {
        post([](DeviceObserver& o, DeviceAggregate& d) { o.onDeviceDisconnected(d); });
    }
}

std::shared_ptr<DeviceChannel> DeviceAggregate::channel(const std::string& channelType) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return findChannelLocked(channelType);
}

std::vector<std::shared_ptr<DeviceChannel>> DeviceAggregate::channels() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return channels_;
}

bool DeviceAggregate::hasChannels() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !channels_.empty();
}

std::string DeviceAggregate::connectedChannelNames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string names;
    for (const auto& channel : channels_) {
        if (!channel->isConnected()) {
            continue;
        }
        if (!names.empty()) {
            names += ", ";
        }
        names += channel->channelType();
    }
    return names;
}

// =============================================================================
// Capabilities
// =============================================================================

std::set<CapabilityTag> DeviceAggregate::capabilities() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::set<CapabilityTag> merged;
    for (const auto& channel : channels_) {
        auto tags = channel->capabilities().all();
        merged.insert(tags.begin(), tags.end());
    }
    return merged;
}

bool DeviceAggregate::hasCapability(const std::string& query) const {
    return CapabilityRegistry::matches(capabilities(), query);
}

bool DeviceAggregate::hasCapabilities(const std::vector<std::string>& queries) const {
    const auto merged = capabilities();
    for (const auto& query : queries) {
        if (!CapabilityRegistry::matches(merged, query)) {
            return false;
        }
    }
    return true;
}

bool DeviceAggregate::hasAnyCapability(const std::vector<std::string>& queries) const {
    const auto merged = capabilities();
    for (const auto& query : queries) {
        if (CapabilityRegistry::matches(merged, query)) {
            return true;
        }
    }
    return false;
}

std::shared_ptr<DeviceChannel> DeviceAggregate::channelFor(CapabilityFamily family) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = resolved_.find(family);
    return it != resolved_.end() ? it->second : nullptr;
}

void DeviceAggregate::refreshCapabilityResolution() {
    std::lock_guard<std::mutex> lock(mutex_);
    resolveLocked();
}

void DeviceAggregate::resolveLocked() {
    for (CapabilityFamily family : kAllCapabilityFamilies) {
        std::shared_ptr<DeviceChannel> best;
        int bestLevel = 0;
        for (const auto& channel : channels_) {
            auto level = channel->capabilityPriority(family);
            if (level && (!best || *level > bestLevel)) {
                best = channel;
                bestLevel = *level;
            }
        }

        auto current = resolved_.find(family);
        std::shared_ptr<DeviceChannel> previous = current != resolved_.end() ? current->second : nullptr;
        if (previous == best) {
            continue;
        }
        if (best) {
            DEVMUX_LOG_TRACE("Device {} resolves {} to {}", id_, familyName(family), best->channelType());
            resolved_[family] = best;
        } else {
            DEVMUX_LOG_TRACE("Device {} no longer serves {}", id_, familyName(family));
            resolved_.erase(family);
        }
    }
}

// =============================================================================
// Lifecycle
// =============================================================================

void DeviceAggregate::connect() {
    std::vector<std::shared_ptr<DeviceChannel>> toConnect;
    bool readyNow = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (connecting_) {
            return;
        }

        disconnecting_ = false;
        pendingDisconnect_.clear();
        pendingConnect_.clear();
        firstFailure_.reset();
        connectCompleted_ = false;

        for (const auto& channel : channels_) {
            if (channel->isConnectable() && !channel->isConnected()) {
                pendingConnect_.insert(channel->channelType());
                toConnect.push_back(channel);
            }
        }

        readyNow = pendingConnect_.empty();
        connecting_ = !readyNow;
    }

    DEVMUX_LOG_INFO("Connecting device {} ({} channel(s) pending)", id_, toConnect.size());

    if (readyNow) {
        finishConnect(std::nullopt);
        return;
    }
    for (const auto& channel : toConnect) {
        channel->connect();
    }
}

void DeviceAggregate::disconnect() {
    std::vector<std::shared_ptr<DeviceChannel>> all;
    bool immediate = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disconnecting_) {
            return;
        }

        connecting_ = false;
        pendingConnect_.clear();
        firstFailure_.reset();
        connectCompleted_ = false;

        pendingDisconnect_.clear();
        for (const auto& channel : channels_) {
            if (channel->isConnectable() && channel->state() != ChannelState::Disconnected) {
                pendingDisconnect_.insert(channel->channelType());
            }
        }
        all = channels_;

        immediate = pendingDisconnect_.empty();
        disconnecting_ = !immediate;
    }

    DEVMUX_LOG_INFO("Disconnecting device {}", id_);

    for (const auto& channel : all) {
        channel->disconnect();
    }
    if (immediate) {
        post([](DeviceObserver& o, DeviceAggregate& d) { o.onDeviceDisconnected(d); });
    }
}

bool DeviceAggregate::isConnectable() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(channels_.begin(), channels_.end(),
        [](const std::shared_ptr<DeviceChannel>& channel) { return channel->isConnectable(); });
}

bool DeviceAggregate::isConnected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    bool anyConnectable = false;
    for (const auto& channel : channels_) {
        if (!channel->isConnectable()) {
            continue;
        }
        anyConnectable = true;
        if (!channel->isConnected()) {
            return false;
        }
    }
    return anyConnectable || connectCompleted_;
}

bool DeviceAggregate::settleLocked(const std::string& channelType, const std::optional<Error>& failure) {
    if (!connecting_ || pendingConnect_.erase(channelType) == 0) {
        return false;
    }
    if (failure && !firstFailure_) {
        firstFailure_ = failure;
    }
    if (!pendingConnect_.empty()) {
        return false;
    }
    connecting_ = false;
    return true;
}

void DeviceAggregate::finishConnect(const std::optional<Error>& failure) {
    if (failure) {
        DEVMUX_LOG_WARN("Device {} failed to connect: {}", id_, failure->message);
        Error error = *failure;
        post([error](DeviceObserver& o, DeviceAggregate& d) { o.onConnectionFailed(d, error); });
        return;
    }

    std::shared_ptr<DeviceStore> store;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        lastConnected_ = utils::epochSeconds();
        connectCompleted_ = true;
        store = store_.lock();
    }

    if (store) {
        auto saved = store->addDevice(*this);
        if (saved.has_error()) {
            DEVMUX_LOG_WARN("Could not store device {}: {}", id_, saved.error().message);
        }
    }

    DEVMUX_LOG_INFO("Device {} is ready", id_);
    post([](DeviceObserver& o, DeviceAggregate& d) { o.onDeviceReady(d); });
}

void DeviceAggregate::closeSession(const LaunchSession& session,
                                   SuccessCallback onSuccess, FailureCallback onFailure) {
    auto dispatcher = dispatcher_;

    SuccessCallback success = [dispatcher, onSuccess]() {
        if (onSuccess) {
            dispatcher->post(onSuccess);
        }
    };
    FailureCallback failure = [dispatcher, onFailure](const Error& error) {
        if (onFailure) {
            dispatcher->post([onFailure, error]() { onFailure(error); });
        }
    };

    auto owner = session.channel.lock();
    if (!owner) {
        failure(Error(ErrorCode::ArgumentError, "This launch session does not have an associated channel"));
        return;
    }

    bool attached = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        attached = ownsLocked(*owner);
    }
    if (!attached) {
        failure(Error(ErrorCode::ArgumentError,
                      "Channel " + owner->channelType() + " is not attached to device " + id_));
        return;
    }

    owner->closeSession(session, std::move(success), std::move(failure));
}

// =============================================================================
// ChannelObserver
// =============================================================================

void DeviceAggregate::onConnectionSucceeded(DeviceChannel& channel) {
    bool settled = false;
    std::optional<Error> failure;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!ownsLocked(channel)) {
            return;
        }
        settled = settleLocked(channel.channelType(), std::nullopt);
        failure = firstFailure_;
    }

    auto source = channel.shared_from_this();
    post([source](DeviceObserver& o, DeviceAggregate& d) { o.onChannelConnected(d, *source); });
    if (settled) {
        finishConnect(failure);
    }
}

void DeviceAggregate::onConnectionFailed(DeviceChannel& channel, const Error& error) {
    bool settled = false;
    std::optional<Error> failure;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!ownsLocked(channel)) {
            return;
        }
        settled = settleLocked(channel.channelType(), error);
        failure = firstFailure_;
    }

    auto source = channel.shared_from_this();
    post([source, error](DeviceObserver& o, DeviceAggregate& d) {
        o.onChannelConnectionFailed(d, *source, error);
    });
    if (settled) {
        finishConnect(failure);
    }
}

void DeviceAggregate::onPairingRequired(DeviceChannel& channel, PairingType type,
                                        const nlohmann::json& pairingData) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!ownsLocked(channel)) {
            return;
        }
    }

    auto source = channel.shared_from_this();
    post([source, type, pairingData](DeviceObserver& o, DeviceAggregate& d) {
        o.onPairingRequired(d, *source, type, pairingData);
    });
}

void DeviceAggregate::onPairingSucceeded(DeviceChannel& channel) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!ownsLocked(channel)) {
            return;
        }
    }

    auto source = channel.shared_from_this();
    post([source](DeviceObserver& o, DeviceAggregate& d) { o.onPairingSucceeded(d, *source); });
}

void DeviceAggregate::onPairingFailed(DeviceChannel& channel, const Error& error) {
    bool settled = false;
    std::optional<Error> failure;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!ownsLocked(channel)) {
            return;
        }
        // A rejected pair() call leaves the channel waiting; only a real failure settles it
        if (channel.state() == ChannelState::Disconnected) {
            settled = settleLocked(channel.channelType(), error);
            failure = firstFailure_;
        }
    }

    auto source = channel.shared_from_this();
    post([source, error](DeviceObserver& o, DeviceAggregate& d) {
        o.onPairingFailed(d, *source, error);
    });
    if (settled) {
        finishConnect(failure);
    }
}

void DeviceAggregate::onDisconnected(DeviceChannel& channel, const std::optional<Error>& error) {
    bool settled = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!ownsLocked(channel)) {
            return;
        }
        if (disconnecting_ && pendingDisconnect_.erase(channel.channelType()) > 0 &&
            pendingDisconnect_.empty()) {
            disconnecting_ = false;
            settled = true;
        }
    }

    auto source = channel.shared_from_this();
    post([source, error](DeviceObserver& o, DeviceAggregate& d) {
        o.onChannelDisconnected(d, *source, error);
    });
    if (settled) {
        DEVMUX_LOG_INFO("Device {} disconnected", id_);
        post([](DeviceObserver& o, DeviceAggregate& d) { o.onDeviceDisconnected(d); });
    }
}

void DeviceAggregate::onCapabilitiesChanged(DeviceChannel& channel, const CapabilityList& added,
                                            const CapabilityList& removed) {
    CapabilityList unionAdded;
    CapabilityList unionRemoved;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!ownsLocked(channel)) {
            return;
        }
        for (const auto& tag : added) {
            if (!anyChannelHasLocked(tag, &channel)) {
                unionAdded.push_back(tag);
            }
        }
        for (const auto& tag : removed) {
            if (!anyChannelHasLocked(tag, nullptr)) {
                unionRemoved.push_back(tag);
            }
        }
        resolveLocked();
    }

    if (unionAdded.empty() && unionRemoved.empty()) {
        return;
    }
    post([unionAdded, unionRemoved](DeviceObserver& o, DeviceAggregate& d) {
        o.onCapabilitiesChanged(d, unionAdded, unionRemoved);
    });
}

// =============================================================================
// Persistence
// =============================================================================

nlohmann::json DeviceAggregate::toJson(const RecordCodec& codec) const {
    nlohmann::json entry = {
        {"id", id_},
        {"friendlyName", friendlyName()},
        {"modelName", modelName()},
        {"modelNumber", modelNumber()},
        {"lastKnownIPAddress", lastKnownIPAddress()},
        {"lastSeenOnWifi", lastSeenOnWifi()},
        {"lastConnected", lastConnected()},
        {"lastDetection", lastDetection()}
    };

    nlohmann::json services = nlohmann::json::object();
    for (const auto& channel : channels()) {
        std::string key = channel->id();
        if (key.empty()) {
            key = channel->channelType();
        }
        services[key] = codec.encode(*channel);
    }
    entry["services"] = std::move(services);
    return entry;
}

Result<std::shared_ptr<DeviceAggregate>> DeviceAggregate::fromJson(
    const nlohmann::json& entry,
    const RecordCodec& codec,
    std::shared_ptr<CallbackDispatcher> dispatcher) {
    if (!entry.is_object()) {
        return Error(ErrorCode::DecodeError, "Device entry is not an object");
    }

    try {
        const std::string id = entry.value("id", std::string());
        if (id.empty()) {
            return Error(ErrorCode::DecodeError, "Device entry has no id");
        }

        auto device = create(id, std::move(dispatcher));
        device->friendlyName_ = entry.value("friendlyName", std::string());
        device->modelName_ = entry.value("modelName", std::string());
        device->modelNumber_ = entry.value("modelNumber", std::string());
        device->lastKnownIPAddress_ = entry.value("lastKnownIPAddress", std::string());
        device->lastSeenOnWifi_ = entry.value("lastSeenOnWifi", std::string());
        device->lastConnected_ = entry.value("lastConnected", 0.0);
        device->lastDetection_ = entry.value("lastDetection", 0.0);

        auto services = entry.find("services");
        if (services != entry.end() && services->is_object()) {
            for (auto it = services->begin(); it != services->end(); ++it) {
                auto decoded = codec.decodeAs<DeviceChannel>(it.value());
                if (decoded.has_error()) {
                    DEVMUX_LOG_WARN("Dropping stored channel {} of device {}: {}",
                                    it.key(), id, decoded.error().message);
                    continue;
                }
                device->addChannel(decoded.value());
            }
        }
        return device;
    } catch (const nlohmann::json::exception& e) {
        return Error(ErrorCode::DecodeError, std::string("Malformed device entry: ") + e.what());
    }
}

} // namespace core
} // namespace devmux
