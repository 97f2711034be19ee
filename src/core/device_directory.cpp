#include "devmux/core/device_directory.h"
#include "devmux/utils/clock.hpp"
#include "devmux/utils/logging.hpp"

namespace devmux {
namespace core {

namespace {

// Stored channel matching a rediscovered one, by id first and type second
std::shared_ptr<DeviceChannel> findStoredChannel(const DeviceAggregate& stored,
                                                 const DeviceChannel& channel) {
    const std::string id = channel.id();
    const std::string type = channel.channelType();
    std::shared_ptr<DeviceChannel> byType;
    for (const auto& candidate : stored.channels()) {
        if (!id.empty() && candidate->id() == id) {
            return candidate;
        }
        if (!byType && candidate->channelType() == type) {
            byType = candidate;
        }
    }
    return byType;
}

} // namespace

DeviceDirectory::DeviceDirectory(std::shared_ptr<CallbackDispatcher> dispatcher,
                                 std::shared_ptr<DeviceStore> store)
    : dispatcher_(dispatcher ? std::move(dispatcher) : immediateDispatcher())
    , store_(std::move(store)) {}

void DeviceDirectory::setObserver(std::weak_ptr<DirectoryObserver> observer) {
    std::lock_guard<std::mutex> lock(mutex_);
    observer_ = std::move(observer);
}

template <typename F>
void DeviceDirectory::post(const std::shared_ptr<DeviceAggregate>& device, F&& callback) {
    std::weak_ptr<DirectoryObserver> observer;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        observer = observer_;
    }
    dispatcher_->post([observer, device, callback = std::forward<F>(callback)]() {
        if (auto target = observer.lock()) {
            callback(*target, *device);
        }
    });
}

void DeviceDirectory::onChannelDiscovered(const std::string& deviceId,
                                          std::shared_ptr<DeviceChannel> channel,
                                          const std::string& ipAddress,
                                          const std::string& wifiName) {
    if (deviceId.empty() || !channel) {
        DEVMUX_LOG_WARN("Ignoring discovery without a device id or channel");
        return;
    }

    std::shared_ptr<DeviceAggregate> stored;
    if (store_) {
        stored = store_->deviceForId(deviceId);
    }

    if (stored) {
        if (auto previous = findStoredChannel(*stored, *channel)) {
            auto config = previous->config();
            config->connected = false;
            channel->setConfig(config);
        }
    }

    std::shared_ptr<DeviceAggregate> device;
    bool created = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = devices_.find(deviceId);
        if (it != devices_.end()) {
            device = it->second;
        } else {
            device = DeviceAggregate::create(deviceId, dispatcher_);
            if (stored) {
                device->setFriendlyName(stored->friendlyName());
                device->setModelName(stored->modelName());
                device->setModelNumber(stored->modelNumber());
                device->setLastKnownIPAddress(stored->lastKnownIPAddress());
                device->setLastSeenOnWifi(stored->lastSeenOnWifi());
                device->setLastConnected(stored->lastConnected());
                device->setLastDetection(stored->lastDetection());
            }
            if (store_) {
                device->setStore(store_);
            }
            devices_[deviceId] = device;
            created = true;
        }
    }

    const double now = utils::epochSeconds();
    channel->markDetected(now);
    const bool added = device->addChannel(channel);

    device->setLastDetection(now);
    if (!ipAddress.empty()) {
        device->setLastKnownIPAddress(ipAddress);
    }
    if (!wifiName.empty()) {
        device->setLastSeenOnWifi(wifiName);
    }

    if (store_) {
        auto saved = store_->updateDevice(*device);
        if (saved.has_error()) {
            DEVMUX_LOG_WARN("Could not refresh stored device {}: {}", deviceId, saved.error().message);
        }
    }

    if (created) {
        DEVMUX_LOG_INFO("Found device {} via {}{}", deviceId, channel->channelType(),
                        stored ? " (restored)" : "");
        post(device, [](DirectoryObserver& o, DeviceAggregate& d) { o.onDeviceAdded(d); });
    } else if (added) {
        DEVMUX_LOG_DEBUG("Device {} gained channel {}", deviceId, channel->channelType());
        post(device, [](DirectoryObserver& o, DeviceAggregate& d) { o.onDeviceUpdated(d); });
    }
}

void DeviceDirectory::onChannelLost(const std::string& deviceId, const std::string& channelType) {
    std::shared_ptr<DeviceAggregate> device;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = devices_.find(deviceId);
        if (it == devices_.end()) {
            return;
        }
        device = it->second;
    }

    const bool hadChannel = device->channel(channelType) != nullptr;
    device->removeChannel(channelType);

    bool removed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = devices_.find(deviceId);
        if (it != devices_.end() && it->second == device && !device->hasChannels()) {
            devices_.erase(it);
            removed = true;
        }
    }

    if (removed) {
        DEVMUX_LOG_INFO("Lost device {}", deviceId);
        post(device, [](DirectoryObserver& o, DeviceAggregate& d) { o.onDeviceRemoved(d); });
    } else if (hadChannel) {
        post(device, [](DirectoryObserver& o, DeviceAggregate& d) { o.onDeviceUpdated(d); });
    }
}

std::shared_ptr<DeviceAggregate> DeviceDirectory::device(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(id);
    return it != devices_.end() ? it->second : nullptr;
}

std::vector<std::shared_ptr<DeviceAggregate>> DeviceDirectory::devices() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<DeviceAggregate>> result;
    result.reserve(devices_.size());
    for (const auto& [id, device] : devices_) {
        result.push_back(device);
    }
    return result;
}

size_t DeviceDirectory::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return devices_.size();
}

} // namespace core
} // namespace devmux
