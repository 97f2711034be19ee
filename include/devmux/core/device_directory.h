#pragma once

#include "devmux/core/device_aggregate.h"
#include "devmux/core/device_channel.h"
#include "devmux/core/device_store.h"
#include "devmux/core/dispatcher.h"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace devmux {
namespace core {

/**
 * @brief Entry point for discovery collaborators.
 *
 * A discovery provider hands over each channel it finds, keyed by the
 * device id it assigned, and reports when a previously supplied channel
 * disappears. This layer never performs network discovery itself.
 */
class DiscoveryListener {
public:
    virtual ~DiscoveryListener() = default;

    virtual void onChannelDiscovered(const std::string& deviceId,
                                     std::shared_ptr<DeviceChannel> channel,
                                     const std::string& ipAddress,
                                     const std::string& wifiName) = 0;

    virtual void onChannelLost(const std::string& deviceId, const std::string& channelType) = 0;
};

/**
 * @brief Receives device set changes from a DeviceDirectory.
 */
class DirectoryObserver {
public:
    virtual ~DirectoryObserver() = default;

    virtual void onDeviceAdded(DeviceAggregate& /*device*/) {}
    virtual void onDeviceUpdated(DeviceAggregate& /*device*/) {}
    virtual void onDeviceRemoved(DeviceAggregate& /*device*/) {}
};

/**
 * @brief Keeps one DeviceAggregate per discovered device id.
 *
 * The first channel of an id creates its aggregate, restored from the
 * attached store when the device was connected before. Stored channel
 * configs (pairing keys and the like) are handed back to rediscovered
 * channels. The aggregate is dropped once its last channel is lost.
 */
class DeviceDirectory : public DiscoveryListener {
public:
    explicit DeviceDirectory(std::shared_ptr<CallbackDispatcher> dispatcher = nullptr,
                             std::shared_ptr<DeviceStore> store = nullptr);
    ~DeviceDirectory() override = default;

    // Non-copyable
    DeviceDirectory(const DeviceDirectory&) = delete;
    DeviceDirectory& operator=(const DeviceDirectory&) = delete;

    void setObserver(std::weak_ptr<DirectoryObserver> observer);

    void onChannelDiscovered(const std::string& deviceId,
                             std::shared_ptr<DeviceChannel> channel,
                             const std::string& ipAddress,
                             const std::string& wifiName) override;

    void onChannelLost(const std::string& deviceId, const std::string& channelType) override;

    /**
     * @return nullptr if the id is unknown
     */
    std::shared_ptr<DeviceAggregate> device(const std::string& id) const;

    std::vector<std::shared_ptr<DeviceAggregate>> devices() const;

    size_t size() const;

private:
    template <typename F>
    void post(const std::shared_ptr<DeviceAggregate>& device, F&& callback);

    std::shared_ptr<CallbackDispatcher> dispatcher_;
    std::shared_ptr<DeviceStore> store_;

    mutable std::mutex mutex_;
    std::weak_ptr<DirectoryObserver> observer_;
    std::map<std::string, std::shared_ptr<DeviceAggregate>> devices_;
};

} // namespace core
} // namespace devmux
