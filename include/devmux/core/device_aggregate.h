#ifndef DEVMUX_CORE_DEVICE_AGGREGATE_H
#define DEVMUX_CORE_DEVICE_AGGREGATE_H

#include "devmux/core/capability.h"
#include "devmux/core/device_channel.h"
#include "devmux/core/dispatcher.h"
#include "devmux/core/error.h"
#include "devmux/core/launch_session.h"
#include "devmux/core/record_codec.h"
#include "devmux/utils/result.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace devmux {
namespace core {

class DeviceAggregate;
class DeviceStore;

/**
 * @brief Receives events for one logical device.
 *
 * All methods default to no-ops and are invoked on the aggregate's dispatcher.
 */
class DeviceObserver {
public:
    virtual ~DeviceObserver() = default;

    /// Every connectable channel connected after connect()
    virtual void onDeviceReady(DeviceAggregate& /*device*/) {}

    /// Every connectable channel reported disconnected after disconnect()
    virtual void onDeviceDisconnected(DeviceAggregate& /*device*/) {}

    /// connect() settled with at least one failed channel; carries the first error
    virtual void onConnectionFailed(DeviceAggregate& /*device*/, const Error& /*error*/) {}

    /// Deltas of the union capability set
    virtual void onCapabilitiesChanged(DeviceAggregate& /*device*/, const CapabilityList& /*added*/,
                                       const CapabilityList& /*removed*/) {}

    /// A connectable channel joined a device that is connected or connecting
    virtual void onChannelConnectionRequired(DeviceAggregate& /*device*/, DeviceChannel& /*channel*/) {}

    virtual void onChannelConnected(DeviceAggregate& /*device*/, DeviceChannel& /*channel*/) {}
    virtual void onChannelDisconnected(DeviceAggregate& /*device*/, DeviceChannel& /*channel*/,
                                       const std::optional<Error>& /*error*/) {}
    virtual void onChannelConnectionFailed(DeviceAggregate& /*device*/, DeviceChannel& /*channel*/,
                                           const Error& /*error*/) {}

    virtual void onPairingRequired(DeviceAggregate& /*device*/, DeviceChannel& /*channel*/,
                                   PairingType /*type*/, const nlohmann::json& /*pairingData*/) {}
    virtual void onPairingSucceeded(DeviceAggregate& /*device*/, DeviceChannel& /*channel*/) {}
    virtual void onPairingFailed(DeviceAggregate& /*device*/, DeviceChannel& /*channel*/,
                                 const Error& /*error*/) {}
};

/**
 * @brief One physical device presented as a single object over its channels.
 *
 * The aggregate owns its channels and observes each of them weakly. It merges
 * their capability registries, picks one channel per capability family, fans
 * connect() and disconnect() out to every channel and reports combined
 * readiness to its DeviceObserver.
 *
 * Channel completions may arrive on any thread and in any order. State is
 * mutated under a single mutex and every observer call is posted to the
 * dispatcher given at creation.
 */
class DeviceAggregate : public ChannelObserver,
                        public std::enable_shared_from_this<DeviceAggregate> {
public:
    /**
     * @brief Creates an aggregate for a discovery-assigned id.
     * @param dispatcher Context for observer calls; defaults to immediate delivery
     */
    static std::shared_ptr<DeviceAggregate> create(
        const std::string& id,
        std::shared_ptr<CallbackDispatcher> dispatcher = nullptr);

    ~DeviceAggregate() override = default;

    // Non-copyable
    DeviceAggregate(const DeviceAggregate&) = delete;
    DeviceAggregate& operator=(const DeviceAggregate&) = delete;

    void setObserver(std::weak_ptr<DeviceObserver> observer);

    /**
     * @brief Store receiving this device when it becomes ready. Held weakly.
     */
    void setStore(std::weak_ptr<DeviceStore> store);

    // =========================================================================
    // Identity and metadata
    // =========================================================================

    const std::string& id() const { return id_; }

    /**
     * @brief Metadata taken from the first registered channel supplying a
     * non-empty value, falling back to what was restored from the store.
     */
    std::string friendlyName() const;
    std::string modelName() const;
    std::string modelNumber() const;
    std::string address() const;

    void setFriendlyName(const std::string& name);
    void setModelName(const std::string& name);
    void setModelNumber(const std::string& number);

    std::string lastKnownIPAddress() const;
    std::string lastSeenOnWifi() const;
    double lastConnected() const;
    double lastDetection() const;

    void setLastKnownIPAddress(const std::string& address);
    void setLastSeenOnWifi(const std::string& ssid);
    void setLastConnected(double timestamp);
    void setLastDetection(double timestamp);

    // =========================================================================
    // Channel management
    // =========================================================================

    /**
     * @brief Attaches a channel. A second channel of an already present type
     * is ignored. A connectable channel joining during connect() is connected
     * and counted towards readiness.
     * @return true if the channel was attached
     */
    bool addChannel(std::shared_ptr<DeviceChannel> channel);

    /**
     * @brief Detaches the channel of the given type, if any.
     */
    void removeChannel(const std::string& channelType);

    std::shared_ptr<DeviceChannel> channel(const std::string& channelType) const;

    /**
     * @brief Channels in registration order.
     */
    std::vector<std::shared_ptr<DeviceChannel>> channels() const;
    bool hasChannels() const;

    /**
     * @brief Comma separated types of the currently connected channels.
     */
    std::string connectedChannelNames() const;

    // =========================================================================
    // Capabilities
    // =========================================================================

    /**
     * @brief Union of every channel's capabilities.
     */
    std::set<CapabilityTag> capabilities() const;

    bool hasCapability(const std::string& query) const;
    bool hasCapabilities(const std::vector<std::string>& queries) const;
    bool hasAnyCapability(const std::vector<std::string>& queries) const;

    /**
     * @brief Channel answering calls for a family: the highest declared
     * priority among channels serving it, first registered on ties.
     * @return nullptr if no channel serves the family
     */
    std::shared_ptr<DeviceChannel> channelFor(CapabilityFamily family) const;

    /**
     * @brief Recomputes family resolution. Needed only after a channel changes
     * its declared priorities without a capability change.
     */
    void refreshCapabilityResolution();

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /**
     * @brief Connects every connectable channel. Ready is reported once all of
     * them connected, immediately if there are none.
     */
    void connect();

    /**
     * @brief Disconnects every channel. Reported once the last connectable
     * channel disconnected, immediately if none was connected.
     */
    void disconnect();

    bool isConnectable() const;

    /**
     * @brief True when every connectable channel is connected, or when the
     * device has no connectable channel and connect() has completed.
     */
    bool isConnected() const;

    /**
     * @brief Closes a session through the channel that started it.
     *
     * Fails with ErrorCode::ArgumentError if the session's channel is missing
     * or not attached to this device.
     */
    void closeSession(const LaunchSession& session,
                      SuccessCallback onSuccess, FailureCallback onFailure);

    // =========================================================================
    // Persistence
    // =========================================================================

    /**
     * @brief Device entry of the store envelope. Channels are keyed by id.
     */
    nlohmann::json toJson(const RecordCodec& codec) const;

    /**
     * @brief Rebuilds a device entry. Channels whose record cannot be decoded
     * are dropped individually.
     */
    static Result<std::shared_ptr<DeviceAggregate>> fromJson(
        const nlohmann::json& entry,
        const RecordCodec& codec,
        std::shared_ptr<CallbackDispatcher> dispatcher = nullptr);

    // =========================================================================
    // ChannelObserver
    // =========================================================================

    void onConnectionSucceeded(DeviceChannel& channel) override;
    void onConnectionFailed(DeviceChannel& channel, const Error& error) override;
    void onPairingRequired(DeviceChannel& channel, PairingType type,
                           const nlohmann::json& pairingData) override;
    void onPairingSucceeded(DeviceChannel& channel) override;
    void onPairingFailed(DeviceChannel& channel, const Error& error) override;
    void onDisconnected(DeviceChannel& channel, const std::optional<Error>& error) override;
    void onCapabilitiesChanged(DeviceChannel& channel, const CapabilityList& added,
                               const CapabilityList& removed) override;

private:
    DeviceAggregate(const std::string& id, std::shared_ptr<CallbackDispatcher> dispatcher);

    template <typename F>
    void post(F&& callback);

    // The following must be called with mutex_ held
    std::shared_ptr<DeviceChannel> findChannelLocked(const std::string& channelType) const;
    bool ownsLocked(const DeviceChannel& channel) const;
    bool anyChannelHasLocked(const CapabilityTag& tag, const DeviceChannel* except) const;
    void resolveLocked();
    std::string metadataLocked(std::string ChannelDescription::*field,
                               const std::string& fallback) const;

    // Removes a channel from the pending connect set; true when that settled connect()
    bool settleLocked(const std::string& channelType, const std::optional<Error>& failure);

    void finishConnect(const std::optional<Error>& failure);

    const std::string id_;
    std::shared_ptr<CallbackDispatcher> dispatcher_;

    mutable std::mutex mutex_;
    std::weak_ptr<DeviceObserver> observer_;
    std::weak_ptr<DeviceStore> store_;

    std::vector<std::shared_ptr<DeviceChannel>> channels_;
    std::map<CapabilityFamily, std::shared_ptr<DeviceChannel>> resolved_;

    std::string friendlyName_;
    std::string modelName_;
    std::string modelNumber_;
    std::string lastKnownIPAddress_;
    std::string lastSeenOnWifi_;
    double lastConnected_{0.0};
    double lastDetection_{0.0};

    bool connecting_{false};
    bool connectCompleted_{false};
    std::set<std::string> pendingConnect_;
    std::optional<Error> firstFailure_;

    bool disconnecting_{false};
    std::set<std::string> pendingDisconnect_;
};

} // namespace core
} // namespace devmux

#endif // DEVMUX_CORE_DEVICE_AGGREGATE_H
