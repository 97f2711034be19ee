#ifndef DEVMUX_CORE_DEVICE_CHANNEL_H
#define DEVMUX_CORE_DEVICE_CHANNEL_H

#include "devmux/core/capability.h"
#include "devmux/core/channel_record.h"
#include "devmux/core/error.h"
#include "devmux/core/launch_session.h"
#include "devmux/core/record_codec.h"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace devmux {
namespace core {

/**
 * @brief Connection state of a single channel.
 */
enum class ChannelState {
    Disconnected,
    Connecting,
    Pairing,    ///< Waiting for pair() after the device asked for pairing
    Connected
};

const char* channelStateToString(ChannelState state);

/**
 * @brief Kind of trust establishment a channel requires.
 */
enum class PairingType {
    None,         ///< No pairing
    FirstScreen,  ///< User confirms a prompt on the device
    PinCode,      ///< User enters a code shown on the device
    Mixed,        ///< Prompt or code, whichever the user picks
    Unknown       ///< Pairing needed, kind not yet known
};

const char* pairingTypeToString(PairingType type);

class DeviceChannel;

/**
 * @brief Receives lifecycle and capability events from a channel.
 *
 * Every method has an empty default so observers override only what they need.
 * Methods may be invoked from any thread the channel's transport completes on.
 */
class ChannelObserver {
public:
    virtual ~ChannelObserver() = default;

    virtual void onConnectionSucceeded(DeviceChannel& /*channel*/) {}
    virtual void onConnectionFailed(DeviceChannel& /*channel*/, const Error& /*error*/) {}
    virtual void onPairingRequired(DeviceChannel& /*channel*/, PairingType /*type*/,
                                   const nlohmann::json& /*pairingData*/) {}
    virtual void onPairingSucceeded(DeviceChannel& /*channel*/) {}
    virtual void onPairingFailed(DeviceChannel& /*channel*/, const Error& /*error*/) {}
    virtual void onDisconnected(DeviceChannel& /*channel*/, const std::optional<Error>& /*error*/) {}
    virtual void onCapabilitiesChanged(DeviceChannel& /*channel*/, const CapabilityList& /*added*/,
                                       const CapabilityList& /*removed*/) {}
};

/**
 * @brief One protocol-specific control endpoint on a physical device.
 *
 * DeviceChannel is abstract: each transport (DIAL, a WebSocket control
 * protocol, ...) subclasses it, fills its CapabilityRegistry, declares a
 * priority per capability family and implements the doConnect / doDisconnect /
 * doPair hooks. All lifecycle operations are asynchronous. The subclass reports
 * the outcome through the protected complete / fail methods, tagging each
 * report with the attempt id it was handed. Reports carrying a superseded
 * attempt id are dropped, which is how a disconnect() issued mid-connect wins
 * over a late connect completion.
 *
 * Outcomes are forwarded to a weakly held ChannelObserver (normally the owning
 * DeviceAggregate). The channel never keeps its observer alive.
 *
 * State machine:
 * @code
 * Disconnected -> Connecting -> Connected
 *                 Connecting <-> Pairing
 * Connecting / Pairing / Connected -> Disconnected   (failure or disconnect())
 * @endcode
 */
class DeviceChannel : public Persistable,
                      public std::enable_shared_from_this<DeviceChannel> {
public:
    using AttemptId = std::uint64_t;

    DeviceChannel(std::shared_ptr<ChannelConfig> config,
                  std::shared_ptr<ChannelDescription> description);
    ~DeviceChannel() override = default;

    // Non-copyable
    DeviceChannel(const DeviceChannel&) = delete;
    DeviceChannel& operator=(const DeviceChannel&) = delete;

    // =========================================================================
    // Identity and records
    // =========================================================================

    /**
     * @brief Channel type tag, e.g. "webOS TV". At most one channel per type
     * is attached to an aggregate.
     */
    std::string channelType() const;

    /**
     * @brief Unique id of this endpoint, used as its key in the device store.
     */
    std::string id() const;

    std::shared_ptr<ChannelConfig> config() const;
    std::shared_ptr<ChannelDescription> description() const;
    void setConfig(std::shared_ptr<ChannelConfig> config);
    void setDescription(std::shared_ptr<ChannelDescription> description);

    /**
     * @brief Stamps the config's lastDetection under the channel lock.
     */
    void markDetected(double timestamp);

    // =========================================================================
    // Capabilities
    // =========================================================================

    CapabilityRegistry& capabilities() { return capabilities_; }
    const CapabilityRegistry& capabilities() const { return capabilities_; }

    /**
     * @brief Declares the priority this channel has for a family.
     */
    void setCapabilityPriority(CapabilityFamily family, int level);
    void clearCapabilityPriority(CapabilityFamily family);

    /**
     * @brief Priority for a family, or nullopt if the channel does not
     * currently serve it.
     *
     * A channel serves a family when it declared a priority for it and its
     * registry currently holds at least one tag of that family.
     */
    std::optional<int> capabilityPriority(CapabilityFamily family) const;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    void setObserver(std::weak_ptr<ChannelObserver> observer);

    /**
     * @brief Whether this channel type keeps a connection or registration.
     * Stateless, fire-and-forget channels return false and never connect.
     */
    virtual bool isConnectable() const { return false; }

    ChannelState state() const;
    bool isConnected() const { return state() == ChannelState::Connected; }

    /**
     * @brief Starts connecting. No-op unless connectable and Disconnected.
     */
    void connect();

    /**
     * @brief Starts disconnecting. No-op if already Disconnected.
     * Supersedes any connect or pairing still in flight.
     */
    void disconnect();

    PairingType pairingType() const;
    bool requiresPairing() const { return pairingType() != PairingType::None; }
    nlohmann::json pairingData() const;

    /**
     * @brief Supplies pairing input (a PIN, a confirmation) while in Pairing.
     * Outside that state, or on a channel that needs no pairing, the observer
     * receives onPairingFailed with an argument error.
     */
    void pair(const nlohmann::json& data);

    // =========================================================================
    // Sessions
    // =========================================================================

    virtual AppCloser* appCloser() { return nullptr; }
    virtual MediaCloser* mediaCloser() { return nullptr; }
    virtual InputPickerCloser* inputPickerCloser() { return nullptr; }
    virtual WebAppCloser* webAppCloser() { return nullptr; }

    /**
     * @brief Routes a close request to the closer matching the session kind.
     *
     * Fails with ErrorCode::ArgumentError if the session has no channel, the
     * kind is unknown, or this channel has no closer for that kind.
     */
    void closeSession(const LaunchSession& session,
                      SuccessCallback onSuccess, FailureCallback onFailure);

    // =========================================================================
    // Persistence
    // =========================================================================

    /**
     * @brief Writes `config` and `description` as tagged sub-records.
     */
    nlohmann::json toJson(const RecordCodec& codec) const override;

protected:
    /**
     * @brief Transport hook for connect(). The default connects immediately.
     */
    virtual void doConnect(AttemptId attempt) { completeConnect(attempt); }

    /**
     * @brief Transport hook for disconnect(). The default completes immediately.
     */
    virtual void doDisconnect() { completeDisconnect(); }

    /**
     * @brief Transport hook for pair(). The default fails as unsupported.
     */
    virtual void doPair(AttemptId attempt, const nlohmann::json& data);

    AttemptId currentAttempt() const;

    void setPairingType(PairingType type);
    void setPairingData(nlohmann::json data);

    void completeConnect(AttemptId attempt);
    void failConnect(AttemptId attempt, const Error& error);
    void requirePairing(AttemptId attempt, PairingType type, const nlohmann::json& data);
    void completePairing(AttemptId attempt);
    void failPairing(AttemptId attempt, const Error& error);
    void completeDisconnect(const std::optional<Error>& error = std::nullopt);

    /**
     * @brief Reports an unsolicited drop of the transport.
     */
    void connectionLost(const Error& error);

private:
    template <typename F>
    void notify(F&& callback);

    void handleCapabilityChange(const CapabilityList& added, const CapabilityList& removed);

    // Must be called with mutex_ held
    bool isCurrent(AttemptId attempt, ChannelState expected) const;

    mutable std::mutex mutex_;
    std::shared_ptr<ChannelConfig> config_;
    std::shared_ptr<ChannelDescription> description_;
    std::weak_ptr<ChannelObserver> observer_;
    std::map<CapabilityFamily, int> priorities_;

    ChannelState state_{ChannelState::Disconnected};
    AttemptId attempt_{0};
    bool disconnectPending_{false};
    AttemptId disconnectAttempt_{0};
    PairingType pairingType_{PairingType::None};
    nlohmann::json pairingData_;

    CapabilityRegistry capabilities_;
};

/**
 * @brief Rebuilds a channel of type T from a `{class, config, description}` record.
 *
 * T must be constructible from (shared_ptr<ChannelConfig>, shared_ptr<ChannelDescription>).
 * Sub-records are decoded through the codec so config subclasses survive;
 * a missing sub-record becomes a default-constructed one.
 *
 * @throws std::runtime_error when a present sub-record cannot be decoded
 */
template <typename T>
std::shared_ptr<T> decodeChannel(const nlohmann::json& record, const RecordCodec& codec) {
    static_assert(std::is_base_of<DeviceChannel, T>::value,
                  "Decoded channel must derive from DeviceChannel");

    auto config = std::make_shared<ChannelConfig>();
    if (record.contains("config")) {
        auto decoded = codec.decodeAs<ChannelConfig>(record.at("config"));
        if (decoded.has_error()) {
            throw std::runtime_error(decoded.error().message);
        }
        config = decoded.value();
    }

    auto description = std::make_shared<ChannelDescription>();
    if (record.contains("description")) {
        auto decoded = codec.decodeAs<ChannelDescription>(record.at("description"));
        if (decoded.has_error()) {
            throw std::runtime_error(decoded.error().message);
        }
        description = decoded.value();
    }

    return std::make_shared<T>(config, description);
}

} // namespace core
} // namespace devmux

#endif // DEVMUX_CORE_DEVICE_CHANNEL_H
