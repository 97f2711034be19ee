#include "devmux/core/device_channel.h"
#include "devmux/utils/logging.hpp"

namespace devmux {
namespace core {

const char* channelStateToString(ChannelState state) {
    switch (state) {
        case ChannelState::Disconnected: return "disconnected";
        case ChannelState::Connecting: return "connecting";
        case ChannelState::Pairing: return "pairing";
        case ChannelState::Connected: return "connected";
        default: return "unknown";
    }
}

const char* pairingTypeToString(PairingType type) {
    switch (type) {
        case PairingType::None: return "none";
        case PairingType::FirstScreen: return "first screen";
        case PairingType::PinCode: return "pin code";
        case PairingType::Mixed: return "mixed";
        case PairingType::Unknown:
        default: return "unknown";
    }
}

DeviceChannel::DeviceChannel(std::shared_ptr<ChannelConfig> config,
                             std::shared_ptr<ChannelDescription> description)
    : config_(config ? std::move(config) : std::make_shared<ChannelConfig>())
    , description_(description ? std::move(description) : std::make_shared<ChannelDescription>()) {
    capabilities_.setChangeCallback(
        [this](const CapabilityList& added, const CapabilityList& removed) {
            handleCapabilityChange(added, removed);
        });
}

std::string DeviceChannel::channelType() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return description_->serviceId;
}

std::string DeviceChannel::id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_->id;
}

std::shared_ptr<ChannelConfig> DeviceChannel::config() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

std::shared_ptr<ChannelDescription> DeviceChannel::description() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return description_;
}

void DeviceChannel::setConfig(std::shared_ptr<ChannelConfig> config) {
    if (!config) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = std::move(config);
}

void DeviceChannel::setDescription(std::shared_ptr<ChannelDescription> description) {
    if (!description) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    description_ = std::move(description);
}

void DeviceChannel::markDetected(double timestamp) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_->lastDetection = timestamp;
}

void DeviceChannel::setCapabilityPriority(CapabilityFamily family, int level) {
    std::lock_guard<std::mutex> lock(mutex_);
    priorities_[family] = level;
}

void DeviceChannel::clearCapabilityPriority(CapabilityFamily family) {
    std::lock_guard<std::mutex> lock(mutex_);
    priorities_.erase(family);
}

std::optional<int> DeviceChannel::capabilityPriority(CapabilityFamily family) const {
    std::optional<int> level;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = priorities_.find(family);
        if (it == priorities_.end()) {
            return std::nullopt;
        }
        level = it->second;
    }
    if (!capabilities_.has(familyQuery(family))) {
        return std::nullopt;
    }
    return level;
}

void DeviceChannel::setObserver(std::weak_ptr<ChannelObserver> observer) {
    std::lock_guard<std::mutex> lock(mutex_);
    observer_ = std::move(observer);
}

ChannelState DeviceChannel::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

PairingType DeviceChannel::pairingType() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pairingType_;
}

nlohmann::json DeviceChannel::pairingData() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pairingData_;
}

void DeviceChannel::setPairingType(PairingType type) {
    std::lock_guard<std::mutex> lock(mutex_);
    pairingType_ = type;
}

void DeviceChannel::setPairingData(nlohmann::json data) {
    std::lock_guard<std::mutex> lock(mutex_);
    pairingData_ = std::move(data);
}

DeviceChannel::AttemptId DeviceChannel::currentAttempt() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return attempt_;
}

template <typename F>
void DeviceChannel::notify(F&& callback) {
    std::shared_ptr<ChannelObserver> observer;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        observer = observer_.lock();
    }
    if (observer) {
        callback(*observer);
    }
}

bool DeviceChannel::isCurrent(AttemptId attempt, ChannelState expected) const {
    return attempt == attempt_ && state_ == expected;
}

void DeviceChannel::connect() {
    if (!isConnectable()) {
        DEVMUX_LOG_TRACE("Channel {} is not connectable, connect ignored", channelType());
        return;
    }

    AttemptId attempt = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != ChannelState::Disconnected) {
            return;
        }
        state_ = ChannelState::Connecting;
        attempt = ++attempt_;
    }

    DEVMUX_LOG_DEBUG("Channel {} connecting (attempt {})", channelType(), attempt);
    doConnect(attempt);
}

void DeviceChannel::disconnect() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == ChannelState::Disconnected) {
            return;
        }
        state_ = ChannelState::Disconnected;
        disconnectAttempt_ = ++attempt_;
        disconnectPending_ = true;
        config_->connected = false;
    }

    DEVMUX_LOG_DEBUG("Channel {} disconnecting", channelType());
    doDisconnect();
}

void DeviceChannel::pair(const nlohmann::json& data) {
    AttemptId attempt = 0;
    std::optional<Error> rejected;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (pairingType_ == PairingType::None) {
            rejected = Error(ErrorCode::ArgumentError,
                             "Channel " + description_->serviceId + " does not require pairing");
        } else if (state_ != ChannelState::Pairing) {
            rejected = Error(ErrorCode::ArgumentError,
                             "Channel " + description_->serviceId + " is not waiting for pairing");
        } else {
            state_ = ChannelState::Connecting;
            attempt = attempt_;
        }
    }

    if (rejected) {
        notify([&](ChannelObserver& o) { o.onPairingFailed(*this, *rejected); });
        return;
    }
    doPair(attempt, data);
}

void DeviceChannel::doPair(AttemptId attempt, const nlohmann::json& /*data*/) {
    failPairing(attempt, Error(ErrorCode::NotSupported, "Pairing is not implemented by " + channelType()));
}

void DeviceChannel::completeConnect(AttemptId attempt) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!isCurrent(attempt, ChannelState::Connecting)) {
            DEVMUX_LOG_DEBUG("Dropping stale connect completion for {}", description_->serviceId);
            return;
        }
        state_ = ChannelState::Connected;
        config_->connected = true;
        config_->wasConnected = true;
    }

    DEVMUX_LOG_INFO("Channel {} connected", channelType());
    notify([this](ChannelObserver& o) { o.onConnectionSucceeded(*this); });
}

void DeviceChannel::failConnect(AttemptId attempt, const Error& error) {
    if (error.isPairingRequired()) {
        requirePairing(attempt, pairingType() == PairingType::None ? PairingType::Unknown : pairingType(),
                       pairingData());
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (attempt != attempt_ ||
            (state_ != ChannelState::Connecting && state_ != ChannelState::Pairing)) {
            return;
        }
        state_ = ChannelState::Disconnected;
        config_->connected = false;
    }

    DEVMUX_LOG_WARN("Channel {} failed to connect: {}", channelType(), error.message);
    notify([&](ChannelObserver& o) { o.onConnectionFailed(*this, error); });
}

void DeviceChannel::requirePairing(AttemptId attempt, PairingType type, const nlohmann::json& data) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!isCurrent(attempt, ChannelState::Connecting)) {
            return;
        }
        state_ = ChannelState::Pairing;
        pairingType_ = type == PairingType::None ? PairingType::Unknown : type;
        pairingData_ = data;
        type = pairingType_;
    }

    DEVMUX_LOG_INFO("Channel {} requires pairing ({})", channelType(), pairingTypeToString(type));
    notify([&](ChannelObserver& o) { o.onPairingRequired(*this, type, data); });
}

void DeviceChannel::completePairing(AttemptId attempt) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!isCurrent(attempt, ChannelState::Connecting)) {
            return;
        }
    }
    notify([this](ChannelObserver& o) { o.onPairingSucceeded(*this); });
}

void DeviceChannel::failPairing(AttemptId attempt, const Error& error) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (attempt != attempt_ ||
            (state_ != ChannelState::Connecting && state_ != ChannelState::Pairing)) {
            return;
        }
        state_ = ChannelState::Disconnected;
    }

    DEVMUX_LOG_WARN("Channel {} pairing failed: {}", channelType(), error.message);
    notify([&](ChannelObserver& o) { o.onPairingFailed(*this, error); });
}

void DeviceChannel::completeDisconnect(const std::optional<Error>& error) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!disconnectPending_) {
            return;
        }
        disconnectPending_ = false;
        // A connect() issued since disconnect() supersedes this completion
        if (attempt_ != disconnectAttempt_) {
            DEVMUX_LOG_DEBUG("Dropping stale disconnect completion for {}", description_->serviceId);
            return;
        }
    }

    DEVMUX_LOG_DEBUG("Channel {} disconnected", channelType());
    notify([&](ChannelObserver& o) { o.onDisconnected(*this, error); });
}

void DeviceChannel::connectionLost(const Error& error) {
    ChannelState previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        previous = state_;
        if (previous == ChannelState::Disconnected) {
            return;
        }
        state_ = ChannelState::Disconnected;
        ++attempt_;
        config_->connected = false;
    }

    DEVMUX_LOG_WARN("Channel {} lost its connection while {}: {}",
                    channelType(), channelStateToString(previous), error.message);
    if (previous == ChannelState::Connected) {
        notify([&](ChannelObserver& o) { o.onDisconnected(*this, error); });
    } else {
        notify([&](ChannelObserver& o) { o.onConnectionFailed(*this, error); });
    }
}

void DeviceChannel::handleCapabilityChange(const CapabilityList& added, const CapabilityList& removed) {
    notify([&](ChannelObserver& o) { o.onCapabilitiesChanged(*this, added, removed); });
}

void DeviceChannel::closeSession(const LaunchSession& session,
                                 SuccessCallback onSuccess, FailureCallback onFailure) {
    auto fail = [&onFailure](const std::string& message) {
        if (onFailure) {
            onFailure(Error(ErrorCode::ArgumentError, message));
        }
    };

    auto owner = session.channel.lock();
    if (!owner) {
        fail("This launch session does not have an associated channel");
        return;
    }
    if (owner.get() != this) {
        fail("This launch session belongs to channel " + owner->channelType());
        return;
    }

    switch (session.kind) {
        case SessionKind::App:
            if (auto* closer = appCloser()) {
                closer->closeApp(session, std::move(onSuccess), std::move(onFailure));
                return;
            }
            break;
        case SessionKind::Media:
            if (auto* closer = mediaCloser()) {
                closer->closeMedia(session, std::move(onSuccess), std::move(onFailure));
                return;
            }
            break;
        case SessionKind::ExternalInputPicker:
            if (auto* closer = inputPickerCloser()) {
                closer->closeInputPicker(session, std::move(onSuccess), std::move(onFailure));
                return;
            }
            break;
        case SessionKind::WebApp:
            if (auto* closer = webAppCloser()) {
                closer->closeWebApp(session, std::move(onSuccess), std::move(onFailure));
                return;
            }
            break;
        case SessionKind::Unknown:
        default:
            fail("This channel does not know how to close this launch session");
            return;
    }

    fail("Channel " + channelType() + " cannot close " +
         sessionKindToString(session.kind) + " sessions");
}

nlohmann::json DeviceChannel::toJson(const RecordCodec& codec) const {
    // Completions write config_ under the lock, so encode under it too
    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json record = nlohmann::json::object();
    record["config"] = codec.encode(*config_);
    record["description"] = codec.encode(*description_);
    return record;
}

} // namespace core
} // namespace devmux
