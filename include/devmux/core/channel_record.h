#pragma once

#include "devmux/core/record_codec.h"
#include <cstdint>
#include <memory>
#include <string>

namespace devmux {
namespace core {

/**
 * @brief Persisted per-channel state: pairing results, connection history.
 *
 * Protocol-specific channels subclass this to add their own keys (client
 * keys, certificates) and register the subclass with the RecordCodec.
 */
struct ChannelConfig : public Persistable {
    static constexpr const char* kTypeTag = "ChannelConfig";

    std::string id;               ///< Channel UUID
    bool connected{false};        ///< Connected when last written
    bool wasConnected{false};     ///< Has ever completed a connection
    double lastDetection{0.0};    ///< Epoch seconds of the last discovery hit

    ChannelConfig() = default;
    explicit ChannelConfig(std::string channelId) : id(std::move(channelId)) {}

    std::string typeTag() const override { return kTypeTag; }
    nlohmann::json toJson(const RecordCodec& codec) const override;

    static std::shared_ptr<ChannelConfig> fromJson(const nlohmann::json& record,
                                                   const RecordCodec& codec);

    /**
     * @brief Field-wise comparison including subclass fields.
     */
    virtual bool equals(const ChannelConfig& other) const;

protected:
    // Shared by subclasses reading their base fields
    void readBaseFields(const nlohmann::json& record);
};

/**
 * @brief Discovery-time description of a channel endpoint.
 */
struct ChannelDescription : public Persistable {
    static constexpr const char* kTypeTag = "ChannelDescription";

    std::string serviceId;        ///< Channel type, e.g. "webOS TV"
    std::string id;               ///< Channel UUID
    std::string address;          ///< IP address
    uint16_t port{0};
    std::string type;             ///< Discovery type, e.g. an SSDP URN
    std::string version;
    std::string friendlyName;
    std::string manufacturer;
    std::string modelName;
    std::string modelDescription;
    std::string modelNumber;
    std::string commandURL;

    std::string typeTag() const override { return kTypeTag; }
    nlohmann::json toJson(const RecordCodec& codec) const override;

    static std::shared_ptr<ChannelDescription> fromJson(const nlohmann::json& record,
                                                        const RecordCodec& codec);

    bool operator==(const ChannelDescription& other) const;
    bool operator!=(const ChannelDescription& other) const { return !(*this == other); }
};

/**
 * @brief Registers ChannelConfig and ChannelDescription with a codec.
 */
void registerChannelRecordTypes(RecordCodec& codec);

} // namespace core
} // namespace devmux
