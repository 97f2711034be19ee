#include "devmux/core/channel_record.h"

namespace devmux {
namespace core {

nlohmann::json ChannelConfig::toJson(const RecordCodec& /*codec*/) const {
    return {
        {"UUID", id},
        {"connected", connected},
        {"wasConnected", wasConnected},
        {"lastDetection", lastDetection}
    };
}

void ChannelConfig::readBaseFields(const nlohmann::json& record) {
    id = record.value("UUID", std::string());
    connected = record.value("connected", false);
    wasConnected = record.value("wasConnected", false);
    lastDetection = record.value("lastDetection", 0.0);
}

std::shared_ptr<ChannelConfig> ChannelConfig::fromJson(const nlohmann::json& record,
                                                       const RecordCodec& /*codec*/) {
    auto config = std::make_shared<ChannelConfig>();
    config->readBaseFields(record);
    return config;
}

bool ChannelConfig::equals(const ChannelConfig& other) const {
    return typeTag() == other.typeTag() &&
           id == other.id &&
           connected == other.connected &&
           wasConnected == other.wasConnected &&
           lastDetection == other.lastDetection;
}

nlohmann::json ChannelDescription::toJson(const RecordCodec& /*codec*/) const {
    return {
        {"serviceId", serviceId},
        {"UUID", id},
        {"address", address},
        {"port", port},
        {"type", type},
        {"version", version},
        {"friendlyName", friendlyName},
        {"manufacturer", manufacturer},
        {"modelName", modelName},
        {"modelDescription", modelDescription},
        {"modelNumber", modelNumber},
        {"commandURL", commandURL}
    };
}

std::shared_ptr<ChannelDescription> ChannelDescription::fromJson(const nlohmann::json& record,
                                                                 const RecordCodec& /*codec*/) {
    auto description = std::make_shared<ChannelDescription>();
    description->serviceId = record.value("serviceId", std::string());
    description->id = record.value("UUID", std::string());
    description->address = record.value("address", std::string());
    description->port = record.value("port", static_cast<uint16_t>(0));
    description->type = record.value("type", std::string());
    description->version = record.value("version", std::string());
    description->friendlyName = record.value("friendlyName", std::string());
    description->manufacturer = record.value("manufacturer", std::string());
    description->modelName = record.value("modelName", std::string());
    description->modelDescription = record.value("modelDescription", std::string());
    description->modelNumber = record.value("modelNumber", std::string());
    description->commandURL = record.value("commandURL", std::string());
    return description;
}

bool ChannelDescription::operator==(const ChannelDescription& other) const {
    return serviceId == other.serviceId &&
           id == other.id &&
           address == other.address &&
           port == other.port &&
           type == other.type &&
           version == other.version &&
           friendlyName == other.friendlyName &&
           manufacturer == other.manufacturer &&
           modelName == other.modelName &&
           modelDescription == other.modelDescription &&
           modelNumber == other.modelNumber &&
           commandURL == other.commandURL;
}

void registerChannelRecordTypes(RecordCodec& codec) {
    RecordTypeRegistrar<ChannelConfig> config(ChannelConfig::kTypeTag, codec);
    RecordTypeRegistrar<ChannelDescription> description(ChannelDescription::kTypeTag, codec);
}

} // namespace core
} // namespace devmux
