#include "devmux/core/record_codec.h"
#include "devmux/core/channel_record.h"
#include "devmux/utils/logging.hpp"
#include <algorithm>
#include <stdexcept>

namespace devmux {
namespace core {

RecordCodec& RecordCodec::getInstance() {
    static RecordCodec instance;
    static std::once_flag builtins;
    std::call_once(builtins, [] { registerChannelRecordTypes(instance); });
    return instance;
}

void RecordCodec::registerType(const std::string& tag, RecordFactory factory) {
    if (tag.empty()) {
        throw std::invalid_argument("Record type tag must not be empty");
    }
    if (!factory) {
        throw std::invalid_argument("Record factory for " + tag + " is empty");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (registry_.find(tag) != registry_.end()) {
        throw std::invalid_argument("Record type already registered: " + tag);
    }
    registry_[tag] = std::move(factory);
}

bool RecordCodec::hasType(const std::string& tag) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return registry_.find(tag) != registry_.end();
}

std::vector<std::string> RecordCodec::registeredTypes() const {
    std::vector<std::string> tags;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tags.reserve(registry_.size());
        for (const auto& [tag, _] : registry_) {
            tags.push_back(tag);
        }
    }
    std::sort(tags.begin(), tags.end());
    return tags;
}

nlohmann::json RecordCodec::encode(const Persistable& entity) const {
    nlohmann::json record = entity.toJson(*this);
    if (!record.is_object()) {
        record = nlohmann::json::object();
    }
    record[kTypeKey] = entity.typeTag();
    return record;
}

Result<std::shared_ptr<Persistable>> RecordCodec::decode(const nlohmann::json& record) const {
    if (!record.is_object()) {
        return Error(ErrorCode::DecodeError, "Record is not an object");
    }

    auto tagIt = record.find(kTypeKey);
    if (tagIt == record.end() || !tagIt->is_string()) {
        return Error(ErrorCode::DecodeError, "Record has no type tag");
    }
    const std::string tag = tagIt->get<std::string>();

    // Factories may decode nested records, so never call them under the lock
    RecordFactory factory;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = registry_.find(tag);
        if (it == registry_.end()) {
            return Error(ErrorCode::DecodeError, "Unknown record type: " + tag);
        }
        factory = it->second;
    }

    try {
        auto entity = factory(record, *this);
        if (!entity) {
            return Error(ErrorCode::DecodeError, "Factory for " + tag + " produced no entity");
        }
        return entity;
    } catch (const std::exception& e) {
        DEVMUX_LOG_DEBUG("Decoding {} record failed: {}", tag, e.what());
        return Error(ErrorCode::DecodeError,
                     "Malformed " + tag + " record: " + std::string(e.what()));
    }
}

} // namespace core
} // namespace devmux
