#include "devmux/core/device_store.h"
#include "devmux/core/device_aggregate.h"
#include "devmux/utils/clock.hpp"
#include "devmux/utils/logging.hpp"
#include <filesystem>
#include <fstream>
#include <system_error>

namespace devmux {
namespace core {

namespace {

// Entries that were never detected age from their last connection instead
double referenceTime(const nlohmann::json& entry) {
    double detected = entry.value("lastDetection", 0.0);
    return detected > 0.0 ? detected : entry.value("lastConnected", 0.0);
}

} // namespace

void DeviceStoreConfig::configure(const nlohmann::json& config) {
    if (!config.is_object()) {
        return;
    }
    auto path = config.find("storage_path");
    if (path != config.end()) {
        if (path->is_string()) {
            storagePath = path->get<std::string>();
        } else {
            DEVMUX_LOG_WARN("Ignoring storage_path: expected a string");
        }
    }
    auto duration = config.find("max_store_duration_seconds");
    if (duration != config.end()) {
        if (duration->is_number_integer()) {
            maxStoreDuration = std::chrono::seconds(duration->get<long long>());
        } else {
            DEVMUX_LOG_WARN("Ignoring max_store_duration_seconds: expected an integer");
        }
    }
}

DeviceStore::DeviceStore(DeviceStoreConfig config,
                         const RecordCodec& codec,
                         std::shared_ptr<CallbackDispatcher> dispatcher)
    : config_(std::move(config))
    , codec_(codec)
    , dispatcher_(dispatcher ? std::move(dispatcher) : immediateDispatcher()) {}

Result<void> DeviceStore::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    created_ = 0.0;
    updated_ = 0.0;

    const std::filesystem::path path(config_.storagePath);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        DEVMUX_LOG_DEBUG("No device store at {}, starting empty", config_.storagePath);
        return Result<void>();
    }

    std::ifstream file(path);
    if (!file) {
        DEVMUX_LOG_WARN("Could not open device store {}", config_.storagePath);
        return Error(ErrorCode::IOError, "Could not open " + config_.storagePath);
    }

    nlohmann::json document;
    try {
        file >> document;
    } catch (const nlohmann::json::exception& e) {
        DEVMUX_LOG_WARN("Device store {} is malformed: {}", config_.storagePath, e.what());
        return Error(ErrorCode::DecodeError, std::string("Malformed device store: ") + e.what());
    }

    if (!document.is_object()) {
        DEVMUX_LOG_WARN("Device store {} is not a json object", config_.storagePath);
        return Error(ErrorCode::DecodeError, "Device store envelope is not an object");
    }

    const double now = utils::epochSeconds();
    try {
        const int storedVersion = document.value("version", 0);
        if (storedVersion > config_.version) {
            DEVMUX_LOG_WARN("Device store version {} is newer than {}", storedVersion, config_.version);
        }
        created_ = document.value("created", now);
        updated_ = document.value("updated", created_);
    } catch (const nlohmann::json::exception& e) {
        DEVMUX_LOG_WARN("Device store header is malformed: {}", e.what());
        return Error(ErrorCode::DecodeError, std::string("Malformed device store header: ") + e.what());
    }

    auto devices = document.find("devices");
    if (devices != document.end() && devices->is_array()) {
        for (const auto& entry : *devices) {
            auto decoded = DeviceAggregate::fromJson(entry, codec_, dispatcher_);
            if (decoded.has_error()) {
                DEVMUX_LOG_WARN("Skipping stored device: {}", decoded.error().message);
                continue;
            }
            const auto& device = decoded.value();
            entries_[device->id()] = device->toJson(codec_);
        }
    }

    const size_t pruned = pruneLocked(now);
    DEVMUX_LOG_INFO("Loaded {} device(s) from {} ({} pruned)",
                    entries_.size(), config_.storagePath, pruned);
    if (pruned > 0) {
        return saveLocked(now);
    }
    return Result<void>();
}

Result<void> DeviceStore::addDevice(const DeviceAggregate& device) {
    return upsert(device, false);
}

Result<void> DeviceStore::updateDevice(const DeviceAggregate& device) {
    return upsert(device, true);
}

Result<void> DeviceStore::upsert(const DeviceAggregate& device, bool requireExisting) {
    if (device.id().empty()) {
        return Error(ErrorCode::ArgumentError, "Cannot store a device without an id");
    }

    const bool everConnected = device.lastConnected() > 0.0;
    nlohmann::json entry;
    if (everConnected) {
        entry = device.toJson(codec_);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const double now = utils::epochSeconds();
    const size_t pruned = pruneLocked(now);

    if (!everConnected) {
        DEVMUX_LOG_DEBUG("Not storing device {}: it has never connected", device.id());
        return pruned > 0 ? saveLocked(now) : Result<void>();
    }

    auto existing = entries_.find(device.id());
    if (existing == entries_.end()) {
        if (requireExisting) {
            return pruned > 0 ? saveLocked(now) : Result<void>();
        }
    } else {
        auto storedServices = existing->second.find("services");
        auto& services = entry["services"];
        if (storedServices != existing->second.end() && storedServices->is_object()) {
            for (auto it = storedServices->begin(); it != storedServices->end(); ++it) {
                if (!services.contains(it.key())) {
                    services[it.key()] = it.value();
                }
            }
        }
    }

    entries_[device.id()] = std::move(entry);
    return saveLocked(now);
}

Result<void> DeviceStore::removeDevice(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const double now = utils::epochSeconds();
    pruneLocked(now);
    entries_.erase(id);
    return saveLocked(now);
}

Result<void> DeviceStore::removeAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    return saveLocked(utils::epochSeconds());
}

std::shared_ptr<DeviceAggregate> DeviceStore::decodeLocked(const std::string& id) const {
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return nullptr;
    }
    auto decoded = DeviceAggregate::fromJson(it->second, codec_, dispatcher_);
    if (decoded.has_error()) {
        DEVMUX_LOG_WARN("Stored device {} could not be rebuilt: {}", id, decoded.error().message);
        return nullptr;
    }
    return decoded.value();
}

std::shared_ptr<DeviceAggregate> DeviceStore::deviceForId(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return decodeLocked(id);
}

std::vector<std::shared_ptr<DeviceAggregate>> DeviceStore::storedDevices() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<DeviceAggregate>> devices;
    devices.reserve(entries_.size());
    for (const auto& [id, entry] : entries_) {
        if (auto device = decodeLocked(id)) {
            devices.push_back(std::move(device));
        }
    }
    return devices;
}

std::vector<std::string> DeviceStore::storedIds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(entries_.size());
    for (const auto& [id, entry] : entries_) {
        ids.push_back(id);
    }
    return ids;
}

Result<void> DeviceStore::setMaxStoreDuration(std::chrono::seconds duration) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.maxStoreDuration = duration;
    const double now = utils::epochSeconds();
    pruneLocked(now);
    return saveLocked(now);
}

std::chrono::seconds DeviceStore::maxStoreDuration() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.maxStoreDuration;
}

int DeviceStore::version() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.version;
}

double DeviceStore::created() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return created_;
}

double DeviceStore::updated() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return updated_;
}

std::string DeviceStore::storagePath() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.storagePath;
}

size_t DeviceStore::pruneLocked(double now) {
    const double cutoff = now - static_cast<double>(config_.maxStoreDuration.count());
    size_t pruned = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (referenceTime(it->second) < cutoff) {
            DEVMUX_LOG_DEBUG("Pruning stale device {}", it->first);
            it = entries_.erase(it);
            ++pruned;
        } else {
            ++it;
        }
    }
    return pruned;
}

Result<void> DeviceStore::saveLocked(double now) {
    if (created_ <= 0.0) {
        created_ = now;
    }
    updated_ = now;

    nlohmann::json devices = nlohmann::json::array();
    for (const auto& [id, entry] : entries_) {
        devices.push_back(entry);
    }

    const nlohmann::json document = {
        {"version", config_.version},
        {"created", created_},
        {"updated", updated_},
        {"devices", std::move(devices)}
    };

    const std::filesystem::path path(config_.storagePath);
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return Error(ErrorCode::IOError,
                         "Could not create " + path.parent_path().string() + ": " + ec.message());
        }
    }

    std::filesystem::path temporary = path;
    temporary += ".tmp";
    {
        std::ofstream file(temporary, std::ios::out | std::ios::trunc);
        if (!file) {
            return Error(ErrorCode::IOError, "Could not write " + temporary.string());
        }
        file << document.dump(4);
        file.flush();
        if (!file) {
            return Error(ErrorCode::IOError, "Could not write " + temporary.string());
        }
    }

    std::filesystem::rename(temporary, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temporary, ignored);
        DEVMUX_LOG_ERROR("Could not replace device store {}: {}", path.string(), ec.message());
        return Error(ErrorCode::IOError, "Could not replace " + path.string() + ": " + ec.message());
    }

    DEVMUX_LOG_TRACE("Saved {} device(s) to {}", entries_.size(), path.string());
    return Result<void>();
}

} // namespace core
} // namespace devmux
