#ifndef DEVMUX_CORE_DEVICE_STORE_H
#define DEVMUX_CORE_DEVICE_STORE_H

#include "devmux/core/dispatcher.h"
#include "devmux/core/record_codec.h"
#include "devmux/utils/result.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace devmux {
namespace core {

class DeviceAggregate;

/**
 * @brief Settings for the on-disk device store.
 */
struct DeviceStoreConfig {
    static constexpr int kCurrentVersion = 1;

    std::string storagePath = "devmux_devices.json";          // Store file
    std::chrono::seconds maxStoreDuration{3 * 24 * 60 * 60};  // Prune devices not detected for this long
    int version = kCurrentVersion;                            // Schema version written to the envelope

    /**
     * @brief Merges recognised keys from a json object:
     * `storage_path`, `max_store_duration_seconds`.
     */
    void configure(const nlohmann::json& config);
};

/**
 * @brief Versioned, file-backed collection of previously connected devices.
 *
 * The file holds one envelope:
 * @code
 * { "version": 1, "created": <epoch s>, "updated": <epoch s>,
 *   "devices": [ { "id", "friendlyName", "lastKnownIPAddress", "lastSeenOnWifi",
 *                  "lastConnected", "lastDetection",
 *                  "services": { "<channel id>": { "class", "config", "description" } } } ] }
 * @endcode
 *
 * Devices whose last detection is older than maxStoreDuration are pruned on
 * load and before every mutation. Devices that never completed a connection
 * are not written. Each mutating call runs prune, mutate and save as one
 * critical section, and saves replace the file atomically through a
 * temporary sibling.
 */
class DeviceStore {
public:
    explicit DeviceStore(DeviceStoreConfig config = DeviceStoreConfig(),
                         const RecordCodec& codec = RecordCodec::getInstance(),
                         std::shared_ptr<CallbackDispatcher> dispatcher = nullptr);

    // Non-copyable
    DeviceStore(const DeviceStore&) = delete;
    DeviceStore& operator=(const DeviceStore&) = delete;

    /**
     * @brief Reads the store file, replacing the in-memory contents.
     *
     * A missing file yields an empty store. An unreadable or malformed file
     * yields an empty store and an error. Malformed device entries and
     * channels with unknown tags are dropped individually.
     */
    Result<void> load();

    /**
     * @brief Inserts or replaces a device. Stored channels the device no
     * longer carries are kept. A device that never connected is skipped.
     */
    Result<void> addDevice(const DeviceAggregate& device);

    /**
     * @brief Like addDevice, but only for a device that is already stored.
     */
    Result<void> updateDevice(const DeviceAggregate& device);

    Result<void> removeDevice(const std::string& id);
    Result<void> removeAll();

    /**
     * @brief Rebuilds a stored device.
     * @return nullptr if the id is not stored
     */
    std::shared_ptr<DeviceAggregate> deviceForId(const std::string& id) const;

    std::vector<std::shared_ptr<DeviceAggregate>> storedDevices() const;
    std::vector<std::string> storedIds() const;

    /**
     * @brief Changes the retention window, then prunes and saves immediately.
     */
    Result<void> setMaxStoreDuration(std::chrono::seconds duration);
    std::chrono::seconds maxStoreDuration() const;

    int version() const;
    double created() const;
    double updated() const;
    std::string storagePath() const;

private:
    Result<void> upsert(const DeviceAggregate& device, bool requireExisting);

    // The following must be called with mutex_ held
    size_t pruneLocked(double now);
    Result<void> saveLocked(double now);
    std::shared_ptr<DeviceAggregate> decodeLocked(const std::string& id) const;

    DeviceStoreConfig config_;
    const RecordCodec& codec_;
    std::shared_ptr<CallbackDispatcher> dispatcher_;

    mutable std::mutex mutex_;
    std::map<std::string, nlohmann::json> entries_;
    double created_{0.0};
    double updated_{0.0};
};

} // namespace core
} // namespace devmux

#endif // DEVMUX_CORE_DEVICE_STORE_H
