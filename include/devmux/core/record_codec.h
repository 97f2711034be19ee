#pragma once

#include "devmux/utils/result.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace devmux {
namespace core {

class RecordCodec;

/**
 * @brief Entity that can be written to and rebuilt from a tagged json record.
 */
class Persistable {
public:
    virtual ~Persistable() = default;

    /**
     * @brief Stable name of the concrete kind, written under RecordCodec::kTypeKey.
     */
    virtual std::string typeTag() const = 0;

    /**
     * @brief Writes the entity's own fields. Nested persistables are encoded
     * through the supplied codec so that they carry their own tag.
     */
    virtual nlohmann::json toJson(const RecordCodec& codec) const = 0;
};

/**
 * @brief Factory rebuilding an entity from its record.
 *
 * Factories may throw; the codec converts any exception into a decode error.
 */
using RecordFactory =
    std::function<std::shared_ptr<Persistable>(const nlohmann::json&, const RecordCodec&)>;

/**
 * @brief Tagged-variant registry turning persistable entities into json and back.
 *
 * Each concrete kind registers a tag and a factory. Encoding writes the tag next
 * to the entity fields; decoding dispatches on the tag. Unknown tags produce a
 * DecodeError result so that callers can skip a record written by a newer
 * build instead of failing a whole load.
 */
class RecordCodec {
public:
    static constexpr const char* kTypeKey = "class";

    RecordCodec() = default;

    /**
     * @brief Process-wide codec with the built-in channel record types registered.
     */
    static RecordCodec& getInstance();

    // Non-copyable
    RecordCodec(const RecordCodec&) = delete;
    RecordCodec& operator=(const RecordCodec&) = delete;

    /**
     * @brief Registers a factory for a tag.
     * @throws std::invalid_argument if the tag is empty or already registered
     */
    void registerType(const std::string& tag, RecordFactory factory);

    bool hasType(const std::string& tag) const;

    std::vector<std::string> registeredTypes() const;

    /**
     * @brief Encodes an entity, tag included.
     */
    nlohmann::json encode(const Persistable& entity) const;

    /**
     * @brief Rebuilds an entity from a tagged record.
     */
    Result<std::shared_ptr<Persistable>> decode(const nlohmann::json& record) const;

    /**
     * @brief Rebuilds an entity and checks it has the expected static type.
     */
    template <typename T>
    Result<std::shared_ptr<T>> decodeAs(const nlohmann::json& record) const {
        static_assert(std::is_base_of<Persistable, T>::value,
                      "Decoded type must derive from Persistable");
        auto decoded = decode(record);
        if (decoded.has_error()) {
            return decoded.error();
        }
        auto typed = std::dynamic_pointer_cast<T>(decoded.value());
        if (!typed) {
            return Error(ErrorCode::DecodeError,
                         "Record of type " + decoded.value()->typeTag() +
                             " has an unexpected kind");
        }
        return typed;
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, RecordFactory> registry_;
};

/**
 * @brief Helper for registering a persistable type at static initialization.
 *
 * Usage:
 *   static RecordTypeRegistrar<MyChannel> registrar(MyChannel::kTypeTag);
 *
 * @tparam T Type deriving from Persistable with a static
 *           `std::shared_ptr<T> fromJson(const nlohmann::json&, const RecordCodec&)`
 */
template <typename T>
class RecordTypeRegistrar {
    static_assert(std::is_base_of<Persistable, T>::value,
        "Registered type must inherit from Persistable");

public:
    explicit RecordTypeRegistrar(const std::string& tag,
                                 RecordCodec& codec = RecordCodec::getInstance()) {
        codec.registerType(tag, [](const nlohmann::json& record, const RecordCodec& c)
                                    -> std::shared_ptr<Persistable> {
            return T::fromJson(record, c);
        });
    }
};

} // namespace core
} // namespace devmux
