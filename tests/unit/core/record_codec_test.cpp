#include <gtest/gtest.h>
#include "unit/core/fake_channel.hpp"
#include "devmux/core/channel_record.h"
#include "devmux/core/record_codec.h"
#include <algorithm>
#include <memory>
#include <stdexcept>

using namespace devmux::core;

namespace {

// Config subclass carrying a pairing key, as protocol channels do
struct KeyedConfig : public ChannelConfig {
    static constexpr const char* kTypeTag = "KeyedConfig";

    std::string clientKey;

    std::string typeTag() const override { return kTypeTag; }

    nlohmann::json toJson(const RecordCodec& codec) const override {
        auto record = ChannelConfig::toJson(codec);
        record["clientKey"] = clientKey;
        return record;
    }

    static std::shared_ptr<KeyedConfig> fromJson(const nlohmann::json& record, const RecordCodec&) {
        auto config = std::make_shared<KeyedConfig>();
        config->readBaseFields(record);
        config->clientKey = record.at("clientKey").get<std::string>();
        return config;
    }

    bool equals(const ChannelConfig& other) const override {
        auto keyed = dynamic_cast<const KeyedConfig*>(&other);
        return keyed && ChannelConfig::equals(other) && clientKey == keyed->clientKey;
    }
};

} // namespace

class RecordCodecTest : public ::testing::Test {
protected:
    void SetUp() override {
        registerChannelRecordTypes(codec);
        RecordTypeRegistrar<FakeChannel> channels(FakeChannel::kTypeTag, codec);
        RecordTypeRegistrar<KeyedConfig> keyed(KeyedConfig::kTypeTag, codec);
    }

    RecordCodec codec;
};

TEST_F(RecordCodecTest, DefaultInstanceHasChannelRecords) {
    auto& instance = RecordCodec::getInstance();
    EXPECT_TRUE(instance.hasType(ChannelConfig::kTypeTag));
    EXPECT_TRUE(instance.hasType(ChannelDescription::kTypeTag));
}

TEST_F(RecordCodecTest, DuplicateRegistrationThrows) {
    EXPECT_THROW(codec.registerType(ChannelConfig::kTypeTag,
                                    [](const nlohmann::json&, const RecordCodec&) {
                                        return std::shared_ptr<Persistable>();
                                    }),
                 std::invalid_argument);
    EXPECT_THROW(codec.registerType("", nullptr), std::invalid_argument);
}

TEST_F(RecordCodecTest, RegisteredTypesAreSorted) {
    auto types = codec.registeredTypes();
    ASSERT_EQ(types.size(), 4u);
    EXPECT_TRUE(std::is_sorted(types.begin(), types.end()));
}

TEST_F(RecordCodecTest, EncodeWritesTypeTag) {
    ChannelConfig config("abc");
    config.wasConnected = true;

    auto record = codec.encode(config);

    EXPECT_EQ(record[RecordCodec::kTypeKey], "ChannelConfig");
    EXPECT_EQ(record["UUID"], "abc");
    EXPECT_EQ(record["wasConnected"], true);
}

TEST_F(RecordCodecTest, UnknownTagIsDecodeError) {
    auto result = codec.decode({{"class", "FutureChannel"}, {"UUID", "x"}});
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error().code, ErrorCode::DecodeError);
}

TEST_F(RecordCodecTest, MalformedRecordsAreDecodeErrors) {
    EXPECT_TRUE(codec.decode(nlohmann::json::array()).has_error());
    EXPECT_TRUE(codec.decode({{"UUID", "no tag"}}).has_error());
    EXPECT_TRUE(codec.decode({{"class", 42}}).has_error());

    // Factory throws on the missing key
    auto result = codec.decode({{"class", "KeyedConfig"}, {"UUID", "x"}});
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error().code, ErrorCode::DecodeError);
}

TEST_F(RecordCodecTest, DecodeAsRejectsWrongKind) {
    auto record = codec.encode(ChannelDescription());
    auto result = codec.decodeAs<ChannelConfig>(record);
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error().code, ErrorCode::DecodeError);
}

TEST_F(RecordCodecTest, DescriptionRoundTrip) {
    ChannelDescription description;
    description.serviceId = "DIAL";
    description.id = "uuid-1";
    description.address = "192.168.1.20";
    description.port = 8008;
    description.friendlyName = "Kitchen";
    description.modelNumber = "X1";
    description.commandURL = "http://192.168.1.20:8008/apps/";

    auto decoded = codec.decodeAs<ChannelDescription>(codec.encode(description));

    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded.value(), description);
}

TEST_F(RecordCodecTest, ChannelRecordRoundTripKeepsConfigSubclass) {
    auto config = std::make_shared<KeyedConfig>();
    config->id = "tv-1";
    config->wasConnected = true;
    config->lastDetection = 1700000000.5;
    config->clientKey = "secret";

    auto description = std::make_shared<ChannelDescription>();
    description->serviceId = "webOS TV";
    description->id = "tv-1";
    description->modelName = "OLED";

    FakeChannel original(config, description);

    auto record = codec.encode(original);
    EXPECT_EQ(record["class"], "FakeChannel");
    EXPECT_EQ(record["config"]["class"], "KeyedConfig");
    EXPECT_EQ(record["description"]["class"], "ChannelDescription");

    auto decoded = codec.decodeAs<DeviceChannel>(record);
    ASSERT_TRUE(decoded.has_value()) << decoded.error();

    const auto& channel = decoded.value();
    EXPECT_EQ(channel->typeTag(), "FakeChannel");
    EXPECT_EQ(channel->channelType(), "webOS TV");
    EXPECT_EQ(channel->id(), "tv-1");
    EXPECT_TRUE(channel->config()->equals(*config));
    EXPECT_EQ(*channel->description(), *description);
}

TEST_F(RecordCodecTest, ChannelWithUnknownConfigTagFails) {
    nlohmann::json record = {
        {"class", "FakeChannel"},
        {"config", {{"class", "FutureConfig"}, {"UUID", "x"}}},
        {"description", codec.encode(ChannelDescription())}
    };

    auto result = codec.decode(record);
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error().code, ErrorCode::DecodeError);
}
