#pragma once

#include "devmux/core/error.h"
#include <nlohmann/json.hpp>
#include <functional>
#include <memory>
#include <string>

namespace devmux {
namespace core {

class DeviceChannel;

using SuccessCallback = std::function<void()>;
using FailureCallback = std::function<void(const Error&)>;

/**
 * @brief What a launch session refers to, and so which family can close it.
 */
enum class SessionKind {
    Unknown,
    App,
    Media,
    ExternalInputPicker,
    WebApp
};

const char* sessionKindToString(SessionKind kind);

/**
 * @brief Handle to something a channel started on the device (an app, a media
 * playback, an input picker, a web app).
 *
 * The channel reference is weak: a session outliving its channel becomes
 * uncloseable rather than keeping the channel alive.
 */
struct LaunchSession {
    std::string id;
    std::string name;
    SessionKind kind{SessionKind::Unknown};
    nlohmann::json rawData;
    std::weak_ptr<DeviceChannel> channel;
};

/**
 * @brief Closing hooks a channel implements for the session kinds it understands.
 */
class AppCloser {
public:
    virtual ~AppCloser() = default;
    virtual void closeApp(const LaunchSession& session,
                          SuccessCallback onSuccess, FailureCallback onFailure) = 0;
};

class MediaCloser {
public:
    virtual ~MediaCloser() = default;
    virtual void closeMedia(const LaunchSession& session,
                            SuccessCallback onSuccess, FailureCallback onFailure) = 0;
};

class InputPickerCloser {
public:
    virtual ~InputPickerCloser() = default;
    virtual void closeInputPicker(const LaunchSession& session,
                                  SuccessCallback onSuccess, FailureCallback onFailure) = 0;
};

class WebAppCloser {
public:
    virtual ~WebAppCloser() = default;
    virtual void closeWebApp(const LaunchSession& session,
                             SuccessCallback onSuccess, FailureCallback onFailure) = 0;
};

} // namespace core
} // namespace devmux
