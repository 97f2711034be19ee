#ifndef DEVMUX_CORE_CAPABILITY_H
#define DEVMUX_CORE_CAPABILITY_H

#include <array>
#include <functional>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace devmux {
namespace core {

using CapabilityTag = std::string;
using CapabilityList = std::vector<CapabilityTag>;

/**
 * @brief Query suffix that turns a tag into a substring match.
 *
 * "Launcher.App.Any" matches any registered tag containing "Launcher.App".
 */
constexpr const char* kWildcardSuffix = ".Any";

/**
 * @brief Well-known capability tags.
 */
namespace capabilities {
constexpr const char* kLauncherApp = "Launcher.App";
constexpr const char* kLauncherAppParams = "Launcher.App.Params";
constexpr const char* kLauncherAppClose = "Launcher.App.Close";
constexpr const char* kLauncherBrowser = "Launcher.Browser";
constexpr const char* kLauncherYouTube = "Launcher.YouTube";
constexpr const char* kExternalInputPickerLaunch = "ExternalInputControl.Picker.Launch";
constexpr const char* kExternalInputPickerClose = "ExternalInputControl.Picker.Close";
constexpr const char* kMediaPlayerDisplayImage = "MediaPlayer.Display.Image";
constexpr const char* kMediaPlayerPlayVideo = "MediaPlayer.Play.Video";
constexpr const char* kMediaPlayerPlayAudio = "MediaPlayer.Play.Audio";
constexpr const char* kMediaPlayerClose = "MediaPlayer.Close";
constexpr const char* kMediaControlPlay = "MediaControl.Play";
constexpr const char* kMediaControlPause = "MediaControl.Pause";
constexpr const char* kMediaControlStop = "MediaControl.Stop";
constexpr const char* kMediaControlSeek = "MediaControl.Seek";
constexpr const char* kVolumeControlVolumeGet = "VolumeControl.Get";
constexpr const char* kVolumeControlVolumeSet = "VolumeControl.Set";
constexpr const char* kVolumeControlMuteSet = "VolumeControl.Mute.Set";
constexpr const char* kTVControlChannelUp = "TVControl.Channel.Up";
constexpr const char* kTVControlChannelDown = "TVControl.Channel.Down";
constexpr const char* kKeyControlHome = "KeyControl.Home";
constexpr const char* kTextInputControlSend = "TextInputControl.Send";
constexpr const char* kMouseControlMove = "MouseControl.Move";
constexpr const char* kPowerControlOff = "PowerControl.Off";
constexpr const char* kToastControlShow = "ToastControl.Show";
constexpr const char* kWebAppLauncherLaunch = "WebAppLauncher.Launch";
constexpr const char* kWebAppLauncherClose = "WebAppLauncher.Close";
} // namespace capabilities

/**
 * @brief Named groups of related capabilities, each resolved to a single channel.
 */
enum class CapabilityFamily {
    Launcher,
    ExternalInputControl,
    MediaPlayer,
    MediaControl,
    VolumeControl,
    TVControl,
    KeyControl,
    TextInputControl,
    MouseControl,
    PowerControl,
    ToastControl,
    WebAppLauncher
};

constexpr std::array<CapabilityFamily, 12> kAllCapabilityFamilies = {
    CapabilityFamily::Launcher,
    CapabilityFamily::ExternalInputControl,
    CapabilityFamily::MediaPlayer,
    CapabilityFamily::MediaControl,
    CapabilityFamily::VolumeControl,
    CapabilityFamily::TVControl,
    CapabilityFamily::KeyControl,
    CapabilityFamily::TextInputControl,
    CapabilityFamily::MouseControl,
    CapabilityFamily::PowerControl,
    CapabilityFamily::ToastControl,
    CapabilityFamily::WebAppLauncher
};

/**
 * @brief Tag prefix shared by every capability of a family, e.g. "MediaControl".
 */
const char* familyName(CapabilityFamily family);

/**
 * @brief Wildcard query matching any capability of a family, e.g. "MediaControl.Any".
 */
std::string familyQuery(CapabilityFamily family);

/**
 * @brief Standard priority levels a channel may declare for a family.
 *
 * Any int is accepted; higher wins.
 */
struct CapabilityPriority {
    static constexpr int VeryLow = 1;
    static constexpr int Low = 25;
    static constexpr int Normal = 50;
    static constexpr int High = 75;
    static constexpr int VeryHigh = 100;
};

/**
 * @brief Mutable set of capability tags advertised by one channel.
 *
 * Tags are unique and unordered. Every mutation that changes the set emits
 * exactly one change notification listing only the tags that were actually
 * inserted or erased; mutations that change nothing are silent.
 *
 * Thread-safe. The change callback runs on the mutating thread after the
 * internal lock has been released.
 */
class CapabilityRegistry {
public:
    using ChangeCallback = std::function<void(const CapabilityList& added,
                                              const CapabilityList& removed)>;

    CapabilityRegistry() = default;
    explicit CapabilityRegistry(ChangeCallback callback);

    // Non-copyable
    CapabilityRegistry(const CapabilityRegistry&) = delete;
    CapabilityRegistry& operator=(const CapabilityRegistry&) = delete;

    /**
     * @brief Installs the callback receiving change deltas, replacing any previous one.
     */
    void setChangeCallback(ChangeCallback callback);

    /**
     * @brief Adds a single tag. Empty, blank and already present tags are ignored.
     * @return true if the tag was inserted
     */
    bool add(const CapabilityTag& tag);

    /**
     * @brief Adds several tags and emits one notification for those newly inserted.
     * @return The tags that were inserted, in input order
     */
    CapabilityList addAll(const CapabilityList& tags);

    /**
     * @brief Removes a tag.
     * @return true if the tag was present
     */
    bool remove(const CapabilityTag& tag);

    /**
     * @brief Removes several tags and emits one notification for those actually erased.
     * @return The tags that were erased, in input order
     */
    CapabilityList removeAll(const CapabilityList& tags);

    /**
     * @brief Snapshot of every registered tag.
     */
    std::set<CapabilityTag> all() const;

    /**
     * @brief Tests a plain or wildcard query.
     */
    bool has(const std::string& query) const;

    /**
     * @brief True iff every query matches. Stops at the first miss.
     */
    bool hasAll(const std::vector<std::string>& queries) const;

    /**
     * @brief True iff at least one query matches. Stops at the first hit.
     */
    bool hasAny(const std::vector<std::string>& queries) const;

    bool empty() const;
    size_t size() const;

    /**
     * @brief Query semantics shared with the aggregate capability union.
     *
     * A query containing kWildcardSuffix is cut at the suffix and matches when
     * any tag contains the remaining prefix as a substring. Any other query is
     * an exact match.
     */
    static bool matches(const std::set<CapabilityTag>& tags, const std::string& query);

private:
    void notify(const CapabilityList& added, const CapabilityList& removed);

    mutable std::mutex mutex_;
    std::set<CapabilityTag> tags_;
    ChangeCallback callback_;
};

} // namespace core
} // namespace devmux

#endif // DEVMUX_CORE_CAPABILITY_H
