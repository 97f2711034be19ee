#include "devmux/core/capability.h"
#include <algorithm>
#include <cctype>

namespace devmux {
namespace core {

namespace {
bool isBlank(const std::string& tag) {
    return std::all_of(tag.begin(), tag.end(), [](unsigned char c) {
        return std::isspace(c) != 0;
    });
}
} // anonymous namespace

const char* familyName(CapabilityFamily family) {
    switch (family) {
        case CapabilityFamily::Launcher: return "Launcher";
        case CapabilityFamily::ExternalInputControl: return "ExternalInputControl";
        case CapabilityFamily::MediaPlayer: return "MediaPlayer";
        case CapabilityFamily::MediaControl: return "MediaControl";
        case CapabilityFamily::VolumeControl: return "VolumeControl";
        case CapabilityFamily::TVControl: return "TVControl";
        case CapabilityFamily::KeyControl: return "KeyControl";
        case CapabilityFamily::TextInputControl: return "TextInputControl";
        case CapabilityFamily::MouseControl: return "MouseControl";
        case CapabilityFamily::PowerControl: return "PowerControl";
        case CapabilityFamily::ToastControl: return "ToastControl";
        case CapabilityFamily::WebAppLauncher: return "WebAppLauncher";
        default: return "Unknown";
    }
}

std::string familyQuery(CapabilityFamily family) {
    return std::string(familyName(family)) + kWildcardSuffix;
}

CapabilityRegistry::CapabilityRegistry(ChangeCallback callback)
    : callback_(std::move(callback)) {}

void CapabilityRegistry::setChangeCallback(ChangeCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    callback_ = std::move(callback);
}

bool CapabilityRegistry::add(const CapabilityTag& tag) {
    return !addAll({tag}).empty();
}

CapabilityList CapabilityRegistry::addAll(const CapabilityList& tags) {
    CapabilityList added;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& tag : tags) {
            if (tag.empty() || isBlank(tag)) {
                continue;
            }
            if (tags_.insert(tag).second) {
                added.push_back(tag);
            }
        }
    }

    if (!added.empty()) {
        notify(added, {});
    }
    return added;
}

bool CapabilityRegistry::remove(const CapabilityTag& tag) {
    return !removeAll({tag}).empty();
}

CapabilityList CapabilityRegistry::removeAll(const CapabilityList& tags) {
    CapabilityList removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& tag : tags) {
            if (tags_.erase(tag) > 0) {
                removed.push_back(tag);
            }
        }
    }

    if (!removed.empty()) {
        notify({}, removed);
    }
    return removed;
}

std::set<CapabilityTag> CapabilityRegistry::all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tags_;
}

bool CapabilityRegistry::has(const std::string& query) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return matches(tags_, query);
}

bool CapabilityRegistry::hasAll(const std::vector<std::string>& queries) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::all_of(queries.begin(), queries.end(), [this](const std::string& query) {
        return matches(tags_, query);
    });
}

bool CapabilityRegistry::hasAny(const std::vector<std::string>& queries) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(queries.begin(), queries.end(), [this](const std::string& query) {
        return matches(tags_, query);
    });
}

bool CapabilityRegistry::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tags_.empty();
}

size_t CapabilityRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tags_.size();
}

bool CapabilityRegistry::matches(const std::set<CapabilityTag>& tags, const std::string& query) {
    auto wildcard = query.find(kWildcardSuffix);
    if (wildcard == std::string::npos) {
        return tags.count(query) > 0;
    }

    const std::string prefix = query.substr(0, wildcard);
    return std::any_of(tags.begin(), tags.end(), [&prefix](const CapabilityTag& tag) {
        return tag.find(prefix) != std::string::npos;
    });
}

void CapabilityRegistry::notify(const CapabilityList& added, const CapabilityList& removed) {
    ChangeCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = callback_;
    }
    if (callback) {
        callback(added, removed);
    }
}

} // namespace core
} // namespace devmux
