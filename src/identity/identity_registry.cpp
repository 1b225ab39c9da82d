#include "identity/identity_registry.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cstdint>
#include <stdexcept>
#include <utility>
#include <vector>

namespace speakerfusion {
namespace identity {

namespace {

std::optional<std::string> optionalField(const nlohmann::json& entry, const char* key) {
    if (!entry.contains(key) || entry[key].is_null()) {
        return std::nullopt;
    }
    return entry[key].get<std::string>();
}

uint32_t parseSpeakerKey(const std::string& key) {
    // stoul alone would accept leading whitespace and a sign
    if (key.empty() || !std::isdigit(static_cast<unsigned char>(key[0]))) {
        throw std::invalid_argument("Speaker key is not an index: " + key);
    }
    size_t consumed = 0;
    unsigned long value = 0;
    try {
        value = std::stoul(key, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("Speaker key is not an index: " + key);
    }
    if (consumed != key.size() || value > UINT32_MAX) {
        throw std::invalid_argument("Speaker key is not an index: " + key);
    }
    return static_cast<uint32_t>(value);
}

} // namespace

IdentityRegistry::IdentityRegistry(std::set<uint32_t> validSpeakers)
    : validSpeakers_(std::move(validSpeakers)) {
}

IdentityRegistry IdentityRegistry::forTranscript(const fusion::DiarizedTranscript& transcript) {
    std::set<uint32_t> speakers;
    for (const auto& segment : transcript.segments) {
        if (segment.speaker_index) {
            speakers.insert(*segment.speaker_index);
        }
    }
    return IdentityRegistry(std::move(speakers));
}

void IdentityRegistry::assign(uint32_t speakerIndex,
                              const std::string& displayName,
                              const std::optional<std::string>& email,
                              const std::optional<std::string>& title,
                              const std::optional<std::string>& company) {
    checkKnown(speakerIndex);

    fusion::SpeakerProfile profile(speakerIndex, displayName);
    profile.email = email;
    profile.title = title;
    profile.company = company;

    std::lock_guard<std::mutex> lock(mutex_);
    profiles_[speakerIndex] = std::move(profile);
}

size_t IdentityRegistry::assignFromJson(const std::string& body) {
    std::vector<fusion::SpeakerProfile> pending;

    try {
        nlohmann::json j = nlohmann::json::parse(body);
        if (!j.is_object() || !j.contains("speakers") || !j["speakers"].is_object()) {
            throw std::invalid_argument("Identity body must contain a \"speakers\" object");
        }

        for (const auto& [key, entry] : j["speakers"].items()) {
            uint32_t speakerIndex = parseSpeakerKey(key);
            checkKnown(speakerIndex);

            if (!entry.is_object() || !entry.contains("name") || !entry["name"].is_string()) {
                throw std::invalid_argument("Speaker " + key + " needs a string \"name\"");
            }

            fusion::SpeakerProfile profile(speakerIndex, entry["name"].get<std::string>());
            profile.email = optionalField(entry, "email");
            profile.title = optionalField(entry, "title");
            profile.company = optionalField(entry, "company");
            pending.push_back(std::move(profile));
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument(std::string("Malformed identity body: ") + e.what());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& profile : pending) {
        profiles_[profile.speaker_index] = std::move(profile);
    }

    utils::Logger::info("Identified " + std::to_string(pending.size()) + " speakers");
    return pending.size();
}

fusion::SpeakerProfile IdentityRegistry::resolve(uint32_t speakerIndex) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = profiles_.find(speakerIndex);
    if (it != profiles_.end()) {
        return it->second;
    }
    return fusion::SpeakerProfile(speakerIndex, defaultDisplayName(speakerIndex));
}

bool IdentityRegistry::remove(uint32_t speakerIndex) {
    std::lock_guard<std::mutex> lock(mutex_);
    return profiles_.erase(speakerIndex) > 0;
}

bool IdentityRegistry::isAssigned(uint32_t speakerIndex) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return profiles_.count(speakerIndex) > 0;
}

std::map<uint32_t, fusion::SpeakerProfile> IdentityRegistry::profiles() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return profiles_;
}

std::string IdentityRegistry::defaultDisplayName(uint32_t speakerIndex) {
    return "Speaker " + std::to_string(static_cast<uint64_t>(speakerIndex) + 1);
}

void IdentityRegistry::checkKnown(uint32_t speakerIndex) const {
    if (validSpeakers_.count(speakerIndex) == 0) {
        throw utils::UnknownSpeakerError(speakerIndex);
    }
}

} // namespace identity
} // namespace speakerfusion
