#pragma once

#include "fusion/transcript_types.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace speakerfusion {
namespace identity {

/**
 * Human-assigned identities for the speaker indices of one transcript.
 *
 * The registry never touches fused segments; renaming a speaker only changes
 * what resolve() returns. assign() and resolve() may be called from several
 * threads on the same instance.
 */
class IdentityRegistry {
public:
    /**
     * @param validSpeakers Speaker indices that appear in the transcript
     */
    explicit IdentityRegistry(std::set<uint32_t> validSpeakers);

    /**
     * Registry accepting exactly the attributed speakers of a transcript
     */
    static IdentityRegistry forTranscript(const fusion::DiarizedTranscript& transcript);

    /**
     * Set the profile of a speaker, replacing any previous one
     * @throws utils::UnknownSpeakerError if the index is not in the transcript
     */
    void assign(uint32_t speakerIndex,
                const std::string& displayName,
                const std::optional<std::string>& email = std::nullopt,
                const std::optional<std::string>& title = std::nullopt,
                const std::optional<std::string>& company = std::nullopt);

    /**
     * Bulk assignment from {"speakers": {"<index>": {"name", "email", "title", "company"}}}.
     * Every entry is validated before any is applied.
     * @return Number of profiles written
     * @throws utils::UnknownSpeakerError for an index not in the transcript
     * @throws std::invalid_argument for a malformed body
     */
    size_t assignFromJson(const std::string& body);

    /**
     * Profile for a speaker; never fails. Unassigned indices get "Speaker {index+1}".
     */
    fusion::SpeakerProfile resolve(uint32_t speakerIndex) const;

    bool remove(uint32_t speakerIndex);
    bool isAssigned(uint32_t speakerIndex) const;
    std::map<uint32_t, fusion::SpeakerProfile> profiles() const;
    const std::set<uint32_t>& validSpeakers() const { return validSpeakers_; }

    static std::string defaultDisplayName(uint32_t speakerIndex);

private:
    void checkKnown(uint32_t speakerIndex) const;

    const std::set<uint32_t> validSpeakers_;
    std::map<uint32_t, fusion::SpeakerProfile> profiles_;
    mutable std::mutex mutex_;
};

} // namespace identity
} // namespace speakerfusion
