#include "transcript.h"

namespace voice_relay {

const char* transcript_role_name(TranscriptRole role) {
    return role == TranscriptRole::User ? "user" : "assistant";
}

void Transcript::append_user(const std::string& content) {
    append(TranscriptRole::User, content);
}

void Transcript::append_assistant(const std::string& content) {
    append(TranscriptRole::Assistant, content);
}

void Transcript::append(TranscriptRole role, const std::string& content) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back({role, content});
}

std::vector<TranscriptEntry> Transcript::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

size_t Transcript::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace voice_relay
