#pragma once

#include <mutex>
#include <string>
#include <vector>

namespace voice_relay {

enum class TranscriptRole {
    User,
    Assistant
};

const char* transcript_role_name(TranscriptRole role);

struct TranscriptEntry {
    TranscriptRole role;
    std::string content;
};

/**
 * @brief Append-only conversation log of one session
 *
 * Written by the receiver thread, read through snapshots from any thread.
 */
class Transcript {
public:
    void append_user(const std::string& content);
    void append_assistant(const std::string& content);

    std::vector<TranscriptEntry> snapshot() const;
    size_t size() const;

private:
    void append(TranscriptRole role, const std::string& content);

    mutable std::mutex mutex_;
    std::vector<TranscriptEntry> entries_;
};

} // namespace voice_relay
