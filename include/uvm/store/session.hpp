#pragma once

#include "uvm/engine/types.hpp"
#include "uvm/store/lock_map.hpp"
#include "uvm/store/store.hpp"

#include <QDateTime>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace uvm::store {

enum class SessionStatus {
    Pending,
    Recording,
    Processing,
    Completed,
    Cancelled,
};

std::string to_string(SessionStatus status);
SessionStatus parse_session_status(const std::string& value);

struct RecordingSegment {
    std::string id;
    int promptIndex = 0;
    std::string promptText;
    std::string audioFilename;
    double durationMs = 0.0;
    QDateTime recordedAt;
    bool isAccepted = true;
    std::optional<std::string> rejectionReason;
};

struct RecordingSession {
    std::string id;
    std::string voicebankId;
    engine::RecordingStyle recordingStyle = engine::RecordingStyle::Cv;
    std::string language = "ja";
    SessionStatus status = SessionStatus::Pending;
    std::vector<std::string> prompts;
    std::vector<RecordingSegment> segments;
    int currentPromptIndex = 0;
    QDateTime createdAt;
    QDateTime updatedAt;

    [[nodiscard]] std::size_t accepted_count() const;
    [[nodiscard]] std::size_t rejected_count() const;
    [[nodiscard]] double progress_percent() const;
    [[nodiscard]] bool is_complete() const;
};

struct SessionProgress {
    std::string sessionId;
    SessionStatus status = SessionStatus::Pending;
    std::size_t totalPrompts = 0;
    std::size_t completedSegments = 0;
    std::size_t rejectedSegments = 0;
    double progressPercent = 0.0;
    int currentPromptIndex = 0;
    std::optional<std::string> currentPromptText;
};

struct SessionCreate {
    std::string voicebankId;
    std::string recordingStyle = "cv";
    std::string language = "ja";
    std::vector<std::string> prompts;
};

struct SegmentUpload {
    int promptIndex = 0;
    std::string promptText;
    double durationMs = 0.0;
};

std::string session_to_json(const RecordingSession& session);
// Throws StoreError on malformed documents.
RecordingSession session_from_json(const std::string& json);

// Guided recording sessions. Every mutation runs under the session's lock.
class SessionService {
public:
    static constexpr std::size_t kMaxPrompts = 10000;

    explicit SessionService(DurableStore& store, std::size_t lockCapacity = BoundedLockMap::kDefaultMaxSize);

    static std::string session_key(const std::string& sessionId);
    static std::string segment_key(const std::string& sessionId, const std::string& filename);

    // Throws SessionValidationError for unsupported style, language or prompt count.
    RecordingSession create(const SessionCreate& request);

    // Throws SessionNotFoundError.
    [[nodiscard]] RecordingSession get(const std::string& sessionId) const;
    [[nodiscard]] SessionProgress progress(const std::string& sessionId) const;
    [[nodiscard]] std::vector<RecordingSession> list() const;

    RecordingSession start_recording(const std::string& sessionId);

    // Stores the WAV bytes as "NNNN_prompt.wav" and records the segment.
    // Throws SessionStateError or SessionValidationError.
    RecordingSegment upload_segment(const std::string& sessionId,
                                    const SegmentUpload& upload,
                                    const std::string& audioBytes);

    RecordingSegment reject_segment(const std::string& sessionId,
                                    const std::string& segmentId,
                                    const std::string& reason);

    RecordingSession complete(const std::string& sessionId);
    RecordingSession cancel(const std::string& sessionId);

    // Removes the session and its audio, then its lock.
    void remove(const std::string& sessionId);

    // Throws SessionNotFoundError if the audio is missing or not file-backed.
    [[nodiscard]] std::filesystem::path segment_audio_path(const std::string& sessionId,
                                                           const std::string& filename) const;

    [[nodiscard]] const BoundedLockMap& locks() const { return locks_; }

private:
    [[nodiscard]] RecordingSession load(const std::string& sessionId) const;
    void save(RecordingSession& session);

    DurableStore& store_;
    BoundedLockMap locks_;
};

}  // namespace uvm::store
