#include "uvm/store/session.hpp"

#include "uvm/errors.hpp"
#include "uvm/logging.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QString>
#include <QUuid>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <stdexcept>
#include <string_view>

namespace uvm::store {

namespace {

constexpr std::string_view kSupportedLanguages[] = {"ja", "en", "zh", "ko"};
// Minimum size of a RIFF/WAVE header.
constexpr std::size_t kMinWavBytes = 44;
constexpr int kPromptFilenameChars = 20;

QString q(const std::string& value) {
    return QString::fromStdString(value);
}

std::string new_id() {
    return QUuid::createUuid().toString(QUuid::WithoutBraces).toStdString();
}

void check_session_id(const std::string& sessionId) {
    if (QUuid::fromString(q(sessionId)).isNull()) {
        throw SessionNotFoundError("session '" + sessionId + "' not found");
    }
}

std::string lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

QJsonObject segment_to_json(const RecordingSegment& segment) {
    QJsonObject obj;
    obj["id"] = q(segment.id);
    obj["prompt_index"] = segment.promptIndex;
    obj["prompt_text"] = q(segment.promptText);
    obj["audio_filename"] = q(segment.audioFilename);
    obj["duration_ms"] = segment.durationMs;
    obj["recorded_at"] = segment.recordedAt.toString(Qt::ISODateWithMs);
    obj["is_accepted"] = segment.isAccepted;
    obj["rejection_reason"] = segment.rejectionReason ? QJsonValue(q(*segment.rejectionReason)) : QJsonValue();
    return obj;
}

RecordingSegment segment_from_json(const QJsonObject& obj) {
    RecordingSegment segment;
    segment.id = obj["id"].toString().toStdString();
    segment.promptIndex = obj["prompt_index"].toInt();
    segment.promptText = obj["prompt_text"].toString().toStdString();
    segment.audioFilename = obj["audio_filename"].toString().toStdString();
    segment.durationMs = obj["duration_ms"].toDouble();
    segment.recordedAt = QDateTime::fromString(obj["recorded_at"].toString(), Qt::ISODateWithMs);
    segment.isAccepted = obj["is_accepted"].toBool(true);
    if (obj["rejection_reason"].isString()) {
        segment.rejectionReason = obj["rejection_reason"].toString().toStdString();
    }
    return segment;
}

std::string prompt_filename(int promptIndex, const std::string& promptText) {
    auto safe = q(promptText).left(kPromptFilenameChars);
    safe.replace(QLatin1Char(' '), QLatin1Char('_'))
        .replace(QLatin1Char('/'), QLatin1Char('_'))
        .replace(QLatin1Char('\\'), QLatin1Char('_'));
    return QStringLiteral("%1_%2.wav").arg(promptIndex, 4, 10, QLatin1Char('0')).arg(safe).toStdString();
}

}  // namespace

std::string to_string(SessionStatus status) {
    switch (status) {
        case SessionStatus::Pending: return "pending";
        case SessionStatus::Recording: return "recording";
        case SessionStatus::Processing: return "processing";
        case SessionStatus::Completed: return "completed";
        case SessionStatus::Cancelled: return "cancelled";
    }
    return "pending";
}

SessionStatus parse_session_status(const std::string& value) {
    if (value == "pending") return SessionStatus::Pending;
    if (value == "recording") return SessionStatus::Recording;
    if (value == "processing") return SessionStatus::Processing;
    if (value == "completed") return SessionStatus::Completed;
    if (value == "cancelled") return SessionStatus::Cancelled;
    throw std::invalid_argument("unknown session status: " + value);
}

std::size_t RecordingSession::accepted_count() const {
    return static_cast<std::size_t>(
        std::count_if(segments.begin(), segments.end(), [](const auto& s) { return s.isAccepted; }));
}

std::size_t RecordingSession::rejected_count() const {
    return segments.size() - accepted_count();
}

double RecordingSession::progress_percent() const {
    if (prompts.empty()) {
        return 0.0;
    }
    return static_cast<double>(accepted_count()) / static_cast<double>(prompts.size()) * 100.0;
}

bool RecordingSession::is_complete() const {
    return accepted_count() >= prompts.size();
}

std::string session_to_json(const RecordingSession& session) {
    QJsonArray prompts;
    for (const auto& prompt : session.prompts) {
        prompts.append(q(prompt));
    }
    QJsonArray segments;
    for (const auto& segment : session.segments) {
        segments.append(segment_to_json(segment));
    }

    QJsonObject obj;
    obj["id"] = q(session.id);
    obj["voicebank_id"] = q(session.voicebankId);
    obj["recording_style"] = q(engine::to_string(session.recordingStyle));
    obj["language"] = q(session.language);
    obj["status"] = q(to_string(session.status));
    obj["prompts"] = prompts;
    obj["segments"] = segments;
    obj["current_prompt_index"] = session.currentPromptIndex;
    obj["created_at"] = session.createdAt.toString(Qt::ISODateWithMs);
    obj["updated_at"] = session.updatedAt.toString(Qt::ISODateWithMs);
    return QJsonDocument(obj).toJson(QJsonDocument::Indented).toStdString();
}

RecordingSession session_from_json(const std::string& json) {
    QJsonParseError error;
    const auto doc = QJsonDocument::fromJson(QByteArray::fromStdString(json), &error);
    if (error.error != QJsonParseError::NoError || !doc.isObject()) {
        throw StoreError("malformed session document: " + error.errorString().toStdString());
    }
    const auto obj = doc.object();

    RecordingSession session;
    session.id = obj["id"].toString().toStdString();
    session.voicebankId = obj["voicebank_id"].toString().toStdString();
    session.language = obj["language"].toString().toStdString();
    try {
        session.recordingStyle = engine::parse_recording_style(obj["recording_style"].toString().toStdString());
        session.status = parse_session_status(obj["status"].toString().toStdString());
    } catch (const std::invalid_argument& e) {
        throw StoreError(std::string("malformed session document: ") + e.what());
    }
    for (const auto& prompt : obj["prompts"].toArray()) {
        session.prompts.push_back(prompt.toString().toStdString());
    }
    for (const auto& segment : obj["segments"].toArray()) {
        session.segments.push_back(segment_from_json(segment.toObject()));
    }
    session.currentPromptIndex = obj["current_prompt_index"].toInt();
    session.createdAt = QDateTime::fromString(obj["created_at"].toString(), Qt::ISODateWithMs);
    session.updatedAt = QDateTime::fromString(obj["updated_at"].toString(), Qt::ISODateWithMs);

    if (session.id.empty()) {
        throw StoreError("malformed session document: missing id");
    }
    return session;
}

SessionService::SessionService(DurableStore& store, std::size_t lockCapacity) : store_(store), locks_(lockCapacity) {}

std::string SessionService::session_key(const std::string& sessionId) {
    return "sessions/" + sessionId + "/session.json";
}

std::string SessionService::segment_key(const std::string& sessionId, const std::string& filename) {
    return "sessions/" + sessionId + "/segments/" + filename;
}

RecordingSession SessionService::load(const std::string& sessionId) const {
    check_session_id(sessionId);
    const auto json = store_.read(session_key(sessionId));
    if (!json) {
        throw SessionNotFoundError("session '" + sessionId + "' not found");
    }
    return session_from_json(*json);
}

void SessionService::save(RecordingSession& session) {
    session.updatedAt = QDateTime::currentDateTimeUtc();
    store_.write(session_key(session.id), session_to_json(session));
}

RecordingSession SessionService::create(const SessionCreate& request) {
    RecordingSession session;
    try {
        session.recordingStyle = engine::parse_recording_style(lower(request.recordingStyle));
    } catch (const std::invalid_argument&) {
        throw SessionValidationError("unsupported recording style: " + request.recordingStyle +
                                     " (supported: cv, vcv, cvvc, vccv, arpasing)");
    }

    session.language = lower(request.language);
    if (std::find(std::begin(kSupportedLanguages), std::end(kSupportedLanguages), session.language) ==
        std::end(kSupportedLanguages)) {
        throw SessionValidationError("unsupported language: " + request.language + " (supported: ja, en, zh, ko)");
    }
    if (request.prompts.empty()) {
        throw SessionValidationError("at least one prompt is required");
    }
    if (request.prompts.size() > kMaxPrompts) {
        throw SessionValidationError("at most " + std::to_string(kMaxPrompts) + " prompts per session");
    }

    session.id = new_id();
    session.voicebankId = request.voicebankId;
    session.prompts = request.prompts;
    session.createdAt = QDateTime::currentDateTimeUtc();

    const auto mutex = locks_.get(session.id);
    std::lock_guard guard(*mutex);
    save(session);
    qCInfo(lcUvmStore).noquote() << "created session" << q(session.id) << "with" << session.prompts.size()
                                 << "prompts";
    return session;
}

RecordingSession SessionService::get(const std::string& sessionId) const {
    return load(sessionId);
}

SessionProgress SessionService::progress(const std::string& sessionId) const {
    const auto session = load(sessionId);

    SessionProgress progress;
    progress.sessionId = session.id;
    progress.status = session.status;
    progress.totalPrompts = session.prompts.size();
    progress.completedSegments = session.accepted_count();
    progress.rejectedSegments = session.rejected_count();
    progress.progressPercent = session.progress_percent();
    progress.currentPromptIndex = session.currentPromptIndex;
    if (session.currentPromptIndex >= 0 &&
        static_cast<std::size_t>(session.currentPromptIndex) < session.prompts.size()) {
        progress.currentPromptText = session.prompts[static_cast<std::size_t>(session.currentPromptIndex)];
    }
    return progress;
}

std::vector<RecordingSession> SessionService::list() const {
    std::vector<RecordingSession> sessions;
    for (const auto& id : store_.list("sessions")) {
        const auto json = store_.read(session_key(id));
        if (!json) {
            continue;
        }
        try {
            sessions.push_back(session_from_json(*json));
        } catch (const StoreError& e) {
            qCWarning(lcUvmStore).noquote() << "skipping session" << q(id) << ":" << e.what();
        }
    }
    std::sort(sessions.begin(), sessions.end(),
              [](const auto& a, const auto& b) { return a.createdAt > b.createdAt; });
    return sessions;
}

RecordingSession SessionService::start_recording(const std::string& sessionId) {
    check_session_id(sessionId);
    const auto mutex = locks_.get(sessionId);
    std::lock_guard guard(*mutex);

    auto session = load(sessionId);
    if (session.status != SessionStatus::Pending && session.status != SessionStatus::Recording) {
        throw SessionStateError("cannot start recording: session is " + to_string(session.status));
    }
    session.status = SessionStatus::Recording;
    save(session);
    return session;
}

RecordingSegment SessionService::upload_segment(const std::string& sessionId,
                                                const SegmentUpload& upload,
                                                const std::string& audioBytes) {
    check_session_id(sessionId);
    const auto mutex = locks_.get(sessionId);
    std::lock_guard guard(*mutex);

    auto session = load(sessionId);
    if (session.status != SessionStatus::Pending && session.status != SessionStatus::Recording) {
        throw SessionStateError("cannot upload segment: session is " + to_string(session.status));
    }
    if (upload.promptIndex < 0 || static_cast<std::size_t>(upload.promptIndex) >= session.prompts.size()) {
        throw SessionValidationError("invalid prompt index: " + std::to_string(upload.promptIndex));
    }
    if (upload.durationMs < 0.0) {
        throw SessionValidationError("negative segment duration");
    }
    if (audioBytes.size() < kMinWavBytes) {
        throw SessionValidationError("invalid audio data: too small for WAV");
    }
    if (audioBytes.compare(0, 4, "RIFF") != 0 || audioBytes.compare(8, 4, "WAVE") != 0) {
        throw SessionValidationError("invalid audio data: not a WAV file");
    }

    RecordingSegment segment;
    segment.id = new_id();
    segment.promptIndex = upload.promptIndex;
    segment.promptText = upload.promptText;
    segment.audioFilename = prompt_filename(upload.promptIndex, upload.promptText);
    segment.durationMs = upload.durationMs;
    segment.recordedAt = QDateTime::currentDateTimeUtc();

    store_.write(segment_key(sessionId, segment.audioFilename), audioBytes);

    session.segments.push_back(segment);
    if (session.status == SessionStatus::Pending) {
        session.status = SessionStatus::Recording;
    }
    if (upload.promptIndex == session.currentPromptIndex) {
        ++session.currentPromptIndex;
    }
    if (session.is_complete()) {
        session.status = SessionStatus::Processing;
    }
    save(session);
    return segment;
}

RecordingSegment SessionService::reject_segment(const std::string& sessionId,
                                                const std::string& segmentId,
                                                const std::string& reason) {
    check_session_id(sessionId);
    const auto mutex = locks_.get(sessionId);
    std::lock_guard guard(*mutex);

    auto session = load(sessionId);
    const auto it = std::find_if(session.segments.begin(), session.segments.end(),
                                 [&](const auto& s) { return s.id == segmentId; });
    if (it == session.segments.end()) {
        throw SessionValidationError("segment '" + segmentId + "' not found");
    }

    it->isAccepted = false;
    it->rejectionReason = reason;
    if (session.status == SessionStatus::Processing) {
        session.status = SessionStatus::Recording;
    }
    const auto rejected = *it;
    save(session);
    return rejected;
}

RecordingSession SessionService::complete(const std::string& sessionId) {
    check_session_id(sessionId);
    const auto mutex = locks_.get(sessionId);
    std::lock_guard guard(*mutex);

    auto session = load(sessionId);
    if (session.status == SessionStatus::Cancelled) {
        throw SessionStateError("cannot complete a cancelled session");
    }
    if (session.status != SessionStatus::Completed) {
        session.status = SessionStatus::Completed;
        save(session);
    }
    return session;
}

RecordingSession SessionService::cancel(const std::string& sessionId) {
    check_session_id(sessionId);
    const auto mutex = locks_.get(sessionId);
    std::lock_guard guard(*mutex);

    auto session = load(sessionId);
    session.status = SessionStatus::Cancelled;
    save(session);
    return session;
}

void SessionService::remove(const std::string& sessionId) {
    check_session_id(sessionId);
    {
        const auto mutex = locks_.get(sessionId);
        std::lock_guard guard(*mutex);
        if (!store_.exists(session_key(sessionId))) {
            throw SessionNotFoundError("session '" + sessionId + "' not found");
        }
        store_.remove_prefix("sessions/" + sessionId);
    }
    locks_.discard(sessionId);
    qCInfo(lcUvmStore).noquote() << "removed session" << q(sessionId);
}

std::filesystem::path SessionService::segment_audio_path(const std::string& sessionId,
                                                         const std::string& filename) const {
    check_session_id(sessionId);
    const auto key = segment_key(sessionId, filename);
    if (!store_.exists(key)) {
        throw SessionNotFoundError("audio '" + filename + "' not found in session '" + sessionId + "'");
    }
    const auto path = store_.local_path(key);
    if (!path) {
        throw SessionNotFoundError("audio '" + filename + "' of session '" + sessionId + "' is not file-backed");
    }
    return *path;
}

}  // namespace uvm::store
