/*
 * ShadowVeil - Privacy Enforcement Core
 * Copyright (C) 2026 ShadowVeil Project
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
/**
 * ============================================================================
 * ShadowVeil - DOWNLOAD QUARANTINE GATE IMPLEMENTATION
 * ============================================================================
 *
 * @file DownloadQuarantineGate.cpp
 *
 * Locking:
 *   m_stateMutex          initialization state, source, quarantine directory;
 *                         held while a new slot is published
 *   m_mapMutex            id -> slot map (shared for lookups)
 *   DownloadSlot::opMutex serializes transitions of one download, held
 *                         across file system work
 *   DownloadSlot::dataMutex guards the record for snapshots
 *   m_callbackMutex       callback table; callbacks run without any lock
 * ============================================================================
 */

#include "pch.h"
#include "DownloadQuarantineGate.hpp"
#include "../Utils/CryptoUtils.hpp"
#include "../Utils/FileUtils.hpp"
#include "../Utils/HashUtils.hpp"
#include "../Utils/StringUtils.hpp"

#include <algorithm>
#include <cerrno>
#include <atomic>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>

namespace ShadowVeil {
namespace WebProtection {

using namespace Utils;
namespace fs = std::filesystem;

// ============================================================================
// LOGGING MACROS
// ============================================================================

#define QG_LOG_DEBUG(fmt, ...)   SV_LOG_DEBUG("Quarantine", fmt, ##__VA_ARGS__)
#define QG_LOG_INFO(fmt, ...)    SV_LOG_INFO("Quarantine", fmt, ##__VA_ARGS__)
#define QG_LOG_WARN(fmt, ...)    SV_LOG_WARN("Quarantine", fmt, ##__VA_ARGS__)
#define QG_LOG_ERROR(fmt, ...)   SV_LOG_ERROR("Quarantine", fmt, ##__VA_ARGS__)

namespace {

int HexValue(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string PercentDecode(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            const int hi = HexValue(s[i + 1]);
            const int lo = HexValue(s[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        out.push_back(s[i]);
    }
    return out;
}

/**
 * @brief Last path segment of a URI, query and fragment removed, percent-decoded.
 */
std::string LastPathSegment(std::string_view uri) {
    uri = uri.substr(0, uri.find_first_of("?#"));

    if (const size_t scheme = uri.find("://"); scheme != std::string_view::npos) {
        const size_t pathStart = uri.find('/', scheme + 3);
        if (pathStart == std::string_view::npos) {
            return {};
        }
        uri.remove_prefix(pathStart);
    }

    const size_t slash = uri.rfind('/');
    const std::string_view segment = (slash == std::string_view::npos) ? uri : uri.substr(slash + 1);
    return PercentDecode(segment);
}

}  // namespace

bool QuarantineGateConfiguration::IsValid() const noexcept {
    for (const auto& type : allowedContentTypes) {
        if (type.empty()) {
            return false;
        }
    }
    for (const auto& ext : blockedExtensions) {
        if (ext.size() < 2 || ext.front() != '.') {
            return false;
        }
    }
    return true;
}

// ============================================================================
// IMPLEMENTATION CLASS
// ============================================================================

class DownloadQuarantineGateImpl {
public:
    enum class CallbackKind : uint8_t {
        Completed,
        Promoted,
        Deleted
    };

    struct DownloadSlot {
        std::mutex opMutex;
        mutable std::mutex dataMutex;
        DownloadRecord record;
        std::chrono::steady_clock::time_point startedSteady;
    };

    DownloadQuarantineGateImpl(QuarantineGateConfiguration config,
                               std::shared_ptr<IContentMarker> marker,
                               std::shared_ptr<Privacy::SecureDeletionWorker> wiper);

    bool Initialize(std::shared_ptr<IDownloadEventSource> source,
                    const fs::path& quarantineDir,
                    IDownloadEventSink* sink);
    void Detach(IDownloadEventSink* sink);
    void Shutdown(IDownloadEventSink* sink);
    bool IsInitialized() const;

    StartDecision OnDownloadStarting(const DownloadStartingEvent& event);
    void OnDownloadStateChanged(const std::string& id, TransferState state);

    bool Promote(const std::string& id, const fs::path& destination, DownloadRecord& out, DownloadError* err);
    bool Delete(const std::string& id);

    std::vector<DownloadRecord> GetActiveDownloads() const;
    std::optional<DownloadRecord> GetDownload(const std::string& id) const;
    DownloadMetrics GetMetrics() const;
    fs::path GetQuarantineDirectory() const;

    uint64_t RegisterCallback(CallbackKind kind, DownloadCallback callback);
    bool UnregisterCallback(uint64_t callbackId);

    QuarantineGateConfiguration m_config;

private:
    std::shared_ptr<DownloadSlot> FindSlot(const std::string& id) const;
    static DownloadRecord Snapshot(const DownloadSlot& slot);
    static bool TransitionLocked(DownloadSlot& slot, DownloadStatus to);

    bool IsAllowedContentType(std::string_view mime) const;
    bool IsBlockedExtension(std::string_view fileName) const;

    void CompleteLocked(DownloadSlot& slot);
    void MarkLocked(const DownloadRecord& record);
    void FailLocked(DownloadSlot& slot, const char* reason);
    bool DeleteLocked(DownloadSlot& slot);
    void RemoveQuietly(const fs::path& path);

    void Notify(CallbackKind kind, const DownloadRecord& record);

    std::shared_ptr<IContentMarker> m_marker;
    std::shared_ptr<Privacy::SecureDeletionWorker> m_wiper;
    CryptoUtils::SecureRandom m_rng;

    mutable std::mutex m_stateMutex;
    bool m_initialized = false;
    bool m_shutDown = false;
    bool m_detached = false;
    std::shared_ptr<IDownloadEventSource> m_source;
    fs::path m_quarantineDir;

    mutable std::shared_mutex m_mapMutex;
    std::unordered_map<std::string, std::shared_ptr<DownloadSlot>> m_downloads;

    std::mutex m_callbackMutex;
    std::map<uint64_t, std::pair<CallbackKind, DownloadCallback>> m_callbacks;
    uint64_t m_nextCallbackId = 1;

    std::atomic<uint64_t> m_total{0};
    std::atomic<uint64_t> m_quarantined{0};
    std::atomic<uint64_t> m_promoted{0};
    std::atomic<uint64_t> m_deleted{0};
    std::atomic<uint64_t> m_blocked{0};
    std::atomic<uint64_t> m_failed{0};
    std::atomic<uint64_t> m_totalBytes{0};
    std::atomic<uint64_t> m_transferUsTotal{0};
};

DownloadQuarantineGateImpl::DownloadQuarantineGateImpl(
    QuarantineGateConfiguration config,
    std::shared_ptr<IContentMarker> marker,
    std::shared_ptr<Privacy::SecureDeletionWorker> wiper)
    : m_config(std::move(config))
    , m_marker(std::move(marker))
    , m_wiper(std::move(wiper)) {

    if (!m_config.IsValid()) {
        QG_LOG_WARN("Invalid configuration, falling back to defaults");
        m_config = QuarantineGateConfiguration{};
    }
    for (auto& ext : m_config.blockedExtensions) {
        StringUtils::ToLowerAsciiInPlace(ext);
    }
    if (!m_marker) {
        m_marker = CreateDefaultContentMarker();
    }
    if (!m_wiper) {
        m_wiper = std::make_shared<Privacy::SecureDeletionWorker>();
    }
}

// ----------------------------------------------------------------------------
// Lifecycle
// ----------------------------------------------------------------------------

bool DownloadQuarantineGateImpl::Initialize(std::shared_ptr<IDownloadEventSource> source,
                                            const fs::path& quarantineDir,
                                            IDownloadEventSink* sink) {
    if (!source || quarantineDir.empty()) {
        QG_LOG_ERROR("Initialize requires an event source and a quarantine directory");
        return false;
    }

    {
        std::lock_guard lock(m_stateMutex);
        if (m_initialized || m_shutDown) {
            QG_LOG_WARN("Initialize ignored: gate already %s", m_shutDown ? "shut down" : "initialized");
            return false;
        }

        FileUtils::Error ferr;
        if (!FileUtils::CreateDirectories(quarantineDir, &ferr)) {
            QG_LOG_ERROR("Cannot create quarantine directory %s: %s",
                         quarantineDir.c_str(), ferr.message.c_str());
            return false;
        }

        std::error_code ec;
        fs::path absolute = fs::absolute(quarantineDir, ec);
        m_quarantineDir = (ec ? quarantineDir : absolute).lexically_normal();
        m_source = source;
        m_initialized = true;
    }

    source->Subscribe(sink);
    QG_LOG_INFO("Quarantine gate initialized at %s", quarantineDir.c_str());
    return true;
}

bool DownloadQuarantineGateImpl::IsInitialized() const {
    std::lock_guard lock(m_stateMutex);
    return m_initialized && !m_shutDown;
}

void DownloadQuarantineGateImpl::Detach(IDownloadEventSink* sink) {
    std::shared_ptr<IDownloadEventSource> source;
    {
        std::lock_guard lock(m_stateMutex);
        if (m_shutDown || m_detached) {
            return;
        }
        m_detached = true;
        source = std::move(m_source);
    }

    if (source) {
        source->Unsubscribe(sink);
    }
    QG_LOG_DEBUG("Quarantine gate detached from its event source");
}

void DownloadQuarantineGateImpl::Shutdown(IDownloadEventSink* sink) {
    std::shared_ptr<IDownloadEventSource> source;
    {
        std::lock_guard lock(m_stateMutex);
        if (m_shutDown) {
            return;
        }
        m_shutDown = true;
        source = std::move(m_source);
    }

    if (source) {
        source->Unsubscribe(sink);
    }

    std::vector<std::shared_ptr<DownloadSlot>> slots;
    {
        std::shared_lock lock(m_mapMutex);
        slots.reserve(m_downloads.size());
        for (const auto& [id, slot] : m_downloads) {
            slots.push_back(slot);
        }
    }

    size_t purged = 0;
    for (const auto& slot : slots) {
        std::lock_guard op(slot->opMutex);
        const DownloadStatus status = Snapshot(*slot).status;
        if (status == DownloadStatus::Quarantined) {
            if (DeleteLocked(*slot)) {
                ++purged;
            }
        }
        else if (status == DownloadStatus::Pending || status == DownloadStatus::InProgress) {
            FailLocked(*slot, "gate shut down");
            ++purged;
        }
    }

    if (!slots.empty()) {
        QG_LOG_INFO("Quarantine gate shut down, %zu undecided download(s) purged", purged);
    }
}

// ----------------------------------------------------------------------------
// Helpers
// ----------------------------------------------------------------------------

std::shared_ptr<DownloadQuarantineGateImpl::DownloadSlot>
DownloadQuarantineGateImpl::FindSlot(const std::string& id) const {
    std::shared_lock lock(m_mapMutex);
    const auto it = m_downloads.find(id);
    return it == m_downloads.end() ? nullptr : it->second;
}

DownloadRecord DownloadQuarantineGateImpl::Snapshot(const DownloadSlot& slot) {
    std::lock_guard lock(slot.dataMutex);
    return slot.record;
}

bool DownloadQuarantineGateImpl::TransitionLocked(DownloadSlot& slot, DownloadStatus to) {
    std::lock_guard lock(slot.dataMutex);
    const DownloadStatus from = slot.record.status;
    if (!IsValidTransition(from, to)) {
        QG_LOG_WARN("Download %s: transition %s -> %s rejected", slot.record.id.c_str(),
                    std::string(GetDownloadStatusName(from)).c_str(),
                    std::string(GetDownloadStatusName(to)).c_str());
        return false;
    }
    slot.record.status = to;
    return true;
}

bool DownloadQuarantineGateImpl::IsAllowedContentType(std::string_view mime) const {
    return std::any_of(m_config.allowedContentTypes.begin(), m_config.allowedContentTypes.end(),
                       [mime](const std::string& allowed) {
                           return StringUtils::StartsWithIgnoreCase(mime, allowed);
                       });
}

bool DownloadQuarantineGateImpl::IsBlockedExtension(std::string_view fileName) const {
    const std::string ext = StringUtils::ToLowerAscii(fs::path(std::string(fileName)).extension().string());
    if (ext.empty()) {
        return false;
    }
    return std::find(m_config.blockedExtensions.begin(), m_config.blockedExtensions.end(), ext) !=
           m_config.blockedExtensions.end();
}

void DownloadQuarantineGateImpl::RemoveQuietly(const fs::path& path) {
    FileUtils::Error ferr;
    if (!FileUtils::RemoveFile(path, &ferr)) {
        QG_LOG_WARN("Cannot remove %s: %s", path.c_str(), ferr.message.c_str());
    }
}

void DownloadQuarantineGateImpl::Notify(CallbackKind kind, const DownloadRecord& record) {
    std::vector<DownloadCallback> targets;
    {
        std::lock_guard lock(m_callbackMutex);
        for (const auto& [id, entry] : m_callbacks) {
            if (entry.first == kind) {
                targets.push_back(entry.second);
            }
        }
    }
    for (const auto& cb : targets) {
        try {
            cb(record);
        }
        catch (const std::exception& ex) {
            QG_LOG_WARN("Download callback threw: %s", ex.what());
        }
    }
}

// ----------------------------------------------------------------------------
// Event sink
// ----------------------------------------------------------------------------

StartDecision DownloadQuarantineGateImpl::OnDownloadStarting(const DownloadStartingEvent& event) {
    fs::path quarantineDir;
    {
        std::lock_guard lock(m_stateMutex);
        if (!m_initialized || m_shutDown || m_detached) {
            QG_LOG_WARN("Download of %s cancelled: gate not active",
                        StringUtils::Truncate(event.uri, 128).c_str());
            return StartDecision::Cancel();
        }
        quarantineDir = m_quarantineDir;
    }

    std::string mime(StringUtils::Trim(event.mimeType));
    if (mime.empty()) {
        mime = std::string(QuarantineGateConstants::DEFAULT_CONTENT_TYPE);
    }

    if (!IsAllowedContentType(mime)) {
        m_blocked++;
        QG_LOG_INFO("Blocked download with content type '%s'", mime.c_str());
        return StartDecision::Cancel();
    }

    std::string fileName = FileUtils::SanitizeFileName(
        event.suggestedFileName.empty() ? LastPathSegment(event.uri) : event.suggestedFileName);

    if (IsBlockedExtension(fileName)) {
        m_blocked++;
        QG_LOG_INFO("Blocked download '%s' by extension", fileName.c_str());
        return StartDecision::Cancel();
    }

    CryptoUtils::Error cerr;
    const std::string id = m_rng.GenerateHex(QuarantineGateConstants::DOWNLOAD_ID_BYTES, &cerr);
    if (id.empty()) {
        QG_LOG_ERROR("Download cancelled, no id: %s", cerr.message.c_str());
        return StartDecision::Cancel();
    }

    if (fileName.empty()) {
        fileName = "download_" + id;
    }

    const fs::path quarantinePath = quarantineDir / (id + "_" + fileName);
    FileUtils::Error ferr;
    if (!FileUtils::IsPathUnderRoot(quarantinePath, quarantineDir, &ferr)) {
        m_blocked++;
        QG_LOG_WARN("Download '%s' escapes the quarantine directory", fileName.c_str());
        return StartDecision::Cancel();
    }

    auto slot = std::make_shared<DownloadSlot>();
    slot->record.id = id;
    slot->record.fileName = fileName;
    slot->record.sourceUrl = event.uri;
    slot->record.quarantinePath = quarantinePath;
    slot->record.contentType = mime;
    slot->record.size = -1;
    slot->record.startTime = std::chrono::system_clock::now();
    slot->record.status = DownloadStatus::Pending;
    slot->startedSteady = std::chrono::steady_clock::now();

    {
        // Published under m_stateMutex: a concurrent Shutdown either purges this slot or we cancel.
        std::lock_guard state(m_stateMutex);
        if (m_shutDown || m_detached) {
            QG_LOG_WARN("Download %s cancelled: gate stopped while starting", id.c_str());
            return StartDecision::Cancel();
        }
        std::unique_lock lock(m_mapMutex);
        m_downloads.emplace(id, std::move(slot));
    }
    m_total++;

    QG_LOG_INFO("Accepted download %s (%s, %s)", id.c_str(), fileName.c_str(), mime.c_str());
    return StartDecision::Accept(id, quarantinePath);
}

void DownloadQuarantineGateImpl::OnDownloadStateChanged(const std::string& id, TransferState state) {
    const auto slot = FindSlot(id);
    if (!slot) {
        QG_LOG_DEBUG("State %s for unknown download %s ignored",
                     std::string(GetTransferStateName(state)).c_str(), id.c_str());
        return;
    }

    std::optional<DownloadRecord> completed;
    {
        std::lock_guard op(slot->opMutex);
        const DownloadStatus current = Snapshot(*slot).status;

        switch (state) {
            case TransferState::InProgress:
                if (current == DownloadStatus::Pending) {
                    TransitionLocked(*slot, DownloadStatus::InProgress);
                }
                break;

            case TransferState::Completed:
                if (current == DownloadStatus::Pending) {
                    TransitionLocked(*slot, DownloadStatus::InProgress);
                }
                else if (current != DownloadStatus::InProgress) {
                    QG_LOG_DEBUG("Completion of %s in state %s ignored",
                                 id.c_str(), std::string(GetDownloadStatusName(current)).c_str());
                    break;
                }
                CompleteLocked(*slot);
                if (Snapshot(*slot).status == DownloadStatus::Quarantined) {
                    completed = Snapshot(*slot);
                }
                break;

            case TransferState::Interrupted:
                if (current != DownloadStatus::Pending && current != DownloadStatus::InProgress) {
                    QG_LOG_DEBUG("Interruption of %s in state %s ignored",
                                 id.c_str(), std::string(GetDownloadStatusName(current)).c_str());
                    break;
                }
                FailLocked(*slot, "transfer interrupted");
                break;

            default:
                break;
        }
    }

    if (completed) {
        Notify(CallbackKind::Completed, *completed);
    }
}

void DownloadQuarantineGateImpl::CompleteLocked(DownloadSlot& slot) {
    const DownloadRecord record = Snapshot(slot);

    FileUtils::FileStat st;
    FileUtils::Error ferr;
    if (!FileUtils::Stat(record.quarantinePath, st, &ferr) || !st.exists || !st.isRegularFile) {
        FailLocked(slot, "completed download is not a regular file");
        return;
    }

    std::string sha256;
    uint64_t bytes = 0;
    HashUtils::Error herr;
    if (!HashUtils::ComputeFileHex(HashUtils::Algorithm::SHA256, record.quarantinePath, sha256, &herr, &bytes)) {
        QG_LOG_ERROR("Hashing %s failed: %s", record.id.c_str(), herr.message.c_str());
        FailLocked(slot, "hashing failed");
        return;
    }

    MarkLocked(record);

    {
        std::lock_guard lock(slot.dataMutex);
        slot.record.size = static_cast<int64_t>(bytes);
        slot.record.sha256 = sha256;
    }
    if (!TransitionLocked(slot, DownloadStatus::Quarantined)) {
        return;
    }

    const auto transfer = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - slot.startedSteady);
    m_quarantined++;
    m_totalBytes += bytes;
    m_transferUsTotal += static_cast<uint64_t>(transfer.count());

    QG_LOG_INFO("Download %s quarantined (%llu bytes, %s %s)",
                record.id.c_str(), static_cast<unsigned long long>(bytes),
                HashUtils::AlgorithmName(HashUtils::Algorithm::SHA256), sha256.c_str());
}

void DownloadQuarantineGateImpl::MarkLocked(const DownloadRecord& record) {
    bool marked = false;
    try {
        marked = m_marker->Mark(record.quarantinePath, record.sourceUrl);
    }
    catch (const std::exception& ex) {
        QG_LOG_WARN("Marker '%s' threw for %s: %s",
                    std::string(m_marker->GetName()).c_str(), record.id.c_str(), ex.what());
    }
    if (marked) {
        return;
    }

    SidecarContentMarker sidecar;
    if (!sidecar.Mark(record.quarantinePath, record.sourceUrl)) {
        QG_LOG_WARN("Download %s not marked as internet content", record.id.c_str());
    }
}

void DownloadQuarantineGateImpl::FailLocked(DownloadSlot& slot, const char* reason) {
    const DownloadRecord record = Snapshot(slot);
    if (!TransitionLocked(slot, DownloadStatus::Failed)) {
        return;
    }
    RemoveQuietly(record.quarantinePath);
    RemoveQuietly(SidecarContentMarker::SidecarPathFor(record.quarantinePath));
    m_failed++;
    QG_LOG_WARN("Download %s failed: %s", record.id.c_str(), reason);
}

// ----------------------------------------------------------------------------
// Decisions
// ----------------------------------------------------------------------------

bool DownloadQuarantineGateImpl::Promote(const std::string& id,
                                         const fs::path& destination,
                                         DownloadRecord& out,
                                         DownloadError* err) {
    auto fail = [err](DownloadErrorCode code, std::string message) {
        if (err) {
            err->code = code;
            err->message = std::move(message);
        }
        return false;
    };

    const auto slot = FindSlot(id);
    if (!slot) {
        return fail(DownloadErrorCode::NotFound, "unknown download '" + id + "'");
    }
    if (destination.empty()) {
        return fail(DownloadErrorCode::IoError, "empty destination");
    }

    DownloadRecord promoted;
    {
        std::lock_guard op(slot->opMutex);
        const DownloadRecord record = Snapshot(*slot);
        if (record.status != DownloadStatus::Quarantined) {
            return fail(DownloadErrorCode::InvalidState,
                        "download is " + std::string(GetDownloadStatusName(record.status)));
        }

        std::string actual;
        HashUtils::Error herr;
        if (!HashUtils::ComputeFileHex(HashUtils::Algorithm::SHA256, record.quarantinePath, actual, &herr)) {
            TransitionLocked(*slot, DownloadStatus::Failed);
            m_failed++;
            QG_LOG_ERROR("Promotion of %s failed: %s", id.c_str(), herr.message.c_str());
            return fail(DownloadErrorCode::IoError, herr.message);
        }
        if (!HashUtils::EqualHex(actual, record.sha256)) {
            TransitionLocked(*slot, DownloadStatus::Failed);
            m_failed++;
            QG_LOG_ERROR("Promotion of %s refused: quarantined file changed (sha256 %s, expected %s)",
                         id.c_str(), actual.c_str(), record.sha256.c_str());
            return fail(DownloadErrorCode::IntegrityMismatch, "quarantined file changed after completion");
        }

        FileUtils::Error ferr;
        bool moved = true;
        if (destination.has_parent_path() && !FileUtils::CreateDirectories(destination.parent_path(), &ferr)) {
            moved = false;
        }
        else {
            FileUtils::FileStat st;
            if (FileUtils::Stat(destination, st, &ferr) && st.exists) {
                ferr.code = EEXIST;
                ferr.message = "destination exists: " + destination.string();
                moved = false;
            }
            else if (!FileUtils::MoveFileAtomic(record.quarantinePath, destination, &ferr)) {
                moved = false;
            }
        }

        if (!moved) {
            TransitionLocked(*slot, DownloadStatus::Failed);
            m_failed++;
            QG_LOG_ERROR("Promotion of %s failed: %s", id.c_str(), ferr.message.c_str());
            return fail(DownloadErrorCode::IoError, ferr.message);
        }

        const fs::path sidecar = SidecarContentMarker::SidecarPathFor(record.quarantinePath);
        FileUtils::Error serr;
        if (FileUtils::Exists(sidecar, &serr) &&
            !FileUtils::MoveFileAtomic(sidecar, SidecarContentMarker::SidecarPathFor(destination), &serr)) {
            QG_LOG_WARN("Marker of %s not moved: %s", id.c_str(), serr.message.c_str());
        }

        {
            std::lock_guard lock(slot->dataMutex);
            slot->record.finalPath = destination;
        }
        TransitionLocked(*slot, DownloadStatus::Promoted);
        promoted = Snapshot(*slot);
        m_promoted++;
    }

    QG_LOG_INFO("Download %s promoted to %s", id.c_str(), destination.c_str());
    out = promoted;
    Notify(CallbackKind::Promoted, promoted);
    return true;
}

bool DownloadQuarantineGateImpl::DeleteLocked(DownloadSlot& slot) {
    const DownloadRecord record = Snapshot(slot);
    if (!IsValidTransition(record.status, DownloadStatus::Deleted)) {
        return false;
    }

    const Privacy::WipeResult wipe = m_wiper->WipeFile(record.quarantinePath);
    if (!wipe) {
        QG_LOG_ERROR("Download %s not deleted: %s", record.id.c_str(), wipe.message.c_str());
        return false;
    }
    const Privacy::WipeResult sidecar = m_wiper->WipeFile(SidecarContentMarker::SidecarPathFor(record.quarantinePath));
    if (!sidecar) {
        QG_LOG_WARN("Marker of %s not removed: %s", record.id.c_str(), sidecar.message.c_str());
    }

    TransitionLocked(slot, DownloadStatus::Deleted);
    m_deleted++;
    QG_LOG_INFO("Download %s deleted", record.id.c_str());
    return true;
}

bool DownloadQuarantineGateImpl::Delete(const std::string& id) {
    const auto slot = FindSlot(id);
    if (!slot) {
        return false;
    }

    DownloadRecord deleted;
    {
        std::lock_guard op(slot->opMutex);
        if (Snapshot(*slot).status != DownloadStatus::Quarantined) {
            return false;
        }
        if (!DeleteLocked(*slot)) {
            return false;
        }
        deleted = Snapshot(*slot);
    }

    Notify(CallbackKind::Deleted, deleted);
    return true;
}

// ----------------------------------------------------------------------------
// Queries
// ----------------------------------------------------------------------------

std::vector<DownloadRecord> DownloadQuarantineGateImpl::GetActiveDownloads() const {
    std::vector<DownloadRecord> out;
    {
        std::shared_lock lock(m_mapMutex);
        for (const auto& [id, slot] : m_downloads) {
            DownloadRecord record = Snapshot(*slot);
            if (!IsTerminal(record.status)) {
                out.push_back(std::move(record));
            }
        }
    }
    std::sort(out.begin(), out.end(), [](const DownloadRecord& a, const DownloadRecord& b) {
        return a.startTime < b.startTime;
    });
    return out;
}

std::optional<DownloadRecord> DownloadQuarantineGateImpl::GetDownload(const std::string& id) const {
    const auto slot = FindSlot(id);
    if (!slot) {
        return std::nullopt;
    }
    return Snapshot(*slot);
}

DownloadMetrics DownloadQuarantineGateImpl::GetMetrics() const {
    DownloadMetrics m;
    m.totalDownloads = m_total.load();
    m.quarantined = m_quarantined.load();
    m.promoted = m_promoted.load();
    m.deleted = m_deleted.load();
    m.blocked = m_blocked.load();
    m.failed = m_failed.load();
    m.totalBytes = m_totalBytes.load();
    if (m.quarantined > 0) {
        m.averageTransferMs = static_cast<double>(m_transferUsTotal.load()) /
                              static_cast<double>(m.quarantined) / 1000.0;
    }
    return m;
}

fs::path DownloadQuarantineGateImpl::GetQuarantineDirectory() const {
    std::lock_guard lock(m_stateMutex);
    return m_quarantineDir;
}

uint64_t DownloadQuarantineGateImpl::RegisterCallback(CallbackKind kind, DownloadCallback callback) {
    std::lock_guard lock(m_callbackMutex);
    const uint64_t id = m_nextCallbackId++;
    m_callbacks.emplace(id, std::make_pair(kind, std::move(callback)));
    return id;
}

bool DownloadQuarantineGateImpl::UnregisterCallback(uint64_t callbackId) {
    std::lock_guard lock(m_callbackMutex);
    return m_callbacks.erase(callbackId) != 0;
}

// ============================================================================
// PUBLIC INTERFACE
// ============================================================================

DownloadQuarantineGate::DownloadQuarantineGate(QuarantineGateConfiguration config,
                                               std::shared_ptr<IContentMarker> marker,
                                               std::shared_ptr<Privacy::SecureDeletionWorker> wiper)
    : m_impl(std::make_unique<DownloadQuarantineGateImpl>(
          std::move(config), std::move(marker), std::move(wiper))) {
}

DownloadQuarantineGate::~DownloadQuarantineGate() {
    m_impl->Shutdown(this);
}

bool DownloadQuarantineGate::Initialize(std::shared_ptr<IDownloadEventSource> source,
                                        const fs::path& quarantineDir) {
    return m_impl->Initialize(std::move(source), quarantineDir, this);
}

void DownloadQuarantineGate::Detach() {
    m_impl->Detach(this);
}

void DownloadQuarantineGate::Shutdown() {
    m_impl->Shutdown(this);
}

bool DownloadQuarantineGate::IsInitialized() const {
    return m_impl->IsInitialized();
}

StartDecision DownloadQuarantineGate::OnDownloadStarting(const DownloadStartingEvent& event) {
    return m_impl->OnDownloadStarting(event);
}

void DownloadQuarantineGate::OnDownloadStateChanged(const std::string& downloadId, TransferState state) {
    m_impl->OnDownloadStateChanged(downloadId, state);
}

bool DownloadQuarantineGate::Promote(const std::string& downloadId,
                                     const fs::path& destination,
                                     DownloadRecord& out,
                                     DownloadError* err) {
    return m_impl->Promote(downloadId, destination, out, err);
}

bool DownloadQuarantineGate::Delete(const std::string& downloadId) {
    return m_impl->Delete(downloadId);
}

std::vector<DownloadRecord> DownloadQuarantineGate::GetActiveDownloads() const {
    return m_impl->GetActiveDownloads();
}

std::optional<DownloadRecord> DownloadQuarantineGate::GetDownload(const std::string& downloadId) const {
    return m_impl->GetDownload(downloadId);
}

DownloadMetrics DownloadQuarantineGate::GetMetrics() const {
    return m_impl->GetMetrics();
}

fs::path DownloadQuarantineGate::GetQuarantineDirectory() const {
    return m_impl->GetQuarantineDirectory();
}

const QuarantineGateConfiguration& DownloadQuarantineGate::GetConfiguration() const noexcept {
    return m_impl->m_config;
}

uint64_t DownloadQuarantineGate::RegisterCompletedCallback(DownloadCallback callback) {
    return m_impl->RegisterCallback(DownloadQuarantineGateImpl::CallbackKind::Completed, std::move(callback));
}

uint64_t DownloadQuarantineGate::RegisterPromotedCallback(DownloadCallback callback) {
    return m_impl->RegisterCallback(DownloadQuarantineGateImpl::CallbackKind::Promoted, std::move(callback));
}

uint64_t DownloadQuarantineGate::RegisterDeletedCallback(DownloadCallback callback) {
    return m_impl->RegisterCallback(DownloadQuarantineGateImpl::CallbackKind::Deleted, std::move(callback));
}

bool DownloadQuarantineGate::UnregisterCallback(uint64_t callbackId) {
    return m_impl->UnregisterCallback(callbackId);
}

}  // namespace WebProtection
}  // namespace ShadowVeil
