#include "session_registry.hpp"

#include <mutex>

SessionId SessionRegistry::create() {
    auto session = TranscriptionSession::create();
    auto id = session.id;

    std::unique_lock lock(mutex_);
    entries_.emplace(id, Entry{std::move(session), AudioBuffer{}});
    return id;
}

bool SessionRegistry::exists(const SessionId& id) const {
    std::shared_lock lock(mutex_);
    return entries_.contains(id);
}

std::optional<TranscriptionSession> SessionRegistry::get(const SessionId& id) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) return std::nullopt;
    return it->second.session;
}

bool SessionRegistry::update(const SessionId& id, const SessionFn& fn) {
    std::unique_lock lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) return false;
    fn(it->second.session);
    return true;
}

bool SessionRegistry::with_buffer(const SessionId& id, const BufferFn& fn) {
    std::unique_lock lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) return false;
    fn(it->second.session, it->second.buffer);
    return true;
}

bool SessionRegistry::remove(const SessionId& id) {
    std::unique_lock lock(mutex_);
    return entries_.erase(id) > 0;
}

std::vector<SessionId> SessionRegistry::list_ids() const {
    std::shared_lock lock(mutex_);
    std::vector<SessionId> ids;
    ids.reserve(entries_.size());
    for (const auto& [id, entry] : entries_) {
        ids.push_back(id);
    }
    return ids;
}

size_t SessionRegistry::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

size_t SessionRegistry::clear() {
    std::unique_lock lock(mutex_);
    size_t n = entries_.size();
    entries_.clear();
    return n;
}

std::vector<PendingAudio> SessionRegistry::take_pending() {
    std::unique_lock lock(mutex_);
    std::vector<PendingAudio> pending;
    for (auto& [id, entry] : entries_) {
        if (entry.session.status.state != SessionState::Recording) continue;

        entry.session.status = {SessionState::Processing, {}};
        PendingAudio p;
        p.id = id;
        p.sample_rate = entry.buffer.sample_rate();
        p.channels = entry.buffer.channels();
        p.duration_s = entry.buffer.duration_seconds();
        p.samples = entry.buffer.drain();
        pending.push_back(std::move(p));
    }
    return pending;
}

std::vector<SessionId> SessionRegistry::expire_idle(std::chrono::duration<double> timeout) {
    std::unique_lock lock(mutex_);
    std::vector<SessionId> expired;
    for (auto it = entries_.begin(); it != entries_.end();) {
        const auto& entry = it->second;
        if (entry.session.status.state == SessionState::Recording &&
            entry.buffer.is_idle(timeout)) {
            expired.push_back(it->first);
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
    return expired;
}
