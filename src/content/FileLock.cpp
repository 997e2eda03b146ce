/**
 * Campaign Keeper - File Lock Implementation
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "FileLock.hpp"

#include <spdlog/spdlog.h>

namespace keeper {

FileLock::FileLock(std::chrono::milliseconds stallWarning)
    : m_stallWarning(stallWarning)
{
}

FileLock::~FileLock() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_entries.empty()) {
        spdlog::error("FileLock destroyed with {} key(s) still held", m_entries.size());
    }
}

void FileLock::acquire(const std::string& key) {
    std::unique_lock<std::mutex> lock(m_mutex);
    
    auto& slot = m_entries[key];
    if (!slot) {
        slot = std::make_unique<Entry>();
    }
    // The entry outlives this wait: it is only erased once every ticket is served
    Entry* entry = slot.get();
    const std::uint64_t ticket = entry->nextTicket++;
    
    if (ticket == entry->serving) {
        return;
    }
    
    spdlog::debug("Waiting for lock: {} ({} ahead)", key, ticket - entry->serving);
    
    auto waitStart = std::chrono::steady_clock::now();
    while (ticket != entry->serving) {
        if (m_stallWarning.count() <= 0) {
            entry->released.wait(lock);
            continue;
        }
        
        auto status = entry->released.wait_for(lock, m_stallWarning);
        if (status == std::cv_status::timeout && ticket != entry->serving) {
            auto waited = std::chrono::duration_cast<std::chrono::seconds>(
                std::chrono::steady_clock::now() - waitStart);
            spdlog::warn("Lock stall on {}: waiter blocked for {}s, holder has not released",
                         key, waited.count());
        }
    }
}

void FileLock::release(const std::string& key) {
    std::lock_guard<std::mutex> lock(m_mutex);
    
    auto it = m_entries.find(key);
    if (it == m_entries.end()) {
        spdlog::error("Released lock that was not held: {}", key);
        return;
    }
    
    Entry* entry = it->second.get();
    ++entry->serving;
    
    if (entry->serving == entry->nextTicket) {
        // Nobody queued behind us, key is idle again
        m_entries.erase(it);
    } else {
        entry->released.notify_all();
    }
}

bool FileLock::isLocked(const std::string& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.find(key) != m_entries.end();
}

std::size_t FileLock::activeKeyCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

} // namespace keeper
