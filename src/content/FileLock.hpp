/**
 * Campaign Keeper - File Lock
 * 
 * Per-key mutual exclusion for entity files.
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace keeper {

/**
 * Lock registry keyed by resource (usually an entity's storage path)
 * 
 * Operations on one key run one at a time, in arrival order; operations on
 * different keys never wait for each other. An entry exists only while its
 * key has a holder or waiters.
 * 
 * The registry is process-local. One instance is owned by the application
 * and shared by every store that writes the same campaigns.
 */
class FileLock {
public:
    /**
     * @param stallWarning How long a waiter blocks before a stall is logged
     *                     (zero disables the warning)
     */
    explicit FileLock(std::chrono::milliseconds stallWarning = std::chrono::seconds(30));
    ~FileLock();
    
    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;
    
    /**
     * Run an operation while holding the lock for key
     * 
     * Blocks until every earlier holder of key has finished. The lock is
     * released whether the operation returns or throws; exceptions reach
     * the caller unchanged.
     */
    template<typename Operation>
    auto withLock(const std::string& key, Operation&& operation) -> decltype(operation()) {
        Holder holder(*this, key);
        return operation();
    }
    
    /**
     * Whether key has an outstanding holder
     * 
     * Diagnostic only. Never use it to decide whether to acquire.
     */
    bool isLocked(const std::string& key) const;
    
    /**
     * Number of keys with a holder or waiters
     */
    std::size_t activeKeyCount() const;
    
private:
    struct Entry {
        std::uint64_t nextTicket = 0;
        std::uint64_t serving = 0;
        std::condition_variable released;
    };
    
    class Holder {
    public:
        Holder(FileLock& lock, const std::string& key)
            : m_lock(lock), m_key(key) { m_lock.acquire(m_key); }
        ~Holder() { m_lock.release(m_key); }
        
        Holder(const Holder&) = delete;
        Holder& operator=(const Holder&) = delete;
        
    private:
        FileLock& m_lock;
        std::string m_key;
    };
    
    void acquire(const std::string& key);
    void release(const std::string& key);
    
    mutable std::mutex m_mutex;
    std::unordered_map<std::string, std::unique_ptr<Entry>> m_entries;
    std::chrono::milliseconds m_stallWarning;
};

} // namespace keeper
