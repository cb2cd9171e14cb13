// Last-good assessment cache and pending-write replay queue
#pragma once

#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "cardiowatch_core.h"
#include "cardiowatch_store.h"

namespace cardiowatch {

struct CachedAssessment {
    Assessment assessment;
    double cachedAt = 0.0;
};

class OfflineCache {
public:
    explicit OfflineCache(double expirySec = 3600.0, size_t pendingCapacity = 256)
        : expirySec_(expirySec), pendingCapacity_(pendingCapacity == 0 ? 1 : pendingCapacity) {}

    // Replaces the cached entry (own copy)
    void store(const Assessment& a, double now);
    // Empty when nothing is cached or the entry is older than the expiry
    std::optional<Assessment> get(double now) const;
    std::optional<CachedAssessment> entry(double now) const;
    bool isAvailable(double now) const { return get(now).has_value(); }
    std::optional<double> lastSyncTime() const { std::lock_guard<std::mutex> lock(dataMutex_); return lastSync_; }
    void clear();
    double expirySec() const { return expirySec_; }

    // key=value file with the cached entry. Errors: CARDIOWATCH_E020.
    bool saveToFile(const std::string& path, const char** err_code = nullptr, std::string* err_msg = nullptr) const;
    bool loadFromFile(const std::string& path, const char** err_code = nullptr, std::string* err_msg = nullptr);

    // Pending persistence writes. A record whose assessment timestamp is
    // already queued is ignored (returns false). At capacity the oldest
    // record is dropped to make room.
    bool enqueue(const AssessmentRecord& rec);
    size_t pendingCount() const { std::lock_guard<std::mutex> lock(dataMutex_); return pending_.size(); }
    std::vector<AssessmentRecord> pendingRecords() const;
    size_t pendingCapacity() const { return pendingCapacity_; }
    unsigned long long droppedTotal() const { std::lock_guard<std::mutex> lock(dataMutex_); return droppedTotal_; }
    // Delivers pending records oldest first; saved ones are removed, failed
    // ones stay queued in order. Returns the number saved.
    size_t replay(AssessmentStore& store);

    // key=value file with the pending records, so queued writes survive a
    // restart. Loading puts the file's records ahead of those already queued.
    // Errors: CARDIOWATCH_E020.
    bool savePendingToFile(const std::string& path, const char** err_code = nullptr, std::string* err_msg = nullptr) const;
    bool loadPendingFromFile(const std::string& path, const char** err_code = nullptr, std::string* err_msg = nullptr);

private:
    void trimPendingLocked();

    mutable std::mutex dataMutex_;
    double expirySec_;
    size_t pendingCapacity_;
    unsigned long long droppedTotal_{0};
    std::optional<CachedAssessment> cached_;
    std::optional<double> lastSync_;
    std::deque<AssessmentRecord> pending_;
};

} // namespace cardiowatch
