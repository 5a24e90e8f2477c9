#include "multibar/core/registry.hpp"
#include "multibar/core/rate_estimator.hpp"
#include "multibar/common/logger.hpp"
#include <limits>

namespace multibar {
namespace core {

uint64_t Registry::nextId() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
}

bool Registry::insert(uint64_t id, BarRecord record) {
    record.id = id;

    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = entries_.try_emplace(id, nullptr);
    if (!inserted) {
        common::Logger::instance().debug("[Registry] Duplicate id ignored | id={}", id);
        return false;
    }
    it->second = std::make_shared<Entry>(std::move(record));
    return true;
}

std::shared_ptr<Registry::Entry> Registry::find(uint64_t id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return nullptr;
    }
    return it->second;
}

bool Registry::update(uint64_t id, uint64_t delta, TimePoint now) {
    auto entry = find(id);
    if (!entry) {
        return false;
    }

    std::lock_guard<std::mutex> lock(entry->mutex);
    BarRecord& record = entry->record;

    if (delta > std::numeric_limits<uint64_t>::max() - record.completed) {
        record.completed = std::numeric_limits<uint64_t>::max();
    } else {
        record.completed += delta;
    }

    if (record.last_update_at) {
        double dt = std::chrono::duration<double>(now - *record.last_update_at).count();
        if (dt > 0.0) {
            record.rate_estimate = RateEstimator::update(record.rate_estimate, dt,
                                                         static_cast<double>(delta),
                                                         record.config.smoothing_factor);
        }
    }
    record.last_update_at = now;
    return true;
}

bool Registry::modify(uint64_t id, const std::function<void(BarRecord&)>& mutation) {
    auto entry = find(id);
    if (!entry) {
        return false;
    }

    std::lock_guard<std::mutex> lock(entry->mutex);
    mutation(entry->record);
    return true;
}

std::optional<BarRecord> Registry::remove(uint64_t id) {
    std::shared_ptr<Entry> entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        entry = std::move(it->second);
        entries_.erase(it);
    }

    std::lock_guard<std::mutex> lock(entry->mutex);
    return entry->record;
}

std::optional<BarRecord> Registry::get(uint64_t id) const {
    auto entry = find(id);
    if (!entry) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(entry->mutex);
    return entry->record;
}

std::vector<BarRecord> Registry::snapshotOrdered() const {
    std::vector<BarRecord> records;

    std::lock_guard<std::mutex> lock(mutex_);
    records.reserve(entries_.size());
    for (const auto& [id, entry] : entries_) {
        std::lock_guard<std::mutex> entry_lock(entry->mutex);
        records.push_back(entry->record);
    }
    return records;
}

bool Registry::contains(uint64_t id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.find(id) != entries_.end();
}

size_t Registry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

}}
