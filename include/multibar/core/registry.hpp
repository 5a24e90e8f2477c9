#pragma once

#include "bar_record.hpp"
#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace multibar {
namespace core {

// Ordered collection of live bar records keyed by id.
//
// One mutex guards the map itself; every entry carries its own mutex so a
// record is never read mid-mutation. Snapshots copy records out under both
// locks and all formatting happens on the copies, so a slow render never
// holds a record lock while it talks to the terminal.
class Registry {
public:
    Registry() = default;
    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    uint64_t nextId();

    // False when the id is already present; the existing record is kept.
    bool insert(uint64_t id, BarRecord record);

    // Adds delta to completed and feeds the rate estimator. False (and no
    // effect) when the id is gone, e.g. an update racing a close.
    bool update(uint64_t id, uint64_t delta, TimePoint now);

    bool modify(uint64_t id, const std::function<void(BarRecord&)>& mutation);

    std::optional<BarRecord> remove(uint64_t id);
    std::optional<BarRecord> get(uint64_t id) const;

    // Point-in-time copy of every record in ascending id order.
    std::vector<BarRecord> snapshotOrdered() const;

    bool contains(uint64_t id) const;
    size_t size() const;

private:
    struct Entry {
        mutable std::mutex mutex;
        BarRecord record;

        explicit Entry(BarRecord r) : record(std::move(r)) {}
    };

    std::shared_ptr<Entry> find(uint64_t id) const;

    mutable std::mutex mutex_;
    std::map<uint64_t, std::shared_ptr<Entry>> entries_;
    std::atomic<uint64_t> next_id_{1};
};

}}
