#pragma once

#include <algorithm>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <google/protobuf/timestamp.pb.h>
#include "aspect/history.pb.h"
#include "aspect/errors.hpp"
#include "aspect/helpers.hpp"

namespace aspect {
namespace history {

/**
 * A history record together with its unpacked entity snapshot.
 */
template<typename T>
struct TypedHistoryRecord {
    HistoryRecord record;
    T snapshot;
};

/**
 * Sink for entity change history.
 *
 * Records are append-only. get_at_point_in_time() locates the latest record
 * at or before the timestamp; a Delete record is a tombstone, so the entity
 * is absent until a later Create.
 */
template<typename T>
class HistoryRecorder {
public:
    virtual ~HistoryRecorder() = default;

    /**
     * Append a record.
     *
     * @throws InvalidArgumentError if entity_id is empty or action is unspecified
     */
    virtual HistoryRecord add(const T& snapshot, const std::string& entity_id,
                              const std::string& entity_type, HistoryAction action,
                              const std::string& actor) = 0;

    /**
     * All records of an entity, newest first.
     */
    virtual std::vector<TypedHistoryRecord<T>> get_all(const std::string& entity_id) const = 0;

    virtual std::optional<T> get_at_point_in_time(const std::string& entity_id,
                                                  const google::protobuf::Timestamp& timestamp) const = 0;
};

/**
 * HistoryRecorder kept in process memory.
 *
 * The clock is injectable so tests can place records at known instants.
 * Records with equal timestamps keep their append order: the later append
 * counts as the newer one.
 */
template<typename T>
class InMemoryHistoryRecorder : public HistoryRecorder<T> {
public:
    using Clock = std::function<google::protobuf::Timestamp()>;

    explicit InMemoryHistoryRecorder(Clock clock = &helpers::now)
        : clock_(clock ? std::move(clock) : Clock(&helpers::now)) {}

    HistoryRecord add(const T& snapshot, const std::string& entity_id,
                      const std::string& entity_type, HistoryAction action,
                      const std::string& actor) override {
        if (entity_id.empty()) {
            throw InvalidArgumentError("history record requires an entity id");
        }
        if (action == HISTORY_ACTION_UNSPECIFIED) {
            throw InvalidArgumentError("history record requires an action");
        }

        HistoryRecord record;
        record.set_id(helpers::generate_uuid());
        record.set_entity_id(entity_id);
        record.set_entity_type(entity_type);
        record.set_action(action);
        *record.mutable_timestamp() = clock_();
        *record.mutable_snapshot() = helpers::pack_any(snapshot);
        record.set_actor(actor);

        std::lock_guard<std::mutex> lock(mutex_);
        records_.push_back(record);
        return record;
    }

    std::vector<TypedHistoryRecord<T>> get_all(const std::string& entity_id) const override {
        std::vector<HistoryRecord> matching = newest_first(entity_id);

        std::vector<TypedHistoryRecord<T>> result;
        result.reserve(matching.size());
        for (auto& record : matching) {
            T snapshot = unpack(record);
            result.push_back(TypedHistoryRecord<T>{std::move(record), std::move(snapshot)});
        }
        return result;
    }

    std::optional<T> get_at_point_in_time(const std::string& entity_id,
                                          const google::protobuf::Timestamp& timestamp) const override {
        for (const auto& record : newest_first(entity_id)) {
            if (helpers::compare(record.timestamp(), timestamp) > 0) continue;
            if (record.action() == HISTORY_ACTION_DELETE) return std::nullopt;
            return unpack(record);
        }
        return std::nullopt;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_.size();
    }

private:
    std::vector<HistoryRecord> newest_first(const std::string& entity_id) const {
        std::vector<HistoryRecord> matching;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (auto it = records_.rbegin(); it != records_.rend(); ++it) {
                if (it->entity_id() == entity_id) matching.push_back(*it);
            }
        }
        std::stable_sort(matching.begin(), matching.end(),
                         [](const HistoryRecord& a, const HistoryRecord& b) {
                             return helpers::compare(a.timestamp(), b.timestamp()) > 0;
                         });
        return matching;
    }

    static T unpack(const HistoryRecord& record) {
        T snapshot;
        if (!record.snapshot().UnpackTo(&snapshot)) {
            throw InvalidArgumentError("history record " + record.id() + " holds a " +
                                       helpers::type_name_from_url(record.snapshot().type_url()));
        }
        return snapshot;
    }

    Clock clock_;
    mutable std::mutex mutex_;
    std::vector<HistoryRecord> records_;
};

} // namespace history
} // namespace aspect
