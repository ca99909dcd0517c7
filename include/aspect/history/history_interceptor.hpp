#pragma once

#include <memory>
#include <optional>
#include <string>
#include "aspect/errors.hpp"
#include "aspect/interceptor.hpp"
#include "aspect/logging.hpp"
#include "aspect/repository.hpp"
#include "history_recorder.hpp"
#include "user_context.hpp"

namespace aspect {
namespace history {

/**
 * Records entity changes made through a Repository<T> proxy.
 *
 * Before update and remove, the current persisted state is read through the
 * target's get_by_id and kept in the call's items under kPriorStateKey.
 * After add, a Create record is written with the stored entity. After update
 * and remove, an Update or Delete record is written with the prior state.
 *
 * History is best-effort: lookup and recorder failures are logged and never
 * reach the caller, because the repository operation has already committed.
 *
 * The prior-state lookup waits for the target's get_by_id, so the target
 * must be able to settle that call without the calling thread's help.
 *
 * Example:
 *   auto recorder = std::make_shared<InMemoryHistoryRecorder<Product>>();
 *   auto products = InterceptorBuilder<Repository<Product>>()
 *       .add_interceptor(std::make_shared<HistoryInterceptor<Product>>(recorder))
 *       .build(std::make_shared<InMemoryRepository<Product>>());
 */
template<typename T>
class HistoryInterceptor : public InterceptorBase {
public:
    static constexpr const char* kPriorStateKey = "history.prior_state";
    static constexpr int kDefaultOrder = 10;

    /**
     * @throws InvalidArgumentError if recorder or users is null
     */
    explicit HistoryInterceptor(std::shared_ptr<HistoryRecorder<T>> recorder,
                                std::shared_ptr<UserContextAccessor> users =
                                    std::make_shared<DefaultUserContextAccessor>())
        : InterceptorBase(kDefaultOrder, "history"),
          recorder_(std::move(recorder)),
          users_(std::move(users)) {
        if (!recorder_) {
            throw InvalidArgumentError("history interceptor requires a recorder");
        }
        if (!users_) {
            throw InvalidArgumentError("history interceptor requires a user context accessor");
        }
    }

    void before_invoke(MethodCallContext& context) override {
        auto* repository = context.target_as<Repository<T>>();
        if (!repository) return;

        const std::string& operation = context.method().name;
        if (operation != "update" && operation != "remove") return;

        std::string entity_id;
        try {
            entity_id = operation == "update" ? EntityTraits<T>::id(context.argument<T>(0))
                                              : context.argument<std::string>(0);
            if (entity_id.empty()) return;

            std::optional<T> prior = repository->get_by_id(entity_id).get();
            if (prior) {
                context.set_item(kPriorStateKey, std::move(*prior));
            }
        } catch (const std::exception& e) {
            log_warn(kLogDomain, "prior_state_lookup_failed",
                     {{"method", context.method().full_name()},
                      {"entity_id", entity_id},
                      {"error", e.what()}});
        }
    }

    void after_invoke(MethodCallContext& context) override {
        if (!context.target_as<Repository<T>>()) return;

        const std::string& operation = context.method().name;
        try {
            if (operation == "add") {
                if (const T* created = context.result_as<T>()) {
                    record(*created, HISTORY_ACTION_CREATE);
                }
            } else if (operation == "update" || operation == "remove") {
                if (const T* prior = context.item<T>(kPriorStateKey)) {
                    record(*prior, operation == "update" ? HISTORY_ACTION_UPDATE
                                                         : HISTORY_ACTION_DELETE);
                }
            }
        } catch (const std::exception& e) {
            log_error(kLogDomain, "history_record_failed",
                      {{"method", context.method().full_name()},
                       {"error", e.what()}});
        }
    }

    const std::shared_ptr<HistoryRecorder<T>>& recorder() const { return recorder_; }

private:
    static constexpr const char* kLogDomain = "aspect.history";

    void record(const T& snapshot, HistoryAction action) {
        auto record = recorder_->add(snapshot, EntityTraits<T>::id(snapshot),
                                     EntityTraits<T>::type_name(), action,
                                     users_->current_actor());
        log_debug(kLogDomain, "history_recorded",
                  {{"record_id", record.id()},
                   {"entity_id", record.entity_id()},
                   {"entity_type", record.entity_type()},
                   {"action", HistoryAction_Name(record.action())},
                   {"actor", record.actor()}});
    }

    std::shared_ptr<HistoryRecorder<T>> recorder_;
    std::shared_ptr<UserContextAccessor> users_;
};

} // namespace history
} // namespace aspect
