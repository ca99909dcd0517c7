#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>
#include "cancellation.hpp"
#include "chain.hpp"
#include "deferred.hpp"
#include "errors.hpp"
#include "helpers.hpp"
#include "macros.hpp"
#include "proxy.hpp"

namespace aspect {

/**
 * Adapts an entity type to the repository.
 *
 * The default works with protobuf messages that carry a string `id` field.
 * Specialize for other entity types.
 */
template<typename T>
struct EntityTraits {
    static std::string id(const T& entity) { return entity.id(); }

    static void set_id(T& entity, const std::string& id) { entity.set_id(id); }

    static std::string type_name() { return T::descriptor()->name(); }
};

/**
 * Keyed-entity CRUD contract.
 *
 * All operations suspend. Failures, including cancellation, are reported
 * through the returned Deferred.
 */
template<typename T>
class Repository {
public:
    virtual ~Repository() = default;

    virtual Deferred<std::optional<T>> get_by_id(const std::string& id,
                                                 CancellationToken token = CancellationToken()) = 0;

    virtual Deferred<std::vector<T>> get_all(CancellationToken token = CancellationToken()) = 0;

    /**
     * Store a new entity. An empty id is replaced by a generated one.
     * Fulfills with the stored entity.
     */
    virtual Deferred<T> add(const T& entity, CancellationToken token = CancellationToken()) = 0;

    /**
     * Replace an existing entity. Fulfills with the stored entity.
     */
    virtual Deferred<T> update(const T& entity, CancellationToken token = CancellationToken()) = 0;

    virtual Deferred<void> remove(const std::string& id,
                                  CancellationToken token = CancellationToken()) = 0;
};

/**
 * Forwards every Repository operation through the interceptor chain.
 */
template<typename T>
class RepositoryProxy : public Proxy<Repository<T>> {
public:
    RepositoryProxy(std::shared_ptr<Repository<T>> target,
                    std::shared_ptr<const ChainExecutor> executor)
        : Proxy<Repository<T>>(std::move(target), std::move(executor),
                               "Repository<" + EntityTraits<T>::type_name() + ">") {}

    Deferred<std::optional<T>> get_by_id(const std::string& id, CancellationToken token) override {
        return ASPECT_FORWARD(get_by_id)(id, token);
    }

    Deferred<std::vector<T>> get_all(CancellationToken token) override {
        return ASPECT_FORWARD(get_all)(token);
    }

    Deferred<T> add(const T& entity, CancellationToken token) override {
        return ASPECT_FORWARD(add)(entity, token);
    }

    Deferred<T> update(const T& entity, CancellationToken token) override {
        return ASPECT_FORWARD(update)(entity, token);
    }

    Deferred<void> remove(const std::string& id, CancellationToken token) override {
        return ASPECT_FORWARD(remove)(id, token);
    }
};

template<typename T>
struct proxy_traits<Repository<T>> {
    using type = RepositoryProxy<T>;
};

/**
 * Repository kept in process memory. Operations complete before they
 * return; the returned Deferred is already settled.
 */
template<typename T>
class InMemoryRepository : public Repository<T> {
public:
    Deferred<std::optional<T>> get_by_id(const std::string& id,
                                         CancellationToken token = CancellationToken()) override {
        return complete<std::optional<T>>(token, [&]() -> std::optional<T> {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = entities_.find(id);
            if (it == entities_.end()) return std::nullopt;
            return it->second;
        });
    }

    Deferred<std::vector<T>> get_all(CancellationToken token = CancellationToken()) override {
        return complete<std::vector<T>>(token, [&]() {
            std::lock_guard<std::mutex> lock(mutex_);
            std::vector<T> result;
            result.reserve(entities_.size());
            for (const auto& entry : entities_) {
                result.push_back(entry.second);
            }
            return result;
        });
    }

    Deferred<T> add(const T& entity, CancellationToken token = CancellationToken()) override {
        return complete<T>(token, [&]() {
            T stored = entity;
            if (EntityTraits<T>::id(stored).empty()) {
                EntityTraits<T>::set_id(stored, helpers::generate_uuid());
            }
            std::string id = EntityTraits<T>::id(stored);

            std::lock_guard<std::mutex> lock(mutex_);
            if (entities_.count(id) > 0) {
                throw DuplicateEntityError(EntityTraits<T>::type_name() + " " + id + " already exists");
            }
            entities_.emplace(id, stored);
            return stored;
        });
    }

    Deferred<T> update(const T& entity, CancellationToken token = CancellationToken()) override {
        return complete<T>(token, [&]() {
            std::string id = EntityTraits<T>::id(entity);

            std::lock_guard<std::mutex> lock(mutex_);
            auto it = entities_.find(id);
            if (it == entities_.end()) {
                throw EntityNotFoundError(EntityTraits<T>::type_name() + " " + id + " not found");
            }
            it->second = entity;
            return it->second;
        });
    }

    Deferred<void> remove(const std::string& id,
                          CancellationToken token = CancellationToken()) override {
        return complete<void>(token, [&]() {
            std::lock_guard<std::mutex> lock(mutex_);
            if (entities_.erase(id) == 0) {
                throw EntityNotFoundError(EntityTraits<T>::type_name() + " " + id + " not found");
            }
        });
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entities_.size();
    }

private:
    template<typename R, typename Body>
    static Deferred<R> complete(const CancellationToken& token, Body&& body) {
        try {
            token.throw_if_cancellation_requested();
            if constexpr (std::is_void<R>::value) {
                body();
                return make_ready_deferred();
            } else {
                return make_ready_deferred<R>(body());
            }
        } catch (const std::exception&) {
            return make_failed_deferred<R>(std::current_exception());
        }
    }

    mutable std::mutex mutex_;
    std::map<std::string, T> entities_;
};

} // namespace aspect
