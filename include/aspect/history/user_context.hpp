#pragma once

#include <string>

namespace aspect {
namespace history {

/**
 * Supplies the actor recorded with each history record.
 */
class UserContextAccessor {
public:
    virtual ~UserContextAccessor() = default;

    virtual std::string current_actor() const = 0;
};

/**
 * Returns a fixed actor, "System" unless another name is given.
 */
class DefaultUserContextAccessor : public UserContextAccessor {
public:
    explicit DefaultUserContextAccessor(const std::string& actor = "")
        : actor_(actor.empty() ? "System" : actor) {}

    std::string current_actor() const override { return actor_; }

private:
    std::string actor_;
};

} // namespace history
} // namespace aspect
