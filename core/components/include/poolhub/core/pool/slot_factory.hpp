#pragma once

/**
 * @file slot_factory.hpp
 * @brief Construction and reset of pooled resources
 */

#include <poolhub/core/pool/pool_types.hpp>

#include <functional>
#include <memory>
#include <string_view>

namespace poolhub::core::pool {

/**
 * @brief Builds and scrubs pooled resources for a kind
 *
 * Implementations may throw; LocalPool converts exceptions to FACTORY_ERROR.
 */
class PoolSlotFactory {
public:
    virtual ~PoolSlotFactory() = default;

    /**
     * @brief Construct a new resource of the given kind
     * @return Owning pointer, nullptr is treated as a construction failure
     */
    virtual std::shared_ptr<void> create(std::string_view kind) = 0;

    /**
     * @brief Clear per-borrower state before the slot is reused
     */
    virtual void reset(PooledObject& object) = 0;
};

/**
 * @brief Factory built from two callables
 */
class FunctionSlotFactory : public PoolSlotFactory {
public:
    using CreateFn = std::function<std::shared_ptr<void>(std::string_view)>;
    using ResetFn  = std::function<void(PooledObject&)>;

    FunctionSlotFactory(CreateFn create_fn, ResetFn reset_fn = {})
        : create_fn_(std::move(create_fn)), reset_fn_(std::move(reset_fn)) {}

    std::shared_ptr<void> create(std::string_view kind) override {
        return create_fn_ ? create_fn_(kind) : nullptr;
    }

    void reset(PooledObject& object) override {
        if (reset_fn_)
            reset_fn_(object);
    }

private:
    CreateFn create_fn_;
    ResetFn reset_fn_;
};

/**
 * @brief Factory for default-constructible resources of type T
 *
 * @tparam T Resource type
 */
template <typename T>
class TypedSlotFactory : public PoolSlotFactory {
public:
    using ResetFn = std::function<void(T&)>;

    explicit TypedSlotFactory(ResetFn reset_fn = {}) : reset_fn_(std::move(reset_fn)) {}

    std::shared_ptr<void> create(std::string_view /*kind*/) override {
        return std::make_shared<T>();
    }

    void reset(PooledObject& object) override {
        auto* value = object.as<T>();
        if (value == nullptr)
            return;
        if (reset_fn_) {
            reset_fn_(*value);
        } else {
            *value = T{};
        }
    }

private:
    ResetFn reset_fn_;
};

}  // namespace poolhub::core::pool
