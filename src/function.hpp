#pragma once

#include <cstddef>
#include <memory>
#include <type_traits>
#include <utility>

// A move-only std::function. Completion handlers capture move-only state (unique_ptrs, promises,
// other Functions), which std::function can't hold.
template <typename T>
class Function;

template <typename Ret, typename... Args>
class Function<Ret(Args...)> {
public:
    Function() = default;

    Function(std::nullptr_t) { }

    template <typename Func,
        typename = std::enable_if_t<!std::is_same_v<std::decay_t<Func>, Function>>>
    Function(Func&& func)
        : callable_(std::make_unique<Callable<Func>>(std::forward<Func>(func)))
    {
    }

    Function(const Function&) = delete;
    Function(Function&& other) = default;

    Function& operator=(const Function&) = delete;
    Function& operator=(Function&& other) = default;

    Function& operator=(std::nullptr_t)
    {
        callable_.reset();
        return *this;
    }

    explicit operator bool() const { return static_cast<bool>(callable_); }

    Ret operator()(Args... args) const
    {
        return callable_->operator()(std::forward<Args>(args)...);
    }

private:
    struct CallableBase {
        virtual Ret operator()(Args...) const = 0;
        virtual ~CallableBase() = default;
    };

    template <typename Func>
    struct Callable : public CallableBase {
        // Same trick as std::function: store mutable, so a single const operator() can call
        // mutable lambdas as well.
        mutable std::decay_t<Func> func;

        Callable(Func&& func)
            : func(std::forward<Func>(func))
        {
        }

        Ret operator()(Args... args) const override { return func(std::forward<Args>(args)...); }
    };

    std::unique_ptr<CallableBase> callable_;
};
