#pragma once

#include <functional>
#include <utility>

/// A configuration value that is either fixed up front or computed when it is
/// needed (e.g. the current directory at call time).
template <typename T>
class Setting {
public:
    enum class Kind { Static, Computed };

    Setting() = default;

    static Setting fixed(T value) {
        Setting s;
        s.kind_ = Kind::Static;
        s.value_ = std::move(value);
        return s;
    }

    static Setting computed(std::function<T()> fn) {
        Setting s;
        s.kind_ = Kind::Computed;
        s.compute_ = std::move(fn);
        return s;
    }

    Kind kind() const { return kind_; }

    /// Evaluate once per call site; Computed settings run their closure each time
    T resolve() const {
        if (kind_ == Kind::Computed && compute_) {
            return compute_();
        }
        return value_;
    }

private:
    Kind kind_ = Kind::Static;
    T value_{};
    std::function<T()> compute_;
};
