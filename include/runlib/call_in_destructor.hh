#pragma once

#include <utility>

template <class Func>
class CallInDtor {
    Func func_;
    bool make_call_ = true;

public:
    // NOLINTNEXTLINE(google-explicit-constructor)
    CallInDtor(Func func) try
    : func_(std::move(func)) {
    } catch (...) {
        func();
        throw;
    }

    CallInDtor(const CallInDtor&) = delete;
    CallInDtor(CallInDtor&&) = delete;
    CallInDtor& operator=(const CallInDtor&) = delete;
    CallInDtor& operator=(CallInDtor&&) = delete;

    [[nodiscard]] bool active() const noexcept { return make_call_; }

    void cancel() noexcept { make_call_ = false; }

    auto call_and_cancel() {
        make_call_ = false;
        return func_();
    }

    ~CallInDtor() {
        if (make_call_) {
            try {
                func_();
            } catch (...) {
            } // We cannot throw
        }
    }
};
