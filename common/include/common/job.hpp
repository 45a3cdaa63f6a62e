#pragma once

#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

namespace webpool {

// A unit of work with no arguments and no result. Move-only; invoking it
// consumes the stored callable, which is destroyed as soon as the call
// returns or throws.
class Job {
 public:
  Job() = default;

  template <typename F,
            typename = std::enable_if_t<!std::is_same_v<std::decay_t<F>, Job>>>
  Job(F&& fn)  // NOLINT(google-explicit-constructor)
      : impl_(std::make_unique<Model<std::decay_t<F>>>(std::forward<F>(fn))) {
    static_assert(std::is_invocable_v<std::decay_t<F>&>,
                  "Job requires a callable taking no arguments");
  }

  Job(Job&&) noexcept = default;
  Job& operator=(Job&&) noexcept = default;
  Job(const Job&) = delete;
  Job& operator=(const Job&) = delete;

  explicit operator bool() const { return impl_ != nullptr; }

  void operator()() {
    if (!impl_) throw std::bad_function_call();
    auto impl = std::move(impl_);
    impl->run();
  }

 private:
  struct Concept {
    virtual ~Concept() = default;
    virtual void run() = 0;
  };

  template <typename F>
  struct Model : Concept {
    explicit Model(F f) : fn(std::move(f)) {}
    void run() override { fn(); }
    F fn;
  };

  std::unique_ptr<Concept> impl_;
};

}  // namespace webpool
