#pragma once

#include <optional>

namespace mosaic::registry {

/// At most one mutating call in flight per registry. A call that arrives while
/// another is running gets no guard and must fail.
class single_flight final {
 public:
  class guard final {
   public:
    explicit guard(bool& flag) : flag_{&flag} { *flag_ = true; }
    guard(const guard&) = delete;
    guard& operator=(const guard&) = delete;
    guard(guard&& other) noexcept : flag_{other.flag_} {
      other.flag_ = nullptr;
    }
    guard& operator=(guard&&) = delete;
    ~guard() {
      if (flag_ != nullptr) {
        *flag_ = false;
      }
    }

   private:
    bool* flag_;
  };

  std::optional<guard> try_enter() {
    if (in_flight_) {
      return std::nullopt;
    }
    return std::optional<guard>{std::in_place, in_flight_};
  }

 private:
  bool in_flight_{false};
};

}  // namespace mosaic::registry
