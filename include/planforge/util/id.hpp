#pragma once

#include <algorithm>
#include <cctype>
#include <compare>
#include <format>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace planforge {

[[nodiscard]] inline auto is_valid_id_text(std::string_view value) noexcept
    -> bool {
  return !value.empty() &&
         std::none_of(value.begin(), value.end(), [](unsigned char ch) {
           return std::iscntrl(ch) != 0;
         });
}

struct PlanTag {};
struct TaskTag {};
struct ExecutionTag {};

// Phantom-typed string id: a TaskId cannot be passed where an ExecutionId
// is expected.
template <typename Tag> class TypedId {
public:
  TypedId() = default;
  explicit TypedId(std::string value) : value_(std::move(value)) {}
  explicit TypedId(std::string_view value) : value_(value) {}
  explicit TypedId(const char *value) : value_(value ? value : "") {}

  [[nodiscard]] auto value() const noexcept -> std::string_view {
    return value_;
  }
  [[nodiscard]] auto str() const noexcept -> const std::string & {
    return value_;
  }
  [[nodiscard]] auto empty() const noexcept -> bool { return value_.empty(); }

  [[nodiscard]] friend auto operator<=>(const TypedId &lhs,
                                        const TypedId &rhs) = default;
  [[nodiscard]] friend auto operator==(const TypedId &lhs, const TypedId &rhs)
      -> bool = default;

  [[nodiscard]] friend auto operator==(const TypedId &lhs,
                                       std::string_view rhs) noexcept -> bool {
    return lhs.value_ == rhs;
  }

private:
  std::string value_;
};

using PlanId = TypedId<PlanTag>;
using TaskId = TypedId<TaskTag>;
using ExecutionId = TypedId<ExecutionTag>;

template <typename Tag>
inline auto operator<<(std::ostream &os, const TypedId<Tag> &id)
    -> std::ostream & {
  return os << id.value();
}

namespace detail {
// 48-bit epoch millis followed by 64 random bits, hex encoded. Ids sort by
// creation time.
[[nodiscard]] auto generate_time_ordered_id() -> std::string;
} // namespace detail

[[nodiscard]] inline auto generate_execution_id() -> ExecutionId {
  return ExecutionId{detail::generate_time_ordered_id()};
}

} // namespace planforge

// `is_avalanching` lets ankerl::unordered_dense use this hash directly
// instead of re-mixing it.
template <typename Tag> struct std::hash<planforge::TypedId<Tag>> {
  using is_avalanching = void;
  auto operator()(const planforge::TypedId<Tag> &id) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(id.value());
  }
};

template <typename Tag>
struct std::formatter<planforge::TypedId<Tag>>
    : std::formatter<std::string_view> {
  auto format(const planforge::TypedId<Tag> &id, auto &ctx) const {
    return std::formatter<std::string_view>::format(id.value(), ctx);
  }
};
