#pragma once

#include <compare>
#include <cstddef>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace xr {

  // A qualified name as written in the markup: an optional prefix and a local
  // name. Prefixes are kept verbatim; no namespace resolution takes place.
  class qname {
    std::string prefix_;
    std::string local_name_;

  public:
    qname() = default;

    qname(std::string prefix, std::string local_name)
        : prefix_(std::move(prefix)), local_name_(std::move(local_name)) {}

    // Splits "prefix:local" at the first colon.
    explicit qname(std::string_view qualified) {
      auto colon = qualified.find(':');
      if (colon == std::string_view::npos) {
        local_name_ = std::string(qualified);
      } else {
        prefix_ = std::string(qualified.substr(0, colon));
        local_name_ = std::string(qualified.substr(colon + 1));
      }
    }

    const std::string&
    prefix() const {
      return prefix_;
    }

    const std::string&
    local_name() const {
      return local_name_;
    }

    std::string
    qualified() const {
      if (prefix_.empty()) { return local_name_; }
      return prefix_ + ':' + local_name_;
    }

    bool
    empty() const {
      return prefix_.empty() && local_name_.empty();
    }

    auto
    operator<=>(const qname&) const = default;

    bool
    operator==(const qname&) const = default;

    friend std::ostream&
    operator<<(std::ostream& os, const qname& q) {
      if (q.prefix_.empty()) { return os << q.local_name_; }
      return os << q.prefix_ << ':' << q.local_name_;
    }
  };

} // namespace xr

template <>
struct std::hash<xr::qname> {
  std::size_t
  operator()(const xr::qname& q) const noexcept {
    std::size_t h1 = std::hash<std::string>{}(q.prefix());
    std::size_t h2 = std::hash<std::string>{}(q.local_name());
    return h1 ^ (h2 << 1);
  }
};
