#pragma once

#include <xr/qname.hpp>
#include <xr/xml_escape.hpp>

#include <compare>
#include <functional>
#include <ostream>
#include <string>
#include <utility>

namespace xr {

  // A name/value pair from an element start tag. The value has its
  // character and entity references already decoded.
  class attribute {
    qname name_;
    std::string value_;

  public:
    attribute() = default;

    attribute(qname name, std::string value)
        : name_(std::move(name)), value_(std::move(value)) {}

    const qname&
    name() const {
      return name_;
    }

    const std::string&
    value() const {
      return value_;
    }

    auto
    operator<=>(const attribute&) const = default;
    bool
    operator==(const attribute&) const = default;

    friend std::ostream&
    operator<<(std::ostream& os, const attribute& a) {
      os << a.name_ << "=\"";
      escape_attribute(os, a.value_);
      return os << '"';
    }
  };

} // namespace xr

template <>
struct std::hash<xr::attribute> {
  std::size_t
  operator()(const xr::attribute& a) const noexcept {
    std::size_t h1 = std::hash<xr::qname>{}(a.name());
    std::size_t h2 = std::hash<std::string>{}(a.value());
    return h1 ^ (h2 << 1);
  }
};
