#pragma once

#include <xr/attribute.hpp>
#include <xr/qname.hpp>

#include <cstddef>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

namespace xr {

  struct start_document_event {
    bool
    operator==(const start_document_event&) const = default;
  };

  struct end_document_event {
    bool
    operator==(const end_document_event&) const = default;
  };

  struct start_element_event {
    qname name;
    std::vector<attribute> attributes;
    std::size_t depth = 0; // including this element
    bool empty = false;    // written as <name/>

    bool
    operator==(const start_element_event&) const = default;
  };

  struct end_element_event {
    qname name;
    std::size_t depth = 0; // after the element closed

    bool
    operator==(const end_element_event&) const = default;
  };

  struct characters_event {
    std::string text;
    bool cdata = false;

    bool
    operator==(const characters_event&) const = default;
  };

  struct processing_instruction_event {
    std::string target;
    std::string text;

    bool
    operator==(const processing_instruction_event&) const = default;
  };

  struct doctype_event {
    std::string text;

    bool
    operator==(const doctype_event&) const = default;
  };

  struct comment_event {
    std::string text;

    bool
    operator==(const comment_event&) const = default;
  };

  struct parse_error_event {
    std::size_t position = 0;

    bool
    operator==(const parse_error_event&) const = default;
  };

  using sax_event =
      std::variant<start_document_event, end_document_event,
                   start_element_event, end_element_event, characters_event,
                   processing_instruction_event, doctype_event, comment_event,
                   parse_error_event>;

  // Builds a visitor from lambdas, one per alternative.
  template <typename... Ts>
  struct overloaded : Ts... {
    using Ts::operator()...;
  };

  template <typename... Ts>
  overloaded(Ts...) -> overloaded<Ts...>;

  std::ostream&
  operator<<(std::ostream& os, const sax_event& event);

} // namespace xr
