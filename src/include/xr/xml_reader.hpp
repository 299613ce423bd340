#pragma once

#include <xr/attribute.hpp>
#include <xr/qname.hpp>

#include <cstddef>
#include <functional>
#include <ostream>
#include <string_view>
#include <vector>

namespace xr {

  enum class xml_node_type {
    none,
    text,
    cdata,
    start_element,
    end_element,
    comment,
    processing_instruction,
    document_type,
  };

  inline std::ostream&
  operator<<(std::ostream& os, xml_node_type type) {
    switch (type) {
      case xml_node_type::none:
        return os << "none";
      case xml_node_type::text:
        return os << "text";
      case xml_node_type::cdata:
        return os << "cdata";
      case xml_node_type::start_element:
        return os << "start_element";
      case xml_node_type::end_element:
        return os << "end_element";
      case xml_node_type::comment:
        return os << "comment";
      case xml_node_type::processing_instruction:
        return os << "processing_instruction";
      case xml_node_type::document_type:
        return os << "document_type";
    }
    return os << "unknown";
  }

  enum class whitespace_handling {
    preserve, // every text run is reported verbatim
    ignore,   // whitespace-only runs are dropped
    trim,     // whitespace-only runs are dropped, others trimmed
  };

  // Receives the byte offset of malformed input.
  using parse_error_handler = std::function<void(std::size_t position)>;

  struct reader_options {
    whitespace_handling whitespace = whitespace_handling::ignore;
    parse_error_handler on_parse_error;
  };

  // Pull interface over a stream of markup nodes.
  //
  // Depth counts open elements: a start_element reports the depth including
  // itself, an end_element the depth after it closed. A self-closing element
  // is a single start_element with is_empty_element() set; its depth is
  // released on the following read() and no end_element is reported for it.
  class xml_reader {
  public:
    virtual ~xml_reader() = default;

    // Advances to the next node. Returns false once the input is exhausted,
    // and keeps returning false afterwards.
    virtual bool
    read() = 0;

    virtual xml_node_type
    node_type() const = 0;

    virtual const qname&
    name() const = 0;

    // Text of a text, cdata or comment node, the data of a processing
    // instruction, or the body of a document type declaration.
    virtual std::string_view
    value() const = 0;

    virtual std::string_view
    processing_instruction_target() const = 0;

    // Empty unless node_type() is start_element.
    virtual const std::vector<attribute>&
    attributes() const = 0;

    virtual std::string_view
    attribute_value(const qname& name) const = 0;

    virtual std::size_t
    depth() const = 0;

    virtual bool
    is_empty_element() const = 0;

    virtual bool
    eof() const = 0;
  };

} // namespace xr
