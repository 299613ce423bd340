#pragma once

#include <xr/sax_event.hpp>
#include <xr/xml_reader.hpp>

#include <functional>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace xr {

  // Drives a reader to exhaustion and turns its nodes into sax_events:
  // start_document, one event per node, end_document. A self-closing element
  // yields a start_element_event followed by a synthesized
  // end_element_event. CDATA arrives as a characters_event with cdata set.
  class event_dispatcher {
  public:
    using sink_type = std::function<void(const sax_event&)>;

    explicit event_dispatcher(
        sink_type sink,
        whitespace_handling whitespace = whitespace_handling::preserve);

    // Parses text with a push_reader. Malformed input is reported as
    // parse_error_events in stream order. An exception thrown by the sink
    // stops the parse and propagates.
    void
    dispatch(std::string_view text) const;

    // Drives an existing reader from its current position.
    void
    dispatch(xml_reader& reader) const;

  private:
    sink_type sink_;
    whitespace_handling whitespace_;
  };

  // Dispatches text to a visitor that must accept every sax_event
  // alternative, e.g. an overloaded{...} with a [](const auto&) {} fallback.
  template <typename Visitor>
  void
  dispatch(std::string_view text, Visitor&& visitor,
           whitespace_handling whitespace = whitespace_handling::preserve) {
    event_dispatcher dispatcher(
        [&visitor](const sax_event& event) { std::visit(visitor, event); },
        whitespace);
    dispatcher.dispatch(text);
  }

  std::vector<sax_event>
  collect_events(std::string_view text,
                 whitespace_handling whitespace = whitespace_handling::preserve);

} // namespace xr
