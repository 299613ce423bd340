#include <xr/event_dispatcher.hpp>
#include <xr/push_reader.hpp>
#include <xr/xml_escape.hpp>

#include <string>

namespace xr {

  std::ostream&
  operator<<(std::ostream& os, const sax_event& event) {
    std::visit(
        overloaded{
            [&os](const start_document_event&) { os << "start_document"; },
            [&os](const end_document_event&) { os << "end_document"; },
            [&os](const start_element_event& e) {
              os << "start_element " << e.name;
              for (const auto& attr : e.attributes) {
                os << ' ' << attr;
              }
              if (e.empty) { os << " /"; }
              os << " @" << e.depth;
            },
            [&os](const end_element_event& e) {
              os << "end_element " << e.name << " @" << e.depth;
            },
            [&os](const characters_event& e) {
              os << (e.cdata ? "cdata \"" : "characters \"");
              escape_attribute(os, e.text);
              os << '"';
            },
            [&os](const processing_instruction_event& e) {
              os << "processing_instruction " << e.target << " \"";
              escape_attribute(os, e.text);
              os << '"';
            },
            [&os](const doctype_event& e) {
              os << "doctype \"";
              escape_attribute(os, e.text);
              os << '"';
            },
            [&os](const comment_event& e) {
              os << "comment \"";
              escape_attribute(os, e.text);
              os << '"';
            },
            [&os](const parse_error_event& e) {
              os << "parse_error " << e.position;
            },
        },
        event);
    return os;
  }

  event_dispatcher::event_dispatcher(sink_type sink,
                                     whitespace_handling whitespace)
      : sink_(std::move(sink)), whitespace_(whitespace) {}

  void
  event_dispatcher::dispatch(std::string_view text) const {
    reader_options options;
    options.whitespace = whitespace_;
    options.on_parse_error = [this](std::size_t position) {
      sink_(parse_error_event{position});
    };
    push_reader reader(std::string(text), std::move(options));
    dispatch(reader);
  }

  void
  event_dispatcher::dispatch(xml_reader& reader) const {
    sink_(start_document_event{});
    while (reader.read()) {
      switch (reader.node_type()) {
        case xml_node_type::text:
          sink_(characters_event{std::string(reader.value()), false});
          break;
        case xml_node_type::cdata:
          sink_(characters_event{std::string(reader.value()), true});
          break;
        case xml_node_type::start_element:
          sink_(start_element_event{reader.name(), reader.attributes(),
                                    reader.depth(), reader.is_empty_element()});
          if (reader.is_empty_element()) {
            sink_(end_element_event{reader.name(), reader.depth() - 1});
          }
          break;
        case xml_node_type::end_element:
          sink_(end_element_event{reader.name(), reader.depth()});
          break;
        case xml_node_type::comment:
          sink_(comment_event{std::string(reader.value())});
          break;
        case xml_node_type::processing_instruction:
          sink_(processing_instruction_event{
              std::string(reader.processing_instruction_target()),
              std::string(reader.value())});
          break;
        case xml_node_type::document_type:
          sink_(doctype_event{std::string(reader.value())});
          break;
        case xml_node_type::none:
          break;
      }
    }
    sink_(end_document_event{});
  }

  std::vector<sax_event>
  collect_events(std::string_view text, whitespace_handling whitespace) {
    std::vector<sax_event> events;
    event_dispatcher dispatcher(
        [&events](const sax_event& event) { events.push_back(event); },
        whitespace);
    dispatcher.dispatch(text);
    return events;
  }

} // namespace xr
