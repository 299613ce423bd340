#include <xr/push_reader.hpp>

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace xr {

  namespace {

    enum class step {
      node,    // a node is available
      skipped, // input was consumed without producing a node
      none,    // no recognizer matched
    };

    std::string_view
    trim(std::string_view text) {
      std::size_t first = 0;
      while (first < text.size() && is_whitespace(text[first])) {
        ++first;
      }
      std::size_t last = text.size();
      while (last > first && is_whitespace(text[last - 1])) {
        --last;
      }
      return text.substr(first, last - first);
    }

  } // namespace

  struct push_reader::impl {
    std::string buffer;
    reader_options options;
    const token_grammar* grammar;
    std::size_t position = 0;

    xml_node_type type = xml_node_type::none;
    qname name;
    std::string value;
    std::string target;
    std::vector<attribute> attributes;
    std::size_t depth = 0;
    bool empty_element = false;
    bool eof = false;

    impl(std::string text, reader_options opts, const token_grammar& g)
        : buffer(std::move(text)), options(std::move(opts)), grammar(&g) {}

    template <typename T>
    std::size_t
    checked_end(const token_match<T>& match) const {
      if (match.end <= position || match.end > buffer.size()) {
        throw std::logic_error("token grammar returned a match ending at " +
                               std::to_string(match.end) + " for position " +
                               std::to_string(position) + " in a buffer of " +
                               std::to_string(buffer.size()) + " bytes");
      }
      return match.end;
    }

    void
    reset_node() {
      type = xml_node_type::none;
      name = qname{};
      value.clear();
      target.clear();
      attributes.clear();
      empty_element = false;
    }

    step
    recognize() {
      std::string_view input = buffer;

      if (auto m = grammar->match_character_data(input, position)) {
        position = checked_end(*m);
        std::string_view text = m->token.text;
        switch (options.whitespace) {
          case whitespace_handling::preserve:
            break;
          case whitespace_handling::ignore:
            if (is_whitespace(text)) { return step::skipped; }
            break;
          case whitespace_handling::trim:
            text = trim(text);
            if (text.empty()) { return step::skipped; }
            break;
        }
        type = xml_node_type::text;
        value = std::string(text);
        return step::node;
      }

      if (auto m = grammar->match_element_start(input, position)) {
        position = checked_end(*m);
        type = xml_node_type::start_element;
        name = std::move(m->token.name);
        attributes = std::move(m->token.attributes);
        empty_element = m->token.self_closing();
        ++depth;
        return step::node;
      }

      if (auto m = grammar->match_element_end(input, position)) {
        position = checked_end(*m);
        type = xml_node_type::end_element;
        name = std::move(m->token.name);
        // Stray end tags leave the depth at zero.
        if (depth > 0) { --depth; }
        return step::node;
      }

      if (auto m = grammar->match_comment(input, position)) {
        position = checked_end(*m);
        type = xml_node_type::comment;
        value = std::string(m->token.text);
        return step::node;
      }

      if (auto m = grammar->match_cdata(input, position)) {
        position = checked_end(*m);
        type = xml_node_type::cdata;
        value = std::string(m->token.text);
        return step::node;
      }

      if (auto m = grammar->match_processing_instruction(input, position)) {
        position = checked_end(*m);
        type = xml_node_type::processing_instruction;
        target = std::string(m->token.target);
        name = qname(m->token.target);
        value = std::string(m->token.text);
        return step::node;
      }

      if (auto m = grammar->match_doctype(input, position)) {
        position = checked_end(*m);
        type = xml_node_type::document_type;
        value = std::string(m->token.text);
        return step::node;
      }

      return step::none;
    }
  };

  push_reader::push_reader(std::string text, reader_options options)
      : push_reader(std::move(text), std::move(options), default_grammar()) {}

  push_reader::push_reader(std::string text, bool ignore_whitespace,
                           parse_error_handler on_parse_error)
      : push_reader(std::move(text),
                    reader_options{ignore_whitespace
                                       ? whitespace_handling::ignore
                                       : whitespace_handling::preserve,
                                   std::move(on_parse_error)}) {}

  push_reader::push_reader(std::string text, reader_options options,
                           const token_grammar& grammar)
      : impl_(std::make_unique<impl>(std::move(text), std::move(options),
                                     grammar)) {}

  push_reader::~push_reader() = default;
  push_reader::push_reader(push_reader&&) noexcept = default;
  push_reader& push_reader::operator=(push_reader&&) noexcept = default;

  bool
  push_reader::read() {
    auto& s = *impl_;
    if (s.eof) { return false; }

    // Release the depth held by a self-closing element.
    if (s.empty_element) { --s.depth; }
    s.reset_node();

    for (;;) {
      switch (s.recognize()) {
        case step::node:
          return true;
        case step::skipped:
          continue;
        case step::none:
          break;
      }

      if (s.position >= s.buffer.size()) {
        s.eof = true;
        return false;
      }

      if (s.options.on_parse_error) { s.options.on_parse_error(s.position); }
      ++s.position;
    }
  }

  xml_node_type
  push_reader::node_type() const {
    return impl_->type;
  }

  const qname&
  push_reader::name() const {
    return impl_->name;
  }

  std::string_view
  push_reader::value() const {
    return impl_->value;
  }

  std::string_view
  push_reader::processing_instruction_target() const {
    return impl_->target;
  }

  const std::vector<attribute>&
  push_reader::attributes() const {
    return impl_->attributes;
  }

  std::string_view
  push_reader::attribute_value(const qname& attr_name) const {
    for (const auto& attr : impl_->attributes) {
      if (attr.name() == attr_name) { return attr.value(); }
    }
    return {};
  }

  std::size_t
  push_reader::depth() const {
    return impl_->depth;
  }

  bool
  push_reader::is_empty_element() const {
    return impl_->empty_element;
  }

  bool
  push_reader::eof() const {
    return impl_->eof;
  }

  std::size_t
  push_reader::position() const {
    return impl_->position;
  }

  whitespace_handling
  push_reader::whitespace() const {
    return impl_->options.whitespace;
  }

  std::ostream&
  operator<<(std::ostream& os, const push_reader& reader) {
    const auto& s = *reader.impl_;
    if (s.eof) { return os << "push_reader{eof}"; }
    os << "push_reader{" << s.depth << ' ' << s.type;
    if (!s.name.empty()) { os << ' ' << s.name; }
    if (!s.value.empty()) {
      os << " \"";
      escape_attribute(os, s.value);
      os << '"';
    }
    for (const auto& attr : s.attributes) {
      os << ' ' << attr;
    }
    return os << '}';
  }

} // namespace xr
