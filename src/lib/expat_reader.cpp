#include <xr/expat_reader.hpp>
#include <xr/grammar.hpp>

#include <expat.h>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace xr {

  namespace {

    struct event {
      xml_node_type type = xml_node_type::none;
      qname name;
      std::string value;
      std::string target;
      std::vector<attribute> attributes;
      std::size_t depth = 0;
      bool empty = false;
    };

    using parser_ptr =
        std::unique_ptr<std::remove_pointer_t<XML_Parser>, decltype(&XML_ParserFree)>;

    std::string_view
    trim(std::string_view text) {
      while (!text.empty() && is_whitespace(text.front())) {
        text.remove_prefix(1);
      }
      while (!text.empty() && is_whitespace(text.back())) {
        text.remove_suffix(1);
      }
      return text;
    }

    // Body of a DOCTYPE declaration rebuilt from its parts.
    std::string
    doctype_text(const char* name, const char* sysid, const char* pubid,
                 bool has_internal_subset) {
      std::string text = name;
      if (pubid != nullptr) {
        text += " PUBLIC \"";
        text += pubid;
        text += "\" \"";
        text += sysid != nullptr ? sysid : "";
        text += '"';
      } else if (sysid != nullptr) {
        text += " SYSTEM \"";
        text += sysid;
        text += '"';
      }
      if (has_internal_subset) { text += " [...]"; }
      return text;
    }

  } // namespace

  struct expat_reader::impl {
    std::vector<event> events;
    std::size_t cursor = 0;
    std::size_t current_depth = 0;
    whitespace_handling whitespace;
    XML_Parser parser = nullptr;
    std::string_view input;

    bool text_open = false;
    bool in_cdata = false;
    bool in_doctype = false;
    bool skip_end = false;
    bool eof = false;
    event none;

    explicit impl(whitespace_handling ws) : whitespace(ws) {}

    const event&
    current() const {
      if (cursor == 0 || cursor > events.size()) { return none; }
      return events[cursor - 1];
    }

    // Closes the text run being coalesced and applies the whitespace policy.
    void
    flush_text() {
      if (!text_open) { return; }
      text_open = false;
      auto& ev = events.back();
      if (ev.type != xml_node_type::text) { return; }
      switch (whitespace) {
        case whitespace_handling::preserve:
          break;
        case whitespace_handling::ignore:
          if (is_whitespace(ev.value)) { events.pop_back(); }
          break;
        case whitespace_handling::trim:
          ev.value = std::string(trim(ev.value));
          if (ev.value.empty()) { events.pop_back(); }
          break;
      }
    }

    void
    push(event ev) {
      flush_text();
      events.push_back(std::move(ev));
    }

    bool
    ends_with_empty_tag() const {
      XML_Index index = XML_GetCurrentByteIndex(parser);
      int count = XML_GetCurrentByteCount(parser);
      if (index < 0 || count < 2) { return false; }
      auto end = static_cast<std::size_t>(index) + static_cast<std::size_t>(count);
      return end <= input.size() && input.substr(end - 2, 2) == "/>";
    }

    static void XMLCALL
    on_start_element(void* user_data, const char* name, const char** atts) {
      auto* self = static_cast<impl*>(user_data);
      self->current_depth++;

      event ev;
      ev.type = xml_node_type::start_element;
      ev.name = qname(std::string_view(name));
      ev.depth = self->current_depth;

      for (const char** p = atts; *p != nullptr; p += 2) {
        ev.attributes.emplace_back(qname(std::string_view(p[0])),
                                   std::string(p[1]));
      }

      // A self-closing tag becomes one node; its end callback is dropped.
      if (self->ends_with_empty_tag()) {
        ev.empty = true;
        self->skip_end = true;
      }

      self->push(std::move(ev));
    }

    static void XMLCALL
    on_end_element(void* user_data, const char* name) {
      auto* self = static_cast<impl*>(user_data);
      self->current_depth--;

      if (self->skip_end) {
        self->flush_text();
        self->skip_end = false;
        return;
      }

      event ev;
      ev.type = xml_node_type::end_element;
      ev.name = qname(std::string_view(name));
      ev.depth = self->current_depth;
      self->push(std::move(ev));
    }

    static void XMLCALL
    on_character_data(void* user_data, const char* s, int len) {
      auto* self = static_cast<impl*>(user_data);
      auto length = static_cast<std::size_t>(len);

      // Coalesce adjacent character data into a single event
      if (self->text_open) {
        self->events.back().value.append(s, length);
        return;
      }

      event ev;
      ev.type = xml_node_type::text;
      ev.value.assign(s, length);
      ev.depth = self->current_depth;
      self->push(std::move(ev));
      self->text_open = true;
    }

    static void XMLCALL
    on_start_cdata(void* user_data) {
      auto* self = static_cast<impl*>(user_data);
      event ev;
      ev.type = xml_node_type::cdata;
      ev.depth = self->current_depth;
      self->push(std::move(ev));
      self->in_cdata = true;
      self->text_open = true;
    }

    static void XMLCALL
    on_end_cdata(void* user_data) {
      auto* self = static_cast<impl*>(user_data);
      self->in_cdata = false;
      self->text_open = false;
    }

    static void XMLCALL
    on_comment(void* user_data, const char* data) {
      auto* self = static_cast<impl*>(user_data);
      if (self->in_doctype) { return; }
      event ev;
      ev.type = xml_node_type::comment;
      ev.value = data;
      ev.depth = self->current_depth;
      self->push(std::move(ev));
    }

    static void XMLCALL
    on_processing_instruction(void* user_data, const char* target,
                              const char* data) {
      auto* self = static_cast<impl*>(user_data);
      if (self->in_doctype) { return; }
      event ev;
      ev.type = xml_node_type::processing_instruction;
      ev.name = qname(std::string_view(target));
      ev.target = target;
      ev.value = data;
      ev.depth = self->current_depth;
      self->push(std::move(ev));
    }

    // expat consumes the XML declaration itself; report it as the
    // processing instruction it looks like.
    static void XMLCALL
    on_xml_declaration(void* user_data, const char* version,
                       const char* encoding, int standalone) {
      auto* self = static_cast<impl*>(user_data);
      event ev;
      ev.type = xml_node_type::processing_instruction;
      ev.name = qname("", "xml");
      ev.target = "xml";
      if (version != nullptr) {
        ev.value += "version=\"";
        ev.value += version;
        ev.value += '"';
      }
      if (encoding != nullptr) {
        if (!ev.value.empty()) { ev.value += ' '; }
        ev.value += "encoding=\"";
        ev.value += encoding;
        ev.value += '"';
      }
      if (standalone != -1) {
        if (!ev.value.empty()) { ev.value += ' '; }
        ev.value += standalone == 1 ? "standalone=\"yes\"" : "standalone=\"no\"";
      }
      self->push(std::move(ev));
    }

    static void XMLCALL
    on_start_doctype(void* user_data, const char* doctype_name,
                     const char* sysid, const char* pubid,
                     int has_internal_subset) {
      auto* self = static_cast<impl*>(user_data);
      self->in_doctype = true;

      event ev;
      ev.type = xml_node_type::document_type;
      ev.depth = self->current_depth;

      // Prefer the declaration exactly as written.
      XML_Index index = XML_GetCurrentByteIndex(self->parser);
      std::optional<token_match<doctype_token>> verbatim;
      if (index >= 0 && static_cast<std::size_t>(index) < self->input.size()) {
        verbatim = default_grammar().match_doctype(
            self->input, static_cast<std::size_t>(index));
      }
      ev.value = verbatim ? std::string(verbatim->token.text)
                          : doctype_text(doctype_name, sysid, pubid,
                                         has_internal_subset != 0);
      self->push(std::move(ev));
    }

    static void XMLCALL
    on_end_doctype(void* user_data) {
      static_cast<impl*>(user_data)->in_doctype = false;
    }
  };

  expat_reader::expat_reader(std::string_view xml, reader_options options)
      : impl_(std::make_unique<impl>(options.whitespace)) {
    parser_ptr parser(XML_ParserCreate(nullptr), &XML_ParserFree);
    if (parser == nullptr) {
      throw std::runtime_error("failed to create expat parser");
    }

    impl_->parser = parser.get();
    impl_->input = xml;

    XML_SetUserData(parser.get(), impl_.get());
    XML_SetElementHandler(parser.get(), impl::on_start_element,
                          impl::on_end_element);
    XML_SetCharacterDataHandler(parser.get(), impl::on_character_data);
    XML_SetCdataSectionHandler(parser.get(), impl::on_start_cdata,
                               impl::on_end_cdata);
    XML_SetCommentHandler(parser.get(), impl::on_comment);
    XML_SetProcessingInstructionHandler(parser.get(),
                                        impl::on_processing_instruction);
    XML_SetXmlDeclHandler(parser.get(), impl::on_xml_declaration);
    XML_SetDoctypeDeclHandler(parser.get(), impl::on_start_doctype,
                              impl::on_end_doctype);

    XML_Status status = XML_Parse(parser.get(), xml.data(),
                                  static_cast<int>(xml.size()), XML_TRUE);

    if (status == XML_STATUS_ERROR) {
      XML_Index index = XML_GetCurrentByteIndex(parser.get());
      if (options.on_parse_error && index >= 0) {
        options.on_parse_error(static_cast<std::size_t>(index));
      }
      std::string msg = "XML parse error at line ";
      msg += std::to_string(XML_GetCurrentLineNumber(parser.get()));
      msg += ": ";
      msg += XML_ErrorString(XML_GetErrorCode(parser.get()));
      throw std::runtime_error(msg);
    }

    impl_->flush_text();
    impl_->parser = nullptr;
    impl_->input = {};

    if (impl_->events.empty()) {
      throw std::runtime_error("XML parse error: no content");
    }
  }

  expat_reader::~expat_reader() = default;
  expat_reader::expat_reader(expat_reader&&) noexcept = default;
  expat_reader& expat_reader::operator=(expat_reader&&) noexcept = default;

  bool
  expat_reader::read() {
    if (impl_->cursor >= impl_->events.size()) {
      impl_->cursor = impl_->events.size() + 1;
      impl_->eof = true;
      return false;
    }
    impl_->cursor++;
    return true;
  }

  xml_node_type
  expat_reader::node_type() const {
    return impl_->current().type;
  }

  const qname&
  expat_reader::name() const {
    return impl_->current().name;
  }

  std::string_view
  expat_reader::value() const {
    return impl_->current().value;
  }

  std::string_view
  expat_reader::processing_instruction_target() const {
    return impl_->current().target;
  }

  const std::vector<attribute>&
  expat_reader::attributes() const {
    return impl_->current().attributes;
  }

  std::string_view
  expat_reader::attribute_value(const qname& attr_name) const {
    for (const auto& attr : impl_->current().attributes) {
      if (attr.name() == attr_name) { return attr.value(); }
    }
    return {};
  }

  std::size_t
  expat_reader::depth() const {
    if (impl_->eof) { return 0; }
    return impl_->current().depth;
  }

  bool
  expat_reader::is_empty_element() const {
    return impl_->current().empty;
  }

  bool
  expat_reader::eof() const {
    return impl_->eof;
  }

} // namespace xr
