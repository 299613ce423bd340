#include <xr/axis.hpp>
#include <xr/document.hpp>
#include <xr/push_reader.hpp>
#include <xr/xml_escape.hpp>

#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace xr {

  std::ostream&
  operator<<(std::ostream& os, node_kind kind) {
    switch (kind) {
      case node_kind::document:
        return os << "document";
      case node_kind::element:
        return os << "element";
      case node_kind::attribute:
        return os << "attribute";
      case node_kind::text:
        return os << "text";
      case node_kind::cdata:
        return os << "cdata";
      case node_kind::comment:
        return os << "comment";
      case node_kind::processing_instruction:
        return os << "processing_instruction";
      case node_kind::document_type:
        return os << "document_type";
    }
    return os << "unknown";
  }

  document::document() {
    nodes_.emplace_back();
  }

  document::document(xml_reader& reader) : document() {
    std::vector<node_id> open{root()};

    while (reader.read()) {
      node_id top = open.back();
      switch (reader.node_type()) {
        case xml_node_type::start_element: {
          node_id element = append_element(top, reader.name());
          for (const auto& attr : reader.attributes()) {
            append_attribute(element, attr.name(), attr.value());
          }
          if (!reader.is_empty_element()) { open.push_back(element); }
          break;
        }
        case xml_node_type::end_element: {
          for (std::size_t i = open.size(); i > 1; --i) {
            if (nodes_[open[i - 1]].name == reader.name()) {
              open.resize(i - 1);
              break;
            }
          }
          break;
        }
        case xml_node_type::text:
          append_text(top, std::string(reader.value()));
          break;
        case xml_node_type::cdata:
          append_cdata(top, std::string(reader.value()));
          break;
        case xml_node_type::comment:
          append_comment(top, std::string(reader.value()));
          break;
        case xml_node_type::processing_instruction:
          append_processing_instruction(top,
                                        reader.processing_instruction_target(),
                                        std::string(reader.value()));
          break;
        case xml_node_type::document_type:
          append_document_type(top, std::string(reader.value()));
          break;
        case xml_node_type::none:
          break;
      }
    }
  }

  document
  document::parse(std::string_view text, reader_options options) {
    push_reader reader(std::string(text), std::move(options));
    return document(reader);
  }

  const node&
  document::at(node_id id) const {
    if (id >= nodes_.size()) {
      throw std::out_of_range("node " + std::to_string(id) +
                              " is not in a document of " +
                              std::to_string(nodes_.size()) + " nodes");
    }
    return nodes_[id];
  }

  std::string
  document::text_content(node_id id) const {
    const auto& n = at(id);
    if (n.kind != node_kind::document && n.kind != node_kind::element) {
      return n.value;
    }
    std::string result;
    for (node_id d : descendants(*this, id)) {
      auto k = nodes_[d].kind;
      if (k == node_kind::text || k == node_kind::cdata) {
        result += nodes_[d].value;
      }
    }
    return result;
  }

  node_id
  document::append_child(node_id parent, node_kind kind, qname name,
                         std::string value) {
    auto parent_kind = at(parent).kind;
    if (parent_kind != node_kind::document && parent_kind != node_kind::element) {
      std::ostringstream msg;
      msg << "cannot append a " << kind << " to a " << parent_kind;
      throw std::invalid_argument(msg.str());
    }

    node_id id = nodes_.size();
    node n;
    n.kind = kind;
    n.name = std::move(name);
    n.value = std::move(value);
    n.parent = parent;
    nodes_.push_back(std::move(n));
    nodes_[parent].children.push_back(id);
    return id;
  }

  node_id
  document::append_element(node_id parent, qname name) {
    return append_child(parent, node_kind::element, std::move(name), {});
  }

  node_id
  document::append_attribute(node_id element, qname name, std::string value) {
    auto owner_kind = at(element).kind;
    if (owner_kind != node_kind::element) {
      std::ostringstream msg;
      msg << "cannot append an attribute to a " << owner_kind;
      throw std::invalid_argument(msg.str());
    }

    node_id id = nodes_.size();
    node n;
    n.kind = node_kind::attribute;
    n.name = std::move(name);
    n.value = std::move(value);
    n.parent = element;
    nodes_.push_back(std::move(n));
    nodes_[element].attributes.push_back(id);
    return id;
  }

  node_id
  document::append_text(node_id parent, std::string text) {
    return append_child(parent, node_kind::text, {}, std::move(text));
  }

  node_id
  document::append_cdata(node_id parent, std::string text) {
    return append_child(parent, node_kind::cdata, {}, std::move(text));
  }

  node_id
  document::append_comment(node_id parent, std::string text) {
    return append_child(parent, node_kind::comment, {}, std::move(text));
  }

  node_id
  document::append_processing_instruction(node_id parent,
                                          std::string_view target,
                                          std::string text) {
    return append_child(parent, node_kind::processing_instruction,
                        qname(target), std::move(text));
  }

  node_id
  document::append_document_type(node_id parent, std::string text) {
    return append_child(parent, node_kind::document_type, {}, std::move(text));
  }

  std::string
  describe(const document& doc, node_id id) {
    const auto& n = doc.at(id);
    std::ostringstream os;
    os << n.kind;
    switch (n.kind) {
      case node_kind::document:
        break;
      case node_kind::element:
        os << ' ' << n.name;
        break;
      case node_kind::attribute:
      case node_kind::processing_instruction:
        os << ' ' << n.name << " \"";
        escape_attribute(os, n.value);
        os << '"';
        break;
      case node_kind::text:
      case node_kind::cdata:
      case node_kind::comment:
      case node_kind::document_type:
        os << " \"";
        escape_attribute(os, n.value);
        os << '"';
        break;
    }
    return os.str();
  }

} // namespace xr
