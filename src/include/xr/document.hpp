#pragma once

#include <xr/qname.hpp>
#include <xr/xml_reader.hpp>

#include <cstddef>
#include <limits>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace xr {

  enum class node_kind {
    document,
    element,
    attribute,
    text,
    cdata,
    comment,
    processing_instruction,
    document_type,
  };

  std::ostream&
  operator<<(std::ostream& os, node_kind kind);

  // Index of a node in its document's arena.
  using node_id = std::size_t;

  inline constexpr node_id no_node = std::numeric_limits<node_id>::max();

  struct node {
    node_kind kind = node_kind::document;
    qname name;                     // element, attribute, PI target
    std::string value;              // attribute value, character content
    node_id parent = no_node;       // owner element for attributes
    std::vector<node_id> children;  // document and element
    std::vector<node_id> attributes; // element
  };

  // A rooted tree of markup nodes stored in one arena. Node 0 is the
  // document node. Parent links are plain indices, so nodes never own each
  // other and the tree is freely copyable.
  class document {
    std::vector<node> nodes_;

  public:
    document();

    // Builds the tree from the reader's remaining nodes. Unbalanced input
    // is tolerated: an end tag closes up to the nearest open element of the
    // same name and is ignored when none is open; elements still open at
    // the end of input stay as they are.
    explicit document(xml_reader& reader);

    // Reads text with a push_reader.
    static document
    parse(std::string_view text, reader_options options = {});

    node_id
    root() const {
      return 0;
    }

    std::size_t
    size() const {
      return nodes_.size();
    }

    // Throws std::out_of_range for an id not in this document.
    const node&
    at(node_id id) const;

    node_kind
    kind(node_id id) const {
      return at(id).kind;
    }

    node_id
    parent(node_id id) const {
      return at(id).parent;
    }

    // The element's start/end tags and attributes contribute nothing; text
    // and CDATA descendants are concatenated in document order.
    std::string
    text_content(node_id id) const;

    // Appending throws std::invalid_argument when the parent cannot hold the
    // new node (children need a document or element, attributes an element).
    node_id
    append_element(node_id parent, qname name);

    node_id
    append_attribute(node_id element, qname name, std::string value);

    node_id
    append_text(node_id parent, std::string text);

    node_id
    append_cdata(node_id parent, std::string text);

    node_id
    append_comment(node_id parent, std::string text);

    node_id
    append_processing_instruction(node_id parent, std::string_view target,
                                  std::string text);

    node_id
    append_document_type(node_id parent, std::string text);

  private:
    node_id
    append_child(node_id parent, node_kind kind, qname name, std::string value);
  };

  // One line describing the node, e.g. `element title` or `text "XML"`.
  std::string
  describe(const document& doc, node_id id);

} // namespace xr
