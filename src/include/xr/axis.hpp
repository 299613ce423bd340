#pragma once

#include <xr/document.hpp>

#include <cstddef>
#include <iterator>
#include <optional>
#include <ostream>
#include <string_view>
#include <utility>
#include <vector>

namespace xr {

  enum class axis {
    ancestors,
    descendants,
    preceding,
    following,
  };

  std::ostream&
  operator<<(std::ostream& os, axis a);

  // "ancestors", "ancestor", "descendants", ... as accepted on the command
  // line; std::nullopt for anything else.
  std::optional<axis>
  axis_from_name(std::string_view name);

  // Single-pass walk of one axis in document order (ancestors go nearest
  // first). Work is done on demand in next(); sibling walks keep an explicit
  // stack of pending subtrees, so deep trees do not recurse.
  //
  // Document order puts an element's attributes right after the element and
  // before its children. The four axes of a node and the node itself
  // partition the document.
  class axis_cursor {
  public:
    // Throws std::out_of_range if origin is not in doc.
    axis_cursor(const document& doc, node_id origin, axis which);

    // The next node, or std::nullopt once exhausted. Keeps returning
    // std::nullopt after that.
    std::optional<node_id>
    next();

  private:
    void
    expand(node_id id);

    template <typename It>
    void
    push_reversed(It first, It last) {
      pending_.insert(pending_.end(), std::make_reverse_iterator(last),
                      std::make_reverse_iterator(first));
    }

    bool
    refill_following();

    bool
    refill_preceding();

    const document* doc_;
    axis axis_;
    node_id scope_;
    std::vector<node_id> pending_; // subtrees to emit, top is next
    std::vector<node_id> path_;    // root .. origin, preceding only
    std::size_t level_ = 0;
  };

  // Restartable, lazily evaluated view of an axis. Every begin() starts a
  // fresh cursor. The document must outlive the view and stay unmodified
  // while it is iterated.
  class axis_view {
  public:
    class iterator {
    public:
      using iterator_concept = std::input_iterator_tag;
      using iterator_category = std::input_iterator_tag;
      using value_type = node_id;
      using difference_type = std::ptrdiff_t;
      using reference = node_id;
      using pointer = void;

      iterator() = default;

      explicit iterator(axis_cursor cursor)
          : cursor_(std::move(cursor)), current_(cursor_->next()) {}

      node_id
      operator*() const {
        return *current_;
      }

      iterator&
      operator++() {
        current_ = cursor_->next();
        return *this;
      }

      void
      operator++(int) {
        ++*this;
      }

      friend bool
      operator==(const iterator& it, std::default_sentinel_t) {
        return !it.current_.has_value();
      }

    private:
      std::optional<axis_cursor> cursor_;
      std::optional<node_id> current_;
    };

    axis_view(const document& doc, node_id origin, axis which)
        : doc_(&doc), origin_(origin), axis_(which) {}

    iterator
    begin() const {
      return iterator(cursor());
    }

    std::default_sentinel_t
    end() const {
      return {};
    }

    axis_cursor
    cursor() const {
      return axis_cursor(*doc_, origin_, axis_);
    }

    bool
    empty() const {
      return !cursor().next().has_value();
    }

    std::vector<node_id>
    to_vector() const;

  private:
    const document* doc_;
    node_id origin_;
    axis axis_;
  };

  // Parent, grandparent, ... up to and including the document node.
  axis_view
  ancestors(const document& doc, node_id id);

  // The subtree below id in document order, attributes included.
  axis_view
  descendants(const document& doc, node_id id);

  // Nodes before id in document order that are not its ancestors.
  axis_view
  preceding(const document& doc, node_id id);

  // Nodes after id in document order that are not its descendants.
  axis_view
  following(const document& doc, node_id id);

  // Every node of the document, starting with the root.
  std::vector<node_id>
  document_order(const document& doc);

  // Negative if a comes before b in document order, positive if after,
  // zero if they are the same node.
  int
  compare_document_order(const document& doc, node_id a, node_id b);

} // namespace xr
