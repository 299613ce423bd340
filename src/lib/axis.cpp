#include <xr/axis.hpp>

#include <algorithm>

namespace xr {

  namespace {

    std::vector<node_id>
    path_from_root(const document& doc, node_id id) {
      std::vector<node_id> path;
      for (node_id n = id; n != no_node; n = doc.parent(n)) {
        path.push_back(n);
      }
      std::reverse(path.begin(), path.end());
      return path;
    }

    // Position of a node among its parent's attributes followed by its
    // children.
    std::size_t
    sibling_rank(const document& doc, node_id id) {
      const node& n = doc.at(id);
      const node& p = doc.at(n.parent);
      if (n.kind == node_kind::attribute) {
        auto it = std::find(p.attributes.begin(), p.attributes.end(), id);
        return static_cast<std::size_t>(it - p.attributes.begin());
      }
      auto it = std::find(p.children.begin(), p.children.end(), id);
      return p.attributes.size() +
             static_cast<std::size_t>(it - p.children.begin());
    }

  } // namespace

  std::ostream&
  operator<<(std::ostream& os, axis a) {
    switch (a) {
      case axis::ancestors:
        return os << "ancestors";
      case axis::descendants:
        return os << "descendants";
      case axis::preceding:
        return os << "preceding";
      case axis::following:
        return os << "following";
    }
    return os << "unknown";
  }

  std::optional<axis>
  axis_from_name(std::string_view name) {
    if (name == "ancestors" || name == "ancestor") { return axis::ancestors; }
    if (name == "descendants" || name == "descendant") {
      return axis::descendants;
    }
    if (name == "preceding") { return axis::preceding; }
    if (name == "following") { return axis::following; }
    return std::nullopt;
  }

  // ---------------------------------------------------------------------------
  // axis_cursor
  // ---------------------------------------------------------------------------

  axis_cursor::axis_cursor(const document& doc, node_id origin, axis which)
      : doc_(&doc), axis_(which), scope_(origin) {
    doc.at(origin); // rejects an unknown origin up front
    switch (which) {
      case axis::ancestors:
      case axis::following:
        break;
      case axis::descendants:
        expand(origin);
        break;
      case axis::preceding:
        path_ = path_from_root(doc, origin);
        break;
    }
  }

  std::optional<node_id>
  axis_cursor::next() {
    if (axis_ == axis::ancestors) {
      if (scope_ == no_node) { return std::nullopt; }
      scope_ = doc_->parent(scope_);
      if (scope_ == no_node) { return std::nullopt; }
      return scope_;
    }

    for (;;) {
      if (!pending_.empty()) {
        node_id id = pending_.back();
        pending_.pop_back();
        expand(id);
        return id;
      }

      bool advanced = false;
      switch (axis_) {
        case axis::following:
          advanced = refill_following();
          break;
        case axis::preceding:
          advanced = refill_preceding();
          break;
        case axis::ancestors:
        case axis::descendants:
          break;
      }
      if (!advanced) { return std::nullopt; }
    }
  }

  // Queues the node's attributes, then its children, so that the first
  // attribute is on top.
  void
  axis_cursor::expand(node_id id) {
    const node& n = doc_->at(id);
    push_reversed(n.children.begin(), n.children.end());
    push_reversed(n.attributes.begin(), n.attributes.end());
  }

  // Queues the later siblings of scope_ and moves scope_ to its parent. The
  // later siblings of an attribute are the remaining attributes and then
  // all children of the owner element.
  bool
  axis_cursor::refill_following() {
    if (scope_ == no_node) { return false; }
    node_id parent = doc_->parent(scope_);
    if (parent == no_node) {
      scope_ = no_node;
      return false;
    }

    const node& p = doc_->at(parent);
    if (doc_->kind(scope_) == node_kind::attribute) {
      push_reversed(p.children.begin(), p.children.end());
      auto it = std::find(p.attributes.begin(), p.attributes.end(), scope_);
      if (it != p.attributes.end()) { ++it; }
      push_reversed(it, p.attributes.end());
    } else {
      auto it = std::find(p.children.begin(), p.children.end(), scope_);
      if (it != p.children.end()) { ++it; }
      push_reversed(it, p.children.end());
    }
    scope_ = parent;
    return true;
  }

  // Queues everything under path_[level_] that comes before path_[level_+1]
  // and steps one level down. Attributes of an ancestor precede all of its
  // children.
  bool
  axis_cursor::refill_preceding() {
    if (level_ + 1 >= path_.size()) { return false; }
    const node& p = doc_->at(path_[level_]);
    node_id child = path_[level_ + 1];
    ++level_;

    if (doc_->kind(child) == node_kind::attribute) {
      auto it = std::find(p.attributes.begin(), p.attributes.end(), child);
      push_reversed(p.attributes.begin(), it);
    } else {
      auto it = std::find(p.children.begin(), p.children.end(), child);
      push_reversed(p.children.begin(), it);
      push_reversed(p.attributes.begin(), p.attributes.end());
    }
    return true;
  }

  // ---------------------------------------------------------------------------
  // views and order
  // ---------------------------------------------------------------------------

  std::vector<node_id>
  axis_view::to_vector() const {
    std::vector<node_id> result;
    for (node_id id : *this) {
      result.push_back(id);
    }
    return result;
  }

  axis_view
  ancestors(const document& doc, node_id id) {
    return axis_view(doc, id, axis::ancestors);
  }

  axis_view
  descendants(const document& doc, node_id id) {
    return axis_view(doc, id, axis::descendants);
  }

  axis_view
  preceding(const document& doc, node_id id) {
    return axis_view(doc, id, axis::preceding);
  }

  axis_view
  following(const document& doc, node_id id) {
    return axis_view(doc, id, axis::following);
  }

  std::vector<node_id>
  document_order(const document& doc) {
    std::vector<node_id> order{doc.root()};
    for (node_id id : descendants(doc, doc.root())) {
      order.push_back(id);
    }
    return order;
  }

  int
  compare_document_order(const document& doc, node_id a, node_id b) {
    if (a == b) {
      doc.at(a);
      return 0;
    }
    auto path_a = path_from_root(doc, a);
    auto path_b = path_from_root(doc, b);

    std::size_t common = 0;
    while (common < path_a.size() && common < path_b.size() &&
           path_a[common] == path_b[common]) {
      ++common;
    }
    // One is an ancestor of the other.
    if (common == path_a.size()) { return -1; }
    if (common == path_b.size()) { return 1; }

    std::size_t rank_a = sibling_rank(doc, path_a[common]);
    std::size_t rank_b = sibling_rank(doc, path_b[common]);
    return rank_a < rank_b ? -1 : 1;
  }

} // namespace xr
