#pragma once

#include <xr/grammar.hpp>
#include <xr/xml_reader.hpp>

#include <memory>
#include <ostream>
#include <string>
#include <string_view>

namespace xr {

  // Error tolerant pull reader over an in-memory buffer.
  //
  // Each read() tries the grammar's recognizers in a fixed priority order
  // (character data, element start, element end, comment, CDATA, processing
  // instruction, doctype). When none matches before the end of the buffer,
  // the on_parse_error handler receives the offset, the cursor moves one
  // byte forward and recognition is retried, so malformed input never stops
  // the stream.
  class push_reader : public xml_reader {
  public:
    explicit push_reader(std::string text, reader_options options = {});

    push_reader(std::string text, bool ignore_whitespace,
                parse_error_handler on_parse_error = {});

    // The grammar must outlive the reader.
    push_reader(std::string text, reader_options options,
                const token_grammar& grammar);

    ~push_reader() override;

    push_reader(const push_reader&) = delete;
    push_reader&
    operator=(const push_reader&) = delete;
    push_reader(push_reader&&) noexcept;
    push_reader&
    operator=(push_reader&&) noexcept;

    // Throws std::logic_error if the grammar returns a match that does not
    // move the cursor forward or ends past the buffer.
    bool
    read() override;

    xml_node_type
    node_type() const override;

    const qname&
    name() const override;

    std::string_view
    value() const override;

    std::string_view
    processing_instruction_target() const override;

    const std::vector<attribute>&
    attributes() const override;

    std::string_view
    attribute_value(const qname& name) const override;

    std::size_t
    depth() const override;

    bool
    is_empty_element() const override;

    bool
    eof() const override;

    // Byte offset of the cursor; the end of the current node once read()
    // has returned true.
    std::size_t
    position() const;

    whitespace_handling
    whitespace() const;

    friend std::ostream&
    operator<<(std::ostream& os, const push_reader& reader);

  private:
    struct impl;
    std::unique_ptr<impl> impl_;
  };

} // namespace xr
