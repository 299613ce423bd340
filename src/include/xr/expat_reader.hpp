#pragma once

#include <xr/xml_reader.hpp>

#include <memory>
#include <string_view>

namespace xr {

  // Strict reader backed by expat. The whole input is parsed on
  // construction; malformed input is reported to options.on_parse_error (if
  // set) and then raised as std::runtime_error. Reports the same node stream
  // as push_reader for well-formed documents.
  class expat_reader : public xml_reader {
  public:
    explicit expat_reader(std::string_view xml, reader_options options = {});
    ~expat_reader() override;

    expat_reader(const expat_reader&) = delete;
    expat_reader&
    operator=(const expat_reader&) = delete;
    expat_reader(expat_reader&&) noexcept;
    expat_reader&
    operator=(expat_reader&&) noexcept;

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

  private:
    struct impl;
    std::unique_ptr<impl> impl_;
  };

} // namespace xr
