#pragma once

#include <xr/attribute.hpp>
#include <xr/qname.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace xr {

  // A recognized token and the position just past its last byte.
  template <typename T>
  struct token_match {
    T token;
    std::size_t end;
  };

  template <typename T>
  using recognized = std::optional<token_match<T>>;

  struct character_data_token {
    std::string text; // references decoded
  };

  struct element_start_token {
    std::string_view open;  // "<"
    qname name;
    std::vector<attribute> attributes;
    std::string_view trailing_whitespace;
    std::string_view close; // ">" or "/>"

    bool
    self_closing() const {
      return close == "/>";
    }
  };

  struct element_end_token {
    qname name;
  };

  struct comment_token {
    std::string_view text;
  };

  struct cdata_token {
    std::string_view text;
  };

  struct processing_instruction_token {
    std::string_view target;
    std::string_view text;
  };

  struct doctype_token {
    std::string_view text;
  };

  // Lexical recognizers over (buffer, position). Each returns std::nullopt
  // when the input at position does not start the construct; a match must
  // end strictly after position and no later than buffer.size().
  class token_grammar {
  public:
    virtual ~token_grammar() = default;

    virtual recognized<character_data_token>
    match_character_data(std::string_view buffer,
                         std::size_t position) const = 0;

    virtual recognized<element_start_token>
    match_element_start(std::string_view buffer,
                        std::size_t position) const = 0;

    virtual recognized<element_end_token>
    match_element_end(std::string_view buffer, std::size_t position) const = 0;

    virtual recognized<comment_token>
    match_comment(std::string_view buffer, std::size_t position) const = 0;

    virtual recognized<cdata_token>
    match_cdata(std::string_view buffer, std::size_t position) const = 0;

    virtual recognized<processing_instruction_token>
    match_processing_instruction(std::string_view buffer,
                                 std::size_t position) const = 0;

    virtual recognized<doctype_token>
    match_doctype(std::string_view buffer, std::size_t position) const = 0;
  };

  // Byte-oriented XML 1.0 grammar. Names accept any byte >= 0x80 so UTF-8
  // names pass through unchanged.
  class markup_grammar : public token_grammar {
  public:
    recognized<character_data_token>
    match_character_data(std::string_view buffer,
                         std::size_t position) const override;

    recognized<element_start_token>
    match_element_start(std::string_view buffer,
                        std::size_t position) const override;

    recognized<element_end_token>
    match_element_end(std::string_view buffer,
                      std::size_t position) const override;

    recognized<comment_token>
    match_comment(std::string_view buffer, std::size_t position) const override;

    recognized<cdata_token>
    match_cdata(std::string_view buffer, std::size_t position) const override;

    recognized<processing_instruction_token>
    match_processing_instruction(std::string_view buffer,
                                 std::size_t position) const override;

    recognized<doctype_token>
    match_doctype(std::string_view buffer, std::size_t position) const override;
  };

  // The stateless grammar used when a reader is not given one.
  const token_grammar&
  default_grammar();

  bool
  is_whitespace(char c);

  bool
  is_whitespace(std::string_view text);

  // Decodes a reference starting at text[0] == '&'. On success appends the
  // replacement to out and returns the length of the reference including
  // the ';'; returns 0 when the reference is not well formed.
  std::size_t
  decode_reference(std::string_view text, std::string& out);

  struct text_position {
    std::size_t line = 1;
    std::size_t column = 1;
  };

  // 1-based line and column of a byte offset.
  text_position
  locate(std::string_view text, std::size_t offset);

} // namespace xr
