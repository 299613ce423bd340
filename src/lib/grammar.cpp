#include <xr/grammar.hpp>

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <system_error>

namespace xr {

  namespace {

    constexpr std::size_t max_reference_length = 32;

    bool
    is_name_start(char c) {
      auto u = static_cast<unsigned char>(c);
      return (u >= 'A' && u <= 'Z') || (u >= 'a' && u <= 'z') || u == '_' ||
             u == ':' || u >= 0x80;
    }

    bool
    is_name_char(char c) {
      return is_name_start(c) || (c >= '0' && c <= '9') || c == '-' ||
             c == '.';
    }

    bool
    starts_with(std::string_view buffer, std::size_t pos,
                std::string_view literal) {
      return pos <= buffer.size() && buffer.substr(pos).starts_with(literal);
    }

    std::size_t
    skip_whitespace(std::string_view buffer, std::size_t pos) {
      while (pos < buffer.size() && is_whitespace(buffer[pos])) {
        ++pos;
      }
      return pos;
    }

    // Returns the end of the name starting at pos, or pos if there is none.
    std::size_t
    scan_name(std::string_view buffer, std::size_t pos) {
      if (pos >= buffer.size() || !is_name_start(buffer[pos])) { return pos; }
      ++pos;
      while (pos < buffer.size() && is_name_char(buffer[pos])) {
        ++pos;
      }
      return pos;
    }

    void
    append_utf8(std::string& out, char32_t cp) {
      if (cp < 0x80) {
        out += static_cast<char>(cp);
      } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
      } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
      } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
      }
    }

    struct quoted_value {
      std::string value;
      std::size_t end;
    };

    std::optional<quoted_value>
    scan_attribute_value(std::string_view buffer, std::size_t pos) {
      if (pos >= buffer.size()) { return std::nullopt; }
      char quote = buffer[pos];
      if (quote != '"' && quote != '\'') { return std::nullopt; }

      quoted_value result;
      ++pos;
      while (pos < buffer.size()) {
        char c = buffer[pos];
        if (c == quote) {
          result.end = pos + 1;
          return result;
        }
        if (c == '<') { return std::nullopt; }
        if (c == '&') {
          std::size_t n = decode_reference(buffer.substr(pos), result.value);
          if (n == 0) { return std::nullopt; }
          pos += n;
          continue;
        }
        result.value += c;
        ++pos;
      }
      return std::nullopt;
    }

    // Text between open and close, both literal, starting at pos.
    std::optional<std::pair<std::string_view, std::size_t>>
    scan_delimited(std::string_view buffer, std::size_t pos,
                   std::string_view open, std::string_view close) {
      if (!starts_with(buffer, pos, open)) { return std::nullopt; }
      std::size_t body = pos + open.size();
      std::size_t stop = buffer.find(close, body);
      if (stop == std::string_view::npos) { return std::nullopt; }
      return std::pair{buffer.substr(body, stop - body), stop + close.size()};
    }

  } // namespace

  bool
  is_whitespace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
  }

  bool
  is_whitespace(std::string_view text) {
    return std::all_of(text.begin(), text.end(),
                       [](char c) { return is_whitespace(c); });
  }

  std::size_t
  decode_reference(std::string_view text, std::string& out) {
    if (text.empty() || text[0] != '&') { return 0; }
    std::size_t semi = text.find(';');
    if (semi == std::string_view::npos || semi < 2 ||
        semi > max_reference_length) {
      return 0;
    }
    std::string_view name = text.substr(1, semi - 1);

    if (name[0] == '#') {
      std::string_view digits = name.substr(1);
      int base = 10;
      if (!digits.empty() && digits[0] == 'x') {
        digits.remove_prefix(1);
        base = 16;
      }
      if (digits.empty()) { return 0; }
      std::uint32_t cp = 0;
      auto [ptr, ec] =
          std::from_chars(digits.data(), digits.data() + digits.size(), cp, base);
      if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
        return 0;
      }
      if (cp == 0 || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        return 0;
      }
      append_utf8(out, static_cast<char32_t>(cp));
      return semi + 1;
    }

    if (name == "lt") {
      out += '<';
    } else if (name == "gt") {
      out += '>';
    } else if (name == "amp") {
      out += '&';
    } else if (name == "quot") {
      out += '"';
    } else if (name == "apos") {
      out += '\'';
    } else {
      return 0;
    }
    return semi + 1;
  }

  text_position
  locate(std::string_view text, std::size_t offset) {
    text_position result;
    offset = std::min(offset, text.size());
    std::size_t line_start = 0;
    for (std::size_t i = 0; i < offset; ++i) {
      if (text[i] == '\n') {
        ++result.line;
        line_start = i + 1;
      }
    }
    result.column = offset - line_start + 1;
    return result;
  }

  // ---------------------------------------------------------------------------
  // markup_grammar
  // ---------------------------------------------------------------------------

  recognized<character_data_token>
  markup_grammar::match_character_data(std::string_view buffer,
                                       std::size_t position) const {
    character_data_token token;
    std::size_t pos = position;
    while (pos < buffer.size() && buffer[pos] != '<') {
      if (buffer[pos] == '&') {
        std::size_t n = decode_reference(buffer.substr(pos), token.text);
        // An undecodable '&' ends the run; the reader reports it as malformed.
        if (n == 0) { break; }
        pos += n;
        continue;
      }
      token.text += buffer[pos];
      ++pos;
    }
    if (pos == position) { return std::nullopt; }
    return token_match<character_data_token>{std::move(token), pos};
  }

  recognized<element_start_token>
  markup_grammar::match_element_start(std::string_view buffer,
                                      std::size_t position) const {
    if (!starts_with(buffer, position, "<")) { return std::nullopt; }
    std::size_t pos = position + 1;
    std::size_t name_end = scan_name(buffer, pos);
    if (name_end == pos) { return std::nullopt; }

    element_start_token token;
    token.open = buffer.substr(position, 1);
    token.name = qname(buffer.substr(pos, name_end - pos));
    pos = name_end;

    for (;;) {
      std::size_t ws_end = skip_whitespace(buffer, pos);
      std::size_t attr_end = ws_end > pos ? scan_name(buffer, ws_end) : ws_end;
      if (attr_end == ws_end) {
        token.trailing_whitespace = buffer.substr(pos, ws_end - pos);
        pos = ws_end;
        break;
      }

      qname attr_name(buffer.substr(ws_end, attr_end - ws_end));
      std::size_t eq = skip_whitespace(buffer, attr_end);
      if (eq >= buffer.size() || buffer[eq] != '=') { return std::nullopt; }
      auto value = scan_attribute_value(buffer, skip_whitespace(buffer, eq + 1));
      if (!value) { return std::nullopt; }
      token.attributes.emplace_back(std::move(attr_name),
                                    std::move(value->value));
      pos = value->end;
    }

    if (starts_with(buffer, pos, "/>")) {
      token.close = buffer.substr(pos, 2);
      return token_match<element_start_token>{std::move(token), pos + 2};
    }
    if (starts_with(buffer, pos, ">")) {
      token.close = buffer.substr(pos, 1);
      return token_match<element_start_token>{std::move(token), pos + 1};
    }
    return std::nullopt;
  }

  recognized<element_end_token>
  markup_grammar::match_element_end(std::string_view buffer,
                                    std::size_t position) const {
    if (!starts_with(buffer, position, "</")) { return std::nullopt; }
    std::size_t pos = position + 2;
    std::size_t name_end = scan_name(buffer, pos);
    if (name_end == pos) { return std::nullopt; }

    element_end_token token{qname(buffer.substr(pos, name_end - pos))};
    pos = skip_whitespace(buffer, name_end);
    if (!starts_with(buffer, pos, ">")) { return std::nullopt; }
    return token_match<element_end_token>{std::move(token), pos + 1};
  }

  recognized<comment_token>
  markup_grammar::match_comment(std::string_view buffer,
                                std::size_t position) const {
    auto body = scan_delimited(buffer, position, "<!--", "-->");
    if (!body) { return std::nullopt; }
    return token_match<comment_token>{{body->first}, body->second};
  }

  recognized<cdata_token>
  markup_grammar::match_cdata(std::string_view buffer,
                              std::size_t position) const {
    auto body = scan_delimited(buffer, position, "<![CDATA[", "]]>");
    if (!body) { return std::nullopt; }
    return token_match<cdata_token>{{body->first}, body->second};
  }

  recognized<processing_instruction_token>
  markup_grammar::match_processing_instruction(std::string_view buffer,
                                               std::size_t position) const {
    if (!starts_with(buffer, position, "<?")) { return std::nullopt; }
    std::size_t pos = position + 2;
    std::size_t target_end = scan_name(buffer, pos);
    if (target_end == pos) { return std::nullopt; }

    processing_instruction_token token;
    token.target = buffer.substr(pos, target_end - pos);

    if (starts_with(buffer, target_end, "?>")) {
      return token_match<processing_instruction_token>{token, target_end + 2};
    }

    std::size_t text_start = skip_whitespace(buffer, target_end);
    if (text_start == target_end) { return std::nullopt; }
    std::size_t stop = buffer.find("?>", text_start);
    if (stop == std::string_view::npos) { return std::nullopt; }
    token.text = buffer.substr(text_start, stop - text_start);
    return token_match<processing_instruction_token>{token, stop + 2};
  }

  recognized<doctype_token>
  markup_grammar::match_doctype(std::string_view buffer,
                                std::size_t position) const {
    if (!starts_with(buffer, position, "<!DOCTYPE")) { return std::nullopt; }
    std::size_t pos = position + 9;
    std::size_t start = skip_whitespace(buffer, pos);
    if (start == pos) { return std::nullopt; }

    // Names, quoted literals and a bracketed internal subset, separated by
    // whitespace.
    pos = start;
    std::size_t last_end = start;
    while (pos < buffer.size() && buffer[pos] != '>') {
      char c = buffer[pos];
      if (c == '"' || c == '\'') {
        std::size_t close = buffer.find(c, pos + 1);
        if (close == std::string_view::npos) { return std::nullopt; }
        pos = close + 1;
      } else if (c == '[') {
        // The subset ends at the first ']' outside a quoted literal.
        std::size_t close = pos + 1;
        while (close < buffer.size() && buffer[close] != ']') {
          char q = buffer[close];
          if (q == '"' || q == '\'') {
            close = buffer.find(q, close + 1);
            if (close == std::string_view::npos) { return std::nullopt; }
          }
          ++close;
        }
        if (close >= buffer.size()) { return std::nullopt; }
        pos = close + 1;
      } else {
        std::size_t name_end = scan_name(buffer, pos);
        if (name_end == pos) { return std::nullopt; }
        pos = name_end;
      }
      last_end = pos;
      pos = skip_whitespace(buffer, pos);
    }
    if (pos >= buffer.size() || last_end == start) { return std::nullopt; }

    return token_match<doctype_token>{{buffer.substr(start, last_end - start)},
                                      pos + 1};
  }

  const token_grammar&
  default_grammar() {
    static const markup_grammar grammar{};
    return grammar;
  }

} // namespace xr
