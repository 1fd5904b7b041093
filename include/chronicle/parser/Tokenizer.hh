#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace chronicle {

enum class TokenType : uint8_t {
    BraceOpen,
    BraceClose,
    Equal,
    Integer,
    Float,
    String,
    Eof
};

std::string_view tokenTypeToString(TokenType type);

struct Token {
    TokenType type = TokenType::Eof;
    std::variant<std::monostate, std::int64_t, double, std::string> value;
    int line = 1;

    bool isLiteral() const {
        return type == TokenType::Integer || type == TokenType::Float || type == TokenType::String;
    }

    std::int64_t asInt() const { return std::get<std::int64_t>(value); }
    double asFloat() const { return std::get<double>(value); }
    const std::string& asString() const { return std::get<std::string>(value); }
};

// Pull-based scanner over decoded save text. Total: any input yields a token
// stream that ends with exactly one Eof token, after which next() keeps
// returning Eof. Reentrant; holds no state beyond its own cursor.
class Tokenizer {
  public:
    explicit Tokenizer(std::string_view text);

    Token next();
    int line() const { return line_; }

  private:
    void skipWhitespace();
    Token scanQuoted();
    Token scanUnit();

    std::string_view text_;
    size_t pos_ = 0;
    int line_ = 1;
};

// Tokenizes the whole input eagerly. The last token is always Eof.
std::vector<Token> tokenize(std::string_view text);

// Classifies a bare (unquoted) unit as Integer, Float or String.
Token classifyUnit(std::string_view unit, int line);

// Removes '#' comments outside quoted strings. Newlines are kept so line
// numbers stay aligned with the source.
std::string stripComments(std::string_view text);

} // namespace chronicle
