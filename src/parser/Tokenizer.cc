#include "chronicle/parser/Tokenizer.hh"

#include <charconv>

namespace chronicle {

namespace {

bool isSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

bool isDelimiter(char c) {
    return isSpace(c) || c == '{' || c == '}' || c == '=' || c == '"';
}

bool isDigit(char c) {
    return c >= '0' && c <= '9';
}

// Consumes [0-9]+ starting at pos; returns the number of digits read.
size_t digitRun(std::string_view s, size_t pos) {
    size_t n = 0;
    while (pos + n < s.size() && isDigit(s[pos + n])) {
        ++n;
    }
    return n;
}

size_t signLength(std::string_view s) {
    return (!s.empty() && (s[0] == '-' || s[0] == '+')) ? 1 : 0;
}

// [+-]?[0-9]+
bool matchesInteger(std::string_view s) {
    size_t pos = signLength(s);
    size_t digits = digitRun(s, pos);
    return digits > 0 && pos + digits == s.size();
}

// [+-]?[0-9]+\.[0-9]*([eE][+-]?[0-9]+)?
bool matchesFloat(std::string_view s) {
    size_t pos = signLength(s);
    size_t digits = digitRun(s, pos);
    if (digits == 0) {
        return false;
    }
    pos += digits;
    if (pos >= s.size() || s[pos] != '.') {
        return false;
    }
    ++pos;
    pos += digitRun(s, pos);
    if (pos == s.size()) {
        return true;
    }
    if (s[pos] != 'e' && s[pos] != 'E') {
        return false;
    }
    ++pos;
    pos += signLength(s.substr(pos));
    size_t exponent = digitRun(s, pos);
    return exponent > 0 && pos + exponent == s.size();
}

// std::from_chars rejects a leading '+'.
std::string_view dropPlus(std::string_view s) {
    return (!s.empty() && s[0] == '+') ? s.substr(1) : s;
}

bool parseDouble(std::string_view s, double& out) {
    s = dropPlus(s);
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc() && ptr == s.data() + s.size();
}

Token makeToken(TokenType type, int line) {
    Token token;
    token.type = type;
    token.line = line;
    return token;
}

} // namespace

std::string_view tokenTypeToString(TokenType type) {
    switch (type) {
    case TokenType::BraceOpen:
        return "BRACE_OPEN";
    case TokenType::BraceClose:
        return "BRACE_CLOSE";
    case TokenType::Equal:
        return "EQUAL";
    case TokenType::Integer:
        return "INTEGER";
    case TokenType::Float:
        return "FLOAT";
    case TokenType::String:
        return "STRING";
    case TokenType::Eof:
        return "EOF";
    }
    return "UNKNOWN";
}

Token classifyUnit(std::string_view unit, int line) {
    if (matchesInteger(unit)) {
        std::string_view digits = dropPlus(unit);
        std::int64_t value = 0;
        auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
        if (ec == std::errc() && ptr == digits.data() + digits.size()) {
            Token token = makeToken(TokenType::Integer, line);
            token.value = value;
            return token;
        }
        // Out of int64 range: keep the magnitude as a float.
        double wide = 0.0;
        if (parseDouble(unit, wide)) {
            Token token = makeToken(TokenType::Float, line);
            token.value = wide;
            return token;
        }
    } else if (matchesFloat(unit)) {
        double value = 0.0;
        if (parseDouble(unit, value)) {
            Token token = makeToken(TokenType::Float, line);
            token.value = value;
            return token;
        }
    }
    Token token = makeToken(TokenType::String, line);
    token.value = std::string(unit);
    return token;
}

Tokenizer::Tokenizer(std::string_view text) : text_(text) {}

void Tokenizer::skipWhitespace() {
    while (pos_ < text_.size() && isSpace(text_[pos_])) {
        if (text_[pos_] == '\n') {
            ++line_;
        }
        ++pos_;
    }
}

Token Tokenizer::next() {
    skipWhitespace();
    if (pos_ >= text_.size()) {
        return makeToken(TokenType::Eof, line_);
    }

    char c = text_[pos_];
    switch (c) {
    case '{':
        ++pos_;
        return makeToken(TokenType::BraceOpen, line_);
    case '}':
        ++pos_;
        return makeToken(TokenType::BraceClose, line_);
    case '=':
        ++pos_;
        return makeToken(TokenType::Equal, line_);
    case '"':
        return scanQuoted();
    default:
        return scanUnit();
    }
}

Token Tokenizer::scanQuoted() {
    int startLine = line_;
    ++pos_; // opening quote

    std::string value;
    while (pos_ < text_.size()) {
        char c = text_[pos_];
        if (c == '"') {
            ++pos_;
            break;
        }
        if (c == '\\' && pos_ + 1 < text_.size() && (text_[pos_ + 1] == '"' || text_[pos_ + 1] == '\\')) {
            value.push_back(text_[pos_ + 1]);
            pos_ += 2;
            continue;
        }
        if (c == '\n') {
            ++line_;
        }
        value.push_back(c);
        ++pos_;
    }

    Token token = makeToken(TokenType::String, startLine);
    token.value = std::move(value);
    return token;
}

Token Tokenizer::scanUnit() {
    size_t start = pos_;
    while (pos_ < text_.size() && !isDelimiter(text_[pos_])) {
        ++pos_;
    }
    return classifyUnit(text_.substr(start, pos_ - start), line_);
}

std::vector<Token> tokenize(std::string_view text) {
    std::vector<Token> tokens;
    Tokenizer tokenizer(text);
    while (true) {
        Token token = tokenizer.next();
        bool done = token.type == TokenType::Eof;
        tokens.push_back(std::move(token));
        if (done) {
            break;
        }
    }
    return tokens;
}

std::string stripComments(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    bool inQuotes = false;
    size_t i = 0;
    while (i < text.size()) {
        char c = text[i];
        if (inQuotes) {
            out.push_back(c);
            if (c == '\\' && i + 1 < text.size()) {
                out.push_back(text[i + 1]);
                i += 2;
                continue;
            }
            if (c == '"') {
                inQuotes = false;
            }
            ++i;
            continue;
        }
        if (c == '"') {
            inQuotes = true;
            out.push_back(c);
            ++i;
            continue;
        }
        if (c == '#') {
            while (i < text.size() && text[i] != '\n') {
                ++i;
            }
            continue;
        }
        out.push_back(c);
        ++i;
    }
    return out;
}

} // namespace chronicle
