#include "chronicle/parser/Parser.hh"

#include "chronicle/core/Log.hh"

#include <memory>
#include <string>

namespace chronicle {

namespace {

// Key that stands in for the missing name in "a=b={...}".
const char* const kUnknownKey = "unknown_key";

Value literalValue(const Token& token) {
    switch (token.type) {
    case TokenType::Integer:
        return Value(token.asInt());
    case TokenType::Float:
        return Value(token.asFloat());
    default:
        return Value(token.asString());
    }
}

} // namespace

Parser::Parser(TokenSource source, ParserOptions options) : source_(std::move(source)), options_(options) {}

const Token& Parser::peek() {
    if (!lookahead_) {
        lookahead_ = source_();
    }
    return *lookahead_;
}

Token Parser::take() {
    peek();
    Token token = std::move(*lookahead_);
    lookahead_.reset();
    return token;
}

Token Parser::expect(TokenType type, std::string_view what) {
    if (peek().type != type) {
        fail(peek(), what);
    }
    return take();
}

void Parser::fail(const Token& token, std::string_view expected) {
    throw FormatError(token.line,
                      "Expected " + std::string(expected) + ", got " + std::string(tokenTypeToString(token.type)));
}

Value Parser::parseDocument() {
    ValueMap map;
    while (peek().type != TokenType::Eof) {
        Key key = parseKey();
        parseEntry(map, std::move(key), 0);
    }
    return Value(std::move(map));
}

Key Parser::parseKey() {
    const Token& token = peek();
    switch (token.type) {
    case TokenType::Equal:
        // Leave the '=' in place; it is consumed as this key's separator.
        return Key(std::string(kUnknownKey));
    case TokenType::String:
        return Key(take().asString());
    case TokenType::Integer:
        return Key(take().asInt());
    default:
        fail(token, "STRING or INTEGER key");
    }
}

void Parser::parseEntry(ValueMap& map, Key key, int depth) {
    expect(TokenType::Equal, "'=' after key");
    Value value = parseValue(depth);

    Value* existing = map.find(key);
    if (!existing) {
        map.set(std::move(key), std::move(value));
        return;
    }
    if (map.isRepeated(key)) {
        existing->asList().push_back(std::move(value));
        return;
    }
    // Second occurrence: the first value becomes element 0 even if it is
    // already a list itself.
    Value::List merged;
    merged.push_back(std::move(*existing));
    merged.push_back(std::move(value));
    *existing = Value(std::move(merged));
    map.markRepeated(key);
}

Value Parser::parseValue(int depth) {
    const Token& token = peek();
    if (token.isLiteral()) {
        return literalValue(take());
    }
    if (token.type == TokenType::BraceOpen) {
        return parseComposite(depth + 1);
    }
    fail(token, "value");
}

Value Parser::parseComposite(int depth) {
    if (depth > options_.maxDepth) {
        return skipComposite();
    }
    take(); // '{'

    const Token& next = peek();
    if (next.type == TokenType::BraceClose) {
        take();
        return Value(Value::List{});
    }
    if (next.type == TokenType::BraceOpen) {
        return parseListBody({}, depth);
    }
    if (!next.isLiteral()) {
        fail(next, "value, key or '}'");
    }

    Token first = take();
    const Token& after = peek();
    if (after.type == TokenType::Equal) {
        if (first.type == TokenType::Float) {
            fail(first, "STRING or INTEGER key");
        }
        Key key = first.type == TokenType::Integer ? Key(first.asInt()) : Key(first.asString());
        return parseMapBody(std::move(key), depth);
    }
    if (after.isLiteral() || after.type == TokenType::BraceClose || after.type == TokenType::BraceOpen) {
        Value::List seed;
        seed.push_back(literalValue(first));
        return parseListBody(std::move(seed), depth);
    }
    fail(after, "'=', value or '}'");
}

Value Parser::parseMapBody(Key firstKey, int depth) {
    ValueMap map;
    parseEntry(map, std::move(firstKey), depth);

    while (true) {
        const Token& token = peek();
        if (token.type == TokenType::BraceClose) {
            take();
            break;
        }
        if (token.type == TokenType::Eof) {
            fail(token, "'}' to close map");
        }
        Key key = parseKey();
        parseEntry(map, std::move(key), depth);
    }
    return Value(std::move(map));
}

Value Parser::parseListBody(Value::List seed, int depth) {
    Value::List items = std::move(seed);
    while (true) {
        const Token& token = peek();
        if (token.type == TokenType::BraceClose) {
            take();
            break;
        }
        if (token.type == TokenType::Eof) {
            fail(token, "'}' to close list");
        }
        if (token.type == TokenType::Equal) {
            fail(token, "list element");
        }
        items.push_back(parseValue(depth));
    }
    return Value(std::move(items));
}

Value Parser::skipComposite() {
    int startLine = peek().line;
    int open = 0;
    while (true) {
        Token token = take();
        if (token.type == TokenType::BraceOpen) {
            ++open;
        } else if (token.type == TokenType::BraceClose) {
            if (--open == 0) {
                break;
            }
        } else if (token.type == TokenType::Eof) {
            fail(token, "'}' to close skipped object");
        }
    }
    ++skipped_;
    CHRONICLE_PARSER_LOG_INFO("Skipped object at line {} nested deeper than {} levels", startLine,
                              options_.maxDepth);
    return Value(Value::List{});
}

Value parse(const std::vector<Token>& tokens, ParserOptions options) {
    size_t index = 0;
    int lastLine = tokens.empty() ? 1 : tokens.back().line;
    Parser parser(
        [&tokens, &index, lastLine]() -> Token {
            if (index < tokens.size()) {
                return tokens[index++];
            }
            Token eof;
            eof.line = lastLine;
            return eof;
        },
        options);
    return parser.parseDocument();
}

Value parseText(std::string_view text, ParserOptions options) {
    auto tokenizer = std::make_shared<Tokenizer>(text);
    Parser parser([tokenizer]() { return tokenizer->next(); }, options);
    return parser.parseDocument();
}

} // namespace chronicle
