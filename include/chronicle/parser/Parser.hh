#pragma once

#include "chronicle/parser/Tokenizer.hh"
#include "chronicle/parser/Value.hh"

#include <functional>
#include <optional>
#include <string_view>
#include <vector>

namespace chronicle {

struct ParserOptions {
    // Composites nested deeper than this are skipped and read as an empty
    // list instead of recursing further.
    int maxDepth = 256;
};

/**
 * @brief Recursive-descent parser for the save-file grammar.
 *
 *   document       := key_value_list
 *   key_value_list := key '=' value (key '=' value)*
 *   value          := literal | '{' body '}'
 *   body           := <empty> | value_list | key_value_list
 *
 * A '{' is disambiguated by one token of lookahead, then a second one after
 * the first literal. Repeated keys in one map collect into a list in
 * encounter order. Throws FormatError with the offending line on any
 * grammar violation; no partial tree is returned.
 *
 * One Parser instance parses one document. Instances share no state, so
 * independent documents can be parsed on separate threads.
 */
class Parser {
  public:
    using TokenSource = std::function<Token()>;

    explicit Parser(TokenSource source, ParserOptions options = {});

    Value parseDocument();

    // Number of composites dropped by the depth budget.
    int skippedComposites() const { return skipped_; }

  private:
    const Token& peek();
    Token take();
    Token expect(TokenType type, std::string_view what);

    Value parseValue(int depth);
    Value parseComposite(int depth);
    Value parseMapBody(Key firstKey, int depth);
    Value parseListBody(Value::List seed, int depth);
    void parseEntry(ValueMap& map, Key key, int depth);
    Key parseKey();
    Value skipComposite();

    [[noreturn]] void fail(const Token& token, std::string_view expected);

    TokenSource source_;
    ParserOptions options_;
    std::optional<Token> lookahead_;
    int skipped_ = 0;
};

// Convenience entry points.
Value parse(const std::vector<Token>& tokens, ParserOptions options = {});
Value parseText(std::string_view text, ParserOptions options = {});

} // namespace chronicle
