/**
 * Name: pysca::lex::Lexer
 * Purpose: Tokenize Python source into a flat token stream.
 * Theory of Operation:
 *   Lines are pulled from an InputSource. Physical lines are joined into
 *   logical lines inside brackets and after a trailing backslash; strings may
 *   span lines when triple-quoted. Indentation of each logical line is compared
 *   against a stack to emit Indent/Dedent tokens. Blank and comment-only lines
 *   produce no tokens. Malformed input raises exceptions::ParseError.
 */
#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include "lexer/ITokenStream.h"
#include "lexer/InputSource.h"
#include "lexer/StringInput.h"

namespace pysca::lex {

class Lexer : public ITokenStream {
public:
    Lexer() = default;

    void pushString(const std::string& text, const std::string& name);

    // ITokenStream
    const Token& peek(size_t lookahead = 0) override;

    Token next() override;

    std::vector<Token> tokens();

private:
    // Eager tokenization buffer to simplify streaming semantics safely
    bool finalized_{false};
    std::vector<Token> tokens_{};
    size_t pos_{0};

    struct State {
        std::unique_ptr<InputSource> src;
        std::string line;
        size_t index{0};
        int lineNo{0};
        std::vector<size_t> indentStack{0};
        std::vector<Token> brackets{}; // open (, [, { awaiting their closer
        bool continuation{false}; // previous physical line ended with '\'
    };

    std::vector<State> stack_{}; // inputs, tokenized in push order

    // helpers
    bool readNextLine(State& state); // load next physical line into state
    bool emitIndentTokens(State& state);
    void scanLine(State& state); // tokenize rest of the current physical line
    Token scanString(State& state, size_t start, size_t quotePos);
    Token scanNumber(State& state);
    Token makeTok(const State& state, TokenKind kind, size_t start, size_t endExclusive) const;
    [[noreturn]] void fail(const State& state, size_t col, const std::string& msg) const;

    void buildAll(); // build tokens_ from all inputs
};

} // namespace pysca::lex
