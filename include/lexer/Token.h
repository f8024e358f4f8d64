/**
 * Name: pysca::lex::Token
 * Purpose: Token structure with source location and text.
 */
#pragma once

#include <string>
#include "lexer/TokenKind.h"

namespace pysca::lex {

struct Token {
    TokenKind kind{TokenKind::End};
    std::string text{}; // original text; multi-line strings keep their newlines
    std::string file{};
    int line{1}; // 1-based line number of the first character
    int col{1}; // 1-based column at token start
};

} // namespace pysca::lex
