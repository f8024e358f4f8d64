/***
 * Name: pysca::lex::Lexer
 * Purpose: Tokenize Python source into a single token stream.
 */
#include "lexer/Lexer.h"
#include "pysca/exceptions/parse_error.h"
#include <array>
#include <cctype>
#include <cstddef>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace pysca::lex {

static bool isIdentStart(char chr) {
  const auto uch = static_cast<unsigned char>(chr);
  return (std::isalpha(uch) != 0) || chr == '_' || uch >= 0x80U;
}
static bool isIdentChar(char chr) {
  const auto uch = static_cast<unsigned char>(chr);
  return (std::isalnum(uch) != 0) || chr == '_' || uch >= 0x80U;
}
static bool isQuote(char chr) { return chr == '\'' || chr == '"'; }

namespace {
constexpr size_t kTabWidth = 8;

const std::unordered_map<std::string_view, TokenKind>& keywords() {
  static const std::unordered_map<std::string_view, TokenKind> table{
      {"def", TokenKind::Def},         {"return", TokenKind::Return},     {"del", TokenKind::Del},
      {"if", TokenKind::If},           {"else", TokenKind::Else},         {"elif", TokenKind::Elif},
      {"while", TokenKind::While},     {"for", TokenKind::For},           {"in", TokenKind::In},
      {"break", TokenKind::Break},     {"continue", TokenKind::Continue}, {"pass", TokenKind::Pass},
      {"try", TokenKind::Try},         {"except", TokenKind::Except},     {"finally", TokenKind::Finally},
      {"with", TokenKind::With},       {"as", TokenKind::As},             {"import", TokenKind::Import},
      {"from", TokenKind::From},       {"class", TokenKind::Class},       {"async", TokenKind::Async},
      {"assert", TokenKind::Assert},   {"raise", TokenKind::Raise},       {"global", TokenKind::Global},
      {"nonlocal", TokenKind::Nonlocal}, {"yield", TokenKind::Yield},     {"await", TokenKind::Await},
      {"and", TokenKind::And},         {"or", TokenKind::Or},             {"not", TokenKind::Not},
      {"lambda", TokenKind::Lambda},   {"is", TokenKind::Is},             {"True", TokenKind::BoolLit},
      {"False", TokenKind::BoolLit},   {"None", TokenKind::NoneLit},
  };
  return table;
}

struct OpEntry {
  std::string_view text;
  TokenKind kind;
};

// Longest spellings first so a prefix never shadows a longer operator.
constexpr std::array<OpEntry, 47> kOperators{{
    {"**=", TokenKind::StarStarEqual}, {"//=", TokenKind::SlashSlashEqual}, {">>=", TokenKind::RShiftEqual},
    {"<<=", TokenKind::LShiftEqual},   {"...", TokenKind::Ellipsis},        {"->", TokenKind::Arrow},
    {":=", TokenKind::ColonEqual},     {"**", TokenKind::StarStar},         {"//", TokenKind::SlashSlash},
    {">>", TokenKind::RShift},         {"<<", TokenKind::LShift},           {"<=", TokenKind::Le},
    {">=", TokenKind::Ge},             {"==", TokenKind::EqEq},             {"!=", TokenKind::NotEq},
    {"+=", TokenKind::PlusEqual},      {"-=", TokenKind::MinusEqual},       {"*=", TokenKind::StarEqual},
    {"/=", TokenKind::SlashEqual},     {"%=", TokenKind::PercentEqual},     {"@=", TokenKind::AtEqual},
    {"&=", TokenKind::AmpEqual},       {"|=", TokenKind::PipeEqual},        {"^=", TokenKind::CaretEqual},
    {"(", TokenKind::LParen},          {")", TokenKind::RParen},            {"[", TokenKind::LBracket},
    {"]", TokenKind::RBracket},        {"{", TokenKind::LBrace},            {"}", TokenKind::RBrace},
    {":", TokenKind::Colon},           {";", TokenKind::Semicolon},         {",", TokenKind::Comma},
    {"=", TokenKind::Equal},           {"+", TokenKind::Plus},              {"-", TokenKind::Minus},
    {"*", TokenKind::Star},            {"/", TokenKind::Slash},             {"%", TokenKind::Percent},
    {"@", TokenKind::At},              {"&", TokenKind::Amp},               {"|", TokenKind::Pipe},
    {"^", TokenKind::Caret},           {"~", TokenKind::Tilde},             {"<", TokenKind::Lt},
    {">", TokenKind::Gt},              {".", TokenKind::Dot},
}};

// Valid string prefixes (lowercased): r, u, b, f, br, rb, fr, rf.
bool isStringPrefix(std::string_view prefix) {
  std::string lower(prefix);
  for (auto& c : lower) { c = static_cast<char>(std::tolower(static_cast<unsigned char>(c))); }
  return lower == "r" || lower == "u" || lower == "b" || lower == "f" || lower == "br" || lower == "rb" ||
         lower == "fr" || lower == "rf";
}

char closerFor(TokenKind open) {
  if (open == TokenKind::LParen) { return ')'; }
  if (open == TokenKind::LBracket) { return ']'; }
  return '}';
}
} // namespace

// StringInput implementation
StringInput::StringInput(std::string text, std::string name)
  : name_(std::move(name)), in_(nullptr) {
  auto iss = std::make_unique<std::istringstream>(std::move(text));
  in_ = std::move(iss);
}

bool StringInput::getline(std::string& out) {
  if (!in_ || !(*in_)) { return false; }
  if (!std::getline(*in_, out)) { return false; }
  return true;
}

void Lexer::pushString(const std::string& text, const std::string& name) {
  State state;
  state.src = std::make_unique<StringInput>(text, name);
  stack_.push_back(std::move(state));
}

void Lexer::fail(const State& state, const size_t col, const std::string& msg) const {
  std::ostringstream out;
  out << state.src->name() << ":" << state.lineNo << ":" << (col + 1) << ": " << msg;
  out << "\n" << state.line << "\n" << std::string(col, ' ') << "^";
  throw exceptions::ParseError(out.str());
}

Token Lexer::makeTok(const State& state, const TokenKind kind, const size_t start, const size_t endExclusive) const {
  Token tok;
  tok.kind = kind;
  tok.text = state.line.substr(start, endExclusive - start);
  tok.file = state.src->name();
  tok.line = state.lineNo;
  tok.col = static_cast<int>(start + 1);
  return tok;
}

bool Lexer::readNextLine(State& state) {
  state.line.clear();
  if (!state.src->getline(state.line)) { return false; }
  ++state.lineNo;
  state.index = 0;
  // Handle CRLF
  if (!state.line.empty() && state.line.back() == '\r') { state.line.pop_back(); }
  return true;
}

// Returns true when the line is blank or comment-only and should be skipped.
bool Lexer::emitIndentTokens(State& state) {
  size_t idx = 0;
  size_t column = 0;
  while (idx < state.line.size()) {
    const char chr = state.line[idx];
    if (chr == ' ') { ++column; }
    else if (chr == '\t') { column = (column / kTabWidth + 1) * kTabWidth; }
    else if (chr == '\f') { column = 0; }
    else { break; }
    ++idx;
  }
  if (idx >= state.line.size() || state.line[idx] == '#' ||
      (state.line[idx] == '\\' && idx + 1 == state.line.size())) {
    if (idx < state.line.size() && state.line[idx] == '\\') { state.continuation = true; }
    return true;
  }
  if (column > state.indentStack.back()) {
    state.indentStack.push_back(column);
    Token tok = makeTok(state, TokenKind::Indent, 0, 0);
    tok.text = "<INDENT>";
    tokens_.push_back(std::move(tok));
  } else {
    while (column < state.indentStack.back()) {
      state.indentStack.pop_back();
      Token tok = makeTok(state, TokenKind::Dedent, 0, 0);
      tok.text = "<DEDENT>";
      tokens_.push_back(std::move(tok));
    }
    if (column != state.indentStack.back()) {
      fail(state, idx, "unindent does not match any outer indentation level");
    }
  }
  state.index = idx;
  return false;
}

// NOLINTNEXTLINE(readability-function-size,readability-function-cognitive-complexity)
Token Lexer::scanString(State& state, const size_t start, const size_t quotePos) {
  const std::string& line = state.line;
  const std::string prefix = line.substr(start, quotePos - start);
  bool isBytes = false;
  bool isFormat = false;
  for (const char c : prefix) {
    if (c == 'b' || c == 'B') { isBytes = true; }
    if (c == 'f' || c == 'F') { isFormat = true; }
  }
  const char quote = line[quotePos];
  const bool triple = quotePos + 2 < line.size() && line[quotePos + 1] == quote && line[quotePos + 2] == quote;
  const int startLine = state.lineNo;
  const size_t startCol = start;
  const std::string startText = line;

  std::string text;
  size_t segStart = start;
  size_t pos = quotePos + (triple ? 3 : 1);
  int depth = 0; // replacement-field nesting inside f-strings

  auto nextPhysical = [&]() {
    text += line.substr(segStart);
    text += "\n";
    if (!readNextLine(state)) {
      state.lineNo = startLine;
      state.line = startText;
      fail(state, startCol, triple ? "unterminated triple-quoted string literal" : "unterminated string literal");
    }
    pos = 0;
    segStart = 0;
  };

  char innerQuote = 0; // quote of a literal nested in a replacement field
  bool innerTriple = false;
  auto closesAt = [&](const size_t at, const char q, const bool tri) {
    if (line[at] != q) { return false; }
    return !tri || (at + 2 < line.size() && line[at + 1] == q && line[at + 2] == q);
  };

  for (;;) {
    if (pos >= line.size()) {
      if (!triple || (innerQuote != 0 && !innerTriple)) { fail(state, startCol, "unterminated string literal"); }
      nextPhysical();
      continue;
    }
    const char chr = line[pos];
    if (innerQuote != 0) {
      if (chr == '\\') {
        if (pos + 1 >= line.size()) { nextPhysical(); continue; }
        pos += 2;
        continue;
      }
      if (closesAt(pos, innerQuote, innerTriple)) {
        pos += innerTriple ? 3 : 1;
        innerQuote = 0;
        continue;
      }
      ++pos;
      continue;
    }
    if (chr == '\\') {
      if (pos + 1 >= line.size()) { nextPhysical(); continue; }
      // Braces after a backslash still delimit replacement fields in f-strings
      const bool brace = line[pos + 1] == '{' || line[pos + 1] == '}';
      pos += (isFormat && brace) ? 1 : 2;
      continue;
    }
    if (isFormat && depth > 0) {
      if (chr == '{') { ++depth; }
      else if (chr == '}') { --depth; }
      else if (isQuote(chr)) {
        innerQuote = chr;
        innerTriple = pos + 2 < line.size() && line[pos + 1] == chr && line[pos + 2] == chr;
        pos += innerTriple ? 3 : 1;
        continue;
      }
      ++pos;
      continue;
    }
    if (isFormat && chr == '{') {
      if (pos + 1 < line.size() && line[pos + 1] == '{') { pos += 2; continue; }
      depth = 1;
      ++pos;
      continue;
    }
    if (closesAt(pos, quote, triple)) {
      pos += triple ? 3 : 1;
      break;
    }
    ++pos;
  }
  text += line.substr(segStart, pos - segStart);
  Token tok;
  tok.kind = isBytes ? TokenKind::Bytes : TokenKind::String;
  tok.text = std::move(text);
  tok.file = state.src->name();
  tok.line = startLine;
  tok.col = static_cast<int>(startCol + 1);
  state.index = pos;
  return tok;
}

// NOLINTNEXTLINE(readability-function-size,readability-function-cognitive-complexity)
Token Lexer::scanNumber(State& state) {
  const std::string& line = state.line;
  size_t& idx = state.index;

  auto scanExponent = [&](size_t pos) -> size_t {
    size_t cur = pos;
    if (cur < line.size() && (line[cur] == 'e' || line[cur] == 'E')) {
      ++cur;
      if (cur < line.size() && (line[cur] == '+' || line[cur] == '-')) { ++cur; }
      const size_t startIdx = cur;
      bool prevUnderscore = false; size_t digits = 0;
      while (cur < line.size()) {
        const char d = line[cur];
        if (std::isdigit(static_cast<unsigned char>(d)) != 0) { prevUnderscore = false; ++digits; ++cur; continue; }
        if (d == '_' && digits > 0 && !prevUnderscore) { prevUnderscore = true; ++cur; continue; }
        break;
      }
      // Remove trailing underscore
      if (prevUnderscore) { --cur; }
      if (cur == startIdx) { return pos; } // back out if no digits
      return cur;
    }
    return pos;
  };
  auto isDecDigit = [](char c){ return std::isdigit(static_cast<unsigned char>(c)) != 0; };
  auto isHexDigit = [](char c){ return std::isxdigit(static_cast<unsigned char>(c)) != 0; };
  auto isBinDigit = [](char c){ return c=='0'||c=='1'; };
  auto isOctDigit = [](char c){ return c>='0'&&c<='7'; };
  auto scanDigitsUnderscore = [&](size_t pos, auto isOk) {
    size_t i = pos; bool have = false; bool prevUnderscore=false;
    while (i < line.size()) {
      const char c = line[i];
      if (isOk(c)) { have = true; prevUnderscore=false; ++i; continue; }
      if (c=='_' && have && !prevUnderscore) { prevUnderscore=true; ++i; continue; }
      break;
    }
    if (prevUnderscore) --i; // trim trailing underscore
    return i;
  };
  auto finish = [&](TokenKind kind, size_t begin, size_t end) {
    if (end < line.size() && (line[end]=='j'||line[end]=='J')) { ++end; kind = TokenKind::Imag; }
    Token tok = makeTok(state, kind, begin, end);
    idx = end;
    return tok;
  };

  const size_t i0 = idx;
  if (line[idx] == '.') {
    const size_t fracEnd = scanDigitsUnderscore(idx + 1, isDecDigit);
    return finish(TokenKind::Float, i0, scanExponent(fracEnd));
  }
  // Base prefixes 0b/0o/0x
  if (line[idx] == '0' && idx + 1 < line.size()) {
    const char p1 = line[idx+1];
    if (p1=='b'||p1=='B'||p1=='o'||p1=='O'||p1=='x'||p1=='X') {
      size_t p = idx + 2;
      if (p1=='b'||p1=='B') p = scanDigitsUnderscore(p, isBinDigit);
      else if (p1=='o'||p1=='O') p = scanDigitsUnderscore(p, isOctDigit);
      else p = scanDigitsUnderscore(p, isHexDigit);
      if (p == idx + 2) { fail(state, idx, "invalid numeric literal"); }
      Token tok = makeTok(state, TokenKind::Int, i0, p); idx = p; return tok;
    }
  }
  // Decimal int or float
  const size_t p = scanDigitsUnderscore(idx, isDecDigit);
  if (p < line.size() && line[p] == '.') {
    const size_t fracEnd = scanDigitsUnderscore(p + 1, isDecDigit);
    return finish(TokenKind::Float, i0, scanExponent(fracEnd));
  }
  const size_t epos = scanExponent(p);
  if (epos != p) { return finish(TokenKind::Float, i0, epos); }
  return finish(TokenKind::Int, i0, p);
}

// NOLINTNEXTLINE(readability-function-size,readability-function-cognitive-complexity)
void Lexer::scanLine(State& state) {
  const std::string& line = state.line;
  size_t& idx = state.index;
  while (idx < line.size()) {
    const char chr = line[idx];
    if (chr == ' ' || chr == '\t' || chr == '\f') { ++idx; continue; }
    if (chr == '#') { idx = line.size(); break; }
    if (chr == '\\') {
      if (idx + 1 == line.size()) { state.continuation = true; idx = line.size(); break; }
      fail(state, idx, "unexpected character after line continuation character");
    }
    if (isQuote(chr)) { tokens_.push_back(scanString(state, idx, idx)); continue; }
    if (std::isdigit(static_cast<unsigned char>(chr)) != 0 ||
        (chr == '.' && idx + 1 < line.size() && std::isdigit(static_cast<unsigned char>(line[idx + 1])) != 0)) {
      tokens_.push_back(scanNumber(state));
      continue;
    }
    if (isIdentStart(chr)) {
      size_t jpos = idx + 1;
      while (jpos < line.size() && isIdentChar(line[jpos])) { ++jpos; }
      if (jpos < line.size() && isQuote(line[jpos]) && jpos - idx <= 2 &&
          isStringPrefix(std::string_view(line).substr(idx, jpos - idx))) {
        tokens_.push_back(scanString(state, idx, jpos));
        continue;
      }
      const std::string_view ident = std::string_view(line).substr(idx, jpos - idx);
      TokenKind kind = TokenKind::Ident;
      if (const auto found = keywords().find(ident); found != keywords().end()) { kind = found->second; }
      tokens_.push_back(makeTok(state, kind, idx, jpos));
      idx = jpos;
      continue;
    }
    bool matched = false;
    for (const auto& entry : kOperators) {
      if (std::string_view(line).substr(idx, entry.text.size()) != entry.text) { continue; }
      Token tok = makeTok(state, entry.kind, idx, idx + entry.text.size());
      if (entry.kind == TokenKind::LParen || entry.kind == TokenKind::LBracket || entry.kind == TokenKind::LBrace) {
        state.brackets.push_back(tok);
      } else if (entry.kind == TokenKind::RParen || entry.kind == TokenKind::RBracket || entry.kind == TokenKind::RBrace) {
        if (state.brackets.empty()) { fail(state, idx, "unmatched '" + std::string(entry.text) + "'"); }
        if (closerFor(state.brackets.back().kind) != entry.text[0]) {
          fail(state, idx, "closing parenthesis '" + std::string(entry.text) +
                               "' does not match opening parenthesis '" + state.brackets.back().text + "'");
        }
        state.brackets.pop_back();
      }
      tokens_.push_back(std::move(tok));
      idx += entry.text.size();
      matched = true;
      break;
    }
    if (!matched) { fail(state, idx, std::string("invalid character '") + chr + "'"); }
  }
}

void Lexer::buildAll() {
  if (finalized_) { return; }
  finalized_ = true;
  for (auto& state : stack_) {
    while (readNextLine(state)) {
      if (state.continuation || !state.brackets.empty()) {
        state.continuation = false;
      } else if (emitIndentTokens(state)) {
        continue;
      }
      scanLine(state);
      if (state.continuation || !state.brackets.empty()) { continue; }
      if (!tokens_.empty() && tokens_.back().kind != TokenKind::Newline &&
          tokens_.back().kind != TokenKind::Indent && tokens_.back().kind != TokenKind::Dedent) {
        Token newlineTok = makeTok(state, TokenKind::Newline, state.line.size(), state.line.size());
        newlineTok.text = "\n";
        tokens_.push_back(std::move(newlineTok));
      }
    }
    if (!state.brackets.empty()) {
      const Token& open = state.brackets.back();
      std::ostringstream out;
      out << open.file << ":" << open.line << ":" << open.col << ": '" << open.text << "' was never closed";
      throw exceptions::ParseError(out.str());
    }
    if (state.continuation) {
      fail(state, state.line.size(), "unexpected EOF while parsing");
    }
    // flush dedents
    while (state.indentStack.size() > 1) {
      state.indentStack.pop_back();
      Token ded; ded.kind = TokenKind::Dedent; ded.text = "<DEDENT>"; ded.file = state.src->name(); ded.line = state.lineNo + 1; ded.col = 1;
      tokens_.push_back(ded);
    }
  }
  // Final EOF
  Token eof; eof.kind = TokenKind::End; eof.text = "<EOF>";
  if (!stack_.empty()) { eof.file = stack_.back().src->name(); eof.line = stack_.back().lineNo + 1; }
  tokens_.push_back(eof);
}

const Token& Lexer::peek(size_t lookahead) {
  if (!finalized_) { buildAll(); }
  if (pos_ + lookahead < tokens_.size()) {
    return tokens_[pos_ + lookahead];
  }
  return tokens_.back();
}

Token Lexer::next() {
  if (!finalized_) { buildAll(); }
  if (pos_ < tokens_.size()) {
    return tokens_[pos_++];
  }
  return tokens_.back();
}

std::vector<Token> Lexer::tokens() {
  if (!finalized_) { buildAll(); }
  return tokens_;
}

} // namespace pysca::lex
