#include "SelectTranslator.hpp"

#include <cctype>
#include <spdlog/spdlog.h>

#include "core/errors/SdbError.hpp"
#include "core/storage/DomainDirectory.hpp"
#include "core/storage/DomainStore.hpp"

namespace lsdb {

namespace {

enum class TokenKind { Word, Literal, QuotedName, Punct };

struct Token {
  TokenKind kind;
  std::string text;  // unquoted for Literal and QuotedName
};

SdbError malformed(const std::string& expression, const std::string& why) {
  return SdbError(ErrorKind::InvalidParameterValue,
                  "Value (" + expression + ") for parameter SelectExpression is invalid. " + why);
}

bool isWordStart(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

// '-' only continues the domain name after FROM; elsewhere it is an operator,
// so "--" can never reach SQLite as a comment.
bool isWordChar(char c, bool domainName) {
  return isWordStart(c) || c == '.' || (domainName && c == '-');
}

bool isKeyword(const Token& t, const char* kw) {
  if (t.kind != TokenKind::Word) return false;
  size_t i = 0;
  for (; kw[i] != '\0'; ++i) {
    if (i >= t.text.size()) return false;
    if (std::tolower(static_cast<unsigned char>(t.text[i])) != kw[i]) return false;
  }
  return i == t.text.size();
}

bool isPunct(const Token& t, const char* p) {
  return t.kind == TokenKind::Punct && t.text == p;
}

std::vector<Token> tokenize(const std::string& expr) {
  static const char* const twoCharOps[] = {"<=", ">=", "!=", "<>", "==", "||"};

  std::vector<Token> tokens;
  size_t i = 0;
  while (i < expr.size()) {
    char c = expr[i];
    if (std::isspace(static_cast<unsigned char>(c))) { ++i; continue; }

    if (c == '\'' || c == '"' || c == '`') {
      // a doubled quote character stands for itself
      std::string text;
      size_t j = i + 1;
      bool closed = false;
      while (j < expr.size()) {
        if (expr[j] == c) {
          if (j + 1 < expr.size() && expr[j + 1] == c) { text.push_back(c); j += 2; continue; }
          closed = true;
          break;
        }
        text.push_back(expr[j++]);
      }
      if (!closed) throw malformed(expr, "Unterminated quote.");
      tokens.push_back({c == '`' ? TokenKind::QuotedName : TokenKind::Literal, text});
      i = j + 1;
      continue;
    }

    if (isWordStart(c)) {
      const bool domainName = !tokens.empty() && isKeyword(tokens.back(), "from");
      size_t j = i;
      while (j < expr.size() && isWordChar(expr[j], domainName)) ++j;
      tokens.push_back({TokenKind::Word, expr.substr(i, j - i)});
      i = j;
      continue;
    }

    std::string op(1, c);
    if (i + 1 < expr.size()) {
      for (const char* two : twoCharOps) {
        if (expr[i] == two[0] && expr[i + 1] == two[1]) { op = two; break; }
      }
    }
    tokens.push_back({TokenKind::Punct, op});
    i += op.size();
  }
  return tokens;
}

} // namespace

TranslatedSelect translateSelect(const std::string& expression) {
  const std::vector<Token> tokens = tokenize(expression);
  if (tokens.empty() || !isKeyword(tokens[0], "select")) {
    throw malformed(expression, "Expected SELECT.");
  }

  size_t fromIdx = 0;
  int depth = 0;
  for (size_t i = 0; i < tokens.size(); ++i) {
    const Token& t = tokens[i];
    if (i > 0 && isKeyword(t, "select")) throw malformed(expression, "Subqueries are not supported.");
    if (isKeyword(t, "join")) throw malformed(expression, "Joins are not supported.");
    if (isPunct(t, ";")) throw malformed(expression, "Only one statement is allowed.");
    if (isPunct(t, "?") || isPunct(t, "$") || isPunct(t, ":") || isPunct(t, "@")) {
      throw malformed(expression, "Parameters are not supported.");
    }
    if (isPunct(t, "(")) ++depth;
    if (isPunct(t, ")") && --depth < 0) throw malformed(expression, "Unbalanced parentheses.");
    if (depth == 0 && fromIdx == 0 && isKeyword(t, "from")) fromIdx = i;
  }
  if (depth != 0) throw malformed(expression, "Unbalanced parentheses.");
  if (fromIdx == 0) throw malformed(expression, "Expected FROM.");
  if (fromIdx + 1 >= tokens.size() || tokens[fromIdx + 1].kind == TokenKind::Punct) {
    throw malformed(expression, "Expected a domain name after FROM.");
  }

  const size_t domainIdx = fromIdx + 1;
  TranslatedSelect out;
  out.domain = tokens[domainIdx].text;
  if (!DomainDirectory::isValidDomainName(out.domain)) {
    throw SdbError::invalidParameter("DomainName", out.domain);
  }
  if (domainIdx + 1 < tokens.size() && isPunct(tokens[domainIdx + 1], ",")) {
    throw malformed(expression, "Only one domain may be queried.");
  }

  for (size_t i = 0; i < tokens.size(); ++i) {
    const Token& t = tokens[i];
    std::string piece;
    if (i == domainIdx) {
      piece = quoteIdentifier(kItemTable);
    } else if (t.kind == TokenKind::Literal) {
      piece = quoteLiteral(t.text);
    } else if (t.kind == TokenKind::QuotedName) {
      piece = quoteIdentifier(t.text);
    } else if (isKeyword(t, "itemname") && i + 2 < tokens.size() &&
               isPunct(tokens[i + 1], "(") && isPunct(tokens[i + 2], ")")) {
      piece = quoteIdentifier(kItemNameColumn);
      i += 2;
    } else {
      piece = t.text;
    }
    if (!out.sql.empty()) out.sql.push_back(' ');
    out.sql += piece;
  }
  return out;
}

std::vector<SelectedItem> SelectTranslator::selectItems(const std::string& expression) {
  const TranslatedSelect q = translateSelect(expression);
  std::vector<SelectedItem> items;

  auto store = directory_.open(q.domain);
  if (!store) return items;

  spdlog::debug("select on {}: {}", q.domain, q.sql);
  auto st = store->db().prepare(q.sql);
  while (st.step()) {
    SelectedItem item;
    for (int c = 0; c < st.columnCount(); ++c) {
      std::string name = st.columnName(c);
      if (name == kItemNameColumn) {
        item.name = st.columnText(c).value_or("");
      } else {
        item.attributes.emplace_back(std::move(name), st.columnText(c));
      }
    }
    items.push_back(std::move(item));
  }
  return items;
}

} // namespace lsdb
