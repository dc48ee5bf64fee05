#include "PolicyGuard.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>

namespace mcpdb {

namespace {

// ============================================================================
// Lexical scanning
// ============================================================================

enum class TokenKind {
    Word,    ///< Keyword or bare identifier, upper-cased
    Quoted,  ///< String literal or backtick identifier
    Symbol   ///< Any other single character
};

struct Token {
    TokenKind kind;
    std::string text;
};

struct Scan {
    std::vector<Token> tokens;
    bool executableComment = false;
};

bool isWordChar(unsigned char c) {
    return std::isalnum(c) || c == '_' || c == '$' || c >= 0x80;
}

size_t lineEnd(const std::string& sql, size_t pos) {
    auto end = sql.find('\n', pos);
    return end == std::string::npos ? sql.size() : end;
}

// Length of the literal, quoted identifier or comment starting at `pos`,
// or 0 if `pos` starts ordinary text. Unterminated ones run to the end.
size_t skipLength(const std::string& sql, size_t pos, bool& executable) {
    const size_t n = sql.size();
    const char c = sql[pos];

    if (c == '\'' || c == '"' || c == '`') {
        size_t i = pos + 1;
        while (i < n) {
            if (sql[i] == '\\' && c != '`') {
                i += 2;
                continue;
            }
            if (sql[i] == c) {
                if (i + 1 < n && sql[i + 1] == c) {
                    i += 2;
                    continue;
                }
                return i + 1 - pos;
            }
            ++i;
        }
        return n - pos;
    }

    if (c == '#') {
        return lineEnd(sql, pos) - pos;
    }

    // "--" opens a comment only when followed by whitespace or the end
    if (c == '-' && pos + 1 < n && sql[pos + 1] == '-' &&
        (pos + 2 == n || std::isspace(static_cast<unsigned char>(sql[pos + 2])) ||
         std::iscntrl(static_cast<unsigned char>(sql[pos + 2])))) {
        return lineEnd(sql, pos) - pos;
    }

    if (c == '/' && pos + 1 < n && sql[pos + 1] == '*') {
        // /*! ... */ (MySQL) and /*M! ... */ (MariaDB) are executed by the server
        if (pos + 2 < n && (sql[pos + 2] == '!' ||
                            (sql[pos + 2] == 'M' && pos + 3 < n && sql[pos + 3] == '!'))) {
            executable = true;
        }
        auto end = sql.find("*/", pos + 2);
        return end == std::string::npos ? n - pos : end + 2 - pos;
    }

    return 0;
}

Scan tokenize(const std::string& sql) {
    Scan scan;
    size_t pos = 0;

    while (pos < sql.size()) {
        const unsigned char c = static_cast<unsigned char>(sql[pos]);

        if (std::isspace(c)) {
            ++pos;
            continue;
        }

        size_t skip = skipLength(sql, pos, scan.executableComment);
        if (skip > 0) {
            if (c == '\'' || c == '"' || c == '`') {
                scan.tokens.push_back({TokenKind::Quoted, sql.substr(pos, skip)});
            }
            pos += skip;
            continue;
        }

        if (isWordChar(c)) {
            size_t start = pos;
            while (pos < sql.size() && isWordChar(static_cast<unsigned char>(sql[pos]))) {
                ++pos;
            }
            std::string word = sql.substr(start, pos - start);
            std::transform(word.begin(), word.end(), word.begin(),
                           [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
            scan.tokens.push_back({TokenKind::Word, std::move(word)});
            continue;
        }

        scan.tokens.push_back({TokenKind::Symbol, std::string(1, static_cast<char>(c))});
        ++pos;
    }

    return scan;
}

// ============================================================================
// Classification
// ============================================================================

using TokenIt = std::vector<Token>::const_iterator;

bool isSymbol(TokenIt it, char symbol) {
    return it->kind == TokenKind::Symbol && it->text[0] == symbol;
}

bool isWord(TokenIt it, const char* word) {
    return it->kind == TokenKind::Word && it->text == word;
}

// Position just past the parenthesised group opening at `it`
TokenIt skipGroup(TokenIt it, TokenIt end) {
    int depth = 0;
    for (; it != end; ++it) {
        if (isSymbol(it, '(')) {
            ++depth;
        } else if (isSymbol(it, ')')) {
            if (--depth == 0) {
                return it + 1;
            }
        }
    }
    return end;
}

StatementKind classifyStatement(TokenIt begin, TokenIt end);

StatementKind classifySelect(TokenIt begin, TokenIt end) {
    for (auto it = begin; it != end; ++it) {
        if (isWord(it, "INTO") && it + 1 != end &&
            (isWord(it + 1, "OUTFILE") || isWord(it + 1, "DUMPFILE"))) {
            return StatementKind::Write;
        }
    }
    return StatementKind::Read;
}

// WITH [RECURSIVE] name [(cols)] AS (...) [, ...] <statement>
StatementKind classifyWith(TokenIt it, TokenIt end) {
    if (it != end && isWord(it, "RECURSIVE")) {
        ++it;
    }

    while (true) {
        if (it == end || it->kind == TokenKind::Symbol) {
            return StatementKind::Write;
        }
        ++it;

        if (it != end && isSymbol(it, '(')) {
            it = skipGroup(it, end);
        }
        if (it == end || !isWord(it, "AS")) {
            return StatementKind::Write;
        }
        ++it;
        if (it == end || !isSymbol(it, '(')) {
            return StatementKind::Write;
        }
        TokenIt body = it + 1;
        it = skipGroup(it, end);
        if (it == end && !isSymbol(end - 1, ')')) {
            return StatementKind::Write;
        }
        if (classifyStatement(body, it - 1) == StatementKind::Write) {
            return StatementKind::Write;
        }

        if (it != end && isSymbol(it, ',')) {
            ++it;
            continue;
        }
        break;
    }

    return classifyStatement(it, end);
}

// EXPLAIN | DESCRIBE | DESC [options] {statement | table [column]}
// EXPLAIN ANALYZE executes the statement it wraps
StatementKind classifyExplain(TokenIt it, TokenIt end) {
    while (it != end && it->kind == TokenKind::Word) {
        if (isWord(it, "ANALYZE") || isWord(it, "EXTENDED") || isWord(it, "PARTITIONS")) {
            ++it;
        } else if (isWord(it, "FORMAT") && it + 1 != end && isSymbol(it + 1, '=')) {
            it += 2;
            if (it != end) {
                ++it;
            }
        } else {
            break;
        }
    }

    if (it == end) {
        return StatementKind::Write;
    }
    if (isSymbol(it, '(') || isWord(it, "SELECT") || isWord(it, "WITH") || isWord(it, "TABLE")) {
        return classifyStatement(it, end);
    }
    if (it->kind == TokenKind::Quoted) {
        return StatementKind::Read;
    }
    if (it->kind != TokenKind::Word || isWord(it, "INSERT") || isWord(it, "UPDATE") ||
        isWord(it, "DELETE") || isWord(it, "REPLACE")) {
        return StatementKind::Write;
    }
    // Table name
    return StatementKind::Read;
}

StatementKind classifyStatement(TokenIt begin, TokenIt end) {
    while (begin != end && isSymbol(begin, '(')) {
        ++begin;
    }
    if (begin == end || begin->kind != TokenKind::Word) {
        return StatementKind::Write;
    }

    const std::string& keyword = begin->text;
    if (keyword == "SELECT") {
        return classifySelect(begin + 1, end);
    }
    if (keyword == "SHOW") {
        return StatementKind::Read;
    }
    if (keyword == "DESCRIBE" || keyword == "DESC" || keyword == "EXPLAIN") {
        return classifyExplain(begin + 1, end);
    }
    if (keyword == "TABLE") {
        return begin + 1 == end ? StatementKind::Write : classifySelect(begin + 1, end);
    }
    if (keyword == "WITH") {
        return classifyWith(begin + 1, end);
    }
    return StatementKind::Write;
}

}  // namespace

// ============================================================================
// PolicyGuard
// ============================================================================

StatementKind PolicyGuard::classify(const std::string& sql) {
    const Scan scan = tokenize(sql);
    if (scan.executableComment) {
        return StatementKind::Write;
    }

    const auto& tokens = scan.tokens;
    bool any = false;
    auto start = tokens.begin();

    for (auto it = tokens.begin();; ++it) {
        if (it == tokens.end() || isSymbol(it, ';')) {
            if (it != start) {
                any = true;
                if (classifyStatement(start, it) == StatementKind::Write) {
                    return StatementKind::Write;
                }
            }
            if (it == tokens.end()) {
                break;
            }
            start = it + 1;
        }
    }

    return any ? StatementKind::Read : StatementKind::Write;
}

void PolicyGuard::enforceReadOnly(const std::string& sql, bool readOnly) {
    if (readOnly && isWriteStatement(sql)) {
        spdlog::warn("Blocked write statement in read-only mode");
        throw ReadOnlyViolationError("Write operations are not allowed in read-only mode");
    }
}

BoundStatement PolicyGuard::bind(const std::string& sql, const std::vector<Parameter>& parameters) {
    for (size_t i = 0; i < parameters.size(); ++i) {
        const auto& value = parameters[i];
        if (value.is_array() || value.is_object() || value.is_binary()) {
            throw ParameterBindingError("Parameter " + std::to_string(i + 1) +
                                        " has unsupported type '" + value.type_name() + "'");
        }
    }

    BoundStatement bound;
    bound.sql.reserve(sql.size());

    size_t placeholders = 0;
    bool executable = false;
    size_t pos = 0;

    while (pos < sql.size()) {
        size_t skip = skipLength(sql, pos, executable);
        if (skip > 0) {
            bound.sql.append(sql, pos, skip);
            pos += skip;
            continue;
        }

        if (sql[pos] == '?') {
            ++placeholders;
            bound.sql += '?';
            ++pos;
        } else if (sql[pos] == '%' && pos + 1 < sql.size() && sql[pos + 1] == 's') {
            ++placeholders;
            bound.sql += '?';
            pos += 2;
        } else {
            bound.sql += sql[pos++];
        }
    }

    if (placeholders != parameters.size()) {
        throw ParameterBindingError("Statement has " + std::to_string(placeholders) +
                                    " placeholder(s) but " + std::to_string(parameters.size()) +
                                    " parameter(s) were supplied");
    }

    bound.parameters = parameters;
    return bound;
}

const char* PolicyGuard::kindName(StatementKind kind) {
    return kind == StatementKind::Read ? "READ" : "WRITE";
}

}  // namespace mcpdb
