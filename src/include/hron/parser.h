#pragma once

#include <hron/ast.h>
#include <hron/error.h>
#include <hron/lexer.h>
#include <string>
#include <vector>

namespace hron {

struct ParseOptions {
    // Deepest bracket nesting accepted in the header or in the body.
    size_t max_depth = 512;
    // Print stage diagnostics to std::cerr.
    bool verbose = false;
};

// Recursive-descent tree builder over a token sequence. One instance parses
// one document; it keeps no state that outlives parse().
class Parser {
public:
    // `tokens` must outlive the parser. `source` is only used to quote the
    // offending line in error messages.
    Parser(const std::vector<Token>& tokens, const ParseOptions& options = {},
           const std::string& source = std::string());

    // Document := Header ':' ValueBlock
    Document parse();

    SchemaNode parse_key_node();
    DataNode parse_value_node();

private:
    const Token& peek() const;
    const Token& next();
    bool at_end() const { return pos_ >= tokens_.size(); }
    bool at_symbol(char c) const { return not at_end() and tokens_[pos_].is_symbol(c); }

    // Consume the next token, which must have the given kind (and literal).
    const Token& expect(TokenKind kind, char symbol = '\0');

    std::vector<SchemaNode> parse_key_list(char close, bool named_fields);
    std::vector<DataNode> parse_value_list(char close);
    void enter(size_t offset);
    void leave() { --depth_; }

    [[noreturn]] void fail(ErrorKind kind, const std::string& msg, size_t offset) const;
    size_t end_offset() const;

    const std::vector<Token>& tokens_;
    ParseOptions options_;
    std::string source_;
    size_t pos_ = 0;
    size_t depth_ = 0;
};

}  // namespace hron
