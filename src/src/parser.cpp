#include <hron/parser.h>
#include <sstream>

namespace hron {

namespace {
    std::string describe(const Token& t) {
        std::ostringstream ss;
        ss << token_kind_name(t.kind);
        switch (t.kind) {
            case TokenKind::Identifier:
            case TokenKind::Symbol:
            case TokenKind::String:
                ss << " '" << t.literal.as_string() << "'";
                break;
            case TokenKind::Number:
            case TokenKind::Boolean:
                ss << " " << t.literal.to_string();
                break;
            case TokenKind::Null:
                break;
        }
        return ss.str();
    }

    std::string describe_expected(TokenKind kind, char symbol) {
        if (symbol != '\0') return std::string("'") + symbol + "'";
        return token_kind_name(kind);
    }
}

const char* key_kind_name(KeyKind kind) noexcept {
    switch (kind) {
        case KeyKind::Object:
            return "Object";
        case KeyKind::List:
            return "List";
        case KeyKind::Leaf:
            return "Leaf";
    }
    return "Unknown";
}

const char* value_kind_name(ValueKind kind) noexcept {
    switch (kind) {
        case ValueKind::Object:
            return "Object";
        case ValueKind::List:
            return "List";
        case ValueKind::String:
            return "String";
        case ValueKind::Number:
            return "Number";
        case ValueKind::Boolean:
            return "Boolean";
        case ValueKind::Null:
            return "Null";
    }
    return "Unknown";
}

Parser::Parser(const std::vector<Token>& tokens, const ParseOptions& options,
               const std::string& source)
    : tokens_(tokens), options_(options), source_(source) {}

const Token& Parser::peek() const {
    if (at_end()) fail(ErrorKind::UnexpectedEndOfInput, "unexpected end of input", end_offset());
    return tokens_[pos_];
}

const Token& Parser::next() {
    const Token& t = peek();
    ++pos_;
    return t;
}

const Token& Parser::expect(TokenKind kind, char symbol) {
    if (at_end()) {
        fail(ErrorKind::UnexpectedEndOfInput,
             "expected " + describe_expected(kind, symbol) + " but reached end of input",
             end_offset());
    }
    const Token& t = next();
    if (t.kind != kind or (symbol != '\0' and not t.is_symbol(symbol))) {
        fail(ErrorKind::UnexpectedToken,
             "expected " + describe_expected(kind, symbol) + " but got " + describe(t),
             t.offset);
    }
    return t;
}

void Parser::enter(size_t offset) {
    if (++depth_ > options_.max_depth) {
        std::ostringstream msg;
        msg << "nesting deeper than " << options_.max_depth << " levels";
        fail(ErrorKind::NestingTooDeep, msg.str(), offset);
    }
}

void Parser::fail(ErrorKind kind, const std::string& msg, size_t offset) const {
    throw make_syntax_error(kind, msg, source_, offset);
}

size_t Parser::end_offset() const {
    if (not source_.empty()) return source_.size();
    return tokens_.empty() ? 0 : tokens_.back().offset + 1;
}

Document Parser::parse() {
    pos_ = 0;
    depth_ = 0;

    std::vector<SchemaNode> keys = parse_key_list(':', true);
    expect(TokenKind::Symbol, ':');

    Document doc;
    if (keys.size() == 1 and keys[0].name.empty() and keys[0].is_composite()) {
        // `{...}: {...}` or `[...]: [...]` - the bracket is the root itself
        doc.header = std::move(keys[0]);
        doc.body = parse_value_node();
        if (at_symbol(',')) next();
        if (not at_end()) {
            const Token& t = peek();
            fail(ErrorKind::UnexpectedToken, "expected end of input but got " + describe(t),
                 t.offset);
        }
        return doc;
    }

    doc.header.kind = KeyKind::Object;
    doc.header.children = std::move(keys);
    doc.body.kind = ValueKind::Object;
    doc.body.children = parse_value_list('\0');
    return doc;
}

std::vector<SchemaNode> Parser::parse_key_list(char close, bool named_fields) {
    std::vector<SchemaNode> out;
    size_t unnamed_at = std::string::npos;
    while (not at_symbol(close)) {
        const size_t offset = peek().offset;
        SchemaNode node = parse_key_node();
        if (named_fields and node.name.empty() and unnamed_at == std::string::npos)
            unnamed_at = offset;
        if (named_fields and not node.name.empty()) {
            for (auto const& sibling : out) {
                if (sibling.name == node.name)
                    fail(ErrorKind::DuplicateKey, "duplicate key '" + node.name + "'", offset);
            }
        }
        out.push_back(std::move(node));
        if (at_symbol(close)) break;
        if (at_end()) expect(TokenKind::Symbol, close);
        expect(TokenKind::Symbol, ',');
    }
    // a lone unnamed bracket before ':' is the document root
    if (unnamed_at != std::string::npos and not(close == ':' and out.size() == 1))
        fail(ErrorKind::UnexpectedToken, "object fields must be named", unnamed_at);
    return out;
}

std::vector<DataNode> Parser::parse_value_list(char close) {
    // close == '\0' means the list runs to the end of the tokens
    auto at_close = [&]() { return close == '\0' ? at_end() : at_symbol(close); };
    std::vector<DataNode> out;
    while (not at_close()) {
        out.push_back(parse_value_node());
        if (at_close()) break;
        if (at_end()) expect(TokenKind::Symbol, close);
        expect(TokenKind::Symbol, ',');
    }
    return out;
}

SchemaNode Parser::parse_key_node() {
    const Token& t = peek();
    SchemaNode node;

    if (t.kind == TokenKind::Identifier) {
        next();
        node.name = t.literal.as_string();
        if (not at_symbol('{') and not at_symbol('[')) {
            node.kind = KeyKind::Leaf;
            return node;
        }
    } else if (not t.is_symbol('{') and not t.is_symbol('[')) {
        fail(ErrorKind::UnexpectedToken, "unexpected " + describe(t) + " while parsing key",
             t.offset);
    }

    const Token& open = next();
    const bool is_object = open.is_symbol('{');
    const char close = is_object ? '}' : ']';
    node.kind = is_object ? KeyKind::Object : KeyKind::List;

    enter(open.offset);
    node.children = parse_key_list(close, is_object);
    expect(TokenKind::Symbol, close);
    leave();
    return node;
}

DataNode Parser::parse_value_node() {
    const Token& t = next();
    DataNode node;

    switch (t.kind) {
        case TokenKind::String:
            node.kind = ValueKind::String;
            node.literal = t.literal;
            return node;
        case TokenKind::Number:
            node.kind = ValueKind::Number;
            node.literal = t.literal;
            return node;
        case TokenKind::Boolean:
            node.kind = ValueKind::Boolean;
            node.literal = t.literal;
            return node;
        case TokenKind::Null:
            node.kind = ValueKind::Null;
            return node;
        case TokenKind::Identifier:
            fail(ErrorKind::UnexpectedToken,
                 "unexpected " + describe(t) + " while parsing value (strings must be quoted)",
                 t.offset);
        case TokenKind::Symbol:
            break;
    }

    if (not t.is_symbol('{') and not t.is_symbol('[')) {
        fail(ErrorKind::UnexpectedToken, "unexpected " + describe(t) + " while parsing value",
             t.offset);
    }
    const bool is_object = t.is_symbol('{');
    const char close = is_object ? '}' : ']';
    node.kind = is_object ? ValueKind::Object : ValueKind::List;

    enter(t.offset);
    node.children = parse_value_list(close);
    expect(TokenKind::Symbol, close);
    leave();
    return node;
}

}  // namespace hron
