#include <hron/hron.h>
#include <hron/colorize.h>
#include <hron/emit.h>
#include <hron/hierarchy.h>
#include <hron/lexer.h>
#include <hron/reconcile.h>
#include <iostream>

namespace hron {

Value parse(const std::string& text, const ParseOptions& options) {
    std::vector<Token> tokens = tokenize(text);
    if (options.verbose) std::cerr << "[hron] " << tokens.size() << " tokens\n";

    Parser parser(tokens, options, text);
    Document doc = parser.parse();

    const ValueKind expected =
        doc.header.kind == KeyKind::List ? ValueKind::List : ValueKind::Object;
    const bool empty_schema =
        doc.header.kind == KeyKind::Object and doc.header.children.empty();
    if (not empty_schema and doc.body.kind != expected) {
        throw Error(ErrorKind::SchemaMismatch,
                    std::string("schema mismatch for the document root: declared ") +
                        value_kind_name(expected) + " but found " +
                        value_kind_name(doc.body.kind));
    }

    auto keys = flatten(doc.header);
    auto values = flatten(doc.body);
    if (options.verbose) {
        std::cerr << "[hron] header: " << keys.size() << " keys, body: " << values.size()
                  << " values, root " << key_kind_name(doc.header.kind) << "\n";
    }

    return reconcile(keys, values, doc.header.kind);
}

std::string stringify(const Value& value, const StringifyOptions& options) {
    std::string schema = emit_schema(value);
    std::string values = emit_values(value, options.indent);
    std::string out = compose(value, schema, values);
    if (options.colorize) return colorize(out);
    return out;
}

}  // namespace hron
