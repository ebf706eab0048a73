#include "engine/span_rewriter.hpp"
#include "core/utf8.hpp"

namespace anonymizer {

EngineResult rewrite_spans(std::string_view text, const std::vector<SpanEdit>& edits) {
    const auto b = utf8::boundaries(text);

    EngineResult result;
    result.text.reserve(text.size());
    result.items.reserve(edits.size());

    size_t cursor = 0;        // byte position in input
    size_t out_cp = 0;        // code points written so far
    size_t in_cp = 0;         // code point position in input

    for (const auto& edit : edits) {
        // Unchanged text before the edit
        result.text.append(text.substr(cursor, b[edit.start] - cursor));
        out_cp += edit.start - in_cp;

        const size_t replacement_len = utf8::length(edit.replacement);
        result.items.push_back(OperatorResult{
            edit.entity_type,
            out_cp,
            out_cp + replacement_len,
            edit.operator_name,
            edit.replacement
        });

        result.text.append(edit.replacement);
        out_cp += replacement_len;
        cursor = b[edit.end];
        in_cp = edit.end;
    }
    result.text.append(text.substr(cursor));
    return result;
}

} // namespace anonymizer
