#pragma once

#include "core/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace anonymizer {

// One replacement, offsets in code points of the input text
struct SpanEdit {
    size_t start;
    size_t end;
    std::string entity_type;
    std::string operator_name;
    std::string replacement;
};

/**
 * @brief Apply non-overlapping edits (sorted by start) to text
 *
 * Output offsets account for the length change of every earlier edit, so
 * items[i].start/end locate items[i].text inside the returned text.
 */
[[nodiscard]] EngineResult rewrite_spans(std::string_view text, const std::vector<SpanEdit>& edits);

} // namespace anonymizer
