#pragma once

#include "sthe/extract/Compiler.hpp"
#include "sthe/html/Document.hpp"
#include "sthe/html/Node.hpp"
#include "sthe/model/Value.hpp"

#include <string_view>

namespace sthe::extract {

// Applies `option` to the subtree below `root`. Total: missing matches and
// missing attributes become absent leaves or empty lists, never errors.
model::Value evaluate(const html::Node& root, const CompiledOption& option);

// The value `option` produces when its selector matches nothing.
model::Value absentValue(const CompiledOption& option);

// Parse `document` as a full HTML document and evaluate against its root.
// Throws html::MalformedInputError only when the parser cannot take the input.
model::Value extractDocument(std::string_view document, const CompiledOption& option);

// Parse `fragment` without an implied html/body wrapper and evaluate.
model::Value extractFragment(std::string_view fragment, const CompiledOption& option);

} // namespace sthe::extract
