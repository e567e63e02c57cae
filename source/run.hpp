#pragma once

#include <ostream>
#include <string_view>

#include <diagnostics/diagnostics.hpp>

// Scans, parses and evaluates one input unit. The value's text goes to out; errors go
// through diag and evaluation is skipped when scanning or parsing reported one.
// With trace set the parsed tree is written there before evaluating.
auto run(std::string_view source, diagnostics& diag, std::ostream& out, std::ostream* trace = nullptr) -> void;
