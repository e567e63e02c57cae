#pragma once

#include <cstddef>
#include <iostream>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "errors.hpp"

// Error reporting state for one top level run: one script, or one REPL line.
// Scanner and parser report through error()/report(syntax_error) which set had_error(),
// the evaluator's failures end up in report(runtime_error) which sets had_runtime_error().
class diagnostics final
{
  public:
    explicit diagnostics(std::ostream& err = std::cerr);

    auto error(std::size_t line, std::string_view message) -> void;
    auto report(std::size_t line, std::string_view where, std::string_view message) -> void;
    auto report(const syntax_error& err) -> void;
    auto report(const runtime_error& err) -> void;

    [[nodiscard]] auto had_error() const -> bool;
    [[nodiscard]] auto had_runtime_error() const -> bool;
    [[nodiscard]] auto messages() const -> const std::vector<std::string>&;

    // clears the syntax error flag and the recorded messages before the next
    // independent input unit; the runtime flag survives
    auto reset() -> void;

  private:
    auto emit(std::string message) -> void;

    std::ostream& m_err;
    bool m_had_error {};
    bool m_had_runtime_error {};
    std::vector<std::string> m_messages;
};
