#pragma once

#include <string>
#include <vector>

#include "queue/remote_execution_message.hpp"
#include "sandbox/exec_types.hpp"

namespace remex::sandbox {

enum class LineParseOption {
    // tag "at file:line" references (heaptrack and similar reports)
    kAtFileLine
};

// Splits captured output into lines and tags source locations.
std::vector<OutputLine> ParseOutput(const std::string& text,
                                    const std::vector<LineParseOption>& options = {});

// Shell-like tokenizing of a single argument string: whitespace separated,
// single/double quotes group, backslash escapes outside single quotes.
std::vector<std::string> SplitArguments(const std::string& text);

std::vector<std::string> ResolveArgs(const queue::ExecutionParams& params);

}  // namespace remex::sandbox
