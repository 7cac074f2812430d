#pragma once

#include "gitsim_engine/engine.hpp"
#include "gitsim_engine/types.hpp"
#include <string>
#include <vector>

namespace gitsim {

// Splits on unquoted spaces; single and double quotes group. Fails with
// InvalidArgument on an unterminated quote.
Result<std::vector<std::string>> tokenize_command(const std::string& line);

// Parses "git checkout -b topic", "co main", "commit -m 'msg'", ... into a
// Command. Usage errors are InvalidArgument, unknown verbs UnknownCommand.
Result<Command> parse_command(const std::string& line);

} // namespace gitsim
