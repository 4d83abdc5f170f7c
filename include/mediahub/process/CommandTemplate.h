// Repository: MediaHub
// Component: Command Templates
// Purpose: Expands configured command lines ("mpg123 -q {path}") into argv.
// Copyright (c) 2026 MediaHub

#ifndef MEDIAHUB_PROCESS_COMMAND_TEMPLATE_H_
#define MEDIAHUB_PROCESS_COMMAND_TEMPLATE_H_

#include <map>
#include <string>
#include <vector>

namespace mediahub::process {

using TemplateVars = std::map<std::string, std::string>;

// Splits `command_template` on whitespace, then replaces every "{name}" inside
// each token with vars[name]. Substitution happens after splitting, so a value
// containing spaces (a file path, the text to speak) stays one argument.
// Unknown placeholders are left as-is. Empty tokens are dropped.
std::vector<std::string> ExpandCommand(const std::string& command_template,
                                       const TemplateVars& vars);

// Adds the volume placeholders for a 0-100 volume: {volume} (0-100),
// {scale} (mpg123 -f scale, 0-32768) and {gain} (0.00-1.00).
void AddVolumeVars(int volume_percent, TemplateVars& vars);

// First whitespace-separated token of the template ("mpg123").
std::string CommandBinary(const std::string& command_template);

// True if `binary` names an executable: either a path containing '/' that is
// executable, or a name found in one of the PATH directories.
bool IsExecutableAvailable(const std::string& binary);

// Joins argv for logging.
std::string JoinArgv(const std::vector<std::string>& argv);

}  // namespace mediahub::process

#endif  // MEDIAHUB_PROCESS_COMMAND_TEMPLATE_H_
