#ifndef SANDBOXD_LANGUAGE_H
#define SANDBOXD_LANGUAGE_H

#include <string>
#include <vector>
#include "shim.h"

namespace sandboxd {

struct Language {
  std::string tag;
  std::string extension;
  // Shell command line, "{file}" is replaced by the code file path.
  std::string run_command;
};

// Returns nullptr for unknown tags.
const Language* FindLanguage(StringView tag);

std::vector<std::string> SupportedLanguages();

std::string BuildRunCommand(const Language& language, const std::string& file);

// Quotes |value| for use as one word of a POSIX shell command line.
std::string ShellQuote(StringView value);

}

#endif //SANDBOXD_LANGUAGE_H
