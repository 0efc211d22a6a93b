#include "language.h"

#include <boost/algorithm/string/replace.hpp>

namespace sandboxd {

namespace {

const std::vector<Language>& Languages() {
  static const std::vector<Language> languages = {
      {"python", ".py", "python3 {file}"},
      {"javascript", ".js", "node {file}"},
      {"typescript", ".ts", "npx ts-node {file}"},
      {"go", ".go", "go run {file}"},
      {"rust", ".rs", "rustc -o .main_rs {file} && ./.main_rs"},
      {"java", ".java", "java {file}"},
      {"cpp", ".cpp", "g++ -O2 -o .main_cpp {file} && ./.main_cpp"},
  };
  return languages;
}

}

const Language* FindLanguage(StringView tag) {
  for (const Language& language : Languages()) {
    if (language.tag == tag) {
      return &language;
    }
  }
  return nullptr;
}

std::vector<std::string> SupportedLanguages() {
  std::vector<std::string> tags;
  for (const Language& language : Languages()) {
    tags.push_back(language.tag);
  }
  return tags;
}

std::string BuildRunCommand(const Language& language, const std::string& file) {
  return boost::algorithm::replace_all_copy(language.run_command, "{file}",
                                            ShellQuote(file));
}

std::string ShellQuote(StringView value) {
  std::string quoted = "'";
  for (char c : value) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted.push_back(c);
    }
  }
  quoted.push_back('\'');
  return quoted;
}

}
