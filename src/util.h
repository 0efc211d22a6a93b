#ifndef SANDBOXD_UTIL_H
#define SANDBOXD_UTIL_H

#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include "shim.h"
#include "status.h"

namespace sandboxd {

Status WriteFile(const Path& file, StringView content);

Status MakeDirs(const Path& dir);

Status RemoveFile(const Path& file);

Status RemoveDir(const Path& dir);

// Random version 4 UUID in canonical text form.
std::string RandomId();

inline std::string ShortId() {
  return RandomId().substr(0, 8);
}

// Accepts "5g", "512m", "64k" or a plain byte count.
Optional<int64_t> ParseMemorySize(StringView size);

int64_t NowMillis();

std::string UrlEncode(StringView value);

std::vector<std::string> SplitList(StringView list);

}

#endif //SANDBOXD_UTIL_H
