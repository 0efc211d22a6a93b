#include "util.h"

#include <boost/algorithm/string.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/format.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace sandboxd {

Status WriteFile(const Path& file, StringView content) {
  boost::filesystem::ofstream sink(file, std::ios::binary | std::ios::trunc);
  if (!sink) {
    return Status(errc::runtime, "cannot open " + file.string());
  }
  sink.write(content.data(), content.size());
  sink.close();
  if (!sink) {
    return Status(errc::runtime, "cannot write " + file.string());
  }
  return Status();
}

Status MakeDirs(const Path& dir) {
  boost::system::error_code error_code;
  boost::filesystem::create_directories(dir, error_code);
  if (error_code) {
    return Status(errc::infrastructure,
                  "create " + dir.string() + ": " + error_code.message());
  }
  return Status();
}

Status RemoveFile(const Path& file) {
  boost::system::error_code error_code;
  boost::filesystem::remove(file, error_code);
  if (error_code) {
    return Status(errc::infrastructure,
                  "remove " + file.string() + ": " + error_code.message());
  }
  return Status();
}

Status RemoveDir(const Path& dir) {
  boost::system::error_code error_code;
  boost::filesystem::remove_all(dir, error_code);
  if (error_code) {
    return Status(errc::infrastructure,
                  "remove " + dir.string() + ": " + error_code.message());
  }
  return Status();
}

std::string RandomId() {
  static boost::uuids::random_generator generator;
  return boost::uuids::to_string(generator());
}

Optional<int64_t> ParseMemorySize(StringView size) {
  std::string text = boost::algorithm::trim_copy(size.to_string());
  if (text.empty()) {
    return boost::none;
  }
  int64_t multiplier = 1;
  switch (std::tolower(static_cast<unsigned char>(text.back()))) {
  case 'g':
    multiplier = int64_t(1) << 30;
    break;
  case 'm':
    multiplier = int64_t(1) << 20;
    break;
  case 'k':
    multiplier = int64_t(1) << 10;
    break;
  default:
    break;
  }
  if (multiplier != 1) {
    text.pop_back();
  }
  if (text.empty() || !std::all_of(text.begin(), text.end(), ::isdigit)) {
    return boost::none;
  }
  try {
    return std::stoll(text) * multiplier;
  } catch (const std::out_of_range&) {
    return boost::none;
  }
}

int64_t NowMillis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string UrlEncode(StringView value) {
  std::string encoded;
  encoded.reserve(value.size() * 3);
  for (char c : value) {
    unsigned char byte = static_cast<unsigned char>(c);
    if (std::isalnum(byte) || c == '-' || c == '_' || c == '.' || c == '~') {
      encoded.push_back(c);
    } else {
      encoded += (boost::format("%%%02X") % static_cast<int>(byte)).str();
    }
  }
  return encoded;
}

std::vector<std::string> SplitList(StringView list) {
  std::vector<std::string> parts;
  std::string text = list.to_string();
  boost::algorithm::split(parts, text, boost::algorithm::is_any_of(","));
  std::vector<std::string> result;
  for (auto& part : parts) {
    boost::algorithm::trim(part);
    if (!part.empty()) {
      result.push_back(part);
    }
  }
  return result;
}

}
