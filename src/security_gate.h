#ifndef SANDBOXD_SECURITY_GATE_H
#define SANDBOXD_SECURITY_GATE_H

#include <boost/regex.hpp>
#include <map>
#include <nlohmann/json.hpp>
#include <set>
#include <string>
#include <vector>
#include "config.h"
#include "rate_limiter.h"
#include "status.h"

namespace sandboxd {

struct PatternRule {
  // Reported on rejection instead of the matched text.
  std::string pattern_class;
  boost::regex regex;
};

class SecurityGate {
 public:
  explicit SecurityGate(const SecurityConfig& config);
  SecurityGate(const SecurityGate&) = delete;
  SecurityGate& operator=(const SecurityGate&) = delete;

  // Global rules first, then the rules of |language|.
  Status ValidateCode(const std::string& language, const std::string& code) const;

  Status ConsumeRateLimit(const std::string& client_id,
                          TimePoint now,
                          int points = 1);

  // Empty key and origin sets disable the respective check.
  Status CheckCredentials(const std::string& api_key,
                          const std::string& origin) const;

  static Status ValidateEnvelope(const nlohmann::json& request);

  // Strips script tags, inline event handlers and javascript: prefixes from
  // every string in |params|, at any depth.
  static void Sanitize(nlohmann::json* params);
  static std::string SanitizeString(const std::string& value);

  static const std::vector<PatternRule>& GlobalRules();
  static const std::map<std::string, std::vector<PatternRule>>& LanguageRules();

 private:
  KeyedRateLimiter client_limiter_;
  const std::set<std::string> api_keys_;
  const std::set<std::string> allowed_origins_;
};

}

#endif //SANDBOXD_SECURITY_GATE_H
