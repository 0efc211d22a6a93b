#include "security_gate.h"

#include <glog/logging.h>

namespace sandboxd {

namespace {

std::vector<PatternRule> Rules(
    std::initializer_list<std::pair<const char*, const char*>> rules) {
  std::vector<PatternRule> compiled;
  for (const auto& rule : rules) {
    compiled.push_back({rule.first, boost::regex(rule.second)});
  }
  return compiled;
}

const PatternRule* FirstMatch(const std::vector<PatternRule>& rules,
                              const std::string& code) {
  for (const PatternRule& rule : rules) {
    if (boost::regex_search(code, rule.regex)) {
      return &rule;
    }
  }
  return nullptr;
}

}

SecurityGate::SecurityGate(const SecurityConfig& config)
    : client_limiter_(config.client_rate_limit_points,
                      config.client_rate_limit_window),
      api_keys_(config.api_keys.begin(), config.api_keys.end()),
      allowed_origins_(config.allowed_origins.begin(),
                       config.allowed_origins.end()) {}

const std::vector<PatternRule>& SecurityGate::GlobalRules() {
  static const std::vector<PatternRule> rules = Rules({
      {"process-spawning", R"(require\s*\(\s*['"]child_process['"]\s*\))"},
      {"process-spawning", R"(import\s+.*child_process)"},
      {"process-spawning", R"(exec\s*\()"},
      {"dynamic-evaluation", R"(eval\s*\()"},
      {"process-spawning", R"(system\s*\()"},
      {"process-spawning", R"(shell_exec\s*\()"},
      {"process-spawning", R"(passthru\s*\()"},
      {"process-spawning", R"(proc_open\s*\()"},
      {"process-spawning", R"(popen\s*\()"},
      {"forbidden-path", R"(file_get_contents\s*\(\s*['"]/(proc|sys|etc)/)"},
      {"module-import", R"(__import__\s*\(\s*['"]os['"]\s*\))"},
      {"process-spawning", R"(__import__\s*\(\s*['"]subprocess['"]\s*\))"},
      {"process-spawning", R"(subprocess\.)"},
      {"process-spawning", R"(os\.system)"},
      {"process-spawning", R"(os\.popen)"},
      {"process-spawning", R"(Runtime\.getRuntime\(\)\.exec)"},
      {"process-spawning", R"(ProcessBuilder)"},
      {"shell-metacharacter", R"(\$\()"},
      {"shell-metacharacter", R"(`[^`]*`)"},
  });
  return rules;
}

const std::map<std::string, std::vector<PatternRule>>&
SecurityGate::LanguageRules() {
  static const std::vector<PatternRule> javascript = Rules({
      {"module-import", R"(require\s*\()"},
      {"module-import", R"(import\s*\()"},
      {"dynamic-evaluation", R"(new\s+Function\s*\()"},
      {"dynamic-evaluation", R"(Function\s*\()"},
      {"timer", R"(setTimeout\s*\()"},
      {"timer", R"(setInterval\s*\()"},
      {"network-access", R"(XMLHttpRequest)"},
      {"network-access", R"(fetch\s*\()"},
      {"host-object", R"(window\.)"},
      {"host-object", R"(document\.)"},
      {"host-object", R"(global\.)"},
      {"host-object", R"(process\.)"},
      {"host-object", R"(Buffer\.)"},
      {"host-object", R"(__dirname)"},
      {"host-object", R"(__filename)"},
  });
  static const std::vector<PatternRule> shell = Rules({
      {"shell-execution", R"([\s\S]*)"},
  });
  static const std::map<std::string, std::vector<PatternRule>> rules = {
      {"python", Rules({
                     {"module-import", R"(import\s+os)"},
                     {"module-import", R"(from\s+os\s+import)"},
                     {"module-import", R"(import\s+subprocess)"},
                     {"module-import", R"(from\s+subprocess\s+import)"},
                     {"module-import", R"(import\s+sys)"},
                     {"module-import", R"(from\s+sys\s+import)"},
                     {"reflection", R"(__builtins__)"},
                     {"dynamic-evaluation", R"(compile\s*\()"},
                     {"reflection", R"(globals\s*\(\s*\))"},
                     {"reflection", R"(locals\s*\(\s*\))"},
                     {"reflection", R"(vars\s*\(\s*\))"},
                     {"reflection", R"(dir\s*\(\s*\))"},
                     {"reflection", R"(getattr\s*\()"},
                     {"reflection", R"(setattr\s*\()"},
                     {"reflection", R"(hasattr\s*\()"},
                     {"reflection", R"(delattr\s*\()"},
                     {"filesystem-access", R"(open\s*\()"},
                     {"filesystem-access", R"(file\s*\()"},
                     {"interactive-input", R"(input\s*\()"},
                     {"interactive-input", R"(raw_input\s*\()"},
                 })},
      {"javascript", javascript},
      {"typescript", javascript},
      {"bash", shell},
      {"shell", shell},
  };
  return rules;
}

Status SecurityGate::ValidateCode(const std::string& language,
                                  const std::string& code) const {
  const PatternRule* rule = FirstMatch(GlobalRules(), code);
  if (!rule) {
    auto iter = LanguageRules().find(language);
    if (iter != LanguageRules().end()) {
      rule = FirstMatch(iter->second, code);
    }
  }
  if (rule) {
    LOG(WARNING) << "Rejected " << language << " code: " << rule->pattern_class;
    return Status(errc::validation,
                  "code contains a forbidden construct (" +
                      rule->pattern_class + ")");
  }
  return Status();
}

Status SecurityGate::ConsumeRateLimit(const std::string& client_id,
                                      TimePoint now,
                                      int points) {
  if (!client_limiter_.TryConsume(client_id, now, points)) {
    LOG(WARNING) << "Rate limit exceeded for client " << client_id;
    return Status(errc::capacity, "rate limit exceeded for client " + client_id);
  }
  return Status();
}

Status SecurityGate::CheckCredentials(const std::string& api_key,
                                      const std::string& origin) const {
  if (!origin.empty() && !allowed_origins_.empty() &&
      !allowed_origins_.count(origin)) {
    LOG(WARNING) << "Blocked request from unauthorized origin " << origin;
    return Status(errc::validation, "origin not allowed");
  }
  if (!api_keys_.empty() && !api_keys_.count(api_key)) {
    LOG(WARNING) << "Blocked request with invalid API key";
    return Status(errc::validation, "invalid API key");
  }
  return Status();
}

Status SecurityGate::ValidateEnvelope(const nlohmann::json& request) {
  if (!request.is_object()) {
    return Status(errc::validation, "request must be an object");
  }
  auto method = request.find("method");
  if (method == request.end() || !method->is_string() ||
      method->get<std::string>().empty()) {
    return Status(errc::validation, "request method must be a non-empty string");
  }
  auto id = request.find("id");
  if (id != request.end() && !id->is_null() && !id->is_string() &&
      !id->is_number()) {
    return Status(errc::validation, "request id must be null, string or number");
  }
  return Status();
}

std::string SecurityGate::SanitizeString(const std::string& value) {
  static const boost::regex script_tag(
      R"(<script\b[^<]*(?:(?!</script>)<[^<]*)*</script>)", boost::regex::icase);
  static const boost::regex javascript_scheme(R"(javascript:)",
                                              boost::regex::icase);
  static const boost::regex event_handler(R"(on\w+\s*=)", boost::regex::icase);
  std::string result = boost::regex_replace(value, script_tag, "");
  result = boost::regex_replace(result, javascript_scheme, "");
  return boost::regex_replace(result, event_handler, "");
}

void SecurityGate::Sanitize(nlohmann::json* params) {
  if (params->is_string()) {
    *params = SanitizeString(params->get<std::string>());
    return;
  }
  if (params->is_structured()) {
    for (auto& child : *params) {
      Sanitize(&child);
    }
  }
}

}
