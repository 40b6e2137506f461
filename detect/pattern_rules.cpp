#include "detect/pattern_rules.h"

#include <re2/re2.h>

namespace promptguard {

namespace {
constexpr char kCredentialMask[] = "[CREDENTIAL_MASKED]";
constexpr char kApiKeyMask[] = "[API_KEY_MASKED]";
constexpr char kTokenMask[] = "[TOKEN_MASKED]";
constexpr char kPasswordMask[] = "[PASSWORD_MASKED]";
constexpr char kInjectionMask[] = "[INJECTION_ATTEMPT_NEUTRALIZED]";
constexpr char kMaliciousMask[] = "[MALICIOUS_CODE_REMOVED]";
constexpr char kJailbreakMask[] = "[JAILBREAK_ATTEMPT_NEUTRALIZED]";

PatternRule Rule(std::string id, std::string family, Category category,
                 std::string pattern, double confidence, std::string replacement,
                 int value_group = 0, std::size_t min_value_length = 0) {
  PatternRule rule;
  rule.id = std::move(id);
  rule.family = std::move(family);
  rule.category = category;
  rule.pattern = std::move(pattern);
  rule.confidence = confidence;
  rule.replacement = std::move(replacement);
  rule.value_group = value_group;
  rule.min_value_length = min_value_length;
  return rule;
}

void AddCredentialRules(std::vector<PatternRule>* rules) {
  const auto c = Category::kCredential;
  rules->push_back(Rule("credential.openai_key", "api_key", c,
                        R"(\bsk-(?:proj-)?[A-Za-z0-9_\-]{16,})", 0.95, kApiKeyMask));
  rules->push_back(Rule("credential.stripe_key", "api_key", c,
                        R"(\b(?:sk|pk|rk)_(?:live|test)_[A-Za-z0-9]{16,})", 0.95,
                        kApiKeyMask));
  rules->push_back(Rule("credential.aws_access_key", "api_key", c,
                        R"(\b(?:AKIA|ASIA)[0-9A-Z]{16}\b)", 0.95, "[AWS_KEY_MASKED]"));
  rules->push_back(Rule("credential.github_token", "api_key", c,
                        R"(\bgh[pousr]_[A-Za-z0-9]{36,}\b)", 0.95, kApiKeyMask));
  rules->push_back(Rule("credential.slack_token", "api_key", c,
                        R"(\bxox[abprs]-[A-Za-z0-9\-]{10,})", 0.95, kTokenMask));
  rules->push_back(Rule(
      "credential.jwt", "token", c,
      R"(\beyJ[A-Za-z0-9_\-]{8,}\.[A-Za-z0-9_\-]{8,}\.[A-Za-z0-9_\-]{8,})", 0.9,
      kTokenMask));
  rules->push_back(Rule(
      "credential.private_key", "private_key", c,
      R"(-----BEGIN (?:RSA |EC |DSA |OPENSSH |ENCRYPTED )?PRIVATE KEY-----)", 0.99,
      "[PRIVATE_KEY_MASKED]"));
  rules->push_back(Rule("credential.bearer_token", "token", c,
                        R"((?i)\bbearer\s+([A-Za-z0-9_\-.=+/]{16,}))", 0.9, kTokenMask,
                        1));
  rules->push_back(Rule("credential.url_password", "password", c,
                        R"(\b[a-zA-Z][a-zA-Z0-9+.\-]*://[^\s:/@]+:([^\s@/]+)@)", 0.9,
                        kPasswordMask, 1));
  rules->push_back(Rule(
      "credential.keyed_assignment", "keyed", c,
      R"re((?i)\b(?:password|passwd|pwd|passphrase|api[\s_-]?key|access[\s_-]?key|secret[\s_-]?key|client[\s_-]?secret|auth[\s_-]?token|access[\s_-]?token|token|secret)\s*[:=]\s*["']?([^\s"',;]+))re",
      0.9, kCredentialMask, 1, 6));
  // "is" is too common a connector to trust on its own: the value must
  // contain a digit or a symbol.
  rules->push_back(Rule(
      "credential.keyed_statement", "keyed", c,
      R"re((?i)\b(?:password|passwd|passphrase|api[\s_-]?key|access[\s_-]?key|secret[\s_-]?key|client[\s_-]?secret|token|secret)\s+(?:is|was|equals)\s+["']?([^\s"',;]*[0-9@#$%^&*!_\-][^\s"',;]*))re",
      0.88, kCredentialMask, 1, 6));
}

void AddPersonalInfoRules(std::vector<PatternRule>* rules) {
  const auto p = Category::kPersonalInfo;
  rules->push_back(Rule("pii.email", "email", p,
                        R"(\b[A-Za-z0-9._%+\-]+@[A-Za-z0-9.\-]+\.[A-Za-z]{2,}\b)", 0.9,
                        "[EMAIL_MASKED]"));
  rules->push_back(
      Rule("pii.ssn", "ssn", p, R"(\b\d{3}-\d{2}-\d{4}\b)", 0.9, "[SSN_MASKED]"));
  rules->push_back(Rule("pii.credit_card", "credit_card", p,
                        R"(\b(?:\d{4}[- ]?){3}\d{4}\b)", 0.9, "[CREDIT_CARD_MASKED]"));
  rules->push_back(Rule("pii.phone", "phone", p,
                        R"((?:\+\d{1,3}[\s.\-]?)?\(?\b\d{3}\)?[\s.\-]\d{3}[\s.\-]\d{4}\b)",
                        0.8, "[PHONE_MASKED]"));
  rules->push_back(Rule("pii.ipv4", "network", p, R"(\b(?:\d{1,3}\.){3}\d{1,3}\b)",
                        0.65, "[IP_ADDRESS_MASKED]"));
  rules->push_back(Rule("pii.mac_address", "network", p,
                        R"(\b[0-9A-Fa-f]{2}(?::[0-9A-Fa-f]{2}){5}\b)", 0.65,
                        "[MAC_ADDRESS_MASKED]"));
  rules->push_back(Rule(
      "pii.date_of_birth", "dob", p,
      R"((?i)\b(?:dob|date\s+of\s+birth|born\s+on)\s*:?\s*\d{1,2}[/\-]\d{1,2}[/\-]\d{2,4}\b)",
      0.85, "[DOB_MASKED]"));
  rules->push_back(Rule("pii.employee_id", "employee_id", p,
                        R"((?i)\bemployee\s*(?:id|number|no\.?)?\s*[:#]?\s*\d{5,8}\b)",
                        0.8, "[EMPLOYEE_ID_MASKED]"));
}

void AddInjectionRules(std::vector<PatternRule>* rules) {
  const auto i = Category::kInjection;
  rules->push_back(Rule(
      "injection.instruction_override", "instruction_override", i,
      R"((?i)\b(?:ignore|forget|disregard|override|skip|bypass)\s+(?:all\s+|any\s+)?(?:of\s+)?(?:the\s+|your\s+|my\s+)?(?:previous|above|prior|earlier|preceding|original|initial|system)\s+(?:instructions?|commands?|rules|prompts?|guidelines|directives|messages?))",
      0.9, kInjectionMask));
  rules->push_back(Rule(
      "injection.context_reset", "instruction_override", i,
      R"((?i)\b(?:reset|clear|erase|wipe)\s+(?:all\s+)?(?:your\s+)?(?:instructions|context|memory|history|rules)\b)",
      0.8, kInjectionMask));
  rules->push_back(Rule(
      "injection.stop_following", "instruction_override", i,
      R"((?i)\b(?:stop|cease)\s+following\s+(?:your\s+|the\s+)?(?:instructions|rules|guidelines))",
      0.85, kInjectionMask));
  rules->push_back(Rule(
      "injection.prompt_extraction", "prompt_extraction", i,
      R"((?i)\b(?:show|tell|reveal|display|print|output|repeat|leak|give)\s+(?:me\s+)?(?:your|the)\s+(?:system\s+|initial\s+|hidden\s+|original\s+)?(?:prompt|instructions)\b)",
      0.85, kInjectionMask));
  rules->push_back(Rule(
      "injection.role_tokens", "role_tokens", i,
      R"((?i)\[(?:system|inst|/inst|user|assistant)\]|<\|(?:system|user|assistant|im_start|im_end|endoftext)\|>|###\s*(?:system|instruction|assistant)\b)",
      0.9, kInjectionMask));
  rules->push_back(Rule(
      "injection.output_control", "output_control", i,
      R"((?i)\b(?:respond|answer|reply)\s+only\s+with\b|\b(?:start|begin)\s+your\s+(?:response|reply|answer)\s+with\b)",
      0.7, kInjectionMask));
  rules->push_back(Rule(
      "injection.sql_chaining", "sql", i,
      R"((?i)'\s*;\s*(?:drop|delete|insert|update|truncate|alter|create|exec|shutdown)\b[^\n]*)",
      0.95, kInjectionMask));
  rules->push_back(Rule("injection.sql_tautology", "sql", i,
                        R"((?i)'\s*(?:or|and)\s+'?\w+'?\s*=\s*'?\w+'?)", 0.85,
                        kInjectionMask));
  rules->push_back(Rule("injection.sql_union", "sql", i,
                        R"((?i)\bunion\s+(?:all\s+)?select\b)", 0.85, kInjectionMask));
  rules->push_back(Rule("injection.script_tag", "markup", i, R"((?i)<\s*script\b[^>]*>)",
                        0.85, kInjectionMask));
  // Report-only: mentioning an attack class is not an attack.
  rules->push_back(Rule(
      "injection.topic", "topic", i,
      R"((?i)\b(?:sql|command|code|prompt|ldap|xpath|template|header|nosql|os)\s+injections?\b)",
      0.7, ""));
}

void AddMaliciousCodeRules(std::vector<PatternRule>* rules) {
  const auto m = Category::kMaliciousCode;
  rules->push_back(Rule("malicious.recursive_delete", "destructive", m,
                        R"((?i)\brm\s+-(?:rf|fr|r|f)\s+(?:--no-preserve-root\s+)?[/~*.]\S*)",
                        0.95, kMaliciousMask));
  rules->push_back(Rule("malicious.windows_delete", "destructive", m,
                        R"((?i)\b(?:del|erase|rd|rmdir)\s+/[sqf](?:\s+/[sqf])*\s+\S+)", 0.9,
                        kMaliciousMask));
  rules->push_back(Rule(
      "malicious.format_disk", "destructive", m,
      R"((?i)\b(?:format|wipe|shred)\s+(?:c:|d:|/dev/\w+|drive|disk|all|everything))", 0.9,
      kMaliciousMask));
  rules->push_back(Rule("malicious.dd_overwrite", "destructive", m,
                        R"((?i)\bdd\s+if=/dev/(?:zero|random|urandom)\b[^\n]*)", 0.95,
                        kMaliciousMask));
  rules->push_back(Rule(
      "malicious.sql_destroy", "database", m,
      R"((?i)\b(?:drop|truncate)\s+(?:database|table|schema)\b(?:\s+(?:if\s+exists\s+)?[\w.]+)?)",
      0.85, kMaliciousMask));
  rules->push_back(Rule("malicious.delete_all_rows", "database", m,
                        R"((?i)\bdelete\s+from\s+\w+\s*(?:;|$|where\s+1\s*=\s*1))", 0.85,
                        kMaliciousMask));
  rules->push_back(Rule("malicious.shutdown", "system", m,
                        R"((?i)\b(?:shutdown|reboot|halt|poweroff)\s+(?:-[fhrP]\b|now\b|/[rsf]\b))",
                        0.85, kMaliciousMask));
  rules->push_back(Rule("malicious.fork_bomb", "system", m, R"(:\(\)\s*\{\s*:\|:&\s*\};:)",
                        0.99, kMaliciousMask));
  rules->push_back(Rule("malicious.code_exec", "execution", m,
                        R"((?i)\b(?:eval|exec|system|shell_exec|passthru|popen)\s*\()", 0.75,
                        kMaliciousMask));
  rules->push_back(Rule(
      "malicious.process_spawn", "execution", m,
      R"(\bRuntime\.getRuntime\(\)\.exec\s*\(|\bsubprocess\.(?:call|run|Popen)\s*\(|\bos\.system\s*\()",
      0.75, kMaliciousMask));
  rules->push_back(Rule(
      "malicious.pipe_to_shell", "execution", m,
      R"((?i)\b(?:curl|wget)\s+[^\n|]*\|\s*(?:sudo\s+)?(?:bash|sh|zsh|python3?|perl)\b)", 0.9,
      kMaliciousMask));
  rules->push_back(Rule(
      "malicious.reverse_shell", "network", m,
      R"((?i)\b(?:nc|ncat|netcat)\s+(?:-\w+\s+)*-[a-z]*e\s+\S+|\bbash\s+-i\s+>&\s*/dev/tcp/\S+)",
      0.95, kMaliciousMask));
  rules->push_back(Rule("malicious.reverse_shell_topic", "topic", m,
                        R"((?i)\breverse\s+shells?\b)", 0.7, ""));
  rules->push_back(Rule("malicious.world_writable", "system", m,
                        R"((?i)\bchmod\s+(?:-R\s+)?(?:777|666)\s+/\S*)", 0.85,
                        kMaliciousMask));
  rules->push_back(Rule(
      "malicious.offensive_tooling", "tooling", m,
      R"((?i)\b(?:msfvenom|msfconsole|meterpreter|mimikatz)\b|\b(?:sqlmap|hydra|nikto|masscan)\s+-\w)",
      0.85, kMaliciousMask));
  rules->push_back(Rule(
      "malicious.container_destroy", "system", m,
      R"((?i)\bdocker\s+(?:rm|kill|stop)\s+(?:-f|--force)\b[^\n]*|\bkubectl\s+delete\s+(?:all|--all|namespace)\b[^\n]*|\bdocker\s+system\s+prune\s+-a\b)",
      0.85, kMaliciousMask));
}

void AddJailbreakRules(std::vector<PatternRule>* rules) {
  const auto j = Category::kJailbreak;
  rules->push_back(Rule(
      "jailbreak.role_change", "explicit_role_change", j,
      R"((?i)\b(?:you\s+are\s+now|you're\s+now|from\s+now\s+on,?\s+you\s+(?:are|will\s+be))\b|\bpretend\s+(?:to\s+be|you\s+are|that\s+you\s+are)\b|\b(?:simulate|emulate)\s+(?:being\s+)?an?\s+(?:unrestricted|unfiltered|evil|jailbroken)\b)",
      0.95, kJailbreakMask));
  rules->push_back(Rule(
      "jailbreak.policy_override", "policy_override", j,
      R"((?i)\b(?:ignore|disregard|forget|bypass|override|circumvent|evade|get\s+around)\s+(?:all\s+)?(?:of\s+)?(?:your\s+|the\s+|my\s+|these\s+|any\s+)?(?:previous\s+|prior\s+|built-in\s+)?(?:safety\s+|content\s+|ethical\s+|moral\s+|security\s+)?(?:rules?|guidelines?|polic(?:y|ies)|restrictions?|safeguards?|filters?|guardrails?|safety|ethics|limitations?)\b)",
      0.95, kJailbreakMask));
  rules->push_back(Rule(
      "jailbreak.disable_safety", "policy_override", j,
      R"((?i)\b(?:disable|turn\s+off|deactivate)\s+your\s+(?:safety|security|content\s+filters?|restrictions?|guardrails?|safeguards?|filters?)\b|\b(?:remove|lift)\s+(?:all\s+)?your\s+(?:restrictions|limitations|guardrails)\b|\bwithout\s+(?:any\s+)?(?:safety|ethical|content)\s+(?:restrictions|guidelines|filters|limits)\b)",
      0.95, kJailbreakMask));
  rules->push_back(Rule(
      "jailbreak.false_authority", "false_authority", j,
      R"((?i)\bas\s+(?:your|the)\s+(?:developer|creator|admin(?:istrator)?|owner|master|operator)\b|\bi\s+am\s+(?:your|the)\s+(?:developer|creator|admin(?:istrator)?|owner)\b|\bsystem\s+override\b)",
      0.95, kJailbreakMask));
  // "developer mode" has legitimate meanings (phones, browsers), so it is
  // weaker on its own and escalates only alongside another family.
  rules->push_back(Rule("jailbreak.privileged_mode", "false_authority", j,
                        R"((?i)\b(?:developer|admin|god|debug|maintenance)\s+mode\b)", 0.75,
                        kJailbreakMask));
  rules->push_back(Rule(
      "jailbreak.dan", "dan_variant", j,
      R"(\bDAN\b|(?i:\bdo\s+anything\s+now\b|\byou\s+(?:can|will|must)\s+do\s+anything\b|\bunrestricted\s+mode\b|\bjailbr(?:eak|oken)\s+mode\b))",
      0.95, kJailbreakMask));
  rules->push_back(Rule(
      "jailbreak.hypothetical", "hypothetical_framing", j,
      R"((?i)\b(?:hypothetically|theoretically)\b|\bin\s+an?\s+(?:hypothetical|fictional|alternate|parallel)\s+(?:scenario|situation|world|universe|reality)\b|\bin\s+a\s+(?:game|story|simulation)\s+where\b)",
      0.75, kJailbreakMask));
  rules->push_back(Rule("jailbreak.hypothetical_soft", "hypothetical_framing", j,
                        R"((?i)\b(?:imagine|suppose|what\s+if|let's\s+say|lets\s+say)\b)",
                        0.55, kJailbreakMask));
  rules->push_back(Rule(
      "jailbreak.role_play", "role_play", j,
      R"((?i)\b(?:act|behave|roleplay|role-play)\s+as\s+(?:if\s+you\s+(?:are|were)\s+|an?\s+|my\s+)|\blet's\s+(?:play|pretend)\b)",
      0.7, kJailbreakMask));
  rules->push_back(Rule(
      "jailbreak.manipulation", "manipulation", j,
      R"((?i)\bfor\s+(?:purely\s+)?(?:educational|research|testing|academic)\s+purposes?\s+only\b|\bjust\s+this\s+once\b|\bi\s+won't\s+tell\s+anyone\b|\bbetween\s+(?:you\s+and\s+me|us)\b|\blife\s+(?:and|or)\s+death\b|\bpeople\s+will\s+die\b)",
      0.7, kJailbreakMask));
}
}  // namespace

std::unique_ptr<re2::RE2> CompileRule(const std::string& rule_id,
                                      const std::string& pattern) {
  if (pattern.empty()) {
    throw MalformedDetectorRule(rule_id, "empty pattern");
  }
  RE2::Options options;
  options.set_log_errors(false);
  auto compiled = std::make_unique<re2::RE2>(pattern, options);
  if (!compiled->ok()) {
    throw MalformedDetectorRule(rule_id, compiled->error());
  }
  return compiled;
}

std::vector<PatternRule> DefaultPatternRules() {
  std::vector<PatternRule> rules;
  AddCredentialRules(&rules);
  AddPersonalInfoRules(&rules);
  AddInjectionRules(&rules);
  AddMaliciousCodeRules(&rules);
  AddJailbreakRules(&rules);
  return rules;
}

std::vector<std::string> DefaultExcludedValues() {
  return {"example", "localhost", "password", "username", "default",
          "integration", "changeme", "placeholder", "redacted", "xxxxxx"};
}

std::vector<std::string> DefaultCredentialKeywords() {
  return {"password", "passwd", "pwd", "key", "token", "secret",
          "credential", "auth", "api", "bearer", "access", "subscription",
          "tenant", "client", "azure", "aws", "gcp"};
}

}  // namespace promptguard
