#include "detection/pattern_registry.h"

namespace agentguard::detection {

namespace {

constexpr char kFrameworkInjection[] = "OWASP-LLM01";
constexpr char kFrameworkSql[] = "OWASP-LLM02, OWASP-A03, CWE-89";
constexpr char kFrameworkCommand[] = "OWASP-LLM07, OWASP-A03, CWE-77";
constexpr char kFrameworkFile[] = "OWASP-LLM07, OWASP-A01, CWE-22";
constexpr char kFrameworkNetwork[] = "OWASP-LLM07, CWE-918";
constexpr char kFrameworkAgency[] = "OWASP-LLM08";
constexpr char kFrameworkDisclosure[] = "OWASP-LLM06, CWE-200";

using C = ThreatCategory;
using S = Severity;

std::vector<RuleDefinition> BuildCatalog() {
    return {
        // Prompt injection: direct instruction override and prompt extraction
        {"PI-001", C::kPromptInjection, S::kHigh,
         R"re(\bignore\s{1,16}all\b)re",
         "Blanket instruction override", kFrameworkInjection},
        {"PI-002", C::kPromptInjection, S::kHigh,
         R"re(\b(ignore|disregard|forget|override)\s{1,16}(the\s{1,16}|your\s{1,16}|my\s{1,16}|any\s{1,16})?((previous|prior|above|earlier|original|initial|system)\s{1,16})?(instructions?|directives?|rules|guidelines|prompts?|programming)\b)re",
         "Instruction override attempt", kFrameworkInjection},
        {"PI-003", C::kPromptInjection, S::kHigh,
         R"re(\bforget\s{1,16}(everything|all)\s{1,16}(you\s{1,16}(were|have\s{1,16}been)\s{1,16}told|above|before)\b)re",
         "Request to discard prior context", kFrameworkInjection},
        {"PI-004", C::kPromptInjection, S::kMedium,
         R"re(\byou\s{1,16}are\s{1,16}(now|no\s{1,16}longer)\b)re",
         "Role reassignment", kFrameworkInjection},
        {"PI-005", C::kPromptInjection, S::kCritical,
         R"re(\b(reveal|show|print|display|output|repeat|tell\s{1,16}me|leak)\s{1,16}(me\s{1,16})?(your|the)\s{1,16}(hidden\s{1,16}|secret\s{1,16}|original\s{1,16}|initial\s{1,16}|full\s{1,16})?(system\s{1,16}prompt|instructions|prompt)\b)re",
         "System prompt extraction", kFrameworkInjection},
        {"PI-006", C::kPromptInjection, S::kHigh,
         R"re(\bwhat\s{1,16}(were|are)\s{1,16}you\s{1,16}(instructed|told|programmed)\b|\bwhat\s{1,16}(is|are)\s{1,16}your\s{1,16}(system\s{1,16}prompt|instructions)\b)re",
         "System prompt probing", kFrameworkInjection},
        {"PI-007", C::kPromptInjection, S::kMedium,
         R"re(\bnew\s{1,16}instructions?\s{0,16}:)re",
         "Injected instruction block", kFrameworkInjection},
        {"PI-008", C::kPromptInjection, S::kHigh,
         R"re(\b(do\s{1,16}not|don't)\s{1,16}follow\s{1,16}(your|the|any)\s{1,16}((previous|original)\s{1,16})?(instructions|rules|guidelines)\b)re",
         "Instruction refusal directive", kFrameworkInjection},
        {"PI-009", C::kPromptInjection, S::kMedium,
         R"re(\bfrom\s{1,16}now\s{1,16}on,?\s{1,16}you\s{1,16}(will|must|are|should)\b)re",
         "Persistent behavior override", kFrameworkInjection},
        {"PI-010", C::kPromptInjection, S::kMedium,
         R"re(\bpretend\s{1,16}(that\s{1,16})?you\s{1,16}(are|have|were)\b)re",
         "Persona injection via pretence", kFrameworkInjection},
        {"PI-011", C::kPromptInjection, S::kHigh,
         R"re(<!--[\s\S]{0,200}(instruction|ignore|assistant|agent)[\s\S]{0,200}-->)re",
         "Instructions hidden in markup comment", kFrameworkInjection},
        {"PI-012", C::kPromptInjection, S::kHigh,
         R"re(\b(agent|assistant|ai)\s{1,16}instructions?\s{0,16}:)re",
         "Embedded agent directive", kFrameworkInjection},

        // Jailbreak
        {"JB-001", C::kJailbreak, S::kCritical,
         R"re(\b(dan\s{1,16}mode|do\s{1,16}anything\s{1,16}now)\b)re",
         "DAN-style jailbreak", kFrameworkInjection},
        {"JB-002", C::kJailbreak, S::kHigh,
         R"re(\b(developer|god|unrestricted|jailbreak)\s{1,16}mode\b)re",
         "Privileged-mode roleplay", kFrameworkInjection},
        {"JB-003", C::kJailbreak, S::kCritical,
         R"re(\bjailbr(eak|oken|eaking)\b)re",
         "Explicit jailbreak request", kFrameworkInjection},
        {"JB-004", C::kJailbreak, S::kHigh,
         R"re(\b(bypass|disable|circumvent|turn\s{1,16}off|override)\s{1,16}(your\s{1,16}|the\s{1,16}|all\s{1,16})?((safety|content|security)\s{1,16})?(filters?|guidelines|guardrails|restrictions|safeguards|protocols)\b)re",
         "Safety bypass request", kFrameworkInjection},
        {"JB-005", C::kJailbreak, S::kHigh,
         R"re(\b(rules|restrictions|guidelines|filters)\s{1,16}(don't|do\s{1,16}not|no\s{1,16}longer)\s{1,16}apply\b)re",
         "Claim that rules do not apply", kFrameworkInjection},
        {"JB-006", C::kJailbreak, S::kMedium,
         R"re(\bno\s{1,16}(rules|restrictions|limitations|limits|filters|guidelines)\b)re",
         "Unrestricted persona request", kFrameworkInjection},
        {"JB-007", C::kJailbreak, S::kLow,
         R"re(\bfor\s{1,16}(educational|research|academic|hypothetical)\s{1,16}purposes\b)re",
         "Pretext framing", kFrameworkInjection},
        {"JB-008", C::kJailbreak, S::kMedium,
         R"re(\b(test|sandbox|simulation|hypothetical)\s{1,16}(environment|scenario|world)\s{1,16}(where|in\s{1,16}which)\b)re",
         "Fictional-context framing", kFrameworkInjection},
        {"JB-009", C::kJailbreak, S::kHigh,
         R"re(\b(evil|unfiltered|uncensored|amoral)\s{1,16}(ai|assistant|model|version|mode)\b)re",
         "Unaligned persona request", kFrameworkInjection},

        // Context manipulation: spoofed boundaries and role markers
        {"CM-001", C::kContextManipulation, S::kHigh,
         R"re(\bsystem\s{1,16}(override|update|message|notice)\b)re",
         "Fake system message", kFrameworkInjection},
        {"CM-002", C::kContextManipulation, S::kHigh,
         R"re(\bend\s{1,16}of\s{1,16}(conversation|session|context|prompt|instructions)\b)re",
         "Conversation boundary spoofing", kFrameworkInjection},
        {"CM-003", C::kContextManipulation, S::kMedium,
         R"re(\bnew\s{1,16}(session|conversation|context)\s{0,16}:)re",
         "Session reset injection", kFrameworkInjection},
        {"CM-004", C::kContextManipulation, S::kHigh,
         R"re(<\|?(im_start|im_end|system|endoftext)\|?>)re",
         "Chat-template token injection", kFrameworkInjection},
        {"CM-005", C::kContextManipulation, S::kHigh,
         R"re(\[\s{0,16}/?(inst|system|sys)\s{0,16}\]|<<\s{0,16}/?sys\s{0,16}>>)re",
         "Instruction delimiter injection", kFrameworkInjection},
        {"CM-006", C::kContextManipulation, S::kMedium,
         R"re(###\s{0,16}(system|instruction|assistant)\b)re",
         "Role header injection", kFrameworkInjection},
        {"CM-007", C::kContextManipulation, S::kMedium,
         R"re(^\s{0,16}(system|assistant)\s{0,16}:)re",
         "Role prefix spoofing", kFrameworkInjection},
        {"CM-008", C::kContextManipulation, S::kHigh,
         R"re(\b(previous|above|earlier)\s{1,16}(conversation|context|messages?)\s{1,16}(is|was|are|were)\s{1,16}(fake|void|invalid|a\s{1,16}test)\b)re",
         "Context invalidation", kFrameworkInjection},
        {"CM-009", C::kContextManipulation, S::kLow,
         R"re(\[(simulated\s{1,16})?(email|web\s{1,16}page\s{1,16}content|document|tool\s{1,16}output)\])re",
         "Embedded third-party content", kFrameworkInjection},

        // Tool misuse: SQL injection
        {"TM-001", C::kSqlInjection, S::kCritical,
         R"re((delete|drop)\s{1,16}(from|table)\s{1,16}\w{1,64})re",
         "SQL DELETE/DROP command detected", kFrameworkSql},
        {"TM-002", C::kSqlInjection, S::kCritical,
         R"re(;\s{0,16}(drop|delete|truncate)\s{1,16}(table|database))re",
         "SQL injection with destructive command", kFrameworkSql},
        {"TM-003", C::kSqlInjection, S::kHigh,
         R"re((union|or)\s{1,16}\d{1,10}\s{0,16}=\s{0,16}\d{1,10})re",
         "SQL injection union/boolean attack", kFrameworkSql},
        {"TM-004", C::kSqlInjection, S::kMedium,
         R"re(--\s{0,16}$)re",
         "SQL comment injection", kFrameworkSql},
        {"TM-005", C::kSqlInjection, S::kCritical,
         R"re(;\s{0,16}exec\s{0,16}\()re",
         "SQL stored procedure execution attempt", kFrameworkSql},

        // Tool misuse: command injection
        {"TM-006", C::kCommandInjection, S::kCritical,
         R"re(;\s{0,16}(rm|del|format|mkfs)\s)re",
         "Destructive shell command injection", kFrameworkCommand},
        {"TM-007", C::kCommandInjection, S::kCritical,
         R"re(\|\s{0,16}(curl|wget|nc|netcat))re",
         "Network tool injection for exfiltration", kFrameworkCommand},
        {"TM-008", C::kCommandInjection, S::kHigh,
         R"re(`[^`]{1,512}`)re",
         "Backtick command substitution", kFrameworkCommand},
        {"TM-009", C::kCommandInjection, S::kHigh,
         R"re(\$\([^\)]{1,512}\))re",
         "Command substitution syntax", "OWASP-LLM07, OWASP-A03, CWE-94"},
        {"TM-010", C::kCommandInjection, S::kCritical,
         R"re(&&\s{0,16}(rm|del|dd|format))re",
         "Chained destructive command", kFrameworkCommand},

        // Tool misuse: file manipulation
        {"TM-011", C::kFileManipulation, S::kCritical,
         R"re((read|open|cat)\s{1,16}/etc/(passwd|shadow|hosts))re",
         "System file access attempt", kFrameworkFile},
        {"TM-012", C::kFileManipulation, S::kHigh,
         R"re((delete|remove|unlink)\s{1,16}.{0,50}\.(log|conf|config|env))re",
         "Critical file deletion attempt", kFrameworkFile},
        {"TM-013", C::kFileManipulation, S::kHigh,
         R"re(\.\./\.\.)re",
         "Path traversal attempt", kFrameworkFile},
        {"TM-014", C::kFileManipulation, S::kCritical,
         R"re((write|modify|chmod)\s{1,16}.{0,50}(/bin|/sbin|/usr/bin))re",
         "System binary modification attempt", kFrameworkFile},
        {"TM-015", C::kFileManipulation, S::kHigh,
         R"re((upload|write)\s{1,16}.{0,50}\.(exe|sh|bat|ps1))re",
         "Executable file upload attempt", "OWASP-LLM07, OWASP-A01, CWE-434"},

        // Tool misuse: network exploitation
        {"TM-016", C::kNetworkExploit, S::kHigh,
         R"re((scan|nmap|probe)\s{1,16}(all\s{1,16})?(ports?|network|hosts?))re",
         "Network scanning attempt", kFrameworkNetwork},
        {"TM-017", C::kNetworkExploit, S::kHigh,
         R"re((connect|bind|listen)\s{1,16}(to|on)\s{1,16}(port|socket))re",
         "Network socket manipulation", kFrameworkNetwork},
        {"TM-018", C::kNetworkExploit, S::kCritical,
         R"re((reverse|bind)\s{1,16}shell)re",
         "Reverse/bind shell attempt", "OWASP-LLM07, CWE-77"},
        {"TM-019", C::kNetworkExploit, S::kCritical,
         R"re((exfiltrate|send|post)\s{1,16}to\s{1,16}\d{1,3}\.\d{1,3}\.\d{1,3}\.\d{1,3})re",
         "Data exfiltration to IP address", "OWASP-LLM06, CWE-918"},
        {"TM-020", C::kNetworkExploit, S::kMedium,
         R"re((proxy|tunnel|forward)\s{1,16}(through|via))re",
         "Network tunneling attempt", kFrameworkNetwork},

        // Tool misuse: agency abuse through the agent's own tools
        {"TM-021", C::kToolMisuse, S::kHigh,
         R"re(\buse\s{1,16}(your|the)\s{1,16}[\w-]{1,64}\s{1,16}tool\s{1,16}to\s{1,16}.{0,60}(passwords?|credentials|secrets?|api\s{1,16}keys?|tokens|private\s{1,16}keys?))re",
         "Tool repurposed to harvest secrets", kFrameworkAgency},
        {"TM-022", C::kToolMisuse, S::kHigh,
         R"re(\bexecute\s{0,16}:|\bexecute\s{1,16}(the\s{1,16})?(following\s{1,16})?(command|shell|code|script|query)\b)re",
         "Direct execution request", kFrameworkAgency},
        {"TM-023", C::kToolMisuse, S::kMedium,
         R"re(\b(run|call|invoke|use)\s{1,16}(the\s{1,16})?(shell|terminal|bash|powershell|eval|exec)\s{1,16}(tool|command|function)\b)re",
         "Shell tool invocation", kFrameworkAgency},
        {"TM-024", C::kToolMisuse, S::kCritical,
         R"re(\bdelete\s{1,16}all\s{1,16}(users|records|files|data|emails|accounts|logs|rows)\b)re",
         "Mass deletion through a tool", kFrameworkAgency},
        {"TM-025", C::kToolMisuse, S::kHigh,
         R"re(\b(grant|give|escalate)\s{1,16}(me\s{1,16}|yourself\s{1,16})?(admin|root|sudo|superuser|elevated)\s{1,16}(access|privileges?|rights|permissions)\b)re",
         "Privilege escalation request", kFrameworkAgency},
        {"TM-026", C::kToolMisuse, S::kHigh,
         R"re(\b(create|add)\s{1,16}(a\s{1,16})?(new\s{1,16}|test\s{1,16}|hidden\s{1,16})?(admin|root|superuser)\s{1,16}(account|user)\b)re",
         "Privileged account creation", kFrameworkAgency},
        {"TM-027", C::kCommandInjection, S::kCritical,
         R"re(\brm\s{1,16}-(rf|fr|r)\b)re",
         "Recursive file deletion command", kFrameworkCommand},
        {"TM-028", C::kCommandInjection, S::kCritical,
         R"re(\b(wget|curl)\s{1,16}[^|;]{0,200}\|\s{0,16}(ba|z)?sh\b)re",
         "Download piped to shell", kFrameworkCommand},
        {"TM-029", C::kCommandInjection, S::kHigh,
         R"re(\b(eval|exec)\s{0,16}\()re",
         "Dynamic code evaluation", "OWASP-LLM07, OWASP-A03, CWE-94"},
        {"TM-030", C::kNetworkExploit, S::kCritical,
         R"re(169\.254\.169\.254|\bmetadata\.google\.internal\b)re",
         "Cloud metadata endpoint access", kFrameworkNetwork},
        {"TM-031", C::kNetworkExploit, S::kMedium,
         R"re(\b(localhost|127\.0\.0\.1|0\.0\.0\.0):\d{2,5}\b)re",
         "Loopback service access", kFrameworkNetwork},
        {"TM-032", C::kFileManipulation, S::kCritical,
         R"re((~|/home/\w{1,64}|/root)/\.ssh/(id_rsa|id_ed25519|authorized_keys))re",
         "SSH key access", kFrameworkFile},
        {"TM-033", C::kFileManipulation, S::kMedium,
         R"re(\b(read|open|cat|show)\s{1,16}.{0,30}\.env\b)re",
         "Environment secrets file access", kFrameworkFile},

        // Data exfiltration
        {"DE-001", C::kDataExfiltration, S::kCritical,
         R"re(\b(send|upload|transfer|post|forward|copy|leak)\s{1,16}(all\s{1,16})?(of\s{1,16})?(the\s{1,16})?((user|customer|client|employee|sensitive|private|confidential|personal)\s{1,16})?(data|records|files|information|details|database)\s{1,16}to\s{1,16}(an?\s{1,16}|the\s{1,16}|my\s{1,16})?(external|remote|outside|third[- ]party|personal|public)\b)re",
         "Bulk data transfer to an external destination", kFrameworkDisclosure},
        {"DE-002", C::kDataExfiltration, S::kHigh,
         R"re(\b(email|send|forward|mail|post|share)\s{1,16}(me\s{1,16})?(all\s{1,16})?(the\s{1,16}|your\s{1,16}|of\s{1,16}the\s{1,16})?(secrets?|passwords?|credentials|api\s{1,16}keys?|tokens|private\s{1,16}keys?)\b)re",
         "Secret disclosure to an outbound channel", kFrameworkDisclosure},
        {"DE-003", C::kDataExfiltration, S::kHigh,
         R"re(\b(leak|exfiltrate|smuggle|extract)\s{1,16}(all\s{1,16}|the\s{1,16})?(data|secrets|credentials|information|records)\b)re",
         "Data extraction request", kFrameworkDisclosure},
        {"DE-004", C::kDataExfiltration, S::kMedium,
         R"re(https?://[^\s]{1,512}\?(data|q|payload|d|secret|token)=)re",
         "Data embedded in outbound URL", kFrameworkDisclosure},
        {"DE-005", C::kDataExfiltration, S::kMedium,
         R"re(!\[[^\]]{0,200}\]\(https?://)re",
         "Markdown image beacon", kFrameworkDisclosure},
        {"DE-006", C::kDataExfiltration, S::kHigh,
         R"re(\b(dump|export|list)\s{1,16}(all\s{1,16})?(the\s{1,16})?(user\s{1,16})?(passwords|password\s{1,16}hashes|credentials|api\s{1,16}keys|secrets)\b)re",
         "Bulk credential dump", kFrameworkDisclosure},
        {"DE-007", C::kDataExfiltration, S::kMedium,
         R"re(\b(base64|hex|rot13)[- ]?encoded?\b.{0,40}\b(send|include|append|post)\b)re",
         "Encoded exfiltration", kFrameworkDisclosure},
        {"DE-008", C::kDataExfiltration, S::kHigh,
         R"re(\b(curl|wget)\s{1,16}.{0,80}\s(-d|--data|--upload-file|-F)\s)re",
         "Command-line upload", kFrameworkDisclosure},
    };
}

}  // namespace

const std::vector<RuleDefinition>& DefaultRuleDefinitions() {
    static const std::vector<RuleDefinition> kCatalog = BuildCatalog();
    return kCatalog;
}

}  // namespace agentguard::detection
