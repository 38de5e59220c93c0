#include "ctxopt/security/code_analyzer.hpp"

#include <algorithm>
#include <regex>

namespace ctxopt::security {

namespace {

struct Rule {
    std::regex pattern;
    std::string reason;
};

auto make_rule(const char* pattern, const char* reason) -> Rule {
    return Rule{std::regex(pattern, std::regex::ECMAScript | std::regex::optimize), reason};
}

auto blocked_rules() -> const std::vector<Rule>& {
    static const std::vector<Rule> rules = [] {
        std::vector<Rule> r;
        // Code execution
        r.push_back(make_rule(R"(\beval\s*\()", "eval() is not allowed"));
        r.push_back(make_rule(R"(\bFunction\s*\()", "Function constructor is not allowed"));
        r.push_back(make_rule(R"(\bnew\s+Function\b)", "new Function() is not allowed"));

        // Module system
        r.push_back(make_rule(R"(\brequire\s*\()", "require() is not allowed"));
        r.push_back(make_rule(R"(\bimport\s*\()", "dynamic import() is not allowed"));
        r.push_back(make_rule(R"(\bimport\s*\.\s*meta\b)", "import.meta is not allowed"));

        // Host globals
        r.push_back(make_rule(R"(\bprocess\b)", "process is not allowed"));
        r.push_back(make_rule(R"(\bglobal\b)", "global is not allowed"));
        r.push_back(make_rule(R"(\bglobalThis\b)", "globalThis is not allowed"));
        r.push_back(make_rule(R"(\b__dirname\b)", "__dirname is not allowed"));
        r.push_back(make_rule(R"(\b__filename\b)", "__filename is not allowed"));
        r.push_back(make_rule(R"(\bBuffer\b)", "Buffer is not allowed"));

        // Prototype tampering
        r.push_back(make_rule(R"(__proto__)", "__proto__ is not allowed"));
        r.push_back(make_rule(R"(\.\s*constructor\s*[\[.(])", "constructor access is not allowed"));
        r.push_back(make_rule(R"(\[\s*['"`]constructor['"`]\s*\])", "constructor access is not allowed"));
        r.push_back(make_rule(R"(\.\s*prototype\s*[\[.])", "prototype access is not allowed"));

        // Reflection
        r.push_back(make_rule(R"(\bReflect\b)", "Reflect is not allowed"));
        r.push_back(make_rule(R"(\bProxy\b)", "Proxy is not allowed"));

        // Timers
        r.push_back(make_rule(R"(\bsetTimeout\s*\()", "setTimeout is not allowed (use await)"));
        r.push_back(make_rule(R"(\bsetInterval\s*\()", "setInterval is not allowed"));
        r.push_back(make_rule(R"(\bsetImmediate\s*\()", "setImmediate is not allowed"));

        // Filesystem escape attempts
        r.push_back(make_rule(R"(file:\/\/)", "file:// URLs are not allowed"));
        r.push_back(make_rule(R"(\.\.[\/\\]\.\.[\/\\])", "path traversal is not allowed"));
        return r;
    }();
    return rules;
}

auto warning_rules() -> const std::vector<Rule>& {
    static const std::vector<Rule> rules = [] {
        std::vector<Rule> r;
        r.push_back(make_rule(R"(while\s*\(\s*true\s*\))", "infinite loop detected"));
        r.push_back(make_rule(R"(for\s*\(\s*;\s*;\s*\))", "infinite loop detected"));
        r.push_back(make_rule(R"(\.repeat\s*\(\s*\d{6,}\s*\))", "large string repeat"));
        return r;
    }();
    return rules;
}

} // anonymous namespace

auto analyze_code(std::string_view code) -> SecurityVerdict {
    SecurityVerdict verdict;
    const std::string source(code);

    for (const auto& rule : blocked_rules()) {
        if (!std::regex_search(source, rule.pattern)) continue;
        // Two constructor rules share a reason; report it once.
        if (std::find(verdict.blocked_patterns.begin(), verdict.blocked_patterns.end(),
                      rule.reason) != verdict.blocked_patterns.end()) {
            continue;
        }
        verdict.blocked_patterns.push_back(rule.reason);
    }

    for (const auto& rule : warning_rules()) {
        if (!std::regex_search(source, rule.pattern)) continue;
        if (std::find(verdict.warnings.begin(), verdict.warnings.end(), rule.reason) !=
            verdict.warnings.end()) {
            continue;
        }
        verdict.warnings.push_back(rule.reason);
    }

    verdict.safe = verdict.blocked_patterns.empty();
    return verdict;
}

} // namespace ctxopt::security
