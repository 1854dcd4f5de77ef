#include "security/security_filter.hpp"
#include <spdlog/spdlog.h>
#include <sstream>

namespace execore::security {

constexpr size_t MAX_EXCERPT_LENGTH = 80;

static DenyRule make_rule(const std::string& name, const std::string& category,
                          const std::string& pattern) {
    return DenyRule{name, category,
                    std::regex(pattern, std::regex::ECMAScript | std::regex::icase)};
}

static std::string join(const std::vector<std::string>& items, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); i++) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

// Rule quantifiers are bounded, so whitespace runs are folded to one
// character before matching. A run containing a newline keeps it.
static std::string collapse_whitespace(const std::string& code) {
    std::string out;
    out.reserve(code.size());
    bool in_run = false;
    for (char c : code) {
        bool space = c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
        if (!space) {
            out += c;
            in_run = false;
        } else if (!in_run) {
            out += c == '\n' ? '\n' : ' ';
            in_run = true;
        } else if (c == '\n') {
            out.back() = '\n';
        }
    }
    return out;
}

static std::string excerpt(const std::string& text) {
    std::string out;
    for (char c : text) {
        out += (c == '\n' || c == '\r' || c == '\t') ? ' ' : c;
    }
    if (out.size() > MAX_EXCERPT_LENGTH) {
        out = out.substr(0, MAX_EXCERPT_LENGTH) + "...";
    }
    return out;
}

// ============================================================================
// Rule tables
// ============================================================================

static std::vector<DenyRule> build_python_rules() {
    std::vector<DenyRule> rules;

    auto import_rule = [&](const std::string& name, const std::string& category,
                           const std::vector<std::string>& modules) {
        rules.push_back(make_rule(name, category,
            "\\b(import|from)\\s{1,64}(" + join(modules, "|") + ")\\b"));
    };

    import_rule("import-process-module", CATEGORY_PROCESS,
                {"os", "sys", "subprocess", "ctypes", "multiprocessing"});
    import_rule("import-network-module", CATEGORY_NETWORK,
                {"socket", "urllib", "requests"});
    import_rule("import-filesystem-module", CATEGORY_FILESYSTEM,
                {"shutil", "pathlib", "glob", "tempfile"});
    import_rule("import-pickle", CATEGORY_SERIALIZATION, {"pickle"});

    rules.push_back(make_rule("dunder-import", CATEGORY_DYNAMIC_EVAL, "__import__\\s{0,64}\\("));
    rules.push_back(make_rule("eval-call", CATEGORY_DYNAMIC_EVAL, "\\beval\\s{0,64}\\("));
    rules.push_back(make_rule("exec-call", CATEGORY_DYNAMIC_EVAL, "\\bexec\\s{0,64}\\("));
    // Builtin compile() only; re.compile and friends are method calls
    rules.push_back(make_rule("compile-call", CATEGORY_DYNAMIC_EVAL, "(^|[^.\\w])compile\\s{0,64}\\("));

    rules.push_back(make_rule("open-call", CATEGORY_FILESYSTEM, "\\bopen\\s{0,64}\\("));
    rules.push_back(make_rule("file-call", CATEGORY_FILESYSTEM, "\\bfile\\s{0,64}\\("));
    rules.push_back(make_rule("input-call", CATEGORY_INTERACTIVE, "\\binput\\s{0,64}\\("));
    rules.push_back(make_rule("raw-input-call", CATEGORY_INTERACTIVE, "\\braw_input\\s{0,64}\\("));

    rules.push_back(make_rule("system-call", CATEGORY_PROCESS, "\\.system\\s{0,64}\\("));
    rules.push_back(make_rule("popen-call", CATEGORY_PROCESS, "\\.popen\\s{0,64}\\("));
    rules.push_back(make_rule("call-method", CATEGORY_PROCESS, "\\.call\\s{0,64}\\("));

    rules.push_back(make_rule("shutil-access", CATEGORY_FILESYSTEM, "\\bshutil\\."));
    rules.push_back(make_rule("pathlib-access", CATEGORY_FILESYSTEM, "\\bpathlib\\."));
    rules.push_back(make_rule("glob-access", CATEGORY_FILESYSTEM, "\\bglob\\."));
    rules.push_back(make_rule("tempfile-access", CATEGORY_FILESYSTEM, "\\btempfile\\."));
    rules.push_back(make_rule("pickle-access", CATEGORY_SERIALIZATION, "\\bpickle\\."));

    return rules;
}

static std::vector<DenyRule> build_javascript_rules() {
    std::vector<DenyRule> rules;

    // require('fs'), require("node:fs"), import ... from 'fs', import('fs')
    auto module_rule = [&](const std::string& name, const std::string& category,
                           const std::vector<std::string>& modules) {
        std::string group = "(node:)?(" + join(modules, "|") + ")(/[\\w/]{0,128})?";
        rules.push_back(make_rule("require-" + name, category,
            "\\brequire\\s{0,64}\\(\\s{0,64}['\"`]" + group + "['\"`]\\s{0,64}\\)"));
        rules.push_back(make_rule("import-" + name, category,
            "\\bimport\\b[^;\\n]{0,256}?['\"`]" + group + "['\"`]"));
    };

    module_rule("process-module", CATEGORY_PROCESS,
                {"child_process", "cluster", "worker_threads", "os"});
    module_rule("filesystem-module", CATEGORY_FILESYSTEM, {"fs"});
    module_rule("network-module", CATEGORY_NETWORK,
                {"net", "http", "https", "http2", "dgram", "dns", "tls"});
    module_rule("vm-module", CATEGORY_DYNAMIC_EVAL, {"vm"});

    rules.push_back(make_rule("eval-call", CATEGORY_DYNAMIC_EVAL, "\\beval\\s{0,64}\\("));
    rules.push_back(make_rule("function-constructor", CATEGORY_DYNAMIC_EVAL,
                              "\\bnew\\s{1,64}Function\\s{0,64}\\("));
    rules.push_back(make_rule("process-binding", CATEGORY_PROCESS,
                              "\\bprocess\\s{0,64}\\.\\s{0,64}(binding|dlopen)\\b"));
    rules.push_back(make_rule("process-exit", CATEGORY_PROCESS,
                              "\\bprocess\\s{0,64}\\.\\s{0,64}(exit|kill|abort)\\b"));

    return rules;
}

// ============================================================================
// SecurityConfig
// ============================================================================

SecurityConfig::SecurityConfig()
    : allowed_imports(DEFAULT_ALLOWED_IMPORTS) {}

SecurityConfig SecurityConfig::from_json(const nlohmann::json& j) {
    SecurityConfig config;

    if (j.contains("max_code_length") && j["max_code_length"].is_number_integer() &&
        j["max_code_length"].get<int64_t>() >= 0) {
        config.max_code_length = j["max_code_length"].get<size_t>();
    }
    if (j.contains("blocked_patterns") && j["blocked_patterns"].is_array()) {
        for (const auto& p : j["blocked_patterns"]) {
            if (p.is_string()) config.blocked_patterns.push_back(p.get<std::string>());
        }
    }
    if (j.contains("allowed_imports") && j["allowed_imports"].is_array()) {
        config.allowed_imports.clear();
        for (const auto& m : j["allowed_imports"]) {
            if (m.is_string()) config.allowed_imports.push_back(m.get<std::string>());
        }
    }
    if (j.contains("filter_session_code") && j["filter_session_code"].is_boolean()) {
        config.filter_session_code = j["filter_session_code"].get<bool>();
    }

    return config;
}

nlohmann::json SecurityConfig::to_json() const {
    nlohmann::json j;
    j["max_code_length"] = max_code_length;
    j["blocked_patterns"] = blocked_patterns;
    j["allowed_imports"] = allowed_imports;
    j["filter_session_code"] = filter_session_code;
    return j;
}

// ============================================================================
// SecurityVerdict
// ============================================================================

std::string SecurityVerdict::message() const {
    if (allowed) {
        return "";
    }

    std::ostringstream oss;
    if (category && *category == CATEGORY_SIZE) {
        oss << "Security violation: " << matched.value_or("code too long");
        return oss.str();
    }

    oss << "Security violation: " << category.value_or(CATEGORY_CUSTOM)
        << " access is not allowed";
    if (matched) {
        oss << " (found '" << *matched << "')";
    }
    return oss.str();
}

// ============================================================================
// SecurityFilter
// ============================================================================

SecurityFilter::SecurityFilter(const SecurityConfig& config)
    : config_(config)
    , python_rules_(build_python_rules())
    , javascript_rules_(build_javascript_rules())
    , allowed_imports_(config.allowed_imports.begin(), config.allowed_imports.end()) {

    for (size_t i = 0; i < config_.blocked_patterns.size(); i++) {
        const auto& pattern = config_.blocked_patterns[i];
        try {
            custom_rules_.push_back(make_rule("custom-" + std::to_string(i + 1),
                                              CATEGORY_CUSTOM, pattern));
        } catch (const std::regex_error& e) {
            spdlog::error("Ignoring invalid blocked pattern #{}: {}", i + 1, e.what());
        }
    }

    spdlog::debug("SecurityFilter initialized (python={} rules, javascript={} rules, custom={})",
        python_rules_.size(), javascript_rules_.size(), custom_rules_.size());
}

const std::vector<DenyRule>& SecurityFilter::rules_for(Language language) const {
    return language == Language::JAVASCRIPT ? javascript_rules_ : python_rules_;
}

size_t SecurityFilter::rule_count(Language language) const {
    return rules_for(language).size() + custom_rules_.size();
}

size_t SecurityFilter::code_length(const std::string& code) {
    size_t count = 0;
    for (unsigned char c : code) {
        if ((c & 0xC0) != 0x80) {
            count++;
        }
    }
    return count;
}

SecurityVerdict SecurityFilter::check(const std::string& code, Language language) const {
    size_t length = code_length(code);
    if (config_.max_code_length > 0 && length > config_.max_code_length) {
        SecurityVerdict verdict;
        verdict.allowed = false;
        verdict.violated_pattern = "max-code-length";
        verdict.category = CATEGORY_SIZE;
        verdict.matched = "code length " + std::to_string(length) +
                          " exceeds limit of " + std::to_string(config_.max_code_length) +
                          " characters";
        spdlog::warn("Code blocked: {} ({} characters)", *verdict.violated_pattern, length);
        return verdict;
    }

    std::string folded = collapse_whitespace(code);
    for (const auto* rules : {&rules_for(language), &custom_rules_}) {
        for (const auto& rule : *rules) {
            std::smatch match;
            if (std::regex_search(folded, match, rule.pattern)) {
                SecurityVerdict verdict;
                verdict.allowed = false;
                verdict.violated_pattern = rule.name;
                verdict.category = rule.category;
                verdict.matched = excerpt(match.str(0));
                spdlog::warn("Code blocked: rule={} category={} match='{}'",
                    rule.name, rule.category, *verdict.matched);
                return verdict;
            }
        }
    }

    if (language == Language::PYTHON) {
        for (const auto& module : disallowed_imports(folded)) {
            spdlog::warn("Import outside allow-list: {}", module);
        }
    }

    return SecurityVerdict::allow();
}

std::vector<std::string> SecurityFilter::disallowed_imports(const std::string& code) const {
    static const std::regex import_re(R"(^\s{0,64}import\s{1,64}([\w.]{1,128}(\s{0,64}(as\s{1,64}\w{1,64})?\s{0,64},\s{0,64}[\w.]{1,128}){0,32}))");
    static const std::regex from_re(R"(^\s{0,64}from\s{1,64}([\w.]{1,128})\s{1,64}import\b)");
    static const std::regex module_re(R"(([A-Za-z_]\w{0,127})[\w.]{0,128}(\s{1,64}as\s{1,64}\w{1,64})?)");

    std::vector<std::string> modules;
    auto note = [&](const std::string& dotted) {
        std::string top = dotted.substr(0, dotted.find('.'));
        if (top.empty() || allowed_imports_.count(top)) return;
        for (const auto& m : modules) {
            if (m == top) return;
        }
        modules.push_back(top);
    };

    std::istringstream stream(code);
    std::string line;
    while (std::getline(stream, line)) {
        std::smatch match;
        if (std::regex_search(line, match, from_re)) {
            note(match.str(1));
        } else if (std::regex_search(line, match, import_re)) {
            std::string list = match.str(1);
            for (auto it = std::sregex_iterator(list.begin(), list.end(), module_re);
                 it != std::sregex_iterator(); ++it) {
                note((*it).str(1));
            }
        }
    }

    return modules;
}

} // namespace execore::security
