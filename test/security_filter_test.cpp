#include <gtest/gtest.h>
#include "security/security_filter.hpp"
#include "test_support.hpp"

using execore::Language;
using execore::security::SecurityConfig;
using execore::security::SecurityFilter;
using execore::test::contains;

TEST(security_filter, blocks_subprocess_import) {
    SecurityFilter filter;
    auto verdict = filter.check("import subprocess\nsubprocess.run(['ls'])\n", Language::PYTHON);
    ASSERT_FALSE(verdict.allowed);
    EXPECT_EQ(verdict.category.value_or(""), "process");
    EXPECT_EQ(verdict.violated_pattern.value_or(""), "import-process-module");
    EXPECT_TRUE(contains(verdict.message(), "subprocess"));
    EXPECT_TRUE(contains(verdict.message(), "process access is not allowed"));
}

TEST(security_filter, message_never_contains_the_rule_regex) {
    SecurityFilter filter;
    auto verdict = filter.check("from os import path", Language::PYTHON);
    ASSERT_FALSE(verdict.allowed);
    EXPECT_FALSE(contains(verdict.message(), "\\b"));
    EXPECT_FALSE(contains(verdict.message(), "\\s"));
    EXPECT_TRUE(contains(verdict.message(), "from os"));
}

TEST(security_filter, blocks_python_primitives) {
    SecurityFilter filter;
    const std::pair<const char*, const char*> cases[] = {
        {"import socket", "network"},
        {"import urllib.request", "network"},
        {"import shutil", "filesystem"},
        {"from pathlib import Path", "filesystem"},
        {"import pickle", "serialization"},
        {"m = __import__('os')", "dynamic-eval"},
        {"eval('1 + 1')", "dynamic-eval"},
        {"exec('x = 1')", "dynamic-eval"},
        {"code = compile('1', 'f', 'eval')", "dynamic-eval"},
        {"data = open('/etc/passwd').read()", "filesystem"},
        {"name = input()", "interactive-input"},
        {"name = raw_input('? ')", "interactive-input"},
        {"x.system('ls')", "process"},
        {"x.popen('ls')", "process"},
        {"shutil.rmtree('/')", "filesystem"},
        {"glob.glob('*')", "filesystem"},
        {"IMPORT OS", "process"},
    };
    for (const auto& [code, category] : cases) {
        auto verdict = filter.check(code, Language::PYTHON);
        EXPECT_FALSE(verdict.allowed) << code;
        EXPECT_EQ(verdict.category.value_or(""), category) << code;
    }
}

TEST(security_filter, allows_ordinary_python) {
    SecurityFilter filter;
    const char* cases[] = {
        "x = 1\nprint(x + 1)\n",
        "import re\npattern = re.compile(r'a+')\nprint(pattern.findall('caaat'))\n",
        "def evaluate(v):\n    return v * 2\nprint(evaluate(21))\n",
        "import math\nprint(math.sqrt(16))\n",
        "profile = {'name': 'x'}\nprint(profile)\n",
    };
    for (const char* code : cases) {
        EXPECT_TRUE(filter.check(code, Language::PYTHON).allowed) << code;
    }
}

TEST(security_filter, blocks_javascript_primitives) {
    SecurityFilter filter;
    const std::pair<const char*, const char*> cases[] = {
        {"const fs = require('fs');", "filesystem"},
        {"const cp = require(\"node:child_process\");", "process"},
        {"import fs from 'fs';", "filesystem"},
        {"import { exec } from \"child_process\";", "process"},
        {"const http = await import('http');", "network"},
        {"require('dgram').createSocket('udp4')", "network"},
        {"const { Worker } = require('worker_threads');", "process"},
        {"require('vm').runInNewContext('1')", "dynamic-eval"},
        {"eval('1 + 1')", "dynamic-eval"},
        {"const f = new Function('return 1');", "dynamic-eval"},
        {"process.binding('fs')", "process"},
        {"process.exit(1)", "process"},
    };
    for (const auto& [code, category] : cases) {
        auto verdict = filter.check(code, Language::JAVASCRIPT);
        EXPECT_FALSE(verdict.allowed) << code;
        EXPECT_EQ(verdict.category.value_or(""), category) << code;
    }
}

TEST(security_filter, rule_sets_are_per_language) {
    SecurityFilter filter;
    // Python's import rules do not apply to JavaScript and vice versa
    EXPECT_TRUE(filter.check("const os_name = 'linux';\nconsole.log([3, 1, 2].sort().join(','));",
                             Language::JAVASCRIPT).allowed);
    EXPECT_TRUE(filter.check("require = 1\nprint(require)\n", Language::PYTHON).allowed);
    EXPECT_FALSE(filter.check("import os", Language::PYTHON).allowed);
}

TEST(security_filter, import_rule_does_not_span_statements) {
    SecurityFilter filter;
    auto verdict = filter.check("import x from './lib.js';\nconsole.log('fs');\n", Language::JAVASCRIPT);
    EXPECT_TRUE(verdict.allowed);
}

TEST(security_filter, enforces_code_length_in_characters) {
    SecurityConfig config;
    config.max_code_length = 10;
    SecurityFilter filter(config);

    auto verdict = filter.check("x = 123456", Language::PYTHON);
    EXPECT_TRUE(verdict.allowed);

    verdict = filter.check("x = 1234567", Language::PYTHON);
    ASSERT_FALSE(verdict.allowed);
    EXPECT_EQ(verdict.category.value_or(""), "size");
    EXPECT_EQ(verdict.message(), "Security violation: code length 11 exceeds limit of 10 characters");

    // Ten two-byte characters are still ten characters
    std::string accented;
    for (int i = 0; i < 10; i++) accented += "\xC3\xA9";
    EXPECT_EQ(SecurityFilter::code_length(accented), 10u);
    EXPECT_TRUE(filter.check(accented, Language::PYTHON).allowed);
}

TEST(security_filter, applies_custom_patterns_to_every_language) {
    SecurityConfig config;
    config.blocked_patterns = {"forbidden_\\w+", "("};
    SecurityFilter filter(config);

    // The malformed pattern is skipped
    SecurityFilter baseline;
    EXPECT_EQ(filter.rule_count(Language::PYTHON), baseline.rule_count(Language::PYTHON) + 1);

    for (auto language : {Language::PYTHON, Language::JAVASCRIPT}) {
        auto verdict = filter.check("value = forbidden_thing", language);
        ASSERT_FALSE(verdict.allowed);
        EXPECT_EQ(verdict.category.value_or(""), "custom");
        EXPECT_EQ(verdict.matched.value_or(""), "forbidden_thing");
    }
}

TEST(security_filter, reports_imports_outside_allow_list) {
    SecurityFilter filter;
    auto modules = filter.disallowed_imports(
        "import numpy as np\n"
        "import requests_html, foo.bar\n"
        "from zzz import y\n"
        "from pandas import DataFrame\n");
    EXPECT_EQ(modules, (std::vector<std::string>{"requests_html", "foo", "zzz"}));

    // Logged only, never blocked
    EXPECT_TRUE(filter.check("import requests_html", Language::PYTHON).allowed);
}

TEST(security_filter, config_from_json) {
    auto config = SecurityConfig::from_json({
        {"max_code_length", 100},
        {"blocked_patterns", {"abc", 5}},
        {"allowed_imports", {"foo"}},
        {"filter_session_code", false}
    });
    EXPECT_EQ(config.max_code_length, 100u);
    EXPECT_EQ(config.blocked_patterns, std::vector<std::string>{"abc"});
    EXPECT_EQ(config.allowed_imports, std::vector<std::string>{"foo"});
    EXPECT_FALSE(config.filter_session_code);

    SecurityFilter filter(config);
    EXPECT_TRUE(filter.disallowed_imports("import foo").empty());
    EXPECT_EQ(filter.disallowed_imports("import math"), std::vector<std::string>{"math"});
}

TEST(security_filter, survives_inputs_near_the_length_limit) {
    SecurityFilter filter;
    const std::string letters(49000, 'a');
    const std::string spaces(49000, ' ');

    EXPECT_TRUE(filter.check("import " + letters, Language::JAVASCRIPT).allowed);
    EXPECT_TRUE(filter.check("const s = '" + letters + "';", Language::JAVASCRIPT).allowed);
    EXPECT_TRUE(filter.check("eval" + spaces + "x", Language::PYTHON).allowed);
    EXPECT_TRUE(filter.check("import" + spaces + "x", Language::PYTHON).allowed);
    EXPECT_TRUE(filter.check("x = '" + letters + "'", Language::PYTHON).allowed);
    EXPECT_TRUE(filter.disallowed_imports("import " + letters).size() == 1u);
}

TEST(security_filter, whitespace_padding_does_not_hide_calls) {
    SecurityFilter filter;
    const std::string spaces(5000, ' ');

    auto verdict = filter.check("eval" + spaces + "('1')", Language::PYTHON);
    ASSERT_FALSE(verdict.allowed);
    EXPECT_EQ(verdict.violated_pattern.value_or(""), "eval-call");

    verdict = filter.check("import" + spaces + "\n\t  subprocess", Language::PYTHON);
    ASSERT_FALSE(verdict.allowed);
    EXPECT_EQ(verdict.violated_pattern.value_or(""), "import-process-module");

    verdict = filter.check("require(" + spaces + "'fs')", Language::JAVASCRIPT);
    ASSERT_FALSE(verdict.allowed);
    EXPECT_EQ(verdict.category.value_or(""), "filesystem");
}

TEST(security_filter, config_from_parsed_json_text) {
    auto config = SecurityConfig::from_json(nlohmann::json::parse(R"({"max_code_length": 64})"));
    EXPECT_EQ(config.max_code_length, 64u);

    config = SecurityConfig::from_json(nlohmann::json::parse(R"({"max_code_length": 0})"));
    EXPECT_EQ(config.max_code_length, 0u);

    // Negative and fractional values keep the default
    SecurityConfig defaults;
    config = SecurityConfig::from_json(nlohmann::json::parse(R"({"max_code_length": -5})"));
    EXPECT_EQ(config.max_code_length, defaults.max_code_length);
    config = SecurityConfig::from_json(nlohmann::json::parse(R"({"max_code_length": 1.5})"));
    EXPECT_EQ(config.max_code_length, defaults.max_code_length);
}
