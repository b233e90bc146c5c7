#include "CodeCapture.h"

namespace Capture {

namespace {

struct LanguagePattern {
    const char* extension;
    const char* name;
    std::regex pattern;
};

// Checked in order; the first hit wins.
const std::vector<LanguagePattern>& language_patterns() {
    static const std::vector<LanguagePattern> patterns = {
        {".html", "HTML", std::regex(R"(<(!DOCTYPE html|html|head|body|div|p|a|img|script|style)\b)",
                                     std::regex::ECMAScript | std::regex::icase)},
        {".xml", "XML", std::regex(R"(<(\?xml|!DOCTYPE|[a-zA-Z:]+))")},
        {".css", "CSS", std::regex(R"([{};]\s*([a-zA-Z-]+)\s*:)")},
        {".py", "Python", std::regex(R"(\b(def|class|import|from|if|else|elif|for|while|try|except|print)\b)")},
        {".sh", "Shell", std::regex(R"(\b(echo|then|fi|do|done|case|esac|function|source|export)\b)")},
        {".js", "JavaScript", std::regex(R"(\b(function|var|let|const|document|window|console\.log)\b)")},
        {".sql", "SQL", std::regex(R"(\b(SELECT|INSERT|UPDATE|DELETE|CREATE|TABLE|FROM|WHERE|JOIN)\b)",
                                   std::regex::ECMAScript | std::regex::icase)},
        {".md", "Markdown", std::regex(R"((^|\n)#+\s|\*\*|`|(^|\n)> )")},
    };
    return patterns;
}

bool looks_like_json(const std::string& code) {
    std::string t = trim_copy(code);
    if (t.size() < 2) return false;
    bool object = t.front() == '{' && t.back() == '}';
    bool array = t.front() == '[' && t.back() == ']';
    if (!object && !array) return false;
    try {
        // Wrapping lets the flat-object reader walk arrays as well.
        parse_json_object("{\"v\":" + t + "}");
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

std::string first_line(const std::string& code) {
    size_t start = 0;
    while (start < code.size() && (code[start] == '\n' || code[start] == '\r')) ++start;
    size_t end = code.find('\n', start);
    std::string line = code.substr(start, end == std::string::npos ? std::string::npos : end - start);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return line;
}

std::string micro_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count() % 1000000;
    std::ostringstream oss;
    oss << format_local_time("%Y%m%d_%H%M%S") << "_" << std::setw(6) << std::setfill('0') << micros;
    return oss.str();
}

} // namespace

LanguageGuess detect_language(const std::string& code) {
    std::string head = first_line(code);
    if (head.rfind("#!/usr/bin/env python", 0) == 0 || head.rfind("#!/usr/bin/python", 0) == 0)
        return {".py", "Python"};
    if (head.rfind("#!/bin/bash", 0) == 0 || head.rfind("#!/bin/sh", 0) == 0 ||
        head.rfind("#!/usr/bin/env bash", 0) == 0 || head.rfind("#!/usr/bin/env sh", 0) == 0)
        return {".sh", "Shell"};
    if (head.rfind("<?php", 0) == 0) return {".php", "PHP"};

    const auto& patterns = language_patterns();
    for (size_t i = 0; i < patterns.size(); ++i) {
        // JSON sits between XML and CSS in the probe order.
        if (std::strcmp(patterns[i].extension, ".css") == 0 && looks_like_json(code)) return {".json", "JSON"};
        if (std::regex_search(code, patterns[i].pattern)) return {patterns[i].extension, patterns[i].name};
    }

    TRACE_MSG("detect_language: no match, defaulting to text");
    return {kDefaultExtension, "Text"};
}

std::string language_for_extension(const std::string& extension) {
    static const std::map<std::string, std::string> names = {
        {".py", "Python"}, {".sh", "Shell"}, {".js", "JavaScript"}, {".html", "HTML"},
        {".htm", "HTML"}, {".xml", "XML"}, {".css", "CSS"}, {".json", "JSON"},
        {".sql", "SQL"}, {".md", "Markdown"}, {".php", "PHP"}, {".txt", "Text"},
        {".c", "C"}, {".h", "C"}, {".cpp", "C++"}, {".hpp", "C++"}, {".ts", "TypeScript"},
    };
    auto it = names.find(to_lower_copy(extension));
    return it == names.end() ? "Unknown" : it->second;
}

std::string prefix_for_language(const std::string& language) {
    if (language.empty() || language == "Text" || language == "Unknown") return "code";
    std::string prefix;
    for (char c : to_lower_copy(language)) {
        if (std::isalnum(static_cast<unsigned char>(c))) prefix.push_back(c);
        else if (c == ' ' || c == '+') prefix.push_back(c == '+' ? 'p' : '_');
    }
    return prefix.empty() ? "code" : prefix;
}

std::filesystem::path generate_capture_path(const std::filesystem::path& dir,
                                            const std::string& extension,
                                            const std::string& prefix) {
    std::string ext = extension.empty() ? kDefaultExtension : extension;
    if (ext.front() != '.') ext.insert(ext.begin(), '.');

    std::string safe;
    for (char c : prefix) {
        bool ok = std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '.';
        safe.push_back(ok ? c : '_');
    }
    while (!safe.empty() && safe.front() == '_') safe.erase(safe.begin());
    while (!safe.empty() && safe.back() == '_') safe.pop_back();
    if (safe.empty() || safe.find_first_not_of('.') == std::string::npos) safe = "code";

    const std::string today = format_local_time("%Y%m%d");
    std::error_code ec;
    for (int counter = 1; counter <= 999; ++counter) {
        char number[8];
        std::snprintf(number, sizeof(number), "%03d", counter);
        auto candidate = dir / (safe + "_" + today + "_" + number + ext);
        if (!std::filesystem::exists(candidate, ec)) return candidate;
    }

    log_warn("Naming", "no free sequence number for prefix '" + safe + "', using a microsecond timestamp");
    return dir / (safe + "_" + micro_timestamp() + ext);
}

}
