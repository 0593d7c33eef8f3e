/**
 * @file prompt_injection_scanner.cpp
 * @brief 프롬프트 인젝션 스캐너 구현
 */

#include "prompt_injection_scanner.h"

#include "core/result_builder.h"

#include <algorithm>
#include <chrono>
#include <iostream>

namespace llmshield::scanners {

namespace {

constexpr double kEntityConfidence = 0.9;
const std::string kEntityType = "prompt_injection";
constexpr double kBaseConfidence = 0.5;
constexpr double kConfidenceStep = 0.1;
constexpr double kMaxConfidence = 0.9;

} // namespace

PromptInjectionScanner::PromptInjectionScanner() = default;
PromptInjectionScanner::~PromptInjectionScanner() = default;

// ============================================================
// 초기화
// ============================================================

bool PromptInjectionScanner::initialize(const PromptInjectionScannerConfig& config) {
    config_ = config;
    rules_.clear();
    last_error_.clear();
    initialized_ = false;

    for (const auto& rule : promptInjectionRules()) {
        if (!config_.detect_jailbreaks && rule.group == "jailbreak") continue;
        if (!config_.detect_role_play && rule.group == "role-play") continue;
        rules_.push_back(rule);
    }

    for (const auto& source : config_.custom_patterns) {
        if (source.empty()) {
            last_error_ = "빈 사용자 정의 패턴";
            std::cerr << "[PromptInjectionScanner] " << last_error_ << std::endl;
            rules_.clear();
            return false;
        }
        try {
            PatternRule rule;
            rule.pattern = std::regex(source, std::regex::ECMAScript | std::regex::icase);
            rule.label = source;
            rule.group = "custom";
            rule.severity = core::Severity::High;
            rules_.push_back(std::move(rule));
        } catch (const std::regex_error& e) {
            last_error_ = "잘못된 사용자 정의 패턴 '" + source + "': " + e.what();
            std::cerr << "[PromptInjectionScanner] " << last_error_ << std::endl;
            rules_.clear();
            return false;
        }
    }

    initialized_ = true;
    std::cout << "[PromptInjectionScanner] ✓ 인젝션 패턴 " << rules_.size() << "개"
              << " (탈옥: " << (config_.detect_jailbreaks ? "on" : "off")
              << ", 역할 조작: " << (config_.detect_role_play ? "on" : "off") << ")" << std::endl;
    return true;
}

// ============================================================
// 스캔
// ============================================================

core::ScanResult PromptInjectionScanner::scan(const std::string& text) const {
    auto started = std::chrono::steady_clock::now();
    std::vector<core::Entity> entities;
    std::vector<std::string> groups;
    std::size_t match_count = 0;

    for (const auto& rule : rules_) {
        for (const auto& match : findMatches(rule.pattern, text)) {
            ++match_count;
            if (std::find(groups.begin(), groups.end(), rule.group) == groups.end()) {
                groups.push_back(rule.group);
            }
            if (containsSpan(entities, match.start, match.end, kEntityType)) continue;

            core::Entity entity;
            entity.entity_type = kEntityType;
            entity.text = match.value;
            entity.start = match.start;
            entity.end = match.end;
            entity.confidence = kEntityConfidence;
            entities.push_back(std::move(entity));
        }
    }

    std::vector<core::RiskFactor> risk_factors;
    if (match_count > 0) {
        std::string joined;
        for (const auto& group : groups) {
            if (!joined.empty()) joined += ',';
            joined += group;
        }

        core::RiskFactor factor;
        factor.category = core::Category::PromptInjection;
        factor.description = "Detected " + std::to_string(match_count)
                            + " potential prompt injection attempt(s)";
        factor.severity = core::Severity::High;
        factor.confidence = std::min(kMaxConfidence,
            kBaseConfidence + static_cast<double>(match_count) * kConfidenceStep);
        factor.metadata["pattern_matches"] = std::to_string(match_count);
        factor.metadata["rule_groups"] = joined;
        risk_factors.push_back(std::move(factor));
    }

    return core::makeResult(text, std::move(entities), std::move(risk_factors),
                            core::elapsedMs(started));
}

} // namespace llmshield::scanners
