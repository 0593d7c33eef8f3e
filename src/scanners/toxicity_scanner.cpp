/**
 * @file toxicity_scanner.cpp
 * @brief 유해 콘텐츠 스캐너 구현
 */

#include "toxicity_scanner.h"

#include "core/result_builder.h"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <unordered_map>

namespace llmshield::scanners {

namespace {

constexpr double kEntityConfidence = 0.8;
constexpr double kBaseConfidence = 0.6;
constexpr double kConfidenceStep = 0.05;
constexpr double kMaxConfidence = 0.95;

} // namespace

std::string toxicityCategoryToString(ToxicityCategory category) {
    switch (category) {
        case ToxicityCategory::Violence:   return "violence";
        case ToxicityCategory::Hate:       return "hate";
        case ToxicityCategory::Harassment: return "harassment";
        case ToxicityCategory::SelfHarm:   return "self-harm";
        case ToxicityCategory::Sexual:     return "sexual";
        case ToxicityCategory::Profanity:  return "profanity";
    }
    return "unknown";
}

ToxicityScanner::ToxicityScanner() = default;
ToxicityScanner::~ToxicityScanner() = default;

// ============================================================
// 초기화
// ============================================================

bool ToxicityScanner::initialize(const ToxicityScannerConfig& config) {
    config_ = config;
    rules_.clear();
    allowed_.clear();
    last_error_.clear();
    initialized_ = false;

    std::unordered_set<std::string> enabled;
    for (auto category : config_.categories) {
        enabled.insert(toxicityCategoryToString(category));
    }

    for (const auto& rule : toxicityRules()) {
        if (enabled.count(rule.group)) {
            rules_.push_back(rule);
        }
    }

    // 사용자 정의 키워드는 하나의 단어 경계 규칙으로 묶음
    if (!config_.custom_keywords.empty()) {
        std::string alternation;
        for (const auto& keyword : config_.custom_keywords) {
            if (keyword.empty()) {
                last_error_ = "빈 사용자 정의 키워드";
                std::cerr << "[ToxicityScanner] " << last_error_ << std::endl;
                rules_.clear();
                return false;
            }
            if (!alternation.empty()) alternation += '|';
            alternation += escapeRegex(keyword);
        }

        try {
            PatternRule rule;
            rule.pattern = std::regex("\\b(" + alternation + ")\\b",
                                      std::regex::ECMAScript | std::regex::icase);
            rule.label = "custom keywords";
            rule.group = toxicityCategoryToString(ToxicityCategory::Profanity);
            rule.severity = core::Severity::Medium;
            rules_.push_back(std::move(rule));
        } catch (const std::regex_error& e) {
            last_error_ = std::string("사용자 정의 키워드 컴파일 실패: ") + e.what();
            std::cerr << "[ToxicityScanner] " << last_error_ << std::endl;
            rules_.clear();
            return false;
        }
    }

    for (const auto& keyword : config_.allowed_keywords) {
        allowed_.insert(core::toLowerAscii(keyword));
    }

    initialized_ = true;
    std::cout << "[ToxicityScanner] ✓ 유해성 패턴 " << rules_.size() << "개, 허용 키워드 "
              << allowed_.size() << "개" << std::endl;
    return true;
}

// ============================================================
// 스캔
// ============================================================

core::ScanResult ToxicityScanner::scan(const std::string& text) const {
    auto started = std::chrono::steady_clock::now();
    std::vector<core::Entity> entities;

    // 카테고리별 탐지 횟수 (발견 순서 유지)
    std::vector<std::string> found_order;
    std::unordered_map<std::string, int> counts;

    for (const auto& rule : rules_) {
        for (const auto& match : findMatches(rule.pattern, text)) {
            if (allowed_.count(core::toLowerAscii(match.value))) continue;
            if (counts[rule.group]++ == 0) found_order.push_back(rule.group);

            // 겹치는 매칭도 모두 카테고리 집계에 포함 ("kill myself" 는 폭력 + 자해)
            const std::string entity_type = "toxicity:" + rule.group;
            if (containsSpan(entities, match.start, match.end, entity_type)) continue;

            core::Entity entity;
            entity.entity_type = entity_type;
            entity.text = match.value;
            entity.start = match.start;
            entity.end = match.end;
            entity.confidence = kEntityConfidence;
            entities.push_back(std::move(entity));
        }
    }

    std::vector<core::RiskFactor> risk_factors;
    for (const auto& category : found_order) {
        // 카테고리 심각도는 해당 카테고리의 첫 번째 규칙을 따름
        auto rule = std::find_if(rules_.begin(), rules_.end(),
            [&](const PatternRule& r) { return r.group == category; });
        int count = counts[category];

        core::RiskFactor factor;
        factor.category = core::Category::Toxicity;
        factor.description = "Detected " + std::to_string(count) + " instance(s) of "
                            + category + " content";
        factor.severity = rule->severity;
        factor.confidence = std::min(kMaxConfidence, kBaseConfidence + count * kConfidenceStep);
        factor.metadata["toxicity_category"] = category;
        factor.metadata["count"] = std::to_string(count);
        risk_factors.push_back(std::move(factor));
    }

    return core::makeResult(text, std::move(entities), std::move(risk_factors),
                            core::elapsedMs(started));
}

} // namespace llmshield::scanners
