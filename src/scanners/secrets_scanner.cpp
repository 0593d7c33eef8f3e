/**
 * @file secrets_scanner.cpp
 * @brief 비밀 값 스캐너 구현
 */

#include "secrets_scanner.h"

#include "core/result_builder.h"

#include <chrono>
#include <iostream>
#include <unordered_set>

namespace llmshield::scanners {

namespace {

constexpr double kSecretConfidence = 0.95;
const std::string kSecretEntityType = "secret";

} // namespace

std::string secretTypeToString(SecretType type) {
    switch (type) {
        case SecretType::Aws:        return "aws";
        case SecretType::Github:     return "github";
        case SecretType::Stripe:     return "stripe";
        case SecretType::OpenAi:     return "openai";
        case SecretType::Anthropic:  return "anthropic";
        case SecretType::Slack:      return "slack";
        case SecretType::Google:     return "google";
        case SecretType::Generic:    return "generic";
        case SecretType::PrivateKey: return "private-key";
        case SecretType::Jwt:        return "jwt";
    }
    return "unknown";
}

SecretsScanner::SecretsScanner() = default;
SecretsScanner::~SecretsScanner() = default;

// ============================================================
// 초기화
// ============================================================

bool SecretsScanner::initialize(const SecretsScannerConfig& config) {
    config_ = config;
    rules_.clear();
    last_error_.clear();
    initialized_ = false;

    std::unordered_set<std::string> enabled;
    for (auto type : config_.secret_types) {
        enabled.insert(secretTypeToString(type));
    }

    for (const auto& rule : secretRules()) {
        if (enabled.empty() || enabled.count(rule.group)) {
            rules_.push_back(rule);
        }
    }

    // 사용자 정의 패턴은 생성 시점에 컴파일하여 오류를 조기에 보고
    for (const auto& custom : config_.custom_patterns) {
        if (custom.pattern.empty()) {
            last_error_ = "빈 사용자 정의 패턴: " + custom.label;
            std::cerr << "[SecretsScanner] " << last_error_ << std::endl;
            rules_.clear();
            return false;
        }
        try {
            auto flags = std::regex::ECMAScript;
            if (custom.case_insensitive) flags |= std::regex::icase;

            PatternRule rule;
            rule.pattern = std::regex(custom.pattern, flags);
            rule.label = custom.label.empty() ? custom.pattern : custom.label;
            rule.group = "custom";
            rule.severity = custom.severity;
            rules_.push_back(std::move(rule));
        } catch (const std::regex_error& e) {
            last_error_ = "잘못된 사용자 정의 패턴 '" + custom.pattern + "': " + e.what();
            std::cerr << "[SecretsScanner] " << last_error_ << std::endl;
            rules_.clear();
            return false;
        }
    }

    initialized_ = true;
    std::cout << "[SecretsScanner] ✓ 비밀 값 패턴 " << rules_.size() << "개" << std::endl;
    return true;
}

// ============================================================
// 스캔
// ============================================================

core::ScanResult SecretsScanner::scan(const std::string& text) const {
    auto started = std::chrono::steady_clock::now();
    std::vector<core::Entity> entities;

    std::vector<int> counts(rules_.size(), 0);
    std::vector<std::size_t> found_order;

    for (std::size_t i = 0; i < rules_.size(); ++i) {
        const auto& rule = rules_[i];
        for (const auto& match : findMatches(rule.pattern, text)) {
            if (counts[i]++ == 0) found_order.push_back(i);
            if (containsSpan(entities, match.start, match.end, kSecretEntityType)) continue;

            core::Entity entity;
            entity.entity_type = kSecretEntityType;
            entity.text = config_.redact ? mask(match.value) : match.value;
            entity.start = match.start;
            entity.end = match.end;
            entity.confidence = kSecretConfidence;
            entities.push_back(std::move(entity));
        }
    }

    std::vector<core::RiskFactor> risk_factors;
    for (auto index : found_order) {
        const auto& rule = rules_[index];
        core::RiskFactor factor;
        factor.category = core::Category::Secret;
        factor.description = "Detected " + rule.label;
        factor.severity = rule.severity;
        factor.confidence = kSecretConfidence;
        factor.metadata["secret_type"] = rule.label;
        factor.metadata["provider"] = rule.group;
        factor.metadata["count"] = std::to_string(counts[index]);
        risk_factors.push_back(std::move(factor));
    }

    return core::makeResult(text, std::move(entities), std::move(risk_factors),
                            core::elapsedMs(started));
}

std::string SecretsScanner::mask(const std::string& secret) {
    if (secret.size() <= 8) {
        return "****";
    }
    return secret.substr(0, 4) + "****" + secret.substr(secret.size() - 4);
}

} // namespace llmshield::scanners
