/**
 * @file pii_scanner.cpp
 * @brief PII 스캐너 구현
 */

#include "pii_scanner.h"

#include "core/result_builder.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <iostream>
#include <unordered_set>

namespace llmshield::scanners {

namespace {

constexpr double kRiskFactorConfidence = 0.9;

std::string lastChars(const std::string& value, std::size_t count) {
    if (value.size() <= count) return value;
    return value.substr(value.size() - count);
}

std::string digitsOnly(const std::string& value) {
    std::string digits;
    for (char c : value) {
        if (std::isdigit(static_cast<unsigned char>(c))) digits += c;
    }
    return digits;
}

} // namespace

std::string piiTypeToString(PiiType type) {
    switch (type) {
        case PiiType::Email:          return "email";
        case PiiType::Phone:          return "phone";
        case PiiType::Ssn:            return "ssn";
        case PiiType::CreditCard:     return "credit-card";
        case PiiType::IpAddress:      return "ip-address";
        case PiiType::Passport:       return "passport";
        case PiiType::DriversLicense: return "drivers-license";
    }
    return "unknown";
}

// ============================================================
// 생성자 / 소멸자
// ============================================================

PiiScanner::PiiScanner() = default;
PiiScanner::~PiiScanner() = default;

// ============================================================
// 초기화
// ============================================================

bool PiiScanner::initialize(const PiiScannerConfig& config) {
    config_ = config;
    rules_.clear();

    std::unordered_set<std::string> enabled;
    for (auto type : config_.pii_types) {
        enabled.insert(piiTypeToString(type));
    }

    for (const auto& rule : piiRules()) {
        if (enabled.count(rule.group)) {
            rules_.push_back(rule);
        }
    }

    initialized_ = true;
    std::cout << "[PiiScanner] ✓ PII 패턴 " << rules_.size() << "개 (유형 "
              << enabled.size() << "개)" << std::endl;
    return true;
}

// ============================================================
// 스캔
// ============================================================

core::ScanResult PiiScanner::scan(const std::string& text) const {
    auto started = std::chrono::steady_clock::now();
    std::vector<core::Entity> entities;

    // 규칙별 탐지 횟수 (발견 순서 유지)
    std::vector<int> counts(rules_.size(), 0);
    std::vector<std::size_t> found_order;

    for (std::size_t i = 0; i < rules_.size(); ++i) {
        const auto& rule = rules_[i];
        for (const auto& match : findMatches(rule.pattern, text)) {
            // 검증 실패는 오탐으로 간주하고 버림
            if (!validate(match.value, rule.group)) continue;
            if (counts[i]++ == 0) found_order.push_back(i);

            // 다른 규칙이 같은 값을 이미 보고했으면 엔티티는 하나만 유지
            if (containsSpan(entities, match.start, match.end, rule.group)) continue;

            core::Entity entity;
            entity.entity_type = rule.group;
            entity.text = config_.redact ? mask(match.value, rule.group) : match.value;
            entity.start = match.start;
            entity.end = match.end;
            entity.confidence = confidenceFor(rule.group);
            entities.push_back(std::move(entity));
        }
    }

    std::vector<core::RiskFactor> risk_factors;
    for (auto index : found_order) {
        const auto& rule = rules_[index];
        core::RiskFactor factor;
        factor.category = core::Category::Pii;
        factor.description = "Detected " + std::to_string(counts[index]) + " " + rule.label + "(s)";
        factor.severity = rule.severity;
        factor.confidence = kRiskFactorConfidence;
        factor.metadata["pii_type"] = rule.group;
        factor.metadata["rule"] = rule.label;
        factor.metadata["count"] = std::to_string(counts[index]);
        risk_factors.push_back(std::move(factor));
    }

    return core::makeResult(text, std::move(entities), std::move(risk_factors),
                            core::elapsedMs(started));
}

// ============================================================
// 검증
// ============================================================

bool PiiScanner::validate(const std::string& value, const std::string& type) {
    if (type == "credit-card") {
        return luhnCheck(digitsOnly(value));
    }
    if (type == "ssn") {
        // 지역 번호 000, 666, 9xx 는 발급되지 않음
        std::string digits = digitsOnly(value);
        if (digits.size() != 9) return false;
        int area = std::stoi(digits.substr(0, 3));
        return area != 0 && area != 666 && area < 900;
    }
    if (type == "email") {
        return value.find('@') != std::string::npos && value.find('.') != std::string::npos;
    }
    return true;
}

bool PiiScanner::luhnCheck(const std::string& digits) {
    int sum = 0;
    bool alternate = false;

    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        if (!std::isdigit(static_cast<unsigned char>(*it))) continue;
        int digit = *it - '0';
        if (alternate) {
            digit *= 2;
            if (digit > 9) digit -= 9;
        }
        sum += digit;
        alternate = !alternate;
    }
    return sum % 10 == 0;
}

// ============================================================
// 마스킹 / 신뢰도
// ============================================================

std::string PiiScanner::mask(const std::string& value, const std::string& type) {
    if (type == "email") {
        auto at = value.find('@');
        if (at == std::string::npos) return "****";
        auto domain_end = value.find('@', at + 1);
        std::string domain = value.substr(at + 1, domain_end == std::string::npos
                                                      ? std::string::npos
                                                      : domain_end - at - 1);
        return value.substr(0, std::min<std::size_t>(2, at)) + "***@" + domain;
    }
    if (type == "credit-card") return "****-****-****-" + lastChars(value, 4);
    if (type == "ssn")         return "***-**-" + lastChars(value, 4);
    if (type == "phone")       return "***-***-" + lastChars(value, 4);
    return "****";
}

double PiiScanner::confidenceFor(const std::string& type) {
    if (type == "email")       return 0.95;
    if (type == "credit-card") return 0.99;
    if (type == "ssn")         return 0.85;
    if (type == "phone")       return 0.75;
    return 0.7;
}

} // namespace llmshield::scanners
