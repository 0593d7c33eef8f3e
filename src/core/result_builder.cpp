/**
 * @file result_builder.cpp
 * @brief 스캔 결과 집계 유틸리티 구현
 */

#include "result_builder.h"

#include <algorithm>
#include <cctype>

namespace llmshield::core {

double severityWeight(Severity severity) {
    switch (severity) {
        case Severity::None:     return 0.0;
        case Severity::Low:      return 0.25;
        case Severity::Medium:   return 0.5;
        case Severity::High:     return 0.75;
        case Severity::Critical: return 1.0;
    }
    return 0.0;
}

Severity maxSeverity(const std::vector<RiskFactor>& risk_factors) {
    Severity result = Severity::None;
    for (const auto& factor : risk_factors) {
        result = std::max(result, factor.severity);
    }
    return result;
}

double calculateRiskScore(const std::vector<RiskFactor>& risk_factors) {
    if (risk_factors.empty()) return 0.0;

    double total = 0.0;
    for (const auto& factor : risk_factors) {
        total += severityWeight(factor.severity) * factor.confidence;
    }

    double score = total / static_cast<double>(risk_factors.size());
    return std::clamp(score, 0.0, 1.0);
}

std::string redact(const std::string& text, const std::vector<Entity>& entities) {
    if (entities.empty()) return text;

    // 시작 오프셋 오름차순 (같으면 긴 구간 우선)
    std::vector<Entity> sorted = entities;
    std::stable_sort(sorted.begin(), sorted.end(), [](const Entity& a, const Entity& b) {
        if (a.start != b.start) return a.start < b.start;
        return a.end > b.end;
    });

    // 앞선 구간과 겹치는 엔티티는 치환 대상에서 제외
    std::vector<const Entity*> spans;
    std::size_t covered = 0;
    for (const auto& entity : sorted) {
        if (entity.start >= entity.end || entity.end > text.size()) continue;
        if (entity.start < covered) continue;
        spans.push_back(&entity);
        covered = entity.end;
    }

    std::string result = text;
    for (auto it = spans.rbegin(); it != spans.rend(); ++it) {
        const Entity& entity = **it;
        result.replace(entity.start, entity.end - entity.start,
                       "[" + toUpperAscii(entity.entity_type) + "]");
    }
    return result;
}

ScanResult makeValidResult(const std::string& text, double duration_ms) {
    ScanResult result;
    result.is_valid = true;
    result.risk_score = 0.0;
    result.sanitized_text = text;
    result.severity = Severity::None;
    result.duration_ms = duration_ms;
    return result;
}

ScanResult makeResult(
    const std::string& text,
    std::vector<Entity> entities,
    std::vector<RiskFactor> risk_factors,
    double duration_ms
) {
    ScanResult result;
    result.is_valid = risk_factors.empty();
    result.risk_score = calculateRiskScore(risk_factors);
    result.sanitized_text = redact(text, entities);
    result.severity = maxSeverity(risk_factors);
    result.entities = std::move(entities);
    result.risk_factors = std::move(risk_factors);
    result.duration_ms = duration_ms;
    return result;
}

double elapsedMs(std::chrono::steady_clock::time_point started) {
    auto elapsed = std::chrono::steady_clock::now() - started;
    return std::chrono::duration<double, std::milli>(elapsed).count();
}

std::string toUpperAscii(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

std::string toLowerAscii(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace llmshield::core
