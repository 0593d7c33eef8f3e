/**
 * @file test_core.cpp
 * @brief 결과 집계 유틸리티 단위 테스트
 *
 * 테스트 대상:
 *   - 심각도 가중치/최댓값
 *   - 가중 평균 위험 점수 (빈 목록, 평균, 상한)
 *   - 마스킹(redaction) 순서, 겹치는 구간 처리
 *   - makeResult 불변식
 *   - 문자열 변환
 */

#include <gtest/gtest.h>

#include "core/result_builder.h"
#include "core/types.h"

using namespace llmshield::core;

namespace {

RiskFactor factor(Severity severity, double confidence) {
    RiskFactor f;
    f.category = Category::Pii;
    f.description = "test";
    f.severity = severity;
    f.confidence = confidence;
    return f;
}

Entity entity(const std::string& type, std::size_t start, std::size_t end) {
    Entity e;
    e.entity_type = type;
    e.start = start;
    e.end = end;
    e.confidence = 0.9;
    return e;
}

} // namespace

// ============================================================
// 심각도
// ============================================================

// 1. 심각도 가중치는 고정값
TEST(ResultBuilderTest, SeverityWeights) {
    EXPECT_DOUBLE_EQ(severityWeight(Severity::None), 0.0);
    EXPECT_DOUBLE_EQ(severityWeight(Severity::Low), 0.25);
    EXPECT_DOUBLE_EQ(severityWeight(Severity::Medium), 0.5);
    EXPECT_DOUBLE_EQ(severityWeight(Severity::High), 0.75);
    EXPECT_DOUBLE_EQ(severityWeight(Severity::Critical), 1.0);
}

// 2. 최대 심각도
TEST(ResultBuilderTest, MaxSeverityIsTotalOrderMaximum) {
    EXPECT_EQ(maxSeverity({}), Severity::None);
    EXPECT_EQ(maxSeverity({factor(Severity::Low, 0.5), factor(Severity::Critical, 0.1),
                           factor(Severity::High, 0.9)}),
              Severity::Critical);
    EXPECT_LT(Severity::Medium, Severity::High);
}

// ============================================================
// 위험 점수
// ============================================================

// 3. 위험 요소가 없으면 정확히 0
TEST(ResultBuilderTest, RiskScoreZeroWithoutFactors) {
    EXPECT_EQ(calculateRiskScore({}), 0.0);
}

// 4. 가중 평균
TEST(ResultBuilderTest, RiskScoreIsWeightedMean) {
    // (0.75 * 0.6 + 1.0 * 0.9) / 2 = 0.675
    double score = calculateRiskScore({factor(Severity::High, 0.6), factor(Severity::Critical, 0.9)});
    EXPECT_NEAR(score, 0.675, 1e-9);
}

// 5. 상한 1.0
TEST(ResultBuilderTest, RiskScoreClampedToOne) {
    EXPECT_DOUBLE_EQ(calculateRiskScore({factor(Severity::Critical, 2.0)}), 1.0);
}

// ============================================================
// 마스킹
// ============================================================

// 6. 오프셋 역순 처리로 모든 구간이 태그로 치환됨
TEST(ResultBuilderTest, RedactReplacesSpansWithUppercaseTags) {
    std::string text = "a@b.co and 123-45-6789";
    std::string redacted = redact(text, {entity("email", 0, 6), entity("ssn", 11, 22)});
    EXPECT_EQ(redacted, "[EMAIL] and [SSN]");
}

// 7. 엔티티가 없으면 원문 그대로
TEST(ResultBuilderTest, RedactWithoutEntitiesKeepsText) {
    EXPECT_EQ(redact("nothing here", {}), "nothing here");
}

// 8. 같은 위치에서 시작하는 구간은 더 긴 구간으로 치환
TEST(ResultBuilderTest, RedactPrefersLongestSpanAtSameStart) {
    std::string text = "I want to kill myself";
    std::string redacted = redact(text, {entity("toxicity:violence", 10, 14),
                                         entity("toxicity:self-harm", 10, 21)});
    EXPECT_EQ(redacted, "I want to [TOXICITY:SELF-HARM]")
        << "짧은 구간이 먼저 와도 긴 구간 하나만 치환되어야 함";
}

// 9. 부분적으로 겹치는 구간과 범위 밖 구간은 건너뜀
TEST(ResultBuilderTest, RedactSkipsOverlappingAndOutOfRangeSpans) {
    std::string text = "abcdefgh";
    std::string redacted = redact(text, {entity("b", 2, 6), entity("a", 0, 4),
                                         entity("c", 6, 8), entity("x", 5, 99)});
    EXPECT_EQ(redacted, "[A]ef[C]");
}

// ============================================================
// 결과 생성
// ============================================================

// 10. is_valid == risk_factors.empty()
TEST(ResultBuilderTest, MakeResultInvariants) {
    auto clean = makeResult("clean", {}, {}, 1.5);
    EXPECT_TRUE(clean.is_valid);
    EXPECT_EQ(clean.risk_score, 0.0);
    EXPECT_EQ(clean.severity, Severity::None);
    EXPECT_EQ(clean.sanitized_text, "clean");
    EXPECT_DOUBLE_EQ(clean.duration_ms, 1.5);

    auto risky = makeResult("x 123-45-6789", {entity("ssn", 2, 13)},
                            {factor(Severity::Critical, 0.9)}, 0.0);
    EXPECT_FALSE(risky.is_valid);
    EXPECT_NEAR(risky.risk_score, 0.9, 1e-9);
    EXPECT_EQ(risky.severity, Severity::Critical);
    EXPECT_EQ(risky.sanitized_text, "x [SSN]");
    EXPECT_EQ(risky.severityString(), "critical");
}

// 11. 문자열 변환
TEST(TypesTest, StringConversions) {
    EXPECT_EQ(severityToString(Severity::High), "high");
    EXPECT_EQ(severityToString(Severity::Critical), "critical");
    EXPECT_EQ(categoryToString(Category::PromptInjection), "prompt-injection");
    EXPECT_EQ(categoryToString(Category::Pii), "pii");
    EXPECT_EQ(categoryToString(Category::Toxicity), "toxicity");
}

