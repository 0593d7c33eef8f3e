#pragma once

/**
 * @file types.h
 * @brief 스캔 파이프라인 공통 타입
 *
 * 모든 스캐너와 Shield 오케스트레이터가 주고받는 결과 타입을 정의합니다.
 * 탐지 엔티티, 위험 요소, 심각도, 스캔 결과, 스캔 옵션을 포함합니다.
 */

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace llmshield::core {

/**
 * @brief 위험 심각도 (None < Low < Medium < High < Critical)
 */
enum class Severity {
    None,           ///< 위험 없음
    Low,            ///< 낮음
    Medium,         ///< 중간
    High,           ///< 높음
    Critical        ///< 치명적
};

/**
 * @brief 위험 요소 카테고리
 */
enum class Category {
    PromptInjection,    ///< 프롬프트 인젝션
    Secret,             ///< 자격 증명/비밀 값 유출
    Pii,                ///< 개인 식별 정보
    Toxicity            ///< 유해 콘텐츠
};

using Metadata = std::unordered_map<std::string, std::string>;

/**
 * @brief 텍스트 내에서 탐지된 단일 구간
 *
 * 오프셋은 바이트 단위이며 0 <= start < end <= text.size() 를 만족합니다.
 */
struct Entity {
    std::string entity_type;        ///< 엔티티 유형 (email, ssn, secret, toxicity:hate ...)
    std::string text;               ///< 매칭 원문 또는 마스킹된 값
    std::size_t start{0};           ///< 시작 오프셋
    std::size_t end{0};             ///< 끝 오프셋 (미포함)
    double confidence{0.0};         ///< 신뢰도 (0.0~1.0)
};

/**
 * @brief 카테고리 수준의 위험 요소
 *
 * 같은 규칙으로 탐지된 여러 엔티티는 하나의 RiskFactor로 합쳐지며
 * 개수는 metadata["count"] 에 기록됩니다.
 */
struct RiskFactor {
    Category category{Category::PromptInjection};
    std::string description;                ///< 사람이 읽을 수 있는 설명
    Severity severity{Severity::None};
    double confidence{0.0};                 ///< 신뢰도 (0.0~1.0)
    Metadata metadata;                      ///< 추가 메타데이터
};

/**
 * @brief 스캐너/오케스트레이터 스캔 결과
 *
 * 불변식: is_valid == risk_factors.empty(), is_valid 이면 risk_score == 0
 */
struct ScanResult {
    bool is_valid{true};                    ///< 위험 요소가 없으면 true
    double risk_score{0.0};                 ///< 위험 점수 (0.0~1.0)
    std::string sanitized_text;             ///< (마스킹된) 텍스트
    std::vector<Entity> entities;           ///< 탐지 순서대로 정렬된 엔티티
    std::vector<RiskFactor> risk_factors;   ///< 위험 요소 목록
    Severity severity{Severity::None};      ///< 전체 심각도 (최댓값)
    Metadata metadata;                      ///< 추가 메타데이터
    double duration_ms{0.0};                ///< 소요 시간 (밀리초)

    [[nodiscard]] std::string severityString() const;
};

/**
 * @brief 스캔 호출 옵션
 */
struct ScanOptions {
    /// 스캔 전 입력을 잘라낼 최대 길이 (바이트). 오프셋은 잘린 텍스트 기준입니다.
    std::optional<std::size_t> max_length;
};

// ============================
// 문자열 변환
// ============================

[[nodiscard]] std::string severityToString(Severity severity);
[[nodiscard]] std::string categoryToString(Category category);

} // namespace llmshield::core
