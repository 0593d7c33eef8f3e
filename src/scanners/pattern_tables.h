#pragma once

/**
 * @file pattern_tables.h
 * @brief 카테고리별 탐지 패턴 테이블
 *
 * PII, 비밀 값, 유해 콘텐츠, 프롬프트 인젝션 규칙을 프로세스 전역 상수로 제공합니다.
 * 테이블은 최초 접근 시 한 번 컴파일되며 이후 변경되지 않으므로
 * 여러 스레드에서 동시에 읽어도 안전합니다.
 */

#include "core/types.h"

#include <cstddef>
#include <regex>
#include <string>
#include <vector>

namespace llmshield::scanners {

/**
 * @brief 단일 탐지 규칙
 */
struct PatternRule {
    std::regex pattern;                                 ///< 매칭 규칙
    std::string label;                                  ///< 규칙 이름 (예: "SSN (dashed)")
    std::string group;                                  ///< 상위 유형 (ssn, aws, hate, jailbreak ...)
    core::Severity severity{core::Severity::Medium};    ///< 기본 심각도
};

/**
 * @brief 정규식 매칭 구간
 */
struct PatternMatch {
    std::size_t start{0};
    std::size_t end{0};
    std::string value;
};

[[nodiscard]] const std::vector<PatternRule>& piiRules();
[[nodiscard]] const std::vector<PatternRule>& secretRules();
[[nodiscard]] const std::vector<PatternRule>& toxicityRules();
[[nodiscard]] const std::vector<PatternRule>& promptInjectionRules();

/**
 * @brief 텍스트에서 겹치지 않는 모든 매칭을 찾음 (빈 매칭 제외)
 *
 * 정규식 실행 깊이를 제한하기 위해 4KB 창을 512바이트씩 겹쳐 가며 매칭합니다.
 * 오프셋은 전체 텍스트 기준이며 512바이트보다 긴 매칭은 보고되지 않을 수 있습니다.
 */
[[nodiscard]] std::vector<PatternMatch> findMatches(const std::regex& pattern, const std::string& text);

/**
 * @brief 같은 구간/유형의 엔티티가 이미 있는지 확인
 */
[[nodiscard]] bool containsSpan(
    const std::vector<core::Entity>& entities,
    std::size_t start,
    std::size_t end,
    const std::string& entity_type
);

/**
 * @brief 정규식 메타 문자 이스케이프
 */
[[nodiscard]] std::string escapeRegex(const std::string& literal);

} // namespace llmshield::scanners
