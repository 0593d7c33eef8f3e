#pragma once

/**
 * @file result_builder.h
 * @brief 스캔 결과 집계 유틸리티
 *
 * 탐지기들이 공유하는 상태 없는 함수 모음입니다.
 * 심각도 순위, 가중 위험 점수, 텍스트 마스킹(redaction), 결과 생성을 담당합니다.
 */

#include "types.h"

#include <chrono>
#include <string>
#include <vector>

namespace llmshield::core {

/**
 * @brief 심각도 가중치 (none=0, low=0.25, medium=0.5, high=0.75, critical=1.0)
 */
[[nodiscard]] double severityWeight(Severity severity);

/**
 * @brief 위험 요소 목록의 최대 심각도 (빈 목록이면 None)
 */
[[nodiscard]] Severity maxSeverity(const std::vector<RiskFactor>& risk_factors);

/**
 * @brief 가중 평균 위험 점수
 *
 * mean(severityWeight(severity) * confidence) 를 [0, 1] 로 제한합니다.
 * 위험 요소가 없으면 정확히 0 입니다.
 */
[[nodiscard]] double calculateRiskScore(const std::vector<RiskFactor>& risk_factors);

/**
 * @brief 엔티티 구간을 [대문자 유형] 태그로 치환
 *
 * 엔티티 구간이 겹치면 먼저 시작하는 구간(같으면 더 긴 구간)만 치환합니다.
 * 치환은 뒤쪽 구간부터 적용하므로 앞쪽 오프셋이 유지됩니다.
 */
[[nodiscard]] std::string redact(const std::string& text, const std::vector<Entity>& entities);

/**
 * @brief 탐지가 없는 유효한 결과
 */
[[nodiscard]] ScanResult makeValidResult(const std::string& text, double duration_ms);

/**
 * @brief 엔티티/위험 요소 목록으로 결과 생성
 */
[[nodiscard]] ScanResult makeResult(
    const std::string& text,
    std::vector<Entity> entities,
    std::vector<RiskFactor> risk_factors,
    double duration_ms
);

/**
 * @brief 시작 시각부터 경과한 시간 (밀리초)
 */
[[nodiscard]] double elapsedMs(std::chrono::steady_clock::time_point started);

[[nodiscard]] std::string toUpperAscii(std::string value);
[[nodiscard]] std::string toLowerAscii(std::string value);

} // namespace llmshield::core
