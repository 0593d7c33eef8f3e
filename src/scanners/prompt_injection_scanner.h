#pragma once

/**
 * @file prompt_injection_scanner.h
 * @brief 프롬프트 인젝션 스캐너
 *
 * 지시 무시, 역할 조작, 시스템 프롬프트 공격, 탈옥, 구분자 인젝션 패턴을 탐지합니다.
 * 탐지 결과는 하나의 위험 요소로 요약되며 엔티티 텍스트는 마스킹하지 않습니다.
 */

#include "core/scanner.h"
#include "pattern_tables.h"

#include <string>
#include <vector>

namespace llmshield::scanners {

/**
 * @brief 프롬프트 인젝션 스캐너 설정
 */
struct PromptInjectionScannerConfig {
    std::vector<std::string> custom_patterns;   ///< 추가 정규식 (대소문자 무시)
    bool detect_jailbreaks{true};               ///< 탈옥 규칙 그룹 사용
    bool detect_role_play{true};                ///< 역할 조작 규칙 그룹 사용
};

/**
 * @brief 프롬프트 인젝션 스캐너
 */
class PromptInjectionScanner : public core::Scanner {
public:
    PromptInjectionScanner();
    ~PromptInjectionScanner() override;

    /**
     * @brief 초기화
     * @return 사용자 정의 패턴이 컴파일되지 않으면 false
     */
    bool initialize(const PromptInjectionScannerConfig& config = {});

    [[nodiscard]] std::string name() const override { return "prompt-injection"; }
    [[nodiscard]] core::ScanResult scan(const std::string& text) const override;
    [[nodiscard]] bool isInitialized() const override { return initialized_; }

    [[nodiscard]] const std::string& lastError() const { return last_error_; }
    [[nodiscard]] std::size_t ruleCount() const { return rules_.size(); }

private:
    PromptInjectionScannerConfig config_;
    std::vector<PatternRule> rules_;
    std::string last_error_;
    bool initialized_{false};
};

} // namespace llmshield::scanners
