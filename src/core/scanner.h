#pragma once

/**
 * @file scanner.h
 * @brief 스캐너 인터페이스
 *
 * 모든 카테고리 탐지기(PII, Secrets, Toxicity, PromptInjection)와
 * 사용자 정의 스캐너가 구현하는 다형 계약입니다.
 */

#include "types.h"

#include <memory>
#include <string>

namespace llmshield::core {

/**
 * @brief 스캐너 추상 클래스
 *
 * scan()은 입력 텍스트와 스캐너 자신의 불변 설정에만 의존하는 순수 함수여야 하며,
 * 여러 스레드에서 동시에 호출될 수 있습니다.
 */
class Scanner {
public:
    virtual ~Scanner() = default;

    /**
     * @brief 안정적인 스캐너 이름 (pii, secrets, toxicity, prompt-injection ...)
     */
    [[nodiscard]] virtual std::string name() const = 0;

    /**
     * @brief 텍스트 스캔
     * @param text 검사할 텍스트
     * @return 스캔 결과 (탐지가 없으면 유효한 결과)
     */
    [[nodiscard]] virtual ScanResult scan(const std::string& text) const = 0;

    /**
     * @brief 스캔 가능한 상태인지 (initialize 성공 여부)
     */
    [[nodiscard]] virtual bool isInitialized() const { return true; }
};

using ScannerPtr = std::shared_ptr<const Scanner>;

} // namespace llmshield::core
