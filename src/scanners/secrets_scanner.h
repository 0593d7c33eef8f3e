#pragma once

/**
 * @file secrets_scanner.h
 * @brief 비밀 값/자격 증명 스캐너
 *
 * 공급자 접두사가 붙은 API 키, PEM 개인 키 헤더, JWT 형태 토큰 등을 탐지합니다.
 * 패턴 자체가 충분히 구체적이므로 별도의 검증 단계는 없습니다.
 */

#include "core/scanner.h"
#include "pattern_tables.h"

#include <string>
#include <vector>

namespace llmshield::scanners {

/**
 * @brief 비밀 값 공급자 유형
 */
enum class SecretType {
    Aws,
    Github,
    Stripe,
    OpenAi,
    Anthropic,
    Slack,
    Google,
    Generic,
    PrivateKey,
    Jwt
};

[[nodiscard]] std::string secretTypeToString(SecretType type);

/**
 * @brief 사용자 정의 비밀 값 패턴
 */
struct CustomSecretPattern {
    std::string pattern;                                ///< 정규식 (ECMAScript)
    std::string label;                                  ///< 규칙 이름
    core::Severity severity{core::Severity::Medium};
    bool case_insensitive{false};
};

/**
 * @brief 비밀 값 스캐너 설정
 */
struct SecretsScannerConfig {
    /// 탐지할 공급자 유형 (비어 있으면 전체)
    std::vector<SecretType> secret_types;
    std::vector<CustomSecretPattern> custom_patterns;   ///< 추가 패턴
    bool redact{true};                                  ///< 엔티티 텍스트 마스킹
};

/**
 * @brief 비밀 값 스캐너
 */
class SecretsScanner : public core::Scanner {
public:
    SecretsScanner();
    ~SecretsScanner() override;

    /**
     * @brief 초기화
     * @return 사용자 정의 패턴이 컴파일되지 않으면 false (lastError() 참고)
     */
    bool initialize(const SecretsScannerConfig& config = {});

    [[nodiscard]] std::string name() const override { return "secrets"; }
    [[nodiscard]] core::ScanResult scan(const std::string& text) const override;
    [[nodiscard]] bool isInitialized() const override { return initialized_; }

    [[nodiscard]] const std::string& lastError() const { return last_error_; }
    [[nodiscard]] std::size_t ruleCount() const { return rules_.size(); }

    /**
     * @brief 비밀 값 마스킹 (8자 이하는 전체, 그 외 앞 4자 + "****" + 뒤 4자)
     */
    [[nodiscard]] static std::string mask(const std::string& secret);

private:
    SecretsScannerConfig config_;
    std::vector<PatternRule> rules_;
    std::string last_error_;
    bool initialized_{false};
};

} // namespace llmshield::scanners
