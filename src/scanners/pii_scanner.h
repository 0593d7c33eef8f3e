#pragma once

/**
 * @file pii_scanner.h
 * @brief 개인 식별 정보(PII) 스캐너
 *
 * 이메일, 전화번호, 사회보장번호(SSN), 신용카드 번호, IP 주소, 여권/운전면허 번호를
 * 패턴으로 탐지하고, 유형별 검증(Luhn, SSN 지역 번호 등)으로 오탐을 줄입니다.
 */

#include "core/scanner.h"
#include "pattern_tables.h"

#include <string>
#include <vector>

namespace llmshield::scanners {

/**
 * @brief PII 유형
 */
enum class PiiType {
    Email,
    Phone,
    Ssn,
    CreditCard,
    IpAddress,
    Passport,
    DriversLicense
};

[[nodiscard]] std::string piiTypeToString(PiiType type);

/**
 * @brief PII 스캐너 설정
 */
struct PiiScannerConfig {
    /// 탐지할 PII 유형
    std::vector<PiiType> pii_types{PiiType::Email, PiiType::Phone, PiiType::Ssn, PiiType::CreditCard};
    bool redact{true};      ///< 엔티티 텍스트를 마스킹된 형태로 보고
};

/**
 * @brief PII 스캐너
 */
class PiiScanner : public core::Scanner {
public:
    PiiScanner();
    ~PiiScanner() override;

    /**
     * @brief 초기화 (활성화된 유형의 규칙 선택)
     * @return 성공 여부
     */
    bool initialize(const PiiScannerConfig& config = {});

    [[nodiscard]] std::string name() const override { return "pii"; }
    [[nodiscard]] core::ScanResult scan(const std::string& text) const override;
    [[nodiscard]] bool isInitialized() const override { return initialized_; }

    [[nodiscard]] std::size_t ruleCount() const { return rules_.size(); }

    /**
     * @brief 매칭 값 검증 (Luhn, SSN 지역 번호, 이메일 형식)
     * @param value 매칭된 원문
     * @param type 엔티티 유형 문자열 (email, ssn, credit-card ...)
     */
    [[nodiscard]] static bool validate(const std::string& value, const std::string& type);

    /**
     * @brief Luhn 체크섬 (숫자 이외 문자는 무시)
     */
    [[nodiscard]] static bool luhnCheck(const std::string& digits);

    /**
     * @brief 유형별 마스킹
     *
     * email: 로컬 파트 앞 2자 + "***@도메인", credit-card/ssn/phone: 마지막 4자리만 노출,
     * 그 외: "****"
     */
    [[nodiscard]] static std::string mask(const std::string& value, const std::string& type);

    /**
     * @brief 유형별 엔티티 신뢰도
     */
    [[nodiscard]] static double confidenceFor(const std::string& type);

private:
    PiiScannerConfig config_;
    std::vector<PatternRule> rules_;
    bool initialized_{false};
};

} // namespace llmshield::scanners
