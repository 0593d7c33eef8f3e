#pragma once

/**
 * @file toxicity_scanner.h
 * @brief 유해 콘텐츠 스캐너
 *
 * 폭력, 혐오, 괴롭힘, 자해, 성적 콘텐츠, 욕설을 키워드 규칙으로 탐지합니다.
 * 탐지된 엔티티 텍스트는 마스킹하지 않고 원문 그대로 보고합니다.
 */

#include "core/scanner.h"
#include "pattern_tables.h"

#include <string>
#include <unordered_set>
#include <vector>

namespace llmshield::scanners {

/**
 * @brief 유해성 카테고리
 */
enum class ToxicityCategory {
    Violence,
    Hate,
    Harassment,
    SelfHarm,
    Sexual,
    Profanity
};

[[nodiscard]] std::string toxicityCategoryToString(ToxicityCategory category);

/**
 * @brief 유해 콘텐츠 스캐너 설정
 */
struct ToxicityScannerConfig {
    std::vector<ToxicityCategory> categories{
        ToxicityCategory::Violence,
        ToxicityCategory::Hate,
        ToxicityCategory::Harassment,
        ToxicityCategory::SelfHarm
    };
    std::vector<std::string> custom_keywords;   ///< 추가 탐지 키워드 (profanity, medium)
    std::vector<std::string> allowed_keywords;  ///< 허용 목록 (대소문자 무시)
};

/**
 * @brief 유해 콘텐츠 스캐너
 */
class ToxicityScanner : public core::Scanner {
public:
    ToxicityScanner();
    ~ToxicityScanner() override;

    /**
     * @brief 초기화
     * @return 빈 사용자 정의 키워드가 있으면 false
     */
    bool initialize(const ToxicityScannerConfig& config = {});

    [[nodiscard]] std::string name() const override { return "toxicity"; }
    [[nodiscard]] core::ScanResult scan(const std::string& text) const override;
    [[nodiscard]] bool isInitialized() const override { return initialized_; }

    [[nodiscard]] const std::string& lastError() const { return last_error_; }
    [[nodiscard]] std::size_t ruleCount() const { return rules_.size(); }

private:
    ToxicityScannerConfig config_;
    std::vector<PatternRule> rules_;
    std::unordered_set<std::string> allowed_;
    std::string last_error_;
    bool initialized_{false};
};

} // namespace llmshield::scanners
