#pragma once

/**
 * @file shield.h
 * @brief Shield 오케스트레이터 (스캔 파이프라인 코디네이터)
 *
 * 여러 스캐너를 하나의 입력에 적용하고 결과를 단일 판정으로 병합합니다.
 * 순차/병렬 실행, 단락 평가(short-circuit) 임계값, 엔티티 중복 제거,
 * 프리셋(strict, standard, permissive)을 제공합니다.
 */

#include "core/scanner.h"
#include "core/types.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace llmshield::pipeline {

class ShieldBuilder;

/**
 * @brief 파이프라인 정책
 */
struct ShieldConfig {
    std::string preset{"custom"};           ///< 프리셋 이름
    double short_circuit_threshold{0.9};    ///< 이 위험 점수 이상이면 남은 스캐너 생략
    bool parallel_execution{true};          ///< 배치 단위 병렬 실행
    int max_concurrent{4};                  ///< 배치당 최대 동시 스캐너 수 (일괄 스캔 시 동시 텍스트 수)
};

/**
 * @brief scanPromptAndOutput 결과
 */
struct PromptAndOutputResult {
    core::ScanResult prompt_result;
    core::ScanResult output_result;
};

/**
 * @brief 스캐너 실행 결과 (스캐너 이름 포함)
 */
struct ScannerOutcome {
    std::string scanner;
    core::ScanResult result;
};

/**
 * @brief Shield 오케스트레이터
 *
 * 프리셋 또는 ShieldBuilder로만 생성되며 생성 후 설정과 스캐너 목록은 변경되지 않습니다.
 * 모든 scan 메서드는 const 이며 여러 스레드에서 동시에 호출할 수 있습니다.
 */
class Shield {
public:
    Shield(const Shield&) = delete;
    Shield& operator=(const Shield&) = delete;
    ~Shield();

    // ============================
    // 프리셋
    // ============================

    /**
     * @brief 엄격 모드 (금융/의료 등 규제 환경)
     *
     * 임계값 0.7, 순차 실행. 입력: 인젝션/비밀 값/PII/유해성, 출력: 비밀 값/PII
     */
    [[nodiscard]] static std::unique_ptr<Shield> strict();

    /**
     * @brief 표준 모드 (권장)
     *
     * 임계값 0.9, 병렬 실행(최대 4). PII는 email/ssn/credit-card 만 탐지
     */
    [[nodiscard]] static std::unique_ptr<Shield> standard();

    /**
     * @brief 허용 모드 (개발/테스트용)
     *
     * 임계값 1.0, 병렬 실행. 입력: AWS/개인 키만 탐지, 출력 스캐너 없음
     */
    [[nodiscard]] static std::unique_ptr<Shield> permissive();

    [[nodiscard]] static ShieldBuilder builder();

    // ============================
    // 스캔
    // ============================

    /**
     * @brief LLM으로 보내기 전 프롬프트 검사
     */
    [[nodiscard]] core::ScanResult scanPrompt(
        const std::string& text,
        const core::ScanOptions& options = {}
    ) const;

    /**
     * @brief 사용자에게 반환하기 전 LLM 출력 검사
     */
    [[nodiscard]] core::ScanResult scanOutput(
        const std::string& text,
        const core::ScanOptions& options = {}
    ) const;

    /**
     * @brief 프롬프트와 출력을 순서대로 검사
     *
     * 프롬프트가 무효이고 위험 점수가 임계값 이상이면 출력 검사를 생략하고
     * skipped=true 메타데이터가 붙은 결과를 대신 반환합니다.
     */
    [[nodiscard]] PromptAndOutputResult scanPromptAndOutput(
        const std::string& prompt,
        const std::string& output,
        const core::ScanOptions& options = {}
    ) const;

    /**
     * @brief 여러 프롬프트 일괄 검사 (입력 순서 유지)
     */
    [[nodiscard]] std::vector<core::ScanResult> scanBatch(
        const std::vector<std::string>& texts,
        const core::ScanOptions& options = {}
    ) const;

    /**
     * @brief 여러 출력 일괄 검사 (입력 순서 유지)
     */
    [[nodiscard]] std::vector<core::ScanResult> scanOutputBatch(
        const std::vector<std::string>& texts,
        const core::ScanOptions& options = {}
    ) const;

    /**
     * @brief 스캐너별 결과 병합
     *
     * 위험 점수와 심각도는 최댓값, 엔티티는 (start, end, entity_type) 기준 중복 제거,
     * sanitized_text 는 원문을 변경한 마지막 스캐너의 결과를 사용합니다.
     */
    [[nodiscard]] static core::ScanResult mergeResults(
        const std::string& original_text,
        const std::vector<core::ScanResult>& results
    );

    /**
     * @brief 엔티티 중복 제거 (먼저 나온 항목 유지)
     */
    [[nodiscard]] static std::vector<core::Entity> deduplicateEntities(
        const std::vector<core::Entity>& entities
    );

    // ============================
    // 조회
    // ============================

    [[nodiscard]] const ShieldConfig& config() const { return config_; }
    [[nodiscard]] const std::string& presetName() const { return config_.preset; }
    [[nodiscard]] std::size_t inputScannerCount() const { return input_scanners_.size(); }
    [[nodiscard]] std::size_t outputScannerCount() const { return output_scanners_.size(); }
    [[nodiscard]] std::vector<std::string> inputScannerNames() const;
    [[nodiscard]] std::vector<std::string> outputScannerNames() const;

    // ============================
    // 통계
    // ============================

    [[nodiscard]] uint64_t totalScanned() const { return total_scanned_.load(); }
    [[nodiscard]] uint64_t totalThreatsDetected() const { return total_threats_.load(); }
    [[nodiscard]] uint64_t totalShortCircuited() const { return total_short_circuited_.load(); }

private:
    friend class ShieldBuilder;

    Shield(
        ShieldConfig config,
        std::vector<core::ScannerPtr> input_scanners,
        std::vector<core::ScannerPtr> output_scanners
    );

    /**
     * @brief 스캐너 집합 실행 후 병합
     */
    [[nodiscard]] core::ScanResult runScanners(
        const std::string& text,
        const std::vector<core::ScannerPtr>& scanners,
        const core::ScanOptions& options
    ) const;

    /**
     * @brief 목록 순서대로 실행, 임계값 도달 시 중단
     */
    [[nodiscard]] std::vector<ScannerOutcome> runSequential(
        const std::string& text,
        const std::vector<core::ScannerPtr>& scanners,
        bool& short_circuited
    ) const;

    /**
     * @brief max_concurrent 크기의 배치 단위로 병렬 실행, 배치 최대 점수가 임계값 이상이면 중단
     */
    [[nodiscard]] std::vector<ScannerOutcome> runParallel(
        const std::string& text,
        const std::vector<core::ScannerPtr>& scanners,
        bool& short_circuited
    ) const;

    /**
     * @brief 배치 단위 텍스트 병렬/순차 스캔
     *
     * 병렬 모드에서는 max_concurrent 개씩 묶어 동시에 스캔합니다.
     */
    [[nodiscard]] std::vector<core::ScanResult> runBatch(
        const std::vector<std::string>& texts,
        const std::vector<core::ScannerPtr>& scanners,
        const core::ScanOptions& options
    ) const;

    ShieldConfig config_;
    std::vector<core::ScannerPtr> input_scanners_;
    std::vector<core::ScannerPtr> output_scanners_;

    // 통계
    mutable std::atomic<uint64_t> total_scanned_{0};
    mutable std::atomic<uint64_t> total_threats_{0};
    mutable std::atomic<uint64_t> total_short_circuited_{0};
};

/**
 * @brief 입력 길이를 max_length 이하로 자르기 (UTF-8 문자 중간에서 자르지 않음)
 */
[[nodiscard]] std::string truncateText(const std::string& text, std::size_t max_length);

} // namespace llmshield::pipeline
