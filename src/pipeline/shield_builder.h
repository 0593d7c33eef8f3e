#pragma once

/**
 * @file shield_builder.h
 * @brief 사용자 정의 Shield 파이프라인 빌더
 */

#include "shield.h"

#include <memory>
#include <string>
#include <vector>

namespace llmshield::pipeline {

/**
 * @brief Shield 빌더
 *
 * 입력/출력 스캐너와 정책을 누적한 뒤 build()로 불변 Shield를 생성합니다.
 * 기본값: 병렬 실행, 최대 동시 4개, 단락 임계값 0.9
 */
class ShieldBuilder {
public:
    ShieldBuilder();

    ShieldBuilder& addInputScanner(core::ScannerPtr scanner);
    ShieldBuilder& addOutputScanner(core::ScannerPtr scanner);
    ShieldBuilder& withShortCircuit(double threshold);
    ShieldBuilder& withParallelExecution(bool enabled);
    ShieldBuilder& withMaxConcurrent(int max_concurrent);
    ShieldBuilder& withPresetName(const std::string& preset);

    /**
     * @brief Shield 생성
     * @return 설정이 잘못되었으면 nullptr (lastError() 참고)
     */
    [[nodiscard]] std::unique_ptr<Shield> build();

    [[nodiscard]] const std::string& lastError() const { return last_error_; }

private:
    /**
     * @brief 설정 검증 (임계값 범위, 동시성 한도, 스캐너 초기화 여부)
     */
    [[nodiscard]] bool validate();

    ShieldConfig config_;
    std::vector<core::ScannerPtr> input_scanners_;
    std::vector<core::ScannerPtr> output_scanners_;
    std::string last_error_;
};

} // namespace llmshield::pipeline
