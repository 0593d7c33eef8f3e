/**
 * @file shield_builder.cpp
 * @brief Shield 빌더 구현
 */

#include "shield_builder.h"

#include <iostream>

namespace llmshield::pipeline {

ShieldBuilder::ShieldBuilder() {
    config_.preset = "custom";
    config_.short_circuit_threshold = 0.9;
    config_.parallel_execution = true;
    config_.max_concurrent = 4;
}

ShieldBuilder& ShieldBuilder::addInputScanner(core::ScannerPtr scanner) {
    input_scanners_.push_back(std::move(scanner));
    return *this;
}

ShieldBuilder& ShieldBuilder::addOutputScanner(core::ScannerPtr scanner) {
    output_scanners_.push_back(std::move(scanner));
    return *this;
}

ShieldBuilder& ShieldBuilder::withShortCircuit(double threshold) {
    config_.short_circuit_threshold = threshold;
    return *this;
}

ShieldBuilder& ShieldBuilder::withParallelExecution(bool enabled) {
    config_.parallel_execution = enabled;
    return *this;
}

ShieldBuilder& ShieldBuilder::withMaxConcurrent(int max_concurrent) {
    config_.max_concurrent = max_concurrent;
    return *this;
}

ShieldBuilder& ShieldBuilder::withPresetName(const std::string& preset) {
    config_.preset = preset;
    return *this;
}

std::unique_ptr<Shield> ShieldBuilder::build() {
    if (!validate()) {
        std::cerr << "[ShieldBuilder] 생성 실패: " << last_error_ << std::endl;
        return nullptr;
    }

    last_error_.clear();
    return std::unique_ptr<Shield>(new Shield(config_, input_scanners_, output_scanners_));
}

bool ShieldBuilder::validate() {
    const double threshold = config_.short_circuit_threshold;
    // NaN 도 여기서 걸러짐
    if (!(threshold >= 0.0 && threshold <= 1.0)) {
        last_error_ = "단락 임계값은 [0, 1] 범위여야 합니다: " + std::to_string(threshold);
        return false;
    }

    if (config_.max_concurrent < 1) {
        last_error_ = "최대 동시 스캐너 수는 1 이상이어야 합니다: "
                    + std::to_string(config_.max_concurrent);
        return false;
    }

    auto check_scanners = [this](const std::vector<core::ScannerPtr>& scanners,
                                 const char* role) {
        for (std::size_t i = 0; i < scanners.size(); ++i) {
            if (!scanners[i]) {
                last_error_ = std::string(role) + " 스캐너 #" + std::to_string(i) + " 가 null 입니다";
                return false;
            }
            if (!scanners[i]->isInitialized()) {
                last_error_ = std::string(role) + " 스캐너 '" + scanners[i]->name()
                            + "' 가 초기화되지 않았습니다";
                return false;
            }
        }
        return true;
    };

    return check_scanners(input_scanners_, "입력") && check_scanners(output_scanners_, "출력");
}

} // namespace llmshield::pipeline
