/**
 * @file shield.cpp
 * @brief Shield 오케스트레이터 구현
 */

#include "shield.h"
#include "shield_builder.h"

#include "core/result_builder.h"
#include "scanners/pii_scanner.h"
#include "scanners/prompt_injection_scanner.h"
#include "scanners/secrets_scanner.h"
#include "scanners/toxicity_scanner.h"

#include <algorithm>
#include <chrono>
#include <future>
#include <iostream>
#include <set>
#include <system_error>
#include <tuple>

namespace llmshield::pipeline {

using core::ScanResult;
using core::ScannerPtr;

namespace {

/**
 * @brief 내장 스캐너 생성 + 초기화
 */
template <typename ScannerT, typename ConfigT>
ScannerPtr makeScanner(const ConfigT& config) {
    auto scanner = std::make_shared<ScannerT>();
    if (!scanner->initialize(config)) {
        std::cerr << "[Shield] 내장 스캐너 초기화 실패: " << scanner->name() << std::endl;
    }
    return scanner;
}

scanners::PiiScannerConfig standardPiiConfig() {
    scanners::PiiScannerConfig config;
    config.pii_types = {
        scanners::PiiType::Email,
        scanners::PiiType::Ssn,
        scanners::PiiType::CreditCard
    };
    return config;
}

std::string joinNames(const std::vector<ScannerOutcome>& outcomes) {
    std::string joined;
    for (const auto& outcome : outcomes) {
        if (!joined.empty()) joined += ',';
        joined += outcome.scanner;
    }
    return joined;
}

/**
 * @brief 비동기 작업 실행, 스레드 생성 실패 시 호출 스레드에서 지연 실행
 */
template <typename Fn>
std::future<ScanResult> launchTask(Fn&& task) {
    try {
        return std::async(std::launch::async, task);
    } catch (const std::system_error& e) {
        std::cerr << "[Shield] ⚠️ 작업 스레드 생성 실패, 순차 실행으로 전환: " << e.what() << std::endl;
        return std::async(std::launch::deferred, task);
    }
}

} // namespace

Shield::Shield(
    ShieldConfig config,
    std::vector<ScannerPtr> input_scanners,
    std::vector<ScannerPtr> output_scanners
)
    : config_(std::move(config))
    , input_scanners_(std::move(input_scanners))
    , output_scanners_(std::move(output_scanners)) {}

Shield::~Shield() = default;

// ============================================================
// 프리셋
// ============================================================

std::unique_ptr<Shield> Shield::strict() {
    return ShieldBuilder()
        .withPresetName("strict")
        .withShortCircuit(0.7)
        .withParallelExecution(false)
        .addInputScanner(makeScanner<scanners::PromptInjectionScanner>(scanners::PromptInjectionScannerConfig{}))
        .addInputScanner(makeScanner<scanners::SecretsScanner>(scanners::SecretsScannerConfig{}))
        .addInputScanner(makeScanner<scanners::PiiScanner>(scanners::PiiScannerConfig{}))
        .addInputScanner(makeScanner<scanners::ToxicityScanner>(scanners::ToxicityScannerConfig{}))
        .addOutputScanner(makeScanner<scanners::SecretsScanner>(scanners::SecretsScannerConfig{}))
        .addOutputScanner(makeScanner<scanners::PiiScanner>(scanners::PiiScannerConfig{}))
        .build();
}

std::unique_ptr<Shield> Shield::standard() {
    return ShieldBuilder()
        .withPresetName("standard")
        .withShortCircuit(0.9)
        .withParallelExecution(true)
        .withMaxConcurrent(4)
        .addInputScanner(makeScanner<scanners::PromptInjectionScanner>(scanners::PromptInjectionScannerConfig{}))
        .addInputScanner(makeScanner<scanners::SecretsScanner>(scanners::SecretsScannerConfig{}))
        .addInputScanner(makeScanner<scanners::PiiScanner>(standardPiiConfig()))
        .addOutputScanner(makeScanner<scanners::SecretsScanner>(scanners::SecretsScannerConfig{}))
        .addOutputScanner(makeScanner<scanners::PiiScanner>(standardPiiConfig()))
        .build();
}

std::unique_ptr<Shield> Shield::permissive() {
    scanners::SecretsScannerConfig secrets;
    secrets.secret_types = {scanners::SecretType::Aws, scanners::SecretType::PrivateKey};

    return ShieldBuilder()
        .withPresetName("permissive")
        .withShortCircuit(1.0)
        .withParallelExecution(true)
        .withMaxConcurrent(4)
        .addInputScanner(makeScanner<scanners::SecretsScanner>(secrets))
        .build();
}

ShieldBuilder Shield::builder() {
    return ShieldBuilder();
}

// ============================================================
// 스캔
// ============================================================

ScanResult Shield::scanPrompt(const std::string& text, const core::ScanOptions& options) const {
    return runScanners(text, input_scanners_, options);
}

ScanResult Shield::scanOutput(const std::string& text, const core::ScanOptions& options) const {
    return runScanners(text, output_scanners_, options);
}

PromptAndOutputResult Shield::scanPromptAndOutput(
    const std::string& prompt,
    const std::string& output,
    const core::ScanOptions& options
) const {
    PromptAndOutputResult result;
    result.prompt_result = scanPrompt(prompt, options);

    // 위험한 프롬프트라면 출력 검사 생략
    if (!result.prompt_result.is_valid &&
        result.prompt_result.risk_score >= config_.short_circuit_threshold) {
        core::RiskFactor skipped;
        skipped.category = core::Category::PromptInjection;
        skipped.description = "Output scan skipped due to invalid prompt";
        skipped.severity = core::Severity::None;
        skipped.confidence = 1.0;

        ScanResult& out = result.output_result;
        out.is_valid = false;
        out.risk_score = 0.0;
        out.sanitized_text.clear();
        out.risk_factors.push_back(std::move(skipped));
        out.severity = core::Severity::None;
        out.metadata["skipped"] = "true";
        out.duration_ms = 0.0;

        std::cout << "[Shield] 출력 검사 생략 (프롬프트 위험 점수 "
                  << result.prompt_result.risk_score << ")" << std::endl;
        return result;
    }

    result.output_result = scanOutput(output, options);
    return result;
}

std::vector<ScanResult> Shield::scanBatch(
    const std::vector<std::string>& texts,
    const core::ScanOptions& options
) const {
    return runBatch(texts, input_scanners_, options);
}

std::vector<ScanResult> Shield::scanOutputBatch(
    const std::vector<std::string>& texts,
    const core::ScanOptions& options
) const {
    return runBatch(texts, output_scanners_, options);
}

// ============================================================
// 실행
// ============================================================

ScanResult Shield::runScanners(
    const std::string& text,
    const std::vector<ScannerPtr>& scanners,
    const core::ScanOptions& options
) const {
    const std::string processed = options.max_length.has_value()
        ? truncateText(text, options.max_length.value())
        : text;

    if (scanners.empty()) {
        return core::makeValidResult(processed, 0.0);
    }

    auto started = std::chrono::steady_clock::now();
    total_scanned_.fetch_add(1, std::memory_order_relaxed);

    bool short_circuited = false;
    auto outcomes = config_.parallel_execution
        ? runParallel(processed, scanners, short_circuited)
        : runSequential(processed, scanners, short_circuited);

    std::vector<ScanResult> results;
    results.reserve(outcomes.size());
    for (const auto& outcome : outcomes) {
        results.push_back(outcome.result);
    }

    ScanResult merged = mergeResults(processed, results);
    merged.duration_ms = core::elapsedMs(started);
    merged.metadata["scanners_run"] = joinNames(outcomes);
    merged.metadata["short_circuited"] = short_circuited ? "true" : "false";
    merged.metadata["scan_time_ms"] = std::to_string(merged.duration_ms);

    if (short_circuited) {
        total_short_circuited_.fetch_add(1, std::memory_order_relaxed);
    }
    if (!merged.is_valid) {
        total_threats_.fetch_add(1, std::memory_order_relaxed);
    }

    // 심각한 위협은 콘솔에 출력
    if (merged.severity >= core::Severity::High) {
        std::cout << "[Shield] ⚠️ " << merged.severityString() << " 위협 감지: 위험 요소 "
                  << merged.risk_factors.size() << "개, 위험 점수 " << merged.risk_score
                  << " (프리셋: " << config_.preset << ")" << std::endl;
    }

    return merged;
}

std::vector<ScannerOutcome> Shield::runSequential(
    const std::string& text,
    const std::vector<ScannerPtr>& scanners,
    bool& short_circuited
) const {
    std::vector<ScannerOutcome> outcomes;
    short_circuited = false;

    for (std::size_t i = 0; i < scanners.size(); ++i) {
        const auto& scanner = scanners[i];
        ScanResult result;
        try {
            result = scanner->scan(text);
        } catch (const std::exception& e) {
            std::cerr << "[Shield] 스캐너 '" << scanner->name() << "' 오류: " << e.what() << std::endl;
            continue;
        }

        const double risk = result.risk_score;
        outcomes.push_back({scanner->name(), std::move(result)});

        if (risk >= config_.short_circuit_threshold) {
            short_circuited = i + 1 < scanners.size();
            if (short_circuited) {
                std::cout << "[Shield] 단락 평가: '" << scanner->name() << "' 위험 점수 " << risk
                          << " >= " << config_.short_circuit_threshold << ", 남은 스캐너 "
                          << scanners.size() - i - 1 << "개 생략" << std::endl;
            }
            break;
        }
    }

    return outcomes;
}

std::vector<ScannerOutcome> Shield::runParallel(
    const std::string& text,
    const std::vector<ScannerPtr>& scanners,
    bool& short_circuited
) const {
    std::vector<ScannerOutcome> outcomes;
    short_circuited = false;

    const auto batch_size = static_cast<std::size_t>(std::max(1, config_.max_concurrent));

    for (std::size_t begin = 0; begin < scanners.size(); begin += batch_size) {
        const std::size_t end = std::min(scanners.size(), begin + batch_size);

        // 배치 내 스캐너 동시 실행
        std::vector<std::future<ScanResult>> futures;
        futures.reserve(end - begin);
        for (std::size_t i = begin; i < end; ++i) {
            const ScannerPtr scanner = scanners[i];
            futures.push_back(launchTask([scanner, &text]() {
                return scanner->scan(text);
            }));
        }

        bool has_result = false;
        double batch_max = 0.0;
        for (std::size_t i = begin; i < end; ++i) {
            try {
                ScanResult result = futures[i - begin].get();
                batch_max = has_result ? std::max(batch_max, result.risk_score) : result.risk_score;
                has_result = true;
                outcomes.push_back({scanners[i]->name(), std::move(result)});
            } catch (const std::exception& e) {
                std::cerr << "[Shield] 스캐너 '" << scanners[i]->name() << "' 오류: "
                          << e.what() << std::endl;
            }
        }

        if (has_result && batch_max >= config_.short_circuit_threshold) {
            short_circuited = end < scanners.size();
            if (short_circuited) {
                std::cout << "[Shield] 단락 평가: 배치 최대 위험 점수 " << batch_max
                          << " >= " << config_.short_circuit_threshold << ", 남은 스캐너 "
                          << scanners.size() - end << "개 생략" << std::endl;
            }
            break;
        }
    }

    return outcomes;
}

std::vector<ScanResult> Shield::runBatch(
    const std::vector<std::string>& texts,
    const std::vector<ScannerPtr>& scanners,
    const core::ScanOptions& options
) const {
    std::vector<ScanResult> results;
    results.reserve(texts.size());

    if (!config_.parallel_execution) {
        for (const auto& text : texts) {
            results.push_back(runScanners(text, scanners, options));
        }
        return results;
    }

    // 동시에 처리하는 텍스트는 max_concurrent 개로 제한, 입력 순서대로 수집
    const auto chunk_size = static_cast<std::size_t>(std::max(1, config_.max_concurrent));
    for (std::size_t begin = 0; begin < texts.size(); begin += chunk_size) {
        const std::size_t end = std::min(texts.size(), begin + chunk_size);

        std::vector<std::future<ScanResult>> futures;
        futures.reserve(end - begin);
        for (std::size_t i = begin; i < end; ++i) {
            const std::string& text = texts[i];
            futures.push_back(launchTask([this, &text, &scanners, &options]() {
                return runScanners(text, scanners, options);
            }));
        }
        for (auto& future : futures) {
            results.push_back(future.get());
        }
    }
    return results;
}

// ============================================================
// 병합
// ============================================================

ScanResult Shield::mergeResults(
    const std::string& original_text,
    const std::vector<ScanResult>& results
) {
    if (results.empty()) {
        return core::makeValidResult(original_text, 0.0);
    }

    std::vector<core::Entity> all_entities;
    std::vector<core::RiskFactor> all_risk_factors;
    double max_risk = 0.0;
    core::Severity max_severity = core::Severity::None;

    for (const auto& result : results) {
        all_entities.insert(all_entities.end(), result.entities.begin(), result.entities.end());
        all_risk_factors.insert(all_risk_factors.end(),
                                result.risk_factors.begin(), result.risk_factors.end());
        max_risk = std::max(max_risk, result.risk_score);
        max_severity = std::max(max_severity, result.severity);
    }

    // 원문을 변경한 마지막 스캐너의 마스킹 결과를 채택
    std::string sanitized = original_text;
    for (const auto& result : results) {
        if (result.sanitized_text != original_text) {
            sanitized = result.sanitized_text;
        }
    }

    ScanResult merged;
    merged.is_valid = all_risk_factors.empty();
    merged.risk_score = max_risk;
    merged.sanitized_text = std::move(sanitized);
    merged.entities = deduplicateEntities(all_entities);
    merged.risk_factors = std::move(all_risk_factors);
    merged.severity = max_severity;
    merged.duration_ms = 0.0;
    return merged;
}

std::vector<core::Entity> Shield::deduplicateEntities(const std::vector<core::Entity>& entities) {
    std::set<std::tuple<std::size_t, std::size_t, std::string>> seen;
    std::vector<core::Entity> unique;
    unique.reserve(entities.size());

    for (const auto& entity : entities) {
        auto key = std::make_tuple(entity.start, entity.end, entity.entity_type);
        if (seen.insert(key).second) {
            unique.push_back(entity);
        }
    }
    return unique;
}

// ============================================================
// 조회
// ============================================================

std::vector<std::string> Shield::inputScannerNames() const {
    std::vector<std::string> names;
    for (const auto& scanner : input_scanners_) names.push_back(scanner->name());
    return names;
}

std::vector<std::string> Shield::outputScannerNames() const {
    std::vector<std::string> names;
    for (const auto& scanner : output_scanners_) names.push_back(scanner->name());
    return names;
}

std::string truncateText(const std::string& text, std::size_t max_length) {
    if (text.size() <= max_length) return text;

    std::size_t cut = max_length;
    // UTF-8 연속 바이트(10xxxxxx) 위치라면 문자 시작까지 되돌림
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return text.substr(0, cut);
}

} // namespace llmshield::pipeline
