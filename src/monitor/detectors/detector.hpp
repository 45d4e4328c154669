#pragma once

#include "attention_reason.hpp"
#include "poll_context.hpp"
#include "task.hpp"

#include <optional>
#include <string_view>

// One attention heuristic. Implementations hold only fixed configuration,
// so a single instance may be checked from several threads at once.
// check() never throws; read failures yield std::nullopt.
class AttentionDetector {
public:
    virtual ~AttentionDetector() = default;
    virtual std::string_view name() const = 0;
    virtual std::optional<AttentionReason> check(const Task& task, const PollContext& ctx) const = 0;
};
