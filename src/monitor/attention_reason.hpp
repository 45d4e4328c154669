#pragma once

#include <string>
#include <string_view>
#include <variant>

struct WaitingForInput {
    bool operator==(const WaitingForInput&) const = default;
};

struct ProcessStalled {
    bool operator==(const ProcessStalled&) const = default;
};

struct CustomReason {
    std::string message;
    bool operator==(const CustomReason&) const = default;
};

using AttentionReason = std::variant<WaitingForInput, ProcessStalled, CustomReason>;

// Human-readable text, e.g. "Waiting for input".
std::string describe(const AttentionReason& reason);

// Stable identifier for storage: "waiting_for_input", "process_stalled", "custom".
std::string_view reason_code(const AttentionReason& reason);
