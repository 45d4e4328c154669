#include "attention_reason.hpp"

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

std::string describe(const AttentionReason& reason) {
    return std::visit(overloaded{
        [](const WaitingForInput&) { return std::string("Waiting for input"); },
        [](const ProcessStalled&) { return std::string("Process stalled (no activity)"); },
        [](const CustomReason& c) { return c.message; },
    }, reason);
}

std::string_view reason_code(const AttentionReason& reason) {
    return std::visit(overloaded{
        [](const WaitingForInput&) { return std::string_view("waiting_for_input"); },
        [](const ProcessStalled&) { return std::string_view("process_stalled"); },
        [](const CustomReason&) { return std::string_view("custom"); },
    }, reason);
}
