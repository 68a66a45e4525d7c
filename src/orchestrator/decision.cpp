// src/orchestrator/decision.cpp

#include "lifecycle_ngin/orchestrator/decision.hpp"

namespace lifecycle_ngin {

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

}  // namespace

std::string decision_type(const Decision& decision) {
    return std::visit(overloaded{[](const HoldDecision&) { return std::string("hold"); },
                                 [](const AddDecision&) { return std::string("add"); },
                                 [](const TrimDecision&) { return std::string("trim"); },
                                 [](const ExitDecision&) { return std::string("exit"); }},
                      decision);
}

double decision_size(const Decision& decision) {
    return std::visit(overloaded{[](const HoldDecision&) { return 0.0; },
                                 [](const AddDecision& d) { return d.size_fraction; },
                                 [](const TrimDecision& d) { return d.size_fraction; },
                                 [](const ExitDecision&) { return 1.0; }},
                      decision);
}

std::string decision_reason(const Decision& decision) {
    return std::visit(
        overloaded{[](const HoldDecision& d) { return d.reason; },
                   [](const AddDecision& d) { return entry_kind_to_string(d.entry_kind); },
                   [](const TrimDecision&) { return std::string("trim"); },
                   [](const ExitDecision& d) { return d.reason; }},
        decision);
}

}  // namespace lifecycle_ngin
