#include "policy/decision_renderer.hpp"

#include <sstream>
#include <vector>

namespace hookguard::policy {

using protocol::Decision;
using protocol::DecisionBasis;
using protocol::Verdict;

namespace {

constexpr std::size_t kBannerWidth = 70;

void write_section(std::ostringstream& out, const std::string& heading,
                   const std::vector<std::string>& lines,
                   const std::map<std::string, std::string>& context) {
    if (lines.empty()) {
        return;
    }
    out << heading << "\n";
    for (const auto& line : lines) {
        if (line.empty()) {
            out << "\n";
            continue;
        }
        out << "  " << expand_placeholders(line, context) << "\n";
    }
    out << "\n";
}

std::string render_message(const MessageTemplate& message, const Decision& decision) {
    const std::string banner(kBannerWidth, '=');
    const auto& context = decision.context;

    std::ostringstream out;
    out << "\n" << banner << "\n"
        << expand_placeholders(message.title, context) << "\n"
        << banner << "\n\n";

    if (!message.subject_label.empty()) {
        out << message.subject_label << ": "
            << expand_placeholders(message.subject_format, context) << "\n\n";
    }

    std::vector<std::string> reason;
    if (decision.matched_rule && !decision.matched_rule->explanation.empty()) {
        reason.push_back(decision.matched_rule->explanation);
    }
    reason.insert(reason.end(), message.reason.begin(), message.reason.end());
    write_section(out, "Reason:", reason, context);

    if (decision.basis == DecisionBasis::ExceptionRule) {
        std::vector<std::string> rationale;
        if (decision.exception_rule && !decision.exception_rule->explanation.empty()) {
            rationale.push_back(decision.exception_rule->explanation);
        }
        rationale.insert(rationale.end(), message.rationale.begin(),
                         message.rationale.end());
        write_section(out, "Override available because:", rationale, context);
    }

    write_section(out, "Remediation:", message.remediation, context);
    write_section(out, "Examples:", message.examples, context);
    out << banner << "\n";
    return out.str();
}

}  // namespace

std::string expand_placeholders(const std::string& line,
                                const std::map<std::string, std::string>& context) {
    std::string expanded;
    expanded.reserve(line.size());
    std::size_t pos = 0;
    while (pos < line.size()) {
        const auto open = line.find('{', pos);
        if (open == std::string::npos) {
            break;
        }
        const auto close = line.find('}', open + 1);
        if (close == std::string::npos) {
            break;
        }
        expanded.append(line, pos, open - pos);
        const auto it = context.find(line.substr(open + 1, close - open - 1));
        if (it != context.end()) {
            expanded += it->second;
        } else {
            expanded.append(line, open, close - open + 1);
        }
        pos = close + 1;
    }
    expanded.append(line, pos, std::string::npos);
    return expanded;
}

RenderedDecision render(const Decision& decision, const PolicyDomain& domain) {
    switch (decision.verdict) {
        case Verdict::Allow:
            return RenderedDecision{protocol::kExitAllow, ""};
        case Verdict::Warn:
        case Verdict::Block:
            break;
    }

    const MessageTemplate& message =
        decision.basis == DecisionBasis::ExceptionRule && domain.exception_message
            ? *domain.exception_message
            : domain.gated_message;

    RenderedDecision rendered;
    rendered.exit_code = decision.verdict == Verdict::Block ? protocol::kExitBlocked
                                                            : protocol::kExitAllow;
    rendered.text = render_message(message, decision);
    return rendered;
}

}  // namespace hookguard::policy
