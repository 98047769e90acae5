/**
 * @file probe.cpp
 * @brief Накопитель вывода пробы
 */

#include "probe.hpp"

namespace hostdiag::core {

void ProbeOutput::append(std::string_view text) {
    text_.append(text);
}

void ProbeOutput::line(std::string_view text) {
    text_.append(text);
    text_.push_back('\n');
}

void ProbeOutput::addOutcome(const ChainOutcome& outcome) {
    text_.append(outcome.text);
    if (outcome.status == ChainStatus::Failed) {
        fail(outcome.error);
    }
}

void ProbeOutput::fail(std::string_view cause) {
    if (!error_.has_value()) {
        error_ = std::string(cause);
    } else {
        error_->append("; ");
        error_->append(cause);
    }
}

} // namespace hostdiag::core
