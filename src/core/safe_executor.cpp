/**
 * @file safe_executor.cpp
 * @brief Изолированный запуск одной пробы
 */

#include "safe_executor.hpp"
#include <exception>

namespace hostdiag::core {

model::ExecutionResult executeSafely(Probe& probe) {
    model::ExecutionResult result;
    result.probe_name = std::string(probe.name());
    result.title = std::string(probe.title());

    ProbeOutput out;
    try {
        probe.run(out);
    } catch (const std::exception& ex) {
        out.fail(ex.what());
    } catch (...) {
        out.fail("unknown error");
    }

    result.output_text = out.text();
    result.failed = out.failed();
    result.error_summary = out.error();
    return result;
}

} // namespace hostdiag::core
