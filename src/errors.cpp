#include "errors.hpp"

namespace vbios {

std::string SanityViolation::describe(Rule rule, size_t observed, size_t expected) {
    const std::string found = ", found " + std::to_string(observed);
    switch (rule) {
        case Rule::SingleNpds:
            return "Expected only one 'NPDS' marker between header and footer" + found;
        case Rule::ThreeNpde:
            return "Expected " + std::to_string(expected) +
                   " 'NPDE' markers between header and footer" + found +
                   " (possible vBIOS without UEFI support)";
        case Rule::TwoNpdeAfterNpds:
            return "Expected " + std::to_string(expected) +
                   " 'NPDE' markers after the 'NPDS' marker" + found;
    }
    return "Unknown sanity rule" + found;
}

} // namespace vbios
