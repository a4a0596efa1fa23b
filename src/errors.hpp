#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

namespace vbios {

class RomError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Malformed hex text
class DecodeError : public RomError {
public:
    using RomError::RomError;
};

class HeaderNotFound : public RomError {
public:
    HeaderNotFound() : RomError("Couldn't find the ROM header!") {}
    using RomError::RomError;
};

class FooterNotFound : public RomError {
public:
    FooterNotFound() : RomError("Couldn't find the ROM footer!") {}
    using RomError::RomError;
};

// Raised by the command line driver only, the core never touches files
class IOError : public RomError {
public:
    using RomError::RomError;
};

class SanityViolation : public RomError {
public:
    enum class Rule {
        SingleNpds,
        ThreeNpde,
        TwoNpdeAfterNpds,
    };

    SanityViolation(Rule rule, size_t observed, size_t expected)
        : RomError(describe(rule, observed, expected)),
          rule_(rule), observed_(observed), expected_(expected) {}

    Rule rule() const { return rule_; }
    size_t observed() const { return observed_; }
    size_t expected() const { return expected_; }

private:
    static std::string describe(Rule rule, size_t observed, size_t expected);

    Rule rule_;
    size_t observed_;
    size_t expected_;
};

} // namespace vbios
