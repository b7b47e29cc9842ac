#pragma once
#include <stdexcept>
#include <string>

namespace Folio {
namespace Core {

// Programming-contract violations; never expected at runtime.
class ContractViolation : public std::logic_error {
public:
    explicit ContractViolation(const std::string& what) : std::logic_error(what) {
    }
};

class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(const std::string& what) : std::runtime_error(what) {
    }
};

class ProbeError : public std::runtime_error {
public:
    explicit ProbeError(const std::string& what) : std::runtime_error(what) {
    }
};

class RenderError : public std::runtime_error {
public:
    explicit RenderError(const std::string& what) : std::runtime_error(what) {
    }
};

}  // namespace Core
}  // namespace Folio
