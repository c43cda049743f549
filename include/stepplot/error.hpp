#pragma once

#include <stdexcept>
#include <string>

namespace stepplot
{

// Raised when caller-supplied data cannot be turned into a point sequence
// (mismatched lengths, NaN or infinite coordinates).
class InvalidInput : public std::invalid_argument
{
   public:
    explicit InvalidInput(const std::string& what) : std::invalid_argument(what) {}
};

}   // namespace stepplot
