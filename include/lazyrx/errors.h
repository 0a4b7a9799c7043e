#pragma once

// Name:      errors.h
// Copyright: LazyRX authors 2025

#include <lazyrx/main.h>

#include <stdexcept>
#include <string>

namespace lrx {

// Raised when a pattern that must compile does not.  This is the only exception thrown by the library; all other
// failures are reported as ERR codes.

class RegexError : public std::runtime_error {
   public:
      RegexError(ERR Code, const std::string &Pattern, const std::string &Detail);

      ERR code() const noexcept { return code_; }
      const std::string & pattern() const noexcept { return pattern_; }
      const std::string & detail() const noexcept { return detail_; }

   private:
      ERR code_;
      std::string pattern_;
      std::string detail_;
};

} // namespace lrx
