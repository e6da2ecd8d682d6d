#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace reelcut {

/**
 * Base of all engine errors. what() carries the diagnostic message,
 * user_message() a sentence suitable for an end user.
 */
class HighlightError : public std::runtime_error {
  public:
    HighlightError(const std::string& message, std::string userMessage)
        : std::runtime_error(message), userMessage_(std::move(userMessage)) {}

    const std::string& user_message() const noexcept { return userMessage_; }

  private:
    std::string userMessage_;
};

// Configuration outside its documented domain. Raised before any processing.
class InvalidConfiguration : public HighlightError {
  public:
    explicit InvalidConfiguration(const std::string& message)
        : HighlightError(message, "Invalid settings: " + message) {}
};

// No usable signal for this video; a timeline of zeros would be meaningless.
class InsufficientSignal : public HighlightError {
  public:
    explicit InsufficientSignal(const std::string& message)
        : HighlightError(message, "Not enough audio or text to analyze this video.") {}
};

}  // namespace reelcut
