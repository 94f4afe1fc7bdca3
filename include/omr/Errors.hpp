#ifndef OMR_ERRORS_HPP
#define OMR_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace omr {

class OmrError : public std::runtime_error {
public:
    explicit OmrError(const std::string& message)
        : std::runtime_error(message) {}
};

// Image is empty, could not be decoded or has an unsupported format.
class ImageLoadError : public OmrError {
public:
    explicit ImageLoadError(const std::string& message)
        : OmrError(message) {}
};

// Scoring against a key with no questions.
class EmptyAnswerKeyError : public OmrError {
public:
    EmptyAnswerKeyError()
        : OmrError("answer key is empty, nothing to score") {}
};

// Invalid detector configuration or answer key content.
class ConfigError : public OmrError {
public:
    explicit ConfigError(const std::string& message)
        : OmrError(message) {}
};

}

#endif
