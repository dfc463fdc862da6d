#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace docstruct
{

// Base of every error raised by the structuring pipeline.
// stage() names the stage that failed ("input" for validation failures).
class PreprocessorError : public std::runtime_error
{
public:
    PreprocessorError(std::string stage, const std::string& message)
        : std::runtime_error(message)
        , stage_(std::move(stage))
    {
    }

    [[nodiscard]] const std::string& stage() const noexcept { return stage_; }

private:
    std::string stage_;
};

// No pages, or no spans on any page
class InvalidContentError : public PreprocessorError
{
public:
    explicit InvalidContentError(const std::string& message)
        : PreprocessorError("input", message)
    {
    }
};

class NormalizationError : public PreprocessorError
{
public:
    explicit NormalizationError(const std::string& message)
        : PreprocessorError("normalizer", message)
    {
    }
};

class NoiseRemovalError : public PreprocessorError
{
public:
    explicit NoiseRemovalError(const std::string& message)
        : PreprocessorError("noise_remover", message)
    {
    }
};

class SegmentationError : public PreprocessorError
{
public:
    explicit SegmentationError(const std::string& message)
        : PreprocessorError("segmenter", message)
    {
    }
};

class GroupingError : public PreprocessorError
{
public:
    explicit GroupingError(const std::string& message)
        : PreprocessorError("grouper", message)
    {
    }
};

} // namespace docstruct
