#pragma once

#include <chrono>
#include <string>

#include <QByteArray>

#include "common/config.hpp"
#include "common/enums.hpp"

namespace matchwatch {

class ImageClassifier
{
public:
    virtual ~ImageClassifier() = default;

    // Raw model output for one JPEG image. Throws ClassifierError on request
    // failure or timeout.
    virtual std::string classify(const QByteArray &jpeg) = 0;
};

// Case-insensitive containment, checked as KILL, DEATH, ROUND_END, NO_EVENT.
// Anything else is NoEvent.
VisualLabel parseLabel(const std::string &raw);

/**
 * OllamaClassifier asks a local vision-language model for exactly one of the
 * four labels. Deterministic sampling and a short answer budget keep the
 * output parseable.
 */
class OllamaClassifier : public ImageClassifier
{
public:
    static constexpr std::chrono::milliseconds kRequestTimeout{5000};
    static const char *const kPrompt;

    explicit OllamaClassifier(ClassifierConfig config);

    std::string classify(const QByteArray &jpeg) override;

private:
    ClassifierConfig m_config;
};

} // namespace matchwatch
