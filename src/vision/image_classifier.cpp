#include "vision/image_classifier.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/http_utils.hpp"

namespace matchwatch {

const char *const OllamaClassifier::kPrompt =
    "You are a visual referee for a professional VALORANT match.\n"
    "\n"
    "Classify exactly ONE label:\n"
    "- KILL\n"
    "- DEATH\n"
    "- ROUND_END\n"
    "- NO_EVENT\n"
    "\n"
    "Only output the label.";

VisualLabel parseLabel(const std::string &raw)
{
    std::string text = raw;
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    static const std::array<std::pair<const char *, VisualLabel>, 4> kLabels{{
        {"KILL", VisualLabel::Kill},
        {"DEATH", VisualLabel::Death},
        {"ROUND_END", VisualLabel::RoundEnd},
        {"NO_EVENT", VisualLabel::NoEvent},
    }};
    for (const auto &[name, label] : kLabels) {
        if (text.find(name) != std::string::npos) {
            return label;
        }
    }
    return VisualLabel::NoEvent;
}

OllamaClassifier::OllamaClassifier(ClassifierConfig config)
    : m_config(std::move(config))
{
}

std::string OllamaClassifier::classify(const QByteArray &jpeg)
{
    const nlohmann::json payload{
        {"model", m_config.model},
        {"prompt", kPrompt},
        {"images", nlohmann::json::array({jpeg.toBase64().toStdString()})},
        {"stream", false},
        {"options", {{"temperature", 0.0}, {"num_predict", 10}}}
    };

    HttpResponse response;
    try {
        response = postJson(m_config.url, QByteArray::fromStdString(payload.dump()), {},
                            kRequestTimeout);
    } catch (const std::runtime_error &ex) {
        throw ClassifierError(ex.what());
    }

    if (response.statusCode < 200 || response.statusCode >= 300) {
        throw ClassifierError("HTTP " + std::to_string(response.statusCode));
    }

    const auto parsed = nlohmann::json::parse(response.body.toStdString(), nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        throw ClassifierError("invalid JSON from classifier");
    }
    const auto it = parsed.find("response");
    if (it == parsed.end() || !it->is_string()) {
        return "NO_EVENT";
    }
    return it->get<std::string>();
}

} // namespace matchwatch
