#include "daemon/visual_event_journal.hpp"

#include <QDebug>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace matchwatch {

VisualEventJournal::VisualEventJournal(std::size_t capacity)
    : m_visualEvents(capacity)
{
}

void VisualEventJournal::publishTacticalEvent(const TacticalEvent &event)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_tacticalPublished;
    }
    qInfo().noquote() << "Matchwatch: tactical event" << QString::fromStdString(event.eventType)
                      << "-" << QString::fromStdString(event.description);
}

void VisualEventJournal::publishVisualEvent(const VisualEvent &event)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_visualEvents.push(event);
    }

    const QString label = QString::fromStdString(toVisualLabelString(event.label));
    const nlohmann::json context{{"label", label.toStdString()}, {"detail", event.detail}};

    switch (event.label) {
    case VisualLabel::Kill:
    case VisualLabel::Death:
    case VisualLabel::RoundEnd:
        qInfo().noquote() << "Matchwatch: detected" << label;
        MWLOG_INFO(QStringLiteral("VisualEventJournal"),
                   QStringLiteral("publishVisualEvent"),
                   QStringLiteral("visual_event"),
                   QStringLiteral("classifier_label"),
                   QStringLiteral("debounced"),
                   logging::defaultWho(),
                   QString(),
                   context);
        break;
    case VisualLabel::Error:
        MWLOG_WARN(QStringLiteral("VisualEventJournal"),
                   QStringLiteral("publishVisualEvent"),
                   QStringLiteral("visual_event"),
                   QStringLiteral("classifier_error"),
                   QStringLiteral("liveness"),
                   logging::defaultWho(),
                   QString(),
                   context);
        break;
    case VisualLabel::NoEvent:
        MWLOG_DEBUG(QStringLiteral("VisualEventJournal"),
                    QStringLiteral("publishVisualEvent"),
                    QStringLiteral("visual_event"),
                    QStringLiteral("classifier_label"),
                    QStringLiteral("liveness"),
                    logging::defaultWho(),
                    QString(),
                    context);
        break;
    }
}

std::vector<VisualEvent> VisualEventJournal::recentVisualEvents(std::size_t limit) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_visualEvents.newest(limit);
}

std::size_t VisualEventJournal::tacticalEventsPublished() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tacticalPublished;
}

} // namespace matchwatch
