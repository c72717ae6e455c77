#include "MockInputDriver.h"

namespace {

QString buttonName(Hawk::MouseButton button)
{
    switch (button) {
    case Hawk::MouseButton::Left:
        return QStringLiteral("left");
    case Hawk::MouseButton::Middle:
        return QStringLiteral("middle");
    case Hawk::MouseButton::Right:
        return QStringLiteral("right");
    }
    return QString();
}

QString pointText(const QPoint& point)
{
    return QStringLiteral("%1,%2").arg(point.x()).arg(point.y());
}

} // namespace

bool MockInputDriver::record(const QString& call, QString* errorMessage)
{
    m_calls.append(call);
    if (!m_failure.isEmpty()) {
        if (errorMessage) {
            *errorMessage = m_failure;
        }
        return false;
    }
    return true;
}

bool MockInputDriver::moveTo(const QPoint& point, QString* errorMessage)
{
    m_lastPoint = point;
    return record(QStringLiteral("move %1").arg(pointText(point)), errorMessage);
}

bool MockInputDriver::click(const QPoint& point, Hawk::MouseButton button, int count,
                            QString* errorMessage)
{
    m_lastPoint = point;
    return record(QStringLiteral("click %1 %2 x%3").arg(pointText(point), buttonName(button)).arg(count),
                  errorMessage);
}

bool MockInputDriver::typeText(const QString& text, QString* errorMessage)
{
    return record(QStringLiteral("type %1").arg(text), errorMessage);
}

bool MockInputDriver::pressChord(const QStringList& keys, QString* errorMessage)
{
    m_chords.append(keys);
    return record(QStringLiteral("key %1").arg(keys.join(QLatin1Char('+'))), errorMessage);
}

bool MockInputDriver::drag(const QPoint& from, const QPoint& to, QString* errorMessage)
{
    m_lastPoint = to;
    return record(QStringLiteral("drag %1 %2").arg(pointText(from), pointText(to)), errorMessage);
}

bool MockInputDriver::scroll(int clicks, QString* errorMessage)
{
    return record(QStringLiteral("scroll %1").arg(clicks), errorMessage);
}

void MockInputDriver::clear()
{
    m_calls.clear();
    m_chords.clear();
    m_lastPoint = QPoint();
}
