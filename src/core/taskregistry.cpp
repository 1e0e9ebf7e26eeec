module;
#include <functional>
#include <optional>
#include <QList>
#include <QMutex>
#include <QMutexLocker>
#include <QString>
#include <QStringList>
#include <QVector>

module emularr.core.taskregistry;

int TaskRegistry::indexOf(const QString& id) const
{
    for (int i = 0; i < m_rows.size(); ++i) {
        if (m_rows[i].id == id) return i;
    }
    return -1;
}

bool TaskRegistry::insert(const TaskSnapshot& snapshot)
{
    QMutexLocker locker(&m_mutex);
    if (snapshot.id.isEmpty() || indexOf(snapshot.id) >= 0) return false;
    m_rows.append(snapshot);
    return true;
}

bool TaskRegistry::update(const QString& id, const Mutator& mutator)
{
    QMutexLocker locker(&m_mutex);
    const int row = indexOf(id);
    if (row < 0) return false;
    if (mutator) mutator(m_rows[row]);
    return true;
}

bool TaskRegistry::appendLog(const QString& id, const QString& line)
{
    return update(id, [&line](TaskSnapshot& s) { appendLogLine(s.logLines, line); });
}

std::optional<TaskSnapshot> TaskRegistry::find(const QString& id) const
{
    QMutexLocker locker(&m_mutex);
    const int row = indexOf(id);
    if (row < 0) return std::nullopt;
    return m_rows[row];
}

QList<TaskSnapshot> TaskRegistry::all() const
{
    QMutexLocker locker(&m_mutex);
    return m_rows;
}

QStringList TaskRegistry::ids() const
{
    QMutexLocker locker(&m_mutex);
    QStringList out;
    out.reserve(m_rows.size());
    for (const TaskSnapshot& s : m_rows) out << s.id;
    return out;
}

bool TaskRegistry::remove(const QString& id)
{
    QMutexLocker locker(&m_mutex);
    const int row = indexOf(id);
    if (row < 0) return false;
    m_rows.removeAt(row);
    return true;
}

bool TaskRegistry::contains(const QString& id) const
{
    QMutexLocker locker(&m_mutex);
    return indexOf(id) >= 0;
}

int TaskRegistry::size() const
{
    QMutexLocker locker(&m_mutex);
    return static_cast<int>(m_rows.size());
}
