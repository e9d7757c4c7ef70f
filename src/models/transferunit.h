/**
 * @file transferunit.h
 * @brief A single file to hand over to the transfer tool.
 */

#ifndef TRANSFERUNIT_H
#define TRANSFERUNIT_H

#include <QDebug>
#include <QHashFunctions>
#include <QString>

/**
 * @brief One (source, destination suffix) pair of work.
 *
 * @c destination is relative to the destination root of the run. It is empty
 * when @c source was itself one of the requested input paths; otherwise it
 * starts with the name of the requested directory that contains @c source.
 */
struct TransferUnit {
    QString source;       ///< Absolute path of the file to send
    QString destination;  ///< Directory under the destination root, may be empty

    [[nodiscard]] bool operator==(const TransferUnit &other) const
    {
        return source == other.source && destination == other.destination;
    }
    [[nodiscard]] bool operator!=(const TransferUnit &other) const { return !(*this == other); }
};

inline size_t qHash(const TransferUnit &unit, size_t seed = 0) noexcept
{
    return qHashMulti(seed, unit.source, unit.destination);
}

inline QDebug operator<<(QDebug debug, const TransferUnit &unit)
{
    QDebugStateSaver saver(debug);
    debug.nospace() << "TransferUnit(" << unit.source << " -> " << unit.destination << ')';
    return debug;
}

#endif // TRANSFERUNIT_H
