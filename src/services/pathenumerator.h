/**
 * @file pathenumerator.h
 * @brief Lazy producer of transfer units from a list of input paths.
 */

#ifndef PATHENUMERATOR_H
#define PATHENUMERATOR_H

#include <QDir>
#include <QMutex>
#include <QString>
#include <QStringList>
#include <memory>
#include <optional>

#include "models/transferunit.h"

class QDirIterator;

/**
 * @brief Walks input paths and hands out one TransferUnit per regular file.
 *
 * Inputs are resolved to canonical absolute paths one at a time, and
 * directories are walked incrementally, so the number of units is not known
 * up front. Consumers pull with next() until it returns std::nullopt, which
 * marks permanent exhaustion.
 *
 * next() is serialized by an internal mutex: any number of threads may pull
 * from the same enumerator and each unit is handed out exactly once.
 *
 * Inputs that do not exist are reported with a warning and skipped. Inputs
 * that are neither a regular file nor a directory contribute no unit.
 *
 * @par Example usage:
 * @code
 * PathEnumerator enumerator({"/data/run1", "/data/notes.txt"});
 * while (std::optional<TransferUnit> unit = enumerator.next()) {
 *     // unit->source      == "/data/run1/a/b.dat"
 *     // unit->destination == "run1/a"
 * }
 * @endcode
 */
class PathEnumerator
{
public:
    /**
     * @brief Constructs an enumerator over the given inputs.
     * @param paths Files and directories, in the order they were requested.
     *
     * Nothing is touched on disk until the first call to next().
     */
    explicit PathEnumerator(const QStringList &paths);

    ~PathEnumerator();

    PathEnumerator(const PathEnumerator &) = delete;
    PathEnumerator &operator=(const PathEnumerator &) = delete;

    /**
     * @brief Pulls the next unit of work.
     * @return The next unit, or std::nullopt once every input has been walked.
     *
     * Thread-safe. After the first std::nullopt every later call returns
     * std::nullopt as well.
     */
    [[nodiscard]] std::optional<TransferUnit> next();

    /**
     * @brief Checks whether the enumerator has reported exhaustion.
     * @return True once next() has returned std::nullopt.
     */
    [[nodiscard]] bool isExhausted() const;

    /**
     * @brief Returns the number of units handed out so far.
     */
    [[nodiscard]] int producedCount() const;

    /**
     * @brief Returns the inputs skipped because they do not exist.
     * @return Paths as given by the caller, in the order they were skipped.
     */
    [[nodiscard]] QStringList skippedPaths() const;

private:
    // Both require mutex_ to be held
    std::optional<TransferUnit> nextFromWalk();
    std::optional<TransferUnit> openNextInput();

    const QStringList paths_;

    mutable QMutex mutex_;
    int nextInput_ = 0;
    std::unique_ptr<QDirIterator> walker_;
    QDir walkBase_;  // parent of the directory being walked
    QStringList skipped_;
    int produced_ = 0;
    bool exhausted_ = false;
};

#endif // PATHENUMERATOR_H
