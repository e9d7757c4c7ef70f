#include "pathenumerator.h"
#include "utils/logging.h"

#include <QDirIterator>
#include <QFileInfo>
#include <QMutexLocker>

PathEnumerator::PathEnumerator(const QStringList &paths)
    : paths_(paths)
{
}

PathEnumerator::~PathEnumerator() = default;

std::optional<TransferUnit> PathEnumerator::next()
{
    QMutexLocker locker(&mutex_);

    while (!exhausted_) {
        if (walker_) {
            if (std::optional<TransferUnit> unit = nextFromWalk()) {
                ++produced_;
                return unit;
            }
            walker_.reset();
            continue;
        }

        if (nextInput_ >= paths_.size()) {
            exhausted_ = true;
            LOG_VERBOSE() << "PathEnumerator: exhausted after" << produced_ << "units";
            break;
        }

        if (std::optional<TransferUnit> unit = openNextInput()) {
            ++produced_;
            return unit;
        }
    }

    return std::nullopt;
}

std::optional<TransferUnit> PathEnumerator::nextFromWalk()
{
    while (walker_->hasNext()) {
        const QString filePath = walker_->next();
        const QFileInfo info = walker_->fileInfo();
        if (!info.isFile()) {
            continue;
        }
        return TransferUnit{filePath, walkBase_.relativeFilePath(info.path())};
    }
    return std::nullopt;
}

std::optional<TransferUnit> PathEnumerator::openNextInput()
{
    const QString input = paths_.at(nextInput_++);
    const QString resolved = QFileInfo(input).canonicalFilePath();

    if (resolved.isEmpty()) {
        qWarning().noquote() << QString("'%1': no such file or directory").arg(input);
        skipped_.append(input);
        return std::nullopt;
    }

    const QFileInfo info(resolved);
    if (info.isFile()) {
        return TransferUnit{resolved, QString()};
    }

    if (info.isDir()) {
        LOG_VERBOSE() << "PathEnumerator: walking" << resolved;
        // Keep the directory's own name as the top segment of every destination
        walkBase_ = QDir(info.path());
        walker_ = std::make_unique<QDirIterator>(resolved,
                                                 QDir::Files | QDir::Hidden,
                                                 QDirIterator::Subdirectories);
        return std::nullopt;
    }

    LOG_VERBOSE() << "PathEnumerator: ignoring" << resolved << "(not a file or directory)";
    return std::nullopt;
}

bool PathEnumerator::isExhausted() const
{
    QMutexLocker locker(&mutex_);
    return exhausted_;
}

int PathEnumerator::producedCount() const
{
    QMutexLocker locker(&mutex_);
    return produced_;
}

QStringList PathEnumerator::skippedPaths() const
{
    QMutexLocker locker(&mutex_);
    return skipped_;
}
