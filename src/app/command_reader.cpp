#include "app/command_reader.hpp"

#include <QIODevice>

namespace astv::app {

CommandReader::CommandReader(QIODevice* device, QObject* parent)
    : QObject(parent)
    , device_(device)
{
}

void CommandReader::readAvailable() {
    if (!device_ || !device_->isReadable()) {
        emit finished();
        return;
    }

    do {
        const QByteArray raw = device_->readLine();
        if (raw.isEmpty()) {
            emit finished();
            return;
        }
        const QString line = QString::fromUtf8(raw).trimmed();
        if (!line.isEmpty()) {
            emit lineRead(line);
        }
    } while (device_->canReadLine());
}

} // namespace astv::app
