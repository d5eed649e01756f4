#pragma once

#include <QObject>
#include <QString>

class QIODevice;

namespace astv::app {

/**
 * CommandReader - splits a readable device into trimmed command lines.
 *
 * readAvailable() drains every complete line already buffered, so several
 * commands arriving in one chunk are all delivered from one notification.
 * An empty read means end of input and emits finished().
 */
class CommandReader : public QObject {
    Q_OBJECT

public:
    explicit CommandReader(QIODevice* device, QObject* parent = nullptr);

public slots:
    void readAvailable();

signals:
    void lineRead(const QString& line);
    void finished();

private:
    QIODevice* device_;
};

} // namespace astv::app
