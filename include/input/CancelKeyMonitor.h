#ifndef CANCELKEYMONITOR_H
#define CANCELKEYMONITOR_H

#include <QObject>

class QEvent;

/**
 * @brief Application-local watcher for the cancel key (Escape).
 *
 * Installed as an event filter on the application object. A matching
 * key press is consumed and reported; every other event passes through.
 * Only one monitor may be installed at a time.
 */
class CancelKeyMonitor : public QObject
{
    Q_OBJECT

public:
    explicit CancelKeyMonitor(QObject *parent = nullptr);
    ~CancelKeyMonitor() override;

    bool install(quint64 sessionId);
    void remove();
    bool isInstalled() const { return m_installed; }

    static int installedCount();

signals:
    void cancelRequested(quint64 sessionId);

protected:
    bool eventFilter(QObject *watched, QEvent *event) override;

private:
    quint64 m_sessionId = 0;
    bool m_installed = false;

    static CancelKeyMonitor *s_owner;
};

#endif // CANCELKEYMONITOR_H
