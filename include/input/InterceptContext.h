#ifndef INTERCEPTCONTEXT_H
#define INTERCEPTCONTEXT_H

#include <QtGlobal>
#include <atomic>

/**
 * @brief State shared between a capture session and its click tap.
 *
 * Written on the GUI thread, read from the platform tap context.
 * Both flags must be set for a click to be swallowed.
 */
struct InterceptContext {
    explicit InterceptContext(quint64 id) : sessionId(id) {}

    const quint64 sessionId;
    std::atomic<bool> armed{false};
    std::atomic<bool> hasTarget{false};
};

#endif // INTERCEPTCONTEXT_H
