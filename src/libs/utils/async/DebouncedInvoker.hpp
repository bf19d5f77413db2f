// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "utils/UtilsGlobal.hpp"

#include <QtCore/QObject>
#include <QtCore/QTimer>

#include <functional>

namespace Utils::Async {

// Collapses a burst of trigger() calls into one action after the delay of
// quiet. Lives on the thread of its parent.
class UTILS_EXPORT DebouncedInvoker final : public QObject
{
    Q_OBJECT

public:
    explicit DebouncedInvoker(int delayMs, QObject* parent = nullptr);

    int delayMs() const { return m_timer.interval(); }
    void setDelayMs(int ms);

    void setAction(std::function<void()> action) { m_action = std::move(action); }

    // Restarts the quiet period.
    void trigger();
    void cancel() { m_timer.stop(); }
    bool isPending() const { return m_timer.isActive(); }

private:
    void fire();

    QTimer m_timer;
    std::function<void()> m_action;
};

} // namespace Utils::Async
