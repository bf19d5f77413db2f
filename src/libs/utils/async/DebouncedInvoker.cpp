// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "utils/async/DebouncedInvoker.hpp"

#include <algorithm>

namespace Utils::Async {

DebouncedInvoker::DebouncedInvoker(int delayMs, QObject* parent)
    : QObject(parent)
{
    m_timer.setSingleShot(true);
    setDelayMs(delayMs);
    connect(&m_timer, &QTimer::timeout, this, &DebouncedInvoker::fire);
}

void DebouncedInvoker::setDelayMs(int ms)
{
    m_timer.setInterval(std::max(ms, 0));
}

void DebouncedInvoker::trigger()
{
    if (m_action)
        m_timer.start();
}

void DebouncedInvoker::fire()
{
    if (m_action)
        m_action();
}

} // namespace Utils::Async
