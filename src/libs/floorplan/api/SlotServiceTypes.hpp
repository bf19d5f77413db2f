// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "floorplan/FloorPlanGlobal.hpp"
#include "floorplan/FloorPlanTypes.hpp"

#include <QtCore/QString>

#include <functional>
#include <optional>
#include <utility>

namespace FloorPlan::Api {

enum class SlotServiceErrorCode : quint8 {
    None = 0,
    Transport,
    Validation,
    NotFound,
    Unknown
};

FLOORPLAN_EXPORT QString toString(SlotServiceErrorCode code);

class FLOORPLAN_EXPORT SlotServiceError final {
public:
    SlotServiceError() = default;
    SlotServiceError(SlotServiceErrorCode code, QString message)
        : m_code(code), m_message(std::move(message)) {}

    bool ok() const noexcept { return m_code == SlotServiceErrorCode::None; }
    SlotServiceErrorCode code() const noexcept { return m_code; }
    const QString& message() const noexcept { return m_message; }

    static SlotServiceError none() { return {}; }

private:
    SlotServiceErrorCode m_code{SlotServiceErrorCode::None};
    QString m_message;
};

template <typename T>
class SlotServiceReply final {
public:
    static SlotServiceReply success(T value)
    {
        SlotServiceReply r;
        r.m_value = std::move(value);
        return r;
    }

    static SlotServiceReply failure(SlotServiceError error)
    {
        SlotServiceReply r;
        r.m_error = std::move(error);
        return r;
    }

    bool ok() const noexcept { return m_error.ok() && m_value.has_value(); }
    const T& value() const { return *m_value; }
    T takeValue() { return std::move(*m_value); }
    const SlotServiceError& error() const noexcept { return m_error; }

private:
    std::optional<T> m_value;
    SlotServiceError m_error;
};

using ListSlotsReply = SlotServiceReply<SlotList>;
using SlotReply = SlotServiceReply<Slot>;

using ListSlotsCallback = std::function<void(ListSlotsReply)>;
using SlotCallback = std::function<void(SlotReply)>;
using DeleteSlotCallback = std::function<void(SlotServiceError)>;

} // namespace FloorPlan::Api
