// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "floorplan/service/InMemorySlotService.hpp"

#include <QtCore/QLoggingCategory>
#include <QtCore/QPointer>
#include <QtCore/QTimer>

#include <algorithm>
#include <utility>

Q_LOGGING_CATEGORY(fpservicelog, "floorplan.service")

namespace FloorPlan::Service {

using Api::SlotServiceError;
using Api::SlotServiceErrorCode;

namespace {

SlotServiceError notFound(const SlotId& id)
{
    return SlotServiceError(SlotServiceErrorCode::NotFound,
                            QStringLiteral("Slot %1 does not exist.").arg(id.value()));
}

SlotServiceError invalid(const Utils::Result& r)
{
    return SlotServiceError(SlotServiceErrorCode::Validation, r.errors.join(QLatin1Char(' ')));
}

} // namespace

InMemorySlotService::InMemorySlotService(QObject* parent)
    : Api::ISlotService(parent)
{}

void InMemorySlotService::setLatencyMs(int ms)
{
    m_latencyMs = std::max(ms, 0);
}

void InMemorySlotService::seedSlots(const QString& venueId, const SlotList& slots)
{
    SlotList& stored = m_venues[venueId];
    for (const Slot& slot : slots) {
        if (!slot.id) {
            Slot copy = slot;
            copy.id = SlotId(QStringLiteral("slot-%1").arg(++m_nextId));
            stored.push_back(copy);
            continue;
        }
        stored.push_back(slot);
    }
}

SlotList InMemorySlotService::storedSlots(const QString& venueId) const
{
    return m_venues.value(venueId);
}

const Slot* InMemorySlotService::storedSlot(const QString& venueId, const SlotId& id) const
{
    const int idx = indexOf(venueId, id);
    if (idx < 0)
        return nullptr;
    return &m_venues.find(venueId)->at(idx);
}

void InMemorySlotService::failNext(SlotOperation op, SlotServiceError error, int count)
{
    auto& queue = m_pendingFailures[op];
    for (int i = 0; i < count; ++i)
        queue.push_back(error);
}

void InMemorySlotService::setPersistentFailure(SlotOperation op, std::optional<SlotServiceError> error)
{
    if (!error) {
        m_persistentFailures.remove(op);
        return;
    }
    m_persistentFailures.insert(op, *error);
}

std::optional<SlotServiceError> InMemorySlotService::takeInjectedFailure(SlotOperation op)
{
    m_requestCounts[op] += 1;

    auto it = m_pendingFailures.find(op);
    if (it != m_pendingFailures.end() && !it->isEmpty())
        return it->takeFirst();

    const auto persistent = m_persistentFailures.constFind(op);
    if (persistent != m_persistentFailures.constEnd())
        return *persistent;
    return std::nullopt;
}

template <typename Fn>
void InMemorySlotService::deliver(Fn&& fn)
{
    QPointer<InMemorySlotService> guard(this);
    QTimer::singleShot(m_latencyMs, this, [guard, fn = std::forward<Fn>(fn)]() mutable {
        if (guard)
            fn();
    });
}

int InMemorySlotService::indexOf(const QString& venueId, const SlotId& id) const
{
    const auto it = m_venues.constFind(venueId);
    if (it == m_venues.constEnd())
        return -1;
    for (int i = 0; i < it->size(); ++i) {
        if (it->at(i).id == id)
            return i;
    }
    return -1;
}

void InMemorySlotService::listSlots(const QString& venueId, const SlotFilters& filters, Api::ListSlotsCallback done)
{
    if (auto failure = takeInjectedFailure(SlotOperation::List)) {
        deliver([done = std::move(done), err = *failure]() { done(Api::ListSlotsReply::failure(err)); });
        return;
    }

    SlotList out;
    for (const Slot& slot : m_venues.value(venueId)) {
        if (filters.matches(slot))
            out.push_back(slot);
    }
    qCDebug(fpservicelog).noquote() << "list" << venueId << "zone" << filters.zone << "->" << out.size();
    deliver([done = std::move(done), out = std::move(out)]() mutable {
        done(Api::ListSlotsReply::success(std::move(out)));
    });
}

void InMemorySlotService::createSlot(const QString& venueId, const SlotDraft& draft, Api::SlotCallback done)
{
    if (auto failure = takeInjectedFailure(SlotOperation::Create)) {
        deliver([done = std::move(done), err = *failure]() { done(Api::SlotReply::failure(err)); });
        return;
    }

    const Utils::Result valid = draft.validate();
    if (!valid) {
        deliver([done = std::move(done), err = invalid(valid)]() { done(Api::SlotReply::failure(err)); });
        return;
    }

    const Slot created = draft.toSlot(SlotId(QStringLiteral("slot-%1").arg(++m_nextId)));
    m_venues[venueId].push_back(created);
    qCDebug(fpservicelog).noquote() << "create" << venueId << created.id.value();
    deliver([done = std::move(done), created]() { done(Api::SlotReply::success(created)); });
}

void InMemorySlotService::updateSlot(const QString& venueId, const SlotId& id, const SlotPatch& patch,
                                     Api::SlotCallback done)
{
    m_receivedUpdates.push_back(SlotUpdate{id, patch});

    if (auto failure = takeInjectedFailure(SlotOperation::Update)) {
        deliver([done = std::move(done), err = *failure]() { done(Api::SlotReply::failure(err)); });
        return;
    }

    const Utils::Result valid = patch.validate();
    if (!valid) {
        deliver([done = std::move(done), err = invalid(valid)]() { done(Api::SlotReply::failure(err)); });
        return;
    }

    const int idx = indexOf(venueId, id);
    if (idx < 0) {
        deliver([done = std::move(done), err = notFound(id)]() { done(Api::SlotReply::failure(err)); });
        return;
    }

    Slot& stored = m_venues[venueId][idx];
    patch.applyTo(stored);
    const Slot updated = stored;
    qCDebug(fpservicelog).noquote() << "update" << venueId << id.value();
    deliver([done = std::move(done), updated]() { done(Api::SlotReply::success(updated)); });
}

void InMemorySlotService::deleteSlot(const QString& venueId, const SlotId& id, Api::DeleteSlotCallback done)
{
    if (auto failure = takeInjectedFailure(SlotOperation::Delete)) {
        deliver([done = std::move(done), err = *failure]() { done(err); });
        return;
    }

    const int idx = indexOf(venueId, id);
    if (idx < 0) {
        deliver([done = std::move(done), err = notFound(id)]() { done(err); });
        return;
    }

    m_venues[venueId].removeAt(idx);
    qCDebug(fpservicelog).noquote() << "delete" << venueId << id.value();
    deliver([done = std::move(done)]() { done(SlotServiceError::none()); });
}

} // namespace FloorPlan::Service
