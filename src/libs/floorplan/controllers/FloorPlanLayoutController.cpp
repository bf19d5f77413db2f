// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "floorplan/controllers/FloorPlanLayoutController.hpp"

#include "floorplan/FloorPlanConstants.hpp"
#include "floorplan/api/ISlotService.hpp"
#include "floorplan/controllers/SelectionSynchronizer.hpp"
#include "floorplan/document/SlotStore.hpp"
#include "floorplan/persistence/SlotPersistenceManager.hpp"

#include <QtCore/QLoggingCategory>

#include <algorithm>

Q_LOGGING_CATEGORY(fplayoutlog, "floorplan.layout")

namespace FloorPlan {

FloorPlanLayoutController::FloorPlanLayoutController(Api::ISlotService* service, QObject* parent)
    : QObject(parent)
    , m_service(service)
    , m_store(new SlotStore(this))
    , m_persistence(new SlotPersistenceManager(m_store, service, this))
{
    connect(m_persistence, &SlotPersistenceManager::actionFailed,
            this, &FloorPlanLayoutController::onActionFailed);
    connect(m_persistence, &SlotPersistenceManager::slotCreated, this, [this](const Slot& slot) {
        rememberZones(SlotList{slot});
        setStatusMessage(QString::fromLatin1(Constants::kSlotCreatedMessage).arg(slot.displayName()));
    });
    connect(m_persistence, &SlotPersistenceManager::slotSaved, this, [this](const Slot& slot, bool transformOnly) {
        rememberZones(SlotList{slot});
        if (!transformOnly)
            setStatusMessage(QString::fromLatin1(Constants::kSlotUpdatedMessage).arg(slot.displayName()));
    });
    connect(m_persistence, &SlotPersistenceManager::slotDeleted, this, [this](const Slot& slot) {
        setStatusMessage(QString::fromLatin1(Constants::kSlotDeletedMessage).arg(slot.displayName()));
    });
    connect(m_store, &SlotStore::slotsChanged, this, [this]() {
        if (m_preview && !m_store->contains(m_preview->id))
            clearPreview();
    });
    connect(m_store, &SlotStore::selectionChanged, this, [this]() {
        clearActionError();
        if (m_preview && !m_store->selection().isSelected(m_preview->id))
            clearPreview();
    });
}

FloorPlanLayoutController::~FloorPlanLayoutController() = default;

void FloorPlanLayoutController::setVenueId(const QString& venueId)
{
    if (m_venueId == venueId)
        return;

    m_venueId = venueId;
    m_persistence->setVenueId(venueId);
    m_knownZones.clear();
    clearPreview();
    clearActionError();
    clearStatusMessage();
    m_store->selection().clearSelectedSlots();
    m_store->clear();
    emit zonesChanged();

    if (m_venueId.isEmpty()) {
        ++m_loadGeneration;
        setLoadState(LoadState::Idle);
        return;
    }
    reload();
}

void FloorPlanLayoutController::setZoneFilter(const QString& zone)
{
    const QString next = isAllZones(zone) ? QString() : zone;
    if (m_zoneFilter == next)
        return;

    m_zoneFilter = next;
    m_store->selection().clearSelectedSlots();
    emit zoneFilterChanged(m_zoneFilter);
    reload();
}

QStringList FloorPlanLayoutController::zones() const
{
    QStringList out = m_knownZones;
    std::sort(out.begin(), out.end(), [](const QString& a, const QString& b) {
        return QString::localeAwareCompare(a, b) < 0;
    });
    out.prepend(QString::fromLatin1(Constants::kAllZones));
    return out;
}

const Slot* FloorPlanLayoutController::primarySelectedSlot() const
{
    return m_store->findSlot(m_store->selection().selectedSlot());
}

SlotList FloorPlanLayoutController::displayedSlots() const
{
    SlotList out = m_store->slots();
    if (!m_preview)
        return out;

    for (Slot& slot : out) {
        if (slot.id == m_preview->id) {
            m_preview->patch.applyTo(slot);
            break;
        }
    }
    return out;
}

SlotDraft FloorPlanLayoutController::defaultDraft() const
{
    SlotDraft draft;
    draft.label = QString::fromLatin1(Constants::kNewSlotLabel);
    draft.type = SlotType::Table;
    draft.shape = SlotShape::Rectangle;
    draft.x = Constants::kNewSlotX;
    draft.y = Constants::kNewSlotY;
    draft.width = Constants::kNewSlotWidth;
    draft.height = Constants::kNewSlotHeight;
    draft.rotation = 0.0;
    draft.status = SlotStatus::Available;
    draft.zone = m_zoneFilter.isEmpty() ? QString::fromLatin1(Constants::kDefaultZone) : m_zoneFilter;
    return draft;
}

void FloorPlanLayoutController::reload()
{
    if (m_venueId.isEmpty()) {
        qCDebug(fplayoutlog) << "Reload requested without a venue";
        return;
    }
    if (!m_service) {
        setLoadState(LoadState::Failed, QString::fromLatin1(Constants::kLoadFailedMessage));
        return;
    }

    const quint64 generation = ++m_loadGeneration;
    setLoadState(LoadState::Loading);

    SlotFilters filters;
    filters.zone = m_zoneFilter;
    qCInfo(fplayoutlog).noquote() << "Fetching slots for venue" << m_venueId
                                  << "zone" << (m_zoneFilter.isEmpty() ? QStringLiteral("ALL") : m_zoneFilter);

    QPointer<FloorPlanLayoutController> self(this);
    m_service->listSlots(m_venueId, filters, [self, generation](Api::ListSlotsReply reply) {
        if (!self || generation != self->m_loadGeneration)
            return;

        if (!reply.ok()) {
            qCWarning(fplayoutlog).noquote() << "Failed to fetch slots:" << reply.error().message();
            self->setLoadState(LoadState::Failed, QString::fromLatin1(Constants::kLoadFailedMessage));
            return;
        }

        SlotList slots = reply.takeValue();
        self->rememberZones(slots);
        self->m_store->resetSlots(std::move(slots));
        self->setLoadState(LoadState::Ready);
        emit self->slotsLoaded();
    });
}

void FloorPlanLayoutController::selectSlot(const SlotId& id, bool multi)
{
    const SlotIdSet next = SelectionSynchronizer::applyClick(m_store->selectedIds(), id, multi);
    m_store->setSelection(next);
}

void FloorPlanLayoutController::moveSlot(const SlotId& id, const QPointF& topLeft)
{
    updateSlotTransforms(SlotUpdateList{SlotUpdate{id, SlotPatch::moveTo(topLeft)}});
}

void FloorPlanLayoutController::transformSlot(const SlotId& id, const SlotGeometry& geometry)
{
    updateSlotTransforms(SlotUpdateList{SlotUpdate{id, geometry.toPatch()}});
}

Utils::Result FloorPlanLayoutController::updateSlotTransforms(const SlotUpdateList& updates)
{
    clearActionError();
    return reportRejected(m_persistence->submitUpdates(updates));
}

void FloorPlanLayoutController::previewSlotFields(const SlotId& id, const SlotPatch& patch)
{
    if (!m_store->contains(id) || patch.isEmpty()) {
        clearPreview();
        return;
    }
    if (m_preview && m_preview->id == id && m_preview->patch == patch)
        return;

    m_preview = FieldPreview{id, patch};
    emit previewChanged();
}

void FloorPlanLayoutController::clearPreview()
{
    if (!m_preview)
        return;
    m_preview.reset();
    emit previewChanged();
}

Utils::Result FloorPlanLayoutController::saveSlotFields(const SlotId& id, const SlotPatch& patch)
{
    clearActionError();
    clearPreview();
    if (patch.isEmpty())
        return Utils::Result::success();
    return reportRejected(m_persistence->submitUpdates(SlotUpdateList{SlotUpdate{id, patch}}));
}

Utils::Result FloorPlanLayoutController::addSlot()
{
    return createSlot(defaultDraft());
}

Utils::Result FloorPlanLayoutController::createSlot(const SlotDraft& draft)
{
    clearActionError();
    return reportRejected(m_persistence->submitCreate(draft));
}

Utils::Result FloorPlanLayoutController::deleteSlot(const SlotId& id)
{
    clearActionError();
    if (m_preview && m_preview->id == id)
        clearPreview();
    return reportRejected(m_persistence->submitDelete(id));
}

void FloorPlanLayoutController::clearActionError()
{
    setActionError(QString());
}

void FloorPlanLayoutController::clearStatusMessage()
{
    setStatusMessage(QString());
}

void FloorPlanLayoutController::setLoadState(LoadState state, const QString& error)
{
    if (m_loadState == state && m_loadError == error)
        return;
    m_loadState = state;
    m_loadError = error;
    emit loadStateChanged(m_loadState);
}

void FloorPlanLayoutController::setActionError(const QString& message)
{
    if (m_actionError == message)
        return;
    m_actionError = message;
    if (!m_actionError.isEmpty())
        clearStatusMessage();
    emit actionErrorChanged(m_actionError);
}

void FloorPlanLayoutController::setStatusMessage(const QString& message)
{
    if (m_statusMessage == message)
        return;
    m_statusMessage = message;
    if (!m_statusMessage.isEmpty())
        qCInfo(fplayoutlog).noquote() << m_statusMessage;
    emit statusMessageChanged(m_statusMessage);
}

void FloorPlanLayoutController::rememberZones(const SlotList& slots)
{
    bool changed = false;
    for (const Slot& slot : slots) {
        if (slot.zone.isEmpty() || m_knownZones.contains(slot.zone))
            continue;
        m_knownZones.push_back(slot.zone);
        changed = true;
    }
    if (changed)
        emit zonesChanged();
}

void FloorPlanLayoutController::onActionFailed(const SlotActionFailure& failure)
{
    setActionError(failure.message());
}

Utils::Result FloorPlanLayoutController::reportRejected(const Utils::Result& result)
{
    if (!result)
        setActionError(result.errors.join(QLatin1Char(' ')));
    return result;
}

} // namespace FloorPlan
