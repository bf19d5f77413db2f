// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "floorplan/widgets/SlotInspectorPanel.hpp"

#include "floorplan/FloorPlanConstants.hpp"
#include "floorplan/inspector/SlotInspectorModel.hpp"

#include <utils/async/DebouncedInvoker.hpp>

#include <QtGui/QDoubleValidator>
#include <QtWidgets/QComboBox>
#include <QtWidgets/QFormLayout>
#include <QtWidgets/QHBoxLayout>
#include <QtWidgets/QLabel>
#include <QtWidgets/QLineEdit>
#include <QtWidgets/QPushButton>
#include <QtWidgets/QVBoxLayout>

#include <cmath>

namespace FloorPlan {

namespace {

constexpr int kPreviewDebounceMs = 60;

QString numberText(double v)
{
    return std::isfinite(v) ? QString::number(v) : QString();
}

template <typename Enum>
void fillCombo(QComboBox* combo, const QVector<Enum>& values)
{
    for (Enum v : values)
        combo->addItem(toString(v), QVariant::fromValue(static_cast<int>(v)));
}

template <typename Enum>
void selectCombo(QComboBox* combo, Enum v)
{
    const int idx = combo->findData(QVariant::fromValue(static_cast<int>(v)));
    combo->setCurrentIndex(idx);
}

template <typename Enum>
Enum comboValue(const QComboBox* combo)
{
    return static_cast<Enum>(combo->currentData().toInt());
}

} // namespace

SlotInspectorPanel::SlotInspectorPanel(QWidget* parent)
    : QWidget(parent)
    , m_model(new SlotInspectorModel(this))
    , m_previewDebounce(new Utils::Async::DebouncedInvoker(kPreviewDebounceMs, this))
{
    setObjectName(QStringLiteral("SlotInspectorPanel"));
    setAttribute(Qt::WA_StyledBackground, true);

    buildUi();

    m_previewDebounce->setAction([this]() {
        if (!m_model->hasSlot())
            return;
        const SlotPatch patch = m_model->changedFields();
        if (patch.isEmpty() || !patch.validate()) {
            emit previewCleared();
            return;
        }
        emit previewRequested(m_model->slotId(), patch);
    });

    connect(m_model, &SlotInspectorModel::formChanged, this, [this]() {
        syncFromModel();
        syncEnabled();
        schedulePreview();
    });

    setSlot(nullptr);
}

SlotInspectorPanel::~SlotInspectorPanel() = default;

void SlotInspectorPanel::buildUi()
{
    auto* root = new QVBoxLayout(this);
    root->setContentsMargins(12, 12, 12, 12);
    root->setSpacing(10);

    auto* title = new QLabel(tr("Slot"), this);
    QFont f = title->font();
    f.setPointSizeF(f.pointSizeF() + 2);
    f.setWeight(QFont::DemiBold);
    title->setFont(f);
    root->addWidget(title);

    m_emptyLabel = new QLabel(tr("Select a single slot to edit it."), this);
    m_emptyLabel->setWordWrap(true);
    root->addWidget(m_emptyLabel);

    m_form = new QWidget(this);
    auto* form = new QFormLayout(m_form);
    form->setContentsMargins(0, 0, 0, 0);
    form->setFormAlignment(Qt::AlignTop);
    form->setLabelAlignment(Qt::AlignLeft);
    form->setHorizontalSpacing(10);
    form->setVerticalSpacing(8);

    m_label = new QLineEdit(m_form);
    form->addRow(tr("Label"), m_label);

    m_status = new QComboBox(m_form);
    fillCombo(m_status, allSlotStatuses());
    form->addRow(tr("Status"), m_status);

    m_type = new QComboBox(m_form);
    fillCombo(m_type, allSlotTypes());
    form->addRow(tr("Type"), m_type);

    m_shape = new QComboBox(m_form);
    fillCombo(m_shape, allSlotShapes());
    form->addRow(tr("Shape"), m_shape);

    auto* numbers = new QDoubleValidator(this);
    numbers->setNotation(QDoubleValidator::StandardNotation);

    m_width = new QLineEdit(m_form);
    m_width->setValidator(numbers);
    form->addRow(tr("Width"), m_width);

    m_height = new QLineEdit(m_form);
    m_height->setValidator(numbers);
    form->addRow(tr("Height"), m_height);

    m_rotation = new QLineEdit(m_form);
    m_rotation->setValidator(numbers);
    form->addRow(tr("Rotation"), m_rotation);

    m_zone = new QComboBox(m_form);
    m_zone->setEditable(true);
    form->addRow(tr("Zone"), m_zone);

    m_position = new QLabel(m_form);
    form->addRow(tr("Position"), m_position);

    root->addWidget(m_form);

    m_validation = new QLabel(this);
    m_validation->setWordWrap(true);
    m_validation->setStyleSheet(QStringLiteral("color: #b91c1c;"));
    root->addWidget(m_validation);

    auto* buttons = new QHBoxLayout();
    m_save = new QPushButton(tr("Save"), this);
    m_delete = new QPushButton(tr("Delete"), this);
    buttons->addWidget(m_save);
    buttons->addStretch(1);
    buttons->addWidget(m_delete);
    root->addLayout(buttons);
    root->addStretch(1);

    connect(m_label, &QLineEdit::textEdited, this, [this](const QString& text) {
        if (!m_syncing)
            m_model->setLabel(text);
    });
    connect(m_status, &QComboBox::currentIndexChanged, this, [this]() {
        if (!m_syncing)
            m_model->setStatus(comboValue<SlotStatus>(m_status));
    });
    connect(m_type, &QComboBox::currentIndexChanged, this, [this]() {
        if (!m_syncing)
            m_model->setType(comboValue<SlotType>(m_type));
    });
    connect(m_shape, &QComboBox::currentIndexChanged, this, [this]() {
        if (!m_syncing)
            m_model->setShape(comboValue<SlotShape>(m_shape));
    });
    connect(m_width, &QLineEdit::textEdited, this, [this](const QString& text) {
        if (!m_syncing)
            m_model->setWidth(SlotInspectorModel::parseNumber(text));
    });
    connect(m_height, &QLineEdit::textEdited, this, [this](const QString& text) {
        if (!m_syncing)
            m_model->setHeight(SlotInspectorModel::parseNumber(text));
    });
    connect(m_rotation, &QLineEdit::textEdited, this, [this](const QString& text) {
        if (!m_syncing)
            m_model->setRotation(SlotInspectorModel::parseNumber(text));
    });
    connect(m_zone, &QComboBox::currentTextChanged, this, [this](const QString& text) {
        if (!m_syncing)
            m_model->setZone(text.trimmed());
    });
    connect(m_save, &QPushButton::clicked, this, &SlotInspectorPanel::onSave);
    connect(m_delete, &QPushButton::clicked, this, &SlotInspectorPanel::onDelete);
}

void SlotInspectorPanel::setSlot(const Slot* slot)
{
    // Keep in-progress edits when the same slot is echoed back unchanged.
    if (slot && m_model->original() && *m_model->original() == *slot)
        return;

    m_previewDebounce->cancel();
    if (m_model->hasSlot())
        emit previewCleared();
    m_model->load(slot);
}

void SlotInspectorPanel::setZones(const QStringList& zones)
{
    const bool wasSyncing = m_syncing;
    m_syncing = true;
    const QString current = m_zone->currentText();
    m_zone->clear();
    for (const QString& zone : zones) {
        if (!isAllZones(zone))
            m_zone->addItem(zone);
    }
    m_zone->setCurrentText(current);
    m_syncing = wasSyncing;
}

void SlotInspectorPanel::setBusy(bool busy)
{
    if (m_busy == busy)
        return;
    m_busy = busy;
    syncEnabled();
}

void SlotInspectorPanel::syncFromModel()
{
    m_syncing = true;

    const bool has = m_model->hasSlot();
    m_emptyLabel->setVisible(!has);
    m_form->setVisible(has);

    const SlotInspectorForm& form = m_model->form();
    if (m_label->text() != form.label)
        m_label->setText(form.label);
    selectCombo(m_status, form.status);
    selectCombo(m_type, form.type);
    selectCombo(m_shape, form.shape);

    // Do not fight the user over formatting of a value they are typing.
    if (SlotInspectorModel::parseNumber(m_width->text()) != form.width || m_width->text().isEmpty())
        m_width->setText(numberText(form.width));
    if (SlotInspectorModel::parseNumber(m_height->text()) != form.height || m_height->text().isEmpty())
        m_height->setText(numberText(form.height));
    if (SlotInspectorModel::parseNumber(m_rotation->text()) != form.rotation || m_rotation->text().isEmpty())
        m_rotation->setText(numberText(form.rotation));

    if (m_zone->currentText() != form.zone)
        m_zone->setCurrentText(form.zone);

    if (const auto& o = m_model->original())
        m_position->setText(QStringLiteral("%1, %2").arg(o->x).arg(o->y));
    else
        m_position->clear();

    m_syncing = false;
}

void SlotInspectorPanel::syncEnabled()
{
    const bool has = m_model->hasSlot();
    const Utils::Result valid = m_model->validate();

    m_form->setEnabled(has && !m_busy);
    m_save->setEnabled(has && !m_busy && m_model->hasChanges() && valid.ok);
    m_delete->setEnabled(has && !m_busy);
    m_validation->setText(has && !valid.ok ? valid.errors.join(QLatin1Char('\n')) : QString());
}

void SlotInspectorPanel::schedulePreview()
{
    if (m_syncing || !m_model->hasSlot())
        return;
    m_previewDebounce->trigger();
}

void SlotInspectorPanel::onSave()
{
    if (!m_model->hasSlot())
        return;
    const Utils::Result valid = m_model->validate();
    if (!valid) {
        m_validation->setText(valid.errors.join(QLatin1Char('\n')));
        return;
    }

    m_previewDebounce->cancel();
    emit saveRequested(m_model->slotId(), m_model->changedFields());
}

void SlotInspectorPanel::onDelete()
{
    if (!m_model->hasSlot())
        return;
    m_previewDebounce->cancel();
    emit deleteRequested(m_model->slotId());
}

} // namespace FloorPlan
